/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    DeviceSlotTable.h

Abstract:

    This file contains the fixed-size table of guest visible device slots.

--*/

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vmshim::uvm {

// A slot is free when its host path is empty.
class DeviceSlotTable
{
public:
    explicit DeviceSlotTable(std::uint32_t Size);

    // First fit. Throws VMSHIM_E_NO_FREE_SLOT when the table is full.
    std::uint32_t Allocate(const std::string& HostPath);

    std::optional<std::uint32_t> TryAllocate(const std::string& HostPath);

    void Release(std::uint32_t Slot) noexcept;

    std::optional<std::uint32_t> Find(const std::string& HostPath) const;

    const std::string& HostPath(std::uint32_t Slot) const;

    std::uint32_t Size() const noexcept;

    std::uint32_t InUse() const noexcept;

private:
    std::vector<std::string> m_slots;
};

} // namespace vmshim::uvm
