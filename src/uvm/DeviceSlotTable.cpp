/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    DeviceSlotTable.cpp

Abstract:

    This file contains the device slot table implementation.

--*/

#include "DeviceSlotTable.h"
#include <algorithm>
#include "shimlog.h"
#include "shimresult.h"

using vmshim::uvm::DeviceSlotTable;

DeviceSlotTable::DeviceSlotTable(std::uint32_t Size) : m_slots(Size)
{
}

std::uint32_t DeviceSlotTable::Allocate(const std::string& HostPath)
{
    const auto slot = TryAllocate(HostPath);
    VMSHIM_THROW_HR_IF_MSG(VMSHIM_E_NO_FREE_SLOT, !slot.has_value(), "No free slot for {} ({} in use)", HostPath, m_slots.size());

    return slot.value();
}

std::optional<std::uint32_t> DeviceSlotTable::TryAllocate(const std::string& HostPath)
{
    VMSHIM_THROW_HR_IF(VMSHIM_E_INVALIDARG, HostPath.empty());

    for (std::uint32_t slot = 0; slot < m_slots.size(); slot++)
    {
        if (m_slots[slot].empty())
        {
            m_slots[slot] = HostPath;
            LOG_DEBUG("Allocated slot {} for {}", slot, HostPath);
            return slot;
        }
    }

    return {};
}

void DeviceSlotTable::Release(std::uint32_t Slot) noexcept
{
    if (Slot < m_slots.size())
    {
        m_slots[Slot].clear();
    }
}

std::optional<std::uint32_t> DeviceSlotTable::Find(const std::string& HostPath) const
{
    if (HostPath.empty())
    {
        return {};
    }

    const auto slot = std::find(m_slots.begin(), m_slots.end(), HostPath);
    if (slot == m_slots.end())
    {
        return {};
    }

    return static_cast<std::uint32_t>(slot - m_slots.begin());
}

const std::string& DeviceSlotTable::HostPath(std::uint32_t Slot) const
{
    VMSHIM_THROW_HR_IF(VMSHIM_E_INVALIDARG, Slot >= m_slots.size());

    return m_slots[Slot];
}

std::uint32_t DeviceSlotTable::Size() const noexcept
{
    return static_cast<std::uint32_t>(m_slots.size());
}

std::uint32_t DeviceSlotTable::InUse() const noexcept
{
    return static_cast<std::uint32_t>(std::count_if(m_slots.begin(), m_slots.end(), [](const auto& Path) { return !Path.empty(); }));
}
