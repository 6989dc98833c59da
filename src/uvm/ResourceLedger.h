/*++

Copyright (c) Microsoft. All rights reserved.

Module Name:

    ResourceLedger.h

Abstract:

    This file contains the ref-counted table of resources attached to a
    utility VM, written once against the per-kind capability interface.

--*/

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "shimlog.h"
#include "shimresult.h"

namespace vmshim::uvm {

// Per-kind knowledge of how a host resource is named in the guest and how it is added to and removed from the VM.
template <typename TIdentity, typename TMetadata>
class IResourceKind
{
public:
    virtual ~IResourceKind() = default;

    virtual const char* Name() const noexcept = 0;

    virtual TIdentity AllocateIdentity(const std::string& HostPath, const TMetadata& Metadata) = 0;

    virtual void ReleaseIdentity(const TIdentity& Identity) noexcept = 0;

    // May complete Metadata, for example with a default guest path.
    virtual nlohmann::json BuildAddRequest(const std::string& HostPath, const TIdentity& Identity, TMetadata& Metadata) = 0;

    virtual nlohmann::json BuildRemoveRequest(const std::string& HostPath, const TIdentity& Identity, const TMetadata& Metadata) = 0;
};

template <typename TIdentity, typename TMetadata>
struct ResourceAttachment
{
    TIdentity Identity{};
    TMetadata Metadata{};
    size_t RefCount = 0;
};

using ModifyFunction = std::function<void(const nlohmann::json& Request)>;

// Keyed by host path. Methods ending in LockHeld require the owning VM's resource lock.
template <typename TIdentity, typename TMetadata>
class ResourceLedger
{
public:
    using Kind = IResourceKind<TIdentity, TMetadata>;
    using Entry = ResourceAttachment<TIdentity, TMetadata>;

    explicit ResourceLedger(Kind& ResourceKind) : m_kind(ResourceKind)
    {
    }

    ResourceLedger(const ResourceLedger&) = delete;
    ResourceLedger& operator=(const ResourceLedger&) = delete;

    Entry AddLockHeld(const std::string& HostPath, TMetadata Metadata, const ModifyFunction& Modify)
    {
        const auto existing = m_entries.find(HostPath);
        if (existing != m_entries.end())
        {
            existing->second.RefCount++;
            LOG_DEBUG("{} {} refCount {}", m_kind.Name(), HostPath, existing->second.RefCount);
            return existing->second;
        }

        auto identity = m_kind.AllocateIdentity(HostPath, Metadata);
        auto release = scope_exit([&]() { m_kind.ReleaseIdentity(identity); });

        Modify(m_kind.BuildAddRequest(HostPath, identity, Metadata));

        release.release();
        const auto [inserted, _] = m_entries.emplace(HostPath, Entry{std::move(identity), std::move(Metadata), 1});

        LOG_DEBUG("{} {} attached", m_kind.Name(), HostPath);
        return inserted->second;
    }

    // The entry is left unchanged if the host rejects the removal.
    void RemoveLockHeld(const std::string& HostPath, const ModifyFunction& Modify)
    {
        const auto entry = m_entries.find(HostPath);
        VMSHIM_THROW_HR_IF_MSG(VMSHIM_E_NOT_ATTACHED, entry == m_entries.end(), "{} {} is not attached", m_kind.Name(), HostPath);

        if (entry->second.RefCount > 1)
        {
            entry->second.RefCount--;
            LOG_DEBUG("{} {} refCount {}", m_kind.Name(), HostPath, entry->second.RefCount);
            return;
        }

        Modify(m_kind.BuildRemoveRequest(HostPath, entry->second.Identity, entry->second.Metadata));

        const auto identity = std::move(entry->second.Identity);
        m_entries.erase(entry);
        m_kind.ReleaseIdentity(identity);

        LOG_DEBUG("{} {} detached", m_kind.Name(), HostPath);
    }

    Entry FindLockHeld(const std::string& HostPath) const
    {
        const auto entry = m_entries.find(HostPath);
        VMSHIM_THROW_HR_IF_MSG(VMSHIM_E_NOT_ATTACHED, entry == m_entries.end(), "{} {} is not attached", m_kind.Name(), HostPath);

        return entry->second;
    }

    size_t SizeLockHeld() const noexcept
    {
        return m_entries.size();
    }

private:
    Kind& m_kind;
    std::map<std::string, Entry> m_entries;
};

} // namespace vmshim::uvm
