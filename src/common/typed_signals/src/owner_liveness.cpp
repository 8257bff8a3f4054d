#include <owner_liveness.hpp>

namespace typed_signals
{
    void TrackedOwnerLiveness::Forget(OwnerId owner)
    {
        m_owners.erase(owner);
    }

    std::size_t TrackedOwnerLiveness::PruneExpired()
    {
        return static_cast<std::size_t>(
            std::erase_if(m_owners, [](const auto& entry) { return entry.second.Owner.expired(); }));
    }

    bool TrackedOwnerLiveness::IsAlive(OwnerId owner) const
    {
        const auto it = m_owners.find(owner);
        return it == m_owners.end() || !it->second.Owner.expired();
    }

    std::uint64_t TrackedOwnerLiveness::Generation(OwnerId owner) const
    {
        const auto it = m_owners.find(owner);
        return it != m_owners.end() ? it->second.Generation : 0;
    }

    std::size_t TrackedOwnerLiveness::TrackedCount() const
    {
        return m_owners.size();
    }
} // namespace typed_signals
