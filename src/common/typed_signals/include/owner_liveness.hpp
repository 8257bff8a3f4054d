#pragma once

#include <signal.hpp>

#include <cstdint>
#include <memory>
#include <unordered_map>

namespace typed_signals
{
    /// @brief Answers whether the owner of a listener binding is still alive.
    ///
    /// Implementations must never dereference the owner: it may already be destroyed.
    class IOwnerLiveness
    {
    public:
        virtual ~IOwnerLiveness() = default;

        virtual bool IsAlive(OwnerId owner) const = 0;

        /// @brief Identifies which object currently lives at owner's address.
        ///
        /// Changes when a new owner is registered at an address an earlier owner used, so
        /// bindings made for the earlier owner can be told apart. 0 means "not tracked".
        virtual std::uint64_t Generation(OwnerId) const
        {
            return 0;
        }
    };

    /// @brief Liveness oracle for hosts that always unbind owners before destroying them.
    class AlwaysAlive : public IOwnerLiveness
    {
    public:
        bool IsAlive(OwnerId) const override
        {
            return true;
        }
    };

    /// @brief Liveness oracle backed by weak references to shared owners.
    ///
    /// Owners registered with Track() are alive while their std::shared_ptr has not expired.
    /// Owners that were never tracked are reported alive. Every Track() call hands out a new
    /// generation, so an owner allocated at a destroyed owner's address is a different owner.
    class TrackedOwnerLiveness : public IOwnerLiveness
    {
    public:
        /// @brief Starts tracking owner. Tracking the same live owner again keeps its generation.
        template<typename Owner>
        void Track(const std::shared_ptr<Owner>& owner)
        {
            auto& entry = m_owners[static_cast<OwnerId>(owner.get())];

            const bool sameOwner = !entry.Owner.owner_before(owner) && !owner.owner_before(entry.Owner);
            if (entry.Owner.expired() || !sameOwner)
            {
                entry = Entry {std::weak_ptr<const void>(owner), ++m_lastGeneration};
            }
        }

        /// @brief Stops tracking owner.
        void Forget(OwnerId owner);

        /// @brief Drops every tracked owner whose object was destroyed.
        ///
        /// @return Number of entries removed.
        std::size_t PruneExpired();

        bool IsAlive(OwnerId owner) const override;

        std::uint64_t Generation(OwnerId owner) const override;

        std::size_t TrackedCount() const;

    private:
        struct Entry
        {
            std::weak_ptr<const void> Owner;
            std::uint64_t Generation = 0;
        };

        std::unordered_map<OwnerId, Entry> m_owners;
        std::uint64_t m_lastGeneration = 0;
    };
} // namespace typed_signals
