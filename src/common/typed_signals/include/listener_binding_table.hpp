#pragma once

#include <signal.hpp>

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace typed_signals
{
    /// @brief A (signal, listener) pair created on behalf of one owner.
    struct BoundListener
    {
        ISignal* Signal;
        ListenerKey Key;
    };

    /// @brief Index of every binding created for each owner, across all signals.
    ///
    /// Owners are identified by address only; the table never dereferences nor extends the
    /// lifetime of an owner. It exists so an owner's bindings can be removed in bulk.
    class ListenerBindingTable
    {
    public:
        /// @brief Appends a binding to the owner's entry, creating the entry if needed.
        void Record(OwnerId owner, ISignal* signal, ListenerKey key);

        /// @brief Removes and returns every binding recorded for owner.
        std::vector<BoundListener> Take(OwnerId owner);

        /// @brief Drops a single binding; the entry goes away with its last binding.
        void Forget(OwnerId owner, const ListenerKey& key);

        /// @brief Returns the bindings of owner, or nullptr if it has none.
        const std::vector<BoundListener>* Find(OwnerId owner) const;

        bool Contains(OwnerId owner) const;

        /// @brief Owners with at least one binding, in no particular order.
        std::vector<OwnerId> Owners() const;

        /// @brief Number of owners with at least one binding.
        std::size_t Size() const;

        void Clear();

    private:
        std::unordered_map<OwnerId, std::vector<BoundListener>> m_listenersByOwner;
    };
} // namespace typed_signals
