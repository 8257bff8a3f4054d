#include <listener_binding_table.hpp>

#include <algorithm>
#include <utility>

namespace typed_signals
{
    void ListenerBindingTable::Record(OwnerId owner, ISignal* signal, ListenerKey key)
    {
        m_listenersByOwner[owner].push_back(BoundListener {signal, std::move(key)});
    }

    std::vector<BoundListener> ListenerBindingTable::Take(OwnerId owner)
    {
        const auto it = m_listenersByOwner.find(owner);
        if (it == m_listenersByOwner.end())
        {
            return {};
        }

        auto listeners = std::move(it->second);
        m_listenersByOwner.erase(it);
        return listeners;
    }

    void ListenerBindingTable::Forget(OwnerId owner, const ListenerKey& key)
    {
        const auto it = m_listenersByOwner.find(owner);
        if (it == m_listenersByOwner.end())
        {
            return;
        }

        auto& listeners = it->second;
        const auto match = std::find_if(
            listeners.begin(), listeners.end(), [&key](const BoundListener& listener) { return listener.Key == key; });
        if (match != listeners.end())
        {
            listeners.erase(match);
        }

        if (listeners.empty())
        {
            m_listenersByOwner.erase(it);
        }
    }

    const std::vector<BoundListener>* ListenerBindingTable::Find(OwnerId owner) const
    {
        const auto it = m_listenersByOwner.find(owner);
        return it != m_listenersByOwner.end() ? &it->second : nullptr;
    }

    bool ListenerBindingTable::Contains(OwnerId owner) const
    {
        return m_listenersByOwner.contains(owner);
    }

    std::vector<OwnerId> ListenerBindingTable::Owners() const
    {
        std::vector<OwnerId> owners;
        owners.reserve(m_listenersByOwner.size());

        for (const auto& entry : m_listenersByOwner)
        {
            owners.push_back(entry.first);
        }
        return owners;
    }

    std::size_t ListenerBindingTable::Size() const
    {
        return m_listenersByOwner.size();
    }

    void ListenerBindingTable::Clear()
    {
        m_listenersByOwner.clear();
    }
} // namespace typed_signals
