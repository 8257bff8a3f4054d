#include <signal_catalog.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

namespace typed_signals
{
    SignalCatalog& SignalCatalog::GetInstance()
    {
        static SignalCatalog instance;
        return instance;
    }

    bool SignalCatalog::Declare(SignalDescriptor descriptor)
    {
        const auto known = std::any_of(m_descriptors.begin(),
                                       m_descriptors.end(),
                                       [&descriptor](const SignalDescriptor& existing)
                                       { return existing.Type == descriptor.Type; });
        if (known)
        {
            return false;
        }

        m_descriptors.push_back(std::move(descriptor));
        return true;
    }

    std::vector<SignalDescriptor> SignalCatalog::Enumerate(const std::vector<std::string>& reservedNamespaces) const
    {
        std::vector<SignalDescriptor> kinds;
        std::copy_if(m_descriptors.begin(),
                     m_descriptors.end(),
                     std::back_inserter(kinds),
                     [&reservedNamespaces](const SignalDescriptor& descriptor)
                     { return !IsReserved(descriptor.Name, reservedNamespaces); });
        return kinds;
    }

    bool SignalCatalog::IsReserved(const std::string& name, const std::vector<std::string>& reservedNamespaces)
    {
        return std::any_of(reservedNamespaces.begin(),
                           reservedNamespaces.end(),
                           [&name](const std::string& ns)
                           { return !ns.empty() && name.size() > ns.size() + 2 && name.starts_with(ns + "::"); });
    }

    std::size_t SignalCatalog::Size() const
    {
        return m_descriptors.size();
    }
} // namespace typed_signals
