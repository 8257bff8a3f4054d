#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>

namespace configuration
{
    /// @brief Read-only view over a JSON configuration document.
    ///
    /// Values are addressed by a table (top level object) and a key inside it. Lookups
    /// never throw: a missing table, a missing key or a value of the wrong JSON type all
    /// yield std::nullopt so callers can fall back to their defaults.
    class ConfigurationParser
    {
    public:
        /// @brief Creates an empty configuration.
        ConfigurationParser();

        /// @brief Loads the configuration from a file.
        ///
        /// A missing, unreadable or malformed file leaves the configuration empty and logs
        /// a warning.
        ///
        /// @param configFile Path of the JSON document.
        explicit ConfigurationParser(const std::filesystem::path& configFile);

        /// @brief Parses the configuration from an in-memory JSON string.
        ///
        /// @param content JSON text. Malformed content leaves the configuration empty.
        static ConfigurationParser FromString(const std::string& content);

        /// @brief Returns the value stored at table.key converted to T.
        ///
        /// @tparam T Requested type.
        /// @param table Name of the top level object.
        /// @param key Name of the entry inside the table.
        /// @return The converted value, or std::nullopt if absent or not convertible.
        template<typename T>
        std::optional<T> GetConfig(const std::string& table, const std::string& key) const
        {
            const auto tableIt = m_document.find(table);
            if (tableIt == m_document.end() || !tableIt->is_object())
            {
                return std::nullopt;
            }

            const auto valueIt = tableIt->find(key);
            if (valueIt == tableIt->end())
            {
                return std::nullopt;
            }

            try
            {
                return valueIt->template get<T>();
            }
            catch (const nlohmann::json::exception&)
            {
                return std::nullopt;
            }
        }

        /// @brief Returns true if no configuration was loaded.
        bool IsEmpty() const;

    private:
        explicit ConfigurationParser(nlohmann::json document);

        nlohmann::json m_document;
    };
} // namespace configuration
