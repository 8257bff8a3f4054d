#include <configuration_parser.hpp>

#include <logger.hpp>

#include <fstream>
#include <sstream>
#include <utility>

namespace
{
    nlohmann::json ParseObject(std::istream& input, const std::string& origin)
    {
        auto document = nlohmann::json::parse(input, nullptr, false);

        if (document.is_discarded() || !document.is_object())
        {
            LogWarn("Configuration '{}' is not a valid JSON object. Using defaults.", origin);
            return nlohmann::json::object();
        }
        return document;
    }
} // namespace

namespace configuration
{
    ConfigurationParser::ConfigurationParser()
        : m_document(nlohmann::json::object())
    {
    }

    ConfigurationParser::ConfigurationParser(nlohmann::json document)
        : m_document(std::move(document))
    {
    }

    ConfigurationParser::ConfigurationParser(const std::filesystem::path& configFile)
        : m_document(nlohmann::json::object())
    {
        std::ifstream file(configFile);

        if (!file.is_open())
        {
            LogWarn("Unable to open configuration file '{}'. Using defaults.", configFile.string());
            return;
        }

        m_document = ParseObject(file, configFile.string());
        LogDebug("Loaded configuration from '{}'", configFile.string());
    }

    ConfigurationParser ConfigurationParser::FromString(const std::string& content)
    {
        std::istringstream input(content);
        return ConfigurationParser(ParseObject(input, "<string>"));
    }

    bool ConfigurationParser::IsEmpty() const
    {
        return m_document.empty();
    }
} // namespace configuration
