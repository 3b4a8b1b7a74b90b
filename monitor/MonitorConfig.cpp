#include "MonitorConfig.hpp"

#include <cmath>
#include <fstream>
#include <set>
#include <sstream>

namespace netwatch::monitor
{
    using nlohmann::json;

    namespace
    {
        template <typename T>
        T Field(const json &doc, const char *key, T fallback)
        {
            auto it = doc.find(key);
            if (it == doc.end() || it->is_null())
                return fallback;
            try
            {
                return it->get<T>();
            }
            catch (const json::exception &)
            {
                throw ConfigError(std::string("Invalid value for ") + key);
            }
        }

        bool IsValidName(const std::string &name)
        {
            if (name.empty() || name.size() > 64)
                return false;
            for (char c : name)
            {
                bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                          c == '-' || c == '_';
                if (!ok)
                    return false;
            }
            return true;
        }
    }

    InstanceConfig ParseInstanceConfig(const json &doc)
    {
        if (!doc.is_object())
            throw ConfigError("Instance configuration must be an object");

        InstanceConfig config;
        config.name = Field<std::string>(doc, "name", "default");
        if (!IsValidName(config.name))
            throw ConfigError("Instance name '" + config.name + "' may only contain letters, digits, '-' and '_'");

        auto ranges = Field<std::vector<std::string>>(doc, "ranges", {});
        if (ranges.empty())
            throw ConfigError("Instance " + config.name + " has no ranges");
        for (const auto &range : ranges)
            config.ranges.push_back(common::AddressRange::Parse(range));

        int full = Field<int>(doc, "full_scan_interval_minutes", 60);
        int quick = Field<int>(doc, "quick_check_interval_minutes", 1);
        if (quick < 1)
            throw ConfigError("quick_check_interval_minutes must be at least 1");
        if (quick >= full)
            throw ConfigError("quick_check_interval_minutes must be smaller than full_scan_interval_minutes");
        config.full_scan_interval = std::chrono::minutes(full);
        config.quick_check_interval = std::chrono::minutes(quick);

        double timeout = Field<double>(doc, "probe_timeout_seconds", 1.0);
        if (!(timeout > 0.0) || timeout > 60.0)
            throw ConfigError("probe_timeout_seconds must be in (0, 60]");
        config.probe_timeout = std::chrono::milliseconds(static_cast<long long>(std::lround(timeout * 1000.0)));

        config.offline_threshold = Field<int>(doc, "offline_threshold", 3);
        if (config.offline_threshold < 1)
            throw ConfigError("offline_threshold must be at least 1");

        config.ping_count = Field<int>(doc, "ping_count", 1);
        if (config.ping_count < 1 || config.ping_count > 10)
            throw ConfigError("ping_count must be between 1 and 10");

        return config;
    }

    DaemonConfig ParseDaemonConfig(const json &doc)
    {
        if (!doc.is_object())
            throw ConfigError("Configuration must be a JSON object");

        DaemonConfig config;
        config.state_dir = Field<std::string>(doc, "state_dir", config.state_dir);
        config.control_socket = Field<std::string>(doc, "control_socket", config.control_socket);
        config.journal = Field<std::string>(doc, "journal", config.state_dir + "/events.db");
        config.oui_database = Field<std::string>(doc, "oui_database", config.oui_database);

        std::string nameserver = Field<std::string>(doc, "nameserver", "");
        if (!nameserver.empty())
        {
            if (!common::IsIPv4Address(nameserver))
                throw ConfigError("nameserver must be an IPv4 address");
            config.nameserver = nameserver;
        }

        int in_flight = Field<int>(doc, "max_in_flight", 50);
        if (in_flight < 1 || in_flight > 1024)
            throw ConfigError("max_in_flight must be between 1 and 1024");
        config.max_in_flight = static_cast<size_t>(in_flight);

        int hostname_timeout = Field<int>(doc, "hostname_timeout_ms", 1000);
        if (hostname_timeout < 1)
            throw ConfigError("hostname_timeout_ms must be positive");
        config.hostname_timeout = std::chrono::milliseconds(hostname_timeout);

        auto instances = doc.find("instances");
        if (instances == doc.end() || !instances->is_array() || instances->empty())
            throw ConfigError("At least one instance must be configured");

        std::set<std::string> names;
        for (const auto &entry : *instances)
        {
            InstanceConfig instance = ParseInstanceConfig(entry);
            if (!names.insert(instance.name).second)
                throw ConfigError("Duplicate instance name " + instance.name);
            config.instances.push_back(std::move(instance));
        }
        return config;
    }

    DaemonConfig LoadDaemonConfig(const std::string &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
            throw ConfigError("Cannot open configuration file " + path);

        std::stringstream content;
        content << in.rdbuf();

        json doc = json::parse(content.str(), nullptr, false);
        if (doc.is_discarded())
            throw ConfigError("Configuration file " + path + " is not valid JSON");
        return ParseDaemonConfig(doc);
    }

    std::string StateFilePath(const DaemonConfig &config, const InstanceConfig &instance)
    {
        return config.state_dir + "/" + instance.name + ".json";
    }
}
