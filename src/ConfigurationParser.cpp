#include "ArdourOsc/ConfigurationParser.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <fstream>
#include <sstream>

#include "ArdourOsc/Logging.h"

namespace ArdourOsc
{
    namespace
    {
        bool portInRange(int port, bool allowZero)
        {
            return port <= 65535 && (port > 0 || (allowZero && port == 0));
        }

        // Reads an integer member if present; false on a type or range error
        bool readInt(const nlohmann::json &json, const char *key, int &out)
        {
            if (!json.contains(key))
                return true;
            const nlohmann::json &value = json.at(key);
            if (!value.is_number_integer())
            {
                log_error("Configuration key '%s' must be an integer", key);
                return false;
            }
            long long raw = value.get<long long>();
            if (raw < INT_MIN || raw > INT_MAX)
            {
                log_error("Configuration key '%s' is out of range", key);
                return false;
            }
            out = static_cast<int>(raw);
            return true;
        }

        bool readString(const nlohmann::json &json, const char *key, std::string &out)
        {
            if (!json.contains(key))
                return true;
            const nlohmann::json &value = json.at(key);
            if (!value.is_string())
            {
                log_error("Configuration key '%s' must be a string", key);
                return false;
            }
            out = value.get<std::string>();
            return true;
        }

        bool readBool(const nlohmann::json &json, const char *key, bool &out)
        {
            if (!json.contains(key))
                return true;
            const nlohmann::json &value = json.at(key);
            if (!value.is_boolean())
            {
                log_error("Configuration key '%s' must be a boolean", key);
                return false;
            }
            out = value.get<bool>();
            return true;
        }
    }

    bool ConfigurationParser::parseCommandLine(int argc, char *argv[], BridgeConfig &config,
                                               std::vector<std::string> *remaining)
    {
        BridgeConfig parsed = config;

        // The file is applied first so that explicit options override it.
        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            if (arg == "--config" || arg == "-c")
            {
                if (i + 1 >= argc)
                {
                    log_error("Missing value for %s", arg.c_str());
                    return false;
                }
                if (!parseJsonFile(argv[++i], parsed))
                    return false;
            }
        }

        std::vector<std::string> rest;
        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];

            bool takesValue = arg == "--config" || arg == "-c" || arg == "--host" || arg == "-H" ||
                              arg == "--port" || arg == "-p" || arg == "--feedback-port" ||
                              arg == "-f" || arg == "--timeout-ms" || arg == "--feedback-mask" ||
                              arg == "--log-level" || arg == "--log-file";

            if (arg == "--announce")
            {
                parsed.announceSurface = true;
                continue;
            }

            if (!takesValue)
            {
                if (!remaining)
                {
                    log_error("Unknown option: %s", arg.c_str());
                    return false;
                }
                rest.push_back(arg);
                continue;
            }

            if (i + 1 >= argc)
            {
                log_error("Missing value for %s", arg.c_str());
                return false;
            }
            std::string value = argv[++i];

            if (arg == "--config" || arg == "-c")
            {
                continue;
            }
            else if (arg == "--host" || arg == "-H")
            {
                parsed.host = value;
            }
            else if (arg == "--port" || arg == "-p")
            {
                if (!parsePort(value, false, parsed.commandPort))
                    return false;
            }
            else if (arg == "--feedback-port" || arg == "-f")
            {
                if (!parsePort(value, true, parsed.feedbackPort))
                    return false;
            }
            else if (arg == "--timeout-ms")
            {
                if (!parseInt(value, parsed.receiveTimeoutMs))
                    return false;
            }
            else if (arg == "--feedback-mask")
            {
                if (!parseInt(value, parsed.feedbackMask))
                    return false;
            }
            else if (arg == "--log-level")
            {
                parsed.logLevel = value;
            }
            else if (arg == "--log-file")
            {
                parsed.logFile = value;
            }
        }

        config = parsed;
        if (remaining)
            remaining->insert(remaining->end(), rest.begin(), rest.end());
        return true;
    }

    bool ConfigurationParser::parseJsonFile(const std::string &filePath, BridgeConfig &config)
    {
        std::ifstream file(filePath);
        if (!file.is_open())
        {
            log_error("Cannot open configuration file %s", filePath.c_str());
            return false;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        return parseJsonString(buffer.str(), config);
    }

    bool ConfigurationParser::parseJsonString(const std::string &jsonContent, BridgeConfig &config)
    {
        nlohmann::json json;
        try
        {
            json = nlohmann::json::parse(jsonContent);
        }
        catch (const nlohmann::json::parse_error &e)
        {
            log_error("Invalid configuration JSON: %s", e.what());
            return false;
        }

        if (!json.is_object())
        {
            log_error("Configuration JSON must be an object");
            return false;
        }

        BridgeConfig parsed = config;
        if (!parseJsonObject(json, parsed))
            return false;

        config = parsed;
        return true;
    }

    bool ConfigurationParser::parseJsonObject(const nlohmann::json &json, BridgeConfig &config)
    {
        if (!readString(json, "host", config.host) ||
            !readInt(json, "commandPort", config.commandPort) ||
            !readInt(json, "feedbackPort", config.feedbackPort) ||
            !readString(json, "listenAddress", config.listenAddress) ||
            !readInt(json, "receiveTimeoutMs", config.receiveTimeoutMs) ||
            !readInt(json, "maxDatagramSize", config.maxDatagramSize) ||
            !readBool(json, "announceSurface", config.announceSurface) ||
            !readInt(json, "feedbackMask", config.feedbackMask) ||
            !readString(json, "logLevel", config.logLevel) ||
            !readString(json, "logFile", config.logFile))
        {
            return false;
        }

        if (!portInRange(config.commandPort, true))
        {
            log_error("commandPort %d is outside 0..65535", config.commandPort);
            return false;
        }
        if (!portInRange(config.feedbackPort, true))
        {
            log_error("feedbackPort %d is outside 0..65535", config.feedbackPort);
            return false;
        }
        return true;
    }

    nlohmann::json ConfigurationParser::toJson(const BridgeConfig &config)
    {
        nlohmann::json json;
        json["host"] = config.host;
        json["commandPort"] = config.commandPort;
        json["feedbackPort"] = config.feedbackPort;
        json["listenAddress"] = config.listenAddress;
        json["receiveTimeoutMs"] = config.receiveTimeoutMs;
        json["maxDatagramSize"] = config.maxDatagramSize;
        json["announceSurface"] = config.announceSurface;
        json["feedbackMask"] = config.feedbackMask;
        json["logLevel"] = config.logLevel;
        json["logFile"] = config.logFile;
        return json;
    }

    std::string ConfigurationParser::usage()
    {
        return "  --config, -c <file>        JSON configuration file\n"
               "  --host, -H <addr>          Ardour host (default 127.0.0.1)\n"
               "  --port, -p <port>          Ardour OSC port (default 3819)\n"
               "  --feedback-port, -f <port> Local feedback port, 0 for any (default 3820)\n"
               "  --timeout-ms <ms>          Listener receive timeout (default 1000)\n"
               "  --announce                 Register as a control surface after connecting\n"
               "  --feedback-mask <n>        Feedback bitmask sent with --announce\n"
               "  --log-level <level>        error, warning, info or debug (default info)\n"
               "  --log-file <path>          Also append log lines to this file\n";
    }

    bool ConfigurationParser::parsePort(const std::string &text, bool allowZero, int &port)
    {
        int value = 0;
        if (!parseInt(text, value))
            return false;
        if (!portInRange(value, allowZero))
        {
            log_error("Port %s is out of range", text.c_str());
            return false;
        }
        port = value;
        return true;
    }

    bool ConfigurationParser::parseInt(const std::string &text, int &value)
    {
        if (text.empty())
        {
            log_error("Expected a number, got an empty value");
            return false;
        }

        errno = 0;
        char *end = nullptr;
        long parsed = std::strtol(text.c_str(), &end, 10);
        if (errno != 0 || !end || *end != '\0' || parsed < INT_MIN || parsed > INT_MAX)
        {
            log_error("Expected a number, got '%s'", text.c_str());
            return false;
        }
        value = static_cast<int>(parsed);
        return true;
    }

} // namespace ArdourOsc
