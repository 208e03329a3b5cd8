#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "ArdourOsc/BridgeConfig.h"

namespace ArdourOsc
{
    /**
     * @brief Parser for bridge configuration from JSON and the command line
     *
     * On failure the target configuration is left unchanged and the reason is
     * logged.
     */
    class ConfigurationParser
    {
    public:
        /**
         * @brief Parse configuration from command line arguments
         *
         * A --config file is applied first, then the other options override it.
         *
         * @param argc Argument count
         * @param argv Argument values
         * @param config Configuration to fill
         * @param remaining Receives arguments that are not configuration
         *        options; when null such arguments are an error
         * @return bool True if parsing was successful
         */
        static bool parseCommandLine(int argc, char *argv[], BridgeConfig &config,
                                     std::vector<std::string> *remaining = nullptr);

        /**
         * @brief Parse configuration from a JSON file
         *
         * @param filePath Path to the JSON file
         * @param config Configuration to fill
         * @return bool True if parsing was successful
         */
        static bool parseJsonFile(const std::string &filePath, BridgeConfig &config);

        /**
         * @brief Parse configuration from a JSON string
         *
         * Unknown keys are ignored.
         *
         * @param jsonContent JSON content as string
         * @param config Configuration to fill
         * @return bool True if parsing was successful
         */
        static bool parseJsonString(const std::string &jsonContent, BridgeConfig &config);

        /**
         * @brief Render a configuration with the same keys the parser reads
         */
        static nlohmann::json toJson(const BridgeConfig &config);

        /**
         * @brief Usage text for the options parseCommandLine understands
         */
        static std::string usage();

    private:
        static bool parseJsonObject(const nlohmann::json &json, BridgeConfig &config);
        static bool parsePort(const std::string &text, bool allowZero, int &port);
        static bool parseInt(const std::string &text, int &value);
    };

} // namespace ArdourOsc
