#ifndef DDSLEDGER_UTIL_CONFIG_PARSER_HPP
#define DDSLEDGER_UTIL_CONFIG_PARSER_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <istream>
#include <mutex>
#include <sstream>
#include <string>
#include "config/node_config.hpp"
#include "util/errors.hpp"
#include "util/logger.hpp"

/**
 * @file config_parser.hpp
 * @brief Reads a "key=value" node configuration into config::NodeConfig.
 *
 * FORMAT:
 *   # comment
 *   nodeName = alice
 *   chunkSize = 4096
 *   storageBackend = sqlite
 *   compressChunks = true
 *
 * RULES:
 *   - Whitespace around keys and values is trimmed; blank lines and '#' lines are skipped.
 *   - A line without '=' or a bad number/bool throws MalformedInputError.
 *   - Unknown keys are logged and ignored.
 *   - A missing file is not an error: defaults are kept and a warning is logged.
 *
 * USAGE:
 *   @code
 *   ddsledger::config::NodeConfig nodeConfig;
 *   ddsledger::util::ConfigParser parser(nodeConfig);
 *   parser.loadFromFile("ddsledger_node.conf");
 *   @endcode
 */

namespace ddsledger {
namespace util {

class ConfigParser
{
public:
    explicit ConfigParser(ddsledger::config::NodeConfig &nodeConfig)
        : nodeConfig_(nodeConfig)
    {
    }

    /**
     * @brief Parse the file at filepath into the referenced NodeConfig.
     * @return false if the file does not exist (defaults kept), true once parsed.
     * @throw MalformedInputError on malformed lines or values.
     */
    inline bool loadFromFile(const std::string &filepath)
    {
        std::ifstream inFile(filepath);
        if (!inFile.is_open()) {
            logger::warn("[ConfigParser] File not found: " + filepath + ", using defaults");
            return false;
        }

        logger::info("[ConfigParser] Loading config from " + filepath);
        loadFromStream(inFile);
        logger::info("[ConfigParser] Config loaded.");
        return true;
    }

    /**
     * @brief Parse already-open configuration text.
     * @throw MalformedInputError on malformed lines or values; the config is then left
     *        partially updated up to the offending line.
     */
    inline void loadFromStream(std::istream &in)
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string line;
        size_t lineNo = 0;
        while (std::getline(in, line)) {
            ++lineNo;
            trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }

            auto pos = line.find('=');
            if (pos == std::string::npos) {
                throw MalformedInputError("ConfigParser: line " + std::to_string(lineNo)
                                          + " has no '=': " + line);
            }
            std::string key = line.substr(0, pos);
            std::string val = line.substr(pos + 1);
            trim(key);
            trim(val);
            if (key.empty()) {
                throw MalformedInputError("ConfigParser: line " + std::to_string(lineNo)
                                          + " has an empty key");
            }

            applyKeyValue(key, val);
        }
    }

private:
    ddsledger::config::NodeConfig &nodeConfig_;
    std::mutex mutex_;

    inline void applyKeyValue(const std::string &key, const std::string &val)
    {
        if (key == "nodeName") {
            nodeConfig_.nodeName = val;
        }
        else if (key == "nodeAddress") {
            nodeConfig_.nodeAddress = val;
        }
        else if (key == "nodeWeight") {
            nodeConfig_.nodeWeight = parseUInt(val);
        }
        else if (key == "dataDirectory") {
            nodeConfig_.dataDirectory = val;
        }
        else if (key == "chunkSize") {
            uint64_t n = parseUInt(val);
            if (n == 0) {
                throw MalformedInputError("ConfigParser: chunkSize must be greater than zero");
            }
            nodeConfig_.chunkSize = n;
        }
        else if (key == "storageBackend") {
            if (val != "memory" && val != "sqlite") {
                throw MalformedInputError("ConfigParser: storageBackend must be 'memory' or 'sqlite', got '"
                                          + val + "'");
            }
            nodeConfig_.storageBackend = val;
        }
        else if (key == "compressChunks") {
            nodeConfig_.compressChunks = parseBool(val);
        }
        else if (key == "requestTimeoutMs") {
            nodeConfig_.requestTimeoutMs = parseUInt(val);
        }
        else if (key == "requestWorkers") {
            nodeConfig_.requestWorkers = parseUInt(val);
        }
        else if (key == "logLevel") {
            logger::parseLogLevel(val); // validate now rather than at startup
            nodeConfig_.logLevel = val;
        }
        else if (key == "logFile") {
            nodeConfig_.logFile = val;
        }
        else {
            logger::warn("[ConfigParser] Unrecognized key '" + key + "' with value '" + val + "'");
            return;
        }
        logger::debug("[ConfigParser] " + key + " set to " + val);
    }

    inline void trim(std::string &s)
    {
        static const std::string whitespace = " \t\r\n";
        auto pos = s.find_first_not_of(whitespace);
        if (pos == std::string::npos) {
            s.clear();
            return;
        }
        s.erase(0, pos);
        pos = s.find_last_not_of(whitespace);
        s.erase(pos + 1);
    }

    inline uint64_t parseUInt(const std::string &val) const
    {
        if (val.empty() || val[0] == '-' || val[0] == '+') {
            throw MalformedInputError("ConfigParser: expected an unsigned integer, got '" + val + "'");
        }
        try {
            size_t idx = 0;
            uint64_t n = std::stoull(val, &idx, 10);
            if (idx != val.size()) {
                throw MalformedInputError("ConfigParser: non-numeric suffix in '" + val + "'");
            }
            return n;
        }
        catch (const std::logic_error &ex) {
            // std::invalid_argument / std::out_of_range from stoull
            throw MalformedInputError("ConfigParser: parseUInt failed on '" + val + "': " + ex.what());
        }
    }

    inline bool parseBool(std::string val) const
    {
        std::transform(val.begin(), val.end(), val.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        }
        if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        throw MalformedInputError("ConfigParser: expected a boolean, got '" + val + "'");
    }
};

} // namespace util
} // namespace ddsledger

#endif // DDSLEDGER_UTIL_CONFIG_PARSER_HPP
