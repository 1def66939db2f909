#include "Config.hpp"
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace
{
    std::string trim(const std::string &s)
    {
        const char *ws = " \t\r\n";
        auto begin = s.find_first_not_of(ws);
        if (begin == std::string::npos)
            return "";
        auto end = s.find_last_not_of(ws);
        return s.substr(begin, end - begin + 1);
    }

    long long parseInteger(const std::string &key, const std::string &value)
    {
        size_t consumed = 0;
        long long parsed = 0;
        try
        {
            parsed = std::stoll(value, &consumed);
        }
        catch (const std::exception &)
        {
            throw std::runtime_error("Invalid integer for " + key + ": " + value);
        }
        if (consumed != value.size())
        {
            throw std::runtime_error("Invalid integer for " + key + ": " + value);
        }
        return parsed;
    }

    size_t parseSize(const std::string &key, const std::string &value)
    {
        long long parsed = parseInteger(key, value);
        if (parsed < 0)
        {
            throw std::runtime_error("Negative value for " + key + ": " + value);
        }
        return static_cast<size_t>(parsed);
    }

    bool parseBool(const std::string &key, const std::string &value)
    {
        if (value == "true" || value == "1" || value == "yes")
            return true;
        if (value == "false" || value == "0" || value == "no")
            return false;
        throw std::runtime_error("Invalid boolean for " + key + ": " + value);
    }

    void applySetting(DownloadCountsConfig &config, const std::string &key, const std::string &value)
    {
        if (key == "databasePath")
            config.databasePath = value;
        else if (key == "busyTimeoutMs")
            config.busyTimeout = std::chrono::milliseconds(parseSize(key, value));
        else if (key == "readOnly")
            config.readOnly = parseBool(key, value);
        else if (key == "maxUpsertAttempts")
            config.maxUpsertAttempts = parseSize(key, value);
        else if (key == "baseRetryDelayMs")
            config.baseRetryDelay = std::chrono::milliseconds(parseSize(key, value));
        else if (key == "historyWindowDays")
            config.historyWindowDays = static_cast<unsigned>(parseSize(key, value));
        else if (key == "fillGaps")
            config.fillGaps = parseBool(key, value);
        else if (key == "utcOffsetMinutes")
            config.utcOffsetMinutes = static_cast<int>(parseInteger(key, value));
        else if (key == "appendTimeoutMs")
            config.appendTimeout = std::chrono::milliseconds(parseSize(key, value));
        else if (key == "queueCapacity")
            config.queueCapacity = parseSize(key, value);
        else if (key == "maxExplicitProducers")
            config.maxExplicitProducers = parseSize(key, value);
        else if (key == "batchSize")
            config.batchSize = parseSize(key, value);
        else if (key == "numWriterThreads")
            config.numWriterThreads = parseSize(key, value);
        else if (key == "writerIdleDelayMs")
            config.writerIdleDelay = std::chrono::milliseconds(parseSize(key, value));
        else
            throw std::runtime_error("Unknown config key: " + key);
    }
}

bool DownloadCountsConfig::validate() const
{
    // SQLite takes the busy timeout as an int of milliseconds
    const std::chrono::milliseconds maxBusyTimeout(std::numeric_limits<int>::max());
    const std::chrono::milliseconds zero(0);

    // utcOffsetMinutes bounded to the real-world range of UTC offsets
    return !databasePath.empty() &&
           busyTimeout >= zero && busyTimeout <= maxBusyTimeout &&
           baseRetryDelay >= zero &&
           appendTimeout >= zero &&
           writerIdleDelay >= zero &&
           maxUpsertAttempts > 0 &&
           historyWindowDays > 0 &&
           utcOffsetMinutes >= -14 * 60 && utcOffsetMinutes <= 14 * 60 &&
           queueCapacity > 0 &&
           batchSize > 0 &&
           numWriterThreads > 0;
}

DownloadCountsConfig loadConfigFromFile(const std::string &configFilePath)
{
    std::ifstream file(configFilePath);
    if (!file)
    {
        throw std::runtime_error("Failed to load config file: " + configFilePath);
    }

    DownloadCountsConfig config;
    std::string line;
    while (std::getline(file, line))
    {
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        std::istringstream iss(line);
        std::string key, value;
        if (!std::getline(iss, key, '=') || !std::getline(iss, value))
        {
            throw std::runtime_error("Malformed config line: " + line);
        }
        applySetting(config, trim(key), trim(value));
    }

    if (!config.validate())
    {
        throw std::runtime_error("Invalid configuration in: " + configFilePath);
    }
    return config;
}

bool saveConfigToFile(const DownloadCountsConfig &config, const std::string &configFilePath)
{
    std::ofstream file(configFilePath);
    if (!file)
    {
        return false;
    }
    file << "databasePath=" << config.databasePath << "\n"
         << "busyTimeoutMs=" << config.busyTimeout.count() << "\n"
         << "readOnly=" << (config.readOnly ? "true" : "false") << "\n"
         << "maxUpsertAttempts=" << config.maxUpsertAttempts << "\n"
         << "baseRetryDelayMs=" << config.baseRetryDelay.count() << "\n"
         << "historyWindowDays=" << config.historyWindowDays << "\n"
         << "fillGaps=" << (config.fillGaps ? "true" : "false") << "\n"
         << "utcOffsetMinutes=" << config.utcOffsetMinutes << "\n"
         << "appendTimeoutMs=" << config.appendTimeout.count() << "\n"
         << "queueCapacity=" << config.queueCapacity << "\n"
         << "maxExplicitProducers=" << config.maxExplicitProducers << "\n"
         << "batchSize=" << config.batchSize << "\n"
         << "numWriterThreads=" << config.numWriterThreads << "\n"
         << "writerIdleDelayMs=" << config.writerIdleDelay.count() << "\n";
    return static_cast<bool>(file);
}
