#include "CalendarDate.hpp"
#include "Config.hpp"
#include "ConnectionProvider.hpp"
#include "CounterRecorder.hpp"
#include "HistoryReader.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
    void printUsage(const char *program)
    {
        std::cerr << "Usage: " << program << " [--config FILE] record KEY [YYYY-MM-DD]\n"
                  << "       " << program << " [--config FILE] history KEY [YYYY-MM-DD]" << std::endl;
    }

    int runRecord(const DownloadCountsConfig &config, const std::string &key, const std::optional<std::string> &date)
    {
        CalendarDate day = CalendarDate::today(config.utcOffsetMinutes);
        if (date)
        {
            auto parsed = CalendarDate::parse(*date);
            if (!parsed)
            {
                std::cerr << "Invalid date: " << *date << std::endl;
                return 2;
            }
            day = *parsed;
        }

        auto provider = std::make_shared<SqliteConnectionProvider>(config);
        auto sink = std::make_shared<CollectingTimingSink>();
        CounterRecorder recorder(provider, config);

        bool counted = recorder.recordDownload(key, day, TimingRecorder(sink));
        std::cout << (counted ? "counted" : "uncounted") << std::endl;
        for (const auto &[phase, duration] : sink->getMeasurements())
        {
            std::cerr << phase << ": "
                      << std::chrono::duration_cast<std::chrono::microseconds>(duration).count() << "us" << std::endl;
        }
        return counted ? 0 : 1;
    }

    int runHistory(const DownloadCountsConfig &config, const std::string &key, const std::optional<std::string> &date)
    {
        auto provider = std::make_shared<SqliteConnectionProvider>(
            config.databasePath, config.busyTimeout, /*readOnly=*/true);
        HistoryReader reader(provider, config);

        try
        {
            // no download has been recorded against a database that does not exist yet
            std::vector<DownloadCount> history = provider->storeExists()
                                                     ? reader.fetchHistoryBefore(key, date)
                                                     : reader.emptyHistory(reader.endDateFor(date));
            for (const auto &entry : history)
            {
                std::cout << entry.date.toString() << '\t' << entry.count << '\n';
            }
        }
        catch (const StoreError &e)
        {
            std::cerr << "Failed to read history (" << toString(e.kind()) << "): " << e.what() << std::endl;
            return 1;
        }
        catch (const std::invalid_argument &e)
        {
            std::cerr << "Invalid history window: " << e.what() << std::endl;
            return 2;
        }
        std::cout.flush();
        return 0;
    }
}

int main(int argc, char **argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);

    DownloadCountsConfig config;
    if (args.size() >= 2 && args[0] == "--config")
    {
        try
        {
            config = loadConfigFromFile(args[1]);
        }
        catch (const std::runtime_error &e)
        {
            std::cerr << e.what() << std::endl;
            return 2;
        }
        args.erase(args.begin(), args.begin() + 2);
    }

    if (args.size() < 2 || args.size() > 3 || args[1].empty())
    {
        printUsage(argv[0]);
        return 2;
    }

    const std::string &command = args[0];
    const std::string &key = args[1];
    std::optional<std::string> date;
    if (args.size() == 3)
    {
        date = args[2];
    }

    if (command == "record")
    {
        return runRecord(config, key, date);
    }
    if (command == "history")
    {
        return runHistory(config, key, date);
    }

    printUsage(argv[0]);
    return 2;
}
