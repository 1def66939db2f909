#ifndef DOWNLOAD_EVENT_HPP
#define DOWNLOAD_EVENT_HPP

#include "CalendarDate.hpp"
#include <string>

struct DownloadEvent
{
    std::string key;
    CalendarDate day;

    DownloadEvent() = default;
    DownloadEvent(std::string eventKey, const CalendarDate &eventDay)
        : key(std::move(eventKey)), day(eventDay) {}

    DownloadEvent(const DownloadEvent &) = default;
    DownloadEvent(DownloadEvent &&) = default;
    DownloadEvent &operator=(const DownloadEvent &) = default;
    DownloadEvent &operator=(DownloadEvent &&) = default;
};

#endif
