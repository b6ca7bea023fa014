// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2017-2018 The Bitcoin developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#ifndef TXPERSIST_LOGGING_H
#define TXPERSIST_LOGGING_H

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <list>
#include <mutex>
#include <string>
#include <type_traits>

#include <tinyformat.h>

static const bool DEFAULT_LOGTIMEMICROS = false;
static const bool DEFAULT_LOGTIMESTAMPS = true;
static const bool DEFAULT_PRINTTODEBUGLOG = true;

namespace TPLog {

enum LogFlags : uint32_t {
    NONE = 0,
    MEMPOOL = (1 << 0),
    ORPHANS = (1 << 1),
    PERSIST = (1 << 2),
    TXNVAL = (1 << 3),
    RPC = (1 << 4),
    ALL = ~uint32_t(0),
};

class Logger {
private:
    /**
     * Name of the log file, relative to the data directory
     */
    const char* const fileName;

    FILE *fileout = nullptr;
    std::mutex mutexDebugLog;
    std::list<std::string> vMsgsBeforeOpenLog;

    /**
     * fStartedNewLine is a state variable that will suppress printing of the
     * timestamp when multiple calls are made that don't end in a newline.
     */
    std::atomic_bool fStartedNewLine{true};

    std::atomic<std::underlying_type_t<LogFlags>> logCategories{0};

    std::string LogTimestampStr(const std::string &str);

public:
    bool fPrintToConsole = false;
    bool fPrintToDebugLog = DEFAULT_PRINTTODEBUGLOG;

    bool fLogTimestamps = DEFAULT_LOGTIMESTAMPS;
    bool fLogTimeMicros = DEFAULT_LOGTIMEMICROS;

    explicit Logger(const char* fileName);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /** Send a string to the log output */
    int LogPrintStr(const std::string &str);

    /** Returns false if the log file could not be opened */
    bool OpenDebugLog();
    void CloseDebugLog();

    void EnableCategory(LogFlags category);
    void DisableCategory(LogFlags category);

    /** Return true if log accepts specified category */
    bool WillLogCategory(std::underlying_type_t<LogFlags> category) const;
};

} // namespace TPLog

TPLog::Logger &GetLogger();

/** Return true if log accepts one of the specified categories */
static inline bool LogAcceptCategory(std::underlying_type_t<TPLog::LogFlags> categories) {
    return GetLogger().WillLogCategory(categories);
}

/** Returns a string with the supported log categories */
std::string ListLogCategories();

/** Return true if str parses as a log category and set the flag */
bool GetLogCategory(TPLog::LogFlags &flag, const std::string &str);

#define LogPrint(category, ...)                                                \
    do {                                                                       \
        if (LogAcceptCategory((category))) {                                   \
            GetLogger().LogPrintStr(tfm::format(__VA_ARGS__));                 \
        }                                                                      \
    } while (0)

#define LogPrintf(...)                                                         \
    do {                                                                       \
        GetLogger().LogPrintStr(tfm::format(__VA_ARGS__));                     \
    } while (0)

#endif // TXPERSIST_LOGGING_H
