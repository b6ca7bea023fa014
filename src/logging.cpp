// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2017-2018 The Bitcoin developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "logging.h"
#include "util.h"
#include "utiltime.h"

#include <sstream>

constexpr auto LOGFILE = "debug.log";

/**
 * NOTE: the logger instance is leaked on exit. Destructors of other static
 * objects may still log during shutdown, so the logger must outlive them.
 */
TPLog::Logger &GetLogger() {
    static TPLog::Logger *const logger = new TPLog::Logger(LOGFILE);
    return *logger;
}

static int FileWriteStr(const std::string &str, FILE *fp) {
    return static_cast<int>(fwrite(str.data(), 1, str.size(), fp));
}

bool TPLog::Logger::OpenDebugLog() {
    std::lock_guard<std::mutex> scoped_lock(mutexDebugLog);

    if (fileout != nullptr) {
        return true;
    }

    fs::path pathDebug = GetDataDir() / this->fileName;
    fileout = fsbridge::fopen(pathDebug, "a");
    if (fileout == nullptr) {
        return false;
    }

    // Unbuffered.
    setbuf(fileout, nullptr);
    // Dump buffered messages from before we opened the log.
    while (!vMsgsBeforeOpenLog.empty()) {
        FileWriteStr(vMsgsBeforeOpenLog.front(), fileout);
        vMsgsBeforeOpenLog.pop_front();
    }
    return true;
}

void TPLog::Logger::CloseDebugLog() {
    std::lock_guard<std::mutex> scoped_lock(mutexDebugLog);
    if (fileout) {
        fclose(fileout);
        fileout = nullptr;
    }
}

struct CLogCategoryDesc {
    TPLog::LogFlags flag;
    std::string category;
};

const CLogCategoryDesc LogCategories[] = {
    {TPLog::NONE, "0"},
    {TPLog::MEMPOOL, "mempool"},
    {TPLog::ORPHANS, "orphans"},
    {TPLog::PERSIST, "persist"},
    {TPLog::TXNVAL, "txnval"},
    {TPLog::RPC, "rpc"},
    {TPLog::ALL, "1"},
    {TPLog::ALL, "all"},
};

bool GetLogCategory(TPLog::LogFlags &flag, const std::string &str) {
    if (str.empty()) {
        flag = TPLog::ALL;
        return true;
    }
    for (const CLogCategoryDesc &category_desc : LogCategories) {
        if (category_desc.category == str) {
            flag = category_desc.flag;
            return true;
        }
    }
    return false;
}

std::string ListLogCategories() {
    std::string ret;
    int outcount = 0;
    for (const CLogCategoryDesc &category_desc : LogCategories) {
        // Omit the special cases.
        if (category_desc.flag != TPLog::NONE &&
            category_desc.flag != TPLog::ALL) {
            if (outcount != 0) ret += ", ";
            ret += category_desc.category;
            outcount++;
        }
    }
    return ret;
}

TPLog::Logger::Logger(const char* fileName)
: fileName(fileName)
{
}

TPLog::Logger::~Logger() {
    if (fileout) {
        fclose(fileout);
    }
}

std::string TPLog::Logger::LogTimestampStr(const std::string& str)
{
    if(!fLogTimestamps)
        return str;

    std::ostringstream ss;

    if(fStartedNewLine)
    {
        thread_local const DateTimeFormatter dtf{"%Y-%m-%d %H:%M:%S"};

        const int64_t nTimeMicros{GetLogTimeMicros()};
        ss = dtf(nTimeMicros / 1000000);
        if(fLogTimeMicros)
            ss << tfm::format(".%06d", nTimeMicros % 1000000);

        ss << " [" << GetThreadName() << "] " << str;
    }
    else
        ss << str;

    fStartedNewLine = !str.empty() && str[str.size() - 1] == '\n';

    return ss.str();
}

int TPLog::Logger::LogPrintStr(const std::string &str) {

    // Returns total number of characters written.
    int ret = 0;

    std::string strTimestamped = LogTimestampStr(str);

    if (fPrintToConsole) {
        ret = static_cast<int>(fwrite(strTimestamped.data(), 1, strTimestamped.size(), stdout));
        fflush(stdout);
    }
    if (fPrintToDebugLog) {
        std::lock_guard<std::mutex> scoped_lock(mutexDebugLog);

        // Buffer if we haven't opened the log yet.
        if (fileout == nullptr) {
            // Stop buffering if it gets too big
            if (vMsgsBeforeOpenLog.size() <= 1000) {
                vMsgsBeforeOpenLog.push_back(strTimestamped);
                ret = static_cast<int>(strTimestamped.length());
            }
        } else {
            ret = FileWriteStr(strTimestamped, fileout);
        }
    }
    return ret;
}

void TPLog::Logger::EnableCategory(LogFlags category) {
    logCategories |= category;
}

void TPLog::Logger::DisableCategory(LogFlags category) {
    logCategories &= ~category;
}

bool TPLog::Logger::WillLogCategory(std::underlying_type_t<LogFlags> category) const {
    return (logCategories.load(std::memory_order_relaxed) & category) != 0;
}
