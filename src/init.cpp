// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "init.h"

#include "clientversion.h"
#include "config.h"
#include "logging.h"
#include "policy/policy.h"
#include "util.h"

#include <algorithm>
#include <vector>

std::string HelpMessage() {
    std::string strUsage = HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt(
        "-conf=<file>", tfm::format("Specify configuration file (default: %s)",
                                    TXPERSIST_CONF_FILENAME));
    strUsage += HelpMessageOpt("-datadir=<dir>", "Specify data directory");

    strUsage += HelpMessageGroup("Pool options:");
    strUsage += HelpMessageOpt(
        "-persistmempool",
        tfm::format("Whether to save the mempool and the orphan pool on "
                    "shutdown and load on restart (default: %u)",
                    DEFAULT_PERSIST_MEMPOOL));
    strUsage += HelpMessageOpt(
        "-mempoolexpiry=<n>",
        tfm::format("Do not keep transactions in the mempool longer than <n> "
                    "hours (default: %u)",
                    DEFAULT_MEMPOOL_EXPIRY));
    strUsage += HelpMessageOpt(
        "-limitancestorcount=<n>",
        tfm::format("Do not accept transactions if number of in-mempool "
                    "ancestors is <n> or more (default: %u)",
                    DEFAULT_ANCESTOR_LIMIT));
    strUsage += HelpMessageOpt(
        "-maxorphantxs=<n>",
        tfm::format("Keep at most <n> unconnectable transactions in memory "
                    "(default: %u)",
                    DEFAULT_MAX_ORPHAN_TRANSACTIONS));
    strUsage += HelpMessageOpt(
        "-orphantxsexpiry=<n>",
        tfm::format("Do not keep transactions in the orphan pool longer than "
                    "<n> seconds (default: %u)",
                    DEFAULT_ORPHAN_TRANSACTIONS_EXPIRY));
    strUsage += HelpMessageOpt(
        "-orphanonancestorlimit",
        tfm::format("Put transactions exceeding the ancestor limit into the "
                    "orphan pool instead of rejecting them (default: %u)",
                    DEFAULT_ORPHAN_ON_ANCESTOR_LIMIT));

    strUsage += HelpMessageGroup("Debugging/Testing options:");
    strUsage += HelpMessageOpt(
        "-debug=<category>",
        "Output debugging information (default: 0, supplying <category> is "
        "optional). If <category> is not supplied or if <category> = 1, "
        "output all debugging information. <category> can be: " +
            ListLogCategories() + ".");
    strUsage += HelpMessageOpt(
        "-debugexclude=<category>",
        "Exclude debugging information for a category. Can be used in "
        "conjunction with -debug=1 to output debug logs for all categories "
        "except one or more specified categories.");
    strUsage += HelpMessageOpt(
        "-logtimestamps",
        tfm::format("Prepend debug output with timestamp (default: %d)",
                    DEFAULT_LOGTIMESTAMPS));
    strUsage += HelpMessageOpt(
        "-logtimemicros",
        tfm::format("Add microsecond precision to debug timestamps (default: %d)",
                    DEFAULT_LOGTIMEMICROS));
    strUsage += HelpMessageOpt(
        "-printtoconsole",
        "Send trace/debug info to console instead of debug.log file");
    strUsage += HelpMessageOpt(
        "-printtodebuglog",
        tfm::format("Send trace/debug info to debug.log file (default: %d)",
                    DEFAULT_PRINTTODEBUGLOG));

    return strUsage;
}

void InitLogging() {
    TPLog::Logger &logger = GetLogger();
    logger.fPrintToConsole = gArgs.GetBoolArg("-printtoconsole", false);
    logger.fPrintToDebugLog =
        gArgs.GetBoolArg("-printtodebuglog", DEFAULT_PRINTTODEBUGLOG);
    logger.fLogTimestamps =
        gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);
    logger.fLogTimeMicros =
        gArgs.GetBoolArg("-logtimemicros", DEFAULT_LOGTIMEMICROS);

    if (logger.fPrintToDebugLog && !logger.OpenDebugLog()) {
        logger.fPrintToDebugLog = false;
        LogPrintf("Could not open debug log file %s\n",
                  (GetDataDir() / "debug.log").string());
    }

    LogPrintf("%s version %s\n", CLIENT_NAME, FormatFullVersion());
}

void InitLogCategories() {
    if (gArgs.IsArgSet("-debug")) {
        // Special-case: if -debug=0/-nodebug is set, turn off debugging
        // messages
        const std::vector<std::string> categories = gArgs.GetArgs("-debug");
        if (std::find(categories.begin(), categories.end(), std::string("0")) ==
            categories.end()) {
            for (const auto &cat : categories) {
                TPLog::LogFlags flag;
                if (!GetLogCategory(flag, cat)) {
                    LogPrintf("Warning: Unsupported logging category %s=%s.\n",
                              "-debug", cat);
                    continue;
                }
                GetLogger().EnableCategory(flag);
            }
        }
    }

    // Now remove the logging categories which were explicitly excluded
    if (gArgs.IsArgSet("-debugexclude")) {
        for (const std::string &cat : gArgs.GetArgs("-debugexclude")) {
            TPLog::LogFlags flag;
            if (!GetLogCategory(flag, cat)) {
                LogPrintf("Warning: Unsupported logging category %s=%s.\n",
                          "-debugexclude", cat);
                continue;
            }
            GetLogger().DisableCategory(flag);
        }
    }
}

bool AppInitParameters(ConfigInit &config, std::string &err) {
    if (!config.SetMemPoolExpiry(
            gArgs.GetArg("-mempoolexpiry", DEFAULT_MEMPOOL_EXPIRY), &err)) {
        return false;
    }
    if (!config.SetLimitAncestorCount(
            gArgs.GetArg("-limitancestorcount", DEFAULT_ANCESTOR_LIMIT), &err)) {
        return false;
    }
    if (!config.SetMaxOrphanTxns(
            gArgs.GetArg("-maxorphantxs", DEFAULT_MAX_ORPHAN_TRANSACTIONS), &err)) {
        return false;
    }
    if (!config.SetOrphanTxnsExpiry(
            gArgs.GetArg("-orphantxsexpiry", DEFAULT_ORPHAN_TRANSACTIONS_EXPIRY), &err)) {
        return false;
    }
    config.SetOrphanOnAncestorLimit(
        gArgs.GetBoolArg("-orphanonancestorlimit", DEFAULT_ORPHAN_ON_ANCESTOR_LIMIT));
    config.SetPersistMempool(
        gArgs.GetBoolArg("-persistmempool", DEFAULT_PERSIST_MEMPOOL));
    return true;
}
