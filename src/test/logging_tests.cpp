// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "clientversion.h"
#include "init.h"
#include "logging.h"
#include "util.h"

#include "test/test_txpersist.h"

#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <boost/test/unit_test.hpp>

namespace {
    const std::vector<TPLog::LogFlags> ALL_CATEGORIES {
        TPLog::MEMPOOL, TPLog::ORPHANS, TPLog::PERSIST, TPLog::TXNVAL, TPLog::RPC};

    // Puts the global logger back the way the test found it
    struct LoggingTestingSetup : public BasicTestingSetup {
        TPLog::Logger& logger {GetLogger()};
        const bool fPrintToConsole {logger.fPrintToConsole};
        const bool fPrintToDebugLog {logger.fPrintToDebugLog};
        const bool fLogTimestamps {logger.fLogTimestamps};
        const bool fLogTimeMicros {logger.fLogTimeMicros};
        std::vector<TPLog::LogFlags> vEnabled {};

        LoggingTestingSetup() {
            for (TPLog::LogFlags flag : ALL_CATEGORIES) {
                if (LogAcceptCategory(flag)) {
                    vEnabled.push_back(flag);
                }
            }
            logger.DisableCategory(TPLog::ALL);
        }

        ~LoggingTestingSetup() {
            logger.CloseDebugLog();
            logger.fPrintToConsole = fPrintToConsole;
            logger.fPrintToDebugLog = fPrintToDebugLog;
            logger.fLogTimestamps = fLogTimestamps;
            logger.fLogTimeMicros = fLogTimeMicros;
            logger.DisableCategory(TPLog::ALL);
            for (TPLog::LogFlags flag : vEnabled) {
                logger.EnableCategory(flag);
            }
        }

        // Parse strArg as the command line, keeping the test data directory
        void ResetArgs(const std::string &strArg) {
            std::vector<std::string> vecArg;
            if (strArg.size())
                boost::split(vecArg, strArg, boost::is_space(),
                             boost::token_compress_on);
            vecArg.insert(vecArg.begin(), "test_txpersist");

            std::vector<const char *> vecChar;
            for (std::string &s : vecArg) {
                vecChar.push_back(s.c_str());
            }

            gArgs.ParseParameters(vecChar.size(), &vecChar[0]);
            gArgs.ForceSetArg("-datadir", pathTemp.string());
        }

        std::string ReadDebugLog() const {
            std::ifstream file {(GetDataDir() / "debug.log").string()};
            return std::string(std::istreambuf_iterator<char>(file),
                               std::istreambuf_iterator<char>());
        }
    };
}

BOOST_FIXTURE_TEST_SUITE(logging_tests, LoggingTestingSetup)

BOOST_AUTO_TEST_CASE(init_logging_opens_debug_log) {
    // Lines logged before the file is open are kept for it
    logger.fPrintToDebugLog = true;
    LogPrintf("logged before the file was open\n");

    ResetArgs("-printtodebuglog=1 -logtimestamps=0");
    InitLogging();
    BOOST_CHECK(logger.fPrintToDebugLog);
    BOOST_CHECK(!logger.fLogTimestamps);
    BOOST_REQUIRE(fs::exists(GetDataDir() / "debug.log"));

    LogPrintf("logged after the file was open\n");
    const std::string strLog {ReadDebugLog()};
    const size_t nBefore {strLog.find("logged before the file was open\n")};
    const size_t nVersion {strLog.find(CLIENT_NAME + " version " + FormatFullVersion())};
    const size_t nAfter {strLog.find("logged after the file was open\n")};
    BOOST_REQUIRE(nBefore != std::string::npos);
    BOOST_REQUIRE(nVersion != std::string::npos);
    BOOST_REQUIRE(nAfter != std::string::npos);
    BOOST_CHECK_LT(nBefore, nVersion);
    BOOST_CHECK_LT(nVersion, nAfter);
}

BOOST_AUTO_TEST_CASE(init_logging_without_debug_log) {
    ResetArgs("-printtodebuglog=0");
    InitLogging();
    BOOST_CHECK(!logger.fPrintToDebugLog);
    LogPrintf("not written anywhere\n");
    BOOST_CHECK(!fs::exists(GetDataDir() / "debug.log"));
}

BOOST_AUTO_TEST_CASE(init_log_categories) {
    ResetArgs("-debug=orphans -debug=persist -debugexclude=persist -debug=nosuchcategory");
    InitLogCategories();
    BOOST_CHECK(LogAcceptCategory(TPLog::ORPHANS));
    BOOST_CHECK(!LogAcceptCategory(TPLog::PERSIST));
    BOOST_CHECK(!LogAcceptCategory(TPLog::MEMPOOL));
    BOOST_CHECK(!LogAcceptCategory(TPLog::TXNVAL));
    BOOST_CHECK(!LogAcceptCategory(TPLog::RPC));
}

BOOST_AUTO_TEST_CASE(init_log_categories_all_but_excluded) {
    ResetArgs("-debug=1 -debugexclude=rpc");
    InitLogCategories();
    BOOST_CHECK(LogAcceptCategory(TPLog::MEMPOOL));
    BOOST_CHECK(LogAcceptCategory(TPLog::ORPHANS));
    BOOST_CHECK(LogAcceptCategory(TPLog::PERSIST));
    BOOST_CHECK(LogAcceptCategory(TPLog::TXNVAL));
    BOOST_CHECK(!LogAcceptCategory(TPLog::RPC));
}

BOOST_AUTO_TEST_CASE(init_log_categories_debug_zero) {
    // -debug=0 wins over any category named next to it
    ResetArgs("-debug=0 -debug=orphans");
    InitLogCategories();
    for (TPLog::LogFlags flag : ALL_CATEGORIES) {
        BOOST_CHECK(!LogAcceptCategory(flag));
    }
}

BOOST_AUTO_TEST_SUITE_END()
