// Copyright (c) 2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "config.h"
#include "policy/policy.h"

#include "test/test_txpersist.h"

#include <boost/test/unit_test.hpp>
#include <limits>
#include <string>

BOOST_FIXTURE_TEST_SUITE(config_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(defaults) {
    GlobalConfig config;

    BOOST_CHECK_EQUAL(config.GetMaxTxSize(), DEFAULT_MAX_TX_SIZE);
    BOOST_CHECK_EQUAL(config.GetLimitAncestorCount(), DEFAULT_ANCESTOR_LIMIT);
    BOOST_CHECK_EQUAL(config.GetMemPoolExpiry(), DEFAULT_MEMPOOL_EXPIRY * SECONDS_IN_ONE_HOUR);
    BOOST_CHECK_EQUAL(config.GetMaxOrphanTxns(), DEFAULT_MAX_ORPHAN_TRANSACTIONS);
    BOOST_CHECK_EQUAL(config.GetOrphanTxnsExpiry(), DEFAULT_ORPHAN_TRANSACTIONS_EXPIRY);
    BOOST_CHECK_EQUAL(config.GetOrphanOnAncestorLimit(), DEFAULT_ORPHAN_ON_ANCESTOR_LIMIT);
    BOOST_CHECK_EQUAL(config.GetPersistMempool(), DEFAULT_PERSIST_MEMPOOL);
}

BOOST_AUTO_TEST_CASE(mempool_expiry) {
    GlobalConfig config;
    std::string reason;

    // can not set a negative expiry
    BOOST_CHECK(!config.SetMemPoolExpiry(-1, &reason));
    BOOST_CHECK(!reason.empty());

    // can not set an expiry that does not fit in seconds
    BOOST_CHECK(!config.SetMemPoolExpiry(std::numeric_limits<int64_t>::max(), &reason));

    // hours are stored as seconds
    BOOST_CHECK(config.SetMemPoolExpiry(12, &reason));
    BOOST_CHECK_EQUAL(config.GetMemPoolExpiry(), 12 * SECONDS_IN_ONE_HOUR);
}

BOOST_AUTO_TEST_CASE(orphan_limits) {
    GlobalConfig config;
    std::string reason;

    BOOST_CHECK(!config.SetMaxOrphanTxns(-1, &reason));
    // an empty orphan pool is allowed
    BOOST_CHECK(config.SetMaxOrphanTxns(0, &reason));
    BOOST_CHECK_EQUAL(config.GetMaxOrphanTxns(), 0U);

    BOOST_CHECK(!config.SetOrphanTxnsExpiry(0, &reason));
    BOOST_CHECK(config.SetOrphanTxnsExpiry(1, &reason));
    BOOST_CHECK_EQUAL(config.GetOrphanTxnsExpiry(), 1);

    config.SetOrphanOnAncestorLimit(false);
    BOOST_CHECK(!config.GetOrphanOnAncestorLimit());
}

BOOST_AUTO_TEST_CASE(ancestor_and_tx_size_limits) {
    GlobalConfig config;

    // the error string is optional
    BOOST_CHECK(!config.SetLimitAncestorCount(0));
    BOOST_CHECK(config.SetLimitAncestorCount(1));
    BOOST_CHECK_EQUAL(config.GetLimitAncestorCount(), 1U);

    BOOST_CHECK(!config.SetMaxTxSize(0));
    BOOST_CHECK(config.SetMaxTxSize(1000));
    BOOST_CHECK_EQUAL(config.GetMaxTxSize(), 1000U);
}

BOOST_AUTO_TEST_CASE(reset) {
    GlobalConfig config;
    config.SetPersistMempool(false);
    config.SetMaxOrphanTxns(3);
    config.Reset();
    BOOST_CHECK(config.GetPersistMempool());
    BOOST_CHECK_EQUAL(config.GetMaxOrphanTxns(), DEFAULT_MAX_ORPHAN_TRANSACTIONS);
}

BOOST_AUTO_TEST_SUITE_END()
