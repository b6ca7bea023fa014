// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "config.h"
#include "pool_dump_loader.h"
#include "pool_dump_writer.h"
#include "util.h"
#include "utiltime.h"

#include "test/test_txpersist.h"

#include <boost/test/unit_test.hpp>

#include <fstream>

namespace {
    const int64_t NOW {1600000000};

    std::vector<CTransactionRef> GetABunchOfTxns(const std::vector<CTransactionRef>& coinbaseTxns,
                                                 size_t howMany)
    {
        std::vector<CTransactionRef> result;
        for (size_t i = 0; i < howMany; ++i) {
            result.push_back(
                CreateSpendingTxn({COutPoint{coinbaseTxns[i]->GetId(), 0}}, 49 * COIN));
        }
        return result;
    }

    void WriteRawFile(const fs::path& path, const std::vector<uint8_t>& vBytes)
    {
        std::ofstream file {path.string(), std::ios::binary | std::ios::trunc};
        file.write(reinterpret_cast<const char*>(vBytes.data()), vBytes.size());
    }
}

BOOST_FIXTURE_TEST_SUITE(mempool_dump_load_tests, TestingSetup)

BOOST_AUTO_TEST_CASE(DumpLoadMempool)
{
    SetMockTime(NOW);
    for (const auto& tx : GetABunchOfTxns(coinbaseTxns, 5)) {
        BOOST_REQUIRE(Submit(tx).IsValid());
    }
    DumpMempool(mempool, GetDataDir());
    const std::vector<TxMempoolInfo> vBefore {mempool.InfoAll()};

    ClearPools();
    CPoolLoadStats stats {};
    BOOST_CHECK_EQUAL(LoadMempool(validator, testConfig, GetDataDir(), &stats), 5U);
    BOOST_CHECK_EQUAL(stats.nSucceeded, 5U);
    BOOST_CHECK_EQUAL(stats.nFailed, 0U);
    BOOST_CHECK_EQUAL(stats.nExpired, 0U);

    // Same txns, same order, same times
    const std::vector<TxMempoolInfo> vAfter {mempool.InfoAll()};
    BOOST_REQUIRE_EQUAL(vAfter.size(), vBefore.size());
    for (size_t i = 0; i < vAfter.size(); ++i) {
        BOOST_CHECK(vAfter[i].GetTxId() == vBefore[i].GetTxId());
        BOOST_CHECK_EQUAL(vAfter[i].nTime, vBefore[i].nTime);
    }
}

BOOST_AUTO_TEST_CASE(LoadMissingFile)
{
    CPoolLoadStats stats {};
    BOOST_CHECK_EQUAL(LoadMempool(validator, testConfig, GetDataDir(), &stats), 0U);
    BOOST_CHECK_EQUAL(stats.nFailed, 0U);
    BOOST_CHECK_EQUAL(LoadOrphanPool(validator, testConfig, GetDataDir()), 0U);
    BOOST_CHECK_EQUAL(mempool.Size(), 0U);
}

BOOST_AUTO_TEST_CASE(LoadSkipsExpiredEntries)
{
    SetMockTime(NOW);
    const auto vTxns = GetABunchOfTxns(coinbaseTxns, 3);
    const int64_t nExpiry {testConfig.GetMemPoolExpiry()};
    Submit(vTxns[0], NOW - nExpiry);       // exactly at the expiry boundary
    Submit(vTxns[1], NOW - nExpiry + 1);
    Submit(vTxns[2]);
    BOOST_REQUIRE_EQUAL(mempool.Size(), 3U);
    DumpMempool(mempool, GetDataDir());

    ClearPools();
    CPoolLoadStats stats {};
    BOOST_CHECK_EQUAL(LoadMempool(validator, testConfig, GetDataDir(), &stats), 2U);
    BOOST_CHECK_EQUAL(stats.nExpired, 1U);
    BOOST_CHECK(!mempool.Exists(vTxns[0]->GetId()));
    BOOST_CHECK(mempool.Exists(vTxns[1]->GetId()));
}

BOOST_AUTO_TEST_CASE(LoadRevalidatesAgainstChain)
{
    SetMockTime(NOW);
    const auto vTxns = GetABunchOfTxns(coinbaseTxns, 3);
    for (const auto& tx : vTxns) {
        Submit(tx);
    }
    DumpMempool(mempool, GetDataDir());
    ClearPools();

    // One txn confirmed, one double spent on chain since the dump
    const CTransactionRef doubleSpend {
        CreateSpendingTxn({COutPoint{coinbaseTxns[1]->GetId(), 0}}, 40 * COIN)};
    coinsView.ApplyBlock({vTxns[0], doubleSpend});

    CPoolLoadStats stats {};
    BOOST_CHECK_EQUAL(LoadMempool(validator, testConfig, GetDataDir(), &stats), 1U);
    BOOST_CHECK_EQUAL(stats.nFailed, 2U);
    BOOST_CHECK_EQUAL(mempool.Size(), 1U);
    BOOST_CHECK(mempool.Exists(vTxns[2]->GetId()));
}

BOOST_AUTO_TEST_CASE(LoadDoesNotCountStaleOrphanAsRestored)
{
    SetMockTime(NOW);
    const auto vChain = CreateTxnChain(COutPoint{coinbaseTxns[0]->GetId(), 0}, 50 * COIN, 2);
    // Old enough for the orphan pool, young enough for the mempool
    const int64_t nAcceptTime {NOW - testConfig.GetOrphanTxnsExpiry() - 10};
    BOOST_REQUIRE(Submit(vChain[0], nAcceptTime).IsValid());
    BOOST_REQUIRE(Submit(vChain[1], nAcceptTime).IsValid());
    BOOST_REQUIRE_EQUAL(mempool.Size(), 2U);
    DumpMempool(mempool, GetDataDir());
    ClearPools();

    // The parent is double spent on chain, so the child has nowhere to go
    const CTransactionRef doubleSpend {
        CreateSpendingTxn({COutPoint{coinbaseTxns[0]->GetId(), 0}}, 40 * COIN)};
    coinsView.ApplyBlock({doubleSpend});

    CPoolLoadStats stats {};
    BOOST_CHECK_EQUAL(LoadMempool(validator, testConfig, GetDataDir(), &stats), 0U);
    BOOST_CHECK_EQUAL(stats.nSucceeded, 0U);
    BOOST_CHECK_EQUAL(stats.nFailed, 2U);
    BOOST_CHECK_EQUAL(stats.nExpired, 0U);
    BOOST_CHECK_EQUAL(mempool.Size(), 0U);
    BOOST_CHECK_EQUAL(orphanTxns.getTxnsNumber(), 0U);
}

BOOST_AUTO_TEST_CASE(LoadRestoresFeeDeltas)
{
    SetMockTime(NOW);
    const auto vTxns = GetABunchOfTxns(coinbaseTxns, 2);
    Submit(vTxns[0]);
    mempool.PrioritiseTransaction(vTxns[0]->GetId(), Amount{1234});
    // Prioritised but never admitted
    mempool.PrioritiseTransaction(vTxns[1]->GetId(), Amount{99});
    DumpMempool(mempool, GetDataDir());

    ClearPools();
    mempool.ClearPrioritisation(vTxns[0]->GetId());
    mempool.ClearPrioritisation(vTxns[1]->GetId());
    BOOST_CHECK_EQUAL(LoadMempool(validator, testConfig, GetDataDir()), 1U);

    BOOST_CHECK(mempool.Info(vTxns[0]->GetId()).nFeeDelta == Amount{1234});
    Amount nDelta {0};
    mempool.ApplyDeltas(vTxns[1]->GetId(), nDelta);
    BOOST_CHECK(nDelta == Amount{99});
}

BOOST_AUTO_TEST_CASE(LoadMalformedFile)
{
    SetMockTime(NOW);
    for (const auto& tx : GetABunchOfTxns(coinbaseTxns, 2)) {
        Submit(tx);
    }
    DumpMempool(mempool, GetDataDir());
    ClearPools();

    // Chop the last byte off: nothing is restored, not even the complete records
    const fs::path path {GetDataDir() / "mempool.dat"};
    auto vBytes = ReadPoolDumpFile(PoolKind::mempool, GetDataDir());
    BOOST_REQUIRE(vBytes);
    vBytes->pop_back();
    WriteRawFile(path, *vBytes);

    BOOST_CHECK_EQUAL(LoadMempool(validator, testConfig, GetDataDir()), 0U);
    BOOST_CHECK_EQUAL(mempool.Size(), 0U);

    WriteRawFile(path, {0xde, 0xad, 0xbe, 0xef});
    BOOST_CHECK_EQUAL(LoadMempool(validator, testConfig, GetDataDir()), 0U);
    BOOST_CHECK_EQUAL(mempool.Size(), 0U);
}

BOOST_AUTO_TEST_CASE(DumpLoadOrphanPool)
{
    SetMockTime(NOW);
    const auto vChain = CreateTxnChain(COutPoint{coinbaseTxns[0]->GetId(), 0}, 50 * COIN, 3);
    Submit(vChain[1]);
    Submit(vChain[2]);
    BOOST_REQUIRE_EQUAL(orphanTxns.getTxnsNumber(), 2U);
    DumpOrphanPool(orphanTxns, GetDataDir());

    ClearPools();
    SetMockTime(NOW + 60);
    CPoolLoadStats stats {};
    BOOST_CHECK_EQUAL(LoadOrphanPool(validator, testConfig, GetDataDir(), &stats), 2U);
    BOOST_CHECK_EQUAL(orphanTxns.getTxnsNumber(), 2U);

    // First seen time survives, the load counts as one more attempt
    const std::vector<COrphanTxnInfo> vInfo {orphanTxns.getSnapshot()};
    BOOST_REQUIRE_EQUAL(vInfo.size(), 2U);
    for (const COrphanTxnInfo& info : vInfo) {
        BOOST_CHECK_EQUAL(info.nTimeFirstSeen, NOW);
        BOOST_CHECK_EQUAL(info.nAttempts, 1U);
    }
}

BOOST_AUTO_TEST_CASE(LoadOrphanPoolPromotesResolvedOrphans)
{
    SetMockTime(NOW);
    const auto vChain = CreateTxnChain(COutPoint{coinbaseTxns[0]->GetId(), 0}, 50 * COIN, 2);
    Submit(vChain[1]);
    DumpOrphanPool(orphanTxns, GetDataDir());
    ClearPools();

    // The parent is known by now
    BOOST_REQUIRE(Submit(vChain[0]).IsValid());
    BOOST_CHECK_EQUAL(LoadOrphanPool(validator, testConfig, GetDataDir()), 1U);
    BOOST_CHECK(mempool.Exists(vChain[1]->GetId()));
    BOOST_CHECK_EQUAL(orphanTxns.getTxnsNumber(), 0U);
}

BOOST_AUTO_TEST_CASE(LoadOrphanPoolSkipsExpiredEntries)
{
    SetMockTime(NOW);
    const auto vChain = CreateTxnChain(COutPoint{coinbaseTxns[0]->GetId(), 0}, 50 * COIN, 2);
    Submit(vChain[1]);
    DumpOrphanPool(orphanTxns, GetDataDir());
    ClearPools();

    SetMockTime(NOW + testConfig.GetOrphanTxnsExpiry());
    CPoolLoadStats stats {};
    BOOST_CHECK_EQUAL(LoadOrphanPool(validator, testConfig, GetDataDir(), &stats), 0U);
    BOOST_CHECK_EQUAL(stats.nExpired, 1U);
    BOOST_CHECK_EQUAL(orphanTxns.getTxnsNumber(), 0U);
}

BOOST_AUTO_TEST_SUITE_END()
