// Copyright (c) 2011-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "txmempool.h"
#include "utiltime.h"

#include "test/test_txpersist.h"

#include <boost/test/unit_test.hpp>

namespace {
    void AddToMempool(CTxMemPool& pool, const CTransactionRef& tx, int64_t nTime,
                      Amount nFee = DEFAULT_TEST_TX_FEE) {
        pool.AddUnchecked(CTxMemPoolEntry{tx, nFee, nTime});
    }
}

BOOST_FIXTURE_TEST_SUITE(mempool_tests, TestingSetup)

BOOST_AUTO_TEST_CASE(MempoolAddAndRemoveRecursive) {
    const auto vChain = CreateTxnChain(COutPoint{coinbaseTxns[0]->GetId(), 0}, 50 * COIN, 3);
    for (const auto& tx : vChain) {
        AddToMempool(mempool, tx, 1600000000);
    }
    BOOST_CHECK_EQUAL(mempool.Size(), 3U);
    BOOST_CHECK(mempool.Exists(vChain[1]->GetId()));
    BOOST_CHECK(mempool.Get(vChain[2]->GetId()) == vChain[2]);
    BOOST_CHECK(!mempool.Get(coinbaseTxns[0]->GetId()));
    BOOST_CHECK(mempool.IsSpent(COutPoint{vChain[0]->GetId(), 0}));

    uint64_t nExpectedSize {0};
    for (const auto& tx : vChain) {
        nExpectedSize += tx->GetTotalSize();
    }
    BOOST_CHECK_EQUAL(mempool.GetTotalTxSize(), nExpectedSize);

    // Removing the middle txn takes its descendant with it
    mempool.RemoveRecursive(*vChain[1]);
    BOOST_CHECK_EQUAL(mempool.Size(), 1U);
    BOOST_CHECK(mempool.Exists(vChain[0]->GetId()));
    BOOST_CHECK(!mempool.IsSpent(COutPoint{vChain[0]->GetId(), 0}));
    BOOST_CHECK_EQUAL(mempool.GetTotalTxSize(), vChain[0]->GetTotalSize());

    mempool.Clear();
    BOOST_CHECK_EQUAL(mempool.Size(), 0U);
    BOOST_CHECK_EQUAL(mempool.GetTotalTxSize(), 0U);
}

BOOST_AUTO_TEST_CASE(MempoolSpentOutputsAndConflicts) {
    const CTransactionRef tx {
        CreateSpendingTxn({COutPoint{coinbaseTxns[0]->GetId(), 0}}, 49 * COIN, 2)};
    AddToMempool(mempool, tx, 1600000000);

    const auto out = mempool.GetSpentOutput(COutPoint{tx->GetId(), 1});
    BOOST_REQUIRE(out);
    BOOST_CHECK(out->nValue == tx->vout[1].nValue);
    BOOST_CHECK(!mempool.GetSpentOutput(COutPoint{tx->GetId(), 2}));

    const CTransactionRef doubleSpend {
        CreateSpendingTxn({COutPoint{coinbaseTxns[0]->GetId(), 0}}, 48 * COIN)};
    const std::set<CTransactionRef> conflicts {mempool.CheckConflict(*doubleSpend)};
    BOOST_REQUIRE_EQUAL(conflicts.size(), 1U);
    BOOST_CHECK(*conflicts.begin() == tx);
    BOOST_CHECK(mempool.CheckConflict(*tx).empty());
}

BOOST_AUTO_TEST_CASE(MempoolAncestorCount) {
    const auto vChain = CreateTxnChain(COutPoint{coinbaseTxns[0]->GetId(), 0}, 50 * COIN, 4);
    for (size_t i = 0; i < 3; ++i) {
        AddToMempool(mempool, vChain[i], 1600000000);
    }

    uint64_t nCount {0};
    uint64_t nSize {0};
    std::string errString;
    BOOST_CHECK(mempool.CalculateAncestorCount(*vChain[3], 4, nCount, nSize, errString));
    BOOST_CHECK_EQUAL(nCount, 4U);
    uint64_t nExpectedSize {0};
    for (const auto& tx : vChain) {
        nExpectedSize += tx->GetTotalSize();
    }
    BOOST_CHECK_EQUAL(nSize, nExpectedSize);

    BOOST_CHECK(!mempool.CalculateAncestorCount(*vChain[3], 3, nCount, nSize, errString));
    BOOST_CHECK(!errString.empty());
}

BOOST_AUTO_TEST_CASE(MempoolExpire) {
    const auto vChain = CreateTxnChain(COutPoint{coinbaseTxns[0]->GetId(), 0}, 50 * COIN, 2);
    const CTransactionRef unrelated {
        CreateSpendingTxn({COutPoint{coinbaseTxns[1]->GetId(), 0}}, 49 * COIN)};
    AddToMempool(mempool, vChain[0], 1000);
    // A fresh child of an expired parent goes with it
    AddToMempool(mempool, vChain[1], 5000);
    AddToMempool(mempool, unrelated, 2000);

    BOOST_CHECK_EQUAL(mempool.Expire(1500), 2);
    BOOST_CHECK_EQUAL(mempool.Size(), 1U);
    BOOST_CHECK(mempool.Exists(unrelated->GetId()));
    BOOST_CHECK_EQUAL(mempool.Expire(1500), 0);
}

BOOST_AUTO_TEST_CASE(MempoolRemoveForBlock) {
    const auto vChain = CreateTxnChain(COutPoint{coinbaseTxns[0]->GetId(), 0}, 50 * COIN, 2);
    const CTransactionRef inPool {
        CreateSpendingTxn({COutPoint{coinbaseTxns[1]->GetId(), 0}}, 49 * COIN)};
    for (const auto& tx : vChain) {
        AddToMempool(mempool, tx, 1600000000);
    }
    AddToMempool(mempool, inPool, 1600000000);

    // The block confirms the chain's first txn and double spends inPool
    const CTransactionRef conflicting {
        CreateSpendingTxn({COutPoint{coinbaseTxns[1]->GetId(), 0}}, 48 * COIN)};
    mempool.RemoveForBlock({vChain[0], conflicting});

    BOOST_CHECK(!mempool.Exists(vChain[0]->GetId()));
    BOOST_CHECK(mempool.Exists(vChain[1]->GetId()));
    BOOST_CHECK(!mempool.Exists(inPool->GetId()));
    BOOST_CHECK_EQUAL(mempool.Size(), 1U);
}

BOOST_AUTO_TEST_CASE(MempoolPrioritisation) {
    const CTransactionRef tx {
        CreateSpendingTxn({COutPoint{coinbaseTxns[0]->GetId(), 0}}, 49 * COIN)};
    const CTransactionRef absent {
        CreateSpendingTxn({COutPoint{coinbaseTxns[1]->GetId(), 0}}, 49 * COIN)};

    // A delta set before the txn arrives is applied on admission
    mempool.PrioritiseTransaction(tx->GetId(), Amount{700});
    AddToMempool(mempool, tx, 1600000000, Amount{1000});
    mempool.PrioritiseTransaction(tx->GetId(), Amount{-200});
    mempool.PrioritiseTransaction(absent->GetId(), Amount{42});

    const TxMempoolInfo info {mempool.Info(tx->GetId())};
    BOOST_REQUIRE(!info.IsNull());
    BOOST_CHECK(info.nFee == Amount{1000});
    BOOST_CHECK(info.nFeeDelta == Amount{500});

    Amount nDelta {0};
    mempool.ApplyDeltas(absent->GetId(), nDelta);
    BOOST_CHECK(nDelta == Amount{42});

    std::map<TxId, Amount> mapDeltas;
    std::vector<TxMempoolInfo> vInfo;
    mempool.GetDeltasAndInfo(mapDeltas, vInfo);
    BOOST_CHECK_EQUAL(mapDeltas.size(), 2U);
    BOOST_REQUIRE_EQUAL(vInfo.size(), 1U);
    BOOST_CHECK(vInfo[0].GetTxId() == tx->GetId());

    mempool.ClearPrioritisation(absent->GetId());
    nDelta = Amount{0};
    mempool.ApplyDeltas(absent->GetId(), nDelta);
    BOOST_CHECK(nDelta == Amount{0});
}

BOOST_AUTO_TEST_CASE(MempoolInfoAllInAdmissionOrder) {
    std::vector<CTransactionRef> vTxns {};
    // Entry times deliberately out of order
    const int64_t times[] = {3000, 1000, 2000};
    for (size_t i = 0; i < 3; ++i) {
        vTxns.push_back(
            CreateSpendingTxn({COutPoint{coinbaseTxns[i]->GetId(), 0}}, 49 * COIN));
        AddToMempool(mempool, vTxns.back(), times[i]);
    }
    const std::vector<TxMempoolInfo> vInfo {mempool.InfoAll()};
    BOOST_REQUIRE_EQUAL(vInfo.size(), 3U);
    for (size_t i = 0; i < 3; ++i) {
        BOOST_CHECK(vInfo[i].GetTxId() == vTxns[i]->GetId());
        BOOST_CHECK_EQUAL(vInfo[i].nTime, times[i]);
    }
}

BOOST_AUTO_TEST_SUITE_END()
