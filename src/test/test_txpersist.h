// Copyright (c) 2015-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#ifndef TXPERSIST_TEST_TEST_TXPERSIST_H
#define TXPERSIST_TEST_TEST_TXPERSIST_H

#include "amount.h"
#include "coins.h"
#include "fs.h"
#include "orphan_txns.h"
#include "pool_persistence.h"
#include "primitives/transaction.h"
#include "txmempool.h"
#include "txn_validator.h"

#include <vector>

class ConfigInit;

/**
 * Basic testing setup.
 * Gives every test its own data directory and a default configuration.
 */
struct BasicTestingSetup {
    ConfigInit& testConfig;
    fs::path pathTemp;

    BasicTestingSetup();
    ~BasicTestingSetup();
};

/**
 * Testing setup that configures a complete environment: a chain view funded
 * with a number of mature coinbase txns, both pools, the validator and the
 * persistence controller dumping into the test data directory.
 */
struct TestingSetup : public BasicTestingSetup {
    static constexpr size_t NUM_COINBASE_TXNS {10};

    CCoinsViewMemory coinsView;
    CTxMemPool mempool;
    COrphanTxns orphanTxns;
    CTxnValidator validator;
    CPoolPersistence persistence;

    // For convenience, coinbase transactions.
    std::vector<CTransactionRef> coinbaseTxns;

    TestingSetup();
    ~TestingSetup();

    // Drop the contents of both pools, as a node restart would
    void ClearPools();
    // Submit a txn through the validator and return the resulting state
    CValidationState Submit(const CTransactionRef& tx, int64_t nAcceptTime = 0);
};

static constexpr Amount DEFAULT_TEST_TX_FEE{10000};

// Create a coinbase txn paying value to an anyone-can-spend script
CTransactionRef CreateCoinbaseTxn(int32_t nHeight, Amount value);

// Create a txn spending the given outpoints into nOutputs equal outputs
CTransactionRef CreateSpendingTxn(const std::vector<COutPoint>& vInputs,
                                  Amount totalOut,
                                  size_t nOutputs = 1);

/**
 * Create a chain of txns where each one spends the first output of the
 * previous one. The first txn spends outpoint, which must hold value.
 */
std::vector<CTransactionRef> CreateTxnChain(const COutPoint& outpoint,
                                            Amount value,
                                            size_t length);

#endif // TXPERSIST_TEST_TEST_TXPERSIST_H
