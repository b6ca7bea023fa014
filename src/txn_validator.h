// Copyright (c) 2019 The Bitcoin SV developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#pragma once

#include "consensus/validation.h"
#include "orphan_txns.h"
#include "txn_validation_data.h"

#include <mutex>
#include <vector>

class CCoinsView;
class Config;
class CTxMemPool;

/**
 * A class representing txn Validator.
 *
 * It is the single admission path into the mempool. Txns are checked against
 * the chain state and the mempool, txns with unresolved inputs are parked in
 * the orphan pool, and orphans are retried as soon as a txn they spend from
 * gets accepted.
 *
 * Admissions are serialised: only one txn is validated at a time.
 */
class CTxnValidator final
{
  public:
    // Construction/destruction
    CTxnValidator(
        const Config& config,
        CTxMemPool& mpool,
        COrphanTxns& orphanTxns,
        const CCoinsView& coinsView);
    ~CTxnValidator() = default;

    // Forbid copying/assignment
    CTxnValidator(const CTxnValidator&) = delete;
    CTxnValidator(CTxnValidator&&) = delete;
    CTxnValidator& operator=(const CTxnValidator&) = delete;
    CTxnValidator& operator=(CTxnValidator&&) = delete;

    /**
     * Process a new txn with wait.
     *
     * A txn accepted by the mempool returns a valid state. A txn parked in the
     * orphan pool returns a valid state with IsOrphaned() set, plus
     * IsMissingInputs() when some of its inputs are unknown.
     */
    CValidationState processValidation(const TxInputDataSPtr& pTxInputData);

    /**
     * Retry orphans spending from the given txns, for instance after a block
     * made their parents available on chain.
     */
    void retryOrphans(const std::vector<TxId>& vParentTxIds);

    /** Getters */
    CTxMemPool& getMempool() { return mMempool; }
    COrphanTxns& getOrphanTxns() { return mOrphanTxns; }

  private:
    /** Run all admission checks and place the txn in the mempool or the orphan pool */
    CValidationState executeTxnValidationNL(const TxInputDataSPtr& pTxInputData);
    /** Park a txn in the orphan pool */
    void addToOrphanPoolNL(
        const TxInputDataSPtr& pTxInputData,
        std::vector<TxId> vMissingParents,
        CValidationState& state);
    /** Retry orphans depending on accepted txns, and on orphans accepted in turn */
    void processOrphansNL(std::vector<TxId> vAcceptedTxIds);

    const Config& mConfig;
    CTxMemPool& mMempool;
    COrphanTxns& mOrphanTxns;
    const CCoinsView& mCoinsView;

    std::mutex mMainMtx {};
};
