// Copyright (c) 2019 The Bitcoin SV developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "txn_validator.h"

#include "coins.h"
#include "config.h"
#include "consensus/tx_verify.h"
#include "logging.h"
#include "txmempool.h"
#include "utiltime.h"

#include <algorithm>
#include <deque>

namespace {
    // Accepted by the mempool, as opposed to parked or rejected
    bool IsAcceptedToMempool(const CValidationState& state) {
        return state.IsValid() && !state.IsOrphaned();
    }
}

CTxnValidator::CTxnValidator(
    const Config& config,
    CTxMemPool& mpool,
    COrphanTxns& orphanTxns,
    const CCoinsView& coinsView)
: mConfig(config),
  mMempool(mpool),
  mOrphanTxns(orphanTxns),
  mCoinsView(coinsView)
{}

/** Process a new txn in synchronous mode */
CValidationState CTxnValidator::processValidation(
    const TxInputDataSPtr& pTxInputData) {

    CValidationState state {};
    if (!pTxInputData || !pTxInputData->GetTxnPtr()) {
        state.Error("Txnval-synch: Null txn");
        return state;
    }
    const TxId txid = pTxInputData->GetTxnPtr()->GetId();
    LogPrint(TPLog::TXNVAL,
            "Txnval-synch: Got a new txn= %s source= %s\n",
             txid.ToString(),
             enum_cast<std::string>(pTxInputData->GetTxSource()));

    std::unique_lock lock { mMainMtx };
    try
    {
        state = executeTxnValidationNL(pTxInputData);
        if (IsAcceptedToMempool(state)) {
            processOrphansNL({txid});
        }
    } catch (const std::exception& e) {
        LogPrint(TPLog::TXNVAL,
                "Txnval-synch: An exception thrown in txn= %s processing: %s\n",
                 txid.ToString(),
                 e.what());
        state.Error(std::string("An exception thrown in txn processing: ") + e.what());
    }
    return state;
}

void CTxnValidator::retryOrphans(const std::vector<TxId>& vParentTxIds) {
    std::unique_lock lock { mMainMtx };
    try
    {
        processOrphansNL(vParentTxIds);
    } catch (const std::exception& e) {
        LogPrint(TPLog::TXNVAL,
                "Txnval-synch: An exception thrown while retrying orphans: %s\n",
                 e.what());
    }
}

CValidationState CTxnValidator::executeTxnValidationNL(
    const TxInputDataSPtr& pTxInputData) {

    const CTransactionRef& ptx = pTxInputData->GetTxnPtr();
    const CTransaction &tx = *ptx;
    const TxId txid = tx.GetId();
    CValidationState state {};

    if (!CheckRegularTransaction(tx, state, mConfig.GetMaxTxSize())) {
        return state;
    }
    // Is it already in the memory pool?
    if (mMempool.Exists(txid)) {
        state.Invalid(false, REJECT_DUPLICATE, "txn-already-in-mempool");
        return state;
    }
    if (mOrphanTxns.checkTxnExists(txid)) {
        state.Invalid(false, REJECT_DUPLICATE, "txn-already-in-orphanpool");
        return state;
    }
    if (mCoinsView.HaveTransaction(txid)) {
        state.Invalid(false, REJECT_DUPLICATE, "txn-already-known");
        return state;
    }
    // Check for conflicts with in-memory transactions
    std::set<CTransactionRef> collidedWith = mMempool.CheckConflict(tx);
    if (!collidedWith.empty()) {
        state.SetMempoolConflictDetected(std::move(collidedWith));
        state.Invalid(false, REJECT_DUPLICATE, "txn-mempool-conflict");
        return state;
    }

    // Resolve inputs from the chain first, then from the mempool
    Amount nValueIn {0};
    std::vector<TxId> vMissingParents {};
    for (const CTxIn &txin : tx.vin) {
        const COutPoint& prevout = txin.prevout;
        if (const auto coin = mCoinsView.GetCoin(prevout)) {
            nValueIn += coin->GetAmount();
        } else if (const auto out = mMempool.GetSpentOutput(prevout)) {
            nValueIn += out->nValue;
        } else if (mCoinsView.IsSpent(prevout)) {
            state.Invalid(false, REJECT_DUPLICATE, "bad-txns-inputs-spent");
            return state;
        } else if (std::find(vMissingParents.begin(), vMissingParents.end(),
                             prevout.GetTxId()) == vMissingParents.end()) {
            vMissingParents.emplace_back(prevout.GetTxId());
        }
    }
    if (!vMissingParents.empty()) {
        state.SetMissingInputs();
        addToOrphanPoolNL(pTxInputData, std::move(vMissingParents), state);
        return state;
    }

    if (!MoneyRange(nValueIn)) {
        state.Invalid(false, REJECT_INVALID, "bad-txns-inputvalues-outofrange");
        return state;
    }
    const Amount nFee = nValueIn - tx.GetValueOut();
    if (nFee < Amount{0}) {
        state.Invalid(false, REJECT_INVALID, "bad-txns-in-belowout",
                      tfm::format("value in (%s) < value out (%s)",
                                  nValueIn.ToString(),
                                  tx.GetValueOut().ToString()));
        return state;
    }

    // Check the in-mempool chain length
    uint64_t nCountWithAncestors {0};
    uint64_t nSizeWithAncestors {0};
    std::string errString;
    if (!mMempool.CalculateAncestorCount(tx,
                                         mConfig.GetLimitAncestorCount(),
                                         nCountWithAncestors,
                                         nSizeWithAncestors,
                                         errString)) {
        if (!mConfig.GetOrphanOnAncestorLimit()) {
            state.Invalid(false, REJECT_NONSTANDARD, "too-long-mempool-chain",
                          errString);
            return state;
        }
        // Wait in the orphan pool for the chain to get shorter
        std::vector<TxId> vInPoolParents {};
        for (const CTxIn &txin : tx.vin) {
            const TxId& parentId = txin.prevout.GetTxId();
            if (mMempool.Exists(parentId) &&
                std::find(vInPoolParents.begin(), vInPoolParents.end(),
                          parentId) == vInPoolParents.end()) {
                vInPoolParents.emplace_back(parentId);
            }
        }
        LogPrint(TPLog::TXNVAL, "Txnval-synch: txn= %s %s\n",
                 txid.ToString(), errString);
        addToOrphanPoolNL(pTxInputData, std::move(vInPoolParents), state);
        return state;
    }

    int64_t nAcceptTime {pTxInputData->GetAcceptTime()};
    if (!nAcceptTime) {
        nAcceptTime = GetTime();
    }
    CTxMemPoolEntry entry {ptx, nFee, nAcceptTime};
    entry.SetAncestorState(nCountWithAncestors, nSizeWithAncestors);
    mMempool.AddUnchecked(entry);
    pTxInputData->SetOrphanTxn(false);

    LogPrint(TPLog::TXNVAL,
            "Txnval-synch: txn= %s accepted by the mempool (poolsz %u txn, %u kB)\n",
             txid.ToString(),
             mMempool.Size(),
             mMempool.GetTotalTxSize() / 1000);
    return state;
}

void CTxnValidator::addToOrphanPoolNL(
    const TxInputDataSPtr& pTxInputData,
    std::vector<TxId> vMissingParents,
    CValidationState& state) {

    const TxId txid = pTxInputData->GetTxnPtr()->GetId();
    if (!mOrphanTxns.addTxn(pTxInputData, std::move(vMissingParents))) {
        state.Invalid(false, REJECT_DUPLICATE, "txn-already-in-orphanpool");
        return;
    }
    // Keep the orphan pool within its bounds
    mOrphanTxns.limitTxnsSize();
    // An old first-seen time can make the txn the first one out
    if (!mOrphanTxns.checkTxnExists(txid)) {
        LogPrint(TPLog::ORPHANS,
                "orphan txn= %s evicted on arrival\n",
                 txid.ToString());
        state.Invalid(false, REJECT_NONSTANDARD, "txn-orphan-evicted");
        return;
    }
    state.SetOrphaned();
}

void CTxnValidator::processOrphansNL(std::vector<TxId> vAcceptedTxIds) {
    std::deque<TxId> toProcess {vAcceptedTxIds.begin(), vAcceptedTxIds.end()};
    while (!toProcess.empty()) {
        const TxId parentTxId {toProcess.front()};
        toProcess.pop_front();
        for (const TxInputDataSPtr& pOrphan : mOrphanTxns.getDependentTxns(parentTxId)) {
            const TxId orphanTxId = pOrphan->GetTxnPtr()->GetId();
            // Evicted while an earlier sibling was being re-parked
            if (!mOrphanTxns.checkTxnExists(orphanTxId)) {
                continue;
            }
            // The txn goes back to the orphan pool if it is still missing inputs
            mOrphanTxns.markAttempt(orphanTxId);
            mOrphanTxns.eraseTxn(orphanTxId);
            const CValidationState state = executeTxnValidationNL(pOrphan);
            if (IsAcceptedToMempool(state)) {
                LogPrint(TPLog::ORPHANS,
                        "promoted orphan txn= %s after %u attempts\n",
                         orphanTxId.ToString(),
                         pOrphan->GetAttempts());
                toProcess.emplace_back(orphanTxId);
            } else if (!state.IsValid()) {
                LogPrint(TPLog::ORPHANS,
                        "removed invalid orphan txn= %s: %s\n",
                         orphanTxId.ToString(),
                         FormatStateMessage(state));
            }
        }
    }
}
