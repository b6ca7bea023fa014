// Copyright (c) 2019 The Bitcoin SV developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "orphan_txns.h"

#include "logging.h"
#include "utiltime.h"

#include <algorithm>

COrphanTxns::COrphanTxns(
    size_t maxOrphanTxns,
    int64_t orphanTxnsExpiry)
: mMaxOrphanTxns(maxOrphanTxns),
  mOrphanTxnsExpiry(orphanTxnsExpiry)
{}

bool COrphanTxns::addTxn(const TxInputDataSPtr& pTxInputData,
                         std::vector<TxId> vMissingParents) {
    if (!pTxInputData) {
        return false;
    }
    const CTransactionRef& ptx = pTxInputData->GetTxnPtr();
    const CTransaction &tx = *ptx;
    const TxId txid = tx.GetId();
    size_t orphanTxnsTotal {0};
    {
        std::unique_lock lock {mOrphanTxnsMtx};
        // Check if already present
        if (checkTxnExistsNL(txid)) {
            return false;
        }
        // Mark txn as orphan
        pTxInputData->SetOrphanTxn();
        if (!pTxInputData->GetAcceptTime()) {
            pTxInputData->SetAcceptTime(GetTime());
        }
        const int64_t nTimeFirstSeen {pTxInputData->GetAcceptTime()};
        const unsigned int sz = tx.GetTotalSize();
        const uint64_t nSequence {mNextSequence++};

        mOrphanTxns.emplace(
            txid,
            COrphanTxnEntry{pTxInputData,
                            nTimeFirstSeen,
                            nTimeFirstSeen + mOrphanTxnsExpiry,
                            sz,
                            std::move(vMissingParents),
                            nSequence});
        for (const CTxIn &txin : tx.vin) {
            mOrphanTxnsByPrev[txin.prevout.GetTxId()].insert(txid);
        }
        mOrphanTxnsByAge.emplace(std::make_pair(nTimeFirstSeen, nSequence), txid);
        mTotalSize += sz;
        orphanTxnsTotal = mOrphanTxns.size();
    }
    // A log message
    LogPrint(TPLog::ORPHANS,
            "stored orphan txn= %s source= %s (mapsz %u)\n",
             txid.ToString(),
             enum_cast<std::string>(pTxInputData->GetTxSource()),
             orphanTxnsTotal);
    return true;
}

int COrphanTxns::eraseTxn(const TxId& txid) {
    int count = 0;
    size_t orphanTxnsTotal {0};
    {
        std::unique_lock lock {mOrphanTxnsMtx};
        count = eraseTxnNL(txid);
        orphanTxnsTotal = mOrphanTxns.size();
    }
    if (count) {
        LogPrint(TPLog::ORPHANS,
                "removed orphan txn= %s (mapsz %u)\n",
                 txid.ToString(),
                 orphanTxnsTotal);
    }
    return count;
}

int COrphanTxns::eraseTxnNL(const TxId& txid) {
    OrphanTxnsIter it = mOrphanTxns.find(txid);
    if (it == mOrphanTxns.end()) {
        return 0;
    }
    const COrphanTxnEntry& entry = it->second;
    for (const CTxIn &txin : entry.pTxInputData->GetTxnPtr()->vin) {
        auto itPrev = mOrphanTxnsByPrev.find(txin.prevout.GetTxId());
        if (itPrev == mOrphanTxnsByPrev.end()) {
            continue;
        }
        itPrev->second.erase(txid);
        if (itPrev->second.empty()) {
            mOrphanTxnsByPrev.erase(itPrev);
        }
    }
    mOrphanTxnsByAge.erase(std::make_pair(entry.nTimeFirstSeen, entry.nSequence));
    mTotalSize -= entry.size;
    mOrphanTxns.erase(it);
    return 1;
}

void COrphanTxns::eraseTxns() {
    std::unique_lock lock {mOrphanTxnsMtx};
    mOrphanTxns.clear();
    mOrphanTxnsByPrev.clear();
    mOrphanTxnsByAge.clear();
    mTotalSize = 0;
}

bool COrphanTxns::checkTxnExists(const TxId& txid) const {
    std::shared_lock lock {mOrphanTxnsMtx};
    return checkTxnExistsNL(txid);
}

bool COrphanTxns::checkTxnExistsNL(const TxId& txid) const {
    return mOrphanTxns.find(txid) != mOrphanTxns.end();
}

unsigned int COrphanTxns::limitTxnsSize() {
    unsigned int nEvicted {0};
    unsigned int nErasedTimeLimit {0};
    {
        std::unique_lock lock {mOrphanTxnsMtx};
        // Sweep out expired orphan pool entries
        nErasedTimeLimit = eraseExpiredNL(GetTime());
        // If the limit is still not reached then remove the oldest txns
        while (mOrphanTxns.size() > mMaxOrphanTxns) {
            const TxId oldest {mOrphanTxnsByAge.begin()->second};
            eraseTxnNL(oldest);
            ++nEvicted;
        }
    }
    // Log a message
    if (nErasedTimeLimit) {
        LogPrint(TPLog::ORPHANS,
                "Erased %d orphan txn due to expiration\n",
                 nErasedTimeLimit);
    }
    if (nEvicted) {
        LogPrint(TPLog::ORPHANS,
                "orphan pool overflow, removed %u txn\n",
                 nEvicted);
    }
    return nEvicted;
}

unsigned int COrphanTxns::eraseExpired(int64_t nNow) {
    std::unique_lock lock {mOrphanTxnsMtx};
    return eraseExpiredNL(nNow);
}

unsigned int COrphanTxns::eraseExpiredNL(int64_t nNow) {
    std::vector<TxId> vExpired {};
    for (const auto& [txid, entry] : mOrphanTxns) {
        if (entry.nTimeExpire <= nNow) {
            vExpired.emplace_back(txid);
        }
    }
    unsigned int nErased {0};
    for (const TxId& txid : vExpired) {
        nErased += eraseTxnNL(txid);
    }
    return nErased;
}

std::vector<TxInputDataSPtr> COrphanTxns::getDependentTxns(const TxId& parentTxId) const {
    std::shared_lock lock {mOrphanTxnsMtx};
    auto itByPrev = mOrphanTxnsByPrev.find(parentTxId);
    if (itByPrev == mOrphanTxnsByPrev.end()) {
        return {};
    }
    std::vector<const COrphanTxnEntry*> vEntries {};
    vEntries.reserve(itByPrev->second.size());
    for (const TxId& txid : itByPrev->second) {
        vEntries.emplace_back(&mOrphanTxns.at(txid));
    }
    // Retry the way they arrived
    std::sort(vEntries.begin(), vEntries.end(),
        [](const COrphanTxnEntry* a, const COrphanTxnEntry* b) {
            return std::make_pair(a->nTimeFirstSeen, a->nSequence) <
                   std::make_pair(b->nTimeFirstSeen, b->nSequence);
        });
    std::vector<TxInputDataSPtr> vTxns {};
    vTxns.reserve(vEntries.size());
    for (const COrphanTxnEntry* pEntry : vEntries) {
        vTxns.emplace_back(pEntry->pTxInputData);
    }
    return vTxns;
}

void COrphanTxns::markAttempt(const TxId& txid) {
    std::unique_lock lock {mOrphanTxnsMtx};
    auto it = mOrphanTxns.find(txid);
    if (it != mOrphanTxns.end()) {
        it->second.pTxInputData->IncrementAttempts();
    }
}

std::vector<COrphanTxnInfo> COrphanTxns::getSnapshot() const {
    std::shared_lock lock {mOrphanTxnsMtx};
    std::vector<COrphanTxnInfo> vInfo {};
    vInfo.reserve(mOrphanTxns.size());
    for (const auto& elem : mOrphanTxnsByAge) {
        const COrphanTxnEntry& entry = mOrphanTxns.at(elem.second);
        vInfo.push_back(COrphanTxnInfo{entry.pTxInputData->GetTxnPtr(),
                                       entry.nTimeFirstSeen,
                                       entry.vMissingParents,
                                       entry.pTxInputData->GetAttempts()});
    }
    return vInfo;
}

/** Get TxIds of known orphan transactions */
std::vector<TxId> COrphanTxns::getTxIds() const {
    std::shared_lock lock {mOrphanTxnsMtx};
    if (mOrphanTxns.empty()) {
        return {};
    }
    std::vector<TxId> vTxIds;
    vTxIds.reserve(mOrphanTxns.size());
    for (const auto& elem: mOrphanTxnsByAge) {
        vTxIds.emplace_back(elem.second);
    }
    return vTxIds;
}

size_t COrphanTxns::getTxnsNumber() const {
    std::shared_lock lock {mOrphanTxnsMtx};
    return mOrphanTxns.size();
}

uint64_t COrphanTxns::getTotalSize() const {
    std::shared_lock lock {mOrphanTxnsMtx};
    return mTotalSize;
}
