// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2019-2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "txmempool.h"

#include "logging.h"
#include <tinyformat.h>

#include <algorithm>
#include <mutex>

CTxMemPoolEntry::CTxMemPoolEntry(const CTransactionRef& _tx,
                                 const Amount _nFee,
                                 int64_t _nTime)
    : tx{_tx},
      nFee{_nFee},
      nTxSize{_tx->GetTotalSize()},
      nTime{_nTime},
      nSizeWithAncestors{nTxSize}
{}

void CTxMemPoolEntry::UpdateFeeDelta(Amount newFeeDelta) {
    feeDelta = newFeeDelta;
}

void CTxMemPoolEntry::SetAncestorState(uint64_t countWithAncestors,
                                       uint64_t sizeWithAncestors) {
    nCountWithAncestors = countWithAncestors;
    nSizeWithAncestors = sizeWithAncestors;
}

const enumTableT<MemPoolRemovalReason>& enumTable(MemPoolRemovalReason)
{
    static enumTableT<MemPoolRemovalReason> table
    {
        { MemPoolRemovalReason::UNKNOWN,  "unknown" },
        { MemPoolRemovalReason::EXPIRY,   "expiry" },
        { MemPoolRemovalReason::BLOCK,    "block" },
        { MemPoolRemovalReason::CONFLICT, "conflict" }
    };
    return table;
}

CTxMemPool::CTxMemPool()
{
    // lock free clear
    clearNL();
}

CTxMemPool::~CTxMemPool() {
}

void CTxMemPool::AddUnchecked(const CTxMemPoolEntry &entry) {
    std::unique_lock lock{smtx};

    const TxId txid = entry.GetTxId();
    auto [newit, inserted] = mapTx.insert(entry);
    if (!inserted) {
        LogPrint(TPLog::MEMPOOL, "AddUnchecked: %s already in mempool\n",
                 txid.ToString());
        return;
    }

    // Update transaction with any previous prioritisation
    const auto pos = mapDeltas.find(txid);
    if (pos != mapDeltas.end() && pos->second != Amount{0}) {
        mapTx.modify(newit, update_fee_delta(pos->second));
    }

    const CTransactionRef& tx = newit->GetSharedTx();
    for (const CTxIn &in : tx->vin) {
        mapNextTx[in.prevout] = tx;
    }
    totalTxSize += newit->GetTxSize();

    LogPrint(TPLog::MEMPOOL,
             "AddUnchecked: %s fee %s, %u ancestors, %u bytes\n",
             txid.ToString(), newit->GetFee().ToString(),
             newit->GetCountWithAncestors(), newit->GetTxSize());
}

bool CTxMemPool::Exists(const TxId &txid) const {
    std::shared_lock lock{smtx};
    return existsNL(txid);
}

bool CTxMemPool::existsNL(const TxId &txid) const {
    return mapTx.count(txid) != 0;
}

CTransactionRef CTxMemPool::Get(const TxId &txid) const {
    std::shared_lock lock{smtx};
    const auto it = mapTx.find(txid);
    if (it == mapTx.end()) {
        return nullptr;
    }
    return it->GetSharedTx();
}

TxMempoolInfo CTxMemPool::Info(const TxId &txid) const {
    std::shared_lock lock{smtx};
    const auto it = mapTx.find(txid);
    if (it == mapTx.end()) {
        return TxMempoolInfo{};
    }
    return TxMempoolInfo{*it};
}

std::vector<TxMempoolInfo> CTxMemPool::InfoAll() const {
    std::shared_lock lock{smtx};
    return infoAllNL();
}

std::vector<TxMempoolInfo> CTxMemPool::infoAllNL() const {
    std::vector<TxMempoolInfo> ret;
    ret.reserve(mapTx.size());
    for (const auto& entry : mapTx.get<insertion_order>()) {
        ret.emplace_back(entry);
    }
    return ret;
}

std::set<CTransactionRef> CTxMemPool::CheckConflict(const CTransaction &tx) const {
    std::shared_lock lock{smtx};
    std::set<CTransactionRef> conflicts;
    for (const CTxIn &txin : tx.vin) {
        const auto it = mapNextTx.find(txin.prevout);
        if (it != mapNextTx.end()) {
            conflicts.insert(it->second);
        }
    }
    return conflicts;
}

std::optional<CTxOut> CTxMemPool::GetSpentOutput(const COutPoint &outpoint) const {
    std::shared_lock lock{smtx};
    const auto it = mapTx.find(outpoint.GetTxId());
    if (it == mapTx.end()) {
        return std::nullopt;
    }
    const CTransaction& tx = it->GetTx();
    if (outpoint.GetN() >= tx.vout.size()) {
        return std::nullopt;
    }
    return tx.vout[outpoint.GetN()];
}

bool CTxMemPool::IsSpent(const COutPoint &outpoint) const {
    std::shared_lock lock{smtx};
    return mapNextTx.count(outpoint) != 0;
}

bool CTxMemPool::CalculateAncestorCount(
    const CTransaction &tx,
    uint64_t limitAncestorCount,
    uint64_t &nCountWithAncestors,
    uint64_t &nSizeWithAncestors,
    std::string &errString) const
{
    std::shared_lock lock{smtx};

    setEntries setAncestors;
    setEntries parentHashes;
    for (const CTxIn &in : tx.vin) {
        const auto piter = mapTx.find(in.prevout.GetTxId());
        if (piter != mapTx.end()) {
            parentHashes.insert(piter);
        }
    }

    nCountWithAncestors = 1;
    nSizeWithAncestors = tx.GetTotalSize();
    while (!parentHashes.empty()) {
        txiter stageit = *parentHashes.begin();
        setAncestors.insert(stageit);
        parentHashes.erase(stageit);
        ++nCountWithAncestors;
        nSizeWithAncestors += stageit->GetTxSize();

        if (nCountWithAncestors > limitAncestorCount) {
            errString = tfm::format("too many unconfirmed ancestors [limit: %u]",
                                  limitAncestorCount);
            return false;
        }

        for (const CTxIn &in : stageit->GetTx().vin) {
            const auto piter = mapTx.find(in.prevout.GetTxId());
            if (piter != mapTx.end() && setAncestors.count(piter) == 0) {
                parentHashes.insert(piter);
            }
        }
    }
    return true;
}

// Calculates descendants of entry that are not already in setDescendants, and
// adds to setDescendants. Assumes entryit is already a tx in the mempool.
void CTxMemPool::getDescendantsNL(txiter entryit,
                                  setEntries &setDescendants) const {
    setEntries stage;
    if (setDescendants.count(entryit) == 0) {
        stage.insert(entryit);
    }
    while (!stage.empty()) {
        txiter it = *stage.begin();
        setDescendants.insert(it);
        stage.erase(it);

        const TxId txid = it->GetTxId();
        const uint32_t outputCount = it->GetTx().vout.size();
        for (uint32_t ndx = 0; ndx < outputCount; ndx++) {
            const auto nextit = mapNextTx.find(COutPoint{txid, ndx});
            if (nextit == mapNextTx.end()) {
                continue;
            }
            const auto childiter = mapTx.find(nextit->second->GetId());
            if (childiter != mapTx.end() && !setDescendants.count(childiter)) {
                stage.insert(childiter);
            }
        }
    }
}

void CTxMemPool::RemoveRecursive(const CTransaction &tx,
                                 MemPoolRemovalReason reason) {
    std::unique_lock lock{smtx};
    removeRecursiveNL(tx, reason);
}

void CTxMemPool::removeRecursiveNL(const CTransaction &origTx,
                                   MemPoolRemovalReason reason) {
    setEntries txToRemove;
    const auto origit = mapTx.find(origTx.GetId());
    if (origit != mapTx.end()) {
        txToRemove.insert(origit);
    } else {
        // When recursively removing but origTx isn't in the mempool be sure
        // to remove any children that are in the pool.
        const uint32_t outputCount = origTx.vout.size();
        for (uint32_t ndx = 0; ndx < outputCount; ndx++) {
            const auto nextit = mapNextTx.find(COutPoint{origTx.GetId(), ndx});
            if (nextit != mapNextTx.end()) {
                const auto childit = mapTx.find(nextit->second->GetId());
                if (childit != mapTx.end()) {
                    txToRemove.insert(childit);
                }
            }
        }
    }
    setEntries setAllRemoves;
    for (txiter it : txToRemove) {
        getDescendantsNL(it, setAllRemoves);
    }
    removeStagedNL(setAllRemoves, reason);
}

void CTxMemPool::removeConflictsNL(const CTransaction &tx) {
    // Remove transactions which depend on inputs of tx, recursively
    for (const CTxIn &txin : tx.vin) {
        const auto it = mapNextTx.find(txin.prevout);
        if (it == mapNextTx.end()) {
            continue;
        }
        const CTransactionRef txConflict = it->second;
        if (*txConflict != tx) {
            LogPrint(TPLog::MEMPOOL, "Removing %s, conflicts with %s\n",
                     txConflict->GetId().ToString(), tx.GetId().ToString());
            removeRecursiveNL(*txConflict, MemPoolRemovalReason::CONFLICT);
        }
    }
}

void CTxMemPool::RemoveForBlock(const std::vector<CTransactionRef> &vtx) {
    std::unique_lock lock{smtx};

    setEntries toRemove;
    for (const auto& tx : vtx) {
        const auto found = mapTx.find(tx->GetId());
        if (found != mapTx.end()) {
            toRemove.insert(found);
        }
    }
    // The block's transactions leave the pool; their children stay and are
    // now anchored on chain.
    removeStagedNL(toRemove, MemPoolRemovalReason::BLOCK);

    for (const auto& tx : vtx) {
        removeConflictsNL(*tx);
        mapDeltas.erase(tx->GetId());
    }
}

int CTxMemPool::Expire(int64_t time) {
    std::unique_lock lock{smtx};
    auto it = mapTx.get<entry_time>().begin();
    setEntries toremove;
    while (it != mapTx.get<entry_time>().end() && it->GetTime() < time) {
        toremove.insert(mapTx.project<transaction_id>(it));
        it++;
    }

    setEntries stage;
    for (txiter removeit : toremove) {
        getDescendantsNL(removeit, stage);
    }
    removeStagedNL(stage, MemPoolRemovalReason::EXPIRY);
    return stage.size();
}

void CTxMemPool::removeStagedNL(const setEntries &stage,
                                MemPoolRemovalReason reason) {
    for (txiter it : stage) {
        removeUncheckedNL(it, reason);
    }
}

void CTxMemPool::removeUncheckedNL(txiter entry, MemPoolRemovalReason reason) {
    LogPrint(TPLog::MEMPOOL, "Removing %s from mempool (%s)\n",
             entry->GetTxId().ToString(), enum_cast<std::string>(reason));

    for (const CTxIn &txin : entry->GetTx().vin) {
        mapNextTx.erase(txin.prevout);
    }
    totalTxSize -= entry->GetTxSize();
    mapTx.erase(entry);
}

void CTxMemPool::PrioritiseTransaction(const TxId &txid,
                                       const Amount nFeeDelta) {
    {
        std::unique_lock lock{smtx};
        auto& delta = mapDeltas[txid];
        // do not allow bigger delta than MAX_MONEY
        delta = std::min(MAX_MONEY, delta + nFeeDelta);
        const auto it = mapTx.find(txid);
        if (it != mapTx.end()) {
            mapTx.modify(it, update_fee_delta(delta));
        }
    }
    LogPrint(TPLog::MEMPOOL, "PrioritiseTransaction: %s fee += %s\n",
             txid.ToString(), nFeeDelta.ToString());
}

void CTxMemPool::ApplyDeltas(const TxId &txid, Amount &nFeeDelta) const {
    std::shared_lock lock{smtx};
    const auto pos = mapDeltas.find(txid);
    if (pos == mapDeltas.end()) {
        return;
    }
    nFeeDelta += pos->second;
}

void CTxMemPool::ClearPrioritisation(const TxId &txid) {
    std::unique_lock lock{smtx};
    mapDeltas.erase(txid);
}

void CTxMemPool::GetDeltasAndInfo(std::map<TxId, Amount> &deltas,
                                  std::vector<TxMempoolInfo> &info) const {
    std::shared_lock lock{smtx};
    deltas = mapDeltas;
    info = infoAllNL();
}

unsigned long CTxMemPool::Size() const {
    std::shared_lock lock{smtx};
    return mapTx.size();
}

uint64_t CTxMemPool::GetTotalTxSize() const {
    std::shared_lock lock{smtx};
    return totalTxSize;
}

void CTxMemPool::Clear() {
    std::unique_lock lock{smtx};
    clearNL();
}

void CTxMemPool::clearNL() {
    mapTx.clear();
    mapNextTx.clear();
    mapDeltas.clear();
    totalTxSize = 0;
}
