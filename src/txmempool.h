// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2019-2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#ifndef TXPERSIST_TXMEMPOOL_H
#define TXPERSIST_TXMEMPOOL_H

#include "amount.h"
#include "enum_cast.h"
#include "primitives/transaction.h"
#include "tx_mempool_info.h"

#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/identity.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/sequenced_index.hpp>
#include <boost/multi_index_container.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

/** \class CTxMemPoolEntry
 *
 * CTxMemPoolEntry stores data about the corresponding transaction.
 *
 * The ancestor statistics are captured when the entry is admitted and count
 * the transaction itself.
 */
class CTxMemPoolEntry {
private:
    CTransactionRef tx;
    //!< Cached to avoid expensive parent-transaction lookups
    Amount nFee;
    //!< ... and avoid recomputing tx size
    size_t nTxSize;
    //!< Local time when entering the mempool
    int64_t nTime;
    //!< Used for determining the priority of the transaction for mining in a
    //! block
    Amount feeDelta {};
    //!< In-mempool ancestors at admission, including this transaction
    uint64_t nCountWithAncestors {1};
    uint64_t nSizeWithAncestors;

public:
    CTxMemPoolEntry(const CTransactionRef &_tx, const Amount _nFee,
                    int64_t _nTime);

    CTxMemPoolEntry(const CTxMemPoolEntry &other) = default;
    CTxMemPoolEntry& operator=(const CTxMemPoolEntry&) = default;

    CTransactionRef GetSharedTx() const { return tx; }
    const CTransaction &GetTx() const { return *tx; }
    TxId GetTxId() const { return tx->GetId(); }

    Amount GetFee() const { return nFee; }
    Amount GetFeeDelta() const { return feeDelta; }
    size_t GetTxSize() const { return nTxSize; }
    int64_t GetTime() const { return nTime; }
    Amount GetModifiedFee() const { return nFee + feeDelta; }
    uint64_t GetCountWithAncestors() const { return nCountWithAncestors; }
    uint64_t GetSizeWithAncestors() const { return nSizeWithAncestors; }

    // Updates the fee delta used for mining priority score.
    void UpdateFeeDelta(Amount feeDelta);
    void SetAncestorState(uint64_t countWithAncestors, uint64_t sizeWithAncestors);
};

// Helpers for modifying CTxMemPool::mapTx, which is a boost multi_index.
struct update_fee_delta {
    explicit update_fee_delta(Amount _feeDelta) : feeDelta(_feeDelta) {}

    void operator()(CTxMemPoolEntry &e) { e.UpdateFeeDelta(feeDelta); }

private:
    Amount feeDelta;
};

// extracts a transaction id from CTxMemPoolEntry or CTransactionRef
struct mempoolentry_txid {
    typedef TxId result_type;
    result_type operator()(const CTxMemPoolEntry &entry) const {
        return entry.GetTxId();
    }

    result_type operator()(const CTransactionRef &tx) const {
        return tx->GetId();
    }
};

class CompareTxMemPoolEntryByEntryTime {
public:
    bool operator()(const CTxMemPoolEntry &a, const CTxMemPoolEntry &b) const {
        return a.GetTime() < b.GetTime();
    }
};

// Multi_index tag names
struct transaction_id {};
struct entry_time {};
struct insertion_order {};

/**
 * Reason why a transaction was removed from the mempool, this is passed to the
 * notification signal.
 */
enum class MemPoolRemovalReason {
    //! Manually removed or unknown reason
    UNKNOWN = 0,
    //! Expired from mempool
    EXPIRY,
    //! Removed for block
    BLOCK,
    //! Removed for conflict with in-block transaction
    CONFLICT
};
const enumTableT<MemPoolRemovalReason>& enumTable(MemPoolRemovalReason);

/**
 * CTxMemPool stores valid-according-to-the-current-best-chain transactions
 * that may be included in the next block.
 *
 * Transactions are added when they are seen on the network (or restored from
 * a pool dump), but not all transactions seen are added to the pool. The
 * admission rules live in CTxnValidator; AddUnchecked assumes they have been
 * applied.
 *
 * mapTx is a boost::multi_index that sorts the mempool on 3 criteria:
 * - transaction hash
 * - time in mempool
 * - admission order (used to dump parents before children)
 *
 * All public methods take the pool lock themselves. Private methods suffixed
 * with NL expect the caller to hold it.
 */
class CTxMemPool {
public:
    CTxMemPool();
    ~CTxMemPool();

    CTxMemPool(const CTxMemPool&) = delete;
    CTxMemPool& operator=(const CTxMemPool&) = delete;

    /**
     * Add an entry that passed validation. Any prioritisation recorded for
     * the txid is applied to the entry.
     */
    void AddUnchecked(const CTxMemPoolEntry &entry);

    bool Exists(const TxId &txid) const;
    CTransactionRef Get(const TxId &txid) const;
    TxMempoolInfo Info(const TxId &txid) const;
    std::vector<TxMempoolInfo> InfoAll() const;

    /**
     * Pool transactions spending any of the inputs of tx.
     */
    std::set<CTransactionRef> CheckConflict(const CTransaction &tx) const;

    /**
     * Output created by a pool transaction for the given outpoint, if any.
     * Returns nothing when no pool transaction creates it.
     */
    std::optional<CTxOut> GetSpentOutput(const COutPoint &outpoint) const;

    /** True if a pool transaction spends the outpoint. */
    bool IsSpent(const COutPoint &outpoint) const;

    /**
     * Compute the number and total size of in-mempool ancestors of tx, tx
     * itself included. Returns false and fills errString if the count goes
     * over limitAncestorCount.
     */
    bool CalculateAncestorCount(const CTransaction &tx,
                                uint64_t limitAncestorCount,
                                uint64_t &nCountWithAncestors,
                                uint64_t &nSizeWithAncestors,
                                std::string &errString) const;

    /** Remove tx and all its in-pool descendants. */
    void RemoveRecursive(
        const CTransaction &tx,
        MemPoolRemovalReason reason = MemPoolRemovalReason::UNKNOWN);

    /**
     * Called when a block is connected. Removes the block's transactions and
     * anything in the pool that double spends their inputs.
     */
    void RemoveForBlock(const std::vector<CTransactionRef> &vtx);

    /**
     * Expire all transactions (and their dependencies) in the mempool older
     * than time. Return the number of removed transactions.
     */
    int Expire(int64_t time);

    /**
     * Affect CreateNewBlock prioritisation of transactions. The delta is
     * remembered for txns that are not (yet) in the pool.
     */
    void PrioritiseTransaction(const TxId &txid, const Amount nFeeDelta);
    void ApplyDeltas(const TxId &txid, Amount &nFeeDelta) const;
    void ClearPrioritisation(const TxId &txid);

    /**
     * Retrieve mempool data needed for a pool dump in one consistent read.
     * Entries are returned in admission order.
     */
    void GetDeltasAndInfo(std::map<TxId, Amount> &deltas,
                          std::vector<TxMempoolInfo> &info) const;

    unsigned long Size() const;
    uint64_t GetTotalTxSize() const;
    void Clear();

private:
    typedef boost::multi_index_container<
        CTxMemPoolEntry, boost::multi_index::indexed_by<
                             // sorted by txid
                             boost::multi_index::hashed_unique<
                                 boost::multi_index::tag<transaction_id>,
                                 mempoolentry_txid, std::hash<TxId>>,
                             // sorted by entry time
                             boost::multi_index::ordered_non_unique<
                                 boost::multi_index::tag<entry_time>,
                                 boost::multi_index::identity<CTxMemPoolEntry>,
                                 CompareTxMemPoolEntryByEntryTime>,
                             // arranged by insertion order
                             boost::multi_index::sequenced<
                                 boost::multi_index::tag<insertion_order>>>>
        indexed_transaction_set;

    using txiter = indexed_transaction_set::index<transaction_id>::type::const_iterator;

    struct CompareIteratorByHash {
        bool operator()(const txiter &a, const txiter &b) const {
            return a->GetTxId() < b->GetTxId();
        }
    };
    using setEntries = std::set<txiter, CompareIteratorByHash>;

    mutable std::shared_mutex smtx;
    indexed_transaction_set mapTx;
    //!< outpoint -> pool transaction spending it
    std::map<COutPoint, CTransactionRef> mapNextTx;
    std::map<TxId, Amount> mapDeltas;
    //!< sum of all mempool tx's sizes.
    uint64_t totalTxSize {0};

    bool existsNL(const TxId &txid) const;
    std::vector<TxMempoolInfo> infoAllNL() const;
    void getDescendantsNL(txiter entryit, setEntries &setDescendants) const;
    void removeConflictsNL(const CTransaction &tx);
    void removeRecursiveNL(const CTransaction &tx, MemPoolRemovalReason reason);
    void removeStagedNL(const setEntries &stage, MemPoolRemovalReason reason);
    void removeUncheckedNL(txiter entry, MemPoolRemovalReason reason);
    void clearNL();
};

#endif // TXPERSIST_TXMEMPOOL_H
