// Copyright (c) 2019 The Bitcoin SV developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#pragma once

#include "txn_validation_data.h"

#include <map>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

struct COrphanTxnEntry {
    TxInputDataSPtr pTxInputData {nullptr};
    int64_t nTimeFirstSeen {};
    int64_t nTimeExpire {};
    unsigned int size {};
    std::vector<TxId> vMissingParents {};
    // Position in the oldest-first eviction order
    uint64_t nSequence {};
};

/**
 * A copy of an orphan entry taken under the pool lock.
 */
struct COrphanTxnInfo {
    CTransactionRef tx {nullptr};
    int64_t nTimeFirstSeen {0};
    std::vector<TxId> vMissingParents {};
    uint32_t nAttempts {0};
};

class COrphanTxns;
using OrphanTxnsSPtr = std::shared_ptr<COrphanTxns>;

/**
 * A class created to support orphan txns during validation.
 *
 * Holds txns whose inputs could not be resolved when they were validated,
 * bounded by entry count and by age.
 */
class COrphanTxns {
  public:
    COrphanTxns(size_t maxOrphanTxns, int64_t orphanTxnsExpiry);
    ~COrphanTxns() = default;

    // Forbid copying/assignment
    COrphanTxns(const COrphanTxns&) = delete;
    COrphanTxns(COrphanTxns&&) = delete;
    COrphanTxns& operator=(const COrphanTxns&) = delete;
    COrphanTxns& operator=(COrphanTxns&&) = delete;

    /**
     * Add a new txn. The first seen time is taken from the input data's
     * accept time when it is set, otherwise it is the current time.
     * Returns false if a txn with the same id is already present.
     */
    bool addTxn(const TxInputDataSPtr& pTxInputData,
                std::vector<TxId> vMissingParents = {});
    /** Erase a given txn */
    int eraseTxn(const TxId& txid);
    /** Erase all txns */
    void eraseTxns();
    /** Check if txn exists by it's id */
    bool checkTxnExists(const TxId& txid) const;
    /** Get a number of orphan transactions queued */
    size_t getTxnsNumber() const;
    /** Get TxIds of known orphan transactions */
    std::vector<TxId> getTxIds() const;
    /** Sum of the serialized sizes of all orphan txns */
    uint64_t getTotalSize() const;
    /**
     * Limit the orphan pool. Expired txns are swept first, then the oldest
     * txns are evicted until the pool holds at most the maximum count.
     * Returns the number of txns evicted for capacity.
     */
    unsigned int limitTxnsSize();
    /** Erase txns whose retention window ended at or before nNow */
    unsigned int eraseExpired(int64_t nNow);
    /** Orphans spending an output of the given txn, oldest first */
    std::vector<TxInputDataSPtr> getDependentTxns(const TxId& parentTxId) const;
    /** Count another admission attempt for the given txn */
    void markAttempt(const TxId& txid);
    /** Copy of all entries, oldest first */
    std::vector<COrphanTxnInfo> getSnapshot() const;

    size_t getMaxTxnsNumber() const { return mMaxOrphanTxns; }
    int64_t getTxnsExpiry() const { return mOrphanTxnsExpiry; }

  private:
    // Private aliasis
    using OrphanTxns = std::unordered_map<TxId, COrphanTxnEntry>;
    using OrphanTxnsIter = OrphanTxns::iterator;
    using OrphanTxnsByPrev = std::unordered_map<TxId, std::unordered_set<TxId>>;
    using OrphanTxnsByAge = std::map<std::pair<int64_t, uint64_t>, TxId>;

    /** A non-locking version of checkTxnExists */
    bool checkTxnExistsNL(const TxId& txid) const;
    /** Execute txn's erase (private & not protected by a lock) */
    int eraseTxnNL(const TxId& txid);
    /** A non-locking version of eraseExpired */
    unsigned int eraseExpiredNL(int64_t nNow);

    /** Orphan txns recently received */
    OrphanTxns mOrphanTxns {};
    /** Orphan txn ids by the ids of the txns they spend from */
    OrphanTxnsByPrev mOrphanTxnsByPrev {};
    /** Orphan txn ids by first seen time and arrival */
    OrphanTxnsByAge mOrphanTxnsByAge {};
    mutable std::shared_mutex mOrphanTxnsMtx {};

    size_t mMaxOrphanTxns {0};
    int64_t mOrphanTxnsExpiry {0};
    uint64_t mTotalSize {0};
    uint64_t mNextSequence {0};
};
