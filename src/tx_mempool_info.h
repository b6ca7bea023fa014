// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2019 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#pragma once

#include "amount.h"
#include "primitives/transaction.h"

#include <cstdint>

class CTxMemPoolEntry;

/**
 * Information about a mempool transaction, copied out of the pool so it can
 * be used after the pool lock has been released.
 */
struct TxMempoolInfo
{
    TxMempoolInfo() = default;
    explicit TxMempoolInfo(const CTxMemPoolEntry& entry);

    /** The transaction itself */
    CTransactionRef tx {nullptr};

    /** Time the transaction entered the mempool. */
    int64_t nTime {0};

    /** Fee paid by the transaction. */
    Amount nFee {};

    /** The fee delta. */
    Amount nFeeDelta {};

    /** Serialized size of the transaction. */
    size_t nTxSize {0};

    const TxId& GetTxId() const;
    bool IsNull() const { return tx == nullptr; }

private:
    // Cached so GetTxId can return a reference
    TxId txid {};
};
