// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#ifndef TXPERSIST_COINS_H
#define TXPERSIST_COINS_H

#include "primitives/transaction.h"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <unordered_set>
#include <vector>

/**
 * An unspent transaction output as seen by the active chain.
 */
class Coin
{
    CTxOut mOut {};

    //! Height at which the containing transaction was included into a block.
    int32_t mHeight {0};

    bool mCoinBase {false};

public:
    Coin() = default;
    Coin(CTxOut out, int32_t height, bool coinBase)
        : mOut{std::move(out)}, mHeight{height}, mCoinBase{coinBase}
    {}

    const CTxOut& GetTxOut() const { return mOut; }
    const Amount& GetAmount() const { return mOut.nValue; }
    int32_t GetHeight() const { return mHeight; }
    bool IsCoinBase() const { return mCoinBase; }
};

/**
 * Read-only view of the chain state used to (re)validate pool transactions.
 */
class CCoinsView
{
public:
    virtual ~CCoinsView() = default;

    /** Retrieve the unspent output for a given outpoint, if there is one. */
    virtual std::optional<Coin> GetCoin(const COutPoint &outpoint) const = 0;

    /** True if the transaction has already been included in the chain. */
    virtual bool HaveTransaction(const TxId &txid) const = 0;

    /** True if the outpoint was created on chain and has since been spent. */
    virtual bool IsSpent(const COutPoint &outpoint) const = 0;

    /** Height of the chain tip. */
    virtual int32_t GetBestHeight() const = 0;
};

/**
 * In-memory chain state. Blocks are applied as plain lists of transactions;
 * no proof of work or script checks are involved.
 */
class CCoinsViewMemory : public CCoinsView
{
public:
    CCoinsViewMemory() = default;

    CCoinsViewMemory(const CCoinsViewMemory&) = delete;
    CCoinsViewMemory& operator=(const CCoinsViewMemory&) = delete;

    std::optional<Coin> GetCoin(const COutPoint &outpoint) const override;
    bool HaveTransaction(const TxId &txid) const override;
    bool IsSpent(const COutPoint &outpoint) const override;
    int32_t GetBestHeight() const override;

    void AddCoin(const COutPoint &outpoint, Coin coin);
    /** Returns false if the outpoint was not unspent. */
    bool SpendCoin(const COutPoint &outpoint);

    /**
     * Connect a block made of the given transactions at the next height:
     * spends their inputs and creates their outputs.
     */
    void ApplyBlock(const std::vector<CTransactionRef> &vtx);

    size_t GetCoinsCount() const;

private:
    mutable std::shared_mutex mMtx {};
    std::map<COutPoint, Coin> mUnspent {};
    std::set<COutPoint> mSpent {};
    std::unordered_set<TxId> mConfirmed {};
    int32_t mHeight {0};

    void spendCoinNL(const COutPoint &outpoint);
};

#endif // TXPERSIST_COINS_H
