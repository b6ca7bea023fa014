// Copyright (c) 2012-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "coins.h"

#include <mutex>

std::optional<Coin> CCoinsViewMemory::GetCoin(const COutPoint &outpoint) const
{
    std::shared_lock lock { mMtx };
    auto it = mUnspent.find(outpoint);
    if(it == mUnspent.end())
    {
        return std::nullopt;
    }
    return it->second;
}

bool CCoinsViewMemory::HaveTransaction(const TxId &txid) const
{
    std::shared_lock lock { mMtx };
    return mConfirmed.count(txid) > 0;
}

bool CCoinsViewMemory::IsSpent(const COutPoint &outpoint) const
{
    std::shared_lock lock { mMtx };
    return mSpent.count(outpoint) > 0;
}

int32_t CCoinsViewMemory::GetBestHeight() const
{
    std::shared_lock lock { mMtx };
    return mHeight;
}

void CCoinsViewMemory::AddCoin(const COutPoint &outpoint, Coin coin)
{
    std::unique_lock lock { mMtx };
    mSpent.erase(outpoint);
    mUnspent[outpoint] = std::move(coin);
}

bool CCoinsViewMemory::SpendCoin(const COutPoint &outpoint)
{
    std::unique_lock lock { mMtx };
    if(mUnspent.count(outpoint) == 0)
    {
        return false;
    }
    spendCoinNL(outpoint);
    return true;
}

void CCoinsViewMemory::spendCoinNL(const COutPoint &outpoint)
{
    mUnspent.erase(outpoint);
    mSpent.insert(outpoint);
}

void CCoinsViewMemory::ApplyBlock(const std::vector<CTransactionRef> &vtx)
{
    std::unique_lock lock { mMtx };
    ++mHeight;
    for(const CTransactionRef& tx : vtx)
    {
        if(!tx->IsCoinBase())
        {
            for(const CTxIn& in : tx->vin)
            {
                spendCoinNL(in.prevout);
            }
        }
        const TxId& txid { tx->GetId() };
        for(uint32_t i = 0; i < tx->vout.size(); ++i)
        {
            if(tx->vout[i].scriptPubKey.IsUnspendable())
            {
                continue;
            }
            mUnspent[COutPoint{txid, i}] = Coin{tx->vout[i], mHeight, tx->IsCoinBase()};
        }
        mConfirmed.insert(txid);
    }
}

size_t CCoinsViewMemory::GetCoinsCount() const
{
    std::shared_lock lock { mMtx };
    return mUnspent.size();
}
