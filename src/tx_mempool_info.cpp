// Copyright (c) 2019 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "tx_mempool_info.h"

#include "txmempool.h"

TxMempoolInfo::TxMempoolInfo(const CTxMemPoolEntry& entry)
    : tx{entry.GetSharedTx()},
      nTime{entry.GetTime()},
      nFee{entry.GetFee()},
      nFeeDelta{entry.GetFeeDelta()},
      nTxSize{entry.GetTxSize()},
      txid{entry.GetTxId()}
{}

const TxId& TxMempoolInfo::GetTxId() const
{
    return txid;
}
