// Copyright (c) 2019 Bitcoin Association.
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "txn_validation_data.h"

const enumTableT<TxSource>& enumTable(TxSource)
{
    static enumTableT<TxSource> table
    {
        { TxSource::unknown,      "unknown" },
        { TxSource::file,         "file" },
        { TxSource::rpc,          "rpc" },
        { TxSource::p2p,          "p2p" }
    };
    return table;
}

CTxInputData::CTxInputData(
    CTransactionRef ptx,
    TxSource txSource,
    int64_t nAcceptTime,
    bool fOrphan,
    uint32_t nAttempts)
: mpTx(std::move(ptx)),
  mnAcceptTime(nAcceptTime),
  mTxSource(txSource),
  mnAttempts(nAttempts),
  mfOrphan(fOrphan)
{
}
