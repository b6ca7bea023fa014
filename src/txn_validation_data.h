// Copyright (c) 2019 The Bitcoin SV developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#pragma once

#include "enum_cast.h"
#include "primitives/transaction.h"

#include <cstdint>
#include <memory>

// Enumerate possible txn's source type
enum class TxSource : int
{
    unknown,
    file,
    rpc,
    p2p
};
// Enable enum_cast for TxSource, so we can log informatively
const enumTableT<TxSource>& enumTable(TxSource);

/**
 * Input for the txn validator: a transaction plus the data describing where it
 * came from and what happened to it so far.
 */
class CTxInputData final {
public:
    CTxInputData(
        CTransactionRef ptx,
        TxSource txSource,
        int64_t nAcceptTime=0,
        bool fOrphan=false,
        uint32_t nAttempts=0);
    CTxInputData(CTxInputData&&) = default;
    CTxInputData(const CTxInputData&) = delete;
    CTxInputData& operator=(const CTxInputData&) = delete;
    ~CTxInputData() = default;

    /**
     * Getters
     */
    const CTransactionRef& GetTxnPtr() const {
        return mpTx;
    }
    // Time the txn was first seen; zero means "now" at validation time
    int64_t GetAcceptTime() const {
        return mnAcceptTime;
    }
    TxSource GetTxSource() const {
        return mTxSource;
    }
    bool IsOrphanTxn() const {
        return mfOrphan;
    }
    // Number of admission attempts made while waiting in the orphan pool
    uint32_t GetAttempts() const {
        return mnAttempts;
    }

    /**
     * Setters
     */
    void SetAcceptTime(int64_t acceptTime) {
        mnAcceptTime = acceptTime;
    }
    void SetOrphanTxn(bool fOrphan=true) {
        mfOrphan = fOrphan;
    }
    void IncrementAttempts() {
        ++mnAttempts;
    }

private:
    CTransactionRef mpTx {nullptr};
    int64_t mnAcceptTime {0};
    TxSource mTxSource {TxSource::unknown};
    uint32_t mnAttempts {0};
    bool mfOrphan {false};
};

using TxInputDataSPtr = std::shared_ptr<CTxInputData>;
