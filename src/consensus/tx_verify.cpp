// Copyright (c) 2017-2017 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "consensus/tx_verify.h"

#include "consensus/validation.h"
#include "primitives/transaction.h"

#include <set>

#include <tinyformat.h>

bool CheckRegularTransaction(const CTransaction &tx, CValidationState &state,
                             uint64_t maxTxSizeConsensus) {
    if (tx.IsCoinBase()) {
        return state.Invalid(false, REJECT_INVALID, "bad-tx-coinbase");
    }

    if (tx.vin.empty()) {
        return state.Invalid(false, REJECT_INVALID, "bad-txns-vin-empty");
    }

    if (tx.vout.empty()) {
        return state.Invalid(false, REJECT_INVALID, "bad-txns-vout-empty");
    }

    // Size limit
    if (tx.GetTotalSize() > maxTxSizeConsensus) {
        return state.Invalid(false, REJECT_INVALID, "bad-txns-oversize");
    }

    // Check for negative or overflow output values
    Amount nValueOut(0);
    for (const auto &txout : tx.vout) {
        if (txout.nValue < Amount(0)) {
            return state.Invalid(false, REJECT_INVALID,
                                 "bad-txns-vout-negative");
        }

        if (txout.nValue > MAX_MONEY) {
            return state.Invalid(false, REJECT_INVALID,
                                 "bad-txns-vout-toolarge");
        }

        nValueOut += txout.nValue;
        if (!MoneyRange(nValueOut)) {
            return state.Invalid(false, REJECT_INVALID,
                                 "bad-txns-txouttotal-toolarge");
        }
    }

    std::set<COutPoint> inOutPoints {};
    for (const auto &txin : tx.vin) {
        if (txin.prevout.IsNull()) {
            return state.Invalid(false, REJECT_INVALID,
                                 "bad-txns-prevout-null");
        }

        if (!inOutPoints.insert(txin.prevout).second) {
            return state.Invalid(false, REJECT_INVALID,
                                 "bad-txns-inputs-duplicate");
        }
    }

    return true;
}

std::string FormatStateMessage(const CValidationState &state) {
    return tfm::format(
        "%s%s (code %i)", state.GetRejectReason(),
        state.GetDebugMessage().empty() ? "" : ", " + state.GetDebugMessage(),
        state.GetRejectCode());
}
