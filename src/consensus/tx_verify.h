// Copyright (c) 2017-2017 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#ifndef TXPERSIST_CONSENSUS_TX_VERIFY_H
#define TXPERSIST_CONSENSUS_TX_VERIFY_H

#include <cstdint>
#include <string>

class CTransaction;
class CValidationState;

/**
 * Context-independent structural checks for a non-coinbase transaction.
 * Scripts are not evaluated.
 */
bool CheckRegularTransaction(const CTransaction &tx, CValidationState &state,
                             uint64_t maxTxSizeConsensus);

/** Convert CValidationState to a human-readable message for logging */
std::string FormatStateMessage(const CValidationState &state);

#endif // TXPERSIST_CONSENSUS_TX_VERIFY_H
