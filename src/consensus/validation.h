// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#ifndef TXPERSIST_CONSENSUS_VALIDATION_H
#define TXPERSIST_CONSENSUS_VALIDATION_H

#include "primitives/transaction.h"

#include <cstdint>
#include <set>
#include <string>

/** "reject" message codes */
static const uint8_t REJECT_INVALID = 0x10;
static const uint8_t REJECT_DUPLICATE = 0x12;
static const uint8_t REJECT_NONSTANDARD = 0x40;

/** Capture information about transaction validation */
class CValidationState {
private:
    enum mode_state {
        MODE_VALID,   //!< everything ok
        MODE_INVALID, //!< rule violation
        MODE_ERROR,   //!< run-time error
    } mode {MODE_VALID};
    std::string strDebugMessage {};
    std::string strRejectReason {};
    unsigned int chRejectCode {0};
    bool fMissingInputs {false};
    bool fMempoolConflictDetected {false};
    bool fOrphaned {false};

    // Pool transactions whose inputs collide with the validated one
    std::set<CTransactionRef> mCollidedWithTx;

public:
    bool Invalid(bool ret = false, unsigned int _chRejectCode = 0,
                 const std::string &_strRejectReason = "",
                 const std::string &_strDebugMessage = "") {
        chRejectCode = _chRejectCode;
        strRejectReason = _strRejectReason;
        strDebugMessage = _strDebugMessage;
        if (mode == MODE_ERROR) {
            return ret;
        }
        mode = MODE_INVALID;
        return ret;
    }
    bool Error(const std::string &strRejectReasonIn) {
        if (mode == MODE_VALID) {
            strRejectReason = strRejectReasonIn;
        }

        mode = MODE_ERROR;
        return false;
    }

    bool IsValid() const { return mode == MODE_VALID; }
    bool IsInvalid() const { return mode == MODE_INVALID; }
    bool IsError() const { return mode == MODE_ERROR; }
    bool IsMissingInputs() const { return fMissingInputs; }
    bool IsMempoolConflictDetected() const { return fMempoolConflictDetected; }
    // The transaction was parked in the orphan pool
    bool IsOrphaned() const { return fOrphaned; }

    void SetMissingInputs() { fMissingInputs = true; }
    void SetMempoolConflictDetected(std::set<CTransactionRef>&& collidedWithTx)
    {
        mCollidedWithTx.merge( collidedWithTx );
        fMempoolConflictDetected = true;
    }
    void SetOrphaned() { fOrphaned = true; }

    unsigned int GetRejectCode() const { return chRejectCode; }
    std::string GetRejectReason() const { return strRejectReason; }
    std::string GetDebugMessage() const { return strDebugMessage; }
    const std::set<CTransactionRef>& GetCollidedWithTx() const { return mCollidedWithTx; }
};

#endif // TXPERSIST_CONSENSUS_VALIDATION_H
