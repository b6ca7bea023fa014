// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#ifndef TXPERSIST_SCRIPT_SCRIPT_H
#define TXPERSIST_SCRIPT_SCRIPT_H

#include "serialize.h"

#include <cstdint>
#include <vector>

/** Script opcodes used by this library */
enum opcodetype {
    OP_0 = 0x00,
    OP_FALSE = OP_0,
    OP_PUSHDATA1 = 0x4c,
    OP_PUSHDATA2 = 0x4d,
    OP_1 = 0x51,
    OP_TRUE = OP_1,
    OP_16 = 0x60,
    OP_RETURN = 0x6a,
    OP_DROP = 0x75,
};

typedef std::vector<uint8_t> CScriptBase;

/**
 * Serialized script, used inside transaction inputs and outputs. Scripts are
 * carried opaquely; they are never executed here.
 */
class CScript : public CScriptBase {
public:
    CScript() = default;
    CScript(const uint8_t *pbegin, const uint8_t *pend)
        : CScriptBase(pbegin, pend) {}

    explicit CScript(opcodetype b) { operator<<(b); }

    ADD_SERIALIZE_METHODS

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream &s, Operation ser_action) {
        READWRITE(static_cast<CScriptBase &>(*this));
    }

    CScript &operator<<(opcodetype opcode) {
        insert(end(), static_cast<uint8_t>(opcode));
        return *this;
    }

    /** Push a small integer (0..16) or fall back to a minimal data push */
    CScript &operator<<(int64_t n);

    CScript &operator<<(const std::vector<uint8_t> &b);

    /** Provably unspendable output script */
    bool IsUnspendable() const {
        return (size() > 0 && (*this)[0] == OP_RETURN) ||
               (size() > 1 && (*this)[0] == OP_FALSE && (*this)[1] == OP_RETURN);
    }
};

#endif // TXPERSIST_SCRIPT_SCRIPT_H
