// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "script/script.h"

CScript &CScript::operator<<(int64_t n) {
    if (n == 0) {
        push_back(OP_0);
    } else if (n >= 1 && n <= 16) {
        push_back(static_cast<uint8_t>(n + (OP_1 - 1)));
    } else {
        // Minimal little-endian sign-magnitude encoding
        std::vector<uint8_t> result;
        const bool neg = n < 0;
        uint64_t absvalue = neg ? -static_cast<uint64_t>(n) : static_cast<uint64_t>(n);
        while (absvalue) {
            result.push_back(static_cast<uint8_t>(absvalue & 0xff));
            absvalue >>= 8;
        }
        if (result.back() & 0x80) {
            result.push_back(neg ? 0x80 : 0);
        } else if (neg) {
            result.back() |= 0x80;
        }
        *this << result;
    }
    return *this;
}

CScript &CScript::operator<<(const std::vector<uint8_t> &b) {
    if (b.size() < OP_PUSHDATA1) {
        insert(end(), static_cast<uint8_t>(b.size()));
    } else if (b.size() <= 0xff) {
        insert(end(), static_cast<uint8_t>(OP_PUSHDATA1));
        insert(end(), static_cast<uint8_t>(b.size()));
    } else {
        insert(end(), static_cast<uint8_t>(OP_PUSHDATA2));
        insert(end(), static_cast<uint8_t>(b.size() & 0xff));
        insert(end(), static_cast<uint8_t>((b.size() >> 8) & 0xff));
    }
    insert(end(), b.begin(), b.end());
    return *this;
}
