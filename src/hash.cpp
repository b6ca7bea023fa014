// Copyright (c) 2013-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "hash.h"

#include <stdexcept>

CHash256::CHash256() : ctx{EVP_MD_CTX_new()} {
    if (!ctx) {
        throw std::runtime_error("CHash256: unable to allocate digest context");
    }
    Reset();
}

CHash256 &CHash256::Write(const uint8_t *data, size_t len) {
    if (EVP_DigestUpdate(ctx.get(), data, len) != 1) {
        throw std::runtime_error("CHash256: digest update failed");
    }
    return *this;
}

void CHash256::Finalize(uint8_t hash[OUTPUT_SIZE]) {
    uint8_t buf[OUTPUT_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), buf, &len) != 1) {
        throw std::runtime_error("CHash256: digest finalize failed");
    }
    // Second round over the first digest
    Reset();
    Write(buf, sizeof(buf));
    if (EVP_DigestFinal_ex(ctx.get(), hash, &len) != 1) {
        throw std::runtime_error("CHash256: digest finalize failed");
    }
}

CHash256 &CHash256::Reset() {
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("CHash256: digest init failed");
    }
    return *this;
}

uint256 CHashWriter::GetHash() {
    uint256 result;
    ctx.Finalize(result.begin());
    return result;
}
