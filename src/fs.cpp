// Copyright (c) 2017 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "fs.h"

namespace fsbridge {

FILE *fopen(const fs::path &p, const char *mode) {
    return ::fopen(p.string().c_str(), mode);
}

} // namespace fsbridge
