// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "uint256.h"

template <unsigned int BITS> std::string base_blob<BITS>::GetHex() const {
    static const char hexmap[16] = {'0', '1', '2', '3', '4', '5', '6', '7',
                                    '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    std::string hex(WIDTH * 2, 0);
    for (unsigned int i = 0; i < WIDTH; ++i) {
        uint8_t c = data[WIDTH - i - 1];
        hex[i * 2] = hexmap[c >> 4];
        hex[i * 2 + 1] = hexmap[c & 15];
    }
    return hex;
}

// Explicit instantiation for base_blob<256>
template std::string base_blob<256>::GetHex() const;
