// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

/**
 * Utilities for converting data from/to strings.
 */
#ifndef TXPERSIST_UTILSTRENCODINGS_H
#define TXPERSIST_UTILSTRENCODINGS_H

#include <cstdint>
#include <string>
#include <vector>

std::vector<uint8_t> ParseHex(const char *psz);
std::vector<uint8_t> ParseHex(const std::string &str);
signed char HexDigit(char c);
/**
 * Returns true if each character in str is a hex character, and has an even
 * number of hex digits.
 */
bool IsHex(const std::string &str);

int64_t atoi64(const std::string &str);
int atoi(const std::string &str);

template <typename T>
std::string HexStr(const T itbegin, const T itend)
{
    static const char hexmap[16] = {'0', '1', '2', '3', '4', '5', '6', '7',
                                    '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
    std::string rv;
    rv.reserve(static_cast<size_t>(itend - itbegin) * 2);
    for(T it = itbegin; it < itend; ++it)
    {
        uint8_t val = static_cast<uint8_t>(*it);
        rv.push_back(hexmap[val >> 4]);
        rv.push_back(hexmap[val & 15]);
    }
    return rv;
}

template <typename T>
inline std::string HexStr(const T &vch)
{
    return HexStr(vch.begin(), vch.end());
}

/**
 * Format a paragraph of text to a fixed width, adding spaces for indentation
 * to any added line.
 */
std::string FormatParagraph(const std::string &in, size_t width = 79,
                            size_t indent = 0);

#endif // TXPERSIST_UTILSTRENCODINGS_H
