// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#ifndef TXPERSIST_UINT256_H
#define TXPERSIST_UINT256_H

#include <cstdint>
#include <cstring>
#include <ostream>
#include <string>

/** Template base class for fixed-sized opaque blobs. */
template <unsigned int BITS> class base_blob {
protected:
    enum { WIDTH = BITS / 8 };
    uint8_t data[WIDTH];

public:
    base_blob() { memset(data, 0, sizeof(data)); }

    bool IsNull() const {
        for (int i = 0; i < WIDTH; i++)
            if (data[i] != 0) return false;
        return true;
    }

    inline int Compare(const base_blob &other) const {
        return memcmp(data, other.data, sizeof(data));
    }

    friend inline bool operator==(const base_blob &a, const base_blob &b) {
        return a.Compare(b) == 0;
    }
    friend inline bool operator!=(const base_blob &a, const base_blob &b) {
        return a.Compare(b) != 0;
    }
    friend inline bool operator<(const base_blob &a, const base_blob &b) {
        return a.Compare(b) < 0;
    }

    // Byte-reversed hex, the way txids are displayed
    std::string GetHex() const;

    std::string ToString() const { return GetHex(); }

    uint8_t *begin() { return &data[0]; }
    uint8_t *end() { return &data[WIDTH]; }

    const uint8_t *begin() const { return &data[0]; }
    const uint8_t *end() const { return &data[WIDTH]; }

    unsigned int size() const { return sizeof(data); }

    uint64_t GetUint64(int pos) const {
        const uint8_t *ptr = data + pos * 8;
        return ((uint64_t)ptr[0]) | ((uint64_t)ptr[1]) << 8 |
               ((uint64_t)ptr[2]) << 16 | ((uint64_t)ptr[3]) << 24 |
               ((uint64_t)ptr[4]) << 32 | ((uint64_t)ptr[5]) << 40 |
               ((uint64_t)ptr[6]) << 48 | ((uint64_t)ptr[7]) << 56;
    }

    template <typename Stream> void Serialize(Stream &s) const {
        s.write((const char *)data, sizeof(data));
    }

    template <typename Stream> void Unserialize(Stream &s) {
        s.read((char *)data, sizeof(data));
    }
};

/**
 * 256-bit opaque blob.
 * @note This type is called uint256 for historical reasons only. It is an
 * opaque blob of 256 bits and has no integer operations.
 */
class uint256 : public base_blob<256> {
public:
    uint256() = default;
    uint256(const base_blob<256> &b) : base_blob<256>(b) {}

    /**
     * A cheap hash function that just returns 64 bits from the result. Only
     * suitable when the contents are uniformly random, as hashes are.
     */
    uint64_t GetCheapHash() const { return GetUint64(0); }
};

inline std::ostream& operator<<(std::ostream& os, const uint256& i)
{
    os << i.ToString();
    return os;
}

namespace std
{
    template<>
    class hash<uint256> {
      public:
        size_t operator()(const uint256& u) const
        {
            return static_cast<size_t>(u.GetCheapHash());
        }
    };
}

#endif // TXPERSIST_UINT256_H
