// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#ifndef TXPERSIST_SERIALIZE_H
#define TXPERSIST_SERIALIZE_H

#include <cstdint>
#include <cstring>
#include <ios>
#include <limits>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/endian/conversion.hpp>

static const uint64_t MAX_SIZE = 0x02000000;

/**
 * Dummy data type to identify deserializing constructors.
 *
 * By convention, a constructor of a type T with signature
 *
 *   template <typename Stream> T::T(deserialize_type, Stream& s)
 *
 * is a deserializing constructor, which builds the type by deserializing it
 * from s. If T contains const fields, this is likely the only way to do so.
 */
struct deserialize_type {};
constexpr deserialize_type deserialize{};

// Serialization types
enum {
    SER_NETWORK = (1 << 0),
    SER_DISK = (1 << 1),
    SER_GETHASH = (1 << 2),
};

/**
 * Lowest-level serialization and conversion.
 * @note Sizes of these types are verified in the tests
 */
template <typename Stream> inline void ser_writedata8(Stream &s, uint8_t obj) {
    s.write((const char *)&obj, 1);
}
template <typename Stream>
inline void ser_writedata16(Stream &s, uint16_t obj) {
    obj = boost::endian::native_to_little(obj);
    s.write((const char *)&obj, 2);
}
template <typename Stream>
inline void ser_writedata32(Stream &s, uint32_t obj) {
    obj = boost::endian::native_to_little(obj);
    s.write((const char *)&obj, 4);
}
template <typename Stream>
inline void ser_writedata64(Stream &s, uint64_t obj) {
    obj = boost::endian::native_to_little(obj);
    s.write((const char *)&obj, 8);
}
template <typename Stream> inline uint8_t ser_readdata8(Stream &s) {
    uint8_t obj;
    s.read((char *)&obj, 1);
    return obj;
}
template <typename Stream> inline uint16_t ser_readdata16(Stream &s) {
    uint16_t obj;
    s.read((char *)&obj, 2);
    return boost::endian::little_to_native(obj);
}
template <typename Stream> inline uint32_t ser_readdata32(Stream &s) {
    uint32_t obj;
    s.read((char *)&obj, 4);
    return boost::endian::little_to_native(obj);
}
template <typename Stream> inline uint64_t ser_readdata64(Stream &s) {
    uint64_t obj;
    s.read((char *)&obj, 8);
    return boost::endian::little_to_native(obj);
}

/////////////////////////////////////////////////////////////////
//
// Templates for serializing to anything that looks like a stream,
// i.e. anything that supports .read(char*, size_t) and .write(char*, size_t)
//

#define READWRITE(...) (::SerReadWriteMany(s, ser_action, __VA_ARGS__))

/**
 * Implement three methods for serializable objects. These are actually
 * wrappers over "SerializationOp" template, which implements the body of each
 * class' serialization code. Adding "ADD_SERIALIZE_METHODS" in the body of the
 * class causes these wrappers to be added as members.
 */
#define ADD_SERIALIZE_METHODS                                                  \
    template <typename Stream> void Serialize(Stream &s) const {               \
        NCONST_PTR(this)->SerializationOp(s, CSerActionSerialize());           \
    }                                                                          \
    template <typename Stream> void Unserialize(Stream &s) {                   \
        SerializationOp(s, CSerActionUnserialize());                           \
    }

/**
 * Used to bypass the rule against non-const reference to temporary where it
 * makes sense with wrappers.
 */
template <typename T> inline T &REF(const T &val) {
    return const_cast<T &>(val);
}

/**
 * Used to acquire a non-const pointer "this" to generate bodies of const
 * serialization operations from a template
 */
template <typename T> inline T *NCONST_PTR(const T *val) {
    return const_cast<T *>(val);
}

template <typename Stream> inline void Serialize(Stream &s, char a) {
    ser_writedata8(s, a);
}
template <typename Stream> inline void Serialize(Stream &s, int8_t a) {
    ser_writedata8(s, a);
}
template <typename Stream> inline void Serialize(Stream &s, uint8_t a) {
    ser_writedata8(s, a);
}
template <typename Stream> inline void Serialize(Stream &s, int16_t a) {
    ser_writedata16(s, a);
}
template <typename Stream> inline void Serialize(Stream &s, uint16_t a) {
    ser_writedata16(s, a);
}
template <typename Stream> inline void Serialize(Stream &s, int32_t a) {
    ser_writedata32(s, a);
}
template <typename Stream> inline void Serialize(Stream &s, uint32_t a) {
    ser_writedata32(s, a);
}
template <typename Stream> inline void Serialize(Stream &s, int64_t a) {
    ser_writedata64(s, a);
}
template <typename Stream> inline void Serialize(Stream &s, uint64_t a) {
    ser_writedata64(s, a);
}
template <typename Stream> inline void Serialize(Stream &s, bool a) {
    char f = a;
    ser_writedata8(s, f);
}

template <typename Stream> inline void Unserialize(Stream &s, char &a) {
    a = ser_readdata8(s);
}
template <typename Stream> inline void Unserialize(Stream &s, int8_t &a) {
    a = ser_readdata8(s);
}
template <typename Stream> inline void Unserialize(Stream &s, uint8_t &a) {
    a = ser_readdata8(s);
}
template <typename Stream> inline void Unserialize(Stream &s, int16_t &a) {
    a = ser_readdata16(s);
}
template <typename Stream> inline void Unserialize(Stream &s, uint16_t &a) {
    a = ser_readdata16(s);
}
template <typename Stream> inline void Unserialize(Stream &s, int32_t &a) {
    a = ser_readdata32(s);
}
template <typename Stream> inline void Unserialize(Stream &s, uint32_t &a) {
    a = ser_readdata32(s);
}
template <typename Stream> inline void Unserialize(Stream &s, int64_t &a) {
    a = ser_readdata64(s);
}
template <typename Stream> inline void Unserialize(Stream &s, uint64_t &a) {
    a = ser_readdata64(s);
}
template <typename Stream> inline void Unserialize(Stream &s, bool &a) {
    char f = ser_readdata8(s);
    a = f;
}

/**
 * Compact Size
 * size <  253        -- 1 byte
 * size <= USHRT_MAX  -- 3 bytes  (253 + 2 bytes)
 * size <= UINT_MAX   -- 5 bytes  (254 + 4 bytes)
 * size >  UINT_MAX   -- 9 bytes  (255 + 8 bytes)
 */
inline unsigned int GetSizeOfCompactSize(uint64_t nSize) {
    if (nSize < 253) return sizeof(uint8_t);
    if (nSize <= std::numeric_limits<uint16_t>::max())
        return sizeof(uint8_t) + sizeof(uint16_t);
    if (nSize <= std::numeric_limits<uint32_t>::max())
        return sizeof(uint8_t) + sizeof(uint32_t);
    return sizeof(uint8_t) + sizeof(uint64_t);
}

template <typename Stream> void WriteCompactSize(Stream &os, uint64_t nSize) {
    if (nSize < 253) {
        ser_writedata8(os, static_cast<uint8_t>(nSize));
    } else if (nSize <= std::numeric_limits<uint16_t>::max()) {
        ser_writedata8(os, 253);
        ser_writedata16(os, static_cast<uint16_t>(nSize));
    } else if (nSize <= std::numeric_limits<uint32_t>::max()) {
        ser_writedata8(os, 254);
        ser_writedata32(os, static_cast<uint32_t>(nSize));
    } else {
        ser_writedata8(os, 255);
        ser_writedata64(os, nSize);
    }
}

template <typename Stream> uint64_t ReadCompactSize(Stream &is) {
    uint8_t chSize = ser_readdata8(is);
    uint64_t nSizeRet = 0;
    if (chSize < 253) {
        nSizeRet = chSize;
    } else if (chSize == 253) {
        nSizeRet = ser_readdata16(is);
        if (nSizeRet < 253) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else if (chSize == 254) {
        nSizeRet = ser_readdata32(is);
        if (nSizeRet < 0x10000u) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    } else {
        nSizeRet = ser_readdata64(is);
        if (nSizeRet < 0x100000000ULL) {
            throw std::ios_base::failure("non-canonical ReadCompactSize()");
        }
    }
    if (nSizeRet > MAX_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }
    return nSizeRet;
}

/**
 * Forward declarations
 */

/**
 * vector
 * vectors of unsigned char are a special case and are intended to be
 * serialized as a single opaque blob.
 */
template <typename Stream, typename T, typename A>
void Serialize_impl(Stream &os, const std::vector<T, A> &v, const uint8_t &);
template <typename Stream, typename T, typename A, typename V>
void Serialize_impl(Stream &os, const std::vector<T, A> &v, const V &);
template <typename Stream, typename T, typename A>
inline void Serialize(Stream &os, const std::vector<T, A> &v);
template <typename Stream, typename T, typename A>
void Unserialize_impl(Stream &is, std::vector<T, A> &v, const uint8_t &);
template <typename Stream, typename T, typename A, typename V>
void Unserialize_impl(Stream &is, std::vector<T, A> &v, const V &);
template <typename Stream, typename T, typename A>
inline void Unserialize(Stream &is, std::vector<T, A> &v);

/**
 * pair
 */
template <typename Stream, typename K, typename T>
void Serialize(Stream &os, const std::pair<K, T> &item);
template <typename Stream, typename K, typename T>
void Unserialize(Stream &is, std::pair<K, T> &item);

/**
 * map
 */
template <typename Stream, typename K, typename T, typename Pred, typename A>
void Serialize(Stream &os, const std::map<K, T, Pred, A> &m);
template <typename Stream, typename K, typename T, typename Pred, typename A>
void Unserialize(Stream &is, std::map<K, T, Pred, A> &m);

/**
 * set
 */
template <typename Stream, typename K, typename Pred, typename A>
void Serialize(Stream &os, const std::set<K, Pred, A> &m);
template <typename Stream, typename K, typename Pred, typename A>
void Unserialize(Stream &is, std::set<K, Pred, A> &m);

/**
 * shared_ptr
 */
template <typename Stream, typename T>
void Serialize(Stream &os, const std::shared_ptr<const T> &p);
template <typename Stream, typename T>
void Unserialize(Stream &os, std::shared_ptr<const T> &p);

/**
 * If none of the specialized versions above matched, default to calling member
 * function.
 */
template <typename Stream, typename T>
inline void Serialize(Stream &os, const T &a) {
    a.Serialize(os);
}

template <typename Stream, typename T>
inline void Unserialize(Stream &is, T &a) {
    a.Unserialize(is);
}

/**
 * vector
 */
template <typename Stream, typename T, typename A>
void Serialize_impl(Stream &os, const std::vector<T, A> &v, const uint8_t &) {
    WriteCompactSize(os, v.size());
    if (!v.empty()) {
        os.write((const char *)v.data(), v.size() * sizeof(T));
    }
}

template <typename Stream, typename T, typename A, typename V>
void Serialize_impl(Stream &os, const std::vector<T, A> &v, const V &) {
    WriteCompactSize(os, v.size());
    for (const T &i : v) {
        ::Serialize(os, i);
    }
}

template <typename Stream, typename T, typename A>
inline void Serialize(Stream &os, const std::vector<T, A> &v) {
    Serialize_impl(os, v, T());
}

template <typename Stream, typename T, typename A>
void Unserialize_impl(Stream &is, std::vector<T, A> &v, const uint8_t &) {
    // Limit size per read so bogus size value won't cause out of memory
    v.clear();
    uint64_t nSize = ReadCompactSize(is);
    uint64_t i = 0;
    while (i < nSize) {
        uint64_t blk = std::min<uint64_t>(nSize - i, 1 + 4999999 / sizeof(T));
        v.resize(i + blk);
        is.read((char *)&v[i], blk * sizeof(T));
        i += blk;
    }
}

template <typename Stream, typename T, typename A, typename V>
void Unserialize_impl(Stream &is, std::vector<T, A> &v, const V &) {
    v.clear();
    uint64_t nSize = ReadCompactSize(is);
    uint64_t i = 0;
    uint64_t nMid = 0;
    while (nMid < nSize) {
        nMid += 5000000 / sizeof(T);
        if (nMid > nSize) {
            nMid = nSize;
        }
        v.resize(nMid);
        for (; i < nMid; i++) {
            Unserialize(is, REF(v[i]));
        }
    }
}

template <typename Stream, typename T, typename A>
inline void Unserialize(Stream &is, std::vector<T, A> &v) {
    Unserialize_impl(is, v, T());
}

/**
 * pair
 */
template <typename Stream, typename K, typename T>
void Serialize(Stream &os, const std::pair<K, T> &item) {
    Serialize(os, item.first);
    Serialize(os, item.second);
}

template <typename Stream, typename K, typename T>
void Unserialize(Stream &is, std::pair<K, T> &item) {
    Unserialize(is, item.first);
    Unserialize(is, item.second);
}

/**
 * map
 */
template <typename Stream, typename K, typename T, typename Pred, typename A>
void Serialize(Stream &os, const std::map<K, T, Pred, A> &m) {
    WriteCompactSize(os, m.size());
    for (const auto &entry : m) {
        Serialize(os, entry);
    }
}

template <typename Stream, typename K, typename T, typename Pred, typename A>
void Unserialize(Stream &is, std::map<K, T, Pred, A> &m) {
    m.clear();
    uint64_t nSize = ReadCompactSize(is);
    auto mi = m.begin();
    for (uint64_t i = 0; i < nSize; i++) {
        std::pair<K, T> item;
        Unserialize(is, item);
        mi = m.insert(mi, item);
    }
}

/**
 * set
 */
template <typename Stream, typename K, typename Pred, typename A>
void Serialize(Stream &os, const std::set<K, Pred, A> &m) {
    WriteCompactSize(os, m.size());
    for (const K &key : m) {
        Serialize(os, key);
    }
}

template <typename Stream, typename K, typename Pred, typename A>
void Unserialize(Stream &is, std::set<K, Pred, A> &m) {
    m.clear();
    uint64_t nSize = ReadCompactSize(is);
    auto it = m.begin();
    for (uint64_t i = 0; i < nSize; i++) {
        K key;
        Unserialize(is, key);
        it = m.insert(it, key);
    }
}

/**
 * shared_ptr
 */
template <typename Stream, typename T>
void Serialize(Stream &os, const std::shared_ptr<const T> &p) {
    Serialize(os, *p);
}

template <typename Stream, typename T>
void Unserialize(Stream &is, std::shared_ptr<const T> &p) {
    p = std::make_shared<const T>(deserialize, is);
}

/**
 * Support for ADD_SERIALIZE_METHODS and READWRITE macro
 */
struct CSerActionSerialize {
    constexpr bool ForRead() const { return false; }
};
struct CSerActionUnserialize {
    constexpr bool ForRead() const { return true; }
};

template <typename Stream, typename T>
inline void SerReadWrite(Stream &s, const T &obj,
                         CSerActionSerialize ser_action) {
    ::Serialize(s, obj);
}

template <typename Stream, typename T>
inline void SerReadWrite(Stream &s, T &obj, CSerActionUnserialize ser_action) {
    ::Unserialize(s, obj);
}

/**
 * Computes the serialized size of an object without writing it anywhere.
 */
class CSizeComputer {
protected:
    size_t nSize{0};

    const int nType;
    const int nVersion;

public:
    CSizeComputer(int nTypeIn, int nVersionIn)
        : nType(nTypeIn), nVersion(nVersionIn) {}

    void write(const char *psz, size_t _nSize) { this->nSize += _nSize; }

    template <typename T> CSizeComputer &operator<<(const T &obj) {
        ::Serialize(*this, obj);
        return (*this);
    }

    size_t size() const { return nSize; }

    int GetVersion() const { return nVersion; }
    int GetType() const { return nType; }
};

template <typename Stream> void SerializeMany(Stream &s) {}

template <typename Stream, typename Arg, typename... Args>
void SerializeMany(Stream &s, const Arg &arg, const Args &... args) {
    ::Serialize(s, arg);
    ::SerializeMany(s, args...);
}

template <typename Stream> inline void UnserializeMany(Stream &s) {}

template <typename Stream, typename Arg, typename... Args>
inline void UnserializeMany(Stream &s, Arg &arg, Args &... args) {
    ::Unserialize(s, arg);
    ::UnserializeMany(s, args...);
}

template <typename Stream, typename... Args>
inline void SerReadWriteMany(Stream &s, CSerActionSerialize ser_action,
                             const Args &... args) {
    ::SerializeMany(s, args...);
}

template <typename Stream, typename... Args>
inline void SerReadWriteMany(Stream &s, CSerActionUnserialize ser_action,
                             Args &... args) {
    ::UnserializeMany(s, args...);
}

template <typename T>
size_t GetSerializeSize(const T &t, int nType, int nVersion = 0) {
    return (CSizeComputer(nType, nVersion) << t).size();
}

#endif // TXPERSIST_SERIALIZE_H
