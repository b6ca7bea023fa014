// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#ifndef TXPERSIST_STREAMS_H
#define TXPERSIST_STREAMS_H

#include "cfile_util.h"
#include "serialize.h"

#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ios>
#include <utility>
#include <vector>

/**
 * In-memory byte stream used to encode and decode pool dumps.
 *
 * Reading consumes from the front, writing appends at the back, so whatever
 * is left between begin() and end() has not been read yet.
 */
class CDataStream {
    using vector_type = std::vector<char>;

    vector_type vch {};
    vector_type::size_type nReadPos {0};

    int nType;
    int nVersion;

public:
    using size_type = vector_type::size_type;
    using const_iterator = vector_type::const_iterator;

    CDataStream(int nTypeIn, int nVersionIn)
        : nType(nTypeIn), nVersion(nVersionIn) {}

    CDataStream(const std::vector<uint8_t> &vchIn, int nTypeIn, int nVersionIn)
        : vch(vchIn.begin(), vchIn.end()), nType(nTypeIn), nVersion(nVersionIn) {}

    const_iterator begin() const { return vch.begin() + static_cast<std::ptrdiff_t>(nReadPos); }
    const_iterator end() const { return vch.end(); }
    size_type size() const { return vch.size() - nReadPos; }
    bool empty() const { return vch.size() == nReadPos; }

    int GetType() const { return nType; }
    int GetVersion() const { return nVersion; }

    void read(char *pch, size_t nSize) {
        if (nSize > size()) {
            throw std::ios_base::failure("CDataStream::read(): end of data");
        }
        if (nSize != 0) {
            memcpy(pch, &vch[nReadPos], nSize);
            nReadPos += nSize;
        }
    }

    void write(const char *pch, size_t nSize) {
        vch.insert(vch.end(), pch, pch + nSize);
    }

    template <typename T> CDataStream &operator<<(const T &obj) {
        ::Serialize(*this, obj);
        return *this;
    }

    template <typename T> CDataStream &operator>>(T &obj) {
        ::Unserialize(*this, obj);
        return *this;
    }
};

/**
 * Owns a FILE* for raw dump file I/O and closes it when it goes out of scope.
 * Use reset() to close early.
 */
class CAutoFile {
    UniqueCFile file;

public:
    explicit CAutoFile(UniqueCFile filenew) : file{ std::move(filenew) } {}

    CAutoFile(const CAutoFile &) = delete;
    CAutoFile &operator=(const CAutoFile &) = delete;

    void reset() { file.reset(); }

    /** Wrapped FILE* without transfer of ownership. */
    FILE *Get() const { return file.get(); }

    bool IsNull() const { return file == nullptr; }

    void read(char *pch, size_t nSize) {
        if (!file)
            throw std::ios_base::failure(
                "CAutoFile::read: file handle is nullptr");
        if (fread(pch, 1, nSize, file.get()) != nSize)
            throw std::ios_base::failure(feof(file.get())
                                             ? "CAutoFile::read: end of file"
                                             : "CAutoFile::read: fread failed");
    }

    void write(const char *pch, size_t nSize) {
        if (!file)
            throw std::ios_base::failure(
                "CAutoFile::write: file handle is nullptr");
        if (fwrite(pch, 1, nSize, file.get()) != nSize)
            throw std::ios_base::failure("CAutoFile::write: write failed");
    }
};

#endif // TXPERSIST_STREAMS_H
