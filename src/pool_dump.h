// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#pragma once

#include "amount.h"
#include "enum_cast.h"
#include "orphan_txns.h"
#include "primitives/transaction.h"
#include "serialize.h"
#include "tx_mempool_info.h"

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * Binary layout of the pool dump files.
 *
 * Both files start with a u64 format version and a u64 record count.
 *
 * mempool.dat records: {tx, i64 time, i64 fee delta}, followed by the
 * map of fee deltas for txns that are not in the dump.
 *
 * orphanpool.dat records: {tx, i64 first seen time, vector of missing parent
 * txids, u32 admission attempts}.
 *
 * Nothing may follow the last record (or the delta map).
 */

// Pools that can be dumped to disk
enum class PoolKind : int
{
    mempool,
    orphanpool
};
// Enable enum_cast for PoolKind, so we can log informatively
const enumTableT<PoolKind>& enumTable(PoolKind);

static constexpr uint64_t POOL_DUMP_VERSION {1};

/** Well known name of the dump file of the given pool */
std::string GetPoolDumpFileName(PoolKind kind);

/** Dump bytes are structurally invalid or of an unsupported version */
class CPoolDumpFormatError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

/** A dump file could not be created, written, renamed or read */
class CPoolDumpIOError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

struct CMempoolDumpEntry
{
    CTransactionRef tx {nullptr};
    int64_t nTime {0};
    int64_t nFeeDelta {0};

    CMempoolDumpEntry() = default;
    CMempoolDumpEntry(CTransactionRef txIn, int64_t nTimeIn, int64_t nFeeDeltaIn)
    : tx{std::move(txIn)}, nTime{nTimeIn}, nFeeDelta{nFeeDeltaIn}
    {}
    explicit CMempoolDumpEntry(const TxMempoolInfo& info);

    ADD_SERIALIZE_METHODS

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream &s, Operation ser_action) {
        READWRITE(tx);
        READWRITE(nTime);
        READWRITE(nFeeDelta);
    }
};

struct CMempoolDump
{
    std::vector<CMempoolDumpEntry> vEntries {};
    std::map<TxId, Amount> mapDeltas {};
};

struct COrphanPoolDumpEntry
{
    CTransactionRef tx {nullptr};
    int64_t nTimeFirstSeen {0};
    std::vector<TxId> vMissingParents {};
    uint32_t nAttempts {0};

    COrphanPoolDumpEntry() = default;
    explicit COrphanPoolDumpEntry(const COrphanTxnInfo& info);

    ADD_SERIALIZE_METHODS

    template <typename Stream, typename Operation>
    inline void SerializationOp(Stream &s, Operation ser_action) {
        READWRITE(tx);
        READWRITE(nTimeFirstSeen);
        READWRITE(vMissingParents);
        READWRITE(nAttempts);
    }
};

using COrphanPoolDump = std::vector<COrphanPoolDumpEntry>;

/**
 * Build the mempool dump from a copy of the mempool. Deltas of txns present
 * in the dump are carried by their records and left out of the delta map.
 */
CMempoolDump MakeMempoolDump(const std::vector<TxMempoolInfo>& vInfo,
                             std::map<TxId, Amount> mapDeltas);
COrphanPoolDump MakeOrphanPoolDump(const std::vector<COrphanTxnInfo>& vInfo);

std::vector<uint8_t> EncodeMempoolDump(const CMempoolDump& dump);
std::vector<uint8_t> EncodeOrphanPoolDump(const COrphanPoolDump& dump);

/**
 * Decode a whole dump. Throws CPoolDumpFormatError on an unknown version, a
 * truncated or malformed record, or data left over after the last record.
 */
CMempoolDump DecodeMempoolDump(const std::vector<uint8_t>& vBytes);
COrphanPoolDump DecodeOrphanPoolDump(const std::vector<uint8_t>& vBytes);
