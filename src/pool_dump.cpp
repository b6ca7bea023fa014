// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "pool_dump.h"

#include "clientversion.h"
#include "streams.h"

#include <tinyformat.h>

#include <ios>

// Enable enum_cast for PoolKind, so we can log informatively
const enumTableT<PoolKind>& enumTable(PoolKind)
{
    static enumTableT<PoolKind> table
    {
        { PoolKind::mempool,    "mempool" },
        { PoolKind::orphanpool, "orphanpool" }
    };
    return table;
}

std::string GetPoolDumpFileName(PoolKind kind)
{
    return enum_cast<std::string>(kind) + ".dat";
}

CMempoolDumpEntry::CMempoolDumpEntry(const TxMempoolInfo& info)
: tx{info.tx},
  nTime{info.nTime},
  nFeeDelta{info.nFeeDelta.GetSatoshis()}
{}

COrphanPoolDumpEntry::COrphanPoolDumpEntry(const COrphanTxnInfo& info)
: tx{info.tx},
  nTimeFirstSeen{info.nTimeFirstSeen},
  vMissingParents{info.vMissingParents},
  nAttempts{info.nAttempts}
{}

CMempoolDump MakeMempoolDump(const std::vector<TxMempoolInfo>& vInfo,
                             std::map<TxId, Amount> mapDeltas)
{
    CMempoolDump dump {};
    dump.vEntries.reserve(vInfo.size());
    for (const auto& info : vInfo) {
        dump.vEntries.emplace_back(info);
        mapDeltas.erase(info.GetTxId());
    }
    dump.mapDeltas = std::move(mapDeltas);
    return dump;
}

COrphanPoolDump MakeOrphanPoolDump(const std::vector<COrphanTxnInfo>& vInfo)
{
    return COrphanPoolDump(vInfo.begin(), vInfo.end());
}

namespace
{
    std::vector<uint8_t> ToBytes(const CDataStream& stream)
    {
        return std::vector<uint8_t>(stream.begin(), stream.end());
    }

    // Read the header and check the version, returning the record count
    uint64_t ReadHeader(CDataStream& stream, PoolKind kind)
    {
        uint64_t version {0};
        stream >> version;
        if (version != POOL_DUMP_VERSION) {
            throw CPoolDumpFormatError(
                tfm::format("Bad %s dump version %d", enum_cast<std::string>(kind), version));
        }
        uint64_t count {0};
        stream >> count;
        return count;
    }

    void CheckFullyConsumed(const CDataStream& stream, PoolKind kind)
    {
        if (!stream.empty()) {
            throw CPoolDumpFormatError(
                tfm::format("%d unexpected bytes after the last %s record",
                            stream.size(), enum_cast<std::string>(kind)));
        }
    }

    template <typename Entry>
    std::vector<Entry> ReadRecords(CDataStream& stream, uint64_t count)
    {
        std::vector<Entry> vEntries {};
        while (count--) {
            Entry entry {};
            stream >> entry;
            vEntries.emplace_back(std::move(entry));
        }
        return vEntries;
    }
}

std::vector<uint8_t> EncodeMempoolDump(const CMempoolDump& dump)
{
    CDataStream stream {SER_DISK, CLIENT_VERSION};
    stream << POOL_DUMP_VERSION;
    stream << static_cast<uint64_t>(dump.vEntries.size());
    for (const auto& entry : dump.vEntries) {
        stream << entry;
    }
    stream << dump.mapDeltas;
    return ToBytes(stream);
}

std::vector<uint8_t> EncodeOrphanPoolDump(const COrphanPoolDump& dump)
{
    CDataStream stream {SER_DISK, CLIENT_VERSION};
    stream << POOL_DUMP_VERSION;
    stream << static_cast<uint64_t>(dump.size());
    for (const auto& entry : dump) {
        stream << entry;
    }
    return ToBytes(stream);
}

CMempoolDump DecodeMempoolDump(const std::vector<uint8_t>& vBytes)
{
    CDataStream stream {vBytes, SER_DISK, CLIENT_VERSION};
    try {
        const uint64_t count {ReadHeader(stream, PoolKind::mempool)};
        CMempoolDump dump {};
        dump.vEntries = ReadRecords<CMempoolDumpEntry>(stream, count);
        stream >> dump.mapDeltas;
        CheckFullyConsumed(stream, PoolKind::mempool);
        return dump;
    } catch (const std::ios_base::failure& e) {
        throw CPoolDumpFormatError(
            tfm::format("Truncated or malformed mempool dump: %s", e.what()));
    }
}

COrphanPoolDump DecodeOrphanPoolDump(const std::vector<uint8_t>& vBytes)
{
    CDataStream stream {vBytes, SER_DISK, CLIENT_VERSION};
    try {
        const uint64_t count {ReadHeader(stream, PoolKind::orphanpool)};
        COrphanPoolDump dump = ReadRecords<COrphanPoolDumpEntry>(stream, count);
        CheckFullyConsumed(stream, PoolKind::orphanpool);
        return dump;
    } catch (const std::ios_base::failure& e) {
        throw CPoolDumpFormatError(
            tfm::format("Truncated or malformed orphanpool dump: %s", e.what()));
    }
}
