// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "pool_dump_writer.h"

#include "cfile_util.h"
#include "logging.h"
#include "orphan_txns.h"
#include "streams.h"
#include "txmempool.h"
#include "util.h"
#include "utiltime.h"

#include <cerrno>
#include <cstring>
#include <ios>
#include <map>

namespace
{
    [[noreturn]] void ThrowDumpFailed(PoolKind kind, const std::string& detail)
    {
        const std::string name {enum_cast<std::string>(kind)};
        LogPrintf("Failed to dump %s: %s\n", name, detail);
        throw CPoolDumpIOError("Unable to dump " + name + " to disk");
    }

    // Remove a temporary file left behind by a failed dump, never a directory
    void RemoveTemporaryFile(const fs::path& path)
    {
        boost::system::error_code ec {};
        if (fs::is_regular_file(path, ec)) {
            fs::remove(path, ec);
        }
    }
}

void WritePoolDumpFile(PoolKind kind,
                       const fs::path& dumpDir,
                       const std::vector<uint8_t>& vBytes)
{
    const fs::path pathDump {dumpDir / GetPoolDumpFileName(kind)};
    const fs::path pathNew {dumpDir / (GetPoolDumpFileName(kind) + ".new")};

    UniqueCFile filestr {fsbridge::fopen(pathNew, "wb")};
    if (!filestr) {
        const int nErr {errno};
        ThrowDumpFailed(kind, "cannot open " + pathNew.string() + ": " +
                              std::strerror(nErr));
    }

    CAutoFile file {std::move(filestr)};
    try {
        file.write(reinterpret_cast<const char*>(vBytes.data()), vBytes.size());
    } catch (const std::ios_base::failure& e) {
        file.reset();
        RemoveTemporaryFile(pathNew);
        ThrowDumpFailed(kind, e.what());
    }
    if (!FileCommit(file.Get())) {
        file.reset();
        RemoveTemporaryFile(pathNew);
        ThrowDumpFailed(kind, "cannot sync " + pathNew.string());
    }
    file.reset();

    if (!RenameOver(pathNew, pathDump)) {
        const int nErr {errno};
        const std::string detail {
            "cannot rename " + pathNew.string() + " to " + pathDump.string() +
            ": " + std::strerror(nErr)};
        RemoveTemporaryFile(pathNew);
        ThrowDumpFailed(kind, detail);
    }
    if (!SyncDirectory(dumpDir)) {
        // The new file is in place, only its durability across a crash is in question
        LogPrintf("Warning: could not sync directory %s after writing %s\n",
                  dumpDir.string(), pathDump.string());
    }
}

void DumpMempool(const CTxMemPool& pool, const fs::path& dumpDir)
{
    int64_t start = GetTimeMicros();

    std::map<TxId, Amount> mapDeltas;
    std::vector<TxMempoolInfo> vinfo;
    pool.GetDeltasAndInfo(mapDeltas, vinfo);

    int64_t mid = GetTimeMicros();

    const CMempoolDump dump {MakeMempoolDump(vinfo, std::move(mapDeltas))};
    WritePoolDumpFile(PoolKind::mempool, dumpDir, EncodeMempoolDump(dump));

    int64_t last = GetTimeMicros();
    LogPrintf("Dumped mempool: %.6fs to copy, %.6fs to dump (%u txs)\n",
              (mid - start) * 0.000001, (last - mid) * 0.000001,
              dump.vEntries.size());
}

void DumpOrphanPool(const COrphanTxns& orphanTxns, const fs::path& dumpDir)
{
    int64_t start = GetTimeMicros();

    const std::vector<COrphanTxnInfo> vinfo = orphanTxns.getSnapshot();

    int64_t mid = GetTimeMicros();

    const COrphanPoolDump dump = MakeOrphanPoolDump(vinfo);
    WritePoolDumpFile(PoolKind::orphanpool, dumpDir, EncodeOrphanPoolDump(dump));

    int64_t last = GetTimeMicros();
    LogPrintf("Dumped orphanpool: %.6fs to copy, %.6fs to dump (%u txs)\n",
              (mid - start) * 0.000001, (last - mid) * 0.000001,
              dump.size());
}
