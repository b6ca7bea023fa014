// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "pool_dump_loader.h"

#include "cfile_util.h"
#include "config.h"
#include "logging.h"
#include "streams.h"
#include "txmempool.h"
#include "txn_validator.h"
#include "utiltime.h"

#include <ios>
#include <memory>

std::optional<std::vector<uint8_t>> ReadPoolDumpFile(PoolKind kind,
                                                     const fs::path& dumpDir)
{
    const fs::path path {dumpDir / GetPoolDumpFileName(kind)};
    const std::string name {enum_cast<std::string>(kind)};

    boost::system::error_code ec {};
    if (!fs::exists(path, ec)) {
        LogPrint(TPLog::PERSIST, "No %s dump found at %s\n", name, path.string());
        return std::nullopt;
    }
    if (!fs::is_regular_file(path, ec)) {
        throw CPoolDumpIOError(path.string() + " is not a regular file");
    }
    const uintmax_t nSize {fs::file_size(path, ec)};
    if (ec) {
        throw CPoolDumpIOError("Cannot get size of " + path.string() + ": " + ec.message());
    }

    CAutoFile file {UniqueCFile{fsbridge::fopen(path, "rb")}};
    if (file.IsNull()) {
        throw CPoolDumpIOError("Failed to open " + name + " file from disk");
    }
    std::vector<uint8_t> vBytes(static_cast<size_t>(nSize));
    try {
        file.read(reinterpret_cast<char*>(vBytes.data()), vBytes.size());
    } catch (const std::ios_base::failure& e) {
        throw CPoolDumpIOError("Failed to read " + name + " file from disk: " + e.what());
    }
    return vBytes;
}

uint64_t LoadMempool(CTxnValidator& validator,
                     const Config& config,
                     const fs::path& dumpDir,
                     CPoolLoadStats* pStats)
{
    CPoolLoadStats stats {};
    try {
        const auto vBytes = ReadPoolDumpFile(PoolKind::mempool, dumpDir);
        if (!vBytes) {
            return 0;
        }
        const CMempoolDump dump = DecodeMempoolDump(*vBytes);

        CTxMemPool& pool {validator.getMempool()};
        const int64_t nExpiryTimeout {config.GetMemPoolExpiry()};
        const int64_t nNow {GetTime()};
        for (const CMempoolDumpEntry& entry : dump.vEntries) {
            if (entry.nFeeDelta != 0) {
                pool.PrioritiseTransaction(entry.tx->GetId(), Amount{entry.nFeeDelta});
            }
            if (entry.nTime + nExpiryTimeout > nNow) {
                // Execute txn validation synchronously.
                const CValidationState state {
                    validator.processValidation(
                        std::make_shared<CTxInputData>(
                            entry.tx,           // a pointer to the tx
                            TxSource::file,     // tx source
                            entry.nTime))       // nAcceptTime
                };
                // Check results
                if (state.IsValid()) {
                    ++stats.nSucceeded;
                } else {
                    ++stats.nFailed;
                }
            } else {
                ++stats.nExpired;
            }
        }

        for (const auto& [txid, delta] : dump.mapDeltas) {
            pool.PrioritiseTransaction(txid, delta);
        }

        LogPrintf("Imported mempool transactions from disk: %i successes, %i "
                  "failed, %i expired\n",
                  stats.nSucceeded, stats.nFailed, stats.nExpired);
    }
    catch (const std::exception &e) {
        LogPrintf("Failed to deserialize mempool data on disk: %s."
                  " Continuing anyway with empty mempool.\n",
                  e.what());
    }
    if (pStats) {
        *pStats = stats;
    }
    return stats.nSucceeded;
}

uint64_t LoadOrphanPool(CTxnValidator& validator,
                        const Config& config,
                        const fs::path& dumpDir,
                        CPoolLoadStats* pStats)
{
    CPoolLoadStats stats {};
    try {
        const auto vBytes = ReadPoolDumpFile(PoolKind::orphanpool, dumpDir);
        if (!vBytes) {
            return 0;
        }
        const COrphanPoolDump dump = DecodeOrphanPoolDump(*vBytes);

        const int64_t nExpiryTimeout {config.GetOrphanTxnsExpiry()};
        const int64_t nNow {GetTime()};
        for (const COrphanPoolDumpEntry& entry : dump) {
            if (entry.nTimeFirstSeen + nExpiryTimeout <= nNow) {
                ++stats.nExpired;
                continue;
            }
            // The dumped missing parents are not trusted, the validator
            // works them out again against the current state.
            const CValidationState state {
                validator.processValidation(
                    std::make_shared<CTxInputData>(
                        entry.tx,                   // a pointer to the tx
                        TxSource::file,             // tx source
                        entry.nTimeFirstSeen,       // nAcceptTime
                        true,                       // fOrphan
                        entry.nAttempts + 1))       // nAttempts
            };
            if (state.IsValid()) {
                ++stats.nSucceeded;
            } else {
                ++stats.nFailed;
            }
        }

        LogPrintf("Imported orphanpool transactions from disk: %i successes, %i "
                  "failed, %i expired\n",
                  stats.nSucceeded, stats.nFailed, stats.nExpired);
    }
    catch (const std::exception &e) {
        LogPrintf("Failed to deserialize orphanpool data on disk: %s."
                  " Continuing anyway with empty orphan pool.\n",
                  e.what());
    }
    if (pStats) {
        *pStats = stats;
    }
    return stats.nSucceeded;
}
