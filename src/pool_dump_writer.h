// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#pragma once

#include "fs.h"
#include "pool_dump.h"

#include <cstdint>
#include <vector>

class COrphanTxns;
class CTxMemPool;

/**
 * Write the dump bytes to <dir>/<name>.new, flush and sync them, then
 * rename the file over <dir>/<name> and sync the directory.
 *
 * The destination is either left untouched or replaced by the complete new
 * file. Throws CPoolDumpIOError("Unable to dump <pool> to disk") on failure.
 */
void WritePoolDumpFile(PoolKind kind,
                       const fs::path& dumpDir,
                       const std::vector<uint8_t>& vBytes);

/**
 * Dump the mempool into dumpDir. The mempool lock is only held while the
 * entries are copied out.
 */
void DumpMempool(const CTxMemPool& pool, const fs::path& dumpDir);

/** Dump the orphan pool into dumpDir */
void DumpOrphanPool(const COrphanTxns& orphanTxns, const fs::path& dumpDir);
