// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#pragma once

#include "fs.h"
#include "pool_dump.h"

#include <cstdint>
#include <optional>
#include <vector>

class Config;
class CTxnValidator;

/** Outcome of loading one dump file */
struct CPoolLoadStats
{
    uint64_t nSucceeded {0};
    uint64_t nFailed {0};
    uint64_t nExpired {0};
};

/**
 * Read the whole dump file of the given pool from dumpDir. Returns nothing
 * if there is no such file; throws CPoolDumpIOError if it cannot be read.
 */
std::optional<std::vector<uint8_t>> ReadPoolDumpFile(PoolKind kind,
                                                     const fs::path& dumpDir);

/**
 * Restore the mempool from dumpDir. Every entry is resubmitted through the
 * validator in file order; entries older than the mempool expiry are
 * skipped. A missing, unreadable or malformed file restores nothing.
 * Returns the number of txns restored.
 */
uint64_t LoadMempool(CTxnValidator& validator,
                     const Config& config,
                     const fs::path& dumpDir,
                     CPoolLoadStats* pStats = nullptr);

/**
 * Restore the orphan pool from dumpDir. Entries keep their first seen time
 * and get one more admission attempt counted; entries past the orphan
 * retention window are skipped. Orphans whose parents are now known go
 * straight to the mempool.
 */
uint64_t LoadOrphanPool(CTxnValidator& validator,
                        const Config& config,
                        const fs::path& dumpDir,
                        CPoolLoadStats* pStats = nullptr);
