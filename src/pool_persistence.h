// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#pragma once

#include "fs.h"
#include "pool_dump.h"

class Config;
class CTxnValidator;

/**
 * Loads the pools from disk when the node starts and writes them back when
 * it stops. Turning persistence off never touches files already on disk.
 */
class CPoolPersistence final
{
  public:
    CPoolPersistence(const Config& config,
                     CTxnValidator& validator,
                     fs::path dumpDir);

    // Forbid copying/assignment
    CPoolPersistence(const CPoolPersistence&) = delete;
    CPoolPersistence& operator=(const CPoolPersistence&) = delete;

    /** Restore the mempool, then the orphan pool. No I/O if not enabled. */
    void OnStartup(bool fEnabled);
    /** Enabled by -persistmempool */
    void OnStartup();

    /** Dump both pools. Failures are logged. No I/O if not enabled. */
    void OnShutdown(bool fEnabled);
    void OnShutdown();

    /** Dump one pool now. Throws CPoolDumpIOError on failure. */
    void DumpOnDemand(PoolKind kind);

    fs::path GetDumpFilePath(PoolKind kind) const;
    const fs::path& GetDumpDir() const { return mDumpDir; }

  private:
    const Config& mConfig;
    CTxnValidator& mValidator;
    const fs::path mDumpDir;
};
