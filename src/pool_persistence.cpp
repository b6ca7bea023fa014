// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "pool_persistence.h"

#include "config.h"
#include "logging.h"
#include "pool_dump_loader.h"
#include "pool_dump_writer.h"
#include "txn_validator.h"

CPoolPersistence::CPoolPersistence(const Config& config,
                                   CTxnValidator& validator,
                                   fs::path dumpDir)
: mConfig(config),
  mValidator(validator),
  mDumpDir(std::move(dumpDir))
{}

void CPoolPersistence::OnStartup(bool fEnabled) {
    if (!fEnabled) {
        LogPrint(TPLog::PERSIST, "Pool persistence disabled, not loading pools\n");
        return;
    }
    // Orphans may spend from mempool txns, so those go first
    LoadMempool(mValidator, mConfig, mDumpDir);
    LoadOrphanPool(mValidator, mConfig, mDumpDir);
}

void CPoolPersistence::OnStartup() {
    OnStartup(mConfig.GetPersistMempool());
}

void CPoolPersistence::OnShutdown(bool fEnabled) {
    if (!fEnabled) {
        LogPrint(TPLog::PERSIST, "Pool persistence disabled, not dumping pools\n");
        return;
    }
    for (PoolKind kind : {PoolKind::mempool, PoolKind::orphanpool}) {
        try {
            DumpOnDemand(kind);
        } catch (const std::exception& e) {
            LogPrintf("%s. Continuing anyway.\n", e.what());
        }
    }
}

void CPoolPersistence::OnShutdown() {
    OnShutdown(mConfig.GetPersistMempool());
}

void CPoolPersistence::DumpOnDemand(PoolKind kind) {
    switch (kind) {
        case PoolKind::mempool:
            DumpMempool(mValidator.getMempool(), mDumpDir);
            break;
        case PoolKind::orphanpool:
            DumpOrphanPool(mValidator.getOrphanTxns(), mDumpDir);
            break;
    }
}

fs::path CPoolPersistence::GetDumpFilePath(PoolKind kind) const {
    return mDumpDir / GetPoolDumpFileName(kind);
}
