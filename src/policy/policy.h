// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#ifndef TXPERSIST_POLICY_POLICY_H
#define TXPERSIST_POLICY_POLICY_H

#include <cstdint>

static const uint64_t ONE_KILOBYTE = 1000;
static const uint64_t ONE_MEGABYTE = ONE_KILOBYTE * 1000;

static const int64_t SECONDS_IN_ONE_HOUR = 60 * 60;

/** Default for -maxtxsize, the largest transaction accepted into the pools */
static const uint64_t DEFAULT_MAX_TX_SIZE = 10 * ONE_MEGABYTE;
/** Default for -limitancestorcount, max number of in-mempool ancestors (including itself) */
static const uint64_t DEFAULT_ANCESTOR_LIMIT = 50;
/** Default for -mempoolexpiry, expiration time for mempool transactions in hours */
static const unsigned int DEFAULT_MEMPOOL_EXPIRY = 336;
/** Default for -maxorphantxs, maximum number of orphan transactions kept in memory */
static const uint64_t DEFAULT_MAX_ORPHAN_TRANSACTIONS = 100;
/** Default for -orphantxsexpiry, seconds an orphan may stay unresolved */
static const int64_t DEFAULT_ORPHAN_TRANSACTIONS_EXPIRY = 20 * 60;
/** Default for -orphanonancestorlimit */
static const bool DEFAULT_ORPHAN_ON_ANCESTOR_LIMIT = true;
/** Default for -persistmempool */
static const bool DEFAULT_PERSIST_MEMPOOL = true;

#endif // TXPERSIST_POLICY_POLICY_H
