// Copyright (c) 2017 The Bitcoin developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "config.h"
#include "policy/policy.h"

#include <limits>

namespace
{
    bool LessThan(
        int64_t argValue,
        std::string* err,
        const std::string& errorMessage,
        int64_t minValue)
    {
        if (argValue < minValue)
        {
            if (err)
            {
                *err = errorMessage;
            }
            return true;
        }
        return false;
    }

    bool LessThanZero(
        int64_t argValue,
        std::string* err,
        const std::string& errorMessage)
    {
        return LessThan( argValue, err, errorMessage, 0 );
    }
}

GlobalConfig::GlobalConfig() {
    Reset();
}

void GlobalConfig::Reset()
{
    data->maxTxSize = DEFAULT_MAX_TX_SIZE;
    data->limitAncestorCount = DEFAULT_ANCESTOR_LIMIT;
    data->memPoolExpiry = DEFAULT_MEMPOOL_EXPIRY * SECONDS_IN_ONE_HOUR;
    data->maxOrphanTxns = DEFAULT_MAX_ORPHAN_TRANSACTIONS;
    data->orphanTxnsExpiry = DEFAULT_ORPHAN_TRANSACTIONS_EXPIRY;
    data->orphanOnAncestorLimit = DEFAULT_ORPHAN_ON_ANCESTOR_LIMIT;
    data->persistMempool = DEFAULT_PERSIST_MEMPOOL;
}

bool GlobalConfig::SetMaxTxSize(int64_t value, std::string* err)
{
    if (LessThan(value, err, "Max tx size must be at least 1 byte", 1))
    {
        return false;
    }
    data->maxTxSize = static_cast<uint64_t>(value);
    return true;
}

uint64_t GlobalConfig::GetMaxTxSize() const
{
    return data->maxTxSize;
}

bool GlobalConfig::SetLimitAncestorCount(int64_t limitAncestorCount, std::string* err)
{
    if (LessThan(limitAncestorCount, err, "The maximal number of ancestors must be at least 1", 1))
    {
        return false;
    }
    data->limitAncestorCount = static_cast<uint64_t>(limitAncestorCount);
    return true;
}

uint64_t GlobalConfig::GetLimitAncestorCount() const
{
    return data->limitAncestorCount;
}

bool GlobalConfig::SetMemPoolExpiry(int64_t memPoolExpiryHours, std::string* err)
{
    if (LessThanZero(memPoolExpiryHours, err, "Mempool expiry must not be less than 0"))
    {
        return false;
    }
    if (memPoolExpiryHours > std::numeric_limits<int64_t>::max() / SECONDS_IN_ONE_HOUR)
    {
        if (err)
        {
            *err = "Mempool expiry is too large";
        }
        return false;
    }
    data->memPoolExpiry = memPoolExpiryHours * SECONDS_IN_ONE_HOUR;
    return true;
}

int64_t GlobalConfig::GetMemPoolExpiry() const
{
    return data->memPoolExpiry;
}

bool GlobalConfig::SetMaxOrphanTxns(int64_t maxOrphanTxns, std::string* err)
{
    if (LessThanZero(maxOrphanTxns, err, "The maximum number of orphan transactions must not be less than 0"))
    {
        return false;
    }
    data->maxOrphanTxns = static_cast<uint64_t>(maxOrphanTxns);
    return true;
}

uint64_t GlobalConfig::GetMaxOrphanTxns() const
{
    return data->maxOrphanTxns;
}

bool GlobalConfig::SetOrphanTxnsExpiry(int64_t expirySeconds, std::string* err)
{
    if (LessThan(expirySeconds, err, "Orphan transactions expiry must be at least 1 second", 1))
    {
        return false;
    }
    data->orphanTxnsExpiry = expirySeconds;
    return true;
}

int64_t GlobalConfig::GetOrphanTxnsExpiry() const
{
    return data->orphanTxnsExpiry;
}

void GlobalConfig::SetOrphanOnAncestorLimit(bool orphanOnAncestorLimit)
{
    data->orphanOnAncestorLimit = orphanOnAncestorLimit;
}

bool GlobalConfig::GetOrphanOnAncestorLimit() const
{
    return data->orphanOnAncestorLimit;
}

void GlobalConfig::SetPersistMempool(bool persistMempool)
{
    data->persistMempool = persistMempool;
}

bool GlobalConfig::GetPersistMempool() const
{
    return data->persistMempool;
}

Config& GlobalConfig::GetConfig()
{
    static GlobalConfig config {};
    return config;
}

ConfigInit& GlobalConfig::GetModifiableGlobalConfig()
{
    static Config& config = GlobalConfig::GetConfig();
    return static_cast<ConfigInit&>(config);
}
