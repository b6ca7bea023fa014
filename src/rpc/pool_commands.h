// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#pragma once

#include "rpc/server.h"

#include <univalue.h>

class COrphanTxns;
class CPoolPersistence;
class CTxMemPool;

/** The pools and the persistence controller the pool commands act on */
struct CPoolCommandContext
{
    CTxMemPool& mempool;
    COrphanTxns& orphanTxns;
    CPoolPersistence& persistence;
};

UniValue savemempool(const CPoolCommandContext& context, const JSONRPCRequest& request);
UniValue saveorphanpool(const CPoolCommandContext& context, const JSONRPCRequest& request);
UniValue getmempoolinfo(const CPoolCommandContext& context, const JSONRPCRequest& request);
UniValue getorphanpoolinfo(const CPoolCommandContext& context, const JSONRPCRequest& request);
UniValue getraworphanpool(const CPoolCommandContext& context, const JSONRPCRequest& request);
