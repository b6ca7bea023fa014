// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "rpc/pool_commands.h"

#include "logging.h"
#include "orphan_txns.h"
#include "pool_persistence.h"
#include "rpc/protocol.h"
#include "txmempool.h"

#include <stdexcept>

namespace
{
    UniValue dumpPool(const CPoolCommandContext& context, PoolKind kind)
    {
        try {
            context.persistence.DumpOnDemand(kind);
        } catch (const CPoolDumpIOError& e) {
            throw JSONRPCError(RPC_MISC_ERROR, e.what());
        }
        LogPrint(TPLog::RPC, "Dumped %s to %s on request\n",
                 enum_cast<std::string>(kind),
                 context.persistence.GetDumpFilePath(kind).string());
        return NullUniValue;
    }
}

UniValue savemempool(const CPoolCommandContext& context, const JSONRPCRequest& request) {
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "savemempool\n"
            "\nDumps the mempool to disk.\n"
            "\nExamples:\n" +
            HelpExampleCli("savemempool", "") +
            HelpExampleRpc("savemempool", ""));
    }

    return dumpPool(context, PoolKind::mempool);
}

UniValue saveorphanpool(const CPoolCommandContext& context, const JSONRPCRequest& request) {
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "saveorphanpool\n"
            "\nDumps the orphan pool to disk.\n"
            "\nExamples:\n" +
            HelpExampleCli("saveorphanpool", "") +
            HelpExampleRpc("saveorphanpool", ""));
    }

    return dumpPool(context, PoolKind::orphanpool);
}

UniValue getmempoolinfo(const CPoolCommandContext& context, const JSONRPCRequest& request) {
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "getmempoolinfo\n"
            "\nReturns details on the active state of the TX memory pool.\n"
            "\nResult:\n"
            "{\n"
            "  \"size\": xxxxx,               (numeric) Current tx count\n"
            "  \"bytes\": xxxxx,              (numeric) Transaction size.\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("getmempoolinfo", "") +
            HelpExampleRpc("getmempoolinfo", ""));
    }

    UniValue ret(UniValue::VOBJ);
    ret.pushKV("size", (int64_t)context.mempool.Size());
    ret.pushKV("bytes", (int64_t)context.mempool.GetTotalTxSize());
    return ret;
}

UniValue getorphanpoolinfo(const CPoolCommandContext& context, const JSONRPCRequest& request) {
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "getorphanpoolinfo\n"
            "\nReturns details on the active state of the orphan pool.\n"
            "\nResult:\n"
            "{\n"
            "  \"size\": xxxxx,               (numeric) Current tx count\n"
            "  \"bytes\": xxxxx,              (numeric) Transaction size.\n"
            "}\n"
            "\nExamples:\n" +
            HelpExampleCli("getorphanpoolinfo", "") +
            HelpExampleRpc("getorphanpoolinfo", ""));
    }

    UniValue ret(UniValue::VOBJ);
    ret.pushKV("size", (int64_t)context.orphanTxns.getTxnsNumber());
    ret.pushKV("bytes", (int64_t)context.orphanTxns.getTotalSize());
    return ret;
}

UniValue getraworphanpool(const CPoolCommandContext& context, const JSONRPCRequest& request) {
    if (request.fHelp || request.params.size() != 0) {
        throw std::runtime_error(
            "getraworphanpool\n"
            "\nReturns all transaction ids in the orphan pool, oldest first.\n"
            "\nResult:\n"
            "[                     (json array of string)\n"
            "  \"transactionid\"     (string) The transaction id\n"
            "  ,...\n"
            "]\n"
            "\nExamples:\n" +
            HelpExampleCli("getraworphanpool", "") +
            HelpExampleRpc("getraworphanpool", ""));
    }

    UniValue a(UniValue::VARR);
    for (const TxId& txid : context.orphanTxns.getTxIds()) {
        a.push_back(txid.ToString());
    }
    return a;
}
