// Copyright (c) 2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#ifndef TXPERSIST_RPCPROTOCOL_H
#define TXPERSIST_RPCPROTOCOL_H

#include <string>

#include <univalue.h>

//! Error codes reported by the pool commands
enum RPCErrorCode {
    //! Standard JSON-RPC 2.0 errors
    RPC_INVALID_REQUEST = -32600,
    RPC_METHOD_NOT_FOUND = -32601,
    RPC_INVALID_PARAMS = -32602,
    RPC_INTERNAL_ERROR = -32603,
    RPC_PARSE_ERROR = -32700,

    //! General application defined errors
    //!< std::exception thrown in command handling
    RPC_MISC_ERROR = -1,
};

/** Error object thrown by command handlers: {"code": code, "message": message} */
UniValue JSONRPCError(int code, const std::string &message);

#endif // TXPERSIST_RPCPROTOCOL_H
