// Copyright (c) 2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#ifndef TXPERSIST_RPCSERVER_H
#define TXPERSIST_RPCSERVER_H

#include <string>

#include <univalue.h>

/** A parsed command call, as handed over by the command dispatcher */
class JSONRPCRequest {
public:
    UniValue id;
    std::string strMethod;
    UniValue params;
    bool fHelp;

    JSONRPCRequest() : id(NullUniValue), params(UniValue::VARR), fHelp(false) {}
};

std::string HelpExampleCli(const std::string &methodname,
                           const std::string &args);
std::string HelpExampleRpc(const std::string &methodname,
                           const std::string &args);

#endif // TXPERSIST_RPCSERVER_H
