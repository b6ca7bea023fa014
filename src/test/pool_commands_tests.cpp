// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "rpc/pool_commands.h"
#include "rpc/protocol.h"
#include "utiltime.h"

#include "test/test_txpersist.h"

#include <boost/test/unit_test.hpp>

#include <stdexcept>

namespace {
    struct PoolCommandsTestingSetup : public TestingSetup {
        CPoolCommandContext context {mempool, orphanTxns, persistence};
        JSONRPCRequest request {};
    };

    // Run a command expected to fail and return the error code it reports
    template <typename Command>
    int CallRPCError(Command command, const CPoolCommandContext& context,
                     const JSONRPCRequest& request, std::string& message)
    {
        try {
            command(context, request);
        } catch (const UniValue& objError) {
            message = find_value(objError, "message").get_str();
            return find_value(objError, "code").get_int();
        }
        BOOST_ERROR("command did not fail");
        return 0;
    }
}

BOOST_FIXTURE_TEST_SUITE(pool_commands_tests, PoolCommandsTestingSetup)

BOOST_AUTO_TEST_CASE(rpc_getorphanpoolinfo)
{
    UniValue info {getorphanpoolinfo(context, request)};
    BOOST_CHECK_EQUAL(find_value(info, "size").get_int64(), 0);
    BOOST_CHECK_EQUAL(find_value(info, "bytes").get_int64(), 0);

    const auto vChain = CreateTxnChain(COutPoint{coinbaseTxns[0]->GetId(), 0}, 50 * COIN, 3);
    Submit(vChain[1]);
    Submit(vChain[2]);
    info = getorphanpoolinfo(context, request);
    BOOST_CHECK_EQUAL(find_value(info, "size").get_int64(), 2);
    BOOST_CHECK_EQUAL(find_value(info, "bytes").get_int64(),
                      static_cast<int64_t>(orphanTxns.getTotalSize()));

    const UniValue txids {getraworphanpool(context, request)};
    BOOST_REQUIRE_EQUAL(txids.size(), 2U);
    BOOST_CHECK_EQUAL(txids[0].get_str(), vChain[1]->GetId().ToString());
    BOOST_CHECK_EQUAL(txids[1].get_str(), vChain[2]->GetId().ToString());
}

BOOST_AUTO_TEST_CASE(rpc_getmempoolinfo)
{
    const CTransactionRef tx {
        CreateSpendingTxn({COutPoint{coinbaseTxns[0]->GetId(), 0}}, 49 * COIN)};
    Submit(tx);
    const UniValue info {getmempoolinfo(context, request)};
    BOOST_CHECK_EQUAL(find_value(info, "size").get_int64(), 1);
    BOOST_CHECK_EQUAL(find_value(info, "bytes").get_int64(),
                      static_cast<int64_t>(tx->GetTotalSize()));
}

BOOST_AUTO_TEST_CASE(rpc_savemempool)
{
    Submit(CreateSpendingTxn({COutPoint{coinbaseTxns[0]->GetId(), 0}}, 49 * COIN));
    BOOST_CHECK(savemempool(context, request).isNull());
    BOOST_CHECK(fs::exists(persistence.GetDumpFilePath(PoolKind::mempool)));

    BOOST_CHECK(saveorphanpool(context, request).isNull());
    BOOST_CHECK(fs::exists(persistence.GetDumpFilePath(PoolKind::orphanpool)));
}

BOOST_AUTO_TEST_CASE(rpc_save_fails)
{
    fs::create_directory(GetDataDir() / "mempool.dat.new");
    fs::create_directory(GetDataDir() / "orphanpool.dat.new");

    std::string message;
    BOOST_CHECK_EQUAL(CallRPCError(savemempool, context, request, message), RPC_MISC_ERROR);
    BOOST_CHECK_EQUAL(message, "Unable to dump mempool to disk");
    BOOST_CHECK_EQUAL(CallRPCError(saveorphanpool, context, request, message), RPC_MISC_ERROR);
    BOOST_CHECK_EQUAL(message, "Unable to dump orphanpool to disk");
}

BOOST_AUTO_TEST_CASE(rpc_help_and_params)
{
    JSONRPCRequest help {};
    help.fHelp = true;
    BOOST_CHECK_THROW(getorphanpoolinfo(context, help), std::runtime_error);
    BOOST_CHECK_THROW(savemempool(context, help), std::runtime_error);

    JSONRPCRequest extra {};
    extra.params.push_back(UniValue{1});
    BOOST_CHECK_THROW(getraworphanpool(context, extra), std::runtime_error);
    BOOST_CHECK_THROW(saveorphanpool(context, extra), std::runtime_error);
    BOOST_CHECK(!fs::exists(persistence.GetDumpFilePath(PoolKind::orphanpool)));
}

BOOST_AUTO_TEST_SUITE_END()
