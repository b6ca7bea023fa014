// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "pool_dump.h"
#include "clientversion.h"
#include "streams.h"

#include "test/test_txpersist.h"

#include <boost/test/unit_test.hpp>

namespace {
    COutPoint FakeOutPoint(uint8_t n) {
        uint256 hash {};
        *hash.begin() = n;
        return COutPoint{TxId{hash}, 0};
    }

    CMempoolDump CreateMempoolDump(size_t nEntries) {
        CMempoolDump dump {};
        for (size_t i = 0; i < nEntries; ++i) {
            dump.vEntries.emplace_back(
                CreateSpendingTxn({FakeOutPoint(static_cast<uint8_t>(i + 1))}, Amount{1000}),
                1600000000 + static_cast<int64_t>(i),
                static_cast<int64_t>(i) * 100);
        }
        return dump;
    }

    COrphanPoolDump CreateOrphanPoolDump(size_t nEntries) {
        COrphanPoolDump dump {};
        for (size_t i = 0; i < nEntries; ++i) {
            const COutPoint prevout {FakeOutPoint(static_cast<uint8_t>(i + 1))};
            COrphanPoolDumpEntry entry {};
            entry.tx = CreateSpendingTxn({prevout}, Amount{1000});
            entry.nTimeFirstSeen = 1600000000 + static_cast<int64_t>(i);
            entry.vMissingParents = {prevout.GetTxId()};
            entry.nAttempts = static_cast<uint32_t>(i);
            dump.push_back(entry);
        }
        return dump;
    }
}

BOOST_FIXTURE_TEST_SUITE(pool_dump_codec_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(file_names)
{
    BOOST_CHECK_EQUAL(GetPoolDumpFileName(PoolKind::mempool), "mempool.dat");
    BOOST_CHECK_EQUAL(GetPoolDumpFileName(PoolKind::orphanpool), "orphanpool.dat");
}

BOOST_AUTO_TEST_CASE(mempool_dump_layout)
{
    CMempoolDump dump {CreateMempoolDump(2)};
    const TxId prioritised {FakeOutPoint(77).GetTxId()};
    dump.mapDeltas[prioritised] = Amount{-5};

    const std::vector<uint8_t> vBytes {EncodeMempoolDump(dump)};

    // Header, the records in order, then the delta map
    CDataStream stream {vBytes, SER_DISK, CLIENT_VERSION};
    uint64_t version {0};
    uint64_t count {0};
    stream >> version >> count;
    BOOST_CHECK_EQUAL(version, POOL_DUMP_VERSION);
    BOOST_CHECK_EQUAL(count, 2U);
    for (const CMempoolDumpEntry& expected : dump.vEntries) {
        CMempoolDumpEntry entry {};
        stream >> entry;
        BOOST_CHECK(*entry.tx == *expected.tx);
        BOOST_CHECK_EQUAL(entry.nTime, expected.nTime);
        BOOST_CHECK_EQUAL(entry.nFeeDelta, expected.nFeeDelta);
    }
    std::map<TxId, Amount> mapDeltas {};
    stream >> mapDeltas;
    BOOST_CHECK_EQUAL(mapDeltas.size(), 1U);
    BOOST_CHECK(mapDeltas[prioritised] == Amount{-5});
    BOOST_CHECK(stream.empty());

    const CMempoolDump decoded {DecodeMempoolDump(vBytes)};
    BOOST_REQUIRE_EQUAL(decoded.vEntries.size(), 2U);
    BOOST_CHECK(decoded.vEntries[1].tx->GetId() == dump.vEntries[1].tx->GetId());
    BOOST_CHECK(decoded.mapDeltas == dump.mapDeltas);
}

BOOST_AUTO_TEST_CASE(orphanpool_dump_keeps_orphan_metadata)
{
    const COrphanPoolDump dump {CreateOrphanPoolDump(3)};
    const COrphanPoolDump decoded {DecodeOrphanPoolDump(EncodeOrphanPoolDump(dump))};
    BOOST_REQUIRE_EQUAL(decoded.size(), dump.size());
    for (size_t i = 0; i < dump.size(); ++i) {
        BOOST_CHECK(decoded[i].tx->GetId() == dump[i].tx->GetId());
        BOOST_CHECK_EQUAL(decoded[i].nTimeFirstSeen, dump[i].nTimeFirstSeen);
        BOOST_CHECK(decoded[i].vMissingParents == dump[i].vMissingParents);
        BOOST_CHECK_EQUAL(decoded[i].nAttempts, dump[i].nAttempts);
    }
}

BOOST_AUTO_TEST_CASE(empty_dumps)
{
    const CMempoolDump mempoolDump {DecodeMempoolDump(EncodeMempoolDump(CMempoolDump{}))};
    BOOST_CHECK(mempoolDump.vEntries.empty());
    BOOST_CHECK(mempoolDump.mapDeltas.empty());
    BOOST_CHECK(DecodeOrphanPoolDump(EncodeOrphanPoolDump(COrphanPoolDump{})).empty());
}

BOOST_AUTO_TEST_CASE(unknown_version_is_rejected)
{
    CDataStream stream {SER_DISK, CLIENT_VERSION};
    stream << uint64_t{POOL_DUMP_VERSION + 1} << uint64_t{0};
    const std::vector<uint8_t> vBytes(stream.begin(), stream.end());
    BOOST_CHECK_THROW(DecodeOrphanPoolDump(vBytes), CPoolDumpFormatError);
}

BOOST_AUTO_TEST_CASE(truncated_dump_is_rejected)
{
    std::vector<uint8_t> vBytes {EncodeMempoolDump(CreateMempoolDump(3))};
    vBytes.resize(vBytes.size() / 2);
    BOOST_CHECK_THROW(DecodeMempoolDump(vBytes), CPoolDumpFormatError);

    BOOST_CHECK_THROW(DecodeOrphanPoolDump({}), CPoolDumpFormatError);
}

BOOST_AUTO_TEST_CASE(count_mismatch_is_rejected)
{
    // One record more than the header announces
    const COrphanPoolDump dump {CreateOrphanPoolDump(2)};
    CDataStream stream {SER_DISK, CLIENT_VERSION};
    stream << POOL_DUMP_VERSION << uint64_t{1} << dump[0] << dump[1];
    const std::vector<uint8_t> vBytes(stream.begin(), stream.end());
    BOOST_CHECK_THROW(DecodeOrphanPoolDump(vBytes), CPoolDumpFormatError);

    // Trailing garbage after the delta map
    std::vector<uint8_t> vMempoolBytes {EncodeMempoolDump(CreateMempoolDump(1))};
    vMempoolBytes.push_back(0x00);
    BOOST_CHECK_THROW(DecodeMempoolDump(vMempoolBytes), CPoolDumpFormatError);
}

BOOST_AUTO_TEST_CASE(make_mempool_dump_moves_deltas_into_records)
{
    const CTransactionRef tx {CreateSpendingTxn({FakeOutPoint(1)}, Amount{1000})};
    CTxMemPoolEntry entry {tx, Amount{500}, 1600000000};
    entry.UpdateFeeDelta(Amount{300});
    const std::vector<TxMempoolInfo> vInfo {TxMempoolInfo{entry}};

    const TxId absent {FakeOutPoint(2).GetTxId()};
    const std::map<TxId, Amount> mapDeltas {
        {tx->GetId(), Amount{300}},
        {absent, Amount{42}}
    };
    const CMempoolDump dump {MakeMempoolDump(vInfo, mapDeltas)};
    BOOST_REQUIRE_EQUAL(dump.vEntries.size(), 1U);
    BOOST_CHECK_EQUAL(dump.vEntries[0].nFeeDelta, 300);
    BOOST_CHECK_EQUAL(dump.vEntries[0].nTime, 1600000000);
    BOOST_CHECK_EQUAL(dump.mapDeltas.size(), 1U);
    BOOST_CHECK(dump.mapDeltas.count(absent));
}

BOOST_AUTO_TEST_SUITE_END()
