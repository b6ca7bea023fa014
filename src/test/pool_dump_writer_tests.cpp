// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "pool_dump_writer.h"
#include "pool_dump_loader.h"
#include "util.h"

#include "test/test_txpersist.h"

#include <boost/test/unit_test.hpp>

#include <fstream>

namespace {
    std::vector<uint8_t> ReadAll(const fs::path& path) {
        std::ifstream file {path.string(), std::ios::binary};
        return std::vector<uint8_t>(std::istreambuf_iterator<char>(file),
                                    std::istreambuf_iterator<char>());
    }
}

BOOST_FIXTURE_TEST_SUITE(pool_dump_writer_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(write_creates_dump_file)
{
    const std::vector<uint8_t> vBytes {1, 2, 3, 4};
    WritePoolDumpFile(PoolKind::mempool, GetDataDir(), vBytes);

    BOOST_CHECK(fs::exists(GetDataDir() / "mempool.dat"));
    BOOST_CHECK(!fs::exists(GetDataDir() / "mempool.dat.new"));
    BOOST_CHECK(ReadAll(GetDataDir() / "mempool.dat") == vBytes);

    const auto vRead = ReadPoolDumpFile(PoolKind::mempool, GetDataDir());
    BOOST_REQUIRE(vRead);
    BOOST_CHECK(*vRead == vBytes);
}

BOOST_AUTO_TEST_CASE(write_replaces_previous_dump)
{
    WritePoolDumpFile(PoolKind::orphanpool, GetDataDir(), {1, 1, 1, 1, 1, 1});
    WritePoolDumpFile(PoolKind::orphanpool, GetDataDir(), {2, 2});
    BOOST_CHECK(ReadAll(GetDataDir() / "orphanpool.dat") == std::vector<uint8_t>({2, 2}));
}

BOOST_AUTO_TEST_CASE(failed_write_keeps_previous_dump)
{
    const std::vector<uint8_t> vOld {9, 8, 7};
    WritePoolDumpFile(PoolKind::mempool, GetDataDir(), vOld);

    // A directory in the way of the temporary file makes the dump fail
    const fs::path pathNew {GetDataDir() / "mempool.dat.new"};
    fs::create_directory(pathNew);
    BOOST_CHECK_THROW(WritePoolDumpFile(PoolKind::mempool, GetDataDir(), {1, 2, 3}),
                      CPoolDumpIOError);

    try {
        WritePoolDumpFile(PoolKind::mempool, GetDataDir(), {1, 2, 3});
    } catch (const CPoolDumpIOError& e) {
        BOOST_CHECK_EQUAL(std::string{e.what()}, "Unable to dump mempool to disk");
    }

    // The old file and the blocking directory are both untouched
    BOOST_CHECK(ReadAll(GetDataDir() / "mempool.dat") == vOld);
    BOOST_CHECK(fs::is_directory(pathNew));
}

BOOST_AUTO_TEST_CASE(failed_write_into_missing_directory)
{
    const fs::path missing {GetDataDir() / "no_such_dir"};
    BOOST_CHECK_THROW(WritePoolDumpFile(PoolKind::orphanpool, missing, {1}),
                      CPoolDumpIOError);
    BOOST_CHECK(!fs::exists(missing));
}

BOOST_AUTO_TEST_CASE(read_missing_and_bad_files)
{
    BOOST_CHECK(!ReadPoolDumpFile(PoolKind::orphanpool, GetDataDir()));

    fs::create_directory(GetDataDir() / "orphanpool.dat");
    BOOST_CHECK_THROW(ReadPoolDumpFile(PoolKind::orphanpool, GetDataDir()),
                      CPoolDumpIOError);
}

BOOST_AUTO_TEST_SUITE_END()
