// Copyright (c) 2012-2016 The Bitcoin Core developers
// Copyright (c) 2019 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "clientversion.h"

/**
 * Name of client reported in the log and in the help text.
 */
const std::string CLIENT_NAME("txpersist");

std::string FormatFullVersion() {
    return "v" STRINGIZE(CLIENT_VERSION_MAJOR) "." STRINGIZE(
        CLIENT_VERSION_MINOR) "." STRINGIZE(CLIENT_VERSION_REVISION);
}
