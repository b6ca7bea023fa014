// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2019 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#ifndef TXPERSIST_CLIENTVERSION_H
#define TXPERSIST_CLIENTVERSION_H

#include <string>

/**
 * client versioning
 */

//! These need to be macros, as FormatFullVersion() stringizes them
#define CLIENT_VERSION_MAJOR 1
#define CLIENT_VERSION_MINOR 0
#define CLIENT_VERSION_REVISION 0

/**
 * Converts the parameter X to a string after macro replacement on X has been
 * performed.
 * Don't merge these into one macro!
 */
#define STRINGIZE(X) DO_STRINGIZE(X)
#define DO_STRINGIZE(X) #X

static const int CLIENT_VERSION =
    1000000 * CLIENT_VERSION_MAJOR + 10000 * CLIENT_VERSION_MINOR +
    100 * CLIENT_VERSION_REVISION;

extern const std::string CLIENT_NAME;

std::string FormatFullVersion();

#endif // TXPERSIST_CLIENTVERSION_H
