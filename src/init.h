// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#ifndef TXPERSIST_INIT_H
#define TXPERSIST_INIT_H

#include <string>

class ConfigInit;

//! Initialize the logging infrastructure
void InitLogging();

/**
 * Enable the log categories named by -debug, then disable those named by
 * -debugexclude. Unknown categories are reported and ignored.
 */
void InitLogCategories();

/**
 * Copy the pool and persistence options from gArgs into config.
 * @return false and an error message if an option is out of range.
 */
bool AppInitParameters(ConfigInit &config, std::string &err);

/** Returns the usage text for the supported options */
std::string HelpMessage();

#endif // TXPERSIST_INIT_H
