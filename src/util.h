// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

/**
 * Server environment: argument handling, config file parsing, data
 * directory and file helpers
 */
#ifndef TXPERSIST_UTIL_H
#define TXPERSIST_UTIL_H

#include "fs.h"
#include "logging.h"
#include "utiltime.h"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <tinyformat.h>

extern const char *const TXPERSIST_CONF_FILENAME;

template <typename... Args> bool error(const char *fmt, const Args &... args) {
    LogPrintf("ERROR: " + tfm::format(fmt, args...) + "\n");
    return false;
}

/** Flush stdio buffers and the kernel's copy of file data to disk */
bool FileCommit(FILE *file);
bool RenameOver(const fs::path& src, const fs::path& dest);
fs::path GetDefaultDataDir();
const fs::path &GetDataDir();
void ClearDatadirCache();
fs::path GetConfigFile(const std::string &confPath);

inline bool IsSwitchChar(char c) {
    return c == '-';
}

class ArgsManager {
protected:
    std::mutex cs_args;
    std::map<std::string, std::string> mapArgs;
    std::map<std::string, std::vector<std::string>> mapMultiArgs;

public:
    void ParseParameters(int argc, const char *const argv[]);
    void ReadConfigFile(const std::string &confPath);
    std::vector<std::string> GetArgs(const std::string &strArg);

    /**
     * Return true if the given argument has been manually set.
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return true if the argument has been set
     */
    bool IsArgSet(const std::string &strArg);

    /**
     * Return string argument or default value.
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param default (e.g. "1")
     * @return command-line argument or default value
     */
    std::string GetArg(const std::string &strArg,
                       const std::string &strDefault);

    /**
     * Return integer argument or default value.
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param default (e.g. 1)
     * @return command-line argument or default value
     */
    int64_t GetArg(const std::string &strArg, int64_t nDefault);

    /**
     * Return boolean argument or default value.
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param default (true or false)
     * @return command-line argument or default value
     */
    bool GetBoolArg(const std::string &strArg, bool fDefault);

    // Forces a arg setting, used only in testing
    void ForceSetArg(const std::string &strArg, const std::string &strValue);

    // Remove an arg setting, used only in testing
    void ClearArg(const std::string &strArg);

private:
    void forceSetArgNL(const std::string &strArg, const std::string &strValue);
};

extern ArgsManager gArgs;

/**
 * Format a string to be used as group of options in help messages.
 *
 * @param message Group name (e.g. "Persistence options:")
 * @return the formatted string
 */
std::string HelpMessageGroup(const std::string &message);

/**
 * Format a string to be used as option description in help messages.
 *
 * @param option Option message (e.g. "-persistmempool")
 * @param message Option description
 * @return the formatted string
 */
std::string HelpMessageOpt(const std::string &option,
                           const std::string &message);

std::string GetThreadName();

#endif // TXPERSIST_UTIL_H
