// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2020 Bitcoin Association
// Distributed under the Open BSV software license, see the accompanying file LICENSE.

#include "util.h"
#include "utilstrencodings.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <set>
#include <sstream>
#include <thread>

#include <unistd.h>

#include <boost/program_options/detail/config_file.hpp>
#include <boost/program_options/parsers.hpp>

const char *const TXPERSIST_CONF_FILENAME = "txpersist.conf";

ArgsManager gArgs;

/** Interpret string as boolean, for argument parsing */
static bool InterpretBool(const std::string &strValue) {
    if (strValue.empty()) return true;
    return (atoi(strValue) != 0);
}

/** Turn -noX into -X=0 */
static void InterpretNegativeSetting(std::string &strKey,
                                     std::string &strValue) {
    if (strKey.length() > 3 && strKey[0] == '-' && strKey[1] == 'n' &&
        strKey[2] == 'o') {
        strKey = "-" + strKey.substr(3);
        strValue = InterpretBool(strValue) ? "0" : "1";
    }
}

void ArgsManager::ParseParameters(int argc, const char *const argv[]) {
    std::lock_guard<std::mutex> lock(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();

    for (int i = 1; i < argc; i++) {
        std::string str(argv[i]);
        std::string strValue;
        size_t is_index = str.find('=');
        if (is_index != std::string::npos) {
            strValue = str.substr(is_index + 1);
            str = str.substr(0, is_index);
        }

        if (str.empty() || !IsSwitchChar(str[0])) break;

        // Interpret --foo as -foo.
        // If both --foo and -foo are set, the last takes effect.
        if (str.length() > 1 && str[1] == '-') str = str.substr(1);
        InterpretNegativeSetting(str, strValue);

        mapArgs[str] = strValue;
        mapMultiArgs[str].push_back(strValue);
    }
}

std::vector<std::string> ArgsManager::GetArgs(const std::string &strArg) {
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = mapMultiArgs.find(strArg);
    if (it == mapMultiArgs.end()) return {};
    return it->second;
}

bool ArgsManager::IsArgSet(const std::string &strArg) {
    std::lock_guard<std::mutex> lock(cs_args);
    return mapArgs.count(strArg) > 0;
}

std::string ArgsManager::GetArg(const std::string &strArg,
                                const std::string &strDefault) {
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return it->second;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) {
    std::lock_guard<std::mutex> lock(cs_args);
    int64_t returnValue(nDefault);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end())
    {
        const std::string& argValue(it->second);
        if (argValue.find_first_not_of("\t\r\n\f ") != std::string::npos)
        {
            try
            {
                returnValue = std::stoll(argValue);
            }
            catch (const std::exception& e)
            {
                LogPrintf("ArgsManager::GetArg '%s' is invalid value for argument %s,"
                          " must be numeric value (%s). Using default %d.\n",
                          argValue, strArg, e.what(), nDefault);
            }
        }
    }
    return returnValue;
}

bool ArgsManager::GetBoolArg(const std::string &strArg, bool fDefault) {
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return InterpretBool(it->second);
    return fDefault;
}

void ArgsManager::ForceSetArg(const std::string &strArg,
                              const std::string &strValue) {
    std::lock_guard<std::mutex> lock(cs_args);
    forceSetArgNL(strArg, strValue);
}

void ArgsManager::forceSetArgNL(const std::string &strArg,
                                const std::string &strValue) {
    mapArgs[strArg] = strValue;
    mapMultiArgs[strArg].push_back(strValue);
}

void ArgsManager::ClearArg(const std::string &strArg) {
    std::lock_guard<std::mutex> lock(cs_args);
    mapArgs.erase(strArg);
    mapMultiArgs.erase(strArg);
}

static const int screenWidth = 79;
static const int optIndent = 2;
static const int msgIndent = 7;

std::string HelpMessageGroup(const std::string &message) {
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string &option,
                           const std::string &message) {
    return std::string(optIndent, ' ') + std::string(option) +
           std::string("\n") + std::string(msgIndent, ' ') +
           FormatParagraph(message, screenWidth - msgIndent, msgIndent) +
           std::string("\n\n");
}

fs::path GetDefaultDataDir() {
    // Unix: ~/.txpersist
    fs::path pathRet;
    const char *pszHome = getenv("HOME");
    if (pszHome == nullptr || strlen(pszHome) == 0)
        pathRet = fs::path("/");
    else
        pathRet = fs::path(pszHome);
    return pathRet / ".txpersist";
}

static fs::path pathCached;
static std::mutex csPathCached;

const fs::path &GetDataDir() {
    std::lock_guard<std::mutex> lock(csPathCached);

    // This can be called during exceptions by LogPrintf(), so we cache the
    // value so we don't have to do memory allocations after that.
    if (!pathCached.empty()) return pathCached;

    if (gArgs.IsArgSet("-datadir")) {
        pathCached = fs::system_complete(gArgs.GetArg("-datadir", ""));
        if (!fs::is_directory(pathCached)) {
            pathCached = "";
            return pathCached;
        }
    } else {
        pathCached = GetDefaultDataDir();
        fs::create_directories(pathCached);
    }

    return pathCached;
}

void ClearDatadirCache() {
    std::lock_guard<std::mutex> lock(csPathCached);
    pathCached = fs::path();
}

fs::path GetConfigFile(const std::string &confPath) {
    fs::path pathConfigFile(confPath);
    if (!pathConfigFile.is_absolute())
        pathConfigFile = GetDataDir() / pathConfigFile;

    return pathConfigFile;
}

void ArgsManager::ReadConfigFile(const std::string &confPath) {
    fs::ifstream streamConfig(GetConfigFile(confPath));

    // No config file is OK
    if (!streamConfig.good()) return;

    {
        std::lock_guard<std::mutex> lock(cs_args);
        std::set<std::string> setOptions;
        setOptions.insert("*");

        for (boost::program_options::detail::config_file_iterator
                 it(streamConfig, setOptions),
             end;
             it != end; ++it) {
            // Don't overwrite existing settings so command line settings
            // override the config file
            std::string strKey = std::string("-") + it->string_key;
            std::string strValue = it->value[0];
            InterpretNegativeSetting(strKey, strValue);
            if (mapArgs.count(strKey) == 0) {
                mapArgs[strKey] = strValue;
            }
            mapMultiArgs[strKey].push_back(strValue);
        }
    }
    // If datadir is changed in the config file, reset the cached path.
    ClearDatadirCache();
}

bool RenameOver(const fs::path& src, const fs::path& dest) {
    int rc = std::rename(src.string().c_str(), dest.string().c_str());
    return (rc == 0);
}

bool FileCommit(FILE *file) {
    // Harmless if redundantly called.
    if (fflush(file) != 0) {
        return error("%s: fflush failed: %d", __func__, errno);
    }
    if (fdatasync(fileno(file)) != 0 && errno != EINVAL) {
        return error("%s: fdatasync failed: %d", __func__, errno);
    }
    return true;
}

std::string GetThreadName()
{
    std::ostringstream ss;
    ss << "thread-" << std::this_thread::get_id();
    return ss.str();
}
