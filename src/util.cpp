// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <util.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>

const char * const DEFAULT_DEBUGLOGFILE = "debug.log";

ArgsManager gArgs;
bool fPrintToConsole = DEFAULT_PRINTTOCONSOLE;
bool fPrintToDebugLog = false;
bool fLogTimestamps = DEFAULT_LOGTIMESTAMPS;

/** Log categories bitfield. */
std::atomic<uint32_t> logCategories(0);

namespace {

CCriticalSection cs_log;
FILE* fileout = nullptr;

/**
 * fStartedNewLine is a state variable held by the calling context that will
 * suppress printing of the timestamp when multiple calls are made that don't
 * end in a newline.
 */
bool fStartedNewLine = true;

struct CLogCategoryDesc
{
    uint32_t flag;
    std::string category;
};

const CLogCategoryDesc LogCategories[] =
{
    {MSLog::NONE, "0"},
    {MSLog::FILTER, "filter"},
    {MSLog::MINTER, "minter"},
    {MSLog::SPLIT, "split"},
    {MSLog::AUCTION, "auction"},
    {MSLog::HOLDER, "holder"},
    {MSLog::CORE, "core"},
    {MSLog::CHAIN, "chain"},
    {MSLog::CONFIG, "config"},
    {MSLog::ALL, "1"},
    {MSLog::ALL, "all"},
};

std::string LogTimestampStr(const std::string& str)
{
    std::string strStamped;

    if (!fLogTimestamps)
        return str;

    if (fStartedNewLine) {
        std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        char buf[32];
        struct tm tmbuf;
        gmtime_r(&now, &tmbuf);
        strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmbuf);
        strStamped = std::string(buf) + ' ' + str;
    } else {
        strStamped = str;
    }

    fStartedNewLine = !str.empty() && str[str.size() - 1] == '\n';

    return strStamped;
}

std::string TrimString(const std::string& str)
{
    const char* pattern = " \t\r\n";
    std::string::size_type front = str.find_first_not_of(pattern);
    if (front == std::string::npos) {
        return std::string();
    }
    std::string::size_type end = str.find_last_not_of(pattern);
    return str.substr(front, end - front + 1);
}

bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue.c_str()) != 0);
}

/** Turn -noX into -X=0 */
void InterpretNegativeSetting(std::string& strKey, std::string& strValue)
{
    if (strKey.length() > 3 && strKey[0] == '-' && strKey[1] == 'n' && strKey[2] == 'o') {
        strKey = "-" + strKey.substr(3);
        strValue = InterpretBool(strValue) ? "0" : "1";
    }
}

} // namespace

bool GetLogCategory(uint32_t *f, const std::string *str)
{
    if (f && str) {
        if (*str == "") {
            *f = MSLog::ALL;
            return true;
        }
        for (const CLogCategoryDesc& desc : LogCategories) {
            if (desc.category == *str) {
                *f = desc.flag;
                return true;
            }
        }
    }
    return false;
}

std::string ListLogCategories()
{
    std::string ret;
    int outcount = 0;
    for (const CLogCategoryDesc& desc : LogCategories) {
        // Omit the special cases.
        if (desc.flag != MSLog::NONE && desc.flag != MSLog::ALL) {
            if (outcount != 0) ret += ", ";
            ret += desc.category;
            outcount++;
        }
    }
    return ret;
}

int LogPrintStr(const std::string &str)
{
    int ret = 0; // Returns total number of characters written
    LOCK(cs_log);

    std::string strTimestamped = LogTimestampStr(str);

    if (fPrintToConsole) {
        ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), stdout);
        fflush(stdout);
    }
    if (fPrintToDebugLog && fileout != nullptr) {
        ret = fwrite(strTimestamped.data(), 1, strTimestamped.size(), fileout);
        fflush(fileout);
    }
    return ret;
}

bool OpenDebugLog(const std::string& path)
{
    LOCK(cs_log);
    if (fileout != nullptr) {
        fclose(fileout);
    }
    fileout = fopen(path.c_str(), "a");
    if (fileout == nullptr) {
        return false;
    }
    setbuf(fileout, nullptr); // unbuffered
    fPrintToDebugLog = true;
    return true;
}

void CloseDebugLog()
{
    LOCK(cs_log);
    if (fileout != nullptr) {
        fclose(fileout);
        fileout = nullptr;
    }
    fPrintToDebugLog = false;
}

std::string HelpMessageGroup(const std::string &message) {
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string &option, const std::string &message) {
    return std::string(2, ' ') + std::string(option) + std::string("\n") +
           std::string(7, ' ') + message + std::string("\n\n");
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    LOCK(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        if (key.empty() || key[0] != '-') {
            error = strprintf("Unexpected argument '%s'", argv[i]);
            return false;
        }

        // Interpret --foo as -foo.
        if (key.length() > 1 && key[1] == '-')
            key = key.substr(1);
        InterpretNegativeSetting(key, val);

        mapArgs[key] = val;
        mapMultiArgs[key].push_back(val);
    }
    return true;
}

void ArgsManager::ReadConfigFile(const std::string& confPath)
{
    std::ifstream streamConfig(confPath);
    if (!streamConfig.good()) {
        return; // No config file is OK
    }

    LOCK(cs_args);
    std::string line;
    int nLine = 0;
    while (std::getline(streamConfig, line)) {
        ++nLine;
        line = TrimString(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        size_t is_index = line.find('=');
        if (is_index == std::string::npos) {
            throw std::runtime_error(strprintf("parse error on line %d of %s: '%s'", nLine, confPath, line));
        }
        std::string strKey = "-" + TrimString(line.substr(0, is_index));
        std::string strValue = TrimString(line.substr(is_index + 1));
        InterpretNegativeSetting(strKey, strValue);
        // Don't overwrite existing settings so command line settings override config file
        if (mapArgs.count(strKey) == 0) {
            mapArgs[strKey] = strValue;
        }
        mapMultiArgs[strKey].push_back(strValue);
    }
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    LOCK(cs_args);
    auto it = mapMultiArgs.find(strArg);
    if (it != mapMultiArgs.end()) return it->second;
    return {};
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    LOCK(cs_args);
    return mapArgs.count(strArg);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return it->second;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return atoll(it->second.c_str());
    return nDefault;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return InterpretBool(it->second);
    return fDefault;
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    if (IsArgSet(strArg)) return false;
    ForceSetArg(strArg, strValue);
    return true;
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    mapArgs[strArg] = strValue;
    mapMultiArgs[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    LOCK(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();
}

bool InitLogging(std::string& error)
{
    fPrintToConsole = gArgs.GetBoolArg("-printtoconsole", DEFAULT_PRINTTOCONSOLE);
    fLogTimestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    uint32_t categories = MSLog::NONE;
    if (gArgs.IsArgSet("-debug")) {
        const std::vector<std::string> categoryNames = gArgs.GetArgs("-debug");
        for (const std::string& cat : categoryNames) {
            uint32_t flag = 0;
            if (!GetLogCategory(&flag, &cat)) {
                error = strprintf("Unsupported logging category -debug=%s. Valid categories: %s", cat, ListLogCategories());
                return false;
            }
            categories |= flag;
        }
    }
    logCategories = categories;

    if (gArgs.IsArgSet("-debuglogfile")) {
        std::string path = gArgs.GetArg("-debuglogfile", std::string(DEFAULT_DEBUGLOGFILE));
        if (!OpenDebugLog(path)) {
            error = strprintf("Could not open debug log file %s", path);
            return false;
        }
    }
    return true;
}
