// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, config file parsing,
 * logging.
 */
#ifndef MINTSUITE_UTIL_H
#define MINTSUITE_UTIL_H

#include <sync.h>

#include <stdexcept>

/** Report malformed format strings as exceptions rather than asserting */
#define TINYFORMAT_ERROR(reason) throw std::runtime_error(reason)
#include <tinyformat.h>

#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

static const bool DEFAULT_LOGTIMESTAMPS = true;
static const bool DEFAULT_PRINTTOCONSOLE = false;
extern const char * const DEFAULT_DEBUGLOGFILE;

extern bool fPrintToConsole;
extern bool fPrintToDebugLog;
extern bool fLogTimestamps;
extern std::atomic<uint32_t> logCategories;

/** Format arguments and return the string, or write to the log. */
template<typename... Args>
std::string strprintf(const char* fmt, const Args&... args)
{
    return tfm::format(fmt, args...);
}

namespace MSLog {
    enum LogFlags : uint32_t {
        NONE        = 0,
        FILTER      = (1 <<  0),
        MINTER      = (1 <<  1),
        SPLIT       = (1 <<  2),
        AUCTION     = (1 <<  3),
        HOLDER      = (1 <<  4),
        CORE        = (1 <<  5),
        CHAIN       = (1 <<  6),
        CONFIG      = (1 <<  7),
        ALL         = ~(uint32_t)0,
    };
}

/** Return true if log accepts specified category */
static inline bool LogAcceptCategory(uint32_t category)
{
    return (logCategories.load(std::memory_order_relaxed) & category) != 0;
}

/** Returns a string with the log categories. */
std::string ListLogCategories();

/** Return true if str parses as a log category and set the flags in f */
bool GetLogCategory(uint32_t *f, const std::string *str);

/** Send a string to the log output */
int LogPrintStr(const std::string &str);

/** Open the debug log file, if enabled. Returns false if the file cannot be opened. */
bool OpenDebugLog(const std::string& path);

/** Close the debug log file */
void CloseDebugLog();

template<typename... Args>
static inline int LogPrintf(const char* fmt, const Args&... args)
{
    std::string log_msg;
    try {
        log_msg = tfm::format(fmt, args...);
    } catch (const std::runtime_error& fmterr) {
        /* Original format string will have newline so don't add one here */
        log_msg = "Error \"" + std::string(fmterr.what()) + "\" while formatting log message: " + fmt;
    }
    return LogPrintStr(log_msg);
}

#define LogPrint(category, ...) do { \
    if (LogAcceptCategory((category))) { \
        LogPrintf(__VA_ARGS__); \
    } \
} while(0)

/** Format a string to be used as group of options in help messages */
std::string HelpMessageGroup(const std::string& message);

/** Format a string to be used as option description in help messages */
std::string HelpMessageOpt(const std::string& option, const std::string& message);

class ArgsManager
{
protected:
    mutable CCriticalSection cs_args;
    std::map<std::string, std::string> mapArgs;
    std::map<std::string, std::vector<std::string>> mapMultiArgs;
public:
    /**
     * Parse "-key[=value]" style arguments.
     * @return false with an error message if an argument does not start with '-'
     */
    bool ParseParameters(int argc, const char* const argv[], std::string& error);

    /**
     * Read "key=value" lines from a config file. Command-line values win.
     * @throws std::runtime_error if the file exists but cannot be parsed
     */
    void ReadConfigFile(const std::string& confPath);

    /**
     * Return a vector of strings of the given argument
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return command-line arguments
     */
    std::vector<std::string> GetArgs(const std::string& strArg) const;

    /**
     * Return true if the given argument has been manually set
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return true if the argument has been set
     */
    bool IsArgSet(const std::string& strArg) const;

    /**
     * Return string argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param strDefault (e.g. "1")
     * @return command-line argument or default value
     */
    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;

    /**
     * Return integer argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param nDefault (e.g. 1)
     * @return command-line argument (0 if invalid number) or default value
     */
    int64_t GetArg(const std::string& strArg, int64_t nDefault) const;

    /**
     * Return boolean argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param fDefault (true or false)
     * @return command-line argument or default value
     */
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    /**
     * Set an argument if it doesn't already have a value
     *
     * @param strArg Argument to set (e.g. "-foo")
     * @param strValue Value (e.g. "1")
     * @return true if argument gets set, false if it already had a value
     */
    bool SoftSetArg(const std::string& strArg, const std::string& strValue);

    // Forces an arg setting. Called by SoftSetArg() if the arg hasn't already
    // been set. Also called directly in testing.
    void ForceSetArg(const std::string& strArg, const std::string& strValue);

    /** Drop every parsed argument. Used by tests. */
    void ClearArgs();
};

extern ArgsManager gArgs;

/** Apply -debug, -printtoconsole, -logtimestamps and -debuglogfile from gArgs. */
bool InitLogging(std::string& error);

#endif // MINTSUITE_UTIL_H
