// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mintsuite/mintsuite_config.h>
#include <mintsuite/mintsuite_params.h>
#include <util.h>

#include <stdexcept>

namespace mintsuite {

std::string GetMintSuiteHelpMessage()
{
    std::string strUsage;

    strUsage += HelpMessageGroup("Minter suite options:");
    strUsage += HelpMessageOpt("-network=<net>", strprintf("Network parameters to use: %s, %s or %s (default: %s)",
        NETWORK_MAIN, NETWORK_TEST, NETWORK_REGTEST, DEFAULT_NETWORK));
    strUsage += HelpMessageOpt("-minauctionlength=<n>",
        "Minimum linear auction length in seconds for newly deployed minters (default: network specific)");
    strUsage += HelpMessageOpt("-minhalflife=<n>",
        "Minimum exponential auction half life in seconds for newly deployed minters (default: network specific)");

    return strUsage;
}

bool InitMintSuiteConfig(std::string& error)
{
    const std::string network = gArgs.GetArg("-network", std::string(DEFAULT_NETWORK));
    try {
        SelectMintSuiteParams(network);
    } catch (const std::runtime_error& e) {
        error = strprintf("Invalid -network: %s", e.what());
        return false;
    }

    const MintSuiteParams& params = GetMintSuiteParams();
    int64_t minAuctionLength = gArgs.GetArg("-minauctionlength", params.nMinAuctionLengthSeconds);
    int64_t minHalfLife = gArgs.GetArg("-minhalflife", params.nMinPriceDecayHalfLifeSeconds);

    if (minAuctionLength < 0) {
        error = strprintf("Invalid -minauctionlength: %d", minAuctionLength);
        return false;
    }
    if (minHalfLife <= 0) {
        error = strprintf("Invalid -minhalflife: %d (half life of zero not allowed)", minHalfLife);
        return false;
    }
    UpdateMintSuiteAuctionMinimums(minAuctionLength, minHalfLife);

    LogPrint(MSLog::CONFIG, "MintSuite: Initialized - network=%s, minauctionlength=%d, minhalflife=%d\n",
             network, minAuctionLength, minHalfLife);
    return true;
}

} // namespace mintsuite
