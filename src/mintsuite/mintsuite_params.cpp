// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mintsuite/mintsuite_params.h>

#include <util.h>

#include <stdexcept>

namespace mintsuite {

// Main parameters
static const MintSuiteParams mainParams = {
    .strNetworkID = NETWORK_MAIN,

    // === Dutch Auctions ===
    .nMinAuctionLengthSeconds = 10 * 60,            // 10 minutes
    .nMinPriceDecayHalfLifeSeconds = 45,            // 45 seconds

    // === Revenue Splits ===
    .nRenderProviderPercentage = 10,
    .nPlatformProviderPercentage = 10
};

// Test parameters (shorter auctions allowed)
static const MintSuiteParams testParams = {
    .strNetworkID = NETWORK_TEST,

    // === Dutch Auctions ===
    .nMinAuctionLengthSeconds = 5 * 60,             // 5 minutes
    .nMinPriceDecayHalfLifeSeconds = 45,

    // === Revenue Splits ===
    .nRenderProviderPercentage = 10,
    .nPlatformProviderPercentage = 10
};

// Regtest parameters (fast auctions for testing)
static const MintSuiteParams regtestParams = {
    .strNetworkID = NETWORK_REGTEST,

    // === Dutch Auctions ===
    .nMinAuctionLengthSeconds = 60,                 // 1 minute
    .nMinPriceDecayHalfLifeSeconds = 45,

    // === Revenue Splits ===
    .nRenderProviderPercentage = 10,
    .nPlatformProviderPercentage = 10
};

// Currently selected parameters, with overrides applied
static MintSuiteParams currentParams = mainParams;

const MintSuiteParams& MainMintSuiteParams()
{
    return mainParams;
}

const MintSuiteParams& TestMintSuiteParams()
{
    return testParams;
}

const MintSuiteParams& RegtestMintSuiteParams()
{
    return regtestParams;
}

const MintSuiteParams& GetMintSuiteParams()
{
    return currentParams;
}

void SelectMintSuiteParams(const std::string& network)
{
    if (network == NETWORK_MAIN) {
        currentParams = mainParams;
    } else if (network == NETWORK_TEST) {
        currentParams = testParams;
    } else if (network == NETWORK_REGTEST) {
        currentParams = regtestParams;
    } else {
        throw std::runtime_error(strprintf("%s: Unknown network %s.", __func__, network));
    }
}

void UpdateMintSuiteAuctionMinimums(int64_t nMinAuctionLengthSeconds, int64_t nMinPriceDecayHalfLifeSeconds)
{
    currentParams.nMinAuctionLengthSeconds = nMinAuctionLengthSeconds;
    currentParams.nMinPriceDecayHalfLifeSeconds = nMinPriceDecayHalfLifeSeconds;
}

} // namespace mintsuite
