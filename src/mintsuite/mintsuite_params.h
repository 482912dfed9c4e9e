// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_MINTSUITE_PARAMS_H
#define MINTSUITE_MINTSUITE_PARAMS_H

/**
 * @file mintsuite_params.h
 * @brief Network-specific parameters of the minter suite
 *
 * Minters read their initial auction minimums from the selected network
 * parameters at deployment; the simulator reads provider percentages
 * when it deploys core contracts.
 */

#include <cstdint>
#include <string>

namespace mintsuite {

static const char* const NETWORK_MAIN = "main";
static const char* const NETWORK_TEST = "test";
static const char* const NETWORK_REGTEST = "regtest";

/**
 * Minter suite parameters
 * These parameters are network-specific (main/test/regtest)
 */
struct MintSuiteParams {
    /** Network name */
    std::string strNetworkID;

    // === Dutch Auctions ===
    /** Minimum length of a linear auction (seconds) */
    int64_t nMinAuctionLengthSeconds;
    /** Minimum half life of an exponential auction (seconds) */
    int64_t nMinPriceDecayHalfLifeSeconds;

    // === Revenue Splits ===
    /** Render provider share of primary sales for new cores (percent) */
    uint32_t nRenderProviderPercentage;
    /** Platform provider share of primary sales for new Engine cores (percent) */
    uint32_t nPlatformProviderPercentage;
};

/**
 * Get parameters for main
 */
const MintSuiteParams& MainMintSuiteParams();

/**
 * Get parameters for test
 */
const MintSuiteParams& TestMintSuiteParams();

/**
 * Get parameters for regtest
 */
const MintSuiteParams& RegtestMintSuiteParams();

/**
 * Get currently selected parameters, including any command-line overrides
 */
const MintSuiteParams& GetMintSuiteParams();

/**
 * Select parameters for a network, dropping earlier overrides
 * @throws std::runtime_error for an unknown network
 */
void SelectMintSuiteParams(const std::string& network);

/**
 * Override the auction minimums of the selected parameters
 */
void UpdateMintSuiteAuctionMinimums(int64_t nMinAuctionLengthSeconds, int64_t nMinPriceDecayHalfLifeSeconds);

} // namespace mintsuite

#endif // MINTSUITE_MINTSUITE_PARAMS_H
