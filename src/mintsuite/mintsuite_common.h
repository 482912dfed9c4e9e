// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_MINTSUITE_COMMON_H
#define MINTSUITE_MINTSUITE_COMMON_H

/**
 * @file mintsuite_common.h
 * @brief Common types and constants for the minter suite
 */

#include <amount.h>
#include <uint256.h>

#include <cstdint>
#include <string>

namespace mintsuite {

// ============================================================================
// Constants
// ============================================================================

/** Token ids are projectId * ONE_MILLION + invocation */
static constexpr uint64_t ONE_MILLION = 1000000;

/** Version reported by every shared minter */
static const char* const MINTER_VERSION = "v5.0.0";

/** Symbol reported for native-currency prices */
static const char* const NATIVE_CURRENCY_SYMBOL = "ETH";

// ============================================================================
// Token id helpers
// ============================================================================

/** Project a token belongs to */
inline uint64_t ProjectIdFromTokenId(uint64_t tokenId) { return tokenId / ONE_MILLION; }

/** Zero-based invocation ordinal of a token within its project */
inline uint64_t InvocationFromTokenId(uint64_t tokenId) { return tokenId % ONE_MILLION; }

inline uint64_t MakeTokenId(uint64_t projectId, uint64_t invocation)
{
    return projectId * ONE_MILLION + invocation;
}

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief (core contract, project id) key for per-project state
 *
 * Project ids are only unique per core contract, so every per-project
 * store is keyed by the pair.
 */
struct ProjectKey {
    uint160 coreContract;
    uint64_t projectId;

    ProjectKey() : projectId(0) {}
    ProjectKey(const uint160& core, uint64_t id) : coreContract(core), projectId(id) {}

    bool operator<(const ProjectKey& other) const
    {
        if (coreContract != other.coreContract) {
            return coreContract < other.coreContract;
        }
        return projectId < other.projectId;
    }

    bool operator==(const ProjectKey& other) const
    {
        return coreContract == other.coreContract && projectId == other.projectId;
    }

    std::string ToString() const
    {
        return coreContract.ToString() + ":" + std::to_string(projectId);
    }
};

/**
 * @brief Price information reported by a minter for a project
 */
struct PriceInfo {
    /** Whether a price (or auction) is configured */
    bool isConfigured;

    /** Current token price in the project's currency */
    CAmount tokenPriceInWei;

    /** Currency symbol, "ETH" for native payments */
    std::string currencySymbol;

    /** ERC20 currency address, null for native payments */
    uint160 currencyAddress;

    PriceInfo()
        : isConfigured(false)
        , tokenPriceInWei(0)
        , currencySymbol(NATIVE_CURRENCY_SYMBOL) {}
};

} // namespace mintsuite

#endif // MINTSUITE_MINTSUITE_COMMON_H
