// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_SPLIT_FUNDS_H
#define MINTSUITE_SPLIT_FUNDS_H

/**
 * @file split_funds.h
 * @brief Engine detection and primary sale revenue splitting
 *
 * Sale proceeds are partitioned in a fixed order:
 *   1. Refund of any excess value to the payer
 *   2. Render provider: price * renderPct / 100
 *   3. Platform provider (Engine cores only): price * platformPct / 100
 *   4. Additional payee: remaining * additionalPct / 100
 *   5. Artist: whatever is left
 *
 * The artist never receives a computed percentage, so the legs always sum
 * to the price exactly.
 *
 * Whether a core is an Engine deployment is derived from the length of its
 * raw revenue split data (8 words for Engine, 6 for flagship) and cached
 * per core, since a core cannot change its kind after deployment.
 */

#include <mintsuite/abi.h>
#include <mintsuite/chain.h>
#include <mintsuite/core_contract.h>
#include <mintsuite/erc20.h>
#include <mintsuite/mintsuite_common.h>

#include <map>
#include <string>

namespace mintsuite {

/**
 * @brief Cached engine-ness of a core contract
 */
struct IsEngineCache {
    bool isCached;
    bool isEngine;

    IsEngineCache() : isCached(false), isEngine(false) {}
};

/**
 * @brief ERC20 currency a project is sold in
 */
struct ProjectCurrencyInfo {
    std::string currencySymbol;
    uint160 currencyAddress;
};

/**
 * @brief Payees and amounts of one primary sale
 */
struct SplitFundsAmounts {
    CAmount renderProviderRevenue;
    uint160 renderProviderAddress;
    CAmount platformProviderRevenue;
    uint160 platformProviderAddress;
    CAmount additionalPayeeRevenue;
    uint160 additionalPayeeAddress;
    CAmount artistRevenue;
    uint160 artistAddress;

    SplitFundsAmounts()
        : renderProviderRevenue(0)
        , platformProviderRevenue(0)
        , additionalPayeeRevenue(0)
        , artistRevenue(0) {}

    CAmount Total() const
    {
        return renderProviderRevenue + platformProviderRevenue + additionalPayeeRevenue + artistRevenue;
    }
};

/**
 * @brief Decode raw revenue split words and partition price
 *
 * @param raw Raw revenue split data of the core
 * @param isEngine Expected shape of raw
 * @param price Sale price
 * @throws RevertError "Unexpected revenue split bytes" if raw does not have
 *         the expected shape
 */
SplitFundsAmounts ComputeSplitFunds(const abi::Bytes& raw, bool isEngine, const CAmount& price);

/**
 * @brief Engine detection, revenue splitting and project currency settings of one minter
 *
 * Owned by a minter; payments are made from the minter's balance (native)
 * or pulled from the payer by the minter (ERC20).
 */
class SplitFunds
{
public:
    /**
     * @param chain Hosting ledger
     * @param owner Address of the owning minter
     */
    SplitFunds(Chain& chain, const uint160& owner);

    /** Journal holding the splitter's state, to be tracked by the owning contract */
    StateJournal& Journal() { return state_; }

    // =========================================================================
    // Engine detection
    // =========================================================================

    /**
     * @brief Engine-ness of a core, cached after the first query
     * @throws RevertError "Unexpected revenue split bytes"
     */
    bool GetIsEngine(const ProjectKey& key, const IGenArt721Core& core);

    /** Engine-ness of a core; uses the cache if populated, never writes it */
    bool IsEngineView(const ProjectKey& key, const IGenArt721Core& core) const;

    IsEngineCache GetIsEngineCache(const uint160& coreContract) const;

    // =========================================================================
    // Native currency
    // =========================================================================

    /**
     * @brief Refund the excess over price to the payer, then split price among payees
     *
     * @param key Project sold
     * @param price Token price
     * @param core Core contract of the project
     * @param ctx Purchase context: payer and attached value
     * @throws RevertError "Refund failed", "<payee> payment failed"
     */
    void SplitFundsETHRefundSender(const ProjectKey& key, const CAmount& price, const IGenArt721Core& core,
                                   const CallContext& ctx);

    // =========================================================================
    // ERC20 currency
    // =========================================================================

    /**
     * @brief Configure the ERC20 currency a project is sold in
     * @throws RevertError "null address, only ERC20", "only non-null symbol"
     */
    void UpdateProjectCurrencyInfo(const ProjectKey& key, const std::string& currencySymbol,
                                   const uint160& currencyAddress);

    /** Currency of a project; empty symbol and null address if unconfigured */
    ProjectCurrencyInfo GetProjectCurrencyInfo(const ProjectKey& key) const;

    bool IsProjectCurrencyConfigured(const ProjectKey& key) const;

    /**
     * @brief Check the payer can cover price with their ERC20 balance and allowance
     * @throws RevertError "Insufficient ERC20 allowance", "Insufficient ERC20 balance"
     */
    void ValidateERC20Approvals(const uint160& payer, const IERC20& currency, const CAmount& price) const;

    /**
     * @brief Pull each leg of price from the payer straight to the payees
     */
    void SplitFundsERC20(const ProjectKey& key, const CAmount& price, const IGenArt721Core& core,
                         const uint160& payer, IERC20& currency);

private:
    struct State {
        std::map<uint160, IsEngineCache> engineCache;
        std::map<ProjectKey, ProjectCurrencyInfo> currencies;
    };

    static bool IsEngineFromRaw(const abi::Bytes& raw);
    void PayNative(const uint160& to, const CAmount& amount, const std::string& payee);
    void PayERC20(IERC20& currency, const uint160& payer, const uint160& to, const CAmount& amount);

    Chain& chain_;
    const uint160 owner_;
    Snapshotted<State> state_;
};

} // namespace mintsuite

#endif // MINTSUITE_SPLIT_FUNDS_H
