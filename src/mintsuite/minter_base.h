// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_MINTER_BASE_H
#define MINTSUITE_MINTER_BASE_H

/**
 * @file minter_base.h
 * @brief Behaviour shared by every shared minter
 *
 * A shared minter serves many core contracts through one minter filter.
 * MinterBase holds the pieces every purchase workflow composes:
 * - a reentrancy guard wrapping each purchase entry point
 * - the max-invocations cache, with artist sync and manual limit
 * - engine detection and revenue splitting
 * - authorization helpers for artist, core admin and filter admin checks
 *
 * Purchases follow checks, effects, interactions: the cache check and
 * pricing come first, then the mint through the filter and the cache
 * update, and the payment split last.
 */

#include <mintsuite/chain.h>
#include <mintsuite/core_contract.h>
#include <mintsuite/max_invocations.h>
#include <mintsuite/minter_filter.h>
#include <mintsuite/mintsuite_common.h>
#include <mintsuite/split_funds.h>

#include <cstdint>
#include <string>

namespace mintsuite {

class MinterBase : public Contract, public IFilteredMinter
{
public:
    /**
     * @param chain Hosting ledger
     * @param minterFilter Minter filter the minter mints through
     */
    MinterBase(Chain& chain, const uint160& minterFilter);

    std::string MinterVersion() const override { return MINTER_VERSION; }
    uint160 MinterFilterAddress() const override { return minterFilter_; }

    // =========================================================================
    // Max invocations
    // =========================================================================

    /** Artist only; copy the core's max invocations into the local cache */
    void SyncProjectMaxInvocationsToCore(const CallContext& ctx, uint64_t projectId, const uint160& coreContract);

    /**
     * @brief Artist only; limit a project below the core's max invocations
     * @throws RevertError "Only Artist", "Invalid max invocations"
     */
    void ManuallyLimitProjectMaxInvocations(const CallContext& ctx, uint64_t projectId, const uint160& coreContract,
                                            uint64_t maxInvocations);

    MaxInvocationsProjectConfig MaxInvocationsProjectConfigOf(uint64_t projectId, const uint160& coreContract) const;
    bool ProjectMaxHasBeenInvoked(uint64_t projectId, const uint160& coreContract) const;
    uint64_t ProjectMaxInvocations(uint64_t projectId, const uint160& coreContract) const;

    // =========================================================================
    // Funds
    // =========================================================================

    /** Engine-ness of a core contract, without caching it */
    bool IsEngineView(const uint160& coreContract) const;

protected:
    /** Resolve a core contract */
    IGenArt721Core& Core(const uint160& coreContract) const;

    MinterFilterV2& Filter() const;

    /** @throws RevertError "Only Artist" */
    void RequireArtist(const CallContext& ctx, const ProjectKey& key) const;

    /** @throws RevertError "Only Core AdminACL allowed" */
    void RequireCoreAdminACL(const CallContext& ctx, const uint160& coreContract, const std::string& selector) const;

    /** @throws RevertError "Only MinterFilter AdminACL" */
    void RequireMinterFilterAdminACL(const CallContext& ctx, const std::string& selector) const;

    /**
     * @brief Mint through the filter and update the max-invocations cache
     * @return New token id
     */
    uint64_t MintAndValidateEffects(const uint160& to, const ProjectKey& key, const uint160& sender);

    ReentrancyGuard reentrancyGuard_;
    MaxInvocationsTracker maxInvocations_;
    SplitFunds splitFunds_;

private:
    const uint160 minterFilter_;
};

} // namespace mintsuite

#endif // MINTSUITE_MINTER_BASE_H
