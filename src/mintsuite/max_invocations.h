// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_MAX_INVOCATIONS_H
#define MINTSUITE_MAX_INVOCATIONS_H

/**
 * @file max_invocations.h
 * @brief Per-project max-invocations cache shared by every minter
 *
 * Each minter keeps a local copy of a project's mint cap plus a
 * "cap reached" flag, so that sold-out purchases fail early. The cache is
 * advisory: the core contract re-enforces its own cap on every mint. A
 * stale cache can therefore only let a purchase reach the core and fail
 * there, never allow over-minting, since the core cap only decreases.
 *
 * State transitions:
 * - Sync copies the core's cap and clears the flag only if invocations are
 *   below the new cap. It never sets the flag.
 * - A manual limit sets a cap between core invocations and the core cap,
 *   and sets the flag exactly when the cap equals current invocations.
 * - Purchase effects set the flag when the minted ordinal is the last one
 *   allowed by the cached cap.
 */

#include <mintsuite/chain.h>
#include <mintsuite/core_contract.h>
#include <mintsuite/mintsuite_common.h>

#include <cstdint>
#include <map>

namespace mintsuite {

/**
 * @brief Cached cap of one project
 */
struct MaxInvocationsProjectConfig {
    /** Set once the cached cap has been reached */
    bool maxHasBeenInvoked;

    /** Cached cap; 0 with maxHasBeenInvoked unset means unconfigured */
    uint64_t maxInvocations;

    MaxInvocationsProjectConfig()
        : maxHasBeenInvoked(false)
        , maxInvocations(0) {}
};

class MaxInvocationsTracker
{
public:
    /**
     * @param chain Hosting ledger, for events
     * @param owner Address of the owning minter, the emitter of events
     */
    MaxInvocationsTracker(Chain& chain, const uint160& owner);

    /** Journal holding the tracker's state, to be tracked by the owning contract */
    StateJournal& Journal() { return configs_; }

    /**
     * @brief Copy the core's authoritative cap into the cache
     *
     * Clears maxHasBeenInvoked only when invocations are below the new cap.
     */
    void SyncProjectMaxInvocationsToCore(const ProjectKey& key, const IGenArt721Core& core);

    /**
     * @brief Limit a project below the core cap
     *
     * The caller is responsible for the artist check.
     *
     * @throws RevertError "Invalid max invocations" unless
     *         invocations <= maxInvocations <= core cap
     */
    void ManuallyLimitProjectMaxInvocations(const ProjectKey& key, const IGenArt721Core& core,
                                            uint64_t maxInvocations);

    /** Sync from the core if the project has never been configured */
    void RefreshMaxInvocations(const ProjectKey& key, const IGenArt721Core& core);

    /** @throws RevertError "Max invocations reached" */
    void PreMintChecks(const ProjectKey& key) const;

    /**
     * @brief Update the cache after a successful mint
     *
     * @param key Project minted
     * @param tokenId Token id returned by the mint
     * @param core Core that minted the token
     * @throws RevertError "Unexpected token id" if the token is not the
     *         next invocation of the project
     */
    void ValidatePurchaseEffectsInvocations(const ProjectKey& key, uint64_t tokenId, const IGenArt721Core& core);

    MaxInvocationsProjectConfig GetConfig(const ProjectKey& key) const;

    bool ProjectMaxHasBeenInvoked(const ProjectKey& key) const;

    uint64_t ProjectMaxInvocations(const ProjectKey& key) const;

    /**
     * @brief Cap reached according to the cache or to the core itself
     *
     * Unlike the cached flag, this also sees caps reached through other
     * minters or core-side limit changes.
     */
    bool ProjectMaxHasBeenInvokedSafe(const ProjectKey& key, const IGenArt721Core& core) const;

private:
    void EmitLimitUpdated(const ProjectKey& key, uint64_t maxInvocations);

    Chain& chain_;
    const uint160 owner_;
    Snapshotted<std::map<ProjectKey, MaxInvocationsProjectConfig>> configs_;
};

} // namespace mintsuite

#endif // MINTSUITE_MAX_INVOCATIONS_H
