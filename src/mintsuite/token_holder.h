// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_TOKEN_HOLDER_H
#define MINTSUITE_TOKEN_HOLDER_H

/**
 * @file token_holder.h
 * @brief Allowlist of NFT projects whose holders may purchase
 *
 * Each project keeps a set of (owned NFT contract, owned NFT project id)
 * pairs. Holding any token of an allowlisted pair makes its owner, or a
 * delegate of the owner, eligible to purchase. A holder token is not
 * consumed by a purchase and may be presented any number of times.
 */

#include <mintsuite/chain.h>
#include <mintsuite/delegation_registry.h>
#include <mintsuite/mintsuite_common.h>

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace mintsuite {

class MinterFilterV2;

class TokenHolderAllowlist
{
public:
    /**
     * @param chain Hosting ledger
     * @param owner Address of the owning minter, the emitter of events
     */
    TokenHolderAllowlist(Chain& chain, const uint160& owner);

    /** Journal holding the allowlist, to be tracked by the owning contract */
    StateJournal& Journal() { return allowlists_; }

    /**
     * @brief Allow holders of the given projects
     *
     * Owned NFT contracts must be core contracts registered with filter.
     * Adding a pair twice has no further effect.
     *
     * @throws RevertError "TokenHolderLib: arrays neq length",
     *         "TokenHolderLib: address not registered"
     */
    void AllowHoldersOfProjects(const ProjectKey& key, const std::vector<uint160>& ownedNFTAddresses,
                                const std::vector<uint64_t>& ownedNFTProjectIds, const MinterFilterV2& filter);

    /**
     * @brief Remove holders of the given projects; pairs never added are ignored
     * @throws RevertError "TokenHolderLib: arrays neq length"
     */
    void RemoveHoldersOfProjects(const ProjectKey& key, const std::vector<uint160>& ownedNFTAddresses,
                                 const std::vector<uint64_t>& ownedNFTProjectIds);

    /** Add then remove; a pair present in both ends up removed */
    void AllowAndRemoveHoldersOfProjects(const ProjectKey& key,
                                         const std::vector<uint160>& ownedNFTAddressesAdd,
                                         const std::vector<uint64_t>& ownedNFTProjectIdsAdd,
                                         const std::vector<uint160>& ownedNFTAddressesRemove,
                                         const std::vector<uint64_t>& ownedNFTProjectIdsRemove,
                                         const MinterFilterV2& filter);

    /** True if the project of ownedNFTTokenId on ownedNFTAddress is allowlisted for key */
    bool IsAllowlistedNFT(const ProjectKey& key, const uint160& ownedNFTAddress, uint64_t ownedNFTTokenId) const;

    /** Allowlisted pairs of a project */
    std::vector<std::pair<uint160, uint64_t>> GetAllowlistedProjects(const ProjectKey& key) const;

    /**
     * @brief Require targetOwner to own the token
     * @throws RevertError "Only owner of NFT"
     */
    void ValidateNFTOwnership(const uint160& ownedNFTAddress, uint64_t ownedNFTTokenId,
                              const uint160& targetOwner) const;

    /**
     * @brief Effective purchasing principal
     *
     * With a null vault the purchaser acts for itself. Otherwise the
     * purchaser must be a delegate of the vault for the owned token, and the
     * vault becomes the principal.
     *
     * @throws RevertError "Invalid delegate-vault pairing"
     */
    uint160 ResolvePurchaser(const uint160& purchaser, const uint160& vault, const uint160& ownedNFTAddress,
                             uint64_t ownedNFTTokenId, const IDelegationRegistry* delegationRegistry) const;

private:
    typedef std::set<std::pair<uint160, uint64_t>> HolderSet;

    void AllowInternal(const ProjectKey& key, const std::vector<uint160>& ownedNFTAddresses,
                       const std::vector<uint64_t>& ownedNFTProjectIds, const MinterFilterV2& filter);
    void RemoveInternal(const ProjectKey& key, const std::vector<uint160>& ownedNFTAddresses,
                        const std::vector<uint64_t>& ownedNFTProjectIds);
    void EmitHolderEvent(const std::string& name, const ProjectKey& key,
                         const std::vector<uint160>& ownedNFTAddresses,
                         const std::vector<uint64_t>& ownedNFTProjectIds);

    Chain& chain_;
    const uint160 owner_;
    Snapshotted<std::map<ProjectKey, HolderSet>> allowlists_;
};

} // namespace mintsuite

#endif // MINTSUITE_TOKEN_HOLDER_H
