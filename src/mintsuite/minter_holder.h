// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_MINTER_HOLDER_H
#define MINTSUITE_MINTER_HOLDER_H

/**
 * @file minter_holder.h
 * @brief Fixed-price minters gated on holding an allowlisted NFT
 *
 * MinterSetPriceHolderV5 sells at a fixed price to owners of tokens from
 * allowlisted projects, or to their delegates acting for a vault.
 *
 * MinterSetPricePolyptychV5 additionally copies the hash seed of the owned
 * token onto the new token, so that a series of panels can share one
 * seed. Each seed may be used once per panel; the artist advances the
 * panel to open the next round.
 */

#include <mintsuite/minter_set_price.h>
#include <mintsuite/token_holder.h>

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace mintsuite {

// ============================================================================
// MinterSetPriceHolderV5
// ============================================================================

class MinterSetPriceHolderV5 : public MinterBase
{
public:
    /**
     * @param chain Hosting ledger
     * @param minterFilter Minter filter the minter mints through
     * @param delegationRegistry Registry consulted for vault purchases; may be null
     */
    MinterSetPriceHolderV5(Chain& chain, const uint160& minterFilter, const uint160& delegationRegistry);

    std::string MinterType() const override { return "MinterSetPriceHolderV5"; }

    PriceInfo GetPriceInfo(uint64_t projectId, const uint160& coreContract) const override;

    /** Artist only */
    void UpdatePricePerTokenInWei(const CallContext& ctx, uint64_t projectId, const uint160& coreContract,
                                  const CAmount& pricePerTokenInWei);

    /** Artist only; see TokenHolderAllowlist::AllowHoldersOfProjects */
    void AllowHoldersOfProjects(const CallContext& ctx, uint64_t projectId, const uint160& coreContract,
                                const std::vector<uint160>& ownedNFTAddresses,
                                const std::vector<uint64_t>& ownedNFTProjectIds);

    /** Artist only */
    void RemoveHoldersOfProjects(const CallContext& ctx, uint64_t projectId, const uint160& coreContract,
                                 const std::vector<uint160>& ownedNFTAddresses,
                                 const std::vector<uint64_t>& ownedNFTProjectIds);

    /** Artist only; removals apply after additions */
    void AllowAndRemoveHoldersOfProjects(const CallContext& ctx, uint64_t projectId, const uint160& coreContract,
                                         const std::vector<uint160>& ownedNFTAddressesAdd,
                                         const std::vector<uint64_t>& ownedNFTProjectIdsAdd,
                                         const std::vector<uint160>& ownedNFTAddressesRemove,
                                         const std::vector<uint64_t>& ownedNFTProjectIdsRemove);

    bool IsAllowlistedNFT(uint64_t projectId, const uint160& coreContract, const uint160& ownedNFTAddress,
                          uint64_t ownedNFTTokenId) const;

    std::vector<std::pair<uint160, uint64_t>> AllowlistedProjectsOf(uint64_t projectId,
                                                                     const uint160& coreContract) const;

    /** Always reverts: holder purchases must name the owned NFT */
    uint64_t Purchase(const CallContext& ctx, uint64_t projectId, const uint160& coreContract);

    /** Purchase a token to the caller, presenting an owned NFT */
    uint64_t Purchase(const CallContext& ctx, uint64_t projectId, const uint160& coreContract,
                      const uint160& ownedNFTAddress, uint64_t ownedNFTTokenId);

    /**
     * @brief Purchase a token to another address, presenting an owned NFT
     *
     * With a non-null vault the caller must be a delegate of the vault for
     * the owned token, and the vault must own it.
     *
     * @throws RevertError "Price not configured", "Min value to mint req.",
     *         "Invalid delegate-vault pairing", "Only allowlisted NFTs", "Only owner of NFT"
     */
    uint64_t PurchaseTo(const CallContext& ctx, const uint160& to, uint64_t projectId, const uint160& coreContract,
                        const uint160& ownedNFTAddress, uint64_t ownedNFTTokenId, const uint160& vault);

    SetPriceProjectConfig SetPriceProjectConfigOf(uint64_t projectId, const uint160& coreContract) const;

    uint160 DelegationRegistryAddress() const { return delegationRegistry_; }

protected:
    /** Runs after eligibility checks, before the mint */
    virtual void BeforeMint(const ProjectKey& key, const uint160& ownedNFTAddress, uint64_t ownedNFTTokenId) {}

    /** Runs right after the mint, before the ownership check and payment */
    virtual void AfterMint(const ProjectKey& key, uint64_t tokenId, const uint160& ownedNFTAddress,
                           uint64_t ownedNFTTokenId) {}

private:
    uint64_t PurchaseToInternal(const CallContext& ctx, const uint160& to, const ProjectKey& key,
                                const uint160& ownedNFTAddress, uint64_t ownedNFTTokenId, const uint160& vault);

    SetPriceConfigs prices_;
    TokenHolderAllowlist holders_;
    const uint160 delegationRegistry_;
};

// ============================================================================
// MinterSetPricePolyptychV5
// ============================================================================

class MinterSetPricePolyptychV5 : public MinterSetPriceHolderV5
{
public:
    MinterSetPricePolyptychV5(Chain& chain, const uint160& minterFilter, const uint160& delegationRegistry);

    std::string MinterType() const override { return "MinterSetPricePolyptychV5"; }

    /** Artist only; open the next panel of the project */
    void IncrementPolyptychProjectPanelId(const CallContext& ctx, uint64_t projectId, const uint160& coreContract);

    uint64_t GetCurrentPolyptychPanelId(uint64_t projectId, const uint160& coreContract) const;

    bool GetPolyptychPanelHashSeedIsMinted(uint64_t projectId, const uint160& coreContract, uint64_t panelId,
                                           const uint96& hashSeed) const;

protected:
    /** @throws RevertError "Only tokens with hash seed", "Panel already minted" */
    void BeforeMint(const ProjectKey& key, const uint160& ownedNFTAddress, uint64_t ownedNFTTokenId) override;

    /** @throws RevertError "Unexpected token hash seed" */
    void AfterMint(const ProjectKey& key, uint64_t tokenId, const uint160& ownedNFTAddress,
                   uint64_t ownedNFTTokenId) override;

private:
    uint96 OwnedTokenHashSeed(const uint160& ownedNFTAddress, uint64_t ownedNFTTokenId) const;

    struct PanelState {
        std::map<ProjectKey, uint64_t> currentPanelIds;
        std::map<ProjectKey, std::set<std::pair<uint64_t, uint96>>> mintedSeeds;
    };

    Snapshotted<PanelState> panels_;
};

} // namespace mintsuite

#endif // MINTSUITE_MINTER_HOLDER_H
