// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mintsuite/minter_holder.h>

#include <util.h>

namespace mintsuite {

// ============================================================================
// MinterSetPriceHolderV5
// ============================================================================

MinterSetPriceHolderV5::MinterSetPriceHolderV5(Chain& chain, const uint160& minterFilter,
                                               const uint160& delegationRegistry)
    : MinterBase(chain, minterFilter)
    , prices_(chain, address_)
    , holders_(chain, address_)
    , delegationRegistry_(delegationRegistry)
{
    Track(prices_.Journal());
    Track(holders_.Journal());
}

PriceInfo MinterSetPriceHolderV5::GetPriceInfo(uint64_t projectId, const uint160& coreContract) const
{
    const SetPriceProjectConfig config = prices_.GetConfig(ProjectKey(coreContract, projectId));

    PriceInfo info;
    info.isConfigured = config.priceIsConfigured;
    info.tokenPriceInWei = config.pricePerTokenInWei;
    return info;
}

void MinterSetPriceHolderV5::UpdatePricePerTokenInWei(const CallContext& ctx, uint64_t projectId,
                                                      const uint160& coreContract, const CAmount& pricePerTokenInWei)
{
    const ProjectKey key(coreContract, projectId);
    RequireArtist(ctx, key);
    prices_.UpdatePricePerTokenInWei(key, pricePerTokenInWei);
    maxInvocations_.RefreshMaxInvocations(key, Core(coreContract));
}

void MinterSetPriceHolderV5::AllowHoldersOfProjects(const CallContext& ctx, uint64_t projectId,
                                                    const uint160& coreContract,
                                                    const std::vector<uint160>& ownedNFTAddresses,
                                                    const std::vector<uint64_t>& ownedNFTProjectIds)
{
    const ProjectKey key(coreContract, projectId);
    RequireArtist(ctx, key);
    holders_.AllowHoldersOfProjects(key, ownedNFTAddresses, ownedNFTProjectIds, Filter());
}

void MinterSetPriceHolderV5::RemoveHoldersOfProjects(const CallContext& ctx, uint64_t projectId,
                                                     const uint160& coreContract,
                                                     const std::vector<uint160>& ownedNFTAddresses,
                                                     const std::vector<uint64_t>& ownedNFTProjectIds)
{
    const ProjectKey key(coreContract, projectId);
    RequireArtist(ctx, key);
    holders_.RemoveHoldersOfProjects(key, ownedNFTAddresses, ownedNFTProjectIds);
}

void MinterSetPriceHolderV5::AllowAndRemoveHoldersOfProjects(const CallContext& ctx, uint64_t projectId,
                                                             const uint160& coreContract,
                                                             const std::vector<uint160>& ownedNFTAddressesAdd,
                                                             const std::vector<uint64_t>& ownedNFTProjectIdsAdd,
                                                             const std::vector<uint160>& ownedNFTAddressesRemove,
                                                             const std::vector<uint64_t>& ownedNFTProjectIdsRemove)
{
    const ProjectKey key(coreContract, projectId);
    RequireArtist(ctx, key);
    holders_.AllowAndRemoveHoldersOfProjects(key, ownedNFTAddressesAdd, ownedNFTProjectIdsAdd,
                                             ownedNFTAddressesRemove, ownedNFTProjectIdsRemove, Filter());
}

bool MinterSetPriceHolderV5::IsAllowlistedNFT(uint64_t projectId, const uint160& coreContract,
                                              const uint160& ownedNFTAddress, uint64_t ownedNFTTokenId) const
{
    return holders_.IsAllowlistedNFT(ProjectKey(coreContract, projectId), ownedNFTAddress, ownedNFTTokenId);
}

std::vector<std::pair<uint160, uint64_t>> MinterSetPriceHolderV5::AllowlistedProjectsOf(
    uint64_t projectId, const uint160& coreContract) const
{
    return holders_.GetAllowlistedProjects(ProjectKey(coreContract, projectId));
}

uint64_t MinterSetPriceHolderV5::Purchase(const CallContext& ctx, uint64_t projectId, const uint160& coreContract)
{
    throw RevertError("Purchase requires NFT ownership");
}

uint64_t MinterSetPriceHolderV5::Purchase(const CallContext& ctx, uint64_t projectId, const uint160& coreContract,
                                          const uint160& ownedNFTAddress, uint64_t ownedNFTTokenId)
{
    ReentrancyGuard::Scope scope(reentrancyGuard_);
    return PurchaseToInternal(ctx, ctx.sender, ProjectKey(coreContract, projectId),
                              ownedNFTAddress, ownedNFTTokenId, uint160());
}

uint64_t MinterSetPriceHolderV5::PurchaseTo(const CallContext& ctx, const uint160& to, uint64_t projectId,
                                            const uint160& coreContract, const uint160& ownedNFTAddress,
                                            uint64_t ownedNFTTokenId, const uint160& vault)
{
    ReentrancyGuard::Scope scope(reentrancyGuard_);
    return PurchaseToInternal(ctx, to, ProjectKey(coreContract, projectId), ownedNFTAddress, ownedNFTTokenId, vault);
}

uint64_t MinterSetPriceHolderV5::PurchaseToInternal(const CallContext& ctx, const uint160& to, const ProjectKey& key,
                                                    const uint160& ownedNFTAddress, uint64_t ownedNFTTokenId,
                                                    const uint160& vault)
{
    maxInvocations_.PreMintChecks(key);
    const CAmount price = prices_.GetPriceRequireConfigured(key);
    Require(ctx.value >= price, "Min value to mint req.");

    const uint160 purchaser = holders_.ResolvePurchaser(ctx.sender, vault, ownedNFTAddress, ownedNFTTokenId,
                                                        chain_.GetContractAs<IDelegationRegistry>(delegationRegistry_));
    Require(holders_.IsAllowlistedNFT(key, ownedNFTAddress, ownedNFTTokenId), "Only allowlisted NFTs");

    BeforeMint(key, ownedNFTAddress, ownedNFTTokenId);

    const uint64_t tokenId = MintAndValidateEffects(to, key, purchaser);

    AfterMint(key, tokenId, ownedNFTAddress, ownedNFTTokenId);

    // Checked after effects
    holders_.ValidateNFTOwnership(ownedNFTAddress, ownedNFTTokenId, purchaser);

    splitFunds_.SplitFundsETHRefundSender(key, price, Core(key.coreContract), ctx);
    return tokenId;
}

SetPriceProjectConfig MinterSetPriceHolderV5::SetPriceProjectConfigOf(uint64_t projectId,
                                                                      const uint160& coreContract) const
{
    return prices_.GetConfig(ProjectKey(coreContract, projectId));
}

// ============================================================================
// MinterSetPricePolyptychV5
// ============================================================================

MinterSetPricePolyptychV5::MinterSetPricePolyptychV5(Chain& chain, const uint160& minterFilter,
                                                     const uint160& delegationRegistry)
    : MinterSetPriceHolderV5(chain, minterFilter, delegationRegistry)
{
    Track(panels_);
}

void MinterSetPricePolyptychV5::IncrementPolyptychProjectPanelId(const CallContext& ctx, uint64_t projectId,
                                                                 const uint160& coreContract)
{
    const ProjectKey key(coreContract, projectId);
    RequireArtist(ctx, key);
    const uint64_t panelId = ++panels_->currentPanelIds[key];

    chain_.EmitEvent(EventLog(address_, "ConfigValueSet")
        .Add("projectId", projectId)
        .Add("coreContract", coreContract)
        .Add("key", "polyptychPanelId")
        .Add("value", panelId));
    LogPrint(MSLog::MINTER, "Polyptych: %s advanced to panel %d\n", key.ToString(), panelId);
}

uint64_t MinterSetPricePolyptychV5::GetCurrentPolyptychPanelId(uint64_t projectId, const uint160& coreContract) const
{
    auto it = panels_->currentPanelIds.find(ProjectKey(coreContract, projectId));
    return it == panels_->currentPanelIds.end() ? 0 : it->second;
}

bool MinterSetPricePolyptychV5::GetPolyptychPanelHashSeedIsMinted(uint64_t projectId, const uint160& coreContract,
                                                                  uint64_t panelId, const uint96& hashSeed) const
{
    auto it = panels_->mintedSeeds.find(ProjectKey(coreContract, projectId));
    if (it == panels_->mintedSeeds.end()) {
        return false;
    }
    return it->second.count(std::make_pair(panelId, hashSeed)) > 0;
}

void MinterSetPricePolyptychV5::BeforeMint(const ProjectKey& key, const uint160& ownedNFTAddress,
                                           uint64_t ownedNFTTokenId)
{
    const uint96 hashSeed = OwnedTokenHashSeed(ownedNFTAddress, ownedNFTTokenId);
    Require(!hashSeed.IsNull(), "Only tokens with hash seed");

    const uint64_t panelId = GetCurrentPolyptychPanelId(key.projectId, key.coreContract);
    const bool inserted = panels_->mintedSeeds[key].insert(std::make_pair(panelId, hashSeed)).second;
    Require(inserted, "Panel already minted");
}

void MinterSetPricePolyptychV5::AfterMint(const ProjectKey& key, uint64_t tokenId, const uint160& ownedNFTAddress,
                                          uint64_t ownedNFTTokenId)
{
    const uint96 hashSeed = OwnedTokenHashSeed(ownedNFTAddress, ownedNFTTokenId);
    IGenArt721Core& core = Core(key.coreContract);
    core.SetTokenHashSeed(Self(), tokenId, hashSeed);
    Require(core.TokenIdToHashSeed(tokenId) == hashSeed, "Unexpected token hash seed");

    LogPrint(MSLog::MINTER, "Polyptych: token %d copied hash seed %s from token %d\n",
             tokenId, hashSeed.GetHex(), ownedNFTTokenId);
}

uint96 MinterSetPricePolyptychV5::OwnedTokenHashSeed(const uint160& ownedNFTAddress, uint64_t ownedNFTTokenId) const
{
    return ContractAt<IGenArt721Core>(ownedNFTAddress, "Only allowlisted NFTs").TokenIdToHashSeed(ownedNFTTokenId);
}

} // namespace mintsuite
