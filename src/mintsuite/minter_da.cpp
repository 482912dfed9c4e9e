// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mintsuite/minter_da.h>

#include <mintsuite/mintsuite_params.h>
#include <util.h>

namespace mintsuite {

// ============================================================================
// MinterDALinV5
// ============================================================================

MinterDALinV5::MinterDALinV5(Chain& chain, const uint160& minterFilter)
    : MinterBase(chain, minterFilter)
    , auctions_(chain, address_, GetMintSuiteParams().nMinAuctionLengthSeconds)
{
    Track(auctions_.Journal());
}

PriceInfo MinterDALinV5::GetPriceInfo(uint64_t projectId, const uint160& coreContract) const
{
    const AuctionParamsLinear params = auctions_.GetAuctionParams(ProjectKey(coreContract, projectId));

    PriceInfo info;
    info.isConfigured = params.IsConfigured();
    if (!info.isConfigured) {
        return info;
    }
    const int64_t now = chain_.GetBlockTimestamp();
    info.tokenPriceInWei = (now < params.timestampStart) ? params.startPrice : GetPriceLinear(params, now);
    return info;
}

void MinterDALinV5::SetAuctionDetails(const CallContext& ctx, uint64_t projectId, const uint160& coreContract,
                                      int64_t auctionTimestampStart, int64_t auctionTimestampEnd,
                                      const CAmount& startPrice, const CAmount& basePrice)
{
    const ProjectKey key(coreContract, projectId);
    RequireArtist(ctx, key);
    const IGenArt721Core& core = Core(coreContract);

    AuctionParamsLinear params;
    params.timestampStart = auctionTimestampStart;
    params.timestampEnd = auctionTimestampEnd;
    params.startPrice = startPrice;
    params.basePrice = basePrice;
    auctions_.SetAuctionDetails(key, params, maxInvocations_.ProjectMaxHasBeenInvokedSafe(key, core));

    maxInvocations_.RefreshMaxInvocations(key, core);
}

void MinterDALinV5::ResetAuctionDetails(const CallContext& ctx, uint64_t projectId, const uint160& coreContract)
{
    RequireCoreAdminACL(ctx, coreContract, "resetAuctionDetails");
    auctions_.ResetAuctionDetails(ProjectKey(coreContract, projectId));
}

void MinterDALinV5::SetMinimumAuctionLengthSeconds(const CallContext& ctx, int64_t minimumAuctionLengthSeconds)
{
    RequireMinterFilterAdminACL(ctx, "setMinimumAuctionLengthSeconds");
    auctions_.SetMinimumAuctionLengthSeconds(minimumAuctionLengthSeconds);
}

int64_t MinterDALinV5::MinimumAuctionLengthSeconds() const
{
    return auctions_.MinimumAuctionLengthSeconds();
}

AuctionParamsLinear MinterDALinV5::ProjectAuctionParameters(uint64_t projectId, const uint160& coreContract) const
{
    return auctions_.GetAuctionParams(ProjectKey(coreContract, projectId));
}

uint64_t MinterDALinV5::Purchase(const CallContext& ctx, uint64_t projectId, const uint160& coreContract)
{
    ReentrancyGuard::Scope scope(reentrancyGuard_);
    return PurchaseToInternal(ctx, ctx.sender, ProjectKey(coreContract, projectId));
}

uint64_t MinterDALinV5::PurchaseTo(const CallContext& ctx, const uint160& to, uint64_t projectId,
                                   const uint160& coreContract)
{
    ReentrancyGuard::Scope scope(reentrancyGuard_);
    return PurchaseToInternal(ctx, to, ProjectKey(coreContract, projectId));
}

uint64_t MinterDALinV5::PurchaseToInternal(const CallContext& ctx, const uint160& to, const ProjectKey& key)
{
    maxInvocations_.PreMintChecks(key);
    const CAmount price = auctions_.GetPrice(key);
    Require(ctx.value >= price, "Min value to mint req.");

    const uint64_t tokenId = MintAndValidateEffects(to, key, ctx.sender);

    splitFunds_.SplitFundsETHRefundSender(key, price, Core(key.coreContract), ctx);
    return tokenId;
}

// ============================================================================
// MinterDAExpV5
// ============================================================================

MinterDAExpV5::MinterDAExpV5(Chain& chain, const uint160& minterFilter)
    : MinterBase(chain, minterFilter)
    , auctions_(chain, address_, GetMintSuiteParams().nMinPriceDecayHalfLifeSeconds)
{
    Track(auctions_.Journal());
}

PriceInfo MinterDAExpV5::GetPriceInfo(uint64_t projectId, const uint160& coreContract) const
{
    const AuctionParamsExp params = auctions_.GetAuctionParams(ProjectKey(coreContract, projectId));

    PriceInfo info;
    info.isConfigured = params.IsConfigured();
    if (!info.isConfigured) {
        return info;
    }
    const int64_t now = chain_.GetBlockTimestamp();
    info.tokenPriceInWei = (now < params.timestampStart) ? params.startPrice : GetPriceExp(params, now);
    return info;
}

void MinterDAExpV5::SetAuctionDetails(const CallContext& ctx, uint64_t projectId, const uint160& coreContract,
                                      int64_t auctionTimestampStart, int64_t priceDecayHalfLifeSeconds,
                                      const CAmount& startPrice, const CAmount& basePrice)
{
    const ProjectKey key(coreContract, projectId);
    RequireArtist(ctx, key);
    const IGenArt721Core& core = Core(coreContract);

    AuctionParamsExp params;
    params.timestampStart = auctionTimestampStart;
    params.priceDecayHalfLifeSeconds = priceDecayHalfLifeSeconds;
    params.startPrice = startPrice;
    params.basePrice = basePrice;
    auctions_.SetAuctionDetails(key, params, maxInvocations_.ProjectMaxHasBeenInvokedSafe(key, core));

    maxInvocations_.RefreshMaxInvocations(key, core);
}

void MinterDAExpV5::ResetAuctionDetails(const CallContext& ctx, uint64_t projectId, const uint160& coreContract)
{
    RequireCoreAdminACL(ctx, coreContract, "resetAuctionDetails");
    auctions_.ResetAuctionDetails(ProjectKey(coreContract, projectId));
}

void MinterDAExpV5::SetMinimumPriceDecayHalfLifeSeconds(const CallContext& ctx,
                                                        int64_t minimumPriceDecayHalfLifeSeconds)
{
    RequireMinterFilterAdminACL(ctx, "setMinimumPriceDecayHalfLifeSeconds");
    auctions_.SetMinimumPriceDecayHalfLifeSeconds(minimumPriceDecayHalfLifeSeconds);
}

int64_t MinterDAExpV5::MinimumPriceDecayHalfLifeSeconds() const
{
    return auctions_.MinimumPriceDecayHalfLifeSeconds();
}

AuctionParamsExp MinterDAExpV5::ProjectAuctionParameters(uint64_t projectId, const uint160& coreContract) const
{
    return auctions_.GetAuctionParams(ProjectKey(coreContract, projectId));
}

int64_t MinterDAExpV5::GetProjectExpAuctionEndTime(uint64_t projectId, const uint160& coreContract) const
{
    const AuctionParamsExp params = auctions_.GetAuctionParams(ProjectKey(coreContract, projectId));
    Require(params.IsConfigured(), "Only configured auctions");
    return GetAuctionEndTimeExp(params);
}

uint64_t MinterDAExpV5::Purchase(const CallContext& ctx, uint64_t projectId, const uint160& coreContract)
{
    ReentrancyGuard::Scope scope(reentrancyGuard_);
    return PurchaseToInternal(ctx, ctx.sender, ProjectKey(coreContract, projectId));
}

uint64_t MinterDAExpV5::PurchaseTo(const CallContext& ctx, const uint160& to, uint64_t projectId,
                                   const uint160& coreContract)
{
    ReentrancyGuard::Scope scope(reentrancyGuard_);
    return PurchaseToInternal(ctx, to, ProjectKey(coreContract, projectId));
}

uint64_t MinterDAExpV5::PurchaseToInternal(const CallContext& ctx, const uint160& to, const ProjectKey& key)
{
    maxInvocations_.PreMintChecks(key);
    const CAmount price = auctions_.GetPrice(key);
    Require(ctx.value >= price, "Min value to mint req.");

    const uint64_t tokenId = MintAndValidateEffects(to, key, ctx.sender);

    splitFunds_.SplitFundsETHRefundSender(key, price, Core(key.coreContract), ctx);
    return tokenId;
}

} // namespace mintsuite
