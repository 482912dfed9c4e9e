// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mintsuite/minter_set_price.h>

#include <util.h>
#include <utilmoneystr.h>

namespace mintsuite {

// ============================================================================
// SetPriceConfigs
// ============================================================================

SetPriceConfigs::SetPriceConfigs(Chain& chain, const uint160& owner)
    : chain_(chain)
    , owner_(owner)
{
}

void SetPriceConfigs::UpdatePricePerTokenInWei(const ProjectKey& key, const CAmount& pricePerTokenInWei)
{
    SetPriceProjectConfig& config = (*configs_)[key];
    config.pricePerTokenInWei = pricePerTokenInWei;
    config.priceIsConfigured = true;

    chain_.EmitEvent(EventLog(owner_, "PricePerTokenInWeiUpdated")
        .Add("projectId", key.projectId)
        .Add("coreContract", key.coreContract)
        .Add("pricePerTokenInWei", pricePerTokenInWei));
    LogPrint(MSLog::MINTER, "SetPrice: %s price set to %s\n", key.ToString(), FormatMoney(pricePerTokenInWei));
}

SetPriceProjectConfig SetPriceConfigs::GetConfig(const ProjectKey& key) const
{
    auto it = configs_->find(key);
    return it == configs_->end() ? SetPriceProjectConfig() : it->second;
}

CAmount SetPriceConfigs::GetPriceRequireConfigured(const ProjectKey& key) const
{
    const SetPriceProjectConfig config = GetConfig(key);
    Require(config.priceIsConfigured, "Price not configured");
    return config.pricePerTokenInWei;
}

// ============================================================================
// MinterSetPriceV5
// ============================================================================

MinterSetPriceV5::MinterSetPriceV5(Chain& chain, const uint160& minterFilter)
    : MinterBase(chain, minterFilter)
    , prices_(chain, address_)
{
    Track(prices_.Journal());
}

PriceInfo MinterSetPriceV5::GetPriceInfo(uint64_t projectId, const uint160& coreContract) const
{
    const SetPriceProjectConfig config = prices_.GetConfig(ProjectKey(coreContract, projectId));

    PriceInfo info;
    info.isConfigured = config.priceIsConfigured;
    info.tokenPriceInWei = config.pricePerTokenInWei;
    return info;
}

void MinterSetPriceV5::UpdatePricePerTokenInWei(const CallContext& ctx, uint64_t projectId,
                                                const uint160& coreContract, const CAmount& pricePerTokenInWei)
{
    const ProjectKey key(coreContract, projectId);
    RequireArtist(ctx, key);
    prices_.UpdatePricePerTokenInWei(key, pricePerTokenInWei);
    maxInvocations_.RefreshMaxInvocations(key, Core(coreContract));
}

uint64_t MinterSetPriceV5::Purchase(const CallContext& ctx, uint64_t projectId, const uint160& coreContract)
{
    ReentrancyGuard::Scope scope(reentrancyGuard_);
    return PurchaseToInternal(ctx, ctx.sender, ProjectKey(coreContract, projectId));
}

uint64_t MinterSetPriceV5::PurchaseTo(const CallContext& ctx, const uint160& to, uint64_t projectId,
                                      const uint160& coreContract)
{
    ReentrancyGuard::Scope scope(reentrancyGuard_);
    return PurchaseToInternal(ctx, to, ProjectKey(coreContract, projectId));
}

uint64_t MinterSetPriceV5::PurchaseToInternal(const CallContext& ctx, const uint160& to, const ProjectKey& key)
{
    maxInvocations_.PreMintChecks(key);
    const CAmount price = prices_.GetPriceRequireConfigured(key);
    Require(ctx.value >= price, "Min value to mint req.");

    const uint64_t tokenId = MintAndValidateEffects(to, key, ctx.sender);

    splitFunds_.SplitFundsETHRefundSender(key, price, Core(key.coreContract), ctx);
    return tokenId;
}

SetPriceProjectConfig MinterSetPriceV5::SetPriceProjectConfigOf(uint64_t projectId, const uint160& coreContract) const
{
    return prices_.GetConfig(ProjectKey(coreContract, projectId));
}

} // namespace mintsuite
