// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mintsuite/minter_set_price_erc20.h>

#include <util.h>

namespace mintsuite {

MinterSetPriceERC20V5::MinterSetPriceERC20V5(Chain& chain, const uint160& minterFilter)
    : MinterBase(chain, minterFilter)
    , prices_(chain, address_)
{
    Track(prices_.Journal());
}

PriceInfo MinterSetPriceERC20V5::GetPriceInfo(uint64_t projectId, const uint160& coreContract) const
{
    const ProjectKey key(coreContract, projectId);
    const SetPriceProjectConfig config = prices_.GetConfig(key);
    const ProjectCurrencyInfo currency = splitFunds_.GetProjectCurrencyInfo(key);

    PriceInfo info;
    info.isConfigured = config.priceIsConfigured && !currency.currencyAddress.IsNull();
    info.tokenPriceInWei = config.pricePerTokenInWei;
    info.currencySymbol = currency.currencySymbol;
    info.currencyAddress = currency.currencyAddress;
    return info;
}

void MinterSetPriceERC20V5::UpdatePricePerTokenInWei(const CallContext& ctx, uint64_t projectId,
                                                     const uint160& coreContract, const CAmount& pricePerTokenInWei)
{
    const ProjectKey key(coreContract, projectId);
    RequireArtist(ctx, key);
    prices_.UpdatePricePerTokenInWei(key, pricePerTokenInWei);
    maxInvocations_.RefreshMaxInvocations(key, Core(coreContract));
}

void MinterSetPriceERC20V5::UpdateProjectCurrencyInfo(const CallContext& ctx, uint64_t projectId,
                                                      const uint160& coreContract, const std::string& currencySymbol,
                                                      const uint160& currencyAddress)
{
    const ProjectKey key(coreContract, projectId);
    RequireArtist(ctx, key);
    splitFunds_.UpdateProjectCurrencyInfo(key, currencySymbol, currencyAddress);
}

uint64_t MinterSetPriceERC20V5::Purchase(const CallContext& ctx, uint64_t projectId, const uint160& coreContract,
                                         const CAmount& maxPricePerToken, const uint160& currencyAddress)
{
    ReentrancyGuard::Scope scope(reentrancyGuard_);
    return PurchaseToInternal(ctx, ctx.sender, ProjectKey(coreContract, projectId), maxPricePerToken, currencyAddress);
}

uint64_t MinterSetPriceERC20V5::PurchaseTo(const CallContext& ctx, const uint160& to, uint64_t projectId,
                                           const uint160& coreContract, const CAmount& maxPricePerToken,
                                           const uint160& currencyAddress)
{
    ReentrancyGuard::Scope scope(reentrancyGuard_);
    return PurchaseToInternal(ctx, to, ProjectKey(coreContract, projectId), maxPricePerToken, currencyAddress);
}

uint64_t MinterSetPriceERC20V5::PurchaseToInternal(const CallContext& ctx, const uint160& to, const ProjectKey& key,
                                                   const CAmount& maxPricePerToken, const uint160& currencyAddress)
{
    maxInvocations_.PreMintChecks(key);
    const CAmount price = prices_.GetPriceRequireConfigured(key);

    Require(ctx.value == 0, "ERC20: No ETH when using ERC20");
    Require(splitFunds_.IsProjectCurrencyConfigured(key), "ERC20: payment not configured");
    Require(splitFunds_.GetProjectCurrencyInfo(key).currencyAddress == currencyAddress, "Currency addresses must match");
    Require(maxPricePerToken >= price, "Only max price gte token price");

    IERC20& currency = ProjectCurrency(key);
    splitFunds_.ValidateERC20Approvals(ctx.sender, currency, price);

    const uint64_t tokenId = MintAndValidateEffects(to, key, ctx.sender);

    splitFunds_.SplitFundsERC20(key, price, Core(key.coreContract), ctx.sender, currency);
    return tokenId;
}

ProjectCurrencyInfo MinterSetPriceERC20V5::GetProjectCurrencyInfo(uint64_t projectId, const uint160& coreContract) const
{
    return splitFunds_.GetProjectCurrencyInfo(ProjectKey(coreContract, projectId));
}

CAmount MinterSetPriceERC20V5::GetYourBalanceOfProjectERC20(uint64_t projectId, const uint160& coreContract,
                                                            const uint160& account) const
{
    return ProjectCurrency(ProjectKey(coreContract, projectId)).BalanceOf(account);
}

CAmount MinterSetPriceERC20V5::CheckYourAllowanceOfProjectERC20(uint64_t projectId, const uint160& coreContract,
                                                                const uint160& account) const
{
    return ProjectCurrency(ProjectKey(coreContract, projectId)).Allowance(account, address_);
}

IERC20& MinterSetPriceERC20V5::ProjectCurrency(const ProjectKey& key) const
{
    return ContractAt<IERC20>(splitFunds_.GetProjectCurrencyInfo(key).currencyAddress, "ERC20: payment not configured");
}

} // namespace mintsuite
