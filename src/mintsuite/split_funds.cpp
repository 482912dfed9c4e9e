// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mintsuite/split_funds.h>

#include <util.h>
#include <utilmoneystr.h>

namespace mintsuite {

SplitFundsAmounts ComputeSplitFunds(const abi::Bytes& raw, bool isEngine, const CAmount& price)
{
    const size_t expectedWords = isEngine ? ENGINE_REVENUE_SPLIT_WORDS : FLAGSHIP_REVENUE_SPLIT_WORDS;
    Require(raw.size() == expectedWords * abi::WORD_SIZE, "Unexpected revenue split bytes");

    // Word layout: render, [platform,] artist, additional payee; each (pct, address)
    size_t word = 0;
    const CAmount renderPct = abi::DecodeUint(raw, word++);
    const uint160 renderAddr = abi::DecodeAddress(raw, word++);
    CAmount platformPct = 0;
    uint160 platformAddr;
    if (isEngine) {
        platformPct = abi::DecodeUint(raw, word++);
        platformAddr = abi::DecodeAddress(raw, word++);
    }
    word++; // artist percentage: the artist always receives the remainder
    const uint160 artistAddr = abi::DecodeAddress(raw, word++);
    const CAmount additionalPct = abi::DecodeUint(raw, word++);
    const uint160 additionalAddr = abi::DecodeAddress(raw, word++);

    Require(renderPct + platformPct <= 100 && additionalPct <= 100, "Unexpected revenue split percentages");

    SplitFundsAmounts amounts;
    amounts.renderProviderAddress = renderAddr;
    amounts.renderProviderRevenue = price * renderPct / 100;
    amounts.platformProviderAddress = platformAddr;
    amounts.platformProviderRevenue = price * platformPct / 100;

    const CAmount remaining = price - amounts.renderProviderRevenue - amounts.platformProviderRevenue;
    amounts.additionalPayeeAddress = additionalAddr;
    amounts.additionalPayeeRevenue = remaining * additionalPct / 100;
    amounts.artistAddress = artistAddr;
    amounts.artistRevenue = remaining - amounts.additionalPayeeRevenue;
    return amounts;
}

SplitFunds::SplitFunds(Chain& chain, const uint160& owner)
    : chain_(chain)
    , owner_(owner)
{
}

// ============================================================================
// Engine detection
// ============================================================================

bool SplitFunds::IsEngineFromRaw(const abi::Bytes& raw)
{
    if (raw.size() == ENGINE_REVENUE_SPLIT_WORDS * abi::WORD_SIZE) {
        return true;
    }
    Require(raw.size() == FLAGSHIP_REVENUE_SPLIT_WORDS * abi::WORD_SIZE, "Unexpected revenue split bytes");
    return false;
}

bool SplitFunds::GetIsEngine(const ProjectKey& key, const IGenArt721Core& core)
{
    IsEngineCache& cache = state_->engineCache[key.coreContract];
    if (cache.isCached) {
        return cache.isEngine;
    }

    cache.isEngine = IsEngineFromRaw(core.GetPrimaryRevenueSplitsRaw(key.projectId));
    cache.isCached = true;
    LogPrint(MSLog::SPLIT, "SplitFunds: Cached %s as %s core\n",
             key.coreContract.ToString(), cache.isEngine ? "engine" : "flagship");
    return cache.isEngine;
}

bool SplitFunds::IsEngineView(const ProjectKey& key, const IGenArt721Core& core) const
{
    const IsEngineCache cache = GetIsEngineCache(key.coreContract);
    if (cache.isCached) {
        return cache.isEngine;
    }
    return IsEngineFromRaw(core.GetPrimaryRevenueSplitsRaw(key.projectId));
}

IsEngineCache SplitFunds::GetIsEngineCache(const uint160& coreContract) const
{
    auto it = state_->engineCache.find(coreContract);
    return it == state_->engineCache.end() ? IsEngineCache() : it->second;
}

// ============================================================================
// Native currency
// ============================================================================

void SplitFunds::SplitFundsETHRefundSender(const ProjectKey& key, const CAmount& price, const IGenArt721Core& core,
                                           const CallContext& ctx)
{
    Require(ctx.value >= price, "Min value to mint req.");
    if (ctx.value == 0) {
        return;
    }

    const CAmount refund = ctx.value - price;
    if (refund > 0) {
        Require(chain_.SendValue(owner_, ctx.sender, refund), "Refund failed");
    }
    if (price == 0) {
        return;
    }

    const bool isEngine = GetIsEngine(key, core);
    const SplitFundsAmounts amounts = ComputeSplitFunds(core.GetPrimaryRevenueSplitsRaw(key.projectId), isEngine, price);

    PayNative(amounts.renderProviderAddress, amounts.renderProviderRevenue, "Render Provider");
    PayNative(amounts.platformProviderAddress, amounts.platformProviderRevenue, "Platform Provider");
    PayNative(amounts.additionalPayeeAddress, amounts.additionalPayeeRevenue, "Additional Payee");
    PayNative(amounts.artistAddress, amounts.artistRevenue, "Artist");

    LogPrint(MSLog::SPLIT, "SplitFunds: %s sold for %s ETH (refund %s, artist %s)\n",
             key.ToString(), FormatMoney(price), FormatMoney(refund), FormatMoney(amounts.artistRevenue));
}

void SplitFunds::PayNative(const uint160& to, const CAmount& amount, const std::string& payee)
{
    if (amount == 0) {
        return;
    }
    Require(chain_.SendValue(owner_, to, amount), payee + " payment failed");
}

// ============================================================================
// ERC20 currency
// ============================================================================

void SplitFunds::UpdateProjectCurrencyInfo(const ProjectKey& key, const std::string& currencySymbol,
                                           const uint160& currencyAddress)
{
    Require(!currencyAddress.IsNull(), "null address, only ERC20");
    Require(!currencySymbol.empty(), "only non-null symbol");

    ProjectCurrencyInfo& info = state_->currencies[key];
    info.currencySymbol = currencySymbol;
    info.currencyAddress = currencyAddress;

    chain_.EmitEvent(EventLog(owner_, "ProjectCurrencyInfoUpdated")
        .Add("projectId", key.projectId)
        .Add("coreContract", key.coreContract)
        .Add("currencyAddress", currencyAddress)
        .Add("currencySymbol", currencySymbol));
    LogPrint(MSLog::SPLIT, "SplitFunds: %s now sold in %s (%s)\n",
             key.ToString(), currencySymbol, currencyAddress.ToString());
}

ProjectCurrencyInfo SplitFunds::GetProjectCurrencyInfo(const ProjectKey& key) const
{
    auto it = state_->currencies.find(key);
    return it == state_->currencies.end() ? ProjectCurrencyInfo() : it->second;
}

bool SplitFunds::IsProjectCurrencyConfigured(const ProjectKey& key) const
{
    return !GetProjectCurrencyInfo(key).currencyAddress.IsNull();
}

void SplitFunds::ValidateERC20Approvals(const uint160& payer, const IERC20& currency, const CAmount& price) const
{
    Require(currency.Allowance(payer, owner_) >= price, "Insufficient ERC20 allowance");
    Require(currency.BalanceOf(payer) >= price, "Insufficient ERC20 balance");
}

void SplitFunds::SplitFundsERC20(const ProjectKey& key, const CAmount& price, const IGenArt721Core& core,
                                 const uint160& payer, IERC20& currency)
{
    if (price == 0) {
        return;
    }

    const bool isEngine = GetIsEngine(key, core);
    const SplitFundsAmounts amounts = ComputeSplitFunds(core.GetPrimaryRevenueSplitsRaw(key.projectId), isEngine, price);

    PayERC20(currency, payer, amounts.renderProviderAddress, amounts.renderProviderRevenue);
    PayERC20(currency, payer, amounts.platformProviderAddress, amounts.platformProviderRevenue);
    PayERC20(currency, payer, amounts.additionalPayeeAddress, amounts.additionalPayeeRevenue);
    PayERC20(currency, payer, amounts.artistAddress, amounts.artistRevenue);

    LogPrint(MSLog::SPLIT, "SplitFunds: %s sold for %s %s (artist %s)\n",
             key.ToString(), FormatMoney(price), currency.Symbol(), FormatMoney(amounts.artistRevenue));
}

void SplitFunds::PayERC20(IERC20& currency, const uint160& payer, const uint160& to, const CAmount& amount)
{
    if (amount == 0) {
        return;
    }
    currency.TransferFrom(CallContext(owner_, CAmount(0)), payer, to, amount);
}

} // namespace mintsuite
