// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mintsuite/dutch_auction.h>

#include <util.h>
#include <utilmoneystr.h>

#include <boost/multiprecision/cpp_int.hpp>

#include <algorithm>
#include <limits>

namespace mintsuite {

using boost::multiprecision::uint512_t;

namespace {

/** Whole half lives until startPrice has decayed to basePrice, 0 when unconfigured */
int64_t HalfLivesToBasePrice(const AuctionParamsExp& params)
{
    if (!params.IsConfigured() || params.startPrice <= params.basePrice) {
        return 0;
    }
    const CAmount range = params.startPrice - params.basePrice;
    return static_cast<int64_t>(boost::multiprecision::msb(range)) + 1;
}

/** Longest half life for which timestampStart + halfLives * halfLife fits in int64_t */
int64_t MaxHalfLifeSeconds(int64_t timestampStart, int64_t halfLives)
{
    return (std::numeric_limits<int64_t>::max() - std::max<int64_t>(timestampStart, 0)) / halfLives;
}

} // anonymous namespace

// ============================================================================
// Pricing
// ============================================================================

CAmount GetPriceLinear(const AuctionParamsLinear& params, int64_t timestamp)
{
    Require(params.IsConfigured(), "Only configured auctions");
    Require(timestamp >= params.timestampStart, "Auction not yet started");

    const int64_t elapsed = timestamp - params.timestampStart;
    const int64_t duration = params.timestampEnd - params.timestampStart;
    if (elapsed >= duration) {
        return params.basePrice;
    }

    const uint512_t range = uint512_t(params.startPrice - params.basePrice);
    const uint512_t decay = range * static_cast<uint64_t>(elapsed) / static_cast<uint64_t>(duration);
    return params.startPrice - CAmount(decay);
}

CAmount GetPriceExp(const AuctionParamsExp& params, int64_t timestamp)
{
    Require(params.IsConfigured(), "Only configured auctions");
    Require(timestamp >= params.timestampStart, "Auction not yet started");

    const int64_t elapsed = timestamp - params.timestampStart;
    const int64_t halfLife = params.priceDecayHalfLifeSeconds;
    const int64_t wholeHalfLives = elapsed / halfLife;
    if (wholeHalfLives >= MAX_HALF_LIVES) {
        return params.basePrice;
    }

    CAmount decayed = (params.startPrice - params.basePrice) >> static_cast<unsigned int>(wholeHalfLives);
    // Partial half life: interpolate linearly towards the next halving
    const uint64_t remainder = static_cast<uint64_t>(elapsed % halfLife);
    const uint512_t correction = uint512_t(decayed) * remainder / static_cast<uint64_t>(halfLife) / 2;
    decayed -= CAmount(correction);
    return params.basePrice + decayed;
}

int64_t GetAuctionEndTimeExp(const AuctionParamsExp& params)
{
    const int64_t halfLives = HalfLivesToBasePrice(params);
    if (halfLives == 0) {
        return params.timestampStart;
    }
    if (params.priceDecayHalfLifeSeconds > MaxHalfLifeSeconds(params.timestampStart, halfLives)) {
        return std::numeric_limits<int64_t>::max();
    }
    return params.timestampStart + halfLives * params.priceDecayHalfLifeSeconds;
}

// ============================================================================
// DutchAuctionLinear
// ============================================================================

DutchAuctionLinear::DutchAuctionLinear(Chain& chain, const uint160& owner, int64_t minimumAuctionLengthSeconds)
    : chain_(chain)
    , owner_(owner)
{
    state_->minimumAuctionLengthSeconds = minimumAuctionLengthSeconds;
}

void DutchAuctionLinear::SetAuctionDetails(const ProjectKey& key, const AuctionParamsLinear& params,
                                           bool maxInvocationsReached)
{
    const int64_t now = chain_.GetBlockTimestamp();
    const AuctionParamsLinear existing = GetAuctionParams(key);
    if (existing.IsConfigured() && now >= existing.timestampStart && now < existing.timestampEnd) {
        Require(maxInvocationsReached, "No modifications mid-auction");
    }

    Require(params.timestampStart > now, "Only future auctions");
    Require(params.timestampEnd > params.timestampStart, "Auction end must be greater than auction start");
    Require(params.timestampEnd - params.timestampStart >= state_->minimumAuctionLengthSeconds,
            "Auction length must be at least minimumAuctionLengthSeconds");
    Require(params.startPrice > params.basePrice, "Auction start price must be greater than auction end price");

    state_->auctions[key] = params;

    chain_.EmitEvent(EventLog(owner_, "SetAuctionDetailsLin")
        .Add("projectId", key.projectId)
        .Add("coreContract", key.coreContract)
        .Add("auctionTimestampStart", params.timestampStart)
        .Add("auctionTimestampEnd", params.timestampEnd)
        .Add("startPrice", params.startPrice)
        .Add("basePrice", params.basePrice));
    LogPrint(MSLog::AUCTION, "DutchAuction: %s linear %d..%d from %s to %s ETH\n",
             key.ToString(), params.timestampStart, params.timestampEnd,
             FormatMoney(params.startPrice), FormatMoney(params.basePrice));
}

void DutchAuctionLinear::ResetAuctionDetails(const ProjectKey& key)
{
    state_->auctions.erase(key);

    chain_.EmitEvent(EventLog(owner_, "ResetAuctionDetails")
        .Add("projectId", key.projectId)
        .Add("coreContract", key.coreContract));
    LogPrint(MSLog::AUCTION, "DutchAuction: %s linear auction reset\n", key.ToString());
}

AuctionParamsLinear DutchAuctionLinear::GetAuctionParams(const ProjectKey& key) const
{
    auto it = state_->auctions.find(key);
    return it == state_->auctions.end() ? AuctionParamsLinear() : it->second;
}

CAmount DutchAuctionLinear::GetPrice(const ProjectKey& key) const
{
    return GetPriceLinear(GetAuctionParams(key), chain_.GetBlockTimestamp());
}

void DutchAuctionLinear::SetMinimumAuctionLengthSeconds(int64_t seconds)
{
    Require(seconds >= 0, "Negative auction length not allowed");
    state_->minimumAuctionLengthSeconds = seconds;

    chain_.EmitEvent(EventLog(owner_, "AuctionMinimumLengthSecondsUpdated")
        .Add("minimumAuctionLengthSeconds", seconds));
    LogPrint(MSLog::AUCTION, "DutchAuction: Minimum auction length set to %d s\n", seconds);
}

// ============================================================================
// DutchAuctionExponential
// ============================================================================

DutchAuctionExponential::DutchAuctionExponential(Chain& chain, const uint160& owner,
                                                 int64_t minimumPriceDecayHalfLifeSeconds)
    : chain_(chain)
    , owner_(owner)
{
    state_->minimumPriceDecayHalfLifeSeconds = minimumPriceDecayHalfLifeSeconds;
}

void DutchAuctionExponential::SetAuctionDetails(const ProjectKey& key, const AuctionParamsExp& params,
                                                bool maxInvocationsReached)
{
    const int64_t now = chain_.GetBlockTimestamp();
    const AuctionParamsExp existing = GetAuctionParams(key);
    if (existing.IsConfigured() && now >= existing.timestampStart &&
        (now - existing.timestampStart) / existing.priceDecayHalfLifeSeconds < HalfLivesToBasePrice(existing)) {
        Require(maxInvocationsReached, "No modifications mid-auction");
    }

    Require(params.timestampStart > now, "Only future auctions");
    Require(params.startPrice > params.basePrice, "Auction start price must be greater than auction end price");
    Require(params.priceDecayHalfLifeSeconds > 0 &&
            params.priceDecayHalfLifeSeconds >= state_->minimumPriceDecayHalfLifeSeconds,
            "Price decay half life must be greater than min allowable value");
    Require(params.priceDecayHalfLifeSeconds <=
            MaxHalfLifeSeconds(params.timestampStart, HalfLivesToBasePrice(params)),
            "Price decay half life too long");

    state_->auctions[key] = params;

    chain_.EmitEvent(EventLog(owner_, "SetAuctionDetailsExp")
        .Add("projectId", key.projectId)
        .Add("coreContract", key.coreContract)
        .Add("auctionTimestampStart", params.timestampStart)
        .Add("priceDecayHalfLifeSeconds", params.priceDecayHalfLifeSeconds)
        .Add("startPrice", params.startPrice)
        .Add("basePrice", params.basePrice));
    LogPrint(MSLog::AUCTION, "DutchAuction: %s exponential from %d, half life %d s, %s to %s ETH\n",
             key.ToString(), params.timestampStart, params.priceDecayHalfLifeSeconds,
             FormatMoney(params.startPrice), FormatMoney(params.basePrice));
}

void DutchAuctionExponential::ResetAuctionDetails(const ProjectKey& key)
{
    state_->auctions.erase(key);

    chain_.EmitEvent(EventLog(owner_, "ResetAuctionDetails")
        .Add("projectId", key.projectId)
        .Add("coreContract", key.coreContract));
    LogPrint(MSLog::AUCTION, "DutchAuction: %s exponential auction reset\n", key.ToString());
}

AuctionParamsExp DutchAuctionExponential::GetAuctionParams(const ProjectKey& key) const
{
    auto it = state_->auctions.find(key);
    return it == state_->auctions.end() ? AuctionParamsExp() : it->second;
}

CAmount DutchAuctionExponential::GetPrice(const ProjectKey& key) const
{
    return GetPriceExp(GetAuctionParams(key), chain_.GetBlockTimestamp());
}

void DutchAuctionExponential::SetMinimumPriceDecayHalfLifeSeconds(int64_t seconds)
{
    Require(seconds > 0, "Half life of zero not allowed");
    state_->minimumPriceDecayHalfLifeSeconds = seconds;

    chain_.EmitEvent(EventLog(owner_, "AuctionMinHalfLifeSecondsUpdated")
        .Add("minimumPriceDecayHalfLifeSeconds", seconds));
    LogPrint(MSLog::AUCTION, "DutchAuction: Minimum half life set to %d s\n", seconds);
}

} // namespace mintsuite
