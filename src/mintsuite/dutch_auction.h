// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_DUTCH_AUCTION_H
#define MINTSUITE_DUTCH_AUCTION_H

/**
 * @file dutch_auction.h
 * @brief Linear and exponential Dutch auction pricing
 *
 * Linear auctions interpolate from startPrice at timestampStart down to
 * basePrice at timestampEnd, then stay at basePrice.
 *
 * Exponential auctions halve the distance to basePrice every
 * priceDecayHalfLifeSeconds. Whole half lives are applied as a right shift
 * and the partial half life as a linear interpolation towards the next
 * halving, so the curve is piecewise linear and computed in integers.
 * After MAX_HALF_LIVES whole half lives the price is basePrice.
 *
 * Auction state is per (core contract, project). Configuration while an
 * auction is running is refused unless the project has sold out.
 */

#include <mintsuite/chain.h>
#include <mintsuite/mintsuite_common.h>

#include <cstdint>
#include <map>

namespace mintsuite {

/** Whole half lives after which an exponential auction is at its base price */
static constexpr int64_t MAX_HALF_LIVES = 256;

// ============================================================================
// Auction parameters
// ============================================================================

struct AuctionParamsLinear {
    int64_t timestampStart;
    int64_t timestampEnd;
    CAmount startPrice;
    CAmount basePrice;

    AuctionParamsLinear()
        : timestampStart(0)
        , timestampEnd(0)
        , startPrice(0)
        , basePrice(0) {}

    bool IsConfigured() const { return startPrice > 0; }
};

struct AuctionParamsExp {
    int64_t timestampStart;
    int64_t priceDecayHalfLifeSeconds;
    CAmount startPrice;
    CAmount basePrice;

    AuctionParamsExp()
        : timestampStart(0)
        , priceDecayHalfLifeSeconds(0)
        , startPrice(0)
        , basePrice(0) {}

    bool IsConfigured() const { return startPrice > 0; }
};

// ============================================================================
// Pricing
// ============================================================================

/**
 * @brief Price of a linear auction at timestamp
 * @throws RevertError "Only configured auctions", "Auction not yet started"
 */
CAmount GetPriceLinear(const AuctionParamsLinear& params, int64_t timestamp);

/**
 * @brief Price of an exponential auction at timestamp
 * @throws RevertError "Only configured auctions", "Auction not yet started"
 */
CAmount GetPriceExp(const AuctionParamsExp& params, int64_t timestamp);

/**
 * @brief First timestamp at which an exponential auction reaches its base price
 *
 * The decayed distance start - base reaches zero after as many whole half
 * lives as it has significant bits. Saturates at the largest int64_t.
 */
int64_t GetAuctionEndTimeExp(const AuctionParamsExp& params);

// ============================================================================
// DutchAuctionLinear
// ============================================================================

class DutchAuctionLinear
{
public:
    /**
     * @param chain Hosting ledger
     * @param owner Address of the owning minter, the emitter of events
     * @param minimumAuctionLengthSeconds Initial minimum auction length
     */
    DutchAuctionLinear(Chain& chain, const uint160& owner, int64_t minimumAuctionLengthSeconds);

    /** Journal holding auction state, to be tracked by the owning contract */
    StateJournal& Journal() { return state_; }

    /**
     * @brief Configure a project's auction
     *
     * The caller is responsible for the artist check.
     *
     * @param key Project
     * @param params New parameters
     * @param maxInvocationsReached Whether the project has sold out, which
     *        allows reconfiguration of a running auction
     */
    void SetAuctionDetails(const ProjectKey& key, const AuctionParamsLinear& params, bool maxInvocationsReached);

    /** Clear a project's auction, halting purchases until reconfigured */
    void ResetAuctionDetails(const ProjectKey& key);

    AuctionParamsLinear GetAuctionParams(const ProjectKey& key) const;

    /** Current price, reverting for unconfigured or unstarted auctions */
    CAmount GetPrice(const ProjectKey& key) const;

    int64_t MinimumAuctionLengthSeconds() const { return state_->minimumAuctionLengthSeconds; }

    /** @throws RevertError "Negative auction length not allowed" */
    void SetMinimumAuctionLengthSeconds(int64_t seconds);

private:
    struct State {
        int64_t minimumAuctionLengthSeconds;
        std::map<ProjectKey, AuctionParamsLinear> auctions;

        State() : minimumAuctionLengthSeconds(0) {}
    };

    Chain& chain_;
    const uint160 owner_;
    Snapshotted<State> state_;
};

// ============================================================================
// DutchAuctionExponential
// ============================================================================

class DutchAuctionExponential
{
public:
    /**
     * @param chain Hosting ledger
     * @param owner Address of the owning minter, the emitter of events
     * @param minimumPriceDecayHalfLifeSeconds Initial minimum half life
     */
    DutchAuctionExponential(Chain& chain, const uint160& owner, int64_t minimumPriceDecayHalfLifeSeconds);

    StateJournal& Journal() { return state_; }

    /** @see DutchAuctionLinear::SetAuctionDetails */
    void SetAuctionDetails(const ProjectKey& key, const AuctionParamsExp& params, bool maxInvocationsReached);

    void ResetAuctionDetails(const ProjectKey& key);

    AuctionParamsExp GetAuctionParams(const ProjectKey& key) const;

    CAmount GetPrice(const ProjectKey& key) const;

    int64_t MinimumPriceDecayHalfLifeSeconds() const { return state_->minimumPriceDecayHalfLifeSeconds; }

    /** @throws RevertError "Half life of zero not allowed" */
    void SetMinimumPriceDecayHalfLifeSeconds(int64_t seconds);

private:
    struct State {
        int64_t minimumPriceDecayHalfLifeSeconds;
        std::map<ProjectKey, AuctionParamsExp> auctions;

        State() : minimumPriceDecayHalfLifeSeconds(0) {}
    };

    Chain& chain_;
    const uint160 owner_;
    Snapshotted<State> state_;
};

} // namespace mintsuite

#endif // MINTSUITE_DUTCH_AUCTION_H
