// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_MINTER_DA_H
#define MINTSUITE_MINTER_DA_H

/**
 * @file minter_da.h
 * @brief Dutch auction minters (linear and exponential decay)
 *
 * Artists configure future auctions; the core admin may reset an auction
 * at any time, halting purchases until the artist reconfigures it. The
 * auction minimums are administered through the minter filter's admin ACL.
 *
 * Purchases pay the current auction price, with any excess refunded.
 * Price info reads before the auction starts report the start price.
 */

#include <mintsuite/dutch_auction.h>
#include <mintsuite/minter_base.h>

#include <cstdint>
#include <string>

namespace mintsuite {

// ============================================================================
// MinterDALinV5
// ============================================================================

class MinterDALinV5 : public MinterBase
{
public:
    /** Initial minimum auction length comes from the selected network parameters */
    MinterDALinV5(Chain& chain, const uint160& minterFilter);

    std::string MinterType() const override { return "MinterDALinV5"; }

    PriceInfo GetPriceInfo(uint64_t projectId, const uint160& coreContract) const override;

    /**
     * @brief Artist only; configure a future auction
     * @throws RevertError "Only Artist", "No modifications mid-auction", "Only future auctions",
     *         "Auction length must be at least minimumAuctionLengthSeconds",
     *         "Auction start price must be greater than auction end price"
     */
    void SetAuctionDetails(const CallContext& ctx, uint64_t projectId, const uint160& coreContract,
                           int64_t auctionTimestampStart, int64_t auctionTimestampEnd,
                           const CAmount& startPrice, const CAmount& basePrice);

    /** Core admin only; clear the auction */
    void ResetAuctionDetails(const CallContext& ctx, uint64_t projectId, const uint160& coreContract);

    /** Minter filter admin only */
    void SetMinimumAuctionLengthSeconds(const CallContext& ctx, int64_t minimumAuctionLengthSeconds);

    int64_t MinimumAuctionLengthSeconds() const;

    AuctionParamsLinear ProjectAuctionParameters(uint64_t projectId, const uint160& coreContract) const;

    uint64_t Purchase(const CallContext& ctx, uint64_t projectId, const uint160& coreContract);

    /** @throws RevertError "Only configured auctions", "Auction not yet started", "Min value to mint req." */
    uint64_t PurchaseTo(const CallContext& ctx, const uint160& to, uint64_t projectId, const uint160& coreContract);

private:
    uint64_t PurchaseToInternal(const CallContext& ctx, const uint160& to, const ProjectKey& key);

    DutchAuctionLinear auctions_;
};

// ============================================================================
// MinterDAExpV5
// ============================================================================

class MinterDAExpV5 : public MinterBase
{
public:
    /** Initial minimum half life comes from the selected network parameters */
    MinterDAExpV5(Chain& chain, const uint160& minterFilter);

    std::string MinterType() const override { return "MinterDAExpV5"; }

    PriceInfo GetPriceInfo(uint64_t projectId, const uint160& coreContract) const override;

    /**
     * @brief Artist only; configure a future auction
     * @throws RevertError "Only Artist", "No modifications mid-auction", "Only future auctions",
     *         "Price decay half life must be greater than min allowable value",
     *         "Auction start price must be greater than auction end price"
     */
    void SetAuctionDetails(const CallContext& ctx, uint64_t projectId, const uint160& coreContract,
                           int64_t auctionTimestampStart, int64_t priceDecayHalfLifeSeconds,
                           const CAmount& startPrice, const CAmount& basePrice);

    void ResetAuctionDetails(const CallContext& ctx, uint64_t projectId, const uint160& coreContract);

    /** Minter filter admin only; @throws RevertError "Half life of zero not allowed" */
    void SetMinimumPriceDecayHalfLifeSeconds(const CallContext& ctx, int64_t minimumPriceDecayHalfLifeSeconds);

    int64_t MinimumPriceDecayHalfLifeSeconds() const;

    AuctionParamsExp ProjectAuctionParameters(uint64_t projectId, const uint160& coreContract) const;

    /** Timestamp at which the auction reaches its base price */
    int64_t GetProjectExpAuctionEndTime(uint64_t projectId, const uint160& coreContract) const;

    uint64_t Purchase(const CallContext& ctx, uint64_t projectId, const uint160& coreContract);

    uint64_t PurchaseTo(const CallContext& ctx, const uint160& to, uint64_t projectId, const uint160& coreContract);

private:
    uint64_t PurchaseToInternal(const CallContext& ctx, const uint160& to, const ProjectKey& key);

    DutchAuctionExponential auctions_;
};

} // namespace mintsuite

#endif // MINTSUITE_MINTER_DA_H
