// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file dutch_auction_tests.cpp
 * @brief Tests for linear and exponential Dutch auction pricing and configuration
 */

#include <test/test_mintsuite.h>

#include <mintsuite/dutch_auction.h>

#include <boost/test/unit_test.hpp>

#include <limits>

using namespace mintsuite;

namespace {

AuctionParamsLinear MakeLinear(int64_t start, int64_t end, const CAmount& startPrice, const CAmount& basePrice)
{
    AuctionParamsLinear params;
    params.timestampStart = start;
    params.timestampEnd = end;
    params.startPrice = startPrice;
    params.basePrice = basePrice;
    return params;
}

AuctionParamsExp MakeExp(int64_t start, int64_t halfLife, const CAmount& startPrice, const CAmount& basePrice)
{
    AuctionParamsExp params;
    params.timestampStart = start;
    params.priceDecayHalfLifeSeconds = halfLife;
    params.startPrice = startPrice;
    params.basePrice = basePrice;
    return params;
}

bool HasReason(const RevertError& e, const std::string& reason)
{
    return std::string(e.what()) == reason;
}

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(dutch_auction_tests, BasicTestingSetup)

// ============================================================================
// Pricing
// ============================================================================

BOOST_AUTO_TEST_CASE(linear_price_curve)
{
    const AuctionParamsLinear params = MakeLinear(1000, 2000, ETHER, ETHER / 10);

    BOOST_CHECK(GetPriceLinear(params, 1000) == ETHER);
    BOOST_CHECK(GetPriceLinear(params, 1500) == ETHER * 55 / 100);
    BOOST_CHECK(GetPriceLinear(params, 2000) == ETHER / 10);
    BOOST_CHECK(GetPriceLinear(params, 2500) == ETHER / 10);

    BOOST_CHECK_EXCEPTION(GetPriceLinear(params, 999), RevertError,
                          [](const RevertError& e) { return HasReason(e, "Auction not yet started"); });
    BOOST_CHECK_EXCEPTION(GetPriceLinear(AuctionParamsLinear(), 1500), RevertError,
                          [](const RevertError& e) { return HasReason(e, "Only configured auctions"); });
}

BOOST_AUTO_TEST_CASE(linear_price_never_increases)
{
    const AuctionParamsLinear params = MakeLinear(0, 7, 1000, 3);
    CAmount previous = GetPriceLinear(params, 0);
    for (int64_t t = 1; t <= 10; t++) {
        const CAmount price = GetPriceLinear(params, t);
        BOOST_CHECK(price <= previous);
        BOOST_CHECK(price >= 3);
        previous = price;
    }
}

BOOST_AUTO_TEST_CASE(exponential_price_curve)
{
    const AuctionParamsExp params = MakeExp(1000, 600, ETHER, 0);

    BOOST_CHECK(GetPriceExp(params, 1000) == ETHER);
    BOOST_CHECK(GetPriceExp(params, 1600) == ETHER / 2);
    BOOST_CHECK(GetPriceExp(params, 2200) == ETHER / 4);
    // Halfway through the second half life: linear between 0.5 and 0.25
    BOOST_CHECK(GetPriceExp(params, 1900) == ETHER * 375 / 1000);

    BOOST_CHECK_EXCEPTION(GetPriceExp(params, 999), RevertError,
                          [](const RevertError& e) { return HasReason(e, "Auction not yet started"); });
}

BOOST_AUTO_TEST_CASE(exponential_price_never_increases)
{
    const int64_t halfLives[] = {1, 2, 3, 7, 60, 61};
    const CAmount basePrices[] = {0, ETHER / 20, ETHER - 3};
    for (const int64_t halfLife : halfLives) {
        for (const CAmount& basePrice : basePrices) {
            const AuctionParamsExp params = MakeExp(1000, halfLife, ETHER, basePrice);
            const int64_t end = GetAuctionEndTimeExp(params);
            CAmount previous = GetPriceExp(params, 1000);
            BOOST_CHECK(previous == ETHER);
            for (int64_t t = 1001; t <= end + 2 * halfLife; t++) {
                const CAmount price = GetPriceExp(params, t);
                BOOST_CHECK(price <= previous);
                BOOST_CHECK(price >= basePrice);
                BOOST_CHECK(price <= ETHER);
                if ((t - 1000) % halfLife == 0) {
                    // Whole half lives land exactly on the halved distance
                    const unsigned int halvings = static_cast<unsigned int>((t - 1000) / halfLife);
                    BOOST_CHECK(price == basePrice + ((ETHER - basePrice) >> halvings));
                }
                previous = price;
            }
            BOOST_CHECK(previous == basePrice);
        }
    }
}

BOOST_AUTO_TEST_CASE(exponential_price_reaches_base)
{
    const AuctionParamsExp params = MakeExp(0, 60, ETHER, ETHER / 20);
    const int64_t end = GetAuctionEndTimeExp(params);

    // 0.95 ETH needs 60 bits
    BOOST_CHECK_EQUAL(end, 60 * 60);
    BOOST_CHECK(GetPriceExp(params, end) == ETHER / 20);
    BOOST_CHECK(GetPriceExp(params, end - 60) > ETHER / 20);
    BOOST_CHECK(GetPriceExp(params, MAX_HALF_LIVES * 60) == ETHER / 20);

    BOOST_CHECK_EQUAL(GetAuctionEndTimeExp(AuctionParamsExp()), 0);
}

// ============================================================================
// Linear configuration
// ============================================================================

BOOST_AUTO_TEST_CASE(linear_configuration_rules)
{
    Chain chain;
    const uint160 owner = chain.NewAddress();
    const ProjectKey key(chain.NewAddress(), 0);
    DutchAuctionLinear auctions(chain, owner, 600);
    chain.SetBlockTimestamp(100);

    BOOST_CHECK_EXCEPTION(auctions.SetAuctionDetails(key, MakeLinear(100, 1000, ETHER, 0), false), RevertError,
                          [](const RevertError& e) { return HasReason(e, "Only future auctions"); });
    BOOST_CHECK_EXCEPTION(auctions.SetAuctionDetails(key, MakeLinear(200, 200, ETHER, 0), false), RevertError,
                          [](const RevertError& e) {
                              return HasReason(e, "Auction end must be greater than auction start");
                          });
    BOOST_CHECK_EXCEPTION(auctions.SetAuctionDetails(key, MakeLinear(200, 700, ETHER, 0), false), RevertError,
                          [](const RevertError& e) {
                              return HasReason(e, "Auction length must be at least minimumAuctionLengthSeconds");
                          });
    BOOST_CHECK_EXCEPTION(auctions.SetAuctionDetails(key, MakeLinear(200, 800, ETHER, ETHER), false), RevertError,
                          [](const RevertError& e) {
                              return HasReason(e, "Auction start price must be greater than auction end price");
                          });

    auctions.SetAuctionDetails(key, MakeLinear(200, 800, ETHER, 0), false);
    BOOST_CHECK_EQUAL(auctions.GetAuctionParams(key).timestampEnd, 800);
    BOOST_CHECK_EQUAL(chain.GetEvents("SetAuctionDetailsLin").size(), 1U);

    // Running auctions are locked unless sold out
    chain.SetBlockTimestamp(300);
    BOOST_CHECK(auctions.GetPrice(key) == ETHER - ETHER / 6);
    BOOST_CHECK_EXCEPTION(auctions.SetAuctionDetails(key, MakeLinear(400, 1000, ETHER, 0), false), RevertError,
                          [](const RevertError& e) { return HasReason(e, "No modifications mid-auction"); });
    auctions.SetAuctionDetails(key, MakeLinear(400, 1000, ETHER, 0), true);

    auctions.ResetAuctionDetails(key);
    BOOST_CHECK(!auctions.GetAuctionParams(key).IsConfigured());
    BOOST_CHECK_THROW(auctions.GetPrice(key), RevertError);

    BOOST_CHECK_EXCEPTION(auctions.SetMinimumAuctionLengthSeconds(-1), RevertError,
                          [](const RevertError& e) { return HasReason(e, "Negative auction length not allowed"); });
    BOOST_CHECK_EQUAL(auctions.MinimumAuctionLengthSeconds(), 600);
    auctions.SetMinimumAuctionLengthSeconds(60);
    BOOST_CHECK_EQUAL(auctions.MinimumAuctionLengthSeconds(), 60);
    auctions.SetAuctionDetails(key, MakeLinear(400, 460, ETHER, 0), false);
}

// ============================================================================
// Exponential configuration
// ============================================================================

BOOST_AUTO_TEST_CASE(exponential_configuration_rules)
{
    Chain chain;
    const uint160 owner = chain.NewAddress();
    const ProjectKey key(chain.NewAddress(), 0);
    DutchAuctionExponential auctions(chain, owner, 45);
    chain.SetBlockTimestamp(100);

    BOOST_CHECK_EXCEPTION(auctions.SetAuctionDetails(key, MakeExp(200, 30, ETHER, 0), false), RevertError,
                          [](const RevertError& e) {
                              return HasReason(e, "Price decay half life must be greater than min allowable value");
                          });
    BOOST_CHECK_EXCEPTION(auctions.SetAuctionDetails(key, MakeExp(50, 60, ETHER, 0), false), RevertError,
                          [](const RevertError& e) { return HasReason(e, "Only future auctions"); });

    auctions.SetAuctionDetails(key, MakeExp(200, 60, ETHER, ETHER / 2), false);
    chain.SetBlockTimestamp(260);
    BOOST_CHECK(auctions.GetPrice(key) == ETHER * 3 / 4);
    BOOST_CHECK_EXCEPTION(auctions.SetAuctionDetails(key, MakeExp(300, 60, ETHER, 0), false), RevertError,
                          [](const RevertError& e) { return HasReason(e, "No modifications mid-auction"); });

    // Past the end time the auction may be reconfigured
    chain.SetBlockTimestamp(GetAuctionEndTimeExp(auctions.GetAuctionParams(key)));
    auctions.SetAuctionDetails(key, MakeExp(chain.GetBlockTimestamp() + 1, 60, ETHER, 0), false);

    BOOST_CHECK_EXCEPTION(auctions.SetMinimumPriceDecayHalfLifeSeconds(0), RevertError,
                          [](const RevertError& e) { return HasReason(e, "Half life of zero not allowed"); });
    auctions.SetMinimumPriceDecayHalfLifeSeconds(10);
    BOOST_CHECK_EQUAL(auctions.MinimumPriceDecayHalfLifeSeconds(), 10);
}

BOOST_AUTO_TEST_CASE(exponential_long_half_life)
{
    Chain chain;
    const uint160 owner = chain.NewAddress();
    const ProjectKey key(chain.NewAddress(), 0);
    DutchAuctionExponential auctions(chain, owner, 45);
    chain.SetBlockTimestamp(100);
    const int64_t maxTimestamp = std::numeric_limits<int64_t>::max();

    // 2 ETH takes 61 half lives to decay, which would end past the largest timestamp
    const AuctionParamsExp tooLong = MakeExp(1000, maxTimestamp / 8, 2 * ETHER, 0);
    BOOST_CHECK_EQUAL(GetAuctionEndTimeExp(tooLong), maxTimestamp);
    BOOST_CHECK_EXCEPTION(auctions.SetAuctionDetails(key, tooLong, false), RevertError,
                          [](const RevertError& e) { return HasReason(e, "Price decay half life too long"); });

    // 1000 wei takes 10 half lives
    const int64_t halfLife = maxTimestamp / 64;
    auctions.SetAuctionDetails(key, MakeExp(1000, halfLife, 1000, 0), false);
    BOOST_CHECK_EQUAL(GetAuctionEndTimeExp(auctions.GetAuctionParams(key)), 1000 + 10 * halfLife);

    chain.SetBlockTimestamp(2000);
    BOOST_CHECK(auctions.GetPrice(key) == 1000);
    BOOST_CHECK_EXCEPTION(auctions.SetAuctionDetails(key, MakeExp(3000, 60, ETHER, 0), false), RevertError,
                          [](const RevertError& e) { return HasReason(e, "No modifications mid-auction"); });
    BOOST_CHECK_EQUAL(auctions.GetAuctionParams(key).priceDecayHalfLifeSeconds, halfLife);

    // Sold out auctions may still be replaced
    auctions.SetAuctionDetails(key, MakeExp(3000, 60, ETHER, 0), true);
    BOOST_CHECK_EQUAL(auctions.GetAuctionParams(key).priceDecayHalfLifeSeconds, 60);
}

BOOST_AUTO_TEST_SUITE_END()
