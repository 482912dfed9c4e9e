// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file max_invocations_tests.cpp
 * @brief Tests for the per-minter max-invocations cache
 */

#include <test/test_mintsuite.h>

#include <mintsuite/max_invocations.h>

#include <boost/test/unit_test.hpp>

using namespace mintsuite;

namespace {

struct MaxInvocationsSetup : public MintSuiteTestingSetup {
    MinterSetPriceV5 minter;
    uint64_t projectId;

    MaxInvocationsSetup()
        : minter(chain, minterFilter.GetAddress())
        , projectId(AddProject(flagshipCore, artist))
    {
        SetMinterForProject(flagshipCore, projectId, minter.GetAddress());
        ExecuteOk(artist, [&](const CallContext& ctx) {
            minter.UpdatePricePerTokenInWei(ctx, projectId, flagshipCore.GetAddress(), 0);
        });
        chain.ClearEvents();
    }

    TxResult TryPurchase(const uint160& from)
    {
        return chain.Execute(from, [&](const CallContext& ctx) {
            minter.Purchase(ctx, projectId, flagshipCore.GetAddress());
        });
    }

    void LimitOnCore(uint64_t maxInvocations)
    {
        ExecuteOk(artist, [&](const CallContext& ctx) {
            flagshipCore.UpdateProjectMaxInvocations(ctx, projectId, maxInvocations);
        });
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(max_invocations_tests, MaxInvocationsSetup)

BOOST_AUTO_TEST_CASE(first_price_configuration_syncs_core_cap)
{
    MaxInvocationsProjectConfig config = minter.MaxInvocationsProjectConfigOf(projectId, flagshipCore.GetAddress());
    BOOST_CHECK_EQUAL(config.maxInvocations, ONE_MILLION);
    BOOST_CHECK(!config.maxHasBeenInvoked);

    // Later price updates leave the cache alone
    LimitOnCore(10);
    ExecuteOk(artist, [&](const CallContext& ctx) {
        minter.UpdatePricePerTokenInWei(ctx, projectId, flagshipCore.GetAddress(), ETHER);
    });
    BOOST_CHECK_EQUAL(minter.ProjectMaxInvocations(projectId, flagshipCore.GetAddress()), ONE_MILLION);
}

BOOST_AUTO_TEST_CASE(sync_and_sell_out)
{
    LimitOnCore(2);

    TxResult result = chain.Execute(collector, [&](const CallContext& ctx) {
        minter.SyncProjectMaxInvocationsToCore(ctx, projectId, flagshipCore.GetAddress());
    });
    BOOST_CHECK_EQUAL(result.errorMessage, "Only Artist");

    ExecuteOk(artist, [&](const CallContext& ctx) {
        minter.SyncProjectMaxInvocationsToCore(ctx, projectId, flagshipCore.GetAddress());
    });
    BOOST_CHECK_EQUAL(minter.ProjectMaxInvocations(projectId, flagshipCore.GetAddress()), 2U);

    BOOST_CHECK(TryPurchase(collector).success);
    BOOST_CHECK(!minter.ProjectMaxHasBeenInvoked(projectId, flagshipCore.GetAddress()));
    BOOST_CHECK(TryPurchase(collector).success);
    BOOST_CHECK(minter.ProjectMaxHasBeenInvoked(projectId, flagshipCore.GetAddress()));

    result = TryPurchase(otherCollector);
    BOOST_CHECK_EQUAL(result.errorMessage, "Max invocations reached");

    // Syncing a sold-out project does not clear the flag
    ExecuteOk(artist, [&](const CallContext& ctx) {
        minter.SyncProjectMaxInvocationsToCore(ctx, projectId, flagshipCore.GetAddress());
    });
    BOOST_CHECK(minter.ProjectMaxHasBeenInvoked(projectId, flagshipCore.GetAddress()));
}

BOOST_AUTO_TEST_CASE(manual_limit)
{
    TxResult result = chain.Execute(artist, [&](const CallContext& ctx) {
        minter.ManuallyLimitProjectMaxInvocations(ctx, projectId, flagshipCore.GetAddress(), ONE_MILLION + 1);
    });
    BOOST_CHECK_EQUAL(result.errorMessage, "Invalid max invocations");

    ExecuteOk(artist, [&](const CallContext& ctx) {
        minter.ManuallyLimitProjectMaxInvocations(ctx, projectId, flagshipCore.GetAddress(), 0);
    });
    BOOST_CHECK(minter.ProjectMaxHasBeenInvoked(projectId, flagshipCore.GetAddress()));
    BOOST_CHECK_EQUAL(TryPurchase(collector).errorMessage, "Max invocations reached");

    ExecuteOk(artist, [&](const CallContext& ctx) {
        minter.ManuallyLimitProjectMaxInvocations(ctx, projectId, flagshipCore.GetAddress(), 1);
    });
    BOOST_CHECK(!minter.ProjectMaxHasBeenInvoked(projectId, flagshipCore.GetAddress()));
    BOOST_CHECK(TryPurchase(collector).success);
    BOOST_CHECK(minter.ProjectMaxHasBeenInvoked(projectId, flagshipCore.GetAddress()));

    // Limits below current invocations are invalid
    result = chain.Execute(artist, [&](const CallContext& ctx) {
        minter.ManuallyLimitProjectMaxInvocations(ctx, projectId, flagshipCore.GetAddress(), 0);
    });
    BOOST_CHECK_EQUAL(result.errorMessage, "Invalid max invocations");
    BOOST_CHECK_EQUAL(CountEvents("ProjectMaxInvocationsLimitUpdated"), 2U);
}

BOOST_AUTO_TEST_CASE(stale_cache_is_caught_by_core)
{
    // The minter still caches the original cap
    LimitOnCore(1);
    BOOST_CHECK(TryPurchase(collector).success);
    BOOST_CHECK(!minter.ProjectMaxHasBeenInvoked(projectId, flagshipCore.GetAddress()));

    TxResult result = TryPurchase(collector);
    BOOST_CHECK_EQUAL(result.errorMessage, "Must not exceed max invocations");
    BOOST_CHECK_EQUAL(flagshipCore.GetProjectStateData(projectId).invocations, 1U);
}

BOOST_AUTO_TEST_CASE(safe_view_sees_core_side_limits)
{
    MaxInvocationsTracker tracker(chain, minter.GetAddress());
    const ProjectKey key(flagshipCore.GetAddress(), projectId);

    BOOST_CHECK(!tracker.ProjectMaxHasBeenInvokedSafe(key, flagshipCore));
    BOOST_CHECK(TryPurchase(collector).success);

    LimitOnCore(1);
    BOOST_CHECK(!tracker.ProjectMaxHasBeenInvoked(key));
    BOOST_CHECK(tracker.ProjectMaxHasBeenInvokedSafe(key, flagshipCore));
}

BOOST_AUTO_TEST_CASE(refresh_only_syncs_unconfigured_projects)
{
    MaxInvocationsTracker tracker(chain, minter.GetAddress());
    const ProjectKey key(flagshipCore.GetAddress(), projectId);

    ExecuteOk(artist, [&](const CallContext& ctx) {
        tracker.ManuallyLimitProjectMaxInvocations(key, flagshipCore, 0);
        tracker.RefreshMaxInvocations(key, flagshipCore);
    });
    // Limited to zero and flagged: not treated as unconfigured
    BOOST_CHECK_EQUAL(tracker.ProjectMaxInvocations(key), 0U);
    BOOST_CHECK(tracker.ProjectMaxHasBeenInvoked(key));
    BOOST_CHECK_THROW(tracker.PreMintChecks(key), RevertError);
}

BOOST_AUTO_TEST_SUITE_END()
