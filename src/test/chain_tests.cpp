// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file chain_tests.cpp
 * @brief Tests for the in-process ledger: atomic frames, value transfers, events
 */

#include <test/test_mintsuite.h>

#include <mintsuite/chain.h>

#include <boost/test/unit_test.hpp>

#include <map>
#include <string>
#include <vector>

using namespace mintsuite;

namespace {

/**
 * Contract holding a counter, accepting value only while open
 */
class CounterContract : public Contract
{
public:
    explicit CounterContract(Chain& chain) : Contract(chain), open(true)
    {
        Track(counter_);
    }

    void Increment(const CallContext& ctx)
    {
        *counter_ += 1;
        chain_.EmitEvent(EventLog(address_, "Incremented").Add("by", ctx.sender).Add("value", *counter_));
    }

    void IncrementAndRevert(const CallContext& ctx)
    {
        Increment(ctx);
        Require(false, "Counter: forced revert");
    }

    void OnReceive(const CallContext& ctx) override
    {
        Require(open, "Counter: closed");
        *counter_ += 100;
    }

    int Value() const { return *counter_; }

    bool open;

private:
    Snapshotted<int> counter_;
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(chain_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(addresses_are_unique_and_non_null)
{
    Chain chain;
    const uint160 a = chain.NewAddress();
    const uint160 b = chain.NewAddress();
    BOOST_CHECK(!a.IsNull());
    BOOST_CHECK(!b.IsNull());
    BOOST_CHECK(a != b);

    CounterContract counter(chain);
    BOOST_CHECK(counter.GetAddress() != a && counter.GetAddress() != b);
    BOOST_CHECK(chain.IsContract(counter.GetAddress()));
    BOOST_CHECK(!chain.IsContract(a));
}

BOOST_AUTO_TEST_CASE(committed_transaction_keeps_state_and_events)
{
    Chain chain;
    CounterContract counter(chain);
    const uint160 user = chain.NewAddress();

    TxResult result = chain.Execute(user, [&](const CallContext& ctx) {
        counter.Increment(ctx);
        counter.Increment(ctx);
    });
    BOOST_CHECK(result.success);
    BOOST_CHECK_EQUAL(counter.Value(), 2);
    BOOST_CHECK_EQUAL(chain.GetEvents("Incremented").size(), 2U);
    BOOST_CHECK_EQUAL(*chain.GetEvents("Incremented").back().Get("value"), "2");
    BOOST_CHECK_EQUAL(chain.GetCallDepth(), 0);
}

BOOST_AUTO_TEST_CASE(reverted_transaction_undoes_state_value_and_events)
{
    Chain chain;
    CounterContract counter(chain);
    const uint160 user = chain.NewAddress();
    chain.Fund(user, 10 * ETHER);

    TxResult result = chain.Execute(user, counter.GetAddress(), 3 * ETHER, [&](const CallContext& ctx) {
        counter.IncrementAndRevert(ctx);
    });
    BOOST_CHECK(!result.success);
    BOOST_CHECK_EQUAL(result.errorMessage, "Counter: forced revert");
    BOOST_CHECK_EQUAL(counter.Value(), 0);
    BOOST_CHECK(chain.GetBalance(user) == 10 * ETHER);
    BOOST_CHECK(chain.GetBalance(counter.GetAddress()) == 0);
    BOOST_CHECK(chain.GetEvents().empty());
}

BOOST_AUTO_TEST_CASE(insufficient_balance_reverts)
{
    Chain chain;
    CounterContract counter(chain);
    const uint160 user = chain.NewAddress();
    chain.Fund(user, ETHER);

    TxResult result = chain.Execute(user, counter.GetAddress(), 2 * ETHER, [&](const CallContext& ctx) {
        counter.Increment(ctx);
    });
    BOOST_CHECK(!result.success);
    BOOST_CHECK_EQUAL(result.errorMessage, "Insufficient balance");
    BOOST_CHECK(chain.GetBalance(user) == ETHER);
}

BOOST_AUTO_TEST_CASE(nested_execute_reverts_only_its_frame)
{
    Chain chain;
    CounterContract counter(chain);
    const uint160 user = chain.NewAddress();
    TxResult inner;

    TxResult outer = chain.Execute(user, [&](const CallContext& ctx) {
        counter.Increment(ctx);
        inner = chain.Execute(user, [&](const CallContext& innerCtx) {
            counter.IncrementAndRevert(innerCtx);
        });
    });
    BOOST_CHECK(outer.success);
    BOOST_CHECK(!inner.success);
    BOOST_CHECK_EQUAL(counter.Value(), 1);
    BOOST_CHECK_EQUAL(chain.GetEvents("Incremented").size(), 1U);
}

BOOST_AUTO_TEST_CASE(send_value_runs_receive_hook)
{
    Chain chain;
    CounterContract counter(chain);
    RejectingReceiver rejecting(chain);
    const uint160 user = chain.NewAddress();
    const uint160 other = chain.NewAddress();
    chain.Fund(user, 5 * ETHER);

    bool toCounter = false;
    bool toRejecting = true;
    bool toClosed = true;
    bool toAccount = false;
    TxResult result = chain.Execute(user, [&](const CallContext& ctx) {
        toCounter = chain.SendValue(user, counter.GetAddress(), ETHER);
        toRejecting = chain.SendValue(user, rejecting.GetAddress(), ETHER);
        counter.open = false;
        toClosed = chain.SendValue(user, counter.GetAddress(), ETHER);
        toAccount = chain.SendValue(user, other, ETHER);
    });
    BOOST_CHECK(result.success);
    BOOST_CHECK(toCounter);
    BOOST_CHECK(!toRejecting);
    BOOST_CHECK(!toClosed);
    BOOST_CHECK(toAccount);

    // Failed transfers are undone, including the hook's state changes
    BOOST_CHECK_EQUAL(counter.Value(), 100);
    BOOST_CHECK(chain.GetBalance(counter.GetAddress()) == ETHER);
    BOOST_CHECK(chain.GetBalance(rejecting.GetAddress()) == 0);
    BOOST_CHECK(chain.GetBalance(other) == ETHER);
    BOOST_CHECK(chain.GetBalance(user) == 3 * ETHER);
}

BOOST_AUTO_TEST_CASE(event_signal_fires_on_commit_only)
{
    Chain chain;
    CounterContract counter(chain);
    const uint160 user = chain.NewAddress();

    std::vector<std::string> seen;
    boost::signals2::scoped_connection conn = chain.NotifyEventEmitted.connect([&](const EventLog& log) {
        seen.push_back(log.name);
    });

    BOOST_CHECK(!chain.Execute(user, [&](const CallContext& ctx) { counter.IncrementAndRevert(ctx); }).success);
    BOOST_CHECK(seen.empty());

    BOOST_CHECK(chain.Execute(user, [&](const CallContext& ctx) { counter.Increment(ctx); }).success);
    BOOST_REQUIRE_EQUAL(seen.size(), 1U);
    BOOST_CHECK_EQUAL(seen[0], "Incremented");

    chain.ClearEvents();
    BOOST_CHECK(chain.GetEvents().empty());
}

BOOST_AUTO_TEST_CASE(block_time)
{
    Chain chain;
    chain.SetBlockTimestamp(1000);
    chain.AdvanceTime(500);
    BOOST_CHECK_EQUAL(chain.GetBlockTimestamp(), 1500);
}

BOOST_AUTO_TEST_CASE(reentrancy_guard_scope)
{
    ReentrancyGuard guard;
    {
        ReentrancyGuard::Scope scope(guard);
        BOOST_CHECK(guard.IsEntered());
        BOOST_CHECK_EXCEPTION(ReentrancyGuard::Scope inner(guard), RevertError, [](const RevertError& e) {
            return std::string(e.what()) == "ReentrancyGuard: reentrant call";
        });
        BOOST_CHECK(guard.IsEntered());
    }
    BOOST_CHECK(!guard.IsEntered());
}

BOOST_AUTO_TEST_SUITE_END()
