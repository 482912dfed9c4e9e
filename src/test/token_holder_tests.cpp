// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file token_holder_tests.cpp
 * @brief Tests for holder allowlists and delegate-vault resolution
 */

#include <test/test_mintsuite.h>

#include <mintsuite/delegation_registry.h>
#include <mintsuite/token_holder.h>

#include <boost/test/unit_test.hpp>

using namespace mintsuite;

namespace {

struct TokenHolderSetup : public MintSuiteTestingSetup {
    MinterSetPriceV5 freeMinter;
    TokenHolderAllowlist allowlist;
    DelegationRegistry delegations;
    uint64_t ownedProject;
    uint64_t saleProject;
    ProjectKey saleKey;

    TokenHolderSetup()
        : freeMinter(chain, minterFilter.GetAddress())
        , allowlist(chain, freeMinter.GetAddress())
        , delegations(chain)
        , ownedProject(AddProject(flagshipCore, otherArtist))
        , saleProject(AddProject(engineCore, artist))
        , saleKey(engineCore.GetAddress(), saleProject)
    {
        SetMinterForProject(flagshipCore, ownedProject, freeMinter.GetAddress());
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(token_holder_tests, TokenHolderSetup)

BOOST_AUTO_TEST_CASE(allow_and_remove)
{
    const uint64_t tokenId = MintFreeToken(flagshipCore, ownedProject, freeMinter, collector);
    BOOST_CHECK(!allowlist.IsAllowlistedNFT(saleKey, flagshipCore.GetAddress(), tokenId));

    ExecuteOk(artist, [&](const CallContext& ctx) {
        allowlist.AllowHoldersOfProjects(saleKey, {flagshipCore.GetAddress()}, {ownedProject}, minterFilter);
        // Adding a pair twice has no further effect
        allowlist.AllowHoldersOfProjects(saleKey, {flagshipCore.GetAddress()}, {ownedProject}, minterFilter);
    });
    BOOST_CHECK(allowlist.IsAllowlistedNFT(saleKey, flagshipCore.GetAddress(), tokenId));
    BOOST_CHECK_EQUAL(allowlist.GetAllowlistedProjects(saleKey).size(), 1U);
    BOOST_CHECK_EQUAL(CountEvents("AllowedHoldersOfProjects"), 2U);

    // Allowlists are per sale project
    BOOST_CHECK(!allowlist.IsAllowlistedNFT(ProjectKey(flagshipCore.GetAddress(), ownedProject),
                                            flagshipCore.GetAddress(), tokenId));

    ExecuteOk(artist, [&](const CallContext& ctx) {
        allowlist.RemoveHoldersOfProjects(saleKey, {flagshipCore.GetAddress()}, {ownedProject});
        allowlist.RemoveHoldersOfProjects(saleKey, {flagshipCore.GetAddress()}, {ownedProject + 1});
    });
    BOOST_CHECK(!allowlist.IsAllowlistedNFT(saleKey, flagshipCore.GetAddress(), tokenId));
    BOOST_CHECK(allowlist.GetAllowlistedProjects(saleKey).empty());
}

BOOST_AUTO_TEST_CASE(allow_and_remove_combined)
{
    ExecuteOk(artist, [&](const CallContext& ctx) {
        allowlist.AllowAndRemoveHoldersOfProjects(saleKey,
                                                  {flagshipCore.GetAddress(), flagshipCore.GetAddress()},
                                                  {ownedProject, ownedProject + 1},
                                                  {flagshipCore.GetAddress()}, {ownedProject + 1},
                                                  minterFilter);
    });
    std::vector<std::pair<uint160, uint64_t>> projects = allowlist.GetAllowlistedProjects(saleKey);
    BOOST_REQUIRE_EQUAL(projects.size(), 1U);
    BOOST_CHECK(projects[0].first == flagshipCore.GetAddress());
    BOOST_CHECK_EQUAL(projects[0].second, ownedProject);
}

BOOST_AUTO_TEST_CASE(allow_input_validation)
{
    BOOST_CHECK_EXCEPTION(allowlist.AllowHoldersOfProjects(saleKey, {flagshipCore.GetAddress()}, {}, minterFilter),
                          RevertError, [](const RevertError& e) {
                              return std::string(e.what()) == "TokenHolderLib: arrays neq length";
                          });

    GenArt721Core unregistered(chain, adminACL.GetAddress(), false, renderProvider, uint160());
    BOOST_CHECK_EXCEPTION(allowlist.AllowHoldersOfProjects(saleKey, {unregistered.GetAddress()}, {0}, minterFilter),
                          RevertError, [](const RevertError& e) {
                              return std::string(e.what()) == "TokenHolderLib: address not registered";
                          });

    BOOST_CHECK_THROW(allowlist.RemoveHoldersOfProjects(saleKey, {}, {ownedProject}), RevertError);
}

BOOST_AUTO_TEST_CASE(nft_ownership)
{
    const uint64_t tokenId = MintFreeToken(flagshipCore, ownedProject, freeMinter, collector);

    BOOST_CHECK_NO_THROW(allowlist.ValidateNFTOwnership(flagshipCore.GetAddress(), tokenId, collector));
    BOOST_CHECK_EXCEPTION(allowlist.ValidateNFTOwnership(flagshipCore.GetAddress(), tokenId, otherCollector),
                          RevertError, [](const RevertError& e) {
                              return std::string(e.what()) == "Only owner of NFT";
                          });
    BOOST_CHECK_THROW(allowlist.ValidateNFTOwnership(collector, tokenId, collector), RevertError);
}

BOOST_AUTO_TEST_CASE(delegate_vault_resolution)
{
    const uint160 vault = collector;
    const uint160 hotWallet = otherCollector;
    const uint64_t tokenId = MintFreeToken(flagshipCore, ownedProject, freeMinter, vault);

    // Without a vault the purchaser acts for itself
    BOOST_CHECK(allowlist.ResolvePurchaser(hotWallet, uint160(), flagshipCore.GetAddress(), tokenId,
                                           &delegations) == hotWallet);

    BOOST_CHECK_EXCEPTION(allowlist.ResolvePurchaser(hotWallet, vault, flagshipCore.GetAddress(), tokenId,
                                                     &delegations),
                          RevertError, [](const RevertError& e) {
                              return std::string(e.what()) == "Invalid delegate-vault pairing";
                          });

    ExecuteOk(vault, [&](const CallContext& ctx) {
        delegations.DelegateForToken(ctx, hotWallet, flagshipCore.GetAddress(), tokenId, true);
    });
    BOOST_CHECK(allowlist.ResolvePurchaser(hotWallet, vault, flagshipCore.GetAddress(), tokenId,
                                           &delegations) == vault);

    // No registry configured: vault purchases are impossible
    BOOST_CHECK_THROW(allowlist.ResolvePurchaser(hotWallet, vault, flagshipCore.GetAddress(), tokenId, nullptr),
                      RevertError);
}

BOOST_AUTO_TEST_CASE(delegation_scopes)
{
    const uint160 vault = collector;
    const uint160 delegate = otherCollector;

    BOOST_CHECK(!delegations.CheckDelegateForToken(delegate, vault, flagshipCore.GetAddress(), 7));

    ExecuteOk(vault, [&](const CallContext& ctx) {
        delegations.DelegateForContract(ctx, delegate, flagshipCore.GetAddress(), true);
    });
    BOOST_CHECK(delegations.CheckDelegateForContract(delegate, vault, flagshipCore.GetAddress()));
    BOOST_CHECK(delegations.CheckDelegateForToken(delegate, vault, flagshipCore.GetAddress(), 7));
    BOOST_CHECK(!delegations.CheckDelegateForToken(delegate, vault, engineCore.GetAddress(), 7));

    ExecuteOk(vault, [&](const CallContext& ctx) {
        delegations.DelegateForContract(ctx, delegate, flagshipCore.GetAddress(), false);
        delegations.DelegateForAll(ctx, delegate, true);
    });
    BOOST_CHECK(delegations.CheckDelegateForAll(delegate, vault));
    BOOST_CHECK(delegations.CheckDelegateForToken(delegate, vault, engineCore.GetAddress(), 7));
    BOOST_CHECK(!delegations.CheckDelegateForAll(vault, delegate));
}

BOOST_AUTO_TEST_SUITE_END()
