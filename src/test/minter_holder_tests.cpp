// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file minter_holder_tests.cpp
 * @brief Tests for holder-gated and polyptych minters
 */

#include <test/test_mintsuite.h>

#include <mintsuite/delegation_registry.h>
#include <mintsuite/minter_holder.h>

#include <boost/test/unit_test.hpp>

using namespace mintsuite;

namespace {

struct HolderSetup : public MintSuiteTestingSetup {
    DelegationRegistry delegations;
    MinterSetPriceV5 freeMinter;
    MinterSetPriceHolderV5 holderMinter;
    uint64_t ownedProject;
    uint64_t saleProject;
    uint64_t ownedToken;

    HolderSetup()
        : delegations(chain)
        , freeMinter(chain, minterFilter.GetAddress())
        , holderMinter(chain, minterFilter.GetAddress(), delegations.GetAddress())
        , ownedProject(AddProject(flagshipCore, otherArtist))
        , saleProject(AddProject(engineCore, artist))
        , ownedToken(0)
    {
        SetMinterForProject(flagshipCore, ownedProject, freeMinter.GetAddress());
        SetMinterForProject(engineCore, saleProject, holderMinter.GetAddress());
        ownedToken = MintFreeToken(flagshipCore, ownedProject, freeMinter, collector);
        ExecuteOk(artist, [&](const CallContext& ctx) {
            holderMinter.UpdatePricePerTokenInWei(ctx, saleProject, engineCore.GetAddress(), ETHER / 10);
        });
    }

    void AllowOwnedProject()
    {
        ExecuteOk(artist, [&](const CallContext& ctx) {
            holderMinter.AllowHoldersOfProjects(ctx, saleProject, engineCore.GetAddress(),
                                                {flagshipCore.GetAddress()}, {ownedProject});
        });
    }

    TxResult HolderPurchase(const uint160& from, uint64_t tokenId)
    {
        return chain.Execute(from, holderMinter.GetAddress(), ETHER / 10, [&](const CallContext& ctx) {
            holderMinter.Purchase(ctx, saleProject, engineCore.GetAddress(), flagshipCore.GetAddress(), tokenId);
        });
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_SUITE(minter_holder_tests, HolderSetup)

// ============================================================================
// MinterSetPriceHolderV5
// ============================================================================

BOOST_AUTO_TEST_CASE(purchase_requires_owned_nft)
{
    AllowOwnedProject();
    TxResult result = chain.Execute(collector, holderMinter.GetAddress(), ETHER / 10, [&](const CallContext& ctx) {
        holderMinter.Purchase(ctx, saleProject, engineCore.GetAddress());
    });
    BOOST_CHECK_EQUAL(result.errorMessage, "Purchase requires NFT ownership");
    BOOST_CHECK(holderMinter.DelegationRegistryAddress() == delegations.GetAddress());
}

BOOST_AUTO_TEST_CASE(allowlisted_holder_can_purchase)
{
    BOOST_CHECK_EQUAL(HolderPurchase(collector, ownedToken).errorMessage, "Only allowlisted NFTs");

    TxResult result = chain.Execute(collector, [&](const CallContext& ctx) {
        holderMinter.AllowHoldersOfProjects(ctx, saleProject, engineCore.GetAddress(),
                                            {flagshipCore.GetAddress()}, {ownedProject});
    });
    BOOST_CHECK_EQUAL(result.errorMessage, "Only Artist");

    AllowOwnedProject();
    BOOST_CHECK(holderMinter.IsAllowlistedNFT(saleProject, engineCore.GetAddress(), flagshipCore.GetAddress(),
                                              ownedToken));
    BOOST_CHECK_EQUAL(holderMinter.AllowlistedProjectsOf(saleProject, engineCore.GetAddress()).size(), 1U);

    BOOST_REQUIRE(HolderPurchase(collector, ownedToken).success);
    BOOST_CHECK(engineCore.OwnerOf(MakeTokenId(saleProject, 0)) == collector);
    BOOST_CHECK(chain.GetBalance(artist) == ETHER * 8 / 100);

    // The same NFT may be presented again
    BOOST_CHECK(HolderPurchase(collector, ownedToken).success);
}

BOOST_AUTO_TEST_CASE(non_owner_is_rejected)
{
    AllowOwnedProject();
    TxResult result = HolderPurchase(otherCollector, ownedToken);
    BOOST_CHECK_EQUAL(result.errorMessage, "Only owner of NFT");
    BOOST_CHECK_EQUAL(engineCore.GetProjectStateData(saleProject).invocations, 0U);

    // After a transfer the new owner qualifies and the old one does not
    ExecuteOk(collector, [&](const CallContext& ctx) {
        flagshipCore.TransferFrom(ctx, collector, otherCollector, ownedToken);
    });
    BOOST_CHECK(HolderPurchase(otherCollector, ownedToken).success);
    BOOST_CHECK_EQUAL(HolderPurchase(collector, ownedToken).errorMessage, "Only owner of NFT");
}

BOOST_AUTO_TEST_CASE(remove_holders)
{
    AllowOwnedProject();
    ExecuteOk(artist, [&](const CallContext& ctx) {
        holderMinter.AllowAndRemoveHoldersOfProjects(ctx, saleProject, engineCore.GetAddress(),
                                                     {}, {}, {flagshipCore.GetAddress()}, {ownedProject});
    });
    BOOST_CHECK_EQUAL(HolderPurchase(collector, ownedToken).errorMessage, "Only allowlisted NFTs");

    AllowOwnedProject();
    ExecuteOk(artist, [&](const CallContext& ctx) {
        holderMinter.RemoveHoldersOfProjects(ctx, saleProject, engineCore.GetAddress(),
                                             {flagshipCore.GetAddress()}, {ownedProject});
    });
    BOOST_CHECK(holderMinter.AllowlistedProjectsOf(saleProject, engineCore.GetAddress()).empty());
}

BOOST_AUTO_TEST_CASE(delegate_purchases_for_vault)
{
    AllowOwnedProject();
    const uint160 vault = collector;
    const uint160 hotWallet = otherCollector;

    auto purchaseForVault = [&]() {
        return chain.Execute(hotWallet, holderMinter.GetAddress(), ETHER / 10, [&](const CallContext& ctx) {
            holderMinter.PurchaseTo(ctx, hotWallet, saleProject, engineCore.GetAddress(),
                                    flagshipCore.GetAddress(), ownedToken, vault);
        });
    };

    BOOST_CHECK_EQUAL(purchaseForVault().errorMessage, "Invalid delegate-vault pairing");

    ExecuteOk(vault, [&](const CallContext& ctx) {
        delegations.DelegateForContract(ctx, hotWallet, flagshipCore.GetAddress(), true);
    });
    BOOST_REQUIRE(purchaseForVault().success);
    BOOST_CHECK(engineCore.OwnerOf(MakeTokenId(saleProject, 0)) == hotWallet);
}

BOOST_AUTO_TEST_CASE(vault_purchase_without_registry)
{
    MinterSetPriceHolderV5 noRegistry(chain, minterFilter.GetAddress(), uint160());
    SetMinterForProject(engineCore, saleProject, noRegistry.GetAddress());
    ExecuteOk(artist, [&](const CallContext& ctx) {
        noRegistry.UpdatePricePerTokenInWei(ctx, saleProject, engineCore.GetAddress(), 0);
        noRegistry.AllowHoldersOfProjects(ctx, saleProject, engineCore.GetAddress(),
                                          {flagshipCore.GetAddress()}, {ownedProject});
    });

    TxResult result = chain.Execute(otherCollector, [&](const CallContext& ctx) {
        noRegistry.PurchaseTo(ctx, otherCollector, saleProject, engineCore.GetAddress(),
                              flagshipCore.GetAddress(), ownedToken, collector);
    });
    BOOST_CHECK_EQUAL(result.errorMessage, "Invalid delegate-vault pairing");

    BOOST_CHECK(chain.Execute(collector, [&](const CallContext& ctx) {
        noRegistry.Purchase(ctx, saleProject, engineCore.GetAddress(), flagshipCore.GetAddress(), ownedToken);
    }).success);
}

// ============================================================================
// MinterSetPricePolyptychV5
// ============================================================================

namespace {

struct PolyptychSetup : public HolderSetup {
    MinterSetPricePolyptychV5 polyptych;
    uint64_t panelProject;

    PolyptychSetup()
        : polyptych(chain, minterFilter.GetAddress(), delegations.GetAddress())
        , panelProject(AddProject(flagshipCore, artist))
    {
        SetMinterForProject(flagshipCore, panelProject, polyptych.GetAddress());
        ExecuteOk(superAdmin, [&](const CallContext& ctx) {
            flagshipCore.UpdateHashSeedSetterContract(ctx, polyptych.GetAddress());
            flagshipCore.ToggleProjectUseAssignedHashSeed(ctx, panelProject);
        });
        ExecuteOk(artist, [&](const CallContext& ctx) {
            polyptych.UpdatePricePerTokenInWei(ctx, panelProject, flagshipCore.GetAddress(), 0);
            polyptych.AllowHoldersOfProjects(ctx, panelProject, flagshipCore.GetAddress(),
                                             {flagshipCore.GetAddress()}, {ownedProject});
        });
    }

    TxResult PanelPurchase(const uint160& from, uint64_t tokenId)
    {
        return chain.Execute(from, [&](const CallContext& ctx) {
            polyptych.Purchase(ctx, panelProject, flagshipCore.GetAddress(), flagshipCore.GetAddress(), tokenId);
        });
    }
};

} // anonymous namespace

BOOST_FIXTURE_TEST_CASE(polyptych_copies_hash_seed, PolyptychSetup)
{
    const uint96 ownedSeed = flagshipCore.TokenIdToHashSeed(ownedToken);
    BOOST_REQUIRE(!ownedSeed.IsNull());

    BOOST_REQUIRE(PanelPurchase(collector, ownedToken).success);
    const uint64_t panelToken = MakeTokenId(panelProject, 0);
    BOOST_CHECK(flagshipCore.OwnerOf(panelToken) == collector);
    BOOST_CHECK(flagshipCore.TokenIdToHashSeed(panelToken) == ownedSeed);
    BOOST_CHECK(polyptych.GetPolyptychPanelHashSeedIsMinted(panelProject, flagshipCore.GetAddress(), 0, ownedSeed));
    BOOST_CHECK(!polyptych.GetPolyptychPanelHashSeedIsMinted(panelProject, flagshipCore.GetAddress(), 1, ownedSeed));
}

BOOST_FIXTURE_TEST_CASE(polyptych_one_mint_per_seed_and_panel, PolyptychSetup)
{
    BOOST_REQUIRE(PanelPurchase(collector, ownedToken).success);
    BOOST_CHECK_EQUAL(PanelPurchase(collector, ownedToken).errorMessage, "Panel already minted");

    TxResult result = chain.Execute(collector, [&](const CallContext& ctx) {
        polyptych.IncrementPolyptychProjectPanelId(ctx, panelProject, flagshipCore.GetAddress());
    });
    BOOST_CHECK_EQUAL(result.errorMessage, "Only Artist");

    ExecuteOk(artist, [&](const CallContext& ctx) {
        polyptych.IncrementPolyptychProjectPanelId(ctx, panelProject, flagshipCore.GetAddress());
    });
    BOOST_CHECK_EQUAL(polyptych.GetCurrentPolyptychPanelId(panelProject, flagshipCore.GetAddress()), 1U);
    BOOST_CHECK_EQUAL(CountEvents("ConfigValueSet"), 1U);

    BOOST_REQUIRE(PanelPurchase(collector, ownedToken).success);
    BOOST_CHECK(flagshipCore.TokenIdToHashSeed(MakeTokenId(panelProject, 1)) ==
                flagshipCore.TokenIdToHashSeed(ownedToken));
}

BOOST_FIXTURE_TEST_CASE(polyptych_rejects_tokens_without_seed, PolyptychSetup)
{
    // Tokens of an assigned-seed project have no seed until one is assigned
    const uint64_t seedless = AddProject(flagshipCore, otherArtist);
    SetMinterForProject(flagshipCore, seedless, freeMinter.GetAddress());
    ExecuteOk(superAdmin, [&](const CallContext& ctx) {
        flagshipCore.ToggleProjectUseAssignedHashSeed(ctx, seedless);
    });
    const uint64_t seedlessToken = MintFreeToken(flagshipCore, seedless, freeMinter, collector);
    BOOST_REQUIRE(flagshipCore.TokenIdToHashSeed(seedlessToken).IsNull());

    ExecuteOk(artist, [&](const CallContext& ctx) {
        polyptych.AllowHoldersOfProjects(ctx, panelProject, flagshipCore.GetAddress(),
                                         {flagshipCore.GetAddress()}, {seedless});
    });
    BOOST_CHECK_EQUAL(PanelPurchase(collector, seedlessToken).errorMessage, "Only tokens with hash seed");
}

BOOST_FIXTURE_TEST_CASE(polyptych_requires_hash_seed_setter_role, PolyptychSetup)
{
    ExecuteOk(superAdmin, [&](const CallContext& ctx) {
        flagshipCore.UpdateHashSeedSetterContract(ctx, superAdmin);
    });
    BOOST_CHECK_EQUAL(PanelPurchase(collector, ownedToken).errorMessage, "Only hashSeedSetterContract");

    // The failed purchase left no panel record behind
    BOOST_CHECK(!polyptych.GetPolyptychPanelHashSeedIsMinted(panelProject, flagshipCore.GetAddress(), 0,
                                                             flagshipCore.TokenIdToHashSeed(ownedToken)));
    BOOST_CHECK_EQUAL(flagshipCore.GetProjectStateData(panelProject).invocations, 0U);
}

BOOST_AUTO_TEST_SUITE_END()
