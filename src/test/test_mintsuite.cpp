// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#define BOOST_TEST_MODULE MintSuite Test Suite

#include <test/test_mintsuite.h>

#include <mintsuite/mintsuite_params.h>
#include <util.h>

#include <boost/test/unit_test.hpp>

using namespace mintsuite;

BasicTestingSetup::BasicTestingSetup(const std::string& network)
{
    fPrintToConsole = false;
    fPrintToDebugLog = false;
    logCategories = MSLog::NONE;
    gArgs.ClearArgs();
    SelectMintSuiteParams(network);
}

BasicTestingSetup::~BasicTestingSetup()
{
    gArgs.ClearArgs();
}

MintSuiteTestingSetup::MintSuiteTestingSetup()
    : BasicTestingSetup(NETWORK_REGTEST)
    , superAdmin(chain.NewAddress())
    , artist(chain.NewAddress())
    , otherArtist(chain.NewAddress())
    , collector(chain.NewAddress())
    , otherCollector(chain.NewAddress())
    , renderProvider(chain.NewAddress())
    , platformProvider(chain.NewAddress())
    , additionalPayee(chain.NewAddress())
    , adminACL(chain, superAdmin)
    , coreRegistry(chain, adminACL.GetAddress())
    , minterFilter(chain, adminACL.GetAddress(), coreRegistry.GetAddress())
    , flagshipCore(chain, adminACL.GetAddress(), false, renderProvider, platformProvider)
    , engineCore(chain, adminACL.GetAddress(), true, renderProvider, platformProvider)
{
    chain.SetBlockTimestamp(100);
    chain.Fund(collector, 1000 * ETHER);
    chain.Fund(otherCollector, 1000 * ETHER);

    ExecuteOk(superAdmin, [&](const CallContext& ctx) {
        for (GenArt721Core* core : {&flagshipCore, &engineCore}) {
            coreRegistry.RegisterContract(ctx, core->GetAddress(), core->CoreVersion(), core->CoreType());
            core->UpdateMinterContract(ctx, minterFilter.GetAddress());
        }
    });
    chain.ClearEvents();
}

void MintSuiteTestingSetup::ExecuteOk(const uint160& from, const std::function<void (const CallContext&)>& func)
{
    const TxResult result = chain.Execute(from, func);
    BOOST_REQUIRE_MESSAGE(result.success, "transaction reverted: " + result.errorMessage);
}

uint64_t MintSuiteTestingSetup::AddProject(GenArt721Core& core, const uint160& projectArtist)
{
    uint64_t projectId = 0;
    ExecuteOk(superAdmin, [&](const CallContext& ctx) {
        projectId = core.AddProject(ctx, "Project", projectArtist);
        core.ToggleProjectIsActive(ctx, projectId);
    });
    ExecuteOk(projectArtist, [&](const CallContext& ctx) {
        core.ToggleProjectIsPaused(ctx, projectId);
    });
    return projectId;
}

void MintSuiteTestingSetup::SetMinterForProject(GenArt721Core& core, uint64_t projectId, const uint160& minter)
{
    ExecuteOk(superAdmin, [&](const CallContext& ctx) {
        if (!minterFilter.IsGloballyApprovedMinter(minter)) {
            minterFilter.ApproveMinterGlobally(ctx, minter);
        }
        minterFilter.SetMinterForProject(ctx, projectId, core.GetAddress(), minter);
    });
}

uint64_t MintSuiteTestingSetup::MintFreeToken(GenArt721Core& core, uint64_t projectId, MinterSetPriceV5& minter,
                                              const uint160& to)
{
    const uint160 projectArtist = core.ProjectIdToArtistAddress(projectId);
    if (!minter.SetPriceProjectConfigOf(projectId, core.GetAddress()).priceIsConfigured) {
        ExecuteOk(projectArtist, [&](const CallContext& ctx) {
            minter.UpdatePricePerTokenInWei(ctx, projectId, core.GetAddress(), 0);
        });
    }
    uint64_t tokenId = 0;
    ExecuteOk(to, [&](const CallContext& ctx) {
        tokenId = minter.Purchase(ctx, projectId, core.GetAddress());
    });
    return tokenId;
}

size_t MintSuiteTestingSetup::CountEvents(const std::string& name) const
{
    return chain.GetEvents(name).size();
}

ReentrantPurchaser::ReentrantPurchaser(Chain& chain, MinterSetPriceV5& minter, uint64_t projectId,
                                       const uint160& coreContract)
    : Contract(chain)
    , reentryAttempted(false)
    , minter_(minter)
    , projectId_(projectId)
    , coreContract_(coreContract)
    , value_(0)
{
}

TxResult ReentrantPurchaser::Purchase(const CAmount& value)
{
    value_ = value;
    return chain_.Execute(address_, minter_.GetAddress(), value, [&](const CallContext& ctx) {
        minter_.Purchase(ctx, projectId_, coreContract_);
    });
}

void ReentrantPurchaser::OnReceive(const CallContext& ctx)
{
    if (reentryAttempted) {
        return;
    }
    reentryAttempted = true;
    reentryResult = chain_.Execute(address_, minter_.GetAddress(), value_, [&](const CallContext& innerCtx) {
        minter_.Purchase(innerCtx, projectId_, coreContract_);
    });
}
