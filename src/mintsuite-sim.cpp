// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * @file mintsuite-sim.cpp
 * @brief Scripted sale on a fresh ledger
 *
 * Deploys an admin ACL, core registry, minter filter, one Engine core and
 * the set-price, linear and exponential auction minters, then runs one sale
 * on each and prints the price schedules and payee balances.
 */

#include <mintsuite/admin_acl.h>
#include <mintsuite/chain.h>
#include <mintsuite/core_contract.h>
#include <mintsuite/core_registry.h>
#include <mintsuite/minter_da.h>
#include <mintsuite/minter_filter.h>
#include <mintsuite/minter_set_price.h>
#include <mintsuite/mintsuite_config.h>
#include <mintsuite/mintsuite_params.h>
#include <util.h>
#include <utilmoneystr.h>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

using namespace mintsuite;

namespace {

std::string HelpMessage()
{
    std::string strUsage = "Usage: mintsuite-sim [options]\n\n";
    strUsage += HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-?", "Print this help message and exit");
    strUsage += HelpMessageOpt("-conf=<file>", "Read options from a config file");
    strUsage += HelpMessageGroup("Debugging/Testing options:");
    strUsage += HelpMessageOpt("-debug=<category>", strprintf("Output debugging information. <category> can be: %s",
        ListLogCategories()));
    strUsage += HelpMessageOpt("-printtoconsole", "Send trace/debug info to console");
    strUsage += HelpMessageOpt("-logtimestamps", "Prepend debug output with timestamp");
    strUsage += HelpMessageOpt("-debuglogfile=<file>", strprintf("Specify debug log file (default: %s)",
        DEFAULT_DEBUGLOGFILE));
    strUsage += GetMintSuiteHelpMessage();
    return strUsage;
}

/** Print and log a failed step */
bool CheckStep(const TxResult& result, const std::string& step)
{
    if (result.success) {
        return true;
    }
    fprintf(stderr, "Error: %s failed: %s\n", step.c_str(), result.errorMessage.c_str());
    LogPrintf("Sim: %s failed: %s\n", step, result.errorMessage);
    return false;
}

void PrintPrice(const IFilteredMinter& minter, uint64_t projectId, const uint160& core, int64_t timestamp)
{
    const PriceInfo info = minter.GetPriceInfo(projectId, core);
    printf("  t=%-8lld %s %s\n", (long long)timestamp, FormatMoney(info.tokenPriceInWei).c_str(),
           info.currencySymbol.c_str());
}

bool RunSimulation()
{
    Chain chain;
    chain.SetBlockTimestamp(1700000000);

    const uint160 superAdmin = chain.NewAddress();
    const uint160 artist = chain.NewAddress();
    const uint160 collector = chain.NewAddress();
    const uint160 renderProvider = chain.NewAddress();
    const uint160 platformProvider = chain.NewAddress();
    chain.Fund(collector, 100 * ETHER);

    AdminACLV0 adminACL(chain, superAdmin);
    CoreRegistryV1 registry(chain, adminACL.GetAddress());
    MinterFilterV2 filter(chain, adminACL.GetAddress(), registry.GetAddress());
    GenArt721Core core(chain, adminACL.GetAddress(), true, renderProvider, platformProvider);

    MinterSetPriceV5 setPrice(chain, filter.GetAddress());
    MinterDALinV5 daLin(chain, filter.GetAddress());
    MinterDAExpV5 daExp(chain, filter.GetAddress());

    const uint160 coreAddr = core.GetAddress();
    uint64_t projects[3] = {0, 0, 0};

    if (!CheckStep(chain.Execute(superAdmin, [&](const CallContext& ctx) {
            registry.RegisterContract(ctx, coreAddr, core.CoreVersion(), core.CoreType());
            core.UpdateMinterContract(ctx, filter.GetAddress());
            core.UpdateProviderPrimarySalesPercentages(ctx, GetMintSuiteParams().nRenderProviderPercentage,
                                                       GetMintSuiteParams().nPlatformProviderPercentage);
            filter.ApproveMinterGlobally(ctx, setPrice.GetAddress());
            filter.ApproveMinterGlobally(ctx, daLin.GetAddress());
            filter.ApproveMinterGlobally(ctx, daExp.GetAddress());
            for (uint64_t& projectId : projects) {
                projectId = core.AddProject(ctx, strprintf("Project %d", core.NextProjectId()), artist);
                core.ToggleProjectIsActive(ctx, projectId);
            }
        }), "deployment")) {
        return false;
    }

    const int64_t now = chain.GetBlockTimestamp();
    const int64_t linStart = now + 3600;
    const int64_t linEnd = linStart + 3600;
    const int64_t expStart = now + 3600;
    const int64_t expHalfLife = 600;

    if (!CheckStep(chain.Execute(artist, [&](const CallContext& ctx) {
            for (uint64_t projectId : projects) {
                core.ToggleProjectIsPaused(ctx, projectId);
            }
            filter.SetMinterForProject(ctx, projects[0], coreAddr, setPrice.GetAddress());
            filter.SetMinterForProject(ctx, projects[1], coreAddr, daLin.GetAddress());
            filter.SetMinterForProject(ctx, projects[2], coreAddr, daExp.GetAddress());
            setPrice.UpdatePricePerTokenInWei(ctx, projects[0], coreAddr, ETHER / 10);
            daLin.SetAuctionDetails(ctx, projects[1], coreAddr, linStart, linEnd, ETHER, ETHER / 10);
            daExp.SetAuctionDetails(ctx, projects[2], coreAddr, expStart, expHalfLife, ETHER, ETHER / 20);
        }), "project configuration")) {
        return false;
    }

    printf("Network: %s\n", GetMintSuiteParams().strNetworkID.c_str());

    // Fixed price
    printf("%s project %llu:\n", setPrice.MinterType().c_str(), (unsigned long long)projects[0]);
    PrintPrice(setPrice, projects[0], coreAddr, chain.GetBlockTimestamp());
    for (int i = 0; i < 2; i++) {
        if (!CheckStep(chain.Execute(collector, setPrice.GetAddress(), ETHER / 5, [&](const CallContext& ctx) {
                setPrice.Purchase(ctx, projects[0], coreAddr);
            }), "set price purchase")) {
            return false;
        }
    }

    // Linear auction
    printf("%s project %llu:\n", daLin.MinterType().c_str(), (unsigned long long)projects[1]);
    for (int64_t t = linStart - 900; t <= linEnd + 900; t += 900) {
        chain.SetBlockTimestamp(t);
        PrintPrice(daLin, projects[1], coreAddr, t);
    }
    chain.SetBlockTimestamp(linStart + (linEnd - linStart) / 2);
    if (!CheckStep(chain.Execute(collector, daLin.GetAddress(), ETHER, [&](const CallContext& ctx) {
            daLin.Purchase(ctx, projects[1], coreAddr);
        }), "linear auction purchase")) {
        return false;
    }

    // Exponential auction
    const int64_t expEnd = daExp.GetProjectExpAuctionEndTime(projects[2], coreAddr);
    printf("%s project %llu (reaches base price at t=%lld):\n", daExp.MinterType().c_str(),
           (unsigned long long)projects[2], (long long)expEnd);
    for (int64_t t = expStart; t <= expEnd; t += expHalfLife) {
        chain.SetBlockTimestamp(t);
        PrintPrice(daExp, projects[2], coreAddr, t);
    }
    chain.SetBlockTimestamp(expStart + expHalfLife * 2);
    if (!CheckStep(chain.Execute(collector, daExp.GetAddress(), ETHER, [&](const CallContext& ctx) {
            daExp.Purchase(ctx, projects[2], coreAddr);
        }), "exponential auction purchase")) {
        return false;
    }

    printf("Balances:\n");
    printf("  artist            %s\n", FormatMoney(chain.GetBalance(artist)).c_str());
    printf("  render provider   %s\n", FormatMoney(chain.GetBalance(renderProvider)).c_str());
    printf("  platform provider %s\n", FormatMoney(chain.GetBalance(platformProvider)).c_str());
    printf("  collector         %s\n", FormatMoney(chain.GetBalance(collector)).c_str());
    printf("Events: %u\n", (unsigned int)chain.GetEvents().size());
    return true;
}

} // namespace

int main(int argc, char* argv[])
{
    std::string error;
    if (!gArgs.ParseParameters(argc, argv, error)) {
        fprintf(stderr, "Error parsing command line arguments: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    if (gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        fprintf(stdout, "%s", HelpMessage().c_str());
        return EXIT_SUCCESS;
    }

    if (gArgs.IsArgSet("-conf")) {
        try {
            gArgs.ReadConfigFile(gArgs.GetArg("-conf", std::string()));
        } catch (const std::exception& e) {
            fprintf(stderr, "Error reading configuration file: %s\n", e.what());
            return EXIT_FAILURE;
        }
    }

    if (!InitLogging(error)) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return EXIT_FAILURE;
    }
    if (!InitMintSuiteConfig(error)) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    bool fRet = false;
    try {
        fRet = RunSimulation();
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        LogPrintf("Sim: unexpected error: %s\n", e.what());
    }
    CloseDebugLog();
    return fRet ? EXIT_SUCCESS : EXIT_FAILURE;
}
