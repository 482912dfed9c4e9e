// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mintsuite/minter_filter.h>

#include <mintsuite/core_registry.h>
#include <util.h>

namespace mintsuite {

MinterFilterV2::MinterFilterV2(Chain& chain, const uint160& ownerAdminACL, const uint160& coreRegistry)
    : AdminACLOwned(chain, ownerAdminACL)
{
    state_->coreRegistry = coreRegistry;
    Track(state_);
}

// ============================================================================
// Filter admin operations
// ============================================================================

void MinterFilterV2::UpdateCoreRegistry(const CallContext& ctx, const uint160& coreRegistry)
{
    RequireAdminACL(ctx.sender, "updateCoreRegistry", "Only Admin ACL allowed");
    Require(!coreRegistry.IsNull(), "Only non-zero address");
    state_->coreRegistry = coreRegistry;

    chain_.EmitEvent(EventLog(address_, "CoreRegistryUpdated").Add("coreRegistry", coreRegistry));
    LogPrint(MSLog::FILTER, "MinterFilter: Core registry updated to %s\n", coreRegistry.ToString());
}

void MinterFilterV2::ApproveMinterGlobally(const CallContext& ctx, const uint160& minter)
{
    RequireAdminACL(ctx.sender, "approveMinterGlobally", "Only Admin ACL allowed");
    Require(state_->globallyApproved.Add(minter), "Minter already approved");

    const std::string minterType = MinterTypeOf(minter);
    chain_.EmitEvent(EventLog(address_, "MinterApprovedGlobally")
        .Add("minter", minter)
        .Add("minterType", minterType));
    LogPrint(MSLog::FILTER, "MinterFilter: Approved %s (%s) globally\n", minter.ToString(), minterType);
}

void MinterFilterV2::RevokeMinterGlobally(const CallContext& ctx, const uint160& minter)
{
    RequireAdminACL(ctx.sender, "revokeMinterGlobally", "Only Admin ACL allowed");
    Require(state_->globallyApproved.Remove(minter), "Only previously approved minter");

    chain_.EmitEvent(EventLog(address_, "MinterRevokedGlobally").Add("minter", minter));
    LogPrint(MSLog::FILTER, "MinterFilter: Revoked %s globally\n", minter.ToString());
}

// ============================================================================
// Core admin operations
// ============================================================================

void MinterFilterV2::ApproveMinterForContract(const CallContext& ctx, const uint160& coreContract,
                                              const uint160& minter)
{
    RequireRegisteredCore(coreContract);
    RequireCoreAdminACL(ctx, coreContract, "approveMinterForContract");
    Require(state_->contractApproved[coreContract].Add(minter), "Minter already approved");

    const std::string minterType = MinterTypeOf(minter);
    chain_.EmitEvent(EventLog(address_, "MinterApprovedForContract")
        .Add("coreContract", coreContract)
        .Add("minter", minter)
        .Add("minterType", minterType));
    LogPrint(MSLog::FILTER, "MinterFilter: Approved %s (%s) for %s\n",
             minter.ToString(), minterType, coreContract.ToString());
}

void MinterFilterV2::RevokeMinterForContract(const CallContext& ctx, const uint160& coreContract,
                                             const uint160& minter)
{
    RequireCoreAdminACL(ctx, coreContract, "revokeMinterForContract");
    auto it = state_->contractApproved.find(coreContract);
    Require(it != state_->contractApproved.end() && it->second.Remove(minter), "Only previously approved minter");

    chain_.EmitEvent(EventLog(address_, "MinterRevokedForContract")
        .Add("coreContract", coreContract)
        .Add("minter", minter));
    LogPrint(MSLog::FILTER, "MinterFilter: Revoked %s for %s\n", minter.ToString(), coreContract.ToString());
}

void MinterFilterV2::SetMinterForProject(const CallContext& ctx, uint64_t projectId, const uint160& coreContract,
                                         const uint160& minter)
{
    RequireRegisteredCore(coreContract);
    RequireArtistOrCoreAdminACL(ctx, projectId, coreContract, "setMinterForProject");
    Require(IsApprovedMinterForContract(coreContract, minter), "Only approved minters");
    RequireValidProjectId(projectId, coreContract);

    EnumerableMap<uint64_t, uint160>& assignments = state_->assignments[coreContract];
    if (assignments.Contains(projectId)) {
        const uint160 previous = assignments.Get(projectId);
        state_->numProjectsUsingMinter[previous] -= 1;
    }
    state_->numProjectsUsingMinter[minter] += 1;
    assignments.Set(projectId, minter);

    const std::string minterType = MinterTypeOf(minter);
    chain_.EmitEvent(EventLog(address_, "ProjectMinterRegistered")
        .Add("projectId", projectId)
        .Add("coreContract", coreContract)
        .Add("minter", minter)
        .Add("minterType", minterType));
    LogPrint(MSLog::FILTER, "MinterFilter: Project %d on %s assigned to %s (%s)\n",
             projectId, coreContract.ToString(), minter.ToString(), minterType);
}

void MinterFilterV2::RemoveMinterForProject(const CallContext& ctx, uint64_t projectId, const uint160& coreContract)
{
    RequireCoreAdminACL(ctx, coreContract, "removeMinterForProject");
    RemoveMinterForProjectInternal(projectId, coreContract);
}

void MinterFilterV2::RemoveMintersForProjectsOnContract(const CallContext& ctx, const std::vector<uint64_t>& projectIds,
                                                        const uint160& coreContract)
{
    RequireCoreAdminACL(ctx, coreContract, "removeMintersForProjectsOnContract");
    for (uint64_t projectId : projectIds) {
        RemoveMinterForProjectInternal(projectId, coreContract);
    }
}

void MinterFilterV2::RemoveMinterForProjectInternal(uint64_t projectId, const uint160& coreContract)
{
    auto it = state_->assignments.find(coreContract);
    Require(it != state_->assignments.end() && it->second.Contains(projectId), "No minter assigned");

    const uint160 previous = it->second.Get(projectId);
    state_->numProjectsUsingMinter[previous] -= 1;
    it->second.Remove(projectId);

    chain_.EmitEvent(EventLog(address_, "ProjectMinterRemoved")
        .Add("projectId", projectId)
        .Add("coreContract", coreContract));
    LogPrint(MSLog::FILTER, "MinterFilter: Project %d on %s minter removed\n", projectId, coreContract.ToString());
}

// ============================================================================
// Minting
// ============================================================================

uint64_t MinterFilterV2::Mint(const CallContext& ctx, const uint160& to, uint64_t projectId,
                              const uint160& coreContract, const uint160& sender)
{
    auto it = state_->assignments.find(coreContract);
    Require(it != state_->assignments.end() && it->second.Contains(projectId), "Only assigned minter");
    Require(it->second.Get(projectId) == ctx.sender, "Only assigned minter");

    return Core(coreContract).Mint_Ecf(Self(), to, projectId, sender);
}

// ============================================================================
// Views
// ============================================================================

uint160 MinterFilterV2::GetMinterForProject(uint64_t projectId, const uint160& coreContract) const
{
    auto it = state_->assignments.find(coreContract);
    Require(it != state_->assignments.end(), "No minter assigned");
    return it->second.Get(projectId, "No minter assigned");
}

bool MinterFilterV2::ProjectHasMinter(uint64_t projectId, const uint160& coreContract) const
{
    auto it = state_->assignments.find(coreContract);
    return it != state_->assignments.end() && it->second.Contains(projectId);
}

bool MinterFilterV2::IsRegisteredCoreContract(const uint160& coreContract) const
{
    const CoreRegistryV1* registry = chain_.GetContractAs<CoreRegistryV1>(state_->coreRegistry);
    return registry != nullptr && registry->IsRegisteredContract(coreContract);
}

bool MinterFilterV2::IsGloballyApprovedMinter(const uint160& minter) const
{
    return state_->globallyApproved.Contains(minter);
}

bool MinterFilterV2::IsApprovedMinterForContract(const uint160& coreContract, const uint160& minter) const
{
    if (state_->globallyApproved.Contains(minter)) {
        return true;
    }
    auto it = state_->contractApproved.find(coreContract);
    return it != state_->contractApproved.end() && it->second.Contains(minter);
}

size_t MinterFilterV2::GetNumProjectsOnContractWithMinters(const uint160& coreContract) const
{
    auto it = state_->assignments.find(coreContract);
    return it == state_->assignments.end() ? 0 : it->second.Length();
}

ProjectAndMinterInfo MinterFilterV2::GetProjectAndMinterInfoOnContractAt(const uint160& coreContract, size_t index) const
{
    auto it = state_->assignments.find(coreContract);
    Require(it != state_->assignments.end(), "EnumerableMap: index out of bounds");
    const std::pair<uint64_t, uint160>& entry = it->second.At(index);

    ProjectAndMinterInfo info;
    info.projectId = entry.first;
    info.minterAddress = entry.second;
    info.minterType = MinterTypeOf(entry.second);
    return info;
}

std::vector<MinterWithType> MinterFilterV2::GetAllGloballyApprovedMinters() const
{
    std::vector<MinterWithType> result;
    for (const uint160& minter : state_->globallyApproved.Values()) {
        result.push_back(MinterWithType{minter, MinterTypeOf(minter)});
    }
    return result;
}

std::vector<MinterWithType> MinterFilterV2::GetAllContractApprovedMinters(const uint160& coreContract) const
{
    std::vector<MinterWithType> result;
    auto it = state_->contractApproved.find(coreContract);
    if (it == state_->contractApproved.end()) {
        return result;
    }
    for (const uint160& minter : it->second.Values()) {
        result.push_back(MinterWithType{minter, MinterTypeOf(minter)});
    }
    return result;
}

uint64_t MinterFilterV2::GetNumProjectsUsingMinter(const uint160& minter) const
{
    auto it = state_->numProjectsUsingMinter.find(minter);
    return it == state_->numProjectsUsingMinter.end() ? 0 : it->second;
}

uint160 MinterFilterV2::CoreRegistryAddress() const
{
    return state_->coreRegistry;
}

bool MinterFilterV2::MinterFilterAdminACLAllowed(const uint160& sender, const uint160& contract,
                                                 const std::string& selector) const
{
    return OwnerAdminACLAllowed(sender, contract, selector);
}

// ============================================================================
// Helpers
// ============================================================================

IGenArt721Core& MinterFilterV2::Core(const uint160& coreContract) const
{
    return ContractAt<IGenArt721Core>(coreContract, "Only registered core contract");
}

std::string MinterFilterV2::MinterTypeOf(const uint160& minter) const
{
    const IFilteredMinter* filtered = chain_.GetContractAs<IFilteredMinter>(minter);
    Require(filtered != nullptr, "Only minter contracts");
    return filtered->MinterType();
}

void MinterFilterV2::RequireRegisteredCore(const uint160& coreContract) const
{
    Require(IsRegisteredCoreContract(coreContract), "Only registered core contract");
}

void MinterFilterV2::RequireCoreAdminACL(const CallContext& ctx, const uint160& coreContract,
                                         const std::string& selector) const
{
    const IGenArt721Core* core = chain_.GetContractAs<IGenArt721Core>(coreContract);
    Require(core != nullptr && core->AdminACLAllowed(ctx.sender, address_, selector), "Only Core AdminACL allowed");
}

void MinterFilterV2::RequireArtistOrCoreAdminACL(const CallContext& ctx, uint64_t projectId,
                                                 const uint160& coreContract, const std::string& selector) const
{
    const IGenArt721Core& core = Core(coreContract);
    const bool isArtist = !ctx.sender.IsNull() && core.ProjectIdToArtistAddress(projectId) == ctx.sender;
    Require(isArtist || core.AdminACLAllowed(ctx.sender, address_, selector), "Only Artist or Core Admin ACL");
}

void MinterFilterV2::RequireValidProjectId(uint64_t projectId, const uint160& coreContract) const
{
    const IGenArt721Core& core = Core(coreContract);
    Require(projectId < core.NextProjectId() && !core.ProjectIdToArtistAddress(projectId).IsNull(),
            "Only valid project ID");
}

} // namespace mintsuite
