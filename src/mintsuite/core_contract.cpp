// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mintsuite/core_contract.h>

#include <util.h>

#include <vector>

namespace mintsuite {

namespace {

/** SplitMix64 finalizer */
uint64_t MixBits(uint64_t x)
{
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

} // namespace

GenArt721Core::GenArt721Core(Chain& chain, const uint160& ownerAdminACL, bool isEngine,
                             const uint160& renderProvider, const uint160& platformProvider,
                             uint64_t startingProjectId)
    : AdminACLOwned(chain, ownerAdminACL)
    , isEngine_(isEngine)
{
    state_->nextProjectId = startingProjectId;
    state_->renderProviderAddress = renderProvider;
    state_->platformProviderAddress = isEngine ? platformProvider : uint160();
    state_->renderProviderPercentage = DEFAULT_RENDER_PROVIDER_PERCENTAGE;
    state_->platformProviderPercentage = isEngine ? DEFAULT_PLATFORM_PROVIDER_PERCENTAGE : 0;
    Track(state_);
}

// ============================================================================
// IGenArt721Core
// ============================================================================

std::string GenArt721Core::CoreType() const
{
    return isEngine_ ? "GenArt721CoreV3_Engine" : "GenArt721CoreV3";
}

uint64_t GenArt721Core::NextProjectId() const
{
    return state_->nextProjectId;
}

uint160 GenArt721Core::ProjectIdToArtistAddress(uint64_t projectId) const
{
    auto it = state_->projects.find(projectId);
    if (it == state_->projects.end()) {
        return uint160();
    }
    return it->second.artistAddress;
}

bool GenArt721Core::AdminACLAllowed(const uint160& sender, const uint160& contract, const std::string& selector) const
{
    return OwnerAdminACLAllowed(sender, contract, selector);
}

ProjectStateData GenArt721Core::GetProjectStateData(uint64_t projectId) const
{
    const Project& project = GetProject(projectId);
    ProjectStateData data;
    data.invocations = project.invocations;
    data.maxInvocations = project.maxInvocations;
    data.active = project.active;
    data.paused = project.paused;
    return data;
}

uint64_t GenArt721Core::Mint_Ecf(const CallContext& ctx, const uint160& to, uint64_t projectId, const uint160& sender)
{
    Require(ctx.sender == state_->minterContract, "Must mint from minter contract");
    Project& project = GetProjectMutable(projectId);
    Require(project.invocations + 1 <= project.maxInvocations, "Must not exceed max invocations");
    Require(project.active || sender == project.artistAddress, "Project must exist and be active");
    Require(!project.paused || sender == project.artistAddress, "Purchases are paused.");
    Require(!to.IsNull(), "ERC721: mint to the zero address");

    const uint64_t tokenId = MakeTokenId(projectId, project.invocations);
    project.invocations += 1;
    state_->owners[tokenId] = to;
    if (!project.useAssignedHashSeed) {
        state_->hashSeeds[tokenId] = GenerateHashSeed(tokenId);
    }

    chain_.EmitEvent(EventLog(address_, "Mint")
        .Add("to", to)
        .Add("tokenId", tokenId));
    LogPrint(MSLog::CORE, "GenArt721Core: Minted token %d of project %d to %s\n",
             tokenId, projectId, to.ToString());
    return tokenId;
}

abi::Bytes GenArt721Core::GetPrimaryRevenueSplitsRaw(uint64_t projectId) const
{
    RevenueSplit split = GetPrimaryRevenueSplits(projectId);

    abi::Bytes out;
    abi::AppendUint(out, split.renderProviderPercentage);
    abi::AppendAddress(out, split.renderProviderAddress);
    if (isEngine_) {
        abi::AppendUint(out, split.platformProviderPercentage);
        abi::AppendAddress(out, split.platformProviderAddress);
    }
    abi::AppendUint(out, split.artistPercentage);
    abi::AppendAddress(out, split.artistAddress);
    abi::AppendUint(out, split.additionalPayeePercentage);
    abi::AppendAddress(out, split.additionalPayeeAddress);
    return out;
}

uint160 GenArt721Core::OwnerOf(uint64_t tokenId) const
{
    auto it = state_->owners.find(tokenId);
    Require(it != state_->owners.end(), "ERC721: invalid token ID");
    return it->second;
}

uint96 GenArt721Core::TokenIdToHashSeed(uint64_t tokenId) const
{
    auto it = state_->hashSeeds.find(tokenId);
    if (it == state_->hashSeeds.end()) {
        return uint96();
    }
    return it->second;
}

void GenArt721Core::SetTokenHashSeed(const CallContext& ctx, uint64_t tokenId, const uint96& hashSeed)
{
    Require(ctx.sender == state_->hashSeedSetterContract, "Only hashSeedSetterContract");
    Require(state_->owners.count(tokenId) > 0, "ERC721: invalid token ID");
    Require(GetProject(ProjectIdFromTokenId(tokenId)).useAssignedHashSeed, "Only assigned hash seed projects");
    state_->hashSeeds[tokenId] = hashSeed;
}

// ============================================================================
// Administration
// ============================================================================

uint64_t GenArt721Core::AddProject(const CallContext& ctx, const std::string& name, const uint160& artist)
{
    RequireAdminACL(ctx.sender, "addProject", "Only Admin ACL allowed");
    Require(!artist.IsNull(), "Only non-zero address");

    const uint64_t projectId = state_->nextProjectId;
    Project project;
    project.name = name;
    project.artistAddress = artist;
    state_->projects[projectId] = project;
    state_->nextProjectId += 1;

    chain_.EmitEvent(EventLog(address_, "ProjectUpdated")
        .Add("projectId", projectId)
        .Add("update", "created"));
    LogPrint(MSLog::CORE, "GenArt721Core: Added project %d \"%s\" for artist %s\n",
             projectId, name, artist.ToString());
    return projectId;
}

void GenArt721Core::ToggleProjectIsActive(const CallContext& ctx, uint64_t projectId)
{
    RequireAdminACL(ctx.sender, "toggleProjectIsActive", "Only Admin ACL allowed");
    Project& project = GetProjectMutable(projectId);
    project.active = !project.active;
}

void GenArt721Core::ToggleProjectIsPaused(const CallContext& ctx, uint64_t projectId)
{
    RequireArtist(ctx, projectId);
    Project& project = GetProjectMutable(projectId);
    project.paused = !project.paused;
}

void GenArt721Core::UpdateProjectMaxInvocations(const CallContext& ctx, uint64_t projectId, uint64_t maxInvocations)
{
    RequireArtist(ctx, projectId);
    Project& project = GetProjectMutable(projectId);
    Require(maxInvocations < project.maxInvocations, "Only maxInvocations decrease");
    Require(maxInvocations >= project.invocations, "Only gte invocations");
    project.maxInvocations = maxInvocations;

    chain_.EmitEvent(EventLog(address_, "ProjectUpdated")
        .Add("projectId", projectId)
        .Add("update", "maxInvocations"));
}

void GenArt721Core::UpdateProjectArtistAddress(const CallContext& ctx, uint64_t projectId, const uint160& artist)
{
    RequireAdminACL(ctx.sender, "updateProjectArtistAddress", "Only Admin ACL allowed");
    Require(!artist.IsNull(), "Only non-zero address");
    GetProjectMutable(projectId).artistAddress = artist;
}

void GenArt721Core::UpdateProjectAdditionalPayeeInfo(const CallContext& ctx, uint64_t projectId,
                                                     const uint160& payee, uint32_t percentage)
{
    RequireArtist(ctx, projectId);
    Require(percentage <= 100, "Max of 100%");
    Project& project = GetProjectMutable(projectId);
    project.additionalPayeeAddress = payee;
    project.additionalPayeePercentage = percentage;
}

void GenArt721Core::UpdateProviderSalesAddresses(const CallContext& ctx, const uint160& renderProvider,
                                                 const uint160& platformProvider)
{
    RequireAdminACL(ctx.sender, "updateProviderSalesAddresses", "Only Admin ACL allowed");
    state_->renderProviderAddress = renderProvider;
    if (isEngine_) {
        state_->platformProviderAddress = platformProvider;
    }
}

void GenArt721Core::UpdateProviderPrimarySalesPercentages(const CallContext& ctx, uint32_t renderProviderPercentage,
                                                          uint32_t platformProviderPercentage)
{
    RequireAdminACL(ctx.sender, "updateProviderPrimarySalesPercentages", "Only Admin ACL allowed");
    if (!isEngine_) {
        platformProviderPercentage = 0;
    }
    Require(renderProviderPercentage + platformProviderPercentage <= 100, "Max of 100%");
    state_->renderProviderPercentage = renderProviderPercentage;
    state_->platformProviderPercentage = platformProviderPercentage;
}

void GenArt721Core::UpdateMinterContract(const CallContext& ctx, const uint160& minter)
{
    RequireAdminACL(ctx.sender, "updateMinterContract", "Only Admin ACL allowed");
    Require(!minter.IsNull(), "Only non-zero address");
    state_->minterContract = minter;

    chain_.EmitEvent(EventLog(address_, "MinterUpdated").Add("minter", minter));
}

void GenArt721Core::UpdateHashSeedSetterContract(const CallContext& ctx, const uint160& hashSeedSetter)
{
    RequireAdminACL(ctx.sender, "updateHashSeedSetterContract", "Only Admin ACL allowed");
    state_->hashSeedSetterContract = hashSeedSetter;
}

void GenArt721Core::ToggleProjectUseAssignedHashSeed(const CallContext& ctx, uint64_t projectId)
{
    RequireAdminACL(ctx.sender, "toggleProjectUseAssignedHashSeed", "Only Admin ACL allowed");
    Project& project = GetProjectMutable(projectId);
    project.useAssignedHashSeed = !project.useAssignedHashSeed;
}

void GenArt721Core::TransferFrom(const CallContext& ctx, const uint160& from, const uint160& to, uint64_t tokenId)
{
    Require(OwnerOf(tokenId) == from, "ERC721: transfer from incorrect owner");
    Require(ctx.sender == from, "ERC721: caller is not token owner");
    Require(!to.IsNull(), "ERC721: transfer to the zero address");
    state_->owners[tokenId] = to;

    chain_.EmitEvent(EventLog(address_, "Transfer")
        .Add("from", from)
        .Add("to", to)
        .Add("tokenId", tokenId));
}

uint160 GenArt721Core::MinterContract() const
{
    return state_->minterContract;
}

uint160 GenArt721Core::HashSeedSetterContract() const
{
    return state_->hashSeedSetterContract;
}

RevenueSplit GenArt721Core::GetPrimaryRevenueSplits(uint64_t projectId) const
{
    // Unknown projects report an empty split, with the shape still telling engine and flagship apart
    auto it = state_->projects.find(projectId);
    const Project project = (it == state_->projects.end()) ? Project() : it->second;

    RevenueSplit split;
    split.renderProviderPercentage = state_->renderProviderPercentage;
    split.renderProviderAddress = state_->renderProviderAddress;
    split.platformProviderPercentage = state_->platformProviderPercentage;
    split.platformProviderAddress = state_->platformProviderAddress;
    split.artistPercentage = 100 - project.additionalPayeePercentage;
    split.artistAddress = project.artistAddress;
    split.additionalPayeePercentage = project.additionalPayeePercentage;
    split.additionalPayeeAddress = project.additionalPayeeAddress;
    return split;
}

// ============================================================================
// Helpers
// ============================================================================

const GenArt721Core::Project& GenArt721Core::GetProject(uint64_t projectId) const
{
    auto it = state_->projects.find(projectId);
    Require(it != state_->projects.end(), "Project ID does not exist");
    return it->second;
}

GenArt721Core::Project& GenArt721Core::GetProjectMutable(uint64_t projectId)
{
    auto it = state_->projects.find(projectId);
    Require(it != state_->projects.end(), "Project ID does not exist");
    return it->second;
}

void GenArt721Core::RequireArtist(const CallContext& ctx, uint64_t projectId) const
{
    Require(ctx.sender == GetProject(projectId).artistAddress, "Only artist");
}

uint96 GenArt721Core::GenerateHashSeed(uint64_t tokenId) const
{
    uint64_t a = MixBits(tokenId ^ address_.GetUint64(0));
    uint64_t b = MixBits(a ^ static_cast<uint64_t>(chain_.GetBlockTimestamp()));
    std::vector<unsigned char> bytes(uint96::size(), 0);
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<unsigned char>(a >> (8 * i));
    }
    for (int i = 0; i < 4; ++i) {
        bytes[8 + i] = static_cast<unsigned char>(b >> (8 * i));
    }
    // A null seed means "unset"
    if (uint96(bytes).IsNull()) {
        bytes[0] = 1;
    }
    return uint96(bytes);
}

} // namespace mintsuite
