// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mintsuite/minter_base.h>

#include <util.h>

namespace mintsuite {

MinterBase::MinterBase(Chain& chain, const uint160& minterFilter)
    : Contract(chain)
    , maxInvocations_(chain, address_)
    , splitFunds_(chain, address_)
    , minterFilter_(minterFilter)
{
    Track(maxInvocations_.Journal());
    Track(splitFunds_.Journal());
}

// ============================================================================
// Max invocations
// ============================================================================

void MinterBase::SyncProjectMaxInvocationsToCore(const CallContext& ctx, uint64_t projectId,
                                                 const uint160& coreContract)
{
    const ProjectKey key(coreContract, projectId);
    RequireArtist(ctx, key);
    maxInvocations_.SyncProjectMaxInvocationsToCore(key, Core(coreContract));
}

void MinterBase::ManuallyLimitProjectMaxInvocations(const CallContext& ctx, uint64_t projectId,
                                                    const uint160& coreContract, uint64_t maxInvocations)
{
    const ProjectKey key(coreContract, projectId);
    RequireArtist(ctx, key);
    maxInvocations_.ManuallyLimitProjectMaxInvocations(key, Core(coreContract), maxInvocations);
}

MaxInvocationsProjectConfig MinterBase::MaxInvocationsProjectConfigOf(uint64_t projectId,
                                                                     const uint160& coreContract) const
{
    return maxInvocations_.GetConfig(ProjectKey(coreContract, projectId));
}

bool MinterBase::ProjectMaxHasBeenInvoked(uint64_t projectId, const uint160& coreContract) const
{
    return maxInvocations_.ProjectMaxHasBeenInvoked(ProjectKey(coreContract, projectId));
}

uint64_t MinterBase::ProjectMaxInvocations(uint64_t projectId, const uint160& coreContract) const
{
    return maxInvocations_.ProjectMaxInvocations(ProjectKey(coreContract, projectId));
}

// ============================================================================
// Funds
// ============================================================================

bool MinterBase::IsEngineView(const uint160& coreContract) const
{
    return splitFunds_.IsEngineView(ProjectKey(coreContract, 0), Core(coreContract));
}

// ============================================================================
// Helpers
// ============================================================================

IGenArt721Core& MinterBase::Core(const uint160& coreContract) const
{
    return ContractAt<IGenArt721Core>(coreContract, "Only registered core contract");
}

MinterFilterV2& MinterBase::Filter() const
{
    return ContractAt<MinterFilterV2>(minterFilter_, "Only minter filter");
}

void MinterBase::RequireArtist(const CallContext& ctx, const ProjectKey& key) const
{
    const uint160 artist = Core(key.coreContract).ProjectIdToArtistAddress(key.projectId);
    Require(!artist.IsNull() && ctx.sender == artist, "Only Artist");
}

void MinterBase::RequireCoreAdminACL(const CallContext& ctx, const uint160& coreContract,
                                     const std::string& selector) const
{
    Require(Core(coreContract).AdminACLAllowed(ctx.sender, address_, selector), "Only Core AdminACL allowed");
}

void MinterBase::RequireMinterFilterAdminACL(const CallContext& ctx, const std::string& selector) const
{
    Require(Filter().MinterFilterAdminACLAllowed(ctx.sender, address_, selector), "Only MinterFilter AdminACL");
}

uint64_t MinterBase::MintAndValidateEffects(const uint160& to, const ProjectKey& key, const uint160& sender)
{
    const uint64_t tokenId = Filter().Mint(Self(), to, key.projectId, key.coreContract, sender);
    maxInvocations_.ValidatePurchaseEffectsInvocations(key, tokenId, Core(key.coreContract));

    LogPrint(MSLog::MINTER, "%s: Minted token %d of %s to %s\n", MinterType(), tokenId, key.ToString(), to.ToString());
    return tokenId;
}

} // namespace mintsuite
