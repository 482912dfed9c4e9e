// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mintsuite/token_holder.h>

#include <mintsuite/core_contract.h>
#include <mintsuite/minter_filter.h>
#include <util.h>

namespace mintsuite {

namespace {

template <typename T>
std::string JoinValues(const std::vector<T>& values)
{
    std::string out = "[";
    for (size_t i = 0; i < values.size(); i++) {
        if (i > 0) {
            out += ",";
        }
        out += strprintf("%s", values[i]);
    }
    return out + "]";
}

std::string JoinAddresses(const std::vector<uint160>& addresses)
{
    std::vector<std::string> strings;
    for (const uint160& addr : addresses) {
        strings.push_back(addr.ToString());
    }
    return JoinValues(strings);
}

} // namespace

TokenHolderAllowlist::TokenHolderAllowlist(Chain& chain, const uint160& owner)
    : chain_(chain)
    , owner_(owner)
{
}

void TokenHolderAllowlist::AllowHoldersOfProjects(const ProjectKey& key, const std::vector<uint160>& ownedNFTAddresses,
                                                  const std::vector<uint64_t>& ownedNFTProjectIds,
                                                  const MinterFilterV2& filter)
{
    AllowInternal(key, ownedNFTAddresses, ownedNFTProjectIds, filter);
}

void TokenHolderAllowlist::RemoveHoldersOfProjects(const ProjectKey& key, const std::vector<uint160>& ownedNFTAddresses,
                                                   const std::vector<uint64_t>& ownedNFTProjectIds)
{
    RemoveInternal(key, ownedNFTAddresses, ownedNFTProjectIds);
}

void TokenHolderAllowlist::AllowAndRemoveHoldersOfProjects(const ProjectKey& key,
                                                           const std::vector<uint160>& ownedNFTAddressesAdd,
                                                           const std::vector<uint64_t>& ownedNFTProjectIdsAdd,
                                                           const std::vector<uint160>& ownedNFTAddressesRemove,
                                                           const std::vector<uint64_t>& ownedNFTProjectIdsRemove,
                                                           const MinterFilterV2& filter)
{
    AllowInternal(key, ownedNFTAddressesAdd, ownedNFTProjectIdsAdd, filter);
    RemoveInternal(key, ownedNFTAddressesRemove, ownedNFTProjectIdsRemove);
}

void TokenHolderAllowlist::AllowInternal(const ProjectKey& key, const std::vector<uint160>& ownedNFTAddresses,
                                         const std::vector<uint64_t>& ownedNFTProjectIds, const MinterFilterV2& filter)
{
    Require(ownedNFTAddresses.size() == ownedNFTProjectIds.size(), "TokenHolderLib: arrays neq length");

    HolderSet& holders = (*allowlists_)[key];
    for (size_t i = 0; i < ownedNFTAddresses.size(); i++) {
        Require(filter.IsRegisteredCoreContract(ownedNFTAddresses[i]), "TokenHolderLib: address not registered");
        holders.insert(std::make_pair(ownedNFTAddresses[i], ownedNFTProjectIds[i]));
    }

    EmitHolderEvent("AllowedHoldersOfProjects", key, ownedNFTAddresses, ownedNFTProjectIds);
    LogPrint(MSLog::HOLDER, "TokenHolder: %s allowed %u holder projects (%u total)\n",
             key.ToString(), ownedNFTAddresses.size(), holders.size());
}

void TokenHolderAllowlist::RemoveInternal(const ProjectKey& key, const std::vector<uint160>& ownedNFTAddresses,
                                          const std::vector<uint64_t>& ownedNFTProjectIds)
{
    Require(ownedNFTAddresses.size() == ownedNFTProjectIds.size(), "TokenHolderLib: arrays neq length");

    auto it = allowlists_->find(key);
    if (it != allowlists_->end()) {
        for (size_t i = 0; i < ownedNFTAddresses.size(); i++) {
            it->second.erase(std::make_pair(ownedNFTAddresses[i], ownedNFTProjectIds[i]));
        }
    }

    EmitHolderEvent("RemovedHoldersOfProjects", key, ownedNFTAddresses, ownedNFTProjectIds);
    LogPrint(MSLog::HOLDER, "TokenHolder: %s removed %u holder projects\n", key.ToString(), ownedNFTAddresses.size());
}

bool TokenHolderAllowlist::IsAllowlistedNFT(const ProjectKey& key, const uint160& ownedNFTAddress,
                                            uint64_t ownedNFTTokenId) const
{
    auto it = allowlists_->find(key);
    if (it == allowlists_->end()) {
        return false;
    }
    return it->second.count(std::make_pair(ownedNFTAddress, ProjectIdFromTokenId(ownedNFTTokenId))) > 0;
}

std::vector<std::pair<uint160, uint64_t>> TokenHolderAllowlist::GetAllowlistedProjects(const ProjectKey& key) const
{
    auto it = allowlists_->find(key);
    if (it == allowlists_->end()) {
        return std::vector<std::pair<uint160, uint64_t>>();
    }
    return std::vector<std::pair<uint160, uint64_t>>(it->second.begin(), it->second.end());
}

void TokenHolderAllowlist::ValidateNFTOwnership(const uint160& ownedNFTAddress, uint64_t ownedNFTTokenId,
                                                const uint160& targetOwner) const
{
    const IGenArt721Core* nft = chain_.GetContractAs<IGenArt721Core>(ownedNFTAddress);
    Require(nft != nullptr, "Only owner of NFT");
    Require(nft->OwnerOf(ownedNFTTokenId) == targetOwner, "Only owner of NFT");
}

uint160 TokenHolderAllowlist::ResolvePurchaser(const uint160& purchaser, const uint160& vault,
                                               const uint160& ownedNFTAddress, uint64_t ownedNFTTokenId,
                                               const IDelegationRegistry* delegationRegistry) const
{
    if (vault.IsNull()) {
        return purchaser;
    }
    Require(delegationRegistry != nullptr &&
            delegationRegistry->CheckDelegateForToken(purchaser, vault, ownedNFTAddress, ownedNFTTokenId),
            "Invalid delegate-vault pairing");
    LogPrint(MSLog::HOLDER, "TokenHolder: %s purchasing for vault %s\n", purchaser.ToString(), vault.ToString());
    return vault;
}

void TokenHolderAllowlist::EmitHolderEvent(const std::string& name, const ProjectKey& key,
                                           const std::vector<uint160>& ownedNFTAddresses,
                                           const std::vector<uint64_t>& ownedNFTProjectIds)
{
    chain_.EmitEvent(EventLog(owner_, name)
        .Add("coreContract", key.coreContract)
        .Add("projectId", key.projectId)
        .Add("ownedNFTAddresses", JoinAddresses(ownedNFTAddresses))
        .Add("ownedNFTProjectIds", JoinValues(ownedNFTProjectIds)));
}

} // namespace mintsuite
