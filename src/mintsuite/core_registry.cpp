// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mintsuite/core_registry.h>

#include <util.h>

namespace mintsuite {

CoreRegistryV1::CoreRegistryV1(Chain& chain, const uint160& ownerAdminACL)
    : AdminACLOwned(chain, ownerAdminACL)
{
    Track(state_);
}

void CoreRegistryV1::RegisterContract(const CallContext& ctx, const uint160& contract,
                                      const std::string& coreVersion, const std::string& coreType)
{
    RequireAdminACL(ctx.sender, "registerContract", "Only Admin ACL allowed");
    RegisterContractInternal(contract, coreVersion, coreType);
}

void CoreRegistryV1::UnregisterContract(const CallContext& ctx, const uint160& contract)
{
    RequireAdminACL(ctx.sender, "unregisterContract", "Only Admin ACL allowed");
    UnregisterContractInternal(contract);
}

void CoreRegistryV1::RegisterContracts(const CallContext& ctx, const std::vector<uint160>& contracts,
                                       const std::vector<std::string>& coreVersions,
                                       const std::vector<std::string>& coreTypes)
{
    RequireAdminACL(ctx.sender, "registerContracts", "Only Admin ACL allowed");
    Require(contracts.size() == coreVersions.size() && contracts.size() == coreTypes.size(),
            "Mismatched array lengths");
    for (size_t i = 0; i < contracts.size(); ++i) {
        RegisterContractInternal(contracts[i], coreVersions[i], coreTypes[i]);
    }
}

void CoreRegistryV1::UnregisterContracts(const CallContext& ctx, const std::vector<uint160>& contracts)
{
    RequireAdminACL(ctx.sender, "unregisterContracts", "Only Admin ACL allowed");
    for (const uint160& contract : contracts) {
        UnregisterContractInternal(contract);
    }
}

bool CoreRegistryV1::IsRegisteredContract(const uint160& contract) const
{
    return state_->registered.Contains(contract);
}

size_t CoreRegistryV1::GetNumRegisteredContracts() const
{
    return state_->registered.Length();
}

uint160 CoreRegistryV1::GetRegisteredContractAt(size_t index) const
{
    return state_->registered.At(index);
}

CoreRegistration CoreRegistryV1::GetContractInfo(const uint160& contract) const
{
    auto it = state_->info.find(contract);
    Require(it != state_->info.end(), "Only registered contracts");
    return it->second;
}

void CoreRegistryV1::RegisterContractInternal(const uint160& contract, const std::string& coreVersion,
                                              const std::string& coreType)
{
    Require(!contract.IsNull(), "Only non-zero address");
    Require(state_->registered.Add(contract), "Only non-registered contracts");
    state_->info[contract] = CoreRegistration{coreVersion, coreType};

    chain_.EmitEvent(EventLog(address_, "ContractRegistered")
        .Add("contract", contract)
        .Add("coreVersion", coreVersion)
        .Add("coreType", coreType));
    LogPrint(MSLog::CORE, "CoreRegistry: Registered %s (%s %s)\n", contract.ToString(), coreType, coreVersion);
}

void CoreRegistryV1::UnregisterContractInternal(const uint160& contract)
{
    Require(state_->registered.Remove(contract), "Only registered contracts");
    state_->info.erase(contract);

    chain_.EmitEvent(EventLog(address_, "ContractUnregistered").Add("contract", contract));
    LogPrint(MSLog::CORE, "CoreRegistry: Unregistered %s\n", contract.ToString());
}

} // namespace mintsuite
