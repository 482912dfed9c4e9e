// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_CORE_REGISTRY_H
#define MINTSUITE_CORE_REGISTRY_H

/**
 * @file core_registry.h
 * @brief Registry of core contracts trusted by the minter filter
 *
 * The minter filter only assigns minters for projects on registered core
 * contracts, and holder-gated minters only accept NFTs from registered
 * core contracts.
 */

#include <mintsuite/admin_acl.h>
#include <mintsuite/enumerable.h>

#include <map>
#include <string>
#include <vector>

namespace mintsuite {

/**
 * @brief Registration metadata of a core contract
 */
struct CoreRegistration {
    /** Core version string, e.g. "v3.0.0" */
    std::string coreVersion;

    /** Core type string, e.g. "GenArt721CoreV3_Engine" */
    std::string coreType;
};

class CoreRegistryV1 : public AdminACLOwned
{
public:
    CoreRegistryV1(Chain& chain, const uint160& ownerAdminACL);

    std::string CoreRegistryType() const { return "CoreRegistryV1"; }

    /**
     * @brief Register a core contract
     * @throws RevertError "Only Admin ACL allowed" for unauthorized callers,
     *         "Only non-registered contracts" if already registered
     */
    void RegisterContract(const CallContext& ctx, const uint160& contract,
                          const std::string& coreVersion, const std::string& coreType);

    /**
     * @brief Unregister a core contract
     * @throws RevertError "Only registered contracts" if not registered
     */
    void UnregisterContract(const CallContext& ctx, const uint160& contract);

    /** Register several core contracts; arrays must have equal length */
    void RegisterContracts(const CallContext& ctx, const std::vector<uint160>& contracts,
                           const std::vector<std::string>& coreVersions,
                           const std::vector<std::string>& coreTypes);

    void UnregisterContracts(const CallContext& ctx, const std::vector<uint160>& contracts);

    bool IsRegisteredContract(const uint160& contract) const;

    size_t GetNumRegisteredContracts() const;

    /** @throws RevertError if index is out of bounds */
    uint160 GetRegisteredContractAt(size_t index) const;

    /** @throws RevertError "Only registered contracts" if not registered */
    CoreRegistration GetContractInfo(const uint160& contract) const;

private:
    struct State {
        EnumerableSet<uint160> registered;
        std::map<uint160, CoreRegistration> info;
    };

    void RegisterContractInternal(const uint160& contract, const std::string& coreVersion,
                                  const std::string& coreType);
    void UnregisterContractInternal(const uint160& contract);

    Snapshotted<State> state_;
};

} // namespace mintsuite

#endif // MINTSUITE_CORE_REGISTRY_H
