// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_MINTER_FILTER_H
#define MINTSUITE_MINTER_FILTER_H

/**
 * @file minter_filter.h
 * @brief Minter filter: the registry mapping projects to their minter
 *
 * The minter filter is the single choke point through which tokens are
 * minted. Each (core contract, project) pair has at most one assigned
 * minter, and only that minter may mint for the project.
 *
 * Authorization is two-tier:
 * - Global operations (global minter approvals, core registry updates) are
 *   gated by the filter's own admin ACL.
 * - Per-contract operations (per-contract approvals, minter removal) are
 *   gated by the core contract's admin ACL, and assignments by the project
 *   artist or the core admin ACL. The filter keeps no per-contract admin
 *   list of its own.
 *
 * Approval is only checked at assignment time. Revoking a minter's approval
 * leaves existing assignments in place.
 */

#include <mintsuite/admin_acl.h>
#include <mintsuite/core_contract.h>
#include <mintsuite/enumerable.h>
#include <mintsuite/mintsuite_common.h>

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mintsuite {

/**
 * @brief Surface every minter exposes to the filter and to off-chain callers
 */
class IFilteredMinter
{
public:
    virtual ~IFilteredMinter() {}

    virtual std::string MinterType() const = 0;
    virtual std::string MinterVersion() const = 0;
    virtual uint160 MinterFilterAddress() const = 0;

    /** Price information for a project */
    virtual PriceInfo GetPriceInfo(uint64_t projectId, const uint160& coreContract) const = 0;
};

/**
 * @brief A minter address with its reported type
 */
struct MinterWithType {
    uint160 minterAddress;
    std::string minterType;
};

/**
 * @brief An assignment as returned by enumeration
 */
struct ProjectAndMinterInfo {
    uint64_t projectId;
    uint160 minterAddress;
    std::string minterType;

    ProjectAndMinterInfo() : projectId(0) {}
};

class MinterFilterV2 : public AdminACLOwned
{
public:
    /**
     * @param chain Hosting ledger
     * @param ownerAdminACL Filter admin ACL
     * @param coreRegistry Registry of core contracts the filter serves
     */
    MinterFilterV2(Chain& chain, const uint160& ownerAdminACL, const uint160& coreRegistry);

    std::string MinterFilterType() const { return "MinterFilterV2"; }
    std::string MinterFilterVersion() const { return "v2.0.0"; }

    // =========================================================================
    // Filter admin operations
    // =========================================================================

    /** @throws RevertError "Only Admin ACL allowed", "Only non-zero address" */
    void UpdateCoreRegistry(const CallContext& ctx, const uint160& coreRegistry);

    /** @throws RevertError "Only Admin ACL allowed", "Minter already approved" */
    void ApproveMinterGlobally(const CallContext& ctx, const uint160& minter);

    /** @throws RevertError "Only Admin ACL allowed", "Only previously approved minter" */
    void RevokeMinterGlobally(const CallContext& ctx, const uint160& minter);

    // =========================================================================
    // Core admin operations
    // =========================================================================

    /**
     * @brief Approve a minter for a single core contract
     * @throws RevertError "Only registered core contract", "Only Core AdminACL allowed",
     *         "Minter already approved"
     */
    void ApproveMinterForContract(const CallContext& ctx, const uint160& coreContract, const uint160& minter);

    /** @throws RevertError "Only Core AdminACL allowed", "Only previously approved minter" */
    void RevokeMinterForContract(const CallContext& ctx, const uint160& coreContract, const uint160& minter);

    /**
     * @brief Assign a minter to a project, replacing any prior assignment
     *
     * Requires a registered core contract, the project artist or the core
     * admin ACL as caller, a minter approved globally or for the contract,
     * and a valid project id.
     */
    void SetMinterForProject(const CallContext& ctx, uint64_t projectId, const uint160& coreContract,
                             const uint160& minter);

    /** @throws RevertError "Only Core AdminACL allowed", "No minter assigned" */
    void RemoveMinterForProject(const CallContext& ctx, uint64_t projectId, const uint160& coreContract);

    /** Remove several assignments; each project must have a minter */
    void RemoveMintersForProjectsOnContract(const CallContext& ctx, const std::vector<uint64_t>& projectIds,
                                            const uint160& coreContract);

    // =========================================================================
    // Minting
    // =========================================================================

    /**
     * @brief Mint a token through the project's core contract
     * @param ctx Caller, must be the project's assigned minter
     * @param to Token recipient
     * @param projectId Project to mint
     * @param coreContract Core contract of the project
     * @param sender Purchaser on whose behalf the mint happens
     * @return New token id
     * @throws RevertError "Only assigned minter"
     */
    uint64_t Mint(const CallContext& ctx, const uint160& to, uint64_t projectId,
                  const uint160& coreContract, const uint160& sender);

    // =========================================================================
    // Views
    // =========================================================================

    /** @throws RevertError "No minter assigned" */
    uint160 GetMinterForProject(uint64_t projectId, const uint160& coreContract) const;

    bool ProjectHasMinter(uint64_t projectId, const uint160& coreContract) const;

    bool IsRegisteredCoreContract(const uint160& coreContract) const;

    bool IsGloballyApprovedMinter(const uint160& minter) const;

    /** True if the minter is approved globally or for the contract */
    bool IsApprovedMinterForContract(const uint160& coreContract, const uint160& minter) const;

    size_t GetNumProjectsOnContractWithMinters(const uint160& coreContract) const;

    /** @throws RevertError if index is out of bounds */
    ProjectAndMinterInfo GetProjectAndMinterInfoOnContractAt(const uint160& coreContract, size_t index) const;

    std::vector<MinterWithType> GetAllGloballyApprovedMinters() const;

    std::vector<MinterWithType> GetAllContractApprovedMinters(const uint160& coreContract) const;

    /** Number of projects, across all contracts, currently assigned to minter */
    uint64_t GetNumProjectsUsingMinter(const uint160& minter) const;

    uint160 CoreRegistryAddress() const;

    /** True if the filter's admin ACL allows sender to call selector on contract */
    bool MinterFilterAdminACLAllowed(const uint160& sender, const uint160& contract, const std::string& selector) const;

private:
    struct State {
        uint160 coreRegistry;
        EnumerableSet<uint160> globallyApproved;
        std::map<uint160, EnumerableSet<uint160>> contractApproved;
        std::map<uint160, EnumerableMap<uint64_t, uint160>> assignments;
        std::map<uint160, uint64_t> numProjectsUsingMinter;
    };

    IGenArt721Core& Core(const uint160& coreContract) const;
    std::string MinterTypeOf(const uint160& minter) const;
    void RequireRegisteredCore(const uint160& coreContract) const;
    void RequireCoreAdminACL(const CallContext& ctx, const uint160& coreContract, const std::string& selector) const;
    void RequireArtistOrCoreAdminACL(const CallContext& ctx, uint64_t projectId, const uint160& coreContract,
                                     const std::string& selector) const;
    void RequireValidProjectId(uint64_t projectId, const uint160& coreContract) const;
    void RemoveMinterForProjectInternal(uint64_t projectId, const uint160& coreContract);

    Snapshotted<State> state_;
};

} // namespace mintsuite

#endif // MINTSUITE_MINTER_FILTER_H
