// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_CORE_CONTRACT_H
#define MINTSUITE_CORE_CONTRACT_H

/**
 * @file core_contract.h
 * @brief Core token contract capability surface and reference implementation
 *
 * Minters only talk to core contracts through IGenArt721Core:
 * - artist lookup and admin ACL delegation for authorization
 * - invocation counters for the max-invocations cache
 * - mint entry point (callable only by the core's minter contract)
 * - primary revenue splits as raw 32-byte words, whose length tells
 *   flagship (6 words) and Engine (8 words) deployments apart
 * - token ownership and hash seeds for holder-gated and polyptych sales
 *
 * GenArt721Core is a reference core with just enough behaviour to serve
 * the minter suite: token transfer mechanics and metadata are out of scope.
 */

#include <mintsuite/abi.h>
#include <mintsuite/admin_acl.h>
#include <mintsuite/mintsuite_common.h>

#include <cstdint>
#include <map>
#include <string>

namespace mintsuite {

// ============================================================================
// Constants
// ============================================================================

/** Word count of a flagship revenue split */
static constexpr size_t FLAGSHIP_REVENUE_SPLIT_WORDS = 6;

/** Word count of an Engine revenue split (adds the platform provider) */
static constexpr size_t ENGINE_REVENUE_SPLIT_WORDS = 8;

/** Default render provider share of primary sales */
static constexpr uint32_t DEFAULT_RENDER_PROVIDER_PERCENTAGE = 10;

/** Default platform provider share of primary sales (Engine only) */
static constexpr uint32_t DEFAULT_PLATFORM_PROVIDER_PERCENTAGE = 10;

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief Authoritative per-project state of a core contract
 */
struct ProjectStateData {
    /** Tokens minted so far */
    uint64_t invocations;

    /** Authoritative cap; only ever decreases */
    uint64_t maxInvocations;

    bool active;
    bool paused;

    ProjectStateData()
        : invocations(0)
        , maxInvocations(0)
        , active(false)
        , paused(false) {}
};

/**
 * @brief Decoded primary revenue split of a project
 *
 * Percentages are 0..100. Flagship cores leave the platform provider empty.
 */
struct RevenueSplit {
    uint32_t renderProviderPercentage;
    uint160 renderProviderAddress;
    uint32_t platformProviderPercentage;
    uint160 platformProviderAddress;
    uint32_t artistPercentage;
    uint160 artistAddress;
    uint32_t additionalPayeePercentage;
    uint160 additionalPayeeAddress;

    RevenueSplit()
        : renderProviderPercentage(0)
        , platformProviderPercentage(0)
        , artistPercentage(0)
        , additionalPayeePercentage(0) {}
};

// ============================================================================
// IGenArt721Core
// ============================================================================

/**
 * @brief Core contract surface consumed by minters and the minter filter
 */
class IGenArt721Core
{
public:
    virtual ~IGenArt721Core() {}

    virtual std::string CoreType() const = 0;
    virtual std::string CoreVersion() const = 0;

    /** Next project id; valid ids are [startingProjectId, NextProjectId()) */
    virtual uint64_t NextProjectId() const = 0;

    /** Artist of a project, null if the project does not exist */
    virtual uint160 ProjectIdToArtistAddress(uint64_t projectId) const = 0;

    /** Forwarded to the core's owning admin ACL */
    virtual bool AdminACLAllowed(const uint160& sender, const uint160& contract, const std::string& selector) const = 0;

    /** @throws RevertError "Project ID does not exist" */
    virtual ProjectStateData GetProjectStateData(uint64_t projectId) const = 0;

    /**
     * @brief Mint the next token of a project
     * @param ctx Caller, must be the core's minter contract
     * @param to Token recipient
     * @param projectId Project to mint from
     * @param sender Purchaser on whose behalf the mint happens
     * @return New token id
     */
    virtual uint64_t Mint_Ecf(const CallContext& ctx, const uint160& to, uint64_t projectId, const uint160& sender) = 0;

    /**
     * @brief Primary revenue split as raw words
     *
     * Flagship: renderPct, renderAddr, artistPct, artistAddr, additionalPct, additionalAddr.
     * Engine: renderPct, renderAddr, platformPct, platformAddr, artistPct, artistAddr,
     *         additionalPct, additionalAddr.
     */
    virtual abi::Bytes GetPrimaryRevenueSplitsRaw(uint64_t projectId) const = 0;

    /** @throws RevertError "ERC721: invalid token ID" */
    virtual uint160 OwnerOf(uint64_t tokenId) const = 0;

    /** Hash seed of a token, null if unset */
    virtual uint96 TokenIdToHashSeed(uint64_t tokenId) const = 0;

    /** Assign a token hash seed; callable only by the core's hash seed setter contract */
    virtual void SetTokenHashSeed(const CallContext& ctx, uint64_t tokenId, const uint96& hashSeed) = 0;
};

// ============================================================================
// GenArt721Core
// ============================================================================

class GenArt721Core : public AdminACLOwned, public IGenArt721Core
{
public:
    /**
     * @param chain Hosting ledger
     * @param ownerAdminACL Owning admin ACL
     * @param isEngine Engine (8-word split) or flagship (6-word split)
     * @param renderProvider Render provider payee
     * @param platformProvider Platform provider payee (Engine only)
     * @param startingProjectId First project id
     */
    GenArt721Core(Chain& chain, const uint160& ownerAdminACL, bool isEngine,
                  const uint160& renderProvider, const uint160& platformProvider,
                  uint64_t startingProjectId = 0);

    // =========================================================================
    // IGenArt721Core
    // =========================================================================

    std::string CoreType() const override;
    std::string CoreVersion() const override { return "v3.2.0"; }
    uint64_t NextProjectId() const override;
    uint160 ProjectIdToArtistAddress(uint64_t projectId) const override;
    bool AdminACLAllowed(const uint160& sender, const uint160& contract, const std::string& selector) const override;
    ProjectStateData GetProjectStateData(uint64_t projectId) const override;
    uint64_t Mint_Ecf(const CallContext& ctx, const uint160& to, uint64_t projectId, const uint160& sender) override;
    abi::Bytes GetPrimaryRevenueSplitsRaw(uint64_t projectId) const override;
    uint160 OwnerOf(uint64_t tokenId) const override;
    uint96 TokenIdToHashSeed(uint64_t tokenId) const override;
    void SetTokenHashSeed(const CallContext& ctx, uint64_t tokenId, const uint96& hashSeed) override;

    // =========================================================================
    // Administration
    // =========================================================================

    bool IsEngine() const { return isEngine_; }

    /** Add a project; admin only. @return New project id */
    uint64_t AddProject(const CallContext& ctx, const std::string& name, const uint160& artist);

    void ToggleProjectIsActive(const CallContext& ctx, uint64_t projectId);

    /** Artist only */
    void ToggleProjectIsPaused(const CallContext& ctx, uint64_t projectId);

    /** Artist only; may only decrease, and never below invocations */
    void UpdateProjectMaxInvocations(const CallContext& ctx, uint64_t projectId, uint64_t maxInvocations);

    void UpdateProjectArtistAddress(const CallContext& ctx, uint64_t projectId, const uint160& artist);

    /** Artist only; percentage of the post-provider remainder */
    void UpdateProjectAdditionalPayeeInfo(const CallContext& ctx, uint64_t projectId,
                                          const uint160& payee, uint32_t percentage);

    void UpdateProviderSalesAddresses(const CallContext& ctx, const uint160& renderProvider,
                                      const uint160& platformProvider);

    void UpdateProviderPrimarySalesPercentages(const CallContext& ctx, uint32_t renderProviderPercentage,
                                               uint32_t platformProviderPercentage);

    void UpdateMinterContract(const CallContext& ctx, const uint160& minter);

    void UpdateHashSeedSetterContract(const CallContext& ctx, const uint160& hashSeedSetter);

    /** Projects with assigned hash seeds get their seeds from the hash seed setter instead of the core */
    void ToggleProjectUseAssignedHashSeed(const CallContext& ctx, uint64_t projectId);

    /** Move a token; owner only */
    void TransferFrom(const CallContext& ctx, const uint160& from, const uint160& to, uint64_t tokenId);

    uint160 MinterContract() const;
    uint160 HashSeedSetterContract() const;
    RevenueSplit GetPrimaryRevenueSplits(uint64_t projectId) const;

private:
    struct Project {
        std::string name;
        uint160 artistAddress;
        uint64_t invocations;
        uint64_t maxInvocations;
        bool active;
        bool paused;
        bool useAssignedHashSeed;
        uint160 additionalPayeeAddress;
        uint32_t additionalPayeePercentage;

        Project()
            : invocations(0)
            , maxInvocations(ONE_MILLION)
            , active(false)
            , paused(true)
            , useAssignedHashSeed(false)
            , additionalPayeePercentage(0) {}
    };

    struct State {
        uint64_t nextProjectId;
        std::map<uint64_t, Project> projects;
        std::map<uint64_t, uint160> owners;
        std::map<uint64_t, uint96> hashSeeds;
        uint160 minterContract;
        uint160 hashSeedSetterContract;
        uint160 renderProviderAddress;
        uint160 platformProviderAddress;
        uint32_t renderProviderPercentage;
        uint32_t platformProviderPercentage;
    };

    const Project& GetProject(uint64_t projectId) const;
    Project& GetProjectMutable(uint64_t projectId);
    void RequireArtist(const CallContext& ctx, uint64_t projectId) const;
    uint96 GenerateHashSeed(uint64_t tokenId) const;

    const bool isEngine_;
    Snapshotted<State> state_;
};

} // namespace mintsuite

#endif // MINTSUITE_CORE_CONTRACT_H
