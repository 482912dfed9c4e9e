// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mintsuite/max_invocations.h>

#include <util.h>

namespace mintsuite {

MaxInvocationsTracker::MaxInvocationsTracker(Chain& chain, const uint160& owner)
    : chain_(chain)
    , owner_(owner)
{
}

void MaxInvocationsTracker::SyncProjectMaxInvocationsToCore(const ProjectKey& key, const IGenArt721Core& core)
{
    const ProjectStateData data = core.GetProjectStateData(key.projectId);

    MaxInvocationsProjectConfig& config = (*configs_)[key];
    config.maxInvocations = data.maxInvocations;
    // Optimistic: only ever clears the flag
    if (data.invocations < data.maxInvocations) {
        config.maxHasBeenInvoked = false;
    }

    EmitLimitUpdated(key, data.maxInvocations);
    LogPrint(MSLog::MINTER, "MaxInvocations: Synced %s to core cap %d (invocations %d)\n",
             key.ToString(), data.maxInvocations, data.invocations);
}

void MaxInvocationsTracker::ManuallyLimitProjectMaxInvocations(const ProjectKey& key, const IGenArt721Core& core,
                                                               uint64_t maxInvocations)
{
    const ProjectStateData data = core.GetProjectStateData(key.projectId);
    Require(maxInvocations <= data.maxInvocations, "Invalid max invocations");
    Require(maxInvocations >= data.invocations, "Invalid max invocations");

    MaxInvocationsProjectConfig& config = (*configs_)[key];
    config.maxInvocations = maxInvocations;
    config.maxHasBeenInvoked = (maxInvocations == data.invocations);

    EmitLimitUpdated(key, maxInvocations);
    LogPrint(MSLog::MINTER, "MaxInvocations: Limited %s to %d (invocations %d)\n",
             key.ToString(), maxInvocations, data.invocations);
}

void MaxInvocationsTracker::RefreshMaxInvocations(const ProjectKey& key, const IGenArt721Core& core)
{
    const MaxInvocationsProjectConfig config = GetConfig(key);
    if (config.maxInvocations == 0 && !config.maxHasBeenInvoked) {
        SyncProjectMaxInvocationsToCore(key, core);
    }
}

void MaxInvocationsTracker::PreMintChecks(const ProjectKey& key) const
{
    Require(!ProjectMaxHasBeenInvoked(key), "Max invocations reached");
}

void MaxInvocationsTracker::ValidatePurchaseEffectsInvocations(const ProjectKey& key, uint64_t tokenId,
                                                               const IGenArt721Core& core)
{
    const ProjectStateData data = core.GetProjectStateData(key.projectId);
    const uint64_t ordinal = InvocationFromTokenId(tokenId);
    Require(ProjectIdFromTokenId(tokenId) == key.projectId && data.invocations > 0 &&
            ordinal == data.invocations - 1, "Unexpected token id");

    MaxInvocationsProjectConfig& config = (*configs_)[key];
    if (config.maxInvocations > 0 && ordinal == config.maxInvocations - 1) {
        config.maxHasBeenInvoked = true;
        LogPrint(MSLog::MINTER, "MaxInvocations: %s reached its cap of %d\n", key.ToString(), config.maxInvocations);
    }
}

MaxInvocationsProjectConfig MaxInvocationsTracker::GetConfig(const ProjectKey& key) const
{
    auto it = configs_->find(key);
    if (it == configs_->end()) {
        return MaxInvocationsProjectConfig();
    }
    return it->second;
}

bool MaxInvocationsTracker::ProjectMaxHasBeenInvoked(const ProjectKey& key) const
{
    return GetConfig(key).maxHasBeenInvoked;
}

uint64_t MaxInvocationsTracker::ProjectMaxInvocations(const ProjectKey& key) const
{
    return GetConfig(key).maxInvocations;
}

bool MaxInvocationsTracker::ProjectMaxHasBeenInvokedSafe(const ProjectKey& key, const IGenArt721Core& core) const
{
    const MaxInvocationsProjectConfig config = GetConfig(key);
    if (config.maxHasBeenInvoked) {
        return true;
    }
    const ProjectStateData data = core.GetProjectStateData(key.projectId);
    if (data.invocations >= data.maxInvocations) {
        return true;
    }
    return config.maxInvocations > 0 && data.invocations >= config.maxInvocations;
}

void MaxInvocationsTracker::EmitLimitUpdated(const ProjectKey& key, uint64_t maxInvocations)
{
    chain_.EmitEvent(EventLog(owner_, "ProjectMaxInvocationsLimitUpdated")
        .Add("projectId", key.projectId)
        .Add("coreContract", key.coreContract)
        .Add("maxInvocations", maxInvocations));
}

} // namespace mintsuite
