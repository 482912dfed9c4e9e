// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mintsuite/delegation_registry.h>

#include <util.h>

namespace mintsuite {

DelegationRegistry::DelegationRegistry(Chain& chain)
    : Contract(chain)
{
    Track(state_);
}

void DelegationRegistry::DelegateForAll(const CallContext& ctx, const uint160& delegate, bool value)
{
    auto key = std::make_pair(ctx.sender, delegate);
    if (value) {
        state_->all.insert(key);
    } else {
        state_->all.erase(key);
    }
    chain_.EmitEvent(EventLog(address_, "DelegateForAll")
        .Add("vault", ctx.sender)
        .Add("delegate", delegate)
        .Add("value", value));
    LogPrint(MSLog::HOLDER, "DelegationRegistry: %s %s wallet delegation to %s\n",
             ctx.sender.ToString(), value ? "granted" : "revoked", delegate.ToString());
}

void DelegationRegistry::DelegateForContract(const CallContext& ctx, const uint160& delegate,
                                             const uint160& contract, bool value)
{
    auto key = std::make_tuple(ctx.sender, delegate, contract);
    if (value) {
        state_->contracts.insert(key);
    } else {
        state_->contracts.erase(key);
    }
    chain_.EmitEvent(EventLog(address_, "DelegateForContract")
        .Add("vault", ctx.sender)
        .Add("delegate", delegate)
        .Add("contract", contract)
        .Add("value", value));
}

void DelegationRegistry::DelegateForToken(const CallContext& ctx, const uint160& delegate,
                                          const uint160& contract, uint64_t tokenId, bool value)
{
    auto key = std::make_tuple(ctx.sender, delegate, contract, tokenId);
    if (value) {
        state_->tokens.insert(key);
    } else {
        state_->tokens.erase(key);
    }
    chain_.EmitEvent(EventLog(address_, "DelegateForToken")
        .Add("vault", ctx.sender)
        .Add("delegate", delegate)
        .Add("contract", contract)
        .Add("tokenId", tokenId)
        .Add("value", value));
}

bool DelegationRegistry::CheckDelegateForAll(const uint160& delegate, const uint160& vault) const
{
    return state_->all.count(std::make_pair(vault, delegate)) > 0;
}

bool DelegationRegistry::CheckDelegateForContract(const uint160& delegate, const uint160& vault,
                                                  const uint160& contract) const
{
    return CheckDelegateForAll(delegate, vault) ||
           state_->contracts.count(std::make_tuple(vault, delegate, contract)) > 0;
}

bool DelegationRegistry::CheckDelegateForToken(const uint160& delegate, const uint160& vault,
                                               const uint160& contract, uint64_t tokenId) const
{
    return CheckDelegateForContract(delegate, vault, contract) ||
           state_->tokens.count(std::make_tuple(vault, delegate, contract, tokenId)) > 0;
}

} // namespace mintsuite
