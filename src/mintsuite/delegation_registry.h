// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_DELEGATION_REGISTRY_H
#define MINTSUITE_DELEGATION_REGISTRY_H

/**
 * @file delegation_registry.h
 * @brief Vault/delegate registry used for holder-gated purchases
 *
 * A vault (the wallet holding an NFT) may delegate to a hot wallet at three
 * scopes: everything, one contract, or one token. A token-level check is
 * satisfied by a delegation at any of the three scopes.
 */

#include <mintsuite/chain.h>

#include <set>
#include <tuple>

namespace mintsuite {

/**
 * @brief Capability check used by holder-gated minters
 */
class IDelegationRegistry
{
public:
    virtual ~IDelegationRegistry() {}

    /**
     * @brief True if delegate may act for vault on a specific token
     *
     * Implies the contract-level and wallet-level checks: a delegation at
     * either broader scope also satisfies this query.
     */
    virtual bool CheckDelegateForToken(const uint160& delegate, const uint160& vault,
                                       const uint160& contract, uint64_t tokenId) const = 0;
};

class DelegationRegistry : public Contract, public IDelegationRegistry
{
public:
    explicit DelegationRegistry(Chain& chain);

    /** Caller (the vault) delegates everything to delegate, or revokes it */
    void DelegateForAll(const CallContext& ctx, const uint160& delegate, bool value);

    /** Caller (the vault) delegates one contract to delegate, or revokes it */
    void DelegateForContract(const CallContext& ctx, const uint160& delegate, const uint160& contract, bool value);

    /** Caller (the vault) delegates one token to delegate, or revokes it */
    void DelegateForToken(const CallContext& ctx, const uint160& delegate, const uint160& contract,
                          uint64_t tokenId, bool value);

    bool CheckDelegateForAll(const uint160& delegate, const uint160& vault) const;

    bool CheckDelegateForContract(const uint160& delegate, const uint160& vault, const uint160& contract) const;

    bool CheckDelegateForToken(const uint160& delegate, const uint160& vault,
                               const uint160& contract, uint64_t tokenId) const override;

private:
    struct State {
        std::set<std::pair<uint160, uint160>> all;
        std::set<std::tuple<uint160, uint160, uint160>> contracts;
        std::set<std::tuple<uint160, uint160, uint160, uint64_t>> tokens;
    };

    Snapshotted<State> state_;
};

} // namespace mintsuite

#endif // MINTSUITE_DELEGATION_REGISTRY_H
