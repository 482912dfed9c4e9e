// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_MINTER_SET_PRICE_H
#define MINTSUITE_MINTER_SET_PRICE_H

/**
 * @file minter_set_price.h
 * @brief Fixed-price minter
 *
 * The artist sets a price per token; purchasers pay at least that much and
 * are refunded the excess. A price of zero is a valid, free sale once set.
 */

#include <mintsuite/minter_base.h>

#include <cstdint>
#include <map>

namespace mintsuite {

/**
 * @brief Fixed price of one project
 */
struct SetPriceProjectConfig {
    CAmount pricePerTokenInWei;
    bool priceIsConfigured;

    SetPriceProjectConfig()
        : pricePerTokenInWei(0)
        , priceIsConfigured(false) {}
};

/**
 * @brief Fixed prices of every project served by a minter
 */
class SetPriceConfigs
{
public:
    SetPriceConfigs(Chain& chain, const uint160& owner);

    StateJournal& Journal() { return configs_; }

    /** Set a project's price; the caller is responsible for the artist check */
    void UpdatePricePerTokenInWei(const ProjectKey& key, const CAmount& pricePerTokenInWei);

    SetPriceProjectConfig GetConfig(const ProjectKey& key) const;

    /** @throws RevertError "Price not configured" */
    CAmount GetPriceRequireConfigured(const ProjectKey& key) const;

private:
    Chain& chain_;
    const uint160 owner_;
    Snapshotted<std::map<ProjectKey, SetPriceProjectConfig>> configs_;
};

class MinterSetPriceV5 : public MinterBase
{
public:
    MinterSetPriceV5(Chain& chain, const uint160& minterFilter);

    std::string MinterType() const override { return "MinterSetPriceV5"; }

    PriceInfo GetPriceInfo(uint64_t projectId, const uint160& coreContract) const override;

    /**
     * @brief Artist only; set the project's price and sync max invocations if unconfigured
     * @throws RevertError "Only Artist"
     */
    void UpdatePricePerTokenInWei(const CallContext& ctx, uint64_t projectId, const uint160& coreContract,
                                  const CAmount& pricePerTokenInWei);

    /** Purchase a token to the caller */
    uint64_t Purchase(const CallContext& ctx, uint64_t projectId, const uint160& coreContract);

    /**
     * @brief Purchase a token to another address
     * @throws RevertError "Max invocations reached", "Price not configured",
     *         "Min value to mint req."
     */
    uint64_t PurchaseTo(const CallContext& ctx, const uint160& to, uint64_t projectId, const uint160& coreContract);

    SetPriceProjectConfig SetPriceProjectConfigOf(uint64_t projectId, const uint160& coreContract) const;

private:
    uint64_t PurchaseToInternal(const CallContext& ctx, const uint160& to, const ProjectKey& key);

    SetPriceConfigs prices_;
};

} // namespace mintsuite

#endif // MINTSUITE_MINTER_SET_PRICE_H
