// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_MINTER_SET_PRICE_ERC20_H
#define MINTSUITE_MINTER_SET_PRICE_ERC20_H

/**
 * @file minter_set_price_erc20.h
 * @brief Fixed-price minter selling in an ERC20 currency
 *
 * The artist picks the currency per project. Purchasers approve the minter
 * to pull the price; each revenue leg is pulled straight from the
 * purchaser to its payee. Native value is refused.
 */

#include <mintsuite/minter_set_price.h>

#include <cstdint>
#include <string>

namespace mintsuite {

class MinterSetPriceERC20V5 : public MinterBase
{
public:
    MinterSetPriceERC20V5(Chain& chain, const uint160& minterFilter);

    std::string MinterType() const override { return "MinterSetPriceERC20V5"; }

    /** Configured only once both a price and a currency are set */
    PriceInfo GetPriceInfo(uint64_t projectId, const uint160& coreContract) const override;

    /** Artist only */
    void UpdatePricePerTokenInWei(const CallContext& ctx, uint64_t projectId, const uint160& coreContract,
                                  const CAmount& pricePerTokenInWei);

    /**
     * @brief Artist only; sell the project in an ERC20 currency
     * @throws RevertError "Only Artist", "null address, only ERC20", "only non-null symbol"
     */
    void UpdateProjectCurrencyInfo(const CallContext& ctx, uint64_t projectId, const uint160& coreContract,
                                   const std::string& currencySymbol, const uint160& currencyAddress);

    /**
     * @brief Purchase a token to the caller
     *
     * @param maxPricePerToken Highest price the purchaser accepts
     * @param currencyAddress Currency the purchaser expects to pay in
     */
    uint64_t Purchase(const CallContext& ctx, uint64_t projectId, const uint160& coreContract,
                      const CAmount& maxPricePerToken, const uint160& currencyAddress);

    /**
     * @brief Purchase a token to another address
     * @throws RevertError "ERC20: No ETH when using ERC20", "ERC20: payment not configured",
     *         "Currency addresses must match", "Only max price gte token price",
     *         "Insufficient ERC20 allowance", "Insufficient ERC20 balance"
     */
    uint64_t PurchaseTo(const CallContext& ctx, const uint160& to, uint64_t projectId, const uint160& coreContract,
                        const CAmount& maxPricePerToken, const uint160& currencyAddress);

    ProjectCurrencyInfo GetProjectCurrencyInfo(uint64_t projectId, const uint160& coreContract) const;

    /** Balance of account in the project's currency */
    CAmount GetYourBalanceOfProjectERC20(uint64_t projectId, const uint160& coreContract,
                                         const uint160& account) const;

    /** Allowance account gave this minter in the project's currency */
    CAmount CheckYourAllowanceOfProjectERC20(uint64_t projectId, const uint160& coreContract,
                                             const uint160& account) const;

private:
    uint64_t PurchaseToInternal(const CallContext& ctx, const uint160& to, const ProjectKey& key,
                                const CAmount& maxPricePerToken, const uint160& currencyAddress);
    IERC20& ProjectCurrency(const ProjectKey& key) const;

    SetPriceConfigs prices_;
};

} // namespace mintsuite

#endif // MINTSUITE_MINTER_SET_PRICE_ERC20_H
