// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_ERC20_H
#define MINTSUITE_ERC20_H

/**
 * @file erc20.h
 * @brief Fungible token used as an alternative sale currency
 */

#include <mintsuite/chain.h>

#include <map>
#include <string>
#include <utility>

namespace mintsuite {

/**
 * @brief ERC20 surface consumed by the ERC20 funds splitter
 */
class IERC20
{
public:
    virtual ~IERC20() {}

    virtual std::string Symbol() const = 0;
    virtual CAmount BalanceOf(const uint160& account) const = 0;
    virtual CAmount Allowance(const uint160& owner, const uint160& spender) const = 0;
    virtual void TransferFrom(const CallContext& ctx, const uint160& from, const uint160& to, const CAmount& amount) = 0;
};

class ERC20Token : public Contract, public IERC20
{
public:
    ERC20Token(Chain& chain, const std::string& name, const std::string& symbol);

    std::string Name() const { return name_; }
    std::string Symbol() const override { return symbol_; }
    unsigned int Decimals() const { return 18; }

    CAmount TotalSupply() const;
    CAmount BalanceOf(const uint160& account) const override;
    CAmount Allowance(const uint160& owner, const uint160& spender) const override;

    /** Create tokens out of thin air (test and simulator faucet) */
    void Mint(const uint160& to, const CAmount& amount);

    void Approve(const CallContext& ctx, const uint160& spender, const CAmount& amount);

    void Transfer(const CallContext& ctx, const uint160& to, const CAmount& amount);

    /**
     * @brief Move tokens on behalf of from, consuming the caller's allowance
     * @throws RevertError "ERC20: insufficient allowance", "ERC20: transfer amount exceeds balance",
     *         "ERC20: transfer to the zero address"
     */
    void TransferFrom(const CallContext& ctx, const uint160& from, const uint160& to, const CAmount& amount) override;

private:
    struct State {
        CAmount totalSupply;
        std::map<uint160, CAmount> balances;
        std::map<std::pair<uint160, uint160>, CAmount> allowances;

        State() : totalSupply(0) {}
    };

    void TransferInternal(const uint160& from, const uint160& to, const CAmount& amount);

    const std::string name_;
    const std::string symbol_;
    Snapshotted<State> state_;
};

} // namespace mintsuite

#endif // MINTSUITE_ERC20_H
