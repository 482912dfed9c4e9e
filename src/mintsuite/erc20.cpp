// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mintsuite/erc20.h>

namespace mintsuite {

ERC20Token::ERC20Token(Chain& chain, const std::string& name, const std::string& symbol)
    : Contract(chain)
    , name_(name)
    , symbol_(symbol)
{
    Track(state_);
}

CAmount ERC20Token::TotalSupply() const
{
    return state_->totalSupply;
}

CAmount ERC20Token::BalanceOf(const uint160& account) const
{
    auto it = state_->balances.find(account);
    return it == state_->balances.end() ? CAmount(0) : it->second;
}

CAmount ERC20Token::Allowance(const uint160& owner, const uint160& spender) const
{
    auto it = state_->allowances.find(std::make_pair(owner, spender));
    return it == state_->allowances.end() ? CAmount(0) : it->second;
}

void ERC20Token::Mint(const uint160& to, const CAmount& amount)
{
    Require(!to.IsNull(), "ERC20: mint to the zero address");
    state_->totalSupply += amount;
    state_->balances[to] += amount;
    chain_.EmitEvent(EventLog(address_, "Transfer")
        .Add("from", uint160())
        .Add("to", to)
        .Add("value", amount));
}

void ERC20Token::Approve(const CallContext& ctx, const uint160& spender, const CAmount& amount)
{
    Require(!spender.IsNull(), "ERC20: approve to the zero address");
    state_->allowances[std::make_pair(ctx.sender, spender)] = amount;
    chain_.EmitEvent(EventLog(address_, "Approval")
        .Add("owner", ctx.sender)
        .Add("spender", spender)
        .Add("value", amount));
}

void ERC20Token::Transfer(const CallContext& ctx, const uint160& to, const CAmount& amount)
{
    TransferInternal(ctx.sender, to, amount);
}

void ERC20Token::TransferFrom(const CallContext& ctx, const uint160& from, const uint160& to, const CAmount& amount)
{
    CAmount& allowance = state_->allowances[std::make_pair(from, ctx.sender)];
    Require(allowance >= amount, "ERC20: insufficient allowance");
    allowance -= amount;
    TransferInternal(from, to, amount);
}

void ERC20Token::TransferInternal(const uint160& from, const uint160& to, const CAmount& amount)
{
    Require(!to.IsNull(), "ERC20: transfer to the zero address");
    CAmount& fromBalance = state_->balances[from];
    Require(fromBalance >= amount, "ERC20: transfer amount exceeds balance");
    fromBalance -= amount;
    state_->balances[to] += amount;

    chain_.EmitEvent(EventLog(address_, "Transfer")
        .Add("from", from)
        .Add("to", to)
        .Add("value", amount));
}

} // namespace mintsuite
