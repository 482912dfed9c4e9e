// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <mintsuite/chain.h>

#include <util.h>
#include <utilmoneystr.h>

#include <algorithm>

namespace mintsuite {

// ============================================================================
// EventLog
// ============================================================================

std::optional<std::string> EventLog::Get(const std::string& key) const
{
    for (const auto& field : fields) {
        if (field.first == key) {
            return field.second;
        }
    }
    return std::nullopt;
}

std::string EventLog::ToString() const
{
    std::string str = name + "(";
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            str += ", ";
        }
        str += fields[i].first + "=" + fields[i].second;
    }
    str += ")";
    return str;
}

// ============================================================================
// Contract
// ============================================================================

Contract::Contract(Chain& chain)
    : chain_(chain)
    , address_(chain.RegisterContract(this))
{
}

Contract::~Contract()
{
    for (StateJournal* journal : journals_) {
        chain_.UnregisterJournal(journal);
    }
    chain_.UnregisterContract(this);
}

void Contract::OnReceive(const CallContext& ctx)
{
    throw RevertError("Contract does not accept value");
}

void Contract::Track(StateJournal& journal)
{
    journals_.push_back(&journal);
    chain_.RegisterJournal(&journal);
}

// ============================================================================
// Chain::Frame
// ============================================================================

Chain::Frame::Frame(Chain& chain)
    : chain_(chain)
    , committed_(false)
{
    chain_.SaveSnapshot();
    ++chain_.depth_;
}

Chain::Frame::~Frame()
{
    --chain_.depth_;
    if (!committed_) {
        chain_.RevertToSnapshot();
    }
}

void Chain::Frame::Commit()
{
    chain_.CommitSnapshot();
    committed_ = true;
}

// ============================================================================
// Chain
// ============================================================================

Chain::Chain()
    : nextAddress_(1)
    , blockTimestamp_(0)
    , depth_(0)
{
    journals_.push_back(&balances_);
    journals_.push_back(&pendingEvents_);
}

Chain::~Chain()
{
    NotifyEventEmitted.disconnect_all_slots();
}

uint160 Chain::NewAddress()
{
    LOCK(cs_chain_);
    std::vector<unsigned char> bytes(uint160::size(), 0);
    uint64_t n = nextAddress_++;
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<unsigned char>(n >> (8 * i));
    }
    // Tag byte keeps allocated addresses away from the null address
    bytes[uint160::size() - 1] = 0x4d;
    return uint160(bytes);
}

CAmount Chain::GetBalance(const uint160& account) const
{
    LOCK(cs_chain_);
    auto it = balances_->find(account);
    if (it == balances_->end()) {
        return 0;
    }
    return it->second;
}

void Chain::Fund(const uint160& account, const CAmount& amount)
{
    LOCK(cs_chain_);
    (*balances_)[account] += amount;
}

int64_t Chain::GetBlockTimestamp() const
{
    LOCK(cs_chain_);
    return blockTimestamp_;
}

void Chain::SetBlockTimestamp(int64_t timestamp)
{
    LOCK(cs_chain_);
    blockTimestamp_ = timestamp;
}

void Chain::AdvanceTime(int64_t seconds)
{
    LOCK(cs_chain_);
    blockTimestamp_ += seconds;
}

Contract* Chain::GetContract(const uint160& addr) const
{
    LOCK(cs_chain_);
    auto it = contracts_.find(addr);
    if (it == contracts_.end()) {
        return nullptr;
    }
    return it->second;
}

TxResult Chain::Execute(const uint160& from, const uint160& to, const CAmount& value,
                        const std::function<void (const CallContext&)>& func)
{
    LOCK(cs_chain_);
    const bool topLevel = (depth_ == 0);
    {
        Frame frame(*this);
        try {
            if (value > 0) {
                MoveBalance(from, to, value);
            }
            func(CallContext(from, value));
        } catch (const RevertError& e) {
            LogPrint(MSLog::CHAIN, "Chain: Transaction from %s reverted: %s\n", from.ToString(), e.what());
            return TxResult::Failure(e.what());
        }
        frame.Commit();
    }
    if (topLevel) {
        PublishEvents();
    }
    return TxResult::Success();
}

TxResult Chain::Execute(const uint160& from, const std::function<void (const CallContext&)>& func)
{
    return Execute(from, uint160(), CAmount(0), func);
}

bool Chain::SendValue(const uint160& from, const uint160& to, const CAmount& amount)
{
    LOCK(cs_chain_);
    Frame frame(*this);
    try {
        MoveBalance(from, to, amount);
        Contract* recipient = GetContract(to);
        if (recipient != nullptr) {
            recipient->OnReceive(CallContext(from, amount));
        }
    } catch (const RevertError& e) {
        LogPrint(MSLog::CHAIN, "Chain: Transfer of %s from %s to %s failed: %s\n",
                 FormatMoney(amount), from.ToString(), to.ToString(), e.what());
        return false;
    }
    frame.Commit();
    return true;
}

void Chain::EmitEvent(const EventLog& log)
{
    LOCK(cs_chain_);
    pendingEvents_->push_back(log);
    if (depth_ == 0) {
        // Emitted outside of a transaction (e.g. during deployment)
        PublishEvents();
    }
}

std::vector<EventLog> Chain::GetEvents() const
{
    LOCK(cs_chain_);
    return events_;
}

std::vector<EventLog> Chain::GetEvents(const std::string& name) const
{
    LOCK(cs_chain_);
    std::vector<EventLog> result;
    for (const EventLog& log : events_) {
        if (log.name == name) {
            result.push_back(log);
        }
    }
    return result;
}

void Chain::ClearEvents()
{
    LOCK(cs_chain_);
    events_.clear();
}

int Chain::GetCallDepth() const
{
    LOCK(cs_chain_);
    return depth_;
}

uint160 Chain::RegisterContract(Contract* contract)
{
    LOCK(cs_chain_);
    uint160 addr = NewAddress();
    contracts_[addr] = contract;
    return addr;
}

void Chain::UnregisterContract(Contract* contract)
{
    LOCK(cs_chain_);
    for (auto it = contracts_.begin(); it != contracts_.end(); ++it) {
        if (it->second == contract) {
            contracts_.erase(it);
            return;
        }
    }
}

void Chain::RegisterJournal(StateJournal* journal)
{
    LOCK(cs_chain_);
    journals_.push_back(journal);
}

void Chain::UnregisterJournal(StateJournal* journal)
{
    LOCK(cs_chain_);
    journals_.erase(std::remove(journals_.begin(), journals_.end(), journal), journals_.end());
}

void Chain::SaveSnapshot()
{
    for (StateJournal* journal : journals_) {
        journal->SaveSnapshot();
    }
}

void Chain::RevertToSnapshot()
{
    for (StateJournal* journal : journals_) {
        journal->RevertToSnapshot();
    }
}

void Chain::CommitSnapshot()
{
    for (StateJournal* journal : journals_) {
        journal->CommitSnapshot();
    }
}

void Chain::MoveBalance(const uint160& from, const uint160& to, const CAmount& amount)
{
    CAmount& fromBalance = (*balances_)[from];
    Require(fromBalance >= amount, "Insufficient balance");
    fromBalance -= amount;
    (*balances_)[to] += amount;
}

void Chain::PublishEvents()
{
    std::vector<EventLog> committed;
    committed.swap(*pendingEvents_);
    for (const EventLog& log : committed) {
        events_.push_back(log);
        NotifyEventEmitted(log);
    }
}

} // namespace mintsuite
