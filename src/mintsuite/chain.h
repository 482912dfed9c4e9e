// Copyright (c) 2024 The MintSuite developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef MINTSUITE_CHAIN_H
#define MINTSUITE_CHAIN_H

/**
 * @file chain.h
 * @brief In-process ledger hosting the minter suite contracts
 *
 * The ledger executes transactions atomically: every contract keeps its
 * mutable state in a Snapshotted<T> journal, and the ledger snapshots all
 * journals when a call frame opens and either commits or reverts them
 * when the frame closes. Contract code aborts a frame by throwing
 * RevertError (see Require()).
 *
 * Two kinds of frames exist:
 * - Top-level transactions (Chain::Execute), which report a TxResult
 * - Value transfers (Chain::SendValue), which run the recipient's
 *   OnReceive hook in a nested frame and report success as a bool,
 *   leaving the caller to decide whether a failed transfer reverts.
 *
 * Events emitted inside reverted frames are discarded. Events of committed
 * top-level transactions are announced through NotifyEventEmitted.
 */

#include <amount.h>
#include <sync.h>
#include <uint256.h>

#include <boost/signals2/signal.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mintsuite {

class Chain;

// ============================================================================
// Reverts
// ============================================================================

/**
 * @brief Aborts the current call frame, undoing all of its state changes
 *
 * The message is the revert reason surfaced to the caller.
 */
class RevertError : public std::runtime_error
{
public:
    explicit RevertError(const std::string& reason) : std::runtime_error(reason) {}
};

/** Revert the current frame with the given reason unless condition holds. */
inline void Require(bool condition, const std::string& reason)
{
    if (!condition) {
        throw RevertError(reason);
    }
}

// ============================================================================
// Call context and results
// ============================================================================

/**
 * @brief Caller and attached value of a contract call
 *
 * Every state-changing contract entry point takes the context of the
 * immediate caller. A contract calling into another contract passes its
 * own address as the sender (see Contract::Self()).
 */
struct CallContext {
    /** Immediate caller */
    uint160 sender;

    /** Native value attached to the call, in wei */
    CAmount value;

    CallContext() : value(0) {}
    CallContext(const uint160& senderIn, const CAmount& valueIn)
        : sender(senderIn)
        , value(valueIn) {}
};

/**
 * @brief Outcome of a top-level transaction
 */
struct TxResult {
    /** Whether the transaction committed */
    bool success;

    /** Revert reason if the transaction reverted */
    std::string errorMessage;

    TxResult() : success(false) {}

    static TxResult Success() {
        TxResult result;
        result.success = true;
        return result;
    }

    static TxResult Failure(const std::string& error) {
        TxResult result;
        result.success = false;
        result.errorMessage = error;
        return result;
    }
};

// ============================================================================
// Events
// ============================================================================

/**
 * @brief Event emitted by a contract
 *
 * Fields keep their emission order. Values are stored formatted.
 */
struct EventLog {
    /** Emitting contract */
    uint160 emitter;

    /** Event name, e.g. "ProjectMinterRegistered" */
    std::string name;

    /** Ordered (key, formatted value) pairs */
    std::vector<std::pair<std::string, std::string>> fields;

    EventLog() {}
    EventLog(const uint160& emitterIn, const std::string& nameIn)
        : emitter(emitterIn)
        , name(nameIn) {}

    EventLog& Add(const std::string& key, const uint160& value)
    {
        fields.emplace_back(key, value.ToString());
        return *this;
    }

    template <typename T>
    EventLog& Add(const std::string& key, const T& value);

    /** Formatted value of a field, if present */
    std::optional<std::string> Get(const std::string& key) const;

    std::string ToString() const;
};

// ============================================================================
// State journals
// ============================================================================

/**
 * @brief State that participates in call-frame snapshots
 */
class StateJournal
{
public:
    virtual ~StateJournal() {}

    virtual void SaveSnapshot() = 0;
    virtual void RevertToSnapshot() = 0;
    virtual void CommitSnapshot() = 0;
};

/**
 * @brief Value of type T with a snapshot stack
 *
 * SaveSnapshot pushes a copy, RevertToSnapshot restores and pops it,
 * CommitSnapshot drops it.
 */
template <typename T>
class Snapshotted : public StateJournal
{
public:
    Snapshotted() : value_() {}
    explicit Snapshotted(const T& initial) : value_(initial) {}

    T& operator*() { return value_; }
    const T& operator*() const { return value_; }
    T* operator->() { return &value_; }
    const T* operator->() const { return &value_; }

    void SaveSnapshot() override
    {
        snapshots_.push_back(value_);
    }

    void RevertToSnapshot() override
    {
        if (snapshots_.empty()) {
            return;
        }
        value_ = std::move(snapshots_.back());
        snapshots_.pop_back();
    }

    void CommitSnapshot() override
    {
        if (!snapshots_.empty()) {
            snapshots_.pop_back();
        }
    }

private:
    T value_;
    std::vector<T> snapshots_;
};

// ============================================================================
// Contracts
// ============================================================================

/**
 * @brief Base class of every contract hosted by a Chain
 *
 * Construction allocates an address and registers the contract with the
 * chain; destruction unregisters it. Derived classes register their
 * Snapshotted state with Track() from their constructor. Contracts are
 * expected to be deployed outside of transactions.
 */
class Contract
{
public:
    explicit Contract(Chain& chain);
    virtual ~Contract();

    Contract(const Contract&) = delete;
    Contract& operator=(const Contract&) = delete;

    const uint160& GetAddress() const { return address_; }
    Chain& GetChain() const { return chain_; }

    /**
     * @brief Hook run when native value is pushed to this contract
     *
     * The default rejects the transfer.
     */
    virtual void OnReceive(const CallContext& ctx);

protected:
    /** Register a state journal for snapshots. Call from the derived constructor. */
    void Track(StateJournal& journal);

    /** Context for an outgoing call made by this contract */
    CallContext Self() const { return CallContext(address_, CAmount(0)); }

    /**
     * @brief Resolve a contract of type T at addr
     * @throws RevertError with reason if no such contract exists
     */
    template <typename T>
    T& ContractAt(const uint160& addr, const std::string& reason) const;

    Chain& chain_;
    const uint160 address_;

private:
    std::vector<StateJournal*> journals_;
};

/**
 * @brief Non-reentrant entry point guard
 *
 * Not part of contract state: it is reset on scope exit whether the frame
 * commits or reverts.
 */
class ReentrancyGuard
{
public:
    ReentrancyGuard() : entered_(false) {}

    class Scope
    {
    public:
        explicit Scope(ReentrancyGuard& guard) : guard_(guard)
        {
            Require(!guard_.entered_, "ReentrancyGuard: reentrant call");
            guard_.entered_ = true;
        }
        ~Scope() { guard_.entered_ = false; }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

    private:
        ReentrancyGuard& guard_;
    };

    bool IsEntered() const { return entered_; }

private:
    bool entered_;
};

// ============================================================================
// Chain
// ============================================================================

class Chain
{
public:
    Chain();
    ~Chain();

    Chain(const Chain&) = delete;
    Chain& operator=(const Chain&) = delete;

    // =========================================================================
    // Accounts
    // =========================================================================

    /** Allocate a fresh, non-null address */
    uint160 NewAddress();

    /** Native balance of an account or contract */
    CAmount GetBalance(const uint160& account) const;

    /** Credit an account outside of any transaction (test and simulator faucet) */
    void Fund(const uint160& account, const CAmount& amount);

    // =========================================================================
    // Block time
    // =========================================================================

    int64_t GetBlockTimestamp() const;
    void SetBlockTimestamp(int64_t timestamp);
    void AdvanceTime(int64_t seconds);

    // =========================================================================
    // Contracts
    // =========================================================================

    /** Contract registered at addr, or nullptr */
    Contract* GetContract(const uint160& addr) const;

    /** Contract at addr if it is a T, or nullptr */
    template <typename T>
    T* GetContractAs(const uint160& addr) const
    {
        return dynamic_cast<T*>(GetContract(addr));
    }

    bool IsContract(const uint160& addr) const { return GetContract(addr) != nullptr; }

    // =========================================================================
    // Transactions
    // =========================================================================

    /**
     * @brief Execute a top-level transaction
     *
     * Moves value from the sender to the callee, then runs func. All state
     * changes, the value transfer included, are reverted if func reverts.
     *
     * @param from Transaction sender
     * @param to Callee receiving the attached value
     * @param value Attached native value
     * @param func Transaction body
     * @return Success, or Failure with the revert reason
     */
    TxResult Execute(const uint160& from, const uint160& to, const CAmount& value,
                     const std::function<void (const CallContext&)>& func);

    /** Execute a transaction without attached value */
    TxResult Execute(const uint160& from, const std::function<void (const CallContext&)>& func);

    /**
     * @brief Push native value from one account to another
     *
     * Runs the recipient's OnReceive hook when the recipient is a contract.
     * A revert in the hook, or an insufficient balance, undoes the transfer.
     *
     * @return true if the transfer committed
     */
    bool SendValue(const uint160& from, const uint160& to, const CAmount& amount);

    /** Append an event to the current frame */
    void EmitEvent(const EventLog& log);

    /** Events of committed transactions, oldest first */
    std::vector<EventLog> GetEvents() const;

    /** Committed events with the given name, oldest first */
    std::vector<EventLog> GetEvents(const std::string& name) const;

    void ClearEvents();

    /** Current call-frame depth, 0 outside of transactions */
    int GetCallDepth() const;

    /** Fired for each event of a committed top-level transaction */
    boost::signals2::signal<void (const EventLog&)> NotifyEventEmitted;

private:
    friend class Contract;

    /**
     * @brief RAII call frame: snapshots on entry, reverts on exit unless committed
     */
    class Frame
    {
    public:
        explicit Frame(Chain& chain);
        ~Frame();
        void Commit();

        Frame(const Frame&) = delete;
        Frame& operator=(const Frame&) = delete;

    private:
        Chain& chain_;
        bool committed_;
    };

    uint160 RegisterContract(Contract* contract);
    void UnregisterContract(Contract* contract);
    void RegisterJournal(StateJournal* journal);
    void UnregisterJournal(StateJournal* journal);

    void SaveSnapshot();
    void RevertToSnapshot();
    void CommitSnapshot();

    void MoveBalance(const uint160& from, const uint160& to, const CAmount& amount);
    void PublishEvents();

    mutable CCriticalSection cs_chain_;

    uint64_t nextAddress_;
    int64_t blockTimestamp_;
    int depth_;

    std::map<uint160, Contract*> contracts_;
    std::vector<StateJournal*> journals_;

    Snapshotted<std::map<uint160, CAmount>> balances_;
    Snapshotted<std::vector<EventLog>> pendingEvents_;
    std::vector<EventLog> events_;
};

// ============================================================================
// Template definitions
// ============================================================================

template <typename T>
EventLog& EventLog::Add(const std::string& key, const T& value)
{
    std::ostringstream stream;
    stream << std::boolalpha << value;
    fields.emplace_back(key, stream.str());
    return *this;
}

template <typename T>
T& Contract::ContractAt(const uint160& addr, const std::string& reason) const
{
    T* contract = chain_.GetContractAs<T>(addr);
    Require(contract != nullptr, reason);
    return *contract;
}

} // namespace mintsuite

#endif // MINTSUITE_CHAIN_H
