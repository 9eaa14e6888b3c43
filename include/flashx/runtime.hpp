#ifndef FLASHX_RUNTIME_HPP
#define FLASHX_RUNTIME_HPP

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "types.hpp"

namespace flashx {

// =============================================================================
// Events
// =============================================================================

struct SwapExecuted {
    Address venue;
    Address token_in;
    Address token_out;
    Amount amount_in;
    Amount amount_out;
    bool operator==(const SwapExecuted&) const = default;
};

struct ArbitrageExecuted {
    Address asset;
    Amount borrowed;
    Amount fee;
    Amount profit;
    uint64_t operation;
    bool operator==(const ArbitrageExecuted&) const = default;
};

struct FlashLoan {
    Address receiver;
    Address initiator;
    Address asset;
    Amount amount;
    Amount fee;
    uint16_t referral_code;
    bool operator==(const FlashLoan&) const = default;
};

struct RouterApprovalChanged {
    Address venue;
    bool approved;
    bool operator==(const RouterApprovalChanged&) const = default;
};

struct OperatorChanged {
    Address previous;
    Address current;
    bool operator==(const OperatorChanged&) const = default;
};

struct Swept {
    Address token;  // zero for native currency
    Address to;
    Amount amount;
    bool native;
    bool operator==(const Swept&) const = default;
};

using Event = std::variant<SwapExecuted, ArbitrageExecuted, FlashLoan,
                           RouterApprovalChanged, OperatorChanged, Swept>;

struct EventRecord {
    Address emitter;
    Event event;
    bool operator==(const EventRecord&) const = default;
};

// =============================================================================
// Runtime - token ledger, clock and atomic transactions
//
// All value-bearing state lives here. atomic() runs a callable as one
// indivisible transaction: every mutation is journaled and a throwing
// callable leaves the state exactly as it found it. Top-level transactions
// are serialized by an exclusive lock held for their whole duration; calls
// made from inside an open transaction on the same thread join it as a
// nested frame.
// =============================================================================

class Runtime {
public:
    struct State {
        std::map<std::pair<Address, Address>, Amount> balances;             // (token, holder)
        std::map<std::tuple<Address, Address, Address>, Amount> allowances; // (token, owner, spender)
        std::map<Address, Amount> native;
        std::vector<EventRecord> events;

        bool operator==(const State&) const = default;
    };

    explicit Runtime(Timestamp start_time = 0);
    ~Runtime() = default;

    // Non-copyable
    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    // =========================================================================
    // Transactions
    // =========================================================================

    template <typename Fn>
    auto atomic(Fn&& fn) -> std::invoke_result_t<Fn&>;

    // True when the calling thread has a transaction open
    bool in_transaction() const;

    // Register an undo action for state kept outside the runtime. Replayed in
    // reverse order if the enclosing transaction fails; dropped on commit.
    void journal(std::function<void()> undo);

    // Run `fn` once the outermost transaction commits, after its lock is
    // released; dropped if the transaction fails. Runs immediately when no
    // transaction is open.
    void on_commit(std::function<void()> fn);

    // =========================================================================
    // Tokens
    // =========================================================================

    Amount balance_of(const Address& token, const Address& holder) const;
    Amount allowance(const Address& token, const Address& owner, const Address& spender) const;

    void mint(const Address& token, const Address& to, Amount amount);
    void transfer(const Address& token, const Address& from, const Address& to, Amount amount);
    void approve(const Address& token, const Address& owner, const Address& spender, Amount amount);
    void transfer_from(const Address& token, const Address& spender, const Address& from,
                       const Address& to, Amount amount);

    // =========================================================================
    // Native Currency
    // =========================================================================

    Amount native_balance(const Address& holder) const;
    void credit_native(const Address& to, Amount amount);
    void transfer_native(const Address& from, const Address& to, Amount amount);

    // =========================================================================
    // Clock
    // =========================================================================

    Timestamp now() const { return now_.load(std::memory_order_acquire); }
    void set_time(Timestamp t) { now_.store(t, std::memory_order_release); }
    void advance_time(Timestamp secs) { now_.fetch_add(secs, std::memory_order_acq_rel); }

    // =========================================================================
    // Events
    // =========================================================================

    void emit(const Address& emitter, Event event);
    std::vector<EventRecord> events() const;

    // Full copy of the value-bearing state
    State snapshot() const;

private:
    bool owns_transaction() const {
        return owner_.load(std::memory_order_acquire) == std::this_thread::get_id();
    }
    void revert_to(size_t checkpoint);
    void rollback(size_t checkpoint, size_t hook_checkpoint, bool outermost);
    void commit(std::unique_lock<std::shared_mutex>& lock);

    void set_balance(const Address& token, const Address& holder, Amount value);
    void set_allowance(const Address& token, const Address& owner,
                       const Address& spender, Amount value);
    void set_native(const Address& holder, Amount value);

    template <typename Map, typename Key>
    void journaled_set(Map& map, const Key& key, Amount value);

    State state_;
    std::vector<std::function<void()>> journal_;
    std::vector<std::function<void()>> commit_hooks_;

    mutable std::shared_mutex tx_mutex_;
    std::atomic<std::thread::id> owner_{};
    std::atomic<Timestamp> now_;
};

// =============================================================================
// Template Implementation
// =============================================================================

template <typename Fn>
auto Runtime::atomic(Fn&& fn) -> std::invoke_result_t<Fn&> {
    using Result = std::invoke_result_t<Fn&>;

    std::unique_lock<std::shared_mutex> lock(tx_mutex_, std::defer_lock);
    const bool outermost = !owns_transaction();
    if (outermost) {
        lock.lock();
        owner_.store(std::this_thread::get_id(), std::memory_order_release);
    }
    const size_t checkpoint = journal_.size();
    const size_t hook_checkpoint = commit_hooks_.size();

    if constexpr (std::is_void_v<Result>) {
        try {
            fn();
        } catch (...) {
            rollback(checkpoint, hook_checkpoint, outermost);
            throw;
        }
        if (outermost) commit(lock);
    } else {
        std::optional<Result> result;
        try {
            result.emplace(fn());
        } catch (...) {
            rollback(checkpoint, hook_checkpoint, outermost);
            throw;
        }
        if (outermost) commit(lock);
        return std::move(*result);
    }
}

template <typename Map, typename Key>
void Runtime::journaled_set(Map& map, const Key& key, Amount value) {
    auto it = map.find(key);
    if (it == map.end()) {
        if (value == 0) return;
        map.emplace(key, value);
        journal_.push_back([&map, key]() { map.erase(key); });
        return;
    }
    Amount previous = it->second;
    if (value == 0) {
        map.erase(it);
    } else {
        it->second = value;
    }
    journal_.push_back([&map, key, previous]() { map[key] = previous; });
}

} // namespace flashx

#endif // FLASHX_RUNTIME_HPP
