// =============================================================================
// runtime.cpp - Journaled Token Ledger
// =============================================================================

#include "flashx/runtime.hpp"
#include "flashx/errors.hpp"

namespace flashx {

Runtime::Runtime(Timestamp start_time) : now_(start_time) {}

// =============================================================================
// Transactions
// =============================================================================

bool Runtime::in_transaction() const {
    return owns_transaction();
}

void Runtime::journal(std::function<void()> undo) {
    // Outside a transaction there is nothing to roll back to
    if (!owns_transaction()) return;
    journal_.push_back(std::move(undo));
}

void Runtime::revert_to(size_t checkpoint) {
    while (journal_.size() > checkpoint) {
        auto undo = std::move(journal_.back());
        journal_.pop_back();
        undo();
    }
}

void Runtime::on_commit(std::function<void()> fn) {
    if (!owns_transaction()) {
        fn();
        return;
    }
    commit_hooks_.push_back(std::move(fn));
}

void Runtime::rollback(size_t checkpoint, size_t hook_checkpoint, bool outermost) {
    revert_to(checkpoint);
    commit_hooks_.resize(hook_checkpoint);
    if (outermost) {
        owner_.store(std::thread::id(), std::memory_order_release);
    }
}

void Runtime::commit(std::unique_lock<std::shared_mutex>& lock) {
    journal_.clear();
    std::vector<std::function<void()>> hooks = std::move(commit_hooks_);
    commit_hooks_.clear();
    owner_.store(std::thread::id(), std::memory_order_release);
    lock.unlock();

    for (auto& hook : hooks) hook();
}

// =============================================================================
// Tokens
// =============================================================================

Amount Runtime::balance_of(const Address& token, const Address& holder) const {
    std::shared_lock<std::shared_mutex> lock(tx_mutex_, std::defer_lock);
    if (!owns_transaction()) lock.lock();
    auto it = state_.balances.find({token, holder});
    return it == state_.balances.end() ? 0 : it->second;
}

Amount Runtime::allowance(const Address& token, const Address& owner,
                          const Address& spender) const {
    std::shared_lock<std::shared_mutex> lock(tx_mutex_, std::defer_lock);
    if (!owns_transaction()) lock.lock();
    auto it = state_.allowances.find({token, owner, spender});
    return it == state_.allowances.end() ? 0 : it->second;
}

void Runtime::mint(const Address& token, const Address& to, Amount amount) {
    atomic([&]() {
        set_balance(token, to, checked_add(balance_of(token, to), amount));
    });
}

void Runtime::transfer(const Address& token, const Address& from, const Address& to,
                       Amount amount) {
    atomic([&]() {
        Amount from_balance = balance_of(token, from);
        if (from_balance < amount) {
            throw RevertError(errors::INSUFFICIENT_BALANCE,
                              addresses::to_hex(from) + " holds " + to_string(from_balance) +
                              " of " + addresses::to_hex(token) + ", needs " + to_string(amount));
        }
        if (from == to || amount == 0) return;
        set_balance(token, from, from_balance - amount);
        set_balance(token, to, checked_add(balance_of(token, to), amount));
    });
}

void Runtime::approve(const Address& token, const Address& owner, const Address& spender,
                      Amount amount) {
    atomic([&]() { set_allowance(token, owner, spender, amount); });
}

void Runtime::transfer_from(const Address& token, const Address& spender, const Address& from,
                            const Address& to, Amount amount) {
    atomic([&]() {
        Amount allowed = allowance(token, from, spender);
        if (allowed < amount) {
            throw RevertError(errors::INSUFFICIENT_ALLOWANCE,
                              addresses::to_hex(spender) + " may draw " + to_string(allowed) +
                              " from " + addresses::to_hex(from) + ", needs " + to_string(amount));
        }
        set_allowance(token, from, spender, allowed - amount);
        transfer(token, from, to, amount);
    });
}

// =============================================================================
// Native Currency
// =============================================================================

Amount Runtime::native_balance(const Address& holder) const {
    std::shared_lock<std::shared_mutex> lock(tx_mutex_, std::defer_lock);
    if (!owns_transaction()) lock.lock();
    auto it = state_.native.find(holder);
    return it == state_.native.end() ? 0 : it->second;
}

void Runtime::credit_native(const Address& to, Amount amount) {
    atomic([&]() {
        set_native(to, checked_add(native_balance(to), amount));
    });
}

void Runtime::transfer_native(const Address& from, const Address& to, Amount amount) {
    atomic([&]() {
        Amount from_balance = native_balance(from);
        if (from_balance < amount) {
            throw RevertError(errors::INSUFFICIENT_BALANCE,
                              addresses::to_hex(from) + " holds " + to_string(from_balance) +
                              " native, needs " + to_string(amount));
        }
        if (from == to || amount == 0) return;
        set_native(from, from_balance - amount);
        set_native(to, checked_add(native_balance(to), amount));
    });
}

// =============================================================================
// Events
// =============================================================================

void Runtime::emit(const Address& emitter, Event event) {
    atomic([&]() {
        state_.events.push_back(EventRecord{emitter, std::move(event)});
        journal_.push_back([this]() { state_.events.pop_back(); });
    });
}

std::vector<EventRecord> Runtime::events() const {
    std::shared_lock<std::shared_mutex> lock(tx_mutex_, std::defer_lock);
    if (!owns_transaction()) lock.lock();
    return state_.events;
}

Runtime::State Runtime::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(tx_mutex_, std::defer_lock);
    if (!owns_transaction()) lock.lock();
    return state_;
}

// =============================================================================
// Internal Helpers (caller holds the transaction)
// =============================================================================

void Runtime::set_balance(const Address& token, const Address& holder, Amount value) {
    journaled_set(state_.balances, std::make_pair(token, holder), value);
}

void Runtime::set_allowance(const Address& token, const Address& owner,
                            const Address& spender, Amount value) {
    journaled_set(state_.allowances, std::make_tuple(token, owner, spender), value);
}

void Runtime::set_native(const Address& holder, Amount value) {
    journaled_set(state_.native, holder, value);
}

} // namespace flashx
