// =============================================================================
// ledger.cpp - Operation Statistics
// =============================================================================

#include "flashx/ledger.hpp"
#include "flashx/runtime.hpp"

#include <mutex>

namespace flashx {

Ledger::Ledger(Runtime& runtime) : runtime_(runtime) {}

void Ledger::record(const Address& asset, Amount profit) {
    std::unique_lock lock(mutex_);

    auto it = per_asset_.find(asset);
    bool had_asset = it != per_asset_.end();
    Amount prev_asset_total = had_asset ? it->second : 0;
    Amount new_total = checked_add(total_profit_, profit);
    Amount new_asset_total = checked_add(prev_asset_total, profit);

    uint64_t prev_operations = operations_;
    Amount prev_total = total_profit_;

    operations_ += 1;
    total_profit_ = new_total;
    per_asset_[asset] = new_asset_total;

    runtime_.journal([this, asset, prev_operations, prev_total, had_asset, prev_asset_total]() {
        std::unique_lock undo_lock(mutex_);
        operations_ = prev_operations;
        total_profit_ = prev_total;
        if (!had_asset) {
            per_asset_.erase(asset);
        } else {
            per_asset_[asset] = prev_asset_total;
        }
    });
}

Ledger::Stats Ledger::stats() const {
    std::shared_lock lock(mutex_);
    return Stats{operations_, total_profit_};
}

Amount Ledger::profit_for(const Address& asset) const {
    std::shared_lock lock(mutex_);
    auto it = per_asset_.find(asset);
    return it == per_asset_.end() ? 0 : it->second;
}

std::map<Address, Amount> Ledger::profit_by_asset() const {
    std::shared_lock lock(mutex_);
    return per_asset_;
}

} // namespace flashx
