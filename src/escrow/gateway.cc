#include "gateway.hh"
#include "core/logging.hh"
#include <limits>

namespace tourney {

namespace {

constexpr amount_t AMOUNT_MAX = std::numeric_limits<amount_t>::max();

}  // namespace

// ============================================================================
// EscrowLedger Implementation
// ============================================================================

EscrowToken EscrowLedger::open_vault(const Address& tournament_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = vaults_.try_emplace(tournament_id, 0);
    if (inserted) {
        TOURNEY_LOG_DEBUG(log::escrow) << "Opened vault for tournament " << tournament_id.to_hex();
    }
    return EscrowToken{tournament_id};
}

amount_t EscrowLedger::vault_balance(const EscrowToken& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = vaults_.find(token.vault);
    return it != vaults_.end() ? it->second : 0;
}

EscrowResult EscrowLedger::collect(const EscrowToken& token,
                                   const Address& from,
                                   amount_t amount) {
    if (amount == 0) {
        return EscrowResult::INVALID_AMOUNT;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto vault = vaults_.find(token.vault);
    if (vault == vaults_.end()) {
        return EscrowResult::UNKNOWN_VAULT;
    }

    auto payer = balances_.find(from);
    if (payer == balances_.end() || payer->second < amount) {
        TOURNEY_LOG_DEBUG(log::escrow) << "Payer " << from.to_hex() << " cannot cover " << amount;
        return EscrowResult::INSUFFICIENT_PAYER_BALANCE;
    }
    if (vault->second > AMOUNT_MAX - amount) {
        return EscrowResult::BALANCE_OVERFLOW;
    }

    payer->second -= amount;
    vault->second += amount;

    TOURNEY_LOG_DEBUG(log::escrow) << "Collected " << amount << " from " << from.to_hex()
                                   << " into vault " << token.vault.to_hex();
    return EscrowResult::SUCCESS;
}

EscrowResult EscrowLedger::disburse(const EscrowToken& token,
                                    std::span<const Transfer> transfers) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto vault = vaults_.find(token.vault);
    if (vault == vaults_.end()) {
        return EscrowResult::UNKNOWN_VAULT;
    }

    // Validate the whole batch before touching any balance
    wide_amount_t total = 0;
    std::unordered_map<Address, wide_amount_t> incoming;
    for (const auto& transfer : transfers) {
        total += transfer.amount;
        incoming[transfer.destination] += transfer.amount;
    }
    if (total > vault->second) {
        TOURNEY_LOG_WARN(log::escrow) << "Vault " << token.vault.to_hex() << " holds "
                                      << vault->second << ", batch needs " << wide_to_string(total);
        return EscrowResult::INSUFFICIENT_VAULT_BALANCE;
    }
    for (const auto& [destination, amount] : incoming) {
        auto it = balances_.find(destination);
        amount_t current = it != balances_.end() ? it->second : 0;
        if (amount > static_cast<wide_amount_t>(AMOUNT_MAX - current)) {
            return EscrowResult::BALANCE_OVERFLOW;
        }
    }

    for (const auto& transfer : transfers) {
        balances_[transfer.destination] += transfer.amount;
        vault->second -= transfer.amount;
    }
    total_disbursed_ += total;

    TOURNEY_LOG_DEBUG(log::escrow) << "Disbursed " << wide_to_string(total) << " in "
                                   << transfers.size() << " transfers from vault "
                                   << token.vault.to_hex();
    return EscrowResult::SUCCESS;
}

EscrowResult EscrowLedger::credit(const Address& account, amount_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    amount_t& balance = balances_[account];
    if (balance > AMOUNT_MAX - amount) {
        return EscrowResult::BALANCE_OVERFLOW;
    }
    balance += amount;
    return EscrowResult::SUCCESS;
}

amount_t EscrowLedger::balance_of(const Address& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(account);
    return it != balances_.end() ? it->second : 0;
}

bool EscrowLedger::has_vault(const Address& tournament_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return vaults_.find(tournament_id) != vaults_.end();
}

std::size_t EscrowLedger::vault_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return vaults_.size();
}

wide_amount_t EscrowLedger::total_disbursed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_disbursed_;
}

}  // namespace tourney
