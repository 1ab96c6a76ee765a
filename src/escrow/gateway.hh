#pragma once

#include "core/types.hh"
#include <mutex>
#include <span>
#include <string_view>
#include <unordered_map>

namespace tourney {

// ============================================================================
// Transfer
// ============================================================================

struct Transfer {
    Address destination;
    amount_t amount = 0;

    auto operator<=>(const Transfer&) const = default;
};

// ============================================================================
// Escrow Token - the state machine's capability over one vault
// ============================================================================

struct EscrowToken {
    Address vault;

    auto operator<=>(const EscrowToken&) const = default;
};

enum class EscrowResult : std::uint8_t {
    SUCCESS = 0,
    UNKNOWN_VAULT = 1,
    INVALID_AMOUNT = 2,
    INSUFFICIENT_PAYER_BALANCE = 3,
    INSUFFICIENT_VAULT_BALANCE = 4,
    BALANCE_OVERFLOW = 5,
};

[[nodiscard]] constexpr std::string_view escrow_result_string(EscrowResult result) {
    switch (result) {
        case EscrowResult::SUCCESS: return "success";
        case EscrowResult::UNKNOWN_VAULT: return "unknown_vault";
        case EscrowResult::INVALID_AMOUNT: return "invalid_amount";
        case EscrowResult::INSUFFICIENT_PAYER_BALANCE: return "insufficient_payer_balance";
        case EscrowResult::INSUFFICIENT_VAULT_BALANCE: return "insufficient_vault_balance";
        case EscrowResult::BALANCE_OVERFLOW: return "balance_overflow";
    }
    return "unknown";
}

// ============================================================================
// Escrow Gateway Interface
// ============================================================================

// The only path by which value enters or leaves a tournament's pooled vault.
// How the host authorizes the vault (address derivation, signing) stays
// behind this interface.
class EscrowGateway {
public:
    virtual ~EscrowGateway() = default;

    // Open (or reopen) the vault owned by a tournament
    virtual EscrowToken open_vault(const Address& tournament_id) = 0;

    [[nodiscard]] virtual amount_t vault_balance(const EscrowToken& token) const = 0;

    // Move amount from a payer into the vault
    virtual EscrowResult collect(const EscrowToken& token,
                                 const Address& from,
                                 amount_t amount) = 0;

    // Pay every transfer out of the vault, or none of them
    virtual EscrowResult disburse(const EscrowToken& token,
                                  std::span<const Transfer> transfers) = 0;

    EscrowResult pay(const EscrowToken& token, const Address& destination, amount_t amount) {
        const Transfer transfer{destination, amount};
        return disburse(token, std::span<const Transfer>(&transfer, 1));
    }
};

// ============================================================================
// Escrow Ledger - in-memory gateway with per-address balances
// ============================================================================

class EscrowLedger : public EscrowGateway {
public:
    EscrowLedger() = default;

    EscrowToken open_vault(const Address& tournament_id) override;
    [[nodiscard]] amount_t vault_balance(const EscrowToken& token) const override;
    EscrowResult collect(const EscrowToken& token, const Address& from, amount_t amount) override;
    EscrowResult disburse(const EscrowToken& token, std::span<const Transfer> transfers) override;

    // Fund an external account (wallet top-up)
    EscrowResult credit(const Address& account, amount_t amount);

    [[nodiscard]] amount_t balance_of(const Address& account) const;
    [[nodiscard]] bool has_vault(const Address& tournament_id) const;
    [[nodiscard]] std::size_t vault_count() const;

    // Value ever paid out of any vault
    [[nodiscard]] wide_amount_t total_disbursed() const;

private:
    std::unordered_map<Address, amount_t> balances_;
    std::unordered_map<Address, amount_t> vaults_;
    wide_amount_t total_disbursed_ = 0;
    mutable std::mutex mutex_;
};

}  // namespace tourney
