#pragma once

#include "core/types.hh"
#include "core/errors.hh"
#include "escrow/gateway.hh"
#include <functional>
#include <span>
#include <vector>

namespace tourney {

// ============================================================================
// Winner Entry
// ============================================================================

// One ranked entry of a caller-supplied result list. An individual occupies
// one payout position; a group of tied players jointly consumes
// positions_consumed consecutive positions and splits their combined share.
struct Winner {
    enum class Kind : std::uint8_t {
        INDIVIDUAL = 0,
        GROUP = 1,
    };

    Kind kind = Kind::INDIVIDUAL;
    std::vector<Address> players;
    std::uint8_t positions_consumed = 1;

    [[nodiscard]] static Winner individual(const Address& player);
    [[nodiscard]] static Winner group(std::vector<Address> players, std::uint8_t positions_consumed);

    [[nodiscard]] bool is_group() const { return kind == Kind::GROUP; }
};

// Flatten a result list into the order players were named
[[nodiscard]] std::vector<Address> flatten_winners(std::span<const Winner> winners);

// ============================================================================
// Payout Scope
// ============================================================================

// Tournament payouts tolerate a zero share for an individual; match payouts
// reject it and additionally refuse the default identity.
enum class PayoutScope : std::uint8_t {
    TOURNAMENT = 0,
    MATCH = 1,
};

// ============================================================================
// Payout Plan
// ============================================================================

struct PayoutPlan {
    std::vector<Transfer> transfers;     // In payout order, zero shares omitted
    std::vector<Address> winners;        // Flattened winner list
    wide_amount_t total = 0;             // Sum of all shares
    std::size_t positions_consumed = 0;  // Final position counter
    std::size_t unpaid_winners = 0;      // Individuals ranked past the schedule
};

struct ResolveResult {
    TournamentError error = TournamentError::OK;
    PayoutPlan plan;

    [[nodiscard]] bool ok() const { return error == TournamentError::OK; }
};

using ParticipantPredicate = std::function<bool(const Address&)>;

// Structural checks over the whole list before any amount is computed.
// max_entries bounds the list length (the registered player count).
[[nodiscard]] TournamentError validate_winners(std::span<const Winner> winners,
                                               PayoutScope scope,
                                               const ParticipantPredicate& is_participant,
                                               std::size_t max_entries);

// Walk the list with a running position counter against schedule and
// compute every share of pool. accounts are the destinations the caller made
// available; each paid winner must appear among them.
[[nodiscard]] ResolveResult plan_payouts(std::span<const Winner> winners,
                                         std::span<const bps_t> schedule,
                                         wide_amount_t pool,
                                         PayoutScope scope,
                                         std::span<const Address> accounts);

}  // namespace tourney
