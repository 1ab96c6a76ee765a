#pragma once

#include "core/types.hh"
#include "tournament/config.hh"
#include "tournament/guards.hh"
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace tourney {

// ============================================================================
// Tournament Phase
// ============================================================================

// Registration -> Playing -> Finalized, or Registration -> Cancelled
enum class TournamentPhase : std::uint8_t {
    REGISTRATION = 0,
    PLAYING = 1,
    FINALIZED = 2,
    CANCELLED = 3,
};

[[nodiscard]] constexpr std::string_view tournament_phase_string(TournamentPhase phase) {
    switch (phase) {
        case TournamentPhase::REGISTRATION: return "registration";
        case TournamentPhase::PLAYING: return "playing";
        case TournamentPhase::FINALIZED: return "finalized";
        case TournamentPhase::CANCELLED: return "cancelled";
    }
    return "unknown";
}

// ============================================================================
// Tournament State (one per tournament, persisted by the host)
// ============================================================================

struct TournamentState {
    Address id;
    Address authority;
    TournamentConfig config;
    TournamentPhase phase = TournamentPhase::REGISTRATION;

    // Buy-in order; current player count is participants.size()
    IdempotencyGuard<Address> participants{TournamentLimits::MAX_PLAYERS};

    std::vector<bps_t> tournament_payouts;
    std::vector<bps_t> match_payout_percentages;

    PaidMatchGuard paid_match_ids{TournamentLimits::MAX_PAID_MATCHES};
    RefundGuard refunded_participants{TournamentLimits::MAX_PLAYERS};

    bool operator_fee_withdrawn = false;

    [[nodiscard]] player_count_t current_players() const {
        return static_cast<player_count_t>(participants.size());
    }

    [[nodiscard]] bool is_participant(const Address& player) const {
        return participants.contains(player);
    }

    [[nodiscard]] bool is_full() const {
        return participants.size() >= config.max_players;
    }

    // Serialize/deserialize. Every bound enforced by the state machine is
    // re-checked on load; a buffer that violates one is rejected.
    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<TournamentState> deserialize(
        std::span<const std::uint8_t> data);

    bool operator==(const TournamentState&) const = default;

    static constexpr std::uint8_t SERIALIZATION_VERSION = 1;

    static constexpr std::size_t MAX_SERIALIZED_SIZE =
        1 +                                                          // version
        ADDRESS_SIZE +                                               // id
        ADDRESS_SIZE +                                               // authority
        sizeof(amount_t) + 2 + 3 * sizeof(bps_t) +                   // config
        1 +                                                          // phase
        1 +                                                          // operator_fee_withdrawn
        1 + TournamentLimits::MAX_PLAYERS * ADDRESS_SIZE +           // participants
        1 + TournamentLimits::MAX_TOURNAMENT_PAYOUT_POSITIONS * sizeof(bps_t) +
        1 + TournamentLimits::MAX_MATCH_PAYOUT_POSITIONS * sizeof(bps_t) +
        1 + TournamentLimits::MAX_PAID_MATCHES * sizeof(match_id_t) +
        1 + TournamentLimits::MAX_PLAYERS * ADDRESS_SIZE;            // refunded_participants
};

}  // namespace tourney
