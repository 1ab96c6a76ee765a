#pragma once

#include "core/types.hh"
#include "core/errors.hh"
#include <span>
#include <vector>

namespace tourney {

// ============================================================================
// Structural Limits
// ============================================================================

struct TournamentLimits {
    static constexpr std::uint32_t BPS_TOTAL = 10'000;
    static constexpr std::uint32_t MIN_PLAYERS = 2;
    static constexpr std::uint32_t MAX_PLAYERS = 100;
    static constexpr bps_t MIN_TOURNAMENT_PRIZE_BPS = 5'000;
    static constexpr bps_t MAX_OPERATOR_FEE_BPS = 1'500;
    static constexpr std::size_t MAX_TOURNAMENT_PAYOUT_POSITIONS = 20;
    static constexpr std::size_t MAX_MATCH_PAYOUT_POSITIONS = 8;
    // Most matches MAX_PLAYERS can form at the smallest match size
    static constexpr std::size_t MAX_PAID_MATCHES = MAX_PLAYERS / 2;
};

// ============================================================================
// Tournament Configuration (immutable after creation)
// ============================================================================

struct TournamentConfig {
    amount_t entry_fee = 0;
    player_count_t max_players = 0;
    player_count_t match_size = 0;
    bps_t tournament_prize_bps = 0;
    bps_t match_prize_bps = 0;
    bps_t operator_fee_bps = 0;

    bool operator==(const TournamentConfig&) const = default;
};

// Creation-time rules, checked in the order the error codes are listed
[[nodiscard]] TournamentError validate_config(const TournamentConfig& config);

// ============================================================================
// Payout Schedules (set once, at start)
// ============================================================================

[[nodiscard]] TournamentError validate_tournament_payouts(std::span<const bps_t> payouts,
                                                          std::size_t current_players);

[[nodiscard]] TournamentError validate_match_payouts(std::span<const bps_t> payouts);

// ============================================================================
// Program Configuration (deployment-level)
// ============================================================================

// Who may create tournaments at all. Authority over an individual tournament
// belongs to whoever created it.
struct ProgramConfig {
    std::vector<Address> approved_creators;

    [[nodiscard]] bool is_approved_creator(const Address& creator) const;
};

}  // namespace tourney
