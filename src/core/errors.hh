#pragma once

#include <cstdint>
#include <string_view>

namespace tourney {

// ============================================================================
// Tournament Error Codes
// ============================================================================

enum class TournamentError : std::uint8_t {
    OK = 0x00,

    // Creation-time configuration
    INVALID_BUY_IN_AMOUNT = 0x01,
    INVALID_MAX_PLAYERS = 0x02,
    INVALID_MATCH_SIZE = 0x03,
    INVALID_TOURNAMENT_PRIZE_PERCENTAGE = 0x04,
    INVALID_OPERATOR_FEE_PERCENTAGE = 0x05,
    INVALID_PERCENTAGES = 0x06,
    TOURNAMENT_PRIZE_TOO_LOW = 0x07,
    OPERATOR_FEE_TOO_HIGH = 0x08,
    UNAUTHORIZED_AUTHORITY = 0x09,

    // Registration
    INVALID_PHASE = 0x10,
    TOURNAMENT_FULL = 0x11,
    PLAYER_COUNT_OVERFLOW = 0x12,
    ALREADY_REGISTERED = 0x13,

    // Start (payout schedules)
    NOT_ENOUGH_PLAYERS = 0x20,
    INVALID_PAYOUT_COUNT = 0x21,
    TOO_MANY_PAYOUT_POSITIONS = 0x22,
    INVALID_PAYOUT_PERCENTAGES = 0x23,      // Sum != 10000
    INVALID_PAYOUT_PERCENTAGE = 0x24,       // Entry outside (0, 10000]
    INVALID_MATCH_PAYOUT_COUNT = 0x25,
    TOO_MANY_MATCH_PAYOUT_POSITIONS = 0x26,
    INVALID_MATCH_PAYOUT_PERCENTAGES = 0x27,
    INVALID_MATCH_PAYOUT_PERCENTAGE = 0x28,

    // Winner lists
    INVALID_WINNER_COUNT = 0x30,
    TOO_MANY_WINNERS = 0x31,
    INVALID_WINNER = 0x32,
    WINNER_NOT_PARTICIPANT = 0x33,
    DUPLICATE_WINNER = 0x34,
    MISSING_WINNER_ACCOUNT = 0x35,

    // Post-finalization payouts
    TOURNAMENT_NOT_FINALIZED = 0x40,
    MATCH_ALREADY_PAID = 0x41,
    INVALID_MATCH_COUNT = 0x42,
    NO_MATCH_REWARDS = 0x43,
    OPERATOR_FEE_ALREADY_WITHDRAWN = 0x44,
    MATCH_LEDGER_FULL = 0x45,

    // Cancellation and refunds
    TOURNAMENT_ALREADY_STARTED = 0x50,
    TOURNAMENT_NOT_CANCELLED = 0x51,
    PARTICIPANT_NOT_FOUND = 0x52,
    PARTICIPANT_ALREADY_REFUNDED = 0x53,

    // Arithmetic and value movement
    CALCULATION_OVERFLOW = 0x60,
    ESCROW_TRANSFER_FAILED = 0x61,
};

[[nodiscard]] constexpr std::string_view tournament_error_string(TournamentError error) {
    switch (error) {
        case TournamentError::OK: return "ok";
        case TournamentError::INVALID_BUY_IN_AMOUNT: return "invalid_buy_in_amount";
        case TournamentError::INVALID_MAX_PLAYERS: return "invalid_max_players";
        case TournamentError::INVALID_MATCH_SIZE: return "invalid_match_size";
        case TournamentError::INVALID_TOURNAMENT_PRIZE_PERCENTAGE: return "invalid_tournament_prize_percentage";
        case TournamentError::INVALID_OPERATOR_FEE_PERCENTAGE: return "invalid_operator_fee_percentage";
        case TournamentError::INVALID_PERCENTAGES: return "invalid_percentages";
        case TournamentError::TOURNAMENT_PRIZE_TOO_LOW: return "tournament_prize_too_low";
        case TournamentError::OPERATOR_FEE_TOO_HIGH: return "operator_fee_too_high";
        case TournamentError::UNAUTHORIZED_AUTHORITY: return "unauthorized_authority";
        case TournamentError::INVALID_PHASE: return "invalid_phase";
        case TournamentError::TOURNAMENT_FULL: return "tournament_full";
        case TournamentError::PLAYER_COUNT_OVERFLOW: return "player_count_overflow";
        case TournamentError::ALREADY_REGISTERED: return "already_registered";
        case TournamentError::NOT_ENOUGH_PLAYERS: return "not_enough_players";
        case TournamentError::INVALID_PAYOUT_COUNT: return "invalid_payout_count";
        case TournamentError::TOO_MANY_PAYOUT_POSITIONS: return "too_many_payout_positions";
        case TournamentError::INVALID_PAYOUT_PERCENTAGES: return "invalid_payout_percentages";
        case TournamentError::INVALID_PAYOUT_PERCENTAGE: return "invalid_payout_percentage";
        case TournamentError::INVALID_MATCH_PAYOUT_COUNT: return "invalid_match_payout_count";
        case TournamentError::TOO_MANY_MATCH_PAYOUT_POSITIONS: return "too_many_match_payout_positions";
        case TournamentError::INVALID_MATCH_PAYOUT_PERCENTAGES: return "invalid_match_payout_percentages";
        case TournamentError::INVALID_MATCH_PAYOUT_PERCENTAGE: return "invalid_match_payout_percentage";
        case TournamentError::INVALID_WINNER_COUNT: return "invalid_winner_count";
        case TournamentError::TOO_MANY_WINNERS: return "too_many_winners";
        case TournamentError::INVALID_WINNER: return "invalid_winner";
        case TournamentError::WINNER_NOT_PARTICIPANT: return "winner_not_participant";
        case TournamentError::DUPLICATE_WINNER: return "duplicate_winner";
        case TournamentError::MISSING_WINNER_ACCOUNT: return "missing_winner_account";
        case TournamentError::TOURNAMENT_NOT_FINALIZED: return "tournament_not_finalized";
        case TournamentError::MATCH_ALREADY_PAID: return "match_already_paid";
        case TournamentError::INVALID_MATCH_COUNT: return "invalid_match_count";
        case TournamentError::NO_MATCH_REWARDS: return "no_match_rewards";
        case TournamentError::OPERATOR_FEE_ALREADY_WITHDRAWN: return "operator_fee_already_withdrawn";
        case TournamentError::MATCH_LEDGER_FULL: return "match_ledger_full";
        case TournamentError::TOURNAMENT_ALREADY_STARTED: return "tournament_already_started";
        case TournamentError::TOURNAMENT_NOT_CANCELLED: return "tournament_not_cancelled";
        case TournamentError::PARTICIPANT_NOT_FOUND: return "participant_not_found";
        case TournamentError::PARTICIPANT_ALREADY_REFUNDED: return "participant_already_refunded";
        case TournamentError::CALCULATION_OVERFLOW: return "calculation_overflow";
        case TournamentError::ESCROW_TRANSFER_FAILED: return "escrow_transfer_failed";
    }
    return "unknown";
}

// ============================================================================
// Error Kinds
// ============================================================================

// Coarse classification callers branch on; codes carry the detail
enum class ErrorKind : std::uint8_t {
    NONE = 0,
    CONFIG_INVALID = 1,
    PHASE_VIOLATION = 2,
    CAPACITY_EXCEEDED = 3,
    DUPLICATE_ENTITY = 4,
    NOT_PARTICIPANT = 5,
    MISSING_ACCOUNT = 6,
    ARITHMETIC_OVERFLOW = 7,
    ZERO_PAYOUT = 8,
    UNAUTHORIZED = 9,
    ESCROW_REJECTED = 10,
};

[[nodiscard]] constexpr ErrorKind error_kind(TournamentError error) {
    switch (error) {
        case TournamentError::OK:
            return ErrorKind::NONE;

        case TournamentError::INVALID_BUY_IN_AMOUNT:
        case TournamentError::INVALID_MAX_PLAYERS:
        case TournamentError::INVALID_MATCH_SIZE:
        case TournamentError::INVALID_TOURNAMENT_PRIZE_PERCENTAGE:
        case TournamentError::INVALID_OPERATOR_FEE_PERCENTAGE:
        case TournamentError::INVALID_PERCENTAGES:
        case TournamentError::TOURNAMENT_PRIZE_TOO_LOW:
        case TournamentError::OPERATOR_FEE_TOO_HIGH:
        case TournamentError::INVALID_PAYOUT_COUNT:
        case TournamentError::INVALID_PAYOUT_PERCENTAGES:
        case TournamentError::INVALID_PAYOUT_PERCENTAGE:
        case TournamentError::INVALID_MATCH_PAYOUT_COUNT:
        case TournamentError::INVALID_MATCH_PAYOUT_PERCENTAGES:
        case TournamentError::INVALID_MATCH_PAYOUT_PERCENTAGE:
        case TournamentError::INVALID_WINNER_COUNT:
            return ErrorKind::CONFIG_INVALID;

        case TournamentError::INVALID_PHASE:
        case TournamentError::NOT_ENOUGH_PLAYERS:
        case TournamentError::TOURNAMENT_NOT_FINALIZED:
        case TournamentError::TOURNAMENT_ALREADY_STARTED:
        case TournamentError::TOURNAMENT_NOT_CANCELLED:
            return ErrorKind::PHASE_VIOLATION;

        case TournamentError::TOURNAMENT_FULL:
        case TournamentError::TOO_MANY_PAYOUT_POSITIONS:
        case TournamentError::TOO_MANY_MATCH_PAYOUT_POSITIONS:
        case TournamentError::TOO_MANY_WINNERS:
        case TournamentError::MATCH_LEDGER_FULL:
            return ErrorKind::CAPACITY_EXCEEDED;

        case TournamentError::ALREADY_REGISTERED:
        case TournamentError::DUPLICATE_WINNER:
        case TournamentError::MATCH_ALREADY_PAID:
        case TournamentError::OPERATOR_FEE_ALREADY_WITHDRAWN:
        case TournamentError::PARTICIPANT_ALREADY_REFUNDED:
            return ErrorKind::DUPLICATE_ENTITY;

        case TournamentError::INVALID_WINNER:
        case TournamentError::WINNER_NOT_PARTICIPANT:
        case TournamentError::PARTICIPANT_NOT_FOUND:
            return ErrorKind::NOT_PARTICIPANT;

        case TournamentError::MISSING_WINNER_ACCOUNT:
            return ErrorKind::MISSING_ACCOUNT;

        case TournamentError::PLAYER_COUNT_OVERFLOW:
        case TournamentError::INVALID_MATCH_COUNT:
        case TournamentError::CALCULATION_OVERFLOW:
            return ErrorKind::ARITHMETIC_OVERFLOW;

        case TournamentError::NO_MATCH_REWARDS:
            return ErrorKind::ZERO_PAYOUT;

        case TournamentError::UNAUTHORIZED_AUTHORITY:
            return ErrorKind::UNAUTHORIZED;

        case TournamentError::ESCROW_TRANSFER_FAILED:
            return ErrorKind::ESCROW_REJECTED;
    }
    return ErrorKind::NONE;
}

[[nodiscard]] constexpr std::string_view error_kind_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "none";
        case ErrorKind::CONFIG_INVALID: return "config_invalid";
        case ErrorKind::PHASE_VIOLATION: return "phase_violation";
        case ErrorKind::CAPACITY_EXCEEDED: return "capacity_exceeded";
        case ErrorKind::DUPLICATE_ENTITY: return "duplicate_entity";
        case ErrorKind::NOT_PARTICIPANT: return "not_participant";
        case ErrorKind::MISSING_ACCOUNT: return "missing_account";
        case ErrorKind::ARITHMETIC_OVERFLOW: return "arithmetic_overflow";
        case ErrorKind::ZERO_PAYOUT: return "zero_payout";
        case ErrorKind::UNAUTHORIZED: return "unauthorized";
        case ErrorKind::ESCROW_REJECTED: return "escrow_rejected";
    }
    return "unknown";
}

}  // namespace tourney
