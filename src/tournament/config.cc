#include "config.hh"
#include <algorithm>

namespace tourney {

namespace {

std::uint32_t sum_bps(std::span<const bps_t> values) {
    std::uint32_t total = 0;
    for (auto v : values) {
        total += v;
    }
    return total;
}

bool entries_in_range(std::span<const bps_t> values) {
    return std::all_of(values.begin(), values.end(), [](bps_t v) {
        return v > 0 && v <= TournamentLimits::BPS_TOTAL;
    });
}

}  // namespace

TournamentError validate_config(const TournamentConfig& config) {
    if (config.entry_fee == 0) {
        return TournamentError::INVALID_BUY_IN_AMOUNT;
    }
    if (config.max_players < TournamentLimits::MIN_PLAYERS ||
        config.max_players > TournamentLimits::MAX_PLAYERS) {
        return TournamentError::INVALID_MAX_PLAYERS;
    }
    if (config.match_size < 2 || config.match_size > config.max_players) {
        return TournamentError::INVALID_MATCH_SIZE;
    }
    if (config.tournament_prize_bps == 0) {
        return TournamentError::INVALID_TOURNAMENT_PRIZE_PERCENTAGE;
    }
    if (config.operator_fee_bps == 0 ||
        config.operator_fee_bps > TournamentLimits::MAX_OPERATOR_FEE_BPS) {
        return TournamentError::INVALID_OPERATOR_FEE_PERCENTAGE;
    }

    std::uint32_t total = static_cast<std::uint32_t>(config.tournament_prize_bps) +
                          config.match_prize_bps +
                          config.operator_fee_bps;
    if (total != TournamentLimits::BPS_TOTAL) {
        return TournamentError::INVALID_PERCENTAGES;
    }
    if (config.tournament_prize_bps < TournamentLimits::MIN_TOURNAMENT_PRIZE_BPS) {
        return TournamentError::TOURNAMENT_PRIZE_TOO_LOW;
    }
    if (config.operator_fee_bps > TournamentLimits::MAX_OPERATOR_FEE_BPS) {
        return TournamentError::OPERATOR_FEE_TOO_HIGH;
    }

    return TournamentError::OK;
}

TournamentError validate_tournament_payouts(std::span<const bps_t> payouts,
                                            std::size_t current_players) {
    if (payouts.empty()) {
        return TournamentError::INVALID_PAYOUT_COUNT;
    }
    if (payouts.size() > TournamentLimits::MAX_TOURNAMENT_PAYOUT_POSITIONS ||
        payouts.size() > current_players) {
        return TournamentError::TOO_MANY_PAYOUT_POSITIONS;
    }
    if (sum_bps(payouts) != TournamentLimits::BPS_TOTAL) {
        return TournamentError::INVALID_PAYOUT_PERCENTAGES;
    }
    if (!entries_in_range(payouts)) {
        return TournamentError::INVALID_PAYOUT_PERCENTAGE;
    }
    return TournamentError::OK;
}

TournamentError validate_match_payouts(std::span<const bps_t> payouts) {
    if (payouts.empty()) {
        return TournamentError::INVALID_MATCH_PAYOUT_COUNT;
    }
    if (payouts.size() > TournamentLimits::MAX_MATCH_PAYOUT_POSITIONS) {
        return TournamentError::TOO_MANY_MATCH_PAYOUT_POSITIONS;
    }
    if (sum_bps(payouts) != TournamentLimits::BPS_TOTAL) {
        return TournamentError::INVALID_MATCH_PAYOUT_PERCENTAGES;
    }
    if (!entries_in_range(payouts)) {
        return TournamentError::INVALID_MATCH_PAYOUT_PERCENTAGE;
    }
    return TournamentError::OK;
}

bool ProgramConfig::is_approved_creator(const Address& creator) const {
    return std::find(approved_creators.begin(), approved_creators.end(), creator) !=
           approved_creators.end();
}

}  // namespace tourney
