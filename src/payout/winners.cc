#include "winners.hh"
#include "arithmetic.hh"
#include "core/logging.hh"
#include <algorithm>
#include <unordered_set>

namespace tourney {

// ============================================================================
// Winner Implementation
// ============================================================================

Winner Winner::individual(const Address& player) {
    Winner w;
    w.kind = Kind::INDIVIDUAL;
    w.players = {player};
    w.positions_consumed = 1;
    return w;
}

Winner Winner::group(std::vector<Address> players, std::uint8_t positions_consumed) {
    Winner w;
    w.kind = Kind::GROUP;
    w.players = std::move(players);
    w.positions_consumed = positions_consumed;
    return w;
}

std::vector<Address> flatten_winners(std::span<const Winner> winners) {
    std::vector<Address> flat;
    for (const auto& winner : winners) {
        flat.insert(flat.end(), winner.players.begin(), winner.players.end());
    }
    return flat;
}

// ============================================================================
// Validation
// ============================================================================

TournamentError validate_winners(std::span<const Winner> winners,
                                 PayoutScope scope,
                                 const ParticipantPredicate& is_participant,
                                 std::size_t max_entries) {
    if (winners.empty()) {
        return TournamentError::INVALID_WINNER_COUNT;
    }
    if (winners.size() > max_entries) {
        return TournamentError::TOO_MANY_WINNERS;
    }

    std::unordered_set<Address> seen;
    for (const auto& winner : winners) {
        if (winner.is_group()) {
            if (winner.players.empty() || winner.positions_consumed == 0) {
                return TournamentError::INVALID_WINNER_COUNT;
            }
        } else if (winner.players.size() != 1) {
            return TournamentError::INVALID_WINNER_COUNT;
        }

        for (const auto& player : winner.players) {
            if (scope == PayoutScope::MATCH && player.is_zero()) {
                return TournamentError::INVALID_WINNER;
            }
            if (!is_participant(player)) {
                return TournamentError::WINNER_NOT_PARTICIPANT;
            }
            if (!seen.insert(player).second) {
                return TournamentError::DUPLICATE_WINNER;
            }
        }
    }

    return TournamentError::OK;
}

// ============================================================================
// Planning
// ============================================================================

namespace {

bool has_account(std::span<const Address> accounts, const Address& player) {
    return std::find(accounts.begin(), accounts.end(), player) != accounts.end();
}

// Sum of schedule[first, first + count); positions past the end add nothing
std::uint32_t combined_bps(std::span<const bps_t> schedule,
                           std::size_t first,
                           std::size_t count) {
    std::uint32_t sum = 0;
    for (std::size_t i = first; i < first + count && i < schedule.size(); ++i) {
        sum += schedule[i];
    }
    return sum;
}

TournamentError add_share(PayoutPlan& plan,
                          const Address& player,
                          wide_amount_t share,
                          std::span<const Address> accounts) {
    if (!has_account(accounts, player)) {
        TOURNEY_LOG_DEBUG(log::payout) << "No destination account for winner " << player.to_hex();
        return TournamentError::MISSING_WINNER_ACCOUNT;
    }
    if (!fits_amount(share)) {
        return TournamentError::CALCULATION_OVERFLOW;
    }

    auto total = checked_add(plan.total, share);
    if (!total.ok()) {
        return total.error;
    }
    plan.total = total.value;

    if (share > 0) {
        plan.transfers.push_back(Transfer{player, static_cast<amount_t>(share)});
    }
    return TournamentError::OK;
}

}  // namespace

ResolveResult plan_payouts(std::span<const Winner> winners,
                           std::span<const bps_t> schedule,
                           wide_amount_t pool,
                           PayoutScope scope,
                           std::span<const Address> accounts) {
    ResolveResult result;
    PayoutPlan& plan = result.plan;
    plan.winners = flatten_winners(winners);

    std::size_t position = 0;

    for (std::size_t index = 0; index < winners.size(); ++index) {
        const Winner& winner = winners[index];

        if (!winner.is_group()) {
            const Address& player = winner.players.front();

            if (position < schedule.size()) {
                auto amount = percentage_of(pool, schedule[position]);
                if (!amount.ok()) {
                    result.error = amount.error;
                    return result;
                }
                if (scope == PayoutScope::MATCH && amount.value == 0) {
                    result.error = TournamentError::NO_MATCH_REWARDS;
                    return result;
                }

                result.error = add_share(plan, player, amount.value, accounts);
                if (!result.ok()) {
                    return result;
                }

                TOURNEY_LOG_DEBUG(log::payout) << "Position #" << (position + 1) << " -> "
                                               << player.to_hex() << ": "
                                               << wide_to_string(amount.value);
            } else {
                ++plan.unpaid_winners;
                TOURNEY_LOG_WARN(log::payout) << "Winner " << (index + 1) << " ("
                                              << player.to_hex() << ") ranked at position "
                                              << (position + 1) << " of "
                                              << schedule.size() << " paid positions, no share";
            }
            position += 1;
            continue;
        }

        std::uint32_t bps = combined_bps(schedule, position, winner.positions_consumed);
        auto combined = percentage_of(pool, bps);
        if (!combined.ok()) {
            result.error = combined.error;
            return result;
        }

        auto shares = split_evenly(combined.value, winner.players.size());
        for (std::size_t i = 0; i < shares.size(); ++i) {
            if (shares[i] == 0) {
                result.error = TournamentError::NO_MATCH_REWARDS;
                return result;
            }
            result.error = add_share(plan, winner.players[i], shares[i], accounts);
            if (!result.ok()) {
                return result;
            }
        }

        TOURNEY_LOG_DEBUG(log::payout) << "Tied group " << (index + 1) << " of "
                                       << winner.players.size() << " players shares positions "
                                       << (position + 1) << ".."
                                       << (position + winner.positions_consumed) << ": "
                                       << wide_to_string(combined.value);

        position += winner.positions_consumed;
    }

    plan.positions_consumed = position;

    if (plan.total > pool) {
        result.error = TournamentError::CALCULATION_OVERFLOW;
        return result;
    }

    return result;
}

}  // namespace tourney
