#include "arithmetic.hh"
#include "core/logging.hh"
#include <limits>

namespace tourney {

CheckedAmount checked_mul(wide_amount_t a, wide_amount_t b) {
    wide_amount_t product = a * b;
    if (a != 0 && product / a != b) {
        TOURNEY_LOG_DEBUG(log::payout) << "Multiplication overflow: "
                                       << wide_to_string(a) << " * " << wide_to_string(b);
        return CheckedAmount::failure(TournamentError::CALCULATION_OVERFLOW);
    }
    return CheckedAmount::of(product);
}

CheckedAmount checked_add(wide_amount_t a, wide_amount_t b) {
    wide_amount_t sum = a + b;
    if (sum < a) {
        return CheckedAmount::failure(TournamentError::CALCULATION_OVERFLOW);
    }
    return CheckedAmount::of(sum);
}

CheckedAmount percentage_of(wide_amount_t total, std::uint32_t bps) {
    auto scaled = checked_mul(total, bps);
    if (!scaled.ok()) {
        return scaled;
    }
    wide_amount_t amount = scaled.value / BPS_DENOMINATOR;
    if (amount > total) {
        return CheckedAmount::failure(TournamentError::CALCULATION_OVERFLOW);
    }
    return CheckedAmount::of(amount);
}

bool fits_amount(wide_amount_t value) {
    return value <= static_cast<wide_amount_t>(std::numeric_limits<amount_t>::max());
}

CheckedAmount total_buy_ins(std::uint32_t players, amount_t entry_fee) {
    auto total = checked_mul(players, entry_fee);
    if (!total.ok()) {
        return total;
    }
    if (entry_fee != 0 && total.value / entry_fee != players) {
        return CheckedAmount::failure(TournamentError::CALCULATION_OVERFLOW);
    }
    return total;
}

std::uint32_t match_count(std::uint32_t players, std::uint32_t match_size) {
    if (players == 0 || match_size == 0) {
        return 0;
    }
    return (players + match_size - 1) / match_size;
}

CheckedAmount per_match_pool(wide_amount_t total_match_pool,
                             std::uint32_t players,
                             std::uint32_t match_size) {
    std::uint32_t matches = match_count(players, match_size);
    if (matches == 0) {
        return CheckedAmount::failure(TournamentError::INVALID_MATCH_COUNT);
    }

    wide_amount_t pool = total_match_pool / matches;
    if (pool == 0) {
        return CheckedAmount::failure(TournamentError::NO_MATCH_REWARDS);
    }

    auto back = checked_mul(pool, matches);
    if (!back.ok() || back.value > total_match_pool) {
        return CheckedAmount::failure(TournamentError::CALCULATION_OVERFLOW);
    }
    return CheckedAmount::of(pool);
}

std::vector<wide_amount_t> split_evenly(wide_amount_t combined, std::size_t recipients) {
    std::vector<wide_amount_t> shares;
    if (recipients == 0) {
        return shares;
    }

    wide_amount_t per_recipient = combined / recipients;
    shares.assign(recipients, per_recipient);
    shares.back() = combined - per_recipient * (recipients - 1);
    return shares;
}

}  // namespace tourney
