#pragma once

#include "core/types.hh"
#include "core/errors.hh"
#include <vector>

namespace tourney {

inline constexpr std::uint32_t BPS_DENOMINATOR = 10'000;

// ============================================================================
// Checked Amount - value or the reason it could not be computed
// ============================================================================

struct CheckedAmount {
    TournamentError error = TournamentError::OK;
    wide_amount_t value = 0;

    [[nodiscard]] bool ok() const { return error == TournamentError::OK; }

    [[nodiscard]] static CheckedAmount of(wide_amount_t v) {
        return CheckedAmount{TournamentError::OK, v};
    }
    [[nodiscard]] static CheckedAmount failure(TournamentError e) {
        return CheckedAmount{e, 0};
    }
};

// ============================================================================
// Primitive Operations
// ============================================================================

// a * b, rejected when the division does not invert the multiplication
[[nodiscard]] CheckedAmount checked_mul(wide_amount_t a, wide_amount_t b);

// a + b, rejected on wraparound
[[nodiscard]] CheckedAmount checked_add(wide_amount_t a, wide_amount_t b);

// total * bps / 10000; the result may never exceed total
[[nodiscard]] CheckedAmount percentage_of(wide_amount_t total, std::uint32_t bps);

// Narrow an accumulator to a transferable amount
[[nodiscard]] bool fits_amount(wide_amount_t value);

// ============================================================================
// Pool Calculations
// ============================================================================

// entry_fee * players
[[nodiscard]] CheckedAmount total_buy_ins(std::uint32_t players, amount_t entry_fee);

// ceil(players / match_size); zero when either input is zero
[[nodiscard]] std::uint32_t match_count(std::uint32_t players, std::uint32_t match_size);

// Floor share of the match pool for a single match
[[nodiscard]] CheckedAmount per_match_pool(wide_amount_t total_match_pool,
                                           std::uint32_t players,
                                           std::uint32_t match_size);

// ============================================================================
// Even Split
// ============================================================================

// Divide combined across recipients; every share is combined / recipients
// except the last, which takes what is left. Shares always sum to combined.
[[nodiscard]] std::vector<wide_amount_t> split_evenly(wide_amount_t combined,
                                                      std::size_t recipients);

}  // namespace tourney
