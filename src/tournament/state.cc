#include "state.hh"
#include "core/logging.hh"

namespace tourney {

// ============================================================================
// TournamentState Serialization
// ============================================================================

std::vector<std::uint8_t> TournamentState::serialize() const {
    std::vector<std::uint8_t> out;
    out.reserve(MAX_SERIALIZED_SIZE);

    append_u8(out, SERIALIZATION_VERSION);
    append_address(out, id);
    append_address(out, authority);

    append_u64(out, config.entry_fee);
    append_u8(out, config.max_players);
    append_u8(out, config.match_size);
    append_u16(out, config.tournament_prize_bps);
    append_u16(out, config.match_prize_bps);
    append_u16(out, config.operator_fee_bps);

    append_u8(out, static_cast<std::uint8_t>(phase));
    append_u8(out, operator_fee_withdrawn ? 1 : 0);

    append_u8(out, static_cast<std::uint8_t>(participants.size()));
    for (const auto& player : participants.entries()) {
        append_address(out, player);
    }

    append_u8(out, static_cast<std::uint8_t>(tournament_payouts.size()));
    for (bps_t bps : tournament_payouts) {
        append_u16(out, bps);
    }

    append_u8(out, static_cast<std::uint8_t>(match_payout_percentages.size()));
    for (bps_t bps : match_payout_percentages) {
        append_u16(out, bps);
    }

    append_u8(out, static_cast<std::uint8_t>(paid_match_ids.size()));
    for (match_id_t match_id : paid_match_ids.entries()) {
        append_u32(out, match_id);
    }

    append_u8(out, static_cast<std::uint8_t>(refunded_participants.size()));
    for (const auto& player : refunded_participants.entries()) {
        append_address(out, player);
    }

    return out;
}

namespace {

std::optional<std::vector<bps_t>> read_schedule(ByteReader& reader, std::size_t limit) {
    auto count = reader.read_u8();
    if (!count || *count > limit) {
        return std::nullopt;
    }
    std::vector<bps_t> schedule;
    schedule.reserve(*count);
    for (std::size_t i = 0; i < *count; ++i) {
        auto bps = reader.read_u16();
        if (!bps) {
            return std::nullopt;
        }
        schedule.push_back(*bps);
    }
    return schedule;
}

}  // namespace

std::optional<TournamentState> TournamentState::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() > MAX_SERIALIZED_SIZE) {
        return std::nullopt;
    }

    ByteReader reader(data);
    TournamentState state;

    auto version = reader.read_u8();
    if (!version || *version != SERIALIZATION_VERSION) {
        return std::nullopt;
    }

    auto id = reader.read_address();
    auto authority = reader.read_address();
    auto entry_fee = reader.read_u64();
    auto max_players = reader.read_u8();
    auto match_size = reader.read_u8();
    auto tournament_bps = reader.read_u16();
    auto match_bps = reader.read_u16();
    auto operator_bps = reader.read_u16();
    auto phase = reader.read_u8();
    auto fee_withdrawn = reader.read_u8();
    if (!id || !authority || !entry_fee || !max_players || !match_size ||
        !tournament_bps || !match_bps || !operator_bps || !phase || !fee_withdrawn) {
        return std::nullopt;
    }

    state.id = *id;
    state.authority = *authority;
    state.config.entry_fee = *entry_fee;
    state.config.max_players = *max_players;
    state.config.match_size = *match_size;
    state.config.tournament_prize_bps = *tournament_bps;
    state.config.match_prize_bps = *match_bps;
    state.config.operator_fee_bps = *operator_bps;

    if (validate_config(state.config) != TournamentError::OK) {
        TOURNEY_LOG_DEBUG(log::tournament) << "Rejecting stored state with invalid config";
        return std::nullopt;
    }
    if (*phase > static_cast<std::uint8_t>(TournamentPhase::CANCELLED) || *fee_withdrawn > 1) {
        return std::nullopt;
    }
    state.phase = static_cast<TournamentPhase>(*phase);
    state.operator_fee_withdrawn = *fee_withdrawn == 1;

    // Fee is withdrawn only after finalization
    bool finalized = state.phase == TournamentPhase::FINALIZED;
    if (state.operator_fee_withdrawn && !finalized) {
        return std::nullopt;
    }

    // Participants: unique, at most max_players
    auto player_count = reader.read_u8();
    if (!player_count || *player_count > state.config.max_players) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < *player_count; ++i) {
        auto player = reader.read_address();
        if (!player) {
            return std::nullopt;
        }
        if (state.participants.record(*player) != IdempotencyGuard<Address>::RecordResult::RECORDED) {
            return std::nullopt;
        }
    }

    auto payouts = read_schedule(reader, TournamentLimits::MAX_TOURNAMENT_PAYOUT_POSITIONS);
    auto match_payouts = read_schedule(reader, TournamentLimits::MAX_MATCH_PAYOUT_POSITIONS);
    if (!payouts || !match_payouts) {
        return std::nullopt;
    }
    state.tournament_payouts = std::move(*payouts);
    state.match_payout_percentages = std::move(*match_payouts);

    // Schedules exist exactly when the tournament has started
    bool started = state.phase == TournamentPhase::PLAYING ||
                   state.phase == TournamentPhase::FINALIZED;
    if (started) {
        if (validate_tournament_payouts(state.tournament_payouts, state.participants.size()) != TournamentError::OK ||
            validate_match_payouts(state.match_payout_percentages) != TournamentError::OK) {
            return std::nullopt;
        }
    } else if (!state.tournament_payouts.empty() || !state.match_payout_percentages.empty()) {
        return std::nullopt;
    }

    auto paid_count = reader.read_u8();
    if (!paid_count || *paid_count > TournamentLimits::MAX_PAID_MATCHES ||
        (*paid_count > 0 && !finalized)) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < *paid_count; ++i) {
        auto match_id = reader.read_u32();
        if (!match_id) {
            return std::nullopt;
        }
        if (state.paid_match_ids.record(*match_id) != PaidMatchGuard::RecordResult::RECORDED) {
            return std::nullopt;
        }
    }

    // Refunds: unique, only of registered players, only once cancelled
    auto refunded_count = reader.read_u8();
    if (!refunded_count || *refunded_count > state.participants.size() ||
        (*refunded_count > 0 && state.phase != TournamentPhase::CANCELLED)) {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < *refunded_count; ++i) {
        auto player = reader.read_address();
        if (!player || !state.is_participant(*player)) {
            return std::nullopt;
        }
        if (state.refunded_participants.record(*player) != RefundGuard::RecordResult::RECORDED) {
            return std::nullopt;
        }
    }

    if (reader.remaining() != 0) {
        return std::nullopt;
    }

    return state;
}

}  // namespace tourney
