#include "tournament.hh"
#include "core/logging.hh"

namespace tourney {

// ============================================================================
// Construction
// ============================================================================

Tournament::Tournament(ConstructionKey,
                       TournamentState state,
                       EscrowGateway& escrow,
                       EventSink& events)
    : state_(std::move(state))
    , id_(state_.id)
    , escrow_(escrow)
    , events_(events)
    , token_(escrow.open_vault(state_.id)) {}

CreateResult Tournament::create(const ProgramConfig& program,
                                const Address& tournament_id,
                                const Address& creator,
                                const TournamentConfig& config,
                                EscrowGateway& escrow,
                                EventSink& events) {
    CreateResult result;

    if (!program.is_approved_creator(creator)) {
        TOURNEY_LOG_WARN(log::tournament) << "Creator " << creator.to_hex()
                                          << " is not an approved tournament creator";
        result.error = TournamentError::UNAUTHORIZED_AUTHORITY;
        return result;
    }

    result.error = validate_config(config);
    if (!result.ok()) {
        TOURNEY_LOG_DEBUG(log::tournament) << "Rejected config: "
                                           << tournament_error_string(result.error);
        return result;
    }

    TournamentState state;
    state.id = tournament_id;
    state.authority = creator;
    state.config = config;
    state.phase = TournamentPhase::REGISTRATION;

    result.tournament = std::make_unique<Tournament>(ConstructionKey{}, std::move(state), escrow,
                                                     events);

    TOURNEY_LOG_INFO(log::tournament) << "Created tournament " << tournament_id.to_hex()
                                      << " entry_fee=" << config.entry_fee
                                      << " max_players=" << static_cast<int>(config.max_players)
                                      << " match_size=" << static_cast<int>(config.match_size)
                                      << " split=" << config.tournament_prize_bps << "/"
                                      << config.match_prize_bps << "/" << config.operator_fee_bps;

    events.on_created(TournamentCreated{tournament_id, creator, config, unix_now()});
    return result;
}

std::unique_ptr<Tournament> Tournament::restore(TournamentState state,
                                                EscrowGateway& escrow,
                                                EventSink& events) {
    TOURNEY_LOG_DEBUG(log::tournament) << "Restoring tournament " << state.id.to_hex()
                                       << " in phase " << tournament_phase_string(state.phase);
    return std::make_unique<Tournament>(ConstructionKey{}, std::move(state), escrow, events);
}

// ============================================================================
// Internal Helpers (mutex_ held)
// ============================================================================

bool Tournament::is_authority(const Address& caller) const {
    return caller == state_.authority;
}

CheckedAmount Tournament::pool_share(bps_t bps) const {
    auto total = total_buy_ins(state_.current_players(), state_.config.entry_fee);
    if (!total.ok()) {
        return total;
    }
    return percentage_of(total.value, bps);
}

TournamentError Tournament::pay_out(std::span<const Transfer> transfers) {
    if (transfers.empty()) {
        return TournamentError::OK;
    }
    EscrowResult result = escrow_.disburse(token_, transfers);
    if (result != EscrowResult::SUCCESS) {
        TOURNEY_LOG_ERROR(log::tournament) << "Escrow rejected payout from " << id_.to_hex()
                                           << ": " << escrow_result_string(result);
        return TournamentError::ESCROW_TRANSFER_FAILED;
    }
    return TournamentError::OK;
}

// ============================================================================
// Registration
// ============================================================================

TournamentError Tournament::register_player(const Address& player) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (state_.phase != TournamentPhase::REGISTRATION) {
        return TournamentError::INVALID_PHASE;
    }
    if (state_.is_full()) {
        TOURNEY_LOG_DEBUG(log::tournament) << "Tournament " << id_.to_hex() << " is full at "
                                           << static_cast<int>(state_.current_players());
        return TournamentError::TOURNAMENT_FULL;
    }
    if (state_.participants.check(player) == IdempotencyGuard<Address>::RecordResult::FULL) {
        return TournamentError::PLAYER_COUNT_OVERFLOW;
    }
    if (state_.is_participant(player)) {
        return TournamentError::ALREADY_REGISTERED;
    }

    EscrowResult paid = escrow_.collect(token_, player, state_.config.entry_fee);
    if (paid != EscrowResult::SUCCESS) {
        TOURNEY_LOG_WARN(log::tournament) << "Buy-in from " << player.to_hex()
                                          << " failed: " << escrow_result_string(paid);
        return TournamentError::ESCROW_TRANSFER_FAILED;
    }

    state_.participants.record(player);

    TOURNEY_LOG_INFO(log::tournament) << "Player " << player.to_hex() << " bought in ("
                                      << static_cast<int>(state_.current_players()) << "/"
                                      << static_cast<int>(state_.config.max_players) << ")";

    PlayerBoughtIn event{id_, player, state_.config.entry_fee, state_.current_players(),
                         unix_now()};
    lock.unlock();

    events_.on_bought_in(event);
    return TournamentError::OK;
}

// ============================================================================
// Start
// ============================================================================

TournamentError Tournament::start(const Address& caller,
                                  std::span<const bps_t> tournament_payouts,
                                  std::span<const bps_t> match_payouts) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!is_authority(caller)) {
        return TournamentError::UNAUTHORIZED_AUTHORITY;
    }
    if (state_.phase != TournamentPhase::REGISTRATION) {
        return TournamentError::INVALID_PHASE;
    }
    if (state_.current_players() == 0) {
        return TournamentError::NOT_ENOUGH_PLAYERS;
    }

    TournamentError err = validate_tournament_payouts(tournament_payouts, state_.current_players());
    if (err != TournamentError::OK) {
        TOURNEY_LOG_DEBUG(log::tournament) << "Rejected tournament payouts: "
                                           << tournament_error_string(err);
        return err;
    }
    err = validate_match_payouts(match_payouts);
    if (err != TournamentError::OK) {
        TOURNEY_LOG_DEBUG(log::tournament) << "Rejected match payouts: "
                                           << tournament_error_string(err);
        return err;
    }

    state_.tournament_payouts.assign(tournament_payouts.begin(), tournament_payouts.end());
    state_.match_payout_percentages.assign(match_payouts.begin(), match_payouts.end());
    state_.phase = TournamentPhase::PLAYING;

    TOURNEY_LOG_INFO(log::tournament) << "Tournament " << id_.to_hex() << " started with "
                                      << static_cast<int>(state_.current_players()) << " players, "
                                      << state_.tournament_payouts.size() << " paid positions";

    TournamentStarted event{id_, state_.current_players(), state_.tournament_payouts,
                            state_.match_payout_percentages, unix_now()};
    lock.unlock();

    events_.on_started(event);
    return TournamentError::OK;
}

// ============================================================================
// Finalize
// ============================================================================

TournamentError Tournament::finalize(const Address& caller,
                                     std::span<const Winner> winners,
                                     std::span<const Address> accounts) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!is_authority(caller)) {
        return TournamentError::UNAUTHORIZED_AUTHORITY;
    }
    if (state_.phase != TournamentPhase::PLAYING) {
        return TournamentError::INVALID_PHASE;
    }

    TournamentError err = validate_winners(
        winners, PayoutScope::TOURNAMENT,
        [this](const Address& player) { return state_.is_participant(player); },
        state_.current_players());
    if (err != TournamentError::OK) {
        TOURNEY_LOG_DEBUG(log::tournament) << "Rejected tournament winners: "
                                           << tournament_error_string(err);
        return err;
    }

    auto pool = pool_share(state_.config.tournament_prize_bps);
    if (!pool.ok()) {
        return pool.error;
    }

    auto resolved = plan_payouts(winners, state_.tournament_payouts, pool.value,
                                 PayoutScope::TOURNAMENT, accounts);
    if (!resolved.ok()) {
        TOURNEY_LOG_DEBUG(log::tournament) << "Tournament payout plan failed: "
                                           << tournament_error_string(resolved.error);
        return resolved.error;
    }

    err = pay_out(resolved.plan.transfers);
    if (err != TournamentError::OK) {
        return err;
    }

    state_.phase = TournamentPhase::FINALIZED;

    TOURNEY_LOG_INFO(log::tournament) << "Tournament " << id_.to_hex() << " finalized: "
                                      << wide_to_string(resolved.plan.total) << " of "
                                      << wide_to_string(pool.value) << " paid to "
                                      << resolved.plan.transfers.size() << " transfers";

    TournamentFinalized event{id_, std::move(resolved.plan.winners), pool.value,
                              resolved.plan.total, unix_now()};
    lock.unlock();

    events_.on_finalized(event);
    return TournamentError::OK;
}

// ============================================================================
// Match Rewards
// ============================================================================

TournamentError Tournament::distribute_match(const Address& caller,
                                             match_id_t match_id,
                                             std::span<const Winner> winners,
                                             std::span<const Address> accounts) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!is_authority(caller)) {
        return TournamentError::UNAUTHORIZED_AUTHORITY;
    }
    if (state_.phase != TournamentPhase::FINALIZED) {
        return TournamentError::TOURNAMENT_NOT_FINALIZED;
    }
    switch (state_.paid_match_ids.check(match_id)) {
        case PaidMatchGuard::RecordResult::DUPLICATE:
            TOURNEY_LOG_DEBUG(log::tournament) << "Match " << match_id << " already paid";
            return TournamentError::MATCH_ALREADY_PAID;
        case PaidMatchGuard::RecordResult::FULL:
            return TournamentError::MATCH_LEDGER_FULL;
        case PaidMatchGuard::RecordResult::RECORDED:
            break;
    }

    TournamentError err = validate_winners(
        winners, PayoutScope::MATCH,
        [this](const Address& player) { return state_.is_participant(player); },
        state_.current_players());
    if (err != TournamentError::OK) {
        TOURNEY_LOG_DEBUG(log::tournament) << "Rejected winners for match " << match_id << ": "
                                           << tournament_error_string(err);
        return err;
    }

    auto total_match_pool = pool_share(state_.config.match_prize_bps);
    if (!total_match_pool.ok()) {
        return total_match_pool.error;
    }
    auto pool = per_match_pool(total_match_pool.value, state_.current_players(),
                               state_.config.match_size);
    if (!pool.ok()) {
        return pool.error;
    }

    auto resolved = plan_payouts(winners, state_.match_payout_percentages, pool.value,
                                 PayoutScope::MATCH, accounts);
    if (!resolved.ok()) {
        TOURNEY_LOG_DEBUG(log::tournament) << "Payout plan for match " << match_id << " failed: "
                                           << tournament_error_string(resolved.error);
        return resolved.error;
    }

    err = pay_out(resolved.plan.transfers);
    if (err != TournamentError::OK) {
        return err;
    }

    state_.paid_match_ids.record(match_id);

    TOURNEY_LOG_INFO(log::tournament) << "Match " << match_id << " of " << id_.to_hex()
                                      << " paid " << wide_to_string(resolved.plan.total)
                                      << " of " << wide_to_string(pool.value);

    MatchRewardsDistributed event{id_, match_id, std::move(resolved.plan.winners), pool.value,
                                  resolved.plan.total, unix_now()};
    lock.unlock();

    events_.on_match_rewards(event);
    return TournamentError::OK;
}

// ============================================================================
// Operator Fee
// ============================================================================

TournamentError Tournament::withdraw_operator_fee(const Address& caller, const Address& recipient) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!is_authority(caller)) {
        return TournamentError::UNAUTHORIZED_AUTHORITY;
    }
    if (state_.phase != TournamentPhase::FINALIZED) {
        return TournamentError::TOURNAMENT_NOT_FINALIZED;
    }
    if (state_.operator_fee_withdrawn) {
        return TournamentError::OPERATOR_FEE_ALREADY_WITHDRAWN;
    }

    auto fee = pool_share(state_.config.operator_fee_bps);
    if (!fee.ok()) {
        return fee.error;
    }
    if (!fits_amount(fee.value)) {
        return TournamentError::CALCULATION_OVERFLOW;
    }

    const Transfer transfer{recipient, static_cast<amount_t>(fee.value)};
    if (transfer.amount > 0) {
        TournamentError err = pay_out(std::span<const Transfer>(&transfer, 1));
        if (err != TournamentError::OK) {
            return err;
        }
    }

    state_.operator_fee_withdrawn = true;

    TOURNEY_LOG_INFO(log::tournament) << "Operator fee " << transfer.amount << " of "
                                      << id_.to_hex() << " withdrawn to " << recipient.to_hex();

    OperatorFeeWithdrawn event{id_, recipient, transfer.amount, unix_now()};
    lock.unlock();

    events_.on_operator_fee(event);
    return TournamentError::OK;
}

// ============================================================================
// Cancellation and Refunds
// ============================================================================

TournamentError Tournament::cancel(const Address& caller) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (!is_authority(caller)) {
        return TournamentError::UNAUTHORIZED_AUTHORITY;
    }
    if (state_.phase != TournamentPhase::REGISTRATION) {
        return TournamentError::TOURNAMENT_ALREADY_STARTED;
    }

    state_.phase = TournamentPhase::CANCELLED;

    TOURNEY_LOG_INFO(log::tournament) << "Tournament " << id_.to_hex() << " cancelled with "
                                      << static_cast<int>(state_.current_players())
                                      << " participants to refund";

    TournamentCancelled event{id_, state_.current_players(), unix_now()};
    lock.unlock();

    events_.on_cancelled(event);
    return TournamentError::OK;
}

TournamentError Tournament::refund(const Address& participant) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (state_.phase != TournamentPhase::CANCELLED) {
        return TournamentError::TOURNAMENT_NOT_CANCELLED;
    }
    if (!state_.is_participant(participant)) {
        return TournamentError::PARTICIPANT_NOT_FOUND;
    }
    if (state_.refunded_participants.check(participant) != RefundGuard::RecordResult::RECORDED) {
        return TournamentError::PARTICIPANT_ALREADY_REFUNDED;
    }

    const Transfer transfer{participant, state_.config.entry_fee};
    TournamentError err = pay_out(std::span<const Transfer>(&transfer, 1));
    if (err != TournamentError::OK) {
        return err;
    }

    state_.refunded_participants.record(participant);

    TOURNEY_LOG_INFO(log::tournament) << "Refunded " << transfer.amount << " to "
                                      << participant.to_hex() << " ("
                                      << state_.refunded_participants.size() << "/"
                                      << static_cast<int>(state_.current_players()) << ")";

    ParticipantRefunded event{id_, participant, transfer.amount, unix_now()};
    lock.unlock();

    events_.on_refunded(event);
    return TournamentError::OK;
}

// ============================================================================
// Queries
// ============================================================================

TournamentState Tournament::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

TournamentPhase Tournament::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.phase;
}

player_count_t Tournament::current_players() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.current_players();
}

bool Tournament::is_participant(const Address& player) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.is_participant(player);
}

bool Tournament::is_match_paid(match_id_t match_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.paid_match_ids.contains(match_id);
}

bool Tournament::is_refunded(const Address& participant) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.refunded_participants.contains(participant);
}

amount_t Tournament::vault_balance() const {
    return escrow_.vault_balance(token_);
}

CheckedAmount Tournament::tournament_pool() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_share(state_.config.tournament_prize_bps);
}

CheckedAmount Tournament::match_pool() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_share(state_.config.match_prize_bps);
}

CheckedAmount Tournament::operator_fee() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_share(state_.config.operator_fee_bps);
}

}  // namespace tourney
