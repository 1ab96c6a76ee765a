#include "events.hh"
#include "core/logging.hh"
#include <algorithm>

namespace tourney {

// ============================================================================
// EventLog Implementation
// ============================================================================

void EventLog::on_created(const TournamentCreated& event) {
    TOURNEY_LOG_INFO(log::events) << "TournamentCreated tournament=" << event.tournament.to_hex()
                                  << " authority=" << event.authority.to_hex()
                                  << " entry_fee=" << event.config.entry_fee
                                  << " max_players=" << static_cast<int>(event.config.max_players)
                                  << " match_size=" << static_cast<int>(event.config.match_size)
                                  << " at=" << event.timestamp;
    std::lock_guard<std::mutex> lock(mutex_);
    sequence_.push_back(EventType::TOURNAMENT_CREATED);
    created_.push_back(event);
}

void EventLog::on_bought_in(const PlayerBoughtIn& event) {
    TOURNEY_LOG_INFO(log::events) << "PlayerBoughtIn tournament=" << event.tournament.to_hex()
                                  << " player=" << event.player.to_hex()
                                  << " amount=" << event.amount
                                  << " players=" << static_cast<int>(event.current_players)
                                  << " at=" << event.timestamp;
    std::lock_guard<std::mutex> lock(mutex_);
    sequence_.push_back(EventType::PLAYER_BOUGHT_IN);
    buy_ins_.push_back(event);
}

void EventLog::on_started(const TournamentStarted& event) {
    TOURNEY_LOG_INFO(log::events) << "TournamentStarted tournament=" << event.tournament.to_hex()
                                  << " players=" << static_cast<int>(event.current_players)
                                  << " payout_positions=" << event.tournament_payouts.size()
                                  << " match_positions=" << event.match_payouts.size()
                                  << " at=" << event.timestamp;
    std::lock_guard<std::mutex> lock(mutex_);
    sequence_.push_back(EventType::TOURNAMENT_STARTED);
    starts_.push_back(event);
}

void EventLog::on_finalized(const TournamentFinalized& event) {
    TOURNEY_LOG_INFO(log::events) << "TournamentFinalized tournament=" << event.tournament.to_hex()
                                  << " winners=" << event.winners.size()
                                  << " pool=" << wide_to_string(event.prize_pool)
                                  << " distributed=" << wide_to_string(event.total_distributed)
                                  << " at=" << event.timestamp;
    std::lock_guard<std::mutex> lock(mutex_);
    sequence_.push_back(EventType::TOURNAMENT_FINALIZED);
    finalizations_.push_back(event);
}

void EventLog::on_match_rewards(const MatchRewardsDistributed& event) {
    TOURNEY_LOG_INFO(log::events) << "MatchRewardsDistributed tournament=" << event.tournament.to_hex()
                                  << " match=" << event.match_id
                                  << " winners=" << event.winners.size()
                                  << " pool=" << wide_to_string(event.match_pool)
                                  << " distributed=" << wide_to_string(event.total_distributed)
                                  << " at=" << event.timestamp;
    std::lock_guard<std::mutex> lock(mutex_);
    sequence_.push_back(EventType::MATCH_REWARDS_DISTRIBUTED);
    match_rewards_.push_back(event);
}

void EventLog::on_operator_fee(const OperatorFeeWithdrawn& event) {
    TOURNEY_LOG_INFO(log::events) << "OperatorFeeWithdrawn tournament=" << event.tournament.to_hex()
                                  << " recipient=" << event.recipient.to_hex()
                                  << " amount=" << event.amount
                                  << " at=" << event.timestamp;
    std::lock_guard<std::mutex> lock(mutex_);
    sequence_.push_back(EventType::OPERATOR_FEE_WITHDRAWN);
    operator_fees_.push_back(event);
}

void EventLog::on_cancelled(const TournamentCancelled& event) {
    TOURNEY_LOG_INFO(log::events) << "TournamentCancelled tournament=" << event.tournament.to_hex()
                                  << " participants=" << static_cast<int>(event.participants)
                                  << " at=" << event.timestamp;
    std::lock_guard<std::mutex> lock(mutex_);
    sequence_.push_back(EventType::TOURNAMENT_CANCELLED);
    cancellations_.push_back(event);
}

void EventLog::on_refunded(const ParticipantRefunded& event) {
    TOURNEY_LOG_INFO(log::events) << "ParticipantRefunded tournament=" << event.tournament.to_hex()
                                  << " participant=" << event.participant.to_hex()
                                  << " amount=" << event.amount
                                  << " at=" << event.timestamp;
    std::lock_guard<std::mutex> lock(mutex_);
    sequence_.push_back(EventType::PARTICIPANT_REFUNDED);
    refunds_.push_back(event);
}

std::vector<EventType> EventLog::sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

std::size_t EventLog::count(EventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count(sequence_.begin(), sequence_.end(), type));
}

std::size_t EventLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_.size();
}

std::vector<TournamentCreated> EventLog::created() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_;
}

std::vector<PlayerBoughtIn> EventLog::buy_ins() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buy_ins_;
}

std::vector<TournamentStarted> EventLog::starts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return starts_;
}

std::vector<TournamentFinalized> EventLog::finalizations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return finalizations_;
}

std::vector<MatchRewardsDistributed> EventLog::match_rewards() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return match_rewards_;
}

std::vector<OperatorFeeWithdrawn> EventLog::operator_fees() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return operator_fees_;
}

std::vector<TournamentCancelled> EventLog::cancellations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancellations_;
}

std::vector<ParticipantRefunded> EventLog::refunds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return refunds_;
}

void EventLog::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    sequence_.clear();
    created_.clear();
    buy_ins_.clear();
    starts_.clear();
    finalizations_.clear();
    match_rewards_.clear();
    operator_fees_.clear();
    cancellations_.clear();
    refunds_.clear();
}

}  // namespace tourney
