#pragma once

#include "core/types.hh"
#include "tournament/config.hh"
#include <mutex>
#include <string_view>
#include <vector>

namespace tourney {

// ============================================================================
// Event Types
// ============================================================================

enum class EventType : std::uint8_t {
    TOURNAMENT_CREATED = 0,
    PLAYER_BOUGHT_IN = 1,
    TOURNAMENT_STARTED = 2,
    TOURNAMENT_FINALIZED = 3,
    MATCH_REWARDS_DISTRIBUTED = 4,
    OPERATOR_FEE_WITHDRAWN = 5,
    TOURNAMENT_CANCELLED = 6,
    PARTICIPANT_REFUNDED = 7,
};

[[nodiscard]] constexpr std::string_view event_type_string(EventType type) {
    switch (type) {
        case EventType::TOURNAMENT_CREATED: return "tournament_created";
        case EventType::PLAYER_BOUGHT_IN: return "player_bought_in";
        case EventType::TOURNAMENT_STARTED: return "tournament_started";
        case EventType::TOURNAMENT_FINALIZED: return "tournament_finalized";
        case EventType::MATCH_REWARDS_DISTRIBUTED: return "match_rewards_distributed";
        case EventType::OPERATOR_FEE_WITHDRAWN: return "operator_fee_withdrawn";
        case EventType::TOURNAMENT_CANCELLED: return "tournament_cancelled";
        case EventType::PARTICIPANT_REFUNDED: return "participant_refunded";
    }
    return "unknown";
}

// ============================================================================
// Event Payloads
// ============================================================================

struct TournamentCreated {
    Address tournament;
    Address authority;
    TournamentConfig config;
    unix_time_t timestamp = 0;
};

struct PlayerBoughtIn {
    Address tournament;
    Address player;
    amount_t amount = 0;
    player_count_t current_players = 0;
    unix_time_t timestamp = 0;
};

struct TournamentStarted {
    Address tournament;
    player_count_t current_players = 0;
    std::vector<bps_t> tournament_payouts;
    std::vector<bps_t> match_payouts;
    unix_time_t timestamp = 0;
};

struct TournamentFinalized {
    Address tournament;
    std::vector<Address> winners;
    wide_amount_t prize_pool = 0;
    wide_amount_t total_distributed = 0;
    unix_time_t timestamp = 0;
};

struct MatchRewardsDistributed {
    Address tournament;
    match_id_t match_id = 0;
    std::vector<Address> winners;
    wide_amount_t match_pool = 0;
    wide_amount_t total_distributed = 0;
    unix_time_t timestamp = 0;
};

struct OperatorFeeWithdrawn {
    Address tournament;
    Address recipient;
    amount_t amount = 0;
    unix_time_t timestamp = 0;
};

struct TournamentCancelled {
    Address tournament;
    player_count_t participants = 0;
    unix_time_t timestamp = 0;
};

struct ParticipantRefunded {
    Address tournament;
    Address participant;
    amount_t amount = 0;
    unix_time_t timestamp = 0;
};

// ============================================================================
// Event Sink Interface
// ============================================================================

// Receives one notification per successful operation. Transport (logs,
// host event stream, indexer) is the implementation's concern.
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void on_created(const TournamentCreated& event) = 0;
    virtual void on_bought_in(const PlayerBoughtIn& event) = 0;
    virtual void on_started(const TournamentStarted& event) = 0;
    virtual void on_finalized(const TournamentFinalized& event) = 0;
    virtual void on_match_rewards(const MatchRewardsDistributed& event) = 0;
    virtual void on_operator_fee(const OperatorFeeWithdrawn& event) = 0;
    virtual void on_cancelled(const TournamentCancelled& event) = 0;
    virtual void on_refunded(const ParticipantRefunded& event) = 0;
};

// ============================================================================
// Event Log - in-memory sink that also writes each event to the log
// ============================================================================

class EventLog : public EventSink {
public:
    EventLog() = default;

    void on_created(const TournamentCreated& event) override;
    void on_bought_in(const PlayerBoughtIn& event) override;
    void on_started(const TournamentStarted& event) override;
    void on_finalized(const TournamentFinalized& event) override;
    void on_match_rewards(const MatchRewardsDistributed& event) override;
    void on_operator_fee(const OperatorFeeWithdrawn& event) override;
    void on_cancelled(const TournamentCancelled& event) override;
    void on_refunded(const ParticipantRefunded& event) override;

    // Arrival order across all event types
    [[nodiscard]] std::vector<EventType> sequence() const;
    [[nodiscard]] std::size_t count(EventType type) const;
    [[nodiscard]] std::size_t size() const;

    [[nodiscard]] std::vector<TournamentCreated> created() const;
    [[nodiscard]] std::vector<PlayerBoughtIn> buy_ins() const;
    [[nodiscard]] std::vector<TournamentStarted> starts() const;
    [[nodiscard]] std::vector<TournamentFinalized> finalizations() const;
    [[nodiscard]] std::vector<MatchRewardsDistributed> match_rewards() const;
    [[nodiscard]] std::vector<OperatorFeeWithdrawn> operator_fees() const;
    [[nodiscard]] std::vector<TournamentCancelled> cancellations() const;
    [[nodiscard]] std::vector<ParticipantRefunded> refunds() const;

    void clear();

private:
    std::vector<EventType> sequence_;
    std::vector<TournamentCreated> created_;
    std::vector<PlayerBoughtIn> buy_ins_;
    std::vector<TournamentStarted> starts_;
    std::vector<TournamentFinalized> finalizations_;
    std::vector<MatchRewardsDistributed> match_rewards_;
    std::vector<OperatorFeeWithdrawn> operator_fees_;
    std::vector<TournamentCancelled> cancellations_;
    std::vector<ParticipantRefunded> refunds_;
    mutable std::mutex mutex_;
};

}  // namespace tourney
