#include <gtest/gtest.h>
#include "tournament/tournament.hh"
#include "crypto/hash.hh"

namespace tourney {
namespace {

// Sink that reads the tournament back while handling an event
class QueryingEventLog : public EventLog {
public:
    void on_bought_in(const PlayerBoughtIn& event) override {
        EventLog::on_bought_in(event);
        if (tournament) {
            observed_players.push_back(tournament->current_players());
        }
    }

    void on_finalized(const TournamentFinalized& event) override {
        EventLog::on_finalized(event);
        if (tournament) {
            observed_phase = tournament->phase();
        }
    }

    const Tournament* tournament = nullptr;
    std::vector<player_count_t> observed_players;
    TournamentPhase observed_phase = TournamentPhase::REGISTRATION;
};

class TournamentTest : public ::testing::Test {
protected:
    void SetUp() override {
        authority_ = Address::filled(0xAA);
        operator_ = Address::filled(0x0F);
        program_.approved_creators = {authority_};

        for (std::uint8_t i = 1; i <= 100; ++i) {
            Address player = Address::filled(i);
            players_.push_back(player);
            ASSERT_EQ(ledger_.credit(player, 1'000'000), EscrowResult::SUCCESS);
        }

        config_.entry_fee = 1000;
        config_.max_players = 4;
        config_.match_size = 4;
        config_.tournament_prize_bps = 6000;
        config_.match_prize_bps = 2500;
        config_.operator_fee_bps = 1500;
    }

    std::unique_ptr<Tournament> create(const TournamentConfig& config) {
        auto result = Tournament::create(program_, derive_tournament_id(authority_, nonce_++),
                                         authority_, config, ledger_, events_);
        EXPECT_TRUE(result.ok()) << tournament_error_string(result.error);
        return std::move(result.tournament);
    }

    std::unique_ptr<Tournament> create_with_players(std::size_t count) {
        auto t = create(config_);
        for (std::size_t i = 0; i < count; ++i) {
            EXPECT_EQ(t->register_player(players_[i]), TournamentError::OK);
        }
        return t;
    }

    // Four players, started with one tournament position and two match positions
    std::unique_ptr<Tournament> create_playing() {
        auto t = create_with_players(4);
        std::vector<bps_t> payouts = {10'000};
        std::vector<bps_t> match_payouts = {6000, 4000};
        EXPECT_EQ(t->start(authority_, payouts, match_payouts), TournamentError::OK);
        return t;
    }

    std::unique_ptr<Tournament> create_finalized() {
        auto t = create_playing();
        std::vector<Winner> winners = {Winner::individual(players_[0])};
        EXPECT_EQ(t->finalize(authority_, winners, players_), TournamentError::OK);
        return t;
    }

    ProgramConfig program_;
    TournamentConfig config_;
    EscrowLedger ledger_;
    EventLog events_;
    Address authority_;
    Address operator_;
    std::vector<Address> players_;
    std::uint64_t nonce_ = 0;
};

// ============================================================================
// Creation
// ============================================================================

TEST_F(TournamentTest, CreateStartsInRegistration) {
    auto t = create(config_);
    ASSERT_NE(t, nullptr);

    EXPECT_EQ(t->phase(), TournamentPhase::REGISTRATION);
    EXPECT_EQ(t->current_players(), 0);
    EXPECT_EQ(t->vault_balance(), 0);
    EXPECT_TRUE(ledger_.has_vault(t->id()));

    auto state = t->state();
    EXPECT_EQ(state.authority, authority_);
    EXPECT_TRUE(state.tournament_payouts.empty());
    EXPECT_TRUE(state.match_payout_percentages.empty());

    ASSERT_EQ(events_.created().size(), 1);
    EXPECT_EQ(events_.created()[0].config, config_);
}

TEST_F(TournamentTest, CreateRequiresApprovedCreator) {
    auto result = Tournament::create(program_, Address::filled(0x42), players_[0],
                                     config_, ledger_, events_);
    EXPECT_EQ(result.error, TournamentError::UNAUTHORIZED_AUTHORITY);
    EXPECT_EQ(error_kind(result.error), ErrorKind::UNAUTHORIZED);
    EXPECT_EQ(result.tournament, nullptr);
    EXPECT_EQ(events_.size(), 0);
}

TEST_F(TournamentTest, CreateRejectsBadSplit) {
    config_.match_prize_bps = 2499;
    auto result = Tournament::create(program_, Address::filled(0x42), authority_,
                                     config_, ledger_, events_);
    EXPECT_EQ(result.error, TournamentError::INVALID_PERCENTAGES);
    EXPECT_EQ(error_kind(result.error), ErrorKind::CONFIG_INVALID);
    EXPECT_FALSE(ledger_.has_vault(Address::filled(0x42)));
}

// ============================================================================
// Registration
// ============================================================================

TEST_F(TournamentTest, RegisterCollectsEntryFee) {
    auto t = create(config_);
    EXPECT_EQ(t->register_player(players_[0]), TournamentError::OK);

    EXPECT_EQ(t->current_players(), 1);
    EXPECT_TRUE(t->is_participant(players_[0]));
    EXPECT_EQ(t->vault_balance(), 1000);
    EXPECT_EQ(ledger_.balance_of(players_[0]), 999'000);

    ASSERT_EQ(events_.buy_ins().size(), 1);
    EXPECT_EQ(events_.buy_ins()[0].player, players_[0]);
    EXPECT_EQ(events_.buy_ins()[0].current_players, 1);
}

TEST_F(TournamentTest, RegisterTwiceRejected) {
    auto t = create(config_);
    ASSERT_EQ(t->register_player(players_[0]), TournamentError::OK);
    EXPECT_EQ(t->register_player(players_[0]), TournamentError::ALREADY_REGISTERED);
    EXPECT_EQ(t->current_players(), 1);
    EXPECT_EQ(t->vault_balance(), 1000);
}

TEST_F(TournamentTest, RegisterWhenFullRejected) {
    auto t = create_with_players(4);
    EXPECT_EQ(t->register_player(players_[4]), TournamentError::TOURNAMENT_FULL);
    EXPECT_EQ(t->vault_balance(), 4000);
}

TEST_F(TournamentTest, HundredAndFirstRegistrationRejected) {
    config_.max_players = 100;
    auto t = create(config_);
    for (const auto& player : players_) {
        ASSERT_EQ(t->register_player(player), TournamentError::OK);
    }
    EXPECT_EQ(t->current_players(), 100);

    Address late = Address::filled(0xC8);
    ASSERT_EQ(ledger_.credit(late, 1000), EscrowResult::SUCCESS);
    TournamentError err = t->register_player(late);
    EXPECT_EQ(err, TournamentError::TOURNAMENT_FULL);
    EXPECT_EQ(error_kind(err), ErrorKind::CAPACITY_EXCEEDED);
    EXPECT_EQ(t->vault_balance(), 100'000);
}

TEST_F(TournamentTest, RegisterUnfundedPlayerRejected) {
    auto t = create(config_);
    Address broke = Address::filled(0xB0);
    EXPECT_EQ(t->register_player(broke), TournamentError::ESCROW_TRANSFER_FAILED);
    EXPECT_FALSE(t->is_participant(broke));
    EXPECT_EQ(t->current_players(), 0);
}

TEST_F(TournamentTest, RegisterAfterStartRejected) {
    auto t = create_with_players(2);
    std::vector<bps_t> payouts = {10'000};
    std::vector<bps_t> match_payouts = {10'000};
    ASSERT_EQ(t->start(authority_, payouts, match_payouts), TournamentError::OK);

    EXPECT_EQ(t->register_player(players_[2]), TournamentError::INVALID_PHASE);
}

// ============================================================================
// Start
// ============================================================================

TEST_F(TournamentTest, StartStoresSchedules) {
    auto t = create_playing();
    EXPECT_EQ(t->phase(), TournamentPhase::PLAYING);

    auto state = t->state();
    EXPECT_EQ(state.tournament_payouts, (std::vector<bps_t>{10'000}));
    EXPECT_EQ(state.match_payout_percentages, (std::vector<bps_t>{6000, 4000}));

    ASSERT_EQ(events_.starts().size(), 1);
    EXPECT_EQ(events_.starts()[0].current_players, 4);
}

TEST_F(TournamentTest, StartRequiresAuthority) {
    auto t = create_with_players(2);
    std::vector<bps_t> payouts = {10'000};
    EXPECT_EQ(t->start(players_[0], payouts, payouts), TournamentError::UNAUTHORIZED_AUTHORITY);
    EXPECT_EQ(t->phase(), TournamentPhase::REGISTRATION);
}

TEST_F(TournamentTest, StartRequiresPlayers) {
    auto t = create(config_);
    std::vector<bps_t> payouts = {10'000};
    EXPECT_EQ(t->start(authority_, payouts, payouts), TournamentError::NOT_ENOUGH_PLAYERS);
}

TEST_F(TournamentTest, StartRejectsPayoutSumsOffByOne) {
    auto t = create_with_players(4);
    std::vector<bps_t> match_payouts = {10'000};

    std::vector<bps_t> low = {5000, 4999};
    std::vector<bps_t> high = {5000, 5001};
    EXPECT_EQ(t->start(authority_, low, match_payouts), TournamentError::INVALID_PAYOUT_PERCENTAGES);
    EXPECT_EQ(t->start(authority_, high, match_payouts), TournamentError::INVALID_PAYOUT_PERCENTAGES);

    std::vector<bps_t> payouts = {10'000};
    std::vector<bps_t> match_low = {6000, 3999};
    std::vector<bps_t> match_high = {6000, 4001};
    EXPECT_EQ(t->start(authority_, payouts, match_low), TournamentError::INVALID_MATCH_PAYOUT_PERCENTAGES);
    EXPECT_EQ(t->start(authority_, payouts, match_high), TournamentError::INVALID_MATCH_PAYOUT_PERCENTAGES);

    EXPECT_EQ(t->phase(), TournamentPhase::REGISTRATION);
    EXPECT_TRUE(t->state().tournament_payouts.empty());
}

TEST_F(TournamentTest, StartRejectsMorePositionsThanPlayers) {
    auto t = create_with_players(2);
    std::vector<bps_t> payouts = {5000, 3000, 2000};
    std::vector<bps_t> match_payouts = {10'000};
    EXPECT_EQ(t->start(authority_, payouts, match_payouts), TournamentError::TOO_MANY_PAYOUT_POSITIONS);
}

TEST_F(TournamentTest, StartTwiceRejected) {
    auto t = create_playing();
    std::vector<bps_t> payouts = {10'000};
    EXPECT_EQ(t->start(authority_, payouts, payouts), TournamentError::INVALID_PHASE);
}

// ============================================================================
// Finalize
// ============================================================================

TEST_F(TournamentTest, FinalizePaysSingleWinner) {
    auto t = create_playing();
    std::vector<Winner> winners = {Winner::individual(players_[0])};

    ASSERT_EQ(t->finalize(authority_, winners, players_), TournamentError::OK);

    EXPECT_EQ(t->phase(), TournamentPhase::FINALIZED);
    EXPECT_EQ(ledger_.balance_of(players_[0]), 1'000'000 - 1000 + 2400);
    EXPECT_EQ(t->vault_balance(), 4000 - 2400);

    ASSERT_EQ(events_.finalizations().size(), 1);
    EXPECT_EQ(events_.finalizations()[0].total_distributed, 2400);
    EXPECT_EQ(events_.finalizations()[0].prize_pool, 2400);
    EXPECT_EQ(events_.finalizations()[0].winners, (std::vector<Address>{players_[0]}));
}

TEST_F(TournamentTest, FinalizeGroupSplitsExactly) {
    // Three tied players take both positions of 4 * 1000 * 60% = 2400
    auto t = create_with_players(4);
    std::vector<bps_t> payouts = {7000, 3000};
    std::vector<bps_t> match_payouts = {10'000};
    ASSERT_EQ(t->start(authority_, payouts, match_payouts), TournamentError::OK);

    std::vector<Winner> winners = {Winner::group({players_[0], players_[1], players_[2]}, 2)};
    ASSERT_EQ(t->finalize(authority_, winners, players_), TournamentError::OK);

    for (std::size_t i = 0; i < 3; ++i) {
        EXPECT_EQ(ledger_.balance_of(players_[i]), 1'000'000 - 1000 + 800);
    }
    EXPECT_EQ(t->vault_balance(), 1600);
}

TEST_F(TournamentTest, FinalizeConservesPool) {
    config_.entry_fee = 997;
    auto t = create_with_players(4);
    std::vector<bps_t> payouts = {5000, 3000, 2000};
    std::vector<bps_t> match_payouts = {10'000};
    ASSERT_EQ(t->start(authority_, payouts, match_payouts), TournamentError::OK);

    auto pool = t->tournament_pool();
    ASSERT_TRUE(pool.ok());

    std::vector<Winner> winners = {
        Winner::individual(players_[3]),
        Winner::group({players_[0], players_[1]}, 2),
    };
    ASSERT_EQ(t->finalize(authority_, winners, players_), TournamentError::OK);

    auto finalized = events_.finalizations();
    ASSERT_EQ(finalized.size(), 1);
    EXPECT_LE(finalized[0].total_distributed, pool.value);
    EXPECT_EQ(t->vault_balance(), 4 * 997 - static_cast<amount_t>(finalized[0].total_distributed));
}

TEST_F(TournamentTest, FinalizeExcessWinnerReceivesNothing) {
    auto t = create_playing();
    std::vector<Winner> winners = {
        Winner::individual(players_[0]),
        Winner::individual(players_[1]),
    };
    ASSERT_EQ(t->finalize(authority_, winners, players_), TournamentError::OK);

    EXPECT_EQ(ledger_.balance_of(players_[0]), 1'000'000 - 1000 + 2400);
    EXPECT_EQ(ledger_.balance_of(players_[1]), 1'000'000 - 1000);
}

TEST_F(TournamentTest, FinalizeFailureLeavesStateUntouched) {
    auto t = create_playing();
    std::vector<Address> no_accounts = {players_[1]};
    std::vector<Winner> winners = {Winner::individual(players_[0])};

    EXPECT_EQ(t->finalize(authority_, winners, no_accounts), TournamentError::MISSING_WINNER_ACCOUNT);
    EXPECT_EQ(t->phase(), TournamentPhase::PLAYING);
    EXPECT_EQ(t->vault_balance(), 4000);
    EXPECT_EQ(ledger_.total_disbursed(), 0);
    EXPECT_TRUE(events_.finalizations().empty());
}

TEST_F(TournamentTest, FinalizeRejections) {
    auto t = create_with_players(4);
    std::vector<Winner> winners = {Winner::individual(players_[0])};
    EXPECT_EQ(t->finalize(authority_, winners, players_), TournamentError::INVALID_PHASE);

    std::vector<bps_t> payouts = {10'000};
    ASSERT_EQ(t->start(authority_, payouts, payouts), TournamentError::OK);

    EXPECT_EQ(t->finalize(players_[0], winners, players_), TournamentError::UNAUTHORIZED_AUTHORITY);
    EXPECT_EQ(t->finalize(authority_, {}, players_), TournamentError::INVALID_WINNER_COUNT);

    std::vector<Winner> stranger = {Winner::individual(players_[50])};
    TournamentError err = t->finalize(authority_, stranger, players_);
    EXPECT_EQ(err, TournamentError::WINNER_NOT_PARTICIPANT);
    EXPECT_EQ(error_kind(err), ErrorKind::NOT_PARTICIPANT);

    EXPECT_EQ(t->phase(), TournamentPhase::PLAYING);
}

// ============================================================================
// Match Rewards
// ============================================================================

TEST_F(TournamentTest, MatchRewardsSplitBySchedule) {
    auto t = create_finalized();
    match_id_t match = derive_match_id("round-1");
    std::vector<Winner> winners = {
        Winner::individual(players_[1]),
        Winner::individual(players_[2]),
    };

    ASSERT_EQ(t->distribute_match(authority_, match, winners, players_), TournamentError::OK);

    EXPECT_EQ(ledger_.balance_of(players_[1]), 1'000'000 - 1000 + 600);
    EXPECT_EQ(ledger_.balance_of(players_[2]), 1'000'000 - 1000 + 400);
    EXPECT_TRUE(t->is_match_paid(match));

    ASSERT_EQ(events_.match_rewards().size(), 1);
    EXPECT_EQ(events_.match_rewards()[0].match_id, match);
    EXPECT_EQ(events_.match_rewards()[0].total_distributed, 1000);
}

TEST_F(TournamentTest, MatchPaidOnlyOnce) {
    auto t = create_finalized();
    std::vector<Winner> winners = {
        Winner::individual(players_[1]),
        Winner::individual(players_[2]),
    };

    ASSERT_EQ(t->distribute_match(authority_, 7, winners, players_), TournamentError::OK);
    amount_t vault_after_first = t->vault_balance();

    TournamentError err = t->distribute_match(authority_, 7, winners, players_);
    EXPECT_EQ(err, TournamentError::MATCH_ALREADY_PAID);
    EXPECT_EQ(error_kind(err), ErrorKind::DUPLICATE_ENTITY);
    EXPECT_EQ(t->vault_balance(), vault_after_first);
    EXPECT_EQ(events_.match_rewards().size(), 1);
}

TEST_F(TournamentTest, MatchRequiresFinalized) {
    auto t = create_playing();
    std::vector<Winner> winners = {Winner::individual(players_[1])};
    EXPECT_EQ(t->distribute_match(authority_, 1, winners, players_),
              TournamentError::TOURNAMENT_NOT_FINALIZED);
}

TEST_F(TournamentTest, MatchRejectsDefaultIdentity) {
    auto t = create_finalized();
    std::vector<Winner> winners = {Winner::individual(Address{})};
    EXPECT_EQ(t->distribute_match(authority_, 1, winners, players_), TournamentError::INVALID_WINNER);
    EXPECT_FALSE(t->is_match_paid(1));
}

TEST_F(TournamentTest, MatchRejectsUnauthorizedCaller) {
    auto t = create_finalized();
    std::vector<Winner> winners = {Winner::individual(players_[1])};
    EXPECT_EQ(t->distribute_match(players_[1], 1, winners, players_),
              TournamentError::UNAUTHORIZED_AUTHORITY);
}

TEST_F(TournamentTest, MatchGroupWithZeroShareRejected) {
    // 4 players in matches of 2: per-match pool 500. The tied pair lands on
    // a position past the one-entry schedule.
    config_.match_size = 2;
    auto t = create_with_players(4);
    std::vector<bps_t> payouts = {10'000};
    std::vector<bps_t> match_payouts = {10'000};
    ASSERT_EQ(t->start(authority_, payouts, match_payouts), TournamentError::OK);
    std::vector<Winner> champion = {Winner::individual(players_[0])};
    ASSERT_EQ(t->finalize(authority_, champion, players_), TournamentError::OK);

    std::vector<Winner> winners = {
        Winner::individual(players_[0]),
        Winner::group({players_[1], players_[2]}, 1),
    };
    amount_t vault_before = t->vault_balance();
    EXPECT_EQ(t->distribute_match(authority_, 1, winners, players_), TournamentError::NO_MATCH_REWARDS);
    EXPECT_EQ(t->vault_balance(), vault_before);
}

TEST_F(TournamentTest, MatchesShareTheMatchPool) {
    config_.match_size = 2;
    auto t = create_with_players(4);
    std::vector<bps_t> payouts = {10'000};
    std::vector<bps_t> match_payouts = {10'000};
    ASSERT_EQ(t->start(authority_, payouts, match_payouts), TournamentError::OK);
    std::vector<Winner> champion = {Winner::individual(players_[0])};
    ASSERT_EQ(t->finalize(authority_, champion, players_), TournamentError::OK);

    std::vector<Winner> first = {Winner::individual(players_[0])};
    std::vector<Winner> second = {Winner::individual(players_[2])};
    ASSERT_EQ(t->distribute_match(authority_, 1, first, players_), TournamentError::OK);
    ASSERT_EQ(t->distribute_match(authority_, 2, second, players_), TournamentError::OK);

    // Two matches, 500 each
    EXPECT_EQ(ledger_.balance_of(players_[2]), 1'000'000 - 1000 + 500);
    EXPECT_EQ(t->vault_balance(), 4000 - 2400 - 1000);
}

// ============================================================================
// Operator Fee
// ============================================================================

TEST_F(TournamentTest, OperatorFeeWithdrawnOnce) {
    auto t = create_finalized();

    ASSERT_EQ(t->withdraw_operator_fee(authority_, operator_), TournamentError::OK);
    EXPECT_EQ(ledger_.balance_of(operator_), 600);

    TournamentError err = t->withdraw_operator_fee(authority_, operator_);
    EXPECT_EQ(err, TournamentError::OPERATOR_FEE_ALREADY_WITHDRAWN);
    EXPECT_EQ(error_kind(err), ErrorKind::DUPLICATE_ENTITY);
    EXPECT_EQ(ledger_.balance_of(operator_), 600);

    ASSERT_EQ(events_.operator_fees().size(), 1);
    EXPECT_EQ(events_.operator_fees()[0].amount, 600);
}

TEST_F(TournamentTest, OperatorFeeRequiresFinalized) {
    auto t = create_playing();
    EXPECT_EQ(t->withdraw_operator_fee(authority_, operator_), TournamentError::TOURNAMENT_NOT_FINALIZED);
    EXPECT_EQ(t->withdraw_operator_fee(players_[0], operator_), TournamentError::UNAUTHORIZED_AUTHORITY);
}

TEST_F(TournamentTest, FullLifecycleDrainsVault) {
    auto t = create_finalized();
    std::vector<Winner> winners = {
        Winner::individual(players_[1]),
        Winner::individual(players_[2]),
    };
    ASSERT_EQ(t->distribute_match(authority_, 1, winners, players_), TournamentError::OK);
    ASSERT_EQ(t->withdraw_operator_fee(authority_, operator_), TournamentError::OK);

    // 2400 + 1000 + 600 == 4000
    EXPECT_EQ(t->vault_balance(), 0);
    EXPECT_EQ(ledger_.total_disbursed(), 4000);
}

// ============================================================================
// Cancellation and Refunds
// ============================================================================

TEST_F(TournamentTest, CancelAndRefundEachParticipant) {
    auto t = create_with_players(2);
    ASSERT_EQ(t->cancel(authority_), TournamentError::OK);
    EXPECT_EQ(t->phase(), TournamentPhase::CANCELLED);

    EXPECT_EQ(t->refund(players_[0]), TournamentError::OK);
    EXPECT_EQ(t->refund(players_[1]), TournamentError::OK);
    EXPECT_EQ(ledger_.balance_of(players_[0]), 1'000'000);
    EXPECT_EQ(ledger_.balance_of(players_[1]), 1'000'000);
    EXPECT_EQ(t->vault_balance(), 0);

    TournamentError err = t->refund(players_[0]);
    EXPECT_EQ(err, TournamentError::PARTICIPANT_ALREADY_REFUNDED);
    EXPECT_EQ(error_kind(err), ErrorKind::DUPLICATE_ENTITY);
    EXPECT_EQ(events_.refunds().size(), 2);
}

TEST_F(TournamentTest, RefundRejections) {
    auto t = create_with_players(2);
    EXPECT_EQ(t->refund(players_[0]), TournamentError::TOURNAMENT_NOT_CANCELLED);

    ASSERT_EQ(t->cancel(authority_), TournamentError::OK);
    EXPECT_EQ(t->refund(players_[50]), TournamentError::PARTICIPANT_NOT_FOUND);
    EXPECT_FALSE(t->is_refunded(players_[50]));
}

TEST_F(TournamentTest, PartialRefundIsNormalState) {
    auto t = create_with_players(3);
    ASSERT_EQ(t->cancel(authority_), TournamentError::OK);
    ASSERT_EQ(t->refund(players_[1]), TournamentError::OK);

    EXPECT_TRUE(t->is_refunded(players_[1]));
    EXPECT_FALSE(t->is_refunded(players_[0]));
    EXPECT_EQ(t->vault_balance(), 2000);
}

TEST_F(TournamentTest, CancelOnlyDuringRegistration) {
    auto t = create_playing();
    EXPECT_EQ(t->cancel(authority_), TournamentError::TOURNAMENT_ALREADY_STARTED);
    EXPECT_EQ(t->phase(), TournamentPhase::PLAYING);

    auto finalized = create_finalized();
    EXPECT_EQ(finalized->cancel(authority_), TournamentError::TOURNAMENT_ALREADY_STARTED);
}

TEST_F(TournamentTest, CancelRequiresAuthority) {
    auto t = create_with_players(1);
    EXPECT_EQ(t->cancel(players_[0]), TournamentError::UNAUTHORIZED_AUTHORITY);
    EXPECT_EQ(t->phase(), TournamentPhase::REGISTRATION);
}

TEST_F(TournamentTest, CancelledTournamentRejectsPlay) {
    auto t = create_with_players(2);
    ASSERT_EQ(t->cancel(authority_), TournamentError::OK);

    std::vector<bps_t> payouts = {10'000};
    EXPECT_EQ(t->register_player(players_[3]), TournamentError::INVALID_PHASE);
    EXPECT_EQ(t->start(authority_, payouts, payouts), TournamentError::INVALID_PHASE);
    EXPECT_EQ(t->withdraw_operator_fee(authority_, operator_), TournamentError::TOURNAMENT_NOT_FINALIZED);
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(TournamentTest, RestoreContinuesFromSavedState) {
    auto t = create_finalized();
    std::vector<Winner> winners = {Winner::individual(players_[1])};
    ASSERT_EQ(t->distribute_match(authority_, 9, winners, players_), TournamentError::OK);

    auto bytes = t->state().serialize();
    auto loaded = TournamentState::deserialize(bytes);
    ASSERT_TRUE(loaded.has_value());

    auto restored = Tournament::restore(std::move(*loaded), ledger_, events_);
    EXPECT_EQ(restored->id(), t->id());
    EXPECT_EQ(restored->vault_balance(), t->vault_balance());
    EXPECT_EQ(restored->distribute_match(authority_, 9, winners, players_),
              TournamentError::MATCH_ALREADY_PAID);
    EXPECT_EQ(restored->withdraw_operator_fee(authority_, operator_), TournamentError::OK);
}

TEST_F(TournamentTest, MatchLedgerFullAfterFiftyMatches) {
    TournamentConfig config = config_;
    config.max_players = 100;
    config.match_size = 2;
    auto t = create(config);
    for (const Address& player : players_) {
        ASSERT_EQ(t->register_player(player), TournamentError::OK);
    }
    std::vector<bps_t> payouts = {10'000};
    std::vector<bps_t> match_payouts = {10'000};
    ASSERT_EQ(t->start(authority_, payouts, match_payouts), TournamentError::OK);
    std::vector<Winner> winners = {Winner::individual(players_[0])};
    ASSERT_EQ(t->finalize(authority_, winners, players_), TournamentError::OK);

    // 25'000 match pool over 50 matches
    for (match_id_t id = 1; id <= TournamentLimits::MAX_PAID_MATCHES; ++id) {
        std::vector<Winner> match_winners = {Winner::individual(players_[id])};
        ASSERT_EQ(t->distribute_match(authority_, id, match_winners, players_), TournamentError::OK);
    }
    EXPECT_EQ(t->vault_balance(), 15'000);

    std::vector<Winner> extra = {Winner::individual(players_[99])};
    EXPECT_EQ(t->distribute_match(authority_, 1000, extra, players_),
              TournamentError::MATCH_LEDGER_FULL);
    EXPECT_EQ(t->distribute_match(authority_, 1, extra, players_),
              TournamentError::MATCH_ALREADY_PAID);
    EXPECT_EQ(t->vault_balance(), 15'000);
    EXPECT_FALSE(t->is_match_paid(1000));
    EXPECT_EQ(ledger_.balance_of(players_[99]), 1'000'000 - 1000);
}

TEST_F(TournamentTest, SinkMayQueryTournamentDuringEvent) {
    QueryingEventLog sink;
    auto result = Tournament::create(program_, derive_tournament_id(authority_, nonce_++),
                                     authority_, config_, ledger_, sink);
    ASSERT_TRUE(result.ok());
    Tournament& t = *result.tournament;
    sink.tournament = &t;

    ASSERT_EQ(t.register_player(players_[0]), TournamentError::OK);
    ASSERT_EQ(t.register_player(players_[1]), TournamentError::OK);
    EXPECT_EQ(sink.observed_players, (std::vector<player_count_t>{1, 2}));

    std::vector<bps_t> payouts = {10'000};
    std::vector<bps_t> match_payouts = {10'000};
    ASSERT_EQ(t.start(authority_, payouts, match_payouts), TournamentError::OK);
    std::vector<Winner> winners = {Winner::individual(players_[0])};
    ASSERT_EQ(t.finalize(authority_, winners, players_), TournamentError::OK);
    EXPECT_EQ(sink.observed_phase, TournamentPhase::FINALIZED);
}

}  // namespace
}  // namespace tourney
