#pragma once

#include "core/types.hh"
#include "core/errors.hh"
#include "escrow/gateway.hh"
#include "payout/arithmetic.hh"
#include "payout/winners.hh"
#include "tournament/config.hh"
#include "tournament/events.hh"
#include "tournament/state.hh"
#include <memory>
#include <mutex>
#include <span>

namespace tourney {

class Tournament;

struct CreateResult {
    TournamentError error = TournamentError::OK;
    std::unique_ptr<Tournament> tournament;

    [[nodiscard]] bool ok() const { return error == TournamentError::OK; }
};

// ============================================================================
// Tournament - prize escrow state machine for one tournament
// ============================================================================

// Every operation validates completely before any value moves, hands the
// whole payout to one escrow call, and only then updates state. A failed
// operation leaves the vault and the state as they were. Events reach the
// sink after the internal lock is released, so a sink may query back.
class Tournament {
    // Restricts construction to create() and restore()
    struct ConstructionKey {
        explicit ConstructionKey() = default;
    };

public:
    Tournament(ConstructionKey, TournamentState state, EscrowGateway& escrow, EventSink& events);

    // Creator must be on the program's allow-list and becomes the authority
    [[nodiscard]] static CreateResult create(const ProgramConfig& program,
                                             const Address& tournament_id,
                                             const Address& creator,
                                             const TournamentConfig& config,
                                             EscrowGateway& escrow,
                                             EventSink& events);

    // Resume a tournament from previously persisted state
    [[nodiscard]] static std::unique_ptr<Tournament> restore(TournamentState state,
                                                             EscrowGateway& escrow,
                                                             EventSink& events);

    Tournament(const Tournament&) = delete;
    Tournament& operator=(const Tournament&) = delete;

    // ========================================================================
    // Operations
    // ========================================================================

    // Collect the entry fee from player and add them to the roster
    TournamentError register_player(const Address& player);

    TournamentError start(const Address& caller,
                          std::span<const bps_t> tournament_payouts,
                          std::span<const bps_t> match_payouts);

    // Pay the tournament prize pool by ranking, then close the tournament.
    // accounts lists the destinations available for this payout.
    TournamentError finalize(const Address& caller,
                             std::span<const Winner> winners,
                             std::span<const Address> accounts);

    // Pay one match's share of the match pool; each match id pays once
    TournamentError distribute_match(const Address& caller,
                                     match_id_t match_id,
                                     std::span<const Winner> winners,
                                     std::span<const Address> accounts);

    TournamentError withdraw_operator_fee(const Address& caller, const Address& recipient);

    TournamentError cancel(const Address& caller);

    // Return the entry fee to one participant of a cancelled tournament
    TournamentError refund(const Address& participant);

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] TournamentState state() const;
    [[nodiscard]] TournamentPhase phase() const;
    [[nodiscard]] player_count_t current_players() const;
    [[nodiscard]] bool is_participant(const Address& player) const;
    [[nodiscard]] bool is_match_paid(match_id_t match_id) const;
    [[nodiscard]] bool is_refunded(const Address& participant) const;

    [[nodiscard]] const Address& id() const { return id_; }
    [[nodiscard]] const EscrowToken& token() const { return token_; }
    [[nodiscard]] amount_t vault_balance() const;

    // Pools over the current buy-ins
    [[nodiscard]] CheckedAmount tournament_pool() const;
    [[nodiscard]] CheckedAmount match_pool() const;
    [[nodiscard]] CheckedAmount operator_fee() const;

private:
    [[nodiscard]] bool is_authority(const Address& caller) const;
    [[nodiscard]] CheckedAmount pool_share(bps_t bps) const;
    [[nodiscard]] TournamentError pay_out(std::span<const Transfer> transfers);

    TournamentState state_;
    const Address id_;
    EscrowGateway& escrow_;
    EventSink& events_;
    EscrowToken token_;
    mutable std::mutex mutex_;
};

}  // namespace tourney
