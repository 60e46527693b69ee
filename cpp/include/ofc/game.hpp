/**
 * @file game.hpp
 * @brief The OFC game aggregate: deck, seats, turns, rounds and scoring.
 *
 * A Game owns its Players and Deck exclusively. It deals, validates and
 * applies moves, advances the turn, detects round and game completion, runs
 * Fantasy Land transitions and freezes the final scores.
 *
 * Turn Structure:
 *   - One action per turn; the turn then passes round-robin to the next
 *     seat whose layout is incomplete
 *   - A player who becomes current with no held cards is dealt
 *     GameRules::cards_per_turn cards (1 standard, 3 pineapple)
 *   - A round ends once every seat has acted or is complete
 *   - The game ends when every layout holds 13 cards
 *
 * Actions:
 *   | Action                    | Who / when                                  |
 *   |---------------------------|---------------------------------------------|
 *   | place_card                | standard: any street; pineapple: initial    |
 *   | apply_initial_placement   | all initial cards onto distinct slots       |
 *   | apply_pineapple_action    | pineapple street: place 2, discard 1        |
 *   | apply_fantasy_land_layout | FL player sets all 13 cards at once         |
 *
 * Usage:
 * @code
 *   std::vector<Player> players = {Player("p1", "Ann"), Player("p2", "Bo")};
 *   Game game("g1", players, GameRules::standard(), 42);
 *   Player current = game.get_current_player();
 *   game.place_card(current.id(), current.hand_cards()[0], Row::BOTTOM);
 *   ...
 *   if (game.is_completed()) auto scores = game.calculate_scores();
 * @endcode
 *
 * Thread Safety: Every public method locks a per-game mutex. Mutations apply
 * atomically to a working copy; on any exception the game is unchanged.
 * version() grows by one per successful mutation so readers of snapshot()
 * can detect staleness.
 */

#pragma once

#include "events.hpp"
#include "validator.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace ofc {

class Game {
public:
    /**
     * @brief Create a game and, by default, deal and start round 1.
     * @param game_id Game identity
     * @param players 2-4 players (variant bounds apply) with unique ids and empty layouts
     * @param rules Rules configuration (validated)
     * @param seed Deck shuffle seed (same seed = same deal)
     * @param evaluator Shared evaluator; built from the rules' royalty scheme if null
     * @param fantasy_land Shared FL rules; built from @p rules if null
     * @param start_immediately Deal and start now; otherwise stay WAITING until start()
     * @throws GameStateError on invalid rules, player count or duplicate ids
     */
    Game(const std::string& game_id, const std::vector<Player>& players,
         const GameRules& rules = GameRules::standard(), uint64_t seed = 0,
         std::shared_ptr<const HandEvaluator> evaluator = nullptr,
         std::shared_ptr<const FantasyLandManager> fantasy_land = nullptr,
         bool start_immediately = true);

    Game(const Game&) = delete;
    Game& operator=(const Game&) = delete;

    /**
     * @brief Deal initial cards and start round 1.
     * @throws GameStateError unless WAITING
     */
    void start();

    // =========================================================================
    // Mutation surface
    // =========================================================================

    /**
     * @brief Place one held card for the current player, then advance the turn.
     * @throws GameStateError if the game is not in progress, the player is
     *         unknown or not current, or the move needs a multi-card action
     * @throws InvalidCardPlacementError if the card is not held or the row is full
     */
    void place_card(const std::string& player_id, Card card, Row row);

    /**
     * @brief Place all initial cards in one turn.
     * @throws GameStateError / InvalidCardPlacementError as place_card
     */
    void apply_initial_placement(const InitialPlacement& placement);

    /**
     * @brief Pineapple street: place two dealt cards and discard the third.
     * @throws GameStateError / InvalidCardPlacementError as place_card
     */
    void apply_pineapple_action(const PineappleAction& action);

    /**
     * @brief Fantasy Land: set all 13 cards at once; leftovers are discarded.
     * @throws GameStateError / InvalidCardPlacementError as place_card
     */
    void apply_fantasy_land_layout(const std::string& player_id, const CardList& top,
                                   const CardList& middle, const CardList& bottom);

    /** @throws GameStateError unless IN_PROGRESS */
    void pause();

    /** @throws GameStateError unless PAUSED */
    void resume();

    /** @throws GameStateError if already COMPLETED or CANCELLED */
    void cancel();

    // =========================================================================
    // Query surface
    // =========================================================================

    /**
     * @brief Copy of the player to act.
     * @throws GameStateError if the game is completed or cancelled
     */
    Player get_current_player() const;

    /** @brief Copy of a player by id. @throws GameStateError if unknown */
    Player get_player(const std::string& player_id) const;

    /** @brief Copies of all players in seat order. */
    std::vector<Player> players() const;

    /** @brief Row progression check for one player's layout. */
    bool validate_layout(const std::string& player_id) const;

    /** @brief Serializable snapshot for analysis tools. */
    AnalysisPosition get_analysis_position() const;

    /** @brief Named whole-game checks (see GameValidator). */
    std::map<std::string, ValidationResult> get_validation_summary() const;

    /**
     * @brief Final per-player scores.
     * @throws GameStateError unless COMPLETED
     */
    std::vector<Score> calculate_scores() const;

    /** @brief Winner id once COMPLETED, empty otherwise. */
    std::string winner() const;

    /**
     * @brief Players reset for the next hand, Fantasy Land state carried over.
     * @throws GameStateError unless COMPLETED
     */
    std::vector<Player> players_for_next_hand() const;

    /** @brief Consistent copy of the whole state. */
    GameState snapshot() const;

    const std::string& id() const { return game_id_; }
    GameStatus status() const;
    bool is_completed() const { return status() == GameStatus::COMPLETED; }
    int round() const;
    int turn_index() const;
    uint64_t version() const;
    CardList discards() const;
    const GameRules& rules() const { return rules_; }
    const GameValidator& validator() const { return validator_; }

    // =========================================================================
    // Events
    // =========================================================================

    /** @brief Drain recorded events, oldest first. */
    std::vector<GameEvent> collect_events();

    /** @brief Forward every future event to @p listener (null detaches). */
    void set_listener(std::shared_ptr<GameEventListener> listener);

private:
    /** @brief Working copy of state plus the events a mutation produced. */
    struct Transaction {
        GameState state;
        std::vector<GameEvent> events;
    };

    Transaction begin() const;
    void commit(Transaction& tx);

    void require_acting(const GameState& state, const std::string& player_id) const;
    void deal_initial(Transaction& tx);
    void place(Transaction& tx, Player& player, Card card, Row row);
    void discard(Transaction& tx, Player& player, Card card);
    void finish_turn(Transaction& tx);
    void deal_street(Transaction& tx, Player& player);
    void complete_game(Transaction& tx);
    void update_fantasy_land(Transaction& tx, Player& player);

    std::string game_id_;
    GameRules rules_;
    uint64_t seed_;
    std::shared_ptr<const HandEvaluator> evaluator_;
    std::shared_ptr<const FantasyLandManager> fantasy_land_;
    GameValidator validator_;

    mutable std::mutex mutex_;
    GameState state_;
    std::vector<GameEvent> events_;
    std::shared_ptr<GameEventListener> listener_;
};

} // namespace ofc
