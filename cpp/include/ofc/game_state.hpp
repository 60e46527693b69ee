/**
 * @file game_state.hpp
 * @brief Game state value, player actions and the analysis snapshot.
 *
 * GameState is the copyable part of a Game: everything GameValidator needs
 * to re-derive the game's invariants. Game keeps one under its lock and hands
 * out copies through Game::snapshot().
 *
 * Card conservation at every instant:
 * @code
 *   deck.remaining_cards() + discards + sum(player hand pools + rows) == all 52 cards
 * @endcode
 */

#pragma once

#include "player.hpp"
#include "scoring.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ofc {

/**
 * @brief Game lifecycle.
 *
 * @code
 *   WAITING -> IN_PROGRESS <-> PAUSED
 *                  |             |
 *                  v             v
 *             COMPLETED      CANCELLED (also from WAITING / IN_PROGRESS)
 * @endcode
 */
enum class GameStatus {
    WAITING = 0,       ///< Constructed, cards not dealt
    IN_PROGRESS = 1,
    PAUSED = 2,
    COMPLETED = 3,     ///< All layouts complete, scores frozen
    CANCELLED = 4
};

const char* game_status_name(GameStatus status);

/**
 * @brief Opening placement: all initial cards onto distinct slots in one turn.
 */
struct InitialPlacement {
    std::string player_id;
    std::vector<std::pair<Card, Slot>> placements;
};

/**
 * @brief Pineapple street: 3 dealt cards, 2 placed, 1 discarded.
 */
struct PineappleAction {
    std::string player_id;
    CardList dealt_cards;
    std::vector<std::pair<Card, Row>> placements;
    Card discarded_card = INVALID_CARD;
};

/**
 * @brief Copyable state of one game.
 */
struct GameState {
    std::string game_id;
    GameRules rules;
    GameStatus status = GameStatus::WAITING;
    std::vector<Player> players;    ///< Seat order
    Deck deck;
    int round = 0;                  ///< 1-based once started
    int turn_index = 0;             ///< Seat of the player to act
    uint64_t version = 0;           ///< Incremented on every successful mutation

    std::vector<Score> final_scores;   ///< Set on completion
    std::string winner_id;             ///< Set on completion
    bool has_completed_at = false;
    std::chrono::system_clock::time_point completed_at;

    /** @brief Seat of @p player_id, or -1. */
    int player_index(const std::string& player_id) const;

    const Player* find_player(const std::string& player_id) const;
    Player* find_player(const std::string& player_id);

    /** @brief Player at turn_index (state must have players). */
    const Player& current_player() const { return players[turn_index]; }

    /** @brief Every layout holds 3/5/5 cards. */
    bool all_layouts_complete() const;

    /** @brief Cards burned this hand (Pineapple discards, FL leftovers). */
    const CardList& discards() const { return deck.discarded(); }
};

/**
 * @brief Serializable view of a game for analysis and display.
 */
struct AnalysisPosition {
    std::string game_id;
    GameStatus status = GameStatus::WAITING;
    std::vector<std::string> seat_order;
    std::map<std::string, HandSnapshot> hands;
    CardList remaining_deck;
    CardList discards;
    std::string current_player_id;   ///< Empty once the game is over
    int round = 0;
    GameRules rules;
    uint64_t version = 0;
};

} // namespace ofc
