/**
 * @file events.hpp
 * @brief Facts emitted by a Game for an external event pipeline.
 *
 * The Game records one event per fact, in order, and keeps them until
 * collect_events() drains them. An optional GameEventListener receives each
 * event as it is recorded.
 *
 * Event Types:
 *   | Event                  | Emitted when                               |
 *   |------------------------|--------------------------------------------|
 *   | RoundStartedEvent      | a round begins (round 1 at construction)   |
 *   | CardPlacedEvent        | a card lands on a row                      |
 *   | CardDiscardedEvent     | a Pineapple or Fantasy Land discard        |
 *   | FantasyLandChangedEvent| a player enters, stays in or leaves FL     |
 *   | GameCompletedEvent     | the last layout completes                  |
 *
 * EventLog writes each event as one line of key=value fields:
 * @code
 *   event=card_placed game=g1 player=p1 card=As row=bottom round=1
 * @endcode
 */

#pragma once

#include "scoring.hpp"
#include <cstddef>
#include <fstream>
#include <mutex>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace ofc {

struct RoundStartedEvent {
    std::string game_id;
    int round = 0;
    std::string first_player_id;
};

struct CardPlacedEvent {
    std::string game_id;
    std::string player_id;
    Card card = INVALID_CARD;
    Row row = Row::TOP;
    int round = 0;
};

struct CardDiscardedEvent {
    std::string game_id;
    std::string player_id;
    Card card = INVALID_CARD;
    int round = 0;
};

struct FantasyLandChangedEvent {
    std::string game_id;
    std::string player_id;
    bool active = false;
    int consecutive_count = 0;
    int card_count = 0;   ///< Cards to deal next hand, 0 when leaving
};

struct GameCompletedEvent {
    std::string game_id;
    std::vector<Score> scores;
    std::string winner_id;
};

using GameEvent = std::variant<RoundStartedEvent, CardPlacedEvent, CardDiscardedEvent,
                               FantasyLandChangedEvent, GameCompletedEvent>;

/** @brief Short event name ("round_started", "card_placed", ...). */
const char* event_name(const GameEvent& event);

/** @brief Single-line key=value rendering, without a trailing newline. */
std::string format_event(const GameEvent& event);

/**
 * @brief Receiver of game events.
 *
 * Called synchronously while the game's lock is held; implementations must
 * not call back into the same Game.
 */
class GameEventListener {
public:
    virtual ~GameEventListener() = default;
    virtual void on_event(const GameEvent& event) = 0;
};

/**
 * @brief Thread-safe line-oriented event writer.
 *
 * One instance may be shared by several games.
 */
class EventLog : public GameEventListener {
public:
    /** @brief Write to an existing stream (not owned). */
    explicit EventLog(std::ostream& out);

    /**
     * @brief Append to a file.
     * @throws std::runtime_error if the file cannot be opened
     */
    explicit EventLog(const std::string& path);

    void on_event(const GameEvent& event) override;

    /** @brief Lines written so far. */
    size_t lines_written() const;

private:
    std::ofstream file_;
    std::ostream* out_;
    mutable std::mutex mutex_;
    size_t lines_ = 0;
};

} // namespace ofc
