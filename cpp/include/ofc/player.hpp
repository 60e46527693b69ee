/**
 * @file player.hpp
 * @brief One participant's OFC layout: three rows plus held cards.
 *
 * A Player owns:
 *   - the Top/Middle/Bottom rows (capacities 3/5/5)
 *   - a pool of dealt-but-unplaced cards
 *   - a "placed this round" flag used by round completion
 *   - its Fantasy Land state, carried between hands
 *
 * Placement lifecycle:
 * @code
 *   receive_initial_cards(5) -> place_card() x N -> receive_cards() -> ...
 *   13th placement completes the layout -> validate_layout() -> ACTIVE or FOULED
 * @endcode
 *
 * Fantasy Land players instead receive all cards at once
 * (receive_fantasy_land_cards) and set them with place_fantasy_land_layout().
 */

#pragma once

#include "fantasy_land.hpp"
#include <array>
#include <memory>
#include <string>
#include <vector>

namespace ofc {

/** @brief Player status within the current hand. */
enum class PlayerStatus {
    ACTIVE = 0,        ///< Building a layout normally
    FOULED = 1,        ///< Complete layout violates row progression
    FANTASY_LAND = 2,  ///< Playing (or qualified for) a Fantasy Land hand
    ELIMINATED = 3     ///< Out of the session
};

const char* player_status_name(PlayerStatus status);

/**
 * @brief A single participant's layout and held cards.
 *
 * Mutation is local to the player; cross-player rules (turn order, card
 * uniqueness) are enforced by Game and GameValidator.
 *
 * Thread Safety: Not thread-safe. Owned and locked by its Game.
 */
class Player {
public:
    /**
     * @brief Construct a player with an empty layout.
     * @param id Unique player id within a game
     * @param name Display name
     * @param evaluator Shared evaluator; a standard one is created if null
     * @param initial_cards_count Cards expected by receive_initial_cards()
     */
    Player(const std::string& id, const std::string& name,
           std::shared_ptr<const HandEvaluator> evaluator = nullptr,
           int initial_cards_count = 5);

    /**
     * @brief Adopt a game's evaluator and initial deal size.
     *
     * Only legal between hands, while no cards are held or placed. A null
     * evaluator keeps the current one.
     * @throws GameStateError mid-hand or for a count outside 1-13
     */
    void configure(std::shared_ptr<const HandEvaluator> evaluator, int initial_cards_count);

    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }
    PlayerStatus status() const { return status_; }

    // =========================================================================
    // Receiving cards
    // =========================================================================

    /**
     * @brief Take the initial deal.
     * @throws GameStateError if the count differs from the configured initial
     *         count, or the player already holds or has placed cards
     */
    void receive_initial_cards(const CardList& cards);

    /**
     * @brief Take a street deal (1 card standard, 3 cards pineapple).
     * @throws GameStateError if a card is already held or placed
     */
    void receive_cards(const CardList& cards);

    /**
     * @brief Take the whole Fantasy Land deal at once.
     * @throws GameStateError unless the player is in Fantasy Land with an
     *         empty layout and an empty hand pool
     */
    void receive_fantasy_land_cards(const CardList& cards);

    // =========================================================================
    // Placing cards
    // =========================================================================

    /** @brief True iff @p card is held and @p row has spare capacity. */
    bool can_place_card(Card card, Row row) const;

    /**
     * @brief Move a held card onto a row.
     * @throws InvalidCardPlacementError if can_place_card() is false
     *
     * Marks the player as having placed this round. If this placement
     * completes the layout, validate_layout() runs and a failure sets the
     * status to FOULED.
     */
    void place_card(Card card, Row row);

    /**
     * @brief Drop a held card (Pineapple discard).
     * @throws InvalidCardPlacementError if the card is not held
     */
    void discard_card(Card card);

    /**
     * @brief Set a complete 3/5/5 layout from the Fantasy Land pool at once.
     * @return Held cards left over after the 13 placements (to be discarded)
     * @throws InvalidCardPlacementError on wrong row sizes, duplicates, or
     *         cards not held; the player is unchanged on failure
     */
    CardList place_fantasy_land_layout(const CardList& top, const CardList& middle,
                                       const CardList& bottom);

    // =========================================================================
    // Layout queries
    // =========================================================================

    /**
     * @brief True for any incomplete layout; for a complete layout, true iff
     *        bottom > middle > top strictly.
     */
    bool validate_layout() const;

    /** @brief Exactly 3/5/5 cards placed. */
    bool is_layout_complete() const;

    bool is_fouled() const { return status_ == PlayerStatus::FOULED; }

    /** @brief Rows with spare capacity, Top/Middle/Bottom order. */
    std::vector<Row> get_available_positions() const;

    const CardList& top() const { return top_; }
    const CardList& middle() const { return middle_; }
    const CardList& bottom() const { return bottom_; }
    const CardList& row(Row r) const;
    const CardList& hand_cards() const { return hand_cards_; }

    /** @brief Number of cards on the three rows. */
    int placed_count() const;

    /** @brief Copy of rows and held cards. */
    HandSnapshot hand() const;

    /**
     * @brief Rankings of the three rows (Top, Middle, Bottom).
     * @throws GameStateError if the layout is incomplete
     */
    std::array<HandRanking, NUM_ROWS> rankings() const;

    /** @brief Sum of row royalties; 0 if incomplete or fouled. */
    int royalties() const;

    // =========================================================================
    // Rounds, hands and Fantasy Land
    // =========================================================================

    bool placed_this_round() const { return placed_this_round_; }

    /** @brief Clear the "placed this round" flag. */
    void start_new_round() { placed_this_round_ = false; }

    /**
     * @brief Reset rows and held cards for a new hand, keeping FL state.
     *
     * Status becomes FANTASY_LAND if the FL state is active, ACTIVE otherwise.
     */
    void start_new_hand();

    /**
     * @brief Enter (or stay in) Fantasy Land.
     * @param round Round at which the player qualified
     * @param card_count Cards to deal on the next hand
     */
    void enter_fantasy_land(int round, int card_count);

    /** @brief Leave Fantasy Land, dropping any held Fantasy Land cards. */
    void exit_fantasy_land();

    bool in_fantasy_land() const { return fantasy_land_.is_active; }
    const FantasyLandState& fantasy_land_state() const { return fantasy_land_; }

    int initial_cards_count() const { return initial_cards_count_; }
    const HandEvaluator& evaluator() const { return *evaluator_; }

private:
    CardList& mutable_row(Row r);
    bool holds(Card card) const;
    bool owns(Card card) const;

    std::string id_;
    std::string name_;
    std::shared_ptr<const HandEvaluator> evaluator_;
    int initial_cards_count_;

    PlayerStatus status_;
    CardList top_;
    CardList middle_;
    CardList bottom_;
    CardList hand_cards_;        ///< Dealt but not yet placed
    bool placed_this_round_;
    FantasyLandState fantasy_land_;
};

} // namespace ofc
