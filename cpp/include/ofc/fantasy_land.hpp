/**
 * @file fantasy_land.hpp
 * @brief Fantasy Land qualification rules and per-player FL state.
 *
 * Fantasy Land (FL) is a bonus mode: a player who finishes a hand with a
 * strong, non-fouled Top row receives all of the next hand's cards at once.
 *
 * Rules (defaults, see GameRules):
 *   - Entry: Top pair of Queens or better, or Top trips
 *   - Stay:  Top trips, Middle full house or better, or Bottom quads or better
 *   - Deal:  13 cards (standard), 14 (pineapple); progressive pineapple deals
 *            QQ=14, KK=15, AA=16, trips=17
 *
 * State machine per player:
 * @code
 *   inactive --enter--> active(count=1) --stay--> active(count=n+1)
 *       ^                      |                        |
 *       +--------exit----------+------------exit--------+
 * @endcode
 */

#pragma once

#include "hand_eval.hpp"
#include <memory>
#include <string>

namespace ofc {

/**
 * @brief Immutable Fantasy Land status of one player.
 *
 * Transitions return new values. The state is created once per player and
 * carried across hands so the streak survives.
 */
struct FantasyLandState {
    std::string player_id;
    bool is_active = false;
    int entry_round = -1;        ///< Round in which the current streak began, -1 if inactive
    int consecutive_count = 0;   ///< Hands in a row the player has been (re)qualified
    int times_entered = 0;       ///< Lifetime count of fresh entries
    int card_count = 0;          ///< Cards to deal on the next FL hand, 0 if inactive

    /** @brief Inactive state with a zero streak. */
    static FantasyLandState create_initial(const std::string& player_id);

    /**
     * @brief Enter (or stay in) Fantasy Land.
     * @param current_round Round at which qualification happened
     * @param cards Cards to deal on the next hand
     * @return Active state; streak is prior + 1 if already active, else 1
     */
    FantasyLandState enter_fantasy_land(int current_round, int cards) const;

    /** @brief Leave Fantasy Land; streak resets, lifetime history is kept. */
    FantasyLandState exit_fantasy_land() const;
};

/**
 * @brief Stateless Fantasy Land rules service.
 *
 * Constructed once per rules set with a shared HandEvaluator and injected
 * into the Game and the GameValidator.
 */
class FantasyLandManager {
public:
    FantasyLandManager(std::shared_ptr<const HandEvaluator> evaluator, const GameRules& rules);

    /**
     * @brief True iff a 3-card Top holds trips or a pair at or above the entry threshold.
     */
    bool check_entry_qualification(const CardList& top) const;

    /**
     * @brief True iff the layout lets an FL player stay for the next hand.
     *
     * Top trips always qualify; Middle full house+ and Bottom quads+ qualify
     * when enabled by the rules.
     */
    bool check_stay_qualification(const CardList& top, const CardList& middle,
                                  const CardList& bottom) const;

    /** @brief Base FL deal size for the configured variant. */
    int get_fantasy_land_card_count() const;

    /** @brief Base FL deal size for a variant (13 standard, 14 pineapple). */
    static int get_fantasy_land_card_count(Variant variant);

    /**
     * @brief FL deal size earned by a qualifying Top.
     *
     * Equals the base size unless progressive FL is enabled. Returns 0 if the
     * Top does not qualify.
     */
    int card_count_for_entry(const CardList& top) const;

    /**
     * @brief Check an FL setting: @p expected_dealt dealt, 13 placed, no
     * duplicates, placed cards drawn from the dealt cards.
     */
    ValidationResult validate_fantasy_land_setting(const CardList& placed, const CardList& dealt,
                                                   int expected_dealt) const;

    const GameRules& rules() const { return rules_; }

private:
    std::shared_ptr<const HandEvaluator> evaluator_;
    GameRules rules_;
};

} // namespace ofc
