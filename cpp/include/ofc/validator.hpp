/**
 * @file validator.hpp
 * @brief Stateless re-derivation of every game invariant.
 *
 * GameValidator never mutates and never throws for rule violations; every
 * check returns a ValidationResult with a human-readable reason. Game runs
 * the same checks before mutating, so a move the validator accepts is a move
 * Game applies.
 *
 * Checks:
 *   | Check                          | Scope                                   |
 *   |--------------------------------|-----------------------------------------|
 *   | validate_card_placement        | status, turn, ownership, capacity       |
 *   | validate_turn_order            | player is the one to act                |
 *   | validate_row_strength_progression | complete layout is not fouled        |
 *   | validate_multi_player_game_state  | 52-card conservation, unique ids     |
 *   | can_place_card_safely          | advisory foul-risk warning              |
 *   | validate_pineapple_action      | 3 dealt, 2 placed, 1 discarded          |
 *   | validate_initial_placement     | initial cards onto distinct slots       |
 *   | validate_fantasy_land_*        | entry, stay, and 13-card FL setting     |
 *
 * Usage:
 * @code
 *   GameValidator validator(evaluator, fantasy_land);
 *   auto summary = validator.get_validation_summary(game.snapshot());
 *   for (auto& [name, result] : summary)
 *       if (!result.is_valid) std::cout << name << ": " << result.error_message;
 * @endcode
 */

#pragma once

#include "game_state.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ofc {

/**
 * @brief Advisory and defensive rules checks over a GameState.
 *
 * Thread Safety: All methods are const; one instance may be shared.
 */
class GameValidator {
public:
    /**
     * @param evaluator Shared evaluator; a standard one is created if null
     * @param fantasy_land Shared FL rules; built from standard rules if null
     */
    explicit GameValidator(std::shared_ptr<const HandEvaluator> evaluator = nullptr,
                           std::shared_ptr<const FantasyLandManager> fantasy_land = nullptr);

    /**
     * @brief Full legality of a single place_card() move.
     *
     * Checks in order: game in progress, player known, player's turn, not a
     * Fantasy Land player, Pineapple initial street, card held, row capacity.
     */
    ValidationResult validate_card_placement(const GameState& state, const std::string& player_id,
                                             Card card, Row row) const;

    /** @brief Complete layouts must be strictly ordered bottom > middle > top. */
    ValidationResult validate_row_strength_progression(const Player& player) const;

    /** @brief True when every layout holds 13 cards. */
    bool check_game_completion(const GameState& state) const;

    ValidationResult validate_turn_order(const GameState& state, const std::string& player_id) const;

    /**
     * @brief Whole-game invariants.
     *
     * Player count within bounds, unique ids, row capacities, and every card
     * of the deck present exactly once across draw pile, discards, hand pools
     * and rows.
     */
    ValidationResult validate_multi_player_game_state(const GameState& state) const;

    /**
     * @brief Advisory check for a prospective placement.
     *
     * Invalid if the placement is illegal. Valid with a warning if it makes
     * an upper row stronger than the row beneath it, or completes a pair of
     * rows in the wrong order (a certain foul).
     */
    ValidationResult can_place_card_safely(const Player& player, Card card, Row row) const;

    /**
     * @brief Pineapple street legality.
     *
     * The dealt count is checked before anything else.
     */
    ValidationResult validate_pineapple_action(const GameState& state,
                                               const PineappleAction& action) const;

    /** @brief Initial cards onto distinct, in-range slots, one per card. */
    ValidationResult validate_initial_placement(const GameState& state,
                                                const InitialPlacement& placement) const;

    /** @brief Valid iff the player's Top earns Fantasy Land entry. */
    ValidationResult validate_fantasy_land_entry(const Player& player) const;

    /** @brief Valid iff the player's layout lets them stay in Fantasy Land. */
    ValidationResult validate_fantasy_land_stay(const Player& player) const;

    /** @brief A Fantasy Land player's one-shot 3/5/5 setting. */
    ValidationResult validate_fantasy_land_placement(const GameState& state,
                                                     const std::string& player_id,
                                                     const CardList& top, const CardList& middle,
                                                     const CardList& bottom) const;

    /** @brief Rows with spare capacity, Top/Middle/Bottom order. */
    std::vector<Row> get_available_positions(const Player& player) const;

    /**
     * @brief Named results of every whole-game check.
     *
     * Keys: "game_state", "turn_order", "card_uniqueness",
     * "completion", and "layout:<player_id>" per player.
     */
    std::map<std::string, ValidationResult> get_validation_summary(const GameState& state) const;

    const HandEvaluator& evaluator() const { return *evaluator_; }

private:
    ValidationResult check_acting_player(const GameState& state, const std::string& player_id) const;
    ValidationResult check_structure(const GameState& state) const;
    ValidationResult check_card_conservation(const GameState& state) const;

    std::shared_ptr<const HandEvaluator> evaluator_;
    std::shared_ptr<const FantasyLandManager> fantasy_land_;
};

} // namespace ofc
