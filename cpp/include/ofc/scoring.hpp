/**
 * @file scoring.hpp
 * @brief OFC head-to-head settlement of completed layouts.
 *
 * Every pair of players settles independently:
 *
 * Row Points:
 *   - Each row won = 1 point (ties score nothing)
 *   - Winning all three rows adds GameRules::scoop_bonus (3 standard, 9 pineapple)
 *   - A fouled player loses every row and the scoop to a non-fouled opponent
 *   - Two fouled players exchange nothing
 *
 * Royalties:
 *   - A non-fouled player collects its own royalties from each opponent
 *   - A fouled player earns none and still pays opponents' royalties
 *
 * Example (standard rules, no fouls):
 * @code
 *   A wins Top and Bottom, B wins Middle    -> A +1 rows
 *   A royalties 6, B royalties 2            -> A +4 royalties
 *   A net +5, B net -5
 * @endcode
 *
 * Per player the gross amounts are kept apart:
 * @code
 *   total = points + royalties - penalties
 * @endcode
 * where penalties hold everything paid out. Totals over a game sum to 0.
 */

#pragma once

#include "player.hpp"
#include <array>
#include <string>
#include <vector>

namespace ofc {

/**
 * @brief Final score of one player.
 */
struct Score {
    std::string player_id;
    int points = 0;      ///< Row points and scoop bonuses won
    int royalties = 0;   ///< Royalties collected from opponents
    int penalties = 0;   ///< Row points, scoops and royalties paid to opponents

    int total_points() const { return points + royalties - penalties; }
};

/**
 * @brief Settlement between two players, seen from the first player.
 */
struct PairwiseResult {
    std::string first_id;
    std::string second_id;
    std::array<int, NUM_ROWS> row_outcomes{};  ///< +1 first wins, -1 second wins, 0 tie
    int first_row_points = 0;     ///< Rows won by first, plus scoop bonus
    int second_row_points = 0;    ///< Rows won by second, plus scoop bonus
    int first_royalties = 0;      ///< Royalties first collects from second
    int second_royalties = 0;     ///< Royalties second collects from first
    bool scoop = false;           ///< One side won all three rows

    /** @brief Net gain of the first player (negated for the second). */
    int net() const {
        return first_row_points - second_row_points + first_royalties - second_royalties;
    }
};

/**
 * @brief Settle two complete layouts.
 * @throws std::invalid_argument if either layout is incomplete
 */
PairwiseResult settle_pair(const Player& first, const Player& second,
                           const HandEvaluator& evaluator, const GameRules& rules);

/**
 * @brief Settle every pair and accumulate per-player scores.
 * @return Scores in seat order
 * @throws std::invalid_argument if any layout is incomplete
 */
std::vector<Score> calculate_scores(const std::vector<Player>& players,
                                    const HandEvaluator& evaluator, const GameRules& rules);

/**
 * @brief Winner by highest total; ties go to higher royalties, then seat order.
 * @return Winner's id, or empty if @p scores is empty
 */
std::string determine_winner(const std::vector<Score>& scores);

} // namespace ofc
