/**
 * @file hand_eval.hpp
 * @brief Poker hand ranking, royalty computation and OFC progression checks.
 *
 * Implements the standard 9-hand poker ranking system over 3- and 5-card sets:
 *   1. HIGH_CARD (weakest)
 *   2. PAIR
 *   3. TWO_PAIR
 *   4. THREE_OF_A_KIND
 *   5. STRAIGHT
 *   6. FLUSH
 *   7. FULL_HOUSE
 *   8. FOUR_OF_A_KIND
 *   9. STRAIGHT_FLUSH (strongest)
 *
 * A 3-card set (Top row) can only realize HIGH_CARD, PAIR or THREE_OF_A_KIND.
 * Straights and flushes need 5 cards; the Ace plays low only in the
 * A-2-3-4-5 "wheel".
 *
 * Every ranking carries a single monotonic strength value:
 * @code
 *   strength = hand_type * 15^5 + base15(tiebreak_key)
 * @endcode
 * The tiebreak key holds rank values (2-14) left-aligned and zero-padded to
 * 5 entries, so a 3-card Top and a 5-card Middle compare on the same scale.
 */

#pragma once

#include "layout.hpp"
#include "rules.hpp"
#include <array>
#include <string>

namespace ofc {

/**
 * @brief Poker hand types ordered by strength (0 = weakest, 8 = strongest).
 */
enum class HandType {
    HIGH_CARD = 0,        ///< No matching cards
    PAIR = 1,             ///< Two cards of same rank
    TWO_PAIR = 2,         ///< Two different pairs
    THREE_OF_A_KIND = 3,  ///< Three cards of same rank (trips)
    STRAIGHT = 4,         ///< Five consecutive ranks (includes A-2-3-4-5 wheel)
    FLUSH = 5,            ///< Five cards of same suit
    FULL_HOUSE = 6,       ///< Three of a kind plus a pair
    FOUR_OF_A_KIND = 7,   ///< Four cards of same rank (quads)
    STRAIGHT_FLUSH = 8    ///< Straight and flush combined (strongest)
};

/**
 * @brief Get human-readable name for a hand type.
 * @return String name ("High Card", "Pair", "Full House", etc.)
 */
const char* hand_type_name(HandType type);

/** @brief Tiebreak ranks (2-14), most significant first, zero-padded. */
using TiebreakKey = std::array<int, 5>;

/** @brief Multiplier separating hand types in strength_value (15^5). */
constexpr int STRENGTH_TYPE_STRIDE = 759375;

/**
 * @brief Result of evaluating a 3- or 5-card set.
 */
struct HandRanking {
    HandType hand_type;        ///< Detected hand type
    TiebreakKey tiebreak_key;  ///< Ordered ranks for same-type comparison
    int strength_value;        ///< Single comparable integer
    int royalty_bonus;         ///< Royalty for the row this set was evaluated for
    int card_count;            ///< 3 or 5

    /** @brief Default constructor (empty HIGH_CARD) */
    HandRanking()
        : hand_type(HandType::HIGH_CARD), tiebreak_key{}, strength_value(0),
          royalty_bonus(0), card_count(0) {}

    /** @brief Primary rank value (pair rank, trips rank, straight high, ...). */
    int primary_rank() const { return tiebreak_key[0]; }

    /** @brief Straight flush topped by an Ace. */
    bool is_royal_flush() const {
        return hand_type == HandType::STRAIGHT_FLUSH && tiebreak_key[0] == rank_value(RANK_ACE);
    }

    bool operator<(const HandRanking& other) const { return strength_value < other.strength_value; }
    bool operator>(const HandRanking& other) const { return strength_value > other.strength_value; }
    bool operator==(const HandRanking& other) const { return strength_value == other.strength_value; }
};

/**
 * @brief Human-readable description ("Pair of Aces", "Straight (5 High)").
 */
std::string describe(const HandRanking& ranking);

/**
 * @brief Stateless OFC hand evaluator.
 *
 * Holds only the royalty scheme, so one const instance can be shared by
 * every Player, FantasyLandManager, GameValidator and Game of a rules set,
 * from any thread.
 *
 * Usage:
 * @code
 *   HandEvaluator evaluator(RoyaltyScheme::STANDARD);
 *   HandRanking top = evaluator.evaluate(parse_cards("Qh Qd Kc"), Row::TOP);
 *   // top.hand_type == PAIR, top.royalty_bonus == 7
 * @endcode
 */
class HandEvaluator {
public:
    explicit HandEvaluator(RoyaltyScheme scheme = RoyaltyScheme::STANDARD);

    /**
     * @brief Rank a 3- or 5-card set.
     * @param cards Exactly 3 or 5 distinct cards
     * @return Ranking; royalty_bonus is computed for TOP (3 cards) or BOTTOM (5 cards)
     * @throws std::invalid_argument on wrong count, duplicates or invalid codes
     *
     * Algorithm:
     *   1. Count rank and suit multiplicities
     *   2. Detect flush (5 cards, one suit) and straight (wheel included)
     *   3. Classify by multiplicity pattern (4+1, 3+2, 3+1+1, 2+2+1, 2+1+1+1, 1x5)
     *      combined with the straight/flush flags, strongest first
     */
    HandRanking evaluate(const CardList& cards) const;

    /**
     * @brief Rank a set and compute its royalty for a specific row.
     * @throws std::invalid_argument as evaluate(cards)
     */
    HandRanking evaluate(const CardList& cards, Row row) const;

    /**
     * @brief Royalty points for a ranking placed in @p row.
     *
     * Returns 0 below the row's threshold (Top: pair of 6s; Middle: trips
     * under the standard scheme, straight under flat; Bottom: straight), or
     * when the ranking's card count does not fit the row.
     */
    int royalty_bonus(const HandRanking& ranking, Row row) const;

    /**
     * @brief Compare two rankings by strength value.
     * @return 1 if a is stronger, -1 if b is stronger, 0 if tied
     */
    static int compare(const HandRanking& a, const HandRanking& b);

    /**
     * @brief Check bottom > middle > top, strictly.
     * @return False when the counts are not exactly 3/5/5, or on any tie
     */
    bool validate_ofc_progression(const CardList& top, const CardList& middle,
                                  const CardList& bottom) const;

    /**
     * @brief Negation of validate_ofc_progression() for complete layouts.
     * @return False for incomplete layouts (nothing to foul yet)
     */
    bool is_fouled_hand(const CardList& top, const CardList& middle,
                        const CardList& bottom) const;

    /**
     * @brief Made-hand type from rank multiplicities alone (0-5 cards).
     *
     * Ignores straights and flushes; used by partial-layout safety checks,
     * where rows are still being filled.
     */
    static HandType classify_partial(const CardList& cards);

    RoyaltyScheme scheme() const { return scheme_; }

private:
    RoyaltyScheme scheme_;
};

} // namespace ofc
