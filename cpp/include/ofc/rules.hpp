/**
 * @file rules.hpp
 * @brief Rules configuration consumed by the engine.
 *
 * GameRules selects the variant and every variant-dependent constant:
 *
 *   | Setting               | Standard | Pineapple |
 *   |-----------------------|----------|-----------|
 *   | initial cards         | 5        | 5         |
 *   | cards per turn        | 1        | 3         |
 *   | cards placed per turn | 1        | 2         |
 *   | max players           | 4        | 3         |
 *   | Fantasy Land deal     | 13       | 14        |
 *   | scoop bonus           | 3        | 9         |
 *
 * Royalty tables are selected independently of the variant (RoyaltyScheme).
 */

#pragma once

#include "errors.hpp"
#include <string>

namespace ofc {

/** @brief Supported OFC variants. */
enum class Variant {
    STANDARD = 0,   ///< One card per street
    PINEAPPLE = 1   ///< Three cards per street: place two, discard one
};

/** @brief Royalty table selection. */
enum class RoyaltyScheme {
    STANDARD = 0,   ///< Modern tables: middle doubles bottom, top trips 10-22
    FLAT = 1        ///< Middle uses the bottom table, all top trips pay 10
};

const char* variant_name(Variant variant);

/** @throws std::invalid_argument for unknown names */
Variant parse_variant(const std::string& name);

const char* royalty_scheme_name(RoyaltyScheme scheme);

/**
 * @brief Complete rules configuration for one game.
 *
 * Plain value type; use the named presets and override fields as needed,
 * then check with validate() (Game construction does this).
 */
struct GameRules {
    Variant variant = Variant::STANDARD;
    int min_players = 2;
    int max_players = 4;

    int initial_cards_count = 5;   ///< Cards dealt before the first placement
    int cards_per_turn = 1;        ///< Cards dealt on each later street
    int cards_to_place = 1;        ///< Cards placed from each street deal

    RoyaltyScheme royalty_scheme = RoyaltyScheme::STANDARD;
    int scoop_bonus = 3;           ///< Added to the 3 row points for winning all rows

    bool fantasy_land_enabled = true;
    bool progressive_fantasy_land = false;   ///< QQ=14, KK=15, AA=16, trips=17 cards
    int fantasy_land_min_pair = RANK_QUEEN;  ///< Lowest top pair rank that enters FL
    bool fantasy_land_stay_on_middle_full_house = true;
    bool fantasy_land_stay_on_bottom_quads = true;

    /** @brief Standard OFC: 5 initial cards, then one card per turn. */
    static GameRules standard();

    /** @brief Pineapple OFC: 5 initial cards, then 3-pick-2 streets. */
    static GameRules pineapple();

    /** @brief Pineapple with progressive Fantasy Land deal sizes. */
    static GameRules progressive_pineapple();

    bool is_pineapple() const { return variant == Variant::PINEAPPLE; }

    /** @brief Cards discarded from each street deal. */
    int cards_to_discard() const { return cards_per_turn - cards_to_place; }

    /** @brief Fantasy Land enabled for this rules set. */
    bool supports_fantasy_land() const { return fantasy_land_enabled; }

    /**
     * @brief Check internal consistency.
     * @return Invalid result naming the offending field
     */
    ValidationResult validate() const;
};

} // namespace ofc
