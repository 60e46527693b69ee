/**
 * @file rules.cpp
 * @brief Rules presets, name conversion and consistency checks.
 */

#include "../include/ofc/rules.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace ofc {

const char* variant_name(Variant variant) {
    return variant == Variant::PINEAPPLE ? "pineapple" : "standard";
}

Variant parse_variant(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "standard") return Variant::STANDARD;
    if (lower == "pineapple") return Variant::PINEAPPLE;
    throw std::invalid_argument("Invalid variant: " + name);
}

const char* royalty_scheme_name(RoyaltyScheme scheme) {
    return scheme == RoyaltyScheme::FLAT ? "flat" : "standard";
}

GameRules GameRules::standard() {
    return GameRules();
}

GameRules GameRules::pineapple() {
    GameRules rules;
    rules.variant = Variant::PINEAPPLE;
    rules.max_players = 3;
    rules.cards_per_turn = 3;
    rules.cards_to_place = 2;
    rules.scoop_bonus = 9;
    return rules;
}

GameRules GameRules::progressive_pineapple() {
    GameRules rules = pineapple();
    rules.progressive_fantasy_land = true;
    return rules;
}

ValidationResult GameRules::validate() const {
    if (min_players < 2 || max_players > 4 || min_players > max_players) {
        std::ostringstream oss;
        oss << "Player count bounds must lie within 2-4, got " << min_players << "-" << max_players;
        return ValidationResult::failure(oss.str());
    }
    if (initial_cards_count < 1 || initial_cards_count > LAYOUT_SIZE) {
        return ValidationResult::failure("initial_cards_count must be 1-13, got " +
                                         std::to_string(initial_cards_count));
    }
    if (cards_to_place < 1 || cards_per_turn < cards_to_place) {
        return ValidationResult::failure("cards_per_turn must be >= cards_to_place >= 1");
    }
    if (cards_to_discard() != (is_pineapple() ? 1 : 0)) {
        return ValidationResult::failure(is_pineapple()
            ? "Pineapple streets discard exactly one card"
            : "Standard streets place every dealt card");
    }
    if ((LAYOUT_SIZE - initial_cards_count) % cards_to_place != 0) {
        return ValidationResult::failure("Cards after the initial deal must split evenly into streets");
    }
    if (scoop_bonus < 0) {
        return ValidationResult::failure("scoop_bonus cannot be negative");
    }
    if (fantasy_land_min_pair < 0 || fantasy_land_min_pair >= NUM_RANKS) {
        return ValidationResult::failure("fantasy_land_min_pair must be a rank index 0-12");
    }
    if (progressive_fantasy_land && !is_pineapple()) {
        return ValidationResult::failure("Progressive Fantasy Land requires the pineapple variant");
    }

    // Worst case: every player takes the largest deal the rules allow.
    int street_cards = LAYOUT_SIZE - initial_cards_count;
    int streets = (street_cards + cards_to_place - 1) / cards_to_place;
    int per_player = initial_cards_count + streets * cards_per_turn;
    if (fantasy_land_enabled) {
        int fl_cards = progressive_fantasy_land ? 17 : (is_pineapple() ? 14 : LAYOUT_SIZE);
        per_player = std::max(per_player, fl_cards);
    }
    if (per_player * max_players > DECK_SIZE) {
        std::ostringstream oss;
        oss << max_players << " players need up to " << per_player * max_players
            << " cards, deck has " << DECK_SIZE;
        return ValidationResult::failure(oss.str());
    }
    return ValidationResult::ok();
}

} // namespace ofc
