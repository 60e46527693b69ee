/**
 * @file validator.cpp
 * @brief Implementation of GameValidator checks.
 *
 * Partial-layout safety:
 *   Rows still being filled are classified by rank multiplicity only
 *   (HandEvaluator::classify_partial). A placement that leaves an upper row
 *   with a better made hand than the row beneath it is flagged as risky.
 *   When both rows of a pair are complete the real rankings are compared,
 *   and a non-strict order is flagged as a certain foul.
 */

#include "../include/ofc/validator.hpp"
#include <algorithm>
#include <array>
#include <set>
#include <sstream>
#include <utility>

namespace ofc {

namespace {

bool contains(const CardList& cards, Card card) {
    return std::find(cards.begin(), cards.end(), card) != cards.end();
}

std::string slot_to_string(const Slot& slot) {
    std::ostringstream oss;
    oss << row_name(slot.row) << "[" << slot.index << "]";
    return oss.str();
}

const std::array<std::pair<Row, Row>, 2> ADJACENT_ROWS = {{
    {Row::TOP, Row::MIDDLE},
    {Row::MIDDLE, Row::BOTTOM}
}};

int fantasy_land_deal_size(const Player& player, const FantasyLandManager& manager) {
    int count = player.fantasy_land_state().card_count;
    return count > 0 ? count : manager.get_fantasy_land_card_count();
}

} // anonymous namespace

GameValidator::GameValidator(std::shared_ptr<const HandEvaluator> evaluator,
                             std::shared_ptr<const FantasyLandManager> fantasy_land)
    : evaluator_(std::move(evaluator)), fantasy_land_(std::move(fantasy_land)) {
    if (!evaluator_) {
        evaluator_ = std::make_shared<HandEvaluator>();
    }
    if (!fantasy_land_) {
        fantasy_land_ = std::make_shared<FantasyLandManager>(evaluator_, GameRules::standard());
    }
}

ValidationResult GameValidator::check_acting_player(const GameState& state,
                                                    const std::string& player_id) const {
    switch (state.status) {
        case GameStatus::IN_PROGRESS: break;
        case GameStatus::COMPLETED:   return ValidationResult::failure("Game is already completed");
        case GameStatus::CANCELLED:   return ValidationResult::failure("Game has been cancelled");
        case GameStatus::PAUSED:      return ValidationResult::failure("Game is paused");
        case GameStatus::WAITING:     return ValidationResult::failure("Game has not started");
    }
    return validate_turn_order(state, player_id);
}

ValidationResult GameValidator::validate_turn_order(const GameState& state,
                                                    const std::string& player_id) const {
    if (state.find_player(player_id) == nullptr) {
        return ValidationResult::failure("Unknown player: " + player_id);
    }
    if (state.players.empty() || state.current_player().id() != player_id) {
        std::string current = state.players.empty() ? "" : state.current_player().id();
        return ValidationResult::failure("Not player " + player_id + "'s turn (current: " +
                                         current + ")");
    }
    return ValidationResult::ok();
}

ValidationResult GameValidator::validate_card_placement(const GameState& state,
                                                        const std::string& player_id,
                                                        Card card, Row row) const {
    ValidationResult acting = check_acting_player(state, player_id);
    if (!acting.is_valid) return acting;

    const Player& player = *state.find_player(player_id);
    if (player.status() == PlayerStatus::FANTASY_LAND) {
        return ValidationResult::failure("Fantasy Land players must set all 13 cards at once");
    }
    if (state.rules.is_pineapple() && player.placed_count() >= state.rules.initial_cards_count) {
        std::ostringstream oss;
        oss << "Pineapple streets must place " << state.rules.cards_to_place
            << " cards and discard " << state.rules.cards_to_discard();
        return ValidationResult::failure(oss.str());
    }
    return can_place_card_safely(player, card, row);
}

ValidationResult GameValidator::validate_row_strength_progression(const Player& player) const {
    if (!player.is_layout_complete()) return ValidationResult::ok();

    auto rankings = player.rankings();
    for (const auto& rows : ADJACENT_ROWS) {
        const HandRanking& upper = rankings[static_cast<int>(rows.first)];
        const HandRanking& lower = rankings[static_cast<int>(rows.second)];
        if (HandEvaluator::compare(lower, upper) <= 0) {
            return ValidationResult::failure(
                std::string(row_display_name(rows.second)) + " (" + describe(lower) +
                ") must beat " + row_display_name(rows.first) + " (" + describe(upper) + ")");
        }
    }
    return ValidationResult::ok();
}

bool GameValidator::check_game_completion(const GameState& state) const {
    return state.all_layouts_complete();
}

ValidationResult GameValidator::check_structure(const GameState& state) const {
    int count = static_cast<int>(state.players.size());
    if (count < state.rules.min_players || count > state.rules.max_players) {
        std::ostringstream oss;
        oss << "Game needs " << state.rules.min_players << "-" << state.rules.max_players
            << " players, has " << count;
        return ValidationResult::failure(oss.str());
    }

    std::set<std::string> ids;
    for (const Player& p : state.players) {
        if (!ids.insert(p.id()).second) {
            return ValidationResult::failure("Duplicate player id: " + p.id());
        }
        for (Row r : ALL_ROWS) {
            if (static_cast<int>(p.row(r).size()) > row_capacity(r)) {
                return ValidationResult::failure("Player " + p.id() + " overfilled " +
                                                 row_display_name(r));
            }
        }
    }
    return ValidationResult::ok();
}

ValidationResult GameValidator::check_card_conservation(const GameState& state) const {
    std::array<int, DECK_SIZE> seen = {};

    auto tally = [&seen](const CardList& cards, const std::string& where) -> ValidationResult {
        for (Card c : cards) {
            if (!is_valid_card(c)) {
                return ValidationResult::failure("Invalid card code " +
                                                 std::to_string(static_cast<int>(c)) + " in " + where);
            }
            seen[c]++;
        }
        return ValidationResult::ok();
    };

    ValidationResult r = tally(state.deck.remaining_cards(), "deck");
    if (r.is_valid) r = tally(state.discards(), "discards");
    for (const Player& p : state.players) {
        if (!r.is_valid) break;
        r = tally(p.hand_cards(), p.id() + " hand");
        for (Row row : ALL_ROWS) {
            if (r.is_valid) r = tally(p.row(row), p.id() + " " + row_name(row));
        }
    }
    if (!r.is_valid) return r;

    for (int c = 0; c < DECK_SIZE; ++c) {
        Card card = static_cast<Card>(c);
        if (seen[c] > 1) {
            std::ostringstream oss;
            oss << "Card " << card_to_string(card) << " appears " << seen[c] << " times";
            return ValidationResult::failure(oss.str());
        }
        if (seen[c] == 0) {
            return ValidationResult::failure("Card " + card_to_string(card) + " is missing");
        }
    }
    return ValidationResult::ok();
}

ValidationResult GameValidator::validate_multi_player_game_state(const GameState& state) const {
    ValidationResult structure = check_structure(state);
    if (!structure.is_valid) return structure;
    return check_card_conservation(state);
}

ValidationResult GameValidator::can_place_card_safely(const Player& player, Card card, Row row) const {
    if (!contains(player.hand_cards(), card)) {
        return ValidationResult::failure("Card " + card_to_string(card) + " is not in player " +
                                         player.id() + "'s hand");
    }
    if (static_cast<int>(player.row(row).size()) >= row_capacity(row)) {
        return ValidationResult::failure(std::string(row_display_name(row)) + " is full");
    }

    std::array<CardList, NUM_ROWS> rows = {player.top(), player.middle(), player.bottom()};
    rows[static_cast<int>(row)].push_back(card);

    auto complete = [&rows](Row r) {
        return static_cast<int>(rows[static_cast<int>(r)].size()) == row_capacity(r);
    };

    for (const auto& pair : ADJACENT_ROWS) {
        if (complete(pair.first) && complete(pair.second)) {
            HandRanking upper = evaluator_->evaluate(rows[static_cast<int>(pair.first)], pair.first);
            HandRanking lower = evaluator_->evaluate(rows[static_cast<int>(pair.second)], pair.second);
            if (HandEvaluator::compare(lower, upper) <= 0) {
                return ValidationResult::warning(
                    "Placing " + card_to_string(card) + " on " + row_display_name(row) +
                    " will foul: " + row_display_name(pair.first) + " (" + describe(upper) +
                    ") is not below " + row_display_name(pair.second) + " (" + describe(lower) + ")");
            }
        }
    }

    for (const auto& pair : ADJACENT_ROWS) {
        const CardList& upper = rows[static_cast<int>(pair.first)];
        const CardList& lower = rows[static_cast<int>(pair.second)];
        if (upper.empty() || (complete(pair.first) && complete(pair.second))) continue;

        HandType upper_type = HandEvaluator::classify_partial(upper);
        HandType lower_type = complete(pair.second)
            ? evaluator_->evaluate(lower, pair.second).hand_type
            : HandEvaluator::classify_partial(lower);
        if (upper_type > lower_type) {
            return ValidationResult::warning(
                "Placing " + card_to_string(card) + " on " + row_display_name(row) +
                " risks fouling: " + row_display_name(pair.first) + " holds " +
                hand_type_name(upper_type) + " above " + hand_type_name(lower_type) + " in " +
                row_display_name(pair.second));
        }
    }
    return ValidationResult::ok();
}

ValidationResult GameValidator::validate_pineapple_action(const GameState& state,
                                                          const PineappleAction& action) const {
    int expected_dealt = state.rules.is_pineapple() ? state.rules.cards_per_turn
                                                    : GameRules::pineapple().cards_per_turn;
    if (static_cast<int>(action.dealt_cards.size()) != expected_dealt) {
        std::ostringstream oss;
        oss << "Must deal " << expected_dealt << " cards, got " << action.dealt_cards.size();
        return ValidationResult::failure(oss.str());
    }
    if (!state.rules.is_pineapple()) {
        return ValidationResult::failure("Pineapple actions require the pineapple variant");
    }
    if (has_duplicates(action.dealt_cards)) {
        return ValidationResult::failure("Duplicate dealt cards: " + cards_to_string(action.dealt_cards));
    }
    if (static_cast<int>(action.placements.size()) != state.rules.cards_to_place) {
        std::ostringstream oss;
        oss << "Must place exactly " << state.rules.cards_to_place << " cards, got "
            << action.placements.size();
        return ValidationResult::failure(oss.str());
    }
    if (!contains(action.dealt_cards, action.discarded_card)) {
        return ValidationResult::failure("Discarded card must be one of the dealt cards");
    }

    CardList used;
    std::array<int, NUM_ROWS> per_row = {};
    for (const auto& placement : action.placements) {
        if (!contains(action.dealt_cards, placement.first)) {
            return ValidationResult::failure("Placed card " + card_to_string(placement.first) +
                                             " was not dealt");
        }
        used.push_back(placement.first);
        per_row[static_cast<int>(placement.second)]++;
    }
    used.push_back(action.discarded_card);
    if (has_duplicates(used)) {
        return ValidationResult::failure("Each dealt card must be placed or discarded exactly once");
    }

    ValidationResult acting = check_acting_player(state, action.player_id);
    if (!acting.is_valid) return acting;

    const Player& player = *state.find_player(action.player_id);
    if (player.status() == PlayerStatus::FANTASY_LAND) {
        return ValidationResult::failure("Fantasy Land players must set all 13 cards at once");
    }
    if (player.placed_count() < state.rules.initial_cards_count) {
        return ValidationResult::failure("Initial cards must be placed before Pineapple streets");
    }

    CardList held = player.hand_cards();
    CardList dealt = action.dealt_cards;
    std::sort(held.begin(), held.end());
    std::sort(dealt.begin(), dealt.end());
    if (held != dealt) {
        return ValidationResult::failure("Dealt cards " + cards_to_string(action.dealt_cards) +
                                         " do not match player " + player.id() + "'s hand " +
                                         cards_to_string(player.hand_cards()));
    }

    for (Row r : ALL_ROWS) {
        int after = static_cast<int>(player.row(r).size()) + per_row[static_cast<int>(r)];
        if (after > row_capacity(r)) {
            return ValidationResult::failure(std::string(row_display_name(r)) + " cannot take " +
                                             std::to_string(per_row[static_cast<int>(r)]) +
                                             " more cards");
        }
    }
    return ValidationResult::ok();
}

ValidationResult GameValidator::validate_initial_placement(const GameState& state,
                                                           const InitialPlacement& placement) const {
    ValidationResult acting = check_acting_player(state, placement.player_id);
    if (!acting.is_valid) return acting;

    const Player& player = *state.find_player(placement.player_id);
    if (player.status() == PlayerStatus::FANTASY_LAND) {
        return ValidationResult::failure("Fantasy Land players must set all 13 cards at once");
    }
    if (player.placed_count() > 0) {
        return ValidationResult::failure("Initial placement already made for player " + player.id());
    }
    if (static_cast<int>(placement.placements.size()) != state.rules.initial_cards_count) {
        std::ostringstream oss;
        oss << "Must place exactly " << state.rules.initial_cards_count << " initial cards, got "
            << placement.placements.size();
        return ValidationResult::failure(oss.str());
    }

    std::set<Slot> slots;
    CardList cards;
    for (const auto& p : placement.placements) {
        const Slot& slot = p.second;
        if (slot.index < 0 || slot.index >= row_capacity(slot.row)) {
            return ValidationResult::failure("Invalid slot " + slot_to_string(slot));
        }
        if (!slots.insert(slot).second) {
            return ValidationResult::failure("Duplicate slot " + slot_to_string(slot));
        }
        if (!contains(player.hand_cards(), p.first)) {
            return ValidationResult::failure("Card " + card_to_string(p.first) +
                                             " is not in player " + player.id() + "'s hand");
        }
        cards.push_back(p.first);
    }
    if (has_duplicates(cards)) {
        return ValidationResult::failure("Duplicate cards in initial placement");
    }
    return ValidationResult::ok();
}

ValidationResult GameValidator::validate_fantasy_land_entry(const Player& player) const {
    if (!player.is_layout_complete()) {
        return ValidationResult::failure("Layout is incomplete");
    }
    if (player.is_fouled()) {
        return ValidationResult::failure("Fouled layouts cannot enter Fantasy Land");
    }
    if (!fantasy_land_->check_entry_qualification(player.top())) {
        return ValidationResult::failure(
            "Top Row (" + describe(evaluator_->evaluate(player.top(), Row::TOP)) +
            ") does not qualify for Fantasy Land");
    }
    return ValidationResult::ok();
}

ValidationResult GameValidator::validate_fantasy_land_stay(const Player& player) const {
    if (!player.in_fantasy_land()) {
        return ValidationResult::failure("Player " + player.id() + " is not in Fantasy Land");
    }
    if (!player.is_layout_complete()) {
        return ValidationResult::failure("Layout is incomplete");
    }
    if (player.is_fouled()) {
        return ValidationResult::failure("Fouled layouts cannot stay in Fantasy Land");
    }
    if (!fantasy_land_->check_stay_qualification(player.top(), player.middle(), player.bottom())) {
        return ValidationResult::failure("Layout does not qualify to stay in Fantasy Land");
    }
    return ValidationResult::ok();
}

ValidationResult GameValidator::validate_fantasy_land_placement(const GameState& state,
                                                                const std::string& player_id,
                                                                const CardList& top,
                                                                const CardList& middle,
                                                                const CardList& bottom) const {
    ValidationResult acting = check_acting_player(state, player_id);
    if (!acting.is_valid) return acting;

    const Player& player = *state.find_player(player_id);
    if (player.status() != PlayerStatus::FANTASY_LAND) {
        return ValidationResult::failure("Player " + player_id + " is not in Fantasy Land");
    }
    if (player.placed_count() > 0) {
        return ValidationResult::failure("Fantasy Land layout must be set in one action");
    }

    const CardList* rows[] = {&top, &middle, &bottom};
    CardList placed;
    for (Row r : ALL_ROWS) {
        const CardList& cards = *rows[static_cast<int>(r)];
        if (static_cast<int>(cards.size()) != row_capacity(r)) {
            std::ostringstream oss;
            oss << row_display_name(r) << " needs " << row_capacity(r) << " cards, got "
                << cards.size();
            return ValidationResult::failure(oss.str());
        }
        placed.insert(placed.end(), cards.begin(), cards.end());
    }

    ValidationResult setting = fantasy_land_->validate_fantasy_land_setting(
        placed, player.hand_cards(), fantasy_land_deal_size(player, *fantasy_land_));
    if (!setting.is_valid) return setting;

    if (!evaluator_->validate_ofc_progression(top, middle, bottom)) {
        return ValidationResult::warning("Fantasy Land layout will foul");
    }
    return ValidationResult::ok();
}

std::vector<Row> GameValidator::get_available_positions(const Player& player) const {
    return player.get_available_positions();
}

std::map<std::string, ValidationResult>
GameValidator::get_validation_summary(const GameState& state) const {
    std::map<std::string, ValidationResult> summary;
    summary["game_state"] = check_structure(state);
    summary["card_uniqueness"] = check_card_conservation(state);

    if (state.status == GameStatus::IN_PROGRESS && !state.players.empty()) {
        const Player& current = state.current_player();
        if (current.is_layout_complete()) {
            summary["turn_order"] = ValidationResult::failure(
                "Current player " + current.id() + " has a complete layout");
        } else {
            summary["turn_order"] = validate_turn_order(state, current.id());
        }
    } else {
        summary["turn_order"] = ValidationResult::ok();
    }

    bool complete = check_game_completion(state);
    if (state.status == GameStatus::COMPLETED && !complete) {
        summary["completion"] = ValidationResult::failure("Game marked completed with incomplete layouts");
    } else if (state.status == GameStatus::IN_PROGRESS && complete) {
        summary["completion"] = ValidationResult::failure("All layouts complete but game not completed");
    } else {
        summary["completion"] = ValidationResult::ok();
    }

    for (const Player& p : state.players) {
        summary["layout:" + p.id()] = validate_row_strength_progression(p);
    }
    return summary;
}

} // namespace ofc
