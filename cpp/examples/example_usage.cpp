// Example usage: play seeded Standard and Pineapple hands to completion

#include "../include/ofc/game.hpp"
#include <iostream>
#include <memory>

using namespace ofc;

namespace {

// Fill Bottom first, then Middle, then Top.
Row naive_row(const Player& player) {
    std::vector<Row> open = player.get_available_positions();
    return open.back();
}

void print_layout(const Player& player, const HandEvaluator& evaluator) {
    std::cout << "  " << player.name() << " (" << player_status_name(player.status()) << ")"
              << std::endl;
    for (Row r : ALL_ROWS) {
        const CardList& cards = player.row(r);
        std::cout << "    " << row_display_name(r) << ": " << cards_to_string(cards);
        if (static_cast<int>(cards.size()) == row_capacity(r)) {
            HandRanking ranking = evaluator.evaluate(cards, r);
            std::cout << "  [" << describe(ranking) << ", royalty " << ranking.royalty_bonus << "]";
        }
        std::cout << std::endl;
    }
}

void print_results(const Game& game, const HandEvaluator& evaluator) {
    for (const Player& p : game.players()) {
        print_layout(p, evaluator);
    }
    std::cout << "\nScores:" << std::endl;
    for (const Score& s : game.calculate_scores()) {
        std::cout << "  " << s.player_id << ": " << s.total_points()
                  << " (rows " << s.points << ", royalties " << s.royalties
                  << ", paid " << s.penalties << ")" << std::endl;
    }
    std::cout << "Winner: " << game.winner() << std::endl;
}

void play_standard(const std::shared_ptr<EventLog>& log) {
    std::cout << "\n--- Standard OFC, seed 42 ---" << std::endl;

    auto evaluator = std::make_shared<HandEvaluator>(RoyaltyScheme::STANDARD);
    std::vector<Player> players = {
        Player("p1", "Alice", evaluator),
        Player("p2", "Bob", evaluator),
    };
    Game game("standard-42", players, GameRules::standard(), 42, evaluator);
    game.set_listener(log);

    while (!game.is_completed()) {
        Player current = game.get_current_player();
        Card card = current.hand_cards().front();
        Row row = naive_row(current);

        ValidationResult advice = game.validator().can_place_card_safely(current, card, row);
        if (advice.has_warning()) {
            std::cout << "  warning: " << advice.warning_message << std::endl;
        }
        game.place_card(current.id(), card, row);
    }

    print_results(game, *evaluator);
}

void play_pineapple(const std::shared_ptr<EventLog>& log) {
    std::cout << "\n--- Pineapple OFC, seed 7 ---" << std::endl;

    GameRules rules = GameRules::pineapple();
    auto evaluator = std::make_shared<HandEvaluator>(rules.royalty_scheme);
    std::vector<Player> players = {
        Player("p1", "Alice", evaluator),
        Player("p2", "Bob", evaluator),
        Player("p3", "Carol", evaluator),
    };
    Game game("pineapple-7", players, rules, 7, evaluator);
    game.set_listener(log);

    while (!game.is_completed()) {
        Player current = game.get_current_player();
        const CardList& held = current.hand_cards();

        if (current.placed_count() == 0) {
            // Opening: two Bottom, two Middle, one Top
            InitialPlacement opening;
            opening.player_id = current.id();
            const Slot slots[] = {{Row::BOTTOM, 0}, {Row::BOTTOM, 1}, {Row::MIDDLE, 0},
                                  {Row::MIDDLE, 1}, {Row::TOP, 0}};
            for (size_t i = 0; i < held.size(); ++i) {
                opening.placements.emplace_back(held[i], slots[i]);
            }
            game.apply_initial_placement(opening);
            continue;
        }

        PineappleAction street;
        street.player_id = current.id();
        street.dealt_cards = held;
        Player preview = current;
        for (int i = 0; i < rules.cards_to_place; ++i) {
            Row row = naive_row(preview);
            preview.place_card(held[i], row);
            street.placements.emplace_back(held[i], row);
        }
        street.discarded_card = held.back();
        game.apply_pineapple_action(street);
    }

    print_results(game, *evaluator);
    std::cout << "Discarded: " << cards_to_string(game.discards()) << std::endl;

    for (const Player& p : game.players_for_next_hand()) {
        if (p.in_fantasy_land()) {
            std::cout << p.name() << " plays the next hand in Fantasy Land with "
                      << p.fantasy_land_state().card_count << " cards" << std::endl;
        }
    }
}

} // anonymous namespace

int main() {
    std::cout << "=== OFC Rules Engine Example ===" << std::endl;

    auto log = std::make_shared<EventLog>(std::cout);
    try {
        play_standard(log);
        play_pineapple(log);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\n" << log->lines_written() << " events logged" << std::endl;
    std::cout << "\n=== Example Complete ===" << std::endl;
    return 0;
}
