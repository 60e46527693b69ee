#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <string>
#include "ofc/game.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_ofc_core, m) {
    m.doc() = "Open-Face Chinese Poker rules engine core module";

    // Expose constants
    m.attr("DECK_SIZE") = ofc::DECK_SIZE;
    m.attr("NUM_RANKS") = ofc::NUM_RANKS;
    m.attr("NUM_SUITS") = ofc::NUM_SUITS;
    m.attr("LAYOUT_SIZE") = ofc::LAYOUT_SIZE;
    m.attr("INVALID_CARD") = ofc::INVALID_CARD;

    // Errors raised on the mutation path
    py::register_exception<ofc::GameStateError>(m, "GameStateError", PyExc_RuntimeError);
    py::register_exception<ofc::InvalidCardPlacementError>(m, "InvalidCardPlacementError",
                                                           PyExc_ValueError);

    // Card helpers (cards are ints 0-51: rank * 4 + suit)
    m.def("card_to_string", &ofc::card_to_string, py::arg("card"));
    m.def("cards_to_string", &ofc::cards_to_string, py::arg("cards"));
    m.def("parse_card", &ofc::parse_card, py::arg("text"));
    m.def("parse_cards", &ofc::parse_cards, py::arg("text"));
    m.def("make_card", &ofc::make_card, py::arg("rank"), py::arg("suit"));
    m.def("get_rank", &ofc::get_rank, py::arg("card"));
    m.def("get_suit", &ofc::get_suit, py::arg("card"));

    py::enum_<ofc::Row>(m, "Row")
        .value("TOP", ofc::Row::TOP)
        .value("MIDDLE", ofc::Row::MIDDLE)
        .value("BOTTOM", ofc::Row::BOTTOM)
        .export_values();
    m.def("parse_row", &ofc::parse_row, py::arg("name"));

    py::enum_<ofc::HandType>(m, "HandType")
        .value("HIGH_CARD", ofc::HandType::HIGH_CARD)
        .value("PAIR", ofc::HandType::PAIR)
        .value("TWO_PAIR", ofc::HandType::TWO_PAIR)
        .value("THREE_OF_A_KIND", ofc::HandType::THREE_OF_A_KIND)
        .value("STRAIGHT", ofc::HandType::STRAIGHT)
        .value("FLUSH", ofc::HandType::FLUSH)
        .value("FULL_HOUSE", ofc::HandType::FULL_HOUSE)
        .value("FOUR_OF_A_KIND", ofc::HandType::FOUR_OF_A_KIND)
        .value("STRAIGHT_FLUSH", ofc::HandType::STRAIGHT_FLUSH)
        .export_values();

    py::enum_<ofc::Variant>(m, "Variant")
        .value("STANDARD", ofc::Variant::STANDARD)
        .value("PINEAPPLE", ofc::Variant::PINEAPPLE);
    m.def("parse_variant", &ofc::parse_variant, py::arg("name"));

    py::enum_<ofc::RoyaltyScheme>(m, "RoyaltyScheme")
        .value("STANDARD", ofc::RoyaltyScheme::STANDARD)
        .value("FLAT", ofc::RoyaltyScheme::FLAT);

    py::enum_<ofc::PlayerStatus>(m, "PlayerStatus")
        .value("ACTIVE", ofc::PlayerStatus::ACTIVE)
        .value("FOULED", ofc::PlayerStatus::FOULED)
        .value("FANTASY_LAND", ofc::PlayerStatus::FANTASY_LAND)
        .value("ELIMINATED", ofc::PlayerStatus::ELIMINATED);

    py::enum_<ofc::GameStatus>(m, "GameStatus")
        .value("WAITING", ofc::GameStatus::WAITING)
        .value("IN_PROGRESS", ofc::GameStatus::IN_PROGRESS)
        .value("PAUSED", ofc::GameStatus::PAUSED)
        .value("COMPLETED", ofc::GameStatus::COMPLETED)
        .value("CANCELLED", ofc::GameStatus::CANCELLED);

    py::class_<ofc::Slot>(m, "Slot")
        .def(py::init([](ofc::Row row, int index) { return ofc::Slot{row, index}; }),
             py::arg("row"), py::arg("index"))
        .def_readwrite("row", &ofc::Slot::row)
        .def_readwrite("index", &ofc::Slot::index);

    py::class_<ofc::HandSnapshot>(m, "HandSnapshot")
        .def(py::init<>())
        .def_readonly("top", &ofc::HandSnapshot::top)
        .def_readonly("middle", &ofc::HandSnapshot::middle)
        .def_readonly("bottom", &ofc::HandSnapshot::bottom)
        .def_readonly("hand_cards", &ofc::HandSnapshot::hand_cards)
        .def("is_complete", &ofc::HandSnapshot::is_complete);

    // Hand evaluation
    py::class_<ofc::HandRanking>(m, "HandRanking")
        .def(py::init<>())
        .def_readonly("hand_type", &ofc::HandRanking::hand_type)
        .def_readonly("tiebreak_key", &ofc::HandRanking::tiebreak_key)
        .def_readonly("strength_value", &ofc::HandRanking::strength_value)
        .def_readonly("royalty_bonus", &ofc::HandRanking::royalty_bonus)
        .def("__repr__", [](const ofc::HandRanking& r) {
            return "<HandRanking " + ofc::describe(r) +
                   " strength=" + std::to_string(r.strength_value) +
                   " royalty=" + std::to_string(r.royalty_bonus) + ">";
        });

    py::class_<ofc::HandEvaluator, std::shared_ptr<ofc::HandEvaluator>>(m, "HandEvaluator")
        .def(py::init<ofc::RoyaltyScheme>(), py::arg("scheme") = ofc::RoyaltyScheme::STANDARD)
        .def("evaluate", py::overload_cast<const ofc::CardList&>(&ofc::HandEvaluator::evaluate, py::const_),
             py::arg("cards"))
        .def("evaluate_row",
             py::overload_cast<const ofc::CardList&, ofc::Row>(&ofc::HandEvaluator::evaluate, py::const_),
             py::arg("cards"), py::arg("row"))
        .def("royalty_bonus", &ofc::HandEvaluator::royalty_bonus, py::arg("ranking"), py::arg("row"))
        .def_static("compare", &ofc::HandEvaluator::compare, py::arg("a"), py::arg("b"))
        .def("validate_ofc_progression", &ofc::HandEvaluator::validate_ofc_progression,
             py::arg("top"), py::arg("middle"), py::arg("bottom"))
        .def("is_fouled_hand", &ofc::HandEvaluator::is_fouled_hand,
             py::arg("top"), py::arg("middle"), py::arg("bottom"));

    py::class_<ofc::ValidationResult>(m, "ValidationResult")
        .def(py::init<>())
        .def_readonly("is_valid", &ofc::ValidationResult::is_valid)
        .def_readonly("error_message", &ofc::ValidationResult::error_message)
        .def_readonly("warning_message", &ofc::ValidationResult::warning_message)
        .def("__repr__", [](const ofc::ValidationResult& result) {
            if (result.is_valid) {
                return std::string("<ValidationResult valid=True>");
            }
            return std::string("<ValidationResult valid=False error='") +
                   result.error_message + std::string("'>");
        });

    // Configuration
    py::class_<ofc::GameRules>(m, "GameRules")
        .def(py::init<>())
        .def_static("standard", &ofc::GameRules::standard)
        .def_static("pineapple", &ofc::GameRules::pineapple)
        .def_static("progressive_pineapple", &ofc::GameRules::progressive_pineapple)
        .def_readwrite("variant", &ofc::GameRules::variant)
        .def_readwrite("min_players", &ofc::GameRules::min_players)
        .def_readwrite("max_players", &ofc::GameRules::max_players)
        .def_readwrite("initial_cards_count", &ofc::GameRules::initial_cards_count)
        .def_readwrite("cards_per_turn", &ofc::GameRules::cards_per_turn)
        .def_readwrite("cards_to_place", &ofc::GameRules::cards_to_place)
        .def_readwrite("royalty_scheme", &ofc::GameRules::royalty_scheme)
        .def_readwrite("scoop_bonus", &ofc::GameRules::scoop_bonus)
        .def_readwrite("fantasy_land_enabled", &ofc::GameRules::fantasy_land_enabled)
        .def_readwrite("progressive_fantasy_land", &ofc::GameRules::progressive_fantasy_land)
        .def_readwrite("fantasy_land_min_pair", &ofc::GameRules::fantasy_land_min_pair)
        .def("validate", &ofc::GameRules::validate);

    // Fantasy Land
    py::class_<ofc::FantasyLandState>(m, "FantasyLandState")
        .def_readonly("player_id", &ofc::FantasyLandState::player_id)
        .def_readonly("is_active", &ofc::FantasyLandState::is_active)
        .def_readonly("entry_round", &ofc::FantasyLandState::entry_round)
        .def_readonly("consecutive_count", &ofc::FantasyLandState::consecutive_count)
        .def_readonly("card_count", &ofc::FantasyLandState::card_count);

    py::class_<ofc::FantasyLandManager, std::shared_ptr<ofc::FantasyLandManager>>(m, "FantasyLandManager")
        .def(py::init([](const ofc::GameRules& rules) {
                 return std::make_shared<ofc::FantasyLandManager>(nullptr, rules);
             }),
             py::arg("rules") = ofc::GameRules::standard())
        .def("check_entry_qualification", &ofc::FantasyLandManager::check_entry_qualification,
             py::arg("top"))
        .def("check_stay_qualification", &ofc::FantasyLandManager::check_stay_qualification,
             py::arg("top"), py::arg("middle"), py::arg("bottom"))
        .def("card_count_for_entry", &ofc::FantasyLandManager::card_count_for_entry, py::arg("top"))
        .def_static("get_fantasy_land_card_count",
                    py::overload_cast<ofc::Variant>(&ofc::FantasyLandManager::get_fantasy_land_card_count),
                    py::arg("variant"));

    // Players and scores
    py::class_<ofc::Player>(m, "Player")
        .def(py::init([](const std::string& id, const std::string& name, int initial_cards_count) {
                 return ofc::Player(id, name, nullptr, initial_cards_count);
             }),
             py::arg("id"), py::arg("name"), py::arg("initial_cards_count") = 5)
        .def("configure", [](ofc::Player& self, ofc::RoyaltyScheme scheme, int initial_cards_count) {
                 self.configure(std::make_shared<ofc::HandEvaluator>(scheme), initial_cards_count);
             },
             py::arg("royalty_scheme"), py::arg("initial_cards_count"))
        .def_property_readonly("initial_cards_count", &ofc::Player::initial_cards_count)
        .def_property_readonly("id", &ofc::Player::id)
        .def_property_readonly("name", &ofc::Player::name)
        .def_property_readonly("status", &ofc::Player::status)
        .def_property_readonly("top", &ofc::Player::top)
        .def_property_readonly("middle", &ofc::Player::middle)
        .def_property_readonly("bottom", &ofc::Player::bottom)
        .def_property_readonly("hand_cards", &ofc::Player::hand_cards)
        .def_property_readonly("fantasy_land_state", &ofc::Player::fantasy_land_state)
        .def("can_place_card", &ofc::Player::can_place_card, py::arg("card"), py::arg("row"))
        .def("validate_layout", &ofc::Player::validate_layout)
        .def("is_layout_complete", &ofc::Player::is_layout_complete)
        .def("get_available_positions", &ofc::Player::get_available_positions)
        .def("royalties", &ofc::Player::royalties)
        .def("__repr__", [](const ofc::Player& p) {
            return "<Player " + p.id() + " status=" + ofc::player_status_name(p.status()) +
                   " placed=" + std::to_string(p.placed_count()) + ">";
        });

    py::class_<ofc::Score>(m, "Score")
        .def_readonly("player_id", &ofc::Score::player_id)
        .def_readonly("points", &ofc::Score::points)
        .def_readonly("royalties", &ofc::Score::royalties)
        .def_readonly("penalties", &ofc::Score::penalties)
        .def_property_readonly("total_points", &ofc::Score::total_points);

    // Actions
    py::class_<ofc::InitialPlacement>(m, "InitialPlacement")
        .def(py::init<>())
        .def_readwrite("player_id", &ofc::InitialPlacement::player_id)
        .def_readwrite("placements", &ofc::InitialPlacement::placements);

    py::class_<ofc::PineappleAction>(m, "PineappleAction")
        .def(py::init<>())
        .def_readwrite("player_id", &ofc::PineappleAction::player_id)
        .def_readwrite("dealt_cards", &ofc::PineappleAction::dealt_cards)
        .def_readwrite("placements", &ofc::PineappleAction::placements)
        .def_readwrite("discarded_card", &ofc::PineappleAction::discarded_card);

    py::class_<ofc::AnalysisPosition>(m, "AnalysisPosition")
        .def_readonly("game_id", &ofc::AnalysisPosition::game_id)
        .def_readonly("status", &ofc::AnalysisPosition::status)
        .def_readonly("seat_order", &ofc::AnalysisPosition::seat_order)
        .def_readonly("hands", &ofc::AnalysisPosition::hands)
        .def_readonly("remaining_deck", &ofc::AnalysisPosition::remaining_deck)
        .def_readonly("discards", &ofc::AnalysisPosition::discards)
        .def_readonly("current_player_id", &ofc::AnalysisPosition::current_player_id)
        .def_readonly("round", &ofc::AnalysisPosition::round)
        .def_readonly("rules", &ofc::AnalysisPosition::rules)
        .def_readonly("version", &ofc::AnalysisPosition::version);

    // Game
    py::class_<ofc::Game>(m, "Game")
        .def(py::init([](const std::string& game_id, const std::vector<ofc::Player>& players,
                         const ofc::GameRules& rules, uint64_t seed) {
                 return new ofc::Game(game_id, players, rules, seed);
             }),
             py::arg("game_id"), py::arg("players"),
             py::arg("rules") = ofc::GameRules::standard(), py::arg("seed") = 0)
        .def_property_readonly("id", &ofc::Game::id)
        .def_property_readonly("status", &ofc::Game::status)
        .def_property_readonly("round", &ofc::Game::round)
        .def_property_readonly("version", &ofc::Game::version)
        .def("get_current_player", &ofc::Game::get_current_player)
        .def("get_player", &ofc::Game::get_player, py::arg("player_id"))
        .def("place_card", &ofc::Game::place_card,
             py::arg("player_id"), py::arg("card"), py::arg("row"),
             "Place one held card for the current player")
        .def("apply_initial_placement", &ofc::Game::apply_initial_placement, py::arg("placement"))
        .def("apply_pineapple_action", &ofc::Game::apply_pineapple_action, py::arg("action"))
        .def("apply_fantasy_land_layout", &ofc::Game::apply_fantasy_land_layout,
             py::arg("player_id"), py::arg("top"), py::arg("middle"), py::arg("bottom"))
        .def("validate_pineapple_action", [](const ofc::Game& game, const ofc::PineappleAction& action) {
                 return game.validator().validate_pineapple_action(game.snapshot(), action);
             }, py::arg("action"))
        .def("validate_initial_placement", [](const ofc::Game& game, const ofc::InitialPlacement& p) {
                 return game.validator().validate_initial_placement(game.snapshot(), p);
             }, py::arg("placement"))
        .def("can_place_card_safely", [](const ofc::Game& game, const std::string& player_id,
                                         ofc::Card card, ofc::Row row) {
                 return game.validator().can_place_card_safely(game.get_player(player_id), card, row);
             }, py::arg("player_id"), py::arg("card"), py::arg("row"))
        .def("validate_layout", &ofc::Game::validate_layout, py::arg("player_id"))
        .def("get_analysis_position", &ofc::Game::get_analysis_position)
        .def("get_validation_summary", &ofc::Game::get_validation_summary)
        .def("calculate_scores", &ofc::Game::calculate_scores)
        .def("winner", &ofc::Game::winner)
        .def("players_for_next_hand", &ofc::Game::players_for_next_hand)
        .def("pause", &ofc::Game::pause)
        .def("resume", &ofc::Game::resume)
        .def("cancel", &ofc::Game::cancel)
        .def("collect_events", [](ofc::Game& game) {
                 py::list lines;
                 for (const ofc::GameEvent& event : game.collect_events()) {
                     lines.append(ofc::format_event(event));
                 }
                 return lines;
             }, "Drain recorded events as key=value lines")
        .def("__repr__", [](const ofc::Game& game) {
            return "<Game " + game.id() + " status=" + ofc::game_status_name(game.status()) +
                   " round=" + std::to_string(game.round()) + ">";
        });
}
