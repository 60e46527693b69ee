/**
 * @file game.cpp
 * @brief Implementation of the Game aggregate.
 *
 * Every mutation follows the same pattern:
 *   1. Lock the game
 *   2. Copy the state into a Transaction
 *   3. Check status and turn (GameStateError), then the move itself
 *      (GameValidator, InvalidCardPlacementError)
 *   4. Apply the move and finish the turn on the copy
 *   5. Commit: swap the copy in, bump the version, publish events
 *
 * An exception at any step leaves the committed state untouched.
 */

#include "../include/ofc/game.hpp"
#include <algorithm>
#include <set>
#include <sstream>
#include <utility>

namespace ofc {

namespace {

std::shared_ptr<const HandEvaluator> evaluator_or_default(std::shared_ptr<const HandEvaluator> evaluator,
                                                          const GameRules& rules) {
    if (evaluator) return evaluator;
    return std::make_shared<HandEvaluator>(rules.royalty_scheme);
}

std::shared_ptr<const FantasyLandManager> fantasy_land_or_default(
        std::shared_ptr<const FantasyLandManager> fantasy_land,
        const std::shared_ptr<const HandEvaluator>& evaluator, const GameRules& rules) {
    if (fantasy_land) return fantasy_land;
    return std::make_shared<FantasyLandManager>(evaluator, rules);
}

} // anonymous namespace

Game::Game(const std::string& game_id, const std::vector<Player>& players, const GameRules& rules,
           uint64_t seed, std::shared_ptr<const HandEvaluator> evaluator,
           std::shared_ptr<const FantasyLandManager> fantasy_land, bool start_immediately)
    : game_id_(game_id), rules_(rules), seed_(seed),
      evaluator_(evaluator_or_default(std::move(evaluator), rules)),
      fantasy_land_(fantasy_land_or_default(std::move(fantasy_land), evaluator_, rules)),
      validator_(evaluator_, fantasy_land_) {
    ValidationResult rules_check = rules_.validate();
    if (!rules_check.is_valid) {
        throw GameStateError("Invalid rules: " + rules_check.error_message);
    }

    int count = static_cast<int>(players.size());
    if (count < rules_.min_players || count > rules_.max_players) {
        std::ostringstream oss;
        oss << "Game requires " << rules_.min_players << "-" << rules_.max_players
            << " players, got " << count;
        throw GameStateError(oss.str());
    }

    std::set<std::string> ids;
    for (const Player& p : players) {
        if (p.id().empty()) {
            throw GameStateError("Player id cannot be empty");
        }
        if (!ids.insert(p.id()).second) {
            throw GameStateError("Duplicate player id: " + p.id());
        }
        if (p.placed_count() > 0 || !p.hand_cards().empty()) {
            throw GameStateError("Player " + p.id() + " must join with an empty layout");
        }
        if (p.status() == PlayerStatus::ELIMINATED) {
            throw GameStateError("Player " + p.id() + " is eliminated");
        }
    }

    state_.game_id = game_id_;
    state_.rules = rules_;
    state_.players = players;
    state_.deck.reset(seed_);
    for (Player& p : state_.players) {
        p.configure(evaluator_, rules_.initial_cards_count);
    }
    if (!rules_.fantasy_land_enabled) {
        for (Player& p : state_.players) {
            if (p.in_fantasy_land()) p.exit_fantasy_land();
        }
    }

    if (start_immediately) {
        start();
    }
}

void Game::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.status != GameStatus::WAITING) {
        throw GameStateError("Game " + game_id_ + " has already started");
    }
    Transaction tx = begin();
    deal_initial(tx);
    commit(tx);
}

// =============================================================================
// Mutations
// =============================================================================

void Game::place_card(const std::string& player_id, Card card, Row row) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx = begin();
    require_acting(tx.state, player_id);

    Player& player = *tx.state.find_player(player_id);
    if (player.status() == PlayerStatus::FANTASY_LAND) {
        throw GameStateError("Fantasy Land players must set all 13 cards at once");
    }
    if (rules_.is_pineapple() && player.placed_count() >= rules_.initial_cards_count) {
        throw GameStateError("Pineapple streets must be played with apply_pineapple_action");
    }

    place(tx, player, card, row);
    finish_turn(tx);
    commit(tx);
}

void Game::apply_initial_placement(const InitialPlacement& placement) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx = begin();
    require_acting(tx.state, placement.player_id);

    ValidationResult check = validator_.validate_initial_placement(tx.state, placement);
    if (!check.is_valid) {
        Card card = placement.placements.empty() ? INVALID_CARD : placement.placements[0].first;
        throw InvalidCardPlacementError(check.error_message, card, Row::TOP, placement.player_id);
    }

    auto ordered = placement.placements;
    std::sort(ordered.begin(), ordered.end(),
              [](const std::pair<Card, Slot>& a, const std::pair<Card, Slot>& b) {
                  return a.second < b.second;
              });

    Player& player = *tx.state.find_player(placement.player_id);
    for (const auto& p : ordered) {
        place(tx, player, p.first, p.second.row);
    }
    finish_turn(tx);
    commit(tx);
}

void Game::apply_pineapple_action(const PineappleAction& action) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx = begin();
    require_acting(tx.state, action.player_id);

    ValidationResult check = validator_.validate_pineapple_action(tx.state, action);
    if (!check.is_valid) {
        Row row = action.placements.empty() ? Row::TOP : action.placements[0].second;
        throw InvalidCardPlacementError(check.error_message, action.discarded_card, row,
                                        action.player_id);
    }

    Player& player = *tx.state.find_player(action.player_id);
    for (const auto& p : action.placements) {
        place(tx, player, p.first, p.second);
    }
    discard(tx, player, action.discarded_card);
    finish_turn(tx);
    commit(tx);
}

void Game::apply_fantasy_land_layout(const std::string& player_id, const CardList& top,
                                     const CardList& middle, const CardList& bottom) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx = begin();
    require_acting(tx.state, player_id);

    ValidationResult check = validator_.validate_fantasy_land_placement(tx.state, player_id,
                                                                        top, middle, bottom);
    if (!check.is_valid) {
        throw InvalidCardPlacementError(check.error_message, INVALID_CARD, Row::TOP, player_id);
    }

    Player& player = *tx.state.find_player(player_id);
    CardList leftover = player.place_fantasy_land_layout(top, middle, bottom);
    for (Row r : ALL_ROWS) {
        for (Card c : player.row(r)) {
            tx.events.push_back(CardPlacedEvent{game_id_, player_id, c, r, tx.state.round});
        }
    }
    for (Card c : leftover) {
        tx.state.deck.discard(c);
        tx.events.push_back(CardDiscardedEvent{game_id_, player_id, c, tx.state.round});
    }
    finish_turn(tx);
    commit(tx);
}

void Game::pause() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.status != GameStatus::IN_PROGRESS) {
        throw GameStateError(std::string("Cannot pause a game that is ") +
                             game_status_name(state_.status));
    }
    Transaction tx = begin();
    tx.state.status = GameStatus::PAUSED;
    commit(tx);
}

void Game::resume() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.status != GameStatus::PAUSED) {
        throw GameStateError(std::string("Cannot resume a game that is ") +
                             game_status_name(state_.status));
    }
    Transaction tx = begin();
    tx.state.status = GameStatus::IN_PROGRESS;
    commit(tx);
}

void Game::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.status == GameStatus::COMPLETED || state_.status == GameStatus::CANCELLED) {
        throw GameStateError(std::string("Cannot cancel a game that is ") +
                             game_status_name(state_.status));
    }
    Transaction tx = begin();
    tx.state.status = GameStatus::CANCELLED;
    commit(tx);
}

// =============================================================================
// Queries
// =============================================================================

Player Game::get_current_player() const {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_.status) {
        case GameStatus::COMPLETED: throw GameStateError("Game " + game_id_ + " is already completed");
        case GameStatus::CANCELLED: throw GameStateError("Game " + game_id_ + " has been cancelled");
        case GameStatus::WAITING:   throw GameStateError("Game " + game_id_ + " has not started");
        default: break;
    }
    return state_.current_player();
}

Player Game::get_player(const std::string& player_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Player* player = state_.find_player(player_id);
    if (player == nullptr) {
        throw GameStateError("Unknown player: " + player_id);
    }
    return *player;
}

std::vector<Player> Game::players() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.players;
}

bool Game::validate_layout(const std::string& player_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Player* player = state_.find_player(player_id);
    if (player == nullptr) {
        throw GameStateError("Unknown player: " + player_id);
    }
    return player->validate_layout();
}

AnalysisPosition Game::get_analysis_position() const {
    std::lock_guard<std::mutex> lock(mutex_);
    AnalysisPosition pos;
    pos.game_id = game_id_;
    pos.status = state_.status;
    for (const Player& p : state_.players) {
        pos.seat_order.push_back(p.id());
        pos.hands[p.id()] = p.hand();
    }
    pos.remaining_deck = state_.deck.remaining_cards();
    pos.discards = state_.discards();
    if (state_.status == GameStatus::IN_PROGRESS || state_.status == GameStatus::PAUSED) {
        pos.current_player_id = state_.current_player().id();
    }
    pos.round = state_.round;
    pos.rules = rules_;
    pos.version = state_.version;
    return pos;
}

std::map<std::string, ValidationResult> Game::get_validation_summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return validator_.get_validation_summary(state_);
}

std::vector<Score> Game::calculate_scores() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.status != GameStatus::COMPLETED) {
        throw GameStateError("Scores are available once game " + game_id_ + " is completed");
    }
    return state_.final_scores;
}

std::string Game::winner() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.winner_id;
}

std::vector<Player> Game::players_for_next_hand() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.status != GameStatus::COMPLETED) {
        throw GameStateError("Game " + game_id_ + " is not completed");
    }
    std::vector<Player> next = state_.players;
    for (Player& p : next) {
        p.start_new_hand();
    }
    return next;
}

GameState Game::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

GameStatus Game::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.status;
}

int Game::round() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.round;
}

int Game::turn_index() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.turn_index;
}

uint64_t Game::version() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.version;
}

CardList Game::discards() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.discards();
}

std::vector<GameEvent> Game::collect_events() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<GameEvent> drained;
    drained.swap(events_);
    return drained;
}

void Game::set_listener(std::shared_ptr<GameEventListener> listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

// =============================================================================
// Internals (mutex held)
// =============================================================================

Game::Transaction Game::begin() const {
    Transaction tx;
    tx.state = state_;
    return tx;
}

void Game::commit(Transaction& tx) {
    tx.state.version = state_.version + 1;
    state_ = std::move(tx.state);
    for (GameEvent& event : tx.events) {
        if (listener_) listener_->on_event(event);
        events_.push_back(std::move(event));
    }
}

void Game::require_acting(const GameState& state, const std::string& player_id) const {
    switch (state.status) {
        case GameStatus::COMPLETED: throw GameStateError("Game " + game_id_ + " is already completed");
        case GameStatus::CANCELLED: throw GameStateError("Game " + game_id_ + " has been cancelled");
        case GameStatus::PAUSED:    throw GameStateError("Game " + game_id_ + " is paused");
        case GameStatus::WAITING:   throw GameStateError("Game " + game_id_ + " has not started");
        case GameStatus::IN_PROGRESS: break;
    }
    ValidationResult turn = validator_.validate_turn_order(state, player_id);
    if (!turn.is_valid) {
        throw GameStateError(turn.error_message);
    }
}

void Game::deal_initial(Transaction& tx) {
    for (Player& p : tx.state.players) {
        if (p.status() == PlayerStatus::FANTASY_LAND) {
            int count = p.fantasy_land_state().card_count;
            if (count <= 0) count = fantasy_land_->get_fantasy_land_card_count();
            if (tx.state.deck.remaining() < count) {
                throw GameStateError("Deck exhausted dealing Fantasy Land cards");
            }
            p.receive_fantasy_land_cards(tx.state.deck.deal(count));
        } else {
            if (tx.state.deck.remaining() < rules_.initial_cards_count) {
                throw GameStateError("Deck exhausted dealing initial cards");
            }
            p.receive_initial_cards(tx.state.deck.deal(rules_.initial_cards_count));
        }
    }

    tx.state.status = GameStatus::IN_PROGRESS;
    tx.state.round = 1;
    tx.state.turn_index = 0;
    tx.events.push_back(RoundStartedEvent{game_id_, 1, tx.state.players[0].id()});
}

void Game::place(Transaction& tx, Player& player, Card card, Row row) {
    player.place_card(card, row);
    tx.events.push_back(CardPlacedEvent{game_id_, player.id(), card, row, tx.state.round});
}

void Game::discard(Transaction& tx, Player& player, Card card) {
    player.discard_card(card);
    tx.state.deck.discard(card);
    tx.events.push_back(CardDiscardedEvent{game_id_, player.id(), card, tx.state.round});
}

void Game::finish_turn(Transaction& tx) {
    GameState& state = tx.state;
    if (state.all_layouts_complete()) {
        complete_game(tx);
        return;
    }

    bool round_done = std::all_of(state.players.begin(), state.players.end(),
                                  [](const Player& p) {
                                      return p.placed_this_round() || p.is_layout_complete();
                                  });
    if (round_done) {
        state.round++;
        for (Player& p : state.players) {
            p.start_new_round();
        }
    }

    int n = static_cast<int>(state.players.size());
    for (int step = 1; step <= n; ++step) {
        int idx = (state.turn_index + step) % n;
        if (!state.players[idx].is_layout_complete()) {
            state.turn_index = idx;
            break;
        }
    }

    Player& next = state.players[state.turn_index];
    if (round_done) {
        tx.events.push_back(RoundStartedEvent{game_id_, state.round, next.id()});
    }
    deal_street(tx, next);
}

void Game::deal_street(Transaction& tx, Player& player) {
    if (!player.hand_cards().empty() || player.is_layout_complete() ||
        player.status() == PlayerStatus::FANTASY_LAND) {
        return;
    }
    int count = rules_.cards_per_turn;
    if (tx.state.deck.remaining() < count) {
        throw GameStateError("Deck exhausted dealing to player " + player.id());
    }
    player.receive_cards(tx.state.deck.deal(count));
}

void Game::complete_game(Transaction& tx) {
    GameState& state = tx.state;
    if (rules_.fantasy_land_enabled) {
        for (Player& p : state.players) {
            update_fantasy_land(tx, p);
        }
    }

    state.final_scores = ofc::calculate_scores(state.players, *evaluator_, rules_);
    state.winner_id = determine_winner(state.final_scores);
    state.completed_at = std::chrono::system_clock::now();
    state.has_completed_at = true;
    state.status = GameStatus::COMPLETED;
    tx.events.push_back(GameCompletedEvent{game_id_, state.final_scores, state.winner_id});
}

void Game::update_fantasy_land(Transaction& tx, Player& player) {
    bool was_active = player.in_fantasy_land();
    int round = tx.state.round;

    if (player.is_fouled()) {
        if (was_active) player.exit_fantasy_land();
    } else if (was_active) {
        if (fantasy_land_->check_stay_qualification(player.top(), player.middle(), player.bottom())) {
            player.enter_fantasy_land(round, fantasy_land_->get_fantasy_land_card_count());
        } else {
            player.exit_fantasy_land();
        }
    } else if (fantasy_land_->check_entry_qualification(player.top())) {
        player.enter_fantasy_land(round, fantasy_land_->card_count_for_entry(player.top()));
    }

    const FantasyLandState& fl = player.fantasy_land_state();
    if (was_active || fl.is_active) {
        tx.events.push_back(FantasyLandChangedEvent{game_id_, player.id(), fl.is_active,
                                                    fl.consecutive_count, fl.card_count});
    }
}

} // namespace ofc
