/**
 * @file player.cpp
 * @brief Implementation of per-player layout state.
 */

#include "../include/ofc/player.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

namespace ofc {

const char* player_status_name(PlayerStatus status) {
    static const char* names[] = {"active", "fouled", "fantasy_land", "eliminated"};
    return names[static_cast<int>(status)];
}

Player::Player(const std::string& id, const std::string& name,
               std::shared_ptr<const HandEvaluator> evaluator, int initial_cards_count)
    : id_(id), name_(name), evaluator_(std::move(evaluator)),
      initial_cards_count_(initial_cards_count), status_(PlayerStatus::ACTIVE),
      placed_this_round_(false), fantasy_land_(FantasyLandState::create_initial(id)) {
    if (!evaluator_) {
        evaluator_ = std::make_shared<HandEvaluator>();
    }
}

void Player::configure(std::shared_ptr<const HandEvaluator> evaluator, int initial_cards_count) {
    if (placed_count() > 0 || !hand_cards_.empty()) {
        throw GameStateError("Player " + id_ + " cannot be reconfigured mid-hand");
    }
    if (initial_cards_count < 1 || initial_cards_count > LAYOUT_SIZE) {
        throw GameStateError("Player " + id_ + " initial card count must be 1-13, got " +
                             std::to_string(initial_cards_count));
    }
    if (evaluator) {
        evaluator_ = std::move(evaluator);
    }
    initial_cards_count_ = initial_cards_count;
}

void Player::receive_initial_cards(const CardList& cards) {
    if (static_cast<int>(cards.size()) != initial_cards_count_) {
        std::ostringstream oss;
        oss << "Player " << id_ << " must receive exactly " << initial_cards_count_
            << " initial cards, got " << cards.size();
        throw GameStateError(oss.str());
    }
    if (!hand_cards_.empty() || placed_count() > 0) {
        throw GameStateError("Player " + id_ + " already received initial cards");
    }
    receive_cards(cards);
}

void Player::receive_cards(const CardList& cards) {
    if (has_duplicates(cards)) {
        throw GameStateError("Duplicate cards dealt to player " + id_ + ": " + cards_to_string(cards));
    }
    for (Card c : cards) {
        if (!is_valid_card(c) || owns(c)) {
            throw GameStateError("Player " + id_ + " cannot receive card " + card_to_string(c));
        }
    }
    hand_cards_.insert(hand_cards_.end(), cards.begin(), cards.end());
}

void Player::receive_fantasy_land_cards(const CardList& cards) {
    if (!in_fantasy_land()) {
        throw GameStateError("Player " + id_ + " is not in Fantasy Land");
    }
    if (!hand_cards_.empty() || placed_count() > 0) {
        throw GameStateError("Player " + id_ + " must start Fantasy Land with an empty layout");
    }
    receive_cards(cards);
}

bool Player::can_place_card(Card card, Row row) const {
    return holds(card) && static_cast<int>(this->row(row).size()) < row_capacity(row);
}

void Player::place_card(Card card, Row row) {
    if (!holds(card)) {
        throw InvalidCardPlacementError("Card " + card_to_string(card) + " is not in player " +
                                        id_ + "'s hand", card, row, id_);
    }
    if (static_cast<int>(this->row(row).size()) >= row_capacity(row)) {
        throw InvalidCardPlacementError(std::string(row_display_name(row)) + " is full",
                                        card, row, id_);
    }

    hand_cards_.erase(std::find(hand_cards_.begin(), hand_cards_.end(), card));
    mutable_row(row).push_back(card);
    placed_this_round_ = true;

    if (is_layout_complete() && !validate_layout()) {
        status_ = PlayerStatus::FOULED;
    }
}

void Player::discard_card(Card card) {
    auto it = std::find(hand_cards_.begin(), hand_cards_.end(), card);
    if (it == hand_cards_.end()) {
        throw InvalidCardPlacementError("Cannot discard " + card_to_string(card) +
                                        ": not in player " + id_ + "'s hand",
                                        card, Row::TOP, id_);
    }
    hand_cards_.erase(it);
}

CardList Player::place_fantasy_land_layout(const CardList& top, const CardList& middle,
                                           const CardList& bottom) {
    if (placed_count() > 0) {
        throw InvalidCardPlacementError("Fantasy Land layout must be set in one action",
                                        INVALID_CARD, Row::TOP, id_);
    }

    const CardList* rows[] = {&top, &middle, &bottom};
    CardList all;
    for (Row r : ALL_ROWS) {
        const CardList& cards = *rows[static_cast<int>(r)];
        if (static_cast<int>(cards.size()) != row_capacity(r)) {
            std::ostringstream oss;
            oss << row_display_name(r) << " needs " << row_capacity(r) << " cards, got "
                << cards.size();
            throw InvalidCardPlacementError(oss.str(), INVALID_CARD, r, id_);
        }
        for (Card c : cards) {
            if (!holds(c)) {
                throw InvalidCardPlacementError("Card " + card_to_string(c) +
                                                " is not in player " + id_ + "'s hand", c, r, id_);
            }
        }
        all.insert(all.end(), cards.begin(), cards.end());
    }
    if (has_duplicates(all)) {
        throw InvalidCardPlacementError("Duplicate cards in Fantasy Land layout",
                                        INVALID_CARD, Row::TOP, id_);
    }

    for (Card c : all) {
        hand_cards_.erase(std::find(hand_cards_.begin(), hand_cards_.end(), c));
    }
    top_ = top;
    middle_ = middle;
    bottom_ = bottom;
    placed_this_round_ = true;

    CardList leftover;
    leftover.swap(hand_cards_);

    if (!validate_layout()) {
        status_ = PlayerStatus::FOULED;
    }
    return leftover;
}

bool Player::validate_layout() const {
    if (!is_layout_complete()) return true;
    return evaluator_->validate_ofc_progression(top_, middle_, bottom_);
}

bool Player::is_layout_complete() const {
    return static_cast<int>(top_.size()) == TOP_SIZE &&
           static_cast<int>(middle_.size()) == MIDDLE_SIZE &&
           static_cast<int>(bottom_.size()) == BOTTOM_SIZE;
}

std::vector<Row> Player::get_available_positions() const {
    std::vector<Row> rows;
    for (Row r : ALL_ROWS) {
        if (static_cast<int>(row(r).size()) < row_capacity(r)) rows.push_back(r);
    }
    return rows;
}

const CardList& Player::row(Row r) const {
    switch (r) {
        case Row::TOP:    return top_;
        case Row::MIDDLE: return middle_;
        default:          return bottom_;
    }
}

CardList& Player::mutable_row(Row r) {
    switch (r) {
        case Row::TOP:    return top_;
        case Row::MIDDLE: return middle_;
        default:          return bottom_;
    }
}

int Player::placed_count() const {
    return static_cast<int>(top_.size() + middle_.size() + bottom_.size());
}

HandSnapshot Player::hand() const {
    HandSnapshot snap;
    snap.top = top_;
    snap.middle = middle_;
    snap.bottom = bottom_;
    snap.hand_cards = hand_cards_;
    return snap;
}

std::array<HandRanking, NUM_ROWS> Player::rankings() const {
    if (!is_layout_complete()) {
        throw GameStateError("Player " + id_ + " has an incomplete layout");
    }
    return {evaluator_->evaluate(top_, Row::TOP),
            evaluator_->evaluate(middle_, Row::MIDDLE),
            evaluator_->evaluate(bottom_, Row::BOTTOM)};
}

int Player::royalties() const {
    if (!is_layout_complete() || is_fouled()) return 0;
    int total = 0;
    for (const HandRanking& ranking : rankings()) {
        total += ranking.royalty_bonus;
    }
    return total;
}

void Player::start_new_hand() {
    top_.clear();
    middle_.clear();
    bottom_.clear();
    hand_cards_.clear();
    placed_this_round_ = false;
    if (status_ != PlayerStatus::ELIMINATED) {
        status_ = fantasy_land_.is_active ? PlayerStatus::FANTASY_LAND : PlayerStatus::ACTIVE;
    }
}

void Player::enter_fantasy_land(int round, int card_count) {
    fantasy_land_ = fantasy_land_.enter_fantasy_land(round, card_count);
    if (status_ == PlayerStatus::ACTIVE) {
        status_ = PlayerStatus::FANTASY_LAND;
    }
}

void Player::exit_fantasy_land() {
    if (fantasy_land_.is_active) {
        hand_cards_.clear();
    }
    if (status_ == PlayerStatus::FANTASY_LAND) {
        status_ = PlayerStatus::ACTIVE;
    }
    fantasy_land_ = fantasy_land_.exit_fantasy_land();
}

bool Player::holds(Card card) const {
    return std::find(hand_cards_.begin(), hand_cards_.end(), card) != hand_cards_.end();
}

bool Player::owns(Card card) const {
    if (holds(card)) return true;
    for (Row r : ALL_ROWS) {
        const CardList& cards = row(r);
        if (std::find(cards.begin(), cards.end(), card) != cards.end()) return true;
    }
    return false;
}

} // namespace ofc
