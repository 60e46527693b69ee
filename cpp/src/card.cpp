/**
 * @file card.cpp
 * @brief Implementation of card utilities and deck management.
 *
 * Provides:
 *   - Rank/suit symbol conversion and card-string parsing
 *   - Deck shuffling using std::mt19937_64 for determinism
 *   - Card drawing and discard tracking
 */

#include "../include/ofc/card.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace ofc {

namespace {

const char* const RANK_SYMBOLS = "23456789TJQKA";
const char* const SUIT_LETTERS = "cdhs";

int rank_from_symbol(char symbol) {
    char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(symbol)));
    for (int r = 0; r < NUM_RANKS; ++r) {
        if (RANK_SYMBOLS[r] == upper) return r;
    }
    return -1;
}

int suit_from_letter(char letter) {
    char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(letter)));
    for (int s = 0; s < NUM_SUITS; ++s) {
        if (SUIT_LETTERS[s] == lower) return s;
    }
    return -1;
}

} // anonymous namespace

const char* get_rank_name(int rank) {
    static const char* names[] = {
        "2", "3", "4", "5", "6", "7", "8", "9", "T", "J", "Q", "K", "A"
    };
    return (rank >= 0 && rank < NUM_RANKS) ? names[rank] : "?";
}

const char* get_suit_name(int suit) {
    static const char* names[] = {"♣", "♦", "♥", "♠"};
    return (suit >= 0 && suit < NUM_SUITS) ? names[suit] : "?";
}

std::string card_to_string(Card card) {
    if (!is_valid_card(card)) return "??";
    std::string out;
    out += RANK_SYMBOLS[get_rank(card)];
    out += SUIT_LETTERS[get_suit(card)];
    return out;
}

std::string cards_to_string(const CardList& cards) {
    std::string out;
    for (size_t i = 0; i < cards.size(); ++i) {
        if (i > 0) out += ' ';
        out += card_to_string(cards[i]);
    }
    return out;
}

Card parse_card(const std::string& text) {
    std::string token = text;
    // "10h" is a common alternative spelling of "Th"
    if (token.size() == 3 && token[0] == '1' && token[1] == '0') {
        token = "T" + token.substr(2);
    }
    if (token.size() != 2) {
        throw std::invalid_argument("Card string must be 2 characters, got: '" + text + "'");
    }
    int rank = rank_from_symbol(token[0]);
    if (rank < 0) {
        throw std::invalid_argument("Invalid rank symbol in card: '" + text + "'");
    }
    int suit = suit_from_letter(token[1]);
    if (suit < 0) {
        throw std::invalid_argument("Invalid suit symbol in card: '" + text + "'");
    }
    return make_card(rank, suit);
}

CardList parse_cards(const std::string& text) {
    CardList cards;
    std::istringstream in(text);
    std::string token;
    while (in >> token) {
        cards.push_back(parse_card(token));
    }
    return cards;
}

bool has_duplicates(const CardList& cards) {
    std::array<bool, DECK_SIZE> seen = {};
    for (Card c : cards) {
        if (!is_valid_card(c)) continue;
        if (seen[c]) return true;
        seen[c] = true;
    }
    return false;
}

Deck::Deck() : draw_idx_(0) {
    deck_.reserve(DECK_SIZE);
    discard_pile_.reserve(DECK_SIZE);
}

void Deck::reset(uint64_t seed) {
    deck_.clear();
    discard_pile_.clear();
    draw_idx_ = 0;

    for (int i = 0; i < DECK_SIZE; ++i) {
        deck_.push_back(static_cast<Card>(i));
    }

    rng_.seed(seed);
    std::shuffle(deck_.begin(), deck_.end(), rng_);
}

Card Deck::draw() {
    if (is_empty()) {
        return INVALID_CARD;
    }
    return deck_[draw_idx_++];
}

CardList Deck::deal(int count) {
    CardList cards;
    cards.reserve(count);
    for (int i = 0; i < count && !is_empty(); ++i) {
        cards.push_back(draw());
    }
    return cards;
}

void Deck::discard(Card card) {
    discard_pile_.push_back(card);
}

CardList Deck::remaining_cards() const {
    return CardList(deck_.begin() + draw_idx_, deck_.end());
}

} // namespace ofc
