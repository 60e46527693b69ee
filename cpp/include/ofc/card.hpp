/**
 * @file card.hpp
 * @brief Card codes, the OFC deck, and text conversion for cards.
 *
 * A card is one byte holding rank * 4 + suit. The evaluator, player rows
 * and the deck all share this code, so cards are passed around by value.
 *
 *   | Field | Values                                          |
 *   |-------|-------------------------------------------------|
 *   | rank  | 0 (deuce) .. 8 (ten) .. 12 (ace)                |
 *   | suit  | 0 clubs, 1 diamonds, 2 hearts, 3 spades         |
 *
 * So "2c" is 0 and "As" is 51. Text form is rank symbol + suit letter
 * ("As", "Td", "2c").
 */

#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace ofc {

/** @brief One card, 0-51 (see file header for the layout of the code). */
using Card = uint8_t;

/** @brief A sequence of cards (a row, a hand pool, a deal). */
using CardList = std::vector<Card>;

constexpr int NUM_RANKS = 13;
constexpr int NUM_SUITS = 4;
constexpr int DECK_SIZE = 52;

/** @brief Returned by Deck::draw() on an empty deck; never a real card. */
constexpr Card INVALID_CARD = 255;

/** @brief Rank indices the rules refer to by name */
constexpr int RANK_SIX = 4;
constexpr int RANK_QUEEN = 10;
constexpr int RANK_KING = 11;
constexpr int RANK_ACE = 12;

/** @brief Rank index 0-12 of a card code. */
inline int get_rank(Card card) { return card / NUM_SUITS; }

/** @brief Suit index 0-3 of a card code. */
inline int get_suit(Card card) { return card % NUM_SUITS; }

/** @brief Card code for a rank index and suit index (no range check). */
inline Card make_card(int rank, int suit) {
    return static_cast<Card>(rank * NUM_SUITS + suit);
}

/** @brief True for codes 0-51. */
inline bool is_valid_card(Card card) { return card < DECK_SIZE; }

/**
 * @brief Poker value of a rank index (2-14, Ace high).
 *
 * Used for tiebreak keys, where 0 is reserved as padding.
 */
constexpr int rank_value(int rank) { return rank + 2; }

/** @brief Rank symbol "2".."9", "T", "J", "Q", "K", "A"; "?" out of range. */
const char* get_rank_name(int rank);

/** @brief Suit glyph for display output. */
const char* get_suit_name(int suit);

/**
 * @brief Format a card as its two-character code.
 * @return e.g. "As", "Td"; "??" for INVALID_CARD
 */
std::string card_to_string(Card card);

/** @brief Space-separated card codes. */
std::string cards_to_string(const CardList& cards);

/**
 * @brief Parse a two-character card code (case-insensitive suit).
 * @param text e.g. "As", "kh", "10d" is also accepted for tens
 * @throws std::invalid_argument on malformed input
 */
Card parse_card(const std::string& text);

/**
 * @brief Parse whitespace-separated card codes.
 * @throws std::invalid_argument if any token is malformed
 */
CardList parse_cards(const std::string& text);

/** @brief True if any card code appears more than once. */
bool has_duplicates(const CardList& cards);

/**
 * @brief A 52-card OFC deck with deterministic shuffling and a discard pile.
 *
 * Uses std::mt19937_64 so identical seeds produce identical deals across
 * platforms. Unlike draw-poker decks, discards never return to play: in
 * Pineapple they are burned for the rest of the hand.
 *
 * Usage:
 * @code
 *   Deck deck;
 *   deck.reset(42);
 *   CardList initial = deck.deal(5);
 *   Card c = deck.draw();
 *   deck.discard(c);
 * @endcode
 */
class Deck {
public:
    /** @brief Empty until reset() is called. */
    Deck();

    /**
     * @brief Refill with all 52 cards, clear the discards and shuffle.
     * @param seed Shuffle seed; a game replays exactly from the same seed
     */
    void reset(uint64_t seed);

    /** @brief Next card, or INVALID_CARD once the deck is exhausted. */
    Card draw();

    /**
     * @brief Draw @p count cards.
     * @return The drawn cards; shorter than @p count if the deck runs out
     */
    CardList deal(int count);

    /** @brief Record a card as burned for the rest of the hand. */
    void discard(Card card);

    bool is_empty() const { return draw_idx_ >= static_cast<int>(deck_.size()); }

    int remaining() const { return static_cast<int>(deck_.size()) - draw_idx_; }

    /** @brief Undealt cards in draw order. */
    CardList remaining_cards() const;

    /** @brief Cards discarded so far, in discard order. */
    const CardList& discarded() const { return discard_pile_; }

private:
    CardList deck_;          ///< All 52 cards in shuffled order
    CardList discard_pile_;  ///< Burned cards (Pineapple discards, FL leftovers)
    int draw_idx_;           ///< Position of the next card in deck_
    std::mt19937_64 rng_;
};

} // namespace ofc
