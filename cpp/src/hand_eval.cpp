/**
 * @file hand_eval.cpp
 * @brief Implementation of OFC hand evaluation and royalties.
 *
 * Hand Evaluation Algorithm:
 *   1. Count rank and suit frequencies
 *   2. Group ranks by (count desc, rank desc); the group order is also the
 *      tiebreak key for every non-straight hand
 *   3. Match against hand types in descending strength order
 *
 * Straight Detection:
 *   - Normal straights: 5 consecutive ranks (e.g., 5-6-7-8-9)
 *   - Wheel straight: A-2-3-4-5 where Ace acts as low card (high card is 5)
 *
 * Royalty Tables (standard scheme):
 *   | Hand            | Middle | Bottom |
 *   |-----------------|--------|--------|
 *   | Three of a Kind | 2      | 0      |
 *   | Straight        | 4      | 2      |
 *   | Flush           | 8      | 4      |
 *   | Full House      | 12     | 6      |
 *   | Four of a Kind  | 20     | 10     |
 *   | Straight Flush  | 30     | 15     |
 *   | Royal Flush     | 50     | 25     |
 *
 *   Top: 66=1 ... AA=9, 222=10 ... AAA=22.
 */

#include "../include/ofc/hand_eval.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace ofc {

const char* hand_type_name(HandType type) {
    static const char* names[] = {
        "High Card", "Pair", "Two Pair", "Three of a Kind",
        "Straight", "Flush", "Full House", "Four of a Kind", "Straight Flush"
    };
    return names[static_cast<int>(type)];
}

namespace {

struct FiveCardRoyalties {
    int trips;
    int straight;
    int flush;
    int full_house;
    int quads;
    int straight_flush;
    int royal_flush;
};

const FiveCardRoyalties BOTTOM_ROYALTIES = {0, 2, 4, 6, 10, 15, 25};
const FiveCardRoyalties MIDDLE_ROYALTIES = {2, 4, 8, 12, 20, 30, 50};

int five_card_royalty(const FiveCardRoyalties& table, const HandRanking& ranking) {
    switch (ranking.hand_type) {
        case HandType::THREE_OF_A_KIND: return table.trips;
        case HandType::STRAIGHT:        return table.straight;
        case HandType::FLUSH:           return table.flush;
        case HandType::FULL_HOUSE:      return table.full_house;
        case HandType::FOUR_OF_A_KIND:  return table.quads;
        case HandType::STRAIGHT_FLUSH:
            return ranking.is_royal_flush() ? table.royal_flush : table.straight_flush;
        default:                        return 0;
    }
}

// Top pays from 66 (index 4) upward; trips pay from 222.
int top_royalty(RoyaltyScheme scheme, const HandRanking& ranking) {
    int rank = ranking.primary_rank() - 2;
    if (ranking.hand_type == HandType::THREE_OF_A_KIND) {
        return scheme == RoyaltyScheme::FLAT ? 10 : 10 + rank;
    }
    if (ranking.hand_type == HandType::PAIR && rank >= RANK_SIX) {
        return rank - 3;
    }
    return 0;
}

std::array<int, NUM_RANKS> count_ranks(const CardList& cards) {
    std::array<int, NUM_RANKS> counts = {};
    for (Card c : cards) {
        counts[get_rank(c)]++;
    }
    return counts;
}

// (count, rank) pairs, strongest group first
std::vector<std::pair<int, int>> rank_groups(const std::array<int, NUM_RANKS>& counts) {
    std::vector<std::pair<int, int>> groups;
    for (int r = 0; r < NUM_RANKS; ++r) {
        if (counts[r] > 0) groups.emplace_back(counts[r], r);
    }
    std::sort(groups.rbegin(), groups.rend());
    return groups;
}

bool is_flush(const CardList& cards) {
    if (cards.size() != 5) return false;
    int suit = get_suit(cards[0]);
    for (Card c : cards) {
        if (get_suit(c) != suit) return false;
    }
    return true;
}

// High card value of a 5-card straight (5 for the wheel), or 0
int straight_high(const std::array<int, NUM_RANKS>& counts, size_t card_count) {
    if (card_count != 5) return 0;
    std::vector<int> ranks;
    for (int r = 0; r < NUM_RANKS; ++r) {
        if (counts[r] == 1) ranks.push_back(r);
    }
    if (ranks.size() != 5) return 0;

    if (ranks[0] == 0 && ranks[1] == 1 && ranks[2] == 2 && ranks[3] == 3 && ranks[4] == RANK_ACE) {
        return rank_value(3);
    }
    if (ranks[4] - ranks[0] == 4) {
        return rank_value(ranks[4]);
    }
    return 0;
}

int encode_strength(HandType type, const TiebreakKey& key) {
    int value = 0;
    for (int k : key) {
        value = value * 15 + k;
    }
    return static_cast<int>(type) * STRENGTH_TYPE_STRIDE + value;
}

void check_input(const CardList& cards) {
    if (cards.size() != 3 && cards.size() != 5) {
        throw std::invalid_argument("Hand must have 3 or 5 cards, got " +
                                    std::to_string(cards.size()));
    }
    for (Card c : cards) {
        if (!is_valid_card(c)) {
            throw std::invalid_argument("Invalid card code " + std::to_string(static_cast<int>(c)));
        }
    }
    if (has_duplicates(cards)) {
        throw std::invalid_argument("Hand contains duplicate cards: " + cards_to_string(cards));
    }
}

const char* plural_rank_name(int value) {
    static const char* names[] = {
        "Twos", "Threes", "Fours", "Fives", "Sixes", "Sevens", "Eights",
        "Nines", "Tens", "Jacks", "Queens", "Kings", "Aces"
    };
    return (value >= 2 && value <= 14) ? names[value - 2] : "?";
}

} // anonymous namespace

std::string describe(const HandRanking& ranking) {
    const TiebreakKey& k = ranking.tiebreak_key;
    switch (ranking.hand_type) {
        case HandType::HIGH_CARD:
            return std::string(get_rank_name(k[0] - 2)) + " High";
        case HandType::PAIR:
            return std::string("Pair of ") + plural_rank_name(k[0]);
        case HandType::TWO_PAIR:
            return std::string(plural_rank_name(k[0])) + " and " + plural_rank_name(k[1]);
        case HandType::THREE_OF_A_KIND:
            return std::string("Three ") + plural_rank_name(k[0]);
        case HandType::STRAIGHT:
            return std::string("Straight (") + get_rank_name(k[0] - 2) + " High)";
        case HandType::FLUSH:
            return std::string("Flush (") + get_rank_name(k[0] - 2) + " High)";
        case HandType::FULL_HOUSE:
            return std::string(plural_rank_name(k[0])) + " full of " + plural_rank_name(k[1]);
        case HandType::FOUR_OF_A_KIND:
            return std::string("Four ") + plural_rank_name(k[0]);
        case HandType::STRAIGHT_FLUSH:
            if (ranking.is_royal_flush()) return "Royal Flush";
            return std::string("Straight Flush (") + get_rank_name(k[0] - 2) + " High)";
    }
    return hand_type_name(ranking.hand_type);
}

HandEvaluator::HandEvaluator(RoyaltyScheme scheme) : scheme_(scheme) {}

HandRanking HandEvaluator::evaluate(const CardList& cards) const {
    return evaluate(cards, cards.size() == 3 ? Row::TOP : Row::BOTTOM);
}

HandRanking HandEvaluator::evaluate(const CardList& cards, Row row) const {
    check_input(cards);

    auto counts = count_ranks(cards);
    auto groups = rank_groups(counts);
    bool flush = is_flush(cards);
    int high = straight_high(counts, cards.size());

    HandRanking result;
    result.card_count = static_cast<int>(cards.size());
    for (size_t i = 0; i < groups.size(); ++i) {
        result.tiebreak_key[i] = rank_value(groups[i].second);
    }

    int top_count = groups[0].first;
    int second_count = groups.size() > 1 ? groups[1].first : 0;

    if (high > 0 && flush) {
        result.hand_type = HandType::STRAIGHT_FLUSH;
        result.tiebreak_key = {high, 0, 0, 0, 0};
    } else if (top_count == 4) {
        result.hand_type = HandType::FOUR_OF_A_KIND;
    } else if (top_count == 3 && second_count == 2) {
        result.hand_type = HandType::FULL_HOUSE;
    } else if (flush) {
        result.hand_type = HandType::FLUSH;
    } else if (high > 0) {
        result.hand_type = HandType::STRAIGHT;
        result.tiebreak_key = {high, 0, 0, 0, 0};
    } else if (top_count == 3) {
        result.hand_type = HandType::THREE_OF_A_KIND;
    } else if (top_count == 2 && second_count == 2) {
        result.hand_type = HandType::TWO_PAIR;
    } else if (top_count == 2) {
        result.hand_type = HandType::PAIR;
    } else {
        result.hand_type = HandType::HIGH_CARD;
    }

    result.strength_value = encode_strength(result.hand_type, result.tiebreak_key);
    result.royalty_bonus = royalty_bonus(result, row);
    return result;
}

int HandEvaluator::royalty_bonus(const HandRanking& ranking, Row row) const {
    if (row == Row::TOP) {
        if (ranking.card_count != TOP_SIZE) return 0;
        return top_royalty(scheme_, ranking);
    }
    if (ranking.card_count != MIDDLE_SIZE) return 0;
    if (row == Row::MIDDLE && scheme_ == RoyaltyScheme::STANDARD) {
        return five_card_royalty(MIDDLE_ROYALTIES, ranking);
    }
    return five_card_royalty(BOTTOM_ROYALTIES, ranking);
}

int HandEvaluator::compare(const HandRanking& a, const HandRanking& b) {
    if (a.strength_value == b.strength_value) return 0;
    return a.strength_value > b.strength_value ? 1 : -1;
}

bool HandEvaluator::validate_ofc_progression(const CardList& top, const CardList& middle,
                                             const CardList& bottom) const {
    if (static_cast<int>(top.size()) != TOP_SIZE ||
        static_cast<int>(middle.size()) != MIDDLE_SIZE ||
        static_cast<int>(bottom.size()) != BOTTOM_SIZE) {
        return false;
    }

    HandRanking top_hand = evaluate(top, Row::TOP);
    HandRanking middle_hand = evaluate(middle, Row::MIDDLE);
    HandRanking bottom_hand = evaluate(bottom, Row::BOTTOM);

    return compare(bottom_hand, middle_hand) > 0 && compare(middle_hand, top_hand) > 0;
}

bool HandEvaluator::is_fouled_hand(const CardList& top, const CardList& middle,
                                   const CardList& bottom) const {
    if (static_cast<int>(top.size()) != TOP_SIZE ||
        static_cast<int>(middle.size()) != MIDDLE_SIZE ||
        static_cast<int>(bottom.size()) != BOTTOM_SIZE) {
        return false;
    }
    return !validate_ofc_progression(top, middle, bottom);
}

HandType HandEvaluator::classify_partial(const CardList& cards) {
    if (cards.empty()) return HandType::HIGH_CARD;

    auto groups = rank_groups(count_ranks(cards));
    int top_count = groups[0].first;
    int second_count = groups.size() > 1 ? groups[1].first : 0;

    if (top_count >= 4) return HandType::FOUR_OF_A_KIND;
    if (top_count == 3 && second_count >= 2) return HandType::FULL_HOUSE;
    if (top_count == 3) return HandType::THREE_OF_A_KIND;
    if (top_count == 2 && second_count == 2) return HandType::TWO_PAIR;
    if (top_count == 2) return HandType::PAIR;
    return HandType::HIGH_CARD;
}

} // namespace ofc
