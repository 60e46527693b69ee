#include <gtest/gtest.h>
#include "ofc/hand_eval.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>
#include <vector>

using namespace ofc;

namespace {

HandRanking eval5(const HandEvaluator& evaluator, const char* cards, Row row = Row::BOTTOM) {
    return evaluator.evaluate(parse_cards(cards), row);
}

} // namespace

// =============================================================================
// Classification
// =============================================================================

TEST(HandEvalTest, HighCard) {
    HandEvaluator evaluator;
    auto eval = evaluator.evaluate(parse_cards("2c 5d 7h 9s Kc"));
    EXPECT_EQ(eval.hand_type, HandType::HIGH_CARD);
    EXPECT_EQ(eval.primary_rank(), 13);
}

TEST(HandEvalTest, Pair) {
    HandEvaluator evaluator;
    auto eval = evaluator.evaluate(parse_cards("Kc Kd 2h 5s 9c"));
    EXPECT_EQ(eval.hand_type, HandType::PAIR);
    EXPECT_EQ(eval.tiebreak_key, (TiebreakKey{13, 9, 5, 2, 0}));
}

TEST(HandEvalTest, TwoPair) {
    HandEvaluator evaluator;
    auto eval = evaluator.evaluate(parse_cards("Kc Kd 5h 5s 2c"));
    EXPECT_EQ(eval.hand_type, HandType::TWO_PAIR);
    EXPECT_EQ(eval.tiebreak_key, (TiebreakKey{13, 5, 2, 0, 0}));
}

TEST(HandEvalTest, ThreeOfAKind) {
    HandEvaluator evaluator;
    EXPECT_EQ(evaluator.evaluate(parse_cards("Kc Kd Kh 2s 5c")).hand_type, HandType::THREE_OF_A_KIND);
}

TEST(HandEvalTest, Straight) {
    HandEvaluator evaluator;
    auto eval = evaluator.evaluate(parse_cards("5c 6d 7h 8s 9c"));
    EXPECT_EQ(eval.hand_type, HandType::STRAIGHT);
    EXPECT_EQ(eval.primary_rank(), 9);
}

TEST(HandEvalTest, StraightWheel) {
    HandEvaluator evaluator;
    auto wheel = evaluator.evaluate(parse_cards("Ac 2d 3h 4s 5c"));
    EXPECT_EQ(wheel.hand_type, HandType::STRAIGHT);
    EXPECT_EQ(wheel.primary_rank(), 5);

    // The wheel is the lowest straight
    auto six_high = evaluator.evaluate(parse_cards("2c 3d 4h 5s 6c"));
    EXPECT_LT(wheel.strength_value, six_high.strength_value);
}

TEST(HandEvalTest, AceDoesNotWrapAround) {
    HandEvaluator evaluator;
    EXPECT_EQ(evaluator.evaluate(parse_cards("Qc Kd Ah 2s 3c")).hand_type, HandType::HIGH_CARD);
}

TEST(HandEvalTest, Flush) {
    HandEvaluator evaluator;
    EXPECT_EQ(evaluator.evaluate(parse_cards("2h 5h 9h Jh Kh")).hand_type, HandType::FLUSH);
}

TEST(HandEvalTest, FullHouse) {
    HandEvaluator evaluator;
    auto eval = evaluator.evaluate(parse_cards("5s 5h 5c 2d 2s"));
    EXPECT_EQ(eval.hand_type, HandType::FULL_HOUSE);
    EXPECT_EQ(eval.tiebreak_key, (TiebreakKey{5, 2, 0, 0, 0}));
}

TEST(HandEvalTest, FourOfAKind) {
    HandEvaluator evaluator;
    EXPECT_EQ(evaluator.evaluate(parse_cards("9c 9d 9h 9s Ac")).hand_type, HandType::FOUR_OF_A_KIND);
}

TEST(HandEvalTest, StraightFlushAndRoyal) {
    HandEvaluator evaluator;
    auto sf = evaluator.evaluate(parse_cards("5d 6d 7d 8d 9d"));
    EXPECT_EQ(sf.hand_type, HandType::STRAIGHT_FLUSH);
    EXPECT_FALSE(sf.is_royal_flush());

    auto royal = evaluator.evaluate(parse_cards("Ts Js Qs Ks As"));
    EXPECT_EQ(royal.hand_type, HandType::STRAIGHT_FLUSH);
    EXPECT_TRUE(royal.is_royal_flush());

    auto steel_wheel = evaluator.evaluate(parse_cards("Ah 2h 3h 4h 5h"));
    EXPECT_EQ(steel_wheel.hand_type, HandType::STRAIGHT_FLUSH);
    EXPECT_EQ(steel_wheel.primary_rank(), 5);
}

TEST(HandEvalTest, ThreeCardSets) {
    HandEvaluator evaluator;
    EXPECT_EQ(evaluator.evaluate(parse_cards("Kh Qc Jd")).hand_type, HandType::HIGH_CARD);
    EXPECT_EQ(evaluator.evaluate(parse_cards("Qh Qd Kc")).hand_type, HandType::PAIR);
    EXPECT_EQ(evaluator.evaluate(parse_cards("7h 7d 7c")).hand_type, HandType::THREE_OF_A_KIND);

    // No straights or flushes with three cards
    EXPECT_EQ(evaluator.evaluate(parse_cards("Ah Kh Qh")).hand_type, HandType::HIGH_CARD);
    EXPECT_EQ(evaluator.evaluate(parse_cards("Qh Jd Tc")).hand_type, HandType::HIGH_CARD);
}

TEST(HandEvalTest, RejectsMalformedInput) {
    HandEvaluator evaluator;
    EXPECT_THROW(evaluator.evaluate(parse_cards("As Kd Qh Jc")), std::invalid_argument);
    EXPECT_THROW(evaluator.evaluate(CardList{}), std::invalid_argument);
    EXPECT_THROW(evaluator.evaluate(parse_cards("As As Kd")), std::invalid_argument);
    EXPECT_THROW(evaluator.evaluate(CardList{0, 1, INVALID_CARD}), std::invalid_argument);
}

TEST(HandEvalTest, DescribeNamesHands) {
    HandEvaluator evaluator;
    EXPECT_EQ(describe(evaluator.evaluate(parse_cards("As Ah Kc"))), "Pair of Aces");
    EXPECT_EQ(describe(evaluator.evaluate(parse_cards("Ac 2d 3h 4s 5c"))), "Straight (5 High)");
    EXPECT_EQ(describe(evaluator.evaluate(parse_cards("Ts Js Qs Ks As"))), "Royal Flush");
    EXPECT_EQ(describe(evaluator.evaluate(parse_cards("5s 5h 5c 2d 2s"))), "Fives full of Twos");
    EXPECT_STREQ(hand_type_name(HandType::FULL_HOUSE), "Full House");
}

// =============================================================================
// Strength ordering
// =============================================================================

TEST(HandEvalTest, TenDistinctStraights) {
    HandEvaluator evaluator;
    std::set<int> strengths;

    // Wheel plus straights topped by 6 through Ace; suits rotate so none is a flush
    for (int high = 3; high <= RANK_ACE; ++high) {
        CardList cards;
        for (int i = 0; i < 5; ++i) {
            int rank = high - 4 + i;
            if (rank < 0) rank += NUM_RANKS;  // Ace below the deuce
            cards.push_back(make_card(rank, i % NUM_SUITS));
        }
        auto eval = evaluator.evaluate(cards);
        EXPECT_EQ(eval.hand_type, HandType::STRAIGHT) << cards_to_string(cards);
        strengths.insert(eval.strength_value);
    }
    EXPECT_EQ(strengths.size(), 10u);
}

TEST(HandEvalTest, KickersBreakTies) {
    HandEvaluator evaluator;
    auto aces_king = evaluator.evaluate(parse_cards("As Ah Kc 4d 2s"));
    auto aces_queen = evaluator.evaluate(parse_cards("Ad Ac Qh 4s 3c"));
    EXPECT_GT(aces_king.strength_value, aces_queen.strength_value);

    // Suits never matter outside flushes
    auto same = evaluator.evaluate(parse_cards("Ad Ac Kd 4c 2h"));
    EXPECT_EQ(HandEvaluator::compare(aces_king, same), 0);
}

TEST(HandEvalTest, ThreeAndFiveCardSetsShareOneScale) {
    HandEvaluator evaluator;
    auto top_pair = evaluator.evaluate(parse_cards("2c 2d 3h"));
    auto middle_high = evaluator.evaluate(parse_cards("Ah Kd Qc Js 9h"));
    EXPECT_GT(top_pair.strength_value, middle_high.strength_value);

    auto top_aces = evaluator.evaluate(parse_cards("As Ah Kc"));
    auto middle_aces = evaluator.evaluate(parse_cards("Ad Ac Kd 3h 2s"));
    EXPECT_LT(top_aces.strength_value, middle_aces.strength_value);
}

TEST(HandEvalTest, CompareIsAntisymmetricAndTransitive) {
    HandEvaluator evaluator;
    std::vector<HandRanking> hands = {
        evaluator.evaluate(parse_cards("2c 5d 7h 9s Kc")),
        evaluator.evaluate(parse_cards("Kh Qc Jd")),
        evaluator.evaluate(parse_cards("Qh Qd Kc")),
        evaluator.evaluate(parse_cards("Kc Kd 5h 5s 2c")),
        evaluator.evaluate(parse_cards("7h 7d 7c")),
        evaluator.evaluate(parse_cards("Ac 2d 3h 4s 5c")),
        evaluator.evaluate(parse_cards("2h 5h 9h Jh Kh")),
        evaluator.evaluate(parse_cards("5s 5h 5c 2d 2s")),
        evaluator.evaluate(parse_cards("9c 9d 9h 9s Ac")),
        evaluator.evaluate(parse_cards("Ts Js Qs Ks As")),
    };

    for (const auto& a : hands) {
        for (const auto& b : hands) {
            EXPECT_EQ(HandEvaluator::compare(a, b), -HandEvaluator::compare(b, a));
            for (const auto& c : hands) {
                if (HandEvaluator::compare(a, b) > 0 && HandEvaluator::compare(b, c) > 0) {
                    EXPECT_GT(HandEvaluator::compare(a, c), 0);
                }
            }
        }
    }

    std::vector<HandRanking> sorted = hands;
    std::sort(sorted.begin(), sorted.end());
    EXPECT_EQ(sorted.back().hand_type, HandType::STRAIGHT_FLUSH);
    EXPECT_EQ(sorted.front().hand_type, HandType::HIGH_CARD);
}

// =============================================================================
// Royalties
// =============================================================================

TEST(RoyaltyTest, TopRow) {
    HandEvaluator evaluator;
    auto top = [&](const char* cards) {
        return evaluator.evaluate(parse_cards(cards), Row::TOP).royalty_bonus;
    };
    EXPECT_EQ(top("Ah Kd Qc"), 0);
    EXPECT_EQ(top("5h 5d Ac"), 0);
    EXPECT_EQ(top("6h 6d 2c"), 1);
    EXPECT_EQ(top("Qh Qd Kc"), 7);
    EXPECT_EQ(top("Ah Ad Kc"), 9);
    EXPECT_EQ(top("2h 2d 2c"), 10);
    EXPECT_EQ(top("Ah Ad Ac"), 22);
}

TEST(RoyaltyTest, MiddleRow) {
    HandEvaluator evaluator;
    EXPECT_EQ(eval5(evaluator, "Kc Kd 5h 5s 2c", Row::MIDDLE).royalty_bonus, 0);
    EXPECT_EQ(eval5(evaluator, "Kc Kd Kh 2s 5c", Row::MIDDLE).royalty_bonus, 2);
    EXPECT_EQ(eval5(evaluator, "5c 6d 7h 8s 9c", Row::MIDDLE).royalty_bonus, 4);
    EXPECT_EQ(eval5(evaluator, "2h 5h 9h Jh Kh", Row::MIDDLE).royalty_bonus, 8);
    EXPECT_EQ(eval5(evaluator, "5s 5h 5c 2d 2s", Row::MIDDLE).royalty_bonus, 12);
    EXPECT_EQ(eval5(evaluator, "9c 9d 9h 9s Ac", Row::MIDDLE).royalty_bonus, 20);
    EXPECT_EQ(eval5(evaluator, "5d 6d 7d 8d 9d", Row::MIDDLE).royalty_bonus, 30);
    EXPECT_EQ(eval5(evaluator, "Ts Js Qs Ks As", Row::MIDDLE).royalty_bonus, 50);
}

TEST(RoyaltyTest, BottomRow) {
    HandEvaluator evaluator;
    EXPECT_EQ(eval5(evaluator, "Kc Kd Kh 2s 5c").royalty_bonus, 0);
    EXPECT_EQ(eval5(evaluator, "Ac 2d 3h 4s 5c").royalty_bonus, 2);
    EXPECT_EQ(eval5(evaluator, "2h 5h 9h Jh Kh").royalty_bonus, 4);
    EXPECT_EQ(eval5(evaluator, "5s 5h 5c 2d 2s").royalty_bonus, 6);
    EXPECT_EQ(eval5(evaluator, "9c 9d 9h 9s Ac").royalty_bonus, 10);
    EXPECT_EQ(eval5(evaluator, "5d 6d 7d 8d 9d").royalty_bonus, 15);
    EXPECT_EQ(eval5(evaluator, "Ts Js Qs Ks As").royalty_bonus, 25);
}

TEST(RoyaltyTest, FlatScheme) {
    HandEvaluator evaluator(RoyaltyScheme::FLAT);
    EXPECT_EQ(evaluator.evaluate(parse_cards("Ah Ad Ac"), Row::TOP).royalty_bonus, 10);
    EXPECT_EQ(evaluator.evaluate(parse_cards("2h 2d 2c"), Row::TOP).royalty_bonus, 10);
    EXPECT_EQ(evaluator.evaluate(parse_cards("Ah Ad Kc"), Row::TOP).royalty_bonus, 9);
    EXPECT_EQ(eval5(evaluator, "Kc Kd Kh 2s 5c", Row::MIDDLE).royalty_bonus, 0);
    EXPECT_EQ(eval5(evaluator, "5c 6d 7h 8s 9c", Row::MIDDLE).royalty_bonus, 2);
    EXPECT_EQ(eval5(evaluator, "Ts Js Qs Ks As", Row::MIDDLE).royalty_bonus, 25);
}

TEST(RoyaltyTest, CardCountMustFitRow) {
    HandEvaluator evaluator;
    auto five = evaluator.evaluate(parse_cards("9c 9d 9h 9s Ac"));
    EXPECT_EQ(evaluator.royalty_bonus(five, Row::TOP), 0);
    auto three = evaluator.evaluate(parse_cards("Ah Ad Ac"));
    EXPECT_EQ(evaluator.royalty_bonus(three, Row::BOTTOM), 0);
}

TEST(RoyaltyTest, MonotonicWithinRow) {
    HandEvaluator evaluator;

    // Every 3-card pair and trips, ordered by strength
    std::vector<HandRanking> tops;
    for (int r = 0; r < NUM_RANKS; ++r) {
        int kicker = r == 0 ? 1 : 0;
        tops.push_back(evaluator.evaluate({make_card(r, 0), make_card(r, 1), make_card(kicker, 2)},
                                          Row::TOP));
        tops.push_back(evaluator.evaluate({make_card(r, 0), make_card(r, 1), make_card(r, 2)},
                                          Row::TOP));
    }
    std::sort(tops.begin(), tops.end());
    for (size_t i = 1; i < tops.size(); ++i) {
        EXPECT_LE(tops[i - 1].royalty_bonus, tops[i].royalty_bonus);
    }

    std::vector<const char*> ladder = {
        "2c 5d 7h 9s Kc", "Kc Kd 2h 5s 9c", "Kc Kd 5h 5s 2c", "Kc Kd Kh 2s 5c",
        "Ac 2d 3h 4s 5c", "Tc Jd Qh Ks Ac", "2h 5h 9h Jh Kh", "5s 5h 5c 2d 2s",
        "9c 9d 9h 9s Ac", "5d 6d 7d 8d 9d", "Ts Js Qs Ks As",
    };
    for (Row row : {Row::MIDDLE, Row::BOTTOM}) {
        int previous = 0;
        for (const char* cards : ladder) {
            int royalty = eval5(evaluator, cards, row).royalty_bonus;
            EXPECT_GE(royalty, previous) << cards << " in " << row_name(row);
            previous = royalty;
        }
    }
}

// =============================================================================
// Progression and fouling
// =============================================================================

TEST(ProgressionTest, ValidLayout) {
    HandEvaluator evaluator;
    EXPECT_TRUE(evaluator.validate_ofc_progression(parse_cards("Kh Qc Jd"),
                                                   parse_cards("As Ah 9c 8d 7s"),
                                                   parse_cards("5s 5h 5c 2d 2s")));
    EXPECT_FALSE(evaluator.is_fouled_hand(parse_cards("Kh Qc Jd"),
                                          parse_cards("As Ah 9c 8d 7s"),
                                          parse_cards("5s 5h 5c 2d 2s")));
}

TEST(ProgressionTest, TopBeatsMiddleFouls) {
    HandEvaluator evaluator;
    EXPECT_TRUE(evaluator.is_fouled_hand(parse_cards("As Ah Kc"),
                                         parse_cards("Kh Qd Jc 9s 8h"),
                                         parse_cards("2c 2d 2h 7c 7d")));
}

TEST(ProgressionTest, MiddleBeatsBottomFouls) {
    HandEvaluator evaluator;
    EXPECT_TRUE(evaluator.is_fouled_hand(parse_cards("2c 3d 4h"),
                                         parse_cards("5s 5h 5c 2d 2s"),
                                         parse_cards("Ac 2h 3s 4c 5d")));
}

TEST(ProgressionTest, EqualRowsFoul) {
    HandEvaluator evaluator;
    EXPECT_TRUE(evaluator.is_fouled_hand(parse_cards("2c 3d 4h"),
                                         parse_cards("Kh Qd Jc 9s 8h"),
                                         parse_cards("Kd Qc Jh 9d 8s")));
}

TEST(ProgressionTest, IncompleteLayouts) {
    HandEvaluator evaluator;
    CardList top = parse_cards("As Ah Kc");
    CardList middle = parse_cards("Kh Qd Jc 9s");
    CardList bottom = parse_cards("2c 2d 2h 7c 7d");
    EXPECT_FALSE(evaluator.validate_ofc_progression(top, middle, bottom));
    EXPECT_FALSE(evaluator.is_fouled_hand(top, middle, bottom));
}

TEST(ProgressionTest, ClassifyPartial) {
    EXPECT_EQ(HandEvaluator::classify_partial({}), HandType::HIGH_CARD);
    EXPECT_EQ(HandEvaluator::classify_partial(parse_cards("As")), HandType::HIGH_CARD);
    EXPECT_EQ(HandEvaluator::classify_partial(parse_cards("As Ah")), HandType::PAIR);
    EXPECT_EQ(HandEvaluator::classify_partial(parse_cards("As Ah Kd Kc")), HandType::TWO_PAIR);
    EXPECT_EQ(HandEvaluator::classify_partial(parse_cards("As Ah Ad")), HandType::THREE_OF_A_KIND);
    EXPECT_EQ(HandEvaluator::classify_partial(parse_cards("As Ah Ad Kc Kd")), HandType::FULL_HOUSE);
    EXPECT_EQ(HandEvaluator::classify_partial(parse_cards("As Ah Ad Ac")), HandType::FOUR_OF_A_KIND);
    // Draws are not made hands
    EXPECT_EQ(HandEvaluator::classify_partial(parse_cards("2h 5h 9h Jh")), HandType::HIGH_CARD);
}
