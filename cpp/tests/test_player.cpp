#include <gtest/gtest.h>
#include "ofc/player.hpp"
#include <memory>

using namespace ofc;

namespace {

// Deal and place a full layout row by row
void fill_layout(Player& player, const char* top, const char* middle, const char* bottom) {
    const char* rows[] = {top, middle, bottom};
    for (Row r : ALL_ROWS) {
        CardList cards = parse_cards(rows[static_cast<int>(r)]);
        player.receive_cards(cards);
        for (Card c : cards) {
            player.place_card(c, r);
        }
    }
}

} // namespace

TEST(PlayerTest, InitialState) {
    Player player("p1", "Alice");
    EXPECT_EQ(player.id(), "p1");
    EXPECT_EQ(player.name(), "Alice");
    EXPECT_EQ(player.status(), PlayerStatus::ACTIVE);
    EXPECT_EQ(player.placed_count(), 0);
    EXPECT_TRUE(player.hand_cards().empty());
    EXPECT_FALSE(player.is_layout_complete());
    EXPECT_TRUE(player.validate_layout());
    EXPECT_FALSE(player.in_fantasy_land());
    EXPECT_EQ(player.get_available_positions().size(), 3u);
    EXPECT_STREQ(player_status_name(player.status()), "active");
}

TEST(PlayerTest, ReceiveInitialCards) {
    Player player("p1", "Alice");
    EXPECT_THROW(player.receive_initial_cards(parse_cards("As Kd Qh")), GameStateError);

    player.receive_initial_cards(parse_cards("As Kd Qh Jc 9s"));
    EXPECT_EQ(player.hand_cards().size(), 5u);

    // A second initial deal is rejected
    EXPECT_THROW(player.receive_initial_cards(parse_cards("2s 3d 4h 5c 6s")), GameStateError);
}

TEST(PlayerTest, ReceiveCardsRejectsDuplicates) {
    Player player("p1", "Alice");
    EXPECT_THROW(player.receive_cards(parse_cards("As As")), GameStateError);

    player.receive_cards(parse_cards("As"));
    player.place_card(parse_card("As"), Row::BOTTOM);
    EXPECT_THROW(player.receive_cards(parse_cards("As")), GameStateError);
    EXPECT_THROW(player.receive_cards(CardList{INVALID_CARD}), GameStateError);
}

TEST(PlayerTest, PlaceCard) {
    Player player("p1", "Alice");
    player.receive_cards(parse_cards("As Kd"));

    EXPECT_TRUE(player.can_place_card(parse_card("As"), Row::TOP));
    EXPECT_FALSE(player.can_place_card(parse_card("Qh"), Row::TOP));

    player.place_card(parse_card("As"), Row::TOP);
    EXPECT_EQ(player.top(), parse_cards("As"));
    EXPECT_EQ(player.hand_cards(), parse_cards("Kd"));
    EXPECT_EQ(player.placed_count(), 1);
    EXPECT_TRUE(player.placed_this_round());

    player.start_new_round();
    EXPECT_FALSE(player.placed_this_round());
}

TEST(PlayerTest, PlaceCardErrors) {
    Player player("p1", "Alice");
    player.receive_cards(parse_cards("As Ah Ad Ac"));
    for (const char* c : {"As", "Ah", "Ad"}) {
        player.place_card(parse_card(c), Row::TOP);
    }

    try {
        player.place_card(parse_card("Ac"), Row::TOP);
        FAIL() << "Expected InvalidCardPlacementError";
    } catch (const InvalidCardPlacementError& e) {
        EXPECT_STREQ(e.what(), "Top Row is full");
        EXPECT_EQ(e.card(), parse_card("Ac"));
        EXPECT_EQ(e.row(), Row::TOP);
        EXPECT_EQ(e.player_id(), "p1");
    }

    try {
        player.place_card(parse_card("Kd"), Row::BOTTOM);
        FAIL() << "Expected InvalidCardPlacementError";
    } catch (const InvalidCardPlacementError& e) {
        EXPECT_STREQ(e.what(), "Card Kd is not in player p1's hand");
    }

    // Failed placements change nothing
    EXPECT_EQ(player.placed_count(), 3);
    EXPECT_EQ(player.hand_cards(), parse_cards("Ac"));
    std::vector<Row> open = player.get_available_positions();
    EXPECT_EQ(open, (std::vector<Row>{Row::MIDDLE, Row::BOTTOM}));
}

TEST(PlayerTest, DiscardCard) {
    Player player("p1", "Alice");
    player.receive_cards(parse_cards("As Kd Qh"));
    player.discard_card(parse_card("Kd"));
    EXPECT_EQ(player.hand_cards(), parse_cards("As Qh"));
    EXPECT_THROW(player.discard_card(parse_card("Kd")), InvalidCardPlacementError);
}

TEST(PlayerTest, ValidLayout) {
    Player player("p1", "Alice");
    fill_layout(player, "Kh Qc Jd", "As Ah 9c 8d 7s", "5s 5h 5c 2d 2s");

    EXPECT_TRUE(player.is_layout_complete());
    EXPECT_TRUE(player.validate_layout());
    EXPECT_FALSE(player.is_fouled());
    EXPECT_EQ(player.status(), PlayerStatus::ACTIVE);
    EXPECT_TRUE(player.get_available_positions().empty());

    auto rankings = player.rankings();
    EXPECT_EQ(rankings[0].hand_type, HandType::HIGH_CARD);
    EXPECT_EQ(rankings[1].hand_type, HandType::PAIR);
    EXPECT_EQ(rankings[2].hand_type, HandType::FULL_HOUSE);
    EXPECT_EQ(player.royalties(), 6);
}

TEST(PlayerTest, FouledLayout) {
    Player player("p1", "Alice");
    fill_layout(player, "As Ah Kc", "Kh Qd Jc 9s 8h", "2c 2d 2h 7c 7d");

    EXPECT_TRUE(player.is_layout_complete());
    EXPECT_FALSE(player.validate_layout());
    EXPECT_TRUE(player.is_fouled());
    EXPECT_STREQ(player_status_name(player.status()), "fouled");

    // Fouled hands earn no royalties even with a paying Top
    EXPECT_EQ(player.royalties(), 0);
}

TEST(PlayerTest, RankingsNeedCompleteLayout) {
    Player player("p1", "Alice");
    player.receive_cards(parse_cards("As"));
    player.place_card(parse_card("As"), Row::TOP);
    EXPECT_THROW(player.rankings(), GameStateError);
    EXPECT_EQ(player.royalties(), 0);
}

TEST(PlayerTest, HandSnapshot) {
    Player player("p1", "Alice");
    player.receive_cards(parse_cards("As Kd Qh"));
    player.place_card(parse_card("As"), Row::MIDDLE);

    HandSnapshot snap = player.hand();
    EXPECT_TRUE(snap.top.empty());
    EXPECT_EQ(snap.middle, parse_cards("As"));
    EXPECT_EQ(snap.hand_cards, parse_cards("Kd Qh"));
}

TEST(PlayerTest, FantasyLandLifecycle) {
    Player player("p1", "Alice");
    EXPECT_THROW(player.receive_fantasy_land_cards(parse_cards("As Kd")), GameStateError);

    player.enter_fantasy_land(1, 14);
    EXPECT_TRUE(player.in_fantasy_land());
    EXPECT_EQ(player.status(), PlayerStatus::FANTASY_LAND);
    EXPECT_EQ(player.fantasy_land_state().card_count, 14);

    CardList dealt = parse_cards("As Ah Kd Kc Qs Jh Td 9c 8s 7h 6d 5c 4s 3h");
    player.receive_fantasy_land_cards(dealt);
    EXPECT_EQ(player.hand_cards().size(), 14u);

    CardList leftover = player.place_fantasy_land_layout(parse_cards("Kd Kc 3h"),
                                                         parse_cards("As Ah Qs Jh 9c"),
                                                         parse_cards("8s 7h 6d 5c 4s"));
    EXPECT_EQ(leftover, parse_cards("Td"));
    EXPECT_TRUE(player.is_layout_complete());
    EXPECT_TRUE(player.hand_cards().empty());
    EXPECT_FALSE(player.is_fouled());

    player.exit_fantasy_land();
    EXPECT_FALSE(player.in_fantasy_land());
    EXPECT_EQ(player.status(), PlayerStatus::ACTIVE);
    EXPECT_EQ(player.fantasy_land_state().times_entered, 1);
}

TEST(PlayerTest, ExitFantasyLandDropsHeldCardsWhenFouled) {
    Player player("p1", "Alice");
    fill_layout(player, "As Ah Kc", "Kh Qd Jc 9s 8h", "2c 2d 2h 7c 7d");
    ASSERT_TRUE(player.is_fouled());

    // Status stays FOULED while the Fantasy Land state is active
    player.enter_fantasy_land(1, 14);
    ASSERT_EQ(player.status(), PlayerStatus::FOULED);
    player.receive_cards(parse_cards("3s 4s"));

    player.exit_fantasy_land();
    EXPECT_TRUE(player.hand_cards().empty());
    EXPECT_FALSE(player.in_fantasy_land());
    EXPECT_EQ(player.status(), PlayerStatus::FOULED);
}

TEST(PlayerTest, FantasyLandLayoutErrors) {
    Player player("p1", "Alice");
    player.enter_fantasy_land(1, 13);
    player.receive_fantasy_land_cards(parse_cards("As Ah Kd Kc Qs Jh Td 9c 8s 7h 6d 5c 4s"));

    EXPECT_THROW(player.place_fantasy_land_layout(parse_cards("Kd Kc"),
                                                  parse_cards("As Ah Qs Jh 9c"),
                                                  parse_cards("8s 7h 6d 5c 4s")),
                 InvalidCardPlacementError);
    EXPECT_THROW(player.place_fantasy_land_layout(parse_cards("Kd Kc 2h"),
                                                  parse_cards("As Ah Qs Jh 9c"),
                                                  parse_cards("8s 7h 6d 5c 4s")),
                 InvalidCardPlacementError);
    EXPECT_THROW(player.place_fantasy_land_layout(parse_cards("Kd Kc Kd"),
                                                  parse_cards("As Ah Qs Jh 9c"),
                                                  parse_cards("8s 7h 6d 5c 4s")),
                 InvalidCardPlacementError);
    EXPECT_EQ(player.placed_count(), 0);
    EXPECT_EQ(player.hand_cards().size(), 13u);
}

TEST(PlayerTest, FantasyLandLayoutCanFoul) {
    Player player("p1", "Alice");
    player.enter_fantasy_land(1, 13);
    player.receive_fantasy_land_cards(parse_cards("As Ah Ad Kc Qs Jh Td 9c 8s 7h 6d 5c 2s"));

    CardList leftover = player.place_fantasy_land_layout(parse_cards("As Ah Ad"),
                                                         parse_cards("Kc Qs Jh Td 8s"),
                                                         parse_cards("9c 7h 6d 5c 2s"));
    EXPECT_TRUE(leftover.empty());
    EXPECT_TRUE(player.is_fouled());
}

TEST(PlayerTest, StartNewHand) {
    Player player("p1", "Alice");
    fill_layout(player, "As Ah Kc", "Kh Qd Jc 9s 8h", "2c 2d 2h 7c 7d");
    ASSERT_TRUE(player.is_fouled());

    player.start_new_hand();
    EXPECT_EQ(player.status(), PlayerStatus::ACTIVE);
    EXPECT_EQ(player.placed_count(), 0);
    EXPECT_TRUE(player.hand_cards().empty());

    player.enter_fantasy_land(1, 13);
    player.start_new_hand();
    EXPECT_EQ(player.status(), PlayerStatus::FANTASY_LAND);
}

TEST(PlayerTest, ConfigureAdoptsEvaluatorAndDealSize) {
    Player player("p1", "Alice");
    EXPECT_EQ(player.initial_cards_count(), 5);
    EXPECT_EQ(player.evaluator().scheme(), RoyaltyScheme::STANDARD);

    player.configure(std::make_shared<HandEvaluator>(RoyaltyScheme::FLAT), 3);
    EXPECT_EQ(player.initial_cards_count(), 3);
    EXPECT_EQ(player.evaluator().scheme(), RoyaltyScheme::FLAT);

    // A null evaluator keeps the current one
    player.configure(nullptr, 3);
    EXPECT_EQ(player.evaluator().scheme(), RoyaltyScheme::FLAT);

    EXPECT_THROW(player.configure(nullptr, 0), GameStateError);
    EXPECT_THROW(player.configure(nullptr, 14), GameStateError);

    EXPECT_THROW(player.receive_initial_cards(parse_cards("As Kd Qh Jc 9s")), GameStateError);
    player.receive_initial_cards(parse_cards("As Kd Qh"));
    EXPECT_THROW(player.configure(nullptr, 5), GameStateError);
}

TEST(PlayerTest, RoyaltiesFollowConfiguredScheme) {
    // Trip threes on Top: 11 on the standard table, 10 on the flat one
    Player standard("p1", "Alice");
    fill_layout(standard, "3c 3d 3h", "4c 4d 4h 9s 8h", "Ac Kc Qc Jc 9c");
    EXPECT_EQ(standard.royalties(), 11 + 2 + 4);

    Player flat("p2", "Bob");
    flat.configure(std::make_shared<HandEvaluator>(RoyaltyScheme::FLAT), 5);
    fill_layout(flat, "3c 3d 3h", "4c 4d 4h 9s 8h", "Ac Kc Qc Jc 9c");
    EXPECT_EQ(flat.royalties(), 10 + 0 + 4);
}
