#include <gtest/gtest.h>
#include "ofc/events.hpp"
#include <sstream>
#include <stdexcept>

using namespace ofc;

TEST(EventTest, Names) {
    EXPECT_STREQ(event_name(RoundStartedEvent{}), "round_started");
    EXPECT_STREQ(event_name(CardPlacedEvent{}), "card_placed");
    EXPECT_STREQ(event_name(CardDiscardedEvent{}), "card_discarded");
    EXPECT_STREQ(event_name(FantasyLandChangedEvent{}), "fantasy_land_changed");
    EXPECT_STREQ(event_name(GameCompletedEvent{}), "game_completed");
}

TEST(EventTest, FormatPlacementEvents) {
    GameEvent placed = CardPlacedEvent{"g1", "p1", parse_card("As"), Row::BOTTOM, 1};
    EXPECT_EQ(format_event(placed), "event=card_placed game=g1 player=p1 card=As row=bottom round=1");

    GameEvent discarded = CardDiscardedEvent{"g1", "p2", parse_card("Td"), 4};
    EXPECT_EQ(format_event(discarded), "event=card_discarded game=g1 player=p2 card=Td round=4");

    GameEvent round = RoundStartedEvent{"g1", 2, "p3"};
    EXPECT_EQ(format_event(round), "event=round_started game=g1 round=2 first=p3");
}

TEST(EventTest, FormatFantasyLandEvent) {
    GameEvent entered = FantasyLandChangedEvent{"g1", "p1", true, 2, 15};
    EXPECT_EQ(format_event(entered),
              "event=fantasy_land_changed game=g1 player=p1 active=true streak=2 cards=15");

    GameEvent left = FantasyLandChangedEvent{"g1", "p1", false, 0, 0};
    EXPECT_EQ(format_event(left),
              "event=fantasy_land_changed game=g1 player=p1 active=false streak=0 cards=0");
}

TEST(EventTest, FormatGameCompleted) {
    Score a;
    a.player_id = "p1";
    a.points = 6;
    a.royalties = 4;
    Score b;
    b.player_id = "p2";
    b.penalties = 10;

    GameEvent done = GameCompletedEvent{"g1", {a, b}, "p1"};
    EXPECT_EQ(format_event(done), "event=game_completed game=g1 winner=p1 scores=p1:10,p2:-10");
}

TEST(EventLogTest, WritesOneLinePerEvent) {
    std::ostringstream out;
    EventLog log(out);
    log.on_event(RoundStartedEvent{"g1", 1, "p1"});
    log.on_event(CardPlacedEvent{"g1", "p1", parse_card("2c"), Row::TOP, 1});

    EXPECT_EQ(log.lines_written(), 2u);
    EXPECT_EQ(out.str(),
              "event=round_started game=g1 round=1 first=p1\n"
              "event=card_placed game=g1 player=p1 card=2c row=top round=1\n");
}

TEST(EventLogTest, UnwritablePathThrows) {
    EXPECT_THROW(EventLog("/nonexistent-dir/ofc/events.log"), std::runtime_error);
}

TEST(LayoutTest, RowNames) {
    EXPECT_STREQ(row_name(Row::MIDDLE), "middle");
    EXPECT_STREQ(row_display_name(Row::BOTTOM), "Bottom Row");
    EXPECT_EQ(parse_row(" Top "), Row::TOP);
    EXPECT_EQ(parse_row("BOTTOM"), Row::BOTTOM);
    EXPECT_THROW(parse_row("side"), std::invalid_argument);
}

TEST(LayoutTest, SlotOrdering) {
    Slot top{Row::TOP, 2};
    Slot bottom{Row::BOTTOM, 0};
    EXPECT_TRUE(top < bottom);
    EXPECT_TRUE((Slot{Row::MIDDLE, 1} < Slot{Row::MIDDLE, 3}));
    EXPECT_EQ(top, (Slot{Row::TOP, 2}));
}
