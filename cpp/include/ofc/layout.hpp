/**
 * @file layout.hpp
 * @brief Row designations and layout snapshots for a player's OFC board.
 *
 * Every player builds three rows:
 *   | Row    | Capacity | Evaluated as |
 *   |--------|----------|--------------|
 *   | TOP    | 3        | 3-card hand  |
 *   | MIDDLE | 5        | 5-card hand  |
 *   | BOTTOM | 5        | 5-card hand  |
 *
 * A complete layout holds exactly 13 cards (3/5/5).
 */

#pragma once

#include "card.hpp"
#include <array>
#include <string>

namespace ofc {

/** @brief Row of an OFC layout, ordered top to bottom. */
enum class Row {
    TOP = 0,
    MIDDLE = 1,
    BOTTOM = 2
};

constexpr int NUM_ROWS = 3;
constexpr int TOP_SIZE = 3;
constexpr int MIDDLE_SIZE = 5;
constexpr int BOTTOM_SIZE = 5;

/** @brief Cards in a complete layout */
constexpr int LAYOUT_SIZE = TOP_SIZE + MIDDLE_SIZE + BOTTOM_SIZE;

/** @brief All rows in Top/Middle/Bottom order. */
constexpr std::array<Row, NUM_ROWS> ALL_ROWS = {Row::TOP, Row::MIDDLE, Row::BOTTOM};

/** @brief Maximum number of cards a row holds (3 for TOP, 5 otherwise). */
constexpr int row_capacity(Row row) {
    return row == Row::TOP ? TOP_SIZE : (row == Row::MIDDLE ? MIDDLE_SIZE : BOTTOM_SIZE);
}

/** @brief Lower-case row name ("top", "middle", "bottom"). */
const char* row_name(Row row);

/** @brief Display name ("Top Row", ...). */
const char* row_display_name(Row row);

/**
 * @brief Parse a row name (case-insensitive, surrounding spaces ignored).
 * @throws std::invalid_argument for unknown names
 */
Row parse_row(const std::string& name);

/**
 * @brief A specific slot within a row, used by initial placements.
 *
 * Index is 0-based and must be below the row's capacity.
 */
struct Slot {
    Row row;
    int index;

    bool operator==(const Slot& other) const { return row == other.row && index == other.index; }
    bool operator<(const Slot& other) const {
        return row != other.row ? row < other.row : index < other.index;
    }
};

/**
 * @brief Immutable copy of one player's cards: rows plus unplaced hand cards.
 */
struct HandSnapshot {
    CardList top;
    CardList middle;
    CardList bottom;
    CardList hand_cards;

    const CardList& row(Row r) const {
        return r == Row::TOP ? top : (r == Row::MIDDLE ? middle : bottom);
    }

    int placed_count() const {
        return static_cast<int>(top.size() + middle.size() + bottom.size());
    }

    bool is_complete() const {
        return static_cast<int>(top.size()) == TOP_SIZE &&
               static_cast<int>(middle.size()) == MIDDLE_SIZE &&
               static_cast<int>(bottom.size()) == BOTTOM_SIZE;
    }
};

} // namespace ofc
