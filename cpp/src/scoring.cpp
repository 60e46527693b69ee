/**
 * @file scoring.cpp
 * @brief Implementation of pairwise OFC settlement.
 *
 * Settlement Table (first vs second):
 *   | First   | Second  | Rows              | Royalties           |
 *   |---------|---------|-------------------|---------------------|
 *   | clean   | clean   | compared row-wise | both directions     |
 *   | clean   | fouled  | first wins all 3  | first collects only |
 *   | fouled  | clean   | second wins all 3 | second collects only|
 *   | fouled  | fouled  | nothing           | nothing             |
 */

#include "../include/ofc/scoring.hpp"
#include <stdexcept>

namespace ofc {

namespace {

struct RowSet {
    std::array<HandRanking, NUM_ROWS> rankings;
    int royalties;
    bool fouled;
};

RowSet evaluate_rows(const Player& player, const HandEvaluator& evaluator) {
    if (!player.is_layout_complete()) {
        throw std::invalid_argument("Cannot score player " + player.id() +
                                    ": layout is incomplete");
    }

    RowSet set;
    set.fouled = player.is_fouled();
    set.royalties = 0;
    for (Row r : ALL_ROWS) {
        HandRanking ranking = evaluator.evaluate(player.row(r), r);
        set.rankings[static_cast<int>(r)] = ranking;
        if (!set.fouled) set.royalties += ranking.royalty_bonus;
    }
    return set;
}

} // anonymous namespace

PairwiseResult settle_pair(const Player& first, const Player& second,
                           const HandEvaluator& evaluator, const GameRules& rules) {
    RowSet a = evaluate_rows(first, evaluator);
    RowSet b = evaluate_rows(second, evaluator);

    PairwiseResult result;
    result.first_id = first.id();
    result.second_id = second.id();

    if (a.fouled && b.fouled) {
        return result;
    }

    for (int i = 0; i < NUM_ROWS; ++i) {
        if (a.fouled) {
            result.row_outcomes[i] = -1;
        } else if (b.fouled) {
            result.row_outcomes[i] = 1;
        } else {
            result.row_outcomes[i] = HandEvaluator::compare(a.rankings[i], b.rankings[i]);
        }
        if (result.row_outcomes[i] > 0) result.first_row_points++;
        if (result.row_outcomes[i] < 0) result.second_row_points++;
    }

    if (result.first_row_points == NUM_ROWS) {
        result.scoop = true;
        result.first_row_points += rules.scoop_bonus;
    } else if (result.second_row_points == NUM_ROWS) {
        result.scoop = true;
        result.second_row_points += rules.scoop_bonus;
    }

    // Fouled sides carry zero royalties, so this covers every case.
    result.first_royalties = a.royalties;
    result.second_royalties = b.royalties;
    return result;
}

std::vector<Score> calculate_scores(const std::vector<Player>& players,
                                    const HandEvaluator& evaluator, const GameRules& rules) {
    std::vector<Score> scores(players.size());
    for (size_t i = 0; i < players.size(); ++i) {
        scores[i].player_id = players[i].id();
    }

    for (size_t i = 0; i < players.size(); ++i) {
        for (size_t j = i + 1; j < players.size(); ++j) {
            PairwiseResult pair = settle_pair(players[i], players[j], evaluator, rules);

            scores[i].points += pair.first_row_points;
            scores[i].royalties += pair.first_royalties;
            scores[i].penalties += pair.second_row_points + pair.second_royalties;

            scores[j].points += pair.second_row_points;
            scores[j].royalties += pair.second_royalties;
            scores[j].penalties += pair.first_row_points + pair.first_royalties;
        }
    }
    return scores;
}

std::string determine_winner(const std::vector<Score>& scores) {
    if (scores.empty()) return "";

    const Score* best = &scores[0];
    for (const Score& s : scores) {
        if (s.total_points() > best->total_points() ||
            (s.total_points() == best->total_points() && s.royalties > best->royalties)) {
            best = &s;
        }
    }
    return best->player_id;
}

} // namespace ofc
