/**
 * @file fantasy_land.cpp
 * @brief Fantasy Land qualification and state transitions.
 */

#include "../include/ofc/fantasy_land.hpp"
#include <algorithm>
#include <sstream>
#include <utility>

namespace ofc {

FantasyLandState FantasyLandState::create_initial(const std::string& player_id) {
    FantasyLandState state;
    state.player_id = player_id;
    return state;
}

FantasyLandState FantasyLandState::enter_fantasy_land(int current_round, int cards) const {
    FantasyLandState next = *this;
    next.is_active = true;
    next.card_count = cards;
    if (is_active) {
        next.consecutive_count = consecutive_count + 1;
    } else {
        next.entry_round = current_round;
        next.consecutive_count = 1;
        next.times_entered = times_entered + 1;
    }
    return next;
}

FantasyLandState FantasyLandState::exit_fantasy_land() const {
    FantasyLandState next = *this;
    next.is_active = false;
    next.entry_round = -1;
    next.consecutive_count = 0;
    next.card_count = 0;
    return next;
}

FantasyLandManager::FantasyLandManager(std::shared_ptr<const HandEvaluator> evaluator,
                                       const GameRules& rules)
    : evaluator_(std::move(evaluator)), rules_(rules) {
    if (!evaluator_) {
        evaluator_ = std::make_shared<HandEvaluator>(rules.royalty_scheme);
    }
}

bool FantasyLandManager::check_entry_qualification(const CardList& top) const {
    if (static_cast<int>(top.size()) != TOP_SIZE) return false;

    HandRanking hand = evaluator_->evaluate(top, Row::TOP);
    if (hand.hand_type == HandType::THREE_OF_A_KIND) return true;
    return hand.hand_type == HandType::PAIR &&
           hand.primary_rank() >= rank_value(rules_.fantasy_land_min_pair);
}

bool FantasyLandManager::check_stay_qualification(const CardList& top, const CardList& middle,
                                                  const CardList& bottom) const {
    if (static_cast<int>(top.size()) == TOP_SIZE &&
        evaluator_->evaluate(top, Row::TOP).hand_type == HandType::THREE_OF_A_KIND) {
        return true;
    }
    if (rules_.fantasy_land_stay_on_middle_full_house &&
        static_cast<int>(middle.size()) == MIDDLE_SIZE &&
        evaluator_->evaluate(middle, Row::MIDDLE).hand_type >= HandType::FULL_HOUSE) {
        return true;
    }
    if (rules_.fantasy_land_stay_on_bottom_quads &&
        static_cast<int>(bottom.size()) == BOTTOM_SIZE &&
        evaluator_->evaluate(bottom, Row::BOTTOM).hand_type >= HandType::FOUR_OF_A_KIND) {
        return true;
    }
    return false;
}

int FantasyLandManager::get_fantasy_land_card_count() const {
    return get_fantasy_land_card_count(rules_.variant);
}

int FantasyLandManager::get_fantasy_land_card_count(Variant variant) {
    return variant == Variant::PINEAPPLE ? 14 : LAYOUT_SIZE;
}

int FantasyLandManager::card_count_for_entry(const CardList& top) const {
    if (!check_entry_qualification(top)) return 0;
    if (!rules_.progressive_fantasy_land) return get_fantasy_land_card_count();

    HandRanking hand = evaluator_->evaluate(top, Row::TOP);
    if (hand.hand_type == HandType::THREE_OF_A_KIND) return 17;
    switch (hand.primary_rank() - 2) {
        case RANK_ACE:  return 16;
        case RANK_KING: return 15;
        default:        return 14;
    }
}

ValidationResult FantasyLandManager::validate_fantasy_land_setting(const CardList& placed,
                                                                   const CardList& dealt,
                                                                   int expected_dealt) const {
    if (static_cast<int>(dealt.size()) != expected_dealt) {
        std::ostringstream oss;
        oss << "Must deal exactly " << expected_dealt << " cards in Fantasy Land, got " << dealt.size();
        return ValidationResult::failure(oss.str());
    }
    if (static_cast<int>(placed.size()) != LAYOUT_SIZE) {
        std::ostringstream oss;
        oss << "Must place exactly " << LAYOUT_SIZE << " cards, got " << placed.size();
        return ValidationResult::failure(oss.str());
    }
    if (has_duplicates(placed)) {
        return ValidationResult::failure("Duplicate cards in placement");
    }
    for (Card c : placed) {
        if (std::find(dealt.begin(), dealt.end(), c) == dealt.end()) {
            return ValidationResult::failure("Placed card " + card_to_string(c) + " not from dealt cards");
        }
    }
    return ValidationResult::ok();
}

} // namespace ofc
