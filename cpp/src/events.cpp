/**
 * @file events.cpp
 * @brief Event naming, formatting and the EventLog writer.
 */

#include "../include/ofc/events.hpp"
#include <sstream>
#include <stdexcept>

namespace ofc {

namespace {

struct NameVisitor {
    const char* operator()(const RoundStartedEvent&) const { return "round_started"; }
    const char* operator()(const CardPlacedEvent&) const { return "card_placed"; }
    const char* operator()(const CardDiscardedEvent&) const { return "card_discarded"; }
    const char* operator()(const FantasyLandChangedEvent&) const { return "fantasy_land_changed"; }
    const char* operator()(const GameCompletedEvent&) const { return "game_completed"; }
};

struct FormatVisitor {
    std::ostringstream& oss;

    void operator()(const RoundStartedEvent& e) const {
        oss << " game=" << e.game_id << " round=" << e.round << " first=" << e.first_player_id;
    }
    void operator()(const CardPlacedEvent& e) const {
        oss << " game=" << e.game_id << " player=" << e.player_id
            << " card=" << card_to_string(e.card) << " row=" << row_name(e.row)
            << " round=" << e.round;
    }
    void operator()(const CardDiscardedEvent& e) const {
        oss << " game=" << e.game_id << " player=" << e.player_id
            << " card=" << card_to_string(e.card) << " round=" << e.round;
    }
    void operator()(const FantasyLandChangedEvent& e) const {
        oss << " game=" << e.game_id << " player=" << e.player_id
            << " active=" << (e.active ? "true" : "false")
            << " streak=" << e.consecutive_count << " cards=" << e.card_count;
    }
    void operator()(const GameCompletedEvent& e) const {
        oss << " game=" << e.game_id << " winner=" << e.winner_id << " scores=";
        for (size_t i = 0; i < e.scores.size(); ++i) {
            if (i > 0) oss << ",";
            oss << e.scores[i].player_id << ":" << e.scores[i].total_points();
        }
    }
};

} // anonymous namespace

const char* event_name(const GameEvent& event) {
    return std::visit(NameVisitor{}, event);
}

std::string format_event(const GameEvent& event) {
    std::ostringstream oss;
    oss << "event=" << event_name(event);
    std::visit(FormatVisitor{oss}, event);
    return oss.str();
}

EventLog::EventLog(std::ostream& out) : out_(&out) {}

EventLog::EventLog(const std::string& path)
    : file_(path, std::ios::app), out_(&file_) {
    if (!file_) {
        throw std::runtime_error("Failed to open event log: " + path);
    }
}

void EventLog::on_event(const GameEvent& event) {
    std::string line = format_event(event);
    std::lock_guard<std::mutex> lock(mutex_);
    *out_ << line << '\n';
    out_->flush();
    ++lines_;
}

size_t EventLog::lines_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

} // namespace ofc
