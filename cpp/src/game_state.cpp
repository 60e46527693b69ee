/**
 * @file game_state.cpp
 * @brief GameState lookups.
 */

#include "../include/ofc/game_state.hpp"

namespace ofc {

const char* game_status_name(GameStatus status) {
    static const char* names[] = {"waiting", "in_progress", "paused", "completed", "cancelled"};
    return names[static_cast<int>(status)];
}

int GameState::player_index(const std::string& player_id) const {
    for (size_t i = 0; i < players.size(); ++i) {
        if (players[i].id() == player_id) return static_cast<int>(i);
    }
    return -1;
}

const Player* GameState::find_player(const std::string& player_id) const {
    int idx = player_index(player_id);
    return idx < 0 ? nullptr : &players[idx];
}

Player* GameState::find_player(const std::string& player_id) {
    int idx = player_index(player_id);
    return idx < 0 ? nullptr : &players[idx];
}

bool GameState::all_layouts_complete() const {
    if (players.empty()) return false;
    for (const Player& p : players) {
        if (!p.is_layout_complete()) return false;
    }
    return true;
}

} // namespace ofc
