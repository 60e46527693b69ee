/**
 * @file errors.hpp
 * @brief Error taxonomy for the OFC engine.
 *
 * Two kinds of failure are reported:
 *   - Exceptions on the mutation path (GameStateError, InvalidCardPlacementError).
 *     The operation is rejected and the game is left unchanged.
 *   - ValidationResult on the advisory path (GameValidator). Expected rule
 *     violations are returned, never thrown.
 *
 * Fouling is not an error: it is a terminal layout state that only affects scoring.
 */

#pragma once

#include "layout.hpp"
#include <stdexcept>
#include <string>

namespace ofc {

/**
 * @brief Operation invalid given the current game state.
 *
 * Wrong turn, completed/paused/cancelled game, wrong initial-deal count,
 * unknown player, exhausted deck, or an invalid game construction.
 */
class GameStateError : public std::runtime_error {
public:
    explicit GameStateError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief A specific placement violates capacity or ownership rules.
 */
class InvalidCardPlacementError : public std::runtime_error {
public:
    InvalidCardPlacementError(const std::string& message, Card card, Row row,
                              const std::string& player_id = "")
        : std::runtime_error(message), card_(card), row_(row), player_id_(player_id) {}

    Card card() const { return card_; }
    Row row() const { return row_; }
    const std::string& player_id() const { return player_id_; }

private:
    Card card_;
    Row row_;
    std::string player_id_;
};

/**
 * @brief Result of an advisory validation with human-readable messages.
 *
 * A valid result may still carry a non-blocking warning
 * (e.g. "this placement risks fouling").
 */
struct ValidationResult {
    bool is_valid;               ///< True if the checked rule holds
    std::string error_message;   ///< Reason when invalid, empty otherwise
    std::string warning_message; ///< Optional non-blocking warning

    /** @brief Default constructor: valid, no messages */
    ValidationResult() : is_valid(true) {}

    ValidationResult(bool valid, const std::string& error, const std::string& warning = "")
        : is_valid(valid), error_message(error), warning_message(warning) {}

    static ValidationResult ok() { return ValidationResult(); }
    static ValidationResult failure(const std::string& error) { return ValidationResult(false, error); }
    static ValidationResult warning(const std::string& warning) { return ValidationResult(true, "", warning); }

    bool has_warning() const { return !warning_message.empty(); }
};

} // namespace ofc
