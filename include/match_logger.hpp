/**
 * PTCG Core - Match Logger
 *
 * Event handler that writes a timestamped trace of a match to disk: one
 * line per event, plus optional full-state snapshots that include hidden
 * zones (decks, prizes). Card ids are printed so card movement can be
 * followed across zones.
 */

#pragma once

#include "game_event.hpp"
#include <fstream>

namespace ptcg {

class Game;
class CardDatabase;
class Player;

/**
 * MatchLogger - Complete match visibility for debugging.
 *
 * Register it on a Game with register_handler(); call log_state() for
 * snapshots. The game end banner is written when a GameEnded event arrives.
 */
class MatchLogger : public EventHandler {
public:
    /**
     * Constructor - creates the output directory and a timestamped log file.
     *
     * @param output_dir Directory for log files
     * @param card_db Optional card database for resolving card names
     */
    explicit MatchLogger(const std::string& output_dir = "match_logs",
                         const CardDatabase* card_db = nullptr);

    ~MatchLogger() override;

    std::string name() const override { return "MatchLogger"; }

    void handle_event(const GameEvent& event) override;

    void set_card_database(const CardDatabase* card_db) { card_db_ = card_db; }

    /**
     * Log a complete snapshot of the game (including hidden zones).
     */
    void log_state(const Game& game);

    const std::string& get_log_path() const { return log_path_; }

    bool is_enabled() const { return enabled_; }
    void set_enabled(bool enabled) { enabled_ = enabled; }

    size_t events_logged() const { return events_logged_; }

private:
    std::string log_path_;
    std::ofstream log_file_;
    const CardDatabase* card_db_ = nullptr;
    bool enabled_ = true;
    size_t events_logged_ = 0;

    /**
     * "Name (id)" when the database knows the card, else "(id)".
     */
    std::string fmt_card(const CardID& card_id) const;

    std::string format_pokemon_line(const Player& player, const CardID& pokemon_id,
                                    const std::string& label) const;

    void write_zone(const std::string& label, const std::vector<CardID>& cards);

    void log_game_end(const GameEvent& event);
};

} // namespace ptcg
