#pragma once

#include <string>
#include <vector>

#include "move.h"

/**
 * Replayable description of a game: the starting configuration and the
 * moves in order. The board itself is never stored, it is re-derived by
 * replaying the moves.
 */
struct GameRecord {
    int board_size = 18;
    int initial_size4 = 1;
    int initial_size5 = 1;
    std::vector<Move> moves;
    int winner = EMPTY;  // informational; replay recomputes it
};

/**
 * Line-oriented text form:
 *
 *   wataru-record 1
 *   size 18
 *   blocks 1 1
 *   move 1 1700000000.5 8,8,0 8,9,0 8,10,0
 *   winner 0
 *   end
 */
std::string serialize_record(const GameRecord& record);

// Throws RecordFormatError when the text is not a well-formed record.
GameRecord parse_record(const std::string& text);
