#pragma once

#include <stdexcept>
#include <string>

/**
 * Raised when a move is refused: wrong turn, finished game, malformed path,
 * placement conflict or an exhausted block inventory. The state is untouched.
 */
class IllegalMove : public std::runtime_error {
public:
    explicit IllegalMove(const std::string& reason)
        : std::runtime_error("Illegal move: " + reason), reason_(reason) {}

    const std::string& reason() const noexcept { return reason_; }

private:
    std::string reason_;
};

class NothingToUndo : public std::runtime_error {
public:
    NothingToUndo() : std::runtime_error("Nothing to undo: move history is empty") {}
};

// Search was asked to move from a position where the side to move has no moves.
class NoLegalMoves : public std::runtime_error {
public:
    explicit NoLegalMoves(const std::string& what) : std::runtime_error(what) {}
};

class RecordFormatError : public std::invalid_argument {
public:
    RecordFormatError(int line, const std::string& detail)
        : std::invalid_argument("Game record line " + std::to_string(line) + ": " + detail),
          line_(line) {}

    // Well-formed text whose content does not add up; no single line to blame.
    explicit RecordFormatError(const std::string& detail)
        : std::invalid_argument("Game record: " + detail), line_(-1) {}

    int line() const noexcept { return line_; }

private:
    int line_;
};
