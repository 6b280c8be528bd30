// record.cpp
#include "record.h"
#include "errors.h"
#include <iomanip>
#include <sstream>

namespace {

const char* RECORD_MAGIC = "wataru-record";
const int RECORD_VERSION = 1;

int parse_int(const std::string& token, int line) {
    std::size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(token, &used);
    } catch (const std::invalid_argument&) {
        throw RecordFormatError(line, "expected integer, got '" + token + "'");
    } catch (const std::out_of_range&) {
        throw RecordFormatError(line, "integer out of range: '" + token + "'");
    }
    if (used != token.size()) {
        throw RecordFormatError(line, "trailing characters in integer '" + token + "'");
    }
    return value;
}

double parse_double(const std::string& token, int line) {
    std::size_t used = 0;
    double value = 0;
    try {
        value = std::stod(token, &used);
    } catch (const std::invalid_argument&) {
        throw RecordFormatError(line, "expected number, got '" + token + "'");
    } catch (const std::out_of_range&) {
        throw RecordFormatError(line, "number out of range: '" + token + "'");
    }
    if (used != token.size()) {
        throw RecordFormatError(line, "trailing characters in number '" + token + "'");
    }
    return value;
}

// "<row>,<col>,<layer>"
Position parse_position(const std::string& token, int line) {
    std::size_t a = token.find(',');
    std::size_t b = (a == std::string::npos) ? std::string::npos : token.find(',', a + 1);
    if (a == std::string::npos || b == std::string::npos) {
        throw RecordFormatError(line, "expected row,col,layer, got '" + token + "'");
    }
    return Position(parse_int(token.substr(0, a), line),
                    parse_int(token.substr(a + 1, b - a - 1), line),
                    parse_int(token.substr(b + 1), line));
}

} // namespace

std::string serialize_record(const GameRecord& record) {
    std::ostringstream oss;
    oss << RECORD_MAGIC << ' ' << RECORD_VERSION << '\n';
    oss << "size " << record.board_size << '\n';
    oss << "blocks " << record.initial_size4 << ' ' << record.initial_size5 << '\n';
    for (const auto& move : record.moves) {
        oss << "move " << move.player << ' ' << std::fixed << std::setprecision(6) << move.timestamp;
        for (const auto& pos : move.path) {
            oss << ' ' << pos.row << ',' << pos.col << ',' << pos.layer;
        }
        oss << '\n';
    }
    oss << "winner " << record.winner << '\n';
    oss << "end\n";
    return oss.str();
}

GameRecord parse_record(const std::string& text) {
    GameRecord record;
    std::istringstream in(text);
    std::string raw;
    int line_no = 0;
    bool header_seen = false;
    bool size_seen = false;
    bool end_seen = false;

    while (std::getline(in, raw)) {
        line_no++;
        std::istringstream line(raw);
        std::string keyword;
        if (!(line >> keyword)) {
            continue;  // blank
        }
        if (end_seen) {
            throw RecordFormatError(line_no, "content after 'end'");
        }

        std::vector<std::string> args;
        std::string tok;
        while (line >> tok) {
            args.push_back(tok);
        }

        if (!header_seen) {
            if (keyword != RECORD_MAGIC || args.size() != 1) {
                throw RecordFormatError(line_no, "missing '" + std::string(RECORD_MAGIC) + "' header");
            }
            if (parse_int(args[0], line_no) != RECORD_VERSION) {
                throw RecordFormatError(line_no, "unsupported record version " + args[0]);
            }
            header_seen = true;
        } else if (keyword == "size") {
            if (args.size() != 1) throw RecordFormatError(line_no, "size takes one value");
            record.board_size = parse_int(args[0], line_no);
            if (record.board_size <= 0) throw RecordFormatError(line_no, "board size must be positive");
            size_seen = true;
        } else if (keyword == "blocks") {
            if (args.size() != 2) throw RecordFormatError(line_no, "blocks takes two values");
            record.initial_size4 = parse_int(args[0], line_no);
            record.initial_size5 = parse_int(args[1], line_no);
            if (record.initial_size4 < 0 || record.initial_size5 < 0) {
                throw RecordFormatError(line_no, "block counts cannot be negative");
            }
        } else if (keyword == "move") {
            if (args.size() < 2) throw RecordFormatError(line_no, "move needs a player and a timestamp");
            Move move;
            move.player = parse_int(args[0], line_no);
            move.timestamp = parse_double(args[1], line_no);
            for (std::size_t i = 2; i < args.size(); i++) {
                move.path.push_back(parse_position(args[i], line_no));
            }
            record.moves.push_back(std::move(move));
        } else if (keyword == "winner") {
            if (args.size() != 1) throw RecordFormatError(line_no, "winner takes one value");
            record.winner = parse_int(args[0], line_no);
            if (record.winner != EMPTY && record.winner != PLAYER_A && record.winner != PLAYER_B) {
                throw RecordFormatError(line_no, "winner must be 0, 1 or 2");
            }
        } else if (keyword == "end") {
            end_seen = true;
        } else {
            throw RecordFormatError(line_no, "unknown keyword '" + keyword + "'");
        }
    }

    if (!header_seen) throw RecordFormatError(line_no, "empty record");
    if (!size_seen) throw RecordFormatError(line_no, "record has no board size");
    if (!end_seen) throw RecordFormatError(line_no, "record is truncated (no 'end')");
    return record;
}
