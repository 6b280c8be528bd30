// python_wrapper.cpp
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "wataru.h"
#include "record.h"
#include "mcts_config.h"
#include "mcts.h"
#include "debug.h"

namespace py = pybind11;
using namespace pybind11::literals;

namespace {

py::dict move_to_dict(const Move& move) {
    py::list path;
    for (const auto& pos : move.path) {
        path.append(py::dict("row"_a = pos.row, "col"_a = pos.col, "layer"_a = pos.layer));
    }
    return py::dict("player"_a = move.player, "path"_a = path, "timestamp"_a = move.timestamp);
}

Move move_from_dict(const py::dict& data) {
    Move move;
    move.player = data["player"].cast<int>();
    py::list path = data["path"].cast<py::list>();
    for (auto item : path) {
        py::dict pos = item.cast<py::dict>();
        move.path.emplace_back(pos["row"].cast<int>(), pos["col"].cast<int>(), pos["layer"].cast<int>());
    }
    if (data.contains("timestamp")) {
        move.timestamp = data["timestamp"].cast<double>();
    }
    return move;
}

py::dict blocks_to_dict(const PlayerBlocks& blocks) {
    return py::dict("size4"_a = blocks.size4, "size5"_a = blocks.size5);
}

py::dict result_to_dict(const SearchResult& result) {
    py::list top;
    for (const auto& c : result.top_candidates) {
        top.append(py::dict("move"_a = move_to_dict(c.move), "visits"_a = c.visits, "win_rate"_a = c.win_rate));
    }
    return py::dict("move"_a = move_to_dict(result.move),
                    "simulations"_a = result.simulations,
                    "nodes_created"_a = result.nodes_created,
                    "elapsed_seconds"_a = result.elapsed_seconds,
                    "top_candidates"_a = top,
                    "decision"_a = decision_name(result.decision),
                    "threat_detected"_a = result.threat_detected);
}

} // namespace

/**
 * One engine instance per game: the canonical state plus a search driver.
 * The transport layer maps its session ids onto instances of this class.
 */
class WataruEngine {
public:
    WataruEngine(int boardSize, const MCTSConfig& cfg)
        : rootState_(boardSize), mcts_(cfg) {
        WATARU_DEBUG("Creating engine for " << boardSize << "x" << boardSize << " board");
    }

    void new_game(int boardSize) {
        rootState_ = Gamestate(boardSize);
    }

    py::list legal_moves() const {
        py::list out;
        for (const auto& m : rootState_.get_legal_moves()) {
            out.append(move_to_dict(m));
        }
        return out;
    }

    py::dict apply_move(const py::dict& data) {
        Move move = move_from_dict(data);
        if (move.timestamp == 0.0) {
            move = Move::create(move.player, move.path);
        }
        rootState_.make_move(move);
        return get_state();
    }

    py::dict undo() {
        rootState_.undo_move();
        return get_state();
    }

    py::dict search() {
        return result_to_dict(mcts_.search(rootState_));
    }

    py::dict apply_best_move() {
        SearchResult result = mcts_.search(rootState_);
        rootState_.make_move(result.move);
        return result_to_dict(result);
    }

    void set_config(const MCTSConfig& cfg) {
        mcts_.set_config(cfg);
    }

    std::string export_record() const {
        return serialize_record(rootState_.export_record());
    }

    void import_record(const std::string& text) {
        rootState_ = Gamestate::from_record(parse_record(text));
    }

    py::dict get_state() const {
        py::list history;
        for (const auto& m : rootState_.move_history) {
            history.append(move_to_dict(m));
        }
        py::dict blocks;
        blocks["1"] = blocks_to_dict(rootState_.blocks_of(PLAYER_A));
        blocks["2"] = blocks_to_dict(rootState_.blocks_of(PLAYER_B));
        return py::dict("board"_a = rootState_.board.get_board(),
                        "board_size"_a = rootState_.board_size(),
                        "current_player"_a = rootState_.current_player,
                        "player_blocks"_a = blocks,
                        "move_history"_a = history,
                        "winner"_a = rootState_.winner);
    }

    std::vector<std::vector<std::vector<float>>> to_tensor() const {
        return rootState_.board.to_tensor();
    }

    bool is_terminal() const { return rootState_.is_terminal(); }
    int get_winner() const { return rootState_.get_winner(); }
    std::string to_string() const { return rootState_.to_string(); }

private:
    Gamestate rootState_;
    MCTS mcts_;
};

PYBIND11_MODULE(wataru_py, m) {
    py::register_exception<IllegalMove>(m, "IllegalMove", PyExc_ValueError);
    py::register_exception<NothingToUndo>(m, "NothingToUndo", PyExc_RuntimeError);
    py::register_exception<NoLegalMoves>(m, "NoLegalMoves", PyExc_RuntimeError);
    py::register_exception<RecordFormatError>(m, "RecordFormatError", PyExc_ValueError);

    m.attr("EMPTY") = EMPTY;
    m.attr("PLAYER_A") = PLAYER_A;
    m.attr("PLAYER_B") = PLAYER_B;
    m.attr("LAYER_PRIMARY") = LAYER_PRIMARY;
    m.attr("LAYER_SECONDARY") = LAYER_SECONDARY;

    py::class_<MCTSConfig>(m, "MCTSConfig")
       .def(py::init<>())
       .def_readwrite("time_limit_seconds", &MCTSConfig::time_limit_seconds)
       .def_readwrite("max_simulations", &MCTSConfig::max_simulations)
       .def_readwrite("exploration_weight", &MCTSConfig::exploration_weight)
       .def_readwrite("tactical_rollout", &MCTSConfig::tactical_rollout)
       .def_readwrite("win_scan_limit", &MCTSConfig::win_scan_limit)
       .def_readwrite("threat_scan_limit", &MCTSConfig::threat_scan_limit)
       .def_readwrite("rollout_win_scan_limit", &MCTSConfig::rollout_win_scan_limit)
       .def_readwrite("max_rollout_moves", &MCTSConfig::max_rollout_moves)
       .def_readwrite("top_candidates", &MCTSConfig::top_candidates)
       .def_readwrite("seed", &MCTSConfig::seed)
       .def_readwrite("verbose", &MCTSConfig::verbose);

    py::class_<WataruEngine>(m, "WataruEngine")
       .def(py::init<int, const MCTSConfig&>(),
            py::arg("boardSize") = 18,
            py::arg("config") = MCTSConfig())
       .def("new_game", &WataruEngine::new_game, py::arg("boardSize") = 18)
       .def("legal_moves", &WataruEngine::legal_moves)
       .def("apply_move", &WataruEngine::apply_move)
       .def("undo", &WataruEngine::undo)
       .def("search", &WataruEngine::search)
       .def("apply_best_move", &WataruEngine::apply_best_move)
       .def("set_config", &WataruEngine::set_config)
       .def("export_record", &WataruEngine::export_record)
       .def("import_record", &WataruEngine::import_record)
       .def("get_state", &WataruEngine::get_state)
       .def("to_tensor", &WataruEngine::to_tensor)
       .def("is_terminal", &WataruEngine::is_terminal)
       .def("get_winner", &WataruEngine::get_winner)
       .def("__str__", &WataruEngine::to_string);
}
