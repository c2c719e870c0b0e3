/// @file pybind_module.cpp
/// pybind11 bindings for fenprobe.
///
/// Exposes `_fenprobe` with the Board position generator and EngineSession.
/// Positions cross the boundary as FEN strings; scores as (kind, value).

#include <fenprobe/board.hpp>
#include <fenprobe/engine_session.hpp>
#include <fenprobe/errors.hpp>

#include <pybind11/chrono.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <variant>

namespace py = pybind11;

namespace {

std::string score_kind(const fenprobe::EvaluationResult& r) {
    return fenprobe::is_mate(r.score) ? "mate" : "cp";
}

int score_value(const fenprobe::EvaluationResult& r) {
    if (auto cp = fenprobe::centipawns(r.score))
        return *cp;
    return std::get<fenprobe::MateIn>(r.score).moves;
}

}  // namespace

PYBIND11_MODULE(_fenprobe, m) {
    m.doc() = "Random position generator and UCI engine session (pybind11)";

    py::register_exception<fenprobe::ProtocolError>(m, "ProtocolError", PyExc_RuntimeError);
    py::register_exception<fenprobe::ConfigurationError>(m, "ConfigurationError",
                                                         PyExc_ValueError);
    py::register_exception<fenprobe::UsageError>(m, "UsageError", PyExc_RuntimeError);

    // ── Enums ───────────────────────────────────────────────────────────
    py::enum_<fenprobe::Color>(m, "Color")
        .value("White", fenprobe::Color::White)
        .value("Black", fenprobe::Color::Black);

    py::enum_<fenprobe::PositionStatus>(m, "PositionStatus")
        .value("Fault", fenprobe::PositionStatus::Fault)
        .value("MoverInCheck", fenprobe::PositionStatus::MoverInCheck)
        .value("MoverNotInCheck", fenprobe::PositionStatus::MoverNotInCheck);

    py::enum_<fenprobe::SessionState>(m, "SessionState")
        .value("Unstarted", fenprobe::SessionState::Unstarted)
        .value("Ready", fenprobe::SessionState::Ready)
        .value("AwaitingResponse", fenprobe::SessionState::AwaitingResponse)
        .value("Faulted", fenprobe::SessionState::Faulted)
        .value("Stopped", fenprobe::SessionState::Stopped);

    // ── Board ───────────────────────────────────────────────────────────
    py::class_<fenprobe::Board>(m, "Board")
        .def(py::init<>(), "Create an empty board.")
        .def("reset_empty", &fenprobe::Board::reset_empty, "Remove all pieces.")
        .def("reset_initial", &fenprobe::Board::reset_initial, "Set up the initial position.")
        .def(
            "scatter",
            [](fenprobe::Board& self, const std::string& pieces, std::uint64_t seed) {
                std::mt19937_64 rng(seed);
                self.scatter(pieces, rng);
            },
            py::arg("pieces"), py::arg("seed"),
            "Place each piece symbol on a random empty square (pawns on ranks 2-7 only).")
        .def(
            "to_fen",
            [](const fenprobe::Board& self, const std::string& mover) {
                return self.to_fen(std::string_view(mover));
            },
            py::arg("mover"), "Position string with *mover* ('w' or 'b') to move.")
        .def("piece_count", &fenprobe::Board::piece_count)
        .def("diagram", &fenprobe::Board::diagram);

    // ── EvaluationResult ────────────────────────────────────────────────
    py::class_<fenprobe::EvaluationResult>(m, "EvaluationResult")
        .def_property_readonly("kind", &score_kind, "'cp' or 'mate'.")
        .def_property_readonly("value", &score_value)
        .def_readonly("elapsed", &fenprobe::EvaluationResult::elapsed)
        .def_readonly("best_move", &fenprobe::EvaluationResult::best_move)
        .def("__str__",
             [](const fenprobe::EvaluationResult& r) { return fenprobe::to_string(r.score); });

    // ── EngineSession ───────────────────────────────────────────────────
    py::class_<fenprobe::EngineSession>(m, "EngineSession")
        .def(py::init<std::string>(), py::arg("executable"))
        .def("start", &fenprobe::EngineSession::start, py::call_guard<py::gil_scoped_release>())
        .def("stop", &fenprobe::EngineSession::stop, py::call_guard<py::gil_scoped_release>())
        .def(
            "submit_position",
            [](fenprobe::EngineSession& self, const std::string& fen) {
                return self.submit_position(fen);
            },
            py::arg("fen"), py::call_guard<py::gil_scoped_release>(),
            "Load *fen*; returns a PositionStatus. Restarts the engine after a crash.")
        .def(
            "evaluate",
            [](fenprobe::EngineSession& self, std::optional<int> depth,
               std::optional<int> movetime) { return self.evaluate(depth, movetime); },
            py::arg("depth") = py::none(), py::arg("movetime") = py::none(),
            py::call_guard<py::gil_scoped_release>(),
            "Search the last accepted position. *movetime* is in milliseconds.")
        .def_property_readonly("state", &fenprobe::EngineSession::state)
        .def_property_readonly("restart_count", &fenprobe::EngineSession::restart_count)
        .def("__enter__",
             [](fenprobe::EngineSession& self) -> fenprobe::EngineSession& {
                 py::gil_scoped_release release;
                 self.start();
                 return self;
             },
             py::return_value_policy::reference)
        .def("__exit__", [](fenprobe::EngineSession& self, py::args) {
            py::gil_scoped_release release;
            auto state = self.state();
            if (state != fenprobe::SessionState::Unstarted &&
                state != fenprobe::SessionState::Stopped)
                self.stop();
        });
}
