#include <pybind11/chrono.h>
#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;

using std::string;
using std::vector;

#include "anchors.h"
#include "board.h"
#include "cross_checks.h"
#include "errors.h"
#include "gaddag.h"
#include "move.h"
#include "move_generator.h"
#include "rack.h"
#include "scorer.h"

PYBIND11_MODULE(cpp_scrabble, m) {
  m.doc() = "C++ Scrabble move generation";

  py::register_exception<ConstructionError>(m, "ConstructionError");
  py::register_exception<IllegalMoveError>(m, "IllegalMoveError");
  py::register_exception<CancellationError>(m, "CancellationError");

  py::enum_<Axis>(m, "Axis")
      .value("HORIZONTAL", kHorizontal)
      .value("VERTICAL", kVertical);

  py::class_<Gaddag>(m, "Gaddag")
      .def(py::init())
      .def("Root", &Gaddag::Root)
      .def("Descend", &Gaddag::Descend)
      .def("IsWord", &Gaddag::IsWord)
      .def("FindPath", &Gaddag::FindPath)
      .def("Contains", &Gaddag::Contains)
      .def("NumNodes", &Gaddag::NumNodes)
      .def("NumEdges", &Gaddag::NumEdges)
      .def("NumWords", &Gaddag::NumWords)
      .def(
          "Serialize",
          [](const Gaddag& g) { return py::bytes(g.Serialize()); }
      )
      .def_static("Build", &Gaddag::Build)
      .def_static("Deserialize", &Gaddag::Deserialize)
      .def_static("CreateFromFile", &Gaddag::CreateFromFileStr);

  py::class_<Rack>(m, "Rack")
      .def(py::init())
      .def(py::init([](const string& tiles) {
        Rack r;
        if (!r.Parse(tiles)) {
          throw py::value_error("Invalid rack: " + tiles);
        }
        return r;
      }))
      .def("Parse", &Rack::Parse)
      .def("Size", &Rack::Size)
      .def("NumBlanks", &Rack::NumBlanks)
      .def("__str__", &Rack::AsString);

  py::class_<Board>(m, "Board")
      .def(py::init())
      .def(
          "Place",
          &Board::Place,
          py::arg("row"),
          py::arg("col"),
          py::arg("letter"),
          py::arg("is_blank") = false
      )
      .def("Apply", &Board::Apply)
      .def("IsEmpty", &Board::IsEmpty)
      .def("NumTiles", &Board::NumTiles)
      .def(
          "LetterAt",
          [](const Board& b, int row, int col) {
            return b.IsOccupied(row, col) ? string(1, b.At(row, col).letter) : string();
          }
      )
      .def("ParseBoard", &Board::ParseBoardStr)
      .def("__str__", &Board::AsString);

  py::class_<Placement>(m, "Placement")
      .def_readonly("row", &Placement::row)
      .def_readonly("col", &Placement::col)
      .def_readonly("letter", &Placement::letter)
      .def_readonly("is_blank", &Placement::is_blank);

  py::class_<Move>(m, "Move")
      .def_readonly("axis", &Move::axis)
      .def_readonly("row", &Move::row)
      .def_readonly("col", &Move::col)
      .def_readonly("placements", &Move::placements)
      .def_readonly("words", &Move::words)
      .def_readonly("score", &Move::score)
      .def("__str__", &Move::ToString);

  py::class_<CrossChecks>(m, "CrossChecks")
      .def(py::init<const Gaddag*>(), py::keep_alive<1, 2>())
      .def("Compute", &CrossChecks::Compute)
      .def("Allowed", &CrossChecks::Allowed)
      .def("IsAllowed", &CrossChecks::IsAllowed)
      .def("HasCrossWord", &CrossChecks::HasCrossWord)
      .def("CrossSum", &CrossChecks::CrossSum);

  py::class_<GenerateOptions>(m, "GenerateOptions")
      .def(py::init())
      .def_readwrite("should_cancel", &GenerateOptions::should_cancel)
      .def_readwrite("time_budget", &GenerateOptions::time_budget);

  // The generator only reads the Gaddag; keep it alive as long as we are.
  py::class_<MoveGenerator>(m, "MoveGenerator")
      .def(py::init<const Gaddag*>(), py::keep_alive<1, 2>())
      .def(
          "Generate",
          &MoveGenerator::Generate,
          py::arg("board"),
          py::arg("rack"),
          py::arg("options") = GenerateOptions()
      )
      .def(
          "LastCrossChecks",
          &MoveGenerator::LastCrossChecks,
          py::return_value_policy::reference_internal
      );

  m.def("ScoreMove", &ScoreMove);
  m.def("FindAnchors", &FindAnchors);
}
