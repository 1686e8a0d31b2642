#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "wisched/dag/compatibility_graph.hpp"
#include "wisched/dag/digraph.hpp"
#include "wisched/dag/path_reconstruction.hpp"
#include "wisched/errors.hpp"
#include "wisched/intervals/interval.hpp"
#include "wisched/intervals/interval_store.hpp"
#include "wisched/io/format.hpp"
#include "wisched/io/text_input.hpp"
#include "wisched/scheduler.hpp"

#include <tuple>

namespace py = pybind11;
using namespace wisched;

namespace {

std::vector<Triple> to_triples(const std::vector<std::tuple<double, double, double>>& items) {
    std::vector<Triple> triples;
    triples.reserve(items.size());
    for (const auto& [start, finish, weight] : items) {
        triples.push_back(Triple{start, finish, weight});
    }
    return triples;
}

} // namespace

PYBIND11_MODULE(pywisched, m) {
    m.doc() = "wisched - weighted interval scheduling via longest paths in a compatibility DAG";

    // ValidationError and ParseError derive from std::invalid_argument /
    // std::runtime_error; register them so Python sees ValueError for both.
    py::register_exception<ValidationError>(m, "ValidationError", PyExc_ValueError);
    py::register_exception<ParseError>(m, "ParseError", PyExc_ValueError);
    py::register_exception<InternalInvariantViolation>(
        m, "InternalInvariantViolation", PyExc_RuntimeError);

    // Intervals module
    auto m_intervals = m.def_submodule("intervals", "Validated interval storage");

    py::class_<intervals::Interval>(m_intervals, "Interval")
        .def_property_readonly("start", &intervals::Interval::start)
        .def_property_readonly("finish", &intervals::Interval::finish)
        .def_property_readonly("weight", &intervals::Interval::weight)
        .def("precedes", &intervals::Interval::precedes)
        .def("overlaps", &intervals::Interval::overlaps)
        .def("__eq__", &intervals::Interval::operator==)
        .def("__str__", &intervals::Interval::to_string)
        .def("__repr__", [](const intervals::Interval& i) {
            return "Interval(start=" + py::repr(py::float_(i.start())).cast<std::string>() +
                   ", finish=" + py::repr(py::float_(i.finish())).cast<std::string>() +
                   ", weight=" + py::repr(py::float_(i.weight())).cast<std::string>() + ")";
        });

    py::class_<intervals::IntervalStore>(m_intervals, "IntervalStore")
        .def(py::init<>())
        .def("add", &intervals::IntervalStore::add,
             py::arg("start"), py::arg("finish"), py::arg("weight"),
             py::return_value_policy::copy)
        .def("__len__", &intervals::IntervalStore::size)
        .def("__getitem__", &intervals::IntervalStore::at, py::return_value_policy::copy)
        .def("intervals", &intervals::IntervalStore::snapshot);

    // DAG module
    auto m_dag = m.def_submodule("dag", "Vertex-weighted DAG and longest paths");

    py::class_<dag::PathCost>(m_dag, "PathCost")
        .def_readonly("path", &dag::PathCost::path)
        .def_readonly("cost", &dag::PathCost::cost)
        .def("__iter__", [](const dag::PathCost& pc) {
            return py::iter(py::make_tuple(pc.path, pc.cost));
        });

    py::class_<dag::Digraph>(m_dag, "Digraph")
        .def(py::init<>())
        .def("add_vertex", &dag::Digraph::add_vertex, py::arg("weight"))
        .def("add_edge", &dag::Digraph::add_edge, py::arg("src"), py::arg("dest"))
        .def_property_readonly("order", &dag::Digraph::order)
        .def_property_readonly("size", &dag::Digraph::size)
        .def("in_degree", &dag::Digraph::in_degree)
        .def("out_edges", &dag::Digraph::out_edges)
        .def("roots", &dag::Digraph::roots)
        .def("to_dot", &dag::Digraph::to_dot)
        .def("compute_max_cost_path", [](const dag::Digraph& g) {
            return dag::compute_max_cost_path(g);
        });

    m_dag.def("compatibility_dot", [](const intervals::IntervalStore& store) {
        return dag::CompatibilityGraph(store.snapshot()).graph().to_dot();
    });

    // Solving
    py::class_<Schedule>(m, "Schedule")
        .def_readonly("intervals", &Schedule::intervals)
        .def_readonly("total_cost", &Schedule::total_cost)
        .def("__len__", &Schedule::size)
        .def("summary", [](const Schedule& s) { return io::format_summary(s); })
        .def("__str__", [](const Schedule& s) { return io::format_schedule(s); });

    m.def("solve",
          [](const std::vector<std::tuple<double, double, double>>& items) {
              return solve(to_triples(items));
          },
          py::arg("triples"));

    m.def("solve_store",
          [](const intervals::IntervalStore& store) { return solve(store); },
          py::arg("store"));

    m.def("solve_text_input",
          [](const std::vector<std::string>& lines) { return io::solve_text_input(lines); },
          py::arg("lines"));

    // Utility functions
    m.def("version", []() { return "0.1.0"; });
}
