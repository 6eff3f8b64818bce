#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

#include "grid_rtree/config.h"
#include "grid_rtree/errors.h"
#include "grid_rtree/rover.h"
#include "grid_rtree/rtree.h"
#include "grid_rtree/rtree_json.h"

namespace py = pybind11;

using grid_rtree::GridPoint;

// Point index holding arbitrary Python objects.
class PointIndex {
public:
    explicit PointIndex(std::size_t fill_factor) : tree_(fill_factor) {}

    py::object insert(std::int32_t x, std::int32_t y, py::object value) {
        auto old = tree_.insert(GridPoint{x, y}, std::move(value));
        if (!old) {
            return py::none();
        }
        return std::move(*old);
    }

    py::object find(std::int32_t x, std::int32_t y) const {
        const py::object *value = tree_.find(GridPoint{x, y});
        if (value == nullptr) {
            return py::none();
        }
        return *value;
    }

    bool contains(const std::pair<std::int32_t, std::int32_t> &p) const {
        return tree_.contains(GridPoint{p.first, p.second});
    }

    std::size_t size() const { return tree_.size(); }
    std::size_t fill_factor() const { return tree_.fill_factor(); }

    // Structure only; values are Python objects.
    std::string to_json() const { return grid_rtree::tree_to_json(tree_).dump(); }

private:
    grid_rtree::RTree<std::int32_t, py::object> tree_;
};

// Returns {"x": int, "y": int, "cleaned": int}.
static py::dict run(const std::string &text, std::size_t fill_factor) {
    grid_rtree::Config config;
    config.fill_factor = fill_factor;
    std::istringstream in(text);
    grid_rtree::RunResult result;
    try {
        result = grid_rtree::run_simulation(in, config);
    } catch (const grid_rtree::ParseError &e) {
        throw std::runtime_error("line " + std::to_string(e.line()) + ": " + e.what());
    }
    py::dict out;
    out["x"] = result.rover.x;
    out["y"] = result.rover.y;
    out["cleaned"] = result.cleaned;
    return out;
}

PYBIND11_MODULE(grid_rtree_py, m) {
    m.doc() = "Point R-tree over an integer grid and the rover simulation built on it.";

    py::class_<PointIndex>(m, "PointIndex")
        .def(py::init<std::size_t>(), py::arg("fill_factor") = grid_rtree::RTree<std::int32_t, py::object>::default_fill_factor)
        .def("insert", &PointIndex::insert, py::arg("x"), py::arg("y"), py::arg("value"),
             "Bind value to (x, y). Returns the previous value or None.")
        .def("find", &PointIndex::find, py::arg("x"), py::arg("y"),
             "Value bound to (x, y), or None.")
        .def("__contains__", &PointIndex::contains)
        .def("__len__", &PointIndex::size)
        .def_property_readonly("fill_factor", &PointIndex::fill_factor)
        .def("to_json", &PointIndex::to_json,
             "Tree structure as a JSON string (values are left out).");

    m.def("run", &run, py::arg("text"), py::arg("fill_factor") = grid_rtree::Config{}.fill_factor,
          "Parse a map, drive the rover and return {x, y, cleaned}. Raises RuntimeError on bad input.");
}
