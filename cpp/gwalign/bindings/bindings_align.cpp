#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "align_params.hpp"
#include "align/align_time.hpp"
#include "align/align_time_phase.hpp"

namespace py = pybind11;
using namespace gwalign;

void init_bindings_align(py::module &m) {
    // InvalidWindow 在 Python 侧是 ValueError 的子类
    py::register_exception<InvalidWindow>(m, "InvalidWindow", PyExc_ValueError);

    py::class_<AlignConfig>(m, "AlignConfig")
        .def(py::init<>())
        .def_readwrite("n_brute_force_dt", &AlignConfig::n_brute_force_dt)
        .def_readwrite("n_brute_force_dphi", &AlignConfig::n_brute_force_dphi)
        .def_readwrite("include_modes", &AlignConfig::include_modes)
        .def_readwrite("max_iter", &AlignConfig::max_iter)
        .def_readwrite("xtol", &AlignConfig::xtol)
        .def_readwrite("gtol", &AlignConfig::gtol)
        .def_readwrite("ftol", &AlignConfig::ftol)
        .def_readwrite("verbose", &AlignConfig::verbose);

    py::class_<OptimizationResult>(m, "OptimizationResult")
        .def_readonly("x", &OptimizationResult::x)
        .def_readonly("seed", &OptimizationResult::seed)
        .def_readonly("cost", &OptimizationResult::cost)
        .def_readonly("converged", &OptimizationResult::converged)
        .def_readonly("iterations", &OptimizationResult::iterations)
        .def_readonly("n_brute_force", &OptimizationResult::n_brute_force)
        .def_readonly("status", &OptimizationResult::status)
        .def_readonly("message", &OptimizationResult::message)
        .def("__repr__", [](const OptimizationResult &r) {
            return "<OptimizationResult cost=" + std::to_string(r.cost) +
                   " converged=" + (r.converged ? std::string("True") : std::string("False")) + ">";
        });

    m.def("align_time", &align_time,
          "Time shift dt minimizing the norm mismatch of wa and wb on [t1, t2]",
          py::arg("wa"), py::arg("wb"), py::arg("t1"), py::arg("t2"),
          py::arg("n_brute_force") = 0);

    m.def("align_time_full", &align_time_full,
          "Like align_time, but returns the full optimization result",
          py::arg("wa"), py::arg("wb"), py::arg("t1"), py::arg("t2"),
          py::arg("config") = AlignConfig());

    // 两个重载: 显式参数 / AlignConfig
    m.def("align_time_phase",
          py::overload_cast<const WaveformModes&, const WaveformModes&, double, double,
                            std::size_t, std::size_t,
                            const std::vector<std::pair<int, int>>&>(&align_time_phase),
          "Time and phase shift applied to wa; returns (result, wa_prime)",
          py::arg("wa"), py::arg("wb"), py::arg("t1"), py::arg("t2"),
          py::arg("n_brute_force_dt") = 0,
          py::arg("n_brute_force_dphi") = 5,
          py::arg("include_modes") = std::vector<std::pair<int, int>>());

    m.def("align_time_phase",
          py::overload_cast<const WaveformModes&, const WaveformModes&, double, double,
                            const AlignConfig&>(&align_time_phase),
          py::arg("wa"), py::arg("wb"), py::arg("t1"), py::arg("t2"), py::arg("config"));
}
