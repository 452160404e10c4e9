#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/complex.h>
#include "waveform/waveform_modes.hpp"

namespace py = pybind11;
using namespace gwalign;

void init_bindings_waveform(py::module &m) {
    py::class_<WaveformModes>(m, "WaveformModes")
        .def(py::init<std::vector<double>, std::vector<std::complex<double>>, int, int>(),
             py::arg("t"), py::arg("data"), py::arg("ell_min"), py::arg("ell_max"),
             "data 为行优先的 (n_times, n_modes) 展平数组")
        .def_property_readonly("t", &WaveformModes::t)
        .def_property_readonly("data", &WaveformModes::data)
        .def_property_readonly("ell_min", &WaveformModes::ell_min)
        .def_property_readonly("ell_max", &WaveformModes::ell_max)
        .def_property_readonly("n_times", &WaveformModes::n_times)
        .def_property_readonly("n_modes", &WaveformModes::n_modes)
        .def_property_readonly("t_min", &WaveformModes::t_min)
        .def_property_readonly("t_max", &WaveformModes::t_max)
        .def("index", &WaveformModes::index, py::arg("ell"), py::arg("m"))
        .def("mode", &WaveformModes::mode, py::arg("ell"), py::arg("m"))
        .def("norm", &WaveformModes::norm)
        .def("power", &WaveformModes::power)
        .def("mode_weights", &WaveformModes::mode_weights)
        .def("max_norm_time", &WaveformModes::max_norm_time)
        .def("time_shifted", &WaveformModes::time_shifted, py::arg("dt"))
        .def("zero_mode", &WaveformModes::zero_mode, py::arg("ell"), py::arg("m"))
        .def("copy", [](const WaveformModes &w) { return WaveformModes(w); })
        .def("__repr__", [](const WaveformModes &w) {
            return "<WaveformModes n_times=" + std::to_string(w.n_times()) +
                   " ell=(" + std::to_string(w.ell_min()) + ", " + std::to_string(w.ell_max()) + ")>";
        });

    m.def("LM_index", &LM_index, py::arg("ell"), py::arg("m"), py::arg("ell_min"));
}
