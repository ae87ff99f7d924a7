#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>
#include "sonar/sweep_ops.h"

namespace py = pybind11;

void bind_sweep(py::module_& m) {
    m.def("noise_level_curve", &sonar::noise_level_curve,
        py::arg("model"), py::arg("profile"), py::arg("speeds_kn"),
        "(S,) source level for each speed");

    m.def("transmission_loss_curve", &sonar::transmission_loss_curve,
        py::arg("model"), py::arg("ranges_m"),
        "(R,) transmission loss for each range");

    m.def("snr_grid", &sonar::snr_grid,
        py::arg("model"), py::arg("profile"),
        py::arg("speeds_kn"), py::arg("ranges_m"),
        py::arg("ambient_noise_db") = sonar::DEFAULT_AMBIENT_NOISE_DB,
        "(S,R) SNR grid: rows are speeds, columns are ranges");

    m.def("linspace_speeds", &sonar::linspace_speeds,
        py::arg("profile"), py::arg("n") = 50,
        "n evenly spaced speeds from 0 to the profile's top speed");
}
