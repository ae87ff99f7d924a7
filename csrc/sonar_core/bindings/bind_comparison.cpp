#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "sonar/comparison_ops.h"

namespace py = pybind11;

void bind_comparison(py::module_& m) {
    m.def("evaluate_all", &sonar::evaluate_all,
        py::arg("model"), py::arg("profiles"), py::arg("scenario"),
        "One SNRResult per profile, in input order");

    m.def("quietest", &sonar::quietest,
        py::arg("model"), py::arg("profiles"), py::arg("scenario"),
        "Profile with the lowest SNR (first wins ties)");

    m.def("loudest", &sonar::loudest,
        py::arg("model"), py::arg("profiles"), py::arg("scenario"),
        "Profile with the highest SNR (first wins ties)");
}
