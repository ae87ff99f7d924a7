#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <string>
#include <vector>
#include "sonar/detection_api.h"
#include "sonar/errors.h"

namespace py = pybind11;

void bind_profiles(py::module_& m);
void bind_acoustic(py::module_& m);
void bind_comparison(py::module_& m);
void bind_sweep(py::module_& m);

namespace {

// Name-based API on the built-in catalog and default model
void bind_api(py::module_& m) {
    using Names = std::vector<std::string>;

    m.def("compute_snr",
        py::overload_cast<const std::string&, double, double, double>(&sonar::compute_snr),
        py::arg("profile_name"), py::arg("speed_kn"), py::arg("range_m"),
        py::arg("ambient_noise_db") = sonar::DEFAULT_AMBIENT_NOISE_DB,
        "SNR for one built-in profile");

    m.def("list_profiles",
        py::overload_cast<>(&sonar::list_profiles),
        "Built-in profile summaries in registration order");

    m.def("compare_all",
        py::overload_cast<const Names&, double, double, double>(&sonar::compare_all),
        py::arg("profile_names"), py::arg("speed_kn"), py::arg("range_m"),
        py::arg("ambient_noise_db") = sonar::DEFAULT_AMBIENT_NOISE_DB,
        "SNR for each named profile, in the given order");

    m.def("quietest_at",
        py::overload_cast<const Names&, double, double, double>(&sonar::quietest_at),
        py::arg("profile_names"), py::arg("speed_kn"), py::arg("range_m"),
        py::arg("ambient_noise_db") = sonar::DEFAULT_AMBIENT_NOISE_DB,
        "Hardest-to-detect profile among the named ones");

    m.def("loudest_at",
        py::overload_cast<const Names&, double, double, double>(&sonar::loudest_at),
        py::arg("profile_names"), py::arg("speed_kn"), py::arg("range_m"),
        py::arg("ambient_noise_db") = sonar::DEFAULT_AMBIENT_NOISE_DB,
        "Easiest-to-detect profile among the named ones");
}

} // namespace

PYBIND11_MODULE(_sonar_core, m) {
    m.doc() = "Passive sonar detectability kernels";

    py::register_exception<sonar::DomainError>(m, "DomainError", PyExc_ValueError);
    py::register_exception<sonar::NotFoundError>(m, "NotFoundError", PyExc_KeyError);

    auto profiles = m.def_submodule("profiles", "Submarine acoustic profiles");
    bind_profiles(profiles);

    auto acoustic = m.def_submodule("acoustic", "Source level, transmission loss and SNR");
    bind_acoustic(acoustic);

    auto comparison = m.def_submodule("comparison", "Multi-profile evaluation and ranking");
    bind_comparison(comparison);

    auto sweep = m.def_submodule("sweep", "Speed/range curves and SNR grids");
    bind_sweep(sweep);

    bind_api(m);
}
