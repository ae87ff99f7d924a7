#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <string>
#include <utility>
#include <vector>
#include "sonar/profile_registry.h"

namespace py = pybind11;

void bind_profiles(py::module_& m) {
    py::class_<sonar::SubmarineProfile>(m, "SubmarineProfile")
        .def(py::init([](std::string name, double base_noise_db,
                         double cavitation_onset_kn, double noise_growth,
                         double cavitation_scale, double cavitation_exponent,
                         double max_submerged_speed_kn) {
                return sonar::SubmarineProfile{
                    std::move(name), base_noise_db, cavitation_onset_kn,
                    noise_growth, cavitation_scale, cavitation_exponent,
                    max_submerged_speed_kn};
            }),
            py::arg("name"), py::arg("base_noise_db"),
            py::arg("cavitation_onset_kn"), py::arg("noise_growth"),
            py::arg("cavitation_scale"), py::arg("cavitation_exponent"),
            py::arg("max_submerged_speed_kn") = 0.0)
        .def_readonly("name", &sonar::SubmarineProfile::name)
        .def_readonly("base_noise_db", &sonar::SubmarineProfile::base_noise_db)
        .def_readonly("cavitation_onset_kn", &sonar::SubmarineProfile::cavitation_onset_kn)
        .def_readonly("noise_growth", &sonar::SubmarineProfile::noise_growth)
        .def_readonly("cavitation_scale", &sonar::SubmarineProfile::cavitation_scale)
        .def_readonly("cavitation_exponent", &sonar::SubmarineProfile::cavitation_exponent)
        .def_readonly("max_submerged_speed_kn", &sonar::SubmarineProfile::max_submerged_speed_kn)
        .def("__repr__", [](const sonar::SubmarineProfile& p) {
            return "<SubmarineProfile '" + p.name + "'>";
        });

    py::class_<sonar::ProfileSummary>(m, "ProfileSummary")
        .def_readonly("name", &sonar::ProfileSummary::name)
        .def_readonly("base_noise_db", &sonar::ProfileSummary::base_noise_db)
        .def_readonly("cavitation_onset_kn", &sonar::ProfileSummary::cavitation_onset_kn)
        .def_readonly("max_submerged_speed_kn", &sonar::ProfileSummary::max_submerged_speed_kn);

    py::class_<sonar::ProfileRegistry>(m, "ProfileRegistry")
        .def(py::init<>())
        .def(py::init<std::vector<sonar::SubmarineProfile>>(), py::arg("profiles"))
        .def("add", &sonar::ProfileRegistry::add, py::arg("profile"))
        .def("resolve", &sonar::ProfileRegistry::resolve, py::arg("name"),
            py::return_value_policy::reference_internal,
            "Case-insensitive lookup; raises NotFoundError")
        .def("contains", &sonar::ProfileRegistry::contains, py::arg("name"))
        .def("list_all", &sonar::ProfileRegistry::list_all,
            "Profile summaries in registration order")
        .def("__len__", &sonar::ProfileRegistry::size);

    m.def("builtin_registry", &sonar::builtin_registry,
        py::return_value_policy::reference,
        "Process-wide catalog of built-in submarine classes");

    m.def("fit_cavitation_scale", &sonar::fit_cavitation_scale,
        py::arg("onset_kn"), py::arg("max_speed_kn"), py::arg("exponent"),
        "Cavitation scale A giving a 10 dB increment at top speed");
}
