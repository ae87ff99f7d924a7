#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <string>
#include "sonar/acoustic_model.h"

namespace py = pybind11;

void bind_acoustic(py::module_& m) {
    m.attr("DEFAULT_ABSORPTION_DB_PER_M") = sonar::DEFAULT_ABSORPTION_DB_PER_M;
    m.attr("DEFAULT_AMBIENT_NOISE_DB") = sonar::DEFAULT_AMBIENT_NOISE_DB;

    py::class_<sonar::Scenario>(m, "Scenario")
        .def(py::init([](double speed_kn, double range_m, double ambient_noise_db) {
                return sonar::Scenario{speed_kn, range_m, ambient_noise_db};
            }),
            py::arg("speed_kn"), py::arg("range_m"),
            py::arg("ambient_noise_db") = sonar::DEFAULT_AMBIENT_NOISE_DB)
        .def_readwrite("speed_kn", &sonar::Scenario::speed_kn)
        .def_readwrite("range_m", &sonar::Scenario::range_m)
        .def_readwrite("ambient_noise_db", &sonar::Scenario::ambient_noise_db);

    py::class_<sonar::SNRResult>(m, "SNRResult")
        .def_readonly("profile_id", &sonar::SNRResult::profile_id)
        .def_readonly("noise_level_db", &sonar::SNRResult::noise_level_db)
        .def_readonly("transmission_loss_db", &sonar::SNRResult::transmission_loss_db)
        .def_readonly("snr_db", &sonar::SNRResult::snr_db)
        .def("__repr__", [](const sonar::SNRResult& r) {
            return "<SNRResult '" + r.profile_id + "' snr=" +
                   std::to_string(r.snr_db) + " dB>";
        });

    py::class_<sonar::AcousticModel>(m, "AcousticModel")
        .def(py::init([](double absorption_db_per_m) {
                return sonar::AcousticModel(sonar::ModelConfig{absorption_db_per_m});
            }),
            py::arg("absorption_db_per_m") = sonar::DEFAULT_ABSORPTION_DB_PER_M)
        .def_property_readonly("absorption_db_per_m", [](const sonar::AcousticModel& model) {
            return model.config().absorption_db_per_m;
        })
        .def("cavitation_increment", &sonar::AcousticModel::cavitation_increment,
            py::arg("profile"), py::arg("speed_kn"),
            "Cavitation noise increment in dB (0 at or below onset speed)")
        .def("noise_level", &sonar::AcousticModel::noise_level,
            py::arg("profile"), py::arg("speed_kn"),
            "Source noise level in dB")
        .def("transmission_loss", &sonar::AcousticModel::transmission_loss,
            py::arg("range_m"),
            "Spreading plus absorption loss in dB")
        .def("snr", &sonar::AcousticModel::snr,
            py::arg("profile"), py::arg("scenario"),
            "Signal-to-noise ratio in dB")
        .def("evaluate", &sonar::AcousticModel::evaluate,
            py::arg("profile"), py::arg("scenario"),
            "Noise level, transmission loss and SNR for one profile");
}
