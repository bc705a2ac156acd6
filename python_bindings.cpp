#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <cstdint>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "voxstore/errors.hpp"
#include "voxstore/rx/reader.hpp"
#include "voxstore/sim/noise.hpp"
#include "voxstore/tx/writer.hpp"

namespace py = pybind11;

static std::vector<uint8_t> bytes_to_vector(const py::bytes& b) {
    std::string s = b;
    return std::vector<uint8_t>(s.begin(), s.end());
}

static py::bytes vector_to_bytes(const std::vector<uint8_t>& v) {
    return py::bytes(reinterpret_cast<const char*>(v.data()), v.size());
}

PYBIND11_MODULE(voxstore_py, m) {
    m.doc() = "5D optical storage codec bindings";

    py::register_exception<voxstore::ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
    py::register_exception<voxstore::ValidationError>(m, "ValidationError", PyExc_ValueError);
    py::register_exception<voxstore::CapacityError>(m, "CapacityError", PyExc_ValueError);
    py::register_exception<voxstore::DataError>(m, "DataError", PyExc_ValueError);

    // WriterConfig class
    py::class_<voxstore::tx::WriterConfig>(m, "WriterConfig")
        .def(py::init<>())
        .def_property("grid_size",
            [](const voxstore::tx::WriterConfig& c) { return py::make_tuple(c.grid.x, c.grid.y, c.grid.z); },
            [](voxstore::tx::WriterConfig& c, std::tuple<int, int, int> g) {
                c.grid = {std::get<0>(g), std::get<1>(g), std::get<2>(g)};
            })
        .def_readwrite("intensity_levels", &voxstore::tx::WriterConfig::intensity_levels)
        .def_readwrite("polarization_states", &voxstore::tx::WriterConfig::polarization_states)
        .def_property("intensity_range",
            [](const voxstore::tx::WriterConfig& c) { return py::make_tuple(c.intensity_range.min, c.intensity_range.max); },
            [](voxstore::tx::WriterConfig& c, std::pair<double, double> r) { c.intensity_range = {r.first, r.second}; })
        .def_property("polarization_range",
            [](const voxstore::tx::WriterConfig& c) { return py::make_tuple(c.polarization_range.min, c.polarization_range.max); },
            [](voxstore::tx::WriterConfig& c, std::pair<double, double> r) { c.polarization_range = {r.first, r.second}; })
        .def_property("error_correction",
            [](const voxstore::tx::WriterConfig& c) { return std::string(c.ecc.name()); },
            [](voxstore::tx::WriterConfig& c, const std::string& name) {
                c.ecc = voxstore::fec::ErrorCorrection::from_name(name);
            });

    // Voxel class
    py::class_<voxstore::Voxel>(m, "Voxel")
        .def(py::init<int, int, int, double, double>(),
             py::arg("x"), py::arg("y"), py::arg("z"), py::arg("intensity"), py::arg("polarization"))
        .def_property_readonly("x", &voxstore::Voxel::x)
        .def_property_readonly("y", &voxstore::Voxel::y)
        .def_property_readonly("z", &voxstore::Voxel::z)
        .def_property_readonly("intensity", &voxstore::Voxel::intensity)
        .def_property_readonly("polarization", &voxstore::Voxel::polarization);

    // StoragePattern class
    py::class_<voxstore::StoragePattern>(m, "StoragePattern")
        .def_property_readonly("voxel_count", &voxstore::StoragePattern::voxel_count)
        .def_property_readonly("bits_per_voxel", &voxstore::StoragePattern::bits_per_voxel)
        .def_property_readonly("padding_bits", &voxstore::StoragePattern::padding_bits)
        .def_property_readonly("voxels", &voxstore::StoragePattern::voxels)
        .def("summary", &voxstore::StoragePattern::summary);

    // ReadResult class
    py::class_<voxstore::rx::ReadResult>(m, "ReadResult")
        .def_property_readonly("data", [](const voxstore::rx::ReadResult& r) { return vector_to_bytes(r.data); })
        .def_readonly("corrected_errors", &voxstore::rx::ReadResult::corrected_errors)
        .def_readonly("detected_uncorrectable", &voxstore::rx::ReadResult::detected_uncorrectable)
        .def_readonly("voxels_used", &voxstore::rx::ReadResult::voxels_used);

    m.def("write", [](const py::bytes& data, const voxstore::tx::WriterConfig& config) {
        return voxstore::tx::LaserWriter(config).write(bytes_to_vector(data));
    }, "Encode bytes into a storage pattern", py::arg("data"), py::arg("config"));

    m.def("read", [](const voxstore::StoragePattern& pattern,
                     std::optional<std::vector<voxstore::Voxel>> voxels) {
        voxstore::rx::LaserReader reader(pattern);
        return voxels ? reader.read(*voxels) : reader.read();
    }, "Decode a storage pattern, optionally from measured voxels", py::arg("pattern"),
       py::arg("voxels") = py::none());

    m.def("apply_gaussian_noise", &voxstore::sim::apply_gaussian_noise,
          "Perturb and clamp the voxels of a pattern", py::arg("pattern"), py::arg("intensity_std"),
          py::arg("polarization_std"), py::arg("seed") = py::none());

    // Noisy readback in one call; the perturbed voxels stay on the C++ side.
    m.def("read_with_noise", [](const voxstore::StoragePattern& pattern, double intensity_std,
                                double polarization_std, std::optional<uint32_t> seed) {
        auto noisy = voxstore::sim::apply_gaussian_noise(pattern, intensity_std, polarization_std, seed);
        return voxstore::rx::LaserReader(pattern).read(noisy);
    }, "Apply Gaussian measurement noise and decode", py::arg("pattern"), py::arg("intensity_std"),
       py::arg("polarization_std"), py::arg("seed") = py::none());
}
