#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>
#include <pybind11/functional.h>

#include "bbox_minimizer/bbox_minimizer.hpp"

namespace py = pybind11;

namespace {

bbox_minimizer::PointCloud points_from_array(
    const py::array_t<double, py::array::c_style | py::array::forcecast>& arr
) {
    if (arr.ndim() != 2 || arr.shape(1) != 3) {
        throw py::value_error("points must have shape (N, 3)");
    }
    auto buf = arr.unchecked<2>();
    const py::ssize_t n = buf.shape(0);
    bbox_minimizer::PointCloud points;
    points.reserve(static_cast<size_t>(n));
    for (py::ssize_t i = 0; i < n; ++i) {
        points.push_back(bbox_minimizer::Vec3{buf(i, 0), buf(i, 1), buf(i, 2)});
    }
    return points;
}

std::vector<bbox_minimizer::Vec3> presets_from_list(const std::vector<std::array<double, 3>>& presets) {
    std::vector<bbox_minimizer::Vec3> out;
    out.reserve(presets.size());
    for (const auto& p : presets) {
        out.emplace_back(p[0], p[1], p[2]);
    }
    return out;
}

py::tuple vec_to_tuple(const bbox_minimizer::Vec3& v) {
    return py::make_tuple(v.x, v.y, v.z);
}

// Recognized keys only; anything else raises KeyError
bbox_minimizer::OptimizerConfig config_from_dict(const py::dict& options) {
    bbox_minimizer::OptimizerConfig config;
    for (const auto& item : options) {
        const std::string key = py::cast<std::string>(item.first);
        const py::handle value = item.second;
        if (key == "adaptive_steps") {
            config.adaptive_steps = py::cast<std::vector<double>>(value);
        } else if (key == "fast_adaptive_steps") {
            config.fast_adaptive_steps = py::cast<std::vector<double>>(value);
        } else if (key == "use_pca_initial_guess") {
            config.use_pca_initial_guess = py::cast<bool>(value);
        } else if (key == "fast_mode") {
            config.fast_mode = py::cast<bool>(value);
        } else if (key == "z_only") {
            config.z_only = py::cast<bool>(value);
        } else if (key == "max_time") {
            config.max_time = py::cast<double>(value);
        } else if (key == "max_presets") {
            config.max_presets = py::cast<size_t>(value);
        } else if (key == "max_refine_sweeps") {
            config.max_refine_sweeps = py::cast<int>(value);
        } else if (key == "fast_max_refine_sweeps") {
            config.fast_max_refine_sweeps = py::cast<int>(value);
        } else if (key == "improvement_tolerance") {
            config.improvement_tolerance = py::cast<double>(value);
        } else if (key == "auto_fast_mode_vertex_threshold") {
            config.auto_fast_mode_vertex_threshold = py::cast<size_t>(value);
        } else {
            throw py::key_error("unknown optimizer option: " + key);
        }
    }
    config.validate();
    return config;
}

}  // namespace

PYBIND11_MODULE(bbox_minimizer_cpp, m) {
    m.doc() = "C++ implementation of bounding box minimizing rotation search";

    // Vec3
    py::class_<bbox_minimizer::Vec3>(m, "Vec3")
        .def(py::init<>())
        .def(py::init<double, double, double>())
        .def_readwrite("x", &bbox_minimizer::Vec3::x)
        .def_readwrite("y", &bbox_minimizer::Vec3::y)
        .def_readwrite("z", &bbox_minimizer::Vec3::z)
        .def("to_tuple", &vec_to_tuple)
        .def("__repr__", [](const bbox_minimizer::Vec3& v) {
            return "Vec3(" + std::to_string(v.x) + ", " + std::to_string(v.y) + ", " + std::to_string(v.z) + ")";
        });

    // Rotation (radians)
    py::class_<bbox_minimizer::Rotation>(m, "Rotation")
        .def(py::init<>())
        .def(py::init([](double x, double y, double z) {
            return bbox_minimizer::Rotation{x, y, z};
        }), py::arg("x"), py::arg("y"), py::arg("z"))
        .def_static("from_degrees", [](double x, double y, double z) {
            return bbox_minimizer::Rotation::from_degrees(x, y, z);
        }, py::arg("x"), py::arg("y"), py::arg("z"))
        .def_readwrite("x", &bbox_minimizer::Rotation::x)
        .def_readwrite("y", &bbox_minimizer::Rotation::y)
        .def_readwrite("z", &bbox_minimizer::Rotation::z)
        .def("to_degrees", [](const bbox_minimizer::Rotation& self) {
            return vec_to_tuple(self.to_degrees());
        })
        .def("compose", [](const bbox_minimizer::Rotation& self, const bbox_minimizer::Rotation& offset) {
            return bbox_minimizer::compose(self, offset);
        })
        .def("__repr__", &bbox_minimizer::Rotation::to_string);

    // AabbMetrics
    py::class_<bbox_minimizer::AabbMetrics>(m, "AabbMetrics")
        .def(py::init<>())
        .def_readwrite("volume", &bbox_minimizer::AabbMetrics::volume)
        .def_readwrite("footprint", &bbox_minimizer::AabbMetrics::footprint)
        .def_readwrite("width", &bbox_minimizer::AabbMetrics::width)
        .def_readwrite("depth", &bbox_minimizer::AabbMetrics::depth)
        .def_readwrite("height", &bbox_minimizer::AabbMetrics::height)
        .def_readwrite("min_point", &bbox_minimizer::AabbMetrics::min_point)
        .def_readwrite("max_point", &bbox_minimizer::AabbMetrics::max_point)
        .def_readwrite("empty", &bbox_minimizer::AabbMetrics::empty)
        .def_static("from_box", [](const bbox_minimizer::Vec3& min_point, const bbox_minimizer::Vec3& max_point) {
            return bbox_minimizer::AabbMetrics::from_box(bbox_minimizer::AABB3{min_point, max_point});
        })
        .def("min_z", &bbox_minimizer::AabbMetrics::min_z)
        .def("center_xy", [](const bbox_minimizer::AabbMetrics& self) {
            const auto c = self.center_xy();
            return py::make_tuple(c.x, c.y);
        });

    // OptimizerConfig
    py::class_<bbox_minimizer::OptimizerConfig>(m, "OptimizerConfig")
        .def(py::init<>())
        .def(py::init(&config_from_dict), py::arg("options"))
        .def_readwrite("adaptive_steps", &bbox_minimizer::OptimizerConfig::adaptive_steps)
        .def_readwrite("fast_adaptive_steps", &bbox_minimizer::OptimizerConfig::fast_adaptive_steps)
        .def_readwrite("use_pca_initial_guess", &bbox_minimizer::OptimizerConfig::use_pca_initial_guess)
        .def_readwrite("fast_mode", &bbox_minimizer::OptimizerConfig::fast_mode)
        .def_readwrite("z_only", &bbox_minimizer::OptimizerConfig::z_only)
        .def_readwrite("max_time", &bbox_minimizer::OptimizerConfig::max_time)
        .def_readwrite("max_presets", &bbox_minimizer::OptimizerConfig::max_presets)
        .def_readwrite("max_refine_sweeps", &bbox_minimizer::OptimizerConfig::max_refine_sweeps)
        .def_readwrite("fast_max_refine_sweeps", &bbox_minimizer::OptimizerConfig::fast_max_refine_sweeps)
        .def_readwrite("improvement_tolerance", &bbox_minimizer::OptimizerConfig::improvement_tolerance)
        .def_readwrite("auto_fast_mode_vertex_threshold",
            &bbox_minimizer::OptimizerConfig::auto_fast_mode_vertex_threshold)
        .def("validate", &bbox_minimizer::OptimizerConfig::validate);

    // OptimizationResult
    py::class_<bbox_minimizer::OptimizationResult>(m, "OptimizationResult")
        .def_readonly("rotation", &bbox_minimizer::OptimizationResult::rotation)
        .def_readonly("reduction_percent", &bbox_minimizer::OptimizationResult::reduction_percent)
        .def_readonly("initial_volume", &bbox_minimizer::OptimizationResult::initial_volume)
        .def_readonly("best_volume", &bbox_minimizer::OptimizationResult::best_volume)
        .def_readonly("attempts", &bbox_minimizer::OptimizationResult::attempts)
        .def_readonly("failures", &bbox_minimizer::OptimizationResult::failures)
        .def_readonly("elapsed_seconds", &bbox_minimizer::OptimizationResult::elapsed_seconds)
        .def_readonly("degenerate", &bbox_minimizer::OptimizationResult::degenerate)
        .def_readonly("fast_mode", &bbox_minimizer::OptimizationResult::fast_mode)
        .def_readonly("phases_run", &bbox_minimizer::OptimizationResult::phases_run)
        .def("rotation_degrees", [](const bbox_minimizer::OptimizationResult& self) {
            return vec_to_tuple(self.rotation_degrees());
        })
        .def("as_pair", [](const bbox_minimizer::OptimizationResult& self) {
            return py::make_tuple(vec_to_tuple(self.rotation_degrees()), self.reduction_percent);
        });

    // PcaAligner
    py::class_<bbox_minimizer::PcaAligner>(m, "PcaAligner")
        .def(py::init([](double floor_slice_fraction, double pitch_range_deg, double pitch_step_deg,
                         size_t min_floor_points) {
            bbox_minimizer::PcaAligner::Config config;
            config.floor_slice_fraction = floor_slice_fraction;
            config.pitch_range_deg = pitch_range_deg;
            config.pitch_step_deg = pitch_step_deg;
            config.min_floor_points = min_floor_points;
            return bbox_minimizer::PcaAligner(config);
        }),
            py::arg("floor_slice_fraction") = 0.10,
            py::arg("pitch_range_deg") = 5.0,
            py::arg("pitch_step_deg") = 0.2,
            py::arg("min_floor_points") = 3)
        .def("align", [](const bbox_minimizer::PcaAligner& self,
                         py::array_t<double, py::array::c_style | py::array::forcecast> points) -> py::object {
            const auto rotation = self.align(points_from_array(points));
            if (!rotation) {
                return py::none();
            }
            return py::cast(*rotation);
        }, py::arg("points"));

    // RotationGenerator
    py::class_<bbox_minimizer::RotationGenerator>(m, "RotationGenerator")
        .def(py::init<bool, bool>(), py::arg("z_only") = false, py::arg("fast_mode") = false)
        .def("generate_coarse", &bbox_minimizer::RotationGenerator::generate_coarse)
        .def("generate_medium", [](const bbox_minimizer::RotationGenerator& self, double x, double y, double z) {
            return self.generate_medium(bbox_minimizer::Vec3{x, y, z});
        })
        .def("generate_fine", [](const bbox_minimizer::RotationGenerator& self, double x, double y, double z) {
            return self.generate_fine(bbox_minimizer::Vec3{x, y, z});
        })
        .def("generate_pca_variants", &bbox_minimizer::RotationGenerator::generate_pca_variants);

    // PresetCache
    py::class_<bbox_minimizer::PresetCache>(m, "PresetCache")
        .def(py::init<>())
        .def("save_rotation", [](bbox_minimizer::PresetCache& self, const std::string& name,
                                 const std::string& type, const std::array<double, 3>& rotation_deg,
                                 double reduction) {
            self.save_rotation(name, type, bbox_minimizer::Vec3{rotation_deg[0], rotation_deg[1], rotation_deg[2]},
                               reduction);
        }, py::arg("name"), py::arg("type"), py::arg("rotation_deg"), py::arg("reduction"))
        .def("presets_for", [](const bbox_minimizer::PresetCache& self, const std::string& name,
                               const std::string& type) {
            py::list out;
            for (const auto& r : self.presets_for(name, type)) {
                out.append(vec_to_tuple(r));
            }
            return out;
        }, py::arg("name"), py::arg("type"))
        .def("common_presets", [](const bbox_minimizer::PresetCache& self, size_t min_samples) {
            py::list out;
            for (const auto& r : self.common_presets(min_samples)) {
                out.append(vec_to_tuple(r));
            }
            return out;
        }, py::arg("min_samples") = 3)
        .def("forget", [](bbox_minimizer::PresetCache& self, const std::string& name, const std::string& type) {
            return self.forget(name, type);
        }, py::arg("name"), py::arg("type"));

    m.def("compute_aabb", [](py::array_t<double, py::array::c_style | py::array::forcecast> points) {
        return bbox_minimizer::compute_aabb(points_from_array(points));
    }, py::arg("points"));

    m.def("optimize_points", [](
        py::array_t<double, py::array::c_style | py::array::forcecast> points,
        const std::array<double, 3>& initial_rotation_deg,
        const std::vector<std::array<double, 3>>& presets,
        const bbox_minimizer::OptimizerConfig& config,
        std::optional<double> max_time,
        bool verbose
    ) {
        bbox_minimizer::PointCloud cloud = points_from_array(points);
        const std::vector<bbox_minimizer::Vec3> preset_list = presets_from_list(presets);
        const auto initial = bbox_minimizer::Rotation::from_degrees(
            initial_rotation_deg[0], initial_rotation_deg[1], initial_rotation_deg[2]);

        py::gil_scoped_release release;
        const bbox_minimizer::RotationOptimizer optimizer(
            config, verbose ? bbox_minimizer::console_logger() : bbox_minimizer::null_logger());
        return optimizer.optimize_points(std::move(cloud), initial, preset_list, max_time);
    },
        py::arg("points"),
        py::arg("initial_rotation_deg") = std::array<double, 3>{0.0, 0.0, 0.0},
        py::arg("presets") = std::vector<std::array<double, 3>>{},
        py::arg("config") = bbox_minimizer::OptimizerConfig{},
        py::arg("max_time") = py::none(),
        py::arg("verbose") = false);

    // The host keeps ownership of its scene object; callbacks run with the GIL held
    m.def("optimize_callbacks", [](
        py::array_t<double, py::array::c_style | py::array::forcecast> rest_points,
        const std::array<double, 3>& initial_rotation_deg,
        std::function<void(const bbox_minimizer::Rotation&)> apply_fn,
        std::function<bbox_minimizer::AabbMetrics()> measure_fn,
        const std::vector<std::array<double, 3>>& presets,
        const bbox_minimizer::OptimizerConfig& config,
        std::optional<double> max_time,
        bool verbose
    ) {
        bbox_minimizer::CallbackGeometry geometry(
            points_from_array(rest_points),
            bbox_minimizer::Rotation::from_degrees(
                initial_rotation_deg[0], initial_rotation_deg[1], initial_rotation_deg[2]),
            std::move(apply_fn),
            std::move(measure_fn));
        const std::vector<bbox_minimizer::Vec3> preset_list = presets_from_list(presets);

        const bbox_minimizer::RotationOptimizer optimizer(
            config, verbose ? bbox_minimizer::console_logger() : bbox_minimizer::null_logger());
        return optimizer.optimize(geometry, preset_list, max_time);
    },
        py::arg("rest_points"),
        py::arg("initial_rotation_deg"),
        py::arg("apply_fn"),
        py::arg("measure_fn"),
        py::arg("presets") = std::vector<std::array<double, 3>>{},
        py::arg("config") = bbox_minimizer::OptimizerConfig{},
        py::arg("max_time") = py::none(),
        py::arg("verbose") = false);
}
