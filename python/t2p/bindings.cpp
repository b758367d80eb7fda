/**
 * @file bindings.cpp
 * @brief Python bindings for t2p using pybind11
 *
 * Provides Python interface for:
 * - Raw tables and well-log datasets
 * - Interval reconciliation options
 * - Pilot points and control file writing
 * - Configuration files
 */

#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>
#include <pybind11/eigen.h>
#include <pybind11/functional.h>

#include "t2p/t2p.hpp"
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <string>

namespace py = pybind11;
using namespace t2p;

// ============================================================================
// Helper Functions
// ============================================================================

/// Convert Eigen Vector to NumPy array
py::array_t<double> vector_to_numpy(const Vector& vec) {
    return py::array_t<double>(vec.size(), vec.data());
}

/// NumPy input converted to a contiguous double array (strided views are copied)
using DoubleArray = py::array_t<double, py::array::c_style | py::array::forcecast>;

/// Convert NumPy array to Eigen Vector
Vector numpy_to_vector(const DoubleArray& arr) {
    py::buffer_info buf = arr.request();
    if (buf.ndim != 1) {
        throw std::invalid_argument("Expected a 1-D array, got " + std::to_string(buf.ndim) +
                                    " dimensions");
    }
    Vector vec(buf.size);
    std::memcpy(vec.data(), buf.ptr, buf.size * sizeof(double));
    return vec;
}

// ============================================================================
// Python Module Definition
// ============================================================================

PYBIND11_MODULE(t2p_py, m) {
    m.doc() = R"pbdoc(
        t2p: Texture2Par data preparation
        =================================

        Prepares well-log lithology data and control files for the
        Texture2Par interpolator.

        Example:
            >>> import t2p_py as t2p
            >>> ds = t2p.Dataset(t2p.DatasetSchema.dataset(["PC"]))
            >>> opts = t2p.ReconcileOptions()
            >>> opts.depth_top_col = "Top"
            >>> ds.add_wells(t2p.RawTable.from_file("wells.csv"), opts)
            >>> ds.write("dataset.dat")
    )pbdoc";

    // ========================================================================
    // Errors
    // ========================================================================

    auto value_error = py::handle(PyExc_ValueError);
    py::register_exception<SchemaError>(m, "SchemaError", value_error);
    py::register_exception<ShapeError>(m, "ShapeError", value_error);
    py::register_exception<ConfigError>(m, "ConfigError", value_error);

    // ========================================================================
    // Enums
    // ========================================================================

    py::enum_<ModelType>(m, "ModelType")
        .value("MODFLOW", ModelType::MODFLOW)
        .value("IWFM", ModelType::IWFM)
        .export_values();

    py::enum_<PilotPointKind>(m, "PilotPointKind")
        .value("Aquifer", PilotPointKind::Aquifer)
        .value("Aquitard", PilotPointKind::Aquitard)
        .export_values();

    // ========================================================================
    // Raw tables
    // ========================================================================

    py::class_<RawReadOptions>(m, "RawReadOptions")
        .def(py::init<>())
        .def_readwrite("delimiter", &RawReadOptions::delimiter)
        .def_readwrite("missing_values", &RawReadOptions::missing_values)
        .def_readwrite("text_columns", &RawReadOptions::text_columns);

    py::class_<RawTable>(m, "RawTable")
        .def(py::init<>())
        .def_static("from_file", &RawTable::from_file,
                    py::arg("filepath"), py::arg("options") = RawReadOptions{})
        .def("add_column", [](RawTable& self, const std::string& name, DoubleArray arr) {
            self.add_column(name, numpy_to_vector(arr));
        })
        .def("add_text_column", &RawTable::add_text_column)
        .def("numeric", [](const RawTable& self, const std::string& name) {
            return vector_to_numpy(self.numeric(name));
        })
        .def("text", &RawTable::text)
        .def("has_column", &RawTable::has_column)
        .def("column_names", &RawTable::column_names)
        .def("n_rows", &RawTable::n_rows);

    // ========================================================================
    // Dataset
    // ========================================================================

    py::class_<SchemaOptions>(m, "SchemaOptions")
        .def(py::init<>())
        .def_readwrite("zones", &SchemaOptions::zones)
        .def_readwrite("n_layers", &SchemaOptions::n_layers)
        .def_readwrite("variances", &SchemaOptions::variances);

    py::class_<DatasetSchema>(m, "DatasetSchema")
        .def_static("dataset", &DatasetSchema::dataset,
                    py::arg("classes"), py::arg("options") = SchemaOptions{})
        .def_static("well_log_file", &DatasetSchema::well_log_file,
                    py::arg("zones") = false, py::arg("n_layers") = 0)
        .def("classes", &DatasetSchema::classes)
        .def("header_labels", &DatasetSchema::header_labels)
        .def("n_layers", &DatasetSchema::n_layers);

    py::class_<ReconcileOptions>(m, "ReconcileOptions")
        .def(py::init<>())
        .def_readwrite("name_col", &ReconcileOptions::name_col)
        .def_readwrite("x_col", &ReconcileOptions::x_col)
        .def_readwrite("y_col", &ReconcileOptions::y_col)
        .def_readwrite("zland_col", &ReconcileOptions::zland_col)
        .def_readwrite("depth_col", &ReconcileOptions::depth_col)
        .def_readwrite("depth_top_col", &ReconcileOptions::depth_top_col)
        .def_readwrite("point_col", &ReconcileOptions::point_col)
        .def_readwrite("class_cols", &ReconcileOptions::class_cols)
        .def_readwrite("variance_cols", &ReconcileOptions::variance_cols)
        .def_readwrite("fill_missing", &ReconcileOptions::fill_missing)
        .def_readwrite("status", &ReconcileOptions::status);

    py::class_<ManualWell>(m, "ManualWell")
        .def(py::init<>())
        .def_readwrite("name", &ManualWell::name)
        .def_readwrite("x", &ManualWell::x)
        .def_readwrite("y", &ManualWell::y)
        .def_readwrite("land_elevation", &ManualWell::land_elevation)
        .def_readwrite("depths", &ManualWell::depths)
        .def_readwrite("class_values", &ManualWell::class_values)
        .def_readwrite("zones", &ManualWell::zones);

    py::class_<WriteOptions>(m, "WriteOptions")
        .def(py::init<>())
        .def_readwrite("delimiter", &WriteOptions::delimiter)
        .def_readwrite("missing", &WriteOptions::missing)
        .def("set_float_format", [](WriteOptions& self, const std::string& spec) {
            self.float_format = NumberFormat::parse(spec);
        });

    py::class_<Dataset>(m, "Dataset")
        .def(py::init<DatasetSchema, StatusCallback>(),
             py::arg("schema"), py::arg("status") = nullptr)
        .def_static("read", [](const std::string& path, const DatasetSchema& schema) {
            return Dataset::read(path, schema);
        })
        .def("add_wells", &Dataset::add_wells)
        .def("add_well", &Dataset::add_well)
        .def("write", &Dataset::write, py::arg("filepath"), py::arg("options") = WriteOptions{})
        .def("well_coordinates", [](const Dataset& self) {
            py::list out;
            for (const auto& c : self.well_coordinates()) {
                out.append(py::make_tuple(c.well_id, c.x, c.y));
            }
            return out;
        })
        .def("column", [](const Dataset& self, const std::string& name) {
            return vector_to_numpy(self.column(name));
        })
        .def("size", &Dataset::size)
        .def("max_id", &Dataset::max_id)
        .def("n_wells", &Dataset::n_wells)
        .def("__len__", &Dataset::size);

    // ========================================================================
    // Control file
    // ========================================================================

    py::class_<HydraulicValues>(m, "HydraulicValues")
        .def(py::init<>())
        .def_readwrite("KCMin", &HydraulicValues::KCMin)
        .def_readwrite("deltaKC", &HydraulicValues::deltaKC)
        .def_readwrite("KFMin", &HydraulicValues::KFMin)
        .def_readwrite("deltaKF", &HydraulicValues::deltaKF)
        .def_readwrite("AnisoC", &HydraulicValues::AnisoC)
        .def_readwrite("AnisoF", &HydraulicValues::AnisoF);

    py::class_<StorageValues>(m, "StorageValues")
        .def(py::init<>())
        .def_readwrite("SsC", &StorageValues::SsC)
        .def_readwrite("SsF", &StorageValues::SsF)
        .def_readwrite("SyC", &StorageValues::SyC)
        .def_readwrite("SyF", &StorageValues::SyF);

    py::class_<TemplateOptions>(m, "TemplateOptions")
        .def(py::init<>())
        .def_readwrite("enabled", &TemplateOptions::enabled)
        .def_readwrite("delimiter", &TemplateOptions::delimiter);

    py::class_<InputFileSettings>(m, "InputFileSettings")
        .def(py::init<>())
        .def_readwrite("well_log_file", &InputFileSettings::well_log_file)
        .def_readwrite("unit_file", &InputFileSettings::unit_file)
        .def_readwrite("sim_file", &InputFileSettings::sim_file)
        .def_readwrite("preproc_file", &InputFileSettings::preproc_file)
        .def_readwrite("template_file", &InputFileSettings::template_file)
        .def_readwrite("pp_zone_file", &InputFileSettings::pp_zone_file)
        .def_readwrite("xoff", &InputFileSettings::xoff)
        .def_readwrite("yoff", &InputFileSettings::yoff)
        .def_readwrite("rotation", &InputFileSettings::rotation)
        .def_readwrite("full_output", &InputFileSettings::full_output)
        .def_readwrite("variogram_type", &InputFileSettings::variogram_type)
        .def_readwrite("sill", &InputFileSettings::sill)
        .def_readwrite("range_max", &InputFileSettings::range_max)
        .def_readwrite("range_min", &InputFileSettings::range_min)
        .def_readwrite("anisotropy", &InputFileSettings::anisotropy)
        .def_readwrite("nugget", &InputFileSettings::nugget)
        .def_readwrite("nkrige_wells", &InputFileSettings::nkrige_wells);

    py::class_<InputFile>(m, "InputFile")
        .def(py::init<InputFileSettings, StatusCallback>(),
             py::arg("settings"), py::arg("status") = nullptr)
        .def("model_type", &InputFile::model_type)
        .def("add_pilot_point",
             py::overload_cast<const Vec2&, const HydraulicValues&, const StorageValues&, Index>(
                 &InputFile::add_pilot_point),
             py::arg("location"), py::arg("hydraulic"), py::arg("storage"), py::arg("zone") = 1)
        .def("add_aquitard_pilot_point", &InputFile::add_aquitard_pilot_point,
             py::arg("location"), py::arg("hydraulic"), py::arg("zone") = 1)
        .def("n_pilot_points", &InputFile::n_pilot_points)
        .def("select_for_estimation", &InputFile::select_for_estimation)
        .def("rename_for_estimation", &InputFile::rename_for_estimation)
        .def("select_pilot_point_parameters", &InputFile::select_pilot_point_parameters,
             py::arg("names"), py::arg("kind") = PilotPointKind::Aquifer)
        .def("rename_pilot_point_parameter", &InputFile::rename_pilot_point_parameter,
             py::arg("name"), py::arg("display_name"), py::arg("kind") = PilotPointKind::Aquifer)
        .def("list_parameters", [](const InputFile& self) {
            return self.global_parameters().list_parameters();
        })
        .def("describe", [](const InputFile& self) {
            std::ostringstream os;
            self.global_parameters().describe(os);
            return os.str();
        })
        .def("to_string", py::overload_cast<const TemplateOptions&>(&InputFile::to_string, py::const_),
             py::arg("options") = TemplateOptions{})
        .def("write", &InputFile::write,
             py::arg("filepath"), py::arg("options") = TemplateOptions{});

    // ========================================================================
    // Configuration
    // ========================================================================

    py::class_<Config>(m, "Config")
        .def(py::init<>())
        .def_static("from_file", &Config::from_file)
        .def("to_file", &Config::to_file)
        .def("validate", &Config::validate)
        .def("make_input_file", &Config::make_input_file, py::arg("status") = nullptr)
        .def_readwrite("input", &Config::input);
}
