/**
 * @file input_file.cpp
 * @brief Control file model type detection and writer
 */

#include "t2p/control/input_file.hpp"
#include <algorithm>
#include <fstream>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace t2p {

namespace {

const char* HEADER_TEXT = "Texture2Par Input File  |  Written by t2p";

const char* SECTION_PROGRAM = "Program Settings (True/False)";
const char* SECTION_VARIOGRAM = "Variogram Settings";
const char* SECTION_GLOBAL = "Global Settings";
const char* SECTION_AQUIFER_PP =
    "Pilot Points - X  Y  KCMin  deltaKC  KFMin  deltaKF  SsC  SsF  SyC  SyF  AnisoC  AnisoF  Zone";
const char* SECTION_AQUITARD_PP =
    "Aquitard Pilot Points - X  Y  KCMin  deltaKC  KFMin  deltaKF  AnisoC  AnisoF  Zone";

} // namespace

InputFile::InputFile(InputFileSettings settings, StatusCallback status)
    : settings_(std::move(settings)),
      model_type_(detect_model_type(settings_.sim_file, settings_.preproc_file)),
      status_(std::move(status)) {
    const auto& f = formats::CONTROL_FLOAT;
    const auto& e = formats::CONTROL_SCI;
    params_.add({"sill", settings_.sill, f});
    params_.add({"range_max", settings_.range_max, e});
    params_.add({"range_min", settings_.range_min, e});
    params_.add({"anisotropy", settings_.anisotropy, f});
    params_.add({"nugget", settings_.nugget, f});
    params_.add({"nkrige_wells", static_cast<Real>(settings_.nkrige_wells), formats::INTEGER});
    params_.add({"KCk", settings_.KCk, f});
    params_.add({"KFk", settings_.KFk, f});
    params_.add({"KHp", settings_.KHp, f});
    params_.add({"KVp", settings_.KVp, f});
    params_.add({"Syp", settings_.Syp, f});

    if (status_) {
        status_("Detected Model Type is: " + to_string(model_type_));
    }
}

ModelType InputFile::detect_model_type(const std::string& sim_file,
                                       const std::optional<std::string>& preproc_file) {
    if (sim_file.empty()) {
        throw ConfigError("Simulation file must be given to detect the model type");
    }
    // Text after the last '.', so a bare ".nam" is a name file too
    const auto dot = sim_file.rfind('.');
    if (dot != std::string::npos && sim_file.compare(dot + 1, std::string::npos, "nam") == 0) {
        return ModelType::MODFLOW;
    }
    if (!preproc_file || preproc_file->empty()) {
        throw ConfigError("Pre-processor file cannot be empty for IWFM (simulation file " +
                          sim_file + ")");
    }
    return ModelType::IWFM;
}

std::string InputFile::to_string(ModelType type) {
    switch (type) {
        case ModelType::MODFLOW: return "MODFLOW";
        case ModelType::IWFM: return "IWFM";
        default: return "Unknown";
    }
}

std::vector<std::string> InputFile::global_parameter_names() {
    return {"sill", "range_max", "range_min", "anisotropy", "nugget", "nkrige_wells",
            "KCk", "KFk", "KHp", "KVp", "Syp"};
}

// ============================================================================
// Pilot points
// ============================================================================

void InputFile::add_pilot_point(const Vec2& location, const HydraulicValues& hydraulic,
                                const StorageValues& storage, Index zone) {
    aquifer_pp_.push_back(PilotPoint::aquifer(location, hydraulic, storage, zone));
}

void InputFile::add_aquitard_pilot_point(const Vec2& location, const HydraulicValues& hydraulic,
                                         Index zone) {
    aquitard_pp_.push_back(PilotPoint::aquitard(location, hydraulic, zone));
}

void InputFile::add_pilot_point(PilotPoint point) {
    collection(point.kind()).push_back(std::move(point));
}

void InputFile::check_pilot_point_names(const std::vector<std::string>& names,
                                        PilotPointKind kind) {
    const auto available = PilotPoint::parameter_names(kind);
    for (const auto& name : names) {
        if (std::find(available.begin(), available.end(), name) == available.end()) {
            throw SchemaError("Unknown " +
                              std::string(kind == PilotPointKind::Aquifer ? "aquifer" : "aquitard") +
                              " pilot point parameter: " + name);
        }
    }
}

void InputFile::select_pilot_point_parameters(const std::vector<std::string>& names,
                                              PilotPointKind kind) {
    check_pilot_point_names(names, kind);
    for (auto& pp : collection(kind)) {
        pp.select_for_estimation(names);
    }
}

void InputFile::rename_pilot_point_parameter(const std::string& name,
                                             const std::string& display_name,
                                             PilotPointKind kind) {
    check_pilot_point_names({name}, kind);
    for (auto& pp : collection(kind)) {
        pp.rename_for_estimation(name, display_name);
    }
}

// ============================================================================
// Output
// ============================================================================

void InputFile::render(std::ostream& os, const TemplateOptions& options) const {
    const bool modflow = model_type_ == ModelType::MODFLOW;
    const auto& s = settings_;

    if (options.enabled) {
        os << "ptf " << options.delimiter << "\n";
    }

    // Primary settings
    os << divider_line('=');
    os << "* " << HEADER_TEXT << "\n";
    os << divider_line('=');
    os << render_string_line(to_string(model_type_), "Model Type");
    os << render_string_line(s.well_log_file, "Well Log File");
    os << render_string_line(s.unit_file, "Hydrogeologic Units File");

    // Model settings
    os << section_header("Model Settings (" + to_string(model_type_) + ")");
    if (modflow) {
        os << render_string_line(s.sim_file, "Name File");
        os << render_string_line(s.template_file, "Layer Parameter Template File");
        os << render_string_line(s.pp_zone_file, "Pilot Point Node Zones File");
        os << render_value_line(s.xoff, formats::CONTROL_FLOAT, "xOffset");
        os << render_value_line(s.yoff, formats::CONTROL_FLOAT, "yOffset");
        os << render_value_line(s.rotation, formats::CONTROL_FLOAT, "Rotation");
    } else {
        os << render_string_line(s.sim_file, "Simulation File");
        os << render_string_line(s.preproc_file.value_or(""), "Pre-processor File");
        os << render_string_line(s.template_file, "GW Template File");
        os << render_string_line(s.pp_zone_file, "Pilot Point Node Zones File");
    }

    // Program settings
    os << section_header(SECTION_PROGRAM);
    os << render_string_line(s.full_output ? "True" : "False",
                             modflow ? "Output Cell Files" : "Output Node Files");

    // Variogram settings
    os << section_header(SECTION_VARIOGRAM);
    os << render_value_line(static_cast<Real>(s.variogram_type), formats::INTEGER,
                            "Variogram Type (itype)");
    os << render_value_line(params_, "sill", "Sill", options);
    os << render_value_line(params_, "range_max", "[Maximum] Range", options);
    os << render_value_line(params_, "range_min", "Minimum Range", options);
    os << render_value_line(params_, "anisotropy", "Anisotropy Angle (from North)", options);
    os << render_value_line(params_, "nugget", "Nugget", options);
    os << render_value_line(params_, "nkrige_wells", "[Maximum] Wells used in kriging", options);

    // Global settings
    os << section_header(SECTION_GLOBAL);
    for (const char* key : {"KCk", "KFk", "KHp", "KVp", "Syp"}) {
        os << render_value_line(params_, key, key, options);
    }

    // Pilot points
    os << section_header(SECTION_AQUIFER_PP);
    for (size_t i = 0; i < aquifer_pp_.size(); ++i) {
        os << render_pilot_point_line(aquifer_pp_[i], static_cast<Index>(i), options);
    }
    os << section_header(SECTION_AQUITARD_PP);
    for (size_t i = 0; i < aquitard_pp_.size(); ++i) {
        os << render_pilot_point_line(aquitard_pp_[i], static_cast<Index>(i), options);
    }

    // EOF
    os << divider_line('-');
    os << "* EOF\n";
}

std::string InputFile::to_string(const TemplateOptions& options) const {
    std::ostringstream os;
    render(os, options);
    return os.str();
}

void InputFile::write(const std::filesystem::path& filepath,
                      const TemplateOptions& options) const {
    const std::string contents = to_string(options);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write input file: " + filepath.string());
    }
    file << contents;
    if (!file) {
        throw std::runtime_error("Error writing input file: " + filepath.string());
    }
    if (status_) {
        status_(std::string("Wrote ") + (options.enabled ? "template " : "") +
                "input file " + filepath.string() + " (" +
                std::to_string(aquifer_pp_.size()) + " aquifer, " +
                std::to_string(aquitard_pp_.size()) + " aquitard pilot points)");
    }
}

} // namespace t2p
