/**
 * @file config.cpp
 * @brief Configuration parsing and validation
 */

#include "t2p/core/config.hpp"
#include "t2p/io/format.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace t2p {

namespace {

void check_names(const std::vector<std::string>& names,
                 const std::vector<std::string>& available,
                 const std::string& what) {
    for (const auto& name : names) {
        if (std::find(available.begin(), available.end(), name) == available.end()) {
            throw ConfigError("Unknown " + what + " parameter in estimate section: " + name);
        }
    }
}

void check_renames(const std::map<std::string, std::string>& renames,
                   const std::vector<std::string>& available,
                   const std::string& what) {
    for (const auto& [name, display] : renames) {
        check_names({name}, available, what);
        if (display.empty()) {
            throw ConfigError("Empty display name for " + what + " parameter " + name);
        }
    }
}

} // namespace

// ============================================================================
// Config
// ============================================================================

Config Config::from_file(const std::filesystem::path& filepath) {
    Config config;

    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filepath.string());
    }

    std::string line;
    std::string current_section;
    Index line_no = 0;

    while (std::getline(file, line)) {
        ++line_no;

        // Strip comments
        auto comment_pos = line.find('#');
        if (comment_pos != std::string::npos) {
            line = line.substr(0, comment_pos);
        }

        line = text::trim(line);
        if (line.empty()) continue;

        auto colon_pos = line.find(':');
        if (colon_pos == std::string::npos) {
            throw std::invalid_argument(filepath.string() + ":" + std::to_string(line_no) +
                                        ": expected 'key: value', got '" + line + "'");
        }

        const std::string key = text::trim(line.substr(0, colon_pos));
        const std::string value = text::trim(line.substr(colon_pos + 1));

        // Section header (key with no value)
        if (value.empty()) {
            current_section = key;
            continue;
        }

        auto& in = config.input;
        try {
            if (current_section == "files" || current_section.empty()) {
                if (key == "well_log_file") in.well_log_file = value;
                else if (key == "unit_file") in.unit_file = value;
                else if (key == "sim_file") in.sim_file = value;
                else if (key == "preproc_file") in.preproc_file = value;
                else if (key == "template_file") in.template_file = value;
                else if (key == "pp_zone_file") in.pp_zone_file = value;
                else if (key == "pilot_points_file") config.pilot_points_file = value;
                else if (key == "aquitard_pilot_points_file") config.aquitard_pilot_points_file = value;
                else throw ConfigError("Unknown key: " + key);
            } else if (current_section == "model") {
                if (key == "xoff") in.xoff = text::to_real(value);
                else if (key == "yoff") in.yoff = text::to_real(value);
                else if (key == "rotation") in.rotation = text::to_real(value);
                else if (key == "full_output") in.full_output = text::to_bool(value);
                else throw ConfigError("Unknown key: " + key);
            } else if (current_section == "variogram") {
                if (key == "type") in.variogram_type = text::to_index(value);
                else if (key == "sill") in.sill = text::to_real(value);
                else if (key == "range_max") in.range_max = text::to_real(value);
                else if (key == "range_min") in.range_min = text::to_real(value);
                else if (key == "anisotropy") in.anisotropy = text::to_real(value);
                else if (key == "nugget") in.nugget = text::to_real(value);
                else if (key == "nkrige_wells") in.nkrige_wells = text::to_index(value);
                else throw ConfigError("Unknown key: " + key);
            } else if (current_section == "global") {
                if (key == "KCk") in.KCk = text::to_real(value);
                else if (key == "KFk") in.KFk = text::to_real(value);
                else if (key == "KHp") in.KHp = text::to_real(value);
                else if (key == "KVp") in.KVp = text::to_real(value);
                else if (key == "Syp") in.Syp = text::to_real(value);
                else throw ConfigError("Unknown key: " + key);
            } else if (current_section == "estimate") {
                auto& est = config.estimate;
                if (key == "parameters") est.parameters = config_io::parse_list(value);
                else if (key == "pilot_points") est.pilot_points = config_io::parse_list(value);
                else if (key == "aquitard_pilot_points")
                    est.aquitard_pilot_points = config_io::parse_list(value);
                else if (key == "rename") est.rename = config_io::parse_renames(value);
                else if (key == "pilot_point_rename")
                    est.pilot_point_rename = config_io::parse_renames(value);
                else if (key == "aquitard_rename")
                    est.aquitard_rename = config_io::parse_renames(value);
                else throw ConfigError("Unknown key: " + key);
            } else if (current_section == "output") {
                if (key == "control_file") config.output.control_file = value;
                else if (key == "template_file") config.output.template_file = value;
                else if (key == "delimiter") config.output.delimiter = config_io::parse_delimiter(value);
                else if (key == "verbose") config.output.verbose = text::to_bool(value);
                else throw ConfigError("Unknown key: " + key);
            } else {
                throw ConfigError("Unknown section: " + current_section);
            }
        } catch (const ConfigError& e) {
            throw ConfigError(filepath.string() + ":" + std::to_string(line_no) + ": " + e.what());
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument(filepath.string() + ":" + std::to_string(line_no) +
                                        ": " + key + ": " + e.what());
        }
    }

    return config;
}

void Config::to_file(const std::filesystem::path& filepath) const {
    std::ostringstream os;
    os << std::setprecision(15);
    const auto& in = input;

    os << "# t2p Configuration File\n\n";

    // Empty values would read back as section headers, so they are omitted
    auto put = [&os](const std::string& key, const std::string& value) {
        if (!value.empty()) os << "  " << key << ": " << value << "\n";
    };

    os << "files:\n";
    put("well_log_file", in.well_log_file);
    put("unit_file", in.unit_file);
    put("sim_file", in.sim_file);
    put("preproc_file", in.preproc_file.value_or(""));
    put("template_file", in.template_file);
    put("pp_zone_file", in.pp_zone_file);
    put("pilot_points_file", pilot_points_file.string());
    put("aquitard_pilot_points_file", aquitard_pilot_points_file.string());
    os << "\n";

    os << "model:\n";
    os << "  xoff: " << in.xoff << "\n";
    os << "  yoff: " << in.yoff << "\n";
    os << "  rotation: " << in.rotation << "\n";
    os << "  full_output: " << (in.full_output ? "true" : "false") << "\n\n";

    os << "variogram:\n";
    os << "  type: " << in.variogram_type << "\n";
    os << "  sill: " << in.sill << "\n";
    os << "  range_max: " << in.range_max << "\n";
    os << "  range_min: " << in.range_min << "\n";
    os << "  anisotropy: " << in.anisotropy << "\n";
    os << "  nugget: " << in.nugget << "\n";
    os << "  nkrige_wells: " << in.nkrige_wells << "\n\n";

    os << "global:\n";
    os << "  KCk: " << in.KCk << "\n";
    os << "  KFk: " << in.KFk << "\n";
    os << "  KHp: " << in.KHp << "\n";
    os << "  KVp: " << in.KVp << "\n";
    os << "  Syp: " << in.Syp << "\n\n";

    os << "estimate:\n";
    put("parameters", config_io::join_list(estimate.parameters));
    put("pilot_points", config_io::join_list(estimate.pilot_points));
    put("aquitard_pilot_points", config_io::join_list(estimate.aquitard_pilot_points));
    put("rename", config_io::join_renames(estimate.rename));
    put("pilot_point_rename", config_io::join_renames(estimate.pilot_point_rename));
    put("aquitard_rename", config_io::join_renames(estimate.aquitard_rename));
    os << "\n";

    os << "output:\n";
    put("control_file", output.control_file.string());
    put("template_file", output.template_file.string());
    os << "  delimiter: " << output.delimiter << "\n";
    os << "  verbose: " << (output.verbose ? "true" : "false") << "\n";

    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write config file: " + filepath.string());
    }
    file << os.str();
    if (!file) {
        throw std::runtime_error("Error writing config file: " + filepath.string());
    }
}

void Config::validate() const {
    validate_paths();

    // Throws ConfigError for an empty sim_file or IWFM without pre-processor
    InputFile::detect_model_type(input.sim_file, input.preproc_file);

    if (input.nkrige_wells < 1) {
        throw ConfigError("nkrige_wells must be >= 1");
    }
    if (output.control_file.empty()) {
        throw ConfigError("output control_file cannot be empty");
    }
    if (!output.template_file.empty() && output.template_file == output.control_file) {
        throw ConfigError("Template file and control file must differ: " +
                          output.control_file.string());
    }

    validate_estimate();
}

void Config::validate_paths() const {
    if (input.well_log_file.empty()) {
        throw ConfigError("well_log_file must be set");
    }
    if (input.unit_file.empty()) {
        throw ConfigError("unit_file must be set");
    }
    // Only validate pilot point files if set
    if (!pilot_points_file.empty() && !std::filesystem::exists(pilot_points_file)) {
        throw ConfigError("Pilot point file not found: " + pilot_points_file.string());
    }
    if (!aquitard_pilot_points_file.empty() &&
        !std::filesystem::exists(aquitard_pilot_points_file)) {
        throw ConfigError("Aquitard pilot point file not found: " +
                          aquitard_pilot_points_file.string());
    }
}

void Config::validate_estimate() const {
    const auto globals = InputFile::global_parameter_names();
    const auto aquifer = PilotPoint::parameter_names(PilotPointKind::Aquifer);
    const auto aquitard = PilotPoint::parameter_names(PilotPointKind::Aquitard);

    check_names(estimate.parameters, globals, "global");
    check_names(estimate.pilot_points, aquifer, "pilot point");
    check_names(estimate.aquitard_pilot_points, aquitard, "aquitard pilot point");
    check_renames(estimate.rename, globals, "global");
    check_renames(estimate.pilot_point_rename, aquifer, "pilot point");
    check_renames(estimate.aquitard_rename, aquitard, "aquitard pilot point");

    if (estimate.any() && output.template_file.empty()) {
        throw ConfigError("Parameters are selected for estimation but no template_file is set");
    }
}

InputFile Config::make_input_file(StatusCallback status) const {
    InputFile input_file(input, status);

    if (!pilot_points_file.empty()) {
        for (auto& pp : read_pilot_points(pilot_points_file, PilotPointKind::Aquifer)) {
            input_file.add_pilot_point(std::move(pp));
        }
    }
    if (!aquitard_pilot_points_file.empty()) {
        for (auto& pp : read_pilot_points(aquitard_pilot_points_file, PilotPointKind::Aquitard)) {
            input_file.add_pilot_point(std::move(pp));
        }
    }

    input_file.select_for_estimation(estimate.parameters);
    for (const auto& [name, display] : estimate.rename) {
        input_file.rename_for_estimation(name, display);
    }
    input_file.select_pilot_point_parameters(estimate.pilot_points, PilotPointKind::Aquifer);
    for (const auto& [name, display] : estimate.pilot_point_rename) {
        input_file.rename_pilot_point_parameter(name, display, PilotPointKind::Aquifer);
    }
    input_file.select_pilot_point_parameters(estimate.aquitard_pilot_points,
                                             PilotPointKind::Aquitard);
    for (const auto& [name, display] : estimate.aquitard_rename) {
        input_file.rename_pilot_point_parameter(name, display, PilotPointKind::Aquitard);
    }

    if (status) {
        const auto [n_aquifer, n_aquitard] = input_file.n_pilot_points();
        status("Loaded " + std::to_string(n_aquifer) + " aquifer and " +
               std::to_string(n_aquitard) + " aquitard pilot points");
    }
    return input_file;
}

void Config::print_summary(std::ostream& os) const {
    os << "=== t2p Configuration ===\n";
    os << "Files:\n";
    os << "  Well log:      " << input.well_log_file << "\n";
    os << "  Units:         " << input.unit_file << "\n";
    os << "  Simulation:    " << input.sim_file << "\n";
    if (input.preproc_file) {
        os << "  Pre-processor: " << *input.preproc_file << "\n";
    }
    os << "Variogram:\n";
    os << "  Type:          " << input.variogram_type << "\n";
    os << "  Sill:          " << input.sill << "\n";
    os << "  Range:         [" << input.range_min << ", " << input.range_max << "]\n";
    os << "  Kriging wells: " << input.nkrige_wells << "\n";
    os << "Estimate:\n";
    os << "  Global:        " << config_io::join_list(estimate.parameters) << "\n";
    os << "  Pilot points:  " << config_io::join_list(estimate.pilot_points) << "\n";
    os << "  Aquitard:      " << config_io::join_list(estimate.aquitard_pilot_points) << "\n";
    os << "Output:\n";
    os << "  Control file:  " << output.control_file.string() << "\n";
    if (!output.template_file.empty()) {
        os << "  Template file: " << output.template_file.string()
           << " (delimiter " << output.delimiter << ")\n";
    }
    os << "=========================\n";
}

// ============================================================================
// config_io helpers
// ============================================================================

namespace config_io {

std::vector<std::string> parse_list(const std::string& value) {
    std::vector<std::string> out;
    for (const auto& field : text::split(value, ',')) {
        auto item = text::trim(field);
        if (!item.empty()) out.push_back(std::move(item));
    }
    return out;
}

std::map<std::string, std::string> parse_renames(const std::string& value) {
    std::map<std::string, std::string> out;
    for (const auto& item : parse_list(value)) {
        auto eq = item.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument("Expected 'name = display', got '" + item + "'");
        }
        out[text::trim(item.substr(0, eq))] = text::trim(item.substr(eq + 1));
    }
    return out;
}

std::string join_list(const std::vector<std::string>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += values[i];
    }
    return out;
}

std::string join_renames(const std::map<std::string, std::string>& renames) {
    std::vector<std::string> pairs;
    for (const auto& [name, display] : renames) {
        pairs.push_back(name + " = " + display);
    }
    return join_list(pairs);
}

char parse_delimiter(const std::string& value) {
    if (value.size() != 1 || value[0] == ' ' || value[0] == '\t' || value[0] == '#') {
        throw std::invalid_argument("Delimiter must be a single printable character: '" +
                                    value + "'");
    }
    return value[0];
}

} // namespace config_io

} // namespace t2p
