/**
 * @file test_input_file.cpp
 * @brief Control file model type detection and layout
 */

#include <catch2/catch_test_macros.hpp>
#include "t2p/control/input_file.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

using namespace t2p;

namespace fs = std::filesystem;

namespace {

InputFileSettings modflow_settings() {
    InputFileSettings s;
    s.well_log_file = "wells.dat";
    s.unit_file = "hsu.dat";
    s.sim_file = "model.nam";
    s.template_file = "layers.tpl";
    s.pp_zone_file = "ppzones.dat";
    return s;
}

InputFileSettings iwfm_settings() {
    InputFileSettings s = modflow_settings();
    s.sim_file = "Simulation.in";
    s.preproc_file = "PreProcessor.in";
    s.template_file = "GW.tpl";
    return s;
}

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream is(text);
    std::string line;
    while (std::getline(is, line)) {
        lines.push_back(line);
    }
    return lines;
}

size_t index_of(const std::vector<std::string>& lines, const std::string& line) {
    for (size_t i = 0; i < lines.size(); ++i) {
        if (lines[i] == line) return i;
    }
    return lines.size();
}

} // namespace

TEST_CASE("Model type detection", "[input_file]") {
    REQUIRE(InputFile::detect_model_type("model.nam", std::nullopt) == ModelType::MODFLOW);
    REQUIRE(InputFile::detect_model_type("dir/model.nam", std::string("ignored")) ==
            ModelType::MODFLOW);
    REQUIRE(InputFile::detect_model_type("Simulation.in", std::string("PreProcessor.in")) ==
            ModelType::IWFM);
    REQUIRE(InputFile::detect_model_type(".nam", std::nullopt) == ModelType::MODFLOW);
    REQUIRE(InputFile::detect_model_type("dir/.nam", std::nullopt) == ModelType::MODFLOW);
    REQUIRE(InputFile::detect_model_type("model.name", std::string("PreProcessor.in")) ==
            ModelType::IWFM);
    REQUIRE(InputFile::detect_model_type("nam", std::string("PreProcessor.in")) ==
            ModelType::IWFM);

    REQUIRE_THROWS_AS(InputFile::detect_model_type("Simulation.in", std::nullopt), ConfigError);
    REQUIRE_THROWS_AS(InputFile::detect_model_type("Simulation.in", std::string()), ConfigError);
    REQUIRE_THROWS_AS(InputFile::detect_model_type("", std::string("PreProcessor.in")),
                      ConfigError);

    REQUIRE(InputFile(modflow_settings()).model_type() == ModelType::MODFLOW);
    REQUIRE(InputFile(iwfm_settings()).model_type() == ModelType::IWFM);

    auto no_preproc = iwfm_settings();
    no_preproc.preproc_file.reset();
    REQUIRE_THROWS_AS(InputFile(no_preproc), ConfigError);
}

TEST_CASE("Detected model type is reported", "[input_file]") {
    std::vector<std::string> messages;
    InputFile input(iwfm_settings(), [&messages](const std::string& m) { messages.push_back(m); });
    REQUIRE(messages.size() == 1);
    REQUIRE(messages[0] == "Detected Model Type is: IWFM");
}

TEST_CASE("Global parameter catalog", "[input_file]") {
    InputFile input(modflow_settings());
    const auto& params = input.global_parameters();
    REQUIRE(params.list_parameters() == InputFile::global_parameter_names());
    REQUIRE(params.value("nkrige_wells") == 16.0);
    REQUIRE(params.at("range_min").format == formats::CONTROL_SCI);
    REQUIRE(params.at("nkrige_wells").format == formats::INTEGER);

    REQUIRE_THROWS_AS(input.select_for_estimation({"sill", "bogus"}), SchemaError);
    REQUIRE(params.list_selected().empty());
}

TEST_CASE("MODFLOW control file layout", "[input_file]") {
    InputFile input(modflow_settings());
    input.add_pilot_point(Vec2(100.0, 200.0), {1.0, 2.0, 3.0, 4.0}, {1e-5, 1e-5, 0.1, 0.1});
    input.add_pilot_point(Vec2(300.0, 400.0), {1.0, 2.0, 3.0, 4.0}, {1e-5, 1e-5, 0.1, 0.1}, 2);
    input.add_aquitard_pilot_point(Vec2(500.0, 600.0), {1.0, 2.0, 3.0, 4.0});
    REQUIRE(input.n_pilot_points().first == 2);
    REQUIRE(input.n_pilot_points().second == 1);

    const auto lines = lines_of(input.to_string());
    REQUIRE(lines.size() == 45 + 3);

    const std::string banner = "*" + std::string(79, '=');
    const std::string divider = "*" + std::string(79, '-');
    REQUIRE(lines[0] == banner);
    REQUIRE(lines[1] == "* Texture2Par Input File  |  Written by t2p");
    REQUIRE(lines[2] == banner);
    REQUIRE(lines[3].rfind(" MODFLOW ", 0) == 0);
    REQUIRE(lines.back() == "* EOF");
    REQUIRE(lines[lines.size() - 2] == divider);

    // Section order
    const auto model = index_of(lines, "* Model Settings (MODFLOW)");
    const auto program = index_of(lines, "* Program Settings (True/False)");
    const auto variogram = index_of(lines, "* Variogram Settings");
    const auto global = index_of(lines, "* Global Settings");
    REQUIRE(model < program);
    REQUIRE(program < variogram);
    REQUIRE(variogram < global);
    REQUIRE(global < lines.size());
    REQUIRE(lines[model - 1] == divider);
    REQUIRE(lines[model + 1] == divider);

    // Model settings
    REQUIRE(lines[model + 2].rfind(" model.nam ", 0) == 0);
    REQUIRE(lines[model + 2].substr(40) == "/ Name File");
    REQUIRE(lines[model + 3].substr(40) == "/ Layer Parameter Template File");
    REQUIRE(lines[model + 5].rfind(" 0.0000 ", 0) == 0);
    REQUIRE(lines[model + 7].substr(40) == "/ Rotation");
    REQUIRE(lines[program + 2].rfind(" False ", 0) == 0);
    REQUIRE(lines[program + 2].substr(40) == "/ Output Cell Files");

    // Variogram settings
    REQUIRE(lines[variogram + 2].rfind(" 1 ", 0) == 0);
    REQUIRE(lines[variogram + 4].rfind(" 1.0000e+07 ", 0) == 0);
    REQUIRE(lines[variogram + 4].substr(40) == "/ [Maximum] Range");
    REQUIRE(lines[variogram + 8].rfind(" 16 ", 0) == 0);
    REQUIRE(lines[variogram + 8].substr(40) == "/ [Maximum] Wells used in kriging");

    // Global settings
    REQUIRE(lines[global + 2].rfind(" 0.0070 ", 0) == 0);
    REQUIRE(lines[global + 5].rfind(" -0.6200 ", 0) == 0);
    REQUIRE(lines[global + 5].substr(40) == "/ KVp");

    // Pilot points, each collection after its header
    REQUIRE(lines[global + 10].rfind("100.00 200.00 ", 0) == 0);
    REQUIRE(lines[global + 11].rfind("300.00 400.00 ", 0) == 0);
    REQUIRE(lines[global + 11].back() == '2');
    REQUIRE(lines[global + 15] == "500.00 600.00 1.00 2.00 3.00 4.00 10.00 10.00 1");

    // Every data line has its comment at column 40
    for (size_t i = 3; i < global + 8; ++i) {
        if (lines[i][0] == '*') continue;
        REQUIRE(lines[i].find("/ ") == 40);
    }
}

TEST_CASE("IWFM control file layout", "[input_file]") {
    auto settings = iwfm_settings();
    settings.full_output = true;
    InputFile input(settings);

    const auto lines = lines_of(input.to_string());
    REQUIRE(lines.size() == 43);

    const auto model = index_of(lines, "* Model Settings (IWFM)");
    REQUIRE(model < lines.size());
    REQUIRE(lines[model + 2].substr(40) == "/ Simulation File");
    REQUIRE(lines[model + 3].rfind(" PreProcessor.in ", 0) == 0);
    REQUIRE(lines[model + 3].substr(40) == "/ Pre-processor File");
    REQUIRE(lines[model + 4].substr(40) == "/ GW Template File");
    REQUIRE(lines[model + 5].substr(40) == "/ Pilot Point Node Zones File");

    const auto program = index_of(lines, "* Program Settings (True/False)");
    REQUIRE(program == model + 7);
    REQUIRE(lines[program + 2].rfind(" True ", 0) == 0);
    REQUIRE(lines[program + 2].substr(40) == "/ Output Node Files");
}

TEST_CASE("Template control file", "[input_file][template]") {
    InputFile input(modflow_settings());
    input.add_pilot_point(Vec2(100.0, 200.0), {1.0, 2.0, 3.0, 4.0}, {1e-5, 1e-5, 0.1, 0.1});
    input.add_pilot_point(Vec2(300.0, 400.0), {1.0, 2.0, 3.0, 4.0}, {1e-5, 1e-5, 0.1, 0.1});
    input.add_aquitard_pilot_point(Vec2(500.0, 600.0), {1.0, 2.0, 3.0, 4.0});

    input.select_for_estimation({"sill", "KCk"});
    input.rename_for_estimation("KCk", "kc_global");
    input.select_pilot_point_parameters({"KCMin"});
    input.select_pilot_point_parameters({"KFMin"}, PilotPointKind::Aquitard);

    TemplateOptions options;
    options.enabled = true;
    const auto text = input.to_string(options);
    const auto lines = lines_of(text);

    REQUIRE(lines[0] == "ptf $");
    REQUIRE(lines.size() == 45 + 3 + 1);
    REQUIRE(text.find("$ sill         $") != std::string::npos);
    REQUIRE(text.find("$ kc_global    $") != std::string::npos);
    REQUIRE(text.find("$ KCMin_01     $") != std::string::npos);
    REQUIRE(text.find("$ KCMin_02     $") != std::string::npos);
    // Aquitard points are numbered within their own collection
    REQUIRE(text.find("$ KFMin_01     $") != std::string::npos);
    REQUIRE(text.find("KFMin_02") == std::string::npos);

    // Literal file is unaffected by the selection
    const auto literal = input.to_string();
    REQUIRE(literal.find('$') == std::string::npos);
    REQUIRE(literal.rfind("ptf", 0) == std::string::npos);

    SECTION("invalid pilot point names") {
        REQUIRE_THROWS_AS(input.select_pilot_point_parameters({"SsC"}, PilotPointKind::Aquitard),
                          SchemaError);
        REQUIRE_THROWS_AS(input.rename_pilot_point_parameter("Bogus", "b"), SchemaError);
    }
}

TEST_CASE("Control file write", "[input_file][io]") {
    const auto path = fs::temp_directory_path() / "t2p_test_input.in";
    InputFile input(modflow_settings());
    input.write(path);

    std::ifstream f(path);
    std::stringstream contents;
    contents << f.rdbuf();
    REQUIRE(contents.str() == input.to_string());
    fs::remove(path);

    REQUIRE_THROWS_AS(input.write(fs::temp_directory_path() / "no_such_dir" / "x.in"),
                      std::runtime_error);
}
