/**
 * @file test_config.cpp
 * @brief Configuration parsing, validation and control file assembly
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "t2p/core/config.hpp"
#include "t2p/control/pilot_point.hpp"
#include <filesystem>
#include <fstream>

using namespace t2p;
using Catch::Approx;

namespace fs = std::filesystem;

namespace {

fs::path write_temp(const std::string& name, const std::string& contents) {
    const auto path = fs::temp_directory_path() / name;
    std::ofstream f(path);
    f << contents;
    return path;
}

const char* BASIC_CONFIG = R"(# Test configuration
files:
  well_log_file: dataset.dat   # merged wells
  unit_file: hsu.dat
  sim_file: model.nam
  template_file: layers.tpl

model:
  xoff: 1500.5
  rotation: 12
  full_output: true

variogram:
  sill: 0.8
  range_max: 2e6
  nkrige_wells: 24

global:
  KVp: -0.5

estimate:
  parameters: sill, KCk
  pilot_points: KCMin, KFMin
  rename: KCk = kc_global
  pilot_point_rename: KCMin = kcmin, KFMin = kfmin

output:
  control_file: run.in
  template_file: run.tpl
  delimiter: @
)";

Config basic_config() {
    Config config;
    config.input.well_log_file = "dataset.dat";
    config.input.unit_file = "hsu.dat";
    config.input.sim_file = "model.nam";
    return config;
}

} // namespace

TEST_CASE("Config parsing", "[config]") {
    const auto path = write_temp("t2p_test_config.cfg", BASIC_CONFIG);

    auto config = Config::from_file(path);
    fs::remove(path);

    REQUIRE(config.input.well_log_file == "dataset.dat");
    REQUIRE(config.input.sim_file == "model.nam");
    REQUIRE_FALSE(config.input.preproc_file.has_value());
    REQUIRE(config.input.xoff == Approx(1500.5));
    REQUIRE(config.input.yoff == Approx(0.0));
    REQUIRE(config.input.rotation == Approx(12.0));
    REQUIRE(config.input.full_output);
    REQUIRE(config.input.sill == Approx(0.8));
    REQUIRE(config.input.range_max == Approx(2e6));
    REQUIRE(config.input.nkrige_wells == 24);
    REQUIRE(config.input.KVp == Approx(-0.5));

    REQUIRE(config.estimate.parameters == std::vector<std::string>{"sill", "KCk"});
    REQUIRE(config.estimate.pilot_points == std::vector<std::string>{"KCMin", "KFMin"});
    REQUIRE(config.estimate.aquitard_pilot_points.empty());
    REQUIRE(config.estimate.rename.at("KCk") == "kc_global");
    REQUIRE(config.estimate.pilot_point_rename.size() == 2);
    REQUIRE(config.estimate.pilot_point_rename.at("KFMin") == "kfmin");

    REQUIRE(config.output.control_file == "run.in");
    REQUIRE(config.output.template_file == "run.tpl");
    REQUIRE(config.output.delimiter == '@');
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("Config parse errors", "[config]") {
    SECTION("unknown key") {
        const auto path = write_temp("t2p_test_bad.cfg", "variogram:\n  silll: 1.0\n");
        REQUIRE_THROWS_AS(Config::from_file(path), ConfigError);
        fs::remove(path);
    }

    SECTION("unknown section") {
        const auto path = write_temp("t2p_test_bad.cfg", "solver:\n  tol: 1e-6\n");
        REQUIRE_THROWS_AS(Config::from_file(path), ConfigError);
        fs::remove(path);
    }

    SECTION("malformed number") {
        const auto path = write_temp("t2p_test_bad.cfg", "variogram:\n  sill: high\n");
        REQUIRE_THROWS_AS(Config::from_file(path), std::invalid_argument);
        fs::remove(path);
    }

    SECTION("missing colon") {
        const auto path = write_temp("t2p_test_bad.cfg", "files:\n  well_log_file dataset.dat\n");
        REQUIRE_THROWS_AS(Config::from_file(path), std::invalid_argument);
        fs::remove(path);
    }

    SECTION("errors carry the line number") {
        const auto path = write_temp("t2p_test_bad.cfg", "model:\n\n  xoff: 1\n  zoff: 2\n");
        try {
            Config::from_file(path);
            FAIL("expected ConfigError");
        } catch (const ConfigError& e) {
            REQUIRE(std::string(e.what()).find(":4:") != std::string::npos);
        }
        fs::remove(path);
    }

    REQUIRE_THROWS_AS(Config::from_file(fs::temp_directory_path() / "t2p_no_such.cfg"),
                      std::runtime_error);
    REQUIRE_THROWS_AS(config_io::parse_delimiter("$$"), std::invalid_argument);
    REQUIRE_THROWS_AS(config_io::parse_renames("KCk kc"), std::invalid_argument);
}

TEST_CASE("Config write and read", "[config][io]") {
    auto config = basic_config();
    config.input.sim_file = "Simulation.in";
    config.input.preproc_file = "PreProcessor.in";
    config.input.range_min = 12345.678;
    config.input.nkrige_wells = 8;
    config.estimate.aquitard_pilot_points = {"KCMin"};
    config.estimate.aquitard_rename = {{"KCMin", "akc"}};
    config.output.template_file = "run.tpl";
    config.output.delimiter = '%';

    const auto path = fs::temp_directory_path() / "t2p_test_roundtrip.cfg";
    config.to_file(path);
    auto back = Config::from_file(path);
    fs::remove(path);

    REQUIRE(back.input.sim_file == "Simulation.in");
    REQUIRE(back.input.preproc_file == std::optional<std::string>("PreProcessor.in"));
    REQUIRE(back.input.range_min == Approx(12345.678));
    REQUIRE(back.input.nkrige_wells == 8);
    REQUIRE(back.estimate.aquitard_pilot_points == config.estimate.aquitard_pilot_points);
    REQUIRE(back.estimate.aquitard_rename == config.estimate.aquitard_rename);
    REQUIRE(back.estimate.parameters.empty());
    REQUIRE(back.output.template_file == "run.tpl");
    REQUIRE(back.output.delimiter == '%');
    REQUIRE_NOTHROW(back.validate());
}

TEST_CASE("Config validation", "[config]") {
    auto config = basic_config();
    REQUIRE_NOTHROW(config.validate());

    SECTION("missing files") {
        config.input.unit_file.clear();
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("missing simulation file") {
        config.input.sim_file.clear();
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("IWFM without pre-processor") {
        config.input.sim_file = "Simulation.in";
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("pilot point file not found") {
        config.pilot_points_file = fs::temp_directory_path() / "t2p_no_such_pp.dat";
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("kriging wells") {
        config.input.nkrige_wells = 0;
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("template and control file collide") {
        config.output.template_file = config.output.control_file;
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }

    SECTION("estimation needs a template file") {
        config.estimate.parameters = {"sill"};
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
        config.output.template_file = "run.tpl";
        REQUIRE_NOTHROW(config.validate());
    }

    SECTION("unknown estimation names") {
        config.output.template_file = "run.tpl";
        config.estimate.parameters = {"sil"};
        REQUIRE_THROWS_AS(config.validate(), ConfigError);

        config.estimate.parameters.clear();
        config.estimate.aquitard_pilot_points = {"SsC"};
        REQUIRE_THROWS_AS(config.validate(), ConfigError);

        config.estimate.aquitard_pilot_points.clear();
        config.estimate.pilot_point_rename = {{"KCMin", ""}};
        REQUIRE_THROWS_AS(config.validate(), ConfigError);
    }
}

TEST_CASE("Reading pilot point files", "[config][pilot_point]") {
    const auto aquifer_path = write_temp(
        "t2p_test_pp.dat",
        "X Y KCMin deltaKC KFMin deltaKF SsC SsF SyC SyF AnisoC AnisoF Zone\n"
        "100 200 1 2 3 4 1e-5 2e-5 0.1 0.2 5 6 1\n"
        "\n"
        "300 400 1 2 3 4 1e-5 2e-5 0.1 0.2 5 6 2\n");
    const auto aquitard_path = write_temp(
        "t2p_test_app.dat",
        "X Y KCMin deltaKC KFMin deltaKF AnisoC AnisoF Zone\n"
        "500 600 1 2 3 4 7 8 3\n");

    auto aquifer = read_pilot_points(aquifer_path, PilotPointKind::Aquifer);
    REQUIRE(aquifer.size() == 2);
    REQUIRE(aquifer[1].kind() == PilotPointKind::Aquifer);
    REQUIRE(aquifer[1].zone() == 2);
    REQUIRE(aquifer[0].parameters().value("SyF") == Approx(0.2));
    REQUIRE(aquifer[0].parameters().value("AnisoF") == Approx(6.0));

    auto aquitard = read_pilot_points(aquitard_path, PilotPointKind::Aquitard);
    REQUIRE(aquitard.size() == 1);
    REQUIRE(aquitard[0].zone() == 3);
    REQUIRE(aquitard[0].parameters().value("AnisoC") == Approx(7.0));

    SECTION("assembled into the control file") {
        auto config = basic_config();
        config.pilot_points_file = aquifer_path;
        config.aquitard_pilot_points_file = aquitard_path;
        config.estimate.parameters = {"KCk"};
        config.estimate.rename = {{"KCk", "kc_global"}};
        config.estimate.pilot_points = {"KCMin"};
        config.estimate.aquitard_pilot_points = {"KFMin"};
        config.estimate.aquitard_rename = {{"KFMin", "akf"}};
        config.output.template_file = "run.tpl";
        REQUIRE_NOTHROW(config.validate());

        std::vector<std::string> messages;
        auto input = config.make_input_file(
            [&messages](const std::string& m) { messages.push_back(m); });
        REQUIRE(input.n_pilot_points().first == 2);
        REQUIRE(input.n_pilot_points().second == 1);
        REQUIRE(input.global_parameters().list_selected() == std::vector<std::string>{"KCk"});
        REQUIRE(messages.back() == "Loaded 2 aquifer and 1 aquitard pilot points");

        TemplateOptions options;
        options.enabled = true;
        const auto text = input.to_string(options);
        REQUIRE(text.find("$ kc_global    $") != std::string::npos);
        REQUIRE(text.find("$ KCMin_02     $") != std::string::npos);
        REQUIRE(text.find("$ akf_01       $") != std::string::npos);
    }

    SECTION("malformed rows") {
        const auto bad_token = write_temp(
            "t2p_test_bad_pp.dat",
            "X Y KCMin deltaKC KFMin deltaKF AnisoC AnisoF Zone\n"
            "500 600 1 2 three 4 7 8 3\n");
        REQUIRE_THROWS_AS(read_pilot_points(bad_token, PilotPointKind::Aquitard),
                          std::runtime_error);

        // A row long enough for an aquitard point is short for an aquifer point
        REQUIRE_THROWS_AS(read_pilot_points(aquitard_path, PilotPointKind::Aquifer),
                          std::runtime_error);
        fs::remove(bad_token);
    }

    fs::remove(aquifer_path);
    fs::remove(aquitard_path);
}
