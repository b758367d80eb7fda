#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "t2p/core/parameters.hpp"
#include "t2p/control/pilot_point.hpp"
#include <sstream>

using namespace t2p;
using Catch::Approx;

TEST_CASE("ParameterCatalog basics", "[parameters]") {
    ParameterCatalog catalog{
        {"sill", 1.0, formats::CONTROL_FLOAT},
        {"range_max", 1e7, formats::CONTROL_SCI},
        {"KCk", 0.007, formats::CONTROL_FLOAT},
    };

    REQUIRE(catalog.size() == 3);
    REQUIRE(catalog.contains("KCk"));
    REQUIRE_FALSE(catalog.contains("KFk"));
    REQUIRE(catalog.value("range_max") == Approx(1e7));
    REQUIRE(catalog.at("range_max").format == formats::CONTROL_SCI);

    catalog.set_value("sill", 2.5);
    REQUIRE(catalog.value("sill") == Approx(2.5));

    REQUIRE(catalog.list_parameters() == std::vector<std::string>{"sill", "range_max", "KCk"});
    REQUIRE_THROWS_AS(catalog.at("nugget"), SchemaError);
    REQUIRE_THROWS_AS(catalog.add({"sill", 0.0}), SchemaError);
}

TEST_CASE("Selecting parameters for estimation", "[parameters]") {
    ParameterCatalog catalog{{"a", 1.0}, {"b", 2.0}, {"c", 3.0}};

    catalog.select_for_estimation({"a", "c"});
    REQUIRE(catalog.list_selected() == std::vector<std::string>{"a", "c"});
    REQUIRE(catalog.at("a").estimate);
    REQUIRE_FALSE(catalog.at("b").estimate);

    SECTION("unknown name changes nothing") {
        catalog.clear_selection();
        REQUIRE_THROWS_AS(catalog.select_for_estimation({"b", "z"}), SchemaError);
        REQUIRE(catalog.list_selected().empty());
    }

    SECTION("error lists the available names") {
        try {
            catalog.select_for_estimation({"z"});
            FAIL("expected SchemaError");
        } catch (const SchemaError& e) {
            REQUIRE(std::string(e.what()).find("a, b, c") != std::string::npos);
        }
    }

    SECTION("rename keeps the key") {
        catalog.rename_for_estimation("a", "alpha");
        REQUIRE(catalog.at("a").placeholder_name() == "alpha");
        REQUIRE(catalog.at("b").placeholder_name() == "b");
        REQUIRE(catalog.contains("a"));
        REQUIRE_THROWS_AS(catalog.rename_for_estimation("z", "zeta"), SchemaError);
    }

    SECTION("describe") {
        std::ostringstream os;
        catalog.describe(os);
        REQUIRE(os.str() == "Available Parameters: a, b, c\nParameters set to estimation: a, c\n");
    }
}

TEST_CASE("Pilot point parameters", "[parameters][pilot_point]") {
    auto aquifer = PilotPoint::aquifer(Vec2(10.0, 20.0), {1.0, 2.0, 3.0, 4.0},
                                       {1e-5, 2e-5, 0.1, 0.2}, 3);
    REQUIRE(aquifer.kind() == PilotPointKind::Aquifer);
    REQUIRE(aquifer.zone() == 3);
    REQUIRE(aquifer.parameters().list_parameters() ==
            PilotPoint::parameter_names(PilotPointKind::Aquifer));
    REQUIRE(aquifer.parameters().at("SsC").format == formats::PP_SCI);
    REQUIRE(aquifer.parameters().value("AnisoC") == Approx(10.0));

    auto aquitard = PilotPoint::aquitard(Vec2(10.0, 20.0), {1.0, 2.0, 3.0, 4.0, 5.0, 6.0});
    REQUIRE(aquitard.kind() == PilotPointKind::Aquitard);
    REQUIRE_FALSE(aquitard.has_storage());
    REQUIRE(aquitard.zone() == 1);
    REQUIRE(aquitard.parameters().size() == 6);
    REQUIRE(aquitard.parameters().value("AnisoF") == Approx(6.0));
    REQUIRE_THROWS_AS(aquitard.select_for_estimation({"SyC"}), SchemaError);
}
