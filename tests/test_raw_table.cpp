#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "t2p/io/raw_table.hpp"
#include <filesystem>
#include <fstream>

using namespace t2p;
using Catch::Approx;

namespace fs = std::filesystem;

TEST_CASE("RawTable columns", "[raw_table]") {
    RawTable raw;
    raw.add_text_column("Name", {"A", "B"});
    raw.add_column("X", std::vector<Real>{1.0, 2.5});

    REQUIRE(raw.n_rows() == 2);
    REQUIRE(raw.n_columns() == 2);
    REQUIRE(raw.has_column("X"));
    REQUIRE(raw.is_numeric("X"));
    REQUIRE_FALSE(raw.is_numeric("Name"));
    REQUIRE(raw.numeric("X")(1) == Approx(2.5));
    REQUIRE(raw.text("X", 1) == "2.5");
    REQUIRE(raw.text("Name", 0) == "A");

    SECTION("duplicate column") {
        REQUIRE_THROWS_AS(raw.add_column("X", std::vector<Real>{0.0, 0.0}), SchemaError);
    }

    SECTION("length mismatch") {
        REQUIRE_THROWS_AS(raw.add_column("Y", std::vector<Real>{0.0}), ShapeError);
    }

    SECTION("numeric access to text or absent columns") {
        REQUIRE_THROWS_AS(raw.numeric("Name"), SchemaError);
        REQUIRE_THROWS_AS(raw.numeric("Depth"), SchemaError);
    }
}

TEST_CASE("RawTable delimited read", "[raw_table][io]") {
    const auto path = fs::temp_directory_path() / "t2p_test_raw_table.csv";
    {
        std::ofstream f(path);
        f << "Name,X,Y,Zland,Depth,PC\n"
          << "W1,1,2,100,5,80\n"
          << "W2,3,4,90,NA,\n"
          << "\n"
          << "W3,5,6,95,12,-999\n";
    }

    auto raw = RawTable::from_file(path);
    REQUIRE(raw.n_rows() == 3);
    REQUIRE_FALSE(raw.is_numeric("Name"));
    REQUIRE(raw.is_numeric("Depth"));
    REQUIRE(is_missing(raw.numeric("Depth")(1)));
    REQUIRE(is_missing(raw.numeric("PC")(1)));
    REQUIRE(is_missing(raw.numeric("PC")(2)));
    REQUIRE(raw.numeric("Zland")(2) == Approx(95.0));

    SECTION("forced text column") {
        RawReadOptions opts;
        opts.text_columns = {"X"};
        auto forced = RawTable::from_file(path, opts);
        REQUIRE_FALSE(forced.is_numeric("X"));
        REQUIRE(forced.text("X", 0) == "1");
    }

    SECTION("write then read") {
        const auto out = fs::temp_directory_path() / "t2p_test_raw_table_out.csv";
        raw.to_file(out);
        auto back = RawTable::from_file(out);
        REQUIRE(back.column_names() == raw.column_names());
        REQUIRE(back.numeric("X")(2) == Approx(5.0));
        REQUIRE(is_missing(back.numeric("PC")(2)));
        fs::remove(out);
    }

    fs::remove(path);
}

TEST_CASE("Numeric cells keep their source token", "[raw_table][io]") {
    const auto path = fs::temp_directory_path() / "t2p_test_raw_tokens.csv";
    {
        std::ofstream f(path);
        f << "Name,Depth\n"
          << "0012,5.50\n"
          << "-99,1e1\n";
    }

    auto raw = RawTable::from_file(path);
    fs::remove(path);

    // Inferred numeric, but text() returns the cells as written
    REQUIRE(raw.is_numeric("Name"));
    REQUIRE(raw.numeric("Name")(0) == Approx(12.0));
    REQUIRE(is_missing(raw.numeric("Name")(1)));
    REQUIRE(raw.text("Name", 0) == "0012");
    REQUIRE(raw.text("Name", 1) == "-99");
    REQUIRE(raw.text("Depth", 0) == "5.50");
    REQUIRE(raw.text("Depth", 1) == "1e1");
}

TEST_CASE("RawTable rejects short rows", "[raw_table][io]") {
    const auto path = fs::temp_directory_path() / "t2p_test_raw_short.csv";
    {
        std::ofstream f(path);
        f << "Name,X,Y\nW1,1\n";
    }
    REQUIRE_THROWS_AS(RawTable::from_file(path), std::runtime_error);
    REQUIRE_THROWS_AS(RawTable::from_file(fs::temp_directory_path() / "t2p_no_such_file.csv"),
                      std::runtime_error);
    fs::remove(path);
}
