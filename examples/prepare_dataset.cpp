/**
 * @file prepare_dataset.cpp
 * @brief Tool: raw well-log tables to a merged interpolator dataset file
 *
 * Each raw table (delimited text, header line = column names) is
 * reconciled and merged in command-line order, so well IDs stay unique
 * across tables. An existing dataset file can be extended with --append.
 *
 * Usage:
 *   t2p_prepare_dataset --classes PC[,PC2...] --out dataset.dat [options] raw1.csv [raw2.csv ...]
 */

#include <t2p/t2p.hpp>
#include <CLI/CLI.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace t2p;

int main(int argc, char** argv) {
    CLI::App app{"Merge raw well-log tables into a Texture2Par dataset file"};

    std::vector<std::string> raw_files;
    std::vector<std::string> classes;
    std::string out_file;
    std::string append_file;
    std::string top_col;
    std::string point_col;
    std::string delimiter = ",";
    Index n_layers = 0;
    bool no_fill = false;
    bool verbose = false;

    SchemaOptions schema_opts;
    ReconcileOptions reconcile;

    app.add_option("raw", raw_files, "Raw well-log tables, merged in order")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("--classes", classes, "Classification columns (comma separated)")
        ->required()
        ->delimiter(',');
    app.add_option("--out", out_file, "Dataset file to write")->required();
    app.add_option("--append", append_file, "Existing dataset file to extend")
        ->check(CLI::ExistingFile);
    app.add_option("--zones", n_layers, "Number of hsu_<i> zone layers")
        ->check(CLI::PositiveNumber);
    app.add_flag("--variances", schema_opts.variances, "Carry <class>_var variance columns");
    app.add_option("--name-col", reconcile.name_col, "Well name column")->capture_default_str();
    app.add_option("--x-col", reconcile.x_col, "X column")->capture_default_str();
    app.add_option("--y-col", reconcile.y_col, "Y column")->capture_default_str();
    app.add_option("--zland-col", reconcile.zland_col, "Land elevation column")
        ->capture_default_str();
    app.add_option("--depth-col", reconcile.depth_col, "Bottom depth column")
        ->capture_default_str();
    app.add_option("--top-col", top_col, "Top depth column (enables gap filling)");
    app.add_option("--point-col", point_col, "Explicit point index column");
    app.add_flag("--no-fill", no_fill, "Do not insert gap intervals");
    app.add_option("--delimiter", delimiter, "Raw table delimiter")->capture_default_str();
    app.add_flag("--verbose", verbose, "Status messages to stderr");

    CLI11_PARSE(app, argc, argv);

    try {
        StatusCallback status = verbose ? stderr_status() : nullptr;

        if (n_layers > 0) {
            schema_opts.zones = true;
            schema_opts.n_layers = n_layers;
        }
        if (!top_col.empty()) reconcile.depth_top_col = top_col;
        if (!point_col.empty()) reconcile.point_col = point_col;
        reconcile.fill_missing = !no_fill;

        RawReadOptions raw_opts;
        raw_opts.delimiter = config_io::parse_delimiter(delimiter);
        raw_opts.text_columns.insert(reconcile.name_col);

        auto schema = DatasetSchema::dataset(classes, schema_opts);
        Dataset dataset = append_file.empty()
            ? Dataset(schema, status)
            : Dataset::read(append_file, schema);
        dataset.set_status_callback(status);

        if (status && !append_file.empty()) {
            status("Loaded " + std::to_string(dataset.size()) + " rows from " +
                   append_file + " (max ID " + std::to_string(dataset.max_id()) + ")");
        }

        for (const auto& raw_file : raw_files) {
            const RawTable raw = RawTable::from_file(raw_file, raw_opts);
            dataset.add_wells(raw, reconcile);
        }

        dataset.write(out_file);

        std::cout << "Wrote " << dataset.size() << " rows from " << dataset.n_wells()
                  << " wells to " << out_file << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
