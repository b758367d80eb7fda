/**
 * @file write_input_file.cpp
 * @brief Tool: configuration file to Texture2Par control and template files
 *
 * Usage:
 *   t2p_write_input config.cfg [--verbose] [--summary]
 *
 * The control file is always written. The PEST template variant is
 * written when the output section names a template_file.
 */

#include <t2p/t2p.hpp>
#include <CLI/CLI.hpp>
#include <iostream>
#include <sstream>
#include <string>

using namespace t2p;

int main(int argc, char** argv) {
    CLI::App app{"Write Texture2Par control and template files from a configuration"};

    std::string config_file;
    bool verbose = false;
    bool summary = false;

    app.add_option("config", config_file, "Configuration file")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_flag("--verbose", verbose, "Status messages to stderr");
    app.add_flag("--summary", summary, "Print the configuration summary");

    CLI11_PARSE(app, argc, argv);

    try {
        Config config = Config::from_file(config_file);
        config.validate();
        if (summary) {
            config.print_summary(std::cout);
        }

        StatusCallback status = (verbose || config.output.verbose) ? stderr_status() : nullptr;
        InputFile input_file = config.make_input_file(status);

        if (status) {
            std::ostringstream os;
            input_file.global_parameters().describe(os);
            status(os.str());
        }

        input_file.write(config.output.control_file);
        if (!config.output.template_file.empty()) {
            TemplateOptions options;
            options.enabled = true;
            options.delimiter = config.output.delimiter;
            input_file.write(config.output.template_file, options);
        }

        std::cout << "Wrote " << config.output.control_file.string();
        if (!config.output.template_file.empty()) {
            std::cout << " and " << config.output.template_file.string();
        }
        std::cout << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
