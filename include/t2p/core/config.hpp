/**
 * @file config.hpp
 * @brief Configuration for the t2p command-line tools
 *
 * Defines the runtime configuration of a control file run:
 * - File paths (model files, pilot point files)
 * - Model placement and program settings
 * - Variogram and global settings
 * - Estimation selection and placeholder renames
 * - Output settings
 */

#pragma once

#include "types.hpp"
#include "../control/input_file.hpp"
#include <filesystem>
#include <iosfwd>
#include <map>
#include <string>
#include <vector>

namespace t2p {

/**
 * @brief Parameters selected for estimation (template file only)
 */
struct EstimateConfig {
    std::vector<std::string> parameters;            ///< Global catalog names
    std::vector<std::string> pilot_points;          ///< Aquifer pilot point names
    std::vector<std::string> aquitard_pilot_points; ///< Aquitard pilot point names

    // Placeholder overrides (name -> display name)
    std::map<std::string, std::string> rename;
    std::map<std::string, std::string> pilot_point_rename;
    std::map<std::string, std::string> aquitard_rename;

    bool any() const {
        return !parameters.empty() || !pilot_points.empty() || !aquitard_pilot_points.empty();
    }
};

/**
 * @brief Output configuration
 */
struct OutputConfig {
    std::filesystem::path control_file = "Texture2Par.in";
    std::filesystem::path template_file;        ///< Empty = no template written
    char delimiter = '$';                       ///< Template placeholder delimiter
    bool verbose = false;                       ///< Status messages to stderr
};

/**
 * @brief Complete configuration
 */
class Config {
public:
    Config() = default;

    // Load from sectioned key: value file
    static Config from_file(const std::filesystem::path& filepath);

    // Save in the same format
    void to_file(const std::filesystem::path& filepath) const;

    /**
     * @brief Check consistency
     *
     * @throws ConfigError describing the first problem found
     */
    void validate() const;

    /**
     * @brief Build the control file model
     *
     * Reads the pilot point files (when given) and applies the estimation
     * selection and renames.
     */
    InputFile make_input_file(StatusCallback status = nullptr) const;

    // Sub-configurations
    InputFileSettings input;
    EstimateConfig estimate;
    OutputConfig output;

    // Pilot point files
    std::filesystem::path pilot_points_file;
    std::filesystem::path aquitard_pilot_points_file;

    // Print summary
    void print_summary(std::ostream& os) const;

private:
    void validate_paths() const;
    void validate_estimate() const;
};

// ============================================================================
// Parser Helpers
// ============================================================================

namespace config_io {

/// Parse a comma-separated list (empty entries dropped)
std::vector<std::string> parse_list(const std::string& value);

/// Parse "a = b, c = d" rename pairs
std::map<std::string, std::string> parse_renames(const std::string& value);

/// Inverse of parse_list / parse_renames
std::string join_list(const std::vector<std::string>& values);
std::string join_renames(const std::map<std::string, std::string>& renames);

/// Single character delimiter
char parse_delimiter(const std::string& value);

} // namespace config_io

} // namespace t2p
