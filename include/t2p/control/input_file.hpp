/**
 * @file input_file.hpp
 * @brief Texture2Par control (input) file model and writer
 *
 * Holds everything the interpolator reads from its control file:
 * - file paths and model type (MODFLOW or IWFM)
 * - program, variogram and global settings
 * - aquifer and aquitard pilot points
 *
 * The same model writes both the literal control file and the PEST
 * template variant (see TemplateOptions).
 */

#pragma once

#include "../core/types.hpp"
#include "../core/parameters.hpp"
#include "pilot_point.hpp"
#include "template_writer.hpp"
#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace t2p {

/**
 * @brief Construction settings of an InputFile
 *
 * Estimable values (variogram and global settings) seed the global
 * ParameterCatalog; change them afterwards through global_parameters().
 */
struct InputFileSettings {
    // Files
    std::string well_log_file;                  ///< Well log / dataset file
    std::string unit_file;                      ///< Hydrogeologic units file
    std::string sim_file;                       ///< Simulation file (.nam for MODFLOW)
    std::optional<std::string> preproc_file;    ///< IWFM pre-processor file
    std::string template_file;                  ///< GW / layer parameter template file
    std::string pp_zone_file;                   ///< Pilot point node zones file

    // MODFLOW grid placement
    Real xoff = 0.0;
    Real yoff = 0.0;
    Real rotation = 0.0;

    // Program settings
    bool full_output = false;

    // Variogram
    Index variogram_type = 1;
    Real sill = 1.0;
    Real range_max = 1e7;
    Real range_min = 1e7;
    Real anisotropy = 0.0;
    Real nugget = 0.0;
    Index nkrige_wells = 16;

    // Global settings
    Real KCk = 0.007;
    Real KFk = 0.0099;
    Real KHp = 0.93;
    Real KVp = -0.62;
    Real Syp = 1.0;
};

/**
 * @brief Texture2Par control file
 */
class InputFile {
public:
    /**
     * @brief Build from settings, detecting the model type
     *
     * @throws ConfigError if the simulation file is empty, or if an IWFM
     *         model has no pre-processor file
     */
    explicit InputFile(InputFileSettings settings, StatusCallback status = nullptr);

    /// ".nam" extension selects MODFLOW, anything else IWFM
    static ModelType detect_model_type(const std::string& sim_file,
                                       const std::optional<std::string>& preproc_file);

    static std::string to_string(ModelType type);

    /// Global catalog names, in control file order
    static std::vector<std::string> global_parameter_names();

    ModelType model_type() const { return model_type_; }
    const InputFileSettings& settings() const { return settings_; }

    // ========================================================================
    // Pilot points
    // ========================================================================

    void add_pilot_point(const Vec2& location, const HydraulicValues& hydraulic,
                         const StorageValues& storage, Index zone = 1);
    void add_aquitard_pilot_point(const Vec2& location, const HydraulicValues& hydraulic,
                                  Index zone = 1);

    /// Append an existing point to the collection matching its kind
    void add_pilot_point(PilotPoint point);

    const std::vector<PilotPoint>& pilot_points(PilotPointKind kind) const {
        return kind == PilotPointKind::Aquifer ? aquifer_pp_ : aquitard_pp_;
    }

    /// (aquifer, aquitard) counts
    std::pair<Index, Index> n_pilot_points() const {
        return {static_cast<Index>(aquifer_pp_.size()), static_cast<Index>(aquitard_pp_.size())};
    }

    /**
     * @brief Select parameters for estimation on every point of a collection
     *
     * @throws SchemaError if a name is not a parameter of that kind
     */
    void select_pilot_point_parameters(const std::vector<std::string>& names,
                                       PilotPointKind kind = PilotPointKind::Aquifer);

    /// Placeholder name override on every point of a collection
    void rename_pilot_point_parameter(const std::string& name, const std::string& display_name,
                                      PilotPointKind kind = PilotPointKind::Aquifer);

    // ========================================================================
    // Global parameters
    // ========================================================================

    ParameterCatalog& global_parameters() { return params_; }
    const ParameterCatalog& global_parameters() const { return params_; }

    void select_for_estimation(const std::vector<std::string>& names) {
        params_.select_for_estimation(names);
    }
    void rename_for_estimation(const std::string& name, const std::string& display_name) {
        params_.rename_for_estimation(name, display_name);
    }

    // ========================================================================
    // Output
    // ========================================================================

    /// Render the control file (or its template when options.enabled)
    void render(std::ostream& os, const TemplateOptions& options = {}) const;

    std::string to_string(const TemplateOptions& options = {}) const;

    /// Write the whole file in one pass
    void write(const std::filesystem::path& filepath,
               const TemplateOptions& options = {}) const;

private:
    InputFileSettings settings_;
    ModelType model_type_;
    ParameterCatalog params_;
    std::vector<PilotPoint> aquifer_pp_;
    std::vector<PilotPoint> aquitard_pp_;
    StatusCallback status_;

    std::vector<PilotPoint>& collection(PilotPointKind kind) {
        return kind == PilotPointKind::Aquifer ? aquifer_pp_ : aquitard_pp_;
    }
    static void check_pilot_point_names(const std::vector<std::string>& names,
                                        PilotPointKind kind);
};

} // namespace t2p
