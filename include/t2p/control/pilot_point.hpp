/**
 * @file pilot_point.hpp
 * @brief Pilot points: spatial nodes where hydraulic parameters are estimated
 *
 * A pilot point is a common payload (location, zone, conductivity and
 * anisotropy terms) plus, for aquifer points only, a storage payload.
 * Aquitard points carry no storage payload and write a reduced line.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/parameters.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace t2p {

/**
 * @brief Conductivity and anisotropy terms shared by all pilot points
 */
struct HydraulicValues {
    Real KCMin = 0.0;       ///< Coarse hydraulic conductivity minimum
    Real deltaKC = 0.0;     ///< Coarse hydraulic conductivity delta
    Real KFMin = 0.0;       ///< Fine hydraulic conductivity minimum
    Real deltaKF = 0.0;     ///< Fine hydraulic conductivity delta
    Real AnisoC = 10.0;     ///< Coarse anisotropy
    Real AnisoF = 10.0;     ///< Fine anisotropy
};

/**
 * @brief Storage terms (aquifer pilot points only)
 */
struct StorageValues {
    Real SsC = 0.0;         ///< Coarse specific storage
    Real SsF = 0.0;         ///< Fine specific storage
    Real SyC = 0.0;         ///< Coarse specific yield
    Real SyF = 0.0;         ///< Fine specific yield
};

/**
 * @brief One pilot point
 */
class PilotPoint {
public:
    /// Aquifer point (full parameter set)
    static PilotPoint aquifer(const Vec2& location, const HydraulicValues& hydraulic,
                              const StorageValues& storage, Index zone = 1);

    /// Aquitard point (no storage terms)
    static PilotPoint aquitard(const Vec2& location, const HydraulicValues& hydraulic,
                               Index zone = 1);

    /// Estimable parameter names, in line order
    static std::vector<std::string> parameter_names(PilotPointKind kind);

    PilotPointKind kind() const {
        return storage_ ? PilotPointKind::Aquifer : PilotPointKind::Aquitard;
    }
    bool has_storage() const { return storage_.has_value(); }

    const Vec2& location() const { return location_; }
    Real x() const { return location_.x(); }
    Real y() const { return location_.y(); }
    Index zone() const { return zone_; }
    const HydraulicValues& hydraulic() const { return hydraulic_; }
    const std::optional<StorageValues>& storage() const { return storage_; }

    /// Estimable parameters (values, formats, flags)
    const ParameterCatalog& parameters() const { return params_; }

    void select_for_estimation(const std::vector<std::string>& names) {
        params_.select_for_estimation(names);
    }
    void rename_for_estimation(const std::string& name, const std::string& display_name) {
        params_.rename_for_estimation(name, display_name);
    }

private:
    PilotPoint(const Vec2& location, const HydraulicValues& hydraulic,
               std::optional<StorageValues> storage, Index zone);

    Vec2 location_;
    Index zone_;
    HydraulicValues hydraulic_;
    std::optional<StorageValues> storage_;
    ParameterCatalog params_;
};

/**
 * @brief Read pilot points from a whitespace-delimited file
 *
 * The first line is skipped. Columns are
 * X Y KCMin deltaKC KFMin deltaKF SsC SsF SyC SyF AnisoC AnisoF Zone (aquifer) or
 * X Y KCMin deltaKC KFMin deltaKF AnisoC AnisoF Zone (aquitard).
 */
std::vector<PilotPoint> read_pilot_points(const std::filesystem::path& filepath,
                                          PilotPointKind kind);

} // namespace t2p
