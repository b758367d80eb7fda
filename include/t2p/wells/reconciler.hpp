/**
 * @file reconciler.hpp
 * @brief Canonicalization of raw well-log intervals
 *
 * Turns an arbitrary raw table of well-log intervals into canonical rows:
 * - dense well IDs, one per distinct (name, x, y)
 * - per-well point indices 1..k ascending by bottom depth
 * - no vertical gaps: when top depths are given, uncovered spans between
 *   the ground surface (depth 0) and the deepest interval are filled with
 *   synthetic rows whose class values are missing
 */

#pragma once

#include "../core/types.hpp"
#include "schema.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace t2p {

/**
 * @brief One interval sample belonging to one well
 */
struct WellLogRow {
    std::string location;               ///< Well/location name
    Index well_id = 0;                  ///< Dense positive well ID
    Index point_index = 0;              ///< 1..k within the well
    Real x = 0.0;
    Real y = 0.0;
    Real land_elevation = 0.0;          ///< Land surface elevation
    Real bottom_depth = 0.0;            ///< Interval bottom depth
    Real top_depth = constants::MISSING;///< Interval top (reconciliation only)
    std::vector<Real> classes;          ///< Per schema class, NaN = missing
    std::vector<Real> variances;        ///< Per schema class when variances are on
    std::vector<Real> zones;            ///< Per layer, NaN = missing
};

/**
 * @brief Column mapping and behavior for reconciliation
 */
struct ReconcileOptions {
    std::string name_col = "Name";
    std::string x_col = "X";
    std::string y_col = "Y";
    std::string zland_col = "Zland";
    std::string depth_col = "Depth";                ///< Interval bottom depth
    std::optional<std::string> depth_top_col;       ///< Enables gap filling
    std::optional<std::string> point_col;           ///< Explicit point indices

    /// Class key -> raw column. Empty means every schema class, same name.
    std::map<std::string, std::string> class_cols;

    /// Class key -> raw variance column. Missing keys default to "<class>_var".
    std::map<std::string, std::string> variance_cols;

    bool fill_missing = true;
    StatusCallback status;                          ///< Progress messages (optional)
};

/**
 * @brief Produces canonical rows from a raw table for a given schema
 *
 * Pre-condition for gap filling: intervals of a well must be sorted and
 * non-overlapping once ordered by bottom depth. Overlapping intervals
 * (top <= previous bottom) are passed through without correction.
 */
class IntervalReconciler {
public:
    explicit IntervalReconciler(DatasetSchema schema);

    /**
     * @brief Check every column requirement without building anything
     *
     * @throws SchemaError naming the missing or invalid column
     */
    void validate(const RawTable& raw, const ReconcileOptions& options) const;

    /**
     * @brief Validate, then build canonical rows
     *
     * Well IDs start at 1 in first-encountered order of (name, x, y).
     */
    std::vector<WellLogRow> reconcile(const RawTable& raw,
                                      const ReconcileOptions& options) const;

    const DatasetSchema& schema() const { return schema_; }

    // ========================================================================
    // Building blocks (exposed for testing)
    // ========================================================================

    /// Stable sort by (well_id, bottom_depth) and number points 1..k per well
    static void assign_point_indices(std::vector<WellLogRow>& rows);

    /**
     * @brief Append synthetic rows covering gaps between consecutive intervals
     *
     * @return Number of rows inserted
     */
    static Index fill_gaps(std::vector<WellLogRow>& rows);

private:
    DatasetSchema schema_;

    std::map<std::string, std::string> class_columns(const ReconcileOptions& options) const;
    std::string variance_column(const ReconcileOptions& options, const std::string& key) const;
};

} // namespace t2p
