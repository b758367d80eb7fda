/**
 * @file dataset.hpp
 * @brief Append-only well-log table with a running maximum well ID
 *
 * A Dataset collects batches of canonical well-log rows. Every merge
 * offsets the batch's well IDs by the current maximum ID, so IDs stay
 * globally unique across independent batches.
 */

#pragma once

#include "../core/types.hpp"
#include "../io/format.hpp"
#include "reconciler.hpp"
#include "schema.hpp"
#include <filesystem>
#include <iosfwd>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace t2p {

/**
 * @brief Delimited dataset file writing options
 */
struct WriteOptions {
    char delimiter = '\t';
    std::string missing = "-999";                   ///< Written for missing values
    NumberFormat float_format = formats::DATASET;   ///< Float columns (default %.5f)
};

/**
 * @brief Delimited dataset file reading options
 */
struct ReadOptions {
    char delimiter = '\t';
    std::vector<std::string> missing_values = {"-99", "-999"};
};

/**
 * @brief A single well added by value rather than from a raw table
 */
struct ManualWell {
    std::string name;
    Real x = 0.0;
    Real y = 0.0;
    Real land_elevation = 0.0;
    std::vector<Real> depths;                               ///< Interval bottoms
    std::map<std::string, std::vector<Real>> class_values;  ///< One value per depth
    std::vector<std::vector<Real>> zones;                   ///< Per depth, one code per layer
};

/**
 * @brief Distinct well location
 */
struct WellCoordinate {
    Index well_id;
    Real x;
    Real y;

    bool operator==(const WellCoordinate& o) const {
        return well_id == o.well_id && x == o.x && y == o.y;
    }
};

/**
 * @brief Well-log table (the interpolator's well log / dataset file)
 */
class Dataset {
public:
    explicit Dataset(DatasetSchema schema, StatusCallback status = nullptr);

    /**
     * @brief Read a delimited dataset file
     *
     * The first line is skipped (comment, not a header). Columns are
     * mapped by position onto the schema; extra columns are ignored.
     */
    static Dataset read(const std::filesystem::path& filepath, DatasetSchema schema,
                        const ReadOptions& options = {});

    static Dataset from_file(const std::filesystem::path& filepath, DatasetSchema schema,
                             const ReadOptions& options = {}) {
        return read(filepath, std::move(schema), options);
    }

    // ========================================================================
    // Adding wells
    // ========================================================================

    /**
     * @brief Append canonical rows, offsetting well IDs by max_id()
     *
     * Rows must carry local IDs starting at 1 (as produced by
     * IntervalReconciler). The store is unchanged if a row does not match
     * the schema.
     */
    void merge(std::vector<WellLogRow> rows);

    /**
     * @brief Reconcile a raw table and merge the result
     *
     * All validation runs before the store is touched.
     *
     * @return Number of rows added (including synthetic gap rows)
     */
    Index add_wells(const RawTable& raw, const ReconcileOptions& options);

    /**
     * @brief Append a single well given by value
     *
     * @return The well ID assigned
     * @throws ShapeError if value/depth/zone lists differ in length
     * @throws SchemaError if classes or zones required by the schema are missing
     */
    Index add_well(const ManualWell& well);

    // ========================================================================
    // Output
    // ========================================================================

    /// Write delimited text (whole file, header line first)
    void write(const std::filesystem::path& filepath, const WriteOptions& options = {}) const;

    /// Render delimited text to a stream
    void render(std::ostream& os, const WriteOptions& options = {}) const;

    // ========================================================================
    // Queries
    // ========================================================================

    /// Distinct (well_id, x, y), first-seen order
    std::vector<WellCoordinate> well_coordinates() const;

    /// Numeric column by schema name or label; throws SchemaError for text/unknown
    Vector column(const std::string& name) const;

    const DatasetSchema& schema() const { return schema_; }
    const std::vector<WellLogRow>& rows() const { return rows_; }
    Index size() const { return static_cast<Index>(rows_.size()); }
    bool empty() const { return rows_.empty(); }
    Index max_id() const { return max_id_; }
    Index n_wells() const { return static_cast<Index>(well_coordinates().size()); }

    void set_status_callback(StatusCallback status) { status_ = std::move(status); }

private:
    DatasetSchema schema_;
    std::vector<WellLogRow> rows_;
    Index max_id_ = 0;
    StatusCallback status_;

    void check_row_shape(const WellLogRow& row) const;
    Real cell_value(const WellLogRow& row, const ColumnSpec& col) const;
};

} // namespace t2p
