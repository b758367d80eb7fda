/**
 * @file schema.hpp
 * @brief Column schema of a well-log dataset
 *
 * Two layouts are supported:
 * - Dataset:       Location ID n X Y Zland Depth <classes> [<class>_var] [hsu_1..hsu_n]
 * - WellLogFile:   WellName Well Point PC X Y Zland Depth [1..n]
 *
 * Zone columns are always written with bare layer numbers as labels.
 */

#pragma once

#include "../core/types.hpp"
#include <string>
#include <vector>

namespace t2p {

/**
 * @brief What a column holds
 */
enum class ColumnKind {
    Location,           ///< Well/location name (text)
    WellId,             ///< Dense integer well ID
    Point,              ///< Per-well point index
    X,
    Y,
    LandElevation,      ///< Land surface elevation
    Depth,              ///< Interval bottom depth
    Class,              ///< Classification value (e.g. percent coarse)
    Variance,           ///< Classification variance
    Zone,               ///< Per-layer hydrostratigraphic unit code
};

/**
 * @brief One schema column
 */
struct ColumnSpec {
    ColumnKind kind;
    std::string name;       ///< Internal name (also raw-table backing name for zones)
    std::string label;      ///< Header label written to file
    Index slot = 0;         ///< Class index (Class/Variance) or 0-based layer (Zone)

    bool is_integer() const {
        return kind == ColumnKind::WellId || kind == ColumnKind::Point || kind == ColumnKind::Zone;
    }
};

/**
 * @brief Options for building a Dataset layout schema
 */
struct SchemaOptions {
    bool zones = false;         ///< Per-layer HSU columns present
    Index n_layers = 0;         ///< Number of zone layers (must be > 0 with zones)
    bool variances = false;     ///< One variance column per class
};

/**
 * @brief Fixed column schema of a Dataset
 */
class DatasetSchema {
public:
    DatasetSchema() = default;

    /// Classification dataset layout
    static DatasetSchema dataset(const std::vector<std::string>& classes,
                                 const SchemaOptions& options = {});

    /// Legacy well log file layout (single "PC" class)
    static DatasetSchema well_log_file(bool zones = false, Index n_layers = 0);

    const std::vector<ColumnSpec>& columns() const { return columns_; }
    Index n_columns() const { return static_cast<Index>(columns_.size()); }

    const std::vector<std::string>& classes() const { return classes_; }
    Index n_classes() const { return static_cast<Index>(classes_.size()); }
    bool has_class(const std::string& name) const;
    /// 0-based class index; throws SchemaError for unknown names
    Index class_index(const std::string& name) const;

    bool has_variances() const { return variances_; }
    bool has_zones() const { return n_layers_ > 0; }
    Index n_layers() const { return n_layers_; }

    /// Header labels in column order
    std::vector<std::string> header_labels() const;

    /// Raw-table column backing zone layer (1-based): "hsu_<layer>"
    static std::string zone_column(Index layer);

    /// Default raw-table column backing the variance of a class
    static std::string variance_column(const std::string& class_name);

private:
    std::vector<ColumnSpec> columns_;
    std::vector<std::string> classes_;
    bool variances_ = false;
    Index n_layers_ = 0;

    void add(ColumnKind kind, const std::string& name, const std::string& label, Index slot = 0);
    void add_zones(Index n_layers);
};

} // namespace t2p
