/**
 * @file dataset.cpp
 * @brief Dataset merge, manual well addition and delimited file I/O
 */

#include "t2p/wells/dataset.hpp"
#include "t2p/io/raw_table.hpp"
#include <algorithm>
#include <fstream>
#include <ostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <tuple>

namespace t2p {

Dataset::Dataset(DatasetSchema schema, StatusCallback status)
    : schema_(std::move(schema)), status_(std::move(status)) {}

// ============================================================================
// Adding wells
// ============================================================================

void Dataset::check_row_shape(const WellLogRow& row) const {
    const auto n_var = schema_.has_variances() ? schema_.n_classes() : 0;
    if (static_cast<Index>(row.classes.size()) != schema_.n_classes() ||
        static_cast<Index>(row.variances.size()) != n_var ||
        static_cast<Index>(row.zones.size()) != schema_.n_layers()) {
        throw ShapeError("Row for well '" + row.location + "' does not match dataset schema");
    }
    if (row.well_id < 1) {
        throw ShapeError("Row for well '" + row.location + "' has no well ID");
    }
}

void Dataset::merge(std::vector<WellLogRow> rows) {
    Index batch_max = 0;
    for (const auto& row : rows) {
        check_row_shape(row);
        batch_max = std::max(batch_max, row.well_id);
    }

    rows_.reserve(rows_.size() + rows.size());
    for (auto& row : rows) {
        row.well_id += max_id_;
        row.top_depth = constants::MISSING;
        rows_.push_back(std::move(row));
    }
    max_id_ += batch_max;
}

Index Dataset::add_wells(const RawTable& raw, const ReconcileOptions& options) {
    ReconcileOptions opts = options;
    if (!opts.status) {
        opts.status = status_;
    }

    IntervalReconciler reconciler(schema_);
    auto rows = reconciler.reconcile(raw, opts);
    const Index added = static_cast<Index>(rows.size());
    merge(std::move(rows));
    return added;
}

Index Dataset::add_well(const ManualWell& well) {
    const size_t npoints = well.depths.size();
    if (npoints == 0) {
        throw ShapeError("Well " + well.name + " has no depths");
    }

    for (const auto& [key, values] : well.class_values) {
        if (!schema_.has_class(key)) {
            throw SchemaError("Invalid class " + key);
        }
        if (values.size() != npoints) {
            throw ShapeError("Values for class " + key + " and depth lists must be the same length");
        }
    }
    for (const auto& key : schema_.classes()) {
        if (well.class_values.count(key) == 0) {
            throw SchemaError("Missing values for class " + key);
        }
    }
    if (schema_.has_zones()) {
        if (well.zones.empty()) {
            throw SchemaError("Zones in dataset - must be included for well " + well.name);
        }
        if (well.zones.size() != npoints) {
            throw ShapeError("Zone and depth lists must be the same length");
        }
        for (const auto& z : well.zones) {
            if (static_cast<Index>(z.size()) != schema_.n_layers()) {
                throw ShapeError("Each zone entry must have " +
                                 std::to_string(schema_.n_layers()) + " layers");
            }
        }
    }

    std::vector<WellLogRow> rows(npoints);
    for (size_t i = 0; i < npoints; ++i) {
        auto& row = rows[i];
        row.location = well.name;
        row.well_id = 1;
        row.point_index = static_cast<Index>(i) + 1;
        row.x = well.x;
        row.y = well.y;
        row.land_elevation = well.land_elevation;
        row.bottom_depth = well.depths[i];
        row.classes.resize(static_cast<size_t>(schema_.n_classes()));
        for (Index c = 0; c < schema_.n_classes(); ++c) {
            row.classes[c] = well.class_values.at(schema_.classes()[c])[i];
        }
        if (schema_.has_variances()) {
            row.variances.assign(static_cast<size_t>(schema_.n_classes()), constants::MISSING);
        }
        if (schema_.has_zones()) {
            row.zones = well.zones[i];
        }
    }

    merge(std::move(rows));
    if (status_) {
        status_("Added well " + well.name + " (ID " + std::to_string(max_id_) + ") with " +
                std::to_string(npoints) + " points");
    }
    return max_id_;
}

// ============================================================================
// Output
// ============================================================================

Real Dataset::cell_value(const WellLogRow& row, const ColumnSpec& col) const {
    switch (col.kind) {
        case ColumnKind::WellId: return static_cast<Real>(row.well_id);
        case ColumnKind::Point: return static_cast<Real>(row.point_index);
        case ColumnKind::X: return row.x;
        case ColumnKind::Y: return row.y;
        case ColumnKind::LandElevation: return row.land_elevation;
        case ColumnKind::Depth: return row.bottom_depth;
        case ColumnKind::Class: return row.classes[col.slot];
        case ColumnKind::Variance: return row.variances[col.slot];
        case ColumnKind::Zone: return row.zones[col.slot];
        default:
            throw SchemaError("Column is not numeric: " + col.name);
    }
}

void Dataset::render(std::ostream& os, const WriteOptions& options) const {
    const auto labels = schema_.header_labels();
    for (size_t c = 0; c < labels.size(); ++c) {
        if (c > 0) os << options.delimiter;
        os << labels[c];
    }
    os << "\n";

    for (const auto& row : rows_) {
        bool first = true;
        for (const auto& col : schema_.columns()) {
            if (!first) os << options.delimiter;
            first = false;

            if (col.kind == ColumnKind::Location) {
                os << row.location;
                continue;
            }
            const Real value = cell_value(row, col);
            if (is_missing(value)) {
                os << options.missing;
            } else if (col.is_integer()) {
                os << formats::INTEGER.format(value);
            } else {
                os << options.float_format.format(value);
            }
        }
        os << "\n";
    }
}

void Dataset::write(const std::filesystem::path& filepath, const WriteOptions& options) const {
    std::ostringstream os;
    render(os, options);

    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write dataset file: " + filepath.string());
    }
    file << os.str();
    if (!file) {
        throw std::runtime_error("Error writing dataset file: " + filepath.string());
    }
    if (status_) {
        status_("Wrote " + std::to_string(rows_.size()) + " rows to " + filepath.string());
    }
}

// ============================================================================
// Input
// ============================================================================

Dataset Dataset::read(const std::filesystem::path& filepath, DatasetSchema schema,
                      const ReadOptions& options) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open dataset file: " + filepath.string());
    }

    Dataset dataset(std::move(schema));
    const auto& columns = dataset.schema_.columns();
    const auto& missing = options.missing_values;

    std::string line;
    std::getline(file, line);  // Comment line

    Index line_no = 1;
    while (std::getline(file, line)) {
        ++line_no;
        if (text::trim(line).empty()) continue;

        const auto fields = text::split(line, options.delimiter);
        const std::string where = filepath.string() + ":" + std::to_string(line_no);
        if (fields.size() < columns.size()) {
            throw std::runtime_error(where + ": expected " + std::to_string(columns.size()) +
                                     " fields, found " + std::to_string(fields.size()));
        }

        WellLogRow row;
        row.classes.assign(static_cast<size_t>(dataset.schema_.n_classes()), constants::MISSING);
        if (dataset.schema_.has_variances()) {
            row.variances.assign(static_cast<size_t>(dataset.schema_.n_classes()), constants::MISSING);
        }
        row.zones.assign(static_cast<size_t>(dataset.schema_.n_layers()), constants::MISSING);

        for (size_t c = 0; c < columns.size(); ++c) {
            const auto& col = columns[c];
            const std::string token = text::trim(fields[c]);
            if (col.kind == ColumnKind::Location) {
                row.location = token;
                continue;
            }

            const bool is_na = std::find(missing.begin(), missing.end(), token) != missing.end();
            Real value = constants::MISSING;
            if (!is_na) {
                try {
                    value = text::to_real(token);
                } catch (const std::invalid_argument& e) {
                    throw std::runtime_error(where + ": column " + col.label + ": " + e.what());
                }
            }

            switch (col.kind) {
                case ColumnKind::WellId:
                case ColumnKind::Point:
                    if (is_missing(value)) {
                        throw std::runtime_error(where + ": missing value in column " + col.label);
                    }
                    if (col.kind == ColumnKind::WellId) {
                        row.well_id = static_cast<Index>(value);
                    } else {
                        row.point_index = static_cast<Index>(value);
                    }
                    break;
                case ColumnKind::X: row.x = value; break;
                case ColumnKind::Y: row.y = value; break;
                case ColumnKind::LandElevation: row.land_elevation = value; break;
                case ColumnKind::Depth: row.bottom_depth = value; break;
                case ColumnKind::Class: row.classes[col.slot] = value; break;
                case ColumnKind::Variance: row.variances[col.slot] = value; break;
                case ColumnKind::Zone: row.zones[col.slot] = value; break;
                default: break;
            }
        }

        dataset.max_id_ = std::max(dataset.max_id_, row.well_id);
        dataset.rows_.push_back(std::move(row));
    }
    return dataset;
}

// ============================================================================
// Queries
// ============================================================================

std::vector<WellCoordinate> Dataset::well_coordinates() const {
    std::vector<WellCoordinate> coords;
    std::set<std::tuple<Index, Real, Real>> seen;
    for (const auto& row : rows_) {
        if (seen.insert({row.well_id, row.x, row.y}).second) {
            coords.push_back({row.well_id, row.x, row.y});
        }
    }
    return coords;
}

Vector Dataset::column(const std::string& name) const {
    for (const auto& col : schema_.columns()) {
        if (col.name != name && col.label != name) continue;
        if (col.kind == ColumnKind::Location) {
            throw SchemaError("Column is not numeric: " + name);
        }
        Vector values(size());
        for (Index i = 0; i < size(); ++i) {
            values(i) = cell_value(rows_[static_cast<size_t>(i)], col);
        }
        return values;
    }
    throw SchemaError("Unknown column: " + name);
}

} // namespace t2p
