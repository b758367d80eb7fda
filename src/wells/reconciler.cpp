/**
 * @file reconciler.cpp
 * @brief Well ID assignment, point indexing and interval gap filling
 */

#include "t2p/wells/reconciler.hpp"
#include "t2p/io/raw_table.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <tuple>
#include <utility>

namespace t2p {

namespace {

void require_complete(const RawTable& raw, const std::string& col) {
    const Vector& values = raw.numeric(col);
    for (Index r = 0; r < values.size(); ++r) {
        if (is_missing(values(r))) {
            throw SchemaError("Missing value in column " + col + " at row " +
                              std::to_string(r + 1));
        }
    }
}

} // namespace

IntervalReconciler::IntervalReconciler(DatasetSchema schema)
    : schema_(std::move(schema)) {}

std::map<std::string, std::string> IntervalReconciler::class_columns(
    const ReconcileOptions& options
) const {
    if (!options.class_cols.empty()) {
        return options.class_cols;
    }
    std::map<std::string, std::string> cols;
    for (const auto& c : schema_.classes()) {
        cols[c] = c;
    }
    return cols;
}

std::string IntervalReconciler::variance_column(const ReconcileOptions& options,
                                                const std::string& key) const {
    auto it = options.variance_cols.find(key);
    if (it != options.variance_cols.end()) {
        return it->second;
    }
    return DatasetSchema::variance_column(key);
}

// ============================================================================
// Validation
// ============================================================================

void IntervalReconciler::validate(const RawTable& raw, const ReconcileOptions& options) const {
    for (const auto* col : {&options.name_col, &options.x_col, &options.y_col,
                            &options.zland_col, &options.depth_col}) {
        if (!raw.has_column(*col)) {
            throw SchemaError("Missing necessary column in input table: " + *col);
        }
    }
    // Well identity and depth must be numeric and complete
    for (const auto* col : {&options.x_col, &options.y_col, &options.depth_col}) {
        require_complete(raw, *col);
    }
    raw.numeric(options.zland_col);

    if (options.depth_top_col && !raw.has_column(*options.depth_top_col)) {
        throw SchemaError("Missing top depth column: " + *options.depth_top_col);
    }
    if (options.depth_top_col) {
        raw.numeric(*options.depth_top_col);
    }
    if (options.point_col) {
        if (!raw.has_column(*options.point_col)) {
            throw SchemaError("Missing point column: " + *options.point_col);
        }
        require_complete(raw, *options.point_col);
    }

    for (const auto& [key, col_name] : class_columns(options)) {
        if (!schema_.has_class(key)) {
            throw SchemaError("Invalid class " + key);
        }
        if (!raw.has_column(col_name)) {
            throw SchemaError("Missing column for class " + key);
        }
        raw.numeric(col_name);
    }

    if (schema_.has_variances()) {
        for (const auto& key : schema_.classes()) {
            const auto col_name = variance_column(options, key);
            if (!raw.has_column(col_name)) {
                throw SchemaError("Missing variance column for class " + key + ": " + col_name);
            }
            raw.numeric(col_name);
        }
    }

    for (Index layer = 1; layer <= schema_.n_layers(); ++layer) {
        const auto col_name = DatasetSchema::zone_column(layer);
        if (!raw.has_column(col_name)) {
            throw SchemaError("Missing column for " + col_name);
        }
        raw.numeric(col_name);
    }
}

// ============================================================================
// Reconciliation
// ============================================================================

std::vector<WellLogRow> IntervalReconciler::reconcile(const RawTable& raw,
                                                      const ReconcileOptions& options) const {
    validate(raw, options);

    const Index n = raw.n_rows();
    const Vector& x = raw.numeric(options.x_col);
    const Vector& y = raw.numeric(options.y_col);
    const Vector& zland = raw.numeric(options.zland_col);
    const Vector& depth = raw.numeric(options.depth_col);
    const Vector* top = options.depth_top_col ? &raw.numeric(*options.depth_top_col) : nullptr;
    const Vector* points = options.point_col ? &raw.numeric(*options.point_col) : nullptr;

    // Resolve class/variance/zone backing columns once
    std::vector<const Vector*> class_src(schema_.n_classes(), nullptr);
    for (const auto& [key, col_name] : class_columns(options)) {
        class_src[schema_.class_index(key)] = &raw.numeric(col_name);
    }
    std::vector<const Vector*> variance_src;
    if (schema_.has_variances()) {
        for (const auto& key : schema_.classes()) {
            variance_src.push_back(&raw.numeric(variance_column(options, key)));
        }
    }
    std::vector<const Vector*> zone_src;
    for (Index layer = 1; layer <= schema_.n_layers(); ++layer) {
        zone_src.push_back(&raw.numeric(DatasetSchema::zone_column(layer)));
    }

    // Dense IDs per distinct (name, x, y), first-encountered order
    std::map<std::tuple<std::string, Real, Real>, Index> well_ids;
    std::set<std::string> names;

    std::vector<WellLogRow> rows;
    rows.reserve(static_cast<size_t>(n));
    for (Index r = 0; r < n; ++r) {
        WellLogRow row;
        row.location = raw.text(options.name_col, r);
        row.x = x(r);
        row.y = y(r);
        row.land_elevation = zland(r);
        row.bottom_depth = depth(r);
        row.top_depth = top ? (*top)(r) : constants::MISSING;

        auto key = std::make_tuple(row.location, row.x, row.y);
        auto it = well_ids.find(key);
        if (it == well_ids.end()) {
            it = well_ids.emplace(key, static_cast<Index>(well_ids.size()) + 1).first;
        }
        row.well_id = it->second;
        names.insert(row.location);

        if (points) {
            row.point_index = static_cast<Index>(std::llround((*points)(r)));
        }

        row.classes.assign(static_cast<size_t>(schema_.n_classes()), constants::MISSING);
        for (Index c = 0; c < schema_.n_classes(); ++c) {
            if (class_src[c]) row.classes[c] = (*class_src[c])(r);
        }
        for (const auto* src : variance_src) {
            row.variances.push_back((*src)(r));
        }
        for (const auto* src : zone_src) {
            row.zones.push_back((*src)(r));
        }
        rows.push_back(std::move(row));
    }

    if (!points) {
        assign_point_indices(rows);
    }

    if (options.status) {
        options.status("Adding " + std::to_string(n) + " entries from " +
                       std::to_string(well_ids.size()) + " wells (" +
                       std::to_string(names.size()) + " unique names)");
    }

    if (top && options.fill_missing) {
        if (options.status) options.status("Filling interval gaps...");
        const Index inserted = fill_gaps(rows);
        assign_point_indices(rows);
        if (options.status) {
            options.status("Inserted " + std::to_string(inserted) + " gap intervals");
        }
    }

    return rows;
}

void IntervalReconciler::assign_point_indices(std::vector<WellLogRow>& rows) {
    std::stable_sort(rows.begin(), rows.end(), [](const WellLogRow& a, const WellLogRow& b) {
        if (a.well_id != b.well_id) return a.well_id < b.well_id;
        return a.bottom_depth < b.bottom_depth;
    });

    Index current_well = -1;
    Index point = 0;
    for (auto& row : rows) {
        if (row.well_id != current_well) {
            current_well = row.well_id;
            point = 0;
        }
        row.point_index = ++point;
    }
}

Index IntervalReconciler::fill_gaps(std::vector<WellLogRow>& rows) {
    // Row positions grouped per well, each group sorted by bottom depth
    std::map<Index, std::vector<size_t>> groups;
    for (size_t i = 0; i < rows.size(); ++i) {
        groups[rows[i].well_id].push_back(i);
    }

    std::vector<WellLogRow> synthetic;
    for (auto& [well_id, members] : groups) {
        std::stable_sort(members.begin(), members.end(), [&rows](size_t a, size_t b) {
            return rows[a].bottom_depth < rows[b].bottom_depth;
        });

        Real previous_bottom = 0.0;  // Ground surface
        for (size_t i : members) {
            const WellLogRow& current = rows[i];
            if (current.top_depth > previous_bottom) {
                WellLogRow gap = current;
                gap.top_depth = previous_bottom;
                gap.bottom_depth = current.top_depth;
                std::fill(gap.classes.begin(), gap.classes.end(), constants::MISSING);
                std::fill(gap.variances.begin(), gap.variances.end(), constants::MISSING);
                synthetic.push_back(std::move(gap));
            }
            previous_bottom = current.bottom_depth;
        }
    }

    const Index inserted = static_cast<Index>(synthetic.size());
    rows.insert(rows.end(),
                std::make_move_iterator(synthetic.begin()),
                std::make_move_iterator(synthetic.end()));
    return inserted;
}

} // namespace t2p
