/**
 * @file schema.cpp
 * @brief DatasetSchema implementation
 */

#include "t2p/wells/schema.hpp"
#include <algorithm>

namespace t2p {

void DatasetSchema::add(ColumnKind kind, const std::string& name,
                        const std::string& label, Index slot) {
    columns_.push_back({kind, name, label, slot});
}

void DatasetSchema::add_zones(Index n_layers) {
    n_layers_ = n_layers;
    for (Index layer = 1; layer <= n_layers; ++layer) {
        add(ColumnKind::Zone, zone_column(layer), std::to_string(layer), layer - 1);
    }
}

DatasetSchema DatasetSchema::dataset(const std::vector<std::string>& classes,
                                     const SchemaOptions& options) {
    if (options.zones && options.n_layers <= 0) {
        throw SchemaError("n_layers must be > 0 if zones (HSUs) are present");
    }

    DatasetSchema schema;
    schema.classes_ = classes;
    schema.variances_ = options.variances;

    schema.add(ColumnKind::Location, "Location", "Location");
    schema.add(ColumnKind::WellId, "ID", "ID");
    schema.add(ColumnKind::Point, "n", "n");
    schema.add(ColumnKind::X, "X", "X");
    schema.add(ColumnKind::Y, "Y", "Y");
    schema.add(ColumnKind::LandElevation, "Zland", "Zland");
    schema.add(ColumnKind::Depth, "Depth", "Depth");

    for (size_t i = 0; i < classes.size(); ++i) {
        if (std::count(classes.begin(), classes.end(), classes[i]) > 1) {
            throw SchemaError("Duplicate class: " + classes[i]);
        }
        schema.add(ColumnKind::Class, classes[i], classes[i], static_cast<Index>(i));
    }
    if (options.variances) {
        for (size_t i = 0; i < classes.size(); ++i) {
            const auto name = variance_column(classes[i]);
            schema.add(ColumnKind::Variance, name, name, static_cast<Index>(i));
        }
    }
    if (options.zones) {
        schema.add_zones(options.n_layers);
    }
    return schema;
}

DatasetSchema DatasetSchema::well_log_file(bool zones, Index n_layers) {
    if (zones && n_layers <= 0) {
        throw SchemaError("n_layers must be > 0 if geozones are present");
    }

    DatasetSchema schema;
    schema.classes_ = {"PC"};

    schema.add(ColumnKind::Location, "WellName", "WellName");
    schema.add(ColumnKind::WellId, "Well", "Well");
    schema.add(ColumnKind::Point, "Point", "Point");
    schema.add(ColumnKind::Class, "PC", "PC", 0);
    schema.add(ColumnKind::X, "X", "X");
    schema.add(ColumnKind::Y, "Y", "Y");
    schema.add(ColumnKind::LandElevation, "Zland", "Zland");
    schema.add(ColumnKind::Depth, "Depth", "Depth");
    if (zones) {
        schema.add_zones(n_layers);
    }
    return schema;
}

bool DatasetSchema::has_class(const std::string& name) const {
    return std::find(classes_.begin(), classes_.end(), name) != classes_.end();
}

Index DatasetSchema::class_index(const std::string& name) const {
    auto it = std::find(classes_.begin(), classes_.end(), name);
    if (it == classes_.end()) {
        throw SchemaError("Invalid class " + name);
    }
    return static_cast<Index>(it - classes_.begin());
}

std::vector<std::string> DatasetSchema::header_labels() const {
    std::vector<std::string> labels;
    labels.reserve(columns_.size());
    for (const auto& col : columns_) {
        labels.push_back(col.label);
    }
    return labels;
}

std::string DatasetSchema::zone_column(Index layer) {
    return "hsu_" + std::to_string(layer);
}

std::string DatasetSchema::variance_column(const std::string& class_name) {
    return class_name + "_var";
}

} // namespace t2p
