/**
 * @file parameters.cpp
 * @brief ParameterCatalog implementation
 */

#include "t2p/core/parameters.hpp"
#include <algorithm>
#include <ostream>

namespace t2p {

namespace {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

} // namespace

ParameterCatalog::ParameterCatalog(std::initializer_list<Parameter> params) {
    for (const auto& p : params) {
        add(p);
    }
}

void ParameterCatalog::add(Parameter param) {
    if (contains(param.name)) {
        throw SchemaError("Duplicate parameter: " + param.name);
    }
    params_.push_back(std::move(param));
}

bool ParameterCatalog::contains(const std::string& name) const {
    return std::any_of(params_.begin(), params_.end(),
                       [&name](const Parameter& p) { return p.name == name; });
}

void ParameterCatalog::unknown(const std::string& name) const {
    throw SchemaError("Unknown parameter '" + name + "'. Available Parameters: " +
                      join(list_parameters(), ", "));
}

const Parameter& ParameterCatalog::at(const std::string& name) const {
    for (const auto& p : params_) {
        if (p.name == name) return p;
    }
    unknown(name);
}

Parameter& ParameterCatalog::find(const std::string& name) {
    for (auto& p : params_) {
        if (p.name == name) return p;
    }
    unknown(name);
}

void ParameterCatalog::set_value(const std::string& name, Real value) {
    find(name).value = value;
}

// ============================================================================
// Estimation
// ============================================================================

void ParameterCatalog::select_for_estimation(const std::vector<std::string>& names) {
    for (const auto& name : names) {
        if (!contains(name)) unknown(name);
    }
    for (const auto& name : names) {
        find(name).estimate = true;
    }
}

void ParameterCatalog::clear_selection() {
    for (auto& p : params_) {
        p.estimate = false;
    }
}

void ParameterCatalog::rename_for_estimation(const std::string& name,
                                             const std::string& display_name) {
    find(name).display_name = display_name;
}

// ============================================================================
// Diagnostics
// ============================================================================

std::vector<std::string> ParameterCatalog::list_parameters() const {
    std::vector<std::string> names;
    names.reserve(params_.size());
    for (const auto& p : params_) {
        names.push_back(p.name);
    }
    return names;
}

std::vector<std::string> ParameterCatalog::list_selected() const {
    std::vector<std::string> names;
    for (const auto& p : params_) {
        if (p.estimate) names.push_back(p.name);
    }
    return names;
}

void ParameterCatalog::describe(std::ostream& os) const {
    os << "Available Parameters: " << join(list_parameters(), ", ") << "\n";
    os << "Parameters set to estimation: " << join(list_selected(), ", ") << "\n";
}

} // namespace t2p
