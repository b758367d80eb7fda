/**
 * @file parameters.hpp
 * @brief Named scalar parameters with estimation flags
 *
 * A ParameterCatalog is an ordered list of parameter records. Each record
 * carries its value, its display format, whether it is selected for
 * estimation and an optional display name used for template placeholders.
 * Pilot points and the control file's global settings both use it.
 */

#pragma once

#include "types.hpp"
#include "../io/format.hpp"
#include <initializer_list>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace t2p {

/**
 * @brief One named scalar parameter
 */
struct Parameter {
    std::string name;                           ///< Catalog key
    Real value = 0.0;
    NumberFormat format = formats::CONTROL_FLOAT;
    bool estimate = false;                      ///< Selected for estimation
    std::optional<std::string> display_name;    ///< Placeholder override

    /// Name used in template placeholders
    const std::string& placeholder_name() const {
        return display_name ? *display_name : name;
    }
};

/**
 * @brief Ordered collection of Parameter records
 */
class ParameterCatalog {
public:
    ParameterCatalog() = default;
    ParameterCatalog(std::initializer_list<Parameter> params);

    /// Append a record; throws SchemaError on a duplicate name
    void add(Parameter param);

    bool contains(const std::string& name) const;

    /// Record by name; throws SchemaError for unknown names
    const Parameter& at(const std::string& name) const;

    Real value(const std::string& name) const { return at(name).value; }
    void set_value(const std::string& name, Real value);

    // ========================================================================
    // Estimation
    // ========================================================================

    /**
     * @brief Mark parameters as estimation targets
     *
     * All names are checked first; nothing is changed if one is unknown.
     *
     * @throws SchemaError listing the unknown name and the available ones
     */
    void select_for_estimation(const std::vector<std::string>& names);

    /// Clear all estimation flags
    void clear_selection();

    /**
     * @brief Override the placeholder name of a parameter
     *
     * The catalog key is unchanged.
     */
    void rename_for_estimation(const std::string& name, const std::string& display_name);

    // ========================================================================
    // Diagnostics
    // ========================================================================

    std::vector<std::string> list_parameters() const;
    std::vector<std::string> list_selected() const;

    /// Print available and selected parameters
    void describe(std::ostream& os) const;

    const std::vector<Parameter>& parameters() const { return params_; }
    Index size() const { return static_cast<Index>(params_.size()); }
    bool empty() const { return params_.empty(); }

    std::vector<Parameter>::const_iterator begin() const { return params_.begin(); }
    std::vector<Parameter>::const_iterator end() const { return params_.end(); }

private:
    std::vector<Parameter> params_;

    Parameter& find(const std::string& name);
    [[noreturn]] void unknown(const std::string& name) const;
};

} // namespace t2p
