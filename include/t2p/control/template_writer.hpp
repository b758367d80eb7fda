/**
 * @file template_writer.hpp
 * @brief Fixed-column control file lines, literal or templated
 *
 * Every data line of the control file has the layout
 *
 *     " <value>" padded with spaces to column 40, then "/ <description>"
 *
 * In template mode a parameter selected for estimation is written as a
 * placeholder token instead of its value:
 *
 *     "<d> <name padded to 12> <d>"
 *
 * which a PEST-style template processor substitutes before each model run.
 * A prefix already wider than column 40 is written unchanged and the
 * comment follows it directly.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/parameters.hpp"
#include "../io/format.hpp"
#include <string>

namespace t2p {

class PilotPoint;

/**
 * @brief Template (PEST ptf) output options
 */
struct TemplateOptions {
    bool enabled = false;       ///< Write placeholders for selected parameters
    char delimiter = '$';       ///< Placeholder delimiter, announced by "ptf <d>"
};

/// "<d> <name padded to 12> <d>"
std::string placeholder_token(const std::string& name, char delimiter);

/// Pad prefix to the comment column and append "/ description\n"
std::string finish_line(const std::string& prefix, const std::string& description);

/// Literal value line
std::string render_value_line(Real value, const NumberFormat& format,
                              const std::string& description);

/**
 * @brief Value line for a catalog parameter
 *
 * Writes the placeholder when template mode is enabled and the parameter
 * is selected for estimation, otherwise the formatted value.
 *
 * @throws SchemaError if key is not in the catalog
 */
std::string render_value_line(const ParameterCatalog& catalog, const std::string& key,
                              const std::string& description,
                              const TemplateOptions& options = {});

/// Literal string line
std::string render_string_line(const std::string& text, const std::string& description);

/**
 * @brief One pilot point line: X Y <parameters> Zone, space separated
 *
 * Placeholders are named "<name>_<NN>", NN being the 1-based position of
 * the point in its collection, zero-padded to two digits.
 *
 * @param index 0-based position in the collection
 */
std::string render_pilot_point_line(const PilotPoint& point, Index index,
                                    const TemplateOptions& options = {});

/// Divider, "* label", divider
std::string section_header(const std::string& label);

/// '*' followed by 79 fill characters
std::string divider_line(char fill);

} // namespace t2p
