/**
 * @file template_writer.cpp
 * @brief Control file line rendering
 */

#include "t2p/control/template_writer.hpp"
#include "t2p/control/pilot_point.hpp"
#include <iomanip>
#include <sstream>

namespace t2p {

std::string placeholder_token(const std::string& name, char delimiter) {
    std::string token;
    token += delimiter;
    token += ' ';
    token += text::ljust(name, constants::PLACEHOLDER_WIDTH);
    token += ' ';
    token += delimiter;
    return token;
}

std::string finish_line(const std::string& prefix, const std::string& description) {
    std::string line = prefix;
    if (line.size() < static_cast<size_t>(constants::COMMENT_COLUMN)) {
        line.append(constants::COMMENT_COLUMN - line.size(), ' ');
    }
    return line + "/ " + description + "\n";
}

std::string render_value_line(Real value, const NumberFormat& format,
                              const std::string& description) {
    return finish_line(" " + format.format(value), description);
}

std::string render_value_line(const ParameterCatalog& catalog, const std::string& key,
                              const std::string& description,
                              const TemplateOptions& options) {
    const Parameter& p = catalog.at(key);
    if (options.enabled && p.estimate) {
        return finish_line(placeholder_token(p.placeholder_name(), options.delimiter),
                           description);
    }
    return render_value_line(p.value, p.format, description);
}

std::string render_string_line(const std::string& text, const std::string& description) {
    return finish_line(" " + text, description);
}

std::string render_pilot_point_line(const PilotPoint& point, Index index,
                                    const TemplateOptions& options) {
    std::ostringstream suffix;
    suffix << '_' << std::setw(2) << std::setfill('0') << (index + 1);

    std::string line = formats::PP_FLOAT.format(point.x()) + " " +
                       formats::PP_FLOAT.format(point.y());
    for (const auto& p : point.parameters()) {
        line += ' ';
        if (options.enabled && p.estimate) {
            line += placeholder_token(p.placeholder_name() + suffix.str(), options.delimiter);
        } else {
            line += p.format.format(p.value);
        }
    }
    line += ' ';
    line += formats::INTEGER.format(static_cast<Real>(point.zone()));
    return line + "\n";
}

std::string divider_line(char fill) {
    return "*" + std::string(constants::DIVIDER_WIDTH, fill) + "\n";
}

std::string section_header(const std::string& label) {
    const std::string divider = divider_line('-');
    return divider + "* " + label + "\n" + divider;
}

} // namespace t2p
