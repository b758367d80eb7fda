/**
 * @file format.cpp
 * @brief Number formatting and text helpers
 */

#include "t2p/io/format.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace t2p {

// ============================================================================
// NumberFormat
// ============================================================================

NumberFormat NumberFormat::parse(const std::string& spec) {
    const std::string s = text::trim(spec);
    if (s == "%d" || s == "%i") {
        return integer();
    }
    // %.Nf / %.Ne
    if (s.size() >= 4 && s[0] == '%' && s[1] == '.') {
        const char conv = s.back();
        const std::string digits = s.substr(2, s.size() - 3);
        if (!digits.empty() &&
            std::all_of(digits.begin(), digits.end(),
                        [](unsigned char c) { return std::isdigit(c); })) {
            const int precision = std::stoi(digits);
            if (conv == 'f') return fixed(precision);
            if (conv == 'e') return scientific(precision);
        }
    }
    throw std::invalid_argument("Unsupported number format: " + spec);
}

std::string NumberFormat::format(Real value) const {
    if (is_missing(value)) {
        return "nan";
    }
    std::ostringstream os;
    switch (kind) {
        case Kind::Fixed:
            os << std::fixed << std::setprecision(precision) << value;
            break;
        case Kind::Scientific:
            os << std::scientific << std::setprecision(precision) << value;
            break;
        case Kind::Integer:
            os << std::llround(value);
            break;
    }
    return os.str();
}

std::string NumberFormat::spec() const {
    switch (kind) {
        case Kind::Fixed: return "%." + std::to_string(precision) + "f";
        case Kind::Scientific: return "%." + std::to_string(precision) + "e";
        case Kind::Integer: return "%d";
        default: return "%s";
    }
}

// ============================================================================
// text helpers
// ============================================================================

namespace text {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& line, char delimiter) {
    std::vector<std::string> fields;
    std::string current;
    for (char c : line) {
        if (c == delimiter) {
            fields.push_back(current);
            current.clear();
        } else if (c != '\r' && c != '\n') {
            current += c;
        }
    }
    fields.push_back(current);
    return fields;
}

std::vector<std::string> split_whitespace(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream iss(line);
    std::string token;
    while (iss >> token) {
        fields.push_back(token);
    }
    return fields;
}

std::string ljust(const std::string& s, Size width) {
    if (s.size() >= width) return s;
    return s + std::string(width - s.size(), ' ');
}

Real to_real(const std::string& token) {
    const std::string t = trim(token);
    size_t pos = 0;
    Real value = 0.0;
    try {
        value = std::stod(t, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Not a number: '" + token + "'");
    }
    if (pos != t.size()) {
        throw std::invalid_argument("Not a number: '" + token + "'");
    }
    return value;
}

Index to_index(const std::string& token) {
    const Real value = to_real(token);
    if (std::floor(value) != value) {
        throw std::invalid_argument("Not an integer: '" + token + "'");
    }
    return static_cast<Index>(value);
}

bool to_bool(const std::string& token) {
    std::string t = trim(token);
    std::transform(t.begin(), t.end(), t.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (t == "true" || t == "1" || t == "yes") return true;
    if (t == "false" || t == "0" || t == "no") return false;
    throw std::invalid_argument("Not a boolean: '" + token + "'");
}

} // namespace text

} // namespace t2p
