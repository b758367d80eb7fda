/**
 * @file format.hpp
 * @brief Number formatting for delimited and fixed-column output
 *
 * Formats are always passed explicitly to the writer that uses them
 * rather than being held as mutable object state.
 */

#pragma once

#include "../core/types.hpp"
#include <string>

namespace t2p {

/**
 * @brief How a numeric value is rendered as text
 */
struct NumberFormat {
    enum class Kind {
        Fixed,          ///< printf "%.Nf"
        Scientific,     ///< printf "%.Ne"
        Integer,        ///< printf "%d" (value rounded to nearest)
    };

    Kind kind = Kind::Fixed;
    int precision = 5;

    static NumberFormat fixed(int precision) { return {Kind::Fixed, precision}; }
    static NumberFormat scientific(int precision) { return {Kind::Scientific, precision}; }
    static NumberFormat integer() { return {Kind::Integer, 0}; }

    /// Parse a printf-style spec: "%.4f", "%.3e", "%d"
    static NumberFormat parse(const std::string& spec);

    /// Render value (missing values are rendered as "nan")
    std::string format(Real value) const;

    /// printf-style spec string for this format
    std::string spec() const;

    bool operator==(const NumberFormat& other) const {
        return kind == other.kind && (kind == Kind::Integer || precision == other.precision);
    }
};

namespace formats {
    inline const NumberFormat DATASET = NumberFormat::fixed(5);       ///< Dataset float columns
    inline const NumberFormat CONTROL_FLOAT = NumberFormat::fixed(4); ///< Control file floats
    inline const NumberFormat CONTROL_SCI = NumberFormat::scientific(4);
    inline const NumberFormat PP_FLOAT = NumberFormat::fixed(2);      ///< Pilot point floats
    inline const NumberFormat PP_SCI = NumberFormat::scientific(3);
    inline const NumberFormat INTEGER = NumberFormat::integer();
}

// ============================================================================
// Text Helpers
// ============================================================================

namespace text {

/// Strip leading/trailing whitespace
std::string trim(const std::string& s);

/// Split on a single delimiter character, keeping empty fields
std::vector<std::string> split(const std::string& line, char delimiter);

/// Split on runs of whitespace
std::vector<std::string> split_whitespace(const std::string& line);

/// Left-justify to width (no truncation)
std::string ljust(const std::string& s, Size width);

/// Parse a floating point token, throws std::invalid_argument on garbage
Real to_real(const std::string& token);

/// Parse an integer token, throws std::invalid_argument on garbage
Index to_index(const std::string& token);

/// Parse "true"/"false" (case-insensitive, also 1/0)
bool to_bool(const std::string& token);

} // namespace text

} // namespace t2p
