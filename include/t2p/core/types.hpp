/**
 * @file types.hpp
 * @brief Core type definitions for t2p
 *
 * This file defines the fundamental types used throughout t2p,
 * including scalar types, array types, callbacks and error types.
 */

#pragma once

#include <Eigen/Core>
#include <cmath>
#include <cstdint>
#include <vector>
#include <functional>
#include <limits>
#include <stdexcept>
#include <string>

namespace t2p {

// ============================================================================
// Scalar Types
// ============================================================================

using Real = double;
using Index = int64_t;
using Size = size_t;

// ============================================================================
// Array Types (Eigen-based)
// ============================================================================

using Vector = Eigen::VectorXd;

// Fixed-size vector for map coordinates
using Vec2 = Eigen::Vector2d;

// ============================================================================
// Enums
// ============================================================================

/**
 * @brief Model family the interpolator writes parameters for
 */
enum class ModelType {
    MODFLOW,            ///< Selected by a .nam simulation (name) file
    IWFM,               ///< Any other simulation file, needs a pre-processor file
};

/**
 * @brief Pilot point collection
 */
enum class PilotPointKind {
    Aquifer,            ///< Full parameter set, including storage terms
    Aquitard,           ///< Reduced set without storage terms
};

// ============================================================================
// Forward Declarations
// ============================================================================

class RawTable;
class DatasetSchema;
class Dataset;
class ParameterCatalog;
class PilotPoint;
class InputFile;
class Config;

// ============================================================================
// Function Types for Callbacks
// ============================================================================

/// Status sink: receives human-readable progress messages (row and well counts)
using StatusCallback = std::function<void(const std::string& message)>;

/// Callback that prints status messages to stderr
StatusCallback stderr_status();

// ============================================================================
// Errors
// ============================================================================

/**
 * @brief A required column is missing or a class/variance/zone name is invalid
 */
class SchemaError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Parallel input lists have mismatched lengths
 */
class ShapeError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Inconsistent control file settings
 */
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// ============================================================================
// Constants
// ============================================================================

namespace constants {
    constexpr Real MISSING = std::numeric_limits<Real>::quiet_NaN(); ///< Missing value marker
    constexpr int COMMENT_COLUMN = 40;          ///< Column where "/ description" starts
    constexpr int PLACEHOLDER_WIDTH = 12;       ///< Left-justified placeholder name width
    constexpr int DIVIDER_WIDTH = 79;           ///< Characters after the leading '*'
}

/// True if value is the missing marker
inline bool is_missing(Real value) { return std::isnan(value); }

} // namespace t2p
