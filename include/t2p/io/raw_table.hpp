/**
 * @file raw_table.hpp
 * @brief Named-column table for raw well-log input
 *
 * A RawTable is what the interval reconciler consumes: arbitrary columns
 * addressed by name, each either text or numeric. Numeric columns are
 * stored as Eigen vectors with NaN for missing values.
 */

#pragma once

#include "../core/types.hpp"
#include <filesystem>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace t2p {

/**
 * @brief Options for reading a delimited raw table
 */
struct RawReadOptions {
    char delimiter = ',';
    std::vector<std::string> missing_values = {"", "-99", "-999", "NA", "nan"};
    std::unordered_set<std::string> text_columns;   ///< Forced text (others inferred)
};

/**
 * @brief In-memory table with named text and numeric columns
 */
class RawTable {
public:
    RawTable() = default;

    /// Read a delimited file whose first line holds the column names
    static RawTable from_file(const std::filesystem::path& filepath,
                              const RawReadOptions& options = {});

    /// Write as delimited text with a header line
    void to_file(const std::filesystem::path& filepath, char delimiter = ',',
                 const std::string& missing = "") const;

    // ========================================================================
    // Columns
    // ========================================================================

    /// Add a numeric column (all columns must have the same length)
    void add_column(const std::string& name, const Vector& values);
    void add_column(const std::string& name, const std::vector<Real>& values);

    /// Add a text column
    void add_text_column(const std::string& name, std::vector<std::string> values);

    bool has_column(const std::string& name) const;
    bool is_numeric(const std::string& name) const;

    /// Numeric column; throws SchemaError if absent or text
    const Vector& numeric(const std::string& name) const;

    /**
     * @brief Cell as text
     *
     * Numeric columns read from a file return the token as written
     * ("0012" stays "0012", a missing token is returned verbatim). Columns
     * added in memory are rendered with 15 significant digits.
     */
    std::string text(const std::string& name, Index row) const;

    const std::vector<std::string>& column_names() const { return names_; }
    Index n_rows() const { return n_rows_; }
    Index n_columns() const { return static_cast<Index>(names_.size()); }

private:
    std::vector<std::string> names_;
    std::unordered_map<std::string, Vector> numeric_;
    std::unordered_map<std::string, std::vector<std::string>> text_;
    std::unordered_map<std::string, std::vector<std::string>> tokens_;  ///< Source tokens of inferred numeric columns
    Index n_rows_ = 0;

    void check_new_column(const std::string& name, Index length);
};

} // namespace t2p
