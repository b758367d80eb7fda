/**
 * @file raw_table.cpp
 * @brief RawTable implementation and delimited reader/writer
 */

#include "t2p/io/raw_table.hpp"
#include "t2p/io/format.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace t2p {

namespace {

bool is_missing_token(const std::string& token, const std::vector<std::string>& missing) {
    return std::find(missing.begin(), missing.end(), token) != missing.end();
}

bool parses_as_real(const std::string& token) {
    try {
        text::to_real(token);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    }
}

} // namespace

// ============================================================================
// Reading / Writing
// ============================================================================

RawTable RawTable::from_file(const std::filesystem::path& filepath,
                             const RawReadOptions& options) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open table file: " + filepath.string());
    }

    std::string line;
    if (!std::getline(file, line)) {
        throw std::runtime_error("Table file is empty: " + filepath.string());
    }
    std::vector<std::string> header = text::split(line, options.delimiter);
    for (auto& h : header) {
        h = text::trim(h);
    }

    // Cells by column
    std::vector<std::vector<std::string>> cells(header.size());
    Index line_no = 1;
    while (std::getline(file, line)) {
        ++line_no;
        if (text::trim(line).empty()) continue;
        auto fields = text::split(line, options.delimiter);
        if (fields.size() < header.size()) {
            throw std::runtime_error(
                filepath.string() + ":" + std::to_string(line_no) + ": expected " +
                std::to_string(header.size()) + " fields, found " +
                std::to_string(fields.size()));
        }
        for (size_t c = 0; c < header.size(); ++c) {
            cells[c].push_back(text::trim(fields[c]));
        }
    }

    RawTable table;
    for (size_t c = 0; c < header.size(); ++c) {
        const auto& col = cells[c];
        bool numeric = options.text_columns.count(header[c]) == 0;
        if (numeric) {
            for (const auto& token : col) {
                if (!is_missing_token(token, options.missing_values) && !parses_as_real(token)) {
                    numeric = false;
                    break;
                }
            }
        }

        if (numeric) {
            Vector values(static_cast<Index>(col.size()));
            for (size_t r = 0; r < col.size(); ++r) {
                values(static_cast<Index>(r)) = is_missing_token(col[r], options.missing_values)
                    ? constants::MISSING : text::to_real(col[r]);
            }
            table.add_column(header[c], values);
            table.tokens_[header[c]] = col;
        } else {
            table.add_text_column(header[c], col);
        }
    }
    return table;
}

void RawTable::to_file(const std::filesystem::path& filepath, char delimiter,
                       const std::string& missing) const {
    std::ostringstream os;
    for (size_t c = 0; c < names_.size(); ++c) {
        if (c > 0) os << delimiter;
        os << names_[c];
    }
    os << "\n";
    for (Index r = 0; r < n_rows_; ++r) {
        for (size_t c = 0; c < names_.size(); ++c) {
            if (c > 0) os << delimiter;
            const auto& name = names_[c];
            if (is_numeric(name) && is_missing(numeric_.at(name)(r))) {
                os << missing;
            } else {
                os << text(name, r);
            }
        }
        os << "\n";
    }

    std::ofstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot write table file: " + filepath.string());
    }
    file << os.str();
}

// ============================================================================
// Columns
// ============================================================================

void RawTable::check_new_column(const std::string& name, Index length) {
    if (has_column(name)) {
        throw SchemaError("Duplicate column: " + name);
    }
    if (!names_.empty() && length != n_rows_) {
        throw ShapeError("Column '" + name + "' has " + std::to_string(length) +
                         " rows, table has " + std::to_string(n_rows_));
    }
}

void RawTable::add_column(const std::string& name, const Vector& values) {
    check_new_column(name, values.size());
    names_.push_back(name);
    numeric_[name] = values;
    n_rows_ = values.size();
}

void RawTable::add_column(const std::string& name, const std::vector<Real>& values) {
    add_column(name, Eigen::Map<const Vector>(values.data(), static_cast<Index>(values.size())));
}

void RawTable::add_text_column(const std::string& name, std::vector<std::string> values) {
    const Index length = static_cast<Index>(values.size());
    check_new_column(name, length);
    names_.push_back(name);
    text_[name] = std::move(values);
    n_rows_ = length;
}

bool RawTable::has_column(const std::string& name) const {
    return numeric_.count(name) > 0 || text_.count(name) > 0;
}

bool RawTable::is_numeric(const std::string& name) const {
    return numeric_.count(name) > 0;
}

const Vector& RawTable::numeric(const std::string& name) const {
    auto it = numeric_.find(name);
    if (it == numeric_.end()) {
        if (text_.count(name) > 0) {
            throw SchemaError("Column is not numeric: " + name);
        }
        throw SchemaError("Missing column: " + name);
    }
    return it->second;
}

std::string RawTable::text(const std::string& name, Index row) const {
    auto tit = text_.find(name);
    if (tit != text_.end()) {
        return tit->second.at(static_cast<size_t>(row));
    }
    auto kit = tokens_.find(name);
    if (kit != tokens_.end()) {
        return kit->second.at(static_cast<size_t>(row));
    }
    const Real value = numeric(name)(row);
    std::ostringstream os;
    os << std::setprecision(15) << value;
    return os.str();
}

} // namespace t2p
