/**
 * File Format Parsers
 *
 * Utilities for reading evidence tables:
 * - DelimitedTableReader: header-indexed tab-separated tables, plain or gzip
 * - Cell parsing helpers for nullable score columns
 */

#ifndef FILE_PARSERS_HPP
#define FILE_PARSERS_HPP

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>

namespace genescore {

/**
 * Split a line on a single-character delimiter (empty fields kept)
 */
std::vector<std::string> split_line(const std::string& line, char delim);

/**
 * Strip leading/trailing whitespace
 */
std::string trim(const std::string& str);

bool file_exists(const std::string& path);

/**
 * Check if path ends with .gz
 */
inline bool ends_with_gz(const std::string& path) {
    return path.size() > 3 && path.compare(path.size() - 3, 3, ".gz") == 0;
}

/**
 * Check whether a cell spells a missing value ("", "NA", ".", "NaN", "nan", "NULL")
 */
bool is_missing_cell(const std::string& cell);

/**
 * Parse a nullable numeric cell.
 * @return Value, or nullopt for missing, unparsable or non-finite cells
 */
std::optional<double> parse_score_cell(const std::string& cell);

// ============================================================================
// Delimited Table Reader
// ============================================================================

/**
 * Tab-delimited table reader.
 * The first non-comment line is the header; a leading '#' on it is stripped.
 * Files ending in .gz are decompressed with zlib.
 */
class DelimitedTableReader {
public:
    /**
     * Open a table
     * @param path Path to .tsv or .tsv.gz file
     * @param delim Field delimiter
     * @throws std::runtime_error if the file cannot be opened or has no header
     */
    explicit DelimitedTableReader(const std::string& path, char delim = '\t');

    ~DelimitedTableReader();

    // Prevent copying
    DelimitedTableReader(const DelimitedTableReader&) = delete;
    DelimitedTableReader& operator=(const DelimitedTableReader&) = delete;

    /**
     * Read the next data row
     * @param fields Output fields (resized to the header width)
     * @return false at end of file
     * @throws std::runtime_error on a read error or truncated gzip stream
     */
    bool next(std::vector<std::string>& fields);

    /**
     * Get all column names
     */
    const std::vector<std::string>& get_columns() const;

    /**
     * Get 0-based index of a column, or -1 if absent
     */
    int column_index(const std::string& column) const;

    /**
     * Get index of a required column
     * @throws std::runtime_error if the column is absent
     */
    int require_column(const std::string& column) const;

    /**
     * Number of data rows read so far
     */
    size_t rows_read() const;

    std::string get_path() const { return path_; }

private:
    struct Impl;
    std::unique_ptr<Impl> pimpl_;
    std::string path_;
};

} // namespace genescore

#endif // FILE_PARSERS_HPP
