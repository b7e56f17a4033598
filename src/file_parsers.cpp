/**
 * File Format Parsers - Implementation
 */

#include "file_parsers.hpp"
#include "gene_scoring.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <sys/stat.h>

#include <zlib.h>

namespace genescore {

// ============================================================================
// Utility Functions
// ============================================================================

std::vector<std::string> split_line(const std::string& line, char delim) {
    std::vector<std::string> result;
    size_t start = 0;
    size_t pos = line.find(delim);
    while (pos != std::string::npos) {
        result.emplace_back(line, start, pos - start);
        start = pos + 1;
        pos = line.find(delim, start);
    }
    result.emplace_back(line, start);
    return result;
}

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool file_exists(const std::string& path) {
    struct stat buffer;
    return (stat(path.c_str(), &buffer) == 0);
}

bool is_missing_cell(const std::string& cell) {
    std::string value = trim(cell);
    return value.empty() || value == "NA" || value == "." || value == "NaN" ||
           value == "nan" || value == "NULL";
}

std::optional<double> parse_score_cell(const std::string& cell) {
    if (is_missing_cell(cell)) return std::nullopt;

    std::string value = trim(cell);
    const char* begin = value.c_str();
    char* end = nullptr;
    errno = 0;
    double parsed = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    if (!std::isfinite(parsed)) return std::nullopt;
    return parsed;
}

// ============================================================================
// DelimitedTableReader Implementation
// ============================================================================

struct DelimitedTableReader::Impl {
    gzFile gz = nullptr;
    std::ifstream file;
    std::string path;
    char delim = '\t';
    std::vector<std::string> columns;
    std::map<std::string, int> column_index;
    size_t rows = 0;

    ~Impl() {
        if (gz) gzclose(gz);
    }

    bool read_line(std::string& line) {
        if (gz) {
            line.clear();
            char buffer[65536];
            while (gzgets(gz, buffer, sizeof(buffer)) != nullptr) {
                line += buffer;
                if (!line.empty() && line.back() == '\n') break;
            }
            // A truncated or corrupt stream also ends gzgets early
            int errnum = Z_OK;
            const char* message = gzerror(gz, &errnum);
            if (errnum != Z_OK) {
                throw std::runtime_error("Error reading gzipped table: " + path + " (" +
                                         (message ? message : "unknown error") + ")");
            }
            if (line.empty()) return false;
        } else {
            if (!std::getline(file, line)) {
                if (file.bad()) throw std::runtime_error("Error reading table: " + path);
                return false;
            }
        }
        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
            line.pop_back();
        }
        return true;
    }
};

DelimitedTableReader::DelimitedTableReader(const std::string& path, char delim)
    : pimpl_(std::make_unique<Impl>()), path_(path) {

    pimpl_->delim = delim;
    pimpl_->path = path;

    if (ends_with_gz(path)) {
        pimpl_->gz = gzopen(path.c_str(), "rb");
        if (!pimpl_->gz) {
            throw std::runtime_error("Cannot open gzipped table: " + path);
        }
    } else {
        pimpl_->file.open(path);
        if (!pimpl_->file.is_open()) {
            throw std::runtime_error("Cannot open table: " + path);
        }
    }

    // Header is the first line that is not a '##' comment
    std::string line;
    bool has_header = false;
    while (pimpl_->read_line(line)) {
        if (line.empty()) continue;
        if (line.compare(0, 2, "##") == 0) continue;
        if (line[0] == '#') line = line.substr(1);

        pimpl_->columns = split_line(line, delim);
        for (size_t i = 0; i < pimpl_->columns.size(); ++i) {
            pimpl_->columns[i] = trim(pimpl_->columns[i]);
            pimpl_->column_index[pimpl_->columns[i]] = static_cast<int>(i);
        }
        has_header = true;
        break;
    }

    if (!has_header) {
        throw std::runtime_error("Table has no header row: " + path);
    }

    log(LogLevel::DEBUG, "Opened table: " + path + " (" +
        std::to_string(pimpl_->columns.size()) + " columns)");
}

DelimitedTableReader::~DelimitedTableReader() = default;

bool DelimitedTableReader::next(std::vector<std::string>& fields) {
    std::string line;
    while (pimpl_->read_line(line)) {
        if (line.empty() || line[0] == '#') continue;

        fields = split_line(line, pimpl_->delim);
        fields.resize(pimpl_->columns.size());
        pimpl_->rows++;
        return true;
    }
    return false;
}

const std::vector<std::string>& DelimitedTableReader::get_columns() const {
    return pimpl_->columns;
}

int DelimitedTableReader::column_index(const std::string& column) const {
    auto it = pimpl_->column_index.find(column);
    if (it == pimpl_->column_index.end()) return -1;
    return it->second;
}

int DelimitedTableReader::require_column(const std::string& column) const {
    int idx = column_index(column);
    if (idx < 0) {
        throw std::runtime_error("Column '" + column + "' not found in " + path_);
    }
    return idx;
}

size_t DelimitedTableReader::rows_read() const {
    return pimpl_->rows;
}

} // namespace genescore
