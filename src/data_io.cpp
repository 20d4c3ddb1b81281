#include "data_io.h"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

fs::path get_data_path() {
    // First try path relative to the working directory
    fs::path data_path = fs::current_path() / "data";

    // If not found, try one level up (running from a build directory)
    if (!fs::exists(data_path)) {
        data_path = fs::current_path().parent_path() / "data";
    }

    if (!fs::exists(data_path)) {
        throw std::runtime_error("Cannot find data directory");
    }

    return data_path;
}

/** Use the header line of a csv file to determine its columns.
 * remove_if shifts all whitespace characters to the end of the string, erase then removes them
 *
 * @param header_line - the first line of the CSV file
 * @return the detected schema
 */
FileSchema detect_schema(const std::string &header_line) {
    FileSchema schema;
    std::istringstream ss(header_line);
    std::string column;

    while (std::getline(ss, column, ',')) {
        column.erase(std::remove_if(column.begin(), column.end(),
                                    [](unsigned char c) { return std::isspace(c); }),
                     column.end());
        schema.columns.push_back(column);
    }

    schema.build_index();
    return schema;
}

Cell parse_cell(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);

    const char *first = text.data();
    const char *last = text.data() + text.size();

    if (!text.empty()) {
        int64_t as_int = 0;
        auto [ptr, ec] = std::from_chars(first, last, as_int);
        if (ec == std::errc() && ptr == last) {
            return as_int;
        }

        double as_double = 0.0;
        auto [dptr, dec] = std::from_chars(first, last, as_double);
        if (dec == std::errc() && dptr == last) {
            return as_double;
        }
    }

    return std::string(text);
}

std::vector<Cell> read_column_csv(const fs::path &filepath, const std::string &column) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Cannot open CSV file: " + filepath.string());
    }

    std::string line;
    if (!std::getline(file, line)) {
        throw std::runtime_error("CSV file is empty: " + filepath.string());
    }

    FileSchema schema = detect_schema(line);
    const size_t col_idx = schema.index_of(column);

    std::vector<Cell> cells;
    std::string value;
    value.reserve(64);

    size_t line_no = 1;
    while (std::getline(file, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        std::istringstream ss(line);
        size_t count = 0;
        bool found = false;
        while (std::getline(ss, value, ',')) {
            if (count == col_idx) {
                cells.push_back(parse_cell(value));
                found = true;
                break;
            }
            count++;
        }

        // Missing trailing column is kept as an empty (non-numeric) cell
        if (!found) {
            std::cerr << "Warning: line " << line_no << " of " << filepath.filename().string()
                      << " has no '" << column << "' column\n";
            cells.emplace_back(std::string());
        }
    }

    return cells;
}

std::map<size_t, fs::path> list_datasets(const fs::path &dir) {
    if (!fs::is_directory(dir)) {
        throw std::runtime_error("Not a directory: " + dir.string());
    }

    std::map<size_t, fs::path> datasets;
    for (const auto &entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".csv") continue;

        std::string digits;
        for (char c : entry.path().stem().string()) {
            if (std::isdigit(static_cast<unsigned char>(c))) digits.push_back(c);
        }
        if (digits.empty()) {
            std::cerr << "Warning: skipping " << entry.path().filename().string() << ", no size in name\n";
            continue;
        }

        size_t size = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), size);
        if (ec != std::errc()) {
            std::cerr << "Warning: skipping " << entry.path().filename().string() << ", size out of range\n";
            continue;
        }
        datasets[size] = entry.path();
    }
    return datasets;
}
