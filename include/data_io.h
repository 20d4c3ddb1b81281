#pragma once

#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "structures/rmq_structure.h"

struct FileSchema {
    std::vector<std::string> columns;
    std::unordered_map<std::string, size_t> column_index;

    void build_index() {
        column_index.clear();
        for (size_t i = 0; i < columns.size(); i++) {
            column_index[columns[i]] = i;
        }
    }

    size_t index_of(const std::string &col) const {
        auto it = column_index.find(col);
        if (it == column_index.end()) {
            throw std::runtime_error("Column not found: " + col);
        }
        return it->second;
    }
};

// Directory holding the dataset files: ./data, falling back to ../data
std::filesystem::path get_data_path();

FileSchema detect_schema(const std::string &header_line);

// Integer if the whole (trimmed) text is an integer, double if it is a
// floating point number, otherwise the text itself.
Cell parse_cell(std::string_view text);

// Reads one column of a CSV file with a header row
std::vector<Cell> read_column_csv(const std::filesystem::path &filepath, const std::string &column = "value");

// Every .csv file in dir, keyed by the number formed by the digits of its name
std::map<size_t, std::filesystem::path> list_datasets(const std::filesystem::path &dir);
