/**
 * @file tsv_reader.hpp
 * @brief Streaming reader for the tab-separated dataset dumps
 *
 * First line is the header. Every following non-empty line must carry exactly
 * as many fields as the header; fields are split on '\t' only (the dumps do
 * not quote).
 */

#pragma once

#include <export.hpp>
#include <fstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace SixDegrees {

class SIXDEGREES_API TsvRow {
public:
    std::string_view at(size_t column) const;
    size_t size() const { return spans_.size(); }
    size_t line() const { return line_; }

private:
    friend class TsvReader;

    std::string text_;
    std::vector<std::pair<size_t, size_t>> spans_;  // offset, length into text_
    size_t line_ = 0;
};

class SIXDEGREES_API TsvReader {
public:
    /**
     * @brief Open the file and consume the header line.
     *
     * Throws SchemaError if the file cannot be opened, ParseError if it has
     * no header.
     */
    explicit TsvReader(const std::string& path);

    /**
     * @brief Index of a header column; ParseError if the header lacks it.
     */
    size_t column(const std::string& name) const;

    bool has_column(const std::string& name) const;

    /**
     * @brief Read the next record into row. Returns false at end of file.
     */
    bool next(TsvRow& row);

    const std::vector<std::string>& header() const { return header_; }
    const std::string& path() const { return path_; }
    size_t line_number() const { return line_number_; }

private:
    static void split(TsvRow& row);

    std::string path_;
    std::ifstream file_;
    std::vector<std::string> header_;
    std::unordered_map<std::string, size_t> index_;
    size_t line_number_ = 0;
};

} // namespace SixDegrees
