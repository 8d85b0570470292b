#include <ingestion/tsv_reader.hpp>
#include <utils/errors.hpp>
#include <stdexcept>

namespace SixDegrees {

std::string_view TsvRow::at(size_t column) const {
    if (column >= spans_.size()) {
        throw std::out_of_range("TsvRow: column " + std::to_string(column) + " out of range");
    }
    const auto& [offset, length] = spans_[column];
    return std::string_view(text_).substr(offset, length);
}

TsvReader::TsvReader(const std::string& path) : path_(path), file_(path) {
    if (!file_.is_open()) {
        throw SchemaError("could not open dump file: " + path);
    }

    TsvRow header_row;
    if (!next(header_row)) {
        throw ParseError(path + ": missing header line");
    }
    for (size_t i = 0; i < header_row.size(); ++i) {
        header_.emplace_back(header_row.at(i));
        index_.emplace(header_.back(), i);
    }
}

size_t TsvReader::column(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        throw ParseError(path_ + ": header has no column '" + name + "'");
    }
    return it->second;
}

bool TsvReader::has_column(const std::string& name) const {
    return index_.count(name) > 0;
}

void TsvReader::split(TsvRow& row) {
    row.spans_.clear();
    size_t start = 0;
    const std::string& text = row.text_;
    while (true) {
        size_t tab = text.find('\t', start);
        if (tab == std::string::npos) {
            row.spans_.emplace_back(start, text.size() - start);
            break;
        }
        row.spans_.emplace_back(start, tab - start);
        start = tab + 1;
    }
}

bool TsvReader::next(TsvRow& row) {
    while (std::getline(file_, row.text_)) {
        ++line_number_;
        if (!row.text_.empty() && row.text_.back() == '\r') row.text_.pop_back();
        if (row.text_.empty()) continue;

        row.line_ = line_number_;
        split(row);

        if (!header_.empty() && row.spans_.size() != header_.size()) {
            throw ParseError(path_ + ":" + std::to_string(line_number_) + ": expected " +
                             std::to_string(header_.size()) + " fields, found " +
                             std::to_string(row.spans_.size()));
        }
        return true;
    }

    if (file_.bad()) {
        throw std::runtime_error("read error on " + path_);
    }
    return false;
}

} // namespace SixDegrees
