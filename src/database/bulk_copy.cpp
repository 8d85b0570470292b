#include <database/bulk_copy.hpp>
#include <stdexcept>

namespace SixDegrees {

std::atomic<uint64_t> BulkCopy::s_counter_{0};

BulkCopy::BulkCopy(PostgresConnection& db, bool use_temp_table) noexcept
    : db_(db), use_temp_table_(use_temp_table) {}

BulkCopy::~BulkCopy() {
    if (!in_copy_) return;
    // Reaching here means the caller is unwinding; abort the COPY so the
    // connection leaves COPY_IN state and the enclosing transaction can roll back.
    try {
        db_.copy_end("BulkCopy abandoned");
    } catch (const std::exception&) {
        // The server always reports an aborted COPY as an error.
    }
}

void BulkCopy::begin_table(const std::string& table_name, const std::vector<std::string>& columns) {
    if (in_copy_) throw std::runtime_error("BulkCopy: begin_table called during an active COPY");

    // Parse optional schema.table
    auto dot_pos = table_name.find('.');
    if (dot_pos != std::string::npos) {
        schema_ = table_name.substr(0, dot_pos);
        table_name_ = table_name.substr(dot_pos + 1);
    } else {
        schema_.clear();
        table_name_ = table_name;
    }

    columns_ = columns;
    buffered_rows_ = 0;
    buffer_.str("");
    buffer_.clear();

    if (use_temp_table_) {
        uint64_t id = ++s_counter_;
        temp_table_name_ = "tmp_" + table_name_ + "_" + std::to_string(id);
    } else {
        temp_table_name_.clear();
    }
}

std::string BulkCopy::quote_identifier(const std::string& id) {
    std::string out;
    out.reserve(id.size() + 2);
    out.push_back('"');
    for (char c : id) {
        if (c == '"') out.append("\"\"");
        else out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string BulkCopy::full_table_name() const {
    if (schema_.empty()) {
        return quote_identifier(table_name_);
    }
    return quote_identifier(schema_) + "." + quote_identifier(table_name_);
}

std::string BulkCopy::column_list() const {
    std::string cols;
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (i) cols += ", ";
        cols += quote_identifier(columns_[i]);
    }
    return cols;
}

void BulkCopy::escape_value_into_buffer(const std::string& value) {
    for (char c : value) {
        if (c == '\0') continue;
        switch (c) {
            case '\\': buffer_ << "\\\\"; break;
            case '\t': buffer_ << "\\t";  break;
            case '\n': buffer_ << "\\n";  break;
            case '\r': buffer_ << "\\r";  break;
            default:   buffer_ << c;      break;
        }
    }
}

void BulkCopy::start_copy_if_needed() {
    if (in_copy_) return;

    if (columns_.empty()) {
        throw std::runtime_error("BulkCopy: columns not set. Call begin_table() first.");
    }

    std::string target_table = use_temp_table_ ? quote_identifier(temp_table_name_) : full_table_name();

    if (use_temp_table_) {
        // Staging table mirrors the target's columns but none of its constraints
        db_.execute("CREATE TEMP TABLE IF NOT EXISTS " + target_table +
                    " (LIKE " + full_table_name() + " INCLUDING DEFAULTS) ON COMMIT PRESERVE ROWS");
        db_.execute("TRUNCATE " + target_table);
    }

    db_.execute("COPY " + target_table + " (" + column_list() + ") FROM STDIN");
    in_copy_ = true;
}

void BulkCopy::send_buffer() {
    std::string data = buffer_.str();
    if (!data.empty()) {
        db_.copy_data(data.c_str(), static_cast<int>(data.size()));
    }
    buffer_.str("");
    buffer_.clear();
    buffered_rows_ = 0;
}

void BulkCopy::add_row(const std::vector<Value>& values) {
    start_copy_if_needed();

    const size_t ncols = columns_.size();
    for (size_t i = 0; i < ncols; ++i) {
        if (i) buffer_ << '\t';
        if (i < values.size() && values[i]) {
            escape_value_into_buffer(*values[i]);
        } else {
            buffer_ << "\\N";
        }
    }
    buffer_ << '\n';

    if (++buffered_rows_ >= SEND_EVERY_ROWS) {
        send_buffer();
    }
}

size_t BulkCopy::flush() {
    if (!in_copy_) return 0;

    send_buffer();
    in_copy_ = false;
    long long copied = db_.copy_end(nullptr);

    long long landed = copied;
    if (use_temp_table_) {
        std::string cols = column_list();
        std::string sql = "INSERT INTO " + full_table_name() + " (" + cols + ") SELECT " + cols +
                          " FROM " + quote_identifier(temp_table_name_);
        if (!conflict_clause_.empty()) {
            sql += " " + conflict_clause_;
        }
        landed = db_.execute_affected(sql);
    }

    return static_cast<size_t>(landed);
}

void BulkCopy::set_conflict_clause(const std::string& clause) {
    conflict_clause_ = clause;
}

} // namespace SixDegrees
