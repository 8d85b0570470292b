#pragma once

#include <export.hpp>
#include <stdexcept>
#include <string>

namespace SixDegrees {

// Dataset corruption: bad identifier, non-numeric number, ragged row.
class SIXDEGREES_API ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& msg)
        : std::runtime_error("Parse error: " + msg), detail_(msg) {}

    // Message without the "Parse error: " prefix, for re-wrapping with context
    const std::string& detail() const noexcept { return detail_; }

private:
    std::string detail_;
};

// Required tables or dump files are missing.
class SIXDEGREES_API SchemaError : public std::runtime_error {
public:
    explicit SchemaError(const std::string& msg) : std::runtime_error("Schema error: " + msg) {}
};

// A loader skipped more rows than the configured ratio allows.
class SIXDEGREES_API LoadError : public std::runtime_error {
public:
    explicit LoadError(const std::string& msg) : std::runtime_error("Load error: " + msg) {}
};

class SIXDEGREES_API ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error("Config error: " + msg) {}
};

/**
 * @brief The path search dequeued more nodes than its ceiling allows.
 *
 * This is an inconclusive search, not a proof that no path exists.
 */
class SIXDEGREES_API SearchAborted : public std::runtime_error {
public:
    SearchAborted(size_t nodes_dequeued, size_t ceiling)
        : std::runtime_error("Search aborted after " + std::to_string(nodes_dequeued) +
                             " nodes (ceiling " + std::to_string(ceiling) + ")"),
          nodes_dequeued_(nodes_dequeued), ceiling_(ceiling) {}

    size_t nodes_dequeued() const noexcept { return nodes_dequeued_; }
    size_t ceiling() const noexcept { return ceiling_; }

private:
    size_t nodes_dequeued_;
    size_t ceiling_;
};

} // namespace SixDegrees
