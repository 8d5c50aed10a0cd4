#pragma once

#include <cinegraph/core/result.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace cinegraph {

// ---------------------------------------------------------------------------
// MovieTitle - identity of a Movie node.
//
// Rules:
//   - Leading/trailing whitespace is stripped
//   - Non-empty after stripping, max 512 characters
//   - No control characters
// ---------------------------------------------------------------------------
class MovieTitle {
public:
    static Result<MovieTitle, std::string> Create(std::string_view title);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const MovieTitle& other) const { return value_ == other.value_; }
    bool operator!=(const MovieTitle& other) const { return value_ != other.value_; }
    bool operator<(const MovieTitle& other) const { return value_ < other.value_; }

private:
    explicit MovieTitle(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// PersonName - identity of a Person node. Same rules as MovieTitle.
// ---------------------------------------------------------------------------
class PersonName {
public:
    static Result<PersonName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const PersonName& other) const { return value_ == other.value_; }
    bool operator!=(const PersonName& other) const { return value_ != other.value_; }

private:
    explicit PersonName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// DatabaseName - Neo4j database name.
// 3..63 characters, starts with an ASCII letter, then lowercase letters,
// digits, '.' or '-'. Input is lowercased first (Neo4j names are
// case-insensitive).
// ---------------------------------------------------------------------------
class DatabaseName {
public:
    static Result<DatabaseName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const DatabaseName& other) const { return value_ == other.value_; }
    bool operator!=(const DatabaseName& other) const { return value_ != other.value_; }

private:
    explicit DatabaseName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

} // namespace cinegraph

// ---------------------------------------------------------------------------
// std::hash specializations
// ---------------------------------------------------------------------------
namespace std {

template <>
struct hash<cinegraph::MovieTitle> {
    size_t operator()(const cinegraph::MovieTitle& t) const noexcept {
        return hash<string>{}(t.Value());
    }
};

} // namespace std
