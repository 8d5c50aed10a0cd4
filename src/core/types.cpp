#include <cinegraph/core/types.hpp>

#include <algorithm>
#include <cctype>

namespace cinegraph {

namespace {

constexpr size_t kMaxIdentityLength = 512;

std::string_view Strip(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

bool HasControlChar(std::string_view s) {
    return std::any_of(s.begin(), s.end(), [](char c) {
        return static_cast<unsigned char>(c) < 0x20 || c == 0x7F;
    });
}

// Shared rules for node identities (titles, names).
Result<std::string, std::string> ValidateIdentity(std::string_view raw,
                                                  const char* what) {
    auto value = Strip(raw);
    if (value.empty()) {
        return Result<std::string, std::string>::Err(
            std::string(what) + " must not be empty");
    }
    if (value.size() > kMaxIdentityLength) {
        return Result<std::string, std::string>::Err(
            std::string(what) + " must be at most " +
            std::to_string(kMaxIdentityLength) + " characters, got " +
            std::to_string(value.size()));
    }
    if (HasControlChar(value)) {
        return Result<std::string, std::string>::Err(
            std::string(what) + " must not contain control characters");
    }
    return Result<std::string, std::string>::Ok(std::string(value));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// MovieTitle
// ---------------------------------------------------------------------------
Result<MovieTitle, std::string> MovieTitle::Create(std::string_view title) {
    auto checked = ValidateIdentity(title, "Movie title");
    if (checked.IsErr()) {
        return Result<MovieTitle, std::string>::Err(std::move(checked).Error());
    }
    return Result<MovieTitle, std::string>::Ok(MovieTitle(std::move(checked).Value()));
}

// ---------------------------------------------------------------------------
// PersonName
// ---------------------------------------------------------------------------
Result<PersonName, std::string> PersonName::Create(std::string_view name) {
    auto checked = ValidateIdentity(name, "Person name");
    if (checked.IsErr()) {
        return Result<PersonName, std::string>::Err(std::move(checked).Error());
    }
    return Result<PersonName, std::string>::Ok(PersonName(std::move(checked).Value()));
}

// ---------------------------------------------------------------------------
// DatabaseName
// ---------------------------------------------------------------------------
Result<DatabaseName, std::string> DatabaseName::Create(std::string_view name) {
    if (name.size() < 3 || name.size() > 63) {
        return Result<DatabaseName, std::string>::Err(
            "Database name must be 3 to 63 characters, got " +
            std::to_string(name.size()));
    }

    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower[0] < 'a' || lower[0] > 'z') {
        return Result<DatabaseName, std::string>::Err(
            "Database name must start with a letter");
    }
    const bool valid = std::all_of(lower.begin(), lower.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
               c == '.' || c == '-';
    });
    if (!valid) {
        return Result<DatabaseName, std::string>::Err(
            "Database name must contain only letters, digits, '.' and '-'");
    }
    return Result<DatabaseName, std::string>::Ok(DatabaseName(std::move(lower)));
}

} // namespace cinegraph
