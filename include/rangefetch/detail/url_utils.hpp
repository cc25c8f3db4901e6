#pragma once

#include <optional>
#include <string>

namespace rangefetch::detail {

// Decodes %XX escapes; '+' becomes a space as in form-encoded query strings.
[[nodiscard]] std::string percentDecode(const std::string& value, bool plus_as_space = true);

// Value of the first `key` parameter in the query string of `url`, decoded.
[[nodiscard]] std::optional<std::string> queryParameter(const std::string& url,
                                                        const std::string& key);

// Last non-empty path segment of `url`, decoded; nullopt when the path is empty.
[[nodiscard]] std::optional<std::string> lastPathSegment(const std::string& url);

// Reduces a name to a bare file name; empty, "." and ".." become the placeholder.
[[nodiscard]] std::string sanitizeFileName(const std::string& name);

[[nodiscard]] std::string toLower(std::string value);
[[nodiscard]] std::string trim(const std::string& value);

} // namespace rangefetch::detail
