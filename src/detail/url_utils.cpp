#include "rangefetch/detail/url_utils.hpp"
#include "rangefetch/download_target.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace rangefetch::detail {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

// Strips scheme and authority; what remains is path[?query][#fragment].
std::string pathAndQuery(const std::string& url) {
    std::size_t pos = 0;
    const auto scheme = url.find("://");
    if (scheme != std::string::npos) {
        pos = url.find('/', scheme + 3);
        if (pos == std::string::npos) {
            const auto query = url.find('?', scheme + 3);
            return query == std::string::npos ? std::string{} : url.substr(query);
        }
    }
    return url.substr(pos);
}

} // namespace

std::string percentDecode(const std::string& value, bool plus_as_space) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        const char c = value[i];
        if (c == '+' && plus_as_space) {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < value.size()) {
            const int hi = hexValue(value[i + 1]);
            const int lo = hexValue(value[i + 2]);
            if (hi < 0 || lo < 0) {
                out.push_back(c);
                continue;
            }
            out.push_back(static_cast<char>(hi * 16 + lo));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::optional<std::string> queryParameter(const std::string& url, const std::string& key) {
    const std::string rest = pathAndQuery(url);
    auto begin = rest.find('?');
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    const auto fragment = rest.find('#', begin);
    const std::string query =
        rest.substr(begin + 1, fragment == std::string::npos ? std::string::npos
                                                             : fragment - begin - 1);

    std::size_t pos = 0;
    while (pos <= query.size()) {
        auto amp = query.find('&', pos);
        if (amp == std::string::npos) {
            amp = query.size();
        }
        const std::string pair = query.substr(pos, amp - pos);
        const auto eq = pair.find('=');
        const std::string name = percentDecode(pair.substr(0, eq));
        if (name == key) {
            return eq == std::string::npos ? std::string{} : percentDecode(pair.substr(eq + 1));
        }
        pos = amp + 1;
    }
    return std::nullopt;
}

std::optional<std::string> lastPathSegment(const std::string& url) {
    std::string path = pathAndQuery(url);
    const auto cut = path.find_first_of("?#");
    if (cut != std::string::npos) {
        path.resize(cut);
    }
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }
    const auto slash = path.rfind('/');
    std::string segment = slash == std::string::npos ? path : path.substr(slash + 1);
    if (segment.empty()) {
        return std::nullopt;
    }
    return percentDecode(segment, false);
}

std::string sanitizeFileName(const std::string& name) {
    std::string normalized = name;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    const std::string bare = std::filesystem::path{normalized}.filename().string();
    if (bare.empty() || bare == "." || bare == "..") {
        return kPlaceholderFileName;
    }
    return bare;
}

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

} // namespace rangefetch::detail
