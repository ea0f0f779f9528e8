/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "timebox/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace timebox {
namespace utils {

// ============================================================================
// GENERAL HELPERS
// ============================================================================

namespace {

constexpr const char* kWhitespace = " \t\n\r\f\v";

} // anonymous namespace

std::string StringUtils::Trim(const std::string& str) {
    auto first = str.find_first_not_of(kWhitespace);
    if (first == std::string::npos) {
        return std::string();
    }
    auto last = str.find_last_not_of(kWhitespace);
    return str.substr(first, last - first + 1);
}

std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    std::string joined;
    for (const auto& part : strings) {
        if (&part != &strings.front()) {
            joined += delimiter;
        }
        joined += part;
    }
    return joined;
}

std::string StringUtils::ReplaceAll(const std::string& str,
                                    const std::string& from,
                                    const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result = str;
    std::size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.length(), to);
        pos += to.length();
    }
    return result;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

// ============================================================================
// ENVIRONMENT HELPERS
// ============================================================================

std::optional<std::pair<std::string, std::string>>
StringUtils::ParseKeyValue(const std::string& assignment) {
    auto pos = assignment.find('=');
    if (pos == std::string::npos || pos == 0) {
        return std::nullopt;
    }
    return std::make_pair(assignment.substr(0, pos), assignment.substr(pos + 1));
}

bool StringUtils::IsValidEnvName(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!(std::isalpha(first) || first == '_')) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

std::string StringUtils::Truncate(const std::string& str,
                                  std::size_t max_length,
                                  const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= suffix.length()) {
        return str.substr(0, max_length);
    }
    return str.substr(0, max_length - suffix.length()) + suffix;
}

} // namespace utils
} // namespace timebox
