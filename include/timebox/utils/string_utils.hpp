/**
 * @file string_utils.hpp
 * @brief Small string helpers shared across the runner
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace timebox {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string manipulation helpers
 *
 * All methods are static - no instantiation required.
 */
class StringUtils {
public:
    /// Strip leading and trailing whitespace
    static std::string Trim(const std::string& str);

    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    static std::string ReplaceAll(const std::string& str,
                                  const std::string& from,
                                  const std::string& to);

    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Split `KEY=VALUE` at the first '='
     * @return nullopt when there is no '=' or the key is empty
     */
    static std::optional<std::pair<std::string, std::string>>
    ParseKeyValue(const std::string& assignment);

    /// Valid POSIX environment variable name ([A-Za-z_][A-Za-z0-9_]*)
    static bool IsValidEnvName(const std::string& name);

    /**
     * @brief Limit a string to @p max_length characters
     *
     * The result ends with @p suffix when anything was cut.
     */
    static std::string Truncate(const std::string& str,
                                std::size_t max_length,
                                const std::string& suffix = "...");
};

} // namespace utils
} // namespace timebox
