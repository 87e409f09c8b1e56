/**
 * @file string_utils.hpp
 * @brief String manipulation and parsing helpers
 *
 * Small toolbox used by the configuration loader, the container runtime
 * wrapper (parsing `docker stats` output) and the procfs collectors.
 * All methods are static - no instantiation required.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace saferun {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string helpers
 *
 * **Usage Example**:
 * @code
 * StringUtils::WildcardMatch("*.malware.com", "cdn.malware.com");   // true
 * StringUtils::ParseSizeBytes("12.5MiB");                           // 13107200
 * StringUtils::Split("a,b,,c", ',');                                // {"a","b","c"}
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Manipulation
     ***************************************************************************/

    /// Strip leading and trailing whitespace
    static std::string Trim(const std::string& str);

    /// ASCII lowercase copy
    static std::string ToLower(const std::string& str);

    /// Split on a delimiter, skipping empty tokens
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /// Split on runs of whitespace
    static std::vector<std::string> SplitWhitespace(const std::string& str);

    /// Join with a delimiter
    static std::string Join(const std::vector<std::string>& strings,
                            const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Case-insensitive glob match supporting `*` and `?`
     *
     * Used for blacklisted application names and restricted domains.
     * `*.example.com` matches `a.example.com` but not `example.com`.
     */
    static bool WildcardMatch(const std::string& pattern, const std::string& text);

    /// Shorten to max_length, appending suffix when cut
    static std::string Truncate(const std::string& str,
                                std::size_t max_length,
                                const std::string& suffix = "...");

    /***************************************************************************
     * Parsing
     ***************************************************************************/

    /**
     * @brief Parse a human-readable size ("512MiB", "1.5GB", "900kB", "12B")
     *
     * Binary (KiB/MiB/GiB) and decimal (kB/MB/GB) units are accepted.
     *
     * @return Byte count, or std::nullopt if the string is not a size
     */
    static std::optional<std::uint64_t> ParseSizeBytes(const std::string& str);

    /// Parse a floating point number, ignoring a trailing '%'
    static std::optional<double> ParseDouble(const std::string& str);

    /// Parse a signed integer
    static std::optional<long long> ParseInt(const std::string& str);
};

} // namespace utils
} // namespace saferun
