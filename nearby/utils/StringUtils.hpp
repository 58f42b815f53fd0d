#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Nearby {

namespace StringUtils {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";

/**
 * @brief Split a string by delimiter
 * @return Vector of string parts (empty parts are kept)
 */
[[nodiscard]] std::vector<std::string> Split(std::string_view str, char delimiter);

[[nodiscard]] std::string Trim(std::string_view str);

/**
 * @brief Parse a whole string as a finite double
 *
 * Surrounding whitespace is ignored. Always uses '.' as the decimal point,
 * whatever the global locale.
 */
[[nodiscard]] std::optional<double> ParseDouble(std::string_view str) noexcept;

/**
 * @brief Count digits after the decimal point of a decimal literal
 *
 * "51.5074" -> 4, "12" -> 0, "-0.10" -> 2. Exponent notation is not
 * a decimal literal and yields nullopt.
 */
[[nodiscard]] std::optional<size_t> CountDecimalDigits(std::string_view str) noexcept;

} // namespace StringUtils

} // namespace Nearby
