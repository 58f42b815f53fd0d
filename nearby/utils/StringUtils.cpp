#include "utils/StringUtils.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <system_error>

namespace Nearby {

namespace StringUtils {

namespace {

std::string_view TrimView(std::string_view str) noexcept {
    const auto start = str.find_first_not_of(kWhitespace);
    if (start == std::string_view::npos) {
        return {};
    }
    const auto end = str.find_last_not_of(kWhitespace);
    return str.substr(start, end - start + 1);
}

} // namespace

std::vector<std::string> Split(std::string_view str, char delimiter) {
    std::vector<std::string> tokens;
    size_t start = 0;
    size_t end = 0;

    while ((end = str.find(delimiter, start)) != std::string_view::npos) {
        tokens.emplace_back(str.substr(start, end - start));
        start = end + 1;
    }
    tokens.emplace_back(str.substr(start));

    return tokens;
}

std::string Trim(std::string_view str) {
    return std::string(TrimView(str));
}

std::optional<double> ParseDouble(std::string_view str) noexcept {
    std::string_view s = TrimView(str);
    // from_chars takes no leading '+'
    if (s.size() > 1 && s.front() == '+' && s[1] != '-' && s[1] != '+') {
        s.remove_prefix(1);
    }
    if (s.empty()) {
        return std::nullopt;
    }

    double value = 0.0;
    const char* last = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(s.data(), last, value);
    if (ec != std::errc{} || ptr != last || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<size_t> CountDecimalDigits(std::string_view str) noexcept {
    const std::string_view s = TrimView(str);
    if (s.empty()) {
        return std::nullopt;
    }

    size_t pos = 0;
    if (s[pos] == '+' || s[pos] == '-') {
        ++pos;
    }

    size_t integerDigits = 0;
    while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
        ++integerDigits;
        ++pos;
    }

    size_t fractionDigits = 0;
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            ++fractionDigits;
            ++pos;
        }
    }

    if (pos != s.size() || integerDigits + fractionDigits == 0) {
        return std::nullopt;
    }
    return fractionDigits;
}

} // namespace StringUtils

} // namespace Nearby
