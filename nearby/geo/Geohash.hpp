/**
 * @file Geohash.hpp
 * @brief Base-32 geohash codec
 *
 * A geohash interleaves binary bisections of longitude [-180, 180] and
 * latitude [-90, 90], longitude first, five bits per character. The axis
 * parity runs across character boundaries, so any hash with a given prefix
 * denotes a sub-cell of the prefix cell and the string range
 * [prefix, prefix + "~"] selects exactly that cell.
 */

#pragma once

#include "core/GeoError.hpp"
#include "geo/GeoPoint.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <variant>

namespace Nearby {
namespace Geo {

constexpr std::string_view kBase32Alphabet = "0123456789bcdefghjkmnpqrstuvwxyz";

/// Sorts after every alphabet symbol; closes a prefix range
constexpr char kRangeTerminator = '~';

constexpr int kDefaultHashLength = 9;
constexpr int kMaxHashLength = 18;
constexpr int kBitsPerChar = 5;

/**
 * @brief Decoded cell center with its positional uncertainty
 */
struct DecodedHash {
    GeoPoint point;
    double latitudeError = 0.0;     ///< Half of the cell height in degrees
    double longitudeError = 0.0;    ///< Half of the cell width in degrees
};

/**
 * @brief How the hash length is chosen when encoding
 */
class HashPrecision {
public:
    enum class Mode {
        Fixed,                  ///< Explicit character count
        AutoFromDecimalDigits   ///< Derived from decimal digits of textual coordinates
    };

    [[nodiscard]] static constexpr HashPrecision Fixed(int length) noexcept {
        return HashPrecision(Mode::Fixed, length);
    }

    [[nodiscard]] static constexpr HashPrecision AutoFromDecimalDigits() noexcept {
        return HashPrecision(Mode::AutoFromDecimalDigits, 0);
    }

    [[nodiscard]] constexpr Mode GetMode() const noexcept { return m_mode; }
    [[nodiscard]] constexpr int GetLength() const noexcept { return m_length; }

private:
    constexpr HashPrecision(Mode mode, int length) noexcept
        : m_mode(mode), m_length(length) {}

    Mode m_mode;
    int m_length;
};

/**
 * @brief Coordinate given either as a number or as decimal text
 */
using CoordinateInput = std::variant<double, std::string>;

namespace Geohash {

/**
 * @brief Encode a coordinate pair into a geohash of `length` characters
 * @return InvalidInput if the coordinates are out of range or length is not in [1, 18]
 */
[[nodiscard]] std::expected<std::string, GeoError> Encode(double latitude, double longitude,
                                                          int length = kDefaultHashLength);

[[nodiscard]] std::expected<std::string, GeoError> Encode(const GeoPoint& point,
                                                          int length = kDefaultHashLength);

/**
 * @brief Encode with an explicit precision strategy
 *
 * AutoFromDecimalDigits requires both coordinates as text and derives the
 * length from the larger count of digits after the decimal point.
 */
[[nodiscard]] std::expected<std::string, GeoError> Encode(const CoordinateInput& latitude,
                                                          const CoordinateInput& longitude,
                                                          HashPrecision precision);

/**
 * @brief Decode a hash into its cell center and error bounds
 *
 * The empty hash decodes to (0, 0) with errors of 90 and 180 degrees.
 */
[[nodiscard]] std::expected<DecodedHash, GeoError> Decode(std::string_view hash);

/**
 * @brief Decode a hash into the bounds of its cell
 */
[[nodiscard]] std::expected<BoundingBox, GeoError> DecodeBoundingBox(std::string_view hash);

/**
 * @brief Hash length that preserves `digits` decimal digits of a coordinate
 *
 * Counts above 10 use the 10-digit length.
 */
[[nodiscard]] int LengthForDecimalDigits(size_t digits) noexcept;

/**
 * @brief True if every character is in the base-32 alphabet (either case)
 */
[[nodiscard]] bool IsValid(std::string_view hash) noexcept;

/**
 * @brief Bisection encode without input validation
 *
 * Values outside the globe saturate to the edge cells. Callers must pass a
 * length in [0, 18].
 */
[[nodiscard]] std::string EncodeUnchecked(double latitude, double longitude, int length);

} // namespace Geohash

} // namespace Geo
} // namespace Nearby
