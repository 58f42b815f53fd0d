/**
 * @file Geohash.cpp
 * @brief Base-32 geohash codec implementation
 */

#include "geo/Geohash.hpp"
#include "utils/StringUtils.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>

namespace Nearby {
namespace Geo {

namespace {

constexpr std::array<int8_t, 128> MakeDecodeTable() {
    std::array<int8_t, 128> table{};
    table.fill(-1);
    for (size_t i = 0; i < kBase32Alphabet.size(); ++i) {
        const char c = kBase32Alphabet[i];
        table[static_cast<size_t>(c)] = static_cast<int8_t>(i);
        if (c >= 'a' && c <= 'z') {
            table[static_cast<size_t>(c - 'a' + 'A')] = static_cast<int8_t>(i);
        }
    }
    return table;
}

constexpr std::array<int8_t, 128> kDecodeTable = MakeDecodeTable();

//     Decimal digits:                 0  1  2  3  4   5   6   7   8   9  10
constexpr std::array<int, 11> kDigitsToLength = {0, 5, 7, 8, 11, 12, 13, 15, 16, 17, 18};

int DecodeChar(char c) noexcept {
    const auto index = static_cast<unsigned char>(c);
    if (index >= kDecodeTable.size()) {
        return -1;
    }
    return kDecodeTable[index];
}

std::expected<double, GeoError> ToDegrees(const CoordinateInput& input, const char* axis) {
    if (const auto* value = std::get_if<double>(&input)) {
        return *value;
    }
    const auto& text = std::get<std::string>(input);
    auto parsed = StringUtils::ParseDouble(text);
    if (!parsed) {
        return std::unexpected(GeoError::InvalidInput(
            std::string("unparseable ") + axis + ": '" + text + "'"));
    }
    return *parsed;
}

} // namespace

namespace Geohash {

std::string EncodeUnchecked(double latitude, double longitude, int length) {
    std::string hash;
    hash.reserve(static_cast<size_t>(std::max(length, 0)));

    int bits = 0;
    int bitsTotal = 0;
    int hashValue = 0;
    double minLat = kMinLatitude, maxLat = kMaxLatitude;
    double minLon = kMinLongitude, maxLon = kMaxLongitude;

    while (static_cast<int>(hash.size()) < length) {
        if (bitsTotal % 2 == 0) {
            const double mid = (maxLon + minLon) / 2.0;
            if (longitude > mid) {
                hashValue = (hashValue << 1) + 1;
                minLon = mid;
            } else {
                hashValue = hashValue << 1;
                maxLon = mid;
            }
        } else {
            const double mid = (maxLat + minLat) / 2.0;
            if (latitude > mid) {
                hashValue = (hashValue << 1) + 1;
                minLat = mid;
            } else {
                hashValue = hashValue << 1;
                maxLat = mid;
            }
        }

        ++bits;
        ++bitsTotal;
        if (bits == kBitsPerChar) {
            hash.push_back(kBase32Alphabet[static_cast<size_t>(hashValue)]);
            bits = 0;
            hashValue = 0;
        }
    }
    return hash;
}

std::expected<std::string, GeoError> Encode(double latitude, double longitude, int length) {
    if (length < 1 || length > kMaxHashLength) {
        return std::unexpected(GeoError::InvalidInput(
            "geohash length must be in [1, " + std::to_string(kMaxHashLength) +
            "], got " + std::to_string(length)));
    }
    auto point = GeoPoint::Create(latitude, longitude);
    if (!point) {
        return std::unexpected(point.error());
    }
    return EncodeUnchecked(latitude, longitude, length);
}

std::expected<std::string, GeoError> Encode(const GeoPoint& point, int length) {
    return Encode(point.Latitude(), point.Longitude(), length);
}

std::expected<std::string, GeoError> Encode(const CoordinateInput& latitude,
                                            const CoordinateInput& longitude,
                                            HashPrecision precision) {
    int length = precision.GetLength();

    if (precision.GetMode() == HashPrecision::Mode::AutoFromDecimalDigits) {
        const auto* latText = std::get_if<std::string>(&latitude);
        const auto* lonText = std::get_if<std::string>(&longitude);
        if (!latText || !lonText) {
            return std::unexpected(GeoError::InvalidInput(
                "string notation required for auto precision"));
        }

        auto latDigits = StringUtils::CountDecimalDigits(*latText);
        auto lonDigits = StringUtils::CountDecimalDigits(*lonText);
        if (!latDigits || !lonDigits) {
            return std::unexpected(GeoError::InvalidInput(
                "auto precision requires decimal notation, got '" + *latText + "', '" +
                *lonText + "'"));
        }
        length = LengthForDecimalDigits(std::max(*latDigits, *lonDigits));
    }

    auto lat = ToDegrees(latitude, "latitude");
    if (!lat) {
        return std::unexpected(lat.error());
    }
    auto lon = ToDegrees(longitude, "longitude");
    if (!lon) {
        return std::unexpected(lon.error());
    }

    // Zero significant digits maps to an empty hash
    if (length == 0 && precision.GetMode() == HashPrecision::Mode::AutoFromDecimalDigits) {
        auto point = GeoPoint::Create(*lat, *lon);
        if (!point) {
            return std::unexpected(point.error());
        }
        return std::string();
    }

    return Encode(*lat, *lon, length);
}

std::expected<BoundingBox, GeoError> DecodeBoundingBox(std::string_view hash) {
    BoundingBox box;
    bool isLon = true;

    for (size_t i = 0; i < hash.size(); ++i) {
        const int value = DecodeChar(hash[i]);
        if (value < 0) {
            return std::unexpected(GeoError::InvalidInput(
                "invalid geohash character '" + std::string(1, hash[i]) + "' at position " +
                std::to_string(i) + " in '" + std::string(hash) + "'"));
        }

        for (int bit = kBitsPerChar - 1; bit >= 0; --bit) {
            const bool set = ((value >> bit) & 1) != 0;
            if (isLon) {
                const double mid = (box.maxLon + box.minLon) / 2.0;
                if (set) {
                    box.minLon = mid;
                } else {
                    box.maxLon = mid;
                }
            } else {
                const double mid = (box.maxLat + box.minLat) / 2.0;
                if (set) {
                    box.minLat = mid;
                } else {
                    box.maxLat = mid;
                }
            }
            isLon = !isLon;
        }
    }
    return box;
}

std::expected<DecodedHash, GeoError> Decode(std::string_view hash) {
    auto box = DecodeBoundingBox(hash);
    if (!box) {
        return std::unexpected(box.error());
    }

    DecodedHash decoded;
    decoded.point = box->Center();
    decoded.latitudeError = box->maxLat - decoded.point.Latitude();
    decoded.longitudeError = box->maxLon - decoded.point.Longitude();
    return decoded;
}

int LengthForDecimalDigits(size_t digits) noexcept {
    return kDigitsToLength[std::min(digits, kDigitsToLength.size() - 1)];
}

bool IsValid(std::string_view hash) noexcept {
    return std::all_of(hash.begin(), hash.end(), [](char c) { return DecodeChar(c) >= 0; });
}

} // namespace Geohash

} // namespace Geo
} // namespace Nearby
