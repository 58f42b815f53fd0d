/**
 * @file GeoData.hpp
 * @brief Geo value stored on each searchable document
 *
 * Stored shape at the configured field path:
 *   { "geopoint": { "latitude": 51.5, "longitude": -0.12 }, "geohash": "gcpvj0duq" }
 */

#pragma once

#include "core/GeoError.hpp"
#include "geo/GeoPoint.hpp"
#include "geo/Geohash.hpp"

#include <expected>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace Nearby {
namespace Geo {

/**
 * @brief Point plus its full-precision geohash
 *
 * The hash is always Encode(point, length) for the length it was created
 * with; re-create the value whenever the point changes.
 */
struct GeoData {
    GeoPoint point;
    std::string geohash;
};

/**
 * @brief Build the value to persist for a coordinate pair
 */
[[nodiscard]] std::expected<GeoData, GeoError> CreateGeoData(double latitude, double longitude,
                                                             int length = kDefaultHashLength);

void to_json(nlohmann::json& j, const GeoPoint& point);
void to_json(nlohmann::json& j, const GeoData& data);

/**
 * @brief Read the point stored under `fieldPath`
 * @return MissingField if the path or the geopoint shape is absent
 */
[[nodiscard]] std::expected<GeoPoint, GeoError> ReadGeoPoint(const nlohmann::json& document,
                                                             std::string_view fieldPath);

/**
 * @brief Read point and hash stored under `fieldPath`
 */
[[nodiscard]] std::expected<GeoData, GeoError> ReadGeoData(const nlohmann::json& document,
                                                           std::string_view fieldPath);

/**
 * @brief Write `data` under `fieldPath`, creating intermediate objects
 */
[[nodiscard]] std::expected<void, GeoError> SetGeoData(nlohmann::json& document,
                                                       std::string_view fieldPath,
                                                       const GeoData& data);

/**
 * @brief Re-derive and store geo data after a coordinate change
 */
[[nodiscard]] std::expected<GeoData, GeoError> UpdateGeoPoint(nlohmann::json& document,
                                                              std::string_view fieldPath,
                                                              double latitude, double longitude,
                                                              int length = kDefaultHashLength);

} // namespace Geo
} // namespace Nearby
