/**
 * @file Distance.hpp
 * @brief Great-circle distance on a spherical Earth
 */

#pragma once

#include "geo/GeoPoint.hpp"

namespace Nearby {
namespace Geo {

/// Mean Earth radius (IUGG)
constexpr double kEarthRadiusKm = 6371.0088;

/**
 * @brief Convert degrees to radians, reducing modulo 360 first
 */
[[nodiscard]] double DegreesToRadians(double degrees) noexcept;

/**
 * @brief Haversine distance between two points in kilometers
 *
 * The haversine term is clamped to [0, 1], so identical and antipodal points
 * never produce NaN.
 */
[[nodiscard]] double HaversineKm(const GeoPoint& from, const GeoPoint& to) noexcept;

} // namespace Geo
} // namespace Nearby
