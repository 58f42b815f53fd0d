/**
 * @file GeoPoint.hpp
 * @brief Geographic coordinate value types
 */

#pragma once

#include "core/GeoError.hpp"

#include <cmath>
#include <expected>
#include <string>

namespace Nearby {
namespace Geo {

constexpr double kMinLatitude = -90.0;
constexpr double kMaxLatitude = 90.0;
constexpr double kMinLongitude = -180.0;
constexpr double kMaxLongitude = 180.0;

/**
 * @brief Immutable latitude/longitude pair in degrees
 */
class GeoPoint {
public:
    constexpr GeoPoint() noexcept = default;
    constexpr GeoPoint(double latitude, double longitude) noexcept
        : m_latitude(latitude), m_longitude(longitude) {}

    /**
     * @brief Create a point, rejecting out-of-range or non-finite coordinates
     */
    [[nodiscard]] static std::expected<GeoPoint, GeoError> Create(double latitude, double longitude) {
        GeoPoint point(latitude, longitude);
        if (!point.IsValid()) {
            return std::unexpected(GeoError::InvalidInput(
                "coordinates out of range: (" + std::to_string(latitude) + ", " +
                std::to_string(longitude) + ")"));
        }
        return point;
    }

    [[nodiscard]] constexpr double Latitude() const noexcept { return m_latitude; }
    [[nodiscard]] constexpr double Longitude() const noexcept { return m_longitude; }

    /**
     * @brief Check that latitude is in [-90, 90] and longitude in [-180, 180]
     */
    [[nodiscard]] bool IsValid() const noexcept {
        return std::isfinite(m_latitude) && std::isfinite(m_longitude) &&
               m_latitude >= kMinLatitude && m_latitude <= kMaxLatitude &&
               m_longitude >= kMinLongitude && m_longitude <= kMaxLongitude;
    }

    constexpr bool operator==(const GeoPoint& other) const noexcept = default;

private:
    double m_latitude = 0.0;
    double m_longitude = 0.0;
};

/**
 * @brief Axis-aligned lat/lon rectangle
 */
struct BoundingBox {
    double minLat = kMinLatitude;
    double minLon = kMinLongitude;
    double maxLat = kMaxLatitude;
    double maxLon = kMaxLongitude;

    [[nodiscard]] constexpr GeoPoint Center() const noexcept {
        return GeoPoint((minLat + maxLat) / 2.0, (minLon + maxLon) / 2.0);
    }

    /// Half of the box height
    [[nodiscard]] constexpr double LatitudeError() const noexcept { return (maxLat - minLat) / 2.0; }

    /// Half of the box width
    [[nodiscard]] constexpr double LongitudeError() const noexcept { return (maxLon - minLon) / 2.0; }

    [[nodiscard]] constexpr bool Contains(const GeoPoint& point) const noexcept {
        return point.Latitude() >= minLat && point.Latitude() <= maxLat &&
               point.Longitude() >= minLon && point.Longitude() <= maxLon;
    }

    constexpr bool operator==(const BoundingBox& other) const noexcept = default;
};

} // namespace Geo
} // namespace Nearby
