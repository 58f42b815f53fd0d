#include "geo/Distance.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace Nearby {
namespace Geo {

double DegreesToRadians(double degrees) noexcept {
    return std::fmod(degrees, 360.0) * std::numbers::pi / 180.0;
}

double HaversineKm(const GeoPoint& from, const GeoPoint& to) noexcept {
    const double dLat = DegreesToRadians(to.Latitude() - from.Latitude());
    const double dLon = DegreesToRadians(to.Longitude() - from.Longitude());
    const double lat1 = DegreesToRadians(from.Latitude());
    const double lat2 = DegreesToRadians(to.Latitude());

    const double sinLat = std::sin(dLat / 2.0);
    const double sinLon = std::sin(dLon / 2.0);
    const double cosProduct = std::cos(lat1) * std::cos(lat2);
    double a = sinLat * sinLat + sinLon * sinLon * cosProduct;
    a = std::clamp(a, 0.0, 1.0);

    return 2.0 * kEarthRadiusKm * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
}

} // namespace Geo
} // namespace Nearby
