#include "geo/Neighbors.hpp"
#include "geo/Geohash.hpp"

#include <algorithm>
#include <cmath>

namespace Nearby {
namespace Geo {

namespace {

struct DirectionVector {
    int latDir;
    int lonDir;
};

constexpr std::array<DirectionVector, kNeighborCount> kDirectionVectors = {{
    { 1,  0},   // N
    { 1,  1},   // NE
    { 0,  1},   // E
    {-1,  1},   // SE
    {-1,  0},   // S
    {-1, -1},   // SW
    { 0, -1},   // W
    { 1, -1},   // NW
}};

double WrapLongitude(double longitude) {
    double wrapped = std::fmod(longitude - kMinLongitude, 360.0);
    if (wrapped < 0.0) {
        wrapped += 360.0;
    }
    return wrapped + kMinLongitude;
}

std::string EncodeNeighbor(const DecodedHash& cell, DirectionVector dir, int length) {
    const double height = cell.latitudeError * 2.0;
    const double width = cell.longitudeError * 2.0;

    const double lat = std::clamp(cell.point.Latitude() + dir.latDir * height,
                                  kMinLatitude, kMaxLatitude);
    const double lon = WrapLongitude(cell.point.Longitude() + dir.lonDir * width);
    return Geohash::EncodeUnchecked(lat, lon, length);
}

} // namespace

namespace Geohash {

std::expected<std::string, GeoError> Neighbor(std::string_view hash, Direction direction) {
    auto cell = Decode(hash);
    if (!cell) {
        return std::unexpected(cell.error());
    }
    return EncodeNeighbor(*cell, kDirectionVectors[static_cast<size_t>(direction)],
                          static_cast<int>(hash.size()));
}

std::expected<NeighborList, GeoError> Neighbors(std::string_view hash) {
    auto cell = Decode(hash);
    if (!cell) {
        return std::unexpected(cell.error());
    }

    const int length = static_cast<int>(hash.size());
    NeighborList neighbors;
    for (size_t i = 0; i < kNeighborCount; ++i) {
        neighbors[i] = EncodeNeighbor(*cell, kDirectionVectors[i], length);
    }
    return neighbors;
}

} // namespace Geohash

} // namespace Geo
} // namespace Nearby
