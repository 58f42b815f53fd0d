/**
 * @file Neighbors.hpp
 * @brief Adjacent geohash cells
 */

#pragma once

#include "core/GeoError.hpp"

#include <array>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace Nearby {
namespace Geo {

/**
 * @brief Compass directions, clockwise from north
 *
 *   NW N NE
 *   W  x  E
 *   SW S SE
 */
enum class Direction : uint8_t {
    North = 0,
    NorthEast,
    East,
    SouthEast,
    South,
    SouthWest,
    West,
    NorthWest
};

constexpr size_t kNeighborCount = 8;

using NeighborList = std::array<std::string, kNeighborCount>;

namespace Geohash {

/**
 * @brief The cell adjacent to `hash` in one direction, at the same length
 *
 * Latitude is clamped at the poles, so the northern neighbors of a cell in
 * the top row are cells of the top row. Longitude wraps across the
 * antimeridian.
 */
[[nodiscard]] std::expected<std::string, GeoError> Neighbor(std::string_view hash, Direction direction);

/**
 * @brief All eight adjacent cells ordered N, NE, E, SE, S, SW, W, NW
 */
[[nodiscard]] std::expected<NeighborList, GeoError> Neighbors(std::string_view hash);

} // namespace Geohash

} // namespace Geo
} // namespace Nearby
