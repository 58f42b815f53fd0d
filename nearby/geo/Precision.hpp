/**
 * @file Precision.hpp
 * @brief Search radius to geohash length mapping
 */

#pragma once

#include <optional>

namespace Nearby {
namespace Geo {

/**
 * @brief Approximate geohash cell size at a given length
 */
struct CellDimensions {
    double widthKm = 0.0;
    double heightKm = 0.0;
};

/**
 * @brief Hash length whose cell size covers `radiusKm`
 *
 * Non-increasing in the radius: 9 for radii up to 4.77 m, 1 above 1250 km.
 */
[[nodiscard]] int SelectPrecision(double radiusKm) noexcept;

/**
 * @brief Cell width and height for lengths 1 to 9
 */
[[nodiscard]] std::optional<CellDimensions> GetCellDimensions(int length) noexcept;

} // namespace Geo
} // namespace Nearby
