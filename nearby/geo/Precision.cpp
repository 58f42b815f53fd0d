#include "geo/Precision.hpp"

#include <array>

namespace Nearby {
namespace Geo {

namespace {

struct PrecisionStep {
    double maxRadiusKm;     ///< Inclusive upper bound
    int length;
};

constexpr std::array<PrecisionStep, 8> kPrecisionSteps = {{
    {0.00477, 9},
    {0.0382, 8},
    {0.153, 7},
    {1.22, 6},
    {4.89, 5},
    {39.1, 4},
    {156.0, 3},
    {1250.0, 2},
}};

// Index 0 is length 1
constexpr std::array<CellDimensions, 9> kCellDimensions = {{
    {5000.0, 5000.0},
    {1250.0, 625.0},
    {156.0, 156.0},
    {39.1, 19.5},
    {4.89, 4.89},
    {1.22, 0.61},
    {0.153, 0.153},
    {0.0382, 0.0191},
    {0.00477, 0.00477},
}};

} // namespace

int SelectPrecision(double radiusKm) noexcept {
    for (const auto& step : kPrecisionSteps) {
        if (radiusKm <= step.maxRadiusKm) {
            return step.length;
        }
    }
    return 1;
}

std::optional<CellDimensions> GetCellDimensions(int length) noexcept {
    if (length < 1 || length > static_cast<int>(kCellDimensions.size())) {
        return std::nullopt;
    }
    return kCellDimensions[static_cast<size_t>(length - 1)];
}

} // namespace Geo
} // namespace Nearby
