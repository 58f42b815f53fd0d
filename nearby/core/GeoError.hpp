#pragma once

#include <string>
#include <string_view>

namespace Nearby {

/**
 * @brief Error codes for geohash and search operations
 */
enum class GeoErrorCode : int {
    None = 0,

    InvalidInput = 100,         ///< Bad coordinates, hash characters or precision mode input
    CollaboratorFailure = 200,  ///< Document store query failed or threw
    MissingField = 300          ///< Field path does not resolve to geo data
};

/**
 * @brief Error information returned through std::expected
 */
struct GeoError {
    GeoErrorCode code = GeoErrorCode::None;
    std::string message;

    [[nodiscard]] static GeoError Make(GeoErrorCode errorCode, std::string msg) {
        return GeoError{errorCode, std::move(msg)};
    }

    [[nodiscard]] static GeoError InvalidInput(std::string msg) {
        return Make(GeoErrorCode::InvalidInput, std::move(msg));
    }

    [[nodiscard]] static GeoError CollaboratorFailure(std::string msg) {
        return Make(GeoErrorCode::CollaboratorFailure, std::move(msg));
    }

    [[nodiscard]] static GeoError MissingField(std::string msg) {
        return Make(GeoErrorCode::MissingField, std::move(msg));
    }

    [[nodiscard]] bool HasError() const noexcept {
        return code != GeoErrorCode::None;
    }

    /**
     * @brief Format error as string for logging
     */
    [[nodiscard]] std::string ToString() const {
        if (!HasError()) {
            return "Success";
        }
        return std::string(ToString(code)) + ": " + message;
    }

    [[nodiscard]] static constexpr std::string_view ToString(GeoErrorCode errorCode) noexcept {
        switch (errorCode) {
            case GeoErrorCode::None: return "None";
            case GeoErrorCode::InvalidInput: return "InvalidInput";
            case GeoErrorCode::CollaboratorFailure: return "CollaboratorFailure";
            case GeoErrorCode::MissingField: return "MissingField";
        }
        return "Unknown";
    }
};

} // namespace Nearby
