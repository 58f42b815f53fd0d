#include "geo/GeoData.hpp"
#include "utils/JsonPath.hpp"

namespace Nearby {
namespace Geo {

namespace {

constexpr const char* kGeoPointKey = "geopoint";
constexpr const char* kGeohashKey = "geohash";
constexpr const char* kLatitudeKey = "latitude";
constexpr const char* kLongitudeKey = "longitude";

} // namespace

std::expected<GeoData, GeoError> CreateGeoData(double latitude, double longitude, int length) {
    auto point = GeoPoint::Create(latitude, longitude);
    if (!point) {
        return std::unexpected(point.error());
    }
    auto hash = Geohash::Encode(*point, length);
    if (!hash) {
        return std::unexpected(hash.error());
    }
    return GeoData{*point, std::move(*hash)};
}

void to_json(nlohmann::json& j, const GeoPoint& point) {
    j = nlohmann::json{{kLatitudeKey, point.Latitude()}, {kLongitudeKey, point.Longitude()}};
}

void to_json(nlohmann::json& j, const GeoData& data) {
    j = nlohmann::json{{kGeoPointKey, data.point}, {kGeohashKey, data.geohash}};
}

std::expected<GeoPoint, GeoError> ReadGeoPoint(const nlohmann::json& document,
                                               std::string_view fieldPath) {
    const auto* field = JsonPath::Resolve(document, fieldPath);
    if (!field || !field->is_object()) {
        return std::unexpected(GeoError::MissingField(
            "no geo data at '" + std::string(fieldPath) + "'"));
    }

    auto geopoint = field->find(kGeoPointKey);
    if (geopoint == field->end() || !geopoint->is_object()) {
        return std::unexpected(GeoError::MissingField(
            "no geopoint at '" + std::string(fieldPath) + "'"));
    }

    auto lat = geopoint->find(kLatitudeKey);
    auto lon = geopoint->find(kLongitudeKey);
    if (lat == geopoint->end() || lon == geopoint->end() ||
        !lat->is_number() || !lon->is_number()) {
        return std::unexpected(GeoError::MissingField(
            "geopoint at '" + std::string(fieldPath) + "' lacks numeric latitude/longitude"));
    }

    GeoPoint point(lat->get<double>(), lon->get<double>());
    if (!point.IsValid()) {
        return std::unexpected(GeoError::MissingField(
            "geopoint at '" + std::string(fieldPath) + "' is out of range"));
    }
    return point;
}

std::expected<GeoData, GeoError> ReadGeoData(const nlohmann::json& document,
                                             std::string_view fieldPath) {
    auto point = ReadGeoPoint(document, fieldPath);
    if (!point) {
        return std::unexpected(point.error());
    }

    const auto* field = JsonPath::Resolve(document, fieldPath);
    auto hash = field->find(kGeohashKey);
    if (hash == field->end() || !hash->is_string()) {
        return std::unexpected(GeoError::MissingField(
            "no geohash at '" + std::string(fieldPath) + "'"));
    }
    return GeoData{*point, hash->get<std::string>()};
}

std::expected<void, GeoError> SetGeoData(nlohmann::json& document, std::string_view fieldPath,
                                         const GeoData& data) {
    auto* field = JsonPath::ResolveOrCreate(document, fieldPath);
    if (!field) {
        return std::unexpected(GeoError::InvalidInput(
            "cannot write geo data at '" + std::string(fieldPath) + "'"));
    }
    *field = data;
    return {};
}

std::expected<GeoData, GeoError> UpdateGeoPoint(nlohmann::json& document, std::string_view fieldPath,
                                                double latitude, double longitude, int length) {
    auto data = CreateGeoData(latitude, longitude, length);
    if (!data) {
        return std::unexpected(data.error());
    }
    auto written = SetGeoData(document, fieldPath, *data);
    if (!written) {
        return std::unexpected(written.error());
    }
    return data;
}

} // namespace Geo
} // namespace Nearby
