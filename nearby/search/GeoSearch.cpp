#include "search/GeoSearch.hpp"
#include "core/Logger.hpp"
#include "geo/Distance.hpp"
#include "geo/Geohash.hpp"
#include "geo/Neighbors.hpp"
#include "geo/Precision.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <optional>
#include <unordered_set>

namespace Nearby {

namespace {

constexpr const char* kGeohashField = ".geohash";

} // namespace

GeoSearchService::GeoSearchService(SearchConfig config)
    : m_config(std::move(config)) {
}

std::expected<Geo::GeoData, GeoError> GeoSearchService::CreateGeoData(double latitude, double longitude) const {
    return Geo::CreateGeoData(latitude, longitude, m_config.geohashLength);
}

std::expected<std::vector<std::string>, GeoError>
GeoSearchService::CoveringCells(const Geo::GeoPoint& center, double radiusKm) const {
    if (!center.IsValid()) {
        return std::unexpected(GeoError::InvalidInput(
            "search center out of range: (" + std::to_string(center.Latitude()) + ", " +
            std::to_string(center.Longitude()) + ")"));
    }
    if (std::isnan(radiusKm) || radiusKm < 0.0) {
        return std::unexpected(GeoError::InvalidInput(
            "search radius must be a non-negative number, got " + std::to_string(radiusKm)));
    }

    // A cell longer than the stored hashes would match none of them
    const int precision = std::min(Geo::SelectPrecision(radiusKm), m_config.geohashLength);
    auto fullHash = Geo::Geohash::Encode(center, Geo::kDefaultHashLength);
    if (!fullHash) {
        return std::unexpected(fullHash.error());
    }
    std::string centerHash = fullHash->substr(0, static_cast<size_t>(precision));

    auto neighbors = Geo::Geohash::Neighbors(centerHash);
    if (!neighbors) {
        return std::unexpected(neighbors.error());
    }

    std::vector<std::string> cells;
    cells.reserve(Geo::kNeighborCount + 1);
    auto addCell = [&cells](std::string cell) {
        if (std::find(cells.begin(), cells.end(), cell) == cells.end()) {
            cells.push_back(std::move(cell));
        }
    };
    for (auto& neighbor : *neighbors) {
        addCell(std::move(neighbor));
    }
    addCell(std::move(centerHash));
    return cells;
}

std::expected<std::vector<SearchResult>, GeoError>
GeoSearchService::Search(IDocumentStore& store, const SearchOptions& options, SearchStats* outStats) const {
    auto cells = CoveringCells(options.center, options.radiusKm);
    if (!cells) {
        return std::unexpected(cells.error());
    }

    const std::string fieldPath = ResolveFieldPath(options);
    const std::string hashField = fieldPath + kGeohashField;
    const double bufferedRadius = options.radiusKm * m_config.radiusBuffer;

    SearchStats stats;
    stats.cellsQueried = cells->size();

    NEARBY_LOG_DEBUG("Searching {:.4f} km around ({:.6f}, {:.6f}) at precision {} across {} cells",
                     options.radiusKm, options.center.Latitude(), options.center.Longitude(),
                     cells->front().size(), cells->size());

    // Fan out: start every query before awaiting any of them
    std::vector<std::future<QueryResult>> pending;
    pending.reserve(cells->size());
    for (const auto& cell : *cells) {
        auto query = RangeQuery::Prefix(hashField, cell);
        NEARBY_LOG_TRACE("Range query {}", query.BuildQueryString());
        try {
            pending.push_back(store.QueryRange(query));
        } catch (const std::exception& e) {
            std::promise<QueryResult> rejected;
            rejected.set_value(std::unexpected(GeoError::CollaboratorFailure(
                "range query for cell '" + cell + "' could not be issued: " + e.what())));
            pending.push_back(rejected.get_future());
        }
    }

    // Fan in, keeping cell order
    std::vector<std::vector<Document>> batches;
    batches.reserve(pending.size());
    std::optional<GeoError> failure;
    for (size_t i = 0; i < pending.size(); ++i) {
        QueryResult result;
        try {
            result = pending[i].get();
        } catch (const std::exception& e) {
            result = std::unexpected(GeoError::CollaboratorFailure(
                "range query for cell '" + (*cells)[i] + "' threw: " + e.what()));
        }

        if (!result) {
            NEARBY_LOG_ERROR("Range query for cell '{}' failed: {}", (*cells)[i], result.error().ToString());
            if (!failure) {
                failure = result.error().code == GeoErrorCode::CollaboratorFailure
                    ? result.error()
                    : GeoError::CollaboratorFailure(result.error().ToString());
            }
            continue;
        }
        batches.push_back(std::move(*result));
    }
    if (failure) {
        return std::unexpected(*failure);
    }

    std::vector<SearchResult> results;
    std::unordered_set<std::string> seen;
    for (auto& batch : batches) {
        for (auto& document : batch) {
            ++stats.documentsFetched;
            if (!seen.insert(document.id).second) {
                ++stats.duplicatesDropped;
                continue;
            }

            auto point = Geo::ReadGeoPoint(document.data, fieldPath);
            if (!point) {
                NEARBY_LOG_DEBUG("Skipping '{}': {}", document.id, point.error().ToString());
                ++stats.missingField;
                continue;
            }

            const double distance = Geo::HaversineKm(options.center, *point);
            if (distance > bufferedRadius) {
                ++stats.outsideRadius;
                continue;
            }
            results.push_back(SearchResult{std::move(document), distance});
        }
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const SearchResult& a, const SearchResult& b) { return a.distanceKm < b.distanceKm; });

    stats.returned = results.size();
    NEARBY_LOG_DEBUG("Search done: fetched={} duplicates={} missing={} outside={} returned={}",
                     stats.documentsFetched, stats.duplicatesDropped, stats.missingField,
                     stats.outsideRadius, stats.returned);
    if (outStats) {
        *outStats = stats;
    }
    return results;
}

nlohmann::json GeoSearchService::ToJson(const SearchResult& result) {
    nlohmann::json j = result.document.data.is_object() ? result.document.data : nlohmann::json::object();
    j["id"] = result.document.id;
    j["geoMetadata"] = {{"distanceKm", result.distanceKm}};
    return j;
}

std::string GeoSearchService::ResolveFieldPath(const SearchOptions& options) const {
    return options.fieldPath.empty() ? m_config.fieldPath : options.fieldPath;
}

} // namespace Nearby
