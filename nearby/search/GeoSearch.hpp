#pragma once

#include "config/Config.hpp"
#include "core/GeoError.hpp"
#include "geo/GeoData.hpp"
#include "geo/GeoPoint.hpp"
#include "store/IDocumentStore.hpp"

#include <expected>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Nearby {

/**
 * @brief Parameters of one proximity search
 */
struct SearchOptions {
    Geo::GeoPoint center;
    double radiusKm = 0.0;
    std::string fieldPath;      // Dot path to the GeoData; empty = SearchConfig::fieldPath
};

/**
 * @brief A matched record and its great-circle distance to the search center
 */
struct SearchResult {
    Document document;
    double distanceKm = 0.0;
};

/**
 * @brief Counters collected during one search
 */
struct SearchStats {
    size_t cellsQueried = 0;
    size_t documentsFetched = 0;
    size_t duplicatesDropped = 0;
    size_t missingField = 0;
    size_t outsideRadius = 0;
    size_t returned = 0;
};

/**
 * @brief Geohash proximity search over a document store
 *
 * A search picks a hash length from the radius, truncates the center's hash to
 * it and issues one prefix range query for that cell and each of its eight
 * neighbors. All queries are started before any result is awaited. The merged
 * records are deduplicated by id (first occurrence wins), filtered by
 * haversine distance against the buffered radius and returned nearest first.
 *
 * Usage:
 * @code
 * GeoSearchService search(SearchConfig::FromConfig(Config::Instance()));
 * auto results = search.Search(store, {center, 3.0, "location"});
 * if (!results) {
 *     NEARBY_LOG_ERROR("Search failed: {}", results.error().ToString());
 * }
 * @endcode
 */
class GeoSearchService {
public:
    explicit GeoSearchService(SearchConfig config = {});

    /**
     * @brief Build the GeoData to store for a coordinate
     */
    [[nodiscard]] std::expected<Geo::GeoData, GeoError> CreateGeoData(double latitude, double longitude) const;

    /**
     * @brief Cells queried for a search: the eight neighbors, then the center cell
     *
     * Identical cells (which only occur next to the poles) are listed once.
     */
    [[nodiscard]] std::expected<std::vector<std::string>, GeoError>
    CoveringCells(const Geo::GeoPoint& center, double radiusKm) const;

    /**
     * @brief Run a proximity search
     * @param store Collection to query
     * @param options Center, radius and field path
     * @param outStats Optional counters for the run
     * @return Records within the radius sorted by ascending distance, or
     *         InvalidInput / CollaboratorFailure
     */
    [[nodiscard]] std::expected<std::vector<SearchResult>, GeoError>
    Search(IDocumentStore& store, const SearchOptions& options, SearchStats* outStats = nullptr) const;

    [[nodiscard]] const SearchConfig& GetConfig() const { return m_config; }

    /**
     * @brief Render a result as its fields plus "id" and "geoMetadata.distanceKm"
     */
    [[nodiscard]] static nlohmann::json ToJson(const SearchResult& result);

private:
    [[nodiscard]] std::string ResolveFieldPath(const SearchOptions& options) const;

    SearchConfig m_config;
};

} // namespace Nearby
