/**
 * @file test_geo_search.cpp
 * @brief Unit tests for the proximity search fan-out, merge, filter and sort
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "search/GeoSearch.hpp"
#include "geo/Geohash.hpp"
#include "geo/Neighbors.hpp"
#include "store/MemoryDocumentStore.hpp"

#include "mocks/MockDocumentStore.hpp"
#include "utils/TestHelpers.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Nearby;
using namespace Nearby::Geo;
using namespace Nearby::Test;
using json = nlohmann::json;
using ::testing::_;
using ::testing::AllOf;
using ::testing::AnyNumber;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::NiceMock;
using ::testing::Throw;

namespace {

const GeoPoint kLondon{51.5074, -0.1278};

std::vector<std::string> IdsOf(const std::vector<SearchResult>& results) {
    std::vector<std::string> ids;
    for (const auto& result : results) {
        ids.push_back(result.document.id);
    }
    return ids;
}

Document MakeDocument(const std::string& id, const GeoPoint& point, const std::string& fieldPath = "location") {
    return Document{id, MakeGeoDocument(point, fieldPath, json{{"name", id}})};
}

} // namespace

// =============================================================================
// Covering Cells
// =============================================================================

class CoveringCellsTest : public ::testing::Test {
protected:
    GeoSearchService search;
};

TEST_F(CoveringCellsTest, NeighborsThenCenter) {
    auto cells = search.CoveringCells(kLondon, 3.0);
    ASSERT_EXPECTED_OK(cells);

    // 3 km selects length 5
    const auto neighbors = Geohash::Neighbors("gcpvj").value();
    std::vector<std::string> expected(neighbors.begin(), neighbors.end());
    expected.push_back("gcpvj");
    EXPECT_EQ(expected, *cells);
}

TEST_F(CoveringCellsTest, LengthFollowsRadius) {
    EXPECT_EQ(6u, search.CoveringCells(kLondon, 0.5).value().front().size());
    EXPECT_EQ(4u, search.CoveringCells(kLondon, 10.0).value().front().size());
    EXPECT_EQ(9u, search.CoveringCells(kLondon, 0.0).value().front().size());
}

TEST_F(CoveringCellsTest, LengthNeverExceedsStoredHashLength) {
    SearchConfig config;
    config.geohashLength = 6;
    GeoSearchService shortHashes(config);

    // 0.1 km alone would select length 7
    auto cells = shortHashes.CoveringCells(kLondon, 0.1);
    ASSERT_EXPECTED_OK(cells);
    for (const auto& cell : *cells) {
        EXPECT_EQ(6u, cell.size()) << cell;
    }
    EXPECT_EQ("gcpvj0", cells->back());
}

TEST_F(CoveringCellsTest, PolarCellsAreListedOnce) {
    auto cells = search.CoveringCells(GeoPoint(89.99, 0.0), 2000.0);
    ASSERT_EXPECTED_OK(cells);
    EXPECT_THAT(*cells, ElementsAre("u", "v", "t", "s", "e", "g"));
}

TEST_F(CoveringCellsTest, RejectsInvalidInput) {
    EXPECT_GEO_ERROR(search.CoveringCells(GeoPoint(91.0, 0.0), 1.0), GeoErrorCode::InvalidInput);
    EXPECT_GEO_ERROR(search.CoveringCells(kLondon, -1.0), GeoErrorCode::InvalidInput);
    EXPECT_GEO_ERROR(search.CoveringCells(kLondon, std::numeric_limits<double>::quiet_NaN()),
                     GeoErrorCode::InvalidInput);
}

// =============================================================================
// Search Against a Mock Store
// =============================================================================

class GeoSearchMockTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Cells without a specific expectation answer with no documents
        EXPECT_CALL(store, QueryRange(_)).Times(AnyNumber());
    }

    NiceMock<MockDocumentStore> store;
    GeoSearchService search;
};

TEST_F(GeoSearchMockTest, IssuesOnePrefixQueryPerCell) {
    const auto cells = search.CoveringCells(kLondon, 3.0).value();
    ASSERT_EQ(9u, cells.size());

    for (const auto& cell : cells) {
        EXPECT_CALL(store, QueryRange(AllOf(OrdersBy("location.geohash"), IsPrefixQueryFor(cell))))
            .Times(1);
    }

    auto results = search.Search(store, {kLondon, 3.0, "location"});
    ASSERT_EXPECTED_OK(results);
    EXPECT_THAT(*results, IsEmpty());
}

TEST_F(GeoSearchMockTest, StartsEveryQueryBeforeAwaiting) {
    int issued = 0;
    std::vector<int> issuedAtAwait;

    EXPECT_CALL(store, QueryRange(_)).Times(9).WillRepeatedly([&](const RangeQuery&) {
        ++issued;
        return std::async(std::launch::deferred, [&]() -> QueryResult {
            issuedAtAwait.push_back(issued);
            return std::vector<Document>{};
        });
    });

    ASSERT_EXPECTED_OK(search.Search(store, {kLondon, 3.0, "location"}));
    EXPECT_THAT(issuedAtAwait, ElementsAre(9, 9, 9, 9, 9, 9, 9, 9, 9));
}

TEST_F(GeoSearchMockTest, SameRecordFromEveryCellAppearsOnce) {
    const auto document = MakeDocument("dup", PointAtDistance(kLondon, 1.0, 90.0));
    ON_CALL(store, QueryRange(_)).WillByDefault([&](const RangeQuery&) {
        return ReadyFuture(std::vector<Document>{document});
    });

    SearchStats stats;
    auto results = search.Search(store, {kLondon, 3.0, "location"}, &stats);
    ASSERT_EXPECTED_OK(results);
    EXPECT_THAT(IdsOf(*results), ElementsAre("dup"));
    EXPECT_EQ(9u, stats.documentsFetched);
    EXPECT_EQ(8u, stats.duplicatesDropped);
    EXPECT_EQ(1u, stats.returned);
}

TEST_F(GeoSearchMockTest, FirstOccurrenceOfAnIdWins) {
    const auto cells = search.CoveringCells(kLondon, 3.0).value();
    const auto farCopy = MakeDocument("same", PointAtDistance(kLondon, 50.0, 0.0));
    const auto nearCopy = MakeDocument("same", PointAtDistance(kLondon, 0.5, 0.0));

    EXPECT_CALL(store, QueryRange(IsPrefixQueryFor(cells.front()))).WillOnce([&](const RangeQuery&) {
        return ReadyFuture(std::vector<Document>{farCopy});
    });
    EXPECT_CALL(store, QueryRange(IsPrefixQueryFor(cells.back()))).WillOnce([&](const RangeQuery&) {
        return ReadyFuture(std::vector<Document>{nearCopy});
    });

    SearchStats stats;
    auto results = search.Search(store, {kLondon, 3.0, "location"}, &stats);
    ASSERT_EXPECTED_OK(results);
    EXPECT_THAT(*results, IsEmpty());
    EXPECT_EQ(1u, stats.outsideRadius);
    EXPECT_EQ(1u, stats.duplicatesDropped);
}

TEST_F(GeoSearchMockTest, FailedQueryFailsSearch) {
    const auto cells = search.CoveringCells(kLondon, 3.0).value();
    EXPECT_CALL(store, QueryRange(IsPrefixQueryFor(cells[3]))).WillOnce([](const RangeQuery&) {
        return ReadyFuture(std::unexpected(GeoError::CollaboratorFailure("backend unavailable")));
    });

    auto results = search.Search(store, {kLondon, 3.0, "location"});
    EXPECT_GEO_ERROR(results, GeoErrorCode::CollaboratorFailure);
    EXPECT_THAT(results.error().message, HasSubstr("backend unavailable"));
}

TEST_F(GeoSearchMockTest, ThrowingFutureFailsSearch) {
    const auto cells = search.CoveringCells(kLondon, 3.0).value();
    EXPECT_CALL(store, QueryRange(IsPrefixQueryFor(cells.back()))).WillOnce([](const RangeQuery&) {
        return ThrowingFuture(std::runtime_error("connection reset"));
    });

    auto results = search.Search(store, {kLondon, 3.0, "location"});
    EXPECT_GEO_ERROR(results, GeoErrorCode::CollaboratorFailure);
    EXPECT_THAT(results.error().message, HasSubstr("connection reset"));
}

TEST_F(GeoSearchMockTest, QueryThatThrowsWhenIssuedFailsSearch) {
    const auto cells = search.CoveringCells(kLondon, 3.0).value();
    EXPECT_CALL(store, QueryRange(IsPrefixQueryFor(cells.front())))
        .WillOnce(Throw(std::runtime_error("request could not be sent")));
    // The remaining cells are still issued
    EXPECT_CALL(store, QueryRange(IsPrefixQueryFor(cells.back()))).Times(1);

    auto results = search.Search(store, {kLondon, 3.0, "location"});
    EXPECT_GEO_ERROR(results, GeoErrorCode::CollaboratorFailure);
    EXPECT_THAT(results.error().message, HasSubstr("request could not be sent"));
    EXPECT_THAT(results.error().message, HasSubstr(cells.front()));
}

TEST_F(GeoSearchMockTest, StoreErrorOfOtherKindIsReportedAsCollaboratorFailure) {
    EXPECT_CALL(store, QueryRange(_)).WillRepeatedly([](const RangeQuery&) {
        return ReadyFuture(std::unexpected(GeoError::InvalidInput("bad index")));
    });

    auto results = search.Search(store, {kLondon, 3.0, "location"});
    EXPECT_GEO_ERROR(results, GeoErrorCode::CollaboratorFailure);
    EXPECT_THAT(results.error().message, HasSubstr("bad index"));
}

TEST_F(GeoSearchMockTest, RecordsWithoutGeoDataAreSkipped) {
    const std::vector<Document> batch = {
        Document{"nowhere", json{{"name", "nowhere"}}},
        Document{"broken", json{{"location", {{"geohash", "gcpvj"}}}}},
        MakeDocument("here", PointAtDistance(kLondon, 1.0, 180.0)),
    };
    const auto cells = search.CoveringCells(kLondon, 3.0).value();
    EXPECT_CALL(store, QueryRange(IsPrefixQueryFor(cells.back()))).WillOnce([&](const RangeQuery&) {
        return ReadyFuture(batch);
    });

    SearchStats stats;
    auto results = search.Search(store, {kLondon, 3.0, "location"}, &stats);
    ASSERT_EXPECTED_OK(results);
    EXPECT_THAT(IdsOf(*results), ElementsAre("here"));
    EXPECT_EQ(2u, stats.missingField);
}

TEST_F(GeoSearchMockTest, InvalidInputIssuesNoQueries) {
    EXPECT_CALL(store, QueryRange(_)).Times(0);

    EXPECT_GEO_ERROR(search.Search(store, {GeoPoint(0.0, 200.0), 1.0, "location"}),
                     GeoErrorCode::InvalidInput);
    EXPECT_GEO_ERROR(search.Search(store, {kLondon, -0.5, "location"}), GeoErrorCode::InvalidInput);
}

TEST_F(GeoSearchMockTest, EmptyFieldPathUsesConfiguredDefault) {
    SearchConfig config;
    config.fieldPath = "venue.position";
    GeoSearchService configured(config);

    EXPECT_CALL(store, QueryRange(OrdersBy("venue.position.geohash"))).Times(9);
    ASSERT_EXPECTED_OK(configured.Search(store, {kLondon, 3.0, ""}));
}

// =============================================================================
// Search Against the In-Memory Store
// =============================================================================

class GeoSearchTest : public ::testing::Test {
protected:
    void Add(const std::string& id, const GeoPoint& point, const std::string& fieldPath = "location") {
        store.Put(id, MakeGeoDocument(point, fieldPath, json{{"name", id}}));
    }

    MemoryDocumentStore store;
    GeoSearchService search;
};

TEST_F(GeoSearchTest, ReturnsRecordsWithinRadiusNearestFirst) {
    Add("ten", PointAtDistance(kLondon, 10.0, 45.0));
    Add("two", PointAtDistance(kLondon, 2.0, 200.0));
    Add("half", PointAtDistance(kLondon, 0.5, 90.0));

    SearchStats stats;
    auto results = search.Search(store, {kLondon, 3.0, "location"}, &stats);
    ASSERT_EXPECTED_OK(results);
    ASSERT_THAT(IdsOf(*results), ElementsAre("half", "two"));
    EXPECT_NEAR(0.5, (*results)[0].distanceKm, 1e-6);
    EXPECT_NEAR(2.0, (*results)[1].distanceKm, 1e-6);
    EXPECT_EQ(9u, stats.cellsQueried);
    EXPECT_EQ(2u, stats.returned);
}

TEST_F(GeoSearchTest, EmptyCollectionYieldsEmptyList) {
    auto results = search.Search(store, {kLondon, 3.0, "location"});
    ASSERT_EXPECTED_OK(results);
    EXPECT_THAT(*results, IsEmpty());
}

TEST_F(GeoSearchTest, BufferAdmitsRecordsJustOutsideRadius) {
    Add("inside-buffer", PointAtDistance(kLondon, 3.02, 0.0));
    Add("outside-buffer", PointAtDistance(kLondon, 3.05, 0.0));

    auto results = search.Search(store, {kLondon, 3.0, "location"});
    ASSERT_EXPECTED_OK(results);
    EXPECT_THAT(IdsOf(*results), ElementsAre("inside-buffer"));

    SearchConfig strict;
    strict.radiusBuffer = 1.0;
    auto strictResults = GeoSearchService(strict).Search(store, {kLondon, 3.0, "location"});
    ASSERT_EXPECTED_OK(strictResults);
    EXPECT_THAT(*strictResults, IsEmpty());
}

TEST_F(GeoSearchTest, NestedFieldPath) {
    Add("cafe", PointAtDistance(kLondon, 0.3, 10.0), "venue.location");
    Add("elsewhere", PointAtDistance(kLondon, 0.3, 10.0), "location");

    auto results = search.Search(store, {kLondon, 1.0, "venue.location"});
    ASSERT_EXPECTED_OK(results);
    EXPECT_THAT(IdsOf(*results), ElementsAre("cafe"));
}

TEST_F(GeoSearchTest, EqualDistancesKeepCellOrder) {
    const auto point = PointAtDistance(kLondon, 1.0, 30.0);
    Add("b", point);
    Add("a", point);

    auto results = search.Search(store, {kLondon, 3.0, "location"});
    ASSERT_EXPECTED_OK(results);
    // Both come from the same cell, which the store orders by hash then id
    EXPECT_THAT(IdsOf(*results), ElementsAre("a", "b"));
}

TEST_F(GeoSearchTest, SearchAcrossAntimeridian) {
    const GeoPoint center(0.0, 179.99);
    Add("east", PointAtDistance(center, 1.5, 90.0));
    Add("west", PointAtDistance(center, 0.5, 270.0));

    auto results = search.Search(store, {center, 3.0, "location"});
    ASSERT_EXPECTED_OK(results);
    EXPECT_THAT(IdsOf(*results), ElementsAre("west", "east"));
}

TEST_F(GeoSearchTest, CreateGeoDataUsesConfiguredLength) {
    SearchConfig config;
    config.geohashLength = 6;
    auto data = GeoSearchService(config).CreateGeoData(51.5074, -0.1278);
    ASSERT_EXPECTED_OK(data);
    EXPECT_EQ("gcpvj0", data->geohash);

    EXPECT_EQ("gcpvj0duq", search.CreateGeoData(51.5074, -0.1278).value().geohash);
}

TEST_F(GeoSearchTest, SmallRadiusFindsRecordsStoredWithShortHashes) {
    SearchConfig config;
    config.geohashLength = 6;
    GeoSearchService shortHashes(config);

    auto data = shortHashes.CreateGeoData(kLondon.Latitude(), kLondon.Longitude());
    ASSERT_EXPECTED_OK(data);
    json fields = {{"name", "center"}};
    ASSERT_TRUE(SetGeoData(fields, "location", *data).has_value());
    store.Put("center", fields);

    auto results = shortHashes.Search(store, {kLondon, 0.1, "location"});
    ASSERT_EXPECTED_OK(results);
    EXPECT_THAT(IdsOf(*results), ElementsAre("center"));
}

TEST_F(GeoSearchTest, ResultToJson) {
    Add("half", PointAtDistance(kLondon, 0.5, 90.0));
    auto results = search.Search(store, {kLondon, 3.0, "location"});
    ASSERT_EXPECTED_OK(results);
    ASSERT_EQ(1u, results->size());

    const auto j = GeoSearchService::ToJson(results->front());
    EXPECT_EQ("half", j["id"].get<std::string>());
    EXPECT_EQ("half", j["name"].get<std::string>());
    EXPECT_TRUE(j["location"].contains("geohash"));
    EXPECT_NEAR(0.5, j["geoMetadata"]["distanceKm"].get<double>(), 1e-6);
}
