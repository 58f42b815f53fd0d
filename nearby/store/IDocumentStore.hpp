#pragma once

#include "core/GeoError.hpp"

#include <expected>
#include <future>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Nearby {

/**
 * @brief A stored record: identifier plus its field map
 */
struct Document {
    std::string id;
    nlohmann::json data;
};

/**
 * @brief Ordered range query over one string field
 *
 * Mirrors the order-by / start-at / end-at form of document databases.
 * Both bounds are inclusive and compared lexicographically.
 */
class RangeQuery {
public:
    RangeQuery() = default;

    /**
     * @brief Prefix query: every value in [prefix, prefix + "~"]
     */
    [[nodiscard]] static RangeQuery Prefix(const std::string& field, const std::string& prefix);

    RangeQuery& OrderBy(const std::string& field);
    RangeQuery& StartAt(const std::string& value);
    RangeQuery& EndAt(const std::string& value);
    RangeQuery& LimitToFirst(size_t limit);

    [[nodiscard]] const std::string& GetField() const { return m_orderBy; }
    [[nodiscard]] const std::optional<std::string>& GetStartAt() const { return m_startAt; }
    [[nodiscard]] const std::optional<std::string>& GetEndAt() const { return m_endAt; }
    [[nodiscard]] size_t GetLimit() const { return m_limit; }

    /**
     * @brief True if `value` falls inside the bounds
     */
    [[nodiscard]] bool Matches(const std::string& value) const;

    /**
     * @brief REST query string, e.g. ?orderBy="location.geohash"&startAt="gcp"&endAt="gcp~"
     */
    [[nodiscard]] std::string BuildQueryString() const;

    bool operator==(const RangeQuery& other) const = default;

private:
    std::string m_orderBy;
    std::optional<std::string> m_startAt;
    std::optional<std::string> m_endAt;
    size_t m_limit = 0;  // 0 = unlimited
};

using QueryResult = std::expected<std::vector<Document>, GeoError>;

/**
 * @brief Document collection able to answer ordered range queries
 *
 * Implementations decide how queries run; a query may complete on another
 * thread or be ready before QueryRange returns. Failures are reported as a
 * CollaboratorFailure result or as an exception thrown from the future.
 */
class IDocumentStore {
public:
    virtual ~IDocumentStore() = default;

    /**
     * @brief Start a range query
     * @return Future of the matching documents ordered ascending by the field
     */
    [[nodiscard]] virtual std::future<QueryResult> QueryRange(const RangeQuery& query) = 0;
};

} // namespace Nearby
