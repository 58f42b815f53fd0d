#include "store/IDocumentStore.hpp"
#include "geo/Geohash.hpp"

#include <sstream>

namespace Nearby {

RangeQuery RangeQuery::Prefix(const std::string& field, const std::string& prefix) {
    RangeQuery query;
    query.OrderBy(field).StartAt(prefix).EndAt(prefix + Geo::kRangeTerminator);
    return query;
}

RangeQuery& RangeQuery::OrderBy(const std::string& field) {
    m_orderBy = field;
    return *this;
}

RangeQuery& RangeQuery::StartAt(const std::string& value) {
    m_startAt = value;
    return *this;
}

RangeQuery& RangeQuery::EndAt(const std::string& value) {
    m_endAt = value;
    return *this;
}

RangeQuery& RangeQuery::LimitToFirst(size_t limit) {
    m_limit = limit;
    return *this;
}

bool RangeQuery::Matches(const std::string& value) const {
    if (m_startAt && value < *m_startAt) {
        return false;
    }
    if (m_endAt && value > *m_endAt) {
        return false;
    }
    return true;
}

std::string RangeQuery::BuildQueryString() const {
    std::stringstream ss;
    bool first = true;

    auto addParam = [&ss, &first](const std::string& name, const std::string& value) {
        ss << (first ? "?" : "&") << name << "=" << value;
        first = false;
    };

    if (!m_orderBy.empty()) {
        addParam("orderBy", nlohmann::json(m_orderBy).dump());
    }
    if (m_startAt.has_value()) {
        addParam("startAt", nlohmann::json(*m_startAt).dump());
    }
    if (m_endAt.has_value()) {
        addParam("endAt", nlohmann::json(*m_endAt).dump());
    }
    if (m_limit > 0) {
        addParam("limitToFirst", std::to_string(m_limit));
    }

    return ss.str();
}

} // namespace Nearby
