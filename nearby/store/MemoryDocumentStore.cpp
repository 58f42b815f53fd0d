#include "store/MemoryDocumentStore.hpp"
#include "core/Logger.hpp"
#include "utils/JsonPath.hpp"

#include <algorithm>
#include <mutex>

namespace Nearby {

void MemoryDocumentStore::Put(const std::string& id, nlohmann::json data) {
    std::unique_lock lock(m_mutex);
    m_documents[id] = std::move(data);
}

std::optional<Document> MemoryDocumentStore::Get(const std::string& id) const {
    std::shared_lock lock(m_mutex);
    auto it = m_documents.find(id);
    if (it == m_documents.end()) {
        return std::nullopt;
    }
    return Document{it->first, it->second};
}

bool MemoryDocumentStore::Remove(const std::string& id) {
    std::unique_lock lock(m_mutex);
    return m_documents.erase(id) > 0;
}

void MemoryDocumentStore::Clear() {
    std::unique_lock lock(m_mutex);
    m_documents.clear();
}

size_t MemoryDocumentStore::Size() const {
    std::shared_lock lock(m_mutex);
    return m_documents.size();
}

std::expected<size_t, GeoError> MemoryDocumentStore::Import(const nlohmann::json& documents) {
    if (!documents.is_object()) {
        return std::unexpected(GeoError::InvalidInput(
            "document import expects an object keyed by id"));
    }

    std::unique_lock lock(m_mutex);
    for (const auto& [id, data] : documents.items()) {
        m_documents[id] = data;
    }
    NEARBY_LOG_DEBUG("Imported {} documents ({} total)", documents.size(), m_documents.size());
    return documents.size();
}

std::future<QueryResult> MemoryDocumentStore::QueryRange(const RangeQuery& query) {
    std::promise<QueryResult> promise;
    promise.set_value(Execute(query));
    return promise.get_future();
}

QueryResult MemoryDocumentStore::Execute(const RangeQuery& query) const {
    if (query.GetField().empty()) {
        return std::unexpected(GeoError::InvalidInput("range query without orderBy field"));
    }

    struct Match {
        std::string key;
        Document document;
    };
    std::vector<Match> matches;

    {
        std::shared_lock lock(m_mutex);
        for (const auto& [id, data] : m_documents) {
            const auto* field = JsonPath::Resolve(data, query.GetField());
            if (!field || !field->is_string()) {
                continue;
            }
            const auto& value = field->get_ref<const std::string&>();
            if (query.Matches(value)) {
                matches.push_back({value, Document{id, data}});
            }
        }
    }

    std::stable_sort(matches.begin(), matches.end(),
                     [](const Match& a, const Match& b) { return a.key < b.key; });

    if (query.GetLimit() > 0 && matches.size() > query.GetLimit()) {
        matches.resize(query.GetLimit());
    }

    std::vector<Document> documents;
    documents.reserve(matches.size());
    for (auto& match : matches) {
        documents.push_back(std::move(match.document));
    }

    NEARBY_LOG_TRACE("Range query {} matched {} documents", query.BuildQueryString(), documents.size());
    return documents;
}

} // namespace Nearby
