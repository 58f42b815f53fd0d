#pragma once

#include "store/IDocumentStore.hpp"

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>

namespace Nearby {

/**
 * @brief In-process document collection
 *
 * Keeps documents keyed by id and answers range queries by resolving the
 * queried dot path on every document. Queries complete before QueryRange
 * returns. Safe for concurrent readers and writers.
 */
class MemoryDocumentStore : public IDocumentStore {
public:
    MemoryDocumentStore() = default;

    MemoryDocumentStore(const MemoryDocumentStore&) = delete;
    MemoryDocumentStore& operator=(const MemoryDocumentStore&) = delete;

    /**
     * @brief Insert or replace a document
     */
    void Put(const std::string& id, nlohmann::json data);

    [[nodiscard]] std::optional<Document> Get(const std::string& id) const;

    /**
     * @brief Remove a document
     * @return true if it existed
     */
    bool Remove(const std::string& id);

    void Clear();

    [[nodiscard]] size_t Size() const;

    /**
     * @brief Load documents from a JSON object keyed by id
     * @return InvalidInput if `documents` is not an object
     */
    [[nodiscard]] std::expected<size_t, GeoError> Import(const nlohmann::json& documents);

    [[nodiscard]] std::future<QueryResult> QueryRange(const RangeQuery& query) override;

private:
    [[nodiscard]] QueryResult Execute(const RangeQuery& query) const;

    std::map<std::string, nlohmann::json> m_documents;
    mutable std::shared_mutex m_mutex;
};

} // namespace Nearby
