#include "utils/JsonPath.hpp"
#include "utils/StringUtils.hpp"

namespace Nearby {

namespace JsonPath {

const nlohmann::json* Resolve(const nlohmann::json& document, std::string_view path) {
    if (path.empty()) {
        return nullptr;
    }

    const nlohmann::json* current = &document;
    for (const auto& part : StringUtils::Split(path, '.')) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(part);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
    }
    return current;
}

nlohmann::json* ResolveOrCreate(nlohmann::json& document, std::string_view path) {
    if (path.empty()) {
        return nullptr;
    }
    if (document.is_null()) {
        document = nlohmann::json::object();
    }

    nlohmann::json* current = &document;
    for (const auto& part : StringUtils::Split(path, '.')) {
        if (current->is_null()) {
            *current = nlohmann::json::object();
        }
        if (!current->is_object()) {
            return nullptr;
        }
        current = &(*current)[part];
    }
    return current;
}

} // namespace JsonPath

} // namespace Nearby
