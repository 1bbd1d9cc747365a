#include <regix/search/document_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <mutex>
#include <unordered_set>

namespace regix::search {

using json = nlohmann::json;

Result<void> InMemoryDocumentStore::addDocument(Document document) {
    if (document.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Document id must not be empty"};
    }

    std::unique_lock lock(mutex_);
    auto it = std::find_if(documents_.begin(), documents_.end(),
                           [&](const Document& d) { return d.id == document.id; });
    if (it != documents_.end()) {
        *it = std::move(document);
    } else {
        documents_.push_back(std::move(document));
    }
    return Result<void>();
}

Result<std::vector<Document>> InMemoryDocumentStore::getAll(const MetadataFilter* filter) {
    std::shared_lock lock(mutex_);
    if (!filter || !filter->hasFilters()) {
        return documents_;
    }
    std::vector<Document> out;
    for (const auto& doc : documents_) {
        if (filter->matches(doc.id, doc.metadata)) {
            out.push_back(doc);
        }
    }
    return out;
}

size_t InMemoryDocumentStore::size() const {
    std::shared_lock lock(mutex_);
    return documents_.size();
}

namespace {

std::string metadataValueToString(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return {};
    }
    return value.dump();
}

} // namespace

Result<std::vector<CorpusEntry>> loadCorpusFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::NotFound, "Cannot open corpus file: " + path.string()};
    }

    json root;
    try {
        in >> root;
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::InvalidData,
                     "Corpus file " + path.string() + " is not valid JSON: " + e.what()};
    }

    const json* items = &root;
    if (root.is_object() && root.contains("documents")) {
        items = &root["documents"];
    }
    if (!items->is_array()) {
        return Error{ErrorCode::InvalidData, "Corpus must be a JSON array of documents"};
    }

    std::vector<CorpusEntry> entries;
    entries.reserve(items->size());
    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < items->size(); ++i) {
        const json& item = (*items)[i];
        if (!item.is_object() || !item.contains("id") || !item["id"].is_string()) {
            return Error{ErrorCode::InvalidData,
                         "Corpus entry " + std::to_string(i) + " has no string 'id'"};
        }

        CorpusEntry entry;
        entry.document.id = item["id"].get<std::string>();
        if (!seen.insert(entry.document.id).second) {
            return Error{ErrorCode::InvalidData, "Duplicate document id: " + entry.document.id};
        }
        if (auto it = item.find("content"); it != item.end() && it->is_string()) {
            entry.document.content = it->get<std::string>();
        }
        if (auto it = item.find("metadata"); it != item.end() && it->is_object()) {
            for (const auto& [key, value] : it->items()) {
                entry.document.metadata[key] = metadataValueToString(value);
            }
        }
        if (auto it = item.find("embedding"); it != item.end() && it->is_array()) {
            try {
                entry.embedding = it->get<std::vector<float>>();
            } catch (const json::exception& e) {
                return Error{ErrorCode::InvalidData, "Invalid embedding for '" +
                                                         entry.document.id + "': " + e.what()};
            }
        }
        entries.push_back(std::move(entry));
    }

    spdlog::info("Loaded {} documents from {}", entries.size(), path.string());
    return entries;
}

} // namespace regix::search
