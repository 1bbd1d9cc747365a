#include <regix/common/utf8_utils.h>
#include <regix/search/search_types.h>

namespace regix::search {

Result<SearchMethod> parseSearchMethod(std::string_view name) {
    const std::string lower = common::toLowerAscii(name);
    for (auto method : allSearchMethods()) {
        if (lower == searchMethodToString(method)) {
            return method;
        }
    }
    return Error{ErrorCode::UnknownMethod, "Unknown search method: '" + std::string(name) + "'"};
}

std::vector<SearchMethod> allSearchMethods() {
    return {SearchMethod::VECTOR_ONLY, SearchMethod::KEYWORD_ONLY, SearchMethod::HYBRID,
            SearchMethod::MULTI_MODAL, SearchMethod::ADAPTIVE};
}

std::string documentFilename(const Metadata& metadata) {
    if (auto it = metadata.find("filename"); it != metadata.end()) {
        return it->second;
    }
    if (auto it = metadata.find("source"); it != metadata.end()) {
        return it->second;
    }
    return {};
}

std::string documentSource(const Metadata& metadata) {
    for (const char* key : {"source_file", "source", "filename"}) {
        if (auto it = metadata.find(key); it != metadata.end() && !it->second.empty()) {
            return it->second;
        }
    }
    return "unknown";
}

} // namespace regix::search
