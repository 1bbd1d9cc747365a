#include <regix/common/utf8_utils.h>
#include <regix/vector/embedding_function.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace regix::vector {

namespace {

uint64_t fnv1a(std::string_view data) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

void addFeature(std::vector<float>& embedding, std::string_view feature, float weight) {
    const uint64_t h = fnv1a(feature);
    const size_t bucket = static_cast<size_t>(h % embedding.size());
    // High bit picks the sign so unrelated features tend to cancel
    const float sign = (h >> 63) ? -1.0f : 1.0f;
    embedding[bucket] += sign * weight;
}

} // namespace

const char* providerToString(EmbeddingConfig::Provider provider) {
    switch (provider) {
        case EmbeddingConfig::Provider::Local:
            return "local";
        case EmbeddingConfig::Provider::OpenAI:
            return "openai";
        case EmbeddingConfig::Provider::Azure:
            return "azure";
    }
    return "unknown";
}

Result<EmbeddingConfig::Provider> parseProvider(const std::string& name) {
    const auto lower = common::toLowerAscii(name);
    if (lower == "local") {
        return EmbeddingConfig::Provider::Local;
    }
    if (lower == "openai") {
        return EmbeddingConfig::Provider::OpenAI;
    }
    if (lower == "azure") {
        return EmbeddingConfig::Provider::Azure;
    }
    return Error{ErrorCode::InvalidArgument, "Unknown embedding provider: " + name};
}

HashingEmbeddingFunction::HashingEmbeddingFunction(size_t dimension, bool normalize)
    : dimension_(dimension == 0 ? 1 : dimension), normalize_(normalize) {
    spdlog::debug("HashingEmbeddingFunction created with dimension {}", dimension_);
}

Result<std::vector<float>> HashingEmbeddingFunction::embed(const std::string& text) {
    std::vector<float> embedding(dimension_, 0.0f);
    const std::string lower = common::toLowerAscii(text);

    for (const auto& token : common::splitWhitespace(lower)) {
        addFeature(embedding, token, 1.0f);
        if (token.size() >= 3) {
            for (size_t i = 0; i + 3 <= token.size(); ++i) {
                addFeature(embedding, std::string_view(token).substr(i, 3), 0.25f);
            }
        }
    }

    if (normalize_) {
        embedding = embedding_utils::normalizeEmbedding(embedding);
    }
    return embedding;
}

Result<std::unique_ptr<IEmbeddingFunction>>
createEmbeddingFunction(const EmbeddingConfig& config) {
    switch (config.provider) {
        case EmbeddingConfig::Provider::Local:
            return std::unique_ptr<IEmbeddingFunction>(std::make_unique<HashingEmbeddingFunction>(
                config.embedding_dim, config.normalize_embeddings));
        case EmbeddingConfig::Provider::OpenAI:
        case EmbeddingConfig::Provider::Azure:
            spdlog::warn("Embedding provider '{}' is not available in this build",
                         providerToString(config.provider));
            return Error{ErrorCode::NotSupported,
                         std::string("Embedding provider not available: ") +
                             providerToString(config.provider)};
    }
    return Error{ErrorCode::InvalidArgument, "Unknown embedding provider"};
}

namespace embedding_utils {

std::vector<float> normalizeEmbedding(const std::vector<float>& embedding) {
    double norm = 0.0;
    for (float v : embedding) {
        norm += static_cast<double>(v) * v;
    }
    norm = std::sqrt(norm);
    if (norm <= 0.0) {
        return embedding;
    }
    std::vector<float> out(embedding.size());
    for (size_t i = 0; i < embedding.size(); ++i) {
        out[i] = static_cast<float>(embedding[i] / norm);
    }
    return out;
}

Result<float> cosineDistance(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size()) {
        return Error{ErrorCode::InvalidArgument, "Embedding dimension mismatch: " +
                                                     std::to_string(a.size()) + " vs " +
                                                     std::to_string(b.size())};
    }
    double dot = 0.0;
    double na = 0.0;
    double nb = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na <= 0.0 || nb <= 0.0) {
        return 1.0f; // Orthogonal by convention
    }
    double similarity = dot / (std::sqrt(na) * std::sqrt(nb));
    similarity = std::max(-1.0, std::min(1.0, similarity));
    return static_cast<float>(1.0 - similarity);
}

} // namespace embedding_utils

} // namespace regix::vector
