#pragma once

#include <regix/core/types.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace regix::vector {

/**
 * Configuration for the query embedding provider
 */
struct EmbeddingConfig {
    enum class Provider {
        Local,  // In-process hashing embedder
        OpenAI, // OpenAI embeddings endpoint
        Azure   // Azure OpenAI deployment
    };
    Provider provider = Provider::Local;

    std::string model_name = "text-embedding-3-small";
    size_t embedding_dim = 384;
    bool normalize_embeddings = true;

    // Remote provider settings
    std::string endpoint;
    std::string api_key;
    std::string deployment;
    std::string api_version = "2024-02-15-preview";
};

const char* providerToString(EmbeddingConfig::Provider provider);
Result<EmbeddingConfig::Provider> parseProvider(const std::string& name);

/**
 * @brief Capability interface for turning text into an embedding
 *
 * Implementations must be safe to call concurrently from sub-search tasks.
 */
class IEmbeddingFunction {
public:
    virtual ~IEmbeddingFunction() = default;

    virtual Result<std::vector<float>> embed(const std::string& text) = 0;

    virtual size_t dimension() const = 0;
    virtual std::string name() const = 0;
};

/**
 * Deterministic local embedder based on feature hashing of lower-cased word tokens
 * and character trigrams. Texts sharing vocabulary land close in cosine space, which is
 * enough for local corpora and tests without a model runtime.
 */
class HashingEmbeddingFunction final : public IEmbeddingFunction {
public:
    explicit HashingEmbeddingFunction(size_t dimension = 384, bool normalize = true);

    Result<std::vector<float>> embed(const std::string& text) override;

    size_t dimension() const override { return dimension_; }
    std::string name() const override { return "local-hashing"; }

private:
    size_t dimension_;
    bool normalize_;
};

/**
 * Factory selecting the provider at construction time. Remote providers are not
 * compiled into this build and report NotSupported.
 */
Result<std::unique_ptr<IEmbeddingFunction>> createEmbeddingFunction(const EmbeddingConfig& config);

namespace embedding_utils {
/**
 * Normalize embedding to unit length (zero vectors are returned unchanged)
 */
std::vector<float> normalizeEmbedding(const std::vector<float>& embedding);

/**
 * Cosine distance in [0, 2]; InvalidArgument on dimension mismatch
 */
Result<float> cosineDistance(const std::vector<float>& a, const std::vector<float>& b);
} // namespace embedding_utils

} // namespace regix::vector
