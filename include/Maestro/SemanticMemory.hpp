// =================================================================
// include/Maestro/SemanticMemory.hpp
// =================================================================
// Vector-similarity memory behind a pluggable embedding interface.

#pragma once

#include <string>
#include <memory>
#include <vector>
#include <unordered_map>
#include <chrono>
#include <mutex>

namespace Maestro {

/**
 * @brief Text to fixed-length unit vector
 */
class EmbeddingModel {
public:
    virtual ~EmbeddingModel() = default;

    /**
     * @brief Embed a text
     * @param text Input text
     * @return Vector of length dimension(), unit length unless the text has no tokens
     */
    virtual std::vector<float> embed(const std::string& text) const = 0;

    virtual size_t dimension() const = 0;
};

/**
 * @brief Deterministic token-hashing embedding
 */
class HashEmbeddingModel : public EmbeddingModel {
public:
    explicit HashEmbeddingModel(size_t dimension = 128);

    std::vector<float> embed(const std::string& text) const override;
    size_t dimension() const override { return m_dimension; }

private:
    size_t m_dimension;
};

/**
 * @brief Cosine similarity of two vectors, 0 when either is all zeros
 */
double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);

/**
 * @brief Stored semantic entry
 */
struct SemanticEntry {
    std::string key;
    std::string content;
    std::unordered_map<std::string, std::string> context; ///< Attributes matched against query context
    double importance = 0.5;
    std::vector<float> embedding;
    size_t access_count = 0;
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();
};

/**
 * @brief One retrieval hit
 */
struct SemanticMatch {
    std::string key;
    std::string content;
    double similarity = 0.0;                      ///< Cosine similarity to the query
    double score = 0.0;                           ///< Final ranking score
};

/**
 * @brief Semantic memory configuration
 */
struct SemanticMemoryConfig {
    size_t capacity = 1000;                       ///< Maximum stored entries
    double minimum_similarity = 0.0;              ///< Hits below this cosine similarity are dropped
    size_t embedding_dimension = 128;             ///< Dimension of the default hash embedding
};

/**
 * @brief Similarity-ranked memory
 */
class SemanticMemory {
public:
    /**
     * @brief Constructor
     * @param config Memory configuration
     * @param model Embedding model, a HashEmbeddingModel when null
     */
    explicit SemanticMemory(const SemanticMemoryConfig& config = SemanticMemoryConfig(),
                            std::shared_ptr<EmbeddingModel> model = nullptr);

    virtual ~SemanticMemory() = default;

    /**
     * @brief Store or replace an entry, evicting the weakest one when full
     */
    virtual void store(const std::string& key, const std::string& content,
                       const std::unordered_map<std::string, std::string>& context = {},
                       double importance = 0.5);

    /**
     * @brief Rank entries against a query
     * @param query Query text
     * @param top_k Maximum hits
     * @param query_context Attributes blended 60/40 with cosine similarity when non-empty
     * @return Hits, best first
     */
    virtual std::vector<SemanticMatch> retrieve(const std::string& query, size_t top_k = 5,
                                                const std::unordered_map<std::string, std::string>& query_context = {});

    bool forget(const std::string& key);

    size_t size() const;

private:
    SemanticMemoryConfig m_config;
    std::shared_ptr<EmbeddingModel> m_model;
    std::unordered_map<std::string, SemanticEntry> m_entries;
    mutable std::mutex m_mutex;

    void evictLocked();
};

} // namespace Maestro
