// =================================================================
// src/Maestro/SemanticMemory.cpp
// =================================================================
// Implementation of the hash embedding and similarity-ranked memory.

#include "Maestro/SemanticMemory.hpp"
#include "Maestro/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>

namespace Maestro {

namespace {

uint64_t fnv1a(const std::string& token) {
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : token) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    return hash;
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            current += static_cast<char>(std::tolower(c));
        } else if (!current.empty()) {
            tokens.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(current);
    }
    return tokens;
}

double contextOverlap(const std::unordered_map<std::string, std::string>& entry_context,
                      const std::unordered_map<std::string, std::string>& query_context) {
    if (query_context.empty()) {
        return 0.0;
    }
    size_t matches = 0;
    for (const auto& [key, value] : query_context) {
        auto it = entry_context.find(key);
        if (it != entry_context.end() && it->second == value) {
            matches++;
        }
    }
    return static_cast<double>(matches) / query_context.size();
}

} // anonymous namespace

HashEmbeddingModel::HashEmbeddingModel(size_t dimension)
    : m_dimension(dimension == 0 ? 1 : dimension) {
}

std::vector<float> HashEmbeddingModel::embed(const std::string& text) const {
    std::vector<float> vector(m_dimension, 0.0f);
    for (const auto& token : tokenize(text)) {
        uint64_t hash = fnv1a(token);
        size_t index = hash % m_dimension;
        float sign = ((hash >> 32) & 1) ? 1.0f : -1.0f;
        vector[index] += sign;
    }

    double norm = 0.0;
    for (float v : vector) {
        norm += static_cast<double>(v) * v;
    }
    norm = std::sqrt(norm);
    if (norm > 0.0) {
        for (float& v : vector) {
            v = static_cast<float>(v / norm);
        }
    }
    return vector;
}

double cosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
    size_t n = std::min(a.size(), b.size());
    double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
    for (size_t i = 0; i < n; ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }
    if (norm_a == 0.0 || norm_b == 0.0) {
        return 0.0;
    }
    return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

SemanticMemory::SemanticMemory(const SemanticMemoryConfig& config, std::shared_ptr<EmbeddingModel> model)
    : m_config(config), m_model(std::move(model)) {
    if (!m_model) {
        m_model = std::make_shared<HashEmbeddingModel>(m_config.embedding_dimension);
    }
}

void SemanticMemory::store(const std::string& key, const std::string& content,
                           const std::unordered_map<std::string, std::string>& context,
                           double importance) {
    std::vector<float> embedding = m_model->embed(content);

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_entries.count(key) == 0 && m_entries.size() >= m_config.capacity) {
        evictLocked();
    }

    SemanticEntry entry;
    entry.key = key;
    entry.content = content;
    entry.context = context;
    entry.importance = std::clamp(importance, 0.0, 1.0);
    entry.embedding = std::move(embedding);
    m_entries[key] = std::move(entry);
}

std::vector<SemanticMatch> SemanticMemory::retrieve(const std::string& query, size_t top_k,
                                                    const std::unordered_map<std::string, std::string>& query_context) {
    std::vector<float> query_embedding = m_model->embed(query);

    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::pair<SemanticMatch, SemanticEntry*>> scored;

    for (auto& [key, entry] : m_entries) {
        double similarity = cosineSimilarity(query_embedding, entry.embedding);
        if (similarity < m_config.minimum_similarity) {
            continue;
        }

        double base = similarity;
        if (!query_context.empty()) {
            base = 0.6 * similarity + 0.4 * contextOverlap(entry.context, query_context);
        }

        SemanticMatch match;
        match.key = key;
        match.content = entry.content;
        match.similarity = similarity;
        match.score = base * (1.0 + 0.1 * entry.importance) +
                      0.01 * static_cast<double>(std::min<size_t>(entry.access_count, 10));
        scored.emplace_back(std::move(match), &entry);
    }

    std::sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        if (a.first.score != b.first.score) {
            return a.first.score > b.first.score;
        }
        return a.first.key < b.first.key;
    });

    std::vector<SemanticMatch> results;
    for (size_t i = 0; i < scored.size() && i < top_k; ++i) {
        scored[i].second->access_count++;
        results.push_back(scored[i].first);
    }
    return results;
}

bool SemanticMemory::forget(const std::string& key) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.erase(key) > 0;
}

size_t SemanticMemory::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

void SemanticMemory::evictLocked() {
    if (m_entries.empty()) {
        return;
    }

    auto victim = m_entries.end();
    double lowest = 0.0;
    for (auto it = m_entries.begin(); it != m_entries.end(); ++it) {
        double retention = it->second.importance + it->second.access_count / 100.0;
        if (victim == m_entries.end() || retention < lowest ||
            (retention == lowest && it->first < victim->first)) {
            victim = it;
            lowest = retention;
        }
    }

    Logger::getInstance().debug("SemanticMemory", "Evicted entry " + victim->first);
    m_entries.erase(victim);
}

} // namespace Maestro
