// =================================================================
// include/Maestro/ReasoningBackend.hpp
// =================================================================
// Interface to the text-generation backend workers may call, plus an
// Ollama HTTP implementation.

#pragma once

#include <string>
#include <chrono>
#include <atomic>

namespace Maestro {

/**
 * @brief Reply from a reasoning backend
 */
struct ReasoningReply {
    std::string text;                             ///< Generated text
    bool ok = false;                              ///< False when the backend could not answer
};

/**
 * @brief Text generation used by worker bodies
 *
 * Implementations never throw; any failure is reported as ok=false.
 */
class ReasoningBackend {
public:
    virtual ~ReasoningBackend() = default;

    /**
     * @brief Generate text
     * @param prompt User prompt
     * @param system_prompt System instructions, may be empty
     * @return Reply, ok=false when generation failed
     */
    virtual ReasoningReply generate(const std::string& prompt, const std::string& system_prompt) = 0;

    /**
     * @brief Backend name for logs
     */
    virtual std::string getName() const = 0;
};

/**
 * @brief Ollama server configuration
 */
struct OllamaConfig {
    std::string server_url = "http://localhost:11434"; ///< Base URL of the server
    std::string model_name = "llama3:latest";     ///< Model to generate with
    std::chrono::seconds connection_timeout{5};   ///< Connect timeout
    std::chrono::seconds read_timeout{120};       ///< Generation timeout
};

/**
 * @brief Reasoning backend posting to an Ollama server's /api/generate
 */
class OllamaReasoningBackend : public ReasoningBackend {
public:
    explicit OllamaReasoningBackend(const OllamaConfig& config);

    ReasoningReply generate(const std::string& prompt, const std::string& system_prompt) override;
    std::string getName() const override;

    size_t getFailureCount() const { return m_failures.load(); }

private:
    OllamaConfig m_config;
    std::atomic<size_t> m_failures{0};
};

} // namespace Maestro
