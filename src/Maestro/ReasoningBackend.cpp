// =================================================================
// src/Maestro/ReasoningBackend.cpp
// =================================================================
// Ollama implementation of the reasoning backend.

#include "Maestro/ReasoningBackend.hpp"
#include "Maestro/Logger.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"
#include <sstream>

namespace Maestro {

OllamaReasoningBackend::OllamaReasoningBackend(const OllamaConfig& config)
    : m_config(config) {
    Logger::getInstance().info("Reasoning", "Configured Ollama backend for server: " + m_config.server_url,
                              "Model: " + m_config.model_name);
}

ReasoningReply OllamaReasoningBackend::generate(const std::string& prompt, const std::string& system_prompt) {
    ReasoningReply reply;

    try {
        httplib::Client client(m_config.server_url);
        client.set_connection_timeout(static_cast<time_t>(m_config.connection_timeout.count()), 0);
        client.set_read_timeout(static_cast<time_t>(m_config.read_timeout.count()), 0);

        nlohmann::json request_body = {
            {"model", m_config.model_name},
            {"prompt", prompt},
            {"stream", false}
        };
        if (!system_prompt.empty()) {
            request_body["system"] = system_prompt;
        }

        auto res = client.Post("/api/generate", request_body.dump(), "application/json");

        if (!res) {
            m_failures.fetch_add(1);
            Logger::getInstance().warning("Reasoning", "Failed to connect to Ollama server at " +
                                         m_config.server_url,
                                         "httplib error " + std::to_string(static_cast<int>(res.error())));
            return reply;
        }

        if (res->status != 200) {
            m_failures.fetch_add(1);
            Logger::getInstance().warning("Reasoning", "Ollama server returned error status: " +
                                         std::to_string(res->status), res->body);
            return reply;
        }

        // Non-streaming replies are one JSON object; tolerate newline-delimited chunks as well
        std::istringstream response_stream(res->body);
        std::string line;
        while (std::getline(response_stream, line)) {
            if (line.empty()) continue;

            auto json_chunk = nlohmann::json::parse(line);
            if (json_chunk.contains("response") && json_chunk["response"].is_string()) {
                reply.text += json_chunk["response"].get<std::string>();
            }
        }

        reply.ok = !reply.text.empty();
        if (!reply.ok) {
            m_failures.fetch_add(1);
            Logger::getInstance().warning("Reasoning", "Ollama returned an empty response");
        }

    } catch (const std::exception& e) {
        m_failures.fetch_add(1);
        reply.text.clear();
        reply.ok = false;
        Logger::getInstance().warning("Reasoning", "Generation failed: " + std::string(e.what()));
    }

    return reply;
}

std::string OllamaReasoningBackend::getName() const {
    return "ollama:" + m_config.model_name;
}

} // namespace Maestro
