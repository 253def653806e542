// =================================================================
// src/Maestro/TaskStore.cpp
// =================================================================
// In-memory and JSON lines task stores.

#include "Maestro/TaskStore.hpp"
#include "Maestro/Logger.hpp"
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace Maestro {

// =================================================================
// InMemoryTaskStore
// =================================================================

void InMemoryTaskStore::saveTask(const Task& task) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_tasks.find(task.id) == m_tasks.end()) {
        m_order.push_back(task.id);
    }
    m_tasks[task.id] = task;
}

void InMemoryTaskStore::saveResult(const Result& result) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_results[result.task_id] = result;
}

std::vector<Task> InMemoryTaskStore::queryTasks(std::optional<TaskStatus> status_filter, size_t limit) {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<Task> tasks;
    for (const auto& id : m_order) {
        const Task& task = m_tasks.at(id);
        if (status_filter && task.status != *status_filter) {
            continue;
        }
        tasks.push_back(task);
        if (limit > 0 && tasks.size() >= limit) {
            break;
        }
    }
    return tasks;
}

std::optional<Result> InMemoryTaskStore::getResult(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_results.find(task_id);
    if (it == m_results.end()) {
        return std::nullopt;
    }
    return it->second;
}

// =================================================================
// JsonlTaskStore
// =================================================================

JsonlTaskStore::JsonlTaskStore(const std::string& path)
    : m_path(path) {
}

void JsonlTaskStore::saveTask(const Task& task) {
    appendLine("task", taskToJson(task));
}

void JsonlTaskStore::saveResult(const Result& result) {
    appendLine("result", resultToJson(result));
}

std::vector<Task> JsonlTaskStore::queryTasks(std::optional<TaskStatus> status_filter, size_t limit) {
    std::vector<std::string> order;
    std::map<std::string, Task> latest;

    for (const auto& line : readLines()) {
        if (line.value("kind", "") != "task") {
            continue;
        }
        Task task = taskFromJson(line.at("data"));
        if (latest.find(task.id) == latest.end()) {
            order.push_back(task.id);
        }
        latest[task.id] = task;
    }

    std::vector<Task> tasks;
    for (const auto& id : order) {
        const Task& task = latest.at(id);
        if (status_filter && task.status != *status_filter) {
            continue;
        }
        tasks.push_back(task);
        if (limit > 0 && tasks.size() >= limit) {
            break;
        }
    }
    return tasks;
}

std::optional<Result> JsonlTaskStore::getResult(const std::string& task_id) {
    std::optional<Result> found;
    for (const auto& line : readLines()) {
        if (line.value("kind", "") == "result" && line.at("data").value("task_id", "") == task_id) {
            found = resultFromJson(line.at("data"));
        }
    }
    return found;
}

void JsonlTaskStore::appendLine(const std::string& kind, const json& data) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::filesystem::path path(m_path);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw MaestroError(ErrorKind::UNAVAILABLE,
                               "Cannot create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream file(m_path, std::ios::app);
    if (!file.is_open()) {
        throw MaestroError(ErrorKind::UNAVAILABLE, "Cannot open " + m_path + " for appending");
    }

    json line = {{"kind", kind}, {"data", data}};
    file << line.dump() << '\n';
    if (!file) {
        throw MaestroError(ErrorKind::UNAVAILABLE, "Write to " + m_path + " failed");
    }
}

std::vector<json> JsonlTaskStore::readLines() {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<json> lines;

    if (!std::filesystem::exists(m_path)) {
        return lines;
    }

    std::ifstream file(m_path);
    if (!file.is_open()) {
        throw MaestroError(ErrorKind::UNAVAILABLE, "Cannot open " + m_path);
    }

    std::string text;
    size_t line_number = 0;
    while (std::getline(file, text)) {
        ++line_number;
        if (text.empty()) continue;

        try {
            lines.push_back(json::parse(text));
        } catch (const json::parse_error& e) {
            // A torn final write should not hide the rest of the history
            Logger::getInstance().warning("TaskStore", "Skipping malformed line " + std::to_string(line_number),
                                         m_path + ": " + e.what());
        }
    }
    return lines;
}

} // namespace Maestro
