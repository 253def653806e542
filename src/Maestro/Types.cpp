// =================================================================
// src/Maestro/Types.cpp
// =================================================================
// Helpers for the core data model: names, ids and JSON conversion.

#include "Maestro/Types.hpp"
#include <random>
#include <sstream>
#include <mutex>

using json = nlohmann::json;

namespace Maestro {

std::string errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND: return "NOT_FOUND";
        case ErrorKind::UNAVAILABLE: return "UNAVAILABLE";
        case ErrorKind::TIMEOUT: return "TIMEOUT";
        case ErrorKind::EXHAUSTED: return "EXHAUSTED";
        case ErrorKind::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case ErrorKind::INTERNAL: return "INTERNAL";
        default: return "UNKNOWN";
    }
}

MaestroError::MaestroError(ErrorKind kind, const std::string& message)
    : std::runtime_error(errorKindToString(kind) + ": " + message), m_kind(kind) {
}

std::string taskStatusToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::PENDING: return "pending";
        case TaskStatus::IN_PROGRESS: return "in_progress";
        case TaskStatus::COMPLETED: return "completed";
        case TaskStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

TaskStatus taskStatusFromString(const std::string& name) {
    if (name == "in_progress") return TaskStatus::IN_PROGRESS;
    if (name == "completed") return TaskStatus::COMPLETED;
    if (name == "failed") return TaskStatus::FAILED;
    return TaskStatus::PENDING;
}

std::string messageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::REQUEST: return "request";
        case MessageType::RESPONSE: return "response";
        case MessageType::NOTIFICATION: return "notification";
        case MessageType::BROADCAST: return "broadcast";
        case MessageType::TASK_ASSIGNMENT: return "task_assignment";
        case MessageType::TASK_RESULT: return "task_result";
        case MessageType::ERROR: return "error";
        case MessageType::HEARTBEAT: return "heartbeat";
        default: return "unknown";
    }
}

bool Message::isExpired(std::chrono::system_clock::time_point now) const {
    if (ttl.count() <= 0) {
        return false;
    }
    return now - timestamp > ttl;
}

std::string generateId(const std::string& prefix) {
    static std::mutex gen_mutex;
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);
    static std::uniform_int_distribution<> dis2(8, 11);

    std::lock_guard<std::mutex> lock(gen_mutex);

    std::stringstream ss;
    if (!prefix.empty()) {
        ss << prefix << "_";
    }
    ss << std::hex;
    for (int i = 0; i < 8; i++) {
        ss << dis(gen);
    }
    ss << "-";
    for (int i = 0; i < 4; i++) {
        ss << dis(gen);
    }
    ss << "-4";
    for (int i = 0; i < 3; i++) {
        ss << dis(gen);
    }
    ss << "-";
    ss << dis2(gen);
    for (int i = 0; i < 3; i++) {
        ss << dis(gen);
    }
    ss << "-";
    for (int i = 0; i < 12; i++) {
        ss << dis(gen);
    }
    return ss.str();
}

int64_t toEpochMillis(std::chrono::system_clock::time_point time_point) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        time_point.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromEpochMillis(int64_t millis) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(millis));
}

json taskToJson(const Task& task) {
    json j;
    j["id"] = task.id;
    j["description"] = task.description;
    j["requirements"] = task.requirements;
    j["priority"] = task.priority;
    j["parent_task_id"] = task.parent_task_id;
    j["child_task_ids"] = task.child_task_ids;
    j["context"] = task.context;
    j["status"] = taskStatusToString(task.status);
    j["created_at"] = toEpochMillis(task.created_at);
    return j;
}

Task taskFromJson(const json& j) {
    Task task;
    task.id = j.value("id", "");
    task.description = j.value("description", "");
    task.requirements = j.value("requirements", std::vector<std::string>());
    task.priority = j.value("priority", 5);
    task.parent_task_id = j.value("parent_task_id", "");
    task.child_task_ids = j.value("child_task_ids", std::vector<std::string>());
    task.context = j.value("context", std::unordered_map<std::string, std::string>());
    task.status = taskStatusFromString(j.value("status", "pending"));
    if (j.contains("created_at")) {
        task.created_at = fromEpochMillis(j["created_at"].get<int64_t>());
    }
    return task;
}

json resultToJson(const Result& result) {
    json j;
    j["task_id"] = result.task_id;
    j["success"] = result.success;
    j["payload"] = result.payload;
    j["error"] = result.error;
    j["agent_id"] = result.agent_id;
    j["execution_time"] = result.execution_time;
    j["quality_score"] = result.quality_score;
    j["metadata"] = result.metadata;
    j["created_at"] = toEpochMillis(result.created_at);
    return j;
}

Result resultFromJson(const json& j) {
    Result result;
    result.task_id = j.value("task_id", "");
    result.success = j.value("success", false);
    if (j.contains("payload")) {
        result.payload = j["payload"];
    }
    result.error = j.value("error", "");
    result.agent_id = j.value("agent_id", "");
    result.execution_time = j.value("execution_time", 0.0);
    result.quality_score = j.value("quality_score", 0.0);
    result.metadata = j.value("metadata", std::unordered_map<std::string, std::string>());
    if (j.contains("created_at")) {
        result.created_at = fromEpochMillis(j["created_at"].get<int64_t>());
    }
    return result;
}

json messageToJson(const Message& message) {
    json j;
    j["id"] = message.id;
    j["sender"] = message.sender;
    j["recipient"] = message.recipient;
    j["type"] = messageTypeToString(message.type);
    j["priority"] = message.priority;
    j["payload"] = message.payload;
    j["timestamp"] = toEpochMillis(message.timestamp);
    j["ttl_ms"] = message.ttl.count();
    j["correlation_id"] = message.correlation_id;
    j["requires_response"] = message.requires_response;
    return j;
}

} // namespace Maestro
