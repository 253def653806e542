// =================================================================
// include/Maestro/Types.hpp
// =================================================================
// Core data model shared by the orchestration components: tasks, results,
// bus messages, capabilities, learning experiences and the error taxonomy.

#pragma once

#include "nlohmann/json.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <chrono>
#include <stdexcept>

namespace Maestro {

/**
 * @brief Error categories surfaced by the orchestration core
 */
enum class ErrorKind {
    NOT_FOUND,          ///< Unknown agent, chain or context id
    UNAVAILABLE,        ///< No capable worker, full queue, backend down
    TIMEOUT,            ///< Response or receive wait elapsed
    EXHAUSTED,          ///< Every fallback option failed
    INVALID_ARGUMENT,   ///< Malformed input or configuration
    INTERNAL            ///< Unexpected failure inside a component
};

/**
 * @brief Convert error kind to its display name
 * @param kind Error kind
 * @return Upper-case name such as "UNAVAILABLE"
 */
std::string errorKindToString(ErrorKind kind);

/**
 * @brief Base exception carrying an error kind
 */
class MaestroError : public std::runtime_error {
public:
    MaestroError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

/**
 * @brief Task lifecycle status
 */
enum class TaskStatus {
    PENDING,
    IN_PROGRESS,
    COMPLETED,
    FAILED
};

std::string taskStatusToString(TaskStatus status);
TaskStatus taskStatusFromString(const std::string& name);

/**
 * @brief Unit of work
 */
struct Task {
    std::string id;                               ///< Unique task identifier
    std::string description;                      ///< Free-text description
    std::vector<std::string> requirements;        ///< Ordered requirement tags
    int priority = 5;                             ///< Priority (higher = more urgent)
    std::string parent_task_id;                   ///< Parent id, empty for root tasks
    std::vector<std::string> child_task_ids;      ///< Ids of subtasks created from this task
    std::unordered_map<std::string, std::string> context; ///< Arbitrary context values
    TaskStatus status = TaskStatus::PENDING;      ///< Lifecycle status
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();
};

/**
 * @brief Outcome of one processed task
 */
struct Result {
    std::string task_id;                          ///< Task this result belongs to
    bool success = false;                         ///< Whether the task succeeded
    nlohmann::json payload;                       ///< Result body
    std::string error;                            ///< Error text when unsuccessful
    std::string agent_id;                         ///< Agent that produced the result
    double execution_time = 0.0;                  ///< Execution time in milliseconds
    double quality_score = 0.0;                   ///< Quality estimate (0.0-1.0)
    std::unordered_map<std::string, std::string> metadata; ///< Additional metadata
    std::chrono::system_clock::time_point created_at = std::chrono::system_clock::now();
};

/**
 * @brief Message categories carried by the bus
 */
enum class MessageType {
    REQUEST,
    RESPONSE,
    NOTIFICATION,
    BROADCAST,
    TASK_ASSIGNMENT,
    TASK_RESULT,
    ERROR,
    HEARTBEAT
};

std::string messageTypeToString(MessageType type);

/**
 * @brief Bus envelope
 */
struct Message {
    std::string id;                               ///< Unique message identifier
    std::string sender;                           ///< Sending agent id
    std::string recipient;                        ///< Recipient agent id, "*" for broadcast
    MessageType type = MessageType::NOTIFICATION; ///< Message category
    int priority = 5;                             ///< Delivery priority (higher first)
    nlohmann::json payload;                       ///< Message body
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::chrono::milliseconds ttl{0};             ///< Time to live, 0 = never expires
    std::string correlation_id;                   ///< Id of the request this answers
    bool requires_response = false;               ///< Whether the sender awaits a reply

    /**
     * @brief Check whether the message outlived its TTL
     * @param now Reference time
     * @return True if TTL is set and has elapsed
     */
    bool isExpired(std::chrono::system_clock::time_point now = std::chrono::system_clock::now()) const;
};

/**
 * @brief Named skill with a proficiency score
 */
struct AgentCapability {
    std::string name;                             ///< Capability name, matched against requirements
    std::string description;                      ///< Human readable description
    double proficiency = 0.0;                     ///< Proficiency (0.0-1.0)
};

/**
 * @brief One transition used by a learning engine
 */
struct Experience {
    nlohmann::json state;                         ///< State snapshot
    std::string action;                           ///< Action taken
    double reward = 0.0;                          ///< Observed reward
    nlohmann::json next_state;                    ///< Following state snapshot
    bool terminal = false;                        ///< Whether the episode ended
};

/**
 * @brief Generate a unique identifier
 * @param prefix Optional prefix joined with '_'
 * @return Identifier with a UUID v4 style body
 */
std::string generateId(const std::string& prefix = "");

/**
 * @brief Milliseconds since the epoch for a time point
 */
int64_t toEpochMillis(std::chrono::system_clock::time_point time_point);

/**
 * @brief Time point from milliseconds since the epoch
 */
std::chrono::system_clock::time_point fromEpochMillis(int64_t millis);

nlohmann::json taskToJson(const Task& task);
Task taskFromJson(const nlohmann::json& j);
nlohmann::json resultToJson(const Result& result);
Result resultFromJson(const nlohmann::json& j);
nlohmann::json messageToJson(const Message& message);

} // namespace Maestro
