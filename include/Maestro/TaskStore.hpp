// =================================================================
// include/Maestro/TaskStore.hpp
// =================================================================
// Persistence interface for tasks and results, with an in-memory store
// and an append-only JSON lines store.

#pragma once

#include "Maestro/Types.hpp"
#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>

namespace Maestro {

/**
 * @brief Task and result persistence
 *
 * Callers treat every method as fire-and-forget; implementations report
 * failures by throwing MaestroError(UNAVAILABLE).
 */
class TaskStore {
public:
    virtual ~TaskStore() = default;

    virtual void saveTask(const Task& task) = 0;
    virtual void saveResult(const Result& result) = 0;

    /**
     * @brief List stored tasks
     * @param status_filter Only tasks with this status when set
     * @param limit Maximum tasks returned, 0 for all
     * @return Tasks in order of first save
     */
    virtual std::vector<Task> queryTasks(std::optional<TaskStatus> status_filter, size_t limit) = 0;
};

/**
 * @brief Task store kept in process memory
 */
class InMemoryTaskStore : public TaskStore {
public:
    void saveTask(const Task& task) override;
    void saveResult(const Result& result) override;
    std::vector<Task> queryTasks(std::optional<TaskStatus> status_filter, size_t limit) override;

    std::optional<Result> getResult(const std::string& task_id) const;

private:
    std::vector<std::string> m_order;
    std::map<std::string, Task> m_tasks;
    std::map<std::string, Result> m_results;
    mutable std::mutex m_mutex;
};

/**
 * @brief Task store appending one JSON document per line
 *
 * Each line is {"kind":"task"|"result","data":{...}}. When reading, the
 * last line written for an id wins.
 */
class JsonlTaskStore : public TaskStore {
public:
    /**
     * @brief Constructor
     * @param path File to append to, created on first save
     */
    explicit JsonlTaskStore(const std::string& path);

    void saveTask(const Task& task) override;
    void saveResult(const Result& result) override;
    std::vector<Task> queryTasks(std::optional<TaskStatus> status_filter, size_t limit) override;

    std::optional<Result> getResult(const std::string& task_id);

    const std::string& getPath() const { return m_path; }

private:
    std::string m_path;
    std::mutex m_mutex;

    void appendLine(const std::string& kind, const nlohmann::json& data);
    std::vector<nlohmann::json> readLines();
};

} // namespace Maestro
