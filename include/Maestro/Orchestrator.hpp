// =================================================================
// include/Maestro/Orchestrator.hpp
// =================================================================
// Top-level coordinator: analyzes, decomposes, delegates, executes in
// parallel over the message bus and synthesizes subtask results.

#pragma once

#include "Maestro/Types.hpp"
#include "Maestro/Agent.hpp"
#include "Maestro/MessageBus.hpp"
#include "Maestro/LoadBalancer.hpp"
#include "Maestro/ScalingStrategy.hpp"
#include "Maestro/WorkerEndpoint.hpp"
#include "Maestro/TaskStore.hpp"
#include "Maestro/QLearningEngine.hpp"
#include "Maestro/QualityVerifier.hpp"
#include <string>
#include <memory>
#include <vector>
#include <unordered_map>
#include <deque>
#include <optional>
#include <future>
#include <chrono>
#include <mutex>
#include <shared_mutex>
#include <atomic>

namespace Maestro {

/**
 * @brief Orchestrator configuration
 */
struct OrchestratorConfig {
    std::string orchestrator_id = "orchestrator"; ///< Sender id on the bus
    std::chrono::milliseconds subtask_timeout{30000}; ///< Wait for one subtask result
    size_t max_tasks_per_worker = 4;              ///< In-flight subtasks that count as full load
    double decomposition_threshold = 0.5;         ///< Normalized complexity above which tasks split
    double complexity_normalizer = 12.0;          ///< Raw score mapped to 1.0
    bool enable_learning = true;                  ///< Feed outcomes to the learning engine
    size_t stage_history_limit = 1000;            ///< Finished tasks whose stage stays queryable
    size_t quality_window = 100;                  ///< Recent task qualities kept for the trend
};

/**
 * @brief Processing stages of a task
 */
enum class TaskStage {
    RECEIVED,
    ANALYZED,
    DECOMPOSED,
    NOT_DECOMPOSED,
    DELEGATED,
    EXECUTING,
    SYNTHESIZED
};

std::string taskStageToString(TaskStage stage);

/**
 * @brief Orchestrator counters
 */
struct OrchestratorStatistics {
    size_t total_tasks = 0;
    size_t simple_tasks = 0;
    size_t moderate_tasks = 0;
    size_t complex_tasks = 0;
    size_t very_complex_tasks = 0;
    size_t successful_tasks = 0;                  ///< Every subtask succeeded
    size_t partial_tasks = 0;                     ///< Some subtasks succeeded
    size_t failed_tasks = 0;                      ///< No subtask succeeded
    size_t total_subtasks = 0;
    double average_agents_per_task = 0.0;
    double average_quality = 0.0;
};

/**
 * @brief Direction of recent task quality
 */
struct QualityTrend {
    size_t samples = 0;
    double average = 0.0;
    double minimum = 0.0;
    double maximum = 0.0;
    std::string direction = "stable";             ///< improving, declining, stable or insufficient_data
};

/**
 * @brief Snapshot of one registered worker
 */
struct WorkerStatus {
    std::string agent_id;
    std::string type;
    bool busy = false;
    size_t completed = 0;
    size_t failed = 0;
    double performance_score = 1.0;
    double success_rate = 1.0;
    double load = 0.0;
};

/**
 * @brief Planned assignment of one subtask
 */
struct Delegation {
    Task subtask;
    std::string agent_id;                         ///< Empty when no worker could take it
    double score = 0.0;
};

/**
 * @brief Coordinates worker agents to process tasks
 *
 * Workers are served by their own WorkerEndpoint; subtasks reach them as
 * TASK_ASSIGNMENT messages. processTask never throws: failures of any
 * subtask are captured in the synthesized Result.
 */
class Orchestrator {
public:
    /**
     * @brief Constructor
     * @param bus Message bus shared with the workers
     * @param load_balancer Load tracker for workers
     * @param config Orchestrator configuration
     * @param scaling Complexity weights and thresholds
     */
    Orchestrator(MessageBus& bus, LoadBalancer& load_balancer,
                 const OrchestratorConfig& config = OrchestratorConfig(),
                 const ScalingConfig& scaling = ScalingConfig());

    /**
     * @brief Destructor, stops every worker endpoint
     */
    virtual ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Add a worker and start serving it on the bus
     * @param agent Worker agent
     * @return False if the id is already in use
     */
    virtual bool registerWorker(std::shared_ptr<Agent> agent);

    size_t getWorkerCount() const;

    void setTaskStore(std::shared_ptr<TaskStore> store);
    void setLearningEngine(std::shared_ptr<QLearningEngine> engine);

    /**
     * @brief Verify every subtask result before synthesis
     *
     * Reports land in the combined payload under "verification"; the
     * metadata gains verification_score and verification_passed. Scores
     * never change whether a task succeeded.
     */
    void setQualityVerifier(std::shared_ptr<QualityVerifier> verifier);

    /**
     * @brief Accept a task for later processing
     * @return Task id
     */
    std::string submitTask(const std::string& description, const std::vector<std::string>& requirements,
                           int priority = 5,
                           const std::unordered_map<std::string, std::string>& context = {});

    /**
     * @brief Process a task accepted by submitTask
     * @param task_id Id returned by submitTask
     * @return Synthesized result, empty for unknown ids
     */
    std::optional<Result> processSubmitted(const std::string& task_id);

    /**
     * @brief Run a task through analysis, decomposition, delegation,
     *        parallel execution and synthesis
     * @param task Task to process (id assigned when empty)
     * @return Synthesized result
     */
    virtual Result processTask(const Task& task);

    std::future<Result> processTaskAsync(const Task& task);

    /**
     * @brief Split a task into subtasks
     * @param task Parent task, child ids are appended to it
     * @return Subtasks, or the task itself when it is not split
     */
    std::vector<Task> decomposeTask(Task& task) const;

    /**
     * @brief Complexity score scaled to 0.0-1.0
     */
    double normalizedComplexity(const Task& task) const;

    /**
     * @brief Choose a worker for every subtask, without an agent limit
     */
    std::vector<Delegation> planDelegation(const std::vector<Task>& subtasks) const;

    /**
     * @brief Choose a worker for every subtask within an allocation
     *
     * Idle workers are scored first; busy ones only compete when no
     * worker is idle. Once allocation.agent_count distinct workers are
     * engaged, later subtasks go to one of them. Subtasks no worker
     * matches are spread by load. Each subtask carries the per-agent
     * tool-call budget under TOOL_CALL_BUDGET_KEY.
     */
    std::vector<Delegation> planDelegation(const std::vector<Task>& subtasks,
                                           const AgentAllocation& allocation) const;

    /**
     * @brief Capability match of a worker for a subtask
     * @return Sum of matching proficiencies times performance times success rate
     */
    double delegationScore(const std::string& agent_id, const Task& subtask) const;

    std::optional<TaskStage> getTaskStage(const std::string& task_id) const;

    OrchestratorStatistics getStatistics() const;

    std::vector<WorkerStatus> getWorkerStatus() const;

    /**
     * @brief Best workers by performance and success rate
     * @param limit Maximum workers returned
     * @param min_tasks Finished subtasks a worker needs before it is ranked
     */
    std::vector<WorkerStatus> getTopPerformers(size_t limit = 10, size_t min_tasks = 5) const;

    /**
     * @brief Compare the newer half of the quality window with the older half
     *
     * A change of more than 5% either way is improving or declining.
     */
    QualityTrend getQualityTrend() const;

    /**
     * @brief Get worker performance report
     * @return Report as formatted string
     */
    std::string getPerformanceReport() const;

    /**
     * @brief Stop every worker endpoint
     */
    void shutdown();

    const OrchestratorConfig& getConfig() const { return m_config; }

private:
    struct WorkerRecord {
        std::shared_ptr<Agent> agent;
        std::unique_ptr<WorkerEndpoint> endpoint;
        std::atomic<size_t> completed{0};
        std::atomic<size_t> failed{0};
        std::atomic<size_t> inflight{0};
        std::atomic<double> performance_score{1.0};

        double successRate() const;
        bool isIdle() const;
    };

    MessageBus& m_bus;
    LoadBalancer& m_load_balancer;
    OrchestratorConfig m_config;
    ScalingStrategy m_scaling;

    std::vector<std::unique_ptr<WorkerRecord>> m_workers;
    mutable std::shared_mutex m_workers_mutex;

    std::shared_ptr<TaskStore> m_store;
    std::shared_ptr<QLearningEngine> m_learner;
    std::shared_ptr<QualityVerifier> m_verifier;
    mutable std::mutex m_collaborators_mutex;

    std::unordered_map<std::string, Task> m_submitted;
    std::unordered_map<std::string, TaskStage> m_stages;
    std::deque<std::string> m_finished;          ///< Oldest first, trimmed to stage_history_limit
    mutable std::mutex m_tasks_mutex;

    OrchestratorStatistics m_stats;
    size_t m_total_agents_used = 0;
    double m_total_quality = 0.0;
    std::deque<double> m_recent_quality;
    mutable std::mutex m_stats_mutex;

    WorkerRecord* findWorker(const std::string& agent_id) const;
    double scoreLocked(const WorkerRecord& worker, const Task& subtask) const;
    void setStage(const std::string& task_id, TaskStage stage);
    void retireStage(const std::string& task_id);
    Result dispatchSubtask(const Delegation& delegation);
    std::vector<Result> executeDelegations(const std::vector<Delegation>& plan);
    Result synthesize(const Task& task, const std::vector<Result>& results, bool decomposed) const;
    void verifyResults(const std::vector<Delegation>& plan, const std::vector<Result>& results,
                       Result& combined) const;
    void recordOutcome(const Task& task, const ComplexityAssessment& assessment,
                       const std::vector<Delegation>& plan, const Result& result);
    void updateLearning(const Task& task, const ComplexityAssessment& assessment,
                        bool decomposed, const Result& result);
    void persistTask(const Task& task);
    void persistResult(const Result& result);
};

} // namespace Maestro
