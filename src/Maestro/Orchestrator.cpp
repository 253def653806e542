// =================================================================
// src/Maestro/Orchestrator.cpp
// =================================================================
// Implementation of the task orchestration pipeline.

#include "Maestro/Orchestrator.hpp"
#include "Maestro/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <numeric>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace Maestro {

namespace {

using Clock = std::chrono::steady_clock;

// Keyword split vocabulary: requirement tag and the word stem that selects it
const std::vector<std::pair<std::string, std::string>> KEYWORD_VOCABULARY = {
    {"research", "research"},
    {"code", "code"},
    {"test", "test"},
    {"analyze", "analy"},
    {"document", "document"}
};

std::string toLower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

std::vector<std::string> matchKeywords(const std::string& description) {
    std::vector<std::string> words;
    std::string current;
    for (unsigned char c : description) {
        if (std::isalnum(c)) {
            current += static_cast<char>(std::tolower(c));
        } else if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(current);
    }

    std::vector<std::string> matched;
    for (const auto& [tag, stem] : KEYWORD_VOCABULARY) {
        for (const auto& word : words) {
            if (word.compare(0, stem.size(), stem) == 0) {
                matched.push_back(tag);
                break;
            }
        }
    }
    return matched;
}

double elapsedMs(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

Result failedResult(const Task& task, const std::string& agent_id, ErrorKind kind, const std::string& message) {
    Result result;
    result.task_id = task.id;
    result.agent_id = agent_id;
    result.success = false;
    result.error = errorKindToString(kind) + ": " + message;
    return result;
}

} // anonymous namespace

std::string taskStageToString(TaskStage stage) {
    switch (stage) {
        case TaskStage::RECEIVED: return "received";
        case TaskStage::ANALYZED: return "analyzed";
        case TaskStage::DECOMPOSED: return "decomposed";
        case TaskStage::NOT_DECOMPOSED: return "not_decomposed";
        case TaskStage::DELEGATED: return "delegated";
        case TaskStage::EXECUTING: return "executing";
        case TaskStage::SYNTHESIZED: return "synthesized";
        default: return "unknown";
    }
}

double Orchestrator::WorkerRecord::successRate() const {
    size_t done = completed.load();
    size_t total = done + failed.load();
    return total == 0 ? 1.0 : static_cast<double>(done) / total;
}

bool Orchestrator::WorkerRecord::isIdle() const {
    return !endpoint->isBusy() && inflight.load() == 0;
}

Orchestrator::Orchestrator(MessageBus& bus, LoadBalancer& load_balancer,
                           const OrchestratorConfig& config, const ScalingConfig& scaling)
    : m_bus(bus), m_load_balancer(load_balancer), m_config(config), m_scaling(scaling) {
    Logger::getInstance().info("Orchestrator", "Orchestrator initialized", m_config.orchestrator_id);
}

Orchestrator::~Orchestrator() {
    shutdown();
}

bool Orchestrator::registerWorker(std::shared_ptr<Agent> agent) {
    if (!agent) {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(m_workers_mutex);
    const std::string agent_id = agent->getId();
    for (const auto& worker : m_workers) {
        if (worker->agent->getId() == agent_id) {
            Logger::getInstance().warning("Orchestrator", "Worker already registered: " + agent_id);
            return false;
        }
    }

    auto record = std::make_unique<WorkerRecord>();
    record->agent = agent;
    record->endpoint = std::make_unique<WorkerEndpoint>(m_bus, agent);
    if (!record->endpoint->start()) {
        return false;
    }

    m_load_balancer.setLoad(agent_id, 0.0);
    m_workers.push_back(std::move(record));

    Logger::getInstance().info("Orchestrator", "Registered worker " + agent_id, "Type: " + agent->getType());
    return true;
}

size_t Orchestrator::getWorkerCount() const {
    std::shared_lock<std::shared_mutex> lock(m_workers_mutex);
    return m_workers.size();
}

void Orchestrator::setTaskStore(std::shared_ptr<TaskStore> store) {
    std::lock_guard<std::mutex> lock(m_collaborators_mutex);
    m_store = std::move(store);
}

void Orchestrator::setLearningEngine(std::shared_ptr<QLearningEngine> engine) {
    std::lock_guard<std::mutex> lock(m_collaborators_mutex);
    m_learner = std::move(engine);
}

void Orchestrator::setQualityVerifier(std::shared_ptr<QualityVerifier> verifier) {
    std::lock_guard<std::mutex> lock(m_collaborators_mutex);
    m_verifier = std::move(verifier);
}

std::string Orchestrator::submitTask(const std::string& description, const std::vector<std::string>& requirements,
                                     int priority, const std::unordered_map<std::string, std::string>& context) {
    Task task;
    task.id = generateId("task");
    task.description = description;
    task.requirements = requirements;
    task.priority = priority;
    task.context = context;

    {
        std::lock_guard<std::mutex> lock(m_tasks_mutex);
        m_submitted[task.id] = task;
    }
    persistTask(task);

    Logger::getInstance().logTaskLifecycle(task.id, "submitted", description);
    return task.id;
}

std::optional<Result> Orchestrator::processSubmitted(const std::string& task_id) {
    Task task;
    {
        std::lock_guard<std::mutex> lock(m_tasks_mutex);
        auto it = m_submitted.find(task_id);
        if (it == m_submitted.end()) {
            Logger::getInstance().warning("Orchestrator", errorKindToString(ErrorKind::NOT_FOUND) +
                                         ": unknown submitted task", task_id);
            return std::nullopt;
        }
        task = it->second;
        m_submitted.erase(it);
    }
    return processTask(task);
}

Result Orchestrator::processTask(const Task& input) {
    auto start = Clock::now();
    Task task = input;
    if (task.id.empty()) {
        task.id = generateId("task");
    }

    try {
        setStage(task.id, TaskStage::RECEIVED);
        task.status = TaskStatus::IN_PROGRESS;
        persistTask(task);

        ComplexityAssessment assessment = m_scaling.assessComplexity(task);
        setStage(task.id, TaskStage::ANALYZED);
        Logger::getInstance().debug("Orchestrator", "Task " + task.id + " assessed as " +
                                   taskComplexityToString(assessment.complexity),
                                   "Score: " + std::to_string(assessment.score));

        DecompositionPlan strategy = m_scaling.getDecompositionStrategy(task);
        Task sizing = task;
        std::vector<Task> subtasks = decomposeTask(task);
        bool decomposed = !(subtasks.size() == 1 && subtasks.front().id == task.id);
        setStage(task.id, decomposed ? TaskStage::DECOMPOSED : TaskStage::NOT_DECOMPOSED);
        if (decomposed) {
            for (const auto& subtask : subtasks) {
                persistTask(subtask);
            }
            // Keyword splits size the allocation by what they inferred
            if (sizing.requirements.empty()) {
                for (const auto& subtask : subtasks) {
                    sizing.requirements.push_back(subtask.requirements.front());
                }
            }
        }

        AgentAllocation allocation = m_scaling.getAgentAllocation(sizing, getWorkerCount());
        std::vector<Delegation> plan = planDelegation(subtasks, allocation);
        setStage(task.id, TaskStage::DELEGATED);
        Logger::getInstance().debug("Orchestrator", "Task " + task.id + " allocated " +
                                   std::to_string(allocation.agent_count) + " agents",
                                   "Tool calls per agent: " + std::to_string(allocation.tool_calls_per_agent) +
                                   ", Suggested split: " + decompositionMethodToString(strategy.method));

        setStage(task.id, TaskStage::EXECUTING);
        std::vector<Result> results = executeDelegations(plan);

        Result result = synthesize(task, results, decomposed);
        verifyResults(plan, results, result);
        result.metadata["complexity"] = taskComplexityToString(assessment.complexity);
        result.metadata["allocated_agents"] = std::to_string(allocation.agent_count);
        result.metadata["tool_calls_per_agent"] = std::to_string(allocation.tool_calls_per_agent);
        result.metadata["decomposition_method"] = decompositionMethodToString(strategy.method);
        setStage(task.id, TaskStage::SYNTHESIZED);

        task.status = result.success ? TaskStatus::COMPLETED : TaskStatus::FAILED;
        persistTask(task);
        persistResult(result);

        recordOutcome(task, assessment, plan, result);
        updateLearning(task, assessment, decomposed, result);
        retireStage(task.id);

        Logger::getInstance().info("Orchestrator", "Task " + task.id + " finished: " + result.metadata["outcome"],
                                  "Subtasks: " + std::to_string(results.size()) + ", Total: " +
                                  std::to_string(static_cast<long>(elapsedMs(start))) + "ms");
        return result;

    } catch (const std::exception& e) {
        Logger::getInstance().error("Orchestrator", "Task " + task.id + " aborted", e.what());
        retireStage(task.id);
        Result result = failedResult(task, m_config.orchestrator_id, ErrorKind::INTERNAL, e.what());
        result.execution_time = elapsedMs(start);
        result.metadata["outcome"] = "failed";
        return result;
    }
}

std::future<Result> Orchestrator::processTaskAsync(const Task& task) {
    return std::async(std::launch::async, [this, task]() { return processTask(task); });
}

double Orchestrator::normalizedComplexity(const Task& task) const {
    if (m_config.complexity_normalizer <= 0.0) {
        return 1.0;
    }
    return std::min(1.0, m_scaling.assessComplexity(task).score / m_config.complexity_normalizer);
}

std::vector<Task> Orchestrator::decomposeTask(Task& task) const {
    double complexity = normalizedComplexity(task);

    std::vector<std::string> parts;
    if (complexity > m_config.decomposition_threshold || task.requirements.size() > 1) {
        parts = task.requirements;
        if (parts.empty()) {
            parts = matchKeywords(task.description);
        }
    }

    if (parts.empty()) {
        Logger::getInstance().logTaskLifecycle(task.id, "not_decomposed",
                                               "Complexity: " + std::to_string(complexity));
        return {task};
    }

    std::vector<Task> subtasks;
    for (size_t i = 0; i < parts.size(); ++i) {
        Task subtask;
        subtask.id = generateId("subtask");
        subtask.description = parts[i] + ": " + task.description;
        subtask.requirements = {parts[i]};
        subtask.priority = task.priority;
        subtask.parent_task_id = task.id;
        subtask.context = task.context;
        subtask.context["subtask_index"] = std::to_string(i);
        subtask.context["focus_area"] = parts[i];

        task.child_task_ids.push_back(subtask.id);
        subtasks.push_back(std::move(subtask));
    }

    Logger::getInstance().logTaskLifecycle(task.id, "decomposed",
                                           std::to_string(subtasks.size()) + " subtasks");
    return subtasks;
}

std::vector<Delegation> Orchestrator::planDelegation(const std::vector<Task>& subtasks) const {
    AgentAllocation unlimited;
    unlimited.agent_count = subtasks.size();
    unlimited.tool_calls_per_agent = 0;
    return planDelegation(subtasks, unlimited);
}

std::vector<Delegation> Orchestrator::planDelegation(const std::vector<Task>& subtasks,
                                                     const AgentAllocation& allocation) const {
    std::shared_lock<std::shared_mutex> lock(m_workers_mutex);
    const size_t agent_limit = std::max<size_t>(1, allocation.agent_count);

    std::vector<const WorkerRecord*> idle;
    for (const auto& worker : m_workers) {
        if (worker->isIdle()) {
            idle.push_back(worker.get());
        }
    }
    // Busy workers are only considered when nobody is idle
    if (idle.empty()) {
        for (const auto& worker : m_workers) {
            idle.push_back(worker.get());
        }
    }

    std::vector<const WorkerRecord*> engaged;
    auto isEngaged = [&engaged](const WorkerRecord* worker) {
        return std::find(engaged.begin(), engaged.end(), worker) != engaged.end();
    };

    std::vector<Delegation> plan(subtasks.size());
    std::vector<size_t> unmatched;

    for (size_t i = 0; i < subtasks.size(); ++i) {
        Delegation& delegation = plan[i];
        delegation.subtask = subtasks[i];
        if (allocation.tool_calls_per_agent > 0 &&
            delegation.subtask.context.find(TOOL_CALL_BUDGET_KEY) == delegation.subtask.context.end()) {
            delegation.subtask.context[TOOL_CALL_BUDGET_KEY] = std::to_string(allocation.tool_calls_per_agent);
        }

        const auto& candidates = (engaged.size() >= agent_limit) ? engaged : idle;
        const WorkerRecord* chosen = nullptr;
        for (const auto* worker : candidates) {
            double score = scoreLocked(*worker, delegation.subtask);
            if (score > delegation.score) {
                delegation.score = score;
                chosen = worker;
            }
        }

        if (!chosen) {
            unmatched.push_back(i);
            continue;
        }
        delegation.agent_id = chosen->agent->getId();
        if (!isEngaged(chosen)) {
            engaged.push_back(chosen);
        }
    }

    if (!unmatched.empty() && !idle.empty()) {
        // Unmatched subtasks are spread by load over the engaged workers,
        // topped up with the least loaded idle ones while the allocation allows
        std::vector<std::string> pool;
        for (const auto* worker : engaged) {
            pool.push_back(worker->agent->getId());
        }
        std::vector<const WorkerRecord*> spare;
        for (const auto* worker : idle) {
            if (!isEngaged(worker)) {
                spare.push_back(worker);
            }
        }
        std::stable_sort(spare.begin(), spare.end(), [this](const WorkerRecord* a, const WorkerRecord* b) {
            return m_load_balancer.getLoad(a->agent->getId()) < m_load_balancer.getLoad(b->agent->getId());
        });
        for (const auto* worker : spare) {
            if (pool.size() >= agent_limit) {
                break;
            }
            pool.push_back(worker->agent->getId());
        }

        std::vector<Task> leftovers;
        for (size_t index : unmatched) {
            leftovers.push_back(plan[index].subtask);
        }
        auto distribution = m_load_balancer.distributeTasks(leftovers, pool);
        for (const auto& [agent_id, assigned] : distribution) {
            for (const auto& task : assigned) {
                for (size_t index : unmatched) {
                    if (plan[index].subtask.id == task.id && plan[index].agent_id.empty()) {
                        plan[index].agent_id = agent_id;
                        break;
                    }
                }
            }
        }
    }

    for (const auto& delegation : plan) {
        if (delegation.agent_id.empty()) {
            Logger::getInstance().warning("Orchestrator", "No worker available for subtask", delegation.subtask.id);
        } else {
            Logger::getInstance().debug("Orchestrator", "Delegating " + delegation.subtask.id + " to " +
                                       delegation.agent_id, "Score: " + std::to_string(delegation.score));
        }
    }
    return plan;
}

double Orchestrator::delegationScore(const std::string& agent_id, const Task& subtask) const {
    std::shared_lock<std::shared_mutex> lock(m_workers_mutex);
    WorkerRecord* worker = findWorker(agent_id);
    return worker ? scoreLocked(*worker, subtask) : 0.0;
}

double Orchestrator::scoreLocked(const WorkerRecord& worker, const Task& subtask) const {
    std::vector<AgentCapability> capabilities = worker.agent->getCapabilities();

    double proficiency = 0.0;
    for (const auto& requirement : subtask.requirements) {
        std::string wanted = toLower(requirement);
        for (const auto& capability : capabilities) {
            if (toLower(capability.name) == wanted) {
                proficiency += capability.proficiency;
                break;
            }
        }
    }
    return proficiency * worker.performance_score.load() * worker.successRate();
}

Orchestrator::WorkerRecord* Orchestrator::findWorker(const std::string& agent_id) const {
    for (const auto& worker : m_workers) {
        if (worker->agent->getId() == agent_id) {
            return worker.get();
        }
    }
    return nullptr;
}

std::vector<Result> Orchestrator::executeDelegations(const std::vector<Delegation>& plan) {
    std::vector<std::future<Result>> pending;
    pending.reserve(plan.size());
    for (const auto& delegation : plan) {
        pending.push_back(std::async(std::launch::async,
                                     [this, &delegation]() { return dispatchSubtask(delegation); }));
    }

    std::vector<Result> results;
    results.reserve(pending.size());
    for (auto& future : pending) {
        results.push_back(future.get());
    }
    return results;
}

Result Orchestrator::dispatchSubtask(const Delegation& delegation) {
    auto start = Clock::now();
    const Task& subtask = delegation.subtask;
    const std::string& agent_id = delegation.agent_id;

    if (agent_id.empty()) {
        return failedResult(subtask, "", ErrorKind::UNAVAILABLE, "no worker available for subtask " + subtask.id);
    }

    WorkerRecord* worker = nullptr;
    {
        std::shared_lock<std::shared_mutex> lock(m_workers_mutex);
        worker = findWorker(agent_id);
    }
    if (!worker) {
        return failedResult(subtask, agent_id, ErrorKind::UNAVAILABLE, "worker " + agent_id + " is not registered");
    }

    const double capacity = static_cast<double>(std::max<size_t>(1, m_config.max_tasks_per_worker));
    size_t inflight = worker->inflight.fetch_add(1) + 1;
    m_load_balancer.setLoad(agent_id, std::min(1.0, inflight / capacity));
    m_load_balancer.recordTaskStart(agent_id);

    Message request;
    request.sender = m_config.orchestrator_id;
    request.recipient = agent_id;
    request.type = MessageType::TASK_ASSIGNMENT;
    request.priority = subtask.priority;
    request.payload = {{"task", taskToJson(subtask)}};
    request.ttl = m_config.subtask_timeout;

    Result result;
    try {
        std::optional<Message> reply = m_bus.sendAndWaitResponse(request, m_config.subtask_timeout);

        if (!reply) {
            if (!m_bus.isRegistered(agent_id)) {
                result = failedResult(subtask, agent_id, ErrorKind::UNAVAILABLE,
                                      "worker " + agent_id + " is not on the bus");
            } else if (Clock::now() - start < m_config.subtask_timeout) {
                result = failedResult(subtask, agent_id, ErrorKind::UNAVAILABLE,
                                      "assignment to " + agent_id + " was dropped");
            } else {
                result = failedResult(subtask, agent_id, ErrorKind::TIMEOUT,
                                      "no result from " + agent_id + " within " +
                                      std::to_string(m_config.subtask_timeout.count()) + "ms");
            }
        } else if (reply->type == MessageType::ERROR) {
            result = failedResult(subtask, agent_id, ErrorKind::INTERNAL, "worker rejected assignment");
            if (reply->payload.contains("error") && reply->payload["error"].is_string()) {
                result.error = reply->payload["error"].get<std::string>();
            }
        } else {
            result = resultFromJson(reply->payload.at("result"));
        }
    } catch (const std::exception& e) {
        result = failedResult(subtask, agent_id, ErrorKind::INTERNAL, e.what());
    }

    double elapsed = elapsedMs(start);
    if (result.task_id.empty()) result.task_id = subtask.id;
    if (result.agent_id.empty()) result.agent_id = agent_id;
    if (!result.success && result.execution_time <= 0.0) result.execution_time = elapsed;

    inflight = worker->inflight.fetch_sub(1) - 1;
    m_load_balancer.setLoad(agent_id, std::min(1.0, inflight / capacity));
    m_load_balancer.recordTaskEnd(agent_id, elapsed, result.success);

    if (result.success) {
        worker->completed.fetch_add(1);
    } else {
        worker->failed.fetch_add(1);
        Logger::getInstance().warning("Orchestrator", "Subtask " + subtask.id + " failed", result.error);
    }

    double reward = result.success ? result.quality_score : 0.0;
    double current = worker->performance_score.load();
    double updated = current;
    do {
        updated = std::max(0.1, 0.9 * current + 0.1 * reward);
    } while (!worker->performance_score.compare_exchange_weak(current, updated));

    return result;
}

Result Orchestrator::synthesize(const Task& task, const std::vector<Result>& results, bool decomposed) const {
    Result result;
    result.task_id = task.id;
    result.agent_id = m_config.orchestrator_id;

    json subtasks = json::array();
    size_t succeeded = 0;
    double quality_sum = 0.0;
    double critical_path = 0.0;
    std::vector<std::string> errors;

    for (const auto& sub : results) {
        subtasks.push_back(resultToJson(sub));
        if (sub.success) {
            ++succeeded;
        } else {
            errors.push_back(sub.task_id + ": " + sub.error);
        }
        quality_sum += sub.quality_score;
        critical_path = std::max(critical_path, sub.execution_time);
    }

    size_t failed = results.size() - succeeded;
    result.success = !results.empty() && failed == 0;
    result.quality_score = results.empty() ? 0.0 : quality_sum / results.size();
    result.execution_time = critical_path;
    result.payload = {
        {"subtasks", subtasks},
        {"succeeded", succeeded},
        {"failed", failed}
    };

    if (result.success) {
        result.metadata["outcome"] = "succeeded";
    } else if (succeeded > 0) {
        result.metadata["outcome"] = "partial";
    } else {
        result.metadata["outcome"] = "failed";
    }
    result.metadata["subtask_count"] = std::to_string(results.size());
    result.metadata["decomposed"] = decomposed ? "true" : "false";

    std::ostringstream joined;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) joined << "; ";
        joined << errors[i];
    }
    result.error = joined.str();

    return result;
}

void Orchestrator::verifyResults(const std::vector<Delegation>& plan, const std::vector<Result>& results,
                                 Result& combined) const {
    std::shared_ptr<QualityVerifier> verifier;
    {
        std::lock_guard<std::mutex> lock(m_collaborators_mutex);
        verifier = m_verifier;
    }
    if (!verifier || results.empty()) {
        return;
    }

    json reports = json::array();
    double overall_sum = 0.0;
    bool all_passed = true;
    for (const auto& sub : results) {
        auto delegation = std::find_if(plan.begin(), plan.end(), [&](const Delegation& d) {
            return d.subtask.id == sub.task_id;
        });
        Task subtask = delegation != plan.end() ? delegation->subtask : Task();
        VerificationReport report = verifier->verify(subtask, sub);
        overall_sum += report.overall;
        all_passed = all_passed && report.passed;
        reports.push_back(report.toJson());
    }

    double score = overall_sum / results.size();
    combined.payload["verification"] = reports;
    std::ostringstream formatted;
    formatted << std::fixed << std::setprecision(2) << score;
    combined.metadata["verification_score"] = formatted.str();
    combined.metadata["verification_passed"] = all_passed ? "true" : "false";
    if (!all_passed) {
        Logger::getInstance().warning("Orchestrator", "Task " + combined.task_id + " has unverified results",
                                     "Verification: " + formatted.str());
    }
}

void Orchestrator::recordOutcome(const Task& task, const ComplexityAssessment& assessment,
                                 const std::vector<Delegation>& plan, const Result& result) {
    std::set<std::string> agents;
    for (const auto& delegation : plan) {
        if (!delegation.agent_id.empty()) {
            agents.insert(delegation.agent_id);
        }
    }

    std::lock_guard<std::mutex> lock(m_stats_mutex);
    m_stats.total_tasks++;
    switch (assessment.complexity) {
        case TaskComplexity::SIMPLE: m_stats.simple_tasks++; break;
        case TaskComplexity::MODERATE: m_stats.moderate_tasks++; break;
        case TaskComplexity::COMPLEX: m_stats.complex_tasks++; break;
        case TaskComplexity::VERY_COMPLEX: m_stats.very_complex_tasks++; break;
    }

    auto outcome = result.metadata.find("outcome");
    if (result.success) {
        m_stats.successful_tasks++;
    } else if (outcome != result.metadata.end() && outcome->second == "partial") {
        m_stats.partial_tasks++;
    } else {
        m_stats.failed_tasks++;
    }

    m_stats.total_subtasks += plan.size();
    m_total_agents_used += agents.size();
    m_total_quality += result.quality_score;
    m_stats.average_agents_per_task = static_cast<double>(m_total_agents_used) / m_stats.total_tasks;
    m_stats.average_quality = m_total_quality / m_stats.total_tasks;
    m_recent_quality.push_back(result.quality_score);
    while (m_recent_quality.size() > m_config.quality_window) {
        m_recent_quality.pop_front();
    }

    Logger::getInstance().logTaskLifecycle(task.id, "synthesized",
                                           "Agents: " + std::to_string(agents.size()) +
                                           ", Quality: " + std::to_string(result.quality_score));
}

void Orchestrator::updateLearning(const Task& task, const ComplexityAssessment& assessment,
                                  bool decomposed, const Result& result) {
    if (!m_config.enable_learning) {
        return;
    }

    std::shared_ptr<QLearningEngine> learner;
    {
        std::lock_guard<std::mutex> lock(m_collaborators_mutex);
        learner = m_learner;
    }
    if (!learner) {
        return;
    }

    json state = {
        {"complexity", taskComplexityToString(assessment.complexity)},
        {"requirement_count", task.requirements.size()}
    };
    double reward = result.success ? result.quality_score : -1.0;
    learner->learnEpisode({state, decomposed ? "decompose" : "single", reward, state, true});
}

void Orchestrator::persistTask(const Task& task) {
    std::shared_ptr<TaskStore> store;
    {
        std::lock_guard<std::mutex> lock(m_collaborators_mutex);
        store = m_store;
    }
    if (!store) {
        return;
    }

    try {
        store->saveTask(task);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Orchestrator", "Failed to save task " + task.id, e.what());
    }
}

void Orchestrator::persistResult(const Result& result) {
    std::shared_ptr<TaskStore> store;
    {
        std::lock_guard<std::mutex> lock(m_collaborators_mutex);
        store = m_store;
    }
    if (!store) {
        return;
    }

    try {
        store->saveResult(result);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Orchestrator", "Failed to save result for " + result.task_id, e.what());
    }
}

void Orchestrator::setStage(const std::string& task_id, TaskStage stage) {
    {
        std::lock_guard<std::mutex> lock(m_tasks_mutex);
        m_stages[task_id] = stage;
    }
    Logger::getInstance().logTaskLifecycle(task_id, taskStageToString(stage));
}

void Orchestrator::retireStage(const std::string& task_id) {
    std::lock_guard<std::mutex> lock(m_tasks_mutex);
    m_finished.push_back(task_id);
    while (m_finished.size() > m_config.stage_history_limit) {
        m_stages.erase(m_finished.front());
        m_finished.pop_front();
    }
}

std::optional<TaskStage> Orchestrator::getTaskStage(const std::string& task_id) const {
    std::lock_guard<std::mutex> lock(m_tasks_mutex);
    auto it = m_stages.find(task_id);
    if (it == m_stages.end()) {
        return std::nullopt;
    }
    return it->second;
}

OrchestratorStatistics Orchestrator::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    return m_stats;
}

std::vector<WorkerStatus> Orchestrator::getWorkerStatus() const {
    std::shared_lock<std::shared_mutex> lock(m_workers_mutex);
    std::vector<WorkerStatus> statuses;
    for (const auto& worker : m_workers) {
        WorkerStatus status;
        status.agent_id = worker->agent->getId();
        status.type = worker->agent->getType();
        status.busy = !worker->isIdle();
        status.completed = worker->completed.load();
        status.failed = worker->failed.load();
        status.performance_score = worker->performance_score.load();
        status.success_rate = worker->successRate();
        status.load = m_load_balancer.getLoad(status.agent_id);
        statuses.push_back(status);
    }
    return statuses;
}

std::vector<WorkerStatus> Orchestrator::getTopPerformers(size_t limit, size_t min_tasks) const {
    std::vector<std::pair<double, WorkerStatus>> ranked;
    for (auto& status : getWorkerStatus()) {
        if (status.completed + status.failed < min_tasks) {
            continue;
        }
        double score = 0.6 * status.performance_score + 0.4 * status.success_rate;
        ranked.emplace_back(score, std::move(status));
    }

    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) {
            return a.first > b.first;
        }
        return a.second.agent_id < b.second.agent_id;
    });

    std::vector<WorkerStatus> top;
    for (size_t i = 0; i < ranked.size() && i < limit; ++i) {
        top.push_back(ranked[i].second);
    }
    return top;
}

QualityTrend Orchestrator::getQualityTrend() const {
    std::vector<double> window;
    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        window.assign(m_recent_quality.begin(), m_recent_quality.end());
    }

    QualityTrend trend;
    trend.samples = window.size();
    if (window.empty()) {
        return trend;
    }

    auto mean = [](std::vector<double>::const_iterator first, std::vector<double>::const_iterator last) {
        return std::accumulate(first, last, 0.0) / std::distance(first, last);
    };
    trend.average = mean(window.begin(), window.end());
    trend.minimum = *std::min_element(window.begin(), window.end());
    trend.maximum = *std::max_element(window.begin(), window.end());

    size_t middle = window.size() / 2;
    if (middle == 0) {
        trend.direction = "insufficient_data";
        return trend;
    }
    double older = mean(window.begin(), window.begin() + middle);
    double newer = mean(window.begin() + middle, window.end());
    if (newer > older * 1.05) {
        trend.direction = "improving";
    } else if (newer < older * 0.95) {
        trend.direction = "declining";
    }
    return trend;
}

std::string Orchestrator::getPerformanceReport() const {
    OrchestratorStatistics stats = getStatistics();
    std::vector<WorkerStatus> workers = getWorkerStatus();

    std::ostringstream report;
    report << "Orchestrator Performance Report\n";
    report << "===============================\n\n";
    report << "Tasks: " << stats.total_tasks << "\n";
    report << "  Simple: " << stats.simple_tasks << "\n";
    report << "  Moderate: " << stats.moderate_tasks << "\n";
    report << "  Complex: " << stats.complex_tasks << "\n";
    report << "  Very Complex: " << stats.very_complex_tasks << "\n";
    report << "Succeeded: " << stats.successful_tasks << "\n";
    report << "Partial: " << stats.partial_tasks << "\n";
    report << "Failed: " << stats.failed_tasks << "\n";
    report << "Subtasks: " << stats.total_subtasks << "\n";
    report << "Avg Agents per Task: " << std::fixed << std::setprecision(2)
           << stats.average_agents_per_task << "\n";
    report << "Avg Quality: " << std::fixed << std::setprecision(2) << stats.average_quality << "\n";
    QualityTrend trend = getQualityTrend();
    report << "Quality Trend: " << trend.direction << " (" << trend.samples << " tasks)\n\n";

    report << "Workers: " << workers.size() << "\n\n";
    for (const auto& worker : workers) {
        report << "Worker: " << worker.agent_id << " (" << worker.type << ")\n";
        report << "  Busy: " << (worker.busy ? "yes" : "no") << "\n";
        report << "  Completed: " << worker.completed << "\n";
        report << "  Failed: " << worker.failed << "\n";
        report << "  Success Rate: " << std::fixed << std::setprecision(2) << worker.success_rate << "\n";
        report << "  Performance: " << std::fixed << std::setprecision(2) << worker.performance_score << "\n";
        report << "  Load: " << std::fixed << std::setprecision(2) << worker.load << "\n\n";
    }

    return report.str();
}

void Orchestrator::shutdown() {
    std::shared_lock<std::shared_mutex> lock(m_workers_mutex);
    for (const auto& worker : m_workers) {
        worker->endpoint->stop();
    }
}

} // namespace Maestro
