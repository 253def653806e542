// =================================================================
// src/Maestro/Workers.cpp
// =================================================================
// Worker agent flavors. Each flavor implements Agent directly; the steps
// they have in common live in free helpers below.

#include "Maestro/Workers.hpp"
#include "Maestro/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace Maestro {

namespace {

using Clock = std::chrono::steady_clock;

struct Reasoned {
    std::string text;
    std::string source = "heuristic";
    bool ok = false;
};

json approachState(const std::string& agent_type, const Task& task) {
    return {{"agent_type", agent_type}, {"requirement_count", task.requirements.size()}};
}

std::string chooseApproach(const WorkerToolkit& toolkit, const std::string& agent_type, const Task& task) {
    if (!toolkit.reasoning && !toolkit.fallback) {
        return "heuristic";
    }
    if (!toolkit.learner) {
        return "reasoning";
    }
    return toolkit.learner->selectAction(approachState(agent_type, task), {"reasoning", "heuristic"});
}

// Backend calls left for one task; every handler attempt counts
struct ToolBudget {
    size_t limit = 0;
    size_t used = 0;

    bool spent() const { return used >= limit; }
};

ToolBudget budgetFor(const WorkerToolkit& toolkit, const Task& task) {
    ToolBudget budget;
    budget.limit = toolkit.tool_call_budget;

    auto it = task.context.find(TOOL_CALL_BUDGET_KEY);
    if (it != task.context.end()) {
        try {
            long granted = std::stol(it->second);
            budget.limit = std::min(budget.limit, static_cast<size_t>(std::max(0L, granted)));
        } catch (const std::logic_error&) {
            Logger::getInstance().warning("Worker", "Ignoring malformed tool-call budget", it->second);
        }
    }
    return budget;
}

Reasoned reason(const WorkerToolkit& toolkit, const std::string& agent_id, ToolBudget& budget,
                const std::string& prompt, const std::string& system_prompt) {
    Reasoned out;
    if (budget.spent()) {
        Logger::getInstance().debug("Worker", "Tool-call budget spent",
                                    std::to_string(budget.used) + "/" + std::to_string(budget.limit));
        return out;
    }

    std::optional<ResourceLease> slot;
    if (toolkit.environment) {
        if (auto resource = toolkit.environment->findResource(REASONING_RESOURCE)) {
            slot.emplace(*toolkit.environment, *resource, agent_id);
            if (!slot->granted()) {
                Logger::getInstance().warning("Worker", "No reasoning slot free, using heuristics", agent_id);
                return out;
            }
        }
    }

    auto backend = toolkit.reasoning;
    FallbackHandler primary;
    if (backend) {
        primary = [backend, system_prompt](const json& args) -> json {
            ReasoningReply reply = backend->generate(args.at("prompt").get<std::string>(), system_prompt);
            if (!reply.ok) {
                throw MaestroError(ErrorKind::UNAVAILABLE, backend->getName() + " returned no text");
            }
            return reply.text;
        };
    }

    if (toolkit.fallback) {
        try {
            FallbackResult result = toolkit.fallback->execute(primary, {{"prompt", prompt},
                                                                        {"system_prompt", system_prompt}});
            budget.used += result.attempts;
            out.text = result.value.is_string() ? result.value.get<std::string>() : result.value.dump();
            out.source = (result.handler_name == "primary") ? backend->getName() : result.handler_name;
            out.ok = true;
        } catch (const FallbackExhaustedError& e) {
            budget.used += e.attempted().size();
            Logger::getInstance().warning("Worker", "Reasoning unavailable, using heuristics", e.what());
        }
    } else if (backend) {
        budget.used++;
        ReasoningReply reply = backend->generate(prompt, system_prompt);
        if (reply.ok) {
            out.text = reply.text;
            out.source = backend->getName();
            out.ok = true;
        } else {
            Logger::getInstance().warning("Worker", "Reasoning unavailable, using heuristics",
                                         backend->getName());
        }
    }
    return out;
}

std::vector<std::string> recallContext(const WorkerToolkit& toolkit, const std::string& agent_id, const Task& task) {
    std::vector<std::string> notes;
    if (!toolkit.context) {
        return notes;
    }
    for (const auto& entry : toolkit.context->retrieveRelevantContext(agent_id, task.description, 3)) {
        notes.push_back(entry.content);
    }
    return notes;
}

json similarTasks(const WorkerToolkit& toolkit, const Task& task) {
    json similar = json::array();
    if (!toolkit.semantic) {
        return similar;
    }
    for (const auto& match : toolkit.semantic->retrieve(task.description, 3)) {
        similar.push_back({{"key", match.key}, {"content", match.content}, {"similarity", match.similarity}});
    }
    return similar;
}

std::vector<std::string> keyTerms(const std::string& text, size_t limit) {
    std::vector<std::string> terms;
    std::set<std::string> seen;
    std::string current;
    auto flush = [&]() {
        if (current.size() >= 5 && seen.insert(current).second && terms.size() < limit) {
            terms.push_back(current);
        }
        current.clear();
    };
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            current += static_cast<char>(std::tolower(c));
        } else {
            flush();
        }
    }
    flush();
    return terms;
}

Result startResult(const std::string& agent_id, const Task& task) {
    Result result;
    result.task_id = task.id;
    result.agent_id = agent_id;
    return result;
}

void finish(const WorkerToolkit& toolkit, const std::string& agent_id, const std::string& agent_type,
            const Task& task, const std::string& approach, const ToolBudget& budget,
            Result& result, Clock::time_point start) {
    result.execution_time = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
    result.metadata["agent_type"] = agent_type;
    result.metadata["tool_calls"] = std::to_string(budget.used);
    result.metadata["tool_call_budget"] = std::to_string(budget.limit);

    std::string summary = agent_type + " result for " + task.id + ": " +
                          (result.success ? "succeeded" : "failed: " + result.error);

    if (toolkit.memory) {
        toolkit.memory->storeShortTerm("task:" + task.id,
                                       {{"agent", agent_id}, {"summary", summary}, {"success", result.success}},
                                       result.quality_score);
    }
    if (toolkit.semantic && result.success) {
        toolkit.semantic->store("task:" + task.id, task.description, {{"agent_type", agent_type}},
                                result.quality_score);
    }
    if (toolkit.context && result.success) {
        toolkit.context->storeContext(agent_id, summary, ContextType::RESULT, ContextScope::GLOBAL,
                                      result.quality_score);
    }
    if (toolkit.learner) {
        json state = approachState(agent_type, task);
        toolkit.learner->learnEpisode({state, approach, result.success ? result.quality_score : -1.0, state, true});
    }
}

} // anonymous namespace

// =================================================================
// ResearchAgent
// =================================================================

ResearchAgent::ResearchAgent(const std::string& id, WorkerToolkit toolkit)
    : m_id(id), m_toolkit(std::move(toolkit)) {
}

std::vector<AgentCapability> ResearchAgent::getCapabilities() const {
    return {
        {"research", "Investigates a topic and reports findings", 0.9},
        {"web_search", "Locates relevant external sources", 0.8},
        {"information_gathering", "Collects and organizes facts", 0.85}
    };
}

Result ResearchAgent::processTask(const Task& task) {
    auto start = Clock::now();
    Result result = startResult(m_id, task);
    ToolBudget budget = budgetFor(m_toolkit, task);
    std::vector<std::string> notes = recallContext(m_toolkit, m_id, task);
    json similar = similarTasks(m_toolkit, task);

    std::string approach = chooseApproach(m_toolkit, getType(), task);
    Reasoned reasoned;
    if (approach == "reasoning") {
        reasoned = reason(m_toolkit, m_id, budget, "Research the following topic and list the key findings:\n" + task.description,
                          "You are a meticulous research analyst. Answer with concise findings.");
    }

    json findings = json::array();
    for (const auto& term : keyTerms(task.description, 5)) {
        findings.push_back("Investigate " + term);
    }

    result.payload = {
        {"summary", reasoned.ok ? reasoned.text : "Research outline for: " + task.description},
        {"findings", findings},
        {"prior_context", notes},
        {"similar_tasks", similar},
        {"source", reasoned.source}
    };
    result.success = true;
    result.quality_score = reasoned.ok ? 0.85 : 0.6;
    result.metadata["approach"] = reasoned.ok ? "reasoning" : "heuristic";

    finish(m_toolkit, m_id, getType(), task, approach, budget, result, start);
    return result;
}

// =================================================================
// CodeAgent
// =================================================================

CodeAgent::CodeAgent(const std::string& id, WorkerToolkit toolkit)
    : m_id(id), m_toolkit(std::move(toolkit)) {
}

std::vector<AgentCapability> CodeAgent::getCapabilities() const {
    return {
        {"code", "Writes and modifies source code", 0.9},
        {"code_generation", "Generates code from a description", 0.85},
        {"debugging", "Locates and fixes defects", 0.75}
    };
}

Result CodeAgent::processTask(const Task& task) {
    auto start = Clock::now();
    Result result = startResult(m_id, task);
    ToolBudget budget = budgetFor(m_toolkit, task);

    auto language_it = task.context.find("language");
    std::string language = (language_it != task.context.end()) ? language_it->second : "cpp";

    json plan = json::array();
    if (task.requirements.empty()) {
        plan = {"design interface", "implement", "add tests"};
    } else {
        for (const auto& requirement : task.requirements) {
            plan.push_back("implement " + requirement);
        }
    }

    std::string approach = chooseApproach(m_toolkit, getType(), task);
    Reasoned reasoned;
    if (approach == "reasoning") {
        reasoned = reason(m_toolkit, m_id, budget, "Write " + language + " code for the following task:\n" + task.description,
                          "You are an expert " + language + " developer. Reply with code only.");
    }

    result.payload = {
        {"language", language},
        {"plan", plan},
        {"code", reasoned.ok ? reasoned.text : "// Implementation outline for: " + task.description},
        {"source", reasoned.source}
    };
    result.success = true;
    result.quality_score = reasoned.ok ? 0.8 : 0.55;
    result.metadata["approach"] = reasoned.ok ? "reasoning" : "heuristic";

    finish(m_toolkit, m_id, getType(), task, approach, budget, result, start);
    return result;
}

// =================================================================
// TestAgent
// =================================================================

TestAgent::TestAgent(const std::string& id, WorkerToolkit toolkit)
    : m_id(id), m_toolkit(std::move(toolkit)) {
}

std::vector<AgentCapability> TestAgent::getCapabilities() const {
    return {
        {"test", "Designs and runs tests", 0.9},
        {"testing", "Builds test plans", 0.85},
        {"validation", "Checks results against expectations", 0.8}
    };
}

Result TestAgent::processTask(const Task& task) {
    auto start = Clock::now();
    Result result = startResult(m_id, task);
    ToolBudget budget = budgetFor(m_toolkit, task);

    json test_cases = json::array();
    for (const auto& requirement : task.requirements) {
        test_cases.push_back("verify " + requirement);
    }
    for (const auto& term : keyTerms(task.description, 3)) {
        test_cases.push_back("edge cases for " + term);
    }
    if (test_cases.empty()) {
        test_cases.push_back("smoke test");
    }

    std::string approach = chooseApproach(m_toolkit, getType(), task);
    Reasoned reasoned;
    if (approach == "reasoning") {
        reasoned = reason(m_toolkit, m_id, budget, "List test cases for the following task:\n" + task.description,
                          "You are a thorough QA engineer.");
    }

    result.payload = {
        {"test_cases", test_cases},
        {"coverage_targets", task.requirements},
        {"notes", reasoned.ok ? reasoned.text : ""},
        {"source", reasoned.source}
    };
    result.success = true;
    result.quality_score = reasoned.ok ? 0.8 : 0.6;
    result.metadata["approach"] = reasoned.ok ? "reasoning" : "heuristic";

    finish(m_toolkit, m_id, getType(), task, approach, budget, result, start);
    return result;
}

// =================================================================
// DataAnalysisAgent
// =================================================================

DataAnalysisAgent::DataAnalysisAgent(const std::string& id, WorkerToolkit toolkit)
    : m_id(id), m_toolkit(std::move(toolkit)) {
}

std::vector<AgentCapability> DataAnalysisAgent::getCapabilities() const {
    return {
        {"analyze", "Analyzes data sets", 0.9},
        {"data_analysis", "Summarizes and interprets data", 0.9},
        {"statistics", "Computes descriptive statistics", 0.8}
    };
}

Result DataAnalysisAgent::processTask(const Task& task) {
    auto start = Clock::now();
    Result result = startResult(m_id, task);
    ToolBudget budget = budgetFor(m_toolkit, task);
    std::string approach = chooseApproach(m_toolkit, getType(), task);

    auto data_it = task.context.find("data");
    if (data_it == task.context.end() || data_it->second.empty()) {
        result.payload = {{"statistics", nullptr}, {"note", "no data supplied"}};
        result.success = true;
        result.quality_score = 0.5;
        finish(m_toolkit, m_id, getType(), task, approach, budget, result, start);
        return result;
    }

    std::vector<double> values;
    std::stringstream stream(data_it->second);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item.erase(0, item.find_first_not_of(" \t"));
        item.erase(item.find_last_not_of(" \t") + 1);
        if (item.empty()) continue;

        try {
            size_t consumed = 0;
            double value = std::stod(item, &consumed);
            if (consumed != item.size()) {
                throw std::invalid_argument(item);
            }
            values.push_back(value);
        } catch (const std::logic_error&) {
            result.success = false;
            result.error = errorKindToString(ErrorKind::INVALID_ARGUMENT) + ": non-numeric value '" + item + "' in data";
            finish(m_toolkit, m_id, getType(), task, approach, budget, result, start);
            return result;
        }
    }

    json statistics = nullptr;
    if (!values.empty()) {
        double sum = 0.0;
        for (double v : values) sum += v;
        double mean = sum / values.size();
        double variance = 0.0;
        for (double v : values) variance += (v - mean) * (v - mean);
        variance /= values.size();

        statistics = {
            {"count", values.size()},
            {"mean", mean},
            {"min", *std::min_element(values.begin(), values.end())},
            {"max", *std::max_element(values.begin(), values.end())},
            {"stddev", std::sqrt(variance)}
        };
    }

    Reasoned reasoned;
    if (approach == "reasoning" && !values.empty()) {
        reasoned = reason(m_toolkit, m_id, budget, "Interpret these statistics for the task '" + task.description + "': " +
                          statistics.dump(), "You are a careful data analyst.");
    }

    result.payload = {
        {"statistics", statistics},
        {"insights", reasoned.ok ? reasoned.text : ""},
        {"source", reasoned.source}
    };
    result.success = true;
    result.quality_score = values.empty() ? 0.5 : (reasoned.ok ? 0.9 : 0.75);
    result.metadata["approach"] = reasoned.ok ? "reasoning" : "heuristic";

    finish(m_toolkit, m_id, getType(), task, approach, budget, result, start);
    return result;
}

// =================================================================
// GeneralAgent
// =================================================================

GeneralAgent::GeneralAgent(const std::string& id, WorkerToolkit toolkit)
    : m_id(id), m_toolkit(std::move(toolkit)) {
}

std::vector<AgentCapability> GeneralAgent::getCapabilities() const {
    return {
        {"general", "Handles tasks without a specialist", 0.6},
        {"document", "Writes documentation and reports", 0.7},
        {"writing", "Produces prose", 0.65}
    };
}

Result GeneralAgent::processTask(const Task& task) {
    auto start = Clock::now();
    Result result = startResult(m_id, task);
    ToolBudget budget = budgetFor(m_toolkit, task);
    std::vector<std::string> notes = recallContext(m_toolkit, m_id, task);
    json similar = similarTasks(m_toolkit, task);

    std::string approach = chooseApproach(m_toolkit, getType(), task);
    Reasoned reasoned;
    if (approach == "reasoning") {
        reasoned = reason(m_toolkit, m_id, budget, task.description, "You are a helpful assistant.");
    }

    result.payload = {
        {"response", reasoned.ok ? reasoned.text : "Acknowledged: " + task.description},
        {"context_used", notes},
        {"similar_tasks", similar},
        {"source", reasoned.source}
    };
    result.success = true;
    result.quality_score = reasoned.ok ? 0.75 : 0.5;
    result.metadata["approach"] = reasoned.ok ? "reasoning" : "heuristic";

    finish(m_toolkit, m_id, getType(), task, approach, budget, result, start);
    return result;
}

// =================================================================
// Factory
// =================================================================

std::vector<std::string> knownAgentTypes() {
    return {"research", "code", "test", "data_analysis", "general"};
}

std::shared_ptr<Agent> makeAgent(const std::string& type, const std::string& id, const WorkerToolkit& toolkit) {
    if (type == "research") return std::make_shared<ResearchAgent>(id, toolkit);
    if (type == "code") return std::make_shared<CodeAgent>(id, toolkit);
    if (type == "test") return std::make_shared<TestAgent>(id, toolkit);
    if (type == "data_analysis") return std::make_shared<DataAnalysisAgent>(id, toolkit);
    if (type == "general") return std::make_shared<GeneralAgent>(id, toolkit);
    throw MaestroError(ErrorKind::INVALID_ARGUMENT, "Unknown agent type: " + type);
}

} // namespace Maestro
