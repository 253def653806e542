// =================================================================
// src/Maestro/FallbackChain.cpp
// =================================================================
// Implementation of fallback chains and the chain registry.

#include "Maestro/FallbackChain.hpp"
#include "Maestro/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace Maestro {

namespace {

// Reported when a handler throws something that is not a std::exception
const char* const UNKNOWN_HANDLER_ERROR = "unknown exception";

} // anonymous namespace

std::string fallbackStrategyToString(FallbackStrategy strategy) {
    switch (strategy) {
        case FallbackStrategy::SEQUENTIAL: return "sequential";
        case FallbackStrategy::PARALLEL: return "parallel";
        case FallbackStrategy::WEIGHTED: return "weighted";
        case FallbackStrategy::ADAPTIVE: return "adaptive";
        default: return "unknown";
    }
}

FallbackStrategy fallbackStrategyFromString(const std::string& name) {
    if (name == "sequential") return FallbackStrategy::SEQUENTIAL;
    if (name == "parallel") return FallbackStrategy::PARALLEL;
    if (name == "weighted") return FallbackStrategy::WEIGHTED;
    if (name == "adaptive") return FallbackStrategy::ADAPTIVE;
    throw MaestroError(ErrorKind::INVALID_ARGUMENT, "Unknown fallback strategy: " + name);
}

double FallbackOption::successRate() const {
    size_t total = success_count + failure_count;
    if (total == 0) {
        return 1.0;
    }
    return static_cast<double>(success_count) / total;
}

double FallbackOption::adaptiveScore() const {
    double latency_seconds = average_latency_ms / 1000.0;
    return 0.7 * successRate() + 0.3 * (1.0 / (1.0 + latency_seconds));
}

namespace {

std::string describeExhaustion(const std::string& chain_name,
                               const std::vector<std::string>& attempted,
                               const std::string& last_cause) {
    std::ostringstream oss;
    oss << "All handlers failed for chain '" << chain_name << "' (tried: ";
    for (size_t i = 0; i < attempted.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << attempted[i];
    }
    oss << "); last error: " << last_cause;
    return oss.str();
}

} // anonymous namespace

FallbackExhaustedError::FallbackExhaustedError(const std::string& chain_name,
                                               const std::vector<std::string>& attempted,
                                               const std::string& last_cause)
    : MaestroError(ErrorKind::EXHAUSTED, describeExhaustion(chain_name, attempted, last_cause)),
      m_attempted(attempted), m_last_cause(last_cause) {
}

// =================================================================
// FallbackChain Implementation
// =================================================================

FallbackChain::FallbackChain(const std::string& name, FallbackStrategy strategy)
    : m_name(name), m_strategy(strategy), m_rng(std::random_device{}()) {
    Logger::getInstance().debug("FallbackChain", "Created chain " + m_name +
                               " with strategy " + fallbackStrategyToString(strategy));
}

FallbackChain::~FallbackChain() {
    std::lock_guard<std::mutex> lock(m_orphans_mutex);
    for (auto& future : m_orphans) {
        if (future.valid()) {
            future.wait();
        }
    }
}

FallbackStrategy FallbackChain::getStrategy() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_strategy;
}

void FallbackChain::setStrategy(FallbackStrategy strategy) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_strategy = strategy;
}

void FallbackChain::addFallback(const std::string& name, FallbackHandler handler,
                                int priority, double weight) {
    auto option = std::make_shared<FallbackOption>();
    option->name = name;
    option->handler = std::move(handler);
    option->priority = priority;
    option->weight = weight;

    std::lock_guard<std::mutex> lock(m_mutex);
    m_options.erase(std::remove_if(m_options.begin(), m_options.end(),
                                   [&name](const std::shared_ptr<FallbackOption>& existing) {
                                       return existing->name == name;
                                   }),
                    m_options.end());
    m_options.push_back(option);
    std::stable_sort(m_options.begin(), m_options.end(),
                     [](const std::shared_ptr<FallbackOption>& a, const std::shared_ptr<FallbackOption>& b) {
                         return a->priority > b->priority;
                     });

    Logger::getInstance().debug("FallbackChain", "Added fallback " + name + " to chain " + m_name,
                               "Priority: " + std::to_string(priority));
}

bool FallbackChain::removeFallback(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_options.begin(), m_options.end(),
                           [&name](const std::shared_ptr<FallbackOption>& option) {
                               return option->name == name;
                           });
    if (it == m_options.end()) {
        return false;
    }
    m_options.erase(it);
    return true;
}

FallbackResult FallbackChain::execute(const FallbackHandler& primary, const json& args) {
    FallbackStrategy strategy;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats.executions++;
        strategy = m_strategy;
    }

    std::vector<std::string> attempted;
    std::string last_error = "no handlers registered";
    size_t primary_attempts = 0;

    if (primary) {
        primary_attempts = 1;
        attempted.push_back("primary");
        auto start = std::chrono::steady_clock::now();
        try {
            json value = primary(args);
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_stats.primary_successes++;
            }
            FallbackResult result;
            result.value = std::move(value);
            result.handler_name = "primary";
            result.attempts = 1;
            return result;
        } catch (const std::exception& e) {
            last_error = e.what();
        } catch (...) {
            last_error = UNKNOWN_HANDLER_ERROR;
        }
        double latency = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        Logger::getInstance().logFallbackAttempt(m_name, "primary", false, latency, last_error);
    }

    OptionList options = snapshotOptions();
    FallbackResult result;
    bool succeeded = false;

    if (!options.empty()) {
        switch (strategy) {
            case FallbackStrategy::SEQUENTIAL:
                succeeded = runSequential(options, args, result, attempted, last_error);
                break;
            case FallbackStrategy::PARALLEL:
                succeeded = runParallel(options, args, result, attempted, last_error);
                break;
            case FallbackStrategy::WEIGHTED:
                succeeded = runWeighted(options, args, result, attempted, last_error);
                break;
            case FallbackStrategy::ADAPTIVE:
                succeeded = runAdaptive(options, args, result, attempted, last_error);
                break;
        }
    }

    if (succeeded) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stats.fallback_successes++;
        }
        result.used_fallback = true;
        result.attempts += primary_attempts;
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats.exhausted++;
    }
    Logger::getInstance().error("FallbackChain", "Chain exhausted: " + m_name, "Last error: " + last_error);
    throw FallbackExhaustedError(m_name, attempted, last_error);
}

std::function<FallbackResult(const json&)> FallbackChain::wrap(FallbackHandler primary) {
    return [this, primary = std::move(primary)](const json& args) {
        return execute(primary, args);
    };
}

std::vector<FallbackOption> FallbackChain::getOptions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<FallbackOption> snapshot;
    snapshot.reserve(m_options.size());
    for (const auto& option : m_options) {
        snapshot.push_back(*option);
    }
    return snapshot;
}

FallbackChainStatistics FallbackChain::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

void FallbackChain::setSeed(unsigned int seed) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_rng.seed(seed);
}

FallbackChain::OptionList FallbackChain::snapshotOptions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_options;
}

bool FallbackChain::invokeOption(const std::shared_ptr<FallbackOption>& option, const json& args,
                                 json& value, std::string& error) {
    auto start = std::chrono::steady_clock::now();
    try {
        value = option->handler(args);
        double latency = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - start).count();
        recordAttempt(*option, true, latency, "");
        return true;
    } catch (const std::exception& e) {
        error = e.what();
    } catch (...) {
        error = UNKNOWN_HANDLER_ERROR;
    }
    double latency = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    recordAttempt(*option, false, latency, error);
    return false;
}

void FallbackChain::recordAttempt(FallbackOption& option, bool success, double latency_ms,
                                  const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (success) {
            option.success_count++;
        } else {
            option.failure_count++;
        }
        size_t total = option.success_count + option.failure_count;
        option.average_latency_ms += (latency_ms - option.average_latency_ms) / total;
    }
    Logger::getInstance().logFallbackAttempt(m_name, option.name, success, latency_ms, error);
}

bool FallbackChain::runSequential(const OptionList& options, const json& args,
                                  FallbackResult& result, std::vector<std::string>& attempted,
                                  std::string& last_error) {
    for (const auto& option : options) {
        attempted.push_back(option->name);
        result.attempts++;

        json value;
        if (invokeOption(option, args, value, last_error)) {
            result.value = std::move(value);
            result.handler_name = option->name;
            return true;
        }
    }
    return false;
}

bool FallbackChain::runParallel(const OptionList& options, const json& args,
                                FallbackResult& result, std::vector<std::string>& attempted,
                                std::string& last_error) {
    struct Race {
        std::mutex mutex;
        std::condition_variable cv;
        std::optional<json> value;
        std::string winner;
        std::string last_error;
        size_t finished = 0;
    };
    auto race = std::make_shared<Race>();

    std::vector<std::future<void>> futures;
    futures.reserve(options.size());
    for (const auto& option : options) {
        attempted.push_back(option->name);
        futures.push_back(std::async(std::launch::async, [this, race, option, args]() {
            auto start = std::chrono::steady_clock::now();
            std::optional<json> value;
            std::string error;
            try {
                value = option->handler(args);
            } catch (const std::exception& e) {
                error = e.what();
            } catch (...) {
                error = UNKNOWN_HANDLER_ERROR;
            }
            double latency = std::chrono::duration<double, std::milli>(
                std::chrono::steady_clock::now() - start).count();

            std::lock_guard<std::mutex> lock(race->mutex);
            race->finished++;
            if (!race->value) {
                // Branches finishing after a winner are cancelled and not counted
                recordAttempt(*option, value.has_value(), latency, error);
                if (value) {
                    race->value = std::move(value);
                    race->winner = option->name;
                } else {
                    race->last_error = error;
                }
            }
            race->cv.notify_all();
        }));
    }

    bool won = false;
    {
        std::unique_lock<std::mutex> lock(race->mutex);
        race->cv.wait(lock, [&] { return race->value.has_value() || race->finished == options.size(); });
        won = race->value.has_value();
        if (won) {
            result.value = *race->value;
            result.handler_name = race->winner;
        } else {
            last_error = race->last_error;
        }
    }
    result.attempts += options.size();

    std::lock_guard<std::mutex> lock(m_orphans_mutex);
    m_orphans.erase(std::remove_if(m_orphans.begin(), m_orphans.end(),
                                   [](const std::future<void>& f) {
                                       return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
                                   }),
                    m_orphans.end());
    for (auto& future : futures) {
        if (future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            m_orphans.push_back(std::move(future));
        }
    }
    return won;
}

bool FallbackChain::runWeighted(const OptionList& options, const json& args,
                                FallbackResult& result, std::vector<std::string>& attempted,
                                std::string& last_error) {
    double total_weight = 0.0;
    for (const auto& option : options) {
        total_weight += std::max(0.0, option->weight);
    }
    if (total_weight <= 0.0) {
        return runSequential(options, args, result, attempted, last_error);
    }

    double draw;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::uniform_real_distribution<double> dist(0.0, total_weight);
        draw = dist(m_rng);
    }

    size_t chosen = options.size() - 1;
    double cumulative = 0.0;
    for (size_t i = 0; i < options.size(); ++i) {
        cumulative += std::max(0.0, options[i]->weight);
        if (draw < cumulative) {
            chosen = i;
            break;
        }
    }

    attempted.push_back(options[chosen]->name);
    result.attempts++;
    json value;
    if (invokeOption(options[chosen], args, value, last_error)) {
        result.value = std::move(value);
        result.handler_name = options[chosen]->name;
        return true;
    }

    OptionList remainder;
    for (size_t i = 0; i < options.size(); ++i) {
        if (i != chosen) {
            remainder.push_back(options[i]);
        }
    }
    return runSequential(remainder, args, result, attempted, last_error);
}

bool FallbackChain::runAdaptive(const OptionList& options, const json& args,
                                FallbackResult& result, std::vector<std::string>& attempted,
                                std::string& last_error) {
    std::vector<std::pair<double, std::shared_ptr<FallbackOption>>> scored;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& option : options) {
            scored.emplace_back(option->adaptiveScore(), option);
        }
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    OptionList ranked;
    for (const auto& entry : scored) {
        ranked.push_back(entry.second);
    }
    return runSequential(ranked, args, result, attempted, last_error);
}

// =================================================================
// FallbackRegistry Implementation
// =================================================================

std::shared_ptr<FallbackChain> FallbackRegistry::registerChain(const std::string& name,
                                                               FallbackStrategy strategy) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_chains.find(name);
    if (it != m_chains.end()) {
        return it->second;
    }

    auto chain = std::make_shared<FallbackChain>(name, strategy);
    m_chains[name] = chain;
    Logger::getInstance().info("FallbackRegistry", "Registered chain: " + name);
    return chain;
}

std::shared_ptr<FallbackChain> FallbackRegistry::getChain(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_chains.find(name);
    if (it == m_chains.end()) {
        Logger::getInstance().warning("FallbackRegistry",
                                     errorKindToString(ErrorKind::NOT_FOUND) + ": chain " + name);
        return nullptr;
    }
    return it->second;
}

bool FallbackRegistry::hasChain(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_chains.count(name) > 0;
}

FallbackResult FallbackRegistry::execute(const std::string& name, const FallbackHandler& primary,
                                         const json& args) {
    std::shared_ptr<FallbackChain> chain;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_chains.find(name);
        if (it == m_chains.end()) {
            throw std::logic_error("Fallback chain was never registered: " + name);
        }
        chain = it->second;
    }
    return chain->execute(primary, args);
}

std::vector<std::string> FallbackRegistry::listChains() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> names;
    for (const auto& [name, chain] : m_chains) {
        names.push_back(name);
    }
    return names;
}

std::string FallbackRegistry::getAllStatistics() const {
    std::vector<std::shared_ptr<FallbackChain>> chains;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& [name, chain] : m_chains) {
            chains.push_back(chain);
        }
    }

    std::ostringstream stats;
    stats << "Fallback Statistics\n";
    stats << "===================\n\n";

    for (const auto& chain : chains) {
        auto chain_stats = chain->getStatistics();
        stats << "Chain: " << chain->getName()
              << " (" << fallbackStrategyToString(chain->getStrategy()) << ")\n";
        stats << "  Executions: " << chain_stats.executions << "\n";
        stats << "  Primary Successes: " << chain_stats.primary_successes << "\n";
        stats << "  Fallback Successes: " << chain_stats.fallback_successes << "\n";
        stats << "  Exhausted: " << chain_stats.exhausted << "\n";

        for (const auto& option : chain->getOptions()) {
            stats << "  - " << option.name << ": "
                  << option.success_count << " ok, " << option.failure_count << " failed, "
                  << std::fixed << std::setprecision(1) << option.average_latency_ms << "ms avg\n";
        }
        stats << "\n";
    }

    return stats.str();
}

} // namespace Maestro
