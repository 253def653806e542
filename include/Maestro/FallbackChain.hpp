// =================================================================
// include/Maestro/FallbackChain.hpp
// =================================================================
// Fallback chains wrapping an unreliable primary operation with ordered,
// parallel, weighted or adaptively scored alternative handlers.

#pragma once

#include "Maestro/Types.hpp"
#include <string>
#include <memory>
#include <vector>
#include <map>
#include <functional>
#include <future>
#include <mutex>
#include <random>

namespace Maestro {

/**
 * @brief Handler signature; failure is reported by throwing
 */
using FallbackHandler = std::function<nlohmann::json(const nlohmann::json&)>;

/**
 * @brief How fallbacks are tried once the primary failed
 */
enum class FallbackStrategy {
    SEQUENTIAL,     ///< Priority order until one succeeds
    PARALLEL,       ///< All at once, first success wins
    WEIGHTED,       ///< Weighted random pick, then sequential over the rest
    ADAPTIVE        ///< Ordered by observed success rate and latency
};

std::string fallbackStrategyToString(FallbackStrategy strategy);

/**
 * @brief Parse a strategy name ("sequential", "parallel", ...)
 * @throws MaestroError INVALID_ARGUMENT for unknown names
 */
FallbackStrategy fallbackStrategyFromString(const std::string& name);

/**
 * @brief One alternative handler and its counters
 */
struct FallbackOption {
    std::string name;                             ///< Handler name
    FallbackHandler handler;                      ///< Handler implementation
    int priority = 0;                             ///< Higher priority is tried first
    double weight = 1.0;                          ///< Relative weight for weighted draws
    size_t success_count = 0;                     ///< Successful invocations
    size_t failure_count = 0;                     ///< Failed invocations
    double average_latency_ms = 0.0;              ///< Streaming average over all invocations

    /**
     * @brief Success ratio, 1.0 without history
     */
    double successRate() const;

    /**
     * @brief Adaptive ranking score: 0.7 * successRate + 0.3 / (1 + latency in seconds)
     */
    double adaptiveScore() const;
};

/**
 * @brief Outcome of a chain execution
 */
struct FallbackResult {
    nlohmann::json value;                         ///< Value returned by the winning handler
    std::string handler_name;                     ///< "primary" or the fallback name
    bool used_fallback = false;                   ///< Whether a fallback produced the value
    size_t attempts = 0;                          ///< Handlers invoked, primary included
};

/**
 * @brief Per-chain counters
 */
struct FallbackChainStatistics {
    size_t executions = 0;
    size_t primary_successes = 0;
    size_t fallback_successes = 0;
    size_t exhausted = 0;
};

/**
 * @brief Raised when the primary and every fallback failed
 */
class FallbackExhaustedError : public MaestroError {
public:
    FallbackExhaustedError(const std::string& chain_name,
                           const std::vector<std::string>& attempted,
                           const std::string& last_cause);

    const std::vector<std::string>& attempted() const { return m_attempted; }
    const std::string& lastCause() const { return m_last_cause; }

private:
    std::vector<std::string> m_attempted;
    std::string m_last_cause;
};

/**
 * @brief Chain of alternatives for one operation
 *
 * Options are kept sorted by priority (descending, stable for equal
 * priority). Counters are guarded by a per-chain mutex; handlers always
 * run outside of it.
 */
class FallbackChain {
public:
    /**
     * @brief Constructor
     * @param name Chain name used in logs
     * @param strategy Strategy applied after the primary fails
     */
    explicit FallbackChain(const std::string& name,
                           FallbackStrategy strategy = FallbackStrategy::SEQUENTIAL);

    /**
     * @brief Destructor, waits for parallel branches that lost their race
     */
    virtual ~FallbackChain();

    FallbackChain(const FallbackChain&) = delete;
    FallbackChain& operator=(const FallbackChain&) = delete;

    const std::string& getName() const { return m_name; }

    FallbackStrategy getStrategy() const;
    void setStrategy(FallbackStrategy strategy);

    /**
     * @brief Register an alternative handler
     * @param name Handler name (replaces an existing option of that name)
     * @param handler Handler implementation
     * @param priority Higher is tried first
     * @param weight Relative weight for the weighted strategy
     */
    virtual void addFallback(const std::string& name, FallbackHandler handler,
                             int priority = 0, double weight = 1.0);

    virtual bool removeFallback(const std::string& name);

    /**
     * @brief Run the primary, then the fallbacks according to the strategy
     * @param primary Primary operation, skipped when empty
     * @param args Arguments passed to every handler
     * @return Value and provenance of the first success
     * @throws FallbackExhaustedError when every handler failed
     */
    virtual FallbackResult execute(const FallbackHandler& primary, const nlohmann::json& args);

    /**
     * @brief Bind a primary operation to this chain
     * @param primary Primary operation
     * @return Callable running execute(primary, args)
     */
    std::function<FallbackResult(const nlohmann::json&)> wrap(FallbackHandler primary);

    /**
     * @brief Snapshot of the options in try order
     */
    std::vector<FallbackOption> getOptions() const;

    FallbackChainStatistics getStatistics() const;

    /**
     * @brief Seed the generator used for weighted draws
     */
    void setSeed(unsigned int seed);

private:
    using OptionList = std::vector<std::shared_ptr<FallbackOption>>;

    std::string m_name;
    FallbackStrategy m_strategy;
    OptionList m_options;
    FallbackChainStatistics m_stats;
    std::mt19937 m_rng;
    mutable std::mutex m_mutex;

    std::vector<std::future<void>> m_orphans;
    std::mutex m_orphans_mutex;

    OptionList snapshotOptions() const;
    bool invokeOption(const std::shared_ptr<FallbackOption>& option, const nlohmann::json& args,
                      nlohmann::json& value, std::string& error);
    void recordAttempt(FallbackOption& option, bool success, double latency_ms, const std::string& error);

    bool runSequential(const OptionList& options, const nlohmann::json& args,
                       FallbackResult& result, std::vector<std::string>& attempted, std::string& last_error);
    bool runParallel(const OptionList& options, const nlohmann::json& args,
                     FallbackResult& result, std::vector<std::string>& attempted, std::string& last_error);
    bool runWeighted(const OptionList& options, const nlohmann::json& args,
                     FallbackResult& result, std::vector<std::string>& attempted, std::string& last_error);
    bool runAdaptive(const OptionList& options, const nlohmann::json& args,
                     FallbackResult& result, std::vector<std::string>& attempted, std::string& last_error);
};

/**
 * @brief Named collection of fallback chains
 *
 * Constructed explicitly and handed to whoever needs it.
 */
class FallbackRegistry {
public:
    FallbackRegistry() = default;

    /**
     * @brief Create a chain, or return the existing one of that name
     * @param name Chain name
     * @param strategy Strategy for a newly created chain
     * @return Chain instance
     */
    std::shared_ptr<FallbackChain> registerChain(const std::string& name,
                                                 FallbackStrategy strategy = FallbackStrategy::SEQUENTIAL);

    /**
     * @brief Look a chain up by name
     * @return Chain, or nullptr (logged) when unknown
     */
    std::shared_ptr<FallbackChain> getChain(const std::string& name) const;

    bool hasChain(const std::string& name) const;

    /**
     * @brief Execute a registered chain
     * @throws std::logic_error when the chain was never registered
     */
    FallbackResult execute(const std::string& name, const FallbackHandler& primary,
                           const nlohmann::json& args);

    std::vector<std::string> listChains() const;

    /**
     * @brief Report of every chain and option counter
     * @return Statistics as formatted string
     */
    std::string getAllStatistics() const;

private:
    std::map<std::string, std::shared_ptr<FallbackChain>> m_chains;
    mutable std::mutex m_mutex;
};

} // namespace Maestro
