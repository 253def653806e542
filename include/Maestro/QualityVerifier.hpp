// =================================================================
// include/Maestro/QualityVerifier.hpp
// =================================================================
// Scores worker results for accuracy, completeness, sources, confidence
// and structural integrity before the orchestrator reports them.

#pragma once

#include "Maestro/Types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <map>
#include <mutex>

namespace Maestro {

/**
 * @brief Quality verifier configuration
 */
struct QualityVerifierConfig {
    double pass_threshold = 0.7;                  ///< Overall score a result needs to pass
};

/**
 * @brief Outcome of verifying one result
 */
struct VerificationReport {
    std::string task_id;
    std::map<std::string, double> scores;         ///< Check name to score (0.0-1.0)
    double overall = 0.0;                         ///< Mean of the check scores
    bool passed = false;
    std::vector<std::string> findings;            ///< One line per check plus recommendations

    nlohmann::json toJson() const;
};

struct VerificationStatistics {
    size_t verified = 0;
    size_t passed = 0;
    size_t failed = 0;
    double average_overall = 0.0;
};

/**
 * @brief Heuristic checker for worker results
 *
 * Checks only look at the result itself and the task it answers, so
 * verify() can run on any thread.
 */
class QualityVerifier {
public:
    explicit QualityVerifier(const QualityVerifierConfig& config = QualityVerifierConfig());

    /**
     * @brief Score a result against the task it answers
     * @param task Task the result belongs to
     * @param result Worker result
     * @return Per-check scores, overall score and findings
     */
    VerificationReport verify(const Task& task, const Result& result);

    VerificationStatistics getStatistics() const;

    const QualityVerifierConfig& getConfig() const { return m_config; }

private:
    QualityVerifierConfig m_config;
    VerificationStatistics m_stats;
    double m_overall_sum = 0.0;
    mutable std::mutex m_mutex;

    static double checkAccuracy(const Result& result);
    static double checkCompleteness(const Task& task, const Result& result);
    static double checkSources(const Result& result);
    static double checkConfidence(const Result& result);
    static double checkIntegrity(const Result& result);
};

} // namespace Maestro
