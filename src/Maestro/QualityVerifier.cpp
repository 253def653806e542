// =================================================================
// src/Maestro/QualityVerifier.cpp
// =================================================================
// Implementation of the result quality checks.

#include "Maestro/QualityVerifier.hpp"
#include "Maestro/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>
#include <utility>

using json = nlohmann::json;

namespace Maestro {

namespace {

const char* const CHECK_ACCURACY = "accuracy";
const char* const CHECK_COMPLETENESS = "completeness";
const char* const CHECK_SOURCES = "source_quality";
const char* const CHECK_CONFIDENCE = "confidence";
const char* const CHECK_INTEGRITY = "integrity";

// Scores below this are reported as low, below HIGH_SCORE as moderate
const double LOW_SCORE = 0.7;
const double HIGH_SCORE = 0.85;

const std::pair<const char*, const char*> CONTRADICTIONS[] = {
    {"always", "never"},
    {"all", "none"},
    {"increase", "decrease"},
};

std::string lowered(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::set<std::string> words(const std::string& text) {
    std::set<std::string> out;
    std::string current;
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            current += static_cast<char>(std::tolower(c));
        } else if (!current.empty()) {
            out.insert(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        out.insert(current);
    }
    return out;
}

bool isEmptyPayload(const json& payload) {
    if (payload.is_null()) return true;
    if (payload.is_string()) return payload.get<std::string>().empty();
    if (payload.is_array() || payload.is_object()) return payload.empty();
    return false;
}

std::string describe(const std::string& check, double score) {
    std::ostringstream line;
    line << (score < LOW_SCORE ? "Low " : score < HIGH_SCORE ? "Moderate " : "High ")
         << check << " (" << std::fixed << std::setprecision(2) << score << ")";
    return line.str();
}

} // anonymous namespace

json VerificationReport::toJson() const {
    return {
        {"task_id", task_id},
        {"scores", scores},
        {"overall", overall},
        {"passed", passed},
        {"findings", findings}
    };
}

QualityVerifier::QualityVerifier(const QualityVerifierConfig& config)
    : m_config(config) {
}

VerificationReport QualityVerifier::verify(const Task& task, const Result& result) {
    VerificationReport report;
    report.task_id = result.task_id;
    report.scores[CHECK_ACCURACY] = checkAccuracy(result);
    report.scores[CHECK_COMPLETENESS] = checkCompleteness(task, result);
    report.scores[CHECK_SOURCES] = checkSources(result);
    report.scores[CHECK_CONFIDENCE] = checkConfidence(result);
    report.scores[CHECK_INTEGRITY] = checkIntegrity(result);

    double sum = 0.0;
    for (const auto& [check, score] : report.scores) {
        sum += score;
        report.findings.push_back(describe(check, score));
    }
    report.overall = sum / report.scores.size();
    report.passed = report.overall >= m_config.pass_threshold;

    if (report.scores[CHECK_COMPLETENESS] < 0.8) {
        report.findings.push_back("Recommendation: address every task requirement");
    }
    if (report.scores[CHECK_SOURCES] < LOW_SCORE) {
        report.findings.push_back("Recommendation: cite credible sources");
    }
    if (report.scores[CHECK_CONFIDENCE] < 0.75) {
        report.findings.push_back("Recommendation: align confidence with result quality");
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats.verified++;
        if (report.passed) {
            m_stats.passed++;
        } else {
            m_stats.failed++;
        }
        m_overall_sum += report.overall;
        m_stats.average_overall = m_overall_sum / m_stats.verified;
    }

    std::ostringstream context;
    context << "Overall: " << std::fixed << std::setprecision(2) << report.overall;
    Logger::getInstance().debug("QualityVerifier", "Result for " + report.task_id +
                               (report.passed ? " passed" : " failed") + " verification", context.str());
    return report;
}

VerificationStatistics QualityVerifier::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_stats;
}

double QualityVerifier::checkAccuracy(const Result& result) {
    double score = 0.85;

    if (!result.payload.is_null()) {
        std::set<std::string> terms = words(result.payload.dump());
        for (const auto& [first, second] : CONTRADICTIONS) {
            if (terms.count(first) > 0 && terms.count(second) > 0) {
                score -= 0.05;
            }
        }
    }

    if (result.payload.is_object() && result.payload.contains("confidence") &&
        result.payload["confidence"].is_number()) {
        double confidence = result.payload["confidence"].get<double>();
        score = (score + 1.0 - std::fabs(result.quality_score - confidence)) / 2.0;
    }
    return std::clamp(score, 0.0, 1.0);
}

double QualityVerifier::checkCompleteness(const Task& task, const Result& result) {
    double score = 1.0;
    if (isEmptyPayload(result.payload)) {
        score -= 0.3;
    }
    if (!result.success && result.error.empty()) {
        score -= 0.1;
    }

    if (!task.requirements.empty()) {
        std::string text = lowered(result.payload.dump());
        size_t met = 0;
        for (const auto& requirement : task.requirements) {
            for (const auto& word : words(requirement)) {
                if (text.find(word) != std::string::npos) {
                    ++met;
                    break;
                }
            }
        }
        score = (score + static_cast<double>(met) / task.requirements.size()) / 2.0;
    }
    return std::clamp(score, 0.0, 1.0);
}

double QualityVerifier::checkSources(const Result& result) {
    // Results without sources are neither rewarded nor punished much
    double score = 0.8;
    if (!result.payload.is_object()) {
        return score;
    }

    json sources;
    if (result.payload.contains("sources")) {
        sources = result.payload["sources"];
    } else if (result.payload.contains("references")) {
        sources = result.payload["references"];
    }
    if (isEmptyPayload(sources)) {
        return score;
    }
    if (!sources.is_array()) {
        sources = json::array({sources});
    }

    double total = 0.0;
    for (const auto& source : sources) {
        std::string text = lowered(source.is_string() ? source.get<std::string>() : source.dump());
        if (text.find("http://") != std::string::npos || text.find("https://") != std::string::npos ||
            text.find("doi:") != std::string::npos || text.find("isbn:") != std::string::npos) {
            total += 0.3;
        }
        if (text.find(".edu") != std::string::npos || text.find(".gov") != std::string::npos ||
            text.find(".org") != std::string::npos) {
            total += 0.2;
        }
        if (text.size() > 20) {
            total += 0.1;
        }
    }
    return std::min(1.0, total / sources.size());
}

double QualityVerifier::checkConfidence(const Result& result) {
    if (!result.payload.is_object() || !result.payload.contains("confidence") ||
        !result.payload["confidence"].is_number()) {
        return 0.9;
    }
    double confidence = result.payload["confidence"].get<double>();
    if (confidence < 0.0 || confidence > 1.0) {
        return 0.0;
    }
    return 1.0 - std::fabs(confidence - result.quality_score);
}

double QualityVerifier::checkIntegrity(const Result& result) {
    double score = 1.0;
    if (result.payload.is_null()) {
        score -= 0.5;
    } else if (isEmptyPayload(result.payload)) {
        score -= 0.2;
    }
    if (!result.success && result.error.empty()) {
        score -= 0.2;
    }
    if (result.agent_id.empty()) {
        score -= 0.1;
    }
    return std::clamp(score, 0.0, 1.0);
}

} // namespace Maestro
