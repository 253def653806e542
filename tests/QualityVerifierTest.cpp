// =================================================================
// tests/QualityVerifierTest.cpp
// =================================================================
// Unit tests for QualityVerifier component.

#include "Maestro/QualityVerifier.hpp"
#include "Maestro/Logger.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <algorithm>

class QualityVerifierTest {
private:
    static Maestro::Task researchTask() {
        Maestro::Task task;
        task.id = "t1";
        task.description = "Research caching";
        task.requirements = {"research"};
        return task;
    }

    static Maestro::Result goodResult() {
        Maestro::Result result;
        result.task_id = "t1";
        result.agent_id = "research-1";
        result.success = true;
        result.quality_score = 0.8;
        result.payload = {
            {"summary", "Research findings on caching"},
            {"sources", {"https://example.org/caching-study"}},
            {"confidence", 0.8}
        };
        return result;
    }

    static bool near(double a, double b) {
        return std::fabs(a - b) < 1e-9;
    }

    static bool hasFinding(const Maestro::VerificationReport& report, const std::string& text) {
        return std::any_of(report.findings.begin(), report.findings.end(),
                           [&](const std::string& finding) { return finding.find(text) != std::string::npos; });
    }

public:
    QualityVerifierTest() {
        Maestro::Logger::getInstance().setConsoleLogging(false);
        Maestro::Logger::getInstance().setFileLogging(false);
    }

    void testWellFormedResultPasses() {
        std::cout << "Testing well-formed result..." << std::endl;

        Maestro::QualityVerifier verifier;
        auto report = verifier.verify(researchTask(), goodResult());

        assert(report.task_id == "t1");
        assert(report.scores.size() == 5);
        assert(near(report.scores.at("accuracy"), (0.85 + 1.0) / 2.0) && "Confidence matches quality");
        assert(near(report.scores.at("completeness"), 1.0));
        assert(near(report.scores.at("source_quality"), 0.6));
        assert(near(report.scores.at("confidence"), 1.0));
        assert(near(report.scores.at("integrity"), 1.0));
        assert(near(report.overall, (0.925 + 1.0 + 0.6 + 1.0 + 1.0) / 5.0));
        assert(report.passed);

        assert(hasFinding(report, "High completeness"));
        assert(hasFinding(report, "Low source_quality (0.60)"));
        assert(hasFinding(report, "Recommendation: cite credible sources"));
        assert(!hasFinding(report, "Recommendation: address every task requirement"));

        auto json = report.toJson();
        assert(json["passed"] == true);
        assert(json["scores"].size() == 5);

        std::cout << "✓ Well-formed result test passed" << std::endl;
    }

    void testBrokenResultFails() {
        std::cout << "Testing broken result..." << std::endl;

        Maestro::QualityVerifier verifier;
        Maestro::Result result;
        result.task_id = "t1";

        auto report = verifier.verify(researchTask(), result);
        assert(near(report.scores.at("accuracy"), 0.85));
        assert(near(report.scores.at("completeness"), (0.6 + 0.0) / 2.0) && "Empty, silent and off-topic");
        assert(near(report.scores.at("source_quality"), 0.8));
        assert(near(report.scores.at("confidence"), 0.9));
        assert(near(report.scores.at("integrity"), 0.2));
        assert(near(report.overall, 0.61));
        assert(!report.passed);
        assert(hasFinding(report, "Low integrity"));
        assert(hasFinding(report, "Recommendation: address every task requirement"));

        // A stated error and an agent id restore some integrity
        result.error = "backend down";
        result.agent_id = "research-1";
        report = verifier.verify(researchTask(), result);
        assert(near(report.scores.at("integrity"), 0.5));

        std::cout << "✓ Broken result test passed" << std::endl;
    }

    void testIndividualChecks() {
        std::cout << "Testing individual checks..." << std::endl;

        Maestro::QualityVerifier verifier;
        Maestro::Task untargeted;

        // Contradicting claims cost accuracy
        Maestro::Result claims = goodResult();
        claims.payload = {{"summary", "Prices always rise and never fall"}};
        auto report = verifier.verify(untargeted, claims);
        assert(near(report.scores.at("accuracy"), 0.80));
        assert(near(report.scores.at("completeness"), 1.0) && "No requirements to miss");

        // Overconfidence
        Maestro::Result boastful = goodResult();
        boastful.quality_score = 0.5;
        boastful.payload["confidence"] = 0.9;
        report = verifier.verify(untargeted, boastful);
        assert(near(report.scores.at("confidence"), 0.6));
        assert(hasFinding(report, "Recommendation: align confidence with result quality"));

        boastful.payload["confidence"] = 1.5;
        report = verifier.verify(untargeted, boastful);
        assert(near(report.scores.at("confidence"), 0.0) && "Confidence must be a probability");

        // Sources are averaged, a single string counts as one
        Maestro::Result cited = goodResult();
        cited.payload["sources"] = {"https://example.org/caching-study", "blog"};
        report = verifier.verify(untargeted, cited);
        assert(near(report.scores.at("source_quality"), 0.3));

        cited.payload.erase("sources");
        cited.payload["references"] = "doi:10.1000/182 published by a research lab";
        report = verifier.verify(untargeted, cited);
        assert(near(report.scores.at("source_quality"), 0.4));

        // Requirements are matched word by word
        Maestro::Task analysis;
        analysis.requirements = {"data_analysis", "code"};
        Maestro::Result partial = goodResult();
        partial.payload = {{"summary", "The data shows three clusters"}};
        report = verifier.verify(analysis, partial);
        assert(near(report.scores.at("completeness"), (1.0 + 0.5) / 2.0));

        std::cout << "✓ Individual checks test passed" << std::endl;
    }

    void testThresholdAndStatistics() {
        std::cout << "Testing threshold and statistics..." << std::endl;

        Maestro::QualityVerifierConfig config;
        config.pass_threshold = 0.95;
        Maestro::QualityVerifier strict(config);

        auto report = strict.verify(researchTask(), goodResult());
        assert(!report.passed && "A stricter threshold rejects the same result");

        Maestro::Result empty;
        strict.verify(researchTask(), empty);

        auto stats = strict.getStatistics();
        assert(stats.verified == 2);
        assert(stats.passed == 0);
        assert(stats.failed == 2);
        assert(stats.average_overall > 0.6 && stats.average_overall < 0.91);

        Maestro::QualityVerifier lenient;
        lenient.verify(researchTask(), goodResult());
        assert(lenient.getStatistics().passed == 1);
        assert(near(lenient.getStatistics().average_overall, 0.905));

        std::cout << "✓ Threshold and statistics test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running QualityVerifier unit tests..." << std::endl;
        std::cout << "=====================================" << std::endl << std::endl;

        testWellFormedResultPasses();
        std::cout << std::endl;

        testBrokenResultFails();
        std::cout << std::endl;

        testIndividualChecks();
        std::cout << std::endl;

        testThresholdAndStatistics();
        std::cout << std::endl;

        std::cout << "All QualityVerifier tests passed!" << std::endl;
    }
};

int main() {
    try {
        QualityVerifierTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All QualityVerifier component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
