// =================================================================
// tests/ContextProtocolTest.cpp
// =================================================================
// Unit tests for ContextProtocol component.

#include "Maestro/ContextProtocol.hpp"
#include "Maestro/Logger.hpp"
#include <iostream>
#include <cassert>
#include <thread>
#include <chrono>

using namespace std::chrono_literals;

class ContextProtocolTest {
public:
    ContextProtocolTest() {
        Maestro::Logger::getInstance().setConsoleLogging(false);
        Maestro::Logger::getInstance().setFileLogging(false);
    }

    void testRoundTripInEveryScope() {
        std::cout << "Testing store and fetch by id..." << std::endl;

        Maestro::ContextProtocol protocol;
        const std::string content = "The build uses CMake 3.16 and C++17";

        for (auto scope : {Maestro::ContextScope::PRIVATE, Maestro::ContextScope::SHARED,
                           Maestro::ContextScope::GLOBAL}) {
            std::string id = protocol.storeContext("agent_a", content, Maestro::ContextType::FACT, scope, 0.6);
            assert(!id.empty());

            auto entry = protocol.getContext(id);
            assert(entry.has_value());
            assert(entry->content == content && "Content should come back unchanged");
            assert(entry->scope == scope);
            assert(entry->owner == "agent_a");
        }

        assert(!protocol.getContext("ctx_missing").has_value());

        std::cout << "✓ Round trip test passed" << std::endl;
    }

    void testVisibility() {
        std::cout << "Testing scope visibility..." << std::endl;

        Maestro::ContextProtocol protocol;
        protocol.storeContext("alice", "private note", Maestro::ContextType::OBSERVATION,
                              Maestro::ContextScope::PRIVATE);
        protocol.storeContext("alice", "announcement", Maestro::ContextType::INSTRUCTION,
                              Maestro::ContextScope::GLOBAL);

        assert(protocol.getAgentContexts("alice").size() == 2);
        auto bob_view = protocol.getAgentContexts("bob");
        assert(bob_view.size() == 1);
        assert(bob_view[0].content == "announcement");

        std::cout << "✓ Visibility test passed" << std::endl;
    }

    void testShareInPlace() {
        std::cout << "Testing share in place..." << std::endl;

        Maestro::ContextProtocol protocol;
        std::string id = protocol.storeContext("alice", "design decision", Maestro::ContextType::DECISION);
        assert(protocol.getAgentContexts("bob").empty());

        assert(protocol.shareContext(id, {"bob"}));
        auto entry = protocol.getContext(id);
        assert(entry->scope == Maestro::ContextScope::SHARED);
        assert(entry->shared_with.count("bob") == 1);

        assert(protocol.getAgentContexts("bob").size() == 1);
        assert(protocol.getAgentContexts("carol").empty());
        assert(protocol.getStatistics().total_entries == 1 && "Sharing moves the entry, never copies it");

        assert(protocol.promoteToGlobal(id));
        assert(protocol.getAgentContexts("carol").size() == 1);
        assert(protocol.getStatistics().global_entries == 1);

        assert(!protocol.shareContext("ctx_unknown", {"bob"}));
        assert(!protocol.promoteToGlobal("ctx_unknown"));

        std::cout << "✓ Share in place test passed" << std::endl;
    }

    void testRelevanceRanking() {
        std::cout << "Testing relevance ranking..." << std::endl;

        Maestro::ContextProtocol protocol;
        protocol.storeContext("agent", "database index tuning notes", Maestro::ContextType::FACT,
                              Maestro::ContextScope::PRIVATE, 0.5);
        protocol.storeContext("agent", "lunch menu for friday", Maestro::ContextType::FACT,
                              Maestro::ContextScope::PRIVATE, 0.5);
        protocol.storeContext("agent", "database backups run nightly", Maestro::ContextType::FACT,
                              Maestro::ContextScope::PRIVATE, 0.5);

        auto results = protocol.retrieveRelevantContext("agent", "database index", 2);
        assert(results.size() == 2);
        assert(results[0].content == "database index tuning notes");
        assert(results[1].content == "database backups run nightly");
        assert(results[0].relevance_score > results[1].relevance_score);

        // Importance breaks keyword ties
        Maestro::ContextProtocol weighted;
        weighted.storeContext("agent", "deploy checklist", Maestro::ContextType::FACT,
                              Maestro::ContextScope::PRIVATE, 0.1);
        weighted.storeContext("agent", "deploy runbook", Maestro::ContextType::FACT,
                              Maestro::ContextScope::PRIVATE, 0.9);
        auto ranked = weighted.retrieveRelevantContext("agent", "deploy", 5);
        assert(ranked.size() == 2);
        assert(ranked[0].content == "deploy runbook");

        assert(weighted.retrieveRelevantContext("stranger", "deploy", 5).empty());
        assert(weighted.getStatistics().retrievals == 2);

        std::cout << "✓ Relevance ranking test passed" << std::endl;
    }

    void testExpiry() {
        std::cout << "Testing expiry and cleanup..." << std::endl;

        Maestro::ContextProtocol protocol;
        std::string short_lived = protocol.storeContext("agent", "temporary fact", Maestro::ContextType::FACT,
                                                        Maestro::ContextScope::GLOBAL, 0.5, 20ms);
        std::string permanent = protocol.storeContext("agent", "permanent fact", Maestro::ContextType::FACT,
                                                      Maestro::ContextScope::GLOBAL, 0.5, 0ms);

        std::this_thread::sleep_for(50ms);

        assert(!protocol.getContext(short_lived).has_value() && "Expired entries are skipped");
        assert(protocol.getContext(permanent).has_value());
        assert(protocol.retrieveRelevantContext("agent", "fact", 10).size() == 1);
        assert(!protocol.shareContext(short_lived, {"other"}));

        assert(protocol.getStatistics().total_entries == 2 && "Still present until swept");
        assert(protocol.cleanupExpired() == 1);
        assert(protocol.getStatistics().total_entries == 1);
        assert(protocol.getStatistics().expired_removed == 1);

        std::cout << "✓ Expiry test passed" << std::endl;
    }

    void testDefaultTtlAndCleanupThread() {
        std::cout << "Testing default TTL and cleanup thread..." << std::endl;

        Maestro::ContextProtocolConfig config;
        config.default_ttl = 20ms;
        Maestro::ContextProtocol protocol(config);

        protocol.storeContext("agent", "fades away");
        protocol.storeContext("agent", "stays", Maestro::ContextType::FACT,
                              Maestro::ContextScope::PRIVATE, 0.5, 0ms);

        protocol.startCleanupThread(10ms);
        std::this_thread::sleep_for(150ms);
        protocol.stopCleanupThread();

        auto stats = protocol.getStatistics();
        assert(stats.total_entries == 1 && "Cleanup thread should physically remove expired entries");
        assert(stats.expired_removed == 1);

        std::cout << "✓ Cleanup thread test passed" << std::endl;
    }

    void testDeleteAndImportance() {
        std::cout << "Testing delete and importance update..." << std::endl;

        Maestro::ContextProtocol protocol;
        std::string id = protocol.storeContext("agent", "fact");
        assert(protocol.updateImportance(id, 2.0));
        assert(protocol.getContext(id)->importance == 1.0);
        assert(protocol.deleteContext(id));
        assert(!protocol.deleteContext(id));
        assert(!protocol.updateImportance(id, 0.5));

        std::cout << "✓ Delete test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ContextProtocol unit tests..." << std::endl;
        std::cout << "=====================================" << std::endl << std::endl;

        testRoundTripInEveryScope();
        std::cout << std::endl;

        testVisibility();
        std::cout << std::endl;

        testShareInPlace();
        std::cout << std::endl;

        testRelevanceRanking();
        std::cout << std::endl;

        testExpiry();
        std::cout << std::endl;

        testDefaultTtlAndCleanupThread();
        std::cout << std::endl;

        testDeleteAndImportance();
        std::cout << std::endl;

        std::cout << "All ContextProtocol tests passed!" << std::endl;
    }
};

int main() {
    try {
        ContextProtocolTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All ContextProtocol component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
