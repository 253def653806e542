// =================================================================
// tests/LoadBalancerTest.cpp
// =================================================================
// Unit tests for LoadBalancer component.

#include "Maestro/LoadBalancer.hpp"
#include "Maestro/Logger.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <thread>
#include <atomic>
#include <vector>

class LoadBalancerTest {
private:
    std::unique_ptr<Maestro::LoadBalancer> m_load_balancer;

    std::vector<Maestro::Task> makeTasks(size_t count) {
        std::vector<Maestro::Task> tasks;
        for (size_t i = 0; i < count; ++i) {
            Maestro::Task task;
            task.id = "t" + std::to_string(i);
            task.description = "Task " + std::to_string(i);
            tasks.push_back(task);
        }
        return tasks;
    }

public:
    LoadBalancerTest() {
        Maestro::Logger::getInstance().setConsoleLogging(false);
        Maestro::Logger::getInstance().setFileLogging(false);
        m_load_balancer = std::make_unique<Maestro::LoadBalancer>();
    }

    void testLoadTracking() {
        std::cout << "Testing load tracking..." << std::endl;

        m_load_balancer->setLoad("agent_a", 0.4);
        assert(std::fabs(m_load_balancer->getLoad("agent_a") - 0.4) < 1e-9);

        m_load_balancer->setLoad("agent_a", 1.7);
        assert(m_load_balancer->getLoad("agent_a") == 1.0 && "Load should be clamped to 1.0");

        m_load_balancer->setLoad("agent_a", -0.5);
        assert(m_load_balancer->getLoad("agent_a") == 0.0 && "Load should be clamped to 0.0");

        assert(m_load_balancer->getLoad("untracked") == 0.0);

        std::cout << "✓ Load tracking test passed" << std::endl;
    }

    void testLeastLoadedAgent() {
        std::cout << "Testing least loaded selection..." << std::endl;

        Maestro::LoadBalancer balancer;
        balancer.setLoad("a", 0.6);
        balancer.setLoad("b", 0.2);
        balancer.setLoad("c", 0.2);

        assert(balancer.leastLoadedAgent({"a", "b", "c"}) == "b" && "Earliest candidate wins ties");
        assert(balancer.leastLoadedAgent({"a", "c", "b"}) == "c");
        assert(balancer.leastLoadedAgent({"a", "fresh"}) == "fresh" && "Untracked agents count as idle");
        assert(balancer.leastLoadedAgent({}).empty());

        std::cout << "✓ Least loaded test passed" << std::endl;
    }

    void testDistributeTasks() {
        std::cout << "Testing round-robin distribution over load-sorted agents..." << std::endl;

        Maestro::LoadBalancer balancer;
        balancer.setLoad("B", 0.9);
        balancer.setLoad("A", 0.1);

        auto distribution = balancer.distributeTasks(makeTasks(4), {"B", "A"});
        assert(distribution.size() == 2);
        assert(distribution["A"].size() == 2);
        assert(distribution["A"][0].id == "t0");
        assert(distribution["A"][1].id == "t2");
        assert(distribution["B"].size() == 2);
        assert(distribution["B"][0].id == "t1");
        assert(distribution["B"][1].id == "t3");

        // Equal loads keep input order
        Maestro::LoadBalancer even;
        auto tied = even.distributeTasks(makeTasks(3), {"y", "x"});
        assert(tied["y"].size() == 2);
        assert(tied["y"][0].id == "t0");
        assert(tied["x"][0].id == "t1");

        assert(balancer.distributeTasks(makeTasks(2), {}).empty());
        assert(balancer.distributeTasks({}, {"A"}).empty());

        std::cout << "✓ Distribution test passed" << std::endl;
    }

    void testTaskRecording() {
        std::cout << "Testing task recording..." << std::endl;

        Maestro::LoadBalancer balancer;
        balancer.recordTaskStart("worker");
        balancer.recordTaskStart("worker");
        assert(balancer.getActiveTasks("worker") == 2);

        balancer.recordTaskEnd("worker", 100.0, true);
        balancer.recordTaskEnd("worker", 200.0, false);
        assert(balancer.getActiveTasks("worker") == 0);

        // Never drops below zero
        balancer.recordTaskEnd("worker", 50.0, true);
        assert(balancer.getActiveTasks("worker") == 0);

        std::string stats = balancer.getStatistics();
        assert(stats.find("Load Balancer Statistics") != std::string::npos);
        assert(stats.find("Agent: worker") != std::string::npos);
        assert(stats.find("Completed: 2") != std::string::npos);
        assert(stats.find("Failed: 1") != std::string::npos);

        std::cout << "✓ Task recording test passed" << std::endl;
    }

    void testConcurrentUpdates() {
        std::cout << "Testing concurrent updates..." << std::endl;

        Maestro::LoadBalancer balancer;
        std::vector<std::thread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&balancer, t]() {
                std::string id = "agent_" + std::to_string(t % 4);
                for (int i = 0; i < 100; ++i) {
                    balancer.recordTaskStart(id);
                    balancer.setLoad(id, i / 100.0);
                    balancer.recordTaskEnd(id, 1.0, true);
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        auto tracked = balancer.getTrackedAgents();
        assert(tracked.size() == 4);
        for (const auto& id : tracked) {
            assert(balancer.getActiveTasks(id) == 0);
        }

        std::cout << "✓ Concurrent update test passed" << std::endl;
    }

    void testRemoveAgent() {
        std::cout << "Testing agent removal..." << std::endl;

        m_load_balancer->setLoad("temporary", 0.5);
        assert(m_load_balancer->removeAgent("temporary"));
        assert(!m_load_balancer->removeAgent("temporary"));
        assert(m_load_balancer->getLoad("temporary") == 0.0);

        std::cout << "✓ Agent removal test passed" << std::endl;
    }

    void testRemoveDuringUpdates() {
        std::cout << "Testing removal racing with updates..." << std::endl;

        Maestro::LoadBalancer balancer;
        std::atomic<bool> running{true};
        std::thread updater([&balancer, &running]() {
            while (running.load()) {
                balancer.setLoad("churn", 0.5);
                balancer.recordTaskStart("churn");
                balancer.recordTaskEnd("churn", 2.0, true);
                (void)balancer.getLoad("churn");
            }
        });

        for (int i = 0; i < 2000; ++i) {
            balancer.removeAgent("churn");
        }
        running = false;
        updater.join();

        // Updates after the last removal recreate the entry
        balancer.recordTaskStart("churn");
        assert(balancer.getActiveTasks("churn") >= 1);
        assert(balancer.removeAgent("churn"));
        assert(balancer.getActiveTasks("churn") == 0);

        std::cout << "✓ Removal race test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running LoadBalancer unit tests..." << std::endl;
        std::cout << "==================================" << std::endl << std::endl;

        testLoadTracking();
        std::cout << std::endl;

        testLeastLoadedAgent();
        std::cout << std::endl;

        testDistributeTasks();
        std::cout << std::endl;

        testTaskRecording();
        std::cout << std::endl;

        testConcurrentUpdates();
        std::cout << std::endl;

        testRemoveAgent();
        std::cout << std::endl;

        testRemoveDuringUpdates();
        std::cout << std::endl;

        std::cout << "All LoadBalancer tests passed!" << std::endl;
    }
};

int main() {
    try {
        LoadBalancerTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All LoadBalancer component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
