// =================================================================
// tests/MessageBusTest.cpp
// =================================================================
// Unit tests for MessageBus component.

#include "Maestro/MessageBus.hpp"
#include "Maestro/Logger.hpp"
#include <iostream>
#include <cassert>
#include <thread>
#include <chrono>
#include <atomic>

using namespace std::chrono_literals;

class MessageBusTest {
private:
    Maestro::Message makeMessage(const std::string& sender, const std::string& recipient,
                                 int priority = 5, const std::string& text = "") {
        Maestro::Message message;
        message.sender = sender;
        message.recipient = recipient;
        message.priority = priority;
        message.payload = {{"text", text}};
        return message;
    }

public:
    MessageBusTest() {
        Maestro::Logger::getInstance().setConsoleLogging(false);
        Maestro::Logger::getInstance().setFileLogging(false);
    }

    void testRegistration() {
        std::cout << "Testing agent registration..." << std::endl;

        Maestro::MessageBus bus;
        assert(bus.registerAgent("a") && "First registration should succeed");
        assert(!bus.registerAgent("a") && "Duplicate registration should fail");
        assert(bus.registerAgent("b"));
        assert(bus.isRegistered("a"));

        auto agents = bus.getRegisteredAgents();
        assert(agents.size() == 2);
        assert(agents[0] == "a" && agents[1] == "b");

        assert(bus.unregisterAgent("a"));
        assert(!bus.isRegistered("a"));
        assert(!bus.unregisterAgent("a") && "Unregistering twice should fail");

        std::cout << "✓ Registration test passed" << std::endl;
    }

    void testDirectDelivery() {
        std::cout << "Testing direct delivery..." << std::endl;

        Maestro::MessageBus bus;
        bus.registerAgent("sender");
        bus.registerAgent("receiver");

        assert(bus.send(makeMessage("sender", "receiver", 5, "hello")));
        assert(bus.pendingCount("receiver") == 1);

        auto received = bus.receive("receiver", 100ms);
        assert(received.has_value());
        assert(received->payload["text"] == "hello");
        assert(!received->id.empty() && "Bus should assign an id");
        assert(bus.pendingCount("receiver") == 0);

        // Unknown recipient is dropped
        assert(!bus.send(makeMessage("sender", "nobody")));

        auto stats = bus.getStatistics();
        assert(stats.total_messages == 2);
        assert(stats.direct_messages == 2);
        assert(stats.dropped == 1);

        std::cout << "✓ Direct delivery test passed" << std::endl;
    }

    void testPriorityThenFifoOrdering() {
        std::cout << "Testing priority then FIFO ordering..." << std::endl;

        Maestro::MessageBus bus;
        bus.registerAgent("r");

        bus.send(makeMessage("s", "r", 1, "low-1"));
        bus.send(makeMessage("s", "r", 9, "high-1"));
        bus.send(makeMessage("s", "r", 5, "mid-1"));
        bus.send(makeMessage("s", "r", 9, "high-2"));
        bus.send(makeMessage("s", "r", 1, "low-2"));

        std::vector<std::string> order;
        for (int i = 0; i < 5; ++i) {
            auto message = bus.receive("r", 50ms);
            assert(message.has_value());
            order.push_back(message->payload["text"].get<std::string>());
        }

        std::vector<std::string> expected = {"high-1", "high-2", "mid-1", "low-1", "low-2"};
        assert(order == expected && "Higher priority first, FIFO within equal priority");

        std::cout << "✓ Ordering test passed" << std::endl;
    }

    void testBoundedQueue() {
        std::cout << "Testing bounded queue capacity..." << std::endl;

        Maestro::MessageBusConfig config;
        config.queue_capacity = 2;
        Maestro::MessageBus bus(config);
        bus.registerAgent("r");

        assert(bus.send(makeMessage("s", "r")));
        assert(bus.send(makeMessage("s", "r")));
        assert(!bus.send(makeMessage("s", "r")) && "Third message should be dropped");
        assert(bus.getStatistics().dropped == 1);
        assert(bus.pendingCount("r") == 2);

        std::cout << "✓ Bounded queue test passed" << std::endl;
    }

    void testTtlExpiry() {
        std::cout << "Testing message TTL..." << std::endl;

        Maestro::MessageBus bus;
        bus.registerAgent("r");

        // Zero TTL never expires, however old the message is
        Maestro::Message ancient = makeMessage("s", "r", 5, "ancient");
        ancient.timestamp = std::chrono::system_clock::now() - std::chrono::hours(24 * 365);
        ancient.ttl = std::chrono::milliseconds(0);
        assert(!ancient.isExpired());
        assert(bus.send(ancient));

        // Already past TTL at send time
        Maestro::Message stale = makeMessage("s", "r", 5, "stale");
        stale.timestamp = std::chrono::system_clock::now() - std::chrono::seconds(10);
        stale.ttl = std::chrono::milliseconds(100);
        assert(stale.isExpired());
        assert(!bus.send(stale) && "Expired message should be refused");

        // Expires while queued
        Maestro::Message short_lived = makeMessage("s", "r", 9, "short");
        short_lived.ttl = std::chrono::milliseconds(20);
        assert(bus.send(short_lived));
        std::this_thread::sleep_for(60ms);

        auto received = bus.receive("r", 50ms);
        assert(received.has_value());
        assert(received->payload["text"] == "ancient" && "Expired message should be skipped");
        assert(!bus.receive("r", 20ms).has_value());

        auto stats = bus.getStatistics();
        assert(stats.expired == 1);
        assert(stats.dropped == 1);

        std::cout << "✓ TTL test passed" << std::endl;
    }

    void testBroadcast() {
        std::cout << "Testing broadcast..." << std::endl;

        Maestro::MessageBus bus;
        bus.registerAgent("a");
        bus.registerAgent("b");
        bus.registerAgent("c");

        assert(bus.send(makeMessage("a", "*", 5, "everyone")));
        assert(bus.pendingCount("a") == 0 && "Sender should not receive its own broadcast");
        assert(bus.pendingCount("b") == 1);
        assert(bus.pendingCount("c") == 1);

        auto message = bus.receive("b", 50ms);
        assert(message.has_value());
        assert(message->recipient == "b");

        assert(bus.getStatistics().broadcasts == 1);

        std::cout << "✓ Broadcast test passed" << std::endl;
    }

    void testReceiveTimeoutAndWakeOnUnregister() {
        std::cout << "Testing receive timeout and unregister wake-up..." << std::endl;

        Maestro::MessageBus bus;
        bus.registerAgent("idle");

        auto start = std::chrono::steady_clock::now();
        assert(!bus.receive("idle", 50ms).has_value());
        assert(std::chrono::steady_clock::now() - start >= 40ms);

        assert(!bus.receive("ghost", 10ms).has_value() && "Unknown agent returns empty");

        std::atomic<bool> returned{false};
        std::thread blocked([&]() {
            auto message = bus.receive("idle");
            assert(!message.has_value());
            returned = true;
        });

        std::this_thread::sleep_for(50ms);
        bus.unregisterAgent("idle");
        blocked.join();
        assert(returned.load());

        std::cout << "✓ Timeout and wake-up test passed" << std::endl;
    }

    void testRequestResponse() {
        std::cout << "Testing request/response correlation..." << std::endl;

        Maestro::MessageBus bus;
        bus.registerAgent("client");
        bus.registerAgent("server");

        std::thread server([&]() {
            auto request = bus.receive("server", 1000ms);
            assert(request.has_value());
            assert(request->requires_response);
            bus.send(Maestro::MessageBus::createResponse(*request, {{"answer", 42}}));
        });

        Maestro::Message request = makeMessage("client", "server");
        request.type = Maestro::MessageType::REQUEST;
        auto reply = bus.sendAndWaitResponse(request, 1000ms);
        server.join();

        assert(reply.has_value());
        assert(reply->payload["answer"] == 42);
        assert(reply->type == Maestro::MessageType::RESPONSE);
        assert(bus.pendingCount("client") == 0 && "Correlated reply goes to the waiter, not the queue");

        // Nobody answers
        auto silent = bus.sendAndWaitResponse(makeMessage("client", "server"), 50ms);
        assert(!silent.has_value());

        auto stats = bus.getStatistics();
        assert(stats.responses_delivered == 1);
        assert(stats.response_timeouts == 1);

        std::cout << "✓ Request/response test passed" << std::endl;
    }

    void testPublishSubscribe() {
        std::cout << "Testing publish/subscribe..." << std::endl;

        Maestro::MessageBus bus;
        bus.registerAgent("publisher");
        bus.registerAgent("s1");
        bus.registerAgent("s2");

        assert(bus.subscribe("s1", "results"));
        assert(!bus.subscribe("s1", "results") && "Duplicate subscription should fail");
        assert(bus.subscribe("s2", "results"));
        assert(bus.subscribe("publisher", "results"));
        assert(!bus.subscribe("ghost", "results"));

        size_t delivered = bus.publish("results", makeMessage("publisher", "", 5, "news"));
        assert(delivered == 2 && "Publisher should not receive its own publication");

        auto m1 = bus.receive("s1", 50ms);
        auto m2 = bus.receive("s2", 50ms);
        assert(m1.has_value() && m2.has_value());
        assert(m1->id != m2->id && "Each subscriber gets its own message id");

        assert(bus.unsubscribe("s1", "results"));
        assert(bus.publish("results", makeMessage("publisher", "")) == 1);

        bus.unregisterAgent("s2");
        assert(bus.publish("results", makeMessage("publisher", "")) == 0);

        std::cout << "✓ Publish/subscribe test passed" << std::endl;
    }

    void testHistory() {
        std::cout << "Testing message history..." << std::endl;

        Maestro::MessageBusConfig config;
        config.history_size = 3;
        Maestro::MessageBus bus(config);
        bus.registerAgent("r");

        for (int i = 0; i < 5; ++i) {
            bus.send(makeMessage("s", "r", 5, std::to_string(i)));
        }

        auto history = bus.getHistory();
        assert(history.size() == 3 && "History is bounded");
        assert(history.front().payload["text"] == "2");
        assert(history.back().payload["text"] == "4");

        auto last = bus.getHistory(1);
        assert(last.size() == 1);
        assert(last[0].payload["text"] == "4");

        std::cout << "✓ History test passed" << std::endl;
    }

    void testConcurrentSenders() {
        std::cout << "Testing concurrent senders..." << std::endl;

        Maestro::MessageBus bus;
        bus.registerAgent("sink");

        std::vector<std::thread> senders;
        for (int t = 0; t < 4; ++t) {
            senders.emplace_back([&bus, t]() {
                for (int i = 0; i < 50; ++i) {
                    Maestro::Message message;
                    message.sender = "sender-" + std::to_string(t);
                    message.recipient = "sink";
                    bus.send(message);
                }
            });
        }
        for (auto& sender : senders) {
            sender.join();
        }

        assert(bus.pendingCount("sink") == 200);
        assert(bus.getStatistics().total_messages == 200);

        std::cout << "✓ Concurrent senders test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running MessageBus unit tests..." << std::endl;
        std::cout << "================================" << std::endl << std::endl;

        testRegistration();
        std::cout << std::endl;

        testDirectDelivery();
        std::cout << std::endl;

        testPriorityThenFifoOrdering();
        std::cout << std::endl;

        testBoundedQueue();
        std::cout << std::endl;

        testTtlExpiry();
        std::cout << std::endl;

        testBroadcast();
        std::cout << std::endl;

        testReceiveTimeoutAndWakeOnUnregister();
        std::cout << std::endl;

        testRequestResponse();
        std::cout << std::endl;

        testPublishSubscribe();
        std::cout << std::endl;

        testHistory();
        std::cout << std::endl;

        testConcurrentSenders();
        std::cout << std::endl;

        std::cout << "All MessageBus tests passed!" << std::endl;
    }
};

int main() {
    try {
        MessageBusTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All MessageBus component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
