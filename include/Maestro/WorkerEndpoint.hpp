// =================================================================
// include/Maestro/WorkerEndpoint.hpp
// =================================================================
// Binds one worker agent to the message bus with a single service thread.

#pragma once

#include "Maestro/Agent.hpp"
#include "Maestro/MessageBus.hpp"
#include <string>
#include <memory>
#include <thread>
#include <atomic>
#include <chrono>

namespace Maestro {

/**
 * @brief Bus-facing service loop for one agent
 *
 * Receives TASK_ASSIGNMENT messages addressed to the agent id, runs
 * processTask with the busy flag raised, and replies with a correlated
 * TASK_RESULT. One service thread means at most one task in flight.
 */
class WorkerEndpoint {
public:
    /**
     * @brief Constructor
     * @param bus Message bus the endpoint listens on
     * @param agent Agent to serve
     * @param poll_interval Receive timeout between stop-flag checks
     */
    WorkerEndpoint(MessageBus& bus, std::shared_ptr<Agent> agent,
                   std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500));

    /**
     * @brief Destructor, stops the service thread
     */
    virtual ~WorkerEndpoint();

    WorkerEndpoint(const WorkerEndpoint&) = delete;
    WorkerEndpoint& operator=(const WorkerEndpoint&) = delete;

    /**
     * @brief Register the agent on the bus and start serving
     * @return False if already running or the agent id is taken
     */
    bool start();

    /**
     * @brief Stop serving and unregister the agent
     */
    void stop();

    bool isRunning() const { return m_running.load(); }
    bool isBusy() const { return m_busy.load(); }
    size_t getProcessedCount() const { return m_processed.load(); }

    std::string getAgentId() const { return m_agent->getId(); }
    std::shared_ptr<Agent> getAgent() const { return m_agent; }

private:
    MessageBus& m_bus;
    std::shared_ptr<Agent> m_agent;
    std::chrono::milliseconds m_poll_interval;

    std::unique_ptr<std::thread> m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_busy{false};
    std::atomic<size_t> m_processed{0};

    void serviceLoop();
    void handleAssignment(const Message& message);
};

} // namespace Maestro
