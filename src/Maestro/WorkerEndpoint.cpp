// =================================================================
// src/Maestro/WorkerEndpoint.cpp
// =================================================================
// Service loop delivering bus assignments to one agent.

#include "Maestro/WorkerEndpoint.hpp"
#include "Maestro/Logger.hpp"
#include <stdexcept>

namespace Maestro {

WorkerEndpoint::WorkerEndpoint(MessageBus& bus, std::shared_ptr<Agent> agent,
                               std::chrono::milliseconds poll_interval)
    : m_bus(bus), m_agent(std::move(agent)), m_poll_interval(poll_interval) {
    if (!m_agent) {
        throw std::invalid_argument("WorkerEndpoint requires an agent");
    }
}

WorkerEndpoint::~WorkerEndpoint() {
    stop();
}

bool WorkerEndpoint::start() {
    if (m_running.load()) {
        return false;
    }
    if (!m_bus.registerAgent(m_agent->getId())) {
        Logger::getInstance().warning("WorkerEndpoint", "Agent id already registered on bus", m_agent->getId());
        return false;
    }

    m_running = true;
    m_thread = std::make_unique<std::thread>(&WorkerEndpoint::serviceLoop, this);

    Logger::getInstance().info("WorkerEndpoint", "Started worker " + m_agent->getId(),
                              "Type: " + m_agent->getType());
    return true;
}

void WorkerEndpoint::stop() {
    if (!m_running.exchange(false)) {
        return;
    }

    // Unregistering closes the queue and wakes a blocked receive
    m_bus.unregisterAgent(m_agent->getId());

    if (m_thread && m_thread->joinable()) {
        m_thread->join();
    }
    m_thread.reset();

    Logger::getInstance().info("WorkerEndpoint", "Stopped worker " + m_agent->getId(),
                              "Processed: " + std::to_string(m_processed.load()));
}

void WorkerEndpoint::serviceLoop() {
    const std::string agent_id = m_agent->getId();

    while (m_running.load()) {
        auto message = m_bus.receive(agent_id, m_poll_interval);
        if (!message) {
            continue;
        }

        switch (message->type) {
            case MessageType::TASK_ASSIGNMENT:
                handleAssignment(*message);
                break;

            case MessageType::HEARTBEAT:
                if (message->requires_response) {
                    m_bus.send(MessageBus::createResponse(*message,
                        {{"agent_id", agent_id}, {"busy", m_busy.load()}}, MessageType::HEARTBEAT));
                }
                break;

            default:
                Logger::getInstance().debug("WorkerEndpoint", "Ignoring message of type " +
                                           messageTypeToString(message->type), agent_id);
                break;
        }
    }
}

void WorkerEndpoint::handleAssignment(const Message& message) {
    const std::string agent_id = m_agent->getId();

    Task task;
    try {
        task = taskFromJson(message.payload.at("task"));
    } catch (const std::exception& e) {
        Logger::getInstance().error("WorkerEndpoint", "Malformed task assignment", e.what());
        if (message.requires_response) {
            m_bus.send(MessageBus::createResponse(message,
                {{"error", errorKindToString(ErrorKind::INVALID_ARGUMENT) + ": " + e.what()}},
                MessageType::ERROR));
        }
        return;
    }

    Result result;
    m_busy = true;
    try {
        result = m_agent->processTask(task);
    } catch (const std::exception& e) {
        result = Result();
        result.task_id = task.id;
        result.agent_id = agent_id;
        result.success = false;
        result.error = errorKindToString(ErrorKind::INTERNAL) + ": " + e.what();
        Logger::getInstance().error("WorkerEndpoint", "Agent threw while processing " + task.id, e.what());
    }
    m_busy = false;
    m_processed.fetch_add(1);

    if (result.task_id.empty()) {
        result.task_id = task.id;
    }
    if (result.agent_id.empty()) {
        result.agent_id = agent_id;
    }

    if (message.requires_response) {
        if (!m_bus.send(MessageBus::createResponse(message, {{"result", resultToJson(result)}},
                                                   MessageType::TASK_RESULT))) {
            Logger::getInstance().warning("WorkerEndpoint", "Result for " + task.id + " could not be delivered",
                                         message.sender);
        }
    }
}

} // namespace Maestro
