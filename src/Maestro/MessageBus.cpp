// =================================================================
// src/Maestro/MessageBus.cpp
// =================================================================
// Implementation of the in-process message bus.

#include "Maestro/MessageBus.hpp"
#include "Maestro/Logger.hpp"
#include <algorithm>

namespace Maestro {

MessageBus::MessageBus(const MessageBusConfig& config)
    : m_config(config) {
    Logger::getInstance().info("MessageBus", "Initialized with queue capacity " +
                              std::to_string(m_config.queue_capacity));
}

MessageBus::~MessageBus() {
    std::unique_lock<std::shared_mutex> lock(m_queues_mutex);
    for (auto& [agent_id, queue] : m_queues) {
        std::lock_guard<std::mutex> queue_lock(queue->mutex);
        queue->closed = true;
        queue->cv.notify_all();
    }
}

bool MessageBus::registerAgent(const std::string& agent_id) {
    std::unique_lock<std::shared_mutex> lock(m_queues_mutex);
    if (m_queues.count(agent_id) > 0) {
        Logger::getInstance().debug("MessageBus", "Agent already registered: " + agent_id);
        return false;
    }

    m_queues[agent_id] = std::make_shared<AgentQueue>();
    Logger::getInstance().debug("MessageBus", "Registered agent: " + agent_id);
    return true;
}

bool MessageBus::unregisterAgent(const std::string& agent_id) {
    std::shared_ptr<AgentQueue> queue;
    {
        std::unique_lock<std::shared_mutex> lock(m_queues_mutex);
        auto it = m_queues.find(agent_id);
        if (it == m_queues.end()) {
            Logger::getInstance().warning("MessageBus", "Cannot unregister unknown agent: " + agent_id);
            return false;
        }
        queue = it->second;
        m_queues.erase(it);
    }

    {
        std::lock_guard<std::mutex> queue_lock(queue->mutex);
        queue->closed = true;
    }
    queue->cv.notify_all();

    {
        std::lock_guard<std::mutex> lock(m_topics_mutex);
        for (auto& [topic, subscribers] : m_topics) {
            subscribers.erase(agent_id);
        }
    }

    Logger::getInstance().debug("MessageBus", "Unregistered agent: " + agent_id);
    return true;
}

bool MessageBus::isRegistered(const std::string& agent_id) const {
    return findQueue(agent_id) != nullptr;
}

bool MessageBus::send(const Message& message) {
    Message outgoing = message;
    if (outgoing.id.empty()) {
        outgoing.id = generateId("msg");
    }

    m_total.fetch_add(1);
    recordHistory(outgoing);

    if (outgoing.isExpired()) {
        m_dropped.fetch_add(1);
        Logger::getInstance().logMessageDropped(outgoing.id, outgoing.recipient, "expired before send");
        return false;
    }

    if (!outgoing.correlation_id.empty() && deliverToWaiter(outgoing)) {
        return true;
    }

    if (outgoing.recipient == "*") {
        m_broadcasts.fetch_add(1);

        std::vector<std::string> recipients;
        {
            std::shared_lock<std::shared_mutex> lock(m_queues_mutex);
            for (const auto& [agent_id, queue] : m_queues) {
                if (agent_id != outgoing.sender) {
                    recipients.push_back(agent_id);
                }
            }
        }

        bool all_delivered = true;
        for (const auto& agent_id : recipients) {
            Message copy = outgoing;
            copy.recipient = agent_id;
            if (!enqueue(copy)) {
                all_delivered = false;
            }
        }
        return all_delivered;
    }

    m_direct.fetch_add(1);
    return enqueue(outgoing);
}

std::optional<Message> MessageBus::receive(const std::string& agent_id,
                                           std::optional<std::chrono::milliseconds> timeout) {
    auto queue = findQueue(agent_id);
    if (!queue) {
        Logger::getInstance().warning("MessageBus", "Receive on unknown agent: " + agent_id);
        return std::nullopt;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout.value_or(std::chrono::milliseconds(0));

    std::unique_lock<std::mutex> lock(queue->mutex);
    while (true) {
        while (!queue->messages.empty()) {
            Message next = queue->messages.top().message;
            queue->messages.pop();

            if (next.isExpired()) {
                m_expired.fetch_add(1);
                continue;
            }
            return next;
        }

        if (queue->closed) {
            return std::nullopt;
        }

        if (timeout) {
            if (queue->cv.wait_until(lock, deadline) == std::cv_status::timeout &&
                queue->messages.empty()) {
                return std::nullopt;
            }
        } else {
            queue->cv.wait(lock);
        }
    }
}

std::optional<Message> MessageBus::sendAndWaitResponse(const Message& message,
                                                       std::chrono::milliseconds timeout) {
    Message request = message;
    if (request.id.empty()) {
        request.id = generateId("msg");
    }
    request.requires_response = true;

    auto pending = std::make_shared<PendingResponse>();
    {
        std::lock_guard<std::mutex> lock(m_pending_mutex);
        m_pending[request.id] = pending;
    }

    if (!send(request)) {
        std::lock_guard<std::mutex> lock(m_pending_mutex);
        m_pending.erase(request.id);
        return std::nullopt;
    }

    std::optional<Message> reply;
    {
        std::unique_lock<std::mutex> lock(pending->mutex);
        pending->cv.wait_for(lock, timeout, [&pending] { return pending->reply.has_value(); });
        reply = pending->reply;
    }

    {
        std::lock_guard<std::mutex> lock(m_pending_mutex);
        m_pending.erase(request.id);
    }

    if (!reply) {
        m_response_timeouts.fetch_add(1);
        Logger::getInstance().warning("MessageBus", "No response within " +
                                     std::to_string(timeout.count()) + "ms",
                                     "Message: " + request.id + ", Recipient: " + request.recipient);
    }
    return reply;
}

bool MessageBus::subscribe(const std::string& agent_id, const std::string& topic) {
    if (!isRegistered(agent_id)) {
        Logger::getInstance().warning("MessageBus", "Cannot subscribe unknown agent: " + agent_id);
        return false;
    }

    std::lock_guard<std::mutex> lock(m_topics_mutex);
    return m_topics[topic].insert(agent_id).second;
}

bool MessageBus::unsubscribe(const std::string& agent_id, const std::string& topic) {
    std::lock_guard<std::mutex> lock(m_topics_mutex);
    auto it = m_topics.find(topic);
    if (it == m_topics.end()) {
        return false;
    }
    bool removed = it->second.erase(agent_id) > 0;
    if (it->second.empty()) {
        m_topics.erase(it);
    }
    return removed;
}

size_t MessageBus::publish(const std::string& topic, const Message& message) {
    std::set<std::string> subscribers;
    {
        std::lock_guard<std::mutex> lock(m_topics_mutex);
        auto it = m_topics.find(topic);
        if (it != m_topics.end()) {
            subscribers = it->second;
        }
    }

    size_t delivered = 0;
    for (const auto& agent_id : subscribers) {
        if (agent_id == message.sender) {
            continue;
        }

        Message copy = message;
        copy.id = generateId("msg");
        copy.recipient = agent_id;
        if (send(copy)) {
            delivered++;
        }
    }

    Logger::getInstance().debug("MessageBus", "Published to topic " + topic,
                               "Subscribers reached: " + std::to_string(delivered));
    return delivered;
}

std::vector<Message> MessageBus::getHistory(size_t limit) const {
    std::lock_guard<std::mutex> lock(m_history_mutex);
    size_t count = (limit == 0) ? m_history.size() : std::min(limit, m_history.size());
    return std::vector<Message>(m_history.end() - static_cast<std::ptrdiff_t>(count), m_history.end());
}

MessageBusStatistics MessageBus::getStatistics() const {
    MessageBusStatistics stats;
    stats.total_messages = m_total.load();
    stats.direct_messages = m_direct.load();
    stats.broadcasts = m_broadcasts.load();
    stats.dropped = m_dropped.load();
    stats.expired = m_expired.load();
    stats.responses_delivered = m_responses_delivered.load();
    stats.response_timeouts = m_response_timeouts.load();
    return stats;
}

size_t MessageBus::pendingCount(const std::string& agent_id) const {
    auto queue = findQueue(agent_id);
    if (!queue) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(queue->mutex);
    return queue->messages.size();
}

std::vector<std::string> MessageBus::getRegisteredAgents() const {
    std::shared_lock<std::shared_mutex> lock(m_queues_mutex);
    std::vector<std::string> agents;
    agents.reserve(m_queues.size());
    for (const auto& [agent_id, queue] : m_queues) {
        agents.push_back(agent_id);
    }
    std::sort(agents.begin(), agents.end());
    return agents;
}

Message MessageBus::createResponse(const Message& request, const nlohmann::json& payload,
                                   MessageType type) {
    Message response;
    response.id = generateId("msg");
    response.sender = request.recipient;
    response.recipient = request.sender;
    response.type = type;
    response.priority = request.priority;
    response.payload = payload;
    response.correlation_id = request.id;
    return response;
}

std::shared_ptr<MessageBus::AgentQueue> MessageBus::findQueue(const std::string& agent_id) const {
    std::shared_lock<std::shared_mutex> lock(m_queues_mutex);
    auto it = m_queues.find(agent_id);
    return (it != m_queues.end()) ? it->second : nullptr;
}

bool MessageBus::enqueue(const Message& message) {
    auto queue = findQueue(message.recipient);
    if (!queue) {
        m_dropped.fetch_add(1);
        Logger::getInstance().logMessageDropped(message.id, message.recipient,
                                                errorKindToString(ErrorKind::NOT_FOUND) + " recipient");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(queue->mutex);
        if (queue->closed || queue->messages.size() >= m_config.queue_capacity) {
            m_dropped.fetch_add(1);
            Logger::getInstance().logMessageDropped(message.id, message.recipient,
                                                    queue->closed ? "queue closed" : "queue full");
            return false;
        }
        queue->messages.push(QueuedMessage{message, m_sequence.fetch_add(1)});
    }
    queue->cv.notify_one();
    return true;
}

bool MessageBus::deliverToWaiter(const Message& message) {
    std::shared_ptr<PendingResponse> pending;
    {
        std::lock_guard<std::mutex> lock(m_pending_mutex);
        auto it = m_pending.find(message.correlation_id);
        if (it == m_pending.end()) {
            return false;
        }
        pending = it->second;
        m_pending.erase(it);
    }

    {
        std::lock_guard<std::mutex> lock(pending->mutex);
        pending->reply = message;
    }
    pending->cv.notify_all();
    m_responses_delivered.fetch_add(1);
    return true;
}

void MessageBus::recordHistory(const Message& message) {
    std::lock_guard<std::mutex> lock(m_history_mutex);
    m_history.push_back(message);
    while (m_history.size() > m_config.history_size) {
        m_history.pop_front();
    }
}

} // namespace Maestro
