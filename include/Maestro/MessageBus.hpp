// =================================================================
// include/Maestro/MessageBus.hpp
// =================================================================
// In-process message bus with per-agent priority queues, TTL expiry,
// request/response correlation and topic subscriptions.

#pragma once

#include "Maestro/Types.hpp"
#include <string>
#include <memory>
#include <vector>
#include <deque>
#include <queue>
#include <set>
#include <unordered_map>
#include <optional>
#include <chrono>
#include <mutex>
#include <shared_mutex>
#include <condition_variable>
#include <atomic>

namespace Maestro {

/**
 * @brief Message bus configuration
 */
struct MessageBusConfig {
    size_t queue_capacity = 1000;                 ///< Maximum queued messages per agent
    size_t history_size = 1000;                   ///< Rolling history length
    std::chrono::milliseconds default_response_timeout{30000}; ///< Default wait for correlated replies
};

/**
 * @brief Bus counters
 */
struct MessageBusStatistics {
    size_t total_messages = 0;                    ///< Every send attempt
    size_t direct_messages = 0;                   ///< Point-to-point sends
    size_t broadcasts = 0;                        ///< Sends to "*"
    size_t dropped = 0;                           ///< Refused deliveries (full queue, unknown or expired)
    size_t expired = 0;                           ///< Messages discarded on receive because of TTL
    size_t responses_delivered = 0;               ///< Replies handed to a waiting requester
    size_t response_timeouts = 0;                 ///< Requests that never got a reply
};

/**
 * @brief Asynchronous delivery between agents
 *
 * Each registered agent owns a bounded queue ordered by priority (higher
 * first) and FIFO within equal priority. Queues are locked independently;
 * the agent map is only held long enough to look a queue up.
 */
class MessageBus {
public:
    /**
     * @brief Constructor
     * @param config Bus configuration
     */
    explicit MessageBus(const MessageBusConfig& config = MessageBusConfig());

    virtual ~MessageBus();

    /**
     * @brief Create a queue for an agent
     * @param agent_id Agent identifier
     * @return False if the agent was already registered
     */
    virtual bool registerAgent(const std::string& agent_id);

    /**
     * @brief Remove an agent's queue and wake any blocked receiver
     * @param agent_id Agent identifier
     * @return False if the agent was not registered
     */
    virtual bool unregisterAgent(const std::string& agent_id);

    virtual bool isRegistered(const std::string& agent_id) const;

    /**
     * @brief Send a message to its recipient, or to every other agent for "*"
     * @param message Message to deliver
     * @return False if the message was dropped
     */
    virtual bool send(const Message& message);

    /**
     * @brief Take the next message for an agent
     * @param agent_id Receiving agent
     * @param timeout Maximum wait, blocks indefinitely when unset
     * @return Message, or empty on timeout, unknown agent or unregistration
     */
    virtual std::optional<Message> receive(const std::string& agent_id,
                                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief Send a request and block until a correlated reply arrives
     * @param message Request message (id assigned when empty)
     * @param timeout Maximum wait for the reply
     * @return Reply message, or empty when the send failed or timed out
     */
    virtual std::optional<Message> sendAndWaitResponse(const Message& message,
                                                       std::chrono::milliseconds timeout);

    /**
     * @brief Subscribe an agent to a topic
     * @return False if the agent is unknown or already subscribed
     */
    virtual bool subscribe(const std::string& agent_id, const std::string& topic);

    virtual bool unsubscribe(const std::string& agent_id, const std::string& topic);

    /**
     * @brief Deliver a copy of the message to every subscriber of a topic
     * @param topic Topic name
     * @param message Message template, recipient is replaced per subscriber
     * @return Number of subscribers the message was delivered to
     */
    virtual size_t publish(const std::string& topic, const Message& message);

    /**
     * @brief Get the most recent sends
     * @param limit Maximum entries, 0 for the whole history
     * @return Messages oldest first
     */
    std::vector<Message> getHistory(size_t limit = 0) const;

    MessageBusStatistics getStatistics() const;

    /**
     * @brief Number of messages waiting in an agent's queue
     */
    size_t pendingCount(const std::string& agent_id) const;

    std::vector<std::string> getRegisteredAgents() const;

    MessageBusConfig getConfig() const { return m_config; }

    /**
     * @brief Build a reply to a request
     * @param request Request being answered
     * @param payload Reply body
     * @param type Reply message type
     * @return Message addressed to the request sender, correlated to its id
     */
    static Message createResponse(const Message& request, const nlohmann::json& payload,
                                  MessageType type = MessageType::RESPONSE);

private:
    struct QueuedMessage {
        Message message;
        uint64_t sequence;
    };

    struct QueueOrder {
        bool operator()(const QueuedMessage& a, const QueuedMessage& b) const {
            if (a.message.priority != b.message.priority) {
                return a.message.priority < b.message.priority;
            }
            return a.sequence > b.sequence;
        }
    };

    struct AgentQueue {
        std::mutex mutex;
        std::condition_variable cv;
        std::priority_queue<QueuedMessage, std::vector<QueuedMessage>, QueueOrder> messages;
        bool closed = false;
    };

    struct PendingResponse {
        std::mutex mutex;
        std::condition_variable cv;
        std::optional<Message> reply;
    };

    MessageBusConfig m_config;

    std::unordered_map<std::string, std::shared_ptr<AgentQueue>> m_queues;
    mutable std::shared_mutex m_queues_mutex;

    std::unordered_map<std::string, std::set<std::string>> m_topics;
    mutable std::mutex m_topics_mutex;

    std::unordered_map<std::string, std::shared_ptr<PendingResponse>> m_pending;
    std::mutex m_pending_mutex;

    std::deque<Message> m_history;
    mutable std::mutex m_history_mutex;

    std::atomic<uint64_t> m_sequence{0};
    std::atomic<size_t> m_total{0};
    std::atomic<size_t> m_direct{0};
    std::atomic<size_t> m_broadcasts{0};
    std::atomic<size_t> m_dropped{0};
    std::atomic<size_t> m_expired{0};
    std::atomic<size_t> m_responses_delivered{0};
    std::atomic<size_t> m_response_timeouts{0};

    std::shared_ptr<AgentQueue> findQueue(const std::string& agent_id) const;
    bool enqueue(const Message& message);
    bool deliverToWaiter(const Message& message);
    void recordHistory(const Message& message);
};

} // namespace Maestro
