/**
 * @file PahoMqttClient.hpp
 * @brief Paho MQTT C library implementation for desktop platforms
 *
 * Provides the IMqttClient implementation using the Eclipse Paho MQTT C
 * asynchronous API. Messages published before the connection completes are
 * held in an offline queue and flushed once the broker accepts the client.
 *
 * @note Thread-safe implementation with proper callback handling
 */

#pragma once

#include "IMqttClient.hpp"
#include <MQTTAsync.h>
#include <string>
#include <memory>
#include <queue>
#include <mutex>
#include <atomic>
#include <cstdint>

namespace geocircle {

/**
 * @brief Paho MQTT C library implementation for desktop platforms
 *
 * Features:
 * - Bounded offline queue; publish() returns false once it is full
 * - Thread-safe callback handling
 *
 * @note Paho invokes the static callbacks on its own thread
 */
class PahoMqttClient : public IMqttClient {
public:
    /**
     * @brief Construct new Paho MQTT client instance
     * @note Client is not connected after construction - call connect() method
     */
    PahoMqttClient();

    /**
     * @brief Destructor - ensures clean disconnection and resource cleanup
     */
    ~PahoMqttClient() override;

    // Disable copy and assignment to prevent resource management issues
    PahoMqttClient(const PahoMqttClient&) = delete;
    PahoMqttClient& operator=(const PahoMqttClient&) = delete;
    PahoMqttClient(PahoMqttClient&&) = delete;
    PahoMqttClient& operator=(PahoMqttClient&&) = delete;

    bool connect(const std::string& host, std::uint16_t port,
                const std::string& clientId,
                const std::string& username,
                const std::string& password) override;

    void disconnect() override;
    bool isConnected() const override;

    bool publish(const std::string& topic, const std::string& payload,
                int qos = 0, bool retained = false) override;

    void setConnectionCallback(ConnectionCallback callback) override;

    std::size_t pendingCount() const override;
    std::size_t failedCount() const override;

    /// Maximum number of messages to queue when offline
    static constexpr std::size_t kMaxOfflineQueueSize = 1000;

private:
    /// Time granted to in-flight QoS 1/2 messages on disconnect
    static constexpr int kDisconnectTimeoutMs = 10000;

    static constexpr int kKeepAliveIntervalSeconds = 60;

    static constexpr int kConnectionTimeoutSeconds = 30;

    MQTTAsync client_;                    ///< Paho MQTT client handle
    std::atomic<bool> connected_{false};  ///< Current connection state

    ConnectionCallback connectionCallback_; ///< User callback for connection events

    std::queue<MqttMessage> offlineQueue_; ///< Queue for messages when offline
    mutable std::mutex queueMutex_;        ///< Mutex protecting offline queue
    std::atomic<std::size_t> failedSends_{0}; ///< Queued messages the flush could not send

    std::string username_;                ///< Kept alive for the duration of the async connect
    std::string password_;

    static void onConnected(void* context, MQTTAsync_successData* response);

    static void onConnectFailure(void* context, MQTTAsync_failureData* response);

    static void connectionLost(void* context, char* cause);

    static void onDisconnected(void* context, MQTTAsync_successData* response);

    /// Required by MQTTAsync_setCallbacks; nothing is subscribed
    static int messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);

    bool send(const MqttMessage& message);

    /**
     * @brief Send all queued messages when connection is restored
     * @note Called automatically when connection is established
     */
    void flushOfflineQueue();

    /**
     * @brief Add message to offline queue when not connected
     * @return false when the queue already holds kMaxOfflineQueueSize messages
     */
    bool queueMessage(const MqttMessage& message);
};

} // namespace geocircle
