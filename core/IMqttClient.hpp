/**
 * @file IMqttClient.hpp
 * @brief MQTT client interface used to publish computed circle polygons
 *
 * Provides a platform-independent MQTT publishing abstraction so the
 * polygon publisher can be exercised against an in-memory client in tests
 * and against Eclipse Paho on the desktop.
 *
 * @note Connection is asynchronous; messages published before the broker
 *       acknowledges the connection are queued by the implementation
 */

#pragma once

#include <string>
#include <functional>
#include <memory>
#include <cstddef>
#include <cstdint>

namespace geocircle {

/**
 * @brief Outgoing MQTT message
 *
 * @note QoS levels: 0 (at most once), 1 (at least once), 2 (exactly once)
 */
struct MqttMessage {
    std::string topic;              ///< MQTT topic (e.g., "geocircle/5/polygon")
    std::string payload;            ///< Message payload (GeoJSON Feature)
    int qos = 0;                   ///< Quality of Service level (0, 1, or 2)
    bool retained = false;         ///< Retain flag so late subscribers get the last polygon
};

/**
 * @brief Platform-independent MQTT publishing interface
 *
 * @note Callback-based connection reporting enables event-driven shutdown
 */
class IMqttClient {
public:
    /// Virtual destructor for proper cleanup in derived classes
    virtual ~IMqttClient() = default;

    /// Callback function type for connection state changes
    using ConnectionCallback = std::function<void(bool connected, const std::string& reason)>;

    /**
     * @brief Connect to MQTT broker using username/password authentication
     * @param host MQTT broker hostname
     * @param port MQTT broker port (typically 1883)
     * @param clientId Unique client identifier
     * @param username MQTT username (may be empty)
     * @param password MQTT password (may be empty)
     * @return true if connection initiated successfully, false otherwise
     * @note This method initiates asynchronous connection - use callback for status
     */
    virtual bool connect(const std::string& host, std::uint16_t port,
                        const std::string& clientId,
                        const std::string& username,
                        const std::string& password) = 0;

    /**
     * @brief Disconnect from MQTT broker
     */
    virtual void disconnect() = 0;

    /**
     * @brief Check if currently connected to MQTT broker
     */
    virtual bool isConnected() const = 0;

    /**
     * @brief Publish message to MQTT topic
     * @param topic MQTT topic to publish to
     * @param payload Message payload
     * @param qos Quality of Service level (0, 1, or 2)
     * @param retained Whether message should be retained by broker
     * @return true if the message was sent or queued for sending, false if it was rejected
     */
    virtual bool publish(const std::string& topic, const std::string& payload,
                        int qos = 0, bool retained = false) = 0;

    /**
     * @brief Set callback for connection state changes
     * @note Callback is called from MQTT thread - ensure thread safety
     */
    virtual void setConnectionCallback(ConnectionCallback callback) = 0;

    /**
     * @brief Number of messages still waiting for a connection
     */
    virtual std::size_t pendingCount() const = 0;

    /**
     * @brief Number of queued messages accepted by publish() that later failed to send
     */
    virtual std::size_t failedCount() const = 0;

protected:
    // Protected constructors to prevent direct instantiation
    IMqttClient() = default;
    IMqttClient(const IMqttClient&) = default;
    IMqttClient& operator=(const IMqttClient&) = default;
    IMqttClient(IMqttClient&&) = default;
    IMqttClient& operator=(IMqttClient&&) = default;
};

} // namespace geocircle
