#include "MockMqttClient.hpp"
#include <utility>

namespace geocircle::sim {

MockMqttClient::MockMqttClient() = default;

bool MockMqttClient::connect(const std::string& host, std::uint16_t port,
                             const std::string& clientId,
                             const std::string& username,
                             const std::string& password) {
    (void)host;
    (void)port;
    (void)username;
    (void)password;

    lastClientId_ = clientId;
    setConnected(true);
    return true;
}

void MockMqttClient::disconnect() {
    setConnected(false);
}

bool MockMqttClient::isConnected() const {
    return connected_;
}

bool MockMqttClient::publish(const std::string& topic, const std::string& payload,
                             int qos, bool retained) {
    if (failPublish_) {
        return false;
    }

    MockMessage msg;
    msg.topic = topic;
    msg.payload = payload;
    msg.qos = qos;
    msg.retained = retained;
    msg.timestamp = std::chrono::steady_clock::now();

    if (!connected_) {
        if (pendingLimit_ > 0 && pending_.size() >= pendingLimit_) {
            return false;
        }
        pending_.push(msg);
        return true;
    }

    publishedMessages_.push_back(msg);
    return true;
}

void MockMqttClient::setConnectionCallback(ConnectionCallback callback) {
    connectionCallback_ = std::move(callback);
}

void MockMqttClient::setConnected(bool connected) {
    bool wasConnected = connected_;
    connected_ = connected;

    if (connected && !wasConnected) {
        flushPending();
    }

    if (connectionCallback_ && wasConnected != connected) {
        connectionCallback_(connected, connected ? "Connected" : "Disconnected");
    }
}

void MockMqttClient::simulateConnectionLoss() {
    setConnected(false);
}

void MockMqttClient::simulateConnectionRestore() {
    setConnected(true);
}

void MockMqttClient::flushPending() {
    while (!pending_.empty()) {
        if (failPublish_) {
            ++failedCount_;
        } else {
            publishedMessages_.push_back(pending_.front());
        }
        pending_.pop();
    }
}

} // namespace geocircle::sim
