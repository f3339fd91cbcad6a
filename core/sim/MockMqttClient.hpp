#pragma once

#include "../IMqttClient.hpp"
#include <queue>
#include <vector>
#include <string>
#include <chrono>

namespace geocircle::sim {

struct MockMessage {
    std::string topic;
    std::string payload;
    int qos;
    bool retained;
    std::chrono::steady_clock::time_point timestamp;
};

class MockMqttClient : public IMqttClient {
public:
    MockMqttClient();
    ~MockMqttClient() override = default;

    // IMqttClient interface
    bool connect(const std::string& host, std::uint16_t port,
                 const std::string& clientId,
                 const std::string& username,
                 const std::string& password) override;
    void disconnect() override;
    bool isConnected() const override;

    bool publish(const std::string& topic, const std::string& payload,
                 int qos = 0, bool retained = false) override;

    void setConnectionCallback(ConnectionCallback callback) override;

    std::size_t pendingCount() const override { return pending_.size(); }
    std::size_t failedCount() const override { return failedCount_; }

    // Mock-specific methods for testing
    void setConnected(bool connected);
    void simulateConnectionLoss();
    void simulateConnectionRestore();

    const std::vector<MockMessage>& getPublishedMessages() const { return publishedMessages_; }
    void clearPublishedMessages() { publishedMessages_.clear(); }

    bool shouldFailPublish() const { return failPublish_; }
    void setFailPublish(bool fail) { failPublish_ = fail; }

    // 0 means unbounded
    void setPendingLimit(std::size_t limit) { pendingLimit_ = limit; }

    const std::string& lastClientId() const { return lastClientId_; }

private:
    void flushPending();

    bool connected_ = false;
    bool failPublish_ = false;
    std::size_t pendingLimit_ = 0;
    std::size_t failedCount_ = 0;

    ConnectionCallback connectionCallback_;

    std::vector<MockMessage> publishedMessages_;
    std::queue<MockMessage> pending_;

    std::string lastClientId_;
};

} // namespace geocircle::sim
