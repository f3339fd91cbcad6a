#include "PahoMqttClient.hpp"
#include <iostream>

namespace geocircle {

PahoMqttClient::PahoMqttClient() : client_(nullptr) {}

PahoMqttClient::~PahoMqttClient() {
    disconnect();
    if (client_) {
        MQTTAsync_destroy(&client_);
    }
}

bool PahoMqttClient::connect(const std::string& host, std::uint16_t port,
                            const std::string& clientId,
                            const std::string& username,
                            const std::string& password) {

    std::string serverURI = "tcp://" + host + ":" + std::to_string(port);
    std::cout << "[MQTT] Connecting to " << serverURI << " as " << clientId << std::endl;

    int rc = MQTTAsync_create(&client_, serverURI.c_str(), clientId.c_str(),
                             MQTTCLIENT_PERSISTENCE_NONE, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cout << "[MQTT] Failed to create client, error code: " << rc << std::endl;
        return false;
    }

    MQTTAsync_setCallbacks(client_, this, connectionLost, messageArrived, nullptr);

    username_ = username;
    password_ = password;

    MQTTAsync_connectOptions conn_opts = MQTTAsync_connectOptions_initializer;

    conn_opts.keepAliveInterval = kKeepAliveIntervalSeconds;
    conn_opts.cleansession = 1;
    conn_opts.connectTimeout = kConnectionTimeoutSeconds;
    conn_opts.retryInterval = 5;        // 5 seconds between retries
    conn_opts.onSuccess = onConnected;
    conn_opts.onFailure = onConnectFailure;
    conn_opts.context = this;
    if (!username_.empty()) {
        conn_opts.username = username_.c_str();
        conn_opts.password = password_.c_str();
    }

    rc = MQTTAsync_connect(client_, &conn_opts);

    if (rc == MQTTASYNC_SUCCESS) {
        std::cout << "[MQTT] Connection attempt initiated successfully" << std::endl;
        return true;
    } else {
        std::cout << "[MQTT] Connection attempt failed, error code: " << rc << std::endl;
        return false;
    }
}

void PahoMqttClient::disconnect() {
    if (client_ && connected_) {
        MQTTAsync_disconnectOptions disc_opts = MQTTAsync_disconnectOptions_initializer;
        disc_opts.timeout = kDisconnectTimeoutMs;
        disc_opts.onSuccess = onDisconnected;
        disc_opts.context = this;

        int rc = MQTTAsync_disconnect(client_, &disc_opts);
        if (rc != MQTTASYNC_SUCCESS) {
            std::cerr << "[MQTT] Disconnect failed, error code: " << rc << std::endl;
        }
        connected_ = false;
    }
}

bool PahoMqttClient::isConnected() const {
    return connected_;
}

bool PahoMqttClient::publish(const std::string& topic, const std::string& payload,
                           int qos, bool retained) {
    MqttMessage message;
    message.topic = topic;
    message.payload = payload;
    message.qos = qos;
    message.retained = retained;

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!connected_) {
            return queueMessage(message);
        }
    }

    return send(message);
}

void PahoMqttClient::setConnectionCallback(ConnectionCallback callback) {
    connectionCallback_ = callback;
}

std::size_t PahoMqttClient::pendingCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return offlineQueue_.size();
}

std::size_t PahoMqttClient::failedCount() const {
    return failedSends_;
}

bool PahoMqttClient::send(const MqttMessage& message) {
    MQTTAsync_message pubmsg = MQTTAsync_message_initializer;
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;

    pubmsg.payload = const_cast<void*>(static_cast<const void*>(message.payload.c_str()));
    pubmsg.payloadlen = static_cast<int>(message.payload.length());
    pubmsg.qos = message.qos;
    pubmsg.retained = message.retained ? 1 : 0;

    int rc = MQTTAsync_sendMessage(client_, message.topic.c_str(), &pubmsg, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        std::cerr << "[MQTT] Publish to " << message.topic << " failed, error code: " << rc << std::endl;
        return false;
    }
    return true;
}

int PahoMqttClient::messageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    (void)context;
    (void)topicLen;

    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);
    return 1;
}

void PahoMqttClient::onConnected(void* context, MQTTAsync_successData* response) {
    (void)response;

    auto* client = static_cast<PahoMqttClient*>(context);
    client->flushOfflineQueue();

    if (client->connectionCallback_) {
        client->connectionCallback_(true, "Connected successfully");
    }
}

void PahoMqttClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    if (client->connectionCallback_) {
        std::string reason = "Connection failed";
        if (response) {
            reason = "CONNACK return code " + std::to_string(response->code);
            if (response->message) {
                reason += " (" + std::string(response->message) + ")";
            }
        }
        client->connectionCallback_(false, reason);
    }
}

void PahoMqttClient::connectionLost(void* context, char* cause) {
    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;

    if (client->connectionCallback_) {
        std::string reason = cause ? std::string(cause) : "Connection lost";
        client->connectionCallback_(false, reason);
    }
}

void PahoMqttClient::onDisconnected(void* context, MQTTAsync_successData* response) {
    (void)response;

    auto* client = static_cast<PahoMqttClient*>(context);
    client->connected_ = false;
}

void PahoMqttClient::flushOfflineQueue() {
    std::lock_guard<std::mutex> lock(queueMutex_);

    connected_ = true;
    std::size_t failed = 0;
    while (!offlineQueue_.empty()) {
        if (!send(offlineQueue_.front())) {
            ++failed;
        }
        offlineQueue_.pop();
    }

    if (failed > 0) {
        failedSends_ += failed;
        std::cerr << "[MQTT] " << failed << " queued messages could not be sent" << std::endl;
    }
}

bool PahoMqttClient::queueMessage(const MqttMessage& message) {
    if (offlineQueue_.size() >= kMaxOfflineQueueSize) {
        std::cerr << "[MQTT] Offline queue full, rejecting message for " << message.topic << std::endl;
        return false;
    }

    offlineQueue_.push(message);
    return true;
}

} // namespace geocircle
