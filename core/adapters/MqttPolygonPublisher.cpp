#include "MqttPolygonPublisher.hpp"
#include "../JsonCodec.hpp"
#include <iostream>
#include <utility>

namespace geocircle::adapters {

MqttPolygonPublisher::MqttPolygonPublisher(std::shared_ptr<IMqttClient> mqttClient,
                                           std::string topicPrefix,
                                           int qos)
    : mqttClient_(std::move(mqttClient)), topicPrefix_(std::move(topicPrefix)), qos_(qos) {
}

PublishSummary MqttPolygonPublisher::publish(const domain::PipelineResult& result) {
    PublishSummary summary;

    for (const auto& circle : result.circles) {
        send(polygonTopic(circle.location.id), assembler_.toFeature(circle).dump(), summary);
    }

    for (const auto& error : result.errors) {
        send(errorTopic(error.locationId), JsonCodec::errorToJson(error).dump(), summary);
    }

    std::cout << "[MQTT] Published " << summary.published << " messages under "
              << topicPrefix_ << "/" << std::endl;
    return summary;
}

std::string MqttPolygonPublisher::polygonTopic(const std::string& locationId) const {
    return topicPrefix_ + "/" + locationId + "/polygon";
}

std::string MqttPolygonPublisher::errorTopic(const std::string& locationId) const {
    return topicPrefix_ + "/" + locationId + "/error";
}

void MqttPolygonPublisher::send(const std::string& topic, const std::string& payload, PublishSummary& summary) {
    if (mqttClient_->publish(topic, payload, qos_, true)) {
        ++summary.published;
    } else {
        ++summary.failed;
        std::cerr << "[MQTT] Failed to publish " << topic << std::endl;
    }
}

} // namespace geocircle::adapters
