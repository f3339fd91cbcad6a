#pragma once

#include "GeoJsonAssembler.hpp"
#include "../IMqttClient.hpp"
#include "../domain/CirclePipeline.hpp"
#include <memory>
#include <string>

namespace geocircle::adapters {

struct PublishSummary {
    std::size_t published = 0;
    std::size_t failed = 0;
};

class MqttPolygonPublisher {
public:
    MqttPolygonPublisher(std::shared_ptr<IMqttClient> mqttClient,
                         std::string topicPrefix = "geocircle",
                         int qos = 1);

    // Each circle goes to <prefix>/<id>/polygon, each failure to <prefix>/<id>/error.
    PublishSummary publish(const domain::PipelineResult& result);

    std::string polygonTopic(const std::string& locationId) const;
    std::string errorTopic(const std::string& locationId) const;

private:
    void send(const std::string& topic, const std::string& payload, PublishSummary& summary);

    std::shared_ptr<IMqttClient> mqttClient_;
    std::string topicPrefix_;
    int qos_;
    GeoJsonAssembler assembler_;
};

} // namespace geocircle::adapters
