#include "SensorFactory.h"
#include "sensors/kanavi/KanaviMulticastReceiver.h"

std::unique_ptr<ISensor> create_sensor(const ReceiverConfig& cfg, IngestionQueue& queue) {
    return std::make_unique<KanaviMulticastReceiver>(queue, KanaviModelTable(cfg.models));
}
