#pragma once
#include "sensors/ISensor.h"
#include "config/config.h"
#include <memory>

class IngestionQueue;

std::unique_ptr<ISensor> create_sensor(const ReceiverConfig& cfg, IngestionQueue& queue);
