#pragma once
/**
 * @file Services.h
 * @brief Convenience include for all service interfaces.
 */
#include "ICommand.h"
#include "IConfig.h"
#include "IEventBus.h"
#include "IIO.h"
#include "IIrrigation.h"
#include "ILogger.h"
