/**
 * @file main.cpp
 * @brief Firmware entry point and module wiring.
 */
#include <Arduino.h>
#include <Preferences.h>
#include "Core/NvsKeys.h"    ///< Preference needs to be singleton-like global to work

/// Load Core Functions
#include "Core/ConfigStore.h"
#include "Core/Log.h"
#include "Core/ModuleManager.h"
#include "Core/ServiceRegistry.h"

/// Load Modules
// Stores Modules
#include "Modules/Stores/ConfigStoreModule/ConfigStoreModule.h"
// System Modules
#include "Modules/System/SystemModule/SystemModule.h"
#include "Modules/SerialConsoleModule/SerialConsoleModule.h"
// Logs Modules
#include "Modules/Logs/LogHubModule/LogHubModule.h"
#include "Modules/Logs/LogSerialSinkModule/LogSerialSinkModule.h"
#include "Modules/Logs/LogDispatcherModule/LogDispatcherModule.h"

#include "Modules/EventBusModule/EventBusModule.h"
#include "Modules/CommandModule/CommandModule.h"
#include "Modules/IOModule/IOModule.h"
#include "Modules/IrrigationModule/IrrigationModule.h"
#include "Modules/TankLevelModule/TankLevelModule.h"

static Preferences preferences;
static ConfigStore registry;

static ModuleManager moduleManager;
static ServiceRegistry services;

static CommandModule        commandModule;
static ConfigStoreModule    configStoreModule;
static SystemModule         systemModule;
static SerialConsoleModule  serialConsoleModule;
static LogSerialSinkModule  logSerialSinkModule;
static LogDispatcherModule  logDispatcherModule;
static LogHubModule         logHubModule;
static EventBusModule       eventBusModule;
static IOModule             ioModule;
static IrrigationModule     irrigationModule;
static TankLevelModule      tankLevelModule;

static void requireSetup(bool ok, const char* step)
{
    if (ok) return;
    Serial.printf("Setup failure: %s\n", step ? step : "unknown");
    while (true) delay(1000);
}

static uint32_t logClock()
{
    return (uint32_t)millis();
}

void setup() {
    Serial.begin(115200);
    delay(50);
    requireSetup(preferences.begin(NvsKeys::StorageNamespace, false), "open preferences");
    registry.setPreferences(preferences);
    Log::setClock(logClock);

    requireSetup(moduleManager.add(&logHubModule), "add loghub");
    requireSetup(moduleManager.add(&logDispatcherModule), "add log.dispatcher");
    requireSetup(moduleManager.add(&logSerialSinkModule), "add log.sink.serial");
    requireSetup(moduleManager.add(&eventBusModule), "add eventbus");
    requireSetup(moduleManager.add(&commandModule), "add cmd");
    requireSetup(moduleManager.add(&configStoreModule), "add config");
    requireSetup(moduleManager.add(&systemModule), "add system");
    requireSetup(moduleManager.add(&serialConsoleModule), "add console");
    requireSetup(moduleManager.add(&ioModule), "add io");
    requireSetup(moduleManager.add(&irrigationModule), "add irrigation");
    requireSetup(moduleManager.add(&tankLevelModule), "add tanklevel");

    requireSetup(moduleManager.initAll(registry, services), "module init");

    Serial.print(
        "\x1b[34m"
        " ___      _              ___ ___  \n"
        "|_ _|_ _ (_)__ _ __ _   |_ _/ _ \\ \n"
        " | || '_|| / _` / _` |_  | | (_) |\n"
        "|___|_|  |_\\__, \\__,_(_)|___\\___/ \n"
        "           |___/                  \n"
        "\x1b[0m"
        );
}

void loop() {
    // All work runs in module tasks.
    vTaskDelay(pdMS_TO_TICKS(1000));
}
