#pragma once
/**
 * @file ServiceRegistry.h
 * @brief Typed service registry for cross-module access.
 */
#include <stdint.h>
#include <cstring>

#include "Core/SystemLimits.h"

/** @brief Raw registry entry. */
struct ServiceEntry {
    const char* id;
    const void* ptr;
};

/**
 * @brief Registry of named services (opaque pointers, ids must be literals).
 */
class ServiceRegistry {
public:
    /** @brief Register a service pointer; duplicate ids are rejected. */
    bool add(const char* id, const void* service);
    const void* getRaw(const char* id) const;

    template<typename T>
    const T* get(const char* id) const {
        return reinterpret_cast<const T*>(getRaw(id));
    }

private:
    ServiceEntry entries_[Limits::MaxServices]{};
    uint8_t count_ = 0;
};
