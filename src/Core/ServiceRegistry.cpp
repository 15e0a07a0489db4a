/**
 * @file ServiceRegistry.cpp
 * @brief Implementation file.
 */
#include "ServiceRegistry.h"

bool ServiceRegistry::add(const char* id, const void* service) {
    if (!id || !service) return false;
    if (getRaw(id) != nullptr) return false;
    if (count_ >= Limits::MaxServices) return false;
    entries_[count_++] = {id, service};
    return true;
}

const void* ServiceRegistry::getRaw(const char* id) const {
    if (!id) return nullptr;
    for (uint8_t i = 0; i < count_; ++i) {
        if (strcmp(entries_[i].id, id) == 0) return entries_[i].ptr;
    }
    return nullptr;
}
