/**
 * @file LogHub.cpp
 * @brief Implementation file.
 */
#include "Core/LogHub.h"

void LogHub::init(int queueLen) {
    if (q_) return;
    q_ = xQueueCreate(queueLen, sizeof(LogEntry));
}

bool LogHub::enqueue(const LogEntry& e) {
    if (!q_) return false;
    if (xQueueSend(q_, &e, 0) != pdTRUE) {
        dropped_ = dropped_ + 1;
        return false;
    }
    return true;
}

bool LogHub::dequeue(LogEntry& out, TickType_t waitTicks) {
    if (!q_) return false;
    return xQueueReceive(q_, &out, waitTicks) == pdTRUE;
}
