#pragma once
/**
 * @file CommandRegistry.h
 * @brief Command registration and execution.
 */
#include <stdint.h>
#include <stddef.h>

#include "Core/SystemLimits.h"
#include "Core/Services/ICommand.h"

/** @brief Command invocation context. */
struct CommandRequest {
    const char* cmd;
    const char* json;   // full request document, may be null
    const char* args;   // args object only, may be null
};

/** @brief Registered command entry. */
struct CommandEntry {
    const char* cmd;
    CommandHandler fn;
    void* userCtx;
};

/**
 * @brief Registry of command handlers.
 *
 * Handlers must always leave a JSON object in the reply buffer; anything
 * else is replaced by a CmdHandlerFailed error.
 */
class CommandRegistry {
public:
    bool registerHandler(const char* cmd, CommandHandler fn, void* userCtx);
    bool execute(const char* cmd, const char* json, const char* args, char* reply, size_t replyLen);
    uint8_t count() const { return count_; }

private:
    CommandEntry entries_[Limits::MaxCommands]{};
    uint8_t count_ = 0;
};
