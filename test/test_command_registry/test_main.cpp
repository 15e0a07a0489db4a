#include <unity.h>
#include <stdio.h>
#include <string.h>

#include "Core/CommandRegistry.h"
#include "Core/ErrorCodes.h"

static char reply[256];
static int calls = 0;

static bool handlerOk(void* ctx, const CommandRequest& req, char* out, size_t len)
{
    ++calls;
    const char* tag = (const char*)ctx;
    snprintf(out, len, "{\"ok\":true,\"tag\":\"%s\",\"args\":%s}", tag, req.args ? req.args : "null");
    return true;
}

static bool handlerPlainText(void*, const CommandRequest&, char* out, size_t len)
{
    snprintf(out, len, "done");
    return true;
}

static bool handlerSilent(void*, const CommandRequest&, char*, size_t)
{
    return true;
}

void setUp()
{
    memset(reply, 0, sizeof(reply));
    calls = 0;
}

void tearDown() {}

void test_dispatches_to_registered_handler()
{
    CommandRegistry reg;
    static char tag[] = "zone";
    TEST_ASSERT_TRUE(reg.registerHandler("irrigation.zone.on", handlerOk, tag));
    TEST_ASSERT_EQUAL_UINT8(1, reg.count());

    TEST_ASSERT_TRUE(reg.execute("irrigation.zone.on", nullptr, "{\"zone\":2}", reply, sizeof(reply)));
    TEST_ASSERT_EQUAL_INT(1, calls);
    TEST_ASSERT_EQUAL_STRING("{\"ok\":true,\"tag\":\"zone\",\"args\":{\"zone\":2}}", reply);
}

void test_rejects_duplicates_and_null_handlers()
{
    CommandRegistry reg;
    TEST_ASSERT_TRUE(reg.registerHandler("system.ping", handlerOk, nullptr));
    TEST_ASSERT_FALSE(reg.registerHandler("system.ping", handlerOk, nullptr));
    TEST_ASSERT_FALSE(reg.registerHandler("system.reboot", nullptr, nullptr));
    TEST_ASSERT_FALSE(reg.registerHandler(nullptr, handlerOk, nullptr));
    TEST_ASSERT_EQUAL_UINT8(1, reg.count());
}

void test_table_capacity_is_bounded()
{
    static char names[Limits::MaxCommands + 1][16];
    CommandRegistry reg;
    for (uint8_t i = 0; i < Limits::MaxCommands; ++i) {
        snprintf(names[i], sizeof(names[i]), "cmd.%u", (unsigned)i);
        TEST_ASSERT_TRUE(reg.registerHandler(names[i], handlerOk, nullptr));
    }
    snprintf(names[Limits::MaxCommands], sizeof(names[0]), "cmd.extra");
    TEST_ASSERT_FALSE(reg.registerHandler(names[Limits::MaxCommands], handlerOk, nullptr));
    TEST_ASSERT_EQUAL_UINT8(Limits::MaxCommands, reg.count());
}

void test_unknown_and_missing_commands_report_errors()
{
    CommandRegistry reg;
    TEST_ASSERT_FALSE(reg.execute("irrigation.nope", nullptr, nullptr, reply, sizeof(reply)));
    TEST_ASSERT_EQUAL_STRING(
        "{\"ok\":false,\"err\":{\"code\":\"UnknownCmd\",\"where\":\"command\",\"retryable\":false}}", reply);

    TEST_ASSERT_FALSE(reg.execute("", nullptr, nullptr, reply, sizeof(reply)));
    TEST_ASSERT_NOT_NULL(strstr(reply, "\"MissingCmd\""));
}

void test_non_object_reply_is_replaced()
{
    CommandRegistry reg;
    TEST_ASSERT_TRUE(reg.registerHandler("text", handlerPlainText, nullptr));
    TEST_ASSERT_TRUE(reg.registerHandler("silent", handlerSilent, nullptr));

    TEST_ASSERT_FALSE(reg.execute("text", nullptr, nullptr, reply, sizeof(reply)));
    TEST_ASSERT_NOT_NULL(strstr(reply, "\"CmdHandlerFailed\""));

    TEST_ASSERT_FALSE(reg.execute("silent", nullptr, nullptr, reply, sizeof(reply)));
    TEST_ASSERT_NOT_NULL(strstr(reply, "\"command.reply\""));
}

void test_error_json_helpers()
{
    char buf[128];
    TEST_ASSERT_TRUE(writeErrorJsonWithZone(buf, sizeof(buf), ErrorCode::Busy, "irrigation.zone.on", 3));
    TEST_ASSERT_EQUAL_STRING(
        "{\"ok\":false,\"zone\":3,\"err\":{\"code\":\"Busy\",\"where\":\"irrigation.zone.on\",\"retryable\":true}}", buf);

    TEST_ASSERT_TRUE(writeErrorJson(buf, sizeof(buf), ErrorCode::UnknownZone, nullptr));
    TEST_ASSERT_NOT_NULL(strstr(buf, "\"where\":\"unknown\""));

    char tiny[16];
    TEST_ASSERT_FALSE(writeErrorJson(tiny, sizeof(tiny), ErrorCode::Failed, "x"));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_dispatches_to_registered_handler);
    RUN_TEST(test_rejects_duplicates_and_null_handlers);
    RUN_TEST(test_table_capacity_is_bounded);
    RUN_TEST(test_unknown_and_missing_commands_report_errors);
    RUN_TEST(test_non_object_reply_is_replaced);
    RUN_TEST(test_error_json_helpers);
    return UNITY_END();
}
