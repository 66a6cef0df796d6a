#include "errors.hpp"
#include "post_processor.hpp"
#include "processing_modes.hpp"
#include "soup_text_generator.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>
#include <json-glib/json-glib.h>

using namespace whispertrigger;
using test_utils::FakeTextGenerator;
using test_utils::TempDir;
using test_utils::WaitUntil;

// --- Cleanup ---

TEST(CleanTranscriptTest, CollapsesWhitespaceAndCapitalizes) {
    EXPECT_EQ(clean_transcript("  hello   world.  this is   a test  "),
              "Hello world. This is a test.");
    EXPECT_EQ(clean_transcript("what time is it? it is late,"),
              "What time is it? It is late.");
    EXPECT_EQ(clean_transcript("line one\n\nline two"), "Line one line two.");
}

TEST(CleanTranscriptTest, KeepsExistingTerminator) {
    EXPECT_EQ(clean_transcript("Done!"), "Done!");
    EXPECT_EQ(clean_transcript("version 3.14 works."), "Version 3.14 works.");
}

TEST(CleanTranscriptTest, HandlesNonAsciiText) {
    EXPECT_EQ(clean_transcript("élan vital. über alles"),
              "Élan vital. Über alles.");
}

TEST(CleanTranscriptTest, EmptyAndInvalidInput) {
    EXPECT_EQ(clean_transcript(""), "");
    EXPECT_EQ(clean_transcript("   \t "), "");

    const std::string invalid = "abc \xff\xfe def";
    EXPECT_EQ(clean_transcript(invalid), invalid);
}

TEST(RewritePromptTest, AddsWindowTitleWhenKnown) {
    EXPECT_EQ(build_rewrite_prompt("Summarize", ""), "Summarize");

    const std::string prompt = build_rewrite_prompt("Summarize", "Inbox - Mail");
    EXPECT_EQ(prompt.rfind("Summarize", 0), 0u);
    EXPECT_NE(prompt.find("\"Inbox - Mail\""), std::string::npos);
}

// --- Mode catalog ---

TEST(ModeCatalogTest, HasBuiltInModes) {
    ModeCatalog catalog;
    const std::vector<std::string> expected = {"code",  "default", "email",
                                               "formatting", "notes", "raw"};
    EXPECT_EQ(catalog.names(), expected);

    EXPECT_EQ(catalog.find("raw").kind, ModeKind::Verbatim);
    EXPECT_EQ(catalog.find("default").kind, ModeKind::Cleaned);
    EXPECT_EQ(catalog.find("email").kind, ModeKind::Rewrite);
    EXPECT_FALSE(catalog.find("email").instructions.empty());
}

TEST(ModeCatalogTest, UnknownModeFallsBackToDefault) {
    ModeCatalog catalog;
    EXPECT_FALSE(catalog.contains("haiku"));
    EXPECT_EQ(catalog.find("haiku").name, ModeCatalog::DEFAULT_MODE);
}

TEST(ModeCatalogTest, LoadsCustomModesAndSkipsBrokenFiles) {
    TempDir tmp;
    tmp.Write("meeting.json",
              "{\"name\": \"meeting\", \"description\": \"Minutes\", "
              "\"instructions\": \"Summarize as minutes\"}");
    tmp.Write("raw.json",
              "{\"name\": \"raw\", \"kind\": \"cleaned\", "
              "\"instructions\": \"Tidy up\"}");
    tmp.Write("broken.json", "{\"name\": ");
    tmp.Write("nameless.json", "{\"description\": \"No name\"}");
    tmp.Write("badkind.json", "{\"name\": \"odd\", \"kind\": \"poetry\"}");
    tmp.Write("notes.txt", "{\"name\": \"ignored\"}");

    ModeCatalog catalog;
    EXPECT_EQ(catalog.load_directory(tmp.path()), 2);

    ASSERT_TRUE(catalog.contains("meeting"));
    EXPECT_EQ(catalog.find("meeting").kind, ModeKind::Rewrite);
    EXPECT_EQ(catalog.find("meeting").instructions, "Summarize as minutes");
    EXPECT_EQ(catalog.find("raw").kind, ModeKind::Cleaned);
    EXPECT_FALSE(catalog.contains("odd"));
    EXPECT_FALSE(catalog.contains("ignored"));
}

TEST(ModeCatalogTest, SavedModesLoadBackAndCanBeDeleted) {
    TempDir tmp;
    const std::string dir = tmp.File("modes");

    ModeCatalog catalog;
    GError *error = nullptr;
    ASSERT_TRUE(catalog.save_mode(
        dir, {"standup", "Daily standup", "List yesterday, today, blockers",
              ModeKind::Rewrite},
        &error));
    ASSERT_TRUE(catalog.save_mode(
        dir, {"code", "Plain code", "Keep it short", ModeKind::Cleaned},
        &error));
    EXPECT_TRUE(catalog.contains("standup"));

    ModeCatalog reloaded;
    EXPECT_EQ(reloaded.load_directory(dir), 2);
    const ProcessingMode &standup = reloaded.find("standup");
    EXPECT_EQ(standup.description, "Daily standup");
    EXPECT_EQ(standup.instructions, "List yesterday, today, blockers");
    EXPECT_EQ(standup.kind, ModeKind::Rewrite);
    EXPECT_EQ(reloaded.find("code").kind, ModeKind::Cleaned);

    ASSERT_TRUE(reloaded.remove_mode(dir, "standup", &error));
    EXPECT_FALSE(reloaded.contains("standup"));
    EXPECT_FALSE(g_file_test(tmp.File("modes/standup.json").c_str(),
                             G_FILE_TEST_EXISTS));

    // A built-in keeps its name and reverts to the stock definition
    ASSERT_TRUE(reloaded.remove_mode(dir, "code", &error));
    ASSERT_TRUE(reloaded.contains("code"));
    EXPECT_TRUE(reloaded.is_builtin("code"));
    EXPECT_EQ(reloaded.find("code").kind, ModeKind::Rewrite);

    ModeCatalog fresh;
    EXPECT_EQ(fresh.load_directory(dir), 0);
}

TEST(ModeCatalogTest, SaveAndRemoveRejectBadRequests) {
    TempDir tmp;
    ModeCatalog catalog;
    GError *error = nullptr;

    EXPECT_FALSE(catalog.save_mode(
        tmp.path(), {"../escape", "", "", ModeKind::Rewrite}, &error));
    ASSERT_NE(error, nullptr);
    EXPECT_TRUE(g_error_matches(error, WHISPERTRIGGER_ERROR,
                                WHISPERTRIGGER_ERROR_CONFIG));
    g_clear_error(&error);
    EXPECT_FALSE(catalog.contains("../escape"));

    EXPECT_FALSE(catalog.remove_mode(tmp.path(), "default", &error));
    ASSERT_NE(error, nullptr);
    EXPECT_STREQ(error->message, "The default mode cannot be deleted");
    g_clear_error(&error);

    EXPECT_FALSE(catalog.remove_mode(tmp.path(), "haiku", &error));
    ASSERT_NE(error, nullptr);
    EXPECT_STREQ(error->message, "Unknown processing mode 'haiku'");
    g_clear_error(&error);
}

TEST(ModeCatalogTest, MissingDirectoryLoadsNothing) {
    ModeCatalog catalog;
    EXPECT_EQ(catalog.load_directory("/nonexistent/whispertrigger/modes"), 0);
    EXPECT_EQ(catalog.names().size(), 6u);
}

TEST(ModeCatalogTest, ModeJsonErrors) {
    ProcessingMode mode;
    GError *error = nullptr;

    EXPECT_FALSE(processing_mode_from_json("{\"name\": 5}", &mode, &error));
    ASSERT_NE(error, nullptr);
    EXPECT_STREQ(error->message, "Member 'name' must be a string");
    g_clear_error(&error);

    EXPECT_FALSE(processing_mode_from_json("[]", &mode, &error));
    EXPECT_TRUE(g_error_matches(error, WHISPERTRIGGER_ERROR,
                                WHISPERTRIGGER_ERROR_CONFIG));
    g_clear_error(&error);
}

// --- Post-processing ---

class PostProcessorTest : public ::testing::Test {
protected:
    TranscriptionResult Result(const std::string &mode) {
        TranscriptionResult result;
        result.request_id = 1;
        result.raw_text = "so the meeting is moved to friday";
        result.processing_mode = mode;
        return result;
    }

    void Process(PostProcessor &processor, const std::string &mode,
                 const std::string &instruction_text = "") {
        processor.process(Result(mode), instruction_text, "Calendar",
                          [this](const std::string &text,
                                 const GError *notice) {
                              done = true;
                              output = text;
                              if (notice != nullptr) {
                                  notice_code = notice->code;
                                  notice_message = notice->message;
                              }
                          });
    }

    ModeCatalog catalog;
    FakeTextGenerator generator;

    bool done = false;
    std::string output;
    int notice_code = -1;
    std::string notice_message;
};

TEST_F(PostProcessorTest, VerbatimModeReturnsRawText) {
    PostProcessor processor(catalog, &generator);
    Process(processor, "raw");

    EXPECT_TRUE(done);
    EXPECT_EQ(output, "so the meeting is moved to friday");
    EXPECT_EQ(generator.calls, 0);
}

TEST_F(PostProcessorTest, CleanedModeCompletesSynchronously) {
    PostProcessor processor(catalog, &generator);
    Process(processor, "default");

    EXPECT_TRUE(done);
    EXPECT_EQ(output, "So the meeting is moved to friday.");
    EXPECT_EQ(notice_code, -1);
}

TEST_F(PostProcessorTest, RewriteModeUsesGenerator) {
    PostProcessor processor(catalog, &generator);
    Process(processor, "email");
    EXPECT_FALSE(done);

    ASSERT_TRUE(WaitUntil([this] { return done; }));
    EXPECT_EQ(output, "Rewritten text.");
    EXPECT_EQ(generator.last_text, "so the meeting is moved to friday");
    EXPECT_EQ(generator.last_instructions.rfind(
                  catalog.find("email").instructions, 0),
              0u);
    EXPECT_NE(generator.last_instructions.find("Calendar"), std::string::npos);
}

TEST_F(PostProcessorTest, InstructionTextOverridesMode) {
    PostProcessor processor(catalog, &generator);
    Process(processor, "notes", "Answer in French");

    ASSERT_TRUE(WaitUntil([this] { return done; }));
    EXPECT_EQ(generator.last_instructions.rfind("Answer in French", 0), 0u);
}

TEST_F(PostProcessorTest, RewriteFailureFallsBackToRawText) {
    generator.fail = true;
    PostProcessor processor(catalog, &generator);
    Process(processor, "email");

    ASSERT_TRUE(WaitUntil([this] { return done; }));
    EXPECT_EQ(output, "so the meeting is moved to friday");
    EXPECT_EQ(notice_code, WHISPERTRIGGER_ERROR_REWRITE);
    EXPECT_NE(notice_message.find("HTTP 401"), std::string::npos);
}

TEST_F(PostProcessorTest, EmptyRewriteFallsBackToRawText) {
    generator.response = "";
    PostProcessor processor(catalog, &generator);
    Process(processor, "code");

    ASSERT_TRUE(WaitUntil([this] { return done; }));
    EXPECT_EQ(output, "so the meeting is moved to friday");
    EXPECT_EQ(notice_code, WHISPERTRIGGER_ERROR_REWRITE);
}

TEST_F(PostProcessorTest, RewriteWithoutGeneratorFallsBack) {
    PostProcessor processor(catalog, nullptr);
    Process(processor, "notes");

    EXPECT_TRUE(done);
    EXPECT_EQ(output, "so the meeting is moved to friday");
    EXPECT_EQ(notice_code, WHISPERTRIGGER_ERROR_REWRITE);
}

// --- Chat completions wire format ---

TEST(ChatRequestTest, BuildsSystemAndUserMessages) {
    const std::string body =
        build_chat_request("mistral-small-latest", "Be brief", "hello there");

    JsonParser *parser = json_parser_new();
    ASSERT_TRUE(json_parser_load_from_data(parser, body.c_str(), -1, nullptr));
    JsonObject *obj = json_node_get_object(json_parser_get_root(parser));

    EXPECT_STREQ(json_object_get_string_member(obj, "model"),
                 "mistral-small-latest");
    EXPECT_DOUBLE_EQ(json_object_get_double_member(obj, "temperature"), 0.2);

    JsonArray *messages = json_object_get_array_member(obj, "messages");
    ASSERT_EQ(json_array_get_length(messages), 2u);
    JsonObject *system = json_array_get_object_element(messages, 0);
    JsonObject *user = json_array_get_object_element(messages, 1);
    EXPECT_STREQ(json_object_get_string_member(system, "role"), "system");
    EXPECT_STREQ(json_object_get_string_member(system, "content"), "Be brief");
    EXPECT_STREQ(json_object_get_string_member(user, "role"), "user");
    EXPECT_STREQ(json_object_get_string_member(user, "content"),
                 "hello there");

    g_object_unref(parser);
}

TEST(ChatResponseTest, ExtractsFirstChoice) {
    std::string content;
    GError *error = nullptr;
    ASSERT_TRUE(parse_chat_response(
        "{\"choices\": [{\"message\": {\"role\": \"assistant\", "
        "\"content\": \"Hi team,\"}}]}",
        &content, &error));
    EXPECT_EQ(content, "Hi team,");
}

TEST(ChatResponseTest, ReportsApiErrors) {
    std::string content;
    GError *error = nullptr;

    EXPECT_FALSE(parse_chat_response(
        "{\"error\": {\"message\": \"Invalid model\"}}", &content, &error));
    ASSERT_NE(error, nullptr);
    EXPECT_TRUE(g_error_matches(error, WHISPERTRIGGER_ERROR,
                                WHISPERTRIGGER_ERROR_REWRITE));
    EXPECT_STREQ(error->message, "API error: Invalid model");
    g_clear_error(&error);

    EXPECT_FALSE(parse_chat_response("{\"message\": \"Unauthorized\"}",
                                     &content, &error));
    EXPECT_STREQ(error->message, "API error: Unauthorized");
    g_clear_error(&error);

    EXPECT_FALSE(parse_chat_response("{\"choices\": []}", &content, &error));
    EXPECT_STREQ(error->message, "No text in response");
    g_clear_error(&error);

    EXPECT_FALSE(parse_chat_response("<html>", &content, &error));
    EXPECT_TRUE(g_error_matches(error, WHISPERTRIGGER_ERROR,
                                WHISPERTRIGGER_ERROR_REWRITE));
    g_clear_error(&error);
}

TEST(SoupTextGeneratorTest, MissingApiKeyFailsImmediately) {
    TempDir tmp;
    ConfigStore store(tmp.File("config.json"));
    g_unsetenv("MISTRAL_API_KEY");

    SoupTextGenerator generator(store);
    bool called = false;
    std::string message;
    generator.generate("Be brief", "hello",
                       [&](const std::string &text, const GError *error) {
                           called = true;
                           EXPECT_TRUE(text.empty());
                           ASSERT_NE(error, nullptr);
                           message = error->message;
                       });

    EXPECT_TRUE(called);
    EXPECT_EQ(message, "No API key configured (set MISTRAL_API_KEY)");
}
