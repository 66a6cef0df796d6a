#include "config_store.hpp"
#include "errors.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

using namespace whispertrigger;
using test_utils::TempDir;

class ConfigStoreTest : public ::testing::Test {
protected:
    std::string ConfigPath() const { return tmp.File("config.json"); }

    TempDir tmp;
};

TEST_F(ConfigStoreTest, MissingFileWritesDefaults) {
    const std::string path = tmp.File("nested/dir/config.json");
    ConfigStore store(path);

    GError *error = nullptr;
    ASSERT_TRUE(store.load(&error));
    EXPECT_TRUE(g_file_test(path.c_str(), G_FILE_TEST_IS_REGULAR));

    ConfigStore reread(path);
    ASSERT_TRUE(reread.load(&error));
    EXPECT_EQ(reread.current().model_size, ModelSize::Base);
    EXPECT_EQ(reread.current().language, "en");
    EXPECT_EQ(reread.current().processing_mode, "default");
    EXPECT_EQ(reread.current().shortcuts.at(Action::ToggleRecording),
              "<Ctrl><Shift>space");
}

TEST_F(ConfigStoreTest, CommitPersistsEveryField) {
    ConfigStore store(ConfigPath());

    Configuration config;
    config.model_size = ModelSize::Small;
    config.language = "de";
    config.device = DevicePreference::Cpu;
    config.processing_mode = "email";
    config.instruction_text = "Keep it short";
    config.inject_text = false;
    config.audio_device = "alsa_input.usb-mic";
    config.min_duration_ms = 500;
    config.max_duration_s = 60;
    config.silence_duration_s = 1.5;
    config.models_dir = "/opt/models";
    config.rewrite.timeout_s = 10;
    config.shortcuts[Action::Quit] = "";

    GError *error = nullptr;
    ASSERT_TRUE(store.commit(config, &error));

    ConfigStore reread(ConfigPath());
    ASSERT_TRUE(reread.load(&error));
    const Configuration &loaded = reread.current();
    EXPECT_EQ(loaded.model_size, ModelSize::Small);
    EXPECT_EQ(loaded.language, "de");
    EXPECT_EQ(loaded.device, DevicePreference::Cpu);
    EXPECT_EQ(loaded.processing_mode, "email");
    EXPECT_EQ(loaded.instruction_text, "Keep it short");
    EXPECT_FALSE(loaded.inject_text);
    EXPECT_EQ(loaded.audio_device, "alsa_input.usb-mic");
    EXPECT_EQ(loaded.min_duration_ms, 500);
    EXPECT_EQ(loaded.max_duration_s, 60);
    EXPECT_DOUBLE_EQ(loaded.silence_duration_s, 1.5);
    EXPECT_EQ(loaded.models_dir, "/opt/models");
    EXPECT_EQ(loaded.rewrite.timeout_s, 10);
    EXPECT_EQ(loaded.shortcuts.at(Action::Quit), "");
}

TEST_F(ConfigStoreTest, MalformedFileKeepsDefaultsAndFile) {
    const std::string garbage = "{ \"model\": \"small\", ";
    tmp.Write("config.json", garbage);
    ConfigStore store(ConfigPath());

    GError *error = nullptr;
    EXPECT_FALSE(store.load(&error));
    ASSERT_NE(error, nullptr);
    EXPECT_TRUE(g_error_matches(error, WHISPERTRIGGER_ERROR,
                                WHISPERTRIGGER_ERROR_CONFIG));
    g_error_free(error);

    EXPECT_EQ(store.current().model_size, ModelSize::Base);
    EXPECT_EQ(tmp.Read("config.json"), garbage);
}

TEST_F(ConfigStoreTest, WrongMemberTypeIsReported) {
    tmp.Write("config.json", "{\"inject_text\": \"yes\"}");
    ConfigStore store(ConfigPath());

    GError *error = nullptr;
    EXPECT_FALSE(store.load(&error));
    ASSERT_NE(error, nullptr);
    EXPECT_STREQ(error->message,
                 "Setting 'inject_text' must be true or false");
    g_error_free(error);
}

TEST_F(ConfigStoreTest, OutOfRangeIntegerIsRejected) {
    tmp.Write("config.json",
              "{\"audio\": {\"max_duration_s\": 4294967596}}");
    ConfigStore store(ConfigPath());

    GError *error = nullptr;
    EXPECT_FALSE(store.load(&error));
    ASSERT_NE(error, nullptr);
    EXPECT_TRUE(g_error_matches(error, WHISPERTRIGGER_ERROR,
                                WHISPERTRIGGER_ERROR_CONFIG));
    EXPECT_STREQ(error->message,
                 "Setting 'max_duration_s' is out of range (4294967596)");
    g_error_free(error);
    EXPECT_EQ(store.current().max_duration_s, Configuration().max_duration_s);
}

TEST_F(ConfigStoreTest, LargeDurationsCompareWithoutOverflow) {
    tmp.Write("config.json",
              "{\"audio\": {\"max_duration_s\": 3000000, "
              "\"min_duration_ms\": 2000000000}}");
    ConfigStore store(ConfigPath());

    GError *error = nullptr;
    ASSERT_TRUE(store.load(&error));
    EXPECT_EQ(store.current().max_duration_s, 3000000);
    EXPECT_EQ(store.current().min_duration_ms, 2000000000);
}

TEST_F(ConfigStoreTest, UnknownModelSizeIsRejected) {
    tmp.Write("config.json", "{\"model\": \"huge\"}");
    ConfigStore store(ConfigPath());

    GError *error = nullptr;
    EXPECT_FALSE(store.load(&error));
    ASSERT_NE(error, nullptr);
    EXPECT_STREQ(error->message, "Unknown model size 'huge'");
    g_error_free(error);
}

TEST_F(ConfigStoreTest, PartialFileKeepsDefaultsForMissingMembers) {
    tmp.Write("config.json",
              "{\"model\": \"large-v3\", \"audio\": {\"max_duration_s\": 90}}");
    ConfigStore store(ConfigPath());

    GError *error = nullptr;
    ASSERT_TRUE(store.load(&error));
    EXPECT_EQ(store.current().model_size, ModelSize::Large);
    EXPECT_EQ(store.current().max_duration_s, 90);
    EXPECT_EQ(store.current().min_duration_ms, 250);
    EXPECT_EQ(store.current().language, "en");
}

TEST_F(ConfigStoreTest, LegacyTranscribeFileKeyIsRead) {
    tmp.Write("config.json",
              "{\"hotkeys\": {\"transcribe_file\": \"alt+f\"}}");
    ConfigStore store(ConfigPath());

    GError *error = nullptr;
    ASSERT_TRUE(store.load(&error));
    EXPECT_EQ(store.current().shortcuts.at(Action::TranscribeLast), "<Alt>f");
}

TEST_F(ConfigStoreTest, CommitNormalizesShortcuts) {
    ConfigStore store(ConfigPath());
    Configuration config;
    config.shortcuts[Action::ToggleRecording] = "ctrl+alt+R";

    GError *error = nullptr;
    ASSERT_TRUE(store.commit(config, &error));
    EXPECT_EQ(store.current().shortcuts.at(Action::ToggleRecording),
              "<Ctrl><Alt>r");
}

TEST_F(ConfigStoreTest, ConflictingShortcutsLeaveEverythingUnchanged) {
    ConfigStore store(ConfigPath());
    GError *error = nullptr;
    ASSERT_TRUE(store.load(&error));
    const std::string before = tmp.Read("config.json");

    Configuration config = store.current();
    config.language = "fr";
    config.shortcuts[Action::ToggleRecording] = "ctrl+alt+r";
    config.shortcuts[Action::Quit] = "<Control><Alt>R";

    EXPECT_FALSE(store.commit(config, &error));
    ASSERT_NE(error, nullptr);
    EXPECT_TRUE(g_error_matches(error, WHISPERTRIGGER_ERROR,
                                WHISPERTRIGGER_ERROR_CONFIG));
    EXPECT_NE(std::string(error->message).find("both bound"),
              std::string::npos);
    g_error_free(error);

    EXPECT_EQ(store.current().language, "en");
    EXPECT_EQ(tmp.Read("config.json"), before);
}

TEST_F(ConfigStoreTest, InvalidDurationsAreRejected) {
    ConfigStore store(ConfigPath());
    Configuration config;
    config.min_duration_ms = 5000;
    config.max_duration_s = 2;

    GError *error = nullptr;
    EXPECT_FALSE(store.commit(config, &error));
    ASSERT_NE(error, nullptr);
    EXPECT_TRUE(g_error_matches(error, WHISPERTRIGGER_ERROR,
                                WHISPERTRIGGER_ERROR_CONFIG));
    g_clear_error(&error);

    config = Configuration();
    config.language = "";
    EXPECT_FALSE(store.commit(config, &error));
    g_clear_error(&error);
}

TEST_F(ConfigStoreTest, ValidatorBlocksCommit) {
    ConfigStore store(ConfigPath());
    int notified = 0;
    store.subscribe([&notified](const Configuration &, const Configuration &) {
        notified++;
    });
    store.add_validator([](const Configuration &candidate, GError **error) {
        if (candidate.model_size == ModelSize::Large) {
            g_set_error_literal(error, WHISPERTRIGGER_ERROR,
                                WHISPERTRIGGER_ERROR_CONFIG,
                                "Model 'large' is not installed");
            return false;
        }
        return true;
    });

    Configuration config;
    config.model_size = ModelSize::Large;
    GError *error = nullptr;
    EXPECT_FALSE(store.commit(config, &error));
    ASSERT_NE(error, nullptr);
    EXPECT_STREQ(error->message, "Model 'large' is not installed");
    g_error_free(error);

    EXPECT_EQ(store.current().model_size, ModelSize::Base);
    EXPECT_EQ(notified, 0);
    EXPECT_FALSE(g_file_test(ConfigPath().c_str(), G_FILE_TEST_EXISTS));
}

TEST_F(ConfigStoreTest, ObserversSeePreviousAndCurrent) {
    ConfigStore store(ConfigPath());
    std::string previous_language;
    std::string current_language;
    store.subscribe([&](const Configuration &previous,
                        const Configuration &current) {
        previous_language = previous.language;
        current_language = current.language;
    });

    Configuration config;
    config.language = "de";
    GError *error = nullptr;
    ASSERT_TRUE(store.commit(config, &error));

    EXPECT_EQ(previous_language, "en");
    EXPECT_EQ(current_language, "de");
    EXPECT_EQ(store.current().language, "de");
}

TEST_F(ConfigStoreTest, LoadRejectsConflictingShortcutsInFile) {
    tmp.Write("config.json",
              "{\"hotkeys\": {\"settings\": \"<Alt>x\", \"quit\": \"alt+x\"}}");
    ConfigStore store(ConfigPath());

    GError *error = nullptr;
    EXPECT_FALSE(store.load(&error));
    ASSERT_NE(error, nullptr);
    EXPECT_TRUE(g_error_matches(error, WHISPERTRIGGER_ERROR,
                                WHISPERTRIGGER_ERROR_CONFIG));
    g_error_free(error);
    EXPECT_EQ(store.current().shortcuts.at(Action::Quit), "<Alt>q");
}
