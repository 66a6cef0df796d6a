#include "configuration.hpp"
#include "model_assets.hpp"
#include "test_utils.hpp"

#include <gtest/gtest.h>

using namespace whispertrigger;
using test_utils::TempDir;

TEST(ModelAssetsTest, EnglishPrefersEnglishOnlyCheckpoint) {
    const std::vector<std::string> expected = {
        "ggml-base.en.bin", "ggml-base.bin", "ggml-base-q5_1.bin"};
    EXPECT_EQ(model_file_candidates(ModelSize::Base, "en"), expected);
}

TEST(ModelAssetsTest, OtherLanguagesUseMultilingualCheckpoint) {
    const std::vector<std::string> expected = {"ggml-small.bin",
                                               "ggml-small-q5_1.bin"};
    EXPECT_EQ(model_file_candidates(ModelSize::Small, "de"), expected);
    EXPECT_EQ(model_file_candidates(ModelSize::Small, "auto"), expected);
}

TEST(ModelAssetsTest, LargeTriesNewestFirst) {
    const std::vector<std::string> expected = {
        "ggml-large-v3.bin", "ggml-large-v2.bin", "ggml-large.bin"};
    EXPECT_EQ(model_file_candidates(ModelSize::Large, "en"), expected);
}

TEST(ModelAssetsTest, ResolvesFirstInstalledCandidate) {
    TempDir tmp;
    EXPECT_EQ(resolve_model_path(tmp.path(), ModelSize::Base, "en"), "");

    tmp.Write("ggml-base.bin", "model");
    EXPECT_EQ(resolve_model_path(tmp.path(), ModelSize::Base, "en"),
              tmp.File("ggml-base.bin"));

    tmp.Write("ggml-base.en.bin", "model");
    EXPECT_EQ(resolve_model_path(tmp.path(), ModelSize::Base, "en"),
              tmp.File("ggml-base.en.bin"));
    EXPECT_EQ(resolve_model_path(tmp.path(), ModelSize::Base, "fr"),
              tmp.File("ggml-base.bin"));

    EXPECT_EQ(resolve_model_path(tmp.path(), ModelSize::Medium, "en"), "");
}

TEST(ModelAssetsTest, ComputeDeviceResolution) {
    EXPECT_EQ(resolve_compute_device(DevicePreference::Auto, false, true),
              ComputeDevice::Gpu);
    EXPECT_EQ(resolve_compute_device(DevicePreference::Auto, false, false),
              ComputeDevice::Cpu);
    EXPECT_EQ(resolve_compute_device(DevicePreference::Gpu, false, false),
              ComputeDevice::Cpu);
    EXPECT_EQ(resolve_compute_device(DevicePreference::Gpu, true, true),
              ComputeDevice::Cpu);
    EXPECT_EQ(resolve_compute_device(DevicePreference::Cpu, false, true),
              ComputeDevice::Cpu);
}

TEST(ModelAssetsTest, ModelsDirFollowsEnvironment) {
    g_setenv("WHISPERTRIGGER_MODELS_DIR", "/srv/whisper", TRUE);
    EXPECT_EQ(default_models_dir(), "/srv/whisper");

    g_unsetenv("WHISPERTRIGGER_MODELS_DIR");
    const std::string dir = default_models_dir();
    EXPECT_NE(dir.find("whispertrigger"), std::string::npos);
}

TEST(ModelAssetsTest, NamesRoundTrip) {
    ModelSize size = ModelSize::Base;
    EXPECT_TRUE(model_size_from_name("medium", &size));
    EXPECT_EQ(size, ModelSize::Medium);
    EXPECT_TRUE(model_size_from_name("large-v2", &size));
    EXPECT_EQ(size, ModelSize::Large);
    EXPECT_FALSE(model_size_from_name("gigantic", &size));

    DevicePreference device = DevicePreference::Auto;
    EXPECT_TRUE(device_preference_from_name("cuda", &device));
    EXPECT_EQ(device, DevicePreference::Gpu);
    EXPECT_FALSE(device_preference_from_name("tpu", &device));

    EXPECT_STREQ(compute_device_name(ComputeDevice::Gpu), "GPU");
    EXPECT_STREQ(action_key(Action::TranscribeLast), "transcribe_last");
}
