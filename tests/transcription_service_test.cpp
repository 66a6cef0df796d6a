#include "errors.hpp"
#include "test_utils.hpp"
#include "transcription_service.hpp"

#include <gtest/gtest.h>

using namespace whispertrigger;
using test_utils::MockSpeechModel;
using test_utils::WaitUntil;

namespace {

std::unique_ptr<TranscriptionRequest> MakeRequest(size_t samples,
                                                  const std::string &mode =
                                                      "default") {
    auto request = std::make_unique<TranscriptionRequest>();
    request->audio = std::make_shared<std::vector<float>>(samples, 0.1f);
    request->language = "en";
    request->processing_mode = mode;
    return request;
}

} // namespace

class TranscriptionServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        service = std::make_unique<TranscriptionService>(model);

        TranscriptionService::Handlers handlers;
        handlers.on_result = [this](const TranscriptionResult &result) {
            results.push_back(result);
        };
        handlers.on_failure = [this](uint64_t id, const GError *error) {
            failures.emplace_back(id, g_error_copy(error));
        };
        handlers.on_fallback = [this](const GError *reason) {
            fallbacks.push_back(reason->message);
        };
        handlers.on_model_loaded = [this](bool ok, ComputeDevice device,
                                          const GError *) {
            loads.emplace_back(ok, device);
        };
        service->set_handlers(std::move(handlers));
    }

    void TearDown() override {
        service.reset();
        for (auto &failure : failures) g_error_free(failure.second);
    }

    MockSpeechModel model;
    std::unique_ptr<TranscriptionService> service;

    std::vector<TranscriptionResult> results;
    std::vector<std::pair<uint64_t, GError *>> failures;
    std::vector<std::string> fallbacks;
    std::vector<std::pair<bool, ComputeDevice>> loads;
};

TEST_F(TranscriptionServiceTest, ResultsArriveInSubmissionOrder) {
    model.delay_ms = 20;

    EXPECT_EQ(service->submit(MakeRequest(1000)), 1u);
    EXPECT_EQ(service->submit(MakeRequest(2000)), 2u);
    EXPECT_EQ(service->submit(MakeRequest(3000)), 3u);
    EXPECT_EQ(service->pending(), 3);

    ASSERT_TRUE(WaitUntil([this] { return results.size() == 3; }));
    EXPECT_EQ(results[0].request_id, 1u);
    EXPECT_EQ(results[1].request_id, 2u);
    EXPECT_EQ(results[2].request_id, 3u);
    EXPECT_EQ(results[0].raw_text, "hello from the mock model");
    EXPECT_EQ(results[0].language, "en");
    EXPECT_EQ(results[0].processing_mode, "default");

    const std::vector<size_t> expected = {1000, 2000, 3000};
    EXPECT_EQ(model.SampleCounts(), expected);
    EXPECT_EQ(model.transcribe_calls.load(), 3);
    EXPECT_EQ(model.max_active.load(), 1);
    EXPECT_EQ(service->pending(), 0);
    EXPECT_TRUE(failures.empty());
}

TEST_F(TranscriptionServiceTest, LoadIsSerializedWithInference) {
    model.delay_ms = 20;
    service->submit(MakeRequest(1000));
    service->load_model("/models/ggml-base.en.bin", ComputeDevice::Cpu);
    service->submit(MakeRequest(2000));

    ASSERT_TRUE(WaitUntil([this] {
        return results.size() == 2 && loads.size() == 1;
    }));
    EXPECT_TRUE(loads[0].first);
    EXPECT_EQ(model.max_active.load(), 1);
}

TEST_F(TranscriptionServiceTest, RetranscribeWithoutAudioReturnsZero) {
    EXPECT_FALSE(service->has_last_audio());
    EXPECT_EQ(service->retranscribe_last("en", "default"), 0u);
    EXPECT_EQ(service->pending(), 0);
}

TEST_F(TranscriptionServiceTest, RetranscribeReplaysLastAudio) {
    service->submit(MakeRequest(4000));
    ASSERT_TRUE(WaitUntil([this] { return results.size() == 1; }));

    const uint64_t first = service->retranscribe_last("en", "raw");
    const uint64_t second = service->retranscribe_last("en", "raw");
    EXPECT_EQ(first, 2u);
    EXPECT_EQ(second, 3u);

    ASSERT_TRUE(WaitUntil([this] { return results.size() == 3; }));
    EXPECT_EQ(results[1].raw_text, results[0].raw_text);
    EXPECT_EQ(results[2].raw_text, results[0].raw_text);
    EXPECT_EQ(results[1].processing_mode, "raw");

    const std::vector<size_t> expected = {4000, 4000, 4000};
    EXPECT_EQ(model.SampleCounts(), expected);
}

TEST_F(TranscriptionServiceTest, AcceleratorFailureRetriesOnceOnCpu) {
    model.SetLoaded(true, ComputeDevice::Gpu);
    model.gpu_failures = 1;

    service->submit(MakeRequest(1000));
    ASSERT_TRUE(WaitUntil([this] { return results.size() == 1; }));

    ASSERT_EQ(fallbacks.size(), 1u);
    EXPECT_EQ(fallbacks[0], "CUDA error: device lost");
    EXPECT_EQ(results[0].device, ComputeDevice::Cpu);
    EXPECT_EQ(model.cpu_switches.load(), 1);
    EXPECT_EQ(model.transcribe_calls.load(), 2);

    // Later requests stay on the CPU
    service->submit(MakeRequest(1000));
    ASSERT_TRUE(WaitUntil([this] { return results.size() == 2; }));
    EXPECT_EQ(fallbacks.size(), 1u);

    const std::vector<ComputeDevice> expected = {
        ComputeDevice::Gpu, ComputeDevice::Cpu, ComputeDevice::Cpu};
    EXPECT_EQ(model.DevicesUsed(), expected);
}

TEST_F(TranscriptionServiceTest, CpuRetryFailureIsReportedAsModelError) {
    model.SetLoaded(true, ComputeDevice::Gpu);
    model.gpu_failures = 5;
    model.fail_on_cpu = true;

    const uint64_t id = service->submit(MakeRequest(1000));
    ASSERT_TRUE(WaitUntil([this] { return failures.size() == 1; }));

    EXPECT_EQ(failures[0].first, id);
    EXPECT_TRUE(g_error_matches(failures[0].second, WHISPERTRIGGER_ERROR,
                                WHISPERTRIGGER_ERROR_MODEL));
    EXPECT_EQ(model.transcribe_calls.load(), 2);
    EXPECT_TRUE(results.empty());
    EXPECT_EQ(service->pending(), 0);
}

TEST_F(TranscriptionServiceTest, FailedCpuSwitchIsReported) {
    model.SetLoaded(true, ComputeDevice::Gpu);
    model.gpu_failures = 1;
    model.fail_cpu_switch = true;

    service->submit(MakeRequest(1000));
    ASSERT_TRUE(WaitUntil([this] { return failures.size() == 1; }));

    EXPECT_TRUE(g_error_matches(failures[0].second, WHISPERTRIGGER_ERROR,
                                WHISPERTRIGGER_ERROR_MODEL));
    EXPECT_STREQ(failures[0].second->message,
                 "CPU fallback failed: Cannot reload on CPU");
    EXPECT_EQ(model.transcribe_calls.load(), 1);
}

TEST_F(TranscriptionServiceTest, FailedCpuSwitchWithoutDetailIsReported) {
    model.SetLoaded(true, ComputeDevice::Gpu);
    model.gpu_failures = 1;
    model.fail_cpu_switch = true;
    model.silent_cpu_switch_failure = true;

    service->submit(MakeRequest(1000));
    ASSERT_TRUE(WaitUntil([this] { return failures.size() == 1; }));

    EXPECT_TRUE(g_error_matches(failures[0].second, WHISPERTRIGGER_ERROR,
                                WHISPERTRIGGER_ERROR_MODEL));
    EXPECT_STREQ(failures[0].second->message,
                 "CPU fallback failed: unknown error");
}

TEST_F(TranscriptionServiceTest, UnloadedModelFailsRequest) {
    model.SetLoaded(false, ComputeDevice::Cpu);

    service->submit(MakeRequest(1000));
    ASSERT_TRUE(WaitUntil([this] { return failures.size() == 1; }));
    EXPECT_STREQ(failures[0].second->message, "Model not loaded");
    EXPECT_TRUE(g_error_matches(failures[0].second, WHISPERTRIGGER_ERROR,
                                WHISPERTRIGGER_ERROR_MODEL));
    // Fails before reaching the model
    EXPECT_EQ(model.transcribe_calls.load(), 0);

    // The queue keeps working after a failure
    model.SetLoaded(true, ComputeDevice::Cpu);
    service->submit(MakeRequest(1000));
    ASSERT_TRUE(WaitUntil([this] { return results.size() == 1; }));
}

TEST_F(TranscriptionServiceTest, GpuLoadFailureFallsBackToCpu) {
    model.fail_gpu_load = true;

    service->load_model("/models/ggml-base.en.bin", ComputeDevice::Gpu);
    ASSERT_TRUE(WaitUntil([this] { return loads.size() == 1; }));

    EXPECT_EQ(fallbacks.size(), 1u);
    EXPECT_TRUE(loads[0].first);
    EXPECT_EQ(loads[0].second, ComputeDevice::Cpu);
    EXPECT_EQ(model.load_calls.load(), 2);
}

TEST_F(TranscriptionServiceTest, DestructionDropsQueuedJobs) {
    model.delay_ms = 100;
    for (int i = 0; i < 4; i++) service->submit(MakeRequest(1000));

    service.reset();
    test_utils::DrainMainLoop();

    EXPECT_LE(model.transcribe_calls.load(), 1);
    EXPECT_TRUE(results.empty());
}
