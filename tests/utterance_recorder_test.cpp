#include "audio/utterance_recorder.hpp"
#include "audio/wav_codec.hpp"
#include "audio/wav_file_source.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

namespace {

SilenceGate::Config fastConfig() {
    SilenceGate::Config config;
    config.silenceThreshold = 0.003f;
    config.frameMs = 500;
    config.silenceTimeoutMs = 1000;
    config.initialTimeoutMs = 2000;
    config.maxRecordMs = 10000;
    return config;
}

} // namespace

TEST(UtteranceRecorderTest, ReturnsEveryFrameInOrderOnCompletion) {
    std::vector<AudioFrame> frames = {toneFrame(0.2f), toneFrame(0.3f), silentFrame(), silentFrame()};
    ScriptedSource source(frames);
    UtteranceRecorder recorder(source, fastConfig());

    const UtteranceRecorder::Result result = recorder.record();

    EXPECT_EQ(result.outcome, UtteranceRecorder::Outcome::Completed);
    EXPECT_TRUE(result.hasUtterance());
    EXPECT_EQ(result.durationMs, 2000);

    std::vector<float> expected;
    for (const auto& f : frames) expected.insert(expected.end(), f.samples.begin(), f.samples.end());
    EXPECT_EQ(result.samples, expected);
}

TEST(UtteranceRecorderTest, SourceIsOpenedForTheCallOnly) {
    ScriptedSource source({speechFrame()});
    UtteranceRecorder recorder(source, fastConfig());

    EXPECT_FALSE(source.isOpen());
    recorder.record();
    EXPECT_FALSE(source.isOpen());
    EXPECT_EQ(source.opens(), 1);
    EXPECT_EQ(source.closes(), 1);

    recorder.record();
    EXPECT_EQ(source.opens(), 2);
    EXPECT_EQ(source.closes(), 2);
}

TEST(UtteranceRecorderTest, NoSpeechDiscardsCapturedAudio) {
    ScriptedSource source;
    UtteranceRecorder recorder(source, fastConfig());

    const UtteranceRecorder::Result result = recorder.record();

    EXPECT_EQ(result.outcome, UtteranceRecorder::Outcome::NoSpeech);
    EXPECT_FALSE(result.hasUtterance());
    EXPECT_TRUE(result.samples.empty());
    EXPECT_EQ(source.closes(), 1);
}

TEST(UtteranceRecorderTest, MaxDurationKeepsWhatWasRecorded) {
    SilenceGate::Config config = fastConfig();
    config.maxRecordMs = 1500;
    ScriptedSource source(std::vector<AudioFrame>(10, speechFrame()));
    UtteranceRecorder recorder(source, config);

    const UtteranceRecorder::Result result = recorder.record();

    EXPECT_EQ(result.outcome, UtteranceRecorder::Outcome::MaxDurationReached);
    EXPECT_TRUE(result.hasUtterance());
    EXPECT_EQ(result.samples.size(), 3u * kTestFrameSamples);
}

TEST(UtteranceRecorderTest, OverflowedFrameIsKeptAndCaptureContinues) {
    AudioFrame overflowed = toneFrame(0.5f);
    overflowed.overflowed = true;
    ScriptedSource source({speechFrame(), overflowed, silentFrame(), silentFrame()});
    UtteranceRecorder recorder(source, fastConfig());

    const UtteranceRecorder::Result result = recorder.record();

    EXPECT_EQ(result.outcome, UtteranceRecorder::Outcome::Completed);
    ASSERT_EQ(result.samples.size(), 4u * kTestFrameSamples);
    EXPECT_FLOAT_EQ(result.samples[kTestFrameSamples], 0.5f);
}

TEST(UtteranceRecorderTest, DeviceErrorPropagatesAndReleasesSource) {
    ScriptedSource source({speechFrame(), speechFrame(), speechFrame()});
    source.failOnRead(2);
    UtteranceRecorder recorder(source, fastConfig());

    EXPECT_THROW(recorder.record(), DeviceError);
    EXPECT_FALSE(source.isOpen());
    EXPECT_EQ(source.closes(), 1);
}

TEST(UtteranceRecorderTest, OpenFailureIsADeviceError) {
    ScriptedSource source;
    source.failOpen();
    UtteranceRecorder recorder(source, fastConfig());

    EXPECT_THROW(recorder.record(), DeviceError);
    EXPECT_EQ(source.opens(), 0);
}

TEST(UtteranceRecorderTest, WavFileSourceRunsTheSameGate) {
    const int sampleRate = 1000;
    const int frameSamples = 500;

    // One second of tone, then end of file; the source pads with silence.
    std::vector<float> tone;
    for (int i = 0; i < sampleRate; ++i) tone.push_back(i % 2 ? -0.1f : 0.1f);
    const std::vector<uint8_t> bytes = encodeWav(tone, sampleRate);

    const std::string path = testing::TempDir() + "voxgate_recorder_test.wav";
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()), (std::streamsize)bytes.size());
    }

    WavFileSource source(path, sampleRate, frameSamples);
    UtteranceRecorder recorder(source, fastConfig());

    const UtteranceRecorder::Result result = recorder.record();

    EXPECT_EQ(result.outcome, UtteranceRecorder::Outcome::Completed);
    EXPECT_EQ(result.durationMs, 2000);
    EXPECT_EQ(result.samples.size(), 4u * frameSamples);
    EXPECT_FALSE(source.isOpen());
}

TEST(UtteranceRecorderTest, WavFileSourceRejectsWrongSampleRate) {
    const std::vector<uint8_t> bytes = encodeWav(std::vector<float>(100, 0.0f), 8000);
    const std::string path = testing::TempDir() + "voxgate_rate_test.wav";
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()), (std::streamsize)bytes.size());
    }

    WavFileSource source(path, 16000, 8000);
    UtteranceRecorder recorder(source, fastConfig());

    EXPECT_THROW(recorder.record(), DeviceError);
}

TEST(UtteranceRecorderTest, MissingWavFileIsADeviceError) {
    WavFileSource source(testing::TempDir() + "does_not_exist.wav", 16000, 8000);
    EXPECT_THROW(source.open(), DeviceError);
}
