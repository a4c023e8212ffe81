#include "app/config.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace {

Config parse(std::vector<std::string> args) {
    args.insert(args.begin(), "voxgate");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(&a[0]);
    return parseArgs((int)argv.size(), argv.data());
}

} // namespace

TEST(ConfigTest, DefaultsMatchTheShippedTuning) {
    const Config c = parse({});

    EXPECT_EQ(c.audio.sampleRate, 16000);
    EXPECT_EQ(c.audio.channels, 1);
    EXPECT_EQ(c.gate.frameMs, 500);
    EXPECT_EQ(c.stt.beamSize, 1);
    EXPECT_TRUE(c.stt.vadModelPath.empty());
    EXPECT_EQ(c.stt.vadMinSilenceMs, 2000);
    EXPECT_FLOAT_EQ(c.gate.silenceThreshold, 0.003f);
    EXPECT_EQ(c.gate.silenceTimeoutMs, 3500);
    EXPECT_EQ(c.gate.maxRecordMs, 120000);
    EXPECT_EQ(c.gate.initialTimeoutMs, 15000);
    EXPECT_EQ(c.samplesPerFrame(), 8000);
    ASSERT_EQ(c.languages.size(), 2u);
    EXPECT_EQ(c.languages[0].code, "en");
    EXPECT_EQ(c.languages[1].abbreviation, "AR");
    EXPECT_EQ(c.dialect.languageCode, "ar");
    EXPECT_FALSE(c.showHelp);
}

TEST(ConfigTest, FlagsOverrideDefaults) {
    const Config c = parse({"--model", "m.bin", "--threads", "8", "--threshold", "0.01",
                            "--silence-timeout", "2.5", "--max-duration", "60", "--initial-timeout", "10",
                            "--frame-ms", "250", "--port", "4000", "--audio-file", "in.wav", "--print"});

    EXPECT_EQ(c.stt.modelPath, "m.bin");
    EXPECT_EQ(c.stt.threads, 8);
    EXPECT_FLOAT_EQ(c.gate.silenceThreshold, 0.01f);
    EXPECT_EQ(c.gate.silenceTimeoutMs, 2500);
    EXPECT_EQ(c.gate.maxRecordMs, 60000);
    EXPECT_EQ(c.gate.initialTimeoutMs, 10000);
    EXPECT_EQ(c.gate.frameMs, 250);
    EXPECT_EQ(c.samplesPerFrame(), 4000);
    EXPECT_EQ(c.trigger.port, 4000);
    EXPECT_EQ(c.audio.inputFile, "in.wav");
    EXPECT_TRUE(c.output.print);
}

TEST(ConfigTest, CaptureAndDecoderFlags) {
    const Config c = parse({"--channels", "2", "--beam", "5", "--vad-model", "silero.bin", "--vad-min-silence", "1.5"});

    EXPECT_EQ(c.audio.channels, 2);
    EXPECT_EQ(c.stt.beamSize, 5);
    EXPECT_EQ(c.stt.vadModelPath, "silero.bin");
    EXPECT_EQ(c.stt.vadMinSilenceMs, 1500);
}

TEST(ConfigTest, HelpIsReported) {
    EXPECT_TRUE(parse({"--help"}).showHelp);
    EXPECT_TRUE(parse({"-h"}).showHelp);
}

TEST(ConfigTest, BadValuesAreRejected) {
    EXPECT_THROW(parse({"--threads", "zero"}), std::invalid_argument);
    EXPECT_THROW(parse({"--threads", "0"}), std::invalid_argument);
    EXPECT_THROW(parse({"--threshold", "-1"}), std::invalid_argument);
    EXPECT_THROW(parse({"--silence-timeout", "0"}), std::invalid_argument);
    EXPECT_THROW(parse({"--port", "70000"}), std::invalid_argument);
    EXPECT_THROW(parse({"--frame-ms", "12x"}), std::invalid_argument);
    EXPECT_THROW(parse({"--channels", "0"}), std::invalid_argument);
    EXPECT_THROW(parse({"--channels", "9"}), std::invalid_argument);
    EXPECT_THROW(parse({"--beam", "0"}), std::invalid_argument);
}

TEST(ConfigTest, MissingValueAndUnknownFlagAreRejected) {
    EXPECT_THROW(parse({"--model"}), std::invalid_argument);
    EXPECT_THROW(parse({"--volume", "11"}), std::invalid_argument);
}
