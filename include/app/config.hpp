#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "app/language_selector.hpp"
#include "audio/silence_gate.hpp"
#include "stt/whisper_stt.hpp"

#include <string>
#include <vector>

// Process-wide settings. Fixed once main() has parsed the command line.
struct Config {
    struct Audio {
        int sampleRate = 16000;
        int channels = 1;
        std::string inputFile;   // replay a WAV file instead of the microphone
    } audio;

    SilenceGate::Config gate;

    WhisperSTT::Config stt;

    // Hint sent with the one language whose dialect needs biasing.
    struct Dialect {
        std::string languageCode = "ar";
        std::string hint = "this is arabic language iraqi";
    } dialect;

    std::vector<Language> languages = {
        {"English", "en", "EN"},
        {"Arabic (Iraq)", "ar", "AR"},
    };

    struct Trigger {
        std::string bindIp = "127.0.0.1";
        int port = 3939;
    } trigger;

    struct Output {
        bool print = false;   // write text to stdout instead of typing it
    } output;

    bool showHelp = false;

    int samplesPerFrame() const { return (int)((long long)audio.sampleRate * gate.frameMs / 1000); }
};

// Throws std::invalid_argument on unknown flags, missing or malformed values.
Config parseArgs(int argc, char** argv);

void printUsage(const char* argv0, const Config& defaults);

#endif
