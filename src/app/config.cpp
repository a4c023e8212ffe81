#include "app/config.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>

namespace {

int parseInt(const std::string& flag, const std::string& value, int minValue) {
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid value for " + flag + ": '" + value + "'");
    }
    if (used != value.size() || v < minValue) {
        throw std::invalid_argument("invalid value for " + flag + ": '" + value + "'");
    }
    return v;
}

float parseFloat(const std::string& flag, const std::string& value) {
    size_t used = 0;
    float v = 0.0f;
    try {
        v = std::stof(value, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid value for " + flag + ": '" + value + "'");
    }
    if (used != value.size() || v < 0.0f) {
        throw std::invalid_argument("invalid value for " + flag + ": '" + value + "'");
    }
    return v;
}

// Seconds on the command line, milliseconds in the config.
int parseSecondsAsMs(const std::string& flag, const std::string& value) {
    const float seconds = parseFloat(flag, value);
    const int ms = (int)(seconds * 1000.0f + 0.5f);
    if (ms <= 0) throw std::invalid_argument("invalid value for " + flag + ": '" + value + "'");
    return ms;
}

} // namespace

void printUsage(const char* argv0, const Config& p) {
    fprintf(stderr, "\nusage: %s [options]\n", argv0);
    fprintf(stderr, "  -h, --help                 show this help\n");
    fprintf(stderr, "  --model PATH               whisper model path [%s]\n", p.stt.modelPath.c_str());
    fprintf(stderr, "  --threads N                decoder threads [%d]\n", p.stt.threads);
    fprintf(stderr, "  --beam N                   beam width, 1 decodes greedily [%d]\n", p.stt.beamSize);
    fprintf(stderr, "  --vad-model PATH           Silero VAD model; enables voice activity filtering\n");
    fprintf(stderr, "  --vad-min-silence S        silence that splits speech under VAD [%0.1f]\n", p.stt.vadMinSilenceMs / 1000.0);
    fprintf(stderr, "  --sample-rate N            capture sample rate in Hz [%d]\n", p.audio.sampleRate);
    fprintf(stderr, "  --channels N               capture channels, downmixed to mono [%d]\n", p.audio.channels);
    fprintf(stderr, "  --frame-ms N               frame duration in ms [%d]\n", p.gate.frameMs);
    fprintf(stderr, "  --threshold F              RMS level separating speech from silence [%0.4f]\n", p.gate.silenceThreshold);
    fprintf(stderr, "  --silence-timeout S        seconds of silence that end an utterance [%0.1f]\n", p.gate.silenceTimeoutMs / 1000.0);
    fprintf(stderr, "  --max-duration S           hard limit on one recording in seconds [%0.1f]\n", p.gate.maxRecordMs / 1000.0);
    fprintf(stderr, "  --initial-timeout S        seconds to wait for the first speech [%0.1f]\n", p.gate.initialTimeoutMs / 1000.0);
    fprintf(stderr, "  --bind IP                  trigger listener address [%s]\n", p.trigger.bindIp.c_str());
    fprintf(stderr, "  --port N                   trigger listener UDP port, 0 disables [%d]\n", p.trigger.port);
    fprintf(stderr, "  --audio-file PATH          replay a WAV file instead of the microphone\n");
    fprintf(stderr, "  --print                    print text to stdout instead of typing it\n");
}

Config parseArgs(int argc, char** argv) {
    Config p;

    auto need = [&](const std::string& flag, int& i) -> std::string {
        if (i + 1 >= argc) throw std::invalid_argument("missing arg for " + flag);
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "-h" || a == "--help") {
            p.showHelp = true;
        } else if (a == "--model") {
            p.stt.modelPath = need(a, i);
        } else if (a == "--threads") {
            p.stt.threads = parseInt(a, need(a, i), 1);
        } else if (a == "--beam") {
            p.stt.beamSize = parseInt(a, need(a, i), 1);
        } else if (a == "--vad-model") {
            p.stt.vadModelPath = need(a, i);
        } else if (a == "--vad-min-silence") {
            p.stt.vadMinSilenceMs = parseSecondsAsMs(a, need(a, i));
        } else if (a == "--sample-rate") {
            p.audio.sampleRate = parseInt(a, need(a, i), 8000);
        } else if (a == "--channels") {
            p.audio.channels = parseInt(a, need(a, i), 1);
            if (p.audio.channels > 8) throw std::invalid_argument("invalid value for --channels");
        } else if (a == "--frame-ms") {
            p.gate.frameMs = parseInt(a, need(a, i), 10);
        } else if (a == "--threshold") {
            p.gate.silenceThreshold = parseFloat(a, need(a, i));
        } else if (a == "--silence-timeout") {
            p.gate.silenceTimeoutMs = parseSecondsAsMs(a, need(a, i));
        } else if (a == "--max-duration") {
            p.gate.maxRecordMs = parseSecondsAsMs(a, need(a, i));
        } else if (a == "--initial-timeout") {
            p.gate.initialTimeoutMs = parseSecondsAsMs(a, need(a, i));
        } else if (a == "--bind") {
            p.trigger.bindIp = need(a, i);
        } else if (a == "--port") {
            p.trigger.port = parseInt(a, need(a, i), 0);
            if (p.trigger.port > 65535) throw std::invalid_argument("invalid value for --port");
        } else if (a == "--audio-file") {
            p.audio.inputFile = need(a, i);
        } else if (a == "--print") {
            p.output.print = true;
        } else {
            throw std::invalid_argument("unknown argument: " + a);
        }
    }

    return p;
}
