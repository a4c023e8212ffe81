#include "app/capture_worker.hpp"
#include "app/config.hpp"
#include "app/model_loader.hpp"
#include "audio/portaudio_source.hpp"
#include "audio/utterance_recorder.hpp"
#include "audio/wav_file_source.hpp"
#include "output/xdo_text_sink.hpp"
#include "stt/whisper_stt.hpp"
#include "trigger/trigger_listener.hpp"
#include "ui/console_presenter.hpp"

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace {
std::atomic<bool> g_running{true};

void handle_sigint(int) {
    g_running.store(false);
}
} // namespace

static void dispatch(TriggerCommand command, CaptureWorker& worker) {
    switch (command) {
        case TriggerCommand::Listen:
            worker.requestListen();
            break;
        case TriggerCommand::SwitchLanguage:
            worker.switchLanguage();
            break;
        case TriggerCommand::Quit:
            g_running.store(false);
            break;
        case TriggerCommand::Unknown:
            break;
    }
}

int main(int argc, char** argv) {
    Config config;
    try {
        config = parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << std::endl;
        printUsage(argv[0], Config());
        return 2;
    }
    if (config.showHelp) {
        printUsage(argv[0], Config());
        return 0;
    }

    std::cout << "==================================================" << std::endl;
    std::cout << "  voxgate - offline speech to text" << std::endl;
    std::cout << "==================================================" << std::endl;
    std::cout << "Commands (stdin or udp://" << config.trigger.bindIp << ":" << config.trigger.port << "):" << std::endl;
    std::cout << "  listen (l) : start recording" << std::endl;
    std::cout << "  switch (s) : next language" << std::endl;
    std::cout << "  quit   (q) : exit (stdin only)" << std::endl << std::endl;

    EventBus events;
    LanguageSelector languages(config.languages);

    std::unique_ptr<FrameSource> source;
    if (config.audio.inputFile.empty()) {
        source = std::make_unique<PortAudioSource>(config.audio.sampleRate, config.audio.channels, config.samplesPerFrame());
    } else {
        source = std::make_unique<WavFileSource>(config.audio.inputFile, config.audio.sampleRate, config.samplesPerFrame());
    }
    UtteranceRecorder recorder(*source, config.gate);

    std::unique_ptr<TextOutputSink> sink;
    if (!config.output.print) {
        try {
            sink = std::make_unique<XdoTextSink>();
        } catch (const std::exception& e) {
            std::cerr << "[App] [WARN] " << e.what() << "; printing text instead." << std::endl;
        }
    }
    if (!sink) sink = std::make_unique<ConsoleTextSink>(std::cout);

    CaptureWorker::Options options;
    options.sampleRate = config.audio.sampleRate;
    options.dialectLanguageCode = config.dialect.languageCode;
    options.dialectHint = config.dialect.hint;

    CaptureWorker worker(recorder, languages, *sink, events, options);
    worker.start();

    const WhisperSTT::Config sttConfig = config.stt;
    ModelLoader loader(
        [sttConfig]() -> std::unique_ptr<TranscriptionService> { return std::make_unique<WhisperSTT>(sttConfig); },
        worker, events);
    loader.loadAsync();

    std::signal(SIGINT, handle_sigint);
    std::signal(SIGTERM, handle_sigint);

    std::unique_ptr<TriggerListener> trigger;
    if (config.trigger.port > 0) {
        trigger = std::make_unique<TriggerListener>(config.trigger.bindIp, config.trigger.port,
            [&](TriggerCommand command) { dispatch(command, worker); });
        try {
            trigger->start();
        } catch (const std::exception& e) {
            std::cerr << "[Trigger] [ERROR] " << e.what() << std::endl;
            trigger.reset();
        }
    }

    std::thread([&] {
        std::string line;
        while (g_running.load() && std::getline(std::cin, line)) {
            const TriggerCommand command = parseTriggerCommand(line);
            if (command == TriggerCommand::Unknown) {
                if (!line.empty()) std::cout << "[App] Unknown command: " << line << std::endl;
                continue;
            }
            dispatch(command, worker);
        }
    }).detach();

    ConsolePresenter presenter(events, std::cout);
    presenter.run(g_running);

    std::cout << "[App] Exiting..." << std::endl;
    if (trigger) trigger->stop();

    // The worker may be blocked on the microphone and the model may still be
    // loading; leave without waiting for either.
    std::cout.flush();
    std::cerr.flush();
    std::_Exit(0);
}
