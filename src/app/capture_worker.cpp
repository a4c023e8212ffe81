#include "app/capture_worker.hpp"
#include "audio/wav_codec.hpp"

#include <exception>
#include <iostream>
#include <utility>

// Constructor
CaptureWorker::CaptureWorker(UtteranceRecorder& recorder,
                             LanguageSelector& languages,
                             TextOutputSink& output,
                             EventBus& events,
                             Options options)
    : recorder_(recorder),
      languages_(languages),
      output_(output),
      events_(events),
      options_(std::move(options)) {}

// Destructor
CaptureWorker::~CaptureWorker() { stop(); }

// Starts the capture thread
void CaptureWorker::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread(&CaptureWorker::run, this);
}

// Stops the capture thread
void CaptureWorker::stop() {
    if (!running_.exchange(false)) return;

    commands_.close();
    if (thread_.joinable()) thread_.join();
}

bool CaptureWorker::requestListen() {
    if (modelFailed_.load()) {
        std::cerr << "[App] [WARN] Model failed to load, ignoring listen request." << std::endl;
        return false;
    }
    if (!modelReady_.load()) {
        std::cout << "[App] Model still loading, please wait..." << std::endl;
        return false;
    }

    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true)) {
        std::cout << "[App] Already listening, ignoring listen request." << std::endl;
        return false;
    }

    commands_.push(Command::Listen);
    return true;
}

bool CaptureWorker::switchLanguage() {
    if (busy_.load()) {
        std::cout << "[App] Cannot switch language while recording." << std::endl;
        return false;
    }

    const Language& language = languages_.advance();
    std::cout << "[App] Language: " << language.displayName << std::endl;
    events_.push(LifecycleEvent::languageSwitched(language.abbreviation));
    return true;
}

void CaptureWorker::attachService(std::unique_ptr<TranscriptionService> service) {
    bool ready = false;
    {
        std::lock_guard<std::mutex> lock(serviceMutex_);
        service_ = std::move(service);
        ready = service_ != nullptr;
    }
    modelReady_.store(ready);
}

void CaptureWorker::markModelFailed(const std::string& reason) {
    std::cerr << "[App] [ERROR] Transcription disabled: " << reason << std::endl;
    modelFailed_.store(true);
    modelReady_.store(false);
}

CaptureWorker::Status CaptureWorker::status() const {
    Status s;
    s.modelReady = modelReady_.load();
    s.modelFailed = modelFailed_.load();
    s.busy = busy_.load();
    s.recording = recording_.load();
    s.language = languages_.current();
    return s;
}

// Thread function: one listen command at a time until the queue is closed
void CaptureWorker::run() {
    Command command;
    while (commands_.pop(command)) {
        if (command == Command::Listen) handleListen();
    }
}

void CaptureWorker::handleListen() {
    const Language language = languages_.current();

    recording_.store(true);
    events_.push(LifecycleEvent::listeningStarted(language.abbreviation));

    UtteranceRecorder::Result result;
    bool captured = false;
    try {
        result = recorder_.record();
        captured = result.hasUtterance();
    } catch (const DeviceError& e) {
        std::cerr << "[STT] [ERROR] Microphone error: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[STT] [ERROR] Recording failed: " << e.what() << std::endl;
    }

    recording_.store(false);
    events_.push(LifecycleEvent::listeningStopped());

    if (captured && !result.samples.empty()) {
        transcribeAndEmit(result.samples, language);
    }

    busy_.store(false);
}

void CaptureWorker::transcribeAndEmit(const std::vector<float>& samples, const Language& language) {
    TranscriptionService* service = nullptr;
    {
        std::lock_guard<std::mutex> lock(serviceMutex_);
        service = service_.get();
    }
    if (!service) {
        std::cerr << "[STT] [ERROR] No transcription model attached." << std::endl;
        return;
    }

    std::cout << "[STT] Transcribing (" << language.code << ")..." << std::endl;

    const std::string hint = language.code == options_.dialectLanguageCode ? options_.dialectHint : std::string();

    std::string text;
    try {
        // Freed when this scope ends, whatever the outcome.
        const std::vector<uint8_t> wav = encodeWav(samples, options_.sampleRate);
        text = joinSegments(service->transcribe(wav, language.code, hint));
    } catch (const std::exception& e) {
        std::cerr << "[STT] [ERROR] Transcription error: " << e.what() << std::endl;
        return;
    }

    if (text.empty()) {
        std::cout << "[STT] No text recognized." << std::endl;
        return;
    }

    std::cout << "[STT] Result: " << text << std::endl;
    try {
        output_.emit(text);
    } catch (const std::exception& e) {
        std::cerr << "[STT] [ERROR] Text output failed: " << e.what() << std::endl;
    }
}
