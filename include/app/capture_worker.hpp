#ifndef CAPTURE_WORKER_HPP
#define CAPTURE_WORKER_HPP

#include "app/language_selector.hpp"
#include "app/lifecycle_event.hpp"
#include "app/message_queue.hpp"
#include "audio/utterance_recorder.hpp"
#include "output/text_sink.hpp"
#include "stt/transcription_service.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

// Owns the single capture thread. Listen requests are admitted here, at most
// one attempt (recording plus transcription) is in flight, and every state
// flag is written only by this class.
class CaptureWorker {
public:
    struct Options {
        int sampleRate = 16000;
        std::string dialectLanguageCode;
        std::string dialectHint;
    };

    struct Status {
        bool modelReady = false;
        bool modelFailed = false;
        bool busy = false;        // an attempt was admitted and has not finished
        bool recording = false;   // the microphone is open
        Language language;
    };

    CaptureWorker(UtteranceRecorder& recorder,
                  LanguageSelector& languages,
                  TextOutputSink& output,
                  EventBus& events,
                  Options options);
    ~CaptureWorker();

    CaptureWorker(const CaptureWorker&) = delete;
    CaptureWorker& operator=(const CaptureWorker&) = delete;

    void start();

    // Finishes the attempt in progress, if any, and joins the thread.
    void stop();

    // Non-blocking. Returns false (and logs) when the model is not ready or an
    // attempt is already in flight.
    bool requestListen();

    // Returns false (and logs) while an attempt is in flight.
    bool switchLanguage();

    void attachService(std::unique_ptr<TranscriptionService> service);
    void markModelFailed(const std::string& reason);

    // Best-effort snapshot; may be stale by the time the caller looks at it.
    Status status() const;

private:
    enum class Command { Listen };

    void run();
    void handleListen();
    void transcribeAndEmit(const std::vector<float>& samples, const Language& language);

    UtteranceRecorder& recorder_;
    LanguageSelector& languages_;
    TextOutputSink& output_;
    EventBus& events_;
    Options options_;

    MessageQueue<Command> commands_;
    std::thread thread_;

    std::atomic<bool> running_{false};
    std::atomic<bool> modelReady_{false};
    std::atomic<bool> modelFailed_{false};
    std::atomic<bool> busy_{false};
    std::atomic<bool> recording_{false};

    std::mutex serviceMutex_;
    std::unique_ptr<TranscriptionService> service_;
};

#endif
