#ifndef MODEL_LOADER_HPP
#define MODEL_LOADER_HPP

#include "app/capture_worker.hpp"
#include "app/lifecycle_event.hpp"
#include "stt/transcription_service.hpp"

#include <functional>
#include <memory>

// Builds the transcription model and hands it to the worker, reporting
// progress on the event bus.
class ModelLoader {
public:
    using Factory = std::function<std::unique_ptr<TranscriptionService>()>;

    ModelLoader(Factory factory, CaptureWorker& worker, EventBus& events);

    // Runs on the calling thread. Returns true when the model is attached.
    bool load();

    // Fire-and-forget: runs load() on a detached thread. This loader, the
    // worker and the event bus must outlive it, or the process must exit
    // without unwinding.
    void loadAsync();

private:
    Factory factory_;
    CaptureWorker& worker_;
    EventBus& events_;
};

#endif
