#include "app/model_loader.hpp"

#include <exception>
#include <iostream>
#include <thread>
#include <utility>

// Constructor
ModelLoader::ModelLoader(Factory factory, CaptureWorker& worker, EventBus& events)
    : factory_(std::move(factory)), worker_(worker), events_(events) {}

bool ModelLoader::load() {
    std::cout << "[Model] Loading transcription model..." << std::endl;
    events_.push(LifecycleEvent::modelLoading());

    std::unique_ptr<TranscriptionService> service;
    std::string failure;
    try {
        service = factory_();
        if (!service) failure = "model factory returned nothing";
    } catch (const std::exception& e) {
        failure = e.what();
    }

    if (!service) {
        std::cerr << "[Model] [ERROR] Failed to load model: " << failure << std::endl;
        worker_.markModelFailed(failure);
        events_.push(LifecycleEvent::modelLoadFailed(failure));
        return false;
    }

    worker_.attachService(std::move(service));
    std::cout << "[Model] Model loaded successfully!" << std::endl;
    events_.push(LifecycleEvent::modelReady());
    return true;
}

void ModelLoader::loadAsync() {
    std::thread([this] { load(); }).detach();
}
