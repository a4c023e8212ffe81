#ifndef LIFECYCLE_EVENT_HPP
#define LIFECYCLE_EVENT_HPP

#include "app/message_queue.hpp"

#include <string>

struct LifecycleEvent {
    enum class Type {
        ModelLoading,
        ModelReady,
        ModelLoadFailed,
        ListeningStarted,
        ListeningStopped,
        LanguageSwitched
    };

    Type type = Type::ListeningStopped;

    // Failure reason for ModelLoadFailed, language abbreviation for
    // ListeningStarted and LanguageSwitched, empty otherwise.
    std::string detail;

    static LifecycleEvent modelLoading() { return {Type::ModelLoading, ""}; }
    static LifecycleEvent modelReady() { return {Type::ModelReady, ""}; }
    static LifecycleEvent modelLoadFailed(const std::string& reason) { return {Type::ModelLoadFailed, reason}; }
    static LifecycleEvent listeningStarted(const std::string& language) { return {Type::ListeningStarted, language}; }
    static LifecycleEvent listeningStopped() { return {Type::ListeningStopped, ""}; }
    static LifecycleEvent languageSwitched(const std::string& language) { return {Type::LanguageSwitched, language}; }
};

using EventBus = MessageQueue<LifecycleEvent>;

#endif
