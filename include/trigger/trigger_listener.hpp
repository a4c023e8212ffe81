#ifndef TRIGGER_LISTENER_HPP
#define TRIGGER_LISTENER_HPP

#include <atomic>
#include <functional>
#include <string>
#include <thread>

enum class TriggerCommand {
    Listen,
    SwitchLanguage,
    Quit,
    Unknown
};

// Accepts "listen"/"l", "switch"/"s", "quit"/"q"; surrounding whitespace and
// case are ignored.
TriggerCommand parseTriggerCommand(const std::string& text);

// Receives trigger datagrams from the hotkey daemon on a local UDP port and
// hands each parsed command to the callback on the listener thread. Only
// Listen and SwitchLanguage are delivered; quit and anything unrecognized is
// logged and dropped.
class TriggerListener {
public:
    using CallBack = std::function<void(TriggerCommand command)>;

    TriggerListener(std::string bind_ip, int port, CallBack callback_function);
    ~TriggerListener();

    TriggerListener(const TriggerListener&) = delete;
    TriggerListener& operator=(const TriggerListener&) = delete;

    // Binds the socket on the calling thread; throws std::runtime_error on failure.
    void start();
    void stop();

    int port() const { return port_; }

private:
    void run();

    std::string bind_ip_;
    int port_;
    CallBack callback_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    int sock_ = -1;
};

#endif
