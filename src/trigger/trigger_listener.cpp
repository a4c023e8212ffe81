#include "trigger/trigger_listener.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

TriggerCommand parseTriggerCommand(const std::string& text) {
    size_t b = 0;
    size_t e = text.size();
    while (b < e && std::isspace((unsigned char)text[b])) ++b;
    while (e > b && std::isspace((unsigned char)text[e - 1])) --e;

    std::string word = text.substr(b, e - b);
    std::transform(word.begin(), word.end(), word.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });

    if (word == "listen" || word == "l") return TriggerCommand::Listen;
    if (word == "switch" || word == "s") return TriggerCommand::SwitchLanguage;
    if (word == "quit" || word == "q") return TriggerCommand::Quit;
    return TriggerCommand::Unknown;
}

// Constructor
TriggerListener::TriggerListener(std::string bind_ip, int port, CallBack callback_function)
    : bind_ip_(std::move(bind_ip)), port_(port), callback_(std::move(callback_function)) {}

// Destructor
TriggerListener::~TriggerListener() { stop(); }

// Binds the UDP socket and starts the receive thread
void TriggerListener::start() {
    if (running_.load()) return;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));
    if (::inet_pton(AF_INET, bind_ip_.c_str(), &addr.sin_addr) != 1) {
        throw std::runtime_error("TriggerListener: invalid bind ip: " + bind_ip_);
    }

    sock_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (sock_ < 0) {
        throw std::runtime_error(std::string("TriggerListener socket() failed: ") + std::strerror(errno));
    }

    int reuse = 1;
    ::setsockopt(sock_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    // Lets run() notice stop() even if the shutdown wakeup is missed.
    timeval tv{};
    tv.tv_usec = 200000;
    ::setsockopt(sock_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    if (::bind(sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        const std::string reason = std::strerror(errno);
        ::close(sock_);
        sock_ = -1;
        throw std::runtime_error("TriggerListener bind() failed: " + reason);
    }

    // Port 0 asks the kernel for a free port.
    socklen_t len = sizeof(addr);
    if (::getsockname(sock_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        port_ = ntohs(addr.sin_port);
    }

    running_.store(true);
    thread_ = std::thread(&TriggerListener::run, this);
    std::cout << "[Trigger] Listening on udp://" << bind_ip_ << ":" << port_ << std::endl;
}

// Wakes the receive thread, joins it and closes the socket
void TriggerListener::stop() {
    if (!running_.exchange(false)) return;

    ::shutdown(sock_, SHUT_RDWR);
    if (thread_.joinable()) thread_.join();

    ::close(sock_);
    sock_ = -1;
}

// Thread function: one datagram per command
void TriggerListener::run() {
    while (running_.load()) {
        char buff[256];
        sockaddr_in src{};
        socklen_t slen = sizeof(src);

        const ssize_t n = ::recvfrom(sock_, buff, sizeof(buff) - 1, 0,
                                     reinterpret_cast<sockaddr*>(&src), &slen);
        if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) continue;
        if (n <= 0) break;
        buff[n] = '\0';

        const TriggerCommand command = parseTriggerCommand(buff);
        // Quit is a console command only; a datagram cannot stop the service.
        if (command == TriggerCommand::Unknown || command == TriggerCommand::Quit) {
            std::cerr << "[Trigger] [WARN] Ignoring unknown command: " << buff << std::endl;
            continue;
        }

        try {
            if (callback_) callback_(command);
        } catch (const std::exception& e) {
            std::cerr << "[Trigger] [ERROR] Callback threw: " << e.what() << std::endl;
        }
    }
}
