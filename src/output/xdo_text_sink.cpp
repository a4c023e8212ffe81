#include "output/xdo_text_sink.hpp"

extern "C" {
#include <xdo.h>
}

#include <stdexcept>

#include <unistd.h>

// Microseconds between synthesized keystrokes.
static const useconds_t kKeyDelayUs = 12000;

// Constructor
XdoTextSink::XdoTextSink() {
    xdo_ = xdo_new(nullptr);
    if (!xdo_) throw std::runtime_error("xdo_new failed: no X display");
}

// Destructor
XdoTextSink::~XdoTextSink() {
    if (xdo_) xdo_free(xdo_);
}

void XdoTextSink::emit(const std::string& text) {
    const std::string typed = text + " ";
    if (xdo_enter_text_window(xdo_, CURRENTWINDOW, typed.c_str(), kKeyDelayUs) != 0) {
        throw std::runtime_error("xdo_enter_text_window failed");
    }
}
