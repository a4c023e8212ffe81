#ifndef XDO_TEXT_SINK_HPP
#define XDO_TEXT_SINK_HPP

#include "output/text_sink.hpp"

#include <string>

struct xdo;

// Types text into the focused X11 window through libxdo.
class XdoTextSink : public TextOutputSink {
public:
    // Throws std::runtime_error when no X display is reachable.
    XdoTextSink();
    ~XdoTextSink() override;

    XdoTextSink(const XdoTextSink&) = delete;
    XdoTextSink& operator=(const XdoTextSink&) = delete;

    void emit(const std::string& text) override;

private:
    xdo* xdo_ = nullptr;
};

#endif
