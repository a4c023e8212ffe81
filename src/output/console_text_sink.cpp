#include "output/text_sink.hpp"

void ConsoleTextSink::emit(const std::string& text) {
    out_ << text << ' ' << std::endl;
}
