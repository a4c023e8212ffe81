#include "stt/transcription_service.hpp"

#include <cctype>

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
    return s.substr(b, e - b);
}

std::string joinSegments(const std::vector<TranscriptSegment>& segments) {
    std::string out;
    for (const auto& segment : segments) {
        const std::string text = trim(segment.text);
        if (text.empty()) continue;
        if (!out.empty()) out += ' ';
        out += text;
    }
    return out;
}
