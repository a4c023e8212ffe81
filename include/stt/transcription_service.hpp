#ifndef TRANSCRIPTION_SERVICE_HPP
#define TRANSCRIPTION_SERVICE_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

class TranscriptionError : public std::runtime_error {
public:
    explicit TranscriptionError(const std::string& what) : std::runtime_error(what) {}
};

struct TranscriptSegment {
    std::string text;
};

// Speech-to-text boundary: a 16-bit mono WAV blob in, text segments out.
class TranscriptionService {
public:
    virtual ~TranscriptionService() = default;

    // dialectHint is empty when no hint applies to languageCode.
    // Throws TranscriptionError (or WavFormatError) on failure.
    virtual std::vector<TranscriptSegment> transcribe(const std::vector<uint8_t>& wav,
                                                      const std::string& languageCode,
                                                      const std::string& dialectHint) = 0;
};

// Trims each segment, joins them with single spaces and trims the result.
std::string joinSegments(const std::vector<TranscriptSegment>& segments);

#endif
