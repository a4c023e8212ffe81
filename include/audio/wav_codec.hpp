#ifndef WAV_CODEC_HPP
#define WAV_CODEC_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

class WavFormatError : public std::runtime_error {
public:
    explicit WavFormatError(const std::string& what) : std::runtime_error(what) {}
};

struct WavClip {
    std::vector<float> samples;   // mono, [-1, 1]
    int sampleRate = 0;
};

// Serializes mono float PCM into a RIFF/WAVE blob with 16-bit linear samples.
// Samples outside [-1, 1] are clipped.
std::vector<uint8_t> encodeWav(const std::vector<float>& samples, int sampleRate);

// Parses PCM16, PCM32 or float32 WAV data. Multi-channel input is downmixed.
// Throws WavFormatError on anything else.
WavClip decodeWav(const std::vector<uint8_t>& bytes);

WavClip readWavFile(const std::string& path);

// Averages interleaved multi-channel samples into one mono channel. A trailing
// partial frame is dropped.
std::vector<float> downmixToMono(const std::vector<float>& interleaved, int channels);

#endif
