#include "audio/wav_codec.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>

namespace {

const int kBitsPerSample = 16;
const int kChannels = 1;

uint16_t readU16(const uint8_t* p) {
    return (uint16_t)p[0] | ((uint16_t)p[1] << 8);
}

uint32_t readU32(const uint8_t* p) {
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}

void putTag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

void putU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back((uint8_t)(v & 0xff));
    out.push_back((uint8_t)(v >> 8));
}

void putU32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back((uint8_t)((v >> (8 * i)) & 0xff));
}

} // namespace

std::vector<uint8_t> encodeWav(const std::vector<float>& samples, int sampleRate) {
    if (sampleRate <= 0) throw WavFormatError("invalid sample rate: " + std::to_string(sampleRate));

    const uint32_t blockAlign = kChannels * (kBitsPerSample / 8);
    const uint32_t dataSize = (uint32_t)samples.size() * blockAlign;

    std::vector<uint8_t> out;
    out.reserve(44 + dataSize);

    putTag(out, "RIFF");
    putU32(out, 36 + dataSize);
    putTag(out, "WAVE");

    putTag(out, "fmt ");
    putU32(out, 16);
    putU16(out, 1);   // PCM
    putU16(out, kChannels);
    putU32(out, (uint32_t)sampleRate);
    putU32(out, (uint32_t)sampleRate * blockAlign);
    putU16(out, (uint16_t)blockAlign);
    putU16(out, kBitsPerSample);

    putTag(out, "data");
    putU32(out, dataSize);
    for (float x : samples) {
        const float clipped = std::max(-1.0f, std::min(1.0f, x));
        const int16_t s = (int16_t)std::lround(clipped * 32767.0f);
        putU16(out, (uint16_t)s);
    }
    return out;
}

WavClip decodeWav(const std::vector<uint8_t>& buf) {
    if (buf.size() < 44 || std::memcmp(buf.data(), "RIFF", 4) != 0 || std::memcmp(buf.data() + 8, "WAVE", 4) != 0) {
        throw WavFormatError("not a RIFF/WAVE stream");
    }

    uint16_t audioFormat = 0;
    uint16_t numChannels = 0;
    uint32_t sampleRate = 0;
    uint16_t bitsPerSample = 0;
    size_t dataOff = 0;
    size_t dataSize = 0;
    bool haveData = false;

    size_t off = 12;
    while (off + 8 <= buf.size()) {
        const uint8_t* tag = buf.data() + off;
        const uint32_t chunkSize = readU32(buf.data() + off + 4);
        const size_t chunkData = off + 8;
        if (chunkData + chunkSize > buf.size()) break;

        if (std::memcmp(tag, "fmt ", 4) == 0 && chunkSize >= 16) {
            audioFormat = readU16(buf.data() + chunkData + 0);
            numChannels = readU16(buf.data() + chunkData + 2);
            sampleRate = readU32(buf.data() + chunkData + 4);
            bitsPerSample = readU16(buf.data() + chunkData + 14);
        } else if (std::memcmp(tag, "data", 4) == 0) {
            dataOff = chunkData;
            dataSize = chunkSize;
            haveData = true;
        }

        off = chunkData + chunkSize;
        if (off & 1) off++; // chunks are word aligned
    }

    if (!haveData) throw WavFormatError("missing data chunk");
    if (!sampleRate || !numChannels) throw WavFormatError("missing fmt chunk");

    const bool pcm16 = audioFormat == 1 && bitsPerSample == 16;
    const bool pcm32 = audioFormat == 1 && bitsPerSample == 32;
    const bool float32 = audioFormat == 3 && bitsPerSample == 32;
    if (!pcm16 && !pcm32 && !float32) {
        throw WavFormatError("unsupported WAV encoding format=" + std::to_string(audioFormat) +
                             " bits=" + std::to_string(bitsPerSample));
    }

    const size_t sampleBytes = bitsPerSample / 8;
    const size_t frameBytes = numChannels * sampleBytes;
    const size_t frames = dataSize / frameBytes;

    WavClip clip;
    clip.sampleRate = (int)sampleRate;
    clip.samples.reserve(frames);

    const uint8_t* data = buf.data() + dataOff;
    for (size_t i = 0; i < frames; ++i) {
        double sum = 0.0;
        const uint8_t* frame = data + i * frameBytes;
        for (uint16_t ch = 0; ch < numChannels; ++ch) {
            const uint8_t* p = frame + ch * sampleBytes;
            if (pcm16) {
                int16_t s;
                std::memcpy(&s, p, sizeof(s));
                sum += (double)s / 32768.0;
            } else if (pcm32) {
                int32_t s;
                std::memcpy(&s, p, sizeof(s));
                sum += (double)s / 2147483648.0;
            } else {
                float s;
                std::memcpy(&s, p, sizeof(s));
                sum += (double)s;
            }
        }
        clip.samples.push_back((float)(sum / numChannels));
    }
    return clip;
}

WavClip readWavFile(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.good()) throw WavFormatError("failed to open audio file '" + path + "'");

    std::vector<uint8_t> buf((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (buf.empty()) throw WavFormatError("audio file '" + path + "' is empty");

    return decodeWav(buf);
}

std::vector<float> downmixToMono(const std::vector<float>& interleaved, int channels) {
    if (channels <= 0) throw WavFormatError("invalid channel count: " + std::to_string(channels));
    if (channels == 1) return interleaved;

    const size_t frames = interleaved.size() / (size_t)channels;
    std::vector<float> mono(frames);
    for (size_t i = 0; i < frames; ++i) {
        double sum = 0.0;
        for (int ch = 0; ch < channels; ++ch) sum += interleaved[i * channels + ch];
        mono[i] = (float)(sum / channels);
    }
    return mono;
}
