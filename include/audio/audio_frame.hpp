#ifndef AUDIO_FRAME_HPP
#define AUDIO_FRAME_HPP

#include <vector>

// One fixed-duration slice of mono float PCM pulled from a FrameSource.
struct AudioFrame {
    std::vector<float> samples;

    // Set when the device reported an input overflow while filling this frame.
    // The samples are still delivered.
    bool overflowed = false;
};

#endif
