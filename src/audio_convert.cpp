#include "audio_convert.h"
#include <algorithm>

namespace guild_voice {

AudioBuffer downmix_to_mono(const AudioBuffer& interleaved, int channels) {
    if (channels <= 1) return interleaved;

    size_t frames = interleaved.size() / static_cast<size_t>(channels);
    AudioBuffer mono;
    mono.reserve(frames);
    for (size_t f = 0; f < frames; ++f) {
        int32_t sum = 0;
        for (int c = 0; c < channels; ++c) {
            sum += interleaved[f * channels + c];
        }
        mono.push_back(static_cast<Sample>(sum / channels));
    }
    return mono;
}

AudioBuffer upmix_from_mono(const AudioBuffer& mono, int channels) {
    if (channels <= 1) return mono;

    AudioBuffer out;
    out.reserve(mono.size() * static_cast<size_t>(channels));
    for (Sample s : mono) {
        for (int c = 0; c < channels; ++c) {
            out.push_back(s);
        }
    }
    return out;
}

AudioBuffer convert_channels(const AudioBuffer& interleaved, int from_channels, int to_channels) {
    if (from_channels == to_channels) return interleaved;
    return upmix_from_mono(downmix_to_mono(interleaved, from_channels), to_channels);
}

AudioBuffer resample(const AudioBuffer& input, int from_rate, int to_rate) {
    if (from_rate == to_rate || input.empty() || from_rate <= 0 || to_rate <= 0) return input;

    double ratio = static_cast<double>(from_rate) / static_cast<double>(to_rate);
    size_t output_samples = static_cast<size_t>(input.size() / ratio);

    AudioBuffer output;
    output.reserve(output_samples);

    for (size_t i = 0; i < output_samples; i++) {
        double input_pos = static_cast<double>(i) * ratio;
        size_t idx0 = static_cast<size_t>(input_pos);
        if (idx0 >= input.size()) break;
        size_t idx1 = std::min(idx0 + 1, input.size() - 1);

        // Linear interpolation
        double t = input_pos - static_cast<double>(idx0);
        double interpolated = input[idx0] * (1.0 - t) + input[idx1] * t;
        output.push_back(static_cast<Sample>(interpolated));
    }

    return output;
}

} // namespace guild_voice
