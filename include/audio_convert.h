#pragma once

#include "common.h"

namespace guild_voice {

/**
 * @brief Average interleaved channels into one
 */
AudioBuffer downmix_to_mono(const AudioBuffer& interleaved, int channels);

/**
 * @brief Duplicate a mono signal across channels (interleaved output)
 */
AudioBuffer upmix_from_mono(const AudioBuffer& mono, int channels);

/**
 * @brief Convert interleaved audio between channel counts
 *
 * Goes through mono when the counts differ.
 */
AudioBuffer convert_channels(const AudioBuffer& interleaved, int from_channels, int to_channels);

/**
 * @brief Linear-interpolation resampler for a mono signal
 */
AudioBuffer resample(const AudioBuffer& input, int from_rate, int to_rate);

} // namespace guild_voice
