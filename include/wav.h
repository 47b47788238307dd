#pragma once

/**
 * @file wav.h
 * @brief RIFF/WAVE container for 16-bit PCM
 *
 * encode_wav() builds the upload payload for speech-to-text; the decoders
 * read synthesized replies back into samples for local playback.
 */

#include "common.h"
#include "errors.h"
#include <cstdint>

namespace guild_voice {

constexpr size_t WAV_HEADER_SIZE = 44;

struct WavHeader {
    uint16_t audio_format = 1;      ///< 1 = PCM
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint32_t byte_rate = 0;
    uint16_t block_align = 0;
    uint16_t bits_per_sample = 0;
    uint32_t data_size = 0;         ///< Bytes in the data chunk
    size_t data_offset = 0;         ///< Offset of the first sample byte
};

struct WavAudio {
    WavHeader header;
    AudioBuffer samples;            ///< Interleaved when channels > 1
};

/**
 * @brief Encode interleaved 16-bit samples as a canonical 44-byte-header WAV
 * @param samples Interleaved PCM samples
 * @param channels Channel count written to the fmt chunk
 * @param sample_rate Sample rate in Hz
 * @return Header followed by little-endian sample bytes
 */
WavBytes encode_wav(const AudioBuffer& samples, uint16_t channels, uint32_t sample_rate);

/**
 * @brief Parse the RIFF, fmt and data chunk headers
 *
 * Unknown chunks between fmt and data (LIST, fact) are skipped. A data
 * size that overruns the buffer (streamed WAVs write 0xFFFFFFFF) is
 * clamped to the bytes present.
 */
Result<WavHeader> decode_wav_header(const WavBytes& bytes);

/**
 * @brief Decode a 16-bit PCM WAV into header and samples
 */
Result<WavAudio> decode_wav_pcm(const WavBytes& bytes);

} // namespace guild_voice
