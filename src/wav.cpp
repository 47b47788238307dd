#include "wav.h"
#include <cstring>

namespace guild_voice {

namespace {

void put_tag(WavBytes& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

void put_u16(WavBytes& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void put_u32(WavBytes& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

uint16_t get_u16(const WavBytes& in, size_t pos) {
    return static_cast<uint16_t>(in[pos] | (in[pos + 1] << 8));
}

uint32_t get_u32(const WavBytes& in, size_t pos) {
    return static_cast<uint32_t>(in[pos]) |
           (static_cast<uint32_t>(in[pos + 1]) << 8) |
           (static_cast<uint32_t>(in[pos + 2]) << 16) |
           (static_cast<uint32_t>(in[pos + 3]) << 24);
}

bool tag_at(const WavBytes& in, size_t pos, const char* tag) {
    return pos + 4 <= in.size() && std::memcmp(in.data() + pos, tag, 4) == 0;
}

} // anonymous namespace

WavBytes encode_wav(const AudioBuffer& samples, uint16_t channels, uint32_t sample_rate) {
    const uint16_t bits_per_sample = 16;
    const uint32_t bytes_per_sample = bits_per_sample / 8;
    const uint32_t data_size = static_cast<uint32_t>(samples.size()) * bytes_per_sample;
    const uint32_t byte_rate = sample_rate * channels * bytes_per_sample;
    const uint16_t block_align = static_cast<uint16_t>(channels * bytes_per_sample);

    WavBytes wav;
    wav.reserve(WAV_HEADER_SIZE + data_size);

    // RIFF header
    put_tag(wav, "RIFF");
    put_u32(wav, 36 + data_size);
    put_tag(wav, "WAVE");

    // fmt chunk
    put_tag(wav, "fmt ");
    put_u32(wav, 16);
    put_u16(wav, 1);  // PCM
    put_u16(wav, channels);
    put_u32(wav, sample_rate);
    put_u32(wav, byte_rate);
    put_u16(wav, block_align);
    put_u16(wav, bits_per_sample);

    // data chunk
    put_tag(wav, "data");
    put_u32(wav, data_size);
    for (Sample s : samples) {
        put_u16(wav, static_cast<uint16_t>(s));
    }

    return wav;
}

Result<WavHeader> decode_wav_header(const WavBytes& bytes) {
    if (bytes.size() < 12 || !tag_at(bytes, 0, "RIFF") || !tag_at(bytes, 8, "WAVE")) {
        return make_parse_error("not a RIFF/WAVE buffer");
    }

    WavHeader header;
    bool have_fmt = false;
    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        uint32_t chunk_size = get_u32(bytes, pos + 4);
        size_t body = pos + 8;

        if (tag_at(bytes, pos, "fmt ")) {
            if (chunk_size < 16 || body + 16 > bytes.size()) {
                return make_parse_error("truncated fmt chunk");
            }
            header.audio_format = get_u16(bytes, body);
            header.channels = get_u16(bytes, body + 2);
            header.sample_rate = get_u32(bytes, body + 4);
            header.byte_rate = get_u32(bytes, body + 8);
            header.block_align = get_u16(bytes, body + 12);
            header.bits_per_sample = get_u16(bytes, body + 14);
            have_fmt = true;
        } else if (tag_at(bytes, pos, "data")) {
            if (!have_fmt) {
                return make_parse_error("data chunk before fmt chunk");
            }
            size_t available = bytes.size() - body;
            header.data_size = chunk_size > available ? static_cast<uint32_t>(available) : chunk_size;
            header.data_offset = body;
            return header;
        }

        // Chunks are word-aligned
        size_t next = body + chunk_size + (chunk_size & 1);
        if (next <= pos) break;
        pos = next;
    }

    return make_parse_error(have_fmt ? "missing data chunk" : "missing fmt chunk");
}

Result<WavAudio> decode_wav_pcm(const WavBytes& bytes) {
    auto header = decode_wav_header(bytes);
    if (!header) {
        return header.error();
    }

    const WavHeader& h = header.value();
    if (h.audio_format != 1 || h.bits_per_sample != 16) {
        return make_parse_error("only 16-bit PCM WAV is supported");
    }
    if (h.channels == 0 || h.sample_rate == 0) {
        return make_parse_error("invalid channel count or sample rate");
    }

    WavAudio audio;
    audio.header = h;
    size_t count = h.data_size / 2;
    audio.samples.resize(count);
    for (size_t i = 0; i < count; ++i) {
        audio.samples[i] = static_cast<Sample>(get_u16(bytes, h.data_offset + i * 2));
    }
    return audio;
}

} // namespace guild_voice
