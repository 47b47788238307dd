/**
 * WAV container, channel/rate conversion and text clamping helpers.
 *
 * Run from build dir: ./test_audio
 * No whisper/PortAudio required.
 */

#include "audio_convert.h"
#include "utils.h"
#include "wav.h"
#include <iostream>
#include <string>

using namespace guild_voice;

static int failed = 0;

#define ASSERT(cond) do { if (!(cond)) { std::cerr << "FAIL: " << #cond << " (line " << __LINE__ << ")\n"; failed++; } } while(0)

static void append_tag(WavBytes& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

static void append_u32(WavBytes& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

int main() {
    // --- encode: 44-byte header describing 16-bit PCM ---
    {
        AudioBuffer stereo = {100, -100, 200, -200, 300, -300};
        WavBytes wav = encode_wav(stereo, 2, 48000);
        ASSERT(wav.size() == WAV_HEADER_SIZE + stereo.size() * 2);
        ASSERT(std::string(wav.begin(), wav.begin() + 4) == "RIFF");
        ASSERT(std::string(wav.begin() + 8, wav.begin() + 12) == "WAVE");

        auto header = decode_wav_header(wav);
        ASSERT(header);
        if (header) {
            ASSERT(header.value().channels == 2);
            ASSERT(header.value().sample_rate == 48000);
            ASSERT(header.value().byte_rate == 48000u * 2 * 2);
            ASSERT(header.value().block_align == 4);
            ASSERT(header.value().bits_per_sample == 16);
            ASSERT(header.value().data_size == 12);
            ASSERT(header.value().data_offset == WAV_HEADER_SIZE);
        }

        auto decoded = decode_wav_pcm(wav);
        ASSERT(decoded && decoded.value().samples == stereo);
    }

    // --- mono header ---
    {
        WavBytes wav = encode_wav(AudioBuffer{1, 2, 3}, 1, 16000);
        auto header = decode_wav_header(wav);
        ASSERT(header && header.value().channels == 1);
        ASSERT(header && header.value().byte_rate == 32000);
        ASSERT(header && header.value().block_align == 2);
    }

    // --- empty audio still produces a valid container ---
    {
        WavBytes wav = encode_wav(AudioBuffer(), 2, 48000);
        ASSERT(wav.size() == WAV_HEADER_SIZE);
        auto decoded = decode_wav_pcm(wav);
        ASSERT(decoded && decoded.value().samples.empty());
    }

    // --- unknown chunks between fmt and data are skipped ---
    {
        WavBytes base = encode_wav(AudioBuffer{5, 6}, 1, 8000);
        WavBytes wav(base.begin(), base.begin() + 36);  // RIFF + fmt
        append_tag(wav, "LIST");
        append_u32(wav, 3);
        wav.push_back('a');
        wav.push_back('b');
        wav.push_back('c');
        wav.push_back(0);  // pad to even
        wav.insert(wav.end(), base.begin() + 36, base.end());

        auto decoded = decode_wav_pcm(wav);
        ASSERT(decoded);
        if (decoded) {
            ASSERT(decoded.value().samples.size() == 2);
            ASSERT(decoded.value().samples[0] == 5);
            ASSERT(decoded.value().samples[1] == 6);
        }
    }

    // --- malformed input ---
    {
        ASSERT(!decode_wav_header(WavBytes()));
        WavBytes riff_only = {'R', 'I', 'F', 'F'};
        auto bare = decode_wav_header(riff_only);
        ASSERT(!bare && bare.error().type == ErrorType::ParseError);

        WavBytes no_data = encode_wav(AudioBuffer{1}, 1, 8000);
        no_data.resize(36);
        auto missing = decode_wav_header(no_data);
        ASSERT(!missing && missing.error().message == "missing data chunk");

        WavBytes truncated = encode_wav(AudioBuffer{1, 2, 3, 4}, 1, 8000);
        truncated.resize(truncated.size() - 4);
        auto clamped = decode_wav_header(truncated);
        ASSERT(clamped && clamped.value().data_size == 4);

        WavBytes not_pcm16 = encode_wav(AudioBuffer{1}, 1, 8000);
        not_pcm16[34] = 8;  // bits_per_sample
        ASSERT(!decode_wav_pcm(not_pcm16));
    }

    // --- channel conversion ---
    {
        AudioBuffer stereo = {100, 300, -50, -150};
        AudioBuffer mono = downmix_to_mono(stereo, 2);
        ASSERT(mono.size() == 2);
        ASSERT(mono[0] == 200);
        ASSERT(mono[1] == -100);

        AudioBuffer back = upmix_from_mono(mono, 2);
        ASSERT(back.size() == 4);
        ASSERT(back[0] == 200 && back[1] == 200);

        ASSERT(convert_channels(stereo, 2, 2) == stereo);
        ASSERT(downmix_to_mono(mono, 1) == mono);
    }

    // --- resample ---
    {
        AudioBuffer in(480, 1000);
        AudioBuffer down = resample(in, 48000, 16000);
        ASSERT(down.size() == 160);
        ASSERT(down[10] == 1000);

        AudioBuffer up = resample(AudioBuffer{0, 100}, 8000, 16000);
        ASSERT(up.size() == 4);
        ASSERT(up[0] == 0);
        ASSERT(up[1] == 50);

        ASSERT(resample(in, 16000, 16000) == in);
        ASSERT(resample(AudioBuffer(), 48000, 16000).empty());
    }

    // --- text helpers ---
    {
        ASSERT(utils::trim_copy("  hi \n") == "hi");
        ASSERT(utils::parse_u64("123456789012345678") == std::optional<uint64_t>(123456789012345678ULL));
        ASSERT(!utils::parse_u64(""));
        ASSERT(!utils::parse_u64("-1"));

        ASSERT(utils::parse_device_index("3", 5) == std::optional<int>(3));
        ASSERT(utils::parse_device_index("0", 1) == std::optional<int>(0));
        ASSERT(!utils::parse_device_index("5", 5));
        ASSERT(!utils::parse_device_index("99999999999999999999999", 5));
        ASSERT(!utils::parse_device_index("18446744073709551615", 5));
        ASSERT(!utils::parse_device_index("", 5));
        ASSERT(!utils::parse_device_index("2", 0));
        ASSERT(!utils::parse_u64("12a"));
        ASSERT(!utils::parse_u64("99999999999999999999"));
        ASSERT(utils::parse_u64("18446744073709551615"));

        ASSERT(utils::clamp_tts_input("  hello  ", 10) == "hello");
        ASSERT(utils::clamp_tts_input("abcdef", 3) == "abc");
        // multibyte characters are never split
        ASSERT(utils::clamp_tts_input("\xC3\xA9\xC3\xA9\xC3\xA9", 2) == "\xC3\xA9\xC3\xA9");
        ASSERT(utils::utf8_length("\xC3\xA9t\xC3\xA9") == 3);

        ASSERT(utils::truncate_for_tool_result("line one\nline two", 100) == "line one line two");
        ASSERT(utils::truncate_for_tool_result(std::string(230, 'x'), 220) == std::string(220, 'x') + "...");
        ASSERT(utils::truncate_for_tool_result(std::string(220, 'x'), 220) == std::string(220, 'x'));

        ASSERT((utils::join({"a", "b"}, ",") == "a,b"));
        ASSERT(utils::split("a::b", ':').size() == 3);
    }

    if (failed > 0) {
        std::cerr << failed << " assertion(s) failed.\n";
        return 1;
    }
    std::cout << "All audio tests passed.\n";
    return 0;
}
