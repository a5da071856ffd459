#ifndef BITPLAY_TEST_HELPERS_HH
#define BITPLAY_TEST_HELPERS_HH

#include <bitplay/sdk/types.hh>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace bitplay::test {

// Value of one sample of one channel; truncated to the sample width on write
using sample_generator = std::function<int64_t(uint32_t frame, uint16_t channel)>;

inline void put_le(std::vector<uint8_t>& out, uint64_t value, unsigned bytes) {
    for (unsigned i = 0; i < bytes; i++) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

inline void put_be(std::vector<uint8_t>& out, uint64_t value, unsigned bytes) {
    for (unsigned i = bytes; i > 0; i--) {
        out.push_back(static_cast<uint8_t>((value >> (8 * (i - 1))) & 0xFF));
    }
}

inline void put_tag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

// RIFF/WAVE with a 16 byte fmt chunk and one data chunk
inline std::vector<uint8_t> make_wav_header(uint16_t format_tag, uint16_t channels, uint16_t bits,
                                            uint32_t rate, uint32_t data_bytes) {
    std::vector<uint8_t> data;
    const uint16_t block_align = static_cast<uint16_t>(channels * (bits / 8));
    put_tag(data, "RIFF");
    put_le(data, 36u + data_bytes, 4);
    put_tag(data, "WAVE");
    put_tag(data, "fmt ");
    put_le(data, 16, 4);
    put_le(data, format_tag, 2);
    put_le(data, channels, 2);
    put_le(data, rate, 4);
    put_le(data, static_cast<uint64_t>(rate) * block_align, 4);
    put_le(data, block_align, 2);
    put_le(data, bits, 2);
    put_tag(data, "data");
    put_le(data, data_bytes, 4);
    return data;
}

// Integer PCM WAV; 8 bit data is stored unsigned (generator value + 128)
inline std::vector<uint8_t> make_pcm_wav(uint16_t channels, uint16_t bits, uint32_t rate,
                                         uint32_t frames, const sample_generator& gen) {
    const unsigned bytes = bits / 8u;
    auto data = make_wav_header(1, channels, bits, rate, frames * channels * bytes);
    data.reserve(data.size() + static_cast<size_t>(frames) * channels * bytes);
    for (uint32_t f = 0; f < frames; f++) {
        for (uint16_t c = 0; c < channels; c++) {
            int64_t v = gen(f, c);
            if (bits == 8) {
                v += 128;
            }
            put_le(data, static_cast<uint64_t>(v), bytes);
        }
    }
    return data;
}

// IEEE float WAV holding a 440 Hz tone
inline std::vector<uint8_t> make_float_wav(uint16_t channels, uint32_t rate, uint32_t frames) {
    auto data = make_wav_header(3, channels, 32, rate, frames * channels * 4u);
    for (uint32_t f = 0; f < frames; f++) {
        const float v = static_cast<float>(0.5 * std::sin(2.0 * 3.14159265358979 * 440.0 * f / rate));
        uint32_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        for (uint16_t c = 0; c < channels; c++) {
            put_le(data, bits, 4);
        }
    }
    return data;
}

inline uint8_t flac_crc8(const std::vector<uint8_t>& bytes) {
    uint8_t crc = 0;
    for (uint8_t b : bytes) {
        crc ^= b;
        for (int i = 0; i < 8; i++) {
            crc = static_cast<uint8_t>((crc & 0x80) ? ((crc << 1) ^ 0x07) : (crc << 1));
        }
    }
    return crc;
}

inline uint16_t flac_crc16(const std::vector<uint8_t>& bytes) {
    uint16_t crc = 0;
    for (uint8_t b : bytes) {
        crc = static_cast<uint16_t>(crc ^ (b << 8));
        for (int i = 0; i < 8; i++) {
            crc = static_cast<uint16_t>((crc & 0x8000) ? ((crc << 1) ^ 0x8005) : (crc << 1));
        }
    }
    return crc;
}

// FLAC stream of VERBATIM subframes, fixed block size; bits must be 8, 16 or 24
inline std::vector<uint8_t> make_flac(uint16_t channels, uint16_t bits, uint32_t rate,
                                      uint32_t frames, const sample_generator& gen,
                                      uint16_t block_size = 256) {
    std::vector<uint8_t> out;
    put_tag(out, "fLaC");

    // STREAMINFO, last metadata block
    out.push_back(0x80);
    put_be(out, 34, 3);
    put_be(out, block_size, 2);
    put_be(out, block_size, 2);
    put_be(out, 0, 3);
    put_be(out, 0, 3);
    // 20 bit rate | 3 bit channels-1 | 5 bit bps-1 | 36 bit total samples
    const uint64_t packed = (static_cast<uint64_t>(rate) << 44) |
                            (static_cast<uint64_t>(channels - 1u) << 41) |
                            (static_cast<uint64_t>(bits - 1u) << 36) |
                            static_cast<uint64_t>(frames);
    put_be(out, packed, 8);
    out.insert(out.end(), 16, 0);  // MD5 unknown

    const unsigned bytes = bits / 8u;
    const uint64_t mask = (bits == 64) ? ~0ull : ((1ull << bits) - 1);
    uint32_t frame_number = 0;
    for (uint32_t start = 0; start < frames; start += block_size, frame_number++) {
        const uint32_t n = std::min<uint32_t>(block_size, frames - start);
        std::vector<uint8_t> frame;
        frame.push_back(0xFF);
        frame.push_back(0xF8);                       // sync, fixed block size
        frame.push_back(0x70);                       // 16 bit block size at end, rate from STREAMINFO
        frame.push_back(static_cast<uint8_t>((channels - 1u) << 4)); // independent, bps from STREAMINFO
        if (frame_number < 0x80) {
            frame.push_back(static_cast<uint8_t>(frame_number));
        } else {
            frame.push_back(static_cast<uint8_t>(0xC0 | (frame_number >> 6)));
            frame.push_back(static_cast<uint8_t>(0x80 | (frame_number & 0x3F)));
        }
        put_be(frame, n - 1u, 2);
        frame.push_back(flac_crc8(frame));

        for (uint16_t c = 0; c < channels; c++) {
            frame.push_back(0x02);                   // VERBATIM, no wasted bits
            for (uint32_t i = 0; i < n; i++) {
                put_be(frame, static_cast<uint64_t>(gen(start + i, c)) & mask, bytes);
            }
        }
        put_be(frame, flac_crc16(frame), 2);
        out.insert(out.end(), frame.begin(), frame.end());
    }
    return out;
}

// A file in the temp directory, removed on destruction
class temp_file {
public:
    temp_file(const std::vector<uint8_t>& bytes, const std::string& suffix) {
        static std::atomic<unsigned> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        m_path = std::filesystem::temp_directory_path() /
                 ("bitplay_test_" + std::to_string(stamp) + "_" + std::to_string(counter++) + suffix);
        std::ofstream f(m_path, std::ios::binary);
        f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    ~temp_file() {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }

    temp_file(const temp_file&) = delete;
    temp_file& operator=(const temp_file&) = delete;

    [[nodiscard]] std::string path() const { return m_path.string(); }

private:
    std::filesystem::path m_path;
};

// Poll pred until it holds or the timeout expires
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

// Stereo 16 bit pattern where every frame encodes its own index
inline int64_t frame_index_pattern(uint32_t frame, uint16_t channel) {
    return channel == 0 ? static_cast<int64_t>(frame & 0x7FFF) : static_cast<int64_t>(frame >> 15);
}

inline uint32_t decode_frame_index(const uint8_t* frame_bytes) {
    const uint32_t l = static_cast<uint32_t>(frame_bytes[0]) | (static_cast<uint32_t>(frame_bytes[1]) << 8);
    const uint32_t r = static_cast<uint32_t>(frame_bytes[2]) | (static_cast<uint32_t>(frame_bytes[3]) << 8);
    return (r << 15) | l;
}

} // namespace bitplay::test

#endif // BITPLAY_TEST_HELPERS_HH
