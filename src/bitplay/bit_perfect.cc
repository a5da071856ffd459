#include <bitplay/bit_perfect.hh>

namespace bitplay {

    namespace {
        constexpr const char* exclusive_prefix = "hw:";
    }

    bool is_exclusive_device_id(const std::string& device_id) {
        return device_id.compare(0, 3, exclusive_prefix) == 0;
    }

    bit_perfect_verdict classify_bit_perfect(const std::string& device_id, sample_encoding enc) {
        if (!is_exclusive_device_id(device_id)) {
            return {false, "output device '" + device_id +
                           "' is not exclusive hardware access; samples may be converted or resampled"};
        }
        if (!sample_encoding_is_wide_pcm(enc)) {
            return {false, std::string("source encoding ") + sample_encoding_name(enc) + " is not integer PCM"};
        }
        return {true, {}};
    }

    bit_perfect_verdict device_open_failed_verdict(const std::string& details) {
        return {false, "device open failed: " + details};
    }

} // namespace bitplay
