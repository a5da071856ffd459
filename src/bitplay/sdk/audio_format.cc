#include <bitplay/sdk/audio_format.hh>
#include <ostream>

namespace bitplay {

std::ostream& operator<<(std::ostream& os, audio_format fmt) {
    switch (fmt) {
        case audio_format::unknown:
            os << "unknown";
            break;
        case audio_format::s16le:
            os << "s16le";
            break;
        case audio_format::s32le:
            os << "s32le";
            break;
        default:
            os << "audio_format(" << static_cast<int>(fmt) << ")";
            break;
    }
    return os;
}

const char* sample_encoding_name(sample_encoding enc) {
    switch (enc) {
        case sample_encoding::pcm_u8: return "PCM_U8";
        case sample_encoding::pcm_s8: return "PCM_S8";
        case sample_encoding::pcm_16: return "PCM_16";
        case sample_encoding::pcm_24: return "PCM_24";
        case sample_encoding::pcm_32: return "PCM_32";
        case sample_encoding::float_32: return "FLOAT";
        case sample_encoding::float_64: return "DOUBLE";
        case sample_encoding::compressed: return "COMPRESSED";
        case sample_encoding::unknown: break;
    }
    return "UNKNOWN";
}

std::ostream& operator<<(std::ostream& os, sample_encoding enc) {
    return os << sample_encoding_name(enc);
}

} // namespace bitplay
