#include <bitplay/format_mapper.hh>
#include <bitplay/error.hh>

#include <string>

namespace bitplay {

    format_mapping map_encoding(sample_encoding enc) {
        switch (enc) {
            case sample_encoding::pcm_16:
                return {audio_format::s16le, 16};
            case sample_encoding::pcm_24:
            case sample_encoding::pcm_32:
                return {audio_format::s32le, 32};
            default:
                break;
        }
        throw unsupported_format_error(std::string("unsupported source encoding ") + sample_encoding_name(enc));
    }

} // namespace bitplay
