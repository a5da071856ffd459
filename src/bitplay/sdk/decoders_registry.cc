#include <bitplay/sdk/decoders_registry.hh>
#include <bitplay/sdk/decoder.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <exception>

namespace bitplay {

void decoders_registry::register_decoder(accept_func_t accept,
                                        factory_func_t factory,
                                        int priority) {
    m_decoders.push_back({std::move(accept), std::move(factory), priority});

    // Sort by priority (higher first)
    std::stable_sort(m_decoders.begin(), m_decoders.end(),
                    [](const decoder_entry& a, const decoder_entry& b) {
                        return a.priority > b.priority;
                    });
}

const decoders_registry::decoder_entry* decoders_registry::find_entry(io_stream* stream) const {
    if (!stream) {
        return nullptr;
    }

    // Save current stream position
    auto original_pos = stream->tell();
    if (original_pos < 0) {
        return nullptr;
    }

    const decoder_entry* found = nullptr;
    for (const auto& entry : m_decoders) {
        // Reset stream position before each check
        stream->seek(original_pos, seek_origin::set);

        bool accepted = false;
        try {
            accepted = entry.accept && entry.accept(stream);
        } catch (const std::exception& e) {
            LOG_DEBUG("codecs", "Decoder probe failed:", e.what());
        }
        if (accepted) {
            found = &entry;
            break;
        }
    }

    // Always restore original position
    stream->seek(original_pos, seek_origin::set);
    return found;
}

std::unique_ptr<decoder> decoders_registry::find_decoder(io_stream* stream) const {
    const auto* entry = find_entry(stream);
    if (!entry || !entry->factory) {
        return nullptr;
    }
    return entry->factory();
}

bool decoders_registry::can_decode(io_stream* stream) const {
    return find_entry(stream) != nullptr;
}

size_t decoders_registry::size() const {
    return m_decoders.size();
}

void decoders_registry::clear() {
    m_decoders.clear();
}

} // namespace bitplay
