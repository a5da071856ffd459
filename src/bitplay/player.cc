// This is copyrighted software. More information is at the end of this file.
#include <bitplay/player.hh>
#include <bitplay/audio_source.hh>
#include <bitplay/bit_perfect.hh>
#include <bitplay/format_mapper.hh>
#include <bitplay/output_device.hh>
#include <bitplay/codecs/register_codecs.hh>
#include <bitplay/error.hh>
#include <failsafe/failsafe.hh>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <mutex>
#include <thread>

namespace bitplay {

    std::ostream& operator<<(std::ostream& os, playback_state s) {
        switch (s) {
            case playback_state::idle: return os << "idle";
            case playback_state::playing: return os << "playing";
            case playback_state::paused: return os << "paused";
            case playback_state::stopped: return os << "stopped";
        }
        return os << "unknown";
    }

    std::ostream& operator<<(std::ostream& os, playback_error e) {
        switch (e) {
            case playback_error::none: return os << "none";
            case playback_error::unsupported_format: return os << "unsupported_format";
            case playback_error::decode_failure: return os << "decode_failure";
            case playback_error::device_unavailable: return os << "device_unavailable";
            case playback_error::device_write_failure: return os << "device_write_failure";
        }
        return os << "unknown";
    }

    namespace {
        // Signals private to one play() call
        struct session_control {
            std::atomic<bool> stop{false};
            std::atomic<bool> pause{false};

            std::mutex seek_mutex;
            std::optional<double> pending_seek;
        };

        struct worker {
            std::thread thread;
            std::shared_ptr<std::atomic<bool>> finished;
        };

        struct finished_guard {
            std::shared_ptr<std::atomic<bool>> flag;
            ~finished_guard() {
                flag->store(true);
            }
        };
    }

    struct player::impl {
        std::shared_ptr<output_backend> m_backend;
        std::shared_ptr<track_library> m_library;
        std::shared_ptr<settings_store> m_settings;
        player_config m_config;
        std::shared_ptr<decoders_registry> m_registry;

        // session, guarded by m_session_mutex
        mutable std::mutex m_session_mutex;
        playback_state m_state = playback_state::idle;
        std::optional<track_info> m_current_track;
        std::string m_device_id;
        double m_position = 0.0;
        double m_duration = 0.0;
        bool m_bit_perfect = false;
        std::string m_bit_perfect_reason;
        playback_error m_last_error = playback_error::none;
        sample_rate_t m_sample_rate = 0;
        channels_t m_channels = 0;
        sample_encoding m_encoding = sample_encoding::unknown;
        uint64_t m_generation = 0;
        std::shared_ptr<session_control> m_control;

        std::mutex m_sink_mutex;
        std::shared_ptr<pcm_sink> m_sink;

        std::mutex m_workers_mutex;
        std::vector<worker> m_workers;

        void reset_session_locked() {
            m_position = 0.0;
            m_duration = 0.0;
            m_bit_perfect = false;
            m_bit_perfect_reason.clear();
            m_last_error = playback_error::none;
            m_sample_rate = 0;
            m_channels = 0;
            m_encoding = sample_encoding::unknown;
        }

        // Run f on the session only if generation gen is still the current one
        template<typename F>
        bool publish(uint64_t gen, F&& f) {
            std::lock_guard<std::mutex> lock(m_session_mutex);
            if (m_generation != gen) {
                return false;
            }
            f();
            return true;
        }

        void reap_finished_workers() {
            std::lock_guard<std::mutex> lock(m_workers_mutex);
            auto it = m_workers.begin();
            while (it != m_workers.end()) {
                if (it->finished->load()) {
                    if (it->thread.joinable()) {
                        it->thread.join();
                    }
                    it = m_workers.erase(it);
                } else {
                    ++it;
                }
            }
        }

        void join_all_workers() {
            std::vector<worker> workers;
            {
                std::lock_guard<std::mutex> lock(m_workers_mutex);
                workers.swap(m_workers);
            }
            for (auto& w : workers) {
                if (w.thread.joinable()) {
                    w.thread.join();
                }
            }
        }

        void post_block(const uint8_t* data, size_t bytes, const audio_spec& spec) {
            std::shared_ptr<pcm_sink> sink;
            {
                std::lock_guard<std::mutex> lock(m_sink_mutex);
                sink = m_sink;
            }
            if (!sink) {
                return;
            }
            try {
                pcm_block block;
                block.format = spec.format;
                block.channels = spec.channels;
                block.sample_rate = spec.freq;
                block.data.assign(data, data + bytes);
                sink->push(std::move(block));
            } catch (const std::exception& e) {
                LOG_WARN("player", "PCM sink failed:", e.what());
            }
        }

        void apply_pending_seek(session_control& ctl, audio_source& source, uint64_t gen) {
            std::optional<double> target;
            {
                std::lock_guard<std::mutex> lock(ctl.seek_mutex);
                target.swap(ctl.pending_seek);
            }
            if (!target) {
                return;
            }
            const auto rate = source.get_rate();
            const auto total = source.total_frames();
            auto frame = static_cast<frame_count_t>(std::llround(std::max(0.0, *target) * rate));
            if (total > 0) {
                frame = std::min(frame, total);
            }
            source.seek_to_frame(frame);
            const double pos = rate ? static_cast<double>(frame) / rate : 0.0;
            publish(gen, [&] { m_position = pos; });
            LOG_DEBUG("player", "Repositioned to frame", frame, "(", pos, "s )");
        }

        void stream(const track_info& track, const std::string& device_id, uint64_t gen,
                    const std::shared_ptr<session_control>& ctl);
    };

    void player::impl::stream(const track_info& track, const std::string& device_id, uint64_t gen,
                              const std::shared_ptr<session_control>& ctl) {
        LOG_INFO("player", "Starting track", track.id, track.path, "on", device_id);

        playback_error error = playback_error::none;
        std::string failure;
        std::unique_ptr<audio_source> source;
        std::unique_ptr<bitplay::output_device> device;
        format_mapping mapping{audio_format::unknown, 0};

        try {
            source = audio_source::from_file(track.path, *m_registry);
            const double duration = source->duration_seconds();
            const auto rate = source->get_rate();
            const auto channels = source->get_channels();
            const auto encoding = source->get_encoding();
            publish(gen, [&] {
                m_duration = duration;
                m_sample_rate = rate;
                m_channels = channels;
                m_encoding = encoding;
            });
            LOG_INFO("player", "File info:", static_cast<int>(channels), "channels,", rate, "Hz,", encoding,
                     ",", duration, "s");
        } catch (const std::exception& e) {
            error = playback_error::decode_failure;
            failure = "cannot decode " + track.name + ": " + e.what();
        }

        if (error == playback_error::none) {
            try {
                mapping = map_encoding(source->get_encoding());
            } catch (const unsupported_format_error&) {
                error = playback_error::unsupported_format;
                failure = std::string("source encoding ") + sample_encoding_name(source->get_encoding()) +
                          " is not integer PCM";
            }
        }

        if (error == playback_error::none) {
            const audio_spec spec{mapping.device_format, source->get_channels(), source->get_rate()};
            try {
                device = bitplay::output_device::open(*m_backend, device_id, spec, m_config.period_frames,
                                                      m_config.retry, &ctl->stop);
            } catch (const std::exception& e) {
                error = playback_error::device_unavailable;
                failure = device_open_failed_verdict(e.what()).reason;
            }
        }

        if (device) {
            const auto verdict = classify_bit_perfect(device_id, source->get_encoding());
            publish(gen, [&] {
                m_bit_perfect = verdict.bit_perfect;
                m_bit_perfect_reason = verdict.reason;
            });
            if (verdict.bit_perfect) {
                LOG_INFO("player", "Bit-perfect:", device_id, sample_encoding_name(source->get_encoding()));
            } else {
                LOG_WARN("player", "Not bit-perfect:", verdict.reason);
            }

            const auto& spec = device->spec();
            const size_t frame_bytes = audio_spec_frame_bytes(spec);
            const size_t period = std::max<size_t>(1, m_config.period_frames);
            std::vector<uint8_t> buffer(period * frame_bytes);
            const double duration = source->duration_seconds();
            const auto rate = source->get_rate();

            try {
                apply_pending_seek(*ctl, *source, gen);
                while (true) {
                    if (ctl->stop.load()) {
                        break;
                    }
                    if (ctl->pause.load()) {
                        std::this_thread::sleep_for(m_config.pause_poll_interval);
                        continue;
                    }
                    apply_pending_seek(*ctl, *source, gen);

                    const size_t frames = source->read_frames(buffer.data(), period, mapping.element_bits);
                    if (frames == 0) {
                        LOG_INFO("player", "End of stream:", track.name);
                        break;
                    }
                    post_block(buffer.data(), frames * frame_bytes, spec);

                    if (ctl->stop.load()) {
                        break;
                    }
                    device->write(buffer.data(), frames);

                    // a seek that arrived during the write already published its target
                    {
                        std::lock_guard<std::mutex> lock(ctl->seek_mutex);
                        if (ctl->pending_seek) {
                            continue;
                        }
                    }
                    double pos = rate ? static_cast<double>(source->tell_frame()) / rate : 0.0;
                    if (duration > 0.0) {
                        pos = std::min(pos, duration);
                    }
                    publish(gen, [&] { m_position = pos; });
                }
            } catch (const device_error& e) {
                error = playback_error::device_write_failure;
                failure = std::string("device write failed: ") + e.what();
            } catch (const std::exception& e) {
                error = playback_error::decode_failure;
                failure = "decoding " + track.name + " failed: " + e.what();
            }
        } else if (error == playback_error::none) {
            LOG_INFO("player", "Stop requested while waiting for", device_id);
        }

        device.reset();
        source.reset();

        if (error != playback_error::none) {
            LOG_ERROR("player", "Stream of", track.path, "ended:", error, "-", failure);
        }

        const bool was_current = publish(gen, [&] {
            if (!ctl->stop.load()) {
                m_state = playback_state::idle;
            }
            m_current_track.reset();
            m_position = 0.0;
            m_duration = 0.0;
            m_bit_perfect = false;
            m_bit_perfect_reason = failure;
            m_last_error = error;
        });
        if (!was_current) {
            LOG_DEBUG("player", "Superseded session for", track.name, "exited");
        }
    }

    player::player(std::shared_ptr<output_backend> backend,
                   std::shared_ptr<track_library> library,
                   std::shared_ptr<settings_store> settings,
                   player_config config,
                   std::shared_ptr<decoders_registry> registry)
        : m_pimpl(std::make_unique<impl>()) {
        if (!backend) {
            THROW_RUNTIME("player needs an output backend");
        }
        if (!library) {
            THROW_RUNTIME("player needs a track library");
        }
        if (!backend->is_initialized()) {
            backend->init();
        }
        m_pimpl->m_backend = std::move(backend);
        m_pimpl->m_library = std::move(library);
        m_pimpl->m_settings = settings ? std::move(settings) : std::make_shared<memory_settings_store>();
        m_pimpl->m_config = std::move(config);
        m_pimpl->m_registry = registry ? std::move(registry) : create_registry_with_lossless_codecs();

        auto remembered = m_pimpl->m_settings->get(settings_keys::output_device);
        m_pimpl->m_device_id = remembered && !remembered->empty() ? *remembered : m_pimpl->m_config.default_device;
        LOG_INFO("player", "Using", m_pimpl->m_backend->get_name(), "backend, output device", m_pimpl->m_device_id);
    }

    player::~player() {
        {
            std::lock_guard<std::mutex> lock(m_pimpl->m_session_mutex);
            if (m_pimpl->m_control) {
                m_pimpl->m_control->stop = true;
                m_pimpl->m_control->pause = false;
            }
        }
        m_pimpl->join_all_workers();
    }

    std::vector<track_info> player::list_tracks() const {
        return m_pimpl->m_library->list();
    }

    std::optional<track_info> player::get_track(track_id_t id) const {
        return m_pimpl->m_library->get(id);
    }

    std::vector<device_info> player::list_output_devices() const {
        auto devices = m_pimpl->m_backend->enumerate_devices();
        LOG_DEBUG("player", "Found", devices.size(), "output devices");
        return devices;
    }

    void player::set_output_device(const std::string& device_id) {
        {
            std::lock_guard<std::mutex> lock(m_pimpl->m_session_mutex);
            m_pimpl->m_device_id = device_id;
        }
        m_pimpl->m_settings->set(settings_keys::output_device, device_id);
        LOG_INFO("player", "Output device set to", device_id);
    }

    std::string player::output_device() const {
        std::lock_guard<std::mutex> lock(m_pimpl->m_session_mutex);
        return m_pimpl->m_device_id;
    }

    void player::set_source_folder(const std::string& path) {
        m_pimpl->m_settings->set(settings_keys::source_folder, path);
    }

    std::string player::source_folder() const {
        return m_pimpl->m_settings->get(settings_keys::source_folder).value_or(std::string{});
    }

    void player::set_pcm_sink(std::shared_ptr<pcm_sink> sink) {
        std::lock_guard<std::mutex> lock(m_pimpl->m_sink_mutex);
        m_pimpl->m_sink = std::move(sink);
    }

    void player::play(track_id_t id) {
        auto track = m_pimpl->m_library->get(id);
        if (!track) {
            throw track_not_found_error("track " + std::to_string(id) + " not found");
        }

        m_pimpl->reap_finished_workers();

        auto ctl = std::make_shared<session_control>();
        std::string device_id;
        uint64_t gen;
        {
            std::lock_guard<std::mutex> lock(m_pimpl->m_session_mutex);
            if (m_pimpl->m_control) {
                m_pimpl->m_control->stop = true;
                m_pimpl->m_control->pause = false;
            }
            m_pimpl->m_control = ctl;
            gen = ++m_pimpl->m_generation;
            m_pimpl->reset_session_locked();
            m_pimpl->m_state = playback_state::playing;
            m_pimpl->m_current_track = *track;
            device_id = m_pimpl->m_device_id;
        }

        worker w;
        w.finished = std::make_shared<std::atomic<bool>>(false);
        auto finished = w.finished;
        impl* self = m_pimpl.get();
        w.thread = std::thread([self, t = *track, device_id, gen, ctl, finished]() {
            finished_guard guard{finished};
            self->stream(t, device_id, gen, ctl);
        });

        std::lock_guard<std::mutex> lock(m_pimpl->m_workers_mutex);
        m_pimpl->m_workers.push_back(std::move(w));
    }

    bool player::pause() {
        std::lock_guard<std::mutex> lock(m_pimpl->m_session_mutex);
        if (m_pimpl->m_state != playback_state::playing || !m_pimpl->m_control) {
            return false;
        }
        m_pimpl->m_control->pause = true;
        m_pimpl->m_state = playback_state::paused;
        LOG_INFO("player", "Paused at", m_pimpl->m_position, "s");
        return true;
    }

    bool player::resume() {
        std::lock_guard<std::mutex> lock(m_pimpl->m_session_mutex);
        if (m_pimpl->m_state != playback_state::paused || !m_pimpl->m_control) {
            return false;
        }
        m_pimpl->m_control->pause = false;
        m_pimpl->m_state = playback_state::playing;
        LOG_INFO("player", "Resumed at", m_pimpl->m_position, "s");
        return true;
    }

    void player::stop() {
        std::lock_guard<std::mutex> lock(m_pimpl->m_session_mutex);
        if (m_pimpl->m_control) {
            m_pimpl->m_control->stop = true;
            m_pimpl->m_control->pause = false;
        }
        m_pimpl->m_state = playback_state::stopped;
        LOG_INFO("player", "Stop requested");
    }

    bool player::seek(double seconds) {
        std::shared_ptr<session_control> ctl;
        double target = 0.0;
        {
            std::lock_guard<std::mutex> lock(m_pimpl->m_session_mutex);
            const auto st = m_pimpl->m_state;
            if (!m_pimpl->m_current_track || !m_pimpl->m_control ||
                (st != playback_state::playing && st != playback_state::paused)) {
                return false;
            }
            target = std::max(0.0, seconds);
            if (m_pimpl->m_duration > 0.0) {
                target = std::min(target, m_pimpl->m_duration);
            }
            m_pimpl->m_position = target;
            ctl = m_pimpl->m_control;
        }
        {
            std::lock_guard<std::mutex> lock(ctl->seek_mutex);
            ctl->pending_seek = target;
        }
        LOG_INFO("player", "Seek to", target, "s");
        return true;
    }

    double player::get_position() const {
        std::lock_guard<std::mutex> lock(m_pimpl->m_session_mutex);
        return m_pimpl->m_position;
    }

    double player::get_duration() const {
        std::lock_guard<std::mutex> lock(m_pimpl->m_session_mutex);
        return m_pimpl->m_duration;
    }

    player_status player::status() const {
        std::lock_guard<std::mutex> lock(m_pimpl->m_session_mutex);
        player_status st;
        st.state = m_pimpl->m_state;
        if (m_pimpl->m_current_track) {
            st.current_track_id = m_pimpl->m_current_track->id;
            st.current_track_name = m_pimpl->m_current_track->name;
        }
        st.device_id = m_pimpl->m_device_id;
        st.position = m_pimpl->m_position;
        st.duration = m_pimpl->m_duration;
        st.bit_perfect = m_pimpl->m_bit_perfect;
        st.bit_perfect_reason = m_pimpl->m_bit_perfect_reason;
        st.last_error = m_pimpl->m_last_error;
        st.sample_rate = m_pimpl->m_sample_rate;
        st.channels = m_pimpl->m_channels;
        st.encoding = m_pimpl->m_encoding;
        return st;
    }
}

/*
 * Copyright (C) 2025
 *
 * This file is part of bitplay.
 *
 * bitplay is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * bitplay is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with bitplay.  If not, see <http://www.gnu.org/licenses/>.
 */
