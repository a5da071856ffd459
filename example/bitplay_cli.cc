/**
 * @example bitplay_cli.cc
 * @brief Bit-perfect command line player
 *
 * Plays the given files one after another on the chosen output device and
 * prints the playback position, the bit-perfect verdict and a coarse
 * spectrum of what was actually written to the device.
 *
 * Usage:
 *   bitplay_cli --list
 *   bitplay_cli [--device hw:1,0] file.flac [file.wav ...]
 */

#include "example_common.hh"
#include <bitplay/player.hh>
#include <bitplay/error.hh>
#include <bitplay/analyzer/analyzer_feed.hh>
#include <bitplay/analyzer/spectrum_analyzer.hh>
#include <bitplay/sdk/audio_format.hh>
#include <chrono>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {
    void print_usage(const char* argv0) {
        std::cerr << "Usage: " << argv0 << " --list\n"
                  << "       " << argv0 << " [--device ID] <audio_file> [audio_file ...]\n";
    }

    std::string spectrum_line(const bitplay::display_frame& frame) {
        static const char levels[] = " .:-=+*#%@";
        constexpr int steps = sizeof(levels) - 2;
        std::string line;
        line.reserve(frame.smoothed_db.size());
        for (float db : frame.smoothed_db) {
            // -90 dB .. 0 dB onto the level ramp
            int idx = static_cast<int>((db + 90.0f) / 90.0f * static_cast<float>(steps));
            if (idx < 0) {
                idx = 0;
            } else if (idx > steps) {
                idx = steps;
            }
            line += levels[idx];
        }
        return line;
    }

    std::string clock_time(double seconds) {
        const auto total = static_cast<int>(seconds);
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%d:%02d", total / 60, total % 60);
        return buf;
    }

    void list_devices(bitplay::player& p) {
        std::cout << "=== Output devices ===\n";
        for (const auto& dev : p.list_output_devices()) {
            std::cout << std::left << std::setw(14) << dev.id << " "
                      << (dev.kind == bitplay::device_kind::exclusive ? "[bit-perfect] " : "[converting]  ")
                      << dev.label << "\n";
        }
    }
}

int main(int argc, char* argv[]) {
    bool list_only = false;
    std::string device;
    std::vector<std::string> files;

    for (int i = 1; i < argc; i++) {
        const std::string arg = argv[i];
        if (arg == "--list") {
            list_only = true;
        } else if (arg == "--device") {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return 1;
            }
            device = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            files.push_back(arg);
        }
    }

    if (!list_only && files.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        auto backend = bitplay::examples::create_default_backend();
        auto library = std::make_shared<bitplay::track_library>(files);
        bitplay::player p(backend, library);
        std::cout << "Using " << bitplay::examples::get_backend_name() << " backend\n";

        if (list_only) {
            list_devices(p);
            return 0;
        }

        if (!device.empty()) {
            p.set_output_device(device);
        }
        std::cout << "Output device: " << p.output_device() << "\n\n";

        bitplay::analyzer_config cfg;
        cfg.bands = 48;
        auto analyzer = std::make_shared<bitplay::spectrum_analyzer>(cfg);
        p.set_pcm_sink(std::make_shared<bitplay::analyzer_feed>(analyzer));

        int failures = 0;
        for (const auto& track : p.list_tracks()) {
            std::cout << "Playing " << track.name << "\n";
            p.play(track.id);

            bool announced = false;
            bitplay::player_status st = p.status();
            while (st.state == bitplay::playback_state::playing ||
                   st.state == bitplay::playback_state::paused) {
                // the verdict lands once the device is open
                if (!announced && (st.bit_perfect || !st.bit_perfect_reason.empty())) {
                    std::cout << "  " << bitplay::sample_encoding_name(st.encoding) << ", "
                              << static_cast<unsigned>(st.channels) << " ch, " << st.sample_rate << " Hz on " << st.device_id << "\n"
                              << "  bit-perfect: " << (st.bit_perfect ? "yes" : "no");
                    if (!st.bit_perfect) {
                        std::cout << " (" << st.bit_perfect_reason << ")";
                    }
                    std::cout << "\n";
                    announced = true;
                }
                std::cout << "\r  " << clock_time(st.position) << " / " << clock_time(st.duration)
                          << " |" << spectrum_line(analyzer->get_display_frame()) << "|" << std::flush;

                std::this_thread::sleep_for(std::chrono::milliseconds(200));
                st = p.status();
            }
            std::cout << "\n";

            if (st.last_error != bitplay::playback_error::none) {
                std::cerr << "  stopped: " << st.last_error;
                if (!st.bit_perfect_reason.empty()) {
                    std::cerr << " (" << st.bit_perfect_reason << ")";
                }
                std::cerr << "\n";
                failures++;
            }
        }

        return failures == 0 ? 0 : 2;

    } catch (const bitplay::device_error& e) {
        std::cerr << "Device error: " << e.what() << "\n";
        return 1;
    } catch (const bitplay::decoder_error& e) {
        std::cerr << "Decoder error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
