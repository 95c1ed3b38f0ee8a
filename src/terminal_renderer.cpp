#include "ringframe/audio_stream.hpp"
#include "ringframe/log.hpp"
#include "ringframe/spectrum_analyzer.hpp"
#include "ringframe/stop_signal.hpp"

#include <ncurses.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <exception>
#include <thread>

namespace ringframe {
namespace {

/// ncurses view of the analyzer output and buffer health.
///
/// Top area: one bar per band with a peak marker. Bottom rows: gauges for the
/// analysis and monitor buffer fill and the overrun and underrun counters.
class TerminalRenderer {
public:
    TerminalRenderer() {
        initscr();
        cbreak();
        noecho();
        curs_set(0);
        nodelay(stdscr, TRUE);
        keypad(stdscr, TRUE);

        if (has_colors()) {
            start_color();
            use_default_colors();
            init_pair(1, COLOR_CYAN, -1);
            init_pair(2, COLOR_GREEN, -1);
            init_pair(3, COLOR_YELLOW, -1);
            init_pair(4, COLOR_RED, -1);
            has_color_ = true;
        }
    }

    ~TerminalRenderer() { endwin(); }

    TerminalRenderer(const TerminalRenderer&) = delete;
    TerminalRenderer& operator=(const TerminalRenderer&) = delete;

    /// Blocks until 'q', Escape, SIGINT or SIGTERM.
    void run(AudioStream& stream, SpectrumAnalyzer& analyzer) {
        constexpr auto frame_duration = std::chrono::milliseconds(16);
        const StopSignal stop_signal;
        stream.start();

        while (!stop_signal.requested()) {
            const auto frame_start = std::chrono::steady_clock::now();

            const int ch = getch();
            if (ch == 'q' || ch == 'Q' || ch == 27) {
                break;
            }

            const auto data = analyzer.update();
            if (data.frames > 0) {
                last_ = data;
            }
            render(stream);

            const auto elapsed = std::chrono::steady_clock::now() - frame_start;
            if (elapsed < frame_duration) {
                std::this_thread::sleep_for(frame_duration - elapsed);
            }
        }

        stream.stop();
    }

private:
    void render(const AudioStream& stream) {
        erase();
        int height = 0;
        int width = 0;
        getmaxyx(stdscr, height, width);

        constexpr int footer_lines = 4;
        const int bars_height = height - footer_lines - 1;
        if (bars_height < 3 || width < 20) {
            mvprintw(0, 0, "Terminal too small");
            refresh();
            return;
        }

        attron(A_BOLD);
        mvprintw(0, 1, "ringframe monitor - %s", stream.device_name().c_str());
        attroff(A_BOLD);

        draw_bars(1, bars_height, width);
        draw_footer(stream, height - footer_lines, width);
        refresh();
    }

    void draw_bars(int top, int bars_height, int width) {
        const auto bands = last_.magnitudes.size();
        if (bands == 0) {
            mvprintw(top + bars_height / 2, (width - 20) / 2, "Waiting for audio...");
            return;
        }

        const int bar_width = std::max(1, (width - 2) / static_cast<int>(bands));
        const int base_y = top + bars_height - 1;

        for (std::size_t i = 0; i < bands; ++i) {
            const int x = 1 + static_cast<int>(i) * bar_width;
            if (x + bar_width > width - 1) {
                break;
            }

            const auto scaled = [&](float v) {
                return static_cast<int>(std::clamp(v, 0.0f, 1.0f) *
                                        static_cast<float>(bars_height - 1));
            };
            const int bar = scaled(last_.magnitudes[i]);
            const int peak = scaled(last_.peaks[i]);

            for (int y = 0; y < bar; ++y) {
                const int pair = 1 + std::min(3, 4 * y / std::max(1, bars_height - 1));
                with_color(pair, [&] {
                    mvhline(base_y - y, x, ACS_BLOCK, std::max(1, bar_width - 1));
                });
            }
            if (peak > bar) {
                with_color(4, [&] {
                    mvhline(base_y - peak, x, ACS_HLINE, std::max(1, bar_width - 1));
                });
            }
        }
    }

    void draw_footer(const AudioStream& stream, int y, int width) {
        const auto stats = stream.stats();
        const auto& config = stream.config();

        mvhline(y, 0, ACS_HLINE, width);

        const auto analysis_rows = static_cast<float>(config.analysis_seconds) *
                                   static_cast<float>(config.sample_rate);
        draw_gauge(y + 1, width, "analysis",
                   static_cast<float>(stats.analysis_fill) / std::max(1.0f, analysis_rows));

        if (config.monitor_output) {
            const auto monitor_rows = config.monitor_seconds * static_cast<float>(config.sample_rate);
            draw_gauge(y + 2, width, "monitor ",
                       static_cast<float>(stats.monitor_fill) / std::max(1.0f, monitor_rows));
        }

        mvprintw(y + 3, 1, "RMS %.2f  Peak %.2f  Captured %lluk  Overruns %llu  Underruns %llu  Errors %llu",
                 static_cast<double>(last_.rms_level), static_cast<double>(last_.peak_level),
                 static_cast<unsigned long long>(stats.frames_captured / 1000),
                 static_cast<unsigned long long>(stats.overruns),
                 static_cast<unsigned long long>(stats.underruns),
                 static_cast<unsigned long long>(stats.callback_errors));
        mvprintw(y + 3, width - 10, "[q] Quit");
    }

    void draw_gauge(int y, int width, const char* label, float fill) {
        const int length = width - 16;
        if (length <= 0) {
            return;
        }
        const int filled =
            static_cast<int>(std::clamp(fill, 0.0f, 1.0f) * static_cast<float>(length));
        mvprintw(y, 1, "%s", label);
        with_color(2, [&] { mvhline(y, 11, ACS_CKBOARD, filled); });
        mvprintw(y, 12 + length, "%3d%%", static_cast<int>(fill * 100.0f));
    }

    template <typename Fn>
    void with_color(int pair, Fn&& draw) {
        if (has_color_) {
            attron(COLOR_PAIR(pair));
        }
        draw();
        if (has_color_) {
            attroff(COLOR_PAIR(pair));
        }
    }

    bool has_color_ = false;
    SpectrumData last_;
};

}  // namespace
}  // namespace ringframe

int main(int argc, char** argv) {
    using namespace ringframe;

    try {
        if (argc > 1 && std::strcmp(argv[1], "--list-devices") == 0) {
            for (const auto& name : AudioStream::list_input_devices()) {
                std::printf("%s\n", name.c_str());
            }
            return 0;
        }

        // stderr would draw over the curses screen
        ringframe::log::set_level(ringframe::log::Level::Error);

        const AudioConfig audio_cfg{.sample_rate = 48000,
                                    .buffer_frames = 256,
                                    .channels = 1,
                                    .analysis_seconds = 0.5f,
                                    .monitor_output = true,
                                    .monitor_seconds = 1.0f,
                                    .monitor_delay = 0.1f};

        const FFTConfig fft_cfg{.fft_size = 2048,
                                .window = WindowFunction::Hann,
                                .use_magnitude_db = true,
                                .db_floor = -60.0f,
                                .db_ceiling = 0.0f};

        const AnalyzerConfig analyzer_cfg{.num_bands = 64,
                                          .hop_size = 512,
                                          .min_frequency = 20.0f,
                                          .max_frequency = 16000.0f,
                                          .smoothing_factor = 0.6f,
                                          .peak_decay_rate = 0.92f,
                                          .logarithmic_frequency = true};

        AudioStream stream{audio_cfg};
        SpectrumAnalyzer analyzer{stream.analysis(), static_cast<float>(audio_cfg.sample_rate),
                                  fft_cfg, analyzer_cfg};
        TerminalRenderer renderer;
        renderer.run(stream, analyzer);
        return 0;
    } catch (const std::exception& e) {
        // The renderer, if it was built, has already restored the terminal
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
}
