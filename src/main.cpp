// chunkring-monitor: captures the default input device into a chunked ring
// buffer and prints one line per whole chunk pulled out of it.
//
// Usage: chunkring-monitor [seconds]
//        chunkring-monitor --list

#include "chunkring/audio_capture.hpp"
#include "chunkring/chunk_analyzer.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void signal_handler(int /*signum*/) {
    g_stop_requested = 1;
}

int usage(const char* program) {
    std::fprintf(stderr, "Usage: %s [seconds]\n       %s --list\n", program, program);
    return 2;
}

int list_devices() {
    for (const auto& name : chunkring::AudioCapture::list_input_devices()) {
        std::printf("%s\n", name.c_str());
    }
    return 0;
}

int run(unsigned seconds) {
    const chunkring::CaptureConfig capture_cfg{.sample_rate = 48000,
                                               .buffer_frames = 256,
                                               .channels = 1,
                                               .chunk_frames = 2048,
                                               .history_chunks = 8};

    chunkring::AudioCapture capture{capture_cfg};
    chunkring::ChunkAnalyzer analyzer{
        {.chunk_size = capture.chunk_size(),
         .sample_rate = static_cast<float>(capture.sample_rate())}};

    std::printf("Capturing from \"%s\" for %us, %zu samples per chunk\n",
                capture.device_name().c_str(), seconds, capture.chunk_size());
    std::printf("%8s %8s %8s %10s\n", "chunk", "rms", "peak", "freq(Hz)");

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::vector<float> chunk(capture.chunk_size());
    std::size_t chunk_index = 0;

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    capture.start();

    while (g_stop_requested == 0 && std::chrono::steady_clock::now() < deadline) {
        while (capture.read_chunk(chunk)) {
            const auto summary = analyzer.analyze(chunk);
            std::printf("%8zu %8.4f %8.4f %10.1f\n", chunk_index++,
                        static_cast<double>(summary.rms), static_cast<double>(summary.peak),
                        static_cast<double>(summary.dominant_frequency));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    capture.stop();

    const auto stats = capture.stats();
    std::printf("Chunks: %zu  Samples: %llu  Overwritten: %llu  Dropped blocks: %llu  "
                "Input overflows: %llu\n",
                chunk_index, static_cast<unsigned long long>(stats.queue.samples_pushed),
                static_cast<unsigned long long>(stats.queue.overwritten_samples),
                static_cast<unsigned long long>(stats.queue.dropped_blocks),
                static_cast<unsigned long long>(stats.input_overflows));
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    unsigned seconds = 10;

    if (argc > 2) {
        return usage(argv[0]);
    }
    if (argc == 2) {
        const std::string_view arg{argv[1]};
        if (arg == "--list") {
            try {
                return list_devices();
            } catch (const std::exception& e) {
                std::fprintf(stderr, "Error: %s\n", e.what());
                return 1;
            }
        }

        const auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), seconds);
        if (ec != std::errc{} || ptr != arg.data() + arg.size() || seconds == 0) {
            return usage(argv[0]);
        }
    }

    try {
        return run(seconds);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
}
