#include <atomic>
#include <chrono>
#include <complex>
#include <csignal>
#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <string>
#include <thread>

#include <fmt/format.h>
#include <zmq.hpp>

#include "counters.hpp"
#include "hackrf_one.hpp"


static std::atomic<bool> do_exit(false);
static std::atomic<uint64_t> dropped_batches(0);

static const uint64_t CENTER_FREQ_HZ       = 915000000ULL;
static const uint32_t SAMPLE_RATE          = 10000000;
static const int DEFAULT_LNA_GAIN          = 16;           // 0-40 in steps of 8
static const int DEFAULT_VGA_GAIN          = 16;           // 0-62 in steps of 2

#define DEFAULT_ZEROMQ_PORT 5556

// signal handler to break the capture loop
void signal_handler(int) {
    do_exit = true;
}

static uint64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()
    ).count();
}

// whole-string base-10/0x number, false on garbage or overflow
static bool parse_int(const char* text, long long min, long long max, long long* value) {
    errno = 0;
    char* end = nullptr;
    const long long parsed = std::strtoll(text, &end, 0);
    if (errno != 0 || end == text || *end != '\0' || parsed < min || parsed > max) {
        return false;
    }
    *value = parsed;
    return true;
}

static void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [-d ser_nr] [-f <Hz>] [-s <Hz>] [-l <dB>] [-g <dB>] [-a] [-b] [-n <count>] [-p tcp_port]\n";
    std::cerr << "\t-d ser_nr   default:first\tserial number (or its tail) of the desired HackRF\n";
    std::cerr << "\t-f <Hz>     default:" << CENTER_FREQ_HZ << "\tcenter frequency\n";
    std::cerr << "\t-s <Hz>     default:" << SAMPLE_RATE << "\tsample rate\n";
    std::cerr << "\t-l <dB>     default:" << DEFAULT_LNA_GAIN << "  \tLNA gain, 0-40 in steps of 8\n";
    std::cerr << "\t-g <dB>     default:" << DEFAULT_VGA_GAIN << "  \tVGA gain, 0-62 in steps of 2\n";
    std::cerr << "\t-a          default:off \tEnable RF amplifier\n";
    std::cerr << "\t-b          default:off \tEnable antenna port power\n";
    std::cerr << "\t-n <count>  default:0   \tStop after this many samples (0: until Ctrl-C)\n";
    std::cerr << "\t-p port     default:" << DEFAULT_ZEROMQ_PORT << "\tZeroMQ publisher port for raw CS8 batches\n";
}

int main(int argc, char** argv) {
    SdrConfig config {
        .center_freq_hz = CENTER_FREQ_HZ,
        .sample_rate = SAMPLE_RATE,
        .lna_gain = DEFAULT_LNA_GAIN,
        .vga_gain = DEFAULT_VGA_GAIN
    };
    const char* serial = nullptr;
    uint64_t num_samples = 0;
    int zmq_port = DEFAULT_ZEROMQ_PORT;

    // process command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        long long value = 0;
        bool ok = true;

        if (arg == "-d" && i + 1 < argc) {
            serial = argv[++i];
        } else if (arg == "-f" && i + 1 < argc) {
            ok = parse_int(argv[++i], 0, std::numeric_limits<long long>::max(), &value);
            config.center_freq_hz = static_cast<uint64_t>(value);
        } else if (arg == "-s" && i + 1 < argc) {
            ok = parse_int(argv[++i], 1, std::numeric_limits<uint32_t>::max(), &value);
            config.sample_rate = static_cast<uint32_t>(value);
        } else if (arg == "-l" && i + 1 < argc) {
            // range checked by the device, not here
            ok = parse_int(argv[++i], std::numeric_limits<int>::min(), std::numeric_limits<int>::max(), &value);
            config.lna_gain = static_cast<int>(value);
        } else if (arg == "-g" && i + 1 < argc) {
            ok = parse_int(argv[++i], std::numeric_limits<int>::min(), std::numeric_limits<int>::max(), &value);
            config.vga_gain = static_cast<int>(value);
        } else if (arg == "-a") {
            config.amp_enable = true;
        } else if (arg == "-b") {
            config.bias_tee = true;
        } else if (arg == "-n" && i + 1 < argc) {
            ok = parse_int(argv[++i], 0, std::numeric_limits<long long>::max(), &value);
            num_samples = static_cast<uint64_t>(value);
        } else if (arg == "-p" && i + 1 < argc) {
            ok = parse_int(argv[++i], 1, 65535, &value);
            zmq_port = static_cast<int>(value);
        } else {
            if (arg != "-h") {
                std::cerr << "Unknown argument: " << arg << "\n";
            }
            print_usage(argv[0]);
            return 1;
        }

        if (!ok) {
            std::cerr << "Invalid value for " << arg << ": " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    //  Prepare our context and publisher
    const std::string zmq_address = fmt::format("tcp://*:{}", zmq_port);
    zmq::context_t context(1);
    zmq::socket_t publisher(context, zmq::socket_type::pub);
    publisher.bind(zmq_address);
    std::cerr << "Publishing samples on " << zmq_address << std::endl;

    // install signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string error;
    std::unique_ptr<HackrfOne> device = HackrfOne::open(serial, &error);
    if (!device) {
        std::fprintf(stderr, "open failed: %s\n", error.c_str());
        return EXIT_FAILURE;
    }
    std::cout << device->get_device_info() << "\n";

    std::cout << "HackRF RX: freq=" << config.center_freq_hz << " Hz, sample_rate=" << config.sample_rate
              << " Hz, LNA=" << config.lna_gain << ", VGA=" << config.vga_gain << "\n";

    Status result = device->configure(config);
    if (result != Status::Success) {
        std::fprintf(stderr, "configure() failed: %s (%s)\n", device->get_last_error().c_str(), status_name(result));
        return EXIT_FAILURE;
    }

    RxStatistics rx_stats;
    rx_stats.reset(now_ms());

    // the callback runs on the receive thread, the only user of the socket from here on
    result = device->start_rx([&](const std::complex<int8_t>* samples, std::size_t count) {
        rx_stats.register_batch(samples, count);
        if (!publisher.send(zmq::buffer(samples, count * sizeof(std::complex<int8_t>)), zmq::send_flags::dontwait)) {
            dropped_batches++;
        }
    });
    if (result != Status::Success) {
        std::fprintf(stderr, "start_rx() failed: %s (%s)\n", device->get_last_error().c_str(), status_name(result));
        return EXIT_FAILURE;
    }

    std::cerr << "Streaming... stop with Ctrl-C\n";

    // main loop: exit on Ctrl-C, on the sample limit or when the stream ends
    while (!do_exit && device->is_streaming()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        const uint64_t now = now_ms();
        if (rx_stats.reporting_due(now)) {
            const std::string report = fmt::format("S {} {} {}", now, rx_stats.to_string(), dropped_batches.load());
            rx_stats.reset(now);
            std::cout << report << std::endl;
        }

        if (num_samples != 0 && rx_stats.total_samples() >= num_samples) {
            break;
        }
    }

    result = device->stop_rx();
    std::cerr << "Stream ended: " << stream_end_name(device->rx_end_cause())
              << ", " << rx_stats.total_samples() << " samples\n";
    if (result != Status::Success) {
        std::fprintf(stderr, "stop_rx() failed: %s (%s)\n", device->get_last_error().c_str(), status_name(result));
        return EXIT_FAILURE;
    }

    std::cerr << "Done.\n";
    return 0;
}
