/**
 * @file main.cpp
 * @brief netfetch-get: download a URL to a file or stdout
 */

#include <netfetch/common/debug.hpp>
#include <netfetch/common/platform.hpp>
#include <netfetch/config/config_loader.hpp>
#include <netfetch/download/downloader.hpp>

#include <chrono>
#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <getopt.h>

namespace {

using namespace netfetch;
using transport::http::Backend;

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage   = 2;

void print_usage(const char* program_name) {
    std::cout << "netfetch-get - fetch a URL with the first working download backend\n\n"
              << "Usage: " << program_name << " [OPTIONS] URL\n\n"
              << "Options:\n"
              << "  -o, --output FILE     Write to FILE instead of stdout\n"
              << "  -b, --backend NAME    Use only this backend (curl, beast, beast-tls)\n"
              << "  -c, --config FILE     Configuration file (YAML or JSON)\n"
              << "  -l, --log-level LEVEL Log level (trace, debug, info, warn, error, off)\n"
              << "  -q, --quiet           Do not print progress\n"
              << "      --list-backends   List compiled-in backends and exit\n"
              << "  -h, --help            Show this help message\n"
              << "      --version         Show version information\n";
}

void print_version() {
    std::cout << "netfetch-get " << NETFETCH_VERSION_STRING << " ("
              << common::platform::build_summary() << ")\n";
}

void list_backends() {
    for (auto backend : transport::http::kBackendOrder) {
        std::cout << transport::http::backend_name(backend) << "\t"
                  << (transport::http::is_backend_available(backend) ? "available" : "unavailable")
                  << "\t" << transport::http::backend_version(backend) << "\n";
    }
}

/**
 * @brief Bytes received so far, redrawn on stderr at most every 100ms
 */
class Progress {
public:
    explicit Progress(bool enabled) : enabled_(enabled) {}

    void on_event(const download::Event& event) {
        if (const auto* length = std::get_if<download::ContentLengthReceived>(&event)) {
            total_ = length->length;
        } else if (const auto* data = std::get_if<download::DataReceived>(&event)) {
            received_ += data->data.size();
        }
        draw(false);
    }

    void finish() {
        if (enabled_ && drawn_) {
            draw(true);
            std::cerr << "\n";
        }
    }

private:
    void draw(bool force) {
        if (!enabled_) {
            return;
        }
        auto now = std::chrono::steady_clock::now();
        if (!force && drawn_ && now - last_draw_ < std::chrono::milliseconds(100)) {
            return;
        }
        last_draw_ = now;
        drawn_     = true;

        std::cerr << "\r" << received_;
        if (total_) {
            std::cerr << " / " << *total_ << " bytes";
            if (*total_ > 0) {
                std::cerr << " (" << (received_ * 100 / *total_) << "%)";
            }
        } else {
            std::cerr << " bytes";
        }
        std::cerr << std::flush;
    }

    bool enabled_;
    bool drawn_ = false;
    uint64_t received_ = 0;
    std::optional<uint64_t> total_;
    std::chrono::steady_clock::time_point last_draw_;
};

}  // anonymous namespace

int main(int argc, char* argv[]) {
    std::string output_path;
    std::string backend_name;
    std::string config_file_path;
    std::string log_level;
    bool quiet = false;

    static struct option long_options[] = {
        {"output",        required_argument, 0, 'o'},
        {"backend",       required_argument, 0, 'b'},
        {"config",        required_argument, 0, 'c'},
        {"log-level",     required_argument, 0, 'l'},
        {"quiet",         no_argument,       0, 'q'},
        {"help",          no_argument,       0, 'h'},
        {"list-backends", no_argument,       0, 0},
        {"version",       no_argument,       0, 0},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;

    while ((c = getopt_long(argc, argv, "o:b:c:l:qh", long_options, &option_index)) != -1) {
        switch (c) {
            case 'o':
                output_path = optarg;
                break;
            case 'b':
                backend_name = optarg;
                break;
            case 'c':
                config_file_path = optarg;
                break;
            case 'l':
                log_level = optarg;
                break;
            case 'q':
                quiet = true;
                break;
            case 'h':
                print_usage(argv[0]);
                return kExitSuccess;
            case 0:
                if (option_index == 6) {  // --list-backends
                    list_backends();
                    return kExitSuccess;
                }
                if (option_index == 7) {  // --version
                    print_version();
                    return kExitSuccess;
                }
                break;
            case '?':
                std::cerr << "Error: Unknown option. Use -h for help." << std::endl;
                return kExitUsage;
            default:
                break;
        }
    }

    if (optind + 1 != argc) {
        std::cerr << "Error: Exactly one URL is required." << std::endl;
        print_usage(argv[0]);
        return kExitUsage;
    }

    auto url = common::parse_url(argv[optind]);
    if (!url) {
        std::cerr << "Error: Invalid URL: " << argv[optind] << std::endl;
        return kExitUsage;
    }

    // Configuration
    config::NetfetchConfig cfg;
    if (!config_file_path.empty()) {
        auto loaded = config::load_config(config_file_path);
        if (loaded.is_error()) {
            std::cerr << "Error: Cannot load configuration: " << loaded.message() << std::endl;
            return kExitUsage;
        }
        cfg = std::move(loaded).value();
    }
    if (!log_level.empty()) {
        cfg.logging.level = log_level;
    }

    auto logging = config::apply_logging_config(cfg.logging);
    if (logging.is_error()) {
        std::cerr << "Error: Invalid logging configuration: " << logging.message() << std::endl;
        return kExitUsage;
    }

    auto options = config::to_download_options(cfg);

    std::optional<Backend> backend;
    if (!backend_name.empty()) {
        backend = transport::http::parse_backend(backend_name);
        if (!backend) {
            std::cerr << "Error: Unknown backend '" << backend_name
                      << "'. Use --list-backends." << std::endl;
            return kExitUsage;
        }
    }

    Progress progress(!quiet);
    common::Result<void> result;

    if (!output_path.empty()) {
        download::EventCallback on_event = [&](const download::Event& event) {
            progress.on_event(event);
            return common::ok();
        };

        if (backend) {
            result = download::download_to_path_with_backend(*backend, *url, output_path,
                                                             on_event, options);
        } else {
            auto strategies = transport::http::default_strategies(options);
            result = download::attempt_download_to_path(strategies, *url, output_path, on_event);
        }
    } else {
        download::EventCallback on_event =
            [&](const download::Event& event) -> common::Result<void> {
            if (const auto* data = std::get_if<download::DataReceived>(&event)) {
                if (std::fwrite(data->data.data(), 1, data->data.size(), stdout) !=
                    data->data.size()) {
                    return common::err(common::ErrorCode::FILE_WRITE_FAILED,
                                       "cannot write to stdout");
                }
            }
            progress.on_event(event);
            return common::ok();
        };

        if (backend) {
            result = download::download_with_backend(*backend, *url, on_event, options);
        } else {
            auto strategies = transport::http::default_strategies(options);
            result = download::attempt_download(strategies, *url, on_event);
        }
        if (std::fflush(stdout) != 0 && result.is_success()) {
            result = common::err(common::ErrorCode::FILE_WRITE_FAILED, "cannot flush stdout");
        }
    }

    progress.finish();
    common::debug::shutdown_logging();

    if (result.is_error()) {
        std::cerr << "Error: " << result.error().to_string() << std::endl;
        return kExitFailure;
    }
    return kExitSuccess;
}
