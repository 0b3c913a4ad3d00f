#include "../include/config.hpp"
#include "../include/scanner.hpp"
#include "../../../services/dispatch/include/review_engine.hpp"
#include "../../../shared/cpp/chat_sdk/include/cancel_token.hpp"
#include "../../../shared/cpp/chat_sdk/include/http.hpp"
#include <csignal>
#include <iostream>
#include <memory>

static CancelToken g_cancel;

extern "C" void on_signal(int) {
    g_cancel.cancel();
}

int main(int argc, char** argv) {
    ReviewConfig cfg;
    try {
        cfg = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << "\n" << usage_text();
        return 2;
    }
    if (cfg.show_help) {
        std::cout << usage_text();
        return 0;
    }

    try {
        if (requires_api_key(cfg)) {
            std::cerr << "[aireview] Warning: This API endpoint likely requires an API key.\n"
                      << "[aireview] Use --api-key flag or set AIREVIEW_API_KEY environment variable.\n";
        }
        validate_config(cfg);

        CurlGlobalScope curl_scope;
        std::signal(SIGINT, on_signal);
        std::signal(SIGTERM, on_signal);

        ScanOptions scan;
        scan.extensions = cfg.extensions;
        scan.include_tests = cfg.include_tests;
        scan.max_file_size = (std::uintmax_t)cfg.max_file_size;

        std::cerr << "[aireview] Scanning directory: " << cfg.project_path << "\n";
        auto units = scan_files(cfg.project_path, scan);
        if (units.empty()) {
            std::cerr << "[aireview] No files found to review\n";
            return 0;
        }
        std::cerr << "[aireview] Found " << units.size() << " files to review\n";

        ChatClientConfig chat;
        chat.model = cfg.model;
        chat.api_key = cfg.api_key;
        chat.max_tokens = cfg.max_tokens;
        chat.temperature = cfg.temperature;
        chat.timeout_ms = cfg.request_timeout_ms;
        ChatReviewClient client{ChatClient(chat)};

        std::unique_ptr<ReportSink> sink;
        if (cfg.output_path.empty()) sink = std::make_unique<StreamSink>(std::cout);
        else sink = std::make_unique<FileSink>(cfg.output_path);

        EngineConfig engine_cfg;
        engine_cfg.endpoints = cfg.endpoints;
        engine_cfg.fallback_url = cfg.api_url;
        engine_cfg.max_concurrency = (std::size_t)cfg.max_concurrency;
        engine_cfg.max_unit_size = (std::uintmax_t)cfg.max_file_size;

        ReviewEngine engine(engine_cfg, client, *sink);
        RunSummary summary = engine.run(units, g_cancel);

        if (!summary.ok()) {
            std::cerr << "\n[aireview] Encountered " << summary.failed << " errors during review:\n";
            for (const auto& f : summary.failures) std::cerr << "- " << f << "\n";
            std::cerr << "[ERROR] " << summary.status_line() << "\n";
            return 1;
        }
        std::cerr << "\n[aireview] " << summary.status_line() << "\n";
        if (!cfg.output_path.empty()) std::cerr << "[aireview] Report written to " << cfg.output_path << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
