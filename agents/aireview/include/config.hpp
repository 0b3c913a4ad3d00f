#pragma once
#include <cstdint>
#include <string>
#include <vector>

struct ReviewConfig {
    std::string project_path{"."};
    std::string api_url{"http://127.0.0.1:1234/v1/chat/completions"};
    std::vector<std::string> endpoints; // takes precedence over api_url
    std::string api_key;
    std::string model{"devstral-small-2507-mlx"};
    std::int64_t max_file_size{1024 * 1024};
    long request_timeout_ms{30000};
    int max_concurrency{3};
    int max_tokens{2048};
    double temperature{0.1};
    std::vector<std::string> extensions{".go"};
    bool include_tests{false};
    std::string output_path; // empty: stdout
    bool show_help{false};
};

std::string getenv_or(const char* key, const std::string& def);

// Applies environment fallbacks, then argv (argv[0] is skipped).
// Throws std::invalid_argument on unknown flags or missing/bad values.
ReviewConfig parse_args(int argc, const char* const* argv);

std::vector<std::string> split_list(const std::string& s, char sep = ',');

// Throws std::runtime_error("configuration error: ...").
void validate_config(const ReviewConfig& cfg);

// True when a hosted service endpoint is configured without an API key.
bool requires_api_key(const ReviewConfig& cfg);

std::string usage_text();
