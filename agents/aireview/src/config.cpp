#include "../include/config.hpp"
#include <cstdlib>
#include <limits>
#include <stdexcept>

std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

std::vector<std::string> split_list(const std::string& s, char sep) {
    std::vector<std::string> out;
    std::string cur;
    auto flush = [&] {
        auto b = cur.find_first_not_of(" \t");
        auto e = cur.find_last_not_of(" \t");
        if (b != std::string::npos) out.push_back(cur.substr(b, e - b + 1));
        cur.clear();
    };
    for (char c : s) {
        if (c == sep) flush();
        else cur += c;
    }
    flush();
    return out;
}

namespace {
long long to_number(const std::string& flag, const std::string& v) {
    try {
        std::size_t pos = 0;
        long long n = std::stoll(v, &pos);
        if (pos != v.size()) throw std::invalid_argument(v);
        return n;
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid value for " + flag + ": " + v);
    }
}

int to_int(const std::string& flag, const std::string& v) {
    long long n = to_number(flag, v);
    if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max()) {
        throw std::invalid_argument("value out of range for " + flag + ": " + v);
    }
    return static_cast<int>(n);
}

long to_millis(const std::string& flag, const std::string& v) {
    long long secs = to_number(flag, v);
    if (secs < std::numeric_limits<long>::min() / 1000 || secs > std::numeric_limits<long>::max() / 1000) {
        throw std::invalid_argument("value out of range for " + flag + ": " + v);
    }
    return static_cast<long>(secs) * 1000;
}

double to_real(const std::string& flag, const std::string& v) {
    try {
        std::size_t pos = 0;
        double d = std::stod(v, &pos);
        if (pos != v.size()) throw std::invalid_argument(v);
        return d;
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid value for " + flag + ": " + v);
    }
}
}

ReviewConfig parse_args(int argc, const char* const* argv) {
    ReviewConfig cfg;
    cfg.model = getenv_or("AIREVIEW_MODEL", cfg.model);
    std::vector<std::string> flag_endpoints;
    std::vector<std::string> flag_exts;
    bool key_given = false;

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument("missing value for " + a);
            return argv[++i];
        };
        if (a == "-h" || a == "--help") cfg.show_help = true;
        else if (a == "-p" || a == "--path") cfg.project_path = value();
        else if (a == "-u" || a == "--url") cfg.api_url = value();
        else if (a == "-e" || a == "--endpoint") flag_endpoints.push_back(value());
        else if (a == "-k" || a == "--api-key") { cfg.api_key = value(); key_given = true; }
        else if (a == "-m" || a == "--model") cfg.model = value();
        else if (a == "--max-size") cfg.max_file_size = to_number(a, value());
        else if (a == "-c" || a == "--concurrency") cfg.max_concurrency = to_int(a, value());
        else if (a == "--timeout") cfg.request_timeout_ms = to_millis(a, value());
        else if (a == "--max-tokens") cfg.max_tokens = to_int(a, value());
        else if (a == "--temperature") cfg.temperature = to_real(a, value());
        else if (a == "--ext") flag_exts.push_back(value());
        else if (a == "--include-tests") cfg.include_tests = true;
        else if (a == "-o" || a == "--output") cfg.output_path = value();
        else throw std::invalid_argument("unknown argument: " + a);
    }

    if (!key_given) cfg.api_key = getenv_or("AIREVIEW_API_KEY", "");
    if (!flag_endpoints.empty()) cfg.endpoints = flag_endpoints;
    else cfg.endpoints = split_list(getenv_or("AIREVIEW_ENDPOINTS", ""));
    if (!flag_exts.empty()) {
        cfg.extensions.clear();
        for (auto& e : flag_exts) cfg.extensions.push_back(e.empty() || e[0] == '.' ? e : "." + e);
    }
    return cfg;
}

void validate_config(const ReviewConfig& cfg) {
    auto fail = [](const std::string& msg) { throw std::runtime_error("configuration error: " + msg); };
    if (cfg.endpoints.empty() && cfg.api_url.empty()) fail("API URL cannot be empty");
    for (const auto& ep : cfg.endpoints) {
        if (ep.empty()) fail("endpoint URL cannot be empty");
    }
    if (cfg.model.empty()) fail("model cannot be empty");
    if (cfg.max_file_size <= 0) fail("max file size must be positive");
    if (cfg.request_timeout_ms <= 0) fail("request timeout must be positive");
    if (cfg.max_concurrency <= 0) fail("concurrency must be at least 1");
    if (cfg.max_tokens <= 0) fail("max tokens must be positive");
    if (cfg.temperature < 0.0 || cfg.temperature > 2.0) fail("temperature must be between 0 and 2");
}

bool requires_api_key(const ReviewConfig& cfg) {
    if (!cfg.api_key.empty()) return false;
    static const char* const hosted[] = {
        "api.openai.com",
        "openai.azure.com",
        "api.anthropic.com",
        "generativelanguage.googleapis.com",
    };
    std::vector<std::string> urls = cfg.endpoints;
    if (urls.empty()) urls.push_back(cfg.api_url);
    for (const auto& u : urls) {
        for (const char* h : hosted) {
            if (u.find(h) != std::string::npos) return true;
        }
    }
    return false;
}

std::string usage_text() {
    return "aireview usage:\n"
           "  aireview [--path <dir>] [--url <url> | --endpoint <url>...] [--api-key <key>] [--model <name>]\n"
           "           [--concurrency N] [--max-size BYTES] [--timeout SECONDS] [--max-tokens N]\n"
           "           [--temperature T] [--ext .go ...] [--include-tests] [--output <file>]\n"
           "  env: AIREVIEW_API_KEY, AIREVIEW_ENDPOINTS (comma-separated), AIREVIEW_MODEL\n";
}
