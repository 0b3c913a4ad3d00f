#include "../include/scanner.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

bool is_test_source(const fs::path& p) {
    const std::string stem = p.stem().string();
    const std::string suffix = "_test";
    return stem.size() > suffix.size() &&
           stem.compare(stem.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string read_text_file(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw std::runtime_error("failed to read file " + p.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    if (f.bad()) throw std::runtime_error("failed to read file " + p.string());
    return ss.str();
}

std::vector<ReviewUnit> scan_files(const fs::path& root, const ScanOptions& opts) {
    fs::path base = fs::absolute(root).lexically_normal();
    if (!fs::is_directory(base)) throw std::runtime_error("not a directory: " + base.string());

    auto extset = std::unordered_set<std::string>(opts.extensions.begin(), opts.extensions.end());
    auto igset = std::unordered_set<std::string>(opts.ignore_dirs.begin(), opts.ignore_dirs.end());

    std::vector<ReviewUnit> out;
    for (auto it = fs::recursive_directory_iterator(base); it != fs::recursive_directory_iterator(); ++it) {
        const auto& entry = *it;
        if (entry.is_directory()) {
            if (igset.count(entry.path().filename().string())) it.disable_recursion_pending();
            continue;
        }
        if (!entry.is_regular_file()) continue;

        const fs::path& p = entry.path();
        if (!extset.empty() && !extset.count(p.extension().string())) continue;
        if (!opts.include_tests && is_test_source(p)) continue;

        std::uintmax_t size = entry.file_size();
        if (size > opts.max_file_size) {
            std::cerr << ("[aireview] Warning: Skipping file " + p.string() + " (size " + std::to_string(size) +
                          " exceeds limit " + std::to_string(opts.max_file_size) + ")\n");
            continue;
        }

        ReviewUnit u;
        u.path = p.string();
        u.size = size;
        u.content = read_text_file(p);
        out.push_back(std::move(u));
    }
    std::sort(out.begin(), out.end(), [](const ReviewUnit& a, const ReviewUnit& b) { return a.path < b.path; });
    return out;
}
