#pragma once
#include "../../../services/dispatch/include/review_unit.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

struct ScanOptions {
    std::vector<std::string> extensions{".go"};
    std::vector<std::string> ignore_dirs{
        "vendor", ".git", ".vscode", ".idea", "node_modules", "build", "dist", "bin", "tmp", ".tmp"
    };
    bool include_tests{false};
    std::uintmax_t max_file_size{1024 * 1024};
};

// Regular files under root matching the options, sorted by path.
// Oversized files are skipped with a warning; unreadable ones throw.
std::vector<ReviewUnit> scan_files(const std::filesystem::path& root, const ScanOptions& opts);

// "foo_test.go", "foo_test.cpp"
bool is_test_source(const std::filesystem::path& p);

std::string read_text_file(const std::filesystem::path& p);
