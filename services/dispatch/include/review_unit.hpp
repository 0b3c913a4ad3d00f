#pragma once
#include <cstdint>
#include <string>

struct ReviewUnit {
    std::string path;      // identity shown in the report
    std::uintmax_t size{0}; // bytes on disk
    std::string content;
};
