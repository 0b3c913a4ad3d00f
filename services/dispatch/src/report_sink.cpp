#include "../include/report_sink.hpp"
#include <stdexcept>

void StreamSink::write_block(const std::string& block) {
    out_.write(block.data(), static_cast<std::streamsize>(block.size()));
    out_.flush();
}

FileSink::FileSink(const std::string& path) : path_(path), out_(path, std::ios::binary | std::ios::trunc) {
    if (!out_) throw std::runtime_error("cannot open report file: " + path_);
}

void FileSink::write_block(const std::string& block) {
    out_.write(block.data(), static_cast<std::streamsize>(block.size()));
    out_.flush();
    if (!out_) throw std::runtime_error("failed to write report file: " + path_);
}
