#pragma once
#include <fstream>
#include <ostream>
#include <string>

// Destination for whole report blocks. Callers serialize access.
class ReportSink {
public:
    virtual ~ReportSink() = default;
    virtual void write_block(const std::string& block) = 0;
};

class StreamSink : public ReportSink {
public:
    explicit StreamSink(std::ostream& out) : out_(out) {}
    void write_block(const std::string& block) override;

private:
    std::ostream& out_;
};

// Truncates `path` on open.
class FileSink : public ReportSink {
public:
    explicit FileSink(const std::string& path);
    void write_block(const std::string& block) override;

private:
    std::string path_;
    std::ofstream out_;
};
