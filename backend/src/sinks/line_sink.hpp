#pragma once

#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>

#include "sinks/sink.hpp"

// Writes one JSON object per line to a stream.
class LineSink : public ISink {
public:
    LineSink(std::string name, std::ostream& out) : name_(std::move(name)), out_(out) {}

    const std::string& name() const override { return name_; }
    bool send(const CanonicalEvent& ev) override { return write(to_json_line(ev)); }
    bool send(const SpreadEvent& ev) override { return write(to_json_line(ev)); }

protected:
    LineSink(std::string name, std::unique_ptr<std::ostream> owned)
        : name_(std::move(name)), owned_(std::move(owned)), out_(*owned_) {}

private:
    bool write(const std::string& line);

    std::string name_;
    std::unique_ptr<std::ostream> owned_;
    std::ostream& out_;
    std::mutex m_;
};

// Stdout sink
class StdoutSink : public LineSink {
public:
    StdoutSink();
};

// Append-only file sink. Throws std::runtime_error if the file cannot be opened.
class FileSink : public LineSink {
public:
    explicit FileSink(const std::string& path);

private:
    static std::unique_ptr<std::ostream> open(const std::string& path);
};
