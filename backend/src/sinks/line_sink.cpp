#include "sinks/line_sink.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

bool LineSink::write(const std::string& line) {
    std::lock_guard<std::mutex> lk(m_);
    out_ << line << '\n';
    out_.flush();
    if (out_) return true;
    // report this line only; the next write tries again
    out_.clear();
    return false;
}

StdoutSink::StdoutSink() : LineSink("stdout", std::cout) {}

FileSink::FileSink(const std::string& path) : LineSink("file:" + path, open(path)) {}

std::unique_ptr<std::ostream> FileSink::open(const std::string& path) {
    auto f = std::make_unique<std::ofstream>(path, std::ios::out | std::ios::app);
    if (!f->is_open()) {
        throw std::runtime_error("cannot open output file '" + path + "'");
    }
    return f;
}
