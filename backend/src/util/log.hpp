#pragma once

#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

// Shared by every writer to stderr so that lines from different threads
// never interleave.
inline std::mutex& log_mutex() {
    static std::mutex mtx;
    return mtx;
}

// log_line("supervisor", "agent ", name, " connected") -> "[supervisor] agent x connected"
template <typename... Args>
void log_line(const char* tag, Args&&... args) {
    std::ostringstream os;
    os << '[' << tag << "] ";
    (os << ... << std::forward<Args>(args));
    os << '\n';
    std::lock_guard<std::mutex> lk(log_mutex());
    std::cerr << os.str();
}
