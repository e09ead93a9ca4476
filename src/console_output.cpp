#include "console_output.hpp"

std::mutex& consoleMutex() {
    static std::mutex mutex;
    return mutex;
}

void writeConsoleLine(std::ostream& out, const std::string& line) {
    std::lock_guard<std::mutex> lock(consoleMutex());
    out << "\n" << line << std::endl;
}

void writeStatusLine(std::ostream& out, const std::string& status) {
    std::lock_guard<std::mutex> lock(consoleMutex());
    out << status << "\r" << std::flush;
}
