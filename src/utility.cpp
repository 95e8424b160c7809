#include "utility.hpp"

// standard
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace logging {
    // ANSI color codes
    const std::string RESET = "\033[0m";
    const std::string YELLOW = "\033[33m";
    const std::string RED = "\033[31m";

    static bool show_progress = false;
    static std::chrono::steady_clock::time_point progress_begin;

    // Internal helper to get timestamp
    static std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        std::time_t current_time = std::chrono::system_clock::to_time_t(now);
        std::stringstream ss;
        ss << std::put_time(std::localtime(&current_time), "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    void info(const std::string& message) {
        std::cerr << "[ISOWEAVE] " << get_timestamp() << " - " << message << std::endl;
    }

    void warning(const std::string& message) {
        std::cerr << YELLOW << "[ISOWEAVE] " << get_timestamp() << " - WARNING: " << message << RESET << std::endl;
    }

    void error(const std::string& message) {
        std::cerr << RED << "[ISOWEAVE] " << get_timestamp() << " - ERROR: " << message << RESET << std::endl;
    }

    void set_progress_enabled(bool enabled) {
        show_progress = enabled;
    }

    bool progress_enabled() {
        return show_progress;
    }

    void progress_start() {
        progress_begin = std::chrono::steady_clock::now();
    }

    void progress(size_t count, const std::string& prefix) {
        if (!show_progress) return;
        std::cerr << "\r[ISOWEAVE] " << prefix << "... " << count << std::flush;
    }

    void progress_done(size_t count, const std::string& message) {
        if (!show_progress) return;
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - progress_begin);
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(1) << static_cast<double>(elapsed.count()) / 1000.0;
        std::cerr << "\r";
        info(message + ": " + std::to_string(count) + " (" + ss.str() + "s)");
    }
}
