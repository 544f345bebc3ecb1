// include/flowstore/debug_utils.h
#pragma once

#include <string>
#include <sstream>
#include <iomanip>
#include <cctype> // For std::isprint
#include <iostream>
#include <mutex>

namespace flowstore {

// Helper to safely print potentially non-printable string data
inline std::string format_key_for_print(const std::string& key) {
    std::ostringstream oss;
    for (unsigned char c : key) {
        if (std::isprint(c)) {
            oss << c;
        } else {
            oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

// For direct hex dump of a string's content
inline std::string hex_dump_string(const std::string& str) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char c : str) {
        oss << std::setw(2) << static_cast<int>(c);
    }
    return oss.str();
}

namespace log_detail {

inline std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

// Writes `fmt`, substituting "{}" positionally. Arguments without a matching
// placeholder are appended at the end.
inline void format_into(std::ostream& os, const std::string& fmt, size_t& pos) {
    os << fmt.substr(pos);
    pos = fmt.size();
}

template<typename T, typename... Rest>
void format_into(std::ostream& os, const std::string& fmt, size_t& pos, T&& first, Rest&&... rest) {
    size_t marker = fmt.find("{}", pos);
    if (marker == std::string::npos) {
        os << fmt.substr(pos) << std::forward<T>(first);
        pos = fmt.size();
        (os << ... << std::forward<Rest>(rest));
        return;
    }
    os << fmt.substr(pos, marker - pos) << std::forward<T>(first);
    pos = marker + 2;
    format_into(os, fmt, pos, std::forward<Rest>(rest)...);
}

} // namespace log_detail

// Helper function for the variadic logging macros
template<typename... Args>
void print_log_line(std::ostream& os, const char* level, const std::string& fmt, Args&&... args) {
    std::ostringstream line;
    line << "[" << level << "] ";
    size_t pos = 0;
    log_detail::format_into(line, fmt, pos, std::forward<Args>(args)...);
    line << '\n';
    std::lock_guard<std::mutex> lock(log_detail::log_mutex());
    os << line.str();
    os.flush();
}

} // namespace flowstore

// #define FLOWSTORE_DEBUG_LOG

#ifdef FLOWSTORE_DEBUG_LOG
    #define LOG_DEBUG(level, ...) \
        do { ::flowstore::print_log_line(std::cout, "DEBUG:" #level, __VA_ARGS__); } while(0)
    #define LOG_TRACE(...) do { ::flowstore::print_log_line(std::cout, "TRACE", __VA_ARGS__); } while(0)
#else
    #define LOG_DEBUG(level, ...) do {} while(0)
    #define LOG_TRACE(...) do {} while(0)
#endif

#define LOG_INFO(...) do { ::flowstore::print_log_line(std::cout, "INFO", __VA_ARGS__); } while(0)
#define LOG_WARN(...) do { ::flowstore::print_log_line(std::cerr, "WARN", __VA_ARGS__); } while(0)
#define LOG_ERROR(...) do { ::flowstore::print_log_line(std::cerr, "ERROR", __VA_ARGS__); } while(0)
#define LOG_FATAL(...) do { ::flowstore::print_log_line(std::cerr, "FATAL", __VA_ARGS__); } while(0)
