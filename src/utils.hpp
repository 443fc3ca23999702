#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <algorithm>
#include <chrono>
#include <mutex>
#include <unordered_map>
#include <iostream>
#include <iomanip>
#include <atomic>

namespace Utils {

    inline char asciiLower(char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }

    inline std::string toLower(std::string_view s) {
        std::string result(s);
        std::transform(result.begin(), result.end(), result.begin(), asciiLower);
        return result;
    }

    inline std::string_view trimView(std::string_view s) {
        size_t b = 0;
        size_t e = s.size();
        while (b < e && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r' || s[b] == '\n')) b++;
        while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r' || s[e - 1] == '\n')) e--;
        return s.substr(b, e - b);
    }

    inline std::string trim(std::string_view s) {
        return std::string(trimView(s));
    }

    inline bool startsWith(std::string_view s, std::string_view prefix) {
        return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
    }

    // ASCII case-insensitive substring search. Returns npos when absent.
    inline size_t findIgnoreCase(std::string_view hay, std::string_view needle, size_t from = 0) {
        if (needle.empty()) return from <= hay.size() ? from : std::string_view::npos;
        if (hay.size() < needle.size()) return std::string_view::npos;
        for (size_t i = from; i + needle.size() <= hay.size(); ++i) {
            size_t j = 0;
            while (j < needle.size() && asciiLower(hay[i + j]) == asciiLower(needle[j])) j++;
            if (j == needle.size()) return i;
        }
        return std::string_view::npos;
    }

    inline bool containsIgnoreCase(std::string_view hay, std::string_view needle) {
        return findIgnoreCase(hay, needle) != std::string_view::npos;
    }

    // Splits on '\n', dropping a trailing '\r' from each line.
    inline std::vector<std::string_view> splitLines(std::string_view text) {
        std::vector<std::string_view> lines;
        size_t pos = 0;
        while (pos < text.size()) {
            size_t end = text.find('\n', pos);
            if (end == std::string_view::npos) end = text.size();
            std::string_view line = text.substr(pos, end - pos);
            if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
            lines.push_back(line);
            pos = end + 1;
        }
        return lines;
    }

    // Percent-encodes everything outside the RFC 3986 unreserved set.
    inline std::string urlEncode(std::string_view value) {
        static const char* hex = "0123456789ABCDEF";
        std::string out;
        out.reserve(value.size() * 3);
        for (char ch : value) {
            unsigned char c = static_cast<unsigned char>(ch);
            if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
                c == '-' || c == '_' || c == '.' || c == '~') {
                out += static_cast<char>(c);
            } else {
                out += '%';
                out += hex[c >> 4];
                out += hex[c & 15];
            }
        }
        return out;
    }

    // Logging

    enum class LogLevel { Error = 0, Warn = 1, Info = 2, Debug = 3 };

    inline std::atomic<int>& logThreshold() {
        static std::atomic<int> level{static_cast<int>(LogLevel::Info)};
        return level;
    }

    inline void setLogLevel(LogLevel level) {
        logThreshold().store(static_cast<int>(level), std::memory_order_relaxed);
    }

    inline bool parseLogLevel(std::string_view name, LogLevel& out) {
        std::string n = toLower(name);
        if (n == "error") out = LogLevel::Error;
        else if (n == "warn" || n == "warning") out = LogLevel::Warn;
        else if (n == "info") out = LogLevel::Info;
        else if (n == "debug") out = LogLevel::Debug;
        else return false;
        return true;
    }

    inline bool logEnabled(LogLevel level) {
        return static_cast<int>(level) <= logThreshold().load(std::memory_order_relaxed);
    }

    inline std::mutex& logMutex() {
        static std::mutex mu;
        return mu;
    }

    inline void log(LogLevel level, std::string_view tag, const std::string& message) {
        if (!logEnabled(level)) return;
        static const char* names[] = {"error", "warn", "info", "debug"};
        std::lock_guard<std::mutex> lk(logMutex());
        std::cerr << "[" << tag << "] " << names[static_cast<int>(level)] << ": " << message << std::endl;
    }

    // Profiling helpers
    struct TimerStats {
        double total_ms = 0;
        size_t count = 0;
    };

    class Profiler {
    public:
        static Profiler& instance() {
            static Profiler inst;
            return inst;
        }

        void record(const std::string& name, double ms) {
            std::lock_guard<std::mutex> lk(mu_);
            stats_[name].total_ms += ms;
            stats_[name].count++;
        }

        void printStats(std::ostream& os) {
            std::lock_guard<std::mutex> lk(mu_);
            os << "\n--- Profiling Stats ---" << std::endl;
            os << std::left << std::setw(25) << "Stage"
               << std::right << std::setw(15) << "Total (ms)"
               << std::setw(10) << "Calls"
               << std::setw(15) << "Avg (ms)" << std::endl;
            os << std::string(65, '-') << std::endl;

            for (const auto& pair : stats_) {
                double avg = pair.second.count > 0 ? pair.second.total_ms / pair.second.count : 0.0;
                os << std::left << std::setw(25) << pair.first
                   << std::right << std::setw(15) << std::fixed << std::setprecision(2) << pair.second.total_ms
                   << std::setw(10) << pair.second.count
                   << std::setw(15) << avg << std::endl;
            }
            os << std::string(65, '-') << std::endl;
        }

    private:
        std::mutex mu_;
        std::unordered_map<std::string, TimerStats> stats_;
    };

    // Timings are keyed per stage; safe to use from several threads.
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string name)
            : name_(std::move(name)), start_(std::chrono::steady_clock::now()) {}
        ~ScopedTimer() {
            std::chrono::duration<double, std::milli> ms = std::chrono::steady_clock::now() - start_;
            Profiler::instance().record(name_, ms.count());
        }
    private:
        std::string name_;
        std::chrono::steady_clock::time_point start_;
    };
}
