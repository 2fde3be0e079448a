#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "time_utils.hpp"
#ifdef __linux__
#include <syslog.h>
#endif

namespace fs = std::filesystem;

namespace {

struct LogMessage {
    LogLevel level;
    std::string msg;
    LogFields fields;
};

// Owned by the writer thread once started; guarded by g_init_mtx otherwise.
std::ofstream g_log_ofs;
std::string g_log_path; // NOLINT(runtime/string)
std::atomic<LogLevel> g_min_level{LogLevel::INFO};
std::atomic<size_t> g_max_size{0};
std::atomic<size_t> g_max_files{1};
std::atomic<bool> g_json_log{false};
std::atomic<bool> g_compress_logs{false};
#ifdef __linux__
std::atomic<bool> g_syslog{false};
#endif

std::deque<LogMessage> g_log_queue;
std::mutex g_queue_mtx;
std::condition_variable g_queue_cv;
std::condition_variable g_idle_cv;
bool g_writing = false;
std::atomic<bool> g_running{false};
std::thread g_log_thread;
std::mutex g_init_mtx;

const char* level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::WARNING:
        return "WARNING";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    while (in) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0 && gzwrite(out, buf, static_cast<unsigned int>(n)) == 0) {
            gzclose(out);
            return false;
        }
    }
    return gzclose(out) == Z_OK;
}

std::string rotated_name(size_t index, bool gz) {
    std::string name = g_log_path + "." + std::to_string(index);
    if (gz)
        name += ".gz";
    return name;
}

// Shift path.N to path.N+1, dropping the oldest, then move the active file
// to path.1 (gzipped when compression is on).
void rotate_files() {
    std::error_code ec;
    const size_t keep = g_max_files.load();
    const bool gz = g_compress_logs.load();
    g_log_ofs.close();
    if (keep > 0) {
        fs::remove(rotated_name(keep, gz), ec);
        for (size_t i = keep; i > 1; --i)
            fs::rename(rotated_name(i - 1, gz), rotated_name(i, gz), ec);
        fs::path first = rotated_name(1, false);
        fs::rename(g_log_path, first, ec);
        if (gz && gzip_file(first.string(), rotated_name(1, true)))
            fs::remove(first, ec);
    }
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

std::string format_entry(const LogMessage& m) {
    std::string ts = timestamp();
    if (g_json_log.load()) {
        nlohmann::json j;
        j["timestamp"] = ts;
        j["level"] = level_label(m.level);
        j["msg"] = m.msg;
        for (const auto& [k, v] : m.fields)
            j[k] = v;
        return j.dump();
    }
    std::string line = "[" + ts + "] [" + level_label(m.level) + "] " + m.msg;
    for (const auto& [k, v] : m.fields)
        line += " " + k + "=" + v;
    return line;
}

void write_log_entry(const LogMessage& m) {
    if (m.level < g_min_level.load())
        return;
    std::string line = format_entry(m);
    if (g_log_ofs.is_open()) {
        g_log_ofs << line << '\n';
        if (g_max_size.load() > 0) {
            g_log_ofs.flush();
            std::error_code ec;
            auto size = fs::file_size(g_log_path, ec);
            if (!ec && size > g_max_size.load())
                rotate_files();
        }
    }
#ifdef __linux__
    if (g_syslog.load()) {
        int pri = LOG_INFO;
        switch (m.level) {
        case LogLevel::DEBUG:
            pri = LOG_DEBUG;
            break;
        case LogLevel::INFO:
            pri = LOG_INFO;
            break;
        case LogLevel::WARNING:
            pri = LOG_WARNING;
            break;
        case LogLevel::ERR:
            pri = LOG_ERR;
            break;
        }
        syslog(pri, "%s", line.c_str());
    }
#endif
}

void log_worker() {
    std::vector<LogMessage> batch;
    batch.reserve(16);
    while (true) {
        std::unique_lock<std::mutex> lk(g_queue_mtx);
        g_queue_cv.wait(lk, [] { return !g_log_queue.empty() || !g_running.load(); });
        if (!g_running.load() && g_log_queue.empty())
            break;
        while (!g_log_queue.empty() && batch.size() < 16) {
            batch.push_back(std::move(g_log_queue.front()));
            g_log_queue.pop_front();
        }
        g_writing = true;
        lk.unlock();
        for (const auto& m : batch)
            write_log_entry(m);
        batch.clear();
        if (g_log_ofs.is_open())
            g_log_ofs.flush();
        lk.lock();
        g_writing = false;
        if (g_log_queue.empty())
            g_idle_cv.notify_all();
    }
    if (g_log_ofs.is_open())
        g_log_ofs.flush();
}

void stop_log_thread() {
    {
        std::lock_guard<std::mutex> qlk(g_queue_mtx);
        g_running.store(false);
    }
    g_queue_cv.notify_all();
    if (g_log_thread.joinable())
        g_log_thread.join();
}

void enqueue(LogLevel level, const std::string& msg, LogFields fields) {
    if (level < g_min_level.load() || !g_running.load())
        return;
    {
        std::lock_guard<std::mutex> lk(g_queue_mtx);
        g_log_queue.push_back(LogMessage{level, msg, std::move(fields)});
    }
    g_queue_cv.notify_one();
}

void enqueue(LogLevel level, const std::string& msg, const std::string& data) {
    if (data.empty())
        enqueue(level, msg, LogFields{});
    else
        enqueue(level, msg, LogFields{{"data", data}});
}

} // namespace

/**
 * @brief Initialize file-based logging.
 *
 * Reopening with a new path flushes and closes the previous file first. If
 * @p path cannot be opened the previous file, if any, stays active.
 */
void init_logger(const std::string& path, LogLevel level, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    std::string prev_path = g_log_path;
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_ofs.clear();
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    std::string target = path;
    g_log_ofs.open(target, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        target = prev_path;
        if (!target.empty())
            g_log_ofs.open(target, std::ios::app);
    }
    g_log_path = target;
    g_min_level.store(level);
    g_running.store(true);
    g_log_thread = std::thread(log_worker);
}

bool parse_log_level(const std::string& name, LogLevel& level) {
    std::string val = name;
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (val == "DEBUG")
        level = LogLevel::DEBUG;
    else if (val == "INFO")
        level = LogLevel::INFO;
    else if (val == "WARNING" || val == "WARN")
        level = LogLevel::WARNING;
    else if (val == "ERROR" || val == "ERR")
        level = LogLevel::ERR;
    else
        return false;
    return true;
}

#ifdef __linux__
void init_syslog(int facility) {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    g_syslog.store(true);
    openlog("gitfleet", LOG_PID | LOG_CONS, facility == 0 ? LOG_USER : facility);
    // Syslog works without a log file, so the writer may not be running yet.
    if (!g_running.load()) {
        g_running.store(true);
        g_log_thread = std::thread(log_worker);
    }
}
#else
void init_syslog(int) {}
#endif

void set_log_level(LogLevel level) { g_min_level.store(level); }

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    return g_log_ofs.is_open();
}

void flush_logger() {
    std::unique_lock<std::mutex> lk(g_queue_mtx);
    g_idle_cv.wait(lk, [] { return (g_log_queue.empty() && !g_writing) || !g_running.load(); });
}

void log_debug(const std::string& msg) { enqueue(LogLevel::DEBUG, msg, LogFields{}); }
void log_debug(const std::string& msg, const std::string& data) {
    enqueue(LogLevel::DEBUG, msg, data);
}
void log_debug(const std::string& msg, const LogFields& fields) {
    enqueue(LogLevel::DEBUG, msg, fields);
}

void log_info(const std::string& msg) { enqueue(LogLevel::INFO, msg, LogFields{}); }
void log_info(const std::string& msg, const std::string& data) {
    enqueue(LogLevel::INFO, msg, data);
}
void log_info(const std::string& msg, const LogFields& fields) {
    enqueue(LogLevel::INFO, msg, fields);
}

void log_warning(const std::string& msg) { enqueue(LogLevel::WARNING, msg, LogFields{}); }
void log_warning(const std::string& msg, const std::string& data) {
    enqueue(LogLevel::WARNING, msg, data);
}
void log_warning(const std::string& msg, const LogFields& fields) {
    enqueue(LogLevel::WARNING, msg, fields);
}

void log_error(const std::string& msg) { enqueue(LogLevel::ERR, msg, LogFields{}); }
void log_error(const std::string& msg, const std::string& data) {
    enqueue(LogLevel::ERR, msg, data);
}
void log_error(const std::string& msg, const LogFields& fields) {
    enqueue(LogLevel::ERR, msg, fields);
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_init_mtx);
    stop_log_thread();
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
#ifdef __linux__
    if (g_syslog.load()) {
        closelog();
        g_syslog.store(false);
    }
#endif
    std::lock_guard<std::mutex> qlk(g_queue_mtx);
    g_log_queue.clear();
    g_idle_cv.notify_all();
}
