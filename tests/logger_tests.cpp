#include <zlib.h>
#include <cstdarg>
#include <cstdio>
#ifdef __linux__
#include <syslog.h>
#endif
#include <nlohmann/json.hpp>
#include "test_common.hpp"

using namespace gitfleet::test_support;

#ifdef __linux__
static std::vector<std::string> g_syslog_messages;
extern "C" void openlog(const char*, int, int) {}
extern "C" void syslog(int, const char* fmt, ...) {
    char buf[512];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    g_syslog_messages.emplace_back(buf);
}
extern "C" void closelog() {}
#endif

namespace {

struct LoggerGuard {
    ~LoggerGuard() {
        shutdown_logger();
        set_json_logging(false);
        set_log_compression(false);
    }
};

std::vector<std::string> read_lines(const fs::path& file) {
    std::ifstream ifs(file);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(ifs, line))
        lines.push_back(line);
    return lines;
}

} // namespace

TEST_CASE("plain entries carry level, message and fields") {
    fs::path dir = temp_dir("log_plain");
    fs::path log = dir / "gitfleet.log";
    {
        LoggerGuard guard;
        init_logger(log.string(), LogLevel::INFO);
        REQUIRE(logger_initialized());
        log_info("Operation finished", LogFields{{"op", "Fetch"}, {"repo", "/src/app"}});
        log_warning("Slow remote", std::string("12s"));
        log_error("Plain error");
    }
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 3);
    REQUIRE(lines[0].rfind("[", 0) == 0);
    REQUIRE(lines[0].find("[INFO] Operation finished op=Fetch repo=/src/app") != std::string::npos);
    REQUIRE(lines[1].find("[WARNING] Slow remote data=12s") != std::string::npos);
    REQUIRE(lines[2].find("[ERROR] Plain error") != std::string::npos);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("entries below the minimum level are dropped") {
    fs::path dir = temp_dir("log_level");
    fs::path log = dir / "gitfleet.log";
    {
        LoggerGuard guard;
        init_logger(log.string(), LogLevel::WARNING);
        log_debug("hidden");
        log_info("hidden too");
        log_warning("shown");
        set_log_level(LogLevel::DEBUG);
        log_debug("now shown");
    }
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].find("shown") != std::string::npos);
    REQUIRE(lines[1].find("now shown") != std::string::npos);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Logger switches between JSON and plain") {
    fs::path dir = temp_dir("log_json");
    fs::path log = dir / "gitfleet.log";
    {
        LoggerGuard guard;
        init_logger(log.string());
        set_json_logging(true);
        log_info("json entry", LogFields{{"repo", "/src/app"}});
        flush_logger();
        set_json_logging(false);
        log_info("plain entry");
    }
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    auto j = nlohmann::json::parse(lines[0]);
    REQUIRE(j["level"].get<std::string>() == "INFO");
    REQUIRE(j["msg"].get<std::string>() == "json entry");
    REQUIRE(j["repo"].get<std::string>() == "/src/app");
    REQUIRE(j.contains("timestamp"));
    REQUIRE(lines[1][0] == '[');
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Logger rotates and limits files") {
    fs::path dir = temp_dir("log_rotate");
    fs::path log = dir / "gitfleet.log";
    {
        LoggerGuard guard;
        init_logger(log.string(), LogLevel::INFO, 100, 2);
        for (int i = 0; i < 200; ++i)
            log_info("entry " + std::to_string(i));
    }
    REQUIRE(fs::exists(log));
    REQUIRE(fs::exists(dir / "gitfleet.log.1"));
    REQUIRE(fs::exists(dir / "gitfleet.log.2"));
    REQUIRE_FALSE(fs::exists(dir / "gitfleet.log.3"));
    FS_REMOVE_ALL(dir);
}

TEST_CASE("Logger compresses rotated files") {
    fs::path dir = temp_dir("log_gzip");
    fs::path log = dir / "gitfleet.log";
    {
        LoggerGuard guard;
        set_log_compression(true);
        init_logger(log.string(), LogLevel::INFO, 100, 2);
        for (int i = 0; i < 200; ++i)
            log_info("entry " + std::to_string(i));
    }
    fs::path gz = dir / "gitfleet.log.1.gz";
    REQUIRE(fs::exists(gz));
    REQUIRE(fs::exists(dir / "gitfleet.log.2.gz"));
    REQUIRE_FALSE(fs::exists(dir / "gitfleet.log.1"));

    gzFile zf = gzopen(gz.c_str(), "rb");
    REQUIRE(zf != nullptr);
    char buf[64] = {};
    int n = gzread(zf, buf, sizeof(buf) - 1);
    gzclose(zf);
    REQUIRE(n > 0);
    REQUIRE(std::string(buf).find("entry") != std::string::npos);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("shutdown_logger drains queued messages") {
    fs::path dir = temp_dir("log_drain");
    fs::path log = dir / "gitfleet.log";
    init_logger(log.string());
    for (int i = 0; i < 50; ++i)
        log_info("queued " + std::to_string(i));
    shutdown_logger();
    REQUIRE_FALSE(logger_initialized());
    REQUIRE(read_lines(log).size() == 50);
    log_info("after shutdown");
    REQUIRE(read_lines(log).size() == 50);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("init_logger keeps the previous file on a failed reopen") {
    fs::path dir = temp_dir("log_reopen");
    fs::path log = dir / "gitfleet.log";
    {
        LoggerGuard guard;
        init_logger(log.string());
        log_info("before");
        init_logger((dir / "missing" / "gitfleet.log").string());
        REQUIRE(logger_initialized());
        log_info("after");
    }
    auto lines = read_lines(log);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[1].find("after") != std::string::npos);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("concurrent writers lose nothing") {
    fs::path dir = temp_dir("log_threads");
    fs::path log = dir / "gitfleet.log";
    {
        LoggerGuard guard;
        init_logger(log.string());
        std::vector<std::thread> writers;
        for (int t = 0; t < 4; ++t) {
            writers.emplace_back([t] {
                for (int i = 0; i < 100; ++i)
                    log_info("writer", LogFields{{"t", std::to_string(t)}, {"i", std::to_string(i)}});
            });
        }
        for (auto& w : writers)
            w.join();
    }
    REQUIRE(read_lines(log).size() == 400);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("parse_log_level") {
    LogLevel level = LogLevel::INFO;
    REQUIRE(parse_log_level("debug", level));
    REQUIRE(level == LogLevel::DEBUG);
    REQUIRE(parse_log_level("Warn", level));
    REQUIRE(level == LogLevel::WARNING);
    REQUIRE(parse_log_level("ERROR", level));
    REQUIRE(level == LogLevel::ERR);
    REQUIRE_FALSE(parse_log_level("trace", level));
    REQUIRE(level == LogLevel::ERR);
}

#ifdef __linux__
TEST_CASE("init_syslog routes messages") {
    fs::path dir = temp_dir("log_syslog");
    g_syslog_messages.clear();
    {
        LoggerGuard guard;
        init_logger((dir / "gitfleet.log").string());
        init_syslog(LOG_USER);
        log_info("syslog entry", LogFields{{"repo", "/src/app"}});
    }
    REQUIRE_FALSE(g_syslog_messages.empty());
    REQUIRE(g_syslog_messages.back().find("syslog entry repo=/src/app") != std::string::npos);
    FS_REMOVE_ALL(dir);
}

TEST_CASE("syslog works without a log file") {
    g_syslog_messages.clear();
    {
        LoggerGuard guard;
        set_log_level(LogLevel::INFO);
        init_syslog(LOG_USER);
        REQUIRE_FALSE(logger_initialized());
        log_warning("remote unreachable", LogFields{{"repo", "/src/lib"}});
        flush_logger();
    }
    REQUIRE(g_syslog_messages.size() == 1);
    REQUIRE(g_syslog_messages[0].find("remote unreachable repo=/src/lib") != std::string::npos);
}
#endif
