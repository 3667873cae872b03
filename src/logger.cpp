#include "logger.hpp"
#include <zlib.h>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <unistd.h>
#include <nlohmann/json.hpp>
#include "time_utils.hpp"

namespace fs = std::filesystem;

static std::ofstream g_log_ofs;
static std::string g_log_path; // NOLINT(runtime/string)
static std::atomic<LogLevel> g_min_level{LogLevel::INFO};
static std::atomic<size_t> g_max_size{0};
static std::atomic<size_t> g_max_files{1};
static std::atomic<bool> g_json_log{false};
static std::atomic<bool> g_compress_logs{false};
static std::atomic<bool> g_console{true};
static std::atomic<bool> g_colors{true};
static std::mutex g_log_mtx;

const char* log_level_label(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "DEBUG";
    case LogLevel::INFO:
        return "INFO";
    case LogLevel::SUCCESS:
        return "SUCCESS";
    case LogLevel::WARNING:
        return "WARN";
    case LogLevel::ERR:
        return "ERROR";
    }
    return "INFO";
}

LogLevel parse_log_level(const std::string& name, bool& ok) {
    std::string up = name;
    std::transform(up.begin(), up.end(), up.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    ok = true;
    if (up == "DEBUG")
        return LogLevel::DEBUG;
    if (up == "INFO")
        return LogLevel::INFO;
    if (up == "SUCCESS")
        return LogLevel::SUCCESS;
    if (up == "WARN" || up == "WARNING")
        return LogLevel::WARNING;
    if (up == "ERROR" || up == "ERR")
        return LogLevel::ERR;
    ok = false;
    return LogLevel::INFO;
}

bool init_logger(const std::string& path, size_t max_size, size_t max_files) {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_ofs.clear();
    g_max_size.store(max_size);
    g_max_files.store(max_files);
    g_log_ofs.open(path, std::ios::app);
    if (!g_log_ofs.is_open()) {
        std::cerr << "Failed to open log file: " << path << std::endl;
        g_log_path.clear();
        return false;
    }
    g_log_path = path;
    return true;
}

void set_log_level(LogLevel level) { g_min_level.store(level); }

void set_json_logging(bool enable) { g_json_log.store(enable); }

void set_log_compression(bool enable) { g_compress_logs.store(enable); }

void set_console_logging(bool enable) { g_console.store(enable); }

void set_console_colors(bool enable) { g_colors.store(enable); }

bool logger_initialized() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    return g_log_ofs.is_open();
}

static bool gzip_file(const std::string& src, const std::string& dst) {
    std::ifstream in(src, std::ios::binary);
    gzFile out = gzopen(dst.c_str(), "wb");
    if (!in.is_open() || out == nullptr) {
        if (out)
            gzclose(out);
        return false;
    }
    char buf[8192];
    bool ok = true;
    while (in && ok) {
        in.read(buf, sizeof(buf));
        std::streamsize n = in.gcount();
        if (n > 0)
            ok = gzwrite(out, buf, static_cast<unsigned int>(n)) == static_cast<int>(n);
    }
    return gzclose(out) == Z_OK && ok;
}

static std::string rotated_name(size_t index, bool gz) {
    std::string name = g_log_path + "." + std::to_string(index);
    return gz ? name + ".gz" : name;
}

// Caller holds g_log_mtx.
static void rotate_if_needed() {
    if (g_max_size.load() == 0)
        return;
    g_log_ofs.flush();
    std::error_code ec;
    auto size = fs::file_size(g_log_path, ec);
    if (ec || size <= g_max_size.load())
        return;
    g_log_ofs.close();
    const size_t keep = g_max_files.load();
    const bool gz = g_compress_logs.load();
    if (keep > 0) {
        fs::remove(rotated_name(keep, gz), ec);
        for (size_t i = keep; i > 1; --i)
            fs::rename(rotated_name(i - 1, gz), rotated_name(i, gz), ec);
        fs::rename(g_log_path, rotated_name(1, false), ec);
        if (gz && gzip_file(rotated_name(1, false), rotated_name(1, true)))
            fs::remove(rotated_name(1, false), ec);
    }
    g_log_ofs.open(g_log_path, std::ios::trunc);
}

static const char* level_color(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
        return "\033[90m";
    case LogLevel::INFO:
        return "\033[36m";
    case LogLevel::SUCCESS:
        return "\033[32m";
    case LogLevel::WARNING:
        return "\033[33m";
    case LogLevel::ERR:
        return "\033[31m";
    }
    return "";
}

static void write_console(LogLevel level, const std::string& line) {
    bool to_err = level >= LogLevel::WARNING;
    std::ostream& os = to_err ? std::cerr : std::cout;
    bool color = g_colors.load() && isatty(to_err ? STDERR_FILENO : STDOUT_FILENO);
    if (color)
        os << level_color(level) << line << "\033[0m\n";
    else
        os << line << "\n";
    os.flush();
}

static void write_log_entry(LogLevel level, const std::string& msg,
                            const std::map<std::string, std::string>& fields) {
    if (level < g_min_level.load())
        return;
    const std::string ts = timestamp();
    const char* label = log_level_label(level);
    std::string line = "[" + ts + "] [" + label + "] " + msg;
    for (const auto& [k, v] : fields)
        line += " " + k + "=" + v;

    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_console.load())
        write_console(level, line);
    if (!g_log_ofs.is_open())
        return;
    if (g_json_log.load()) {
        nlohmann::ordered_json entry{{"timestamp", ts}, {"level", label}, {"msg", msg}};
        for (const auto& [k, v] : fields)
            entry[k] = v;
        // Command output may carry control bytes or broken UTF-8.
        g_log_ofs << entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
                  << '\n';
    } else {
        g_log_ofs << line << '\n';
    }
    rotate_if_needed();
}

void log_event(LogLevel level, const std::string& message) { write_log_entry(level, message, {}); }

void log_event(LogLevel level, const std::string& message,
               const std::map<std::string, std::string>& fields) {
    write_log_entry(level, message, fields);
}

void log_debug(const std::string& msg) { log_event(LogLevel::DEBUG, msg); }
void log_debug(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::DEBUG, msg, fields);
}
void log_info(const std::string& msg) { log_event(LogLevel::INFO, msg); }
void log_info(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::INFO, msg, fields);
}
void log_success(const std::string& msg) { log_event(LogLevel::SUCCESS, msg); }
void log_success(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::SUCCESS, msg, fields);
}
void log_warning(const std::string& msg) { log_event(LogLevel::WARNING, msg); }
void log_warning(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::WARNING, msg, fields);
}
void log_error(const std::string& msg) { log_event(LogLevel::ERR, msg); }
void log_error(const std::string& msg, const std::map<std::string, std::string>& fields) {
    log_event(LogLevel::ERR, msg, fields);
}

void flush_logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    std::cout.flush();
    std::cerr.flush();
    if (g_log_ofs.is_open())
        g_log_ofs.flush();
}

void shutdown_logger() {
    std::lock_guard<std::mutex> lk(g_log_mtx);
    if (g_log_ofs.is_open()) {
        g_log_ofs.flush();
        g_log_ofs.close();
    }
    g_log_path.clear();
    g_json_log.store(false);
    g_compress_logs.store(false);
    g_console.store(true);
    g_colors.store(true);
    g_min_level.store(LogLevel::INFO);
    std::cout.flush();
}
