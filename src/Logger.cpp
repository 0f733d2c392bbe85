/**
 * @file Logger.cpp
 */
#include "Logger.h"

#include <atomic>
#include <mutex>
#include <fstream>
#include <iostream>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <thread>
#include <cctype>
#include <cstdlib>

namespace {
std::mutex g_logMtx;
std::ofstream g_file;
std::ostream* g_out = nullptr;
std::atomic<int> g_level{static_cast<int>(Logger::Level::Info)};

static std::string basenameFromPath(const std::string& p) {
    if (p.empty()) return std::string("lightcycle");
    size_t pos = p.find_last_of("/\\");
    if (pos == std::string::npos) return p;
    if (pos + 1 >= p.size()) return std::string("lightcycle");
    return p.substr(pos + 1);
}

static std::string nowTs() {
    using namespace std::chrono;
    auto tp = system_clock::now();
    auto t = system_clock::to_time_t(tp);
    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
    std::tm tmv;
#if defined(_WIN32)
    localtime_s(&tmv, &t);
#else
    localtime_r(&t, &tmv);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tmv, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count();
    return oss.str();
}

static void setLevelFromEnv() {
    const char* s = std::getenv("LIGHTCYCLE_LOG_LEVEL");
    if (!s) return;
    Logger::Level lvl;
    if (Logger::parseLevel(s, lvl)) g_level.store((int)lvl);
}

// caller holds g_logMtx
static void openSession() {
    setLevelFromEnv();
    *g_out << "===== session start " << nowTs() << " =====" << '\n';
    g_out->flush();
}
}

void Logger::initFromArgv0(const char* argv0) {
    std::string base = basenameFromPath(argv0 ? std::string(argv0) : std::string("lightcycle"));
    std::string file = std::string("./") + base + ".log";
    init(file);
}

void Logger::init(const std::string& filename) {
    std::lock_guard<std::mutex> lock(g_logMtx);
    if (g_out) return;
    // Append to preserve prior runs; we also mark a session header.
    g_file.open(filename, std::ios::out | std::ios::app);
    if (!g_file.is_open()) return;
    g_out = &g_file;
    openSession();
}

void Logger::initStderr() {
    std::lock_guard<std::mutex> lock(g_logMtx);
    if (g_out) return;
    g_out = &std::cerr;
    openSession();
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(g_logMtx);
    if (!g_out) return;
    *g_out << "===== session end   " << nowTs() << " =====" << std::endl;
    if (g_out == &g_file) g_file.close();
    g_out = nullptr;
}

void Logger::logImpl(Level lvl, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_logMtx);
    if (!g_out) return;
    if ((int)lvl < g_level.load()) return;
    std::ostringstream tid;
    tid << std::this_thread::get_id();
    const char* name = (lvl == Level::Debug ? "DEBUG" : lvl == Level::Info ? "INFO" : lvl == Level::Warn ? "WARN" : "ERROR");
    *g_out << nowTs() << " [" << name << "] [t:" << tid.str() << "] " << msg << '\n';
    if (lvl >= Level::Warn) g_out->flush();
}

void Logger::info(const std::string& msg) { logImpl(Level::Info, msg); }
void Logger::warn(const std::string& msg) { logImpl(Level::Warn, msg); }
void Logger::error(const std::string& msg) { logImpl(Level::Error, msg); }
void Logger::debug(const std::string& msg) { logImpl(Level::Debug, msg); }

void Logger::logException(const std::string& where, const std::exception& e) {
    logImpl(Level::Error, where + ": " + e.what());
}

void Logger::logUnknownException(const std::string& where) {
    logImpl(Level::Error, where + ": unknown exception");
}

void Logger::setLevel(Level lvl) { g_level.store((int)lvl); }
Logger::Level Logger::level() { return (Level)g_level.load(); }

bool Logger::enabled(Level lvl) {
    std::lock_guard<std::mutex> lock(g_logMtx);
    return g_out != nullptr && (int)lvl >= g_level.load();
}

bool Logger::parseLevel(const std::string& name, Level& out) {
    std::string v(name);
    for (auto& c : v) c = (char)std::tolower((unsigned char)c);
    if (v == "debug") out = Level::Debug;
    else if (v == "info") out = Level::Info;
    else if (v == "warn" || v == "warning") out = Level::Warn;
    else if (v == "error") out = Level::Error;
    else if (v == "none" || v == "off") out = Level::None;
    else return false;
    return true;
}
