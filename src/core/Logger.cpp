/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Debug builds log to stdout from the header; only release builds need this
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <vector>

namespace DexVault {
namespace {

constexpr size_t KEEP_LOG_FILES = 5;
constexpr size_t FLUSH_EVERY = 50;

std::tm localTime(std::time_t when) {
    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &when);
#else
    localtime_r(&when, &timeinfo);
#endif
    return timeinfo;
}

// Appends CRITICAL/ERROR lines to <pref path>/logs/dexvault_<stamp>.log
class LogFile {
public:
    static LogFile& Instance() {
        static LogFile instance;
        return instance;
    }

    void append(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_fileMutex);

        if (!m_opened) {
            open();
        }
        if (!m_stream.is_open()) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;
        std::tm timeinfo = localTime(std::chrono::system_clock::to_time_t(now));

        m_stream << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << '.'
                 << std::setfill('0') << std::setw(3) << ms.count() << " ["
                 << level << "] [" << system << "] " << message << '\n';

        if (std::strcmp(level, "CRITICAL") == 0 || ++m_pending >= FLUSH_EVERY) {
            m_stream.flush();
            m_pending = 0;
        }
    }

private:
    LogFile() = default;

    ~LogFile() {
        if (m_stream.is_open()) {
            m_stream.flush();
        }
    }

    LogFile(const LogFile&) = delete;
    LogFile& operator=(const LogFile&) = delete;

    void open() {
        m_opened = true;

        // DEXVAULT_APP_NAME comes from CMake
        char* prefPath = SDL_GetPrefPath("DexVault", DEXVAULT_APP_NAME);
        if (prefPath == nullptr) {
            return;
        }

        namespace fs = std::filesystem;
        fs::path logDir = fs::path(prefPath) / "logs";
        SDL_free(prefPath);

        std::error_code ec;
        fs::create_directories(logDir, ec);
        if (ec) {
            return;
        }

        pruneOldLogs(logDir);

        std::tm timeinfo = localTime(std::time(nullptr));
        std::ostringstream filename;
        filename << "dexvault_" << std::put_time(&timeinfo, "%Y%m%d_%H%M%S")
                 << ".log";

        m_stream.open(logDir / filename.str(), std::ios::out | std::ios::app);
        if (m_stream.is_open()) {
            m_stream << "=== " << DEXVAULT_APP_NAME << " Log ===\n"
                     << "Started: "
                     << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << "\n\n";
            m_stream.flush();
        }
    }

    // Keeps the newest KEEP_LOG_FILES - 1 so the new file makes KEEP_LOG_FILES
    static void pruneOldLogs(const std::filesystem::path& logDir) {
        namespace fs = std::filesystem;

        std::vector<fs::directory_entry> logs;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(logDir, ec)) {
            if (entry.path().extension() == ".log" &&
                entry.path().filename().string().starts_with("dexvault_")) {
                logs.push_back(entry);
            }
        }

        if (logs.size() < KEEP_LOG_FILES) {
            return;
        }

        std::sort(logs.begin(), logs.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b) {
                      std::error_code ea;
                      std::error_code eb;
                      return a.last_write_time(ea) < b.last_write_time(eb);
                  });

        size_t excess = logs.size() - (KEEP_LOG_FILES - 1);
        for (size_t i = 0; i < excess; ++i) {
            fs::remove(logs[i].path(), ec);
        }
    }

    std::mutex m_fileMutex;
    std::ofstream m_stream;
    bool m_opened = false;
    size_t m_pending = 0;
};

} // anonymous namespace

void Logger::Log(const char* level, const char* system,
                 const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_silentMode.load(std::memory_order_relaxed)) {
        return;
    }
    LogFile::Instance().append(level, system, message);
}

} // namespace DexVault

#endif // ifndef DEBUG
