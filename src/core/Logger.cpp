/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Debug builds log to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <vector>

namespace Tessera {
namespace {

constexpr size_t LOG_FILES_KEPT = 5;
constexpr size_t FLUSH_EVERY = 50;
constexpr const char *LOG_FILE_PREFIX = "tessera_world_";

std::tm localTime(std::chrono::system_clock::time_point when) {
    auto asTimeT = std::chrono::system_clock::to_time_t(when);
    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &asTimeT);
#else
    localtime_r(&asTimeT, &timeinfo);
#endif
    return timeinfo;
}

// Release builds keep CRITICAL/ERROR lines in a rotating file so a world
// server that lost its heartbeat can be diagnosed after the fact.
class WorldLogFile {
public:
    static WorldLogFile& Instance() {
        static WorldLogFile instance;
        return instance;
    }

    void write(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_fileMutex);

        if (!m_opened) {
            open();
        }
        if (!m_stream.is_open()) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;
        std::tm timeinfo = localTime(now);

        m_stream << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << '.'
                 << std::setfill('0') << std::setw(3) << ms.count() << " ["
                 << level << "] [" << system << "] " << message << '\n';

        if (std::strcmp(level, "CRITICAL") == 0 || ++m_pending >= FLUSH_EVERY) {
            m_stream.flush();
            m_pending = 0;
        }
    }

private:
    WorldLogFile() = default;

    ~WorldLogFile() {
        if (m_stream.is_open()) {
            m_stream.flush();
        }
    }

    WorldLogFile(const WorldLogFile&) = delete;
    WorldLogFile& operator=(const WorldLogFile&) = delete;

    void open() {
        m_opened = true;

        // TESSERA_APP_NAME comes from CMake's ${PROJECT_NAME}
        char* prefPath = SDL_GetPrefPath("Tessera", TESSERA_APP_NAME);
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

        auto now = std::chrono::system_clock::now();
        std::tm timeinfo = localTime(now);
        std::ostringstream filename;
        filename << LOG_FILE_PREFIX << std::put_time(&timeinfo, "%Y%m%d_%H%M%S")
                 << ".log";

        m_stream.open(logDir / filename.str(), std::ios::out | std::ios::app);
        if (m_stream.is_open()) {
            m_stream << "=== " << TESSERA_APP_NAME << " world log, started "
                     << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S")
                     << " ===\n";
            m_stream.flush();
        }
    }

    // Keeps the newest LOG_FILES_KEPT - 1 files, leaving room for the new one
    void pruneOldLogs(const std::filesystem::path& logDir) {
        namespace fs = std::filesystem;

        std::vector<fs::directory_entry> logFiles;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(logDir, ec)) {
            if (entry.path().extension() == ".log" &&
                entry.path().filename().string().starts_with(LOG_FILE_PREFIX)) {
                logFiles.push_back(entry);
            }
        }

        if (logFiles.size() < LOG_FILES_KEPT) {
            return;
        }

        std::sort(logFiles.begin(), logFiles.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b) {
                      return a.last_write_time() < b.last_write_time();
                  });

        size_t toRemove = logFiles.size() - (LOG_FILES_KEPT - 1);
        for (size_t i = 0; i < toRemove; ++i) {
            fs::remove(logFiles[i].path(), ec);
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
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
        return;
    }
    WorldLogFile::Instance().write(level, system, message);
}

} // namespace Tessera

#endif // ifndef DEBUG
