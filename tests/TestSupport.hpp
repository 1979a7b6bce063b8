// Shared helpers for the core tests: scratch directories and an event recorder.
#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <random>
#include <string>
#include <vector>

#include "mediagrab/Types.hpp"

namespace mediagrab_test {

// Unique directory under the system temp dir, removed on destruction.
class ScratchDir {
public:
    ScratchDir() {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() /
                ("mediagrab_test_" + std::to_string(rd()) + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }
    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

// Thread-safe log of item events with blocking waits.
class EventRecorder {
public:
    void operator()(const mediagrab::ItemEvent& ev) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            events_.push_back(ev);
        }
        cv_.notify_all();
    }

    std::function<void(const mediagrab::ItemEvent&)> callback() {
        return [this](const mediagrab::ItemEvent& ev) { (*this)(ev); };
    }

    std::vector<mediagrab::ItemEvent> events() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return events_;
    }

    std::vector<mediagrab::ItemEvent> eventsFor(mediagrab::ItemId id) const {
        std::lock_guard<std::mutex> lk(mtx_);
        std::vector<mediagrab::ItemEvent> out;
        for (const auto& ev : events_) {
            if (ev.id == id) out.push_back(ev);
        }
        return out;
    }

    // Wait until a status event with the given value was seen for id.
    bool waitForStatus(mediagrab::ItemId id, mediagrab::ItemStatus status,
                       std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lk(mtx_);
        return cv_.wait_for(lk, timeout, [&] {
            for (const auto& ev : events_) {
                if (ev.id == id && ev.type == mediagrab::ItemEvent::Type::Status && ev.status == status)
                    return true;
            }
            return false;
        });
    }

    int countStatus(mediagrab::ItemStatus status) const {
        std::lock_guard<std::mutex> lk(mtx_);
        int n = 0;
        for (const auto& ev : events_) {
            if (ev.type == mediagrab::ItemEvent::Type::Status && ev.status == status) ++n;
        }
        return n;
    }

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::vector<mediagrab::ItemEvent> events_;
};

inline std::string makeBody(std::size_t size) {
    std::string body(size, '\0');
    for (std::size_t i = 0; i < size; ++i) body[i] = static_cast<char>('a' + i % 26);
    return body;
}

}  // namespace mediagrab_test
