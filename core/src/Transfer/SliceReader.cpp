// SliceReader.cpp — Background slice reads

#include "innerocket/Transfer/SliceReader.h"
#include <spdlog/spdlog.h>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <thread>

namespace Innerocket {

struct SliceRequest {
    std::shared_ptr<FileSource> source;
    int64_t offset = 0;
    size_t length = 0;
    std::promise<SliceResult> promise;
};

// ═══════════════════════════════════════════════════════════
// SliceReader::Impl
// ═══════════════════════════════════════════════════════════

class SliceReader::Impl {
public:
    Impl() {
        m_running = true;
        m_worker = std::thread([this]() { workerLoop(); });
    }

    ~Impl() {
        stop();
    }

    std::future<SliceResult> requestSlice(std::shared_ptr<FileSource> source,
                                          int64_t offset, size_t length) {
        SliceRequest req;
        req.source = std::move(source);
        req.offset = offset;
        req.length = length;
        auto future = req.promise.get_future();

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_running || !req.source) {
                req.promise.set_value(std::nullopt);
                return future;
            }
            m_queue.push(std::move(req));
        }
        m_cv.notify_one();
        return future;
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_running) return;
            m_running = false;
        }
        m_cv.notify_all();
        if (m_worker.joinable()) {
            m_worker.join();
        }

        // Drain what the worker did not reach
        std::lock_guard<std::mutex> lock(m_mutex);
        while (!m_queue.empty()) {
            m_queue.front().promise.set_value(std::nullopt);
            m_queue.pop();
        }
    }

    bool isRunning() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_running;
    }

    size_t pendingCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::queue<SliceRequest> m_queue;
    bool m_running = false;
    std::thread m_worker;

    void workerLoop() {
        while (true) {
            SliceRequest req;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_cv.wait(lock, [this]() {
                    return !m_queue.empty() || !m_running;
                });

                if (!m_running) {
                    break;
                }

                req = std::move(m_queue.front());
                m_queue.pop();
            }

            process(req);
        }
    }

    void process(SliceRequest& req) {
        SliceResult result;
        try {
            result = req.source->readSlice(req.offset, req.length);
        } catch (const std::exception& e) {
            spdlog::error("SliceReader: Read of {} at {} threw: {}",
                          req.source->name(), req.offset, e.what());
            result = std::nullopt;
        }

        if (!result) {
            spdlog::warn("SliceReader: Failed to read {} bytes of {} at {}",
                         req.length, req.source->name(), req.offset);
        }
        req.promise.set_value(std::move(result));
    }
};

// ═══════════════════════════════════════════════════════════
// SliceReader
// ═══════════════════════════════════════════════════════════

SliceReader::SliceReader()
    : m_impl(std::make_unique<Impl>()) {
}

SliceReader::~SliceReader() = default;

std::future<SliceResult> SliceReader::requestSlice(std::shared_ptr<FileSource> source,
                                                   int64_t offset, size_t length) {
    return m_impl->requestSlice(std::move(source), offset, length);
}

void SliceReader::stop() {
    m_impl->stop();
}

bool SliceReader::isRunning() const {
    return m_impl->isRunning();
}

size_t SliceReader::pendingCount() const {
    return m_impl->pendingCount();
}

} // namespace Innerocket
