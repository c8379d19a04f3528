// =================================================================
// src/Parley/MetricsReporter.cpp
// =================================================================
// Metric sinks and the background metrics reporter.

#include "Parley/MetricsReporter.hpp"
#include "Parley/Logger.hpp"
#include <sstream>

namespace Parley {

void LogMetricsSink::record(const MetricPoint& point) {
    std::stringstream ss;
    ss << point.name << "=" << point.value;
    if (!point.model_id.empty()) {
        ss << " model=" << point.model_id;
    }
    if (!point.region.empty()) {
        ss << " region=" << point.region;
    }
    if (point.estimated_tokens > 0) {
        ss << " tokens=" << point.estimated_tokens;
    }
    Logger::getInstance().debug("Metrics", ss.str(), point.call_id);
}

AsyncMetricsReporter::AsyncMetricsReporter(std::shared_ptr<MetricsSink> sink, size_t capacity)
    : m_sink(std::move(sink)), m_capacity(capacity == 0 ? 1 : capacity) {
    if (!m_sink) {
        m_sink = std::make_shared<LogMetricsSink>();
    }
    m_worker = std::thread(&AsyncMetricsReporter::workerLoop, this);
}

AsyncMetricsReporter::~AsyncMetricsReporter() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_cv.notify_all();
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

bool AsyncMetricsReporter::report(const MetricPoint& point) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_stopping || m_queue.size() >= m_capacity) {
            m_dropped++;
            return false;
        }
        m_queue.push_back(point);
    }
    m_cv.notify_one();
    return true;
}

void AsyncMetricsReporter::flush() {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_idle_cv.wait(lock, [this]() { return m_queue.empty() && m_in_flight == 0; });
}

void AsyncMetricsReporter::workerLoop() {
    while (true) {
        MetricPoint point;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]() { return m_stopping || !m_queue.empty(); });
            if (m_queue.empty()) {
                // Stopping and drained
                break;
            }
            point = std::move(m_queue.front());
            m_queue.pop_front();
            m_in_flight++;
        }

        try {
            m_sink->record(point);
        } catch (const std::exception& e) {
            Logger::getInstance().warning("AsyncMetricsReporter", "Metrics sink failed", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_in_flight--;
        }
        m_idle_cv.notify_all();
    }
    m_idle_cv.notify_all();
}

} // namespace Parley
