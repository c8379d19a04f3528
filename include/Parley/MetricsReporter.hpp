// =================================================================
// include/Parley/MetricsReporter.hpp
// =================================================================
// Fire-and-forget latency and cost reporting.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace Parley {

/**
 * @brief One latency or cost data point
 */
struct MetricPoint {
    std::string name;                  ///< e.g. "first_token_ms", "turn_duration_ms"
    double value = 0.0;
    std::string call_id;
    std::string model_id;
    std::string region;
    size_t estimated_tokens = 0;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

/**
 * @brief Abstract telemetry destination
 */
class MetricsSink {
public:
    virtual ~MetricsSink() = default;
    virtual void record(const MetricPoint& point) = 0;
};

/**
 * @brief Writes metric points to the debug log
 */
class LogMetricsSink : public MetricsSink {
public:
    void record(const MetricPoint& point) override;
};

/**
 * @brief Forwards points to a sink from a background thread
 *
 * report() never waits on the sink. When the queue is full the point is
 * dropped and counted.
 */
class AsyncMetricsReporter {
public:
    /**
     * @brief Constructor
     * @param sink Destination; shared with the caller
     * @param capacity Maximum queued points
     */
    AsyncMetricsReporter(std::shared_ptr<MetricsSink> sink, size_t capacity = 1024);

    /**
     * @brief Destructor; drains queued points and joins the worker
     */
    ~AsyncMetricsReporter();

    AsyncMetricsReporter(const AsyncMetricsReporter&) = delete;
    AsyncMetricsReporter& operator=(const AsyncMetricsReporter&) = delete;

    /**
     * @brief Queue a point
     * @return False if the point was dropped
     */
    bool report(const MetricPoint& point);

    /**
     * @brief Block until every queued point has reached the sink
     */
    void flush();

    size_t droppedCount() const { return m_dropped.load(); }

private:
    std::shared_ptr<MetricsSink> m_sink;
    const size_t m_capacity;
    std::deque<MetricPoint> m_queue;
    size_t m_in_flight = 0;
    bool m_stopping = false;
    std::atomic<size_t> m_dropped{0};
    std::mutex m_mutex;
    std::condition_variable m_cv;
    std::condition_variable m_idle_cv;
    std::thread m_worker;

    void workerLoop();
};

} // namespace Parley
