#pragma once

#include <tbb/global_control.h>
#include <atomic>
#include <memory>
#include <mutex>
#include "core/config_observer.hpp"

/**
 * @brief Bounds the TBB worker pool used for batch document processing
 * and resizes it when max_processing_threads changes.
 */
class ThreadPoolManager : public ConfigObserver
{
public:
    /**
     * @brief Initialize the thread pool manager
     * @param num_threads Number of threads in the pool (default: 4)
     */
    static void initialize(size_t num_threads);

    /**
     * @brief Shutdown the thread pool manager
     */
    static void shutdown();

    /**
     * @brief Dynamically resize the thread pool
     * @param new_num_threads New number of threads
     * @return true if resize was successful, false otherwise
     */
    static bool resizeThreadPool(size_t new_num_threads);

    /**
     * @brief Get current thread pool size
     * @return Current number of threads in the pool, 0 when not initialized
     */
    static size_t getCurrentThreadCount();

    static bool isInitialized();

    static bool validateThreadCount(size_t thread_count);

    /**
     * @brief Configuration change handler for dynamic updates
     * @param event Configuration change event
     */
    void onConfigUpdate(const ConfigUpdateEvent &event) override;

    ThreadPoolManager() = default;

private:
    static std::unique_ptr<tbb::global_control> global_control_;
    static std::unique_ptr<ThreadPoolManager> observer_;
    static std::atomic<bool> initialized_;
    static std::atomic<size_t> current_thread_count_;
    static std::mutex resize_mutex_;
};
