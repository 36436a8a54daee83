#include "core/thread_pool_manager.hpp"
#include "core/poco_config_adapter.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <thread>

// Static member initialization
std::unique_ptr<tbb::global_control> ThreadPoolManager::global_control_;
std::unique_ptr<ThreadPoolManager> ThreadPoolManager::observer_;
std::atomic<bool> ThreadPoolManager::initialized_{false};
std::atomic<size_t> ThreadPoolManager::current_thread_count_{0};
std::mutex ThreadPoolManager::resize_mutex_;

void ThreadPoolManager::initialize(size_t num_threads)
{
    if (initialized_.load())
        return;

    std::lock_guard<std::mutex> lock(resize_mutex_);
    if (initialized_.load()) // Double-check pattern
        return;

    if (!validateThreadCount(num_threads))
    {
        Logger::error("Invalid thread count: " + std::to_string(num_threads) + ". Using default: 4");
        num_threads = 4;
    }

    global_control_ = std::make_unique<tbb::global_control>(
        tbb::global_control::max_allowed_parallelism, num_threads);
    current_thread_count_.store(num_threads);
    initialized_.store(true);

    // Register as config observer for dynamic updates
    if (!observer_)
    {
        observer_ = std::make_unique<ThreadPoolManager>();
    }
    PocoConfigAdapter::getInstance().addObserver(observer_.get());

    Logger::info("Thread pool manager initialized with " + std::to_string(num_threads) + " threads");
}

void ThreadPoolManager::shutdown()
{
    if (!initialized_.load())
        return;

    std::lock_guard<std::mutex> lock(resize_mutex_);
    if (!initialized_.load()) // Double-check pattern
        return;

    if (observer_)
    {
        PocoConfigAdapter::getInstance().removeObserver(observer_.get());
        observer_.reset();
    }

    global_control_.reset();
    current_thread_count_.store(0);
    initialized_.store(false);
    Logger::info("Thread pool manager shutdown");
}

bool ThreadPoolManager::resizeThreadPool(size_t new_num_threads)
{
    if (!initialized_.load())
    {
        Logger::error("Cannot resize thread pool - not initialized");
        return false;
    }

    if (!validateThreadCount(new_num_threads))
    {
        Logger::error("Invalid thread count for resize: " + std::to_string(new_num_threads));
        return false;
    }

    std::lock_guard<std::mutex> lock(resize_mutex_);

    if (new_num_threads == current_thread_count_.load())
    {
        Logger::debug("Thread pool already at requested size: " + std::to_string(new_num_threads));
        return true;
    }

    Logger::info("Resizing thread pool from " + std::to_string(current_thread_count_.load()) +
                 " to " + std::to_string(new_num_threads) + " threads");

    global_control_.reset();
    global_control_ = std::make_unique<tbb::global_control>(
        tbb::global_control::max_allowed_parallelism, new_num_threads);
    current_thread_count_.store(new_num_threads);
    return true;
}

size_t ThreadPoolManager::getCurrentThreadCount()
{
    return current_thread_count_.load();
}

bool ThreadPoolManager::isInitialized()
{
    return initialized_.load();
}

void ThreadPoolManager::onConfigUpdate(const ConfigUpdateEvent &event)
{
    if (std::find(event.changed_keys.begin(), event.changed_keys.end(), "max_processing_threads") ==
        event.changed_keys.end())
    {
        return;
    }

    try
    {
        size_t new_thread_count = static_cast<size_t>(PocoConfigAdapter::getInstance().getMaxProcessingThreads());
        Logger::info("Configuration change detected - max_processing_threads: " + std::to_string(new_thread_count));

        if (!resizeThreadPool(new_thread_count))
        {
            Logger::warn("Failed to resize thread pool due to configuration change");
        }
    }
    catch (const std::exception &e)
    {
        Logger::error("Error handling thread count configuration change: " + std::string(e.what()));
    }
}

bool ThreadPoolManager::validateThreadCount(size_t thread_count)
{
    if (thread_count < 1 || thread_count > 64)
    {
        Logger::warn("Thread count " + std::to_string(thread_count) + " is outside valid range [1-64]");
        return false;
    }

    size_t max_hardware_threads = std::thread::hardware_concurrency();
    if (max_hardware_threads > 0 && thread_count > max_hardware_threads * 2)
    {
        // Allowed, but oversubscribed
        Logger::warn("Thread count " + std::to_string(thread_count) +
                     " exceeds 2x hardware concurrency (" + std::to_string(max_hardware_threads) + ")");
    }

    return true;
}
