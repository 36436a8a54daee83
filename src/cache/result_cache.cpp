#include "core/cache/result_cache.hpp"
#include "logging/logger.hpp"

FusionResult ResultCache::getOrCompute(const std::string &key, const ComputeFn &compute, bool *computed)
{
    if (computed)
        *computed = false;

    std::promise<FusionResult> promise;
    std::shared_future<FusionResult> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto cached = entries_.find(key);
        if (cached != entries_.end())
        {
            Logger::debug("Result cache hit for document: " + key);
            return cached->second;
        }

        auto running = in_flight_.find(key);
        if (running != in_flight_.end())
        {
            pending = running->second;
        }
        else
        {
            in_flight_.emplace(key, promise.get_future().share());
        }
    }

    if (pending.valid())
    {
        Logger::debug("Waiting for in-flight computation of document: " + key);
        return pending.get();
    }

    try
    {
        FusionResult result = compute();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.emplace(key, result);
            in_flight_.erase(key);
        }
        promise.set_value(result);
        if (computed)
            *computed = true;
        return result;
    }
    catch (const std::exception &e)
    {
        Logger::error("Computation for document " + key + " failed: " + std::string(e.what()));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_.erase(key);
        }
        promise.set_exception(std::current_exception());
        throw;
    }
    catch (...)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_.erase(key);
        }
        promise.set_exception(std::current_exception());
        throw;
    }
}

std::optional<FusionResult> ResultCache::get(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

bool ResultCache::contains(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(key) > 0;
}

size_t ResultCache::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t ResultCache::inFlight() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

void ResultCache::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    Logger::info("Result cache cleared");
}
