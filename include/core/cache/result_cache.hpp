#pragma once

#include "core/forensic_result.hpp"
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

/**
 * @brief Document id -> FusionResult cache with single-flight computation.
 *
 * At most one computation runs per key; concurrent callers for the same key
 * block on the in-flight one and receive its result. Entries are never
 * mutated once stored and only disappear through clear().
 */
class ResultCache
{
public:
    using ComputeFn = std::function<FusionResult()>;

    ResultCache() = default;
    ResultCache(const ResultCache &) = delete;
    ResultCache &operator=(const ResultCache &) = delete;

    /**
     * @brief Return the cached result for key, computing it first when absent
     * @param computed Set to true only for the caller that ran compute
     * @throws Whatever compute throws; the key is left uncached and waiters see the same exception
     */
    FusionResult getOrCompute(const std::string &key, const ComputeFn &compute, bool *computed = nullptr);

    std::optional<FusionResult> get(const std::string &key) const;
    bool contains(const std::string &key) const;

    // Completed entries only
    size_t size() const;
    size_t inFlight() const;

    /**
     * @brief Drop every completed entry. Computations already in flight still
     * deliver to their waiters and are stored when they finish.
     */
    void clear();

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, FusionResult> entries_;
    std::unordered_map<std::string, std::shared_future<FusionResult>> in_flight_;
};
