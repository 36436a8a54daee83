#pragma once

#include "core/forensic_result.hpp"
#include <string>

/**
 * @brief Contract shared by the three forensic analyzers.
 *
 * analyze() reports every failure through the returned SignalResult
 * (status = ERROR) and is safe to call from several threads at once.
 */
class SignalAnalyzer
{
public:
    virtual ~SignalAnalyzer() = default;

    virtual SignalName signal() const = 0;

    /**
     * @brief Analyze the prepared raster image at image_path
     * @param image_path Path to a decodable raster image
     * @return SignalResult for this signal
     */
    virtual SignalResult analyze(const std::string &image_path) = 0;
};
