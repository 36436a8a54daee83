#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief A signal raised during computation (decode failure, malformed metadata, OCR fault).
 * Recovered by degrading that one signal.
 */
class AnalyzerFailure : public std::runtime_error
{
public:
    explicit AnalyzerFailure(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief A signal exceeded its deadline. Recovered by degrading that one signal.
 */
class AnalyzerTimeout : public std::runtime_error
{
public:
    explicit AnalyzerTimeout(const std::string &message) : std::runtime_error(message) {}
};

/**
 * @brief A precondition failed before any signal could run (e.g. the image cannot be opened).
 * Recovered at the fusion engine boundary as a PROCESSING_ERROR result.
 */
class PipelineFailure : public std::runtime_error
{
public:
    explicit PipelineFailure(const std::string &message) : std::runtime_error(message) {}
};
