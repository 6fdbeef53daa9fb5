#pragma once
#include <memory>
#include <string>
#include <spdlog/logger.h>

// Decides whether two existing files hold the same bytes by comparing whole
// file digests. Any read failure counts as "different" so that the caller
// rewrites the replica copy instead of trusting a possibly stale one.
class FileComparator {
public:
    explicit FileComparator(std::shared_ptr<spdlog::logger> logger);

    bool filesAreEqual(const std::string& firstPath, const std::string& secondPath) const;

private:
    std::shared_ptr<spdlog::logger> logger_;
};
