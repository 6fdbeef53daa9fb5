#include "file_comparator.hpp"
#include "hash_utils.hpp"
#include <utility>

FileComparator::FileComparator(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

bool FileComparator::filesAreEqual(const std::string& firstPath, const std::string& secondPath) const {
    auto first = HashUtils::computeFileDigest(firstPath);
    if (!first.success) {
        logger_->error("Error comparing files {} and {}: {}", firstPath, secondPath, first.message);
        return false;
    }

    auto second = HashUtils::computeFileDigest(secondPath);
    if (!second.success) {
        logger_->error("Error comparing files {} and {}: {}", firstPath, secondPath, second.message);
        return false;
    }

    return first.data == second.data;
}
