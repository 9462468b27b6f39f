#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <utility>

#include "gstree/logger.h"

namespace gstree::perf {

class ScopedTimer {
public:
    explicit ScopedTimer(std::string label)
        : label_{std::move(label)}, start_{std::chrono::steady_clock::now()} {}

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    ~ScopedTimer() {
        auto end = std::chrono::steady_clock::now();
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
        Logger::instance().debug("{} took {} us", label_, us);
    }

private:
    std::string label_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace gstree::perf
