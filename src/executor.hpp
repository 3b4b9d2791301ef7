#pragma once

// Process-wide work-stealing executor via Taskflow.
//
// Sized to std::thread::hardware_concurrency(). Batch decoding submits
// one task per note through this executor.
//
// Internal header, not installed.

#include <taskflow/taskflow.hpp>

namespace notetext_cpp::detail {

// Created on first use, destroyed at exit.
inline auto global_executor() -> tf::Executor& {
    static auto executor = tf::Executor{};
    return executor;
}

}  // namespace notetext_cpp::detail
