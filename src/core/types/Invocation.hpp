/**
 * @file Invocation.hpp
 * @brief Ephemeral record of one requested module execution.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace hostkeeper::core {

/**
 * @brief Correlation id returned to callers. Valid ids start from 1.
 */
using InvocationId = uint64_t;

/**
 * @brief Lifecycle of an invocation inside the dispatcher.
 */
enum class InvocationState : int {
    Pending = 0,              ///< Queued, waiting for a concurrency slot
    AwaitingConfirmation = 1, ///< Held until the caller confirms
    Executing = 2,            ///< Holds a slot and is talking to the host
    Completed = 3,
    Failed = 4,
    Cancelled = 5
};

enum class ModuleKind : int { Monitor = 0, Command = 1 };

struct Invocation {
    InvocationId id{0};
    std::string hostId;
    std::string moduleId;
    ModuleKind kind{ModuleKind::Monitor};
    std::vector<std::string> params;
    std::chrono::system_clock::time_point issuedAt{std::chrono::system_clock::now()};
    InvocationState state{InvocationState::Pending};
    int attempt{0};
    bool partOfInitialization{false};
};

} // namespace hostkeeper::core
