#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace bdsm::core {

// Outcome of a delegated call, handed to the presentation layer which
// decides whether to print or rethrow.
struct Status {
    bool success = true;
    std::string error_message;

    static Status ok() { return {}; }
    static Status failure(std::string message) { return {false, std::move(message)}; }
};

template <typename Fn>
Status run_guarded(Fn&& fn) {
    try {
        std::forward<Fn>(fn)();
    } catch (const std::runtime_error& e) {
        return Status::failure(e.what());
    }
    return Status::ok();
}

} // namespace bdsm::core
