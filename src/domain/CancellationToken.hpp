/**
 * @file CancellationToken.hpp
 * @brief Cooperative cancellation flag shared between a caller and a processing attempt.
 */

#pragma once

#include <atomic>
#include <memory>
#include <string>

namespace docudigest::domain {

class CancellationToken {
public:
    CancellationToken() : m_state(std::make_shared<State>()) {}

    void cancel(const std::string& reason = "cancelled by caller") {
        if (!m_state->cancelled.exchange(true)) {
            m_state->reason = reason;
            m_state->reasonSet.store(true);
        }
    }

    bool isCancelled() const { return m_state->cancelled.load(); }

    std::string reason() const {
        return m_state->reasonSet.load() ? m_state->reason : std::string("cancelled");
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::atomic<bool> reasonSet{false};
        std::string reason;
    };

    std::shared_ptr<State> m_state; // Copies observe the same flag.
};

} // namespace docudigest::domain
