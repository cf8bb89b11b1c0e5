#pragma once

#include <atomic>
#include <memory>

namespace RailPlan::Resolution {

// Shared flag handed to long-running stages; copies observe the same state.
class CancellationToken {
public:
    CancellationToken() : m_flag(std::make_shared<std::atomic_bool>(false)) {}

    void cancel() { m_flag->store(true); }
    bool isCancelled() const { return m_flag->load(); }
    void reset() { m_flag->store(false); }

private:
    std::shared_ptr<std::atomic_bool> m_flag;
};

} // namespace RailPlan::Resolution
