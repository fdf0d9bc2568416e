#pragma once

#include <atomic>
#include <functional>
#include <string>

namespace cce {

// Progress snapshot handed to the caller (0..100 plus status text)
struct JobProgress {
    int percent;
    std::string status;
};

// Return false to request cancellation
using ProgressCallback = std::function<bool(const JobProgress&)>;

// Cross-thread cancellation flag, checked by the driver between frames
class CancellationToken {
public:
    void cancel() { m_cancelled.store(true, std::memory_order_relaxed); }
    bool is_cancelled() const { return m_cancelled.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> m_cancelled{false};
};

// Forwards progress to a callback, clamped to 0..100 and never decreasing.
// Remembers a cancellation request made through the callback's return value.
class ProgressReporter {
public:
    ProgressReporter(ProgressCallback callback, const CancellationToken* token);

    // Returns false once cancellation has been requested
    bool report(int percent, const std::string& status);

    bool cancel_requested() const;
    int last_percent() const { return m_last_percent; }

private:
    ProgressCallback m_callback;
    const CancellationToken* m_token;
    int m_last_percent = 0;
    bool m_callback_cancelled = false;
};

} // namespace cce
