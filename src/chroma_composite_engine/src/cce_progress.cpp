#include <chroma_composite_engine/cce_progress.h>
#include <algorithm>

namespace cce {

ProgressReporter::ProgressReporter(ProgressCallback callback, const CancellationToken* token)
    : m_callback(std::move(callback)), m_token(token) {
}

bool ProgressReporter::report(int percent, const std::string& status) {
    percent = std::max(m_last_percent, std::min(100, std::max(0, percent)));
    m_last_percent = percent;

    if (m_callback && !m_callback(JobProgress{percent, status})) {
        m_callback_cancelled = true;
    }
    return !cancel_requested();
}

bool ProgressReporter::cancel_requested() const {
    return m_callback_cancelled || (m_token && m_token->is_cancelled());
}

} // namespace cce
