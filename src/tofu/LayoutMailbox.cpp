#include <tofu/LayoutMailbox.hpp>
#include <tofu/Logger.hpp>

namespace tofu {

bool LayoutMailbox::post(LayoutUpdate update) {
    std::scoped_lock lock(m_mutex);
    if (m_closed) {
        return false;
    }
    if (m_slot) {
        ++m_dropped;
        Logger::instance().debug("Dropping stale layout ({} dropped so far)", m_dropped);
    }
    m_slot = std::move(update);
    return true;
}

std::optional<LayoutUpdate> LayoutMailbox::take() {
    std::scoped_lock lock(m_mutex);
    std::optional<LayoutUpdate> update;
    update.swap(m_slot);
    return update;
}

void LayoutMailbox::close() {
    std::scoped_lock lock(m_mutex);
    m_closed = true;
}

bool LayoutMailbox::closed() const {
    std::scoped_lock lock(m_mutex);
    return m_closed;
}

uint64_t LayoutMailbox::dropped_count() const {
    std::scoped_lock lock(m_mutex);
    return m_dropped;
}

} // namespace tofu
