#pragma once

#include "LayoutDescriptor.hpp"
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace tofu {

/// A generated formation together with the descriptor and screen it came from.
struct LayoutUpdate {
    LayoutDescriptor descriptor;
    std::vector<TargetPoint> targets;
    ScreenSize screen;
};

/**
 * @brief Single-slot handoff from background producers to the render thread
 *
 * Latest wins: posting while an earlier update is still unconsumed replaces it
 * and counts it as dropped. The consumer always receives a whole target array.
 */
class LayoutMailbox {
public:
    /**
     * @brief Publish an update, replacing any unconsumed one
     *
     * @return false if the mailbox has been closed and the update was discarded
     */
    bool post(LayoutUpdate update);

    /// Take the pending update, leaving the slot empty.
    [[nodiscard]] std::optional<LayoutUpdate> take();

    /// Refuse further posts; producers use this to notice shutdown.
    void close();

    [[nodiscard]] bool closed() const;
    [[nodiscard]] uint64_t dropped_count() const;

private:
    mutable std::mutex m_mutex;
    std::optional<LayoutUpdate> m_slot;
    uint64_t m_dropped = 0;
    bool m_closed = false;
};

} // namespace tofu
