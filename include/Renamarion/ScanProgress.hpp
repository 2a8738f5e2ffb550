// =================================================================
// include/Renamarion/ScanProgress.hpp
// =================================================================
// Scanning indicator shown while the directory tree is walked.

#pragma once

#include <chrono>
#include <cstddef>
#include <ostream>
#include <string>

namespace Renamarion {

/**
 * @brief Bouncing-dots indicator, redrawn in place with '\r'
 *
 * Owned by the caller and passed to the scanner. Redraws are throttled
 * to the update interval.
 */
class ScanProgress {
public:
    /**
     * @brief Construct a progress indicator
     * @param out Stream to draw on
     * @param enabled False to make every call a no-op
     * @param update_interval Minimum time between two redraws
     */
    explicit ScanProgress(std::ostream& out, bool enabled = true,
                          std::chrono::milliseconds update_interval = std::chrono::milliseconds(16));

    /**
     * @brief Record one scanned folder and redraw if the interval elapsed
     */
    void tick();

    /**
     * @brief Erase the indicator line
     */
    void finish();

    size_t getTicks() const { return m_ticks; }
    size_t getStage() const { return m_stage; }

private:
    static constexpr size_t MAX_STAGE = 20;

    std::ostream& m_out;
    bool m_enabled;
    std::chrono::milliseconds m_update_interval;
    std::chrono::steady_clock::time_point m_last_update;
    size_t m_ticks;
    size_t m_stage;
    bool m_growing;
    bool m_drawn;

    void advance();
    void draw();
};

} // namespace Renamarion
