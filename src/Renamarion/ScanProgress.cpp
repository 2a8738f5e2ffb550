// =================================================================
// src/Renamarion/ScanProgress.cpp
// =================================================================
// Implementation for the scanning indicator.

#include "Renamarion/ScanProgress.hpp"

namespace Renamarion {

namespace {
const std::string PREFIX = "Scanning : ";
}

ScanProgress::ScanProgress(std::ostream& out, bool enabled,
                           std::chrono::milliseconds update_interval)
    : m_out(out),
      m_enabled(enabled),
      m_update_interval(update_interval),
      m_last_update(std::chrono::steady_clock::now() - update_interval),
      m_ticks(0),
      m_stage(0),
      m_growing(true),
      m_drawn(false) {}

void ScanProgress::tick() {
    m_ticks++;
    if (!m_enabled) {
        return;
    }

    auto now = std::chrono::steady_clock::now();
    if (now - m_last_update < m_update_interval) {
        return;
    }
    m_last_update = now;

    advance();
    draw();
}

void ScanProgress::finish() {
    if (!m_enabled || !m_drawn) {
        return;
    }
    m_out << "\r" << std::string(PREFIX.size() + MAX_STAGE + 1, ' ') << "\r" << std::flush;
    m_drawn = false;
}

void ScanProgress::advance() {
    if (m_growing) {
        if (m_stage == MAX_STAGE) {
            m_growing = false;
            m_stage--;
        } else {
            m_stage++;
        }
    } else {
        if (m_stage == 0) {
            m_growing = true;
            m_stage++;
        } else {
            m_stage--;
        }
    }
}

void ScanProgress::draw() {
    m_out << PREFIX << std::string(m_stage, '.') << std::string(MAX_STAGE - m_stage, ' ')
          << "\r" << std::flush;
    m_drawn = true;
}

} // namespace Renamarion
