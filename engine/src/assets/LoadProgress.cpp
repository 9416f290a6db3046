#include "mmdv/assets/LoadProgress.hpp"
#include "mmdv/core/logger.hpp"

#include <format>

namespace mmdv::assets {

const char* loadSlotLabel(LoadSlot slot) {
    switch (slot) {
        case LoadSlot::Motion: return "Loading motion";
        case LoadSlot::CameraMotion: return "Loading camera motion";
        case LoadSlot::Model: return "Loading model";
        case LoadSlot::Count: break;
    }
    return "Loading";
}

ProgressBoard::ProgressBoard(size_t slotCount) : m_slots(slotCount) {}

std::string ProgressBoard::formatLine(const std::string& label, uint64_t loaded, uint64_t total) {
    const uint64_t percent = total > 0 ? (loaded * 100) / total : 0;
    return std::format("{}... {}/{} ({}%)", label, loaded, total, percent);
}

void ProgressBoard::update(size_t slot, const std::string& label, uint64_t loaded, uint64_t total) {
    // Held across the listener call so setListener() waits out a running call
    std::lock_guard<std::mutex> callLock(m_callMutex);
    std::string snapshot;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (slot >= m_slots.size()) {
            core::Logger::warn("ProgressBoard: slot {} out of range ({} slots)", slot, m_slots.size());
            return;
        }
        m_slots[slot].line = formatLine(label, loaded, total);
        m_slots[slot].used = true;
        snapshot = textLocked();
    }
    if (m_listener) {
        m_listener(snapshot);
    }
}

std::string ProgressBoard::text() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return textLocked();
}

void ProgressBoard::setListener(Listener listener) {
    std::lock_guard<std::mutex> callLock(m_callMutex);
    m_listener = std::move(listener);
}

std::string ProgressBoard::textLocked() const {
    std::string out;
    for (const auto& slot : m_slots) {
        if (!slot.used) {
            continue;
        }
        if (!out.empty()) {
            out += '\n';
        }
        out += slot.line;
    }
    return out;
}

}
