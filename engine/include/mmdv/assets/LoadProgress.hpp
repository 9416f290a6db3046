#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace mmdv::assets {

// Fixed slot per concurrently loaded resource
enum class LoadSlot : uint32_t {
    Motion = 0,
    CameraMotion = 1,
    Model = 2,
    Count
};

const char* loadSlotLabel(LoadSlot slot);

// Aggregates the byte progress of concurrent loads into one multi-line
// status text. Each writer owns one slot, so lines never interleave.
class ProgressBoard {
public:
    using Listener = std::function<void(const std::string&)>;

    explicit ProgressBoard(size_t slotCount = static_cast<size_t>(LoadSlot::Count));

    void update(size_t slot, const std::string& label, uint64_t loaded, uint64_t total);
    void update(LoadSlot slot, uint64_t loaded, uint64_t total) {
        update(static_cast<size_t>(slot), loadSlotLabel(slot), loaded, total);
    }

    [[nodiscard]] std::string text() const;

    // Receives the full text after every update, on the updating thread.
    // Blocks while a listener call is running; once it returns the previous
    // listener is never called again. Must not be called from a listener.
    void setListener(Listener listener);

    // "<label>... <loaded>/<total> (<percent>%)"
    static std::string formatLine(const std::string& label, uint64_t loaded, uint64_t total);

private:
    struct Slot {
        std::string line;
        bool used = false;
    };

    [[nodiscard]] std::string textLocked() const;

    mutable std::mutex m_mutex;
    std::vector<Slot> m_slots;
    // Guards m_listener and serializes listener calls
    std::mutex m_callMutex;
    Listener m_listener;
};

}
