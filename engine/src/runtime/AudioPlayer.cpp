#include "mmdv/runtime/AudioPlayer.hpp"
#include "mmdv/core/logger.hpp"

#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>

#include <algorithm>
#include <format>

namespace mmdv::runtime {

    MiniaudioPlayer::MiniaudioPlayer()
        : m_engine(std::make_unique<ma_engine>())
        , m_sound(std::make_unique<ma_sound>())
    {
    }

    MiniaudioPlayer::~MiniaudioPlayer()
    {
        close();
    }

    void MiniaudioPlayer::setSource(const std::filesystem::path& path)
    {
        close();
        m_source = path;
        m_pendingSeek = 0.0;
    }

    core::Result<void> MiniaudioPlayer::open()
    {
        if (m_open) {
            return {};
        }
        if (m_source.empty()) {
            return core::Unexpected(std::string("audio player has no source"));
        }
        if (ma_engine_init(nullptr, m_engine.get()) != MA_SUCCESS) {
            return core::Unexpected(std::string("failed to initialize the audio device"));
        }
        if (ma_sound_init_from_file(m_engine.get(), m_source.string().c_str(), MA_SOUND_FLAG_STREAM,
                                    nullptr, nullptr, m_sound.get()) != MA_SUCCESS) {
            ma_engine_uninit(m_engine.get());
            return core::Unexpected(std::format("{}: failed to open audio stream", m_source.string()));
        }
        m_open = true;

        ma_sound_set_volume(m_sound.get(), m_volume);
        setPlaybackRate(m_rate);
        if (m_pendingSeek > 0.0) {
            setCurrentTime(m_pendingSeek);
        }
        core::Logger::info("Audio opened: {} ({:.1f}s)", m_source.filename().string(), duration());
        return {};
    }

    void MiniaudioPlayer::close()
    {
        if (!m_open) {
            return;
        }
        ma_sound_uninit(m_sound.get());
        ma_engine_uninit(m_engine.get());
        m_open = false;
    }

    core::Result<void> MiniaudioPlayer::play()
    {
        if (auto r = open(); !r) {
            return r;
        }
        if (ma_sound_is_playing(m_sound.get())) {
            return {};
        }
        if (ma_sound_start(m_sound.get()) != MA_SUCCESS) {
            return core::Unexpected(std::format("{}: failed to start playback", m_source.string()));
        }
        onPlay.notify();
        return {};
    }

    void MiniaudioPlayer::pause()
    {
        if (!m_open || !ma_sound_is_playing(m_sound.get())) {
            return;
        }
        ma_sound_stop(m_sound.get());
        onPause.notify();
    }

    bool MiniaudioPlayer::isPlaying() const
    {
        return m_open && ma_sound_is_playing(m_sound.get());
    }

    double MiniaudioPlayer::currentTime() const
    {
        if (!m_open) {
            return m_pendingSeek;
        }
        float seconds = 0.0f;
        if (ma_sound_get_cursor_in_seconds(m_sound.get(), &seconds) != MA_SUCCESS) {
            return 0.0;
        }
        return static_cast<double>(seconds);
    }

    void MiniaudioPlayer::setCurrentTime(double seconds)
    {
        if (!m_open) {
            m_pendingSeek = seconds;
            return;
        }
        ma_uint32 sampleRate = 0;
        if (ma_sound_get_data_format(m_sound.get(), nullptr, nullptr, &sampleRate, nullptr, 0) != MA_SUCCESS
            || sampleRate == 0) {
            core::Logger::warn("Audio seek ignored: unknown sample rate");
            return;
        }
        const auto frame = static_cast<ma_uint64>(std::max(seconds, 0.0) * sampleRate);
        if (ma_sound_seek_to_pcm_frame(m_sound.get(), frame) != MA_SUCCESS) {
            core::Logger::warn("Audio seek to {:.2f}s failed", seconds);
        }
    }

    double MiniaudioPlayer::duration() const
    {
        if (!m_open) {
            return 0.0;
        }
        float seconds = 0.0f;
        if (ma_sound_get_length_in_seconds(m_sound.get(), &seconds) != MA_SUCCESS) {
            return 0.0;
        }
        return static_cast<double>(seconds);
    }

    void MiniaudioPlayer::setPlaybackRate(float rate)
    {
        m_rate = rate;
        if (!m_open) {
            return;
        }
        if (m_preservesPitch && rate != 1.0f) {
            core::Logger::warn("Pitch-preserving rate change is not supported; playing at 1.0x");
            ma_sound_set_pitch(m_sound.get(), 1.0f);
            return;
        }
        // Resampling changes speed and pitch together
        ma_sound_set_pitch(m_sound.get(), rate);
    }

    void MiniaudioPlayer::setPreservesPitch(bool preserve)
    {
        m_preservesPitch = preserve;
        setPlaybackRate(m_rate);
    }

    void MiniaudioPlayer::setVolume(float volume)
    {
        m_volume = volume;
        if (m_open) {
            ma_sound_set_volume(m_sound.get(), volume);
        }
    }

}
