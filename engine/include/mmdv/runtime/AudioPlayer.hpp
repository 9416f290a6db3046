#pragma once

#include <filesystem>
#include <memory>

#include "mmdv/core/Observable.hpp"
#include "mmdv/core/result.hpp"

struct ma_engine;
struct ma_sound;

namespace mmdv::runtime {

    // Audio source the animation clock can follow. Times are in seconds.
    class IAudioPlayer {
    public:
        virtual ~IAudioPlayer() = default;

        virtual core::Result<void> play() = 0;
        virtual void pause() = 0;
        [[nodiscard]] virtual bool isPlaying() const = 0;

        [[nodiscard]] virtual double currentTime() const = 0;
        virtual void setCurrentTime(double seconds) = 0;
        [[nodiscard]] virtual double duration() const = 0;

        virtual void setPlaybackRate(float rate) = 0;
        [[nodiscard]] virtual float playbackRate() const = 0;

        // When false, changing the playback rate also shifts the pitch
        virtual void setPreservesPitch(bool preserve) = 0;
        [[nodiscard]] virtual bool preservesPitch() const = 0;

        virtual void setVolume(float volume) = 0;

        core::Observable<> onPlay;
        core::Observable<> onPause;
    };

    // Streams a file through miniaudio's engine. The file is opened lazily
    // on the first play() so construction never touches the audio device.
    class MiniaudioPlayer final : public IAudioPlayer {
    public:
        MiniaudioPlayer();
        ~MiniaudioPlayer() override;

        MiniaudioPlayer(const MiniaudioPlayer&) = delete;
        MiniaudioPlayer& operator=(const MiniaudioPlayer&) = delete;

        void setSource(const std::filesystem::path& path);
        [[nodiscard]] const std::filesystem::path& source() const { return m_source; }

        core::Result<void> play() override;
        void pause() override;
        [[nodiscard]] bool isPlaying() const override;

        [[nodiscard]] double currentTime() const override;
        void setCurrentTime(double seconds) override;
        [[nodiscard]] double duration() const override;

        void setPlaybackRate(float rate) override;
        [[nodiscard]] float playbackRate() const override { return m_rate; }

        void setPreservesPitch(bool preserve) override;
        [[nodiscard]] bool preservesPitch() const override { return m_preservesPitch; }

        void setVolume(float volume) override;

    private:
        core::Result<void> open();
        void close();

        std::unique_ptr<ma_engine> m_engine;
        std::unique_ptr<ma_sound> m_sound;
        std::filesystem::path m_source;
        double m_pendingSeek = 0.0;
        float m_rate = 1.0f;
        float m_volume = 1.0f;
        bool m_preservesPitch = true;
        bool m_open = false;
    };

}
