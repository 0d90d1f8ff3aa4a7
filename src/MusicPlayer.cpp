#include "MusicPlayer.hpp"
#include <algorithm>
#include <taglib/fileref.h>
#include <taglib/tag.h>
#include <taglib/audioproperties.h>
#include <spdlog/spdlog.h>

MusicPlayer::MusicPlayer() {
    if (SDL_Init(SDL_INIT_AUDIO) < 0) {
        spdlog::error("SDL_Init failed: {}", SDL_GetError());
        return;
    }
    int formats = Mix_Init(MIX_INIT_MP3 | MIX_INIT_FLAC | MIX_INIT_OGG | MIX_INIT_OPUS);
    spdlog::debug("SDL_mixer decoders available: {:#x}", formats);
    if (Mix_OpenAudio(44100, MIX_DEFAULT_FORMAT, 2, 2048) < 0) {
        spdlog::error("Mix_OpenAudio failed: {}", Mix_GetError());
        return;
    }
    ready = true;
}

MusicPlayer::~MusicPlayer() {
    stop();
    if (ready) Mix_CloseAudio();
    Mix_Quit();
    SDL_Quit();
}

bool MusicPlayer::play(const std::string& path, std::int64_t startMs) {
    stop(); // 加载新歌前先停止并释放旧资源
    if (!ready) return false;

    music = Mix_LoadMUS(path.c_str());
    if (!music) {
        spdlog::warn("Mix_LoadMUS({}) failed: {}", path, Mix_GetError());
        return false;
    }
    readTags(path);

    if (Mix_PlayMusic(music, 1) < 0) {
        spdlog::warn("Mix_PlayMusic({}) failed: {}", path, Mix_GetError());
        Mix_FreeMusic(music);
        music = nullptr;
        return false;
    }
    started = true;
    offsetMs = 0;
    startTicks = SDL_GetTicks();
    pauseTotalTicks = 0;
    if (startMs > 0) seek(startMs);
    return true;
}

void MusicPlayer::pause() {
    if (music && !Mix_PausedMusic()) {
        Mix_PauseMusic();
        pauseStartTicks = SDL_GetTicks();
    }
}

void MusicPlayer::resume() {
    if (music && Mix_PausedMusic()) {
        Mix_ResumeMusic();
        pauseTotalTicks += (SDL_GetTicks() - pauseStartTicks);
    }
}

void MusicPlayer::stop() {
    started = false;
    if (music) {
        Mix_HaltMusic();
        Mix_FreeMusic(music);
        music = nullptr;
    }
    currentSong = SongInfo(); // 重置当前歌曲信息
    offsetMs = 0;
}

void MusicPlayer::seek(std::int64_t ms) {
    if (!music) return;
    ms = std::max<std::int64_t>(0, ms);
    if (currentSong.durationMs > 0) ms = std::min(ms, currentSong.durationMs);

    // 部分解码器的 position 是相对当前位置，先倒回开头
    Mix_RewindMusic();
    if (Mix_SetMusicPosition(ms / 1000.0) < 0) {
        spdlog::warn("seek to {} ms failed: {}", ms, Mix_GetError());
        return;
    }
    Uint32 now = SDL_GetTicks();
    offsetMs = ms;
    startTicks = now;
    pauseTotalTicks = 0;
    if (Mix_PausedMusic()) pauseStartTicks = now;
}

void MusicPlayer::setVolume(int volume) {
    Mix_VolumeMusic(std::clamp(volume, 0, 100) * MIX_MAX_VOLUME / 100);
}

std::int64_t MusicPlayer::positionMs() const {
    if (!music) return 0;
    Uint32 current = isPaused() ? pauseStartTicks : SDL_GetTicks();
    return offsetMs + (std::int64_t)(current - startTicks - pauseTotalTicks);
}

bool MusicPlayer::isPaused() const { return music && Mix_PausedMusic(); }

bool MusicPlayer::consumeTrackFinished() {
    // Mix_PlayingMusic 在暂停时也会返回真，所以只有真正播完才为 0
    if (!started || !music || Mix_PlayingMusic() != 0) return false;
    started = false;
    Mix_FreeMusic(music);
    music = nullptr;
    return true;
}

void MusicPlayer::readTags(const std::string& path) {
    currentSong = SongInfo();
    TagLib::FileRef f(path.c_str());
    if (f.isNull()) return;
    if (f.tag()) {
        currentSong.title = f.tag()->title().to8Bit(true);
        currentSong.artist = f.tag()->artist().to8Bit(true);
    }
    if (f.audioProperties()) {
        currentSong.durationMs = f.audioProperties()->lengthInMilliseconds();
    }
}
