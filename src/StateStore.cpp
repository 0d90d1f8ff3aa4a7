#include "StateStore.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <limits>
#include <vector>
#include <fcntl.h>
#include <unistd.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

const char* kTempPrefix = "state_";
const char* kTempSuffix = ".tmp";

[[noreturn]] void schemaError(const std::string& where, const char* expected) {
    throw StateLoadError("invalid state file: " + where + " must be " + expected);
}

std::int64_t readInteger(const json& obj, const char* key, std::int64_t fallback, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    if (!it->is_number_integer()) schemaError(where + "." + key, "an integer");
    if (it->is_number_unsigned() && it->get<std::uint64_t>() > (std::uint64_t)std::numeric_limits<std::int64_t>::max())
        schemaError(where + "." + key, "an integer in range");
    return it->get<std::int64_t>();
}

int readInt(const json& obj, const char* key, int fallback, const std::string& where) {
    std::int64_t v = readInteger(obj, key, fallback, where);
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max())
        schemaError(where + "." + key, "an integer in range");
    return (int)v;
}

bool readBool(const json& obj, const char* key, bool fallback, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    if (!it->is_boolean()) schemaError(where + "." + key, "a boolean");
    return it->get<bool>();
}

double readNumber(const json& obj, const char* key, double fallback, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return fallback;
    if (!it->is_number()) schemaError(where + "." + key, "a number");
    return it->get<double>();
}

bool fitsInt(const json& v) {
    if (v.is_number_unsigned()) return v.get<std::uint64_t>() <= (std::uint64_t)std::numeric_limits<int>::max();
    std::int64_t i = v.get<std::int64_t>();
    return i >= std::numeric_limits<int>::min() && i <= std::numeric_limits<int>::max();
}

PlaylistState playlistFromJson(const json& j, const std::string& where) {
    if (!j.is_object()) schemaError(where, "an object");

    PlaylistState ps;
    ps.current_index = readInt(j, "current_index", 0, where);
    ps.loop_enabled = readBool(j, "loop_enabled", false, where);
    ps.playback_position_ms = readInteger(j, "playback_position_ms", 0, where);

    auto order = j.find("shuffle_order");
    if (order != j.end() && !order->is_null()) {
        if (!order->is_array()) schemaError(where + ".shuffle_order", "an array or null");
        std::vector<int> values;
        values.reserve(order->size());
        for (const auto& v : *order) {
            if (!v.is_number_integer()) schemaError(where + ".shuffle_order", "an array of integers");
            if (!fitsInt(v)) schemaError(where + ".shuffle_order", "an array of integers in range");
            values.push_back(v.get<int>());
        }
        ps.shuffle_order = std::move(values);
    }
    return ps;
}

std::string errnoText(const std::string& what, const fs::path& path) {
    return what + " " + path.string() + ": " + std::strerror(errno);
}

void syncDirectory(const fs::path& dir) {
    int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        spdlog::warn("cannot open {} to sync the rename: {}", dir.string(), std::strerror(errno));
        return;
    }
    if (::fsync(fd) != 0) spdlog::warn("fsync of {} failed: {}", dir.string(), std::strerror(errno));
    ::close(fd);
}

}

void to_json(json& j, const PlaylistState& ps) {
    j = json{
        {"current_index", ps.current_index},
        {"shuffle_order", ps.shuffle_order ? json(*ps.shuffle_order) : json(nullptr)},
        {"loop_enabled", ps.loop_enabled},
        {"playback_position_ms", ps.playback_position_ms},
    };
}

void to_json(json& j, const AppState& state) {
    j = json::object();
    j["recent_folders"] = state.recent_folders;
    j["playlists"] = json::object();
    for (const auto& entry : state.playlists) j["playlists"][entry.first] = entry.second;
    j["volume"] = state.volume;
    j["zoom_level"] = state.zoom_level;
}

AppState appStateFromJson(const json& j) {
    if (!j.is_object()) schemaError("document", "an object");

    AppState state;

    auto folders = j.find("recent_folders");
    if (folders != j.end() && !folders->is_null()) {
        if (!folders->is_array()) schemaError("recent_folders", "an array");
        for (const auto& f : *folders) {
            if (!f.is_string()) schemaError("recent_folders", "an array of strings");
            state.recent_folders.push_back(f.get<std::string>());
        }
    }

    auto playlists = j.find("playlists");
    if (playlists != j.end() && !playlists->is_null()) {
        if (!playlists->is_object()) schemaError("playlists", "an object");
        for (auto it = playlists->begin(); it != playlists->end(); ++it) {
            state.playlists[it.key()] = playlistFromJson(it.value(), "playlists[\"" + it.key() + "\"]");
        }
    }

    state.volume = readInt(j, "volume", kDefaultVolume, "document");
    state.zoom_level = readNumber(j, "zoom_level", 1.0, "document");
    return state;
}

StateStore::StateStore(fs::path stateFile) : stateFile(std::move(stateFile)) {}

AppState StateStore::load() const {
    std::error_code ec;
    if (!fs::exists(stateFile, ec)) {
        if (ec) throw StateLoadError("cannot stat " + stateFile.string() + ": " + ec.message());
        spdlog::info("no state file at {}, starting fresh", stateFile.string());
        return AppState{};
    }

    std::ifstream in(stateFile);
    if (!in.is_open()) throw StateLoadError(errnoText("cannot open", stateFile));

    json j;
    try {
        j = json::parse(in);
    } catch (const json::parse_error& e) {
        throw StateLoadError("cannot parse " + stateFile.string() + ": " + e.what());
    }

    AppState state = appStateFromJson(j);
    if (state.sanitize()) spdlog::info("state file {} contained out-of-range values, repaired", stateFile.string());
    spdlog::info("loaded state from {} ({} folders)", stateFile.string(), state.playlists.size());
    return state;
}

fs::path StateStore::writeTemporary(const AppState& state) const {
    fs::path dir = stateFile.parent_path();
    if (dir.empty()) dir = ".";

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw StateSaveError("cannot create " + dir.string() + ": " + ec.message());

    std::string data;
    try {
        data = json(state).dump(2) + "\n";
    } catch (const json::type_error& e) {
        // 文件夹路径不是合法 UTF-8
        throw StateSaveError(std::string("cannot serialize state: ") + e.what());
    }

    std::string name = (dir / (std::string(kTempPrefix) + "XXXXXX" + kTempSuffix)).string();
    std::vector<char> buf(name.begin(), name.end());
    buf.push_back('\0');

    int fd = ::mkstemps(buf.data(), (int)std::strlen(kTempSuffix));
    if (fd < 0) throw StateSaveError(errnoText("cannot create temporary file in", dir));
    fs::path temporary(buf.data());

    auto fail = [&](const std::string& what) {
        std::string message = errnoText(what, temporary);
        ::close(fd);
        ::unlink(temporary.c_str());
        throw StateSaveError(message);
    };

    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            fail("cannot write");
        }
        written += (size_t)n;
    }
    if (::fsync(fd) != 0) fail("cannot fsync");
    if (::close(fd) != 0) {
        std::string message = errnoText("cannot close", temporary);
        ::unlink(temporary.c_str());
        throw StateSaveError(message);
    }
    return temporary;
}

void StateStore::commitTemporary(const fs::path& temporary) const {
    if (::rename(temporary.c_str(), stateFile.c_str()) != 0) {
        std::string message = errnoText("cannot rename temporary file over", stateFile);
        ::unlink(temporary.c_str());
        throw StateSaveError(message);
    }
    fs::path dir = stateFile.parent_path();
    syncDirectory(dir.empty() ? fs::path(".") : dir);
}

void StateStore::save(const AppState& state) const {
    commitTemporary(writeTemporary(state));
}

int StateStore::removeStaleTemporaries() const {
    fs::path dir = stateFile.parent_path();
    if (dir.empty()) dir = ".";

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return 0;

    int removed = 0;
    const std::string prefix = kTempPrefix, suffix = kTempSuffix;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) break;
        std::string name = it->path().filename().string();
        if (name.size() < prefix.size() + suffix.size()) continue;
        if (name.compare(0, prefix.size(), prefix) != 0) continue;
        if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) continue;

        std::error_code rmEc;
        if (fs::remove(it->path(), rmEc)) {
            ++removed;
            spdlog::info("removed stale temporary {}", it->path().string());
        } else if (rmEc) {
            spdlog::warn("cannot remove stale temporary {}: {}", it->path().string(), rmEc.message());
        }
    }
    return removed;
}
