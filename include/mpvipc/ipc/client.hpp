#pragma once

/// @file client.hpp
/// @brief Typed mpv command API on top of an ll_client
///
/// Each operation translates to one command. Transport errors propagate
/// unchanged; a reply with a peer error string becomes
/// ipc_error::command_failed with the peer text in detail().

#include "ipc_client.hpp"

#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mpvipc::ipc {

// ============================================================================
// Command options
// ============================================================================

/// loadfile modes
enum class load_file_mode {
    replace,     ///< Replace the currently playing file
    append,      ///< Append to the playlist
    append_play  ///< Append, and start playing if idle
};

/// loadlist modes
enum class load_list_mode {
    replace,
    append
};

/// seek modes
enum class seek_mode {
    relative,
    absolute
};

/// sub-add flags
enum class sub_flag {
    select,       ///< Select the subtitle immediately
    auto_select,  ///< Let the default stream selection decide ("auto")
    cached,       ///< Reuse an already loaded file of the same name
    title,        ///< Next argument sets the track title
    lang          ///< Next argument sets the track language
};

inline const char* to_string(load_file_mode mode) noexcept {
    switch (mode) {
        case load_file_mode::replace: return "replace";
        case load_file_mode::append: return "append";
        case load_file_mode::append_play: return "append-play";
        default: return "replace";
    }
}

inline const char* to_string(load_list_mode mode) noexcept {
    return mode == load_list_mode::append ? "append" : "replace";
}

inline const char* to_string(seek_mode mode) noexcept {
    return mode == seek_mode::absolute ? "absolute" : "relative";
}

inline const char* to_string(sub_flag flag) noexcept {
    switch (flag) {
        case sub_flag::select: return "select";
        case sub_flag::auto_select: return "auto";
        case sub_flag::cached: return "cached";
        case sub_flag::title: return "title";
        case sub_flag::lang: return "lang";
        default: return "select";
    }
}

// ============================================================================
// Track list
// ============================================================================

struct video_track {
    int demux_w = 0;
    int demux_h = 0;
    double demux_fps = 0.0;
};

struct audio_track {
    int channels = 0;
    int channel_count = 0;
    std::string demux_channels;
    int sample_rate = 0;
};

/// One entry of the "track-list" property
struct track {
    int id = 0;                ///< Unique within type
    std::string type;          ///< "audio", "video" or "sub"
    int src_id = 0;
    std::string title;
    std::string lang;
    bool albumart = false;
    bool is_default = false;
    bool forced = false;
    bool external = false;
    bool selected = false;
    int ff_index = 0;
    std::string decoder_desc;
    std::string codec;
    std::string filename;      ///< "external-filename"
    audio_track audio;
    video_track video;
};

namespace detail {

template<typename T>
T member_or(const json& j, const char* key, T fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    return it->get<T>();
}

} // namespace detail

/// nlohmann::json conversion; absent keys keep their defaults
inline void from_json(const json& j, track& t) {
    t.id = detail::member_or(j, "id", 0);
    t.type = detail::member_or<std::string>(j, "type", "");
    t.src_id = detail::member_or(j, "src-id", 0);
    t.title = detail::member_or<std::string>(j, "title", "");
    t.lang = detail::member_or<std::string>(j, "lang", "");
    t.albumart = detail::member_or(j, "albumart", false);
    t.is_default = detail::member_or(j, "default", false);
    t.forced = detail::member_or(j, "forced", false);
    t.external = detail::member_or(j, "external", false);
    t.selected = detail::member_or(j, "selected", false);
    t.ff_index = detail::member_or(j, "ff-index", 0);
    t.decoder_desc = detail::member_or<std::string>(j, "decoder-desc", "");
    t.codec = detail::member_or<std::string>(j, "codec", "");
    t.filename = detail::member_or<std::string>(j, "external-filename", "");

    t.audio.channels = detail::member_or(j, "audio-channels", 0);
    t.audio.channel_count = detail::member_or(j, "demux-channel-count", 0);
    t.audio.demux_channels = detail::member_or<std::string>(j, "demux-channels", "");
    t.audio.sample_rate = detail::member_or(j, "demux-samplerate", 0);

    t.video.demux_w = detail::member_or(j, "demux-w", 0);
    t.video.demux_h = detail::member_or(j, "demux-h", 0);
    t.video.demux_fps = detail::member_or(j, "demux-fps", 0.0);
}

// ============================================================================
// Client
// ============================================================================

/// High-level mpv client. Works with any ll_client implementation.
class client {
public:
    explicit client(std::shared_ptr<ll_client> ll) : ll_(std::move(ll)) {}

    /// Underlying low-level client
    ll_client& lowlevel() noexcept { return *ll_; }

    /// Close the underlying client
    ipc_error close() { return ll_->close(); }

    /// Raw pass-through; the reply may carry a peer error
    template<typename... Args>
    ipc_result<reply> exec(Args&&... args) {
        return ll_->execute(make_command(std::forward<Args>(args)...));
    }

    /// Load a file, replacing or appending to the playlist
    ipc_result<void> loadfile(std::string_view path, load_file_mode mode = load_file_mode::replace) {
        return run(make_command("loadfile", path, to_string(mode)));
    }

    /// Load a playlist file
    ipc_result<void> loadlist(std::string_view path, load_list_mode mode = load_list_mode::replace) {
        return run(make_command("loadlist", path, to_string(mode)));
    }

    /// Play the next playlist entry; no-op at the end of the playlist
    ipc_result<void> playlist_next() {
        return run(make_command("playlist-next", "weak"));
    }

    /// Play the previous playlist entry; no-op at the start
    ipc_result<void> playlist_prev() {
        return run(make_command("playlist-prev", "weak"));
    }

    /// Read a property as raw JSON
    ipc_result<json> get_property(std::string_view name) {
        return request(make_command("get_property", name));
    }

    /// Read a property as text: strings verbatim, other values as JSON
    ipc_result<std::string> get_property_string(std::string_view name) {
        auto data = get_property(name);
        if (!data) {
            return ipc_result<std::string>(data.error(), data.detail());
        }
        if (data->is_string()) {
            return ipc_result<std::string>(data->get<std::string>());
        }
        return ipc_result<std::string>(data->dump());
    }

    /// Read a numeric property
    ipc_result<double> get_float_property(std::string_view name) {
        auto data = get_property(name);
        if (!data) {
            return ipc_result<double>(data.error(), data.detail());
        }
        if (!data->is_number()) {
            return ipc_result<double>(ipc_error::invalid_type, data->dump());
        }
        return ipc_result<double>(data->get<double>());
    }

    /// Read a boolean property
    ipc_result<bool> get_bool_property(std::string_view name) {
        auto data = get_property(name);
        if (!data) {
            return ipc_result<bool>(data.error(), data.detail());
        }
        if (!data->is_boolean()) {
            return ipc_result<bool>(ipc_error::invalid_type, data->dump());
        }
        return ipc_result<bool>(data->get<bool>());
    }

    /// Set a property to a scalar value
    template<typename T>
    ipc_result<void> set_property(std::string_view name, T&& value) {
        return run(make_command("set_property", name, std::forward<T>(value)));
    }

    /// Cycle a property, e.g. "pause"
    ipc_result<void> cycle(std::string_view property) {
        return run(make_command("cycle", property));
    }

    /// Seek by or to @p seconds
    ipc_result<void> seek(int seconds, seek_mode mode = seek_mode::relative) {
        return run(make_command("seek", std::to_string(seconds), to_string(mode)));
    }

    /// Stop playback and clear the playlist
    ipc_result<void> stop() {
        return run(make_command("stop"));
    }

    /// Exit the player with @p code
    ipc_result<void> quit(int code = 0) {
        return run(make_command("quit", code));
    }

    ipc_result<std::string> filename() { return get_property_string("filename"); }
    ipc_result<std::string> path() { return get_property_string("path"); }

    ipc_result<bool> pause() { return get_bool_property("pause"); }
    ipc_result<void> set_pause(bool pause) { return set_property("pause", pause); }

    ipc_result<bool> idle() { return get_bool_property("idle"); }
    ipc_result<double> playback_time() { return get_float_property("playback-time"); }

    ipc_result<bool> mute() { return get_bool_property("mute"); }
    ipc_result<void> set_mute(bool mute) { return set_property("mute", mute); }

    ipc_result<bool> fullscreen() { return get_bool_property("fullscreen"); }
    ipc_result<void> set_fullscreen(bool on) { return set_property("fullscreen", on); }

    ipc_result<double> volume() { return get_float_property("volume"); }
    ipc_result<void> set_volume(int volume) { return set_property("volume", volume); }

    /// Change the volume by @p delta (1 louder, -1 quieter)
    ipc_result<void> set_volume_gain(int delta) {
        auto current = volume();
        if (!current) {
            return ipc_result<void>(current.error(), current.detail());
        }
        return set_property("volume", *current + delta);
    }

    ipc_result<double> speed() { return get_float_property("speed"); }
    ipc_result<double> duration() { return get_float_property("duration"); }

    /// Playback position in seconds
    ipc_result<double> position() { return get_float_property("time-pos"); }

    /// Playback position in percent
    ipc_result<double> percent_position() { return get_float_property("percent-pos"); }

    /// Audio, video and subtitle tracks of the current file
    ipc_result<std::vector<track>> track_list() {
        auto data = get_property("track-list");
        if (!data) {
            return ipc_result<std::vector<track>>(data.error(), data.detail());
        }
        try {
            return ipc_result<std::vector<track>>(data->get<std::vector<track>>());
        } catch (const json::exception& e) {
            MPVIPC_LOG_WARNING("Unexpected track-list payload: {}", e.what());
            return ipc_result<std::vector<track>>(ipc_error::invalid_type, e.what());
        }
    }

    ipc_result<void> set_audio_track(int id) { return set_property("aid", id); }
    ipc_result<void> set_video_track(int id) { return set_property("vid", id); }
    ipc_result<void> set_text_track(int id) { return set_property("sid", id); }

    /// Load a subtitle file
    ipc_result<void> sub_add(std::string_view file, std::initializer_list<sub_flag> flags = {}) {
        auto cmd = make_command("sub-add", file);
        for (auto flag : flags) {
            cmd.emplace_back(to_string(flag));
        }
        return run(cmd);
    }

    /// Remove a subtitle track (external files only)
    ipc_result<void> sub_remove(int id) {
        return run(make_command("sub-remove", id));
    }

    /// Show or hide the on-screen controller
    ipc_result<void> set_osd(bool visible) {
        return run(make_command(visible ? "osc" : "no-osc"));
    }

private:
    /// Execute and unwrap the reply data
    ipc_result<json> request(const command& cmd) {
        auto result = ll_->execute(cmd);
        if (!result) {
            return ipc_result<json>(result.error(), result.detail());
        }
        if (!result->ok()) {
            return ipc_result<json>(ipc_error::command_failed, result->error);
        }
        return ipc_result<json>(std::move(result->data));
    }

    /// Execute, ignoring the reply data
    ipc_result<void> run(const command& cmd) {
        auto result = request(cmd);
        if (!result) {
            return ipc_result<void>(result.error(), result.detail());
        }
        return ipc_result<void>::success();
    }

    std::shared_ptr<ll_client> ll_;
};

} // namespace mpvipc::ipc
