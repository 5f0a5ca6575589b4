
#pragma once

#include "video.hpp"

#include "json/json.h"

namespace fauna
{
// Repairs a stored path before a video is reopened. See `fixup_path`.
using PathHook = std::function<string(const string_view)>;

// {"backend": {"type": "MediaVideo", "filename": ..., ...}}
// Throws std::runtime_error for in-memory numpy data.
Json::Value video_to_json(const Video& video) noexcept(false);

// `hook` is applied to the "filename" and "file" keys of the backend.
// The default hook is `fixup_path`.
Video video_from_json(const Json::Value& o,
                      PathHook hook = {}) noexcept(false);

void save_video(const Video& video, const string_view filename) noexcept(false);
Video load_video(const string_view filename,
                 PathHook hook = {}) noexcept(false);

} // namespace fauna
