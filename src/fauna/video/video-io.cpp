
#include "video-io.hpp"

#include "fixup-path.hpp"
#include "video-error.hpp"

#include "fauna/io/json-io.hpp"
#include "fauna/utils/file-system.hpp"

namespace fauna
{
// --------------------------------------------------------------- video-to-json
//
Json::Value video_to_json(const Video& video) noexcept(false)
{
   Json::Value backend = video.backend().to_json();
   backend["type"]     = str(video.kind());

   Json::Value o{Json::objectValue};
   o["backend"] = backend;
   return o;
}

// ------------------------------------------------------------- video-from-json
//
Video video_from_json(const Json::Value& o, PathHook hook) noexcept(false)
{
   if(!hook) hook = [](const string_view path) { return fixup_path(path); };

   const string op = "reading video"s;
   if(!has_key(o, "backend"))
      throw VideoFormatError("video json is missing key 'backend'");
   Json::Value node = get_key(o, "backend");

   for(const auto key : {"filename", "file"})
      if(has_key(node, key) and node[key].isString())
         node[key] = hook(node[key].asString());

   const auto kind = to_backend_kind(json_load_key<string>(node, "type", op));
   const auto filename = has_key(node, "filename")
                             ? json_load_key<string>(node, "filename", op)
                             : json_load_key<string>(node, "file", op);

   auto bool_or = [&](const char* key, bool def) {
      bool val = def;
      json_try_load_key(val, node, key, op, false);
      return val;
   };

   switch(kind) {
   case BackendKind::HDF5: {
      string input_format = "channels_last"s;
      json_try_load_key(input_format, node, "input_format", op, false);
      return Video::from_hdf5(filename,
                              json_load_key<string>(node, "dataset", op),
                              input_format,
                              bool_or("convert_range", true));
   }

   case BackendKind::MEDIA: {
      std::optional<bool> grayscale;
      bool val = false;
      if(json_try_load_key(val, node, "grayscale", op, false)) grayscale = val;
      return Video::from_media(filename, grayscale, bool_or("bgr", true));
   }

   case BackendKind::NUMPY:
      return Video::from_numpy(filename, bool_or("convert_range", true));

   case BackendKind::FRAME_STORE:
      return Video::from_frame_store(filename,
                                     bool_or("index_by_original", true));
   }

   throw VideoFormatError(format("unhandled backend '{}'", str(kind)));
}

// ------------------------------------------------------------ save/load video
//
void save_video(const Video& video, const string_view filename) noexcept(false)
{
   const auto ec = file_put_contents(filename, str(video_to_json(video)));
   if(ec)
      throw std::runtime_error(
          format("failed to write '{}': {}", filename, ec.message()));
}

Video load_video(const string_view filename, PathHook hook) noexcept(false)
{
   return video_from_json(parse_json(file_get_contents(filename)),
                          std::move(hook));
}

} // namespace fauna
