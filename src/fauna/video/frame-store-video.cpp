
#include "frame-store-video.hpp"

#include "video-error.hpp"

#include "fauna/utils/file-system.hpp"

#define This FrameStoreVideo

namespace fauna
{
// ----------------------------------------------------------------------- Pimpl
//
struct This::Pimpl
{
   string filename;
   bool index_by_original = true;
   unique_ptr<FrameStore> store;

   FrameStore& get_store() noexcept(false)
   {
      if(!store) store = make_unique<FrameStore>(FrameStore::open(filename));
      return *store;
   }
};

// ---------------------------------------------------------------- Construction
//
This::This(const string_view filename,
           const bool index_by_original) noexcept(false)
    : pimpl_(make_unique<Pimpl>())
{
   const string meta = is_directory(filename)
                           ? path_join(filename, "metadata.yaml")
                           : string(filename);
   pimpl_->filename          = absolute_path(meta);
   pimpl_->index_by_original = index_by_original;

   const auto& store = pimpl_->get_store();
   INFO(format("opened frame-store video {}, [{} x {} x {} x {}] {}",
               pimpl_->filename,
               frames(),
               height(),
               width(),
               channels(),
               store.format()));
}

This::~This() = default;

// --------------------------------------------------------------------- getters
//
const string& This::filename() const noexcept { return pimpl_->filename; }
bool This::index_by_original() const noexcept
{
   return pimpl_->index_by_original;
}

// The store is opened at construction, and `close` only releases decoders
const vector<int>& This::frame_numbers() const noexcept
{
   return pimpl_->store->frame_numbers();
}
int This::frames() const noexcept { return pimpl_->store->frame_count(); }
int This::height() const noexcept { return pimpl_->store->imgshape().height; }
int This::width() const noexcept { return pimpl_->store->imgshape().width; }
int This::channels() const noexcept
{
   return pimpl_->store->imgshape().channels;
}

// ------------------------------------------------------------------- get-frame
//
Frame This::get_frame(const int idx) noexcept(false)
{
   auto& store = pimpl_->get_store();
   const auto im = index_by_original() ? store.get_image(idx)
                                       : store.get_image_by_index(idx);
   return normalise_frame(im, false);
}

// --------------------------------------------------------------------- matches
//
bool This::matches(const VideoBackend& o) const noexcept
{
   const auto ptr = dynamic_cast<const This*>(&o);
   return ptr != nullptr and filename() == ptr->filename()
          and index_by_original() == ptr->index_by_original();
}

// --------------------------------------------------------------------- to-json
//
Json::Value This::to_json() const noexcept(false)
{
   Json::Value o{Json::objectValue};
   o["filename"]          = filename();
   o["index_by_original"] = index_by_original();
   return o;
}

void This::open() noexcept(false) { pimpl_->get_store(); }

void This::close() noexcept
{
   if(pimpl_->store) pimpl_->store->close();
}

} // namespace fauna
