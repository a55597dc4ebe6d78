#include <texsyn/core/errors.hpp>
#include <texsyn/core/texture.hpp>
#include <texsyn/core/utility.hpp>
#include <algorithm>
#include <vector>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace txs {
  namespace detail {
    void save_stb(const fs::path &path, std::span<const uchar> data, uint w, uint h, uint c) {
      txs_trace();

      // Get path information
      const auto ext  = path.extension();
      const auto pstr = path.string();

      int ret = 0;
      if (ext == ".png") {
        ret = stbi_write_png(pstr.c_str(), w, h, c, data.data(), w * c);
      } else if (ext == ".jpg") {
        ret = stbi_write_jpg(pstr.c_str(), w, h, c, data.data(), 95);
      } else if (ext == ".bmp") {
        ret = stbi_write_bmp(pstr.c_str(), w, h, c, data.data());
      } else {
        debug::check_expr(false,
          fmt::format("unsupported image extension for writing \"{}\"", pstr));
      }

      debug::check_expr(ret != 0,
        fmt::format("could not save image to \"{}\", code was {}", pstr, ret));
    }
  } // namespace detail

  template <typename T>
  void blit(Texture2d<T> &dst, const Texture2d<T> &src, const Rect &dst_rect, const Rect &src_rect) {
    txs_trace();

    check_args((dst_rect.size == src_rect.size).all(),
      fmt::format("blit rect sizes differ, {} vs {}", dst_rect.size, src_rect.size));
    check_args(contains(dst, dst_rect),
      fmt::format("blit destination rect at {} of size {} exceeds texture of size {}",
        dst_rect.coords, dst_rect.size, dst.size()));
    check_args(contains(src, src_rect),
      fmt::format("blit source rect at {} of size {} exceeds texture of size {}",
        src_rect.coords, src_rect.size, src.size()));

    // Copy row by row; rows are contiguous in both textures
    for (uint y = 0; y < src_rect.size.y(); ++y) {
      auto src_row = src.data().subspan((src_rect.coords.y() + y) * src.size().x() + src_rect.coords.x(),
                                        src_rect.size.x());
      auto dst_row = dst.data().subspan((dst_rect.coords.y() + y) * dst.size().x() + dst_rect.coords.x(),
                                        dst_rect.size.x());
      std::copy(range_iter(src_row), dst_row.begin());
    } // for (uint y)
  }

  template <typename T>
  Texture2d<T> crop(const Texture2d<T> &src, const Rect &rect) {
    txs_trace();
    Texture2d<T> dst = {{ .size = rect.size }};
    blit(dst, src, dst.rect(), rect);
    return dst;
  }

  template <typename T>
  void fill(Texture2d<T> &dst, const Rect &rect, const T &value) {
    txs_trace();

    check_args(contains(dst, rect),
      fmt::format("fill rect at {} of size {} exceeds texture of size {}",
        rect.coords, rect.size, dst.size()));

    for (uint y = rect.coords.y(); y < rect.end().y(); ++y) {
      auto row = dst.data().subspan(y * dst.size().x() + rect.coords.x(), rect.size.x());
      std::fill(range_iter(row), value);
    } // for (uint y)
  }

  namespace io {
    Texture2d3b load_texture2d(const fs::path &path) {
      txs_trace();

      // Check that file path exists
      debug::check_expr(fs::exists(path),
        fmt::format("failed to resolve path \"{}\"", path.string()));

      // Load sdr .bmp/.png/.jpg file, forcing three channels
      eig::Array2i v;
      int          c;
      uchar *ptr  = stbi_load(path.string().c_str(), &v.x(), &v.y(), &c, 3);

      // Test if data was loaded
      debug::check_expr(ptr,
        fmt::format("failed to load file \"{}\", {}", path.string(), stbi_failure_reason()));

      // Copy data over, then release stbi data from this point
      std::span<const Colr3b> data = { reinterpret_cast<const Colr3b *>(ptr), static_cast<size_t>(v.prod()) };
      Texture2d3b texture = {{ .size = v.cast<uint>(), .data = data }};
      stbi_image_free(ptr);

      return texture;
    }

    void save_texture2d(const fs::path &path, const Texture2d3b &texture) {
      txs_trace();
      auto size = texture.size();
      detail::save_stb(path, cast_span<const uchar>(texture.data()), size.x(), size.y(), Texture2d3b::dims());
    }
  } // namespace io

  /* Explicit template instantiations */

  #define txs_instantiate_rect_ops(T)                                                        \
    template void blit<T>(Texture2d<T> &, const Texture2d<T> &, const Rect &, const Rect &); \
    template Texture2d<T> crop<T>(const Texture2d<T> &, const Rect &);                       \
    template void fill<T>(Texture2d<T> &, const Rect &, const T &);

  txs_instantiate_rect_ops(uchar);
  txs_instantiate_rect_ops(Colr3b);
} // namespace txs
