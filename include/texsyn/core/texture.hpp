#pragma once

#include <texsyn/core/io.hpp>
#include <texsyn/core/geometry.hpp>
#include <texsyn/core/distribution.hpp>
#include <algorithm>
#include <span>
#include <vector>

namespace txs {
  namespace detail {
    template <typename T>
    consteval uint texture_dims();

    template <> consteval uint texture_dims<uchar>()  { return 1; }
    template <> consteval uint texture_dims<Colr3b>() { return 3; }
  } // namespace detail

  namespace io {
    // Load 2d 8-bit rgb texture from disk; .png/.jpg/.bmp/.tga and
    // other stb-supported formats, alpha is discarded
    Texture2d3b load_texture2d(const fs::path &path);

    // Write 2d 8-bit rgb texture to disk; format follows the
    // extension and must be one of .png/.jpg/.bmp
    void save_texture2d(const fs::path &path, const Texture2d3b &texture);
  } // namespace io

  /**
   * Helper object to create texture object for a given size or with provided data.
   */
  template <typename T, uint D>
  struct TextureCreateInfo {
    eig::Array<uint, D, 1> size;
    std::span<const T>     data = { };
  };

  /**
   * Underlying data block for texture objects
   */
  template <typename T, uint D>
  struct TextureBlock {
  protected:
    using vect       = eig::Array<uint, D, 1>;
    using CreateInfo = TextureCreateInfo<T, D>;

    /* block data */

    std::vector<T> m_data;
    vect           m_size = vect::Zero();

    /* constrs */

    TextureBlock() = default;
    TextureBlock(CreateInfo info)
    : m_data(info.size.prod()), m_size(info.size) {
      txs_trace();
      txs_trace_alloc(m_data.data(), m_data.size() * sizeof(T));
      if (!info.data.empty()) {
        debug::check_expr(info.data.size() == m_data.size(),
          "provided texture data does not match texture size");
        std::copy(range_iter(info.data), m_data.begin());
      }
    }

    ~TextureBlock() {
      txs_trace_free(m_data.data());
    }

  public:
    /* data accessors */

    inline
    std::span<const T> data() const { return m_data; }
    inline
    std::span<T> data()             { return m_data; }

    /* size accessors */

    const vect size() const { return m_size; }
    static constexpr uint dims() { return detail::texture_dims<T>(); }

    /* miscellaneous */

    inline void swap(TextureBlock &o) {
      txs_trace();
      using std::swap;
      swap(m_data, o.m_data);
      swap(m_size, o.m_size);
    }

    inline
    bool operator==(const TextureBlock &o) const {
      return (m_size == o.m_size).all()
          && std::equal(range_iter(m_data),
                        range_iter(o.m_data),
                        [](const auto &a, const auto &b) { return eig::safe_exact_compare(a, b); });
    }

    txs_declare_noncopyable(TextureBlock);
  };

  /**
   * Two-dimensional texture object.
   */
  template <typename T>
  struct Texture2d : public TextureBlock<T, 2> {
    using Base       = TextureBlock<T, 2>;
    using CreateInfo = typename Base::CreateInfo;

  public:
    /* constrs */

    Texture2d()  = default;
    ~Texture2d() = default;

    Texture2d(CreateInfo info)
    : Base(info) { }

    /* data accessors */

    inline
    const T &operator[](const eig::Array2u &v) const {
      return this->m_data[v.y() * this->m_size.x() + v.x()];
    }

    inline
    T &operator[](const eig::Array2u &v) {
      return this->m_data[v.y() * this->m_size.x() + v.x()];
    }

    inline
    const T &operator()(uint i, uint j) const {
      return this->m_data[j * this->m_size.x() + i];
    }

    inline
    T &operator()(uint i, uint j) {
      return this->m_data[j * this->m_size.x() + i];
    }

    // Rectangle spanning the full texture
    Rect rect() const {
      return { .coords = eig::Array2u::Zero(), .size = this->m_size };
    }

    /* miscellaneous */

    inline
    void swap(Texture2d &o) {
      txs_trace();
      Base::swap(o);
    }

    inline
    bool operator==(const Texture2d &o) const {
      return Base::operator==(o);
    }

    // Explicit deep copy, as the texture is otherwise non-copyable
    Texture2d copy() const {
      return Texture2d({ .size = this->m_size, .data = this->data() });
    }

    txs_declare_noncopyable(Texture2d);
  };

  /* Rectangle operations on textures */

  // Test whether a rectangle lies entirely within a texture's bounds
  template <typename T>
  bool contains(const Texture2d<T> &texture, const Rect &rect) {
    return texture.rect().contains(rect);
  }

  // Copy the pixels of src_rect in src into dst_rect in dst;
  // rects must be equal in size, and lie within their respective textures
  template <typename T>
  void blit(Texture2d<T> &dst, const Texture2d<T> &src, const Rect &dst_rect, const Rect &src_rect);

  // Return a new texture holding the pixels of rect in src
  template <typename T>
  Texture2d<T> crop(const Texture2d<T> &src, const Rect &rect);

  // Set every pixel inside rect to value
  template <typename T>
  void fill(Texture2d<T> &dst, const Rect &rect, const T &value);

  // Fill an rgb texture with uniform random noise drawn from the provided sampler
  template <typename E>
  void random_texture(Texture2d3b &texture, UniformSampler<E> &sampler) {
    txs_trace();
    for (auto &v : texture.data())
      v = Colr3b(static_cast<uchar>(sampler.next_uint(255)),
                 static_cast<uchar>(sampler.next_uint(255)),
                 static_cast<uchar>(sampler.next_uint(255)));
  }
} // namespace txs
