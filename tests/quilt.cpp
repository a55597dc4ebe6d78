#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <texsyn/core/errors.hpp>
#include <texsyn/core/texture.hpp>
#include <texsyn/quilt/quilt.hpp>
#include <texsyn/quilt/seam.hpp>
#include <algorithm>
#include <cstdlib>
#include <limits>
#include <set>

using namespace txs;

constexpr static double eps = 1e-9;

namespace {
  // Pack a color into a single integer, for set membership
  uint pack(const Colr3b &c) {
    return (static_cast<uint>(c[0]) << 16) | (static_cast<uint>(c[1]) << 8) | static_cast<uint>(c[2]);
  }

  std::set<uint> color_set(const Texture2d3b &texture) {
    std::set<uint> colors;
    for (const auto &c : texture.data())
      colors.insert(pack(c));
    return colors;
  }

  double path_cost(const ErrorSurface &surface, const SeamPath &path) {
    double cost = 0.0;
    for (uint y = 0; y < path.size(); ++y)
      cost += surface(path[y], y);
    return cost;
  }

  // Exhaustive minimum over all vertical paths starting at (x, y)
  double brute_force_cost(const ErrorSurface &surface, uint overlap, uint x, uint y) {
    double cost = surface(x, y);
    if (y + 1 == surface.cols())
      return cost;

    double next = std::numeric_limits<double>::infinity();
    for (int dx = -1; dx <= 1; ++dx) {
      int nx = static_cast<int>(x) + dx;
      if (nx < 0 || nx >= static_cast<int>(overlap))
        continue;
      next = std::min(next, brute_force_cost(surface, overlap, nx, y + 1));
    }
    return cost + next;
  }

  void require_valid_path(const SeamPath &path, uint length, uint overlap) {
    REQUIRE(path.size() == length);
    for (uint i = 0; i < path.size(); ++i) {
      REQUIRE(path[i] < overlap);
      if (i > 0)
        REQUIRE(std::abs(static_cast<int>(path[i]) - static_cast<int>(path[i - 1])) <= 1);
    }
  }

  Texture2d3b make_random_texture(eig::Array2u size, uint seed) {
    Texture2d3b texture = {{ .size = size }};
    UniformSampler sampler(seed);
    random_texture(texture, sampler);
    return texture;
  }
} // namespace

TEST_CASE("Error surface") {
  // Flat black source with a red marker in its first column, rows 0-4
  const Colr3b red = { 255, 0, 0 };
  Texture2d3b source = {{ .size = { 11, 11 } }};
  Texture2d3b buffer = {{ .size = { 11, 11 } }};
  for (uint y = 0; y <= 4; ++y)
    source(0, y) = red;

  const eig::Array2u origin = eig::Array2u::Zero();

  SECTION("Left overlap") {
    auto surface = patch_error_surface(distance::l1, source, buffer, origin, origin, 5, 1, OverlapArea::eLeft);
    REQUIRE(surface.rows() == 5);
    REQUIRE(surface.cols() == 5);
    for (uint y = 0; y < 5; ++y)
      REQUIRE_THAT(surface(0, y), Catch::Matchers::WithinAbs(255.0, eps));
    REQUIRE_THAT(surface.block(1, 0, 4, 5).sum(), Catch::Matchers::WithinAbs(0.0, eps));
  } // SECTION

  SECTION("Top overlap") {
    auto surface = patch_error_surface(distance::l1, source, buffer, origin, origin, 5, 1, OverlapArea::eTop);
    REQUIRE_THAT(surface(0, 0), Catch::Matchers::WithinAbs(255.0, eps));
    REQUIRE_THAT(surface.sum(), Catch::Matchers::WithinAbs(255.0, eps));
  } // SECTION

  SECTION("Top-left overlap") {
    auto surface = patch_error_surface(distance::l2, source, buffer, origin, origin, 5, 1, OverlapArea::eTopLeft);
    for (uint y = 0; y < 5; ++y)
      REQUIRE_THAT(surface(0, y), Catch::Matchers::WithinAbs(255.0, eps));
    REQUIRE_THAT(surface.sum(), Catch::Matchers::WithinAbs(5 * 255.0, eps));
  } // SECTION

  SECTION("Offset patch") {
    // One row down, the marker covers rows 0-3 of the patch only
    auto surface = patch_error_surface(distance::l1, source, buffer,
      eig::Array2u(0, 1), eig::Array2u(3, 3), 5, 2, OverlapArea::eLeft);
    REQUIRE_THAT(surface.col(4).sum(), Catch::Matchers::WithinAbs(0.0, eps));
    REQUIRE_THAT(surface.sum(), Catch::Matchers::WithinAbs(4 * 255.0, eps));
  } // SECTION

  SECTION("Matches summed overlap error") {
    auto a = make_random_texture({ 16, 16 }, 1);
    auto b = make_random_texture({ 16, 16 }, 2);
    for (auto area : { OverlapArea::eTop, OverlapArea::eLeft, OverlapArea::eTopLeft }) {
      auto surface = patch_error_surface(distance::l1, a, b, eig::Array2u(2, 3), eig::Array2u(5, 1), 8, 3, area);
      double error = patch_overlap_error(distance::l1, a, b, eig::Array2u(2, 3), eig::Array2u(5, 1), 8, 3, area);
      REQUIRE_THAT(surface.sum(), Catch::Matchers::WithinAbs(error, 1e-6));
    }
  } // SECTION
}

TEST_CASE("Overlap rects") {
  auto top      = overlap_rects(OverlapArea::eTop, 8, 3);
  auto left     = overlap_rects(OverlapArea::eLeft, 8, 3);
  auto top_left = overlap_rects(OverlapArea::eTopLeft, 8, 3);

  REQUIRE(top.size() == 1);
  REQUIRE(top[0] == Rect { .coords = { 0, 0 }, .size = { 8, 3 } });
  REQUIRE(left.size() == 1);
  REQUIRE(left[0] == Rect { .coords = { 0, 0 }, .size = { 3, 8 } });

  // The shared corner block belongs to the top band only
  REQUIRE(top_left.size() == 2);
  REQUIRE(top_left[0].area() + top_left[1].area() == 8 * 3 + 3 * 5);
}

TEST_CASE("Minimum cost seams") {
  constexpr uint patch_size = 6;
  constexpr uint overlap    = 3;

  SECTION("Vertical seam follows a zero-cost column") {
    ErrorSurface surface = ErrorSurface::Constant(patch_size, patch_size, 10.0);
    surface.row(1).setZero();
    auto path = min_cost_path_vertical(surface, overlap);
    require_valid_path(path, patch_size, overlap);
    REQUIRE(std::ranges::all_of(path, [](uint x) { return x == 1; }));
  } // SECTION

  SECTION("Horizontal seam follows a zero-cost row") {
    ErrorSurface surface = ErrorSurface::Constant(patch_size, patch_size, 10.0);
    surface.col(2).setZero();
    auto path = min_cost_path_horizontal(surface, overlap);
    require_valid_path(path, patch_size, overlap);
    REQUIRE(std::ranges::all_of(path, [](uint y) { return y == 2; }));
  } // SECTION

  SECTION("Ties resolve to the lowest index") {
    ErrorSurface surface = ErrorSurface::Zero(patch_size, patch_size);
    auto path = min_cost_path_vertical(surface, overlap);
    REQUIRE(std::ranges::all_of(path, [](uint x) { return x == 0; }));
  } // SECTION

  SECTION("Optimality") {
    std::srand(17);
    for (uint i = 0; i < 16; ++i) {
      ErrorSurface surface = ErrorSurface::Random(patch_size, patch_size).abs();

      // Vertical
      auto vpath = min_cost_path_vertical(surface, overlap);
      require_valid_path(vpath, patch_size, overlap);
      double vbest = std::numeric_limits<double>::infinity();
      for (uint x = 0; x < overlap; ++x)
        vbest = std::min(vbest, brute_force_cost(surface, overlap, x, 0));
      REQUIRE_THAT(path_cost(surface, vpath), Catch::Matchers::WithinAbs(vbest, 1e-9));

      // Horizontal, as the transposed vertical case
      auto hpath = min_cost_path_horizontal(surface, overlap);
      require_valid_path(hpath, patch_size, overlap);
      ErrorSurface transposed = surface.transpose();
      double hbest = std::numeric_limits<double>::infinity();
      for (uint y = 0; y < overlap; ++y)
        hbest = std::min(hbest, brute_force_cost(transposed, overlap, y, 0));
      REQUIRE_THAT(path_cost(transposed, hpath), Catch::Matchers::WithinAbs(hbest, 1e-9));
    }
  } // SECTION

  SECTION("Seams per overlap area") {
    ErrorSurface surface = ErrorSurface::Random(patch_size, patch_size).abs();
    auto top      = min_cost_seams(surface, overlap, OverlapArea::eTop);
    auto left     = min_cost_seams(surface, overlap, OverlapArea::eLeft);
    auto top_left = min_cost_seams(surface, overlap, OverlapArea::eTopLeft);
    REQUIRE((top.vertical.empty() && !top.horizontal.empty()));
    REQUIRE((!left.vertical.empty() && left.horizontal.empty()));
    REQUIRE((!top_left.vertical.empty() && !top_left.horizontal.empty()));
    REQUIRE(top_left.vertical == left.vertical);
    REQUIRE(top_left.horizontal == top.horizontal);
  } // SECTION
}

TEST_CASE("Seam cut") {
  constexpr uint patch_size = 6;
  constexpr uint overlap    = 3;

  const Colr3b base = { 0, 0, 0 };
  const Colr3b mark = { 200, 100, 50 };

  Texture2d3b buffer = {{ .size = { 8, 8 } }};
  Texture2d3b source = {{ .size = { 6, 6 } }};
  fill(buffer, buffer.rect(), base);
  fill(source, source.rect(), mark);

  const Patch        patch  = { .coords = eig::Array2u::Zero(), .size = patch_size };
  const eig::Array2u dst_xy = { 1, 2 };

  SECTION("Left") {
    SeamPaths seams = { .vertical = { 0, 1, 2, 2, 1, 1 } };
    blit_seams(buffer, source, patch, dst_xy, seams, OverlapArea::eLeft);
    for (uint y = 0; y < patch_size; ++y) {
      for (uint x = 0; x < patch_size; ++x) {
        bool candidate = x >= seams.vertical[y];
        REQUIRE((buffer(dst_xy.x() + x, dst_xy.y() + y) == (candidate ? mark : base)).all());
      }
    }
    REQUIRE((buffer(0, 0) == base).all());
  } // SECTION

  SECTION("Top") {
    SeamPaths seams = { .horizontal = { 2, 2, 1, 0, 0, 1 } };
    blit_seams(buffer, source, patch, dst_xy, seams, OverlapArea::eTop);
    for (uint y = 0; y < patch_size; ++y) {
      for (uint x = 0; x < patch_size; ++x) {
        bool candidate = y >= seams.horizontal[x];
        REQUIRE((buffer(dst_xy.x() + x, dst_xy.y() + y) == (candidate ? mark : base)).all());
      }
    }
  } // SECTION

  SECTION("Top-left") {
    SeamPaths seams = { .vertical   = { 1, 1, 2, 2, 1, 0 },
                        .horizontal = { 2, 1, 1, 0, 1, 2 } };
    blit_seams(buffer, source, patch, dst_xy, seams, OverlapArea::eTopLeft);
    for (uint y = 0; y < patch_size; ++y) {
      for (uint x = 0; x < patch_size; ++x) {
        bool candidate = x >= seams.vertical[y] && y >= seams.horizontal[x];
        REQUIRE((buffer(dst_xy.x() + x, dst_xy.y() + y) == (candidate ? mark : base)).all());
      }
    }

    // Past both overlap bands, everything is taken from the candidate
    REQUIRE((buffer(dst_xy.x() + overlap, dst_xy.y() + overlap) == mark).all());
  } // SECTION

  SECTION("Out of bounds") {
    SeamPaths seams = { .vertical = { 0, 0, 0, 0, 0, 0 } };
    REQUIRE_THROWS_AS(blit_seams(buffer, source, patch, eig::Array2u(3, 3), seams, OverlapArea::eLeft),
                      InvalidArgumentsException);
  } // SECTION
}

TEST_CASE("Quilter validation") {
  auto source = make_random_texture({ 32, 32 }, 3);

  SECTION("Valid parameters") {
    REQUIRE_NOTHROW(Quilter(source, { .size = { 64, 64 }, .patch_size = 12, .overlap = 6 }));
    REQUIRE_NOTHROW(Quilter(source, { .size = { 64, 64 }, .patch_size = 12, .overlap = 3, .selection_chance = 1.f }));
  } // SECTION

  SECTION("Invalid parameters") {
    REQUIRE_THROWS_AS(Quilter(source, { .size = { 0, 64 } }), InvalidArgumentsException);
    REQUIRE_THROWS_AS(Quilter(source, { .size = { 64, 0 } }), InvalidArgumentsException);
    REQUIRE_THROWS_AS(Quilter(source, { .patch_size = 12, .overlap = 0 }), InvalidArgumentsException);
    REQUIRE_THROWS_AS(Quilter(source, { .patch_size = 11, .overlap = 6 }), InvalidArgumentsException);
    REQUIRE_THROWS_AS(Quilter(source, { .selection_chance = 0.f }), InvalidArgumentsException);
    REQUIRE_THROWS_AS(Quilter(source, { .selection_chance = -0.5f }), InvalidArgumentsException);
    REQUIRE_THROWS_AS(Quilter(source, { .selection_chance = 1.5f }), InvalidArgumentsException);
    REQUIRE_THROWS_AS(Quilter(source, { .distance = DistanceFunc() }), InvalidArgumentsException);
  } // SECTION

  SECTION("Source-dependent parameters") {
    Quilter too_large(source, { .size = { 64, 64 }, .patch_size = 33, .overlap = 4 });
    REQUIRE_THROWS_AS(too_large.quilt_image(), InvalidArgumentsException);

    Quilter bad_seed(source, { .size = { 64, 64 }, .patch_size = 12, .overlap = 3,
                               .seed_coords = eig::Array2u(21, 0) });
    REQUIRE_THROWS_AS(bad_seed.quilt_image(), InvalidArgumentsException);

    Quilter edge_seed(source, { .size = { 16, 16 }, .patch_size = 12, .overlap = 3,
                                .seed_coords = eig::Array2u(20, 20), .seed = 1 });
    REQUIRE_NOTHROW(edge_seed.quilt_image());
  } // SECTION
}

TEST_CASE("Candidate selection") {
  // With the buffer equal to the source, the only zero-error candidate
  // for any placement is the source patch at that same position
  auto source = make_random_texture({ 24, 24 }, 4);
  auto buffer = source.copy();

  Quilter quilter(source, { .size = { 24, 24 }, .patch_size = 8, .overlap = 2, .seed = 5 });

  SECTION("Exhaustive") {
    for (auto [xy, area] : { std::pair { eig::Array2u(6, 0), OverlapArea::eLeft },
                             std::pair { eig::Array2u(0, 6), OverlapArea::eTop },
                             std::pair { eig::Array2u(6, 6), OverlapArea::eTopLeft },
                             std::pair { eig::Array2u(16, 3), OverlapArea::eTopLeft } }) {
      Patch patch = quilter.select_candidate(buffer, xy, area);
      REQUIRE(patch.size == 8);
      REQUIRE((patch.coords == xy).all());
    }
  } // SECTION

  SECTION("Probabilistic") {
    Quilter sparse(source, { .size = { 24, 24 }, .patch_size = 8, .overlap = 2,
                             .selection_chance = 0.25f, .seed = 5 });
    for (uint i = 0; i < 8; ++i) {
      Patch patch = sparse.select_candidate(buffer, eig::Array2u(6, 6), OverlapArea::eTopLeft);
      REQUIRE(contains(source, patch.rect()));
    }
  } // SECTION

  SECTION("NaN distance") {
    Quilter nan_quilter(source, { .size = { 24, 24 }, .patch_size = 8, .overlap = 2,
      .distance = [](const Colr3b &, const Colr3b &) { return std::numeric_limits<double>::quiet_NaN(); } });
    REQUIRE_THROWS_AS(nan_quilter.select_candidate(buffer, eig::Array2u(6, 0), OverlapArea::eLeft),
                      SynthesisException);
  } // SECTION
}

TEST_CASE("Quilting") {
  auto source  = make_random_texture({ 32, 32 }, 6);
  auto palette = color_set(source);

  QuiltCreateInfo info = { .size        = { 50, 37 },
                           .patch_size  = 12,
                           .overlap     = 3,
                           .seed_coords = eig::Array2u(4, 5),
                           .seed        = 7 };

  SECTION("Output size and content") {
    auto output = Quilter(source, info).quilt_image();
    REQUIRE((output.size() == eig::Array2u(50, 37)).all());

    // Every output pixel is copied from somewhere in the source
    for (const auto &c : output.data())
      REQUIRE(palette.contains(pack(c)));
  } // SECTION

  SECTION("Seed patch") {
    auto output = Quilter(source, info).quilt_image();

    // The seed patch's region not overlapped by any later patch stays untouched
    uint step    = info.patch_size - info.overlap;
    auto region  = crop(output, { .size = { step, step } });
    auto expect  = crop(source, { .coords = *info.seed_coords, .size = { step, step } });
    REQUIRE(region == expect);
  } // SECTION

  SECTION("Reproducibility") {
    auto a = Quilter(source, info).quilt_image();
    auto b = Quilter(source, info).quilt_image();
    REQUIRE(a == b);

    info.seed_coords = { };
    auto c = Quilter(source, info).quilt_image();
    auto d = Quilter(source, info).quilt_image();
    REQUIRE(c == d);
  } // SECTION

  SECTION("Probabilistic") {
    info.selection_chance = 0.1f;
    auto output = Quilter(source, info).quilt_image();
    REQUIRE((output.size() == eig::Array2u(50, 37)).all());
    for (const auto &c : output.data())
      REQUIRE(palette.contains(pack(c)));
  } // SECTION

  SECTION("Uniform source") {
    const Colr3b colr = { 12, 34, 56 };
    Texture2d3b flat = {{ .size = { 16, 16 } }};
    fill(flat, flat.rect(), colr);

    auto output = Quilter(flat, { .size = { 40, 40 }, .patch_size = 8, .overlap = 2,
                                  .distance = distance::l2, .seed = 1 }).quilt_image();
    for (const auto &c : output.data())
      REQUIRE((c == colr).all());
  } // SECTION

  SECTION("Single patch output") {
    auto output = Quilter(source, { .size = { 5, 7 }, .patch_size = 12, .overlap = 3,
                                    .seed_coords = eig::Array2u(0, 0), .seed = 2 }).quilt_image();
    REQUIRE(output == crop(source, { .size = { 5, 7 } }));
  } // SECTION
}
