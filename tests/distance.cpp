#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <texsyn/core/distance.hpp>
#include <texsyn/core/errors.hpp>
#include <texsyn/core/ordered_float.hpp>
#include <texsyn/core/texture.hpp>
#include <texsyn/quilt/seam.hpp>
#include <algorithm>
#include <limits>
#include <vector>

using namespace txs;

constexpr static double eps = 1e-9;

TEST_CASE("Distance") {
  const Colr3b a = { 10, 20, 30 };
  const Colr3b b = { 13, 16, 30 };

  SECTION("L1") {
    REQUIRE_THAT(distance::l1(a, b), Catch::Matchers::WithinAbs(7.0, eps));
    REQUIRE_THAT(distance::l1(a, a), Catch::Matchers::WithinAbs(0.0, eps));
    REQUIRE_THAT(distance::l1(Colr3b(255, 0, 0), Colr3b(0, 0, 0)), Catch::Matchers::WithinAbs(255.0, eps));
  } // SECTION

  SECTION("L2") {
    REQUIRE_THAT(distance::l2(a, b), Catch::Matchers::WithinAbs(5.0, eps));
    REQUIRE_THAT(distance::l2(a, a), Catch::Matchers::WithinAbs(0.0, eps));
    REQUIRE_THAT(distance::l2(Colr3b(255, 0, 0), Colr3b(0, 0, 0)), Catch::Matchers::WithinAbs(255.0, eps));
  } // SECTION

  SECTION("Symmetry") {
    for (auto d : { distance::l1, distance::l2 }) {
      REQUIRE(d(a, b) == d(b, a));
      REQUIRE(d(a, b) >= 0.0);
    }
  } // SECTION

  SECTION("Lookup by name") {
    REQUIRE(distance::from_name("l1")(a, b) == distance::l1(a, b));
    REQUIRE(distance::from_name("l2")(a, b) == distance::l2(a, b));
    REQUIRE_THROWS_AS(distance::from_name("l3"), InvalidArgumentsException);
  } // SECTION
}

TEST_CASE("Rect error") {
  // 3x3 regions differing in five pixels, each by (8, 8, 8)
  Texture2d3b a = {{ .size = { 3, 3 } }};
  Texture2d3b b = {{ .size = { 3, 3 } }};
  fill(a, a.rect(), Colr3b(100, 100, 100));
  fill(b, b.rect(), Colr3b(100, 100, 100));
  for (auto xy : { eig::Array2u(0, 0), eig::Array2u(2, 0), eig::Array2u(1, 1),
                   eig::Array2u(0, 2), eig::Array2u(2, 2) })
    b[xy] = Colr3b(108, 108, 108);

  SECTION("L1 sum") {
    double err = patch_rect_error(distance::l1, a, b, eig::Array2u::Zero(), eig::Array2u::Zero(), eig::Array2u(3, 3));
    REQUIRE_THAT(err, Catch::Matchers::WithinAbs(120.0, eps));
  } // SECTION

  SECTION("Symmetry") {
    double ab = patch_rect_error(distance::l2, a, b, eig::Array2u::Zero(), eig::Array2u::Zero(), eig::Array2u(3, 3));
    double ba = patch_rect_error(distance::l2, b, a, eig::Array2u::Zero(), eig::Array2u::Zero(), eig::Array2u(3, 3));
    REQUIRE(ab == ba);
  } // SECTION

  SECTION("Sub-rect") {
    double err = patch_rect_error(distance::l1, a, b, eig::Array2u(1, 0), eig::Array2u(1, 0), eig::Array2u(1, 3));
    REQUIRE_THAT(err, Catch::Matchers::WithinAbs(24.0, eps));
  } // SECTION
}

TEST_CASE("Ordered float") {
  SECTION("Construction") {
    REQUIRE(OrderedFloat<double>(1.5).value() == 1.5);
    REQUIRE_THROWS_AS(OrderedFloat<double>(std::numeric_limits<double>::quiet_NaN()), SynthesisException);
  } // SECTION

  SECTION("Fallible construction") {
    REQUIRE(OrderedFloat<float>::try_from(2.f).has_value());
    REQUIRE(!OrderedFloat<float>::try_from(std::numeric_limits<float>::quiet_NaN()).has_value());
  } // SECTION

  SECTION("Total order") {
    using F = OrderedFloat<double>;
    std::vector<F> v = { F(3.0), F(-1.0), F(std::numeric_limits<double>::infinity()), F(0.0), F(-0.0) };
    std::ranges::sort(v);
    REQUIRE(v.front().value() == -1.0);
    REQUIRE(v.back().value() == std::numeric_limits<double>::infinity());
    REQUIRE(F(0.0) == F(-0.0));
    REQUIRE(F(1.0) < F(2.0));
    REQUIRE(std::min(F(4.0), F(2.0)).value() == 2.0);
  } // SECTION

  SECTION("Arithmetic") {
    using F = OrderedFloat<double>;
    F acc;
    acc += F(1.0);
    acc += F(2.5);
    REQUIRE(acc.value() == 3.5);

    F inf  = F(std::numeric_limits<double>::infinity());
    F ninf = F(-std::numeric_limits<double>::infinity());
    REQUIRE_THROWS_AS(inf + ninf, SynthesisException);
  } // SECTION
}
