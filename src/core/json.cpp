#include <texsyn/core/errors.hpp>
#include <texsyn/core/io.hpp>
#include <texsyn/core/json.hpp>
#include <texsyn/quilt/quilt.hpp>
#include <texsyn/search/search.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <string>
#include <vector>

namespace txs {
  namespace detail {
    // Overwrite value with js[key], if the key is present
    template <typename T>
    void get_if(const json &js, const std::string &key, T &value) {
      guard(js.contains(key));
      value = js.at(key).get<T>();
    }

    // Overwrite an optional with js[key], if the key is present
    template <typename T>
    void get_if(const json &js, const std::string &key, std::optional<T> &value) {
      guard(js.contains(key));
      value = js.at(key).get<T>();
    }

    // Overwrite a distance metric with the metric named by js[key], if the key is present
    void get_distance_if(const json &js, const std::string &key, DistanceFunc &d) {
      guard(js.contains(key));
      d = distance::from_name(js.at(key).get<std::string>());
    }
  } // namespace detail

  namespace io {
    json load_json(const fs::path &path) {
      return json::parse(load_string(path));
    }

    void save_json(const fs::path &path, const json &js, uint indent) {
      save_string(path, js.dump(indent));
    }
  } // namespace io

  void from_json(const json &js, QuiltCreateInfo &info) {
    detail::get_if(js, "size",             info.size);
    detail::get_if(js, "patch_size",       info.patch_size);
    detail::get_if(js, "overlap",          info.overlap);
    detail::get_if(js, "seed_coords",      info.seed_coords);
    detail::get_if(js, "selection_chance", info.selection_chance);
    detail::get_if(js, "seed",             info.seed);
    detail::get_if(js, "verbose",          info.verbose);
    detail::get_distance_if(js, "distance", info.distance);
  }

  void to_json(json &js, const QuiltCreateInfo &info) {
    js["size"]       = info.size;
    js["patch_size"] = info.patch_size;
    js["overlap"]    = info.overlap;
    js["verbose"]    = info.verbose;
    if (info.seed_coords)
      js["seed_coords"] = *info.seed_coords;
    if (info.selection_chance)
      js["selection_chance"] = *info.selection_chance;
    if (info.seed)
      js["seed"] = *info.seed;
  }

  void from_json(const json &js, SearchCreateInfo &info) {
    detail::get_if(js, "size",        info.size);
    detail::get_if(js, "window_size", info.window_size);
    detail::get_if(js, "seed_coords", info.seed_coords);
    detail::get_if(js, "seed",        info.seed);
    detail::get_if(js, "verbose",     info.verbose);
    detail::get_distance_if(js, "distance", info.distance);
  }

  void to_json(json &js, const SearchCreateInfo &info) {
    js["size"]        = info.size;
    js["window_size"] = info.window_size;
    js["verbose"]     = info.verbose;
    if (info.seed_coords)
      js["seed_coords"] = *info.seed_coords;
    if (info.seed)
      js["seed"] = *info.seed;
  }
} // namespace txs

namespace Eigen {
  void from_json(const txs::json& js, Array2u &v) {
    txs::check_args(js.is_array() && js.size() == 2,
      fmt::format("expected a json array of two values, got {}", js.dump()));
    std::ranges::copy(js, v.begin());
  }

  void to_json(txs::json &js, const Array2u &v) {
    js = std::vector<Array2u::value_type>(v.begin(), v.end());
  }
} // namespace Eigen
