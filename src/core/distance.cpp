#include <texsyn/core/distance.hpp>
#include <texsyn/core/errors.hpp>

namespace txs::distance {
  DistanceFunc from_name(std::string_view name) {
    if (name == "l1")
      return l1;
    else if (name == "l2")
      return l2;
    
    check_args(false, fmt::format("unknown distance function \"{}\", expected \"l1\" or \"l2\"", name));
    return { };
  }
} // namespace txs::distance
