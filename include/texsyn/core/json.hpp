// Copyright (C) 2024 Mark van de Ruit, Delft University of Technology.
// 
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
// 
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
// 
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#pragma once

#include <texsyn/core/fwd.hpp>
#include <texsyn/core/io.hpp>
#include <nlohmann/json_fwd.hpp>

namespace txs {
  // namespace/typename shorthand inside txs::io namespace
  using json = nlohmann::json;

  namespace io {
    /* json load/save to/from file */
    json load_json(const fs::path &path);
    void save_json(const fs::path &path, const json &js, uint indent = 2);
  }

  /* json (de)serialization for run parameters; keys absent from js keep their
     current value, and the distance metric is read by name but never written */
  void from_json(const json &js, QuiltCreateInfo &info);
  void to_json(json &js, const QuiltCreateInfo &info);

  void from_json(const json &js, SearchCreateInfo &info);
  void to_json(json &js, const SearchCreateInfo &info);
} // namespace txs

/* json (de)serializations for specific Eigen types must be declared in Eigen scope */
namespace Eigen {
  void from_json(const txs::json& js, Array2u &v);
  void to_json(txs::json &js, const Array2u &v);
} // namespace Eigen
