#include <texsyn/app/cli.hpp>
#include <texsyn/core/errors.hpp>
#include <texsyn/core/json.hpp>
#include <texsyn/core/utility.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <array>
#include <charconv>
#include <utility>

namespace txs {
  namespace detail {
    bool is_option(std::string_view arg) {
      return arg.size() > 1 && arg.front() == '-';
    }

    // Split "-key=value" into key and value; a flag "-key" has an empty value
    std::pair<std::string, std::string> split_option(std::string_view arg) {
      arg.remove_prefix(1);
      auto i = arg.find('=');
      guard(i != std::string_view::npos, { std::string(arg), std::string() });
      return { std::string(arg.substr(0, i)), std::string(arg.substr(i + 1)) };
    }
  } // namespace detail

  Args::Args(int argc, const char * const argv[])
  : Args(std::vector<std::string>(argc > 0 ? argv + 1 : argv, argv + argc)) { }

  Args::Args(std::span<const std::string> args) {
    for (const auto &arg : args) {
      if (detail::is_option(arg)) {
        auto [key, value] = detail::split_option(arg);
        m_options.insert_or_assign(std::move(key), std::move(value));
      } else {
        m_positional.push_back(arg);
      }
    }
  }

  bool Args::has(std::string_view key) const {
    return m_options.contains(std::string(key));
  }

  template <typename T>
  std::optional<T> Args::get(std::string_view key) const {
    auto it = m_options.find(std::string(key));
    guard(it != m_options.end(), { });

    const std::string &value = it->second;
    check_args(!value.empty(), fmt::format("option -{} requires a value", key));

    if constexpr (std::is_same_v<T, std::string>) {
      return value;
    } else {
      T v;
      const char *end = value.data() + value.size();
      auto [ptr, ec] = std::from_chars(value.data(), end, v);
      check_args(ec == std::errc() && ptr == end,
        fmt::format("option -{} has invalid value \"{}\"", key, value));
      return v;
    }
  }

  void Args::check_known(std::span<const std::string_view> keys) const {
    for (const auto &[key, _] : m_options) {
      check_args(std::ranges::find(keys, key) != keys.end(),
        fmt::format("unknown option -{}", key));
    }
  }

  /* Explicit template instantiations */

  template std::optional<uint>        Args::get<uint>(std::string_view) const;
  template std::optional<float>       Args::get<float>(std::string_view) const;
  template std::optional<std::string> Args::get<std::string>(std::string_view) const;

  namespace detail {
    // Shared handling of positional arguments and output size options
    template <typename Command>
    void parse_common(const Args &args, Command &cmd, std::string_view usage) {
      check_args(!args.positional().empty(),
        fmt::format("missing input image\n{}", usage));
      check_args(args.positional().size() <= 2,
        fmt::format("too many positional arguments\n{}", usage));
      check_args(!args.has("size") || (!args.has("width") && !args.has("height")),
        fmt::format("option -size conflicts with -width and -height\n{}", usage));

      cmd.input = args.positional()[0];
      if (args.positional().size() > 1)
        cmd.output = args.positional()[1];

      // Configuration file is applied first, so other options override it
      if (auto path = args.get<std::string>("config"))
        io::load_json(*path).get_to(cmd.info);

      if (auto v = args.get<uint>("size"))
        cmd.info.size = eig::Array2u(*v, *v);
      if (auto v = args.get<uint>("width"))
        cmd.info.size.x() = *v;
      if (auto v = args.get<uint>("height"))
        cmd.info.size.y() = *v;
      if (auto v = args.get<uint>("seed"))
        cmd.info.seed = *v;
      if (auto v = args.get<std::string>("distance"))
        cmd.info.distance = distance::from_name(*v);
      if (args.has("verbose"))
        cmd.info.verbose = true;
    }
  } // namespace detail

  QuiltCommand parse_quilt_command(const Args &args) {
    constexpr std::array<std::string_view, 10> keys = {
      "size", "width", "height", "blocksize", "overlap", "chance", "seed", "distance", "config", "verbose"
    };
    args.check_known(keys);

    QuiltCommand cmd;
    detail::parse_common(args, cmd, quilt_usage());

    if (auto v = args.get<uint>("blocksize"))
      cmd.info.patch_size = *v;
    if (auto v = args.get<uint>("overlap"))
      cmd.info.overlap = *v;
    if (auto v = args.get<float>("chance"))
      cmd.info.selection_chance = *v;

    return cmd;
  }

  SearchCommand parse_search_command(const Args &args) {
    constexpr std::array<std::string_view, 8> keys = {
      "size", "width", "height", "winsize", "seed", "distance", "config", "verbose"
    };
    args.check_known(keys);

    SearchCommand cmd;
    detail::parse_common(args, cmd, search_usage());

    if (auto v = args.get<uint>("winsize"))
      cmd.info.window_size = *v;

    return cmd;
  }

  std::string_view quilt_usage() {
    return "Usage: texsyn_quilt <input> [output=quilt.png]\n"
           "  -size=N        square output size (default 1024)\n"
           "  -width=N       output width\n"
           "  -height=N      output height\n"
           "  -blocksize=N   patch size (default 64)\n"
           "  -overlap=N     overlap size (default 12)\n"
           "  -chance=F      candidate selection chance in (0, 1]\n"
           "  -seed=N        random seed\n"
           "  -distance=D    color distance, l1 or l2 (default l1)\n"
           "  -config=F      json configuration file\n"
           "  -verbose       print progress\n";
  }

  std::string_view search_usage() {
    return "Usage: texsyn_search <input> [output=search.png]\n"
           "  -size=N        square output size (default 1024)\n"
           "  -width=N       output width\n"
           "  -height=N      output height\n"
           "  -winsize=N     search window size, must be odd (default 15)\n"
           "  -seed=N        random seed\n"
           "  -distance=D    color distance, l1 or l2 (default l2)\n"
           "  -config=F      json configuration file\n"
           "  -verbose       print progress\n";
  }
} // namespace txs
