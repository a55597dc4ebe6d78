#include <texsyn/app/cli.hpp>
#include <texsyn/core/errors.hpp>
#include <texsyn/core/texture.hpp>
#include <texsyn/core/utility.hpp>
#include <texsyn/search/search.hpp>
#include <fmt/core.h>
#include <chrono>
#include <cstdlib>
#include <exception>

namespace txs {
  void run_search(const SearchCommand &cmd) {
    txs_trace();

    fmt::print(
      "Starting texsyn_search\n  input   : {}\n  output  : {}\n  size    : {}\n  window  : {}\n",
      cmd.input.string(), cmd.output.string(), cmd.info.size, cmd.info.window_size);

    auto source = io::load_texture2d(cmd.input);
    auto start  = std::chrono::steady_clock::now();

    PixelSearch search(source, cmd.info);
    auto output = search.synthesize();

    auto secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    fmt::print("Finished in {:.2f}s, saving to {}\n", secs, cmd.output.string());

    io::save_texture2d(cmd.output, output);
  }
} // namespace txs

int main(int argc, char *argv[]) {
  try {
    txs::run_search(txs::parse_search_command(txs::Args(argc, argv)));
  } catch (const std::exception &e) {
    fmt::print(stderr, "{}\n", e.what());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
