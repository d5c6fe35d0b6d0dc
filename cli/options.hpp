#pragma once

#include "brotbench/backend.hpp"
#include "brotbench/error.hpp"
#include "brotbench/render.hpp"
#include "brotbench/viewport.hpp"

#include <getopt.h>

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

namespace brotbench::cli {

// 1400x800 at 256 iterations, the classic SQL benchmark size.
inline constexpr std::size_t DEFAULT_WIDTH = 1400;
inline constexpr std::size_t DEFAULT_HEIGHT = 800;
inline constexpr std::size_t DEFAULT_MAX_ITERATIONS = 256;
inline constexpr std::string_view DEFAULT_BACKEND = "threaded-simd";
inline constexpr std::string_view IMAGE_DIRECTORY = "images";
inline constexpr std::uint32_t MAX_THREADS = 1024;

struct Options {
  Viewport viewport = standard_viewport(DEFAULT_WIDTH, DEFAULT_HEIGHT);
  std::size_t max_iterations = DEFAULT_MAX_ITERATIONS;
  std::string backend{DEFAULT_BACKEND};
  Palette palette = Palette::polynomial;
  std::filesystem::path output; // empty: images/<backend>.png
  std::uint32_t threads = std::max(1u, std::thread::hardware_concurrency());
  bool write_image = true;
  bool verify = false;
  bool verbose = false;
  bool help = false;

  [[nodiscard]] auto output_path() const -> std::filesystem::path {
    if (not output.empty()) {
      return output;
    }
    return std::filesystem::path{IMAGE_DIRECTORY} / (backend + ".png");
  }
};

inline constexpr std::string_view USAGE = R"(usage: brotrender [options]

  -W, --width N            image width in pixels (default 1400)
  -H, --height N           image height in pixels (default 800)
  -i, --max-iterations N   iteration cap per pixel (default 256)
      --re-min X           real lower bound (default -2.5)
      --re-max X           real upper bound (default 1.0)
      --im-min X           imaginary lower bound (default -1.0)
      --im-max X           imaginary upper bound (default 1.0)
      --anchor A           corner | center | inclusive (default corner)
  -b, --backend NAME       naive | scalar | simd | threaded | threaded-simd
  -p, --palette NAME       polynomial | hot (default polynomial)
  -o, --output FILE        image path (default images/<backend>.png)
  -n, --no-image           skip writing the image
  -t, --threads N          thread pool size, at most 1024 (default: hardware threads)
      --verify             compare the grid against the scalar reference
  -v, --verbose            debug logging
  -h, --help               show this help
)";

namespace detail {

template <typename T>
[[nodiscard]] auto parse_number(std::string_view text, std::string_view flag) -> T {
  auto value = T{};
  auto const *const last = text.data() + text.size();
  auto const [ptr, ec] = std::from_chars(text.data(), last, value);
  if (ec != std::errc{} or ptr != last or text.empty()) {
    throw InvalidArgument(std::format("--{}: '{}' is not a valid number", flag, text));
  }
  return value;
}

[[nodiscard]] inline auto parse_positive(std::string_view text, std::string_view flag)
    -> std::size_t {
  auto const value = parse_number<long long>(text, flag);
  if (value <= 0) {
    throw InvalidArgument(std::format("--{} must be positive, got {}", flag, value));
  }
  return static_cast<std::size_t>(value);
}

[[nodiscard]] inline auto parse_anchor(std::string_view text) -> Anchor {
  if (text == "corner") {
    return Anchor::corner;
  }
  if (text == "center") {
    return Anchor::center;
  }
  if (text == "inclusive") {
    return Anchor::inclusive;
  }
  throw InvalidArgument(std::format("--anchor: unknown anchor '{}'", text));
}

[[nodiscard]] inline auto parse_palette(std::string_view text) -> Palette {
  for (auto const palette : {Palette::polynomial, Palette::hot}) {
    if (text == palette_name(palette)) {
      return palette;
    }
  }
  throw InvalidArgument(std::format("--palette: unknown palette '{}'", text));
}

enum LongOnly : int {
  RE_MIN = 1000,
  RE_MAX,
  IM_MIN,
  IM_MAX,
  ANCHOR,
  VERIFY,
};

} // namespace detail

/// Parses the brotrender command line. Throws InvalidArgument on unknown
/// flags, missing values and malformed numbers or names; the resulting
/// viewport, bound and backend are validated before returning.
[[nodiscard]] inline auto parse_options(int argc, char *argv[]) -> Options {
  using namespace detail;

  static constexpr option long_options[] = {
      {"width", required_argument, nullptr, 'W'},
      {"height", required_argument, nullptr, 'H'},
      {"max-iterations", required_argument, nullptr, 'i'},
      {"re-min", required_argument, nullptr, RE_MIN},
      {"re-max", required_argument, nullptr, RE_MAX},
      {"im-min", required_argument, nullptr, IM_MIN},
      {"im-max", required_argument, nullptr, IM_MAX},
      {"anchor", required_argument, nullptr, ANCHOR},
      {"backend", required_argument, nullptr, 'b'},
      {"palette", required_argument, nullptr, 'p'},
      {"output", required_argument, nullptr, 'o'},
      {"no-image", no_argument, nullptr, 'n'},
      {"threads", required_argument, nullptr, 't'},
      {"verify", no_argument, nullptr, VERIFY},
      {"verbose", no_argument, nullptr, 'v'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0},
  };

  auto options = Options{};

  // 0 forces a full rescan, so the parser can run more than once per process
  optind = 0;
  opterr = 0;

  int opt = 0;
  while ((opt = getopt_long(argc, argv, ":W:H:i:b:p:o:nt:vh", long_options, nullptr)) != -1) {
    auto const arg = std::string_view{optarg != nullptr ? optarg : ""};
    switch (opt) {
    case 'W':
      options.viewport.width = parse_positive(arg, "width");
      break;
    case 'H':
      options.viewport.height = parse_positive(arg, "height");
      break;
    case 'i':
      options.max_iterations = parse_positive(arg, "max-iterations");
      break;
    case RE_MIN:
      options.viewport.re_min = parse_number<double>(arg, "re-min");
      break;
    case RE_MAX:
      options.viewport.re_max = parse_number<double>(arg, "re-max");
      break;
    case IM_MIN:
      options.viewport.im_min = parse_number<double>(arg, "im-min");
      break;
    case IM_MAX:
      options.viewport.im_max = parse_number<double>(arg, "im-max");
      break;
    case ANCHOR:
      options.viewport.anchor = parse_anchor(arg);
      break;
    case 'b':
      options.backend = arg;
      break;
    case 'p':
      options.palette = parse_palette(arg);
      break;
    case 'o':
      options.output = std::string{arg};
      break;
    case 'n':
      options.write_image = false;
      break;
    case 't': {
      auto const threads = parse_positive(arg, "threads");
      if (threads > MAX_THREADS) {
        throw InvalidArgument(
            std::format("--threads must be at most {}, got {}", MAX_THREADS, threads)
        );
      }
      options.threads = static_cast<std::uint32_t>(threads);
      break;
    }
    case VERIFY:
      options.verify = true;
      break;
    case 'v':
      options.verbose = true;
      break;
    case 'h':
      options.help = true;
      break;
    case ':':
      throw InvalidArgument(std::format("option '{}' requires a value", argv[optind - 1]));
    default:
      throw InvalidArgument(std::format("unknown option '{}'", argv[optind - 1]));
    }
  }

  if (optind < argc) {
    throw InvalidArgument(std::format("unexpected argument '{}'", argv[optind]));
  }
  if (options.help) {
    return options;
  }

  validate(options.viewport);
  validate_max_iterations(options.max_iterations);
  [[maybe_unused]] auto const &backend = find_backend(options.backend);
  return options;
}

} // namespace brotbench::cli
