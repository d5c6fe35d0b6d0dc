#pragma once

#include "brotbench/error.hpp"
#include "brotbench/render.hpp"

#include <SFML/Graphics/Image.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <format>
#include <limits>
#include <system_error>

namespace brotbench {

/// Writes `buffer` to `path`, creating missing parent directories. The
/// format follows the extension (png, bmp, tga, jpg).
inline void save_image(PixelBuffer const &buffer, std::filesystem::path const &path) {
  constexpr auto max_side = std::size_t{std::numeric_limits<unsigned int>::max()};
  if (buffer.width == 0 or buffer.height == 0 or buffer.width > max_side or
      buffer.height > max_side or buffer.rgba.size() != buffer.width * buffer.height * 4) {
    throw InvalidArgument(
        std::format("cannot save a {}x{} pixel buffer", buffer.width, buffer.height)
    );
  }

  if (auto const parent = path.parent_path(); not parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw ImageWriteError(
          std::format("cannot create directory {}: {}", parent.string(), ec.message())
      );
    }
  }

  sf::Image image;
  image.create(
      static_cast<unsigned int>(buffer.width),
      static_cast<unsigned int>(buffer.height),
      buffer.rgba.data()
  );
  if (not image.saveToFile(path.string())) {
    throw ImageWriteError(std::format("cannot write image {}", path.string()));
  }
  spdlog::debug("wrote {}x{} image to {}", buffer.width, buffer.height, path.string());
}

} // namespace brotbench
