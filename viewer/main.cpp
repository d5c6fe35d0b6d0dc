#include "brotbench/backend.hpp"
#include "brotbench/error.hpp"
#include "brotbench/image.hpp"
#include "brotbench/render.hpp"
#include "brotbench/viewport.hpp"

#include <SFML/Graphics.hpp>
#include <exec/static_thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <complex>
#include <cstddef>
#include <filesystem>
#include <format>
#include <memory>
#include <thread>

class BrotViewer {
private:
  // ===== CONSTANTS =====
  static constexpr std::size_t DEFAULT_WIDTH = 800;
  static constexpr std::size_t DEFAULT_HEIGHT = 600;
  static constexpr std::complex<double> DEFAULT_CENTER{-0.7, 0.0};
  static constexpr double DEFAULT_ZOOM = 0.8;
  static constexpr std::size_t DEFAULT_MAX_ITERATIONS = 256;
  static constexpr std::size_t MIN_ITERATIONS = 16;
  static constexpr std::size_t MAX_ITERATIONS = 1 << 16;
  static constexpr auto RENDER_DELAY = std::chrono::milliseconds(150);

  static constexpr double ZOOM_IN_FACTOR = 1.25;
  static constexpr double ZOOM_OUT_FACTOR = 0.8;

  // ===== GRAPHICS COMPONENTS =====
  sf::RenderWindow window;
  sf::Image image;
  sf::Texture texture;
  sf::Sprite sprite;

  // ===== COMPUTATION =====
  std::unique_ptr<exec::static_thread_pool> thread_pool;
  std::size_t backend_index = brotbench::backends().size() - 1;
  brotbench::Palette palette = brotbench::Palette::polynomial;
  std::size_t max_iterations = DEFAULT_MAX_ITERATIONS;

  // ===== VIEWPORT STATE =====
  std::complex<double> center = DEFAULT_CENTER;
  double zoom = DEFAULT_ZOOM;
  std::size_t current_width = DEFAULT_WIDTH;
  std::size_t current_height = DEFAULT_HEIGHT;

  // ===== INTERACTION STATE =====
  bool is_dragging = false;
  bool is_panning = false;
  sf::Vector2i last_mouse_pos;
  std::chrono::steady_clock::time_point last_pan_time;
  std::size_t saved_count = 0;

  // last rendered frame, kept for saving
  brotbench::PixelBuffer pixels;

public:
  BrotViewer()
      : window(sf::VideoMode(DEFAULT_WIDTH, DEFAULT_HEIGHT), "brotview"),
        thread_pool(std::make_unique<exec::static_thread_pool>(
            std::max(1u, std::thread::hardware_concurrency())
        )) {
    texture.create(current_width, current_height);
    sprite.setTexture(texture);
    render();
  }

  void run() {
    while (window.isOpen()) {
      handleEvents();
      checkDelayedRender();
      window.clear();
      window.draw(sprite);
      window.display();
    }
  }

private:
  // ===== EVENT HANDLING =====
  void handleEvents() {
    sf::Event event{};
    while (window.pollEvent(event)) {
      switch (event.type) {
      case sf::Event::Closed:
        window.close();
        break;
      case sf::Event::MouseWheelScrolled:
        handleZoom(
            event.mouseWheelScroll.delta, event.mouseWheelScroll.x, event.mouseWheelScroll.y
        );
        break;
      case sf::Event::MouseButtonPressed:
        if (event.mouseButton.button == sf::Mouse::Left) {
          is_dragging = true;
          last_mouse_pos = {event.mouseButton.x, event.mouseButton.y};
        }
        break;
      case sf::Event::MouseButtonReleased:
        if (event.mouseButton.button == sf::Mouse::Left) {
          stopDragging();
        }
        break;
      case sf::Event::MouseMoved:
        if (is_dragging) {
          handlePan(event.mouseMove.x - last_mouse_pos.x, event.mouseMove.y - last_mouse_pos.y);
          last_mouse_pos = {event.mouseMove.x, event.mouseMove.y};
        }
        break;
      case sf::Event::Resized:
        handleResize(event.size.width, event.size.height);
        break;
      case sf::Event::KeyPressed:
        handleKeyPress(event.key.code);
        break;
      default:
        break;
      }
    }
  }

  void stopDragging() {
    is_dragging = false;
    if (is_panning) {
      is_panning = false;
      render();
    }
  }

  void handleKeyPress(sf::Keyboard::Key key) {
    switch (key) {
    case sf::Keyboard::B:
      backend_index = (backend_index + 1) % brotbench::backends().size();
      render();
      break;
    case sf::Keyboard::P:
      palette = palette == brotbench::Palette::polynomial ? brotbench::Palette::hot
                                                          : brotbench::Palette::polynomial;
      render();
      break;
    case sf::Keyboard::Up:
      max_iterations = std::min(max_iterations * 2, MAX_ITERATIONS);
      render();
      break;
    case sf::Keyboard::Down:
      max_iterations = std::max(max_iterations / 2, MIN_ITERATIONS);
      render();
      break;
    case sf::Keyboard::R:
      center = DEFAULT_CENTER;
      zoom = DEFAULT_ZOOM;
      max_iterations = DEFAULT_MAX_ITERATIONS;
      render();
      break;
    case sf::Keyboard::S:
      saveFrame();
      break;
    default:
      break;
    }
  }

  // ===== NAVIGATION =====
  // Row 0 of the grid is im_min, drawn at the top of the window.
  [[nodiscard]] auto screenToComplex(int screen_x, int screen_y) const -> std::complex<double> {
    auto const scale = pixelScale();
    return {
        center.real() + (screen_x - current_width / 2.0) * scale,
        center.imag() + (screen_y - current_height / 2.0) * scale,
    };
  }

  [[nodiscard]] auto pixelScale() const -> double {
    return brotbench::FRAME_SCALE /
           (zoom * static_cast<double>(std::max<std::size_t>(
                       1, std::min(current_width, current_height)
                   )));
  }

  void handleZoom(float delta, int mouse_x, int mouse_y) {
    auto const previous_center = center;
    auto const previous_zoom = zoom;

    auto const before = screenToComplex(mouse_x, mouse_y);
    zoom *= (delta > 0) ? ZOOM_IN_FACTOR : ZOOM_OUT_FACTOR;
    auto const after = screenToComplex(mouse_x, mouse_y);
    center += before - after;
    if (not render()) {
      center = previous_center;
      zoom = previous_zoom;
    }
  }

  void handlePan(int dx, int dy) {
    auto const scale = pixelScale();
    center -= std::complex<double>{dx * scale, dy * scale};
    is_panning = true;
    last_pan_time = std::chrono::steady_clock::now();
  }

  void handleResize(unsigned int new_width, unsigned int new_height) {
    if (new_width == 0 or new_height == 0) {
      return; // minimized
    }
    current_width = new_width;
    current_height = new_height;

    sf::FloatRect visibleArea(0, 0, new_width, new_height);
    window.setView(sf::View(visibleArea));

    texture.create(current_width, current_height);
    sprite.setTexture(texture, true);

    render();
  }

  void checkDelayedRender() {
    if (is_panning) {
      auto now = std::chrono::steady_clock::now();
      if (now - last_pan_time >= RENDER_DELAY) {
        is_panning = false;
        render();
      }
    }
  }

  // ===== RENDERING =====
  // Returns false and keeps the last frame when the view cannot be evaluated.
  auto render() -> bool {
    auto const &backend = brotbench::backends()[backend_index];

    auto start_time = std::chrono::high_resolution_clock::now();
    try {
      auto const viewport =
          brotbench::framed_viewport(current_width, current_height, center, zoom);
      auto const grid = backend.evaluate(viewport, max_iterations, *thread_pool);
      pixels = brotbench::render(grid, max_iterations, palette);
    } catch (brotbench::InvalidArgument const &e) {
      // past double precision the plane range collapses or overflows
      spdlog::warn("{}", e.what());
      return false;
    }
    auto end_time = std::chrono::high_resolution_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

    image.create(current_width, current_height, pixels.rgba.data());
    texture.update(image);

    spdlog::debug(
        "{} at ({}, {}) zoom {} in {} ms", backend.slug, center.real(), center.imag(), zoom,
        duration.count()
    );
    window.setTitle(std::format(
        "brotview [{}] {} iterations, {} palette - {}ms", backend.name, max_iterations,
        brotbench::palette_name(palette), duration.count()
    ));
    return true;
  }

  void saveFrame() {
    auto const path =
        std::filesystem::path{"images"} / std::format("brotview-{}.png", saved_count++);
    try {
      brotbench::save_image(pixels, path);
      spdlog::info("saved to {}", path.string());
    } catch (brotbench::ImageWriteError const &e) {
      spdlog::error("{}", e.what());
    } catch (brotbench::InvalidArgument const &e) {
      spdlog::error("{}", e.what());
    }
  }
};

int main() {
  BrotViewer viewer;
  viewer.run();
  return 0;
}
