#include "fracit/fracit.hpp"

#include <SFML/Graphics.hpp>
#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <exec/static_thread_pool.hpp>
#include <format>
#include <memory>
#include <optional>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// UI Constants
inline constexpr unsigned TEXT_SIZE = 24;
inline constexpr unsigned HELP_TEXT_SIZE = 16;
inline constexpr float PANEL_PADDING = 20.0f;

namespace {

struct VariantEntry {
  std::string_view name;
  std::unique_ptr<fracit::fractal> fractal;
  int max_iterations;
  fracit::point center;
};

struct PaletteEntry {
  std::string_view name;
  std::unique_ptr<fracit::palette> palette;
};

auto makeVariants() -> std::vector<VariantEntry> {
  std::vector<VariantEntry> variants;
  variants.push_back(
      {"Mandelbrot", std::make_unique<fracit::mandelbrot>(fracit::default_radius),
       fracit::default_max_iterations, {-0.7, 0.0}}
  );
  variants.push_back(
      {"Julia", std::make_unique<fracit::julia>(fracit::default_radius, fracit::point{-0.8, 0.156}),
       500, {0.0, 0.0}}
  );
  // z^2 - 0.0625 / z^3, which escapes like z^2 near infinity
  variants.push_back(
      {"Rational Julia",
       std::make_unique<fracit::rational_julia>(
           fracit::default_radius,
           [](fracit::point z) { return z * z * z * z * z - 0.0625; },
           [](fracit::point z) { return z * z * z; },
           fracit::point{}
       ),
       200, {0.0, 0.0}}
  );
  variants.push_back(
      {"Newton z^3 - 1",
       std::make_unique<fracit::polynomiograph>(
           fracit::default_epsilon,
           fracit::newton_unity_roots(3),
           [](fracit::point) { return fracit::point{}; },
           [](fracit::point c) { return c; }
       ),
       64, {0.0, 0.0}}
  );
  return variants;
}

template <typename Palette>
auto entry(std::string_view name, Palette palette) -> PaletteEntry {
  return {name, std::make_unique<Palette>(std::move(palette))};
}

auto makePalettes() -> std::vector<PaletteEntry> {
  std::vector<PaletteEntry> palettes;
  palettes.push_back(entry("Spectrum", fracit::spectrum()));
  palettes.push_back(entry("Pretty Bands", fracit::pretty_bands()));
  palettes.push_back(entry("Pretty Blends", fracit::pretty_blends()));
  palettes.push_back(entry("Pretty Periodic", fracit::pretty_periodic()));
  palettes.push_back(entry("Pretty Bands 2", fracit::pretty_bands2()));
  palettes.push_back(entry("Pretty Blends 2", fracit::pretty_blends2()));
  palettes.push_back(entry("Pretty Periodic 2", fracit::pretty_periodic2()));
  palettes.push_back(entry("BW Bands", fracit::bw_bands()));
  palettes.push_back(entry("BW Blends", fracit::bw_blends()));
  palettes.push_back(entry("BW Stripes", fracit::bw_stripes()));
  return palettes;
}

} // namespace

class FractalViewer {
private:
  // ===== CONSTANTS =====
  static constexpr unsigned DEFAULT_WIDTH = 800;
  static constexpr unsigned DEFAULT_HEIGHT = 600;
  static constexpr double FIT_SPAN = 3.75; // plane units across the short side
  static constexpr double ZOOM_STEP = 0.8;
  static constexpr auto PAN_SETTLE = std::chrono::milliseconds(150);

  // ===== GRAPHICS COMPONENTS =====
  sf::RenderWindow window;
  sf::Image image;
  sf::Texture texture;
  sf::Sprite sprite;

  // ===== COMPUTATION =====
  std::unique_ptr<exec::static_thread_pool> thread_pool;
  std::vector<VariantEntry> variants = makeVariants();
  std::vector<PaletteEntry> palettes = makePalettes();
  std::size_t current_variant = 0;
  std::size_t current_palette = 0;
  int snapshot_count = 0;

  // ===== VIEWPORT STATE =====
  unsigned width = DEFAULT_WIDTH;
  unsigned height = DEFAULT_HEIGHT;
  fracit::point center = variants.front().center;
  double scale = fitScale(); // plane units per pixel

  // ===== INTERACTION STATE =====
  std::optional<sf::Vector2i> drag_anchor;
  std::optional<std::chrono::steady_clock::time_point> pending_render;
  bool busy = false;
  bool show_help = false;

  // ===== UI ELEMENTS =====
  sf::Font font;
  bool font_loaded = false;
  sf::Text busy_text;
  sf::Text help_text;

public:
  FractalViewer()
      : window(sf::VideoMode(DEFAULT_WIDTH, DEFAULT_HEIGHT), "fracit"),
        thread_pool(std::make_unique<exec::static_thread_pool>(fracit::worker_count())) {
    resizeCanvas();
    loadFont();
    render();
  }

  void run() {
    while (window.isOpen()) {
      sf::Event event{};
      while (window.pollEvent(event)) {
        dispatch(event);
      }
      if (pending_render and std::chrono::steady_clock::now() >= *pending_render) {
        render();
      }
      draw();
    }
  }

private:
  // ===== INITIALIZATION =====
  void resizeCanvas() {
    image.create(width, height);
    texture.create(width, height);
    sprite.setTexture(texture, true);
    window.setView(sf::View(sf::FloatRect(0.f, 0.f, width, height)));
  }

  void loadFont() {
    static constexpr std::array<std::string_view, 4> font_paths = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
        "/usr/share/fonts/TTF/DejaVuSansMono.ttf",
        "/System/Library/Fonts/Menlo.ttc",
        "C:/Windows/Fonts/consola.ttf"
    };
    font_loaded = std::any_of(font_paths.begin(), font_paths.end(), [this](auto path) {
      return font.loadFromFile(std::string{path});
    });
    if (!font_loaded) {
      spdlog::warn("viewer: no font found, help and progress text disabled");
      return;
    }

    busy_text.setFont(font);
    busy_text.setString("Rendering...");
    busy_text.setCharacterSize(TEXT_SIZE);

    help_text.setFont(font);
    help_text.setString(
        "Wheel        zoom at cursor\n"
        "Left drag    pan\n"
        "R            reset view\n"
        "1 2 3 4      Mandelbrot / Julia / rational Julia / Newton\n"
        "C            next palette\n"
        "S            save PNG snapshot\n"
        "H, F1        close this help"
    );
    help_text.setCharacterSize(HELP_TEXT_SIZE);
  }

  // ===== EVENT HANDLING =====
  void dispatch(sf::Event const &event) {
    switch (event.type) {
    case sf::Event::Closed:
      window.close();
      break;
    case sf::Event::MouseWheelScrolled:
      zoomAt(event.mouseWheelScroll.x, event.mouseWheelScroll.y,
             event.mouseWheelScroll.delta > 0 ? ZOOM_STEP : 1.0 / ZOOM_STEP);
      break;
    case sf::Event::MouseButtonPressed:
      if (event.mouseButton.button == sf::Mouse::Left) {
        drag_anchor = sf::Vector2i{event.mouseButton.x, event.mouseButton.y};
      }
      break;
    case sf::Event::MouseButtonReleased:
      if (event.mouseButton.button == sf::Mouse::Left) {
        drag_anchor.reset();
        if (pending_render) {
          render();
        }
      }
      break;
    case sf::Event::MouseMoved:
      if (drag_anchor) {
        auto const to = sf::Vector2i{event.mouseMove.x, event.mouseMove.y};
        panBy(to - *drag_anchor);
        drag_anchor = to;
      }
      break;
    case sf::Event::Resized:
      width = std::max(1u, event.size.width);
      height = std::max(1u, event.size.height);
      resizeCanvas();
      render();
      break;
    case sf::Event::KeyPressed:
      onKey(event.key.code);
      break;
    default:
      break;
    }
  }

  void onKey(sf::Keyboard::Key key) {
    if (key >= sf::Keyboard::Num1 && key <= sf::Keyboard::Num4) {
      selectVariant(static_cast<std::size_t>(key - sf::Keyboard::Num1));
    } else if (key == sf::Keyboard::R) {
      resetView();
    } else if (key == sf::Keyboard::C) {
      current_palette = (current_palette + 1) % palettes.size();
      render();
    } else if (key == sf::Keyboard::S) {
      saveSnapshot();
    } else if (key == sf::Keyboard::H || key == sf::Keyboard::F1) {
      show_help = !show_help;
    }
  }

  // ===== NAVIGATION =====
  [[nodiscard]] auto fitScale() const -> double { return FIT_SPAN / std::min(width, height); }

  [[nodiscard]] auto viewport() const -> fracit::grid {
    return fracit::grid::centered(
        center, scale * (width - 1), static_cast<int>(width), static_cast<int>(height)
    );
  }

  // Keeps the plane point under the cursor fixed.
  void zoomAt(int x, int y, double factor) {
    auto const anchor = viewport().at(x, y).value_or(center);
    center = anchor + (center - anchor) * factor;
    scale *= factor;
    render();
  }

  void panBy(sf::Vector2i delta) {
    center -= fracit::point{delta.x * scale, -delta.y * scale};
    pending_render = std::chrono::steady_clock::now() + PAN_SETTLE;
  }

  void resetView() {
    center = variants[current_variant].center;
    scale = fitScale();
    render();
  }

  void selectVariant(std::size_t index) {
    if (index >= variants.size() || index == current_variant) {
      return;
    }
    current_variant = index;
    spdlog::info("viewer: switched to {}", variants[index].name);
    resetView();
  }

  // ===== RENDERING =====
  void render() {
    pending_render.reset();
    busy = true;
    draw();

    auto const start_time = std::chrono::steady_clock::now();
    auto const rendered = renderVariant();
    auto const elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time
    );

    if (rendered) {
      texture.update(image);
      spdlog::info(
          "viewer: {} around ({}, {}) at {:.3g} per pixel in {}ms",
          variants[current_variant].name, center.real(), center.imag(), scale, elapsed.count()
      );
    }
    busy = false;
    window.setTitle(std::format(
        "fracit [{}] [{}] {}ms, H for help", variants[current_variant].name,
        palettes[current_palette].name, elapsed.count()
    ));
  }

  bool renderVariant() {
    auto &variant = variants[current_variant];
    auto const domain = viewport();

    auto store = fracit::run(
        domain, *variant.fractal, variant.max_iterations, thread_pool->get_scheduler()
    );
    if (!store) {
      spdlog::error("viewer: {} failed: {}", variant.name, store.error().message);
      return false;
    }

    auto const &histogram = store->histogram();
    spdlog::debug(
        "viewer: {} of {} samples bounded", histogram.back(), store->size()
    );

    // Colour rows in parallel; every row owns its own pixels.
    auto const &palette = *palettes[current_palette].palette;
    auto const &config = variant.fractal->config();
    auto const &results = *store;
    auto sender = stdexec::bulk_chunked(
        stdexec::schedule(thread_pool->get_scheduler()),
        stdexec::par,
        static_cast<std::size_t>(height),
        [&](std::size_t begin, std::size_t end) {
          for (auto y = begin; y != end; ++y) {
            auto const row = results.row(static_cast<int>(y));
            for (std::size_t x = 0; x != row.size(); ++x) {
              auto const c = palette.color(row[x], config);
              image.setPixel(x, y, sf::Color{c.r, c.g, c.b});
            }
          }
        }
    );
    stdexec::sync_wait(std::move(sender));
    return true;
  }

  void saveSnapshot() {
    auto const name = std::format("fracit-{}.png", ++snapshot_count);
    if (image.saveToFile(name)) {
      spdlog::info("viewer: saved {}", name);
    } else {
      spdlog::error("viewer: could not write {}", name);
    }
  }

  // ===== UI MANAGEMENT =====
  void draw() {
    window.clear();
    window.draw(sprite);
    if (busy && font_loaded) {
      drawPanel(busy_text, sf::Color(0, 0, 0, 160));
    }
    if (show_help && font_loaded) {
      drawPanel(help_text, sf::Color(30, 30, 40, 240));
    }
    window.display();
  }

  // Draws `text` centred in the window on a padded backdrop.
  void drawPanel(sf::Text &text, sf::Color backdrop) {
    auto const bounds = text.getLocalBounds();
    auto const origin = sf::Vector2f{
        std::round((width - bounds.width) / 2.f), std::round((height - bounds.height) / 2.f)
    };
    sf::RectangleShape panel({bounds.width + 2 * PANEL_PADDING, bounds.height + 2 * PANEL_PADDING});
    panel.setPosition(origin.x - PANEL_PADDING, origin.y - PANEL_PADDING);
    panel.setFillColor(backdrop);
    panel.setOutlineColor(sf::Color(100, 100, 120));
    panel.setOutlineThickness(1.f);
    window.draw(panel);

    text.setPosition(origin.x - bounds.left, origin.y - bounds.top);
    window.draw(text);
  }
};

int main() {
  auto stderr_logger = spdlog::stderr_color_mt("stderr_logger");
  spdlog::set_default_logger(stderr_logger);
  spdlog::cfg::load_env_levels();

  FractalViewer viewer;
  viewer.run();
  return 0;
}
