#ifndef ENGINE_BANNER_HPP
#define ENGINE_BANNER_HPP

#include <string>

#include "engine/engine.hpp"

namespace engine {

// What the security status banner shows.
struct BannerStatus {
  bool sandboxing = true;
  bool network_allowed = false;
  bool subprocess_blocked = true;
  bool filesystem_confined = true;
  bool env_clean = true;
  bool resource_limits = true;
  bool trusted_model = false;
  std::string limiter;
  std::string audit;

  static BannerStatus FromEngine(const Engine& engine, bool trusted_model);
};

// Renders the banner, with box-drawing characters if unicode is set and
// plain ASCII otherwise. Every line ends with a newline.
std::string RenderBanner(const BannerStatus& status, bool unicode);

// True if the locale of the terminal can display box-drawing characters.
bool UnicodeTerminal();

}  // namespace engine

#endif
