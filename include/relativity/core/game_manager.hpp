/**
 * @fileoverview game_manager.hpp
 * @brief High-level controller for the native front-end: window loop, input and drawing.
 */

#pragma once

#include <SFML/System/Time.hpp>

#include "relativity/core/simulator.hpp"
#include "relativity/physics/launch.hpp"
#include "relativity/rendering/renderer.hpp"
#include "relativity/visuals/gravity_grid.hpp"

/**
 * @class GameManager
 * @brief Orchestrates the main loop and translates input into Simulator commands.
 *
 * Controls:
 * - Menu: left click starts, Esc quits
 * - Aiming: press, drag and release the left mouse button to launch
 * - Space pause, +/- rate, 0 reset rate, R retry, N next level,
 *   G toggle gravity grid, Esc back to menu
 */
class GameManager {
 public:
  explicit GameManager(const SystemConfig& cfg = defaultSystemConfig());

  /**
   * @brief Creates the window and loads resources.
   * @return true on success, false otherwise.
   */
  bool init();

  /**
   * @brief Runs until the window closes.
   */
  void run();

  /**
   * @brief Processes window events for the current frame.
   * @return false if the application should quit, true otherwise.
   */
  bool handleEvents();

  /**
   * @brief Renders the current frame.
   * @param fps The current frames-per-second.
   */
  void render(float fps);

 private:
  void handleKey(sf::Keyboard::Key key);
  void handleMousePressed(int x, int y);
  void handleMouseMoved(int x, int y);
  void handleMouseReleased();

  /** @brief Player position in pixels, or the screen centre without a level */
  Position playerScreenPosition() const;

  Renderer renderer;
  Simulator simulator;
  Visuals::GravityGrid grid;
  Physics::LaunchGesture gesture;

  bool running = true;
  bool showGrid = true;

  const float targetTPS = 60.0f;
  const sf::Time statsUpdateInterval = sf::seconds(0.5f);
  const sf::Time profilerPrintInterval = sf::seconds(10.0f);
};
