/**
 * @fileoverview game_manager.cpp
 * @brief Implementation of GameManager.
 */

#include "relativity/core/game_manager.hpp"

#include <iostream>

#include <SFML/System/Clock.hpp>
#include <SFML/Window/Event.hpp>

#include "relativity/components/basic.hpp"
#include "relativity/core/debug.hpp"
#include "relativity/core/profile.hpp"

using Simulation::AppState;
using Simulation::GameState;

GameManager::GameManager(const SystemConfig& cfg)
    : renderer(cfg.ScreenWidthPixels, cfg.ScreenHeightPixels),
      simulator(cfg),
      grid(cfg, simulator.getCoordinates())
{
}

bool GameManager::init() {
  if (!renderer.init()) {
    std::cerr << "Renderer initialization failed." << std::endl;
    return false;
  }
  return true;
}

void GameManager::run() {
  sf::Clock frameClock;
  sf::Time statsAccumulator = sf::Time::Zero;
  sf::Time simulationAccumulator = sf::Time::Zero;
  sf::Time timeSinceLastProfilerPrint = sf::Time::Zero;
  const sf::Time fixedTickDt = sf::seconds(1.f / targetTPS);

  int frameCount = 0;
  float actualFPS = 0.0f;

  running = true;
  while (running && renderer.getWindow().isOpen()) {
    sf::Time const dt = frameClock.restart();
    simulationAccumulator += dt;
    statsAccumulator += dt;
    timeSinceLastProfilerPrint += dt;

    if (!handleEvents()) {
      break;
    }

    // Fixed timestep, capped so a stall cannot spiral
    const int MAX_TICKS_PER_FRAME = 5;
    int ticksThisFrame = 0;
    while (simulationAccumulator >= fixedTickDt && ticksThisFrame < MAX_TICKS_PER_FRAME) {
      simulator.tick(fixedTickDt.asSeconds());
      simulationAccumulator -= fixedTickDt;
      ticksThisFrame++;
    }
    if (simulationAccumulator >= fixedTickDt) {
      simulationAccumulator = sf::Time::Zero;
    }

    render(actualFPS);
    frameCount++;

    if (statsAccumulator >= statsUpdateInterval) {
      float const elapsedSeconds = statsAccumulator.asSeconds();
      actualFPS = (elapsedSeconds > 0) ? static_cast<float>(frameCount) / elapsedSeconds : 0.0f;
      frameCount = 0;
      statsAccumulator = sf::Time::Zero;
    }

    if (timeSinceLastProfilerPrint >= profilerPrintInterval) {
      Profiling::Profiler::printStats(std::cout);
      Profiling::Profiler::reset();
      timeSinceLastProfilerPrint = sf::Time::Zero;
    }
  }

  renderer.getWindow().close();
}

bool GameManager::handleEvents() {
  sf::RenderWindow& window = renderer.getWindow();

  sf::Event event;
  while (window.pollEvent(event)) {
    if (event.type == sf::Event::Closed) {
      running = false;
    } else if (event.type == sf::Event::KeyPressed) {
      handleKey(event.key.code);
    } else if (event.type == sf::Event::MouseButtonPressed &&
               event.mouseButton.button == sf::Mouse::Left) {
      handleMousePressed(event.mouseButton.x, event.mouseButton.y);
    } else if (event.type == sf::Event::MouseMoved) {
      handleMouseMoved(event.mouseMove.x, event.mouseMove.y);
    } else if (event.type == sf::Event::MouseButtonReleased &&
               event.mouseButton.button == sf::Mouse::Left) {
      handleMouseReleased();
    }
  }

  return running;
}

void GameManager::handleKey(sf::Keyboard::Key key) {
  if (simulator.appState() == AppState::Menu) {
    if (key == sf::Keyboard::Escape) {
      running = false;
    } else if (key == sf::Keyboard::Enter) {
      simulator.enterGame();
    }
    return;
  }

  switch (key) {
    case sf::Keyboard::Escape:
      gesture.cancel();
      simulator.exitToMenu();
      break;
    case sf::Keyboard::Space:
      simulator.togglePause();
      break;
    case sf::Keyboard::Equal:
    case sf::Keyboard::Add:
      simulator.increaseRate();
      break;
    case sf::Keyboard::Hyphen:
    case sf::Keyboard::Subtract:
      simulator.decreaseRate();
      break;
    case sf::Keyboard::Num0:
    case sf::Keyboard::Numpad0:
      simulator.resetRate();
      break;
    case sf::Keyboard::R:
      gesture.cancel();
      simulator.retry();
      break;
    case sf::Keyboard::N:
      gesture.cancel();
      simulator.advanceLevel();
      break;
    case sf::Keyboard::G:
      showGrid = !showGrid;
      break;
    default:
      break;
  }
}

void GameManager::handleMousePressed(int x, int y) {
  if (simulator.appState() == AppState::Menu) {
    simulator.enterGame();
    return;
  }
  if (simulator.gameState() != GameState::Paused) {
    return;
  }
  Position const cursor(static_cast<double>(x), static_cast<double>(y));
  gesture.press(displacement(playerScreenPosition(), cursor));
}

void GameManager::handleMouseMoved(int x, int y) {
  if (gesture.phase() == Physics::LaunchGesture::Phase::Idle) {
    return;
  }
  Position const cursor(static_cast<double>(x), static_cast<double>(y));
  double const drag = playerScreenPosition().dist(cursor);
  double const maxDrag = simulator.getConfig().LaunchMaxDragFraction * simulator.getConfig().ScreenWidthPixels;
  gesture.drag(Physics::powerFromDrag(drag, maxDrag));
}

void GameManager::handleMouseReleased() {
  if (auto velocity = gesture.release()) {
    simulator.launchWithVelocity(*velocity);
  }
}

Position GameManager::playerScreenPosition() const {
  const auto& registry = simulator.getRegistry();
  entt::entity const p = simulator.player();
  if (p == entt::null) {
    const auto& cfg = simulator.getConfig();
    return Position(cfg.ScreenWidthPixels / 2.0, cfg.ScreenHeightPixels / 2.0);
  }
  return simulator.getCoordinates().worldToScreen(registry.get<Components::Position>(p));
}

void GameManager::render(float fps) {
  PROFILE_SCOPE("GameManager::render");

  renderer.clear();

  if (simulator.appState() == AppState::Menu) {
    renderer.renderMenu();
  } else {
    if (showGrid) {
      grid.rebuild(simulator.masses());
      renderer.renderGrid(grid);
    }
    renderer.renderTrail(simulator.getRegistry());
    renderer.renderBodies(simulator.getRegistry(), simulator.getCoordinates());
    renderer.renderAim(playerScreenPosition(), gesture);
    renderer.renderHUD(simulator.readout(),
                       simulator.simRate().value(),
                       simulator.gameState(),
                       simulator.getLevels().current().name());
  }

  renderer.renderFPS(fps);
  renderer.present();
}
