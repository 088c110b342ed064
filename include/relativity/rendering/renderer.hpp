/**
 * @file renderer.hpp
 * @brief Graphics rendering using SFML
 *
 * This system handles:
 * - Body rendering (player, planets, destination) as circles
 * - The gamma-colored player trail
 * - The warped gravity grid
 * - HUD readouts, menu and aim indicator
 *
 * Uses SFML for window management and drawing operations. Everything here
 * reads simulation state and never modifies it.
 */

#ifndef RELATIVITY_RENDERER_HPP
#define RELATIVITY_RENDERER_HPP

#include <string>

#include <entt/entt.hpp>
#include <SFML/Graphics.hpp>

#include "relativity/core/coordinates.hpp"
#include "relativity/core/game_state.hpp"
#include "relativity/core/simulator.hpp"
#include "relativity/physics/launch.hpp"
#include "relativity/visuals/color_map.hpp"
#include "relativity/visuals/gravity_grid.hpp"

class Renderer {
public:
    /**
     * @brief Constructs renderer with specified screen dimensions
     * @param screenWidth Width of render window in pixels
     * @param screenHeight Height of render window in pixels
     */
    Renderer(unsigned int screenWidth, unsigned int screenHeight);

    /**
     * @brief Initializes SFML window and loads resources
     * @return true if initialization successful, false otherwise
     */
    bool init();

    /** @brief Clears screen to the background color */
    void clear();

    /** @brief Presents rendered frame to screen */
    void present();

    /** @brief Draws every body with Position, Radius and Color */
    void renderBodies(const entt::registry& registry, const Simulation::Coordinates& coords);

    /** @brief Draws the player trail as a colored line strip */
    void renderTrail(const entt::registry& registry);

    void renderGrid(const Visuals::GravityGrid& grid);

    /**
     * @brief Draws the player and observer panels plus status line
     */
    void renderHUD(const PlayerReadout& readout,
                   double rate,
                   Simulation::GameState state,
                   const std::string& levelName);

    /** @brief Title screen shown in the Menu state */
    void renderMenu();

    /**
     * @brief Aim line and power bar while a launch gesture is active
     * @param origin Player position in pixels
     */
    void renderAim(const Position& origin, const Physics::LaunchGesture& gesture);

    /** @brief Renders FPS counter in the top-right corner */
    void renderFPS(float fps);

    /**
     * @brief Renders UTF-8 text at the specified pixel position
     */
    void renderText(const std::string& text, float x, float y,
                    sf::Color color = sf::Color::White, unsigned int size = 16);

    sf::RenderWindow& getWindow() { return window; }

private:
    static sf::Color toSf(const Visuals::Rgba& c);

    sf::RenderWindow window;
    sf::Font font;
    unsigned int screenWidth;
    unsigned int screenHeight;
};

#endif // RELATIVITY_RENDERER_HPP
