#include "relativity/rendering/renderer.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "relativity/components/basic.hpp"
#include "relativity/core/profile.hpp"
#include "relativity/visuals/hud_format.hpp"

namespace {

    const sf::Color Background(8, 10, 22);
    const sf::Color TextColor(230, 242, 255);
    const sf::Color PanelColor(20, 26, 48, 190);

    // Bodies smaller than this are still drawn visibly
    constexpr float MinBodyPixels = 2.0f;

} // namespace

Renderer::Renderer(unsigned int screenWidth, unsigned int screenHeight)
    : window()
    , font()
    , screenWidth(screenWidth)
    , screenHeight(screenHeight)
{
}

bool Renderer::init() {
    window.create(sf::VideoMode(screenWidth, screenHeight), "Relativity");
    window.setVerticalSyncEnabled(true);

    if (!font.loadFromFile("assets/fonts/arial.ttf")) {
        std::cerr << "Failed to load font assets/fonts/arial.ttf\n";
        return false;
    }
    return true;
}

void Renderer::clear() {
    window.clear(Background);
}

void Renderer::present() {
    window.display();
}

sf::Color Renderer::toSf(const Visuals::Rgba& c) {
    Components::Color const q = Visuals::toColor(c);
    return sf::Color(q.r, q.g, q.b, q.a);
}

void Renderer::renderBodies(const entt::registry& registry, const Simulation::Coordinates& coords) {
    PROFILE_SCOPE("Renderer::renderBodies");

    auto view = registry.view<const Components::Position, const Components::Radius, const Components::Color>();
    for (auto [entity, pos, radius, color] : view.each()) {
        Position const px = coords.worldToScreen(pos);
        float const r = std::max(MinBodyPixels, static_cast<float>(coords.metersToPixels(radius.value)));

        sf::CircleShape circle(r);
        circle.setOrigin(r, r);
        circle.setPosition(static_cast<float>(px.x), static_cast<float>(px.y));
        circle.setFillColor(sf::Color(color.r, color.g, color.b, color.a));

        if (registry.all_of<Components::Destination>(entity)) {
            circle.setOutlineThickness(2.0f);
            circle.setOutlineColor(sf::Color(200, 255, 210));
        }
        window.draw(circle);

        if (const auto* label = registry.try_get<Components::Label>(entity)) {
            if (!registry.all_of<Components::Player>(entity)) {
                renderText(label->text, static_cast<float>(px.x) + r + 4.0f, static_cast<float>(px.y) - 8.0f,
                           sf::Color(180, 190, 210), 12);
            }
        }
    }
}

void Renderer::renderTrail(const entt::registry& registry) {
    PROFILE_SCOPE("Renderer::renderTrail");

    auto view = registry.view<const Components::TrailBuffer>();
    for (auto [entity, trail] : view.each()) {
        if (trail.points.size() < 2) {
            continue;
        }
        sf::VertexArray strip(sf::LineStrip, trail.points.size());
        std::size_t i = 0;
        for (const auto& [point, color] : trail.points) {
            strip[i].position = sf::Vector2f(static_cast<float>(point.x), static_cast<float>(point.y));
            strip[i].color = sf::Color(color.r, color.g, color.b, color.a);
            ++i;
        }
        window.draw(strip);
    }
}

void Renderer::renderGrid(const Visuals::GravityGrid& grid) {
    PROFILE_SCOPE("Renderer::renderGrid");

    const auto& segments = grid.segments();
    sf::VertexArray lines(sf::Lines, segments.size() * 2);
    for (std::size_t i = 0; i < segments.size(); ++i) {
        sf::Color const c = toSf(segments[i].color);
        lines[2 * i].position = sf::Vector2f(static_cast<float>(segments[i].from.x), static_cast<float>(segments[i].from.y));
        lines[2 * i].color = c;
        lines[2 * i + 1].position = sf::Vector2f(static_cast<float>(segments[i].to.x), static_cast<float>(segments[i].to.y));
        lines[2 * i + 1].color = c;
    }
    window.draw(lines);
}

void Renderer::renderHUD(const PlayerReadout& readout,
                         double rate,
                         Simulation::GameState state,
                         const std::string& levelName)
{
    // Player panel, top left
    sf::RectangleShape playerPanel(sf::Vector2f(190.f, 100.f));
    playerPanel.setPosition(10.f, 10.f);
    playerPanel.setFillColor(PanelColor);
    window.draw(playerPanel);

    renderText(Visuals::formatPlayerTime(readout.playerClock), 20.f, 16.f, TextColor);
    renderText(Visuals::formatGamma("γ_v", readout.velocityGamma), 20.f, 38.f,
               toSf(Visuals::hudGammaColor(readout.velocityGamma)));
    renderText(Visuals::formatGamma("γ_g", readout.gravitationalGamma), 20.f, 60.f,
               toSf(Visuals::hudGammaColor(readout.gravitationalGamma)));
    renderText(Visuals::formatVelocityFraction(readout.speed), 20.f, 82.f, TextColor);

    // Observer panel, top right
    float const right = static_cast<float>(screenWidth) - 200.f;
    sf::RectangleShape observerPanel(sf::Vector2f(190.f, 34.f));
    observerPanel.setPosition(right, 10.f);
    observerPanel.setFillColor(PanelColor);
    window.draw(observerPanel);
    renderText(Visuals::formatObserverTime(readout.observerClock), right + 10.f, 16.f, TextColor);

    // Status line, bottom left
    std::ostringstream status;
    status << levelName << "  |  " << Simulation::stateName(state) << "  |  " << Visuals::formatSimRate(rate);
    renderText(status.str(), 20.f, static_cast<float>(screenHeight) - 30.f, TextColor);

    if (state == Simulation::GameState::Finished) {
        renderText("Destination reached!  N: next level   R: retry", 20.f, static_cast<float>(screenHeight) - 56.f,
                   sf::Color(140, 255, 170));
    } else if (state == Simulation::GameState::Failed) {
        renderText("Crashed", 20.f, static_cast<float>(screenHeight) - 56.f, sf::Color(255, 110, 90));
    }
}

void Renderer::renderMenu() {
    float const cx = static_cast<float>(screenWidth) / 2.f;
    float const cy = static_cast<float>(screenHeight) / 2.f;
    renderText("RELATIVITY", cx - 110.f, cy - 80.f, TextColor, 40);
    renderText("Click to start", cx - 55.f, cy, sf::Color(180, 190, 210), 18);
    renderText("Drag to aim and launch. Space: pause  +/-: rate  G: grid  R: retry  Esc: menu",
               cx - 300.f, cy + 40.f, sf::Color(140, 150, 170), 14);
}

void Renderer::renderAim(const Position& origin, const Physics::LaunchGesture& gesture) {
    if (gesture.phase() == Physics::LaunchGesture::Phase::Idle) {
        return;
    }

    double const length = 60.0 + 240.0 * gesture.power();
    Position const tip = origin + gesture.aim() * length;

    sf::Vertex line[2] = {
        sf::Vertex(sf::Vector2f(static_cast<float>(origin.x), static_cast<float>(origin.y)), sf::Color(255, 255, 255, 200)),
        sf::Vertex(sf::Vector2f(static_cast<float>(tip.x), static_cast<float>(tip.y)), sf::Color(255, 255, 255, 60))
    };
    window.draw(line, 2, sf::Lines);

    if (gesture.phase() == Physics::LaunchGesture::Phase::Launching) {
        float const power = static_cast<float>(gesture.power());
        sf::RectangleShape back(sf::Vector2f(200.f, 10.f));
        back.setPosition(static_cast<float>(screenWidth) / 2.f - 100.f, static_cast<float>(screenHeight) - 24.f);
        back.setFillColor(PanelColor);
        window.draw(back);

        sf::RectangleShape bar(sf::Vector2f(200.f * power, 10.f));
        bar.setPosition(back.getPosition());
        bar.setFillColor(sf::Color(255, static_cast<sf::Uint8>(255.f * (1.f - power)), 0, 230));
        window.draw(bar);
    }
}

void Renderer::renderFPS(float fps) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(1) << fps << " FPS";
    renderText(ss.str(), static_cast<float>(screenWidth) - 90.f, static_cast<float>(screenHeight) - 30.f,
               sf::Color(120, 130, 150), 12);
}

void Renderer::renderText(const std::string& text, float x, float y, sf::Color color, unsigned int size) {
    sf::Text sfText;
    sfText.setFont(font);
    sfText.setString(sf::String::fromUtf8(text.begin(), text.end()));
    sfText.setCharacterSize(size);
    sfText.setFillColor(color);
    sfText.setPosition(x, y);
    window.draw(sfText);
}
