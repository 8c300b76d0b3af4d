#include "render.hpp"

#include "ui_font.hpp"
#include "version.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

namespace {

constexpr Color BG{12, 14, 20, 255};
constexpr Color HUD_BG{24, 28, 38, 255};
constexpr Color WHITE{235, 235, 235, 255};
constexpr Color GRAY{150, 155, 165, 255};
constexpr Color PLAYER_FILL{40, 150, 70, 255};
constexpr Color DRONE_FILL{170, 40, 45, 255};
constexpr Color DRONE_FROZEN_FILL{70, 90, 160, 255};

Color darker(Color c, int pct) {
    auto f = [&](uint8_t v) { return static_cast<uint8_t>(v * (100 - pct) / 100); };
    return {f(c.r), f(c.g), f(c.b), c.a};
}

int textWidth(const std::string& s, int scale) {
    return static_cast<int>(s.size()) * (GLYPH_W + 1) * scale;
}

} // namespace

Color cellColor(CellKind k) {
    switch (k) {
        case CellKind::Empty:  return {38, 42, 52, 255};
        case CellKind::Wall:   return {92, 96, 108, 255};
        case CellKind::Trap:   return {120, 50, 40, 255};
        case CellKind::Medkit: return {40, 110, 80, 255};
        case CellKind::Exit:   return {170, 140, 40, 255};
        case CellKind::Drone:  return DRONE_FILL;
        case CellKind::Helper: return {40, 120, 140, 255};
    }
    return {255, 0, 255, 255};
}

Color tensionColor(TensionLevel t) {
    switch (t) {
        case TensionLevel::Low:  return {120, 220, 140, 255};
        case TensionLevel::Mid:  return {240, 200, 90, 255};
        case TensionLevel::High: return {250, 90, 80, 255};
    }
    return WHITE;
}

Renderer::Renderer(int gridW, int gridH, int tileSize, bool vsync)
    : tile(std::clamp(tileSize, 24, 96)), vsyncEnabled(vsync) {
    mapW = gridW * tile;
    mapH = gridH * tile;
    winW = std::max(mapW, MIN_WINDOW_W);
    winH = mapH + HUD_HEIGHT;
    mapX = (winW - mapW) / 2;
}

Renderer::~Renderer() {
    shutdown();
}

bool Renderer::init() {
    if (renderer) return true;

    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "0"); // nearest-neighbor

    const std::string title = std::string(SIGNALVAULT_APPNAME) + " v" + SIGNALVAULT_VERSION;
    window = SDL_CreateWindow(title.c_str(),
                              SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              winW, winH,
                              SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
        return false;
    }

    Uint32 rFlags = SDL_RENDERER_ACCELERATED;
    if (vsyncEnabled) rFlags |= SDL_RENDERER_PRESENTVSYNC;
    renderer = SDL_CreateRenderer(window, -1, rFlags);
    if (!renderer) {
        std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
        SDL_DestroyWindow(window);
        window = nullptr;
        return false;
    }

    // Fixed logical size; SDL scales on resize and keeps pixels crisp.
    SDL_RenderSetLogicalSize(renderer, winW, winH);
    SDL_RenderSetIntegerScale(renderer, SDL_TRUE);
    SDL_SetRenderDrawBlendMode(renderer, SDL_BLENDMODE_BLEND);
    return true;
}

void Renderer::shutdown() {
    if (renderer) {
        SDL_DestroyRenderer(renderer);
        renderer = nullptr;
    }
    if (window) {
        SDL_DestroyWindow(window);
        window = nullptr;
    }
}

void Renderer::toggleFullscreen() {
    if (!window) return;
    fullscreen = !fullscreen;
    if (SDL_SetWindowFullscreen(window, fullscreen ? SDL_WINDOW_FULLSCREEN_DESKTOP : 0) != 0) {
        std::cerr << "SDL_SetWindowFullscreen failed: " << SDL_GetError() << "\n";
        fullscreen = !fullscreen;
    }
}

void Renderer::drawText(int x, int y, int scale, Color c, const std::string& text) {
    SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, c.a);

    int penX = x;
    for (char ch : text) {
        const Glyph5x7 g = glyph5x7(ch);
        for (int row = 0; row < GLYPH_H; ++row) {
            for (int col = 0; col < GLYPH_W; ++col) {
                if (!g.pixel(col, row)) continue;
                SDL_Rect px{penX + col * scale, y + row * scale, scale, scale};
                SDL_RenderFillRect(renderer, &px);
            }
        }
        penX += (GLYPH_W + 1) * scale;
    }
}

void Renderer::drawCell(int px, int py, char symbol, Color fill, Color ink) {
    SDL_Rect outer{px, py, tile, tile};
    SDL_SetRenderDrawColor(renderer, BG.r, BG.g, BG.b, 255);
    SDL_RenderFillRect(renderer, &outer);

    const Color edge = darker(fill, 35);
    SDL_Rect inner{px + 1, py + 1, tile - 2, tile - 2};
    SDL_SetRenderDrawColor(renderer, edge.r, edge.g, edge.b, 255);
    SDL_RenderFillRect(renderer, &inner);

    SDL_Rect body{px + 3, py + 3, tile - 6, tile - 6};
    SDL_SetRenderDrawColor(renderer, fill.r, fill.g, fill.b, 255);
    SDL_RenderFillRect(renderer, &body);

    if (symbol == ' ') return;

    const int scale = std::max(1, tile / 12);
    const int gw = GLYPH_W * scale;
    const int gh = GLYPH_H * scale;
    drawText(px + (tile - gw) / 2, py + (tile - gh) / 2, scale, ink, std::string(1, symbol));
}

void Renderer::drawHud(const RunSession& run) {
    const GameState& s = run.state();
    const int top = mapH;

    SDL_Rect hud{0, top, winW, HUD_HEIGHT};
    SDL_SetRenderDrawColor(renderer, HUD_BG.r, HUD_BG.g, HUD_BG.b, 255);
    SDL_RenderFillRect(renderer, &hud);

    const Mood mood = run.mood();

    // Status row.
    int x = 8;
    const int y = top + 8;
    const std::string diff = s.difficulty.name;
    drawText(x, y, 2, WHITE, diff);
    x += textWidth(diff, 2) + 16;

    const std::string hp = "HP " + std::to_string(s.player.health) + "/" + std::to_string(s.player.maxHealth);
    drawText(x, y, 2, s.player.health * 3 <= s.player.maxHealth ? tensionColor(TensionLevel::High) : WHITE, hp);
    x += textWidth(hp, 2) + 16;

    const std::string turn = "TURN " + std::to_string(s.turn);
    drawText(x, y, 2, WHITE, turn);
    x += textWidth(turn, 2) + 16;

    drawText(x, y, 2, tensionColor(mood.tension), std::string("TENSION ") + tensionLevelName(mood.tension));

    // Health pips.
    const int pip = 10;
    for (int i = 0; i < s.player.maxHealth; ++i) {
        SDL_Rect r{8 + i * (pip + 4), top + 30, pip, pip};
        const Color c = i < s.player.health ? PLAYER_FILL : darker(GRAY, 50);
        SDL_SetRenderDrawColor(renderer, c.r, c.g, c.b, 255);
        SDL_RenderFillRect(renderer, &r);
    }

    // Message log, newest last, wrapped to the window width.
    const int lineH = (GLYPH_H + 2);
    const int maxChars = (winW - 16) / (GLYPH_W + 1);
    std::vector<std::string> lines;
    for (const std::string& msg : run.log().lines()) {
        for (std::string& l : wrapText(msg, maxChars)) lines.push_back(std::move(l));
    }

    const int logTop = top + 48;
    const int maxLines = (HUD_HEIGHT - 52) / lineH;
    const size_t first = lines.size() > static_cast<size_t>(maxLines) ? lines.size() - static_cast<size_t>(maxLines) : 0;
    int ly = logTop;
    for (size_t i = first; i < lines.size(); ++i) {
        drawText(8, ly, 1, i + 1 == lines.size() ? WHITE : GRAY, lines[i]);
        ly += lineH;
    }
}

void Renderer::drawBanner(const std::string& text) {
    const int scale = 2;
    const int w = textWidth(text, scale) + 24;
    const int h = GLYPH_H * scale + 20;
    SDL_Rect r{(winW - w) / 2, (mapH - h) / 2, w, h};
    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 210);
    SDL_RenderFillRect(renderer, &r);
    drawText(r.x + 12, r.y + 10, scale, WHITE, text);
}

void Renderer::render(const RunSession& run, const std::string& banner) {
    if (!renderer) return;

    SDL_SetRenderDrawColor(renderer, BG.r, BG.g, BG.b, 255);
    SDL_RenderClear(renderer);

    const GameState& s = run.state();
    for (int y = 0; y < s.grid.height; ++y) {
        for (int x = 0; x < s.grid.width; ++x) {
            const Vec2i p{x, y};
            const int px = mapX + x * tile;
            const int py = y * tile;
            const CellKind k = s.grid.at(p);
            drawCell(px, py, cellSymbol(k), cellColor(k), WHITE);
        }
    }

    for (const Drone& d : s.drones) {
        const Color fill = d.frozenTurns > 0 ? DRONE_FROZEN_FILL : DRONE_FILL;
        drawCell(mapX + d.pos.x * tile, d.pos.y * tile, cellSymbol(CellKind::Drone), fill, WHITE);
    }

    drawCell(mapX + s.player.pos.x * tile, s.player.pos.y * tile, PLAYER_SYMBOL, PLAYER_FILL, WHITE);

    drawHud(run);
    if (!banner.empty()) drawBanner(banner);

    SDL_RenderPresent(renderer);
}
