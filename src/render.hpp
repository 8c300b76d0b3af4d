#pragma once

#include "sdl.hpp"

#include "common.hpp"
#include "grid.hpp"
#include "mood.hpp"
#include "session.hpp"

#include <string>

// SDL2 window renderer: one coloured tile per cell with its map symbol in
// the built-in 5x7 font, and a HUD strip below the map with health, turn,
// tension and the message log.
class Renderer {
public:
    Renderer(int gridW, int gridH, int tileSize, bool vsync);
    ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    bool init();
    void shutdown();

    // `banner` is drawn over the map when not empty (end-of-run prompt).
    void render(const RunSession& run, const std::string& banner);

    void toggleFullscreen();

    static constexpr int HUD_HEIGHT = 170;
    static constexpr int MIN_WINDOW_W = 560;

private:
    void drawCell(int px, int py, char symbol, Color fill, Color ink);
    void drawHud(const RunSession& run);
    void drawBanner(const std::string& text);
    void drawText(int x, int y, int scale, Color c, const std::string& text);

    int tile = 48;
    int mapW = 0;
    int mapH = 0;
    int winW = 0;
    int winH = 0;
    int mapX = 0;
    bool vsyncEnabled = true;
    bool fullscreen = false;

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;
};

// Fill colour of a cell kind (player and drones use their own entries).
Color cellColor(CellKind k);
Color tensionColor(TensionLevel t);
