#pragma once

// Single SDL include point for the window front end.
// SDL_MAIN_HANDLED keeps main() ours, so no SDLmain link is needed;
// main.cpp calls SDL_SetMainReady() before SDL_Init().
// Nothing under the engine (grid, mapgen, turn, mood, ...) includes this.
#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif

#include <SDL.h>
