#include "difficulty.hpp"
#include "drone_ai.hpp"
#include "game_state.hpp"
#include "grid.hpp"
#include "input.hpp"
#include "mapgen.hpp"
#include "mood.hpp"
#include "narrator.hpp"
#include "render_text.hpp"
#include "replay.hpp"
#include "replay_runner.hpp"
#include "rng.hpp"
#include "session.hpp"
#include "settings.hpp"
#include "sfx.hpp"
#include "stats.hpp"
#include "turn.hpp"
#include "ui_font.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

std::filesystem::path tempPath(const std::string& name) {
    return std::filesystem::temp_directory_path() / ("signalvault_test_" + name);
}

Difficulty testDifficulty(int w, int h, int startHp = 4, int maxHp = 5) {
    Difficulty d;
    d.key = "test";
    d.name = "Test";
    d.width = w;
    d.height = h;
    d.startHealth = startHp;
    d.maxHealth = maxHp;
    d.helperFreezeTurns = 2;
    return d;
}

// Hand-built board: exit in the far corner, everything else Empty.
Grid openGrid(int w, int h) {
    Grid g(w, h);
    g.at(g.exit()) = CellKind::Exit;
    return g;
}

void test_rng_reproducible() {
    RNG rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RNG sequence mismatch at index " + std::to_string(i));
    }

    for (int i = 0; i < 1000; ++i) {
        int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
    }
}

void test_enum_names() {
    expect(std::string(cellKindName(CellKind::Medkit)) == "Medkit", "cellKindName");
    expect(cellSymbol(CellKind::Helper) == 'H', "helper symbol");
    expect(std::string(turnTagName(TurnTag::Helped)) == "Helped", "turnTagName");
    expect(std::string(directionName(Direction::Left)) == "left", "directionName");
    expect(directionCode(Direction::Down) == 'D', "directionCode");
    expect(parseDirection("UP") == Direction::Up && !parseDirection("w").has_value(), "parseDirection");
    expect(std::string(mapGenErrorName(MapGenError::UnsolvableLayout)) == "UnsolvableLayout", "mapGenErrorName");
    expect(std::string(tensionLevelName(TensionLevel::Mid)) == "mid", "tensionLevelName");
    expect(std::string(inputCommandName(InputCommand::Quit)) == "quit", "inputCommandName");
    expect(std::string(runResultName(RunResult::Defeat)) == "defeat", "runResultName");
}

void test_difficulty_presets() {
    for (int i = 0; i < DIFFICULTY_COUNT; ++i) {
        const Difficulty& d = difficultyPreset(static_cast<DifficultyId>(i));
        std::string err;
        expect(validateDifficulty(d, &err), "preset " + d.key + " invalid: " + err);
        expect(d.startHealth <= d.maxHealth, "preset " + d.key + " starts above max health");
    }

    expect(parseDifficultyId("n") == DifficultyId::Normal, "parseDifficultyId n");
    expect(parseDifficultyId("HARD") == DifficultyId::Hard, "parseDifficultyId HARD");
    expect(parseDifficultyId(" easy ") == DifficultyId::Easy, "parseDifficultyId with spaces");
    expect(!parseDifficultyId("x").has_value(), "parseDifficultyId rejects x");
    expect(!parseDifficultyId("").has_value(), "parseDifficultyId rejects empty");
}

void test_mapgen_presets_solvable() {
    for (int i = 0; i < DIFFICULTY_COUNT; ++i) {
        const Difficulty& d = difficultyPreset(static_cast<DifficultyId>(i));
        for (uint32_t seed = 1; seed <= 200; ++seed) {
            RNG rng(seed);
            Grid g;
            MapGenReport rep;
            std::string err;
            const std::string tag = d.key + " seed " + std::to_string(seed);
            if (!generateMap(d, rng, g, MapGenOptions{}, &rep, &err)) {
                expect(false, "mapgen failed for " + tag + ": " + err);
                continue;
            }

            expect(g.width == d.width && g.height == d.height, "mapgen size for " + tag);
            expect(g.at(g.start()) == CellKind::Empty, "start not empty for " + tag);
            expect(g.at(g.exit()) == CellKind::Exit, "exit not in corner for " + tag);
            expect(g.count(CellKind::Exit) == 1, "exit count for " + tag);
            expect(g.count(CellKind::Wall) == d.wallCount, "wall count for " + tag);
            expect(g.count(CellKind::Trap) == d.trapCount, "trap count for " + tag);
            expect(g.count(CellKind::Medkit) == d.medkitCount, "medkit count for " + tag);
            expect(g.count(CellKind::Drone) == d.droneCount, "drone count for " + tag);
            expect(g.count(CellKind::Helper) == d.helperCount, "helper count for " + tag);
            expect(pathExists(g, g.start(), g.exit()), "no path to exit for " + tag);
            expect(rep.attempts >= 1 && rep.attempts <= MapGenOptions{}.maxAttempts, "attempt count for " + tag);
        }
    }
}

void test_mapgen_deterministic() {
    const Difficulty& d = difficultyPreset(DifficultyId::Hard);
    RNG a(777u);
    RNG b(777u);
    Grid ga;
    Grid gb;
    expect(generateMap(d, a, ga), "mapgen a");
    expect(generateMap(d, b, gb), "mapgen b");
    expect(ga.cells == gb.cells, "same seed gives a different map");
    expect(a.state == b.state, "same seed leaves different RNG states");
}

void test_mapgen_invalid_configuration() {
    Difficulty d = testDifficulty(3, 3);
    d.wallCount = 8; // 7 free cells

    RNG rng(1u);
    Grid g;
    MapGenReport rep;
    std::string err;
    expect(!generateMap(d, rng, g, MapGenOptions{}, &rep, &err), "overfull map should fail");
    expect(rep.error == MapGenError::InvalidConfiguration, "overfull map error kind");
    expect(!err.empty(), "overfull map error message");
    expect(g.width == 0 && g.cells.empty(), "failed mapgen touched the output grid");
}

void test_mapgen_unsolvable_layout() {
    // 2x2: the only free cells are both exit neighbours, so two walls always seal it.
    Difficulty d = testDifficulty(2, 2, 1, 1);
    d.wallCount = 2;

    RNG rng(5u);
    Grid g;
    MapGenReport rep;
    std::string err;
    expect(!generateMap(d, rng, g, MapGenOptions{}, &rep, &err), "sealed map should fail");
    expect(rep.error == MapGenError::UnsolvableLayout, "sealed map error kind");
    expect(rep.attempts == MapGenOptions{}.maxAttempts, "sealed map should use every attempt");
}

void test_game_state_lifts_drones() {
    Grid g = openGrid(4, 4);
    g.at(2, 0) = CellKind::Drone;
    g.at(1, 2) = CellKind::Drone;

    const GameState s = makeGameState(testDifficulty(4, 4), g, 9u);
    expect(s.drones.size() == 2, "two drones lifted");
    expect(s.drones[0].pos == Vec2i{2, 0} && s.drones[1].pos == Vec2i{1, 2}, "drones lifted row-major");
    expect(s.grid.count(CellKind::Drone) == 0, "drone cells cleared from grid");
    expect(s.player.pos == Vec2i{0, 0}, "player starts at origin");
    expect(s.player.health == 4 && s.player.maxHealth == 5, "player starting health");
    expect(s.turn == 0 && !s.isOver(), "fresh run state");
    expect(s.seed == 9u, "seed recorded");
    expect(s.nearestDroneDistance() == 2, "nearest drone distance");
}

void test_turn_counter_and_health_bounds() {
    for (int i = 0; i < DIFFICULTY_COUNT; ++i) {
        const Difficulty& d = difficultyPreset(static_cast<DifficultyId>(i));
        for (uint32_t seed = 1; seed <= 40; ++seed) {
            RNG rng(seed);
            GameState s;
            if (!newGameState(d, rng, s)) {
                expect(false, "newGameState failed for " + d.key);
                continue;
            }

            RNG moves(seed * 31u + 7u);
            for (int step = 0; step < 300 && !s.isOver(); ++step) {
                const uint32_t before = s.turn;
                const TurnResult r = stepTurn(s, static_cast<Direction>(moves.range(0, DIRECTION_COUNT - 1)), rng);
                expect(s.turn == before + 1, "turn counter must advance by exactly one");
                expect(r.turn == s.turn, "TurnResult turn mirrors state");
                expect(s.player.health >= 0 && s.player.health <= s.player.maxHealth, "health out of bounds");
                expect(s.grid.inBounds(s.player.pos), "player left the grid");
                expect(s.grid.at(s.player.pos) != CellKind::Wall, "player on a wall");
                expect(s.lastTag == r.tag, "lastTag mirrors the turn");
                if (s.player.health == 0) expect(s.outcome == RunOutcome::Defeat, "zero health must be defeat");
            }
        }
    }
}

void test_bump_is_idempotent() {
    Grid g = openGrid(4, 4);
    g.at(0, 1) = CellKind::Wall;
    g.at(3, 0) = CellKind::Drone;
    GameState s = makeGameState(testDifficulty(4, 4), g);

    RNG rng(42u);
    const uint32_t rngBefore = rng.state;
    const Vec2i droneBefore = s.drones[0].pos;

    TurnResult r = stepTurn(s, Direction::Up, rng);
    expect(r.tag == TurnTag::Bump, "off-grid move should bump");
    expect(!s.grid.inBounds(r.target), "bump target outside grid");
    expect(s.player.pos == Vec2i{0, 0}, "bump keeps position");
    expect(s.turn == 1, "bump still counts a turn");

    r = stepTurn(s, Direction::Down, rng);
    expect(r.tag == TurnTag::Bump, "wall move should bump");
    expect(r.target == Vec2i{0, 1}, "wall bump target");
    expect(s.turn == 2, "second bump counts");

    for (int i = 0; i < 5; ++i) {
        r = stepTurn(s, Direction::Down, rng);
        expect(r.tag == TurnTag::Bump && s.player.pos == Vec2i{0, 0}, "repeated wall bumps keep position");
        expect(s.player.health == 4, "repeated wall bumps keep health");
    }
    expect(s.turn == 7, "every bump counts a turn");

    expect(s.drones[0].pos == droneBefore, "drones must not move on a bump");
    expect(rng.state == rngBefore, "bump must not draw from the RNG");
    expect(s.player.health == 4, "bump does not hurt");
}

void test_trap_scenario() {
    Grid g = openGrid(3, 3);
    g.at(1, 0) = CellKind::Trap;
    GameState s = makeGameState(testDifficulty(3, 3), g);

    RNG rng(1u);
    const TurnResult r = stepTurn(s, Direction::Right, rng);
    expect(r.tag == TurnTag::Trapped, "trap tag");
    expect(r.steppedOn == CellKind::Trap, "trap steppedOn");
    expect(r.healthBefore == 4 && r.healthAfter == 3, "trap costs one health");
    expect(s.player.health == 3, "trap health 3/5");
    expect(s.grid.at(1, 0) == CellKind::Empty, "trap is consumed");
    expect(s.turn == 1, "trap turn counted");
}

void test_trap_defeat() {
    Grid g = openGrid(3, 3);
    g.at(1, 0) = CellKind::Trap;
    GameState s = makeGameState(testDifficulty(3, 3, 1, 5), g);

    RNG rng(1u);
    const TurnResult r = stepTurn(s, Direction::Right, rng);
    expect(r.tag == TurnTag::Defeat, "trap at 1 hp is fatal");
    expect(!r.caught, "trap defeat is not a catch");
    expect(s.outcome == RunOutcome::Defeat, "outcome defeat");
}

void test_medkit_clamps_health() {
    Grid g = openGrid(3, 3);
    g.at(1, 0) = CellKind::Medkit;
    g.at(2, 0) = CellKind::Medkit;
    GameState s = makeGameState(testDifficulty(3, 3, 4, 5), g);

    RNG rng(1u);
    TurnResult r = stepTurn(s, Direction::Right, rng);
    expect(r.tag == TurnTag::Healed && s.player.health == 5, "medkit heals to 5/5");
    r = stepTurn(s, Direction::Right, rng);
    expect(r.tag == TurnTag::Healed, "medkit at full health still triggers");
    expect(s.player.health == 5, "health clamps at max");
    expect(s.grid.at(2, 0) == CellKind::Empty, "medkit consumed at full health");
}

void test_helper_freezes_drones() {
    Grid g = openGrid(4, 4);
    g.at(1, 0) = CellKind::Helper;
    g.at(3, 2) = CellKind::Drone;
    g.at(2, 3) = CellKind::Drone;
    GameState s = makeGameState(testDifficulty(4, 4), g);
    expect(s.drones.size() == 2, "helper scenario has two drones");

    RNG rng(3u);
    const Vec2i d0 = s.drones[0].pos;
    const Vec2i d1 = s.drones[1].pos;

    TurnResult r = stepTurn(s, Direction::Right, rng);
    expect(r.tag == TurnTag::Helped, "helper tag");
    expect(s.player.health == 5, "helper heals one");
    expect(s.grid.at(1, 0) == CellKind::Empty, "helper consumed");
    expect(s.drones[0].pos == d0 && s.drones[1].pos == d1, "drones frozen on the helper turn");
    expect(s.drones[0].frozenTurns == 1 && s.drones[1].frozenTurns == 1, "freeze counts down once");

    r = stepTurn(s, Direction::Left, rng);
    expect(r.tag == TurnTag::Moved, "move after helper");
    expect(s.drones[0].pos == d0 && s.drones[1].pos == d1, "drones still frozen on the second turn");
    expect(s.drones[0].frozenTurns == 0 && s.drones[1].frozenTurns == 0, "freeze expired");

    stepTurn(s, Direction::Right, rng);
    expect(!(s.drones[0].pos == d0) || !(s.drones[1].pos == d1), "drones move again after the freeze");
}

void test_drone_catch_is_fatal() {
    // Drone at (2,0) with a wall below it: its only move is onto (1,0).
    Grid g = openGrid(3, 3);
    g.at(2, 0) = CellKind::Drone;
    g.at(2, 1) = CellKind::Wall;
    GameState s = makeGameState(testDifficulty(3, 3, 5, 5), g);

    RNG rng(11u);
    const TurnResult r = stepTurn(s, Direction::Right, rng);
    expect(r.caught, "drone catches the player");
    expect(r.tag == TurnTag::Defeat, "catch is a defeat");
    expect(s.player.health == 0, "catch zeroes health");
    expect(s.outcome == RunOutcome::Defeat, "catch outcome");
    expect(s.turn == 1, "catch turn counted");
}

void test_victory_skips_drones() {
    Grid g = openGrid(3, 2);
    g.at(2, 0) = CellKind::Drone;
    GameState s = makeGameState(testDifficulty(3, 2), g);
    s.player.pos = {1, 1};

    RNG rng(8u);
    const uint32_t rngBefore = rng.state;
    const TurnResult r = stepTurn(s, Direction::Right, rng);
    expect(r.tag == TurnTag::Victory, "exit is victory");
    expect(!r.caught, "victory is not a catch");
    expect(s.outcome == RunOutcome::Victory, "victory outcome");
    expect(s.drones[0].pos == Vec2i{2, 0}, "drones do not move on the winning turn");
    expect(rng.state == rngBefore, "victory turn does not draw from the RNG");
}

void test_step_contract_violations() {
    Grid g = openGrid(2, 1);
    GameState s = makeGameState(testDifficulty(2, 1), g);
    RNG rng(1u);

    bool threw = false;
    try {
        stepTurn(s, static_cast<Direction>(9), rng);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    expect(threw, "invalid direction throws");
    expect(s.turn == 0, "invalid direction does not mutate");

    stepTurn(s, Direction::Right, rng);
    expect(s.outcome == RunOutcome::Victory, "2x1 grid is won in one move");

    threw = false;
    const uint64_t before = stateHash(s);
    try {
        stepTurn(s, Direction::Left, rng);
    } catch (const std::logic_error&) {
        threw = true;
    }
    expect(threw, "stepping a finished run throws");
    expect(stateHash(s) == before, "finished run is not mutated");
}

void test_drone_rules() {
    // Walled corridor: drones never enter walls and never share a cell.
    Grid g = openGrid(5, 5);
    g.at(1, 1) = CellKind::Wall;
    g.at(3, 1) = CellKind::Wall;
    g.at(1, 3) = CellKind::Wall;
    g.at(3, 3) = CellKind::Wall;
    g.at(2, 2) = CellKind::Trap;

    std::vector<Drone> drones(3);
    drones[0].pos = {0, 4};
    drones[1].pos = {2, 2};
    drones[2].pos = {4, 0};

    RNG rng(99u);
    for (int step = 0; step < 500; ++step) {
        advanceDrones(drones, g, rng);
        for (size_t i = 0; i < drones.size(); ++i) {
            expect(g.isTraversable(drones[i].pos), "drone on a wall or off-grid");
            for (size_t j = i + 1; j < drones.size(); ++j) {
                expect(!(drones[i].pos == drones[j].pos), "two drones share a cell");
            }
        }
    }
    expect(g.at(2, 2) == CellKind::Trap, "drones do not consume items");

    // Boxed in: stays put.
    Grid boxed = openGrid(3, 3);
    boxed.at(1, 0) = CellKind::Wall;
    boxed.at(0, 1) = CellKind::Wall;
    std::vector<Drone> one(1);
    one[0].pos = {0, 0};
    advanceDrones(one, boxed, rng);
    expect(one[0].pos == Vec2i{0, 0}, "boxed-in drone stays");

    // Frozen: counts down, stays.
    std::vector<Drone> frozen(1);
    frozen[0].pos = {1, 1};
    frozen[0].frozenTurns = 2;
    const uint32_t before = rng.state;
    advanceDrones(frozen, openGrid(3, 3), rng);
    expect(frozen[0].pos == Vec2i{1, 1} && frozen[0].frozenTurns == 1, "frozen drone counts down");
    expect(rng.state == before, "frozen drone does not draw");
}

void test_same_seed_same_run() {
    const Difficulty& d = difficultyPreset(DifficultyId::Normal);
    RNG ra(2024u);
    RNG rb(2024u);
    GameState a;
    GameState b;
    expect(newGameState(d, ra, a) && newGameState(d, rb, b), "newGameState for determinism");
    expect(stateHash(a) == stateHash(b), "same seed, same initial hash");

    const Direction script[] = {Direction::Right, Direction::Down, Direction::Right, Direction::Down,
                                Direction::Left,  Direction::Down, Direction::Right, Direction::Right};
    for (Direction dir : script) {
        if (a.isOver()) break;
        stepTurn(a, dir, ra);
        stepTurn(b, dir, rb);
        expect(stateHash(a) == stateHash(b), "same seed and moves diverged");
    }
}

void test_mood_classification() {
    expect(classifyTension(1, 5, 0) == TensionLevel::High, "1/5 at distance 0 is high");
    expect(classifyTension(5, 5, 1) == TensionLevel::High, "adjacent drone is high");
    expect(classifyTension(5, 5, 2) == TensionLevel::Mid, "drone at 2 is mid");
    expect(classifyTension(3, 5, -1) == TensionLevel::Mid, "3/5 is mid");
    expect(classifyTension(4, 5, 3) == TensionLevel::Low, "4/5 far away is low");
    expect(classifyTension(5, 5, -1) == TensionLevel::Low, "no drones, full health is low");
    expect(classifyTension(2, 6, -1) == TensionLevel::High, "exactly a third is high");
    expect(classifyTension(4, 6, -1) == TensionLevel::Mid, "exactly two thirds is mid");

    Grid g = openGrid(3, 3);
    g.at(1, 0) = CellKind::Trap;
    GameState s = makeGameState(testDifficulty(3, 3), g);
    expect(!classifyMood(s).event.has_value(), "no event before the first turn");

    RNG rng(1u);
    stepTurn(s, Direction::Right, rng);
    Mood m = classifyMood(s);
    expect(m.event == TurnTag::Trapped, "mood carries the trap event");
    expect(m.nearestDrone == -1, "no drones reports -1");

    stepTurn(s, Direction::Right, rng);
    m = classifyMood(s);
    expect(!m.event.has_value(), "plain move has no event");
}

void test_narrator_templates() {
    NarrationContext ctx;
    ctx.health = 2;
    ctx.maxHealth = 5;
    ctx.proximity = -1;
    ctx.turns = 17;
    expect(fillTemplate("hp {health}/{max_health}, drones {proximity}, {turns} turns {mystery}", ctx) ==
               "hp 2/5, drones no, 17 turns {mystery}",
           "fillTemplate substitution");
    ctx.proximity = 3;
    expect(fillTemplate("{proximity} cells {", ctx) == "3 cells {", "fillTemplate unmatched brace");

    expect(personas().size() == 4, "four personas");
    for (const Persona& p : personas()) {
        expect(findPersona(p.key) == &p, "findPersona " + p.key);
        for (int e = 0; e < NARRATION_EVENT_COUNT; ++e) {
            expect(!p.events[static_cast<size_t>(e)].empty(),
                   p.key + " has no line for " + narrationEventKey(static_cast<NarrationEvent>(e)));
        }
        for (const auto& lines : p.tension) expect(!lines.empty(), p.key + " missing tension lines");
    }
    expect(findPersona("nobody") == nullptr, "unknown persona");
}

void test_narrator_events() {
    const Persona* mentor = findPersona("mentor");
    expect(mentor != nullptr, "mentor persona");
    if (!mentor) return;

    Narrator a(*mentor, 55u);
    Narrator b(*mentor, 55u);
    NarrationContext ctx;
    ctx.health = 4;
    ctx.maxHealth = 5;
    for (int i = 0; i < 5; ++i) {
        expect(a.describe(NarrationEvent::Start, ctx) == b.describe(NarrationEvent::Start, ctx),
               "narration is seeded");
    }

    Narrator off(*mentor, 55u, false);
    expect(off.describe(NarrationEvent::Start, ctx).empty(), "disabled narrator is silent");

    Grid g = openGrid(3, 3);
    GameState s = makeGameState(testDifficulty(3, 3), g);
    RNG rng(1u);
    const TurnResult bump = stepTurn(s, Direction::Up, rng);
    const std::vector<std::string> lines = a.narrateTurn(bump, classifyMood(s), s);
    expect(lines.size() == 1 && !lines[0].empty(), "bump gets exactly the wall line");

    // Low health is noted once per run.
    Grid tg = openGrid(4, 1);
    tg.at(1, 0) = CellKind::Trap;
    tg.at(2, 0) = CellKind::Trap;
    GameState t = makeGameState(testDifficulty(4, 1, 4, 5), tg);
    Narrator n(*mentor, 1u);
    TurnResult r = stepTurn(t, Direction::Right, rng);
    n.narrateTurn(r, classifyMood(t), t);
    expect(!n.lowHealthNoted(), "3/5 is not low health");
    r = stepTurn(t, Direction::Right, rng);
    n.narrateTurn(r, classifyMood(t), t);
    expect(n.lowHealthNoted(), "2/5 is low health");
    n.resetRound();
    expect(!n.lowHealthNoted(), "resetRound clears the low-health note");
}

void test_stats_persistence() {
    const std::filesystem::path path = tempPath("stats.csv");
    std::error_code ec;
    std::filesystem::remove(path, ec);

    StatsStore stats;
    std::string err;
    expect(stats.load(path.string(), &err), "missing stats file loads empty");
    expect(stats.all().empty(), "empty stats");
    expect(stats.summaryLine("normal") == "runs 0, wins 0 (0% rate), best - turns, streak 0 (best 0)",
           "empty summary line");

    StatsResult r = stats.recordRun("Normal", 12, RunResult::Victory);
    expect(r.newBest && r.streak == 1, "first win is a best");
    r = stats.recordRun("normal", 10, RunResult::Victory);
    expect(r.newBest && r.streak == 2, "faster win is a best");
    r = stats.recordRun("normal", 15, RunResult::Victory);
    expect(!r.newBest && r.streak == 3 && r.bestStreak == 3, "slower win is not a best");
    r = stats.recordRun("normal", 4, RunResult::Defeat);
    expect(!r.newBest && r.streak == 0 && r.bestStreak == 3, "defeat resets the streak");
    stats.recordRun("easy", 2, RunResult::Quit);

    expect(stats.save(path.string(), &err), "stats save: " + err);

    StatsStore loaded;
    expect(loaded.load(path.string(), &err), "stats reload: " + err);
    const DifficultyStats* n = loaded.find("NORMAL");
    expect(n != nullptr, "normal row reloaded");
    if (n) {
        expect(n->runs == 4 && n->wins == 3 && n->defeats == 1 && n->quits == 0, "normal counts");
        expect(n->bestTurns == 10, "normal best turns");
        expect(n->winStreak == 0 && n->bestStreak == 3, "normal streaks");
    }
    const DifficultyStats* e = loaded.find("easy");
    expect(e && e->quits == 1 && e->bestTurns == -1, "easy row reloaded");
    expect(loaded.summaryLine("normal") == "runs 4, wins 3 (75% rate), best 10 turns, streak 0 (best 3)",
           "summary line");

    {
        std::ofstream f(path);
        f << "bogus,1,2\n";
    }
    StatsStore bad;
    expect(!bad.load(path.string(), &err), "stats without header fails");
    expect(err.find("missing header") != std::string::npos, "stats header error message");

    std::filesystem::remove(path, ec);
}

void test_settings_parse_and_update() {
    const std::filesystem::path path = tempPath("settings.ini");
    {
        std::ofstream f(path);
        f << "# comment\n"
          << "difficulty = Hard\n"
          << "narrator = CYBERPUNK ; trailing comment\n"
          << "narration = off\n"
          << "sound = no\n"
          << "tile_size = 500\n"
          << "record_replays = yes\n"
          << "unknown_key = 3\n"
          << "color = maybe\n";
    }

    Settings s = loadSettings(path.string());
    expect(s.difficulty == DifficultyId::Hard, "settings difficulty");
    expect(s.narrator == "cyberpunk", "settings narrator");
    expect(!s.narration && !s.sound, "settings booleans");
    expect(s.tileSize == 96, "settings tile size clamped");
    expect(s.recordReplays, "settings record_replays");
    expect(s.color, "invalid bool keeps default");

    expect(updateIniKey(path.string(), "narrator", "dramatic"), "updateIniKey existing");
    expect(updateIniKey(path.string(), "vsync", "false"), "updateIniKey appended");
    s = loadSettings(path.string());
    expect(s.narrator == "dramatic", "updated narrator");
    expect(!s.vsync, "appended vsync");

    expect(writeDefaultSettings(path.string()), "writeDefaultSettings");
    s = loadSettings(path.string());
    const Settings defaults;
    expect(s.difficulty == defaults.difficulty && s.narrator == defaults.narrator &&
               s.tileSize == defaults.tileSize && s.sound == defaults.sound,
           "default settings file round-trips");

    std::error_code ec;
    std::filesystem::remove(path, ec);
    const Settings missing = loadSettings(path.string());
    expect(missing.narrator == "mentor", "missing settings file gives defaults");
}

void test_input_decoding() {
    expect(commandFromChar('W') == InputCommand::Up, "W is up");
    expect(commandFromChar('a') == InputCommand::Left, "a is left");
    expect(commandFromChar('s') == InputCommand::Down, "s is down");
    expect(commandFromChar('d') == InputCommand::Right, "d is right");
    expect(commandFromChar('Q') == InputCommand::Quit, "Q quits");
    expect(commandFromChar('x') == InputCommand::None, "x does nothing");

    expect(commandFromLine("  up ") == InputCommand::Up, "line up");
    expect(commandFromLine("quit") == InputCommand::Quit, "line quit");
    expect(commandFromLine("d") == InputCommand::Right, "line d");
    expect(commandFromLine("jump") == InputCommand::None, "line jump");

    expect(commandDirection(InputCommand::Left) == Direction::Left, "left maps to a direction");
    expect(!commandDirection(InputCommand::Quit).has_value(), "quit has no direction");

    TermKeyDecoder dec;
    expect(dec.feed(0x1b) == InputCommand::None && dec.pending(), "ESC starts a sequence");
    expect(dec.feed('[') == InputCommand::None, "CSI continues");
    expect(dec.feed('A') == InputCommand::Up, "ESC [ A is up");
    expect(!dec.pending(), "sequence complete");

    dec.feed(0x1b);
    dec.feed('O');
    expect(dec.feed('C') == InputCommand::Right, "ESC O C is right");

    dec.feed(0x1b);
    dec.feed('[');
    dec.feed('1');
    dec.feed(';');
    dec.feed('5');
    expect(dec.feed('D') == InputCommand::Left, "modified arrow is left");

    dec.feed(0x1b);
    expect(dec.flush() == InputCommand::Quit, "lone ESC quits");
    expect(dec.feed('s') == InputCommand::Down, "plain key after flush");
}

void test_text_render() {
    Grid g = openGrid(3, 3);
    g.at(1, 0) = CellKind::Wall;
    g.at(0, 2) = CellKind::Drone;
    g.at(2, 1) = CellKind::Medkit;
    GameState s = makeGameState(testDifficulty(3, 3), g);

    expect(boardSymbolAt(s, {0, 0}) == 'P', "player symbol");
    expect(boardSymbolAt(s, {1, 0}) == '#', "wall symbol");
    expect(boardSymbolAt(s, {0, 2}) == 'D', "drone symbol from the drone list");
    expect(boardSymbolAt(s, {2, 2}) == 'E', "exit symbol");
    expect(boardSymbolAt(s, {2, 1}) == '+', "medkit symbol");

    MessageLog log(3);
    TextRenderOptions opt;
    opt.color = false;
    std::string out = renderBoard(s, log, opt);
    expect(out.find("[P] you") == 0, "legend first");
    expect(out.find("Difficulty: Test   Health: 4/5   Turn: 0") != std::string::npos, "status line");
    expect(out.find("     0 1 2\n") != std::string::npos, "column header");
    expect(out.find(" 0 | P #  \n") != std::string::npos, "first row");
    expect(out.find(" 2 | D   E\n") != std::string::npos, "last row");
    expect(out.find("(no recent events)") != std::string::npos, "empty log placeholder");
    expect(out.find("\x1b[") == std::string::npos, "no ANSI codes without color");

    log.push("one");
    log.push("");
    log.push("two");
    log.push("three");
    log.push("four");
    expect(log.size() == 3 && log.lines().front() == "two" && log.lines().back() == "four", "log keeps the newest");

    opt.color = true;
    out = renderBoard(s, log, opt);
    expect(out.find("\x1b[32mP\x1b[0m") != std::string::npos, "player painted green");
    expect(out.find("four\n") != std::string::npos, "log printed");
}

void test_ui_font_wrap() {
    const std::vector<std::string> a = wrapText("the quick brown fox", 9);
    expect(a.size() == 2 && a[0] == "the quick" && a[1] == "brown fox", "word wrap");

    const std::vector<std::string> b = wrapText("abcdefghij", 4);
    expect(b.size() == 3 && b[0] == "abcd" && b[1] == "efgh" && b[2] == "ij", "long word split");

    const std::vector<std::string> c = wrapText("one\ntwo", 20);
    expect(c.size() == 2 && c[0] == "one" && c[1] == "two", "explicit newline");

    const Glyph5x7 lower = glyph5x7('a');
    const Glyph5x7 upper = glyph5x7('A');
    bool same = true;
    for (int r = 0; r < GLYPH_H; ++r) same = same && lower.rows[r] == upper.rows[r];
    expect(same, "lowercase folds to uppercase");
    expect(hasGlyph('#') && hasGlyph('7') && !hasGlyph('~'), "glyph coverage");
}

void test_sfx_cues() {
    TurnResult r;
    r.tag = TurnTag::Moved;
    expect(!cueForTurn(r).has_value(), "plain move is silent");
    r.tag = TurnTag::Bump;
    expect(cueForTurn(r) == SoundCue::Wall, "bump plays wall");
    r.tag = TurnTag::Trapped;
    expect(cueForTurn(r) == SoundCue::Trap, "trap cue");
    r.tag = TurnTag::Helped;
    expect(cueForTurn(r) == SoundCue::Helper, "helper cue");
    r.tag = TurnTag::Defeat;
    r.caught = true;
    expect(cueForTurn(r) == SoundCue::DroneHit, "catch plays the drone hit");
    r.caught = false;
    expect(cueForTurn(r) == SoundCue::Defeat, "trap death plays defeat");
    r.tag = TurnTag::Victory;
    expect(cueForTurn(r) == SoundCue::Victory, "victory cue");

    for (int i = 0; i < SOUND_CUE_COUNT; ++i) {
        const SoundCue c = static_cast<SoundCue>(i);
        expect(!synthesizeCue(c, 8000).empty(), std::string("empty clip for ") + soundCueName(c));
    }

    std::vector<int16_t> seg;
    double phase = 0.0;
    renderSegment(seg, {}, 0.1, 1.0, phase, 1000);
    expect(seg.size() == 100, "silence segment length");
    bool silent = true;
    for (int16_t v : seg) silent = silent && v == 0;
    expect(silent, "empty frequency list is silence");

    const std::filesystem::path wav = tempPath("cue.wav");
    const std::vector<int16_t> clip = synthesizeCue(SoundCue::Medkit, 8000);
    std::string err;
    expect(writeWavFile(wav.string(), clip, 8000, &err), "writeWavFile: " + err);
    std::error_code ec;
    expect(std::filesystem::file_size(wav, ec) == 44 + clip.size() * 2, "wav size");
    std::filesystem::remove(wav, ec);
}

void test_replay_parse_errors() {
    ReplayFile rf;
    std::string err;

    std::istringstream noHeader("1 M U\n");
    expect(!parseReplay(noHeader, rf, &err), "replay without header fails");

    std::istringstream badDir("@signalvault_replay 1\n@seed 5\n@difficulty normal\n@end_header\n0 M X\n");
    expect(!parseReplay(badDir, rf, &err), "bad direction fails");
    expect(err.find("line 5") != std::string::npos, "error names the line: " + err);

    std::istringstream ok("@signalvault_replay 1\n@game_version 1.0\n@seed 5\n@difficulty h\n@future thing\n"
                          "@end_header\n# comment\n\n0 H 00000000000000ff\n0 M R\n1 M d\n");
    expect(parseReplay(ok, rf, &err), "valid replay parses: " + err);
    expect(rf.meta.seed == 5 && rf.meta.difficulty == DifficultyId::Hard, "replay header");
    expect(rf.events.size() == 3 && rf.moveCount() == 2, "replay events");
    if (rf.events.size() == 3) {
        expect(rf.events[0].kind == ReplayEventType::StateHash && rf.events[0].hash == 0xffu, "hash event");
        expect(rf.events[2].dir == Direction::Down && rf.events[2].turn == 1, "move event");
    }

    std::istringstream again(formatReplay(rf));
    ReplayFile back;
    expect(parseReplay(again, back, &err), "formatted replay parses");
    expect(formatReplay(back) == formatReplay(rf), "formatReplay is stable");
}

void test_session_replay_verifies() {
    const std::filesystem::path path = tempPath("run.svr");
    std::error_code ec;
    std::filesystem::remove(path, ec);

    SessionConfig cfg;
    cfg.difficulty = DifficultyId::Normal;
    cfg.seed = 4242u;
    cfg.replayPath = path;

    RunSession run;
    std::string err;
    expect(run.start(cfg, &err), "session start: " + err);
    expect(run.replayPath() == path, "replay recording opened");

    const Direction pattern[] = {Direction::Right, Direction::Down, Direction::Down, Direction::Right,
                                 Direction::Left,  Direction::Up,   Direction::Right, Direction::Down};
    uint32_t moves = 0;
    for (int i = 0; i < 60 && !run.over(); ++i) {
        run.move(pattern[i % 8]);
        ++moves;
    }
    if (!run.over()) run.quit();

    ReplayFile rf;
    expect(loadReplayFile(path, rf, &err), "load recorded replay: " + err);
    expect(rf.moveCount() == moves, "every move recorded");
    expect(rf.meta.seed == run.state().seed, "replay seed");

    ReplayRunStats st;
    expect(runReplayHeadless(rf, ReplayRunOptions{}, &st, &err), "recorded replay verifies: " + err);
    expect(st.movesApplied == moves, "replay applied every move");
    expect(st.checkpointsVerified == moves + 1, "checkpoint per turn plus the start");
    expect(st.finalHash == stateHash(run.state()), "replay reaches the same state");
    expect(st.outcome == run.state().outcome, "replay outcome");

    // Corrupt the last checkpoint.
    for (auto it = rf.events.rbegin(); it != rf.events.rend(); ++it) {
        if (it->kind == ReplayEventType::StateHash) {
            it->hash ^= 1u;
            break;
        }
    }
    ReplayRunStats bad;
    expect(!runReplayHeadless(rf, ReplayRunOptions{}, &bad, &err), "corrupt checkpoint detected");
    expect(bad.failure == ReplayFailureKind::HashMismatch, "desync kind");

    ReplayRunOptions noVerify;
    noVerify.verifyHashes = false;
    expect(runReplayHeadless(rf, noVerify, nullptr, &err), "hash checks can be skipped");

    ReplayRunOptions capped;
    capped.maxMoves = 1;
    ReplayRunStats cut;
    if (moves > 1) {
        expect(!runReplayHeadless(rf, capped, &cut, &err), "move cap stops the run");
        expect(cut.failure == ReplayFailureKind::SafetyLimit, "safety limit kind");
    }

    std::filesystem::remove(path, ec);
}

void test_session_flow() {
    SessionConfig cfg;
    cfg.narrator = "nobody";
    RunSession bad;
    std::string err;
    expect(!bad.start(cfg, &err), "unknown narrator rejected");

    bool threw = false;
    try {
        bad.move(Direction::Up);
    } catch (const std::logic_error&) {
        threw = true;
    }
    expect(threw, "move before start throws");

    cfg.narrator = "humorous";
    cfg.seed = 31u;
    RunSession run;
    expect(run.start(cfg, &err), "session start: " + err);
    expect(run.log().size() == 1, "start narration logged");
    expect(run.lastCue() == SoundCue::Ambient, "start plays ambience");

    run.move(Direction::Up); // always off the grid from the start corner
    expect(run.state().turn == 1, "session move resolves a turn");
    bool bumpLogged = false;
    for (const std::string& line : run.log().lines()) {
        bumpLogged = bumpLogged || line == "You bump into the perimeter.";
    }
    expect(bumpLogged, "bump logged");
    expect(run.lastCue() == SoundCue::Wall, "bump cue");

    if (!run.over()) run.quit();
    expect(run.over() && run.quitRequested(), "quit ends the run");
    expect(run.result() == RunResult::Quit, "quit result");

    threw = false;
    try {
        run.move(Direction::Down);
    } catch (const std::logic_error&) {
        threw = true;
    }
    expect(threw, "move after quit throws");

    StatsStore stats;
    run.finish(stats);
    run.finish(stats);
    const DifficultyStats* n = stats.find(difficultyPreset(cfg.difficulty).key);
    expect(n && n->runs == 1 && n->quits == 1, "finish records once");

    // Narration off: only event notices.
    cfg.narration = false;
    RunSession quiet;
    expect(quiet.start(cfg, &err), "quiet start");
    expect(quiet.log().size() == 0, "no start narration when muted");
    quiet.move(Direction::Left);
    expect(quiet.log().size() == 1 && quiet.log().lines().back() == "You bump into the perimeter.",
           "perimeter notice");
}

void test_turn_notice() {
    Grid g = openGrid(3, 3);
    g.at(1, 0) = CellKind::Wall;
    g.at(0, 1) = CellKind::Medkit;
    GameState s = makeGameState(testDifficulty(3, 3, 5, 5), g);
    RNG rng(1u);

    TurnResult r = stepTurn(s, Direction::Right, rng);
    expect(turnNotice(r, s) == "That way is sealed by a wall.", "wall notice");
    r = stepTurn(s, Direction::Down, rng);
    expect(turnNotice(r, s) == "You pocket a medkit you do not need yet.", "full health medkit notice");
    r = stepTurn(s, Direction::Down, rng);
    expect(turnNotice(r, s).empty(), "plain move has no notice");
}

} // namespace

int main() {
    std::cout << "Running Signal Vault tests...\n";

    test_rng_reproducible();
    test_enum_names();
    test_difficulty_presets();

    test_mapgen_presets_solvable();
    test_mapgen_deterministic();
    test_mapgen_invalid_configuration();
    test_mapgen_unsolvable_layout();

    test_game_state_lifts_drones();
    test_turn_counter_and_health_bounds();
    test_bump_is_idempotent();
    test_trap_scenario();
    test_trap_defeat();
    test_medkit_clamps_health();
    test_helper_freezes_drones();
    test_drone_catch_is_fatal();
    test_victory_skips_drones();
    test_step_contract_violations();
    test_drone_rules();
    test_same_seed_same_run();

    test_mood_classification();
    test_narrator_templates();
    test_narrator_events();

    test_stats_persistence();
    test_settings_parse_and_update();
    test_input_decoding();
    test_text_render();
    test_ui_font_wrap();
    test_sfx_cues();

    test_replay_parse_errors();
    test_session_replay_verifies();
    test_session_flow();
    test_turn_notice();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
