#include "narrator.hpp"

#include <algorithm>
#include <initializer_list>
#include <utility>

namespace {

using Lines = std::vector<std::string>;

struct PersonaBuilder {
    Persona p;

    PersonaBuilder(const char* key, const char* label, const char* style) {
        p.key = key;
        p.label = label;
        p.style = style;
    }

    PersonaBuilder& on(NarrationEvent e, Lines lines) {
        p.events[static_cast<size_t>(e)] = std::move(lines);
        return *this;
    }

    PersonaBuilder& mood(TensionLevel t, Lines lines) {
        p.tension[static_cast<size_t>(t)] = std::move(lines);
        return *this;
    }
};

Persona makeDramatic() {
    PersonaBuilder b("dramatic", "Heist-show host", "cinematic, breathless commentary");
    b.on(NarrationEvent::Start, {
        "The curtain lifts on a vault of chrome and shadow. Your cue.",
        "One infiltrator, one maze, one shot at the core. Roll camera.",
    });
    b.on(NarrationEvent::Status, {
        "The nearest drone circles {proximity} tiles off. The audience holds its breath.",
        "Still standing at {health}/{max_health}. The vault waits for your next line.",
    });
    b.on(NarrationEvent::LowHealth, {
        "Your vitals flicker like a dying marquee.",
        "The script turns dark. Every step now is borrowed.",
    });
    b.on(NarrationEvent::Trap, {
        "Steel snaps shut and the vault draws first blood.",
        "A hidden blade, a flash of red. The stage bites back.",
    });
    b.on(NarrationEvent::Medkit, {
        "A quick patch between scenes. The show goes on.",
        "Bandage tight, breath steady. Back into the light.",
    });
    b.on(NarrationEvent::Helper, {
        "An ally sprints in, patches you up and jams every rotor in the house.",
        "A stagehand slips you stolen frequencies. The drones freeze mid-swoop.",
    });
    b.on(NarrationEvent::NearMiss, {
        "A rotor wash brushes your collar. Too close for the cameras.",
        "The drone sweeps past, close enough to read your name tag.",
    });
    b.on(NarrationEvent::Wall, {
        "Cold steel refuses your entrance. Find another mark.",
        "The set wall holds. The scene demands a new angle.",
    });
    b.on(NarrationEvent::DroneHit, {
        "Rotors scream, the lights go red, and the broadcast cuts.",
        "Impact. The final frame freezes on you.",
    });
    b.on(NarrationEvent::Quit, {
        "You walk off set before the finale. The crowd murmurs.",
        "Feed cut mid-act. The vault keeps its secrets tonight.",
    });
    b.on(NarrationEvent::Victory, {
        "Core in hand, you vanish into applause only you can hear.",
        "Curtain. You exit with the prize and the alarms sing your encore.",
    });
    b.on(NarrationEvent::Defeat, {
        "Static swallows the screen. The vault wins this episode.",
        "The spotlight dies between cold walls.",
    });
    b.on(NarrationEvent::Record, {
        "A new record: {turns} turns. They will replay this one for years.",
    });
    b.on(NarrationEvent::Streak, {
        "{streak} wins in a row. The ratings climb with you.",
    });
    b.mood(TensionLevel::Low, {
        "Heartbeat steady at {health}/{max_health}.",
        "The rhythm is yours.",
    });
    b.mood(TensionLevel::Mid, {
        "Nerves tighten like piano wire.",
        "The vault leans in, curious.",
    });
    b.mood(TensionLevel::High, {
        "Sirens howl inside your skull.",
        "Red halos everything. Move or be swallowed.",
    });
    return b.p;
}

Persona makeMentor() {
    PersonaBuilder b("mentor", "Calm mentor on comms", "steady, encouraging coaching");
    b.on(NarrationEvent::Start, {
        "Comms are up. Slow breaths, deliberate steps.",
        "I have you on the map. Read the room before you move.",
    });
    b.on(NarrationEvent::Status, {
        "Vitals {health}/{max_health}. Nearest drone {proximity} tiles. Choose your window.",
        "You are stable. Keep {proximity} tiles between you and that drone.",
    });
    b.on(NarrationEvent::LowHealth, {
        "You are hurt. Shorter steps, tighter angles.",
        "Pain is information. Use it, do not freeze.",
    });
    b.on(NarrationEvent::Trap, {
        "Trap got you. Reset your posture and keep going.",
        "Noted that spot. Do not come back this way.",
    });
    b.on(NarrationEvent::Medkit, {
        "Good grab. Let your pulse settle.",
        "Patched. Plan the next three moves while it is quiet.",
    });
    b.on(NarrationEvent::Helper, {
        "Friendly contact jammed the drones. Use the quiet.",
        "Runner patched you and scrambled their comms. Move now.",
    });
    b.on(NarrationEvent::NearMiss, {
        "That drone skimmed past. You read it well.",
        "Tight. Remember that timing.",
    });
    b.on(NarrationEvent::Wall, {
        "Wall. Slide along it and find the gap.",
        "Dead end. Turn and pick a new lane.",
    });
    b.on(NarrationEvent::DroneHit, {
        "Drone contact. Signal lost.",
        "Impact confirmed. I am losing you.",
    });
    b.on(NarrationEvent::Quit, {
        "Aborting early. We will debrief.",
        "Run called off. Take the lesson with you.",
    });
    b.on(NarrationEvent::Victory, {
        "Core secured. Clean exfil. Well done.",
        "You made it out. Quiet pride suits you.",
    });
    b.on(NarrationEvent::Defeat, {
        "Run failed. We adjust and go again.",
        "Down this time. Regroup and debrief.",
    });
    b.on(NarrationEvent::Record, {
        "Fastest finish yet at {turns} turns. The practice shows.",
    });
    b.on(NarrationEvent::Streak, {
        "{streak} clean runs in a row. Stay disciplined.",
    });
    b.mood(TensionLevel::Low, {
        "You sound composed at {health}/{max_health}.",
        "Smooth. Keep it that way.",
    });
    b.mood(TensionLevel::Mid, {
        "Tempo is rising. Anchor your focus.",
        "Pressure is up. Trust your routes.",
    });
    b.mood(TensionLevel::High, {
        "Adrenaline is spiking. Breathe, then choose.",
        "Everything is loud. Make small, exact moves.",
    });
    return b.p;
}

Persona makeHumorous() {
    PersonaBuilder b("humorous", "Sarcastic sidekick", "dry, quick quips");
    b.on(NarrationEvent::Start, {
        "Welcome to the vault. Try not to redecorate it with yourself.",
        "Another day, another felony. Let's be quick about it.",
    });
    b.on(NarrationEvent::Status, {
        "{health}/{max_health} health, {proximity} tiles of personal space. Luxurious.",
        "Nearest flying lawnmower: {proximity} tiles. No pressure.",
    });
    b.on(NarrationEvent::LowHealth, {
        "You are leaking. That is usually bad.",
        "Maybe step on fewer pointy things?",
    });
    b.on(NarrationEvent::Trap, {
        "Ah yes, the floor with teeth. Classic.",
        "You found a trap. With your foot. Bold.",
    });
    b.on(NarrationEvent::Medkit, {
        "Free healthcare. Only in a vault.",
        "Patched. Try to keep your insides inside this time.",
    });
    b.on(NarrationEvent::Helper, {
        "Some hero just jammed the drones. Say thank you.",
        "A runner fixed you up and confused the robots. Show-off.",
    });
    b.on(NarrationEvent::NearMiss, {
        "That drone almost gave you a haircut.",
        "Close. Very close. Closer than I like.",
    });
    b.on(NarrationEvent::Wall, {
        "That is a wall. Walls are famously solid.",
        "Bonk. Try the part of the map that is not made of concrete.",
    });
    b.on(NarrationEvent::DroneHit, {
        "And that is why we do not hug drones.",
        "Well. That drone really wanted to meet you.",
    });
    b.on(NarrationEvent::Quit, {
        "Leaving already? The drones were just warming up.",
        "Tactical retreat. Sure. Let's call it that.",
    });
    b.on(NarrationEvent::Victory, {
        "You actually did it. I had money against you.",
        "Core stolen, dignity mostly intact. Nice.",
    });
    b.on(NarrationEvent::Defeat, {
        "Game over. I will tell them you were brave. Ish.",
        "That went about as well as expected.",
    });
    b.on(NarrationEvent::Record, {
        "{turns} turns? Who are you and what did you do with the usual you?",
    });
    b.on(NarrationEvent::Streak, {
        "{streak} wins straight. Please stop, the drones have feelings.",
    });
    b.mood(TensionLevel::Low, {
        "Relaxed at {health}/{max_health}. Suspiciously relaxed.",
        "Nothing is on fire. Yet.",
    });
    b.mood(TensionLevel::Mid, {
        "Mildly concerning vibes.",
        "I would start sweating now, personally.",
    });
    b.mood(TensionLevel::High, {
        "This is the part where you panic, right?",
        "Everything is terrible and beeping.",
    });
    return b.p;
}

Persona makeCyberpunk() {
    PersonaBuilder b("cyberpunk", "Gravel-voiced pirate DJ", "neon noir with radio static");
    b.on(NarrationEvent::Start, {
        "Pirate band is live. Neon hums in the vents. Go.",
        "Signal's up, grid's cold. Time to ghost the vault.",
    });
    b.on(NarrationEvent::Status, {
        "Nearest rotor pinging {proximity} tiles out. Stay off its freq.",
        "Vitals at {health}/{max_health}. The grid hasn't clocked you yet.",
    });
    b.on(NarrationEvent::LowHealth, {
        "Your biomonitor's spitting red static.",
        "Running on fumes and bad chrome.",
    });
    b.on(NarrationEvent::Trap, {
        "Floor spikes bite through the static. Keep moving.",
        "Trap tripped. The vault tastes your signal.",
    });
    b.on(NarrationEvent::Medkit, {
        "Street medkit. Cheap, dirty, works.",
        "Patched up. Back on the wire.",
    });
    b.on(NarrationEvent::Helper, {
        "A runner drops a jammer. Rotors go dark.",
        "Friendly noise on the band. Drones lose the plot.",
    });
    b.on(NarrationEvent::NearMiss, {
        "Rotor wash in your ear. That was a kiss, not a hit.",
        "Drone shadow slides over you. Still breathing.",
    });
    b.on(NarrationEvent::Wall, {
        "Hard wall. No backdoor here.",
        "Dead circuit. Reroute.",
    });
    b.on(NarrationEvent::DroneHit, {
        "Rotors find flesh. Channel collapses to black.",
        "Hard contact. Signal gone.",
    });
    b.on(NarrationEvent::Quit, {
        "You pull the plug. The band goes quiet.",
        "Jacking out early. The vault keeps humming.",
    });
    b.on(NarrationEvent::Victory, {
        "Core lifted. You fade into the neon. Legend.",
        "Clean exit. The city will hum your name tonight.",
    });
    b.on(NarrationEvent::Defeat, {
        "Static. Then nothing.",
        "Flatline on the pirate band.",
    });
    b.on(NarrationEvent::Record, {
        "{turns} turns flat. New record on the street boards.",
    });
    b.on(NarrationEvent::Streak, {
        "{streak} clean jobs back to back. The fixers are talking.",
    });
    b.mood(TensionLevel::Low, {
        "Quiet on the band at {health}/{max_health}.",
        "Low hum. Easy groove.",
    });
    b.mood(TensionLevel::Mid, {
        "Static's rising. Stay sharp.",
        "The grid is waking up.",
    });
    b.mood(TensionLevel::High, {
        "Every channel screaming red.",
        "Full alarm. Ride it out.",
    });
    return b.p;
}

} // namespace

const char* narrationEventKey(NarrationEvent e) {
    switch (e) {
        case NarrationEvent::Start:     return "start";
        case NarrationEvent::Status:    return "status";
        case NarrationEvent::LowHealth: return "low_health";
        case NarrationEvent::Trap:      return "trap";
        case NarrationEvent::Medkit:    return "medkit";
        case NarrationEvent::Helper:    return "helper";
        case NarrationEvent::NearMiss:  return "near_miss";
        case NarrationEvent::Wall:      return "wall";
        case NarrationEvent::DroneHit:  return "drone_hit";
        case NarrationEvent::Quit:      return "quit";
        case NarrationEvent::Victory:   return "victory";
        case NarrationEvent::Defeat:    return "defeat";
        case NarrationEvent::Record:    return "record";
        case NarrationEvent::Streak:    return "streak";
    }
    return "unknown";
}

const std::vector<Persona>& personas() {
    static const std::vector<Persona> all = {
        makeDramatic(),
        makeMentor(),
        makeHumorous(),
        makeCyberpunk(),
    };
    return all;
}

const Persona* findPersona(const std::string& key) {
    for (const Persona& p : personas()) {
        if (p.key == key) return &p;
    }
    return nullptr;
}

std::string fillTemplate(const std::string& tmpl, const NarrationContext& ctx) {
    auto valueOf = [&](const std::string& name, std::string& out) -> bool {
        if (name == "health") out = std::to_string(ctx.health);
        else if (name == "max_health") out = std::to_string(ctx.maxHealth);
        else if (name == "proximity") out = ctx.proximity >= 0 ? std::to_string(ctx.proximity) : "no";
        else if (name == "turns") out = std::to_string(ctx.turns);
        else if (name == "streak") out = std::to_string(ctx.streak);
        else return false;
        return true;
    };

    std::string out;
    out.reserve(tmpl.size() + 16);

    size_t i = 0;
    while (i < tmpl.size()) {
        if (tmpl[i] == '{') {
            const size_t close = tmpl.find('}', i + 1);
            if (close != std::string::npos) {
                std::string v;
                if (valueOf(tmpl.substr(i + 1, close - i - 1), v)) {
                    out += v;
                    i = close + 1;
                    continue;
                }
            }
        }
        out.push_back(tmpl[i]);
        ++i;
    }
    return out;
}

NarrationContext narrationContext(const GameState& s, const Mood& mood) {
    NarrationContext ctx;
    ctx.health = s.player.health;
    ctx.maxHealth = s.player.maxHealth;
    ctx.proximity = mood.nearestDrone;
    ctx.tension = mood.tension;
    ctx.turns = s.turn;
    return ctx;
}

Narrator::Narrator(const Persona& persona, uint32_t seed, bool enabled)
    : persona_(&persona), rng_(hashCombine(seed, tag32("NARRATE"))), enabled_(enabled) {}

void Narrator::resetRound() {
    lowHealthNoted_ = false;
    lastStatusTurn_ = -10;
    lastTension_ = TensionLevel::Low;
}

std::string Narrator::describe(NarrationEvent ev, const NarrationContext& ctx) {
    if (!enabled_) return {};

    const Lines& base = persona_->events[static_cast<size_t>(ev)];
    if (base.empty()) return {};

    std::string line = fillTemplate(base[rng_.index(base.size())], ctx);

    const Lines& extra = persona_->tension[static_cast<size_t>(ctx.tension)];
    if (!extra.empty()) {
        line += " ";
        line += fillTemplate(extra[rng_.index(extra.size())], ctx);
    }
    return line;
}

std::string Narrator::ambientStatus(const Mood& mood, const GameState& s) {
    if (!enabled_) return {};

    const int64_t turn = static_cast<int64_t>(s.turn);
    const bool cooldownReady = (turn - lastStatusTurn_) >= 3;
    const bool rose = mood.tension != lastTension_ && mood.tension != TensionLevel::Low;

    lastTension_ = mood.tension;
    if (!cooldownReady && !rose) return {};

    lastStatusTurn_ = turn;
    return describe(NarrationEvent::Status, narrationContext(s, mood));
}

std::vector<std::string> Narrator::narrateTurn(const TurnResult& r, const Mood& mood, const GameState& s) {
    std::vector<std::string> out;
    if (!enabled_) return out;

    const NarrationContext ctx = narrationContext(s, mood);
    auto emit = [&](NarrationEvent ev) {
        std::string line = describe(ev, ctx);
        if (!line.empty()) out.push_back(std::move(line));
    };

    if (r.tag == TurnTag::Bump) {
        emit(NarrationEvent::Wall);
        return out;
    }

    switch (r.steppedOn) {
        case CellKind::Trap:   emit(NarrationEvent::Trap); break;
        case CellKind::Medkit: emit(NarrationEvent::Medkit); break;
        case CellKind::Helper: emit(NarrationEvent::Helper); break;
        case CellKind::Empty:
        case CellKind::Wall:
        case CellKind::Exit:
        case CellKind::Drone:
            break;
    }

    const int lowMark = std::max(1, s.player.maxHealth / 2);
    if (s.player.health > 0 && s.player.health <= lowMark && !lowHealthNoted_) {
        lowHealthNoted_ = true;
        emit(NarrationEvent::LowHealth);
    }

    if (r.caught) emit(NarrationEvent::DroneHit);

    if (r.tag == TurnTag::Victory) {
        emit(NarrationEvent::Victory);
        return out;
    }
    if (r.tag == TurnTag::Defeat) {
        emit(NarrationEvent::Defeat);
        return out;
    }

    if (mood.nearestDrone >= 0 && mood.nearestDrone <= 1) {
        emit(NarrationEvent::NearMiss);
    }

    std::string status = ambientStatus(mood, s);
    if (!status.empty()) out.push_back(std::move(status));
    return out;
}
