// rider_runner — headless rider stability run
//
// Drives one rider along a ridge track with a deterministic bot, seeded wind
// and optional surface overrides. Outputs structured metrics for tuning
// validation and regression testing.
//
// Usage:
//   rider_runner [options]
//     --rider <bike|horse>     Rider type (default: bike)
//     --tuning <file>          Tuning JSON overlaid on the rider preset
//     --track <file>           Track JSON (default: assets/tracks/ridge1.json)
//     --seed <hex|dec>         Run seed (default: 0xC0FFEE)
//     --ticks <n>              Max physics ticks (default: 15000 = 5 min at 50Hz)
//     --bot <style>            cautious|aggressive|random (default: cautious)
//     --wind <file|off>        Wind tuning JSON, or off (default: assets/tuning/wind.json)
//     --surface <name>         Force a surface over the whole run
//     --respawn                Respawn after falls instead of stopping
//     --json                   Output as JSON instead of plain text
//     --quiet                  Only output final summary line
//     -h, --help               Print usage

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <raylib.h>
#include <raymath.h>

#include "core/Assets.hpp"
#include "core/Config.hpp"
#include "core/CrashHandler.hpp"
#include "core/Log.hpp"
#include "core/PerfTracker.hpp"
#include "sim/Bot.hpp"
#include "sim/FallDetector.hpp"
#include "sim/RiderManager.hpp"
#include "sim/RiderTuning.hpp"
#include "sim/Track.hpp"
#include "sim/TractionManager.hpp"
#include "sim/WindSystem.hpp"

namespace {

struct RunnerArgs {
    RiderType rider = RiderType::Bike;
    std::string tuningPath;
    std::string trackPath;
    uint32_t seed = 0xC0FFEEu;
    int maxTicks = 15000;  // 5 minutes at 50 Hz
    BotStyle botStyle = BotStyle::Cautious;
    std::string windPath;
    bool windOff = false;
    bool forceSurface = false;
    SurfaceType surface = SurfaceType::Road;
    bool respawn = false;
    bool json = false;
    bool quiet = false;
    bool help = false;
    bool bad = false;
};

uint32_t ParseSeed(const char* str) {
    // Accept 0x prefix for hex, otherwise decimal.
    return static_cast<uint32_t>(std::strtoul(str, nullptr, 0));
}

RunnerArgs ParseArgs(int argc, char* argv[]) {
    RunnerArgs args{};
    for (int i = 1; i < argc; ++i) {
        if ((std::strcmp(argv[i], "--rider") == 0) && i + 1 < argc) {
            if (!ParseRiderType(argv[++i], args.rider)) {
                std::fprintf(stderr, "unknown rider: %s\n", argv[i]);
                args.bad = true;
            }
        } else if ((std::strcmp(argv[i], "--tuning") == 0) && i + 1 < argc) {
            args.tuningPath = argv[++i];
        } else if ((std::strcmp(argv[i], "--track") == 0) && i + 1 < argc) {
            args.trackPath = argv[++i];
        } else if ((std::strcmp(argv[i], "--seed") == 0) && i + 1 < argc) {
            args.seed = ParseSeed(argv[++i]);
        } else if ((std::strcmp(argv[i], "--ticks") == 0) && i + 1 < argc) {
            args.maxTicks = std::atoi(argv[++i]);
            if (args.maxTicks < 1) args.maxTicks = 1;
        } else if ((std::strcmp(argv[i], "--bot") == 0) && i + 1 < argc) {
            if (!ParseBotStyle(argv[++i], args.botStyle)) {
                std::fprintf(stderr, "unknown bot style: %s\n", argv[i]);
                args.bad = true;
            }
        } else if ((std::strcmp(argv[i], "--wind") == 0) && i + 1 < argc) {
            ++i;
            if (std::strcmp(argv[i], "off") == 0) {
                args.windOff = true;
            } else {
                args.windPath = argv[i];
            }
        } else if ((std::strcmp(argv[i], "--surface") == 0) && i + 1 < argc) {
            if (ParseSurfaceType(argv[++i], args.surface)) {
                args.forceSurface = true;
            } else {
                std::fprintf(stderr, "unknown surface: %s\n", argv[i]);
                args.bad = true;
            }
        } else if (std::strcmp(argv[i], "--respawn") == 0) {
            args.respawn = true;
        } else if (std::strcmp(argv[i], "--json") == 0) {
            args.json = true;
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            args.quiet = true;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            args.help = true;
        } else {
            std::fprintf(stderr, "unknown argument: %s\n", argv[i]);
            args.bad = true;
        }
    }
    return args;
}

void PrintUsage() {
    std::printf(
        "rider_runner — headless EdgeAbyss rider stability run\n"
        "\n"
        "Usage: rider_runner [options]\n"
        "  --rider <bike|horse>     Rider type (default: bike)\n"
        "  --tuning <file>          Tuning JSON overlaid on the rider preset\n"
        "  --track <file>           Track JSON (default: assets/tracks/ridge1.json)\n"
        "  --seed <hex|dec>         Run seed (default: 0xC0FFEE)\n"
        "  --ticks <n>              Max physics ticks (default: 15000 = 5 min)\n"
        "  --bot <style>            cautious|aggressive|random (default: cautious)\n"
        "  --wind <file|off>        Wind tuning JSON or off (default: assets/tuning/wind.json)\n"
        "  --surface <name>         road|wetstone|gravel|ice|mud|boostpad for the whole run\n"
        "  --respawn                Respawn after falls instead of stopping\n"
        "  --json                   Output as JSON\n"
        "  --quiet                  Only final summary line\n"
        "  -h, --help               This message\n"
    );
}

struct FallRecord {
    int tick = 0;
    FallReason reason = FallReason::LostBalance;
    Vector3 position{};
};

}  // namespace

int main(int argc, char* argv[]) {
    const RunnerArgs args = ParseArgs(argc, argv);
    if (args.help) {
        PrintUsage();
        return 0;
    }
    if (args.bad) {
        PrintUsage();
        return 2;
    }

    if (args.quiet || args.json) {
        Log::InitConsoleOnly();
        Log::SetLevel(spdlog::level::warn);
    } else {
        Log::Init();
        Log::SetLevel(spdlog::level::info);
    }
    CrashHandler::Init();

    // --- Tuning ---
    RiderTuning tuning = (args.rider == RiderType::Bike) ? GetBikeTuning() : GetHorseTuning();
    if (!args.tuningPath.empty() && !LoadRiderTuningFromFile(tuning, args.tuningPath.c_str())) {
        LOG_CRITICAL("Cannot continue without tuning from {}", args.tuningPath);
        return 2;
    }

    // --- Track ---
    Track track{};
    const std::string trackPath = args.trackPath.empty()
        ? std::string(assets::Path("tracks/ridge1.json")) : args.trackPath;
    if (!LoadTrackFromFile(track, trackPath.c_str())) {
        if (!args.trackPath.empty()) {
            LOG_CRITICAL("Cannot continue without track {}", trackPath);
            return 2;
        }
        LOG_WARN("Falling back to a straight built-in ridge");
        track = MakeStraightTrack(20, 25.0f, 4.0f);
    }

    // --- Wind ---
    WindTuning windTuning{};
    bool windEnabled = !args.windOff;
    if (windEnabled && !args.windPath.empty()) {
        if (!LoadWindTuningFromFile(windTuning, args.windPath.c_str())) {
            LOG_CRITICAL("Cannot continue without wind tuning {}", args.windPath);
            return 2;
        }
    } else if (windEnabled && assets::Exists("tuning/wind.json")) {
        if (!LoadWindTuningFromFile(windTuning, assets::Path("tuning/wind.json"))) {
            LOG_WARN("Using built-in wind defaults");
        }
    }
    WindSystem wind;
    wind.Initialize(windEnabled ? &windTuning : nullptr, args.seed);

    // --- Traction ---
    TractionManager traction;
    int forcedZone = -1;
    if (args.forceSurface) {
        forcedZone = traction.RegisterZone(MakeSurfaceZone(args.surface));
    } else {
        RegisterTrackSurfaces(track, traction);
    }

    // --- Rider ---
    TrackGroundProbe ground(&track);
    RiderEnvironment env{};
    env.ground = &ground;
    env.traction = &traction;
    env.wind = &wind;

    const Vector3 spawn = GetSpawnPosition(track);

    RiderManager manager;
    manager.SetTuning(args.rider, &tuning);
    manager.SetEnvironment(env);
    manager.SetTractionManager(&traction);
    manager.SetSpawnPoint(spawn, QuaternionIdentity());
    manager.SpawnRider(args.rider);

    RiderBase* rider = manager.ActiveRider();
    if (rider == nullptr || !rider->IsInitialized()) {
        LOG_CRITICAL("Rider failed to spawn");
        return 2;
    }
    rider->SetFallDebugLogging(!args.quiet && !args.json);

    FallDetector detector;
    detector.StartMonitoring(rider, &track);

    std::vector<FallRecord> falls;
    int tick = 0;
    manager.AddFellListener([&](FallReason reason) {
        const RiderBase* r = manager.ActiveRider();
        falls.push_back(FallRecord{tick, reason, r ? r->Body().position : Vector3Zero()});
    });

    int gusts = 0;
    wind.AddGustListener([&gusts](bool started) {
        if (started) ++gusts;
    });

    Bot bot{};
    InitBot(bot, args.botStyle, args.seed ^ 0x12345678u);

    // --- Run ---
    using Clock = std::chrono::steady_clock;
    const auto wallStart = Clock::now();

    int ticksRun = 0;
    bool finished = false;
    float minStability = 1.0f;
    float maxSpeed = 0.0f;
    float bestDistance = 0.0f;
    int maxTickAllocs = 0;

    for (tick = 0; tick < args.maxTicks; ++tick) {
        RiderBase* active = manager.ActiveRider();
        const InputState input = BotInput(bot, *active, &track);

        if (active->HasFallen()) {
            if (!args.respawn) break;
            manager.Update(input, cfg::kFixedDt);
            detector.ResetFallState();
            if (forcedZone >= 0) traction.EnterZone(forcedZone);
            continue;
        }

        manager.Update(input, cfg::kFixedDt);

        wind.Update(cfg::kFixedDt);
        if (forcedZone >= 0) {
            traction.EnterZone(forcedZone);
        } else {
            traction.TrackPosition(active->Body().position);
        }
        traction.Update(cfg::kFixedDt);

        perf::ResetAllocCounter();
        manager.FixedUpdate(cfg::kFixedDt);
        const int allocs = perf::ReadAllocCounter();
        if (allocs > maxTickAllocs) maxTickAllocs = allocs;

        detector.Update(cfg::kFixedDt);
        ++ticksRun;

        const RiderBase* r = manager.ActiveRider();
        if (!r->HasFallen()) {
            if (r->Stability() < minStability) minStability = r->Stability();
            if (r->Speed() > maxSpeed) maxSpeed = r->Speed();
        }
        const float distance = r->Body().position.z - spawn.z;
        if (distance > bestDistance) bestDistance = distance;
        if (r->Body().position.z >= track.totalLength && !r->HasFallen()) {
            finished = true;
            break;
        }
    }

    const auto wallEnd = Clock::now();
    const float wallMs = std::chrono::duration<float, std::milli>(wallEnd - wallStart).count();

    // --- Metrics ---
    const RiderBase* r = manager.ActiveRider();
    const float simTime = static_cast<float>(ticksRun) * cfg::kFixedDt;
    const bool survived = falls.empty();
    const char* status = finished ? "FINISHED" : (survived ? "SURVIVED" : "FELL");
    const float perfMsPer1k = (ticksRun > 0) ? (wallMs / (static_cast<float>(ticksRun) / 1000.0f)) : 0.0f;

    // --- Output ---
    if (args.json) {
        std::printf("{\n");
        std::printf("  \"rider\": \"%s\",\n", RiderTypeName(args.rider));
        std::printf("  \"tuning\": \"%s\",\n", tuning.riderName.c_str());
        std::printf("  \"track\": \"%s\",\n", track.name.c_str());
        std::printf("  \"seed\": \"0x%08X\",\n", args.seed);
        std::printf("  \"bot\": \"%s\",\n", BotStyleName(args.botStyle));
        std::printf("  \"ticks_run\": %d,\n", ticksRun);
        std::printf("  \"ticks_max\": %d,\n", args.maxTicks);
        std::printf("  \"sim_time\": %.2f,\n", simTime);
        std::printf("  \"distance\": %.1f,\n", bestDistance);
        std::printf("  \"max_speed\": %.2f,\n", maxSpeed);
        std::printf("  \"final_stability\": %.3f,\n", r->Stability());
        std::printf("  \"min_stability\": %.3f,\n", minStability);
        std::printf("  \"gusts\": %d,\n", gusts);
        std::printf("  \"respawns\": %d,\n", manager.RespawnCount());
        std::printf("  \"status\": \"%s\",\n", status);
        std::printf("  \"falls\": [");
        for (size_t i = 0; i < falls.size(); ++i) {
            const FallRecord& f = falls[i];
            std::printf("%s{\"tick\": %d, \"reason\": \"%s\", \"pos\": [%.2f, %.2f, %.2f]}",
                        i == 0 ? "" : ", ", f.tick, FallReasonName(f.reason),
                        f.position.x, f.position.y, f.position.z);
        }
        std::printf("],\n");
        std::printf("  \"max_tick_allocs\": %d,\n", maxTickAllocs);
        std::printf("  \"wall_ms\": %.2f,\n", wallMs);
        std::printf("  \"perf_ms_per_1k\": %.3f\n", perfMsPer1k);
        std::printf("}\n");
    } else if (args.quiet) {
        std::printf("rider=%-5s  seed=0x%08X  status=%-8s  dist=%-8.1f  falls=%-3d  minStab=%.3f  time=%-7.2fs  perf=%.3fms/1k\n",
                    RiderTypeName(args.rider), args.seed, status, bestDistance,
                    static_cast<int>(falls.size()), minStability, simTime, perfMsPer1k);
    } else {
        std::printf("=== EdgeAbyss Headless Rider Runner ===\n");
        std::printf("rider:      %s (%s)\n", RiderTypeName(args.rider), tuning.riderName.c_str());
        std::printf("track:      %s (%.0f m)\n", track.name.c_str(), track.totalLength);
        std::printf("seed:       0x%08X\n", args.seed);
        std::printf("bot:        %s\n", BotStyleName(args.botStyle));
        std::printf("ticks:      %d / %d\n", ticksRun, args.maxTicks);
        std::printf("sim_time:   %.2f s\n", simTime);
        std::printf("distance:   %.1f units\n", bestDistance);
        std::printf("max_speed:  %.2f\n", maxSpeed);
        std::printf("stability:  %.3f (min %.3f)\n", r->Stability(), minStability);
        std::printf("wind:       %s, %d gusts\n", windEnabled ? "on" : "off", gusts);
        std::printf("status:     %s\n", status);
        for (const FallRecord& f : falls) {
            std::printf("fall:       tick %d %s at (%.2f, %.2f, %.2f)\n", f.tick,
                        FallReasonName(f.reason), f.position.x, f.position.y, f.position.z);
        }
        if (perf::AllocCounterEnabled()) {
            std::printf("allocs:     %d max per tick\n", maxTickAllocs);
        }
        std::printf("wall_time:  %.2f ms\n", wallMs);
        std::printf("perf:       %.3f ms / 1000 ticks\n", perfMsPer1k);
    }

    Log::Shutdown();
    return survived || args.respawn ? 0 : 1;
}
