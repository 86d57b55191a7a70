#include "pixelair/client/Client.hpp"

#include <CLI/CLI.hpp>

#include <chrono>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace pixelair;

namespace {

struct ScanOptions {
    int windowSeconds = static_cast<int>(
        std::chrono::duration_cast<std::chrono::seconds>(config::DISCOVERY_WINDOW).count());
    int watchSeconds = 0;
    std::string broadcast = config::BROADCAST_ADDRESS;
    int port = config::CLIENT_LISTEN_PORT;
    std::string target;

    std::string power;
    int brightness = -1;
    std::vector<int> color;
    std::string effect;
    DeviceMode mode = DeviceMode::Auto;
};

// Effects may be given by catalogue display name; anything else is sent as an id.
std::string resolveEffect(const Client& client, const Address& address, const std::string& effect) {
    if (auto device = client.device(address)) {
        if (auto id = device->lightState.effectIdFor(effect)) {
            return *id;
        }
    }
    return effect;
}

} // namespace

int main(int argc, char** argv) {
    CLI::App app{"Discover, watch and control PixelAir lamps on the local network"};
    ScanOptions options;

    app.add_option("--window", options.windowSeconds, "Discovery window in seconds")
        ->check(CLI::Range(1, 600));
    app.add_option("--watch", options.watchSeconds, "Keep printing changes for N seconds")
        ->check(CLI::Range(0, 86400));
    app.add_option("--broadcast", options.broadcast, "Broadcast address for discovery")
        ->check(CLI::ValidIPV4);
    app.add_option("--port", options.port, "Local state-report port (0 = ephemeral)")
        ->check(CLI::Range(0, 65535));
    auto* ip = app.add_option("--ip", options.target, "Device to send a command to")
        ->check(CLI::ValidIPV4);

    auto* power = app.add_option("--power", options.power, "Switch the lamp on or off")
        ->check(CLI::IsMember({"on", "off"}));
    auto* brightness = app.add_option("--brightness", options.brightness, "Brightness 0-255")
        ->check(CLI::Range(0, 255));
    auto* color = app.add_option("--color", options.color, "Hue (0-359) and saturation (0-100)")
        ->expected(2);
    auto* effect = app.add_option("--effect", options.effect, "Effect id or display name");
    const std::map<std::string, DeviceMode> modes{
        {"auto", DeviceMode::Auto}, {"scene", DeviceMode::Scene}, {"manual", DeviceMode::Manual}};
    auto* mode = app.add_option("--mode", options.mode, "auto, scene or manual")
        ->transform(CLI::CheckedTransformer(modes, CLI::ignore_case));

    const std::vector<CLI::Option*> commands{power, brightness, color, effect, mode};
    for (auto* option : commands) {
        option->needs(ip);
        for (auto* other : commands) {
            if (other != option) option->excludes(other);
        }
    }

    try {
        app.parse(argc, argv);
        if (color->count() > 0 && (options.color[0] < 0 || options.color[0] > 359
                                   || options.color[1] < 0 || options.color[1] > 100)) {
            throw CLI::ValidationError("--color", "hue must be 0-359 and saturation 0-100");
        }
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    ClientConfig config;
    config.discoveryWindow = std::chrono::seconds(options.windowSeconds);
    config.broadcastAddress = options.broadcast;
    config.listenPort = static_cast<std::uint16_t>(options.port);

    std::optional<Command> command;
    if (power->count() > 0) {
        command = SetPower{options.power == "on"};
    } else if (brightness->count() > 0) {
        command = SetBrightness{static_cast<std::uint8_t>(options.brightness)};
    } else if (color->count() > 0) {
        command = SetColor{static_cast<std::uint16_t>(options.color[0]),
                           static_cast<std::uint8_t>(options.color[1])};
    } else if (mode->count() > 0) {
        command = SetMode{options.mode};
    }

    Client client(config);
    auto printer = client.subscribe([](const ChangeEvent& event) {
        std::cout << toString(event.kind) << ": " << event.device.describe() << std::endl;
    });

    if (auto r = client.acquire(); !r) {
        std::cerr << "Acquire failed: " << r.error().message() << "\n";
        return 1;
    }

    // Joins the scan started by acquire().
    auto found = client.rescan().get();
    if (!found) {
        std::cerr << "Discovery failed: " << found.error().message() << "\n";
    }

    std::cout << "\n" << client.devices().size() << " device(s):\n";
    for (const auto& device : client.devices()) {
        std::cout << "  " << device.describe() << "\n";
        for (const auto& entry : device.lightState.effects) {
            std::cout << "      effect " << entry.id << " \"" << entry.displayName << "\"\n";
        }
    }

    if (effect->count() > 0) {
        command = SetEffect{resolveEffect(client, net::ip::make_address_v4(options.target), options.effect)};
    }

    int status = 0;
    if (command) {
        if (auto r = client.command(options.target, *command); !r) {
            std::cerr << describe(*command) << " -> " << options.target << " failed: "
                      << r.error().message() << "\n";
            status = 1;
        } else {
            std::cout << describe(*command) << " -> " << options.target << " confirmed\n";
        }
    }

    if (options.watchSeconds > 0) {
        std::cout << "Watching for " << options.watchSeconds << "s..." << std::endl;
        std::this_thread::sleep_for(std::chrono::seconds(options.watchSeconds));
    }

    client.release();
    return status;
}
