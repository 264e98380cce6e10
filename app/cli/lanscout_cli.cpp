#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "Config.h"
#include "DiscoveryManager.h"
#include "Logger.h"
#include "MdnsServiceBrowser.h"
#include "NetworkInterfaces.h"
#include "SubnetEnumerator.h"

using namespace LanScout;

namespace {

std::atomic<bool> g_interrupted{false};

void signalHandler(int) {
    g_interrupted = true;
}

std::string expandTilde(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (!home) {
        return path;
    }
    if (path.size() == 1) {
        return home;
    }
    if (path[1] == '/') {
        return std::string(home) + path.substr(1);
    }
    return path;
}

struct CliArgs {
    std::string configPath;
    std::string interfaceOverride;
    int concurrency{-1};
    int port{-1};
    bool noMdns{false};
    bool noProbe{false};
    bool json{false};
    bool verbose{false};
    bool help{false};
};

void printUsage(std::ostream& out, const char* argv0) {
    out << "lanscout - find SSH hosts on the local network" << std::endl;
    out << "\nUsage: " << argv0 << " [OPTIONS]" << std::endl;
    out << "\nOptions:" << std::endl;
    out << "  --config <FILE>        Load key=value settings" << std::endl;
    out << "  --concurrency <N>      Probes per wave, at most " << config::PROBE_CONCURRENCY << std::endl;
    out << "  --port <PORT>          Port to probe (default: " << config::SSH_PORT << ")" << std::endl;
    out << "  --interface <IFACE>    Scan NAME=ADDRESS/PREFIX instead of the live table" << std::endl;
    out << "  --no-mdns              Skip service discovery" << std::endl;
    out << "  --no-probe             Skip the subnet probe" << std::endl;
    out << "  --json                 One JSON object per event, then the host list" << std::endl;
    out << "  --verbose              Debug logging on stderr" << std::endl;
    out << "  --help                 Show this help message" << std::endl;
}

bool parsePositive(const std::string& text, int maxValue, int& out) {
    try {
        std::size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != text.size() || value < 1 || value > maxValue) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

bool parseArgs(int argc, char* argv[], CliArgs& args, std::string& error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto needValue = [&](int maxValue, int& target) {
            if (i + 1 >= argc) {
                error = arg + " needs a value";
                return false;
            }
            std::string value = argv[++i];
            if (!parsePositive(value, maxValue, target)) {
                error = "Invalid value for " + arg + ": " + value;
                return false;
            }
            return true;
        };

        if (arg == "--config") {
            if (i + 1 >= argc) {
                error = "--config needs a file";
                return false;
            }
            args.configPath = argv[++i];
        } else if (arg == "--interface") {
            if (i + 1 >= argc) {
                error = "--interface needs NAME=ADDRESS/PREFIX";
                return false;
            }
            args.interfaceOverride = argv[++i];
        } else if (arg == "--concurrency") {
            if (!needValue(config::PROBE_CONCURRENCY, args.concurrency)) return false;
        } else if (arg == "--port") {
            if (!needValue(65535, args.port)) return false;
        } else if (arg == "--no-mdns") {
            args.noMdns = true;
        } else if (arg == "--no-probe") {
            args.noProbe = true;
        } else if (arg == "--json") {
            args.json = true;
        } else if (arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            args.help = true;
        } else {
            error = "Unknown option: " + arg;
            return false;
        }
    }
    return true;
}

// "eth0=192.168.1.42/24" -> an up, non-loopback interface
std::optional<NetworkInterface> parseInterfaceOverride(const std::string& text) {
    const auto eq = text.find('=');
    const auto slash = text.rfind('/');
    if (eq == std::string::npos || eq == 0 || slash == std::string::npos || slash < eq) {
        return std::nullopt;
    }
    auto address = parseIPv4(text.substr(eq + 1, slash - eq - 1));
    int prefix = 0;
    if (!address || !parsePositive(text.substr(slash + 1), 32, prefix)) {
        return std::nullopt;
    }

    NetworkInterface iface;
    iface.name = text.substr(0, eq);
    iface.address = *address;
    iface.netmask = prefix == 32 ? 0xFFFFFFFFu : ~(0xFFFFFFFFu >> prefix);
    iface.isUp = true;
    return iface;
}

std::string escapeJson(const std::string& s) {
    std::ostringstream out;
    for (char c : s) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
                } else {
                    out << c;
                }
        }
    }
    return out.str();
}

std::string hostJson(const DiscoveredHost& host) {
    std::stringstream ss;
    ss << "{";
    ss << "\"displayName\": \"" << escapeJson(host.displayName) << "\",";
    ss << "\"host\": \"" << escapeJson(host.host) << "\",";
    ss << "\"port\": " << host.port << ",";
    ss << "\"sources\": [";
    bool first = true;
    for (auto source : host.sources) {
        if (!first) ss << ",";
        first = false;
        ss << "\"" << discoverySourceName(source) << "\"";
    }
    ss << "],";
    ss << "\"lastSeenAt\": " << std::chrono::duration_cast<std::chrono::milliseconds>(
                                    host.lastSeenAt.time_since_epoch()).count() << ",";
    if (host.latencyMs) {
        ss << "\"latencyMs\": " << *host.latencyMs;
    } else {
        ss << "\"latencyMs\": null";
    }
    ss << "}";
    return ss.str();
}

std::string eventJson(const DiscoveryEvent& event) {
    std::stringstream ss;
    ss << "{\"event\": \"" << eventTypeName(event.type) << "\"";
    switch (event.type) {
        case DiscoveryEvent::Type::SourceStatus:
            ss << ", \"source\": \"" << discoverySourceName(event.source) << "\"";
            ss << ", \"state\": \"" << (event.state == SourceState::Started ? "started" : "finished") << "\"";
            break;
        case DiscoveryEvent::Type::HostFound:
            if (event.host) {
                ss << ", \"host\": " << hostJson(*event.host);
            }
            break;
        case DiscoveryEvent::Type::Failed:
            ss << ", \"message\": \"" << escapeJson(event.message) << "\"";
            break;
        default:
            break;
    }
    ss << "}";
    return ss.str();
}

void printHostTable(const std::vector<DiscoveredHost>& hosts) {
    if (hosts.empty()) {
        return;
    }
    std::cout << std::endl;
    std::cout << std::left << std::setw(32) << "NAME" << std::setw(28) << "ADDRESS"
              << std::setw(10) << "LATENCY" << "SOURCES" << std::endl;
    for (const auto& host : hosts) {
        std::string sources;
        for (auto source : host.sources) {
            if (!sources.empty()) sources += ", ";
            sources += discoverySourceLabel(source);
        }
        std::string latency = host.latencyMs ? std::to_string(*host.latencyMs) + "ms" : "-";
        std::cout << std::left << std::setw(32) << host.displayName
                  << std::setw(28) << (host.host + ":" + std::to_string(host.port))
                  << std::setw(10) << latency << sources << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    auto& logger = Logger::instance();
    logger.setComponent("lanscout");
    logger.setLevel(LogLevel::WARN);

    CliArgs args;
    std::string parseError;
    if (!parseArgs(argc, argv, args, parseError)) {
        std::cerr << "Error: " << parseError << std::endl << std::endl;
        printUsage(std::cerr, argv[0]);
        return 1;
    }
    if (args.help) {
        printUsage(std::cout, argv[0]);
        return 0;
    }

    // Per-user defaults first; an explicit --config overrides them
    Config fileConfig;
    const std::string userConfig = expandTilde("~/.config/lanscout/lanscout.conf");
    const bool haveUserConfig = fileConfig.loadLayered({userConfig});
    if (!args.configPath.empty() && !fileConfig.loadFromFile(expandTilde(args.configPath))) {
        std::cerr << "Error: cannot read config file " << args.configPath << std::endl;
        return 1;
    }

    LogLevel level;
    if (fileConfig.hasKey("log_level")) {
        if (Logger::parseLevel(fileConfig.get("log_level"), level)) {
            logger.setLevel(level);
        } else {
            logger.warn("Unknown log_level '" + fileConfig.get("log_level") + "'", "Config");
        }
    }
    if (args.verbose) {
        logger.setLevel(LogLevel::DEBUG);
    }
    if (fileConfig.hasKey("log_file")) {
        logger.setLogFile(fileConfig.get("log_file"));
    }

    if (haveUserConfig) {
        logger.debug("Loaded " + userConfig, "Config");
    }

    DiscoveryOptions options = DiscoveryOptions::fromConfig(fileConfig);
    if (args.concurrency > 0) options.probeConcurrency = args.concurrency;
    if (args.port > 0) options.probePort = args.port;
    if (args.noMdns) options.enableServiceDiscovery = false;
    if (args.noProbe) options.enableActiveProbe = false;

    if (!options.enableServiceDiscovery && !options.enableActiveProbe) {
        std::cerr << "Error: --no-mdns and --no-probe leave nothing to scan" << std::endl;
        return 1;
    }

    std::shared_ptr<InterfaceSnapshotProvider> interfaces = std::make_shared<SystemInterfaceProvider>();
    if (!args.interfaceOverride.empty()) {
        auto iface = parseInterfaceOverride(args.interfaceOverride);
        if (!iface) {
            std::cerr << "Error: invalid --interface value " << args.interfaceOverride << std::endl;
            return 1;
        }
        interfaces = std::make_shared<StaticInterfaceProvider>(std::vector<NetworkInterface>{*iface});
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    auto controller = std::make_unique<DiscoveryController>(
        interfaces,
        std::make_shared<PosixTcpProber>(),
        []() { return std::make_unique<Mdns::MdnsServiceBrowser>(); },
        options);
    DiscoveryManager manager(std::move(controller));

    std::mutex outputMutex;
    const bool json = args.json;
    manager.bus().subscribe(DiscoveryManager::EVENT, [&outputMutex, json](const std::any& data) {
        const auto* event = std::any_cast<DiscoveryEvent>(&data);
        if (!event) {
            return;
        }
        std::lock_guard<std::mutex> lock(outputMutex);
        if (json) {
            std::cout << eventJson(*event) << std::endl;
        } else {
            std::cout << event->toString() << std::endl;
        }
    });

    logger.info("Scanning for " + std::to_string(options.scanDuration.count()) + "ms", "lanscout");
    manager.startScan();

    const auto deadline = std::chrono::steady_clock::now() + options.scanDuration + std::chrono::seconds(2);
    while (!manager.waitForCompletion(std::chrono::milliseconds(100))) {
        if (g_interrupted) {
            logger.info("Interrupted, stopping scan", "lanscout");
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            logger.warn("Scan did not finish in time, stopping", "lanscout");
            break;
        }
    }
    manager.stopScan();

    const auto hosts = manager.hosts();
    const auto status = manager.status();
    {
        std::lock_guard<std::mutex> lock(outputMutex);
        if (json) {
            std::stringstream ss;
            ss << "[";
            for (std::size_t i = 0; i < hosts.size(); ++i) {
                if (i > 0) ss << ",";
                ss << hostJson(hosts[i]);
            }
            ss << "]";
            std::cout << ss.str() << std::endl;
        } else {
            printHostTable(hosts);
            std::cout << std::endl << status.statusText << std::endl;
            if (status.permission == DiscoveryManager::PermissionState::Denied) {
                std::cout << "Local network browsing was denied; only the subnet probe ran." << std::endl;
            }
        }
    }

    if (status.scanState == DiscoveryManager::ScanState::UnsupportedNetwork) {
        return 3;
    }
    if (status.scanState == DiscoveryManager::ScanState::Failed) {
        return 1;
    }
    if (status.permission == DiscoveryManager::PermissionState::Denied && hosts.empty()) {
        return 2;
    }
    return 0;
}
