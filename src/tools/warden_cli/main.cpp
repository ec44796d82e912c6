/// @file main.cpp
/// @brief warden_cli entry point.
///
/// Operator tool for a warden deployment:
///   warden_cli [--config <path>] check
///   warden_cli [--config <path>] hash <algorithm> <plain>
///   warden_cli [--config <path>] verify <encoded> <plain>

#include "warden/foundation/component_registry.hpp"
#include "warden/foundation/config_manager.hpp"
#include "warden/security/hash_algorithm_registry.hpp"
#include "warden/security/security_config.hpp"
#include "warden/security/security_manager.hpp"
#include "warden/version.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace {

using warden::foundation::ConfigManager;
using warden::security::SecurityConfig;

constexpr const char* kDefaultConfigPath = "/etc/warden/warden.yaml";

struct Arguments {
    std::filesystem::path configPath;
    std::vector<std::string> positional;
};

// Resolve config path: --config flag > WARDEN_CONFIG_PATH env > default.
Arguments parseArguments(int argc, char* argv[]) {
    Arguments args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]); // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == "--config" && i + 1 < argc) {
            args.configPath = argv[++i]; // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        } else {
            args.positional.emplace_back(arg);
        }
    }
    if (args.configPath.empty()) {
        const char* envPath = std::getenv("WARDEN_CONFIG_PATH");
        args.configPath = envPath != nullptr ? envPath : kDefaultConfigPath;
    }
    return args;
}

void printUsage() {
    std::cerr << "warden_cli " << warden::Version::string << "\n"
              << "usage: warden_cli [--config <path>] check\n"
              << "       warden_cli [--config <path>] hash <algorithm> <plain>\n"
              << "       warden_cli [--config <path>] verify <encoded> <plain>\n";
}

bool loadSecurity(const std::filesystem::path& path, SecurityConfig& out) {
    ConfigManager config;
    auto loaded = config.load(path);
    if (!loaded) {
        std::cerr << "Failed to load config " << path.string() << ": "
                  << loaded.error().message() << "\n";
        return false;
    }
    auto security = warden::security::loadSecurityConfig(config);
    if (!security) {
        std::cerr << "Invalid configuration: " << security.error().message() << "\n";
        return false;
    }
    out = std::move(security).value();
    return true;
}

int runCheck(const SecurityConfig& config) {
    warden::foundation::ComponentRegistry components;
    warden::security::registerInMemoryComponents(components);

    auto manager = warden::security::SecurityManager::create(config, components);
    if (!manager) {
        std::cerr << "Configuration cannot be wired: " << manager.error().message() << "\n";
        return EXIT_FAILURE;
    }

    std::cout << "configuration ok\n"
              << "  preferred algorithm: " << config.authc.preferredAlgorithm << "\n"
              << "  realms: " << config.realms.size() << "\n"
              << "  lockout: "
              << (std::holds_alternative<warden::security::LockoutEnabled>(config.authc.lockout)
                      ? "enabled"
                      : "disabled")
              << "\n"
              << "  second factor: " << (config.authc.totp ? "enabled" : "disabled") << "\n"
              << "  remember-me: " << (config.rememberMe ? "enabled" : "disabled") << "\n"
              << "  cache: " << config.cache.backend.value_or("disabled") << "\n";
    return EXIT_SUCCESS;
}

int runHash(const SecurityConfig& config, const std::string& algorithm,
            const std::string& plain) {
    auto registry = warden::security::HashAlgorithmRegistry::create(
        config.authc.algorithms, config.authc.preferredAlgorithm);
    if (!registry) {
        std::cerr << registry.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto record = registry.value().hash(plain, algorithm);
    if (!record) {
        std::cerr << "Hashing failed: " << record.error().message() << "\n";
        return EXIT_FAILURE;
    }
    std::cout << warden::security::HashAlgorithmRegistry::encode(record.value()) << "\n";
    return EXIT_SUCCESS;
}

int runVerify(const SecurityConfig& config, const std::string& encoded,
              const std::string& plain) {
    auto registry = warden::security::HashAlgorithmRegistry::create(
        config.authc.algorithms, config.authc.preferredAlgorithm);
    if (!registry) {
        std::cerr << registry.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto record = warden::security::HashAlgorithmRegistry::decode(encoded);
    if (!record) {
        std::cerr << "Malformed credential: " << record.error().message() << "\n";
        return EXIT_FAILURE;
    }
    auto matched = registry.value().verify(plain, record.value());
    if (!matched) {
        std::cerr << "Verification failed: " << matched.error().message() << "\n";
        return EXIT_FAILURE;
    }
    std::cout << (matched.value() ? "match" : "mismatch") << "\n";
    if (matched.value() && registry.value().needsUpgrade(record.value())) {
        std::cout << "credential should be rehashed with "
                  << registry.value().preferredAlgorithm() << "\n";
    }
    return matched.value() ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // namespace

int main(int argc, char* argv[]) {
    auto args = parseArguments(argc, argv);
    if (args.positional.empty()) {
        printUsage();
        return EXIT_FAILURE;
    }

    SecurityConfig config;
    if (!loadSecurity(args.configPath, config)) {
        return EXIT_FAILURE;
    }

    const auto& command = args.positional[0];
    if (command == "check" && args.positional.size() == 1) {
        return runCheck(config);
    }
    if (command == "hash" && args.positional.size() == 3) {
        return runHash(config, args.positional[1], args.positional[2]);
    }
    if (command == "verify" && args.positional.size() == 3) {
        return runVerify(config, args.positional[1], args.positional[2]);
    }
    printUsage();
    return EXIT_FAILURE;
}
