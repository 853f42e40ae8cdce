// HexForge - Procedural Boss Platform Generator
// main.cpp - Entry point

#include <charconv>
#include <filesystem>
#include <hexforge/core/config.hpp>
#include <hexforge/core/errors.hpp>
#include <hexforge/core/logger.hpp>
#include <hexforge/exporter/glb_exporter.hpp>
#include <hexforge/generation/platform_generator.hpp>
#include <hexforge/scene/memory_scene.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr const char* VERSION = "0.1.0";

// Exit codes
constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_GENERATION = 2;
constexpr int EXIT_EXPORT = 3;

constexpr std::string_view FEATURE_NAMES[] = {"runes", "chains", "lava_cracks", "rune_beams"};

struct CliOptions {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::filesystem::path> output_path;
    std::optional<std::filesystem::path> default_config_path;
    std::optional<int> seed;
    std::optional<hexforge::core::LogLevel> log_level;
    std::vector<std::string> features;
    bool lights = false;
    bool help = false;
};

void print_usage(const char* program) {
    std::cout << "HexForge " << VERSION << " - procedural boss platform generator\n"
              << "\n"
              << "Usage: " << program << " [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config <file>                Load parameters from a JSON config file\n"
              << "  --output <file>                Output .glb path (default: boss_platform.glb)\n"
              << "  --seed <n>                     Random seed for scatter and jitter\n"
              << "  --enable <feature>             Enable runes, chains, lava_cracks or rune_beams\n"
              << "  --lights                       Export pillar and altar lights\n"
              << "  --log-level <level>            trace, debug, info, warn, error, critical or off\n"
              << "  --write-default-config <file>  Write the default config and exit\n"
              << "  --help                         Show this help message\n"
              << "\n"
              << "Exit codes: 0 success, 1 usage or config error, 2 generation error, 3 export error\n";
}

bool is_known_feature(std::string_view name) {
    for (auto feature : FEATURE_NAMES) {
        if (feature == name) {
            return true;
        }
    }
    return false;
}

// Seeds are stored as JSON integers, so the usable range is [0, INT_MAX]
std::optional<int> parse_seed(std::string_view text) {
    int value = 0;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size() || value < 0) {
        return std::nullopt;
    }
    return value;
}

// Returns nullopt (after printing the reason) on a malformed command line
std::optional<CliOptions> parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        auto next_value = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return std::nullopt;
            }
            return std::string_view(argv[++i]);
        };

        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--lights") {
            options.lights = true;
        } else if (arg == "--config" || arg == "--output" || arg == "--write-default-config") {
            auto value = next_value();
            if (!value) {
                return std::nullopt;
            }
            std::filesystem::path path(*value);
            if (arg == "--config") {
                options.config_path = path;
            } else if (arg == "--output") {
                options.output_path = path;
            } else {
                options.default_config_path = path;
            }
        } else if (arg == "--seed") {
            auto value = next_value();
            if (!value) {
                return std::nullopt;
            }
            options.seed = parse_seed(*value);
            if (!options.seed) {
                std::cerr << "Invalid seed: " << *value << "\n";
                return std::nullopt;
            }
        } else if (arg == "--enable") {
            auto value = next_value();
            if (!value) {
                return std::nullopt;
            }
            if (!is_known_feature(*value)) {
                std::cerr << "Unknown feature: " << *value << "\n";
                return std::nullopt;
            }
            options.features.emplace_back(*value);
        } else if (arg == "--log-level") {
            auto value = next_value();
            if (!value) {
                return std::nullopt;
            }
            options.log_level = hexforge::core::parse_log_level(*value);
            if (!options.log_level) {
                std::cerr << "Unknown log level: " << *value << "\n";
                return std::nullopt;
            }
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return std::nullopt;
        }
    }
    return options;
}

// Command-line values take precedence over the config file
void apply_overrides(const CliOptions& options, hexforge::core::Config& config) {
    namespace section = hexforge::core::config_section;
    namespace key = hexforge::core::config_key;

    if (options.seed) {
        config.set_int(section::GENERATION, key::SEED, *options.seed);
    }
    if (options.output_path) {
        config.set_string(section::OUTPUT, key::PATH, options.output_path->string());
    }
    if (options.lights) {
        config.set_bool(section::OUTPUT, key::EXPORT_LIGHTS, true);
    }
    for (const auto& feature : options.features) {
        config.set_bool(section::FEATURES, feature, true);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace hexforge;

    auto options = parse_arguments(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }
    if (options->help) {
        print_usage(argv[0]);
        return EXIT_OK;
    }

    core::LoggerConfig log_config;
    log_config.console_level = options->log_level.value_or(core::LogLevel::Info);
    core::Logger::initialize(log_config);

    HEXFORGE_LOG_INFO(core::log_category::APP, "HexForge {} starting", VERSION);

    if (options->default_config_path) {
        core::Config defaults;
        const bool saved = defaults.save(*options->default_config_path);
        core::Logger::shutdown();
        return saved ? EXIT_OK : EXIT_USAGE;
    }

    core::Config config;
    if (options->config_path && !config.load(*options->config_path)) {
        core::Logger::shutdown();
        return EXIT_USAGE;
    }
    apply_overrides(*options, config);

    // The config's log level applies unless the command line set one
    if (!options->log_level) {
        const auto configured =
            core::parse_log_level(config.get_string(core::config_section::DEBUG, core::config_key::LOG_LEVEL, "info"));
        if (configured) {
            core::Logger::set_global_level(*configured);
        } else {
            HEXFORGE_LOG_WARN(core::log_category::CONFIG, "Ignoring unknown log level in config");
        }
    }

    const std::filesystem::path output_path =
        config.get_string(core::config_section::OUTPUT, core::config_key::PATH, "boss_platform.glb");
    const bool export_lights = config.get_bool(core::config_section::OUTPUT, core::config_key::EXPORT_LIGHTS, false);

    // Generation
    scene::MemoryScene scene;
    generation::GenerationResult result;
    try {
        const auto params = generation::ParameterSet::from_config(config);
        result = generation::PlatformGenerator(params).generate(scene);
    } catch (const core::GenerationError& e) {
        HEXFORGE_LOG_CRITICAL(core::log_category::GENERATOR, "{}: {}", e.kind(), e.what());
        HEXFORGE_LOG_CRITICAL(core::log_category::APP, "Generation aborted, nothing was written");
        core::Logger::shutdown();
        return EXIT_GENERATION;
    }

    // Export
    exporter::GlbExporter exporter(exporter::ExportOptions{.export_lights = export_lights});
    try {
        if (!exporter.write(scene, result.root, output_path)) {
            core::Logger::shutdown();
            return EXIT_EXPORT;
        }
    } catch (const exporter::ExportError& e) {
        HEXFORGE_LOG_CRITICAL(core::log_category::EXPORT, "Export failed: {}", e.what());
        core::Logger::shutdown();
        return EXIT_EXPORT;
    }

    const auto stats = scene.stats();
    std::cout << "Wrote " << output_path.string() << "\n"
              << "  top-level objects: " << result.top_level_count() << "\n"
              << "  meshes:            " << stats.mesh_count << "\n"
              << "  lights:            " << stats.light_count << (export_lights ? "" : " (not exported)") << "\n"
              << "  vertices:          " << stats.vertex_count << "\n"
              << "  triangles:         " << stats.triangle_count << "\n";

    core::Logger::shutdown();
    return EXIT_OK;
}
