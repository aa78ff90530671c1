#include "compiler_options.hh"

#include <zplc/backend_registry.hh>
#include <zplc/error.hh>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <tuple>

namespace zplc::driver {

using namespace zplc::render;

// ============================================================================
// Helper Functions
// ============================================================================

static bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

static std::string get_option_value(const char* arg, const char* prefix) {
    return arg + std::strlen(prefix);
}

// Value of "-x value", "-xvalue" or "--long value" / "--long=value"
static std::string take_value(int argc, char** argv, int& i, const char* prefix) {
    std::string value = get_option_value(argv[i], prefix);
    if (!value.empty() && value[0] == '=') {
        value.erase(0, 1);
    }
    if (value.empty() && i + 1 < argc) {
        value = argv[++i];
    }
    if (value.empty()) {
        throw std::runtime_error(std::string("Option ") + prefix + " requires argument");
    }
    return value;
}

static bool matches_long(const char* arg, const char* name) {
    const std::size_t n = std::strlen(name);
    return std::strncmp(arg, name, n) == 0 && (arg[n] == '\0' || arg[n] == '=');
}

// Parse backend-specific option: --zpl-compress=false
// Returns: (backend name, option name, parsed value)
static std::optional<std::tuple<std::string, std::string, OptionValue>>
parse_backend_option(const char* arg) {
    std::string_view sv(arg + 2);  // Skip "--"

    size_t dash_pos = sv.find('-');
    if (dash_pos == std::string_view::npos) {
        return std::nullopt;
    }

    std::string prefix(sv.substr(0, dash_pos));
    Backend* backend = BackendRegistry::instance().find(prefix);
    if (!backend) {
        return std::nullopt;  // Not a backend option
    }

    std::string_view rest = sv.substr(dash_pos + 1);
    size_t eq_pos = rest.find('=');
    if (eq_pos == std::string_view::npos) {
        throw std::runtime_error(
            "Backend option requires value: --" + prefix + "-<option>=<value>"
        );
    }

    std::string option_name(rest.substr(0, eq_pos));
    std::string value_str(rest.substr(eq_pos + 1));

    auto options = backend->get_options();
    auto opt_it = std::find_if(options.begin(), options.end(),
        [&](const OptionDescription& opt) { return opt.name == option_name; });

    if (opt_it == options.end()) {
        throw std::runtime_error(
            "Unknown option for " + prefix + " backend: " + option_name
        );
    }

    try {
        return std::make_tuple(backend->get_name(), option_name, opt_it->parse_value(value_str));
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("--") + prefix + "-" + option_name + ": " + e.what());
    }
}

// -D name=value
static void parse_variable(const std::string& text, variable_map& out) {
    auto eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw std::runtime_error("Variable must be given as name=value: " + text);
    }
    out[text.substr(0, eq)] = text.substr(eq + 1);
}

// --font A-Z=file.ttf or --font 0=file.ttf
static font_binding parse_font(const std::string& text) {
    auto eq = text.find('=');
    if (eq == std::string::npos || eq + 1 == text.size()) {
        throw std::runtime_error("Font must be given as <from>-<to>=<file>: " + text);
    }
    std::string range = text.substr(0, eq);
    font_binding binding{text.substr(eq + 1), 0, 0};
    if (range.size() == 1) {
        binding.from = binding.to = range[0];
    } else if (range.size() == 3 && range[1] == '-') {
        binding.from = range[0];
        binding.to = range[2];
    } else {
        throw std::runtime_error("Invalid font id range: " + range);
    }
    return binding;
}

static double parse_dpi(const std::string& text) {
    char* end = nullptr;
    double dpi = std::strtod(text.c_str(), &end);
    if (text.empty() || *end != '\0' || dpi <= 0) {
        throw std::runtime_error("Invalid resolution: " + text);
    }
    return dpi;
}

// Flags without a value
struct switch_flag {
    const char* short_name;  // nullptr when there is none
    const char* long_name;
    bool CompilerOptions::*member;
};

constexpr switch_flag switch_flags[] = {
    {"-v", "--verbose", &CompilerOptions::verbose},
    {nullptr, "--debug", &CompilerOptions::debug},
    {"-q", "--quiet", &CompilerOptions::quiet},
    {nullptr, "--stdout", &CompilerOptions::write_stdout},
    {"-w", nullptr, &CompilerOptions::suppress_all_warnings},
    {nullptr, "-Werror", &CompilerOptions::warnings_as_errors},
};

static bool set_switch(const char* arg, CompilerOptions& opts) {
    for (const auto& flag : switch_flags) {
        if ((flag.short_name && std::strcmp(arg, flag.short_name) == 0)
            || (flag.long_name && std::strcmp(arg, flag.long_name) == 0)) {
            opts.*flag.member = true;
            return true;
        }
    }
    return false;
}

// ============================================================================
// Main Parser
// ============================================================================

CompilerOptions parse_command_line(int argc, char** argv) {
    CompilerOptions opts;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Help options
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            std::exit(0);
        }

        if (std::strcmp(arg, "--version") == 0) {
            print_version();
            std::exit(0);
        }

        if (std::strcmp(arg, "--list-backends") == 0) {
            print_backends();
            std::exit(0);
        }

        if (set_switch(arg, opts)) {
            continue;
        }

        if (starts_with(arg, "-o")) {
            opts.output_dir = take_value(argc, argv, i, "-o");
            continue;
        }

        if (starts_with(arg, "-t")) {
            opts.backend = take_value(argc, argv, i, "-t");
            continue;
        }

        // Label setup
        if (matches_long(arg, "--width")) {
            opts.width = unit::parse(take_value(argc, argv, i, "--width"));
            continue;
        }

        if (matches_long(arg, "--height")) {
            opts.height = unit::parse(take_value(argc, argv, i, "--height"));
            continue;
        }

        if (matches_long(arg, "--dpi")) {
            opts.dpi = parse_dpi(take_value(argc, argv, i, "--dpi"));
            continue;
        }

        if (matches_long(arg, "--config")) {
            opts.config_file = take_value(argc, argv, i, "--config");
            continue;
        }

        if (matches_long(arg, "--font")) {
            opts.fonts.push_back(parse_font(take_value(argc, argv, i, "--font")));
            continue;
        }

        if (matches_long(arg, "--color")) {
            const std::string mode = take_value(argc, argv, i, "--color");
            if (mode == "auto") {
                opts.color = ColorMode::Auto;
            } else if (mode == "always") {
                opts.color = ColorMode::Always;
            } else if (mode == "never") {
                opts.color = ColorMode::Never;
            } else {
                throw std::runtime_error("Invalid color mode: " + mode + " (expected auto, always or never)");
            }
            continue;
        }

        if (matches_long(arg, "--encode")) {
            opts.encode_image = take_value(argc, argv, i, "--encode");
            opts.output_mode = OutputMode::EncodeImage;
            continue;
        }

        if (starts_with(arg, "-D")) {
            parse_variable(take_value(argc, argv, i, "-D"), opts.variables);
            continue;
        }

        // Backend-specific options (--zpl-compress=false)
        if (starts_with(arg, "--") && std::strchr(arg + 2, '=')) {
            auto result = parse_backend_option(arg);
            if (result) {
                auto [backend, option_name, value] = *result;
                opts.backend_options[backend][option_name] = value;
                continue;
            }
            // Fall through if not a backend option
        }

        // Unknown option starting with dash ("-" alone is standard input)
        if (arg[0] == '-' && arg[1] != '\0') {
            throw std::runtime_error(std::string("Unknown option: ") + arg);
        }

        opts.input_files.push_back(arg);
    }

    // Validation
    if (opts.output_mode == OutputMode::Compile && opts.input_files.empty()) {
        throw std::runtime_error("No input files specified");
    }

    if (opts.quiet && (opts.verbose || opts.debug)) {
        throw std::runtime_error("Cannot specify both -q/--quiet and -v/--verbose");
    }

    if (opts.backend) {
        BackendRegistry::instance().get(*opts.backend);  // throws backend_error when unknown
    }

    return opts;
}

// ============================================================================
// Help and Info Functions
// ============================================================================

void print_help(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <label.zpl>...\n\n";

    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  --version               Show version information\n";
    std::cout << "  --list-backends         List available output backends\n";
    std::cout << "\n";

    std::cout << "Output:\n";
    std::cout << "  -o <dir>                Output directory (default: current directory)\n";
    std::cout << "  -t <backend>            Output backend (default: listing)\n";
    std::cout << "  --stdout                Write the output to standard output\n";
    std::cout << "\n";

    std::cout << "Label:\n";
    std::cout << "  --width <length>        Label width: 812, 812dots, 4in, 100mm, 10cm (default: 4in)\n";
    std::cout << "  --height <length>       Label height (default: 6in)\n";
    std::cout << "  --dpi <n>               Printer resolution: 152, 203, 300, 600 or custom (default: 203)\n";
    std::cout << "  -D <name>=<value>       Replace {{name}} in field data\n";
    std::cout << "  --font <from>-<to>=<f>  Map a TrueType/OpenType font onto font ids\n";
    std::cout << "  --config <file.yaml>    Read label settings from a YAML file\n";
    std::cout << "\n";

    std::cout << "Tools:\n";
    std::cout << "  --encode <image>        Print a ^GFA command for a PGM/PPM image\n";
    std::cout << "\n";

    std::cout << "Diagnostics:\n";
    std::cout << "  -v, --verbose           Verbose output (includes notes)\n";
    std::cout << "  --debug                 Debug output\n";
    std::cout << "  -q, --quiet             Quiet mode (errors only)\n";
    std::cout << "  --color=<when>          Color output: auto, always, never\n";
    std::cout << "  -w                      Suppress all warnings\n";
    std::cout << "  -Werror                 Treat all warnings as errors\n";
    std::cout << "\n";

    std::cout << "Backend Options:\n";
    std::cout << "  --<backend>-<option>=<value>   Set backend-specific option\n";
    std::cout << "\n";
    std::cout << "  Use --list-backends to see available backends and their options.\n";
    std::cout << "\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " label.zpl\n";
    std::cout << "  " << program_name << " -t zpl -o out --dpi 300 label.zpl\n";
    std::cout << "  " << program_name << " -D name=Ann --stdout label.zpl\n";
    std::cout << "  " << program_name << " --encode logo.pgm\n";
}

void print_version() {
    std::cout << "zplc label compiler v0.1.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

void print_backends() {
    auto& registry = BackendRegistry::instance();
    std::cout << "Available backends:\n\n";

    for (const auto& name : registry.names()) {
        const Backend& backend = registry.get(name);
        std::cout << "  " << name << " - " << backend.get_description() << "\n";
        std::cout << "    Extension: " << backend.get_file_extension() << "\n";

        auto options = backend.get_options();
        if (!options.empty()) {
            std::cout << "    Options:\n";
            for (const auto& opt : options) {
                std::cout << "      --" << name << "-" << opt.name << "=<value>\n";
                std::cout << "        " << opt.description << "\n";
                if (!opt.choices.empty()) {
                    std::cout << "        Choices:";
                    for (const auto& choice : opt.choices) {
                        std::cout << ' ' << choice;
                    }
                    std::cout << "\n";
                }
                if (opt.default_value) {
                    std::cout << "        Default: " << *opt.default_value << "\n";
                }
            }
        }
        std::cout << "\n";
    }

    std::cout << "Plugins:";
    for (const auto& plugin : registry.plugin_names()) {
        std::cout << ' ' << plugin;
    }
    std::cout << "\n";
}

}  // namespace zplc::driver
