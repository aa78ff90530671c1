#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <zplc/engine.hh>
#include <zplc/label_config.hh>
#include <zplc/render/option_description.hh>
#include <zplc/units.hh>

#include "logger.hh"

namespace zplc::driver {

/// What the driver does with its inputs
enum class OutputMode {
    Compile,      // Compile labels through a backend (default)
    EncodeImage   // --encode: print a ^GFA command for an image and exit
};

/// Compiler options (driver configuration only)
struct CompilerOptions {
    // ========================================================================
    // Input/Output
    // ========================================================================

    std::vector<std::filesystem::path> input_files;
    std::filesystem::path output_dir;                // Empty: next to the current directory
    bool write_stdout = false;                       // --stdout
    std::optional<std::filesystem::path> config_file;  // --config
    std::optional<std::filesystem::path> encode_image; // --encode

    // ========================================================================
    // Label setup (unset values come from --config, then defaults)
    // ========================================================================

    std::optional<std::string> backend;              // -t
    std::optional<unit> width;                       // --width
    std::optional<unit> height;                      // --height
    std::optional<double> dpi;                       // --dpi
    variable_map variables;                          // -D name=value
    std::vector<font_binding> fonts;                 // --font A-Z=file.ttf

    // ========================================================================
    // Backend Options
    // ========================================================================

    /// backend name -> option name -> value, from --<backend>-<option>=<value>
    std::map<std::string, std::map<std::string, render::OptionValue>> backend_options;

    // ========================================================================
    // Diagnostic Options
    // ========================================================================

    bool warnings_as_errors = false;                 // -Werror
    bool suppress_all_warnings = false;              // -w
    bool verbose = false;                            // -v, --verbose
    bool debug = false;                              // --debug
    bool quiet = false;                              // -q, --quiet
    ColorMode color = ColorMode::Auto;               // --color=auto|always|never

    OutputMode output_mode = OutputMode::Compile;
};

/// Parse command-line arguments
/// Throws std::runtime_error on invalid arguments
CompilerOptions parse_command_line(int argc, char** argv);

void print_help(const char* program_name);

void print_version();

void print_backends();

}  // namespace zplc::driver
