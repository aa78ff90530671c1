#pragma once

#include "compiler_options.hh"
#include "logger.hh"
#include <zplc/backend.hh>
#include <zplc/engine.hh>
#include <zplc/font_registry.hh>
#include <zplc/ir.hh>
#include <zplc/label_config.hh>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace zplc::driver {

/// Label setup after merging --config with the command line
struct LabelSetup {
    unit width = unit::inches(4);
    unit height = unit::inches(6);
    resolution dpi = resolution::standard(resolution::kind::dpi203);
    std::string backend = "listing";
    variable_map variables;
    shared_font_registry fonts;
};

/// Main compiler driver
class Compiler {
public:
    explicit Compiler(const CompilerOptions& options, Logger& logger);

    /// Compile every input label through the selected backend
    /// Returns 0 on success, non-zero on error
    int compile();

private:
    // ========================================================================
    // Pipeline Stages
    // ========================================================================

    /// Stage 1: Merge the configuration file, the command line and defaults
    LabelSetup resolve_setup();

    /// Stage 2: Read the label text ("-" is standard input)
    std::string read_input(const std::filesystem::path& input_file);

    /// Stage 3: Compile one label and render it
    /// Returns false when diagnostics fail the run (-Werror)
    bool compile_label_file(const std::filesystem::path& input_file,
                            const LabelSetup& setup,
                            render::Backend& backend);

    /// --encode: print a ^GFA command for an image
    int encode_image();

    // ========================================================================
    // Output
    // ========================================================================

    void write_output(const std::filesystem::path& input_file,
                      const render::Backend& backend,
                      const std::vector<uint8_t>& content);

    // ========================================================================
    // Utility Methods
    // ========================================================================

    /// Print builder diagnostics; returns the number of warnings reported
    std::size_t print_diagnostics(const std::filesystem::path& input_file,
                                  const std::vector<ir::diagnostic>& diagnostics);

    // ========================================================================
    // State
    // ========================================================================

    const CompilerOptions& options_;
    Logger& logger_;
};

}  // namespace zplc::driver
