#include "compiler.hh"
#include <zplc/backend_registry.hh>
#include <zplc/codec.hh>
#include <zplc/error.hh>
#include <zplc/netpbm.hh>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>

namespace zplc::driver {

using namespace zplc::render;

Compiler::Compiler(const CompilerOptions& options, Logger& logger)
    : options_(options)
    , logger_(logger)
{
}

int Compiler::compile() {
    try {
        if (options_.output_mode == OutputMode::EncodeImage) {
            return encode_image();
        }

        logger_.verbose("Starting compilation...");

        LabelSetup setup = resolve_setup();

        Backend& backend = BackendRegistry::instance().get(setup.backend);

        // Apply backend-specific options
        auto options_it = options_.backend_options.find(backend.get_name());
        if (options_it != options_.backend_options.end()) {
            for (const auto& [option_name, option_value] : options_it->second) {
                logger_.debug("Backend option " + option_name + " = " + render::to_string(option_value));
                backend.set_option(option_name, option_value);
            }
        }

        bool ok = true;
        for (const auto& input_file : options_.input_files) {
            logger_.info("Compiling: " + input_file.string());
            if (!compile_label_file(input_file, setup, backend)) {
                ok = false;
            }
        }

        if (!ok) {
            return 1;
        }

        logger_.success("Compilation successful");
        return 0;

    } catch (const parse_error& e) {
        logger_.error(e.what());
        return 1;
    } catch (const config_error& e) {
        logger_.error(e.what());
        return 1;
    } catch (const zplc::error& e) {
        logger_.error(e.what());
        return 1;
    } catch (const std::exception& e) {
        logger_.error(std::string("Error: ") + e.what());
        return 1;
    }
}

// ============================================================================
// Pipeline Stages
// ============================================================================

LabelSetup Compiler::resolve_setup() {
    LabelSetup setup;

    label_config config;
    if (options_.config_file) {
        logger_.verbose("Loading configuration: " + options_.config_file->string());
        config = load_label_config(*options_.config_file);
    }

    // Command line wins over the configuration file
    if (auto width = options_.width ? options_.width : config.width) {
        setup.width = *width;
    }
    if (auto height = options_.height ? options_.height : config.height) {
        setup.height = *height;
    }
    if (auto dpi = options_.dpi ? options_.dpi : config.dpi) {
        setup.dpi = resolution::from_dpi(*dpi);
    }
    if (auto backend = options_.backend ? options_.backend : config.backend) {
        setup.backend = *backend;
    }

    setup.variables = config.variables;
    for (const auto& [name, value] : options_.variables) {
        setup.variables[name] = value;
    }

    auto fonts = std::make_shared<font_registry>();
    auto load_fonts = [&](const std::vector<font_binding>& bindings) {
        for (const auto& binding : bindings) {
            logger_.verbose("Loading font " + binding.file.string() + " for "
                            + std::string(1, binding.from) + "-" + std::string(1, binding.to));
            fonts->register_font_file(binding.file, binding.from, binding.to);
        }
    };
    load_fonts(config.fonts);
    load_fonts(options_.fonts);
    setup.fonts = std::move(fonts);

    logger_.debug("Label: " + std::to_string(setup.width.to_dots(setup.dpi)) + "x"
                  + std::to_string(setup.height.to_dots(setup.dpi)) + " dots at "
                  + std::to_string(setup.dpi.dpi()) + " dpi, backend " + setup.backend);

    return setup;
}

std::string Compiler::read_input(const std::filesystem::path& input_file) {
    if (input_file == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
    }

    std::ifstream ifs(input_file, std::ios::binary);
    if (!ifs) {
        throw std::runtime_error("Cannot open file: " + input_file.string());
    }
    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    return buffer.str();
}

bool Compiler::compile_label_file(const std::filesystem::path& input_file,
                                  const LabelSetup& setup,
                                  Backend& backend) {
    std::string text = read_input(input_file);

    engine label(text, setup.width, setup.height, setup.dpi);
    label.set_fonts(setup.fonts);

    logger_.verbose(std::to_string(label.instructions().size()) + " instruction(s)");

    std::size_t warnings = print_diagnostics(input_file, label.diagnostics());
    if (warnings > 0 && options_.warnings_as_errors) {
        logger_.error(input_file.string() + ": warnings treated as errors");
        return false;
    }

    logger_.verbose("Rendering with backend: " + backend.get_name());
    std::vector<uint8_t> content = label.render(backend, setup.variables);

    write_output(input_file, backend, content);
    return true;
}

int Compiler::encode_image() {
    logger_.verbose("Encoding: " + options_.encode_image->string());

    codec::gray_image image = codec::load_netpbm(*options_.encode_image);
    codec::encoded_bitmap bitmap = codec::encode(image);

    std::cout << "^GFA," << bitmap.total_bytes << "," << bitmap.total_bytes << ","
              << bitmap.bytes_per_row << "," << bitmap.data << "\n";
    return 0;
}

// ============================================================================
// Output
// ============================================================================

void Compiler::write_output(const std::filesystem::path& input_file,
                            const Backend& backend,
                            const std::vector<uint8_t>& content) {
    if (options_.write_stdout) {
        std::cout.write(reinterpret_cast<const char*>(content.data()),
                        static_cast<std::streamsize>(content.size()));
        std::cout.flush();
        return;
    }

    // Determine output directory (use current directory if not specified)
    std::filesystem::path output_dir = options_.output_dir;
    if (output_dir.empty()) {
        output_dir = std::filesystem::current_path();
    }
    std::filesystem::create_directories(output_dir);

    std::string stem = input_file == "-" ? std::string("label") : input_file.stem().string();
    std::filesystem::path path = output_dir / (stem + backend.get_file_extension());

    logger_.verbose("Writing: " + path.string());

    std::ofstream ofs(path, std::ios::binary);
    if (!ofs) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }

    ofs.write(reinterpret_cast<const char*>(content.data()),
              static_cast<std::streamsize>(content.size()));

    if (!ofs) {
        throw std::runtime_error("Failed to write file: " + path.string());
    }

    logger_.success("Generated: " + path.string());
}

// ============================================================================
// Utility Methods
// ============================================================================

std::size_t Compiler::print_diagnostics(const std::filesystem::path& input_file,
                                        const std::vector<ir::diagnostic>& diagnostics) {
    std::size_t warnings = 0;
    for (const auto& diag : diagnostics) {
        if (diag.level == ir::diagnostic_level::warning) {
            ++warnings;
            if (!options_.suppress_all_warnings) {
                logger_.diagnostic(Logger::Severity::Warning, input_file, diag.line, diag.message);
            }
        } else {
            logger_.diagnostic(Logger::Severity::Note, input_file, diag.line, diag.message);
        }
    }

    if (warnings > 0 && !options_.suppress_all_warnings) {
        logger_.warning("Total warnings: " + std::to_string(warnings));
    }
    return warnings;
}

}  // namespace zplc::driver
