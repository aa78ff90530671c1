//
// Error taxonomy shared by the parser, the codec, the engine and backends.
//

#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace zplc {
    class error : public std::runtime_error {
        public:
            explicit error(const std::string& msg)
                : std::runtime_error(msg) {
            }
    };

    class parse_error : public error {
        public:
            parse_error(const std::string& msg, std::size_t line, std::size_t column)
                : error(build_message(msg, line, column)),
                  line_(line),
                  column_(column),
                  detail_(msg) {
            }

            [[nodiscard]] std::size_t line() const { return line_; }
            [[nodiscard]] std::size_t column() const { return column_; }

            /// Message without the location prefix
            [[nodiscard]] const std::string& detail() const { return detail_; }

        private:
            std::size_t line_;
            std::size_t column_;
            std::string detail_;

            static std::string build_message(const std::string& msg, std::size_t line, std::size_t column) {
                return "Parse error at line " + std::to_string(line) + ", column "
                       + std::to_string(column) + ": " + msg;
            }
    };

    class empty_input_error : public error {
        public:
            empty_input_error()
                : error("Empty or invalid ZPL input") {
            }
    };

    class security_limit_error : public error {
        public:
            explicit security_limit_error(const std::string& msg)
                : error("Security limit exceeded: " + msg) {
            }
    };

    class image_error : public error {
        public:
            explicit image_error(const std::string& msg)
                : error("Image processing error: " + msg) {
            }
    };

    class font_error : public error {
        public:
            explicit font_error(const std::string& msg)
                : error("Font error: " + msg) {
            }
    };

    class backend_error : public error {
        public:
            explicit backend_error(const std::string& msg)
                : error("Rendering backend error: " + msg) {
            }
    };

    class config_error : public error {
        public:
            explicit config_error(const std::string& msg)
                : error("Configuration error: " + msg) {
            }
    };
}
