#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>

enum class OutputKind {
    Clipboard, // selection only
    Type,      // selection, then the paste chord into the focused window
};

inline std::optional<OutputKind> parse_output_kind(std::string_view name) {
    if (name == "clipboard") return OutputKind::Clipboard;
    if (name == "type") return OutputKind::Type;
    return std::nullopt;
}

inline const char* output_kind_name(OutputKind kind) {
    return kind == OutputKind::Type ? "type" : "clipboard";
}

// Hands a finished transcript to the desktop. Called from a controller
// thread, one transcript at a time.
class OutputMethod {
public:
    virtual ~OutputMethod() = default;
    virtual OutputKind kind() const = 0;
    virtual std::expected<void, std::string> deliver(const std::string& text) = 0;
};
