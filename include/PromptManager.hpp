#pragma once
#include "PromptConfig.hpp"
#include "TextStyle.hpp"
#include "console_io.hpp"

#include <optional>
#include <string>

// Only shapes a yes/no line can take once accepted.
enum class YesNoAnswer { Yes, No, Empty };

// Classifies an already-trimmed answer: "y"/"n" (any case) or "".
// nullopt means the line must be rejected and the prompt shown again.
std::optional<YesNoAnswer> classify_yes_no(const std::string& trimmed);

// Prompts on a LineIO. Holds a reference; the LineIO must outlive it.
class PromptManager {
public:
    explicit PromptManager(LineIO& io, PromptConfig config = PromptConfig{});

    // Writes the prompt (styled as a whole, or trimmed when unstyled),
    // and loops until the answer is y, n or empty. Empty yields defaultValue.
    // Throws PromptIOError on flush/read failure.
    bool promptYesNo(const std::string& prompt,
                     const std::optional<StyleChoice>& style,
                     bool defaultValue) const;

    // Writes "<prompt>: [<choices>]: " with only <choices> styled, reads one
    // line and returns it trimmed, or defaultValue untouched if it is empty.
    // The answer is not checked against choices.
    // Throws PromptIOError on flush/read failure.
    std::string promptSelection(const std::string& prompt,
                                const std::string& choices,
                                const std::optional<StyleChoice>& style,
                                const std::string& defaultValue) const;

private:
    std::string render(const std::string& text, const std::optional<StyleChoice>& style) const;

    LineIO&      m_io;
    PromptConfig m_config;
};

// Same as PromptManager on std::cin/std::cout with PromptConfig::fromEnvironment().
bool prompt_yes_no(const std::string& prompt,
                   const std::optional<StyleChoice>& style,
                   bool defaultValue);

std::string prompt_selection(const std::string& prompt,
                             const std::string& choices,
                             const std::optional<StyleChoice>& style,
                             const std::string& defaultValue);
