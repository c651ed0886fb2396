#include "PromptManager.hpp"
#include "string_util.hpp"

#include <stdexcept>

std::optional<YesNoAnswer> classify_yes_no(const std::string& trimmed) {
    if (trimmed.empty()) return YesNoAnswer::Empty;
    if (trimmed.size() != 1) return std::nullopt;

    switch (trimmed[0]) {
        case 'y': case 'Y': return YesNoAnswer::Yes;
        case 'n': case 'N': return YesNoAnswer::No;
        default:            return std::nullopt;
    }
}

PromptManager::PromptManager(LineIO& io, PromptConfig config)
: m_io(io), m_config(config)
{}

std::string PromptManager::render(const std::string& text,
                                  const std::optional<StyleChoice>& style) const {
    if (!style) return trim_copy(text);
    return render_styled(text, *style, m_config.colorize);
}

bool PromptManager::promptYesNo(const std::string& prompt,
                                const std::optional<StyleChoice>& style,
                                bool defaultValue) const {
    std::optional<YesNoAnswer> answer;
    while (!answer) {
        m_io.write(render(prompt, style));
        m_io.flush();
        answer = classify_yes_no(trim_copy(m_io.readLine()));
    }

    switch (*answer) {
        case YesNoAnswer::Yes:   return true;
        case YesNoAnswer::No:    return false;
        case YesNoAnswer::Empty: return defaultValue;
    }
    throw std::logic_error("promptYesNo: unhandled YesNoAnswer");
}

std::string PromptManager::promptSelection(const std::string& prompt,
                                           const std::string& choices,
                                           const std::optional<StyleChoice>& style,
                                           const std::string& defaultValue) const {
    // Only the choice list is ever colored; the question keeps terminal defaults.
    const std::string question = style ? prompt : trim_copy(prompt);
    m_io.write(question + ": [" + render(choices, style) + "]: ");
    m_io.flush();

    std::string input = trim_copy(m_io.readLine());
    if (input.empty()) return defaultValue;
    return input;
}

bool prompt_yes_no(const std::string& prompt,
                   const std::optional<StyleChoice>& style,
                   bool defaultValue) {
    StreamLineIO io;
    return PromptManager(io, PromptConfig::fromEnvironment())
        .promptYesNo(prompt, style, defaultValue);
}

std::string prompt_selection(const std::string& prompt,
                             const std::string& choices,
                             const std::optional<StyleChoice>& style,
                             const std::string& defaultValue) {
    StreamLineIO io;
    return PromptManager(io, PromptConfig::fromEnvironment())
        .promptSelection(prompt, choices, style, defaultValue);
}
