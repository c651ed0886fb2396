// src/main.cpp
#include "PromptManager.hpp"
#include "PromptConfig.hpp"
#include "TextStyle.hpp"
#include "console_io.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <array>

// ----- Small helpers -----

static const std::array<StyleVariant, 4> ALL_VARIANTS = {
    StyleVariant::Normal, StyleVariant::Background,
    StyleVariant::Bright, StyleVariant::BrightBackground
};

static const std::array<StyleColor, 8> ALL_COLORS = {
    StyleColor::Black, StyleColor::Red, StyleColor::Green, StyleColor::Yellow,
    StyleColor::Blue, StyleColor::Magenta, StyleColor::Cyan, StyleColor::White
};

// Blank means "no style". Re-asks on unknown names.
static std::optional<StyleChoice> ask_style() {
    for (;;) {
        std::string name = prompt_selection("Style", "e.g. green, on-red, bright-cyan; blank=none",
                                            std::nullopt, "");
        if (name.empty()) return std::nullopt;
        if (auto style = parse_style_choice(name)) return style;
        std::cout << "Unknown style '" << name << "'.\n";
    }
}

// ----- Menu actions -----

static void action_yes_no(const PromptManager& pm) {
    std::string prompt = pm.promptSelection("Question", "blank=Approved? (Y/n) >>>",
                                            std::nullopt, "Approved? (Y/n) >>> ");
    auto style = ask_style();
    bool def = prompt_yes_no("Default answer is yes? (Y/n) ", std::nullopt, true);

    bool answer = pm.promptYesNo(prompt, style, def);
    std::cout << "Answer: " << (answer ? "yes" : "no") << "\n";
}

static void action_selection(const PromptManager& pm) {
    std::string prompt  = pm.promptSelection("Question", "blank=Choose something",
                                             std::nullopt, "Choose something");
    std::string choices = pm.promptSelection("Choices", "blank=(a)pples, (b)ananas, (D)oughnuts",
                                             std::nullopt, "(a)pples, (b)ananas, (D)oughnuts");
    std::string def     = pm.promptSelection("Default", "blank=D", std::nullopt, "D");
    auto style = ask_style();

    std::string answer = pm.promptSelection(prompt, choices, style, def);
    std::cout << "Selected: '" << answer << "'\n";
}

static void action_preview(const PromptConfig& cfg) {
    if (!cfg.colorize) {
        std::cout << "(colors disabled by NO_COLOR)\n";
    }
    for (StyleVariant v : ALL_VARIANTS) {
        for (StyleColor c : ALL_COLORS) {
            StyleChoice style{ v, c };
            std::cout << "  " << render_styled(to_string(style), style, cfg.colorize);
        }
        std::cout << "\n";
    }
}

// ----- Main -----

int main() {
    try {
        const PromptConfig cfg = PromptConfig::fromEnvironment();
        StreamLineIO io(std::cin, std::cout);
        PromptManager pm(io, cfg);

        const StyleChoice menuStyle{ StyleVariant::Bright, StyleColor::Cyan };

        for (;;) {
            std::cout << "\n=== Menu ===\n"
                         "1) Yes/no prompt\n"
                         "2) Selection prompt\n"
                         "3) Style preview\n"
                         "q) Quit\n";
            std::string choice = pm.promptSelection(">", "1, 2, 3, Q", menuStyle, "q");

            if (choice == "1") action_yes_no(pm);
            else if (choice == "2") action_selection(pm);
            else if (choice == "3") action_preview(cfg);
            else if (choice == "q" || choice == "Q") break;
            else std::cout << "Unknown option.\n";

            if (!std::cin) {
                std::cerr << "Error: input closed.\n";
                break;
            }
        }

        return 0;
    } catch (const std::exception& ex) {
        std::cerr << "[Fatal] " << ex.what() << "\n";
        return 99;
    }
}
