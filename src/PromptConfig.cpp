#include "PromptConfig.hpp"

#include <cstdlib>
#include <string>

PromptConfig PromptConfig::fromEnvironment() {
    PromptConfig cfg;

    const char* noColor = std::getenv("NO_COLOR");
    if (noColor && *noColor != '\0') {
        cfg.colorize = false;
    }

    const char* force = std::getenv("CLICOLOR_FORCE");
    if (force && std::string(force) != "0") {
        cfg.colorize = true;
    }
    return cfg;
}
