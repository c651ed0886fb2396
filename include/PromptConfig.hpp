#pragma once

struct PromptConfig {
    // When false, styled text is written plain (still untrimmed).
    bool colorize = true;

    // NO_COLOR (non-empty) disables colors; CLICOLOR_FORCE (set, not "0")
    // re-enables them and wins over NO_COLOR.
    static PromptConfig fromEnvironment();
};
