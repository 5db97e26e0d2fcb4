#pragma once

namespace orbit {
    /// Command-line entry point. Returns the process exit code.
    int runSpeedApplication(int argc, const char *const argv[]);
} // namespace orbit
