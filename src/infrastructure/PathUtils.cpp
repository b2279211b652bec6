#include "infrastructure/PathUtils.hpp"
#include <cstdlib>

namespace habitpoints::infrastructure {

namespace fs = std::filesystem;

namespace {

const char* NonEmptyEnv(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

} // namespace

fs::path PathUtils::GetConfigHome() {
    if (const char* xdg = NonEmptyEnv("XDG_CONFIG_HOME")) {
        return fs::path(xdg);
    }
    if (const char* home = NonEmptyEnv("HOME")) {
        return fs::path(home) / ".config";
    }
    return fs::current_path();
}

fs::path PathUtils::GetAppConfigDir() {
    // Not created here; a missing directory means default settings.
    return GetConfigHome() / "HabitPoints";
}

} // namespace habitpoints::infrastructure
