// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace hemoflow::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief <data home>/HemoFlow, created on demand. */
    static std::filesystem::path GetAppDataDir();

    static std::filesystem::path GetDefaultModelPath();
    static std::filesystem::path GetDefaultInventoryPath();
    static std::filesystem::path GetDefaultConfigPath();
};

} // namespace hemoflow::infrastructure
