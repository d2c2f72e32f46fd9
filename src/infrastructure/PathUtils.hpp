// PathUtils Header
#pragma once
#include <string>
#include <filesystem>

namespace docudigest::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();
    /** @brief <data home>/DocuDigest, created on demand. */
    static std::filesystem::path GetAppDataDir();
    /** @brief <config home>/DocuDigest/settings.json (may not exist). */
    static std::filesystem::path GetDefaultConfigPath();
};

} // namespace docudigest::infrastructure
