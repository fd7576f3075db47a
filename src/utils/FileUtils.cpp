#include "utils/FileUtils.hpp"
#include "utils/Logger.hpp"
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

namespace FileUtils {

bool ensureDirectoryExists(const std::string& path) {
    try {
        if (!fs::exists(path)) {
            return fs::create_directories(path);
        }
        return true;
    } catch (const fs::filesystem_error& e) {
        netepi::Logger::getInstance().error("FileUtils::ensureDirectoryExists",
                                           "Error creating directory " + path + ": " + e.what());
        return false;
    }
}

std::string getProjectRoot() {
    std::string currentDir = fs::current_path().string();
    std::vector<std::string> possibleRoots = { currentDir };

    fs::path current(currentDir);
    for (int i = 0; i < 5; i++) {
        current = current.parent_path();
        if (!current.empty()) {
            possibleRoots.push_back(current.string());
        }
    }

    for (const auto& root : possibleRoots) {
        if (fs::exists(root + "/data") &&
            fs::exists(root + "/include") &&
            fs::exists(root + "/src")) {
            return fs::absolute(fs::path(root)).lexically_normal().string();
        }
    }

    return fs::absolute(fs::path(currentDir)).lexically_normal().string();
}

std::string getOutputPath(const std::string& filename) {
    std::string projectRoot = getProjectRoot();
    fs::path outputDir = fs::path(projectRoot) / "data" / "output";

    if (!ensureDirectoryExists(outputDir.string())) {
        netepi::Logger::getInstance().warning("FileUtils::getOutputPath",
                                             "Could not create output directory: " + outputDir.string());
    }

    if (filename.empty()) {
        return outputDir.lexically_normal().string();
    } else {
        return (outputDir / filename).lexically_normal().string();
    }
}

std::string joinPaths(const std::string& path1, const std::string& path2) {
    if(path2.empty()){
        return path1;
    }
    std::string rel = path2;
    if (!rel.empty() && rel[0] == '/') {
        rel = rel.substr(1);
    }
    fs::path p = fs::path(path1) / fs::path(rel);
    return p.lexically_normal().string();
}

} // namespace FileUtils
