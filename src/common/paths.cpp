#include "upload_guard/common/paths.hpp"
#include "upload_guard/common/constants.hpp"
#include <filesystem>
#include <cstdlib>
#include <cstring>

namespace upload_guard {
namespace common {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

std::vector<std::string> PathManager::getConfigSearchPaths() const {
    std::vector<std::string> paths;
    
    if (const char* env = std::getenv(constants::env::CONFIG_PATH)) {
        if (strlen(env) > 0) {
            paths.push_back(env);
        }
    }
    
    std::string user_config = getUserConfigFile();
    if (!user_config.empty()) {
        paths.push_back(user_config);
    }
    
    paths.push_back(constants::system::SYSTEM_CONFIG_FILE);
    
    return paths;
}

std::string PathManager::getUserConfigFile() const {
    std::string xdg = getXdgConfigHome();
    if (xdg.empty()) {
        return "";
    }
    return xdg + "/upload-guard/" + constants::system::CONFIG_FILE_NAME;
}

std::string PathManager::getTempDir() const {
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return "/tmp";
    }
    return tmp.string();
}

std::string PathManager::getXdgConfigHome() const {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && strlen(xdg) > 0) {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/.config" : "";
}

}}
