#include "etabar/common/paths.hpp"
#include "etabar/common/constants.hpp"
#include <cstdlib>
#include <cstring>

namespace etabar {
namespace common {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

std::vector<std::string> PathManager::getConfigSearchPaths() const {
    std::vector<std::string> paths;
    
    const char* env = std::getenv(constants::system::CONFIG_ENV);
    if (env && strlen(env) > 0) {
        paths.push_back(env);
    }
    
    paths.push_back(getConfigFile());
    
    return paths;
}

std::string PathManager::getConfigDir() const {
    std::string base = getXdgConfigHome();
    if (base.empty()) {
        return "./config";
    }
    return base + "/" + constants::system::APPLICATION_NAME;
}

std::string PathManager::getConfigFile() const {
    return getConfigDir() + "/" + constants::system::CONFIG_FILE_NAME;
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
