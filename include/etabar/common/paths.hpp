#pragma once

#include <string>
#include <vector>

namespace etabar {
namespace common {

class PathManager {
public:
    static PathManager& instance();
    
    std::string getConfigDir() const;
    
    std::string getConfigFile() const;
    std::vector<std::string> getConfigSearchPaths() const;
    
private:
    PathManager() = default;
    
    std::string getXdgConfigHome() const;
};

}}
