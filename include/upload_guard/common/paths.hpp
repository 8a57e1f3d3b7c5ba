#pragma once

#include <string>
#include <vector>

namespace upload_guard {
namespace common {

class PathManager {
public:
    static PathManager& instance();

    std::vector<std::string> getConfigSearchPaths() const;

    std::string getUserConfigFile() const;
    std::string getTempDir() const;

private:
    PathManager() = default;

    std::string getXdgConfigHome() const;
};

}}
