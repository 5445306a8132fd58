#include "etabar/render/width_provider.hpp"
#include "etabar/common/constants.hpp"
#include "etabar/common/logger.hpp"
#include <sys/ioctl.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace etabar {
namespace render {

TerminalWidthProvider::TerminalWidthProvider(int fd) : fd_(fd) {}

TerminalWidthProvider::TerminalWidthProvider() : fd_(STDOUT_FILENO) {}

int TerminalWidthProvider::columns() const {
    int width = queryTerminal();
    if (width > 0) {
        return width;
    }
    
    width = readColumnsEnv();
    if (width > 0) {
        return width;
    }
    
    common::Logger::instance().debug("[Width] Terminal width unavailable | fd={}", fd_);
    return 0;
}

int TerminalWidthProvider::queryTerminal() const {
    struct winsize w;
    if (ioctl(fd_, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return w.ws_col;
    }
    return 0;
}

int TerminalWidthProvider::readColumnsEnv() {
    const char* env = std::getenv("COLUMNS");
    if (!env || strlen(env) == 0) {
        return 0;
    }
    
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(env, &end, 10);
    if (errno != 0 || *end != '\0' || value <= 0 || value > constants::limits::MAX_WIDTH) {
        return 0;
    }
    return static_cast<int>(value);
}

}}
