#include "ps3_update/common/progress_bar.hpp"
#include "ps3_update/common/format.hpp"
#include <algorithm>
#include <sstream>
#include <sys/ioctl.h>
#include <unistd.h>

namespace ps3_update {
namespace common {

namespace {

constexpr int MIN_BAR_WIDTH = 10;
constexpr int MAX_BAR_WIDTH = 40;

}

ProgressBarRenderer::ProgressBarRenderer(const std::string& label, bool use_colors)
    : label_(label),
      use_colors_(use_colors),
      interactive_(isatty(STDOUT_FILENO)),
      completed_(false) {}

void ProgressBarRenderer::update(const ProgressSnapshot& snapshot) {
    snapshot_ = snapshot;
}

void ProgressBarRenderer::complete() {
    completed_ = true;
}

void ProgressBarRenderer::clear(std::ostream& out) {
    if (!interactive_) return;
    out << "\r\033[K" << std::flush;
}

int ProgressBarRenderer::clampedPercent(double percent) {
    if (percent <= 0.0) {
        return 0;
    }
    return static_cast<int>(std::min(percent, 100.0));
}

void ProgressBarRenderer::render(std::ostream& out) {
    if (!interactive_ && !completed_) {
        return;
    }
    
    if (completed_) {
        if (interactive_) {
            out << "\r\033[K";
        }
        return;
    }
    
    std::ostringstream oss;
    oss << "\r";
    
    if (use_colors_) {
        oss << "\033[36m";
    }
    
    if (snapshot_.total > 0) {
        int percent = clampedPercent(snapshot_.percent);
        int bar_width = std::clamp(getTerminalWidth() - 60, MIN_BAR_WIDTH, MAX_BAR_WIDTH);
        int filled = bar_width * percent / 100;
        
        oss << label_ << ": [";
        for (int i = 0; i < bar_width; ++i) {
            if (i < filled) {
                oss << "=";
            } else if (i == filled) {
                oss << ">";
            } else {
                oss << " ";
            }
        }
        oss << "] " << percent << "% ";
        
        if (use_colors_) {
            oss << "\033[0m";
        }
        
        oss << "(" << formatSize(snapshot_.transferred) << "/" << formatSize(snapshot_.total) << ")";
    } else {
        oss << label_ << ": " << formatSize(snapshot_.transferred) << " downloaded...";
        
        if (use_colors_) {
            oss << "\033[0m";
        }
    }
    
    oss << " @ " << snapshot_.throughput_human << "\033[K";
    
    out << oss.str() << std::flush;
}

int ProgressBarRenderer::getTerminalWidth() const {
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return w.ws_col;
    }
    return 80;
}

}}
