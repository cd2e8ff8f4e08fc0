#pragma once

#include "types.hpp"
#include <string>
#include <ostream>

namespace ps3_update {
namespace common {

class ProgressBarRenderer {
public:
    explicit ProgressBarRenderer(const std::string& label, bool use_colors = true);
    
    void update(const ProgressSnapshot& snapshot);
    void complete();
    void clear(std::ostream& out);
    
    void render(std::ostream& out);
    
    bool isComplete() const { return completed_; }
    
    // Bar position never goes past 100 even when the counter overshoots the total.
    static int clampedPercent(double percent);

private:
    std::string label_;
    bool use_colors_;
    bool interactive_;
    bool completed_;
    
    ProgressSnapshot snapshot_;
    
    int getTerminalWidth() const;
};

}}
