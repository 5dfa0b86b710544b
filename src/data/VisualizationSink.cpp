#include "data/VisualizationSink.hpp"

#include <cmath>
#include <string>

namespace randomwalk {

void PlotOptions::validate() const {
    if (!std::isfinite(yMin) || !std::isfinite(yMax) || yMin >= yMax) {
        throw InvalidParameter("Plot range requires finite y_min < y_max, got ["
                               + std::to_string(yMin) + ", " + std::to_string(yMax) + "]");
    }
}

} // namespace randomwalk
