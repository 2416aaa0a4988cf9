#include "types.hpp"
#include "errors.hpp"

#include <cmath>

namespace calmpath {

const char* layer_type_name(LayerType type) {
    switch (type) {
        case LayerType::kNoise:
            return "noise";
        case LayerType::kCrowd:
            return "crowd";
        case LayerType::kLight:
            return "light";
        case LayerType::kPuddles:
            return "puddles";
    }
    return "unknown";
}

std::optional<LayerType> parse_layer_type(std::string_view name) {
    for (LayerType type : kAllLayerTypes) {
        if (name == layer_type_name(type)) {
            return type;
        }
    }
    return std::nullopt;
}

const char* error_kind_name(EngineError::ErrorKind kind) {
    switch (kind) {
        case EngineError::ErrorKind::NoGraphData:
            return "NoGraphData";
        case EngineError::ErrorKind::PointOutOfRange:
            return "PointOutOfRange";
        case EngineError::ErrorKind::NoRouteFound:
            return "NoRouteFound";
        case EngineError::ErrorKind::Cancelled:
            return "Cancelled";
        case EngineError::ErrorKind::InvalidRequest:
            return "InvalidRequest";
    }
    return "Unknown";
}

bool RouteWeights::is_valid() const {
    for (double weight : values) {
        if (!std::isfinite(weight) || weight < 0.0) {
            return false;
        }
    }
    return true;
}

} // namespace calmpath
