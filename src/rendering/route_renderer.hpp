#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include <cairo.h>

#include "../core/logging.hpp"
#include "../core/types.hpp"
#include "../geometry/geometry.hpp"
#include "../graph/street_graph.hpp"

namespace calmpath {

struct RenderStyle {
    double line_width = 1.0;
    double point_size = 2.0;
    struct Color { double r, g, b, a; } color = {0.0, 0.0, 0.0, 1.0};
    bool filled = false;
    bool stroked = true;
};

// Style presets
namespace styles {
    extern const RenderStyle street_default;
    extern const RenderStyle route_line;
    extern const RenderStyle route_endpoint;
    extern const RenderStyle warning_marker;
    extern const RenderStyle layer_noise;
    extern const RenderStyle layer_crowd;
    extern const RenderStyle layer_light;
    extern const RenderStyle layer_puddles;

    const RenderStyle& for_layer(LayerType layer);
}

struct RenderOptions {
    int width = 1024;
    int height = 1024;
    // Share of the image left empty around the drawing.
    double margin = 0.05;
    RenderStyle::Color background = {0.97, 0.96, 0.94, 1.0};
};

/**
 * Draws a street graph, layer polygons and a route into a cairo image
 * surface, north up, in a local meter projection around the graph center.
 */
class RouteRenderer {
public:
    explicit RouteRenderer(RenderOptions options = {}, LogCallback log_callback = nullptr);
    ~RouteRenderer();

    RouteRenderer(const RouteRenderer&) = delete;
    RouteRenderer& operator=(const RouteRenderer&) = delete;

    void begin_frame(const BoundingBox& bounds);

    void draw_graph(const StreetGraph& graph, const RenderStyle& style);
    void draw_polygon(const Polygon& ring, const RenderStyle& style);
    void draw_layer(const std::vector<LayerPolygon>& polygons);
    void draw_route(const RouteResult& route);

    // Returns false and logs when the surface or the file cannot be written.
    bool write_png(const std::filesystem::path& output);

    [[nodiscard]] cairo_surface_t* surface() const noexcept;

private:
    geometry::Point2D to_screen(const Point& point) const;
    void draw_point(const Point& point, const RenderStyle& style);
    void apply(const RenderStyle& style);

    struct Impl;
    std::unique_ptr<Impl> impl_;
    RenderOptions options_;
    Logger logger_;
};

// Convenience wrapper: graph, every given polygon and the route in one PNG.
bool render_route_png(const std::filesystem::path& output, const StreetGraph& graph,
                      const std::vector<LayerPolygon>& polygons, const RouteResult& route,
                      const RenderOptions& options = {}, LogCallback log_callback = nullptr);

} // namespace calmpath
