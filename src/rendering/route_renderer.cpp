#include "route_renderer.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <optional>
#include <utility>

namespace calmpath {

// RenderStyle definitions
namespace styles {
    const RenderStyle street_default{
        .line_width = 2.0,
        .color = {0.6, 0.6, 0.6, 1.0},
        .filled = false,
        .stroked = true
    };

    const RenderStyle route_line{
        .line_width = 5.0,
        .color = {0.15, 0.45, 0.85, 0.9},
        .filled = false,
        .stroked = true
    };

    const RenderStyle route_endpoint{
        .point_size = 7.0,
        .color = {0.1, 0.3, 0.7, 1.0},
        .filled = true,
        .stroked = false
    };

    const RenderStyle warning_marker{
        .line_width = 2.0,
        .point_size = 6.0,
        .color = {0.85, 0.1, 0.1, 1.0},
        .filled = false,
        .stroked = true
    };

    const RenderStyle layer_noise{
        .line_width = 1.0,
        .color = {0.9, 0.3, 0.2, 0.35},
        .filled = true,
        .stroked = true
    };

    const RenderStyle layer_crowd{
        .line_width = 1.0,
        .color = {0.7, 0.3, 0.8, 0.35},
        .filled = true,
        .stroked = true
    };

    const RenderStyle layer_light{
        .line_width = 1.0,
        .color = {1.0, 0.85, 0.2, 0.4},
        .filled = true,
        .stroked = true
    };

    const RenderStyle layer_puddles{
        .line_width = 1.0,
        .color = {0.3, 0.6, 0.95, 0.4},
        .filled = true,
        .stroked = true
    };

    const RenderStyle& for_layer(LayerType layer) {
        switch (layer) {
            case LayerType::kNoise:
                return layer_noise;
            case LayerType::kCrowd:
                return layer_crowd;
            case LayerType::kLight:
                return layer_light;
            case LayerType::kPuddles:
                return layer_puddles;
        }
        return layer_noise;
    }
}

struct RouteRenderer::Impl {
    cairo_surface_t* surface = nullptr;
    cairo_t* cr = nullptr;
    std::optional<geometry::LocalProjection> projection;
    double scale = 1.0;
    geometry::Point2D center{0.0, 0.0};

    void release() {
        if (cr) {
            cairo_destroy(cr);
            cr = nullptr;
        }
        if (surface) {
            cairo_surface_destroy(surface);
            surface = nullptr;
        }
    }

    ~Impl() { release(); }
};

RouteRenderer::RouteRenderer(RenderOptions options, LogCallback log_callback)
    : impl_(std::make_unique<Impl>())
    , options_(options)
    , logger_("RouteRenderer", std::move(log_callback)) {}

RouteRenderer::~RouteRenderer() = default;

cairo_surface_t* RouteRenderer::surface() const noexcept {
    return impl_->surface;
}

void RouteRenderer::begin_frame(const BoundingBox& bounds) {
    impl_->release();
    impl_->surface = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, options_.width, options_.height);
    impl_->cr = cairo_create(impl_->surface);

    const auto& bg = options_.background;
    cairo_set_source_rgba(impl_->cr, bg.r, bg.g, bg.b, bg.a);
    cairo_paint(impl_->cr);

    // Fit the box into the viewport, keeping the aspect ratio
    impl_->projection.emplace(bounds.center());
    const auto low = impl_->projection->to_local(Point(bounds.min_lat, bounds.min_lon));
    const auto high = impl_->projection->to_local(Point(bounds.max_lat, bounds.max_lon));
    const double map_width = std::max(high.x - low.x, 1.0);
    const double map_height = std::max(high.y - low.y, 1.0);
    const double usable = 1.0 - 2.0 * options_.margin;
    impl_->scale = std::min(options_.width * usable / map_width, options_.height * usable / map_height);
    impl_->center = geometry::Point2D{(low.x + high.x) * 0.5, (low.y + high.y) * 0.5};

    cairo_set_line_cap(impl_->cr, CAIRO_LINE_CAP_ROUND);
    cairo_set_line_join(impl_->cr, CAIRO_LINE_JOIN_ROUND);
}

geometry::Point2D RouteRenderer::to_screen(const Point& point) const {
    const auto local = impl_->projection->to_local(point);
    // screen y grows downwards
    return geometry::Point2D{options_.width * 0.5 + (local.x - impl_->center.x) * impl_->scale,
                             options_.height * 0.5 - (local.y - impl_->center.y) * impl_->scale};
}

void RouteRenderer::apply(const RenderStyle& style) {
    cairo_set_line_width(impl_->cr, style.line_width);
    cairo_set_source_rgba(impl_->cr, style.color.r, style.color.g, style.color.b, style.color.a);
}

void RouteRenderer::draw_graph(const StreetGraph& graph, const RenderStyle& style) {
    if (!impl_->cr) {
        return;
    }
    apply(style);
    for (const auto& edge : graph.edges()) {
        const auto from = to_screen(graph.node(edge.from).location);
        const auto to = to_screen(graph.node(edge.to).location);
        cairo_move_to(impl_->cr, from.x, from.y);
        cairo_line_to(impl_->cr, to.x, to.y);
    }
    cairo_stroke(impl_->cr);
}

void RouteRenderer::draw_polygon(const Polygon& ring, const RenderStyle& style) {
    if (!impl_->cr || ring.size() < 3) {
        return;
    }
    apply(style);

    bool first = true;
    for (const auto& vertex : ring) {
        const auto transformed = to_screen(vertex);
        if (first) {
            cairo_move_to(impl_->cr, transformed.x, transformed.y);
            first = false;
        } else {
            cairo_line_to(impl_->cr, transformed.x, transformed.y);
        }
    }
    cairo_close_path(impl_->cr);

    if (style.filled && style.stroked) {
        cairo_fill_preserve(impl_->cr);
        cairo_stroke(impl_->cr);
    } else if (style.filled) {
        cairo_fill(impl_->cr);
    } else {
        cairo_stroke(impl_->cr);
    }
}

void RouteRenderer::draw_layer(const std::vector<LayerPolygon>& polygons) {
    for (const auto& polygon : polygons) {
        draw_polygon(polygon.ring, styles::for_layer(polygon.layer));
    }
}

void RouteRenderer::draw_point(const Point& point, const RenderStyle& style) {
    apply(style);
    const auto transformed = to_screen(point);
    cairo_new_sub_path(impl_->cr);
    cairo_arc(impl_->cr, transformed.x, transformed.y, style.point_size, 0, 2 * std::numbers::pi);
    if (style.filled) {
        cairo_fill(impl_->cr);
    } else {
        cairo_stroke(impl_->cr);
    }
}

void RouteRenderer::draw_route(const RouteResult& route) {
    if (!impl_->cr || route.path.empty()) {
        return;
    }

    if (route.path.size() > 1) {
        apply(styles::route_line);
        const auto first_point = to_screen(route.path.front());
        cairo_move_to(impl_->cr, first_point.x, first_point.y);
        for (std::size_t i = 1; i < route.path.size(); ++i) {
            const auto transformed = to_screen(route.path[i]);
            cairo_line_to(impl_->cr, transformed.x, transformed.y);
        }
        cairo_stroke(impl_->cr);
    }

    for (const auto& warning : route.warnings) {
        draw_point(warning.location, styles::warning_marker);
    }
    draw_point(route.path.front(), styles::route_endpoint);
    draw_point(route.path.back(), styles::route_endpoint);
}

bool RouteRenderer::write_png(const std::filesystem::path& output) {
    if (!impl_->surface) {
        logger_.error("Nothing rendered; call begin_frame first");
        return false;
    }
    cairo_surface_flush(impl_->surface);
    if (cairo_surface_status(impl_->surface) != CAIRO_STATUS_SUCCESS) {
        logger_.error(std::string("Surface error: ") + cairo_status_to_string(cairo_surface_status(impl_->surface)));
        return false;
    }

    const cairo_status_t status = cairo_surface_write_to_png(impl_->surface, output.string().c_str());
    if (status != CAIRO_STATUS_SUCCESS) {
        logger_.error("Failed to write " + output.string() + ": " + cairo_status_to_string(status));
        return false;
    }
    logger_.info("Wrote " + output.string());
    return true;
}

bool render_route_png(const std::filesystem::path& output, const StreetGraph& graph,
                      const std::vector<LayerPolygon>& polygons, const RouteResult& route,
                      const RenderOptions& options, LogCallback log_callback) {
    RouteRenderer renderer(options, std::move(log_callback));
    renderer.begin_frame(graph.bounds());
    renderer.draw_layer(polygons);
    renderer.draw_graph(graph, styles::street_default);
    renderer.draw_route(route);
    return renderer.write_png(output);
}

} // namespace calmpath
