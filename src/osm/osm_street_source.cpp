#include "osm_street_source.hpp"

#include <osmium/handler.hpp>
#include <osmium/io/any_input.hpp>
#include <osmium/io/reader.hpp>
#include <osmium/osm/node.hpp>
#include <osmium/osm/tag.hpp>
#include <osmium/osm/way.hpp>
#include <osmium/visitor.hpp>

#include <algorithm>
#include <cctype>
#include <exception>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace calmpath {

namespace {

using osm_id = osmium::object_id_type;

std::string to_lower_copy(std::string_view value) {
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool is_lit_place(const osmium::TagList& tags) {
    if (const char* shop = tags.get_value_by_key("shop")) {
        const std::string lower = to_lower_copy(shop);
        return lower == "mall" || lower == "department_store";
    }
    if (const char* amenity = tags.get_value_by_key("amenity")) {
        return to_lower_copy(amenity) == "marketplace";
    }
    return false;
}

bool pedestrian_excluded(const osmium::TagList& tags) {
    if (const char* foot = tags.get_value_by_key("foot")) {
        const std::string lower = to_lower_copy(foot);
        if (lower == "no" || lower == "private") {
            return true;
        }
    }
    if (const char* access = tags.get_value_by_key("access")) {
        const std::string lower = to_lower_copy(access);
        if (lower == "no" || lower == "private") {
            return !tags.has_key("foot");
        }
    }
    return false;
}

struct WayRecord {
    std::string name;
    std::vector<osm_id> node_refs;
};

struct PlaceWayRecord {
    osm_id id;
    std::string name;
    std::vector<osm_id> node_refs;
};

struct CollectedData {
    std::vector<WayRecord> streets;
    std::vector<PlaceWayRecord> place_ways;
    std::unordered_set<osm_id> referenced_nodes;
    std::unordered_map<osm_id, Point> locations;
    std::vector<PlaceBufferLayerSource::Place> places;
    std::size_t ways_read = 0;
};

class StreetWayCollector final : public osmium::handler::Handler {
public:
    StreetWayCollector(CollectedData& data, const OsmLoadOptions& options)
        : data_(data)
        , options_(options) {}

    void way(const osmium::Way& way) {
        ++data_.ways_read;

        if (options_.collect_places && is_lit_place(way.tags())) {
            PlaceWayRecord place;
            place.id = way.id();
            if (const char* name = way.tags().get_value_by_key("name")) {
                place.name = name;
            }
            for (const auto& node_ref : way.nodes()) {
                place.node_refs.push_back(node_ref.ref());
                data_.referenced_nodes.insert(node_ref.ref());
            }
            data_.place_ways.push_back(std::move(place));
        }

        const char* highway = way.tags().get_value_by_key("highway");
        if (!highway) {
            return;
        }
        if (options_.walkable_only &&
            (!OsmStreetSource::is_walkable_highway(to_lower_copy(highway)) || pedestrian_excluded(way.tags()))) {
            return;
        }

        WayRecord record;
        if (const char* name = way.tags().get_value_by_key("name")) {
            record.name = name;
        }
        for (const auto& node_ref : way.nodes()) {
            data_.referenced_nodes.insert(node_ref.ref());
            record.node_refs.push_back(node_ref.ref());
        }

        if (record.node_refs.size() < 2) {
            return;
        }

        data_.streets.push_back(std::move(record));
    }

private:
    CollectedData& data_;
    const OsmLoadOptions& options_;
};

class NodeCollector final : public osmium::handler::Handler {
public:
    NodeCollector(CollectedData& data, const OsmLoadOptions& options)
        : data_(data)
        , options_(options) {}

    void node(const osmium::Node& node) {
        if (!node.location().valid()) {
            return;
        }

        const osm_id id = node.id();
        const Point location(node.location().lat(), node.location().lon());

        if (data_.referenced_nodes.contains(id)) {
            data_.locations.emplace(id, location);
        }

        if (options_.collect_places && is_lit_place(node.tags())) {
            PlaceBufferLayerSource::Place place;
            place.id = "n" + std::to_string(id);
            place.location = location;
            if (const char* name = node.tags().get_value_by_key("name")) {
                place.name = name;
            }
            data_.places.push_back(std::move(place));
        }
    }

private:
    CollectedData& data_;
    const OsmLoadOptions& options_;
};

} // namespace

OsmStreetSource::OsmStreetSource(LogCallback log_callback)
    : logger_("OsmStreetSource", std::move(log_callback)) {}

bool OsmStreetSource::is_walkable_highway(const std::string& highway) {
    static const std::unordered_set<std::string> kWalkable = {
        "primary", "primary_link", "secondary", "secondary_link", "tertiary", "tertiary_link",
        "unclassified", "residential", "living_street", "service", "pedestrian", "footway",
        "path", "steps", "track", "cycleway", "corridor"};
    return kWalkable.contains(highway);
}

bool OsmStreetSource::load(const std::filesystem::path& input, const OsmLoadOptions& options) {
    if (!std::filesystem::exists(input)) {
        logger_.error("Input file does not exist: " + input.string());
        return false;
    }

    CollectedData data;
    try {
        const osmium::io::File file{input.string()};

        StreetWayCollector way_handler(data, options);
        osmium::io::Reader way_reader{file, osmium::osm_entity_bits::way};
        osmium::apply(way_reader, way_handler);
        way_reader.close();

        NodeCollector node_handler(data, options);
        osmium::io::Reader node_reader{file, osmium::osm_entity_bits::node};
        osmium::apply(node_reader, node_handler);
        node_reader.close();
    } catch (const std::exception& ex) {
        logger_.error("Failed to read " + input.string() + ": " + ex.what());
        return false;
    }

    OsmLoadStats stats;
    stats.ways_read = data.ways_read;

    std::vector<RawSegment> segments;
    segments.reserve(data.streets.size());
    // A node without a location ends the current piece; joining its
    // neighbours directly would invent a street across the gap.
    auto flush = [&segments](RawSegment& segment) {
        if (segment.points.size() >= 2) {
            segments.push_back(segment);
        }
        segment.points.clear();
    };
    for (auto& street : data.streets) {
        RawSegment segment;
        segment.name = std::move(street.name);
        for (osm_id ref : street.node_refs) {
            const auto it = data.locations.find(ref);
            if (it == data.locations.end()) {
                ++stats.missing_nodes;
                flush(segment);
                continue;
            }
            segment.points.push_back(it->second);
        }
        flush(segment);
    }

    // Area places are represented by the average of their outline nodes.
    for (const auto& place_way : data.place_ways) {
        double lat_sum = 0.0;
        double lon_sum = 0.0;
        std::size_t count = 0;
        for (osm_id ref : place_way.node_refs) {
            const auto it = data.locations.find(ref);
            if (it != data.locations.end()) {
                lat_sum += it->second.lat;
                lon_sum += it->second.lon;
                ++count;
            }
        }
        if (count == 0) {
            continue;
        }
        PlaceBufferLayerSource::Place place;
        place.id = "w" + std::to_string(place_way.id);
        place.name = place_way.name;
        place.location = Point(lat_sum / static_cast<double>(count), lon_sum / static_cast<double>(count));
        data.places.push_back(std::move(place));
    }

    stats.segments = segments.size();
    stats.places = data.places.size();

    if (stats.missing_nodes > 0) {
        logger_.error("Missing " + std::to_string(stats.missing_nodes) + " node locations referenced by streets");
    }
    logger_.info("Loaded " + std::to_string(stats.segments) + " street segments and " +
                 std::to_string(stats.places) + " lit places from " + input.string());

    streets_ = InMemoryStreetSource(std::move(segments));
    places_ = std::move(data.places);
    stats_ = stats;
    loaded_ = true;
    return true;
}

std::vector<RawSegment> OsmStreetSource::segments_in(const BoundingBox& bounds) const {
    return streets_.segments_in(bounds);
}

} // namespace calmpath
