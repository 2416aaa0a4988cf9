#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "../core/logging.hpp"
#include "../graph/street_source.hpp"
#include "../layers/layer_source.hpp"

namespace calmpath {

struct OsmLoadOptions {
    // Skip motorways, trunks and ways tagged foot=no or access=private.
    bool walkable_only = true;
    // Collect shopping centers and markets as lit places.
    bool collect_places = true;
};

struct OsmLoadStats {
    std::size_t ways_read = 0;
    std::size_t segments = 0;
    std::size_t places = 0;
    std::size_t missing_nodes = 0;
};

/**
 * Street source backed by an OpenStreetMap extract (.osm, .osm.pbf).
 * The file is read once by load(); queries are answered from memory.
 */
class OsmStreetSource final : public StreetSource {
public:
    explicit OsmStreetSource(LogCallback log_callback = nullptr);

    // Returns false and logs when the file is missing or unreadable.
    bool load(const std::filesystem::path& input, const OsmLoadOptions& options = {});

    std::vector<RawSegment> segments_in(const BoundingBox& bounds) const override;

    [[nodiscard]] const std::vector<PlaceBufferLayerSource::Place>& lit_places() const noexcept { return places_; }
    [[nodiscard]] const OsmLoadStats& stats() const noexcept { return stats_; }
    [[nodiscard]] bool loaded() const noexcept { return loaded_; }

    // highway=* values a pedestrian may use.
    static bool is_walkable_highway(const std::string& highway);

private:
    Logger logger_;
    InMemoryStreetSource streets_;
    std::vector<PlaceBufferLayerSource::Place> places_;
    OsmLoadStats stats_;
    bool loaded_ = false;
};

} // namespace calmpath
