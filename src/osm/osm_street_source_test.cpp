#include "osm_street_source.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>

namespace fs = std::filesystem;

namespace calmpath {

namespace osm_street_source_tests {

void quiet(const std::string&, bool) {}

const char* kSampleOsm = R"(<?xml version="1.0" encoding="UTF-8"?>
<osm version="0.6" generator="calmpath-test">
  <node id="1" version="1" lat="55.7500" lon="37.6100"/>
  <node id="2" version="1" lat="55.7510" lon="37.6100"/>
  <node id="3" version="1" lat="55.7520" lon="37.6100"/>
  <node id="4" version="1" lat="55.7500" lon="37.6120"/>
  <node id="5" version="1" lat="55.7510" lon="37.6120"/>
  <node id="6" version="1" lat="55.7515" lon="37.6110">
    <tag k="shop" v="mall"/>
    <tag k="name" v="Galleria"/>
  </node>
  <node id="7" version="1" lat="55.7560" lon="37.6160"/>
  <node id="8" version="1" lat="55.7562" lon="37.6160"/>
  <node id="9" version="1" lat="55.7562" lon="37.6164"/>
  <node id="10" version="1" lat="55.7560" lon="37.6164"/>
  <way id="100" version="1">
    <nd ref="1"/>
    <nd ref="2"/>
    <nd ref="3"/>
    <tag k="highway" v="residential"/>
    <tag k="name" v="Tihaya St"/>
  </way>
  <way id="101" version="1">
    <nd ref="4"/>
    <nd ref="5"/>
    <tag k="highway" v="motorway"/>
  </way>
  <way id="102" version="1">
    <nd ref="2"/>
    <nd ref="5"/>
    <tag k="highway" v="service"/>
    <tag k="access" v="private"/>
  </way>
  <way id="103" version="1">
    <nd ref="1"/>
    <nd ref="4"/>
    <nd ref="999"/>
    <tag k="highway" v="footway"/>
  </way>
  <way id="104" version="1">
    <nd ref="7"/>
    <nd ref="8"/>
    <nd ref="9"/>
    <nd ref="10"/>
    <nd ref="7"/>
    <tag k="shop" v="mall"/>
    <tag k="building" v="retail"/>
  </way>
</osm>
)";

// Way 200 has its middle node 99 cut off by the extract.
const char* kGapOsm = R"(<?xml version="1.0" encoding="UTF-8"?>
<osm version="0.6" generator="calmpath-test">
  <node id="1" version="1" lat="55.7500" lon="37.6100"/>
  <node id="2" version="1" lat="55.7510" lon="37.6100"/>
  <node id="3" version="1" lat="55.7510" lon="37.6130"/>
  <node id="4" version="1" lat="55.7500" lon="37.6130"/>
  <way id="200" version="1">
    <nd ref="1"/>
    <nd ref="2"/>
    <nd ref="99"/>
    <nd ref="3"/>
    <nd ref="4"/>
    <tag k="highway" v="residential"/>
    <tag k="name" v="Ring Rd"/>
  </way>
</osm>
)";

fs::path write_osm(const char* file_name, const char* content) {
    const fs::path path = fs::temp_directory_path() / file_name;
    std::ofstream out(path);
    out << content;
    return path;
}

fs::path write_sample() {
    return write_osm("calmpath_osm_street_source_test.osm", kSampleOsm);
}

bool test_loads_walkable_streets() {
    const fs::path path = write_sample();
    OsmStreetSource source(quiet);
    const bool ok = source.load(path);
    fs::remove(path);
    if (!ok || !source.loaded()) {
        return false;
    }

    // residential and footway survive; motorway and private service do not
    const auto segments = source.segments_in(BoundingBox(55.74, 37.60, 55.76, 37.62));
    if (segments.size() != 2 || source.stats().segments != 2 || source.stats().missing_nodes != 1) {
        std::cerr << "segments=" << segments.size() << " missing=" << source.stats().missing_nodes << std::endl;
        return false;
    }
    const bool named = segments[0].name == "Tihaya St" && segments[0].points.size() == 3;
    const bool footway = segments[1].points.size() == 2;
    return named && footway && source.stats().ways_read == 5;
}

bool test_collects_lit_places() {
    const fs::path path = write_sample();
    OsmStreetSource source(quiet);
    const bool ok = source.load(path);
    fs::remove(path);
    if (!ok || source.lit_places().size() != 2) {
        return false;
    }

    const auto& node_place = source.lit_places()[0];
    const auto& way_place = source.lit_places()[1];
    return node_place.id == "n6" && node_place.name == "Galleria" && way_place.id == "w104" &&
           way_place.location.lat > 55.7560 && way_place.location.lat < 55.7562;
}

bool test_missing_node_splits_way() {
    const fs::path path = write_osm("calmpath_osm_street_source_gap_test.osm", kGapOsm);
    OsmStreetSource source(quiet);
    const bool ok = source.load(path);
    fs::remove(path);
    if (!ok || source.stats().missing_nodes != 1) {
        return false;
    }

    const auto segments = source.segments_in(BoundingBox(55.74, 37.60, 55.76, 37.62));
    if (segments.size() != 2) {
        std::cerr << "segments=" << segments.size() << std::endl;
        return false;
    }
    // no piece may join node 2 to node 3 across the gap
    const auto& west = segments[0];
    const auto& east = segments[1];
    return west.points.size() == 2 && east.points.size() == 2 && west.name == "Ring Rd" && east.name == "Ring Rd" &&
           west.points[1] == Point(55.7510, 37.6100) && east.points[0] == Point(55.7510, 37.6130);
}

bool test_all_highways_when_not_filtered() {
    const fs::path path = write_sample();
    OsmStreetSource source(quiet);
    OsmLoadOptions options;
    options.walkable_only = false;
    options.collect_places = false;
    const bool ok = source.load(path, options);
    fs::remove(path);
    return ok && source.stats().segments == 4 && source.lit_places().empty();
}

bool test_missing_file_reported() {
    int errors = 0;
    OsmStreetSource source([&errors](const std::string&, bool is_error) {
        if (is_error) {
            ++errors;
        }
    });
    return !source.load("/nonexistent/calmpath/input.osm.pbf") && !source.loaded() && errors == 1;
}

bool test_walkable_classification() {
    return OsmStreetSource::is_walkable_highway("footway") && OsmStreetSource::is_walkable_highway("residential") &&
           !OsmStreetSource::is_walkable_highway("motorway") && !OsmStreetSource::is_walkable_highway("trunk_link");
}

bool run_all_tests() {
    const std::pair<const char*, bool (*)()> tests[] = {
        {"loads_walkable_streets", &test_loads_walkable_streets},
        {"collects_lit_places", &test_collects_lit_places},
        {"missing_node_splits_way", &test_missing_node_splits_way},
        {"all_highways_when_not_filtered", &test_all_highways_when_not_filtered},
        {"missing_file_reported", &test_missing_file_reported},
        {"walkable_classification", &test_walkable_classification},
    };

    bool all_passed = true;

    for (const auto& [name, fn] : tests) {
        try {
            if (!fn()) {
                std::cerr << "Test failed: " << name << std::endl;
                all_passed = false;
            }
        } catch (const std::exception& ex) {
            std::cerr << "Test threw: " << name << ": " << ex.what() << std::endl;
            all_passed = false;
        }
    }

    return all_passed;
}

} // namespace osm_street_source_tests

} // namespace calmpath

int main() {
    if (calmpath::osm_street_source_tests::run_all_tests()) {
        std::cout << "All OsmStreetSource tests passed" << std::endl;
        return 0;
    }

    std::cerr << "OsmStreetSource tests failed" << std::endl;
    return 1;
}
