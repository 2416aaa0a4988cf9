#include "calm_route/cli.hpp"

#include <charconv>
#include <iostream>
#include <string_view>

namespace fs = std::filesystem;

namespace {

void print_usage() {
  std::cout << "Usage: calm_route --osm <file.osm.pbf> --start <lat,lon> --end <lat,lon> [options]\n"
               "\n"
               "Options:\n"
               "  -i, --osm <path>          OpenStreetMap extract with the street network\n"
               "  -s, --start <lat,lon>     Route start\n"
               "  -e, --end <lat,lon>       Route end\n"
               "  -b, --bbox <a,b,c,d>      Search area as min_lat,min_lon,max_lat,max_lon\n"
               "                            (default: start and end plus 500 m)\n"
               "  -w, --weights <list>      Layer weights, e.g. noise=1,crowd=0.5,light=0.3\n"
               "                            (default: noise=1,crowd=1)\n"
               "      --hour <0-23>         Hour of day; rush hours raise crowd levels\n"
               "      --seed <n>            Seed of the synthetic layer data (default: 42)\n"
               "  -r, --render <path>       Write the route as a PNG image\n"
               "  -q, --quiet               Suppress progress logging\n"
               "  -h, --help                Show this help text\n";
}

bool parse_int(std::string_view text, long long& value) {
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  return ec == std::errc() && ptr == text.data() + text.size();
}

}  // namespace

int main(int argc, char* argv[]) {
  calmpath::cli::CliConfig config;
  config.weights.set(calmpath::LayerType::kNoise, 1.0);
  config.weights.set(calmpath::LayerType::kCrowd, 1.0);

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    }
    if (arg == "-q" || arg == "--quiet") {
      config.quiet = true;
      continue;
    }
    if (i + 1 >= argc) {
      std::cerr << "[calm_route] Missing value for " << arg << std::endl;
      return 1;
    }
    const std::string_view value(argv[++i]);

    if (arg == "-i" || arg == "--osm") {
      config.osm_input = fs::path(value);
    } else if (arg == "-s" || arg == "--start") {
      config.start = calmpath::cli::parse_point(value);
      if (!config.start) {
        std::cerr << "[calm_route] Invalid --start, expected lat,lon: " << value << std::endl;
        return 1;
      }
    } else if (arg == "-e" || arg == "--end") {
      config.end = calmpath::cli::parse_point(value);
      if (!config.end) {
        std::cerr << "[calm_route] Invalid --end, expected lat,lon: " << value << std::endl;
        return 1;
      }
    } else if (arg == "-b" || arg == "--bbox") {
      config.bounds = calmpath::cli::parse_bbox(value);
      if (!config.bounds) {
        std::cerr << "[calm_route] Invalid --bbox, expected min_lat,min_lon,max_lat,max_lon" << std::endl;
        return 1;
      }
    } else if (arg == "-w" || arg == "--weights") {
      calmpath::RouteWeights weights;
      if (!calmpath::cli::parse_weights(value, weights)) {
        std::cerr << "[calm_route] Invalid --weights: " << value << std::endl;
        return 1;
      }
      config.weights = weights;
    } else if (arg == "--hour") {
      long long hour = 0;
      if (!parse_int(value, hour) || hour < 0 || hour > 23) {
        std::cerr << "[calm_route] Invalid --hour, expected 0-23: " << value << std::endl;
        return 1;
      }
      config.hour = static_cast<int>(hour);
    } else if (arg == "--seed") {
      long long seed = 0;
      if (!parse_int(value, seed) || seed < 0) {
        std::cerr << "[calm_route] Invalid --seed: " << value << std::endl;
        return 1;
      }
      config.seed = static_cast<std::uint64_t>(seed);
    } else if (arg == "-r" || arg == "--render") {
      config.render_output = fs::path(value);
    } else {
      std::cerr << "[calm_route] Unrecognized argument: " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  return calmpath::cli::run_calm_route(config);
}
