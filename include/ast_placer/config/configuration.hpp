#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

namespace ast_placer::config {

namespace fs = std::filesystem;

struct MapConfig {
  std::string path;
  int hdu = 0;                        // 0 = first table HDU
};

struct PlacementConfig {
  int n_bins = 5;
  int n_realize = 1;
  std::optional<bool> reject_negative; // unset = per-routine default
  int max_attempts = 10000;
};

struct NeighborConfig {
  std::optional<double> separation; // pixels; required by the neighbor routine
  double noise = 3.0;      // annulus width, pixels
};

struct ReferenceConfig {
  std::string image; // empty = no pixel conversion
  int hdu = 1;
};

struct OutputConfig {
  std::string path; // empty = not written
  int precision = 5;
};

struct RandomConfig {
  std::optional<uint64_t> seed; // unset = non-deterministic
};

struct Config {
  MapConfig map;
  PlacementConfig placement;
  NeighborConfig neighbor;
  ReferenceConfig reference;
  OutputConfig output;
  RandomConfig random;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace ast_placer::config
