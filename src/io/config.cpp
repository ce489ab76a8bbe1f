#include "ast_placer/config/configuration.hpp"
#include "ast_placer/core/errors.hpp"

#include <fstream>

namespace ast_placer::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError(path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["map"]) {
            auto m = node["map"];
            if (m["path"]) cfg.map.path = m["path"].as<std::string>();
            if (m["hdu"]) cfg.map.hdu = m["hdu"].as<int>();
        }

        if (node["placement"]) {
            auto p = node["placement"];
            if (p["n_bins"]) cfg.placement.n_bins = p["n_bins"].as<int>();
            if (p["n_realize"]) cfg.placement.n_realize = p["n_realize"].as<int>();
            if (p["reject_negative"]) cfg.placement.reject_negative = p["reject_negative"].as<bool>();
            if (p["max_attempts"]) cfg.placement.max_attempts = p["max_attempts"].as<int>();
        }

        if (node["neighbor"]) {
            auto n = node["neighbor"];
            if (n["separation"]) cfg.neighbor.separation = n["separation"].as<double>();
            if (n["noise"]) cfg.neighbor.noise = n["noise"].as<double>();
        }

        if (node["reference"]) {
            auto r = node["reference"];
            if (r["image"]) cfg.reference.image = r["image"].as<std::string>();
            if (r["hdu"]) cfg.reference.hdu = r["hdu"].as<int>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["path"]) cfg.output.path = o["path"].as<std::string>();
            if (o["precision"]) cfg.output.precision = o["precision"].as<int>();
        }

        if (node["random"]) {
            auto r = node["random"];
            if (r["seed"] && !r["seed"].IsNull()) cfg.random.seed = r["seed"].as<uint64_t>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw IOError("Cannot write config: " + path.string());
    }
    YAML::Emitter emitter;
    emitter << node;
    out << emitter.c_str() << "\n";
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["map"]["path"] = map.path;
    node["map"]["hdu"] = map.hdu;

    node["placement"]["n_bins"] = placement.n_bins;
    node["placement"]["n_realize"] = placement.n_realize;
    if (placement.reject_negative) {
        node["placement"]["reject_negative"] = *placement.reject_negative;
    }
    node["placement"]["max_attempts"] = placement.max_attempts;

    if (neighbor.separation) {
        node["neighbor"]["separation"] = *neighbor.separation;
    }
    node["neighbor"]["noise"] = neighbor.noise;

    node["reference"]["image"] = reference.image;
    node["reference"]["hdu"] = reference.hdu;

    node["output"]["path"] = output.path;
    node["output"]["precision"] = output.precision;

    if (random.seed) {
        node["random"]["seed"] = *random.seed;
    } else {
        node["random"]["seed"] = YAML::Node(YAML::NodeType::Null);
    }

    return node;
}

void Config::validate() const {
    if (map.hdu < 0) {
        throw ValidationError("map.hdu must be >= 0");
    }

    if (placement.n_bins < 1) {
        throw ValidationError("placement.n_bins must be >= 1");
    }
    if (placement.n_realize < 1) {
        throw ValidationError("placement.n_realize must be >= 1");
    }
    if (placement.max_attempts < 1) {
        throw ValidationError("placement.max_attempts must be >= 1");
    }

    if (neighbor.separation && !(*neighbor.separation > 0.0)) {
        throw ValidationError("neighbor.separation must be > 0");
    }
    if (!(neighbor.noise >= 0.0)) {
        throw ValidationError("neighbor.noise must be >= 0");
    }

    if (reference.hdu < 0) {
        throw ValidationError("reference.hdu must be >= 0");
    }

    if (output.precision < 0 || output.precision > 15) {
        throw ValidationError("output.precision must be in [0,15]");
    }
}

} // namespace ast_placer::config
