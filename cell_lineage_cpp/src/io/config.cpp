#include "cell_lineage/config/configuration.hpp"
#include "cell_lineage/core/errors.hpp"

#include <fstream>

namespace cell_lineage::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw ConfigError("top level must be a mapping");
    }

    try {
        if (node["qc"]) {
            auto q = node["qc"];
            if (q["max_splits_allowed"]) cfg.qc.max_splits_allowed = q["max_splits_allowed"].as<int>();
            if (q["min_track_duration_frames"]) {
                cfg.qc.min_track_duration_frames = q["min_track_duration_frames"].as<int>();
            }
        }

        if (node["input"]) {
            auto i = node["input"];
            if (i["tracking_result_dir"]) cfg.input.tracking_result_dir = i["tracking_result_dir"].as<std::string>();
            if (i["location_suffix"]) cfg.input.location_suffix = i["location_suffix"].as<std::string>();
        }

        if (node["output"]) {
            auto o = node["output"];
            if (o["dir"]) cfg.output.dir = o["dir"].as<std::string>();
            if (o["delimiter"]) cfg.output.delimiter = o["delimiter"].as<std::string>();
            if (o["missing_value"]) cfg.output.missing_value = o["missing_value"].as<std::string>();
            if (o["precision"]) cfg.output.precision = o["precision"].as<int>();
            if (o["write_summary"]) cfg.output.write_summary = o["write_summary"].as<bool>();
        }

        if (node["runtime"]) {
            auto r = node["runtime"];
            if (r["parallel_workers"]) cfg.runtime.parallel_workers = r["parallel_workers"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid value: ") + e.what());
    }

    return cfg;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["qc"]["max_splits_allowed"] = qc.max_splits_allowed;
    node["qc"]["min_track_duration_frames"] = qc.min_track_duration_frames;

    node["input"]["tracking_result_dir"] = input.tracking_result_dir;
    node["input"]["location_suffix"] = input.location_suffix;

    node["output"]["dir"] = output.dir;
    node["output"]["delimiter"] = output.delimiter;
    node["output"]["missing_value"] = output.missing_value;
    node["output"]["precision"] = output.precision;
    node["output"]["write_summary"] = output.write_summary;

    node["runtime"]["parallel_workers"] = runtime.parallel_workers;

    return node;
}

void Config::save(const fs::path& path) const {
    std::ofstream out(path);
    if (!out) {
        throw IOError("Cannot create file: " + path.string());
    }
    YAML::Emitter emitter;
    emitter << to_yaml();
    out << emitter.c_str() << "\n";
}

void Config::validate() const {
    if (qc.max_splits_allowed < 0) {
        throw ValidationError("qc.max_splits_allowed must be >= 0");
    }
    if (qc.min_track_duration_frames < 1) {
        throw ValidationError("qc.min_track_duration_frames must be >= 1");
    }

    if (input.tracking_result_dir.empty()) {
        throw ValidationError("input.tracking_result_dir must not be empty");
    }

    if (output.dir.empty()) {
        throw ValidationError("output.dir must not be empty");
    }
    if (output.delimiter.size() != 1) {
        throw ValidationError("output.delimiter must be a single character");
    }
    {
        const char d = output.delimiter[0];
        if (d == '"' || d == '\n' || d == '\r') {
            throw ValidationError("output.delimiter must not be a quote or line break");
        }
        if (output.missing_value.find(d) != std::string::npos) {
            throw ValidationError("output.missing_value must not contain the delimiter");
        }
    }
    if (output.precision < 1 || output.precision > 17) {
        throw ValidationError("output.precision must be in [1,17]");
    }

    if (runtime.parallel_workers < 1) {
        throw ValidationError("runtime.parallel_workers must be >= 1");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "qc": {
      "type": "object",
      "properties": {
        "max_splits_allowed": {"type": "integer", "minimum": 0},
        "min_track_duration_frames": {"type": "integer", "minimum": 1}
      }
    },
    "input": {
      "type": "object",
      "properties": {
        "tracking_result_dir": {"type": "string", "minLength": 1},
        "location_suffix": {"type": "string"}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "dir": {"type": "string", "minLength": 1},
        "delimiter": {"type": "string", "minLength": 1, "maxLength": 1},
        "missing_value": {"type": "string"},
        "precision": {"type": "integer", "minimum": 1, "maximum": 17},
        "write_summary": {"type": "boolean"}
      }
    },
    "runtime": {
      "type": "object",
      "properties": {
        "parallel_workers": {"type": "integer", "minimum": 1}
      }
    }
  }
})";
}

} // namespace cell_lineage::config
