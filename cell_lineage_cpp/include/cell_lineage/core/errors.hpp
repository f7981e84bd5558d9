#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace cell_lineage {

class CellLineageError : public std::runtime_error {
public:
    explicit CellLineageError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public CellLineageError {
public:
    explicit ConfigError(const std::string& message)
        : CellLineageError("Config error: " + message) {}
};

class ValidationError : public CellLineageError {
public:
    explicit ValidationError(const std::string& message)
        : CellLineageError("Validation error: " + message) {}
};

class IOError : public CellLineageError {
public:
    explicit IOError(const std::string& message)
        : CellLineageError("I/O error: " + message) {}
};

// Missing table, missing required column or unparsable key cell.
class InputTableError : public IOError {
public:
    explicit InputTableError(const std::string& message)
        : IOError("Input table error: " + message) {}
};

// Structural problem confined to one track. The batch keeps going.
class TrackError : public CellLineageError {
public:
    TrackError(int64_t track_id, const std::string& kind, const std::string& cause)
        : CellLineageError(kind + " (track " + std::to_string(track_id) + "): " + cause),
          track_id_(track_id), kind_(kind), cause_(cause) {}

    int64_t track_id() const { return track_id_; }
    const std::string& kind() const { return kind_; }
    const std::string& cause() const { return cause_; }

private:
    int64_t track_id_;
    std::string kind_;
    std::string cause_;
};

class MalformedTrackError : public TrackError {
public:
    MalformedTrackError(int64_t track_id, const std::string& cause)
        : TrackError(track_id, "MalformedTrackError", cause) {}
};

class MultipleRootsError : public TrackError {
public:
    MultipleRootsError(int64_t track_id, const std::string& cause)
        : TrackError(track_id, "MultipleRootsError", cause) {}
};

class UnsupportedMergeError : public TrackError {
public:
    UnsupportedMergeError(int64_t track_id, const std::string& cause)
        : TrackError(track_id, "UnsupportedMergeError", cause) {}
};

} // namespace cell_lineage
