#pragma once

#include "cell_lineage/core/types.hpp"
#include "cell_lineage/io/csv.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace cell_lineage::io {

namespace fs = std::filesystem;

/**
 * Table files of one TrackMate export inside a "Tracking Result" folder.
 * base_name is the common prefix, e.g. "A1_1" for "A1_1-spots.csv".
 */
struct TrackmateFiles {
    fs::path folder;
    std::string base_name;
    fs::path spots;
    fs::path edges;
    fs::path tracks;   // empty when the export has no track table
};

/**
 * Spots and edges of one location. Untracked spots are dropped.
 */
struct LocationTables {
    std::map<SpotId, Spot> spots;
    std::vector<Edge> edges;
    std::vector<std::string> channels;   // "CH1", "CH2", ... in channel order
    int untracked_spots = 0;
    int unassigned_edges = 0;            // edges whose track could not be determined
};

/**
 * Locate the spot/edge/track tables in a folder. "*-all-spots.csv" wins over
 * "*-spots.csv". Throws InputTableError when spots or edges are missing.
 */
TrackmateFiles discover_trackmate_files(const fs::path& folder);

std::map<SpotId, Spot> parse_spots(const CsvTable& table, std::vector<std::string>& channels,
                                   int& untracked);

std::vector<Edge> parse_edges(const CsvTable& table, const std::map<SpotId, Spot>& spots,
                              int& unassigned);

LocationTables tables_from_csv(const CsvTable& spots, const CsvTable& edges);

LocationTables load_location_tables(const TrackmateFiles& files);

} // namespace cell_lineage::io
