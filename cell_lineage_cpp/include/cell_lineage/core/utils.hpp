#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cell_lineage::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
std::vector<fs::path> find_directories_named(const fs::path& root, const std::string& name);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_text(const std::string& text);
std::string sha256_file(const fs::path& path);

// Statistics over plain vectors. Empty input yields 0.
double mean_of(const std::vector<double>& v);
double median_of(std::vector<double> v);
double stddev_of(const std::vector<double>& v);  // population (ddof = 0)

// String utilities
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
bool starts_with(const std::string& str, const std::string& prefix);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Strict numeric parsing: surrounding whitespace allowed, nothing else.
std::optional<int64_t> parse_int(const std::string& s);
std::optional<double> parse_double(const std::string& s);

// "A1_1_cropped" -> "A1_1" for suffix "_cropped"
std::string clean_location_name(const std::string& name, const std::string& suffix);

} // namespace cell_lineage::core
