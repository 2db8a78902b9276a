#pragma once
#include <string>
#include <chrono>
#include <filesystem>
#include <optional>

#include "job.hpp"
#include "subscription_table.hpp"

// Drops every ':' so the id is usable as a path on all platforms.
std::string normalize_data_id(const std::string& data_id);

// "yyyy/mm/dd" in local time.
std::string date_partition(std::chrono::system_clock::time_point when);

// {directory}/{yyyy}/{mm}/{dd}/{normalized data_id}. Returns nullopt when the
// data id is empty after normalisation or would escape the directory.
std::optional<std::filesystem::path> resolve_output_path(const SubscriptionTable& subs, const Job& job,
                                                         const std::string& default_dir,
                                                         std::chrono::system_clock::time_point when);

bool output_exists(const std::filesystem::path& path);

// Creates missing parents. Already existing directories are not an error,
// which matters when several workers hit the same day partition.
void ensure_parent_dirs(const std::filesystem::path& path);

// Existing directory the process may write to.
bool directory_writable(const std::string& dir);

// Writes bytes to a temp file beside path and renames it into place, so path
// either holds the complete body or does not exist. Throws std::runtime_error.
void write_file(const std::filesystem::path& path, const std::string& bytes);

// Last path segment of a URL, used for log lines.
std::string url_filename(const std::string& url);
