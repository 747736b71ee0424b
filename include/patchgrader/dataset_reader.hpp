#pragma once

#include <patchgrader/common/expected.hpp>
#include <patchgrader/harness/task_instance.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace patchgrader {

/// Reader for JSON-lines files of task instances.
/// Expects one JSON object per line; a single line holding a JSON array of objects is
/// accepted as well. Blank lines are skipped.
class DatasetReader
{
public:
    explicit DatasetReader(std::filesystem::path path);

    /// The records exactly as stored, so that fields unknown to TaskInstance survive a rewrite
    Expected<std::vector<nlohmann::json>, std::string> read_records() const;

    Expected<std::vector<TaskInstance>, std::string> read() const;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/// Write ``records`` one per line, replacing ``path``
Expected<void, std::string> write_jsonl(const std::filesystem::path& path, const std::vector<nlohmann::json>& records);

} // namespace patchgrader
