#include <patchgrader/dataset_reader.hpp>

#include <patchgrader/common/expected.hpp>
#include <patchgrader/common/strings.hpp>
#include <patchgrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/std.h>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <exception>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace patchgrader {

DatasetReader::DatasetReader(std::filesystem::path path)
    : path_{std::move(path)} {}

Expected<std::vector<nlohmann::json>, std::string> DatasetReader::read_records() const {
    std::ifstream in_file{path_};

    if (not in_file.is_open()) {
        return fmt::format("Failed to open dataset {}", path_);
    }

    std::vector<nlohmann::json> result;

    std::string line;
    std::size_t line_num = 0;
    while (std::getline(in_file, line)) {
        ++line_num;

        if (is_blank(line)) {
            LOG_DEBUG("Skipping blank line {} of {}", line_num, path_);
            continue;
        }

        nlohmann::json parsed = nlohmann::json::parse(line, /*cb=*/nullptr, /*allow_exceptions=*/false);

        if (parsed.is_discarded()) {
            return fmt::format("{}:{}: malformed JSON", path_, line_num);
        }

        if (parsed.is_array()) {
            for (auto& element : parsed) {
                if (!element.is_object()) {
                    return fmt::format("{}:{}: array element is not an object", path_, line_num);
                }
                result.push_back(std::move(element));
            }
            continue;
        }

        if (!parsed.is_object()) {
            return fmt::format("{}:{}: expected a JSON object", path_, line_num);
        }

        result.push_back(std::move(parsed));
    }

    if (in_file.bad()) {
        return fmt::format("IO error in reading {}", path_);
    }

    return result;
}

Expected<std::vector<TaskInstance>, std::string> DatasetReader::read() const {
    auto records = read_records();

    if (!records) {
        return records.error();
    }

    std::vector<TaskInstance> result;
    result.reserve(records->size());

    for (std::size_t i = 0; i < records->size(); ++i) {
        try {
            result.push_back(records->at(i).get<TaskInstance>());
        } catch (const std::exception& err) {
            return fmt::format("{}: record {} is not a valid task instance: {}", path_, i + 1, err.what());
        }
    }

    LOG_DEBUG("Read {} task instance(s) from {}", result.size(), path_);

    return result;
}

Expected<void, std::string> write_jsonl(const std::filesystem::path& path, const std::vector<nlohmann::json>& records) {
    std::ofstream out_file{path, std::ios::trunc};

    if (!out_file.is_open()) {
        return fmt::format("Failed to open {} for writing", path);
    }

    for (const auto& record : records) {
        out_file << record.dump() << '\n';
    }

    if (!out_file) {
        return fmt::format("IO error writing {}", path);
    }

    return {};
}

} // namespace patchgrader
