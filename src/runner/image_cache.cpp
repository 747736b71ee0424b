#include <patchgrader/runner/image_cache.hpp>

#include <patchgrader/common/error_types.hpp>
#include <patchgrader/common/unreachable.hpp>
#include <patchgrader/logging.hpp>

#include <range/v3/algorithm/contains.hpp>

#include <set>
#include <string>
#include <utility>
#include <vector>

namespace patchgrader {

namespace {

/// The lowest cache level that keeps images of ``kind``
CacheLevel kept_from(ImageKind kind) {
    switch (kind) {
    case ImageKind::Base:
        return CacheLevel::Base;
    case ImageKind::Env:
        return CacheLevel::Env;
    case ImageKind::Instance:
        return CacheLevel::Instance;
    }

    unreachable();
}

} // namespace

bool should_remove(ImageKind kind, CacheLevel level, bool clean, bool existed_before) {
    if (level >= kept_from(kind)) {
        return false;
    }

    if (kind == ImageKind::Instance) {
        return true;
    }

    return clean || !existed_before;
}

std::vector<std::string> sweep_images(ContainerRuntime& runtime, const std::vector<TestSpec>& specs, CacheLevel level,
                                      bool clean, const std::set<std::string>& prior_images) {
    std::vector<std::pair<std::string, ImageKind>> candidates;
    std::set<std::string> seen;

    auto add_candidate = [&](std::string key, ImageKind kind) {
        if (seen.insert(key).second) {
            candidates.emplace_back(std::move(key), kind);
        }
    };

    // Instance images first, so that the layers they sit on are free to be removed after them
    for (const auto& spec : specs) {
        add_candidate(spec.instance_image_key(), ImageKind::Instance);
    }
    for (const auto& spec : specs) {
        add_candidate(spec.env_image_key(), ImageKind::Env);
    }
    for (const auto& spec : specs) {
        add_candidate(spec.base_image_key(), ImageKind::Base);
    }

    auto existing = runtime.list_images();
    if (!existing) {
        LOG_WARN("Could not list images ({}); skipping image cleanup", existing.error());
        return {};
    }

    std::vector<std::string> removed;

    for (const auto& [key, kind] : candidates) {
        if (!ranges::contains(existing.value(), key)) {
            continue;
        }

        if (!should_remove(kind, level, clean, prior_images.contains(key))) {
            LOG_DEBUG("Keeping {} image {}", kind, key);
            continue;
        }

        auto res = runtime.remove_image(key);

        if (res) {
            removed.push_back(key);
        } else if (res.error() != ErrorKind::NotFound) {
            LOG_WARN("Failed to remove {} image {}: {}", kind, key, res.error());
        }
    }

    LOG_INFO("Removed {} image(s) at cache level {}", removed.size(), level);

    return removed;
}

} // namespace patchgrader
