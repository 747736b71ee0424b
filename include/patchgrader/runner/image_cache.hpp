#pragma once

#include <patchgrader/common/enum_names.hpp>
#include <patchgrader/harness/test_spec.hpp>
#include <patchgrader/runtime/container_runtime.hpp>

#include <set>
#include <string>
#include <vector>

namespace patchgrader {

/// Which image layers survive the end of a run. Each level keeps itself and every layer below.
enum class CacheLevel { None, Base, Env, Instance };

PATCHGRADER_ENUM_NAMES(CacheLevel,                       //
                       {CacheLevel::None, "none"},       //
                       {CacheLevel::Base, "base"},       //
                       {CacheLevel::Env, "env"},         //
                       {CacheLevel::Instance, "instance"});

enum class ImageKind { Base, Env, Instance };

PATCHGRADER_ENUM_NAMES(ImageKind,                    //
                       {ImageKind::Base, "base"},    //
                       {ImageKind::Env, "env"},      //
                       {ImageKind::Instance, "instance"});

/// Decide whether an image is removed once all workers have finished.
///
/// An image whose layer is above ``level`` is removed. Base and env images that existed before
/// the run are kept anyway, unless ``clean``. Instance images are single-use, so they are removed
/// whenever their layer is above ``level`` even if they were reused.
bool should_remove(ImageKind kind, CacheLevel level, bool clean, bool existed_before);

/// Whether a worker removes its instance image as soon as it is done with it
inline bool remove_instance_image_after_run(CacheLevel level) {
    return level != CacheLevel::Instance;
}

/// Remove the images of ``specs`` that ``should_remove`` selects and that still exist.
/// Returns the keys actually removed.
std::vector<std::string> sweep_images(ContainerRuntime& runtime, const std::vector<TestSpec>& specs, CacheLevel level,
                                      bool clean, const std::set<std::string>& prior_images);

} // namespace patchgrader
