#pragma once

#include <patchgrader/common/enum_names.hpp>
#include <patchgrader/state/failure_mode.hpp>

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace patchgrader {

/// A stage of a single instance run failed for a known reason
class InstanceFailure : public std::runtime_error
{
public:
    InstanceFailure(FailureMode mode, const std::string& msg)
        : std::runtime_error{msg}
        , mode_{mode} {}

    FailureMode get_mode() const { return mode_; }

private:
    FailureMode mode_;
};

/// The image an instance runs in could not be built or located
class BuildImageError : public std::runtime_error
{
public:
    BuildImageError(std::string image_key, const std::string& msg)
        : std::runtime_error{msg}
        , image_key_{std::move(image_key)} {}

    const std::string& get_image_key() const { return image_key_; }

private:
    std::string image_key_;
};

/// A TestSpec could not be constructed for an instance (bad repo config, missing manifest, ...)
class SpecError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/// The same instance id produced more than one result. Fatal for a whole repository run.
class DuplicateInstanceError : public std::runtime_error
{
public:
    explicit DuplicateInstanceError(std::string instance_id)
        : std::runtime_error{fmt::format("Duplicate result keys for instance {}", instance_id)}
        , instance_id_{std::move(instance_id)} {}

    const std::string& get_instance_id() const { return instance_id_; }

private:
    std::string instance_id_;
};

class UnsupportedManagerError : public std::invalid_argument
{
public:
    explicit UnsupportedManagerError(const std::string& name)
        : std::invalid_argument{fmt::format("Unsupported environment manager {:?}", name)} {}
};

} // namespace patchgrader

template <>
struct fmt::formatter<::patchgrader::InstanceFailure> : fmt::formatter<std::string_view>
{
    auto format(const ::patchgrader::InstanceFailure& from, format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{} : {}", from.what(), from.get_mode());
    }
};

template <>
struct fmt::formatter<::patchgrader::BuildImageError> : fmt::formatter<std::string_view>
{
    auto format(const ::patchgrader::BuildImageError& from, format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{} (image {})", from.what(), from.get_image_key());
    }
};

/// Exceptions carrying nothing beyond their message
#define PATCHGRADER_MESSAGE_ONLY_EXCEPTION_FORMATTER(type)                                                            \
    template <>                                                                                                        \
    struct fmt::formatter<type> : fmt::formatter<std::string_view>                                                     \
    {                                                                                                                  \
        auto format(const type& from, format_context& ctx) const {                                                     \
            return fmt::formatter<std::string_view>::format(from.what(), ctx);                                         \
        }                                                                                                              \
    }

PATCHGRADER_MESSAGE_ONLY_EXCEPTION_FORMATTER(::patchgrader::SpecError);
PATCHGRADER_MESSAGE_ONLY_EXCEPTION_FORMATTER(::patchgrader::DuplicateInstanceError);
PATCHGRADER_MESSAGE_ONLY_EXCEPTION_FORMATTER(::patchgrader::UnsupportedManagerError);
