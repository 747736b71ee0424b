#pragma once

#include <patchgrader/output/serializer.hpp>
#include <patchgrader/output/sink.hpp>
#include <patchgrader/output/verbosity.hpp>
#include <patchgrader/state/failure_mode.hpp>

#include "user/program_options.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace patchgrader {

class PlainTextSerializer : public Serializer
{
public:
    PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option, VerbosityLevel verbosity);

    void on_run_metadata(const RunMetadata& data) override;
    void on_repo_begin(std::string_view repo_name, std::size_t num_instances) override;
    void on_instance_result(const InstanceOutcome& data) override;
    void on_repo_result(const RepoSummary& data) override;

    void on_warning(std::string_view what) override;
    void on_error(std::string_view what) override;

    void finalize() override;

private:
    static bool process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option);
    static std::size_t get_terminal_width();

    static fmt::text_style style_for(FailureMode mode);

    template <typename T>
    auto style(const T& arg, fmt::text_style style) const -> decltype(fmt::styled(arg, style));

    template <typename T>
    std::string style_str(const T& arg, fmt::text_style style) const;

    /// Conditionally make a word singular or plural based on `count`
    ///
    /// Examples:
    ///  pluralize("instance", 0) => "instances"
    ///  pluralize("image", 1) => "image"
    static std::string pluralize(std::string_view root, std::size_t count, std::string_view suffix = "s");

    // Basic styles for different kinds of output:
    //   error    - failure modes, fatal errors, etc.
    //   success  - validated instances
    //   value    - ids, counts and other literal values
    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);
    static constexpr auto POP_OUT_STYLE =
        fmt::emphasis::underline | fmt::emphasis::bold | fmt::fg(fmt::color::golden_rod);
    static constexpr auto VALUE_STYLE = fmt::fg(fmt::color::aqua);

    static constexpr std::size_t DEFAULT_WIDTH = 80;

    static constexpr auto MAKE_LINE_DIVIDER = [](char chr) {
        return [chr](std::size_t len) { return std::string(len, chr); };
    };

    // Basic line dividers to seperate output, parameterized on length
    // Line Divider 2x Emphasized : "#######"...
    // Line Divider Emphasized    : "======="...
    // Line Divider               : "--------...
    static const inline auto LINE_DIVIDER = MAKE_LINE_DIVIDER('-');
    static const inline auto LINE_DIVIDER_EM = MAKE_LINE_DIVIDER('=');
    static const inline auto LINE_DIVIDER_2EM = MAKE_LINE_DIVIDER('#');

    bool do_colorize_;
    std::size_t terminal_width_;
};

template <typename T>
auto PlainTextSerializer::style(const T& arg, fmt::text_style style) const -> decltype(fmt::styled(arg, style)) {
    if (!do_colorize_) {
        return fmt::styled(arg, {});
    }
    return fmt::styled(arg, style);
}

template <typename T>
std::string PlainTextSerializer::style_str(const T& arg, fmt::text_style style) const {
    if (!do_colorize_) {
        return fmt::format("{}", arg);
    }

    return fmt::format(style, "{}", arg);
}

} // namespace patchgrader
