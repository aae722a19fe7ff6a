#pragma once

/// @file command_table.hpp
/// @brief Ordered file-to-command rules and command template rendering.

#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "fwr/foundation/watch_result.hpp"

namespace fwr::dispatch {

/// One rule: a predicate on the file path and the command to run.
///
/// `ext` matches when the path's extension (with the dot) is equal to it;
/// otherwise `re` is searched for in the path. A rule with an empty `run`,
/// or with neither `ext` nor `re`, never matches.
struct CommandRule {
    std::string ext;
    std::string re;
    std::string run;

    /// Compiled form of `re`; set by CommandTable::add().
    std::shared_ptr<const std::regex> compiled;

    [[nodiscard]] bool matches(std::string_view path) const;
};

/// Rules consulted in configured order; the first match wins.
///
/// YAML form:
/// @code
///   commands:
///     - ext: .py
///       run: python "{{file}}"
///     - re: ^Makefile$
///       run: make
/// @endcode
class CommandTable {
public:
    CommandTable() = default;

    /// Build a table from a YAML sequence of {ext, re, run} maps.
    /// @return ConfigTypeMismatch for malformed nodes, ConfigInvalidValue
    ///         for a `re` that is not a valid regular expression.
    static foundation::WatchResult<CommandTable> fromYaml(const YAML::Node& commands);

    /// A table whose single rule runs @p run for every file.
    static CommandTable singleCommand(std::string run);

    /// Append a rule, compiling its regular expression.
    foundation::WatchResult<void> add(CommandRule rule);

    /// First rule matching @p path, or nullptr.
    [[nodiscard]] const CommandRule* match(std::string_view path) const;

    [[nodiscard]] std::size_t size() const noexcept { return rules_.size(); }

    [[nodiscard]] bool empty() const noexcept { return rules_.empty(); }

private:
    std::vector<CommandRule> rules_;
};

/// Substitute file placeholders in @p commandTemplate.
///
/// Both `{{name}}` and `{name}` forms are recognized:
/// | name  | value for "src/app/main.py"   |
/// |-------|-------------------------------|
/// | file  | src/app/main.py               |
/// | ext   | .py                           |
/// | base  | main.py                       |
/// | base0 | main                          |
/// | dir   | src/app                       |
/// | abs   | /abs/path/src/app/main.py     |
///
/// Unknown placeholders are left untouched.
[[nodiscard]] std::string renderCommand(std::string_view commandTemplate, std::string_view path);

/// Built-in command table used when no configuration file is found.
[[nodiscard]] std::string_view defaultCommandYaml();

} // namespace fwr::dispatch
