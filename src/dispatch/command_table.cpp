/// @file command_table.cpp
/// @brief Command rule matching, YAML loading and template rendering.

#include "fwr/dispatch/command_table.hpp"

#include <filesystem>
#include <optional>
#include <utility>

namespace fs = std::filesystem;

namespace fwr::dispatch {

using foundation::ErrorCode;
using foundation::WatchError;
using foundation::WatchResult;

namespace {

std::optional<std::string> placeholderValue(std::string_view name, const fs::path& path) {
    if (name == "file") {
        return path.string();
    }
    if (name == "ext") {
        return path.extension().string();
    }
    if (name == "base") {
        return path.filename().string();
    }
    if (name == "base0") {
        return path.stem().string();
    }
    if (name == "dir") {
        auto parent = path.parent_path().string();
        return parent.empty() ? std::string(".") : parent;
    }
    if (name == "abs") {
        std::error_code ec;
        auto absolute = fs::absolute(path, ec);
        return ec ? path.string() : absolute.lexically_normal().string();
    }
    return std::nullopt;
}

WatchResult<std::string> optionalString(const YAML::Node& entry, const char* key,
                                        std::size_t index) {
    const auto value = entry[key];
    if (!value || value.IsNull()) {
        return WatchResult<std::string>::ok(std::string());
    }
    if (!value.IsScalar()) {
        return WatchResult<std::string>::err(WatchError(
            ErrorCode::ConfigTypeMismatch,
            "commands[" + std::to_string(index) + "]." + key + " must be a string"));
    }
    return WatchResult<std::string>::ok(value.as<std::string>());
}

}  // namespace

bool CommandRule::matches(std::string_view path) const {
    if (run.empty() || (ext.empty() && re.empty())) {
        return false;
    }
    if (!ext.empty() && fs::path(path).extension().string() == ext) {
        return true;
    }
    if (!re.empty() && compiled) {
        return std::regex_search(path.begin(), path.end(), *compiled);
    }
    return false;
}

WatchResult<CommandTable> CommandTable::fromYaml(const YAML::Node& commands) {
    CommandTable table;
    if (!commands || commands.IsNull()) {
        return WatchResult<CommandTable>::ok(std::move(table));
    }
    if (!commands.IsSequence()) {
        return WatchResult<CommandTable>::err(
            WatchError(ErrorCode::ConfigTypeMismatch, "commands must be a sequence"));
    }

    for (std::size_t i = 0; i < commands.size(); ++i) {
        const auto entry = commands[i];
        if (!entry.IsMap()) {
            return WatchResult<CommandTable>::err(WatchError(
                ErrorCode::ConfigTypeMismatch,
                "commands[" + std::to_string(i) + "] must be a mapping"));
        }

        CommandRule rule;
        for (auto [key, field] : {std::pair{"ext", &rule.ext}, std::pair{"re", &rule.re},
                                  std::pair{"run", &rule.run}}) {
            auto value = optionalString(entry, key, i);
            if (!value) {
                return WatchResult<CommandTable>::err(value.error());
            }
            *field = std::move(value).value();
        }

        auto added = table.add(std::move(rule));
        if (!added) {
            return WatchResult<CommandTable>::err(added.error());
        }
    }
    return WatchResult<CommandTable>::ok(std::move(table));
}

CommandTable CommandTable::singleCommand(std::string run) {
    CommandTable table;
    CommandRule rule;
    rule.re = ".";
    rule.run = std::move(run);
    rule.compiled = std::make_shared<const std::regex>(".");
    table.rules_.push_back(std::move(rule));
    return table;
}

WatchResult<void> CommandTable::add(CommandRule rule) {
    if (!rule.re.empty()) {
        try {
            rule.compiled = std::make_shared<const std::regex>(rule.re);
        } catch (const std::regex_error& e) {
            return WatchResult<void>::err(WatchError(
                ErrorCode::ConfigInvalidValue,
                "invalid regular expression '" + rule.re + "': " + e.what()));
        }
    }
    rules_.push_back(std::move(rule));
    return WatchResult<void>::ok();
}

const CommandRule* CommandTable::match(std::string_view path) const {
    for (const auto& rule : rules_) {
        if (rule.matches(path)) {
            return &rule;
        }
    }
    return nullptr;
}

std::string renderCommand(std::string_view commandTemplate, std::string_view path) {
    const fs::path filePath(path);
    std::string out;
    out.reserve(commandTemplate.size() + path.size());

    std::size_t pos = 0;
    while (pos < commandTemplate.size()) {
        auto open = commandTemplate.find('{', pos);
        if (open == std::string_view::npos) {
            out.append(commandTemplate.substr(pos));
            break;
        }
        out.append(commandTemplate.substr(pos, open - pos));

        bool doubled = commandTemplate.substr(open, 2) == "{{";
        auto nameStart = open + (doubled ? 2 : 1);
        auto close = commandTemplate.find(doubled ? "}}" : "}", nameStart);
        if (close == std::string_view::npos) {
            out.append(commandTemplate.substr(open));
            break;
        }

        auto name = commandTemplate.substr(nameStart, close - nameStart);
        auto value = placeholderValue(name, filePath);
        if (!value) {
            // Literal brace: placeholders inside it are still rendered.
            out.push_back('{');
            pos = open + 1;
            continue;
        }
        out.append(*value);
        pos = close + (doubled ? 2 : 1);
    }
    return out;
}

std::string_view defaultCommandYaml() {
    return R"(commands:
  - ext: .go
    run: go run "{{file}}"
  - ext: .py
    run: python3 "{{file}}"
  - ext: .rb
    run: ruby "{{file}}"
  - ext: .js
    run: node "{{file}}"
  - ext: .ts
    run: npx ts-node "{{file}}"
  - ext: .sh
    run: sh "{{file}}"
  - ext: .pl
    run: perl "{{file}}"
  - ext: .php
    run: php "{{file}}"
  - ext: .lua
    run: lua "{{file}}"
  - ext: .rs
    run: rustc "{{file}}" -o "{{dir}}/{{base0}}" && "{{dir}}/{{base0}}"
  - ext: .c
    run: cc "{{file}}" -o "{{dir}}/{{base0}}" && "{{dir}}/{{base0}}"
  - ext: .cpp
    run: c++ -std=c++20 "{{file}}" -o "{{dir}}/{{base0}}" && "{{dir}}/{{base0}}"
  - re: ^Makefile$
    run: make
)";
}

} // namespace fwr::dispatch
