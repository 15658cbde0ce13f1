#include <macsweep/config.hpp>
#include <macsweep/sysinfo.hpp>
#include <macsweep/utils.hpp>

#include <spdlog/spdlog.h>

#include <sstream>
#include <stdexcept>

DevicePrefixRule parse_rule(std::string_view text) {
    auto entry = split(text, "=");
    if (entry.first.size() == text.size()) {
        throw std::invalid_argument(fmt::format("expected PREFIX=LABEL, got '{}'", text));
    }
    DevicePrefixRule rule{std::string(trim(entry.first)), std::string(trim(entry.second))};
    validate_rule(rule);
    return rule;
}

std::vector<DevicePrefixRule> parse_rules(std::string_view text) {
    std::vector<DevicePrefixRule> ret;
    std::istringstream stream{std::string(text)};
    std::string line;
    size_t lineno = 0;
    while (std::getline(stream, line)) {
        ++lineno;
        auto content = trim(line);
        if (content.empty() || content.front() == '#') {
            continue;
        }
        auto entry = split(content, " \t");
        DevicePrefixRule rule{std::string(entry.first), std::string(trim(entry.second))};
        try {
            validate_rule(rule);
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument(fmt::format("line {}: {}", lineno, e.what()));
        }
        ret.push_back(std::move(rule));
    }
    return ret;
}

std::vector<DevicePrefixRule> load_rules_file(const std::string& path) {
    auto text = read_text_file(path);
    if (!text) {
        throw std::runtime_error(fmt::format("cannot read rules file {}", path));
    }
    try {
        return parse_rules(*text);
    } catch (const std::invalid_argument& e) {
        throw std::invalid_argument(fmt::format("{}: {}", path, e.what()));
    }
}

std::vector<DevicePrefixRule> build_rules(const Config& config) {
    std::vector<DevicePrefixRule> rules;
    if (!config.no_default_rules) {
        rules = default_rules();
    }
    if (!config.rules_file.empty()) {
        auto loaded = load_rules_file(config.rules_file);
        spdlog::debug("loaded {} rules from {}", loaded.size(), config.rules_file);
        rules.insert(rules.end(), loaded.begin(), loaded.end());
    }
    for (const auto& text : config.rules) {
        rules.push_back(parse_rule(text));
    }
    return rules;
}

std::vector<TableFormat> build_formats(const Config& config) {
    if (config.formats.empty()) {
        return builtin_table_formats();
    }
    std::vector<TableFormat> formats;
    for (const auto& name : config.formats) {
        auto format = find_table_format(name);
        if (!format) {
            throw std::invalid_argument(fmt::format("unknown table format '{}'", name));
        }
        formats.push_back(std::move(*format));
    }
    return formats;
}
