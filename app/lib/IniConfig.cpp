#include "IniConfig.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <optional>
#include <utility>
#include <spdlog/fmt/fmt.h>

namespace {
template <typename... Args>
void ini_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::warn) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

bool is_comment_or_blank(const std::string& line)
{
    return line.empty() || line.front() == ';' || line.front() == '#';
}

std::optional<std::string> parse_section_header(const std::string& line)
{
    if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
        return Utils::trim_copy(line.substr(1, line.size() - 2));
    }
    return std::nullopt;
}

std::optional<std::pair<std::string, std::string>> parse_key_value(const std::string& line)
{
    const auto delimiter = line.find('=');
    if (delimiter == std::string::npos) {
        return std::nullopt;
    }
    std::string key = Utils::trim_copy(line.substr(0, delimiter));
    std::string value = Utils::trim_copy(line.substr(delimiter + 1));
    if (key.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::move(key), std::move(value));
}
}


bool IniConfig::load(const std::string& filename)
{
    const std::filesystem::path path = Utils::utf8_to_path(filename);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        ini_log(spdlog::level::debug, "Config file not found, using defaults: {}", filename);
        return false;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        ini_log(spdlog::level::err, "Failed to open config file: {}", filename);
        return false;
    }

    std::string raw_line;
    std::string section;
    std::size_t line_number = 0;
    while (std::getline(file, raw_line)) {
        ++line_number;
        const std::string line = Utils::trim_copy(raw_line);
        if (is_comment_or_blank(line)) {
            continue;
        }
        if (auto header = parse_section_header(line)) {
            section = std::move(*header);
            continue;
        }
        if (auto key_value = parse_key_value(line)) {
            data[section][key_value->first] = key_value->second;
        } else {
            ini_log(spdlog::level::warn, "Ignoring malformed line {} in {}", line_number, filename);
        }
    }
    return true;
}


std::string IniConfig::getValue(const std::string& section,
                                const std::string& key,
                                const std::string& default_value) const
{
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        auto key_it = sec_it->second.find(key);
        if (key_it != sec_it->second.end()) {
            return key_it->second;
        }
    }
    return default_value;
}


void IniConfig::setValue(const std::string& section, const std::string& key, const std::string& value)
{
    data[section][key] = value;
}


bool IniConfig::save(const std::string& filename) const
{
    const std::filesystem::path path = Utils::utf8_to_path(filename);
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            ini_log(spdlog::level::err, "Failed to create config directory for {}: {}", filename, ec.message());
            return false;
        }
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        ini_log(spdlog::level::err, "Failed to open config file for writing: {}", filename);
        return false;
    }

    for (const auto& [section, values] : data) {
        file << "[" << section << "]\n";
        for (const auto& [key, value] : values) {
            file << key << " = " << value << "\n";
        }
        file << "\n";
    }

    return static_cast<bool>(file);
}
