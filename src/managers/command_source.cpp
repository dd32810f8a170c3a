#include "command_source.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

fs::path normalize_target(const fs::path& target) {
    std::error_code ec;
    fs::path abs = fs::absolute(target, ec);
    if (ec) abs = target;
    abs = abs.lexically_normal();
    // "/a/b/" and "/a/b" are the same target
    if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

CommandSource::CommandSource(fs::path command_dir)
    : dir_(std::move(command_dir)) {}

std::vector<CommandFile> CommandSource::scan() const {
    std::vector<CommandFile> found;

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        log_error(fmt::format("Cannot create command directory {}: {}", dir_.string(), ec.message()));
        return found;
    }

    fs::directory_iterator it(dir_, ec);
    if (ec) {
        log_error(fmt::format("Cannot list command directory {}: {}", dir_.string(), ec.message()));
        return found;
    }

    std::vector<fs::path> paths;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        const auto& p = it->path();
        if (p.extension() != COMMAND_FILE_EXT) continue;
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue;
        paths.push_back(p);
    }
    if (ec) {
        log_warn(fmt::format("Listing {} stopped early: {}", dir_.string(), ec.message()));
    }
    std::sort(paths.begin(), paths.end());

    for (const auto& p : paths) {
        std::ifstream in(p);
        if (!in) {
            if (fs::exists(p, ec)) {
                log_error(fmt::format("Cannot read command file {}", p.string()));
                found.push_back({p, {}});
            }
            continue;
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        std::string content = ss.str();
        trim(content);
        if (content.empty()) {
            log_error(fmt::format("Command file {} is empty", p.string()));
            found.push_back({p, {}});
            continue;
        }
        found.push_back({p, fs::path(content)});
    }

    return found;
}

void CommandSource::remove(const std::vector<CommandFile>& files) const {
    for (const auto& f : files) {
        std::error_code ec;
        if (!fs::is_regular_file(f.path, ec)) continue;
        fs::remove(f.path, ec);
        if (ec) {
            log_warn(fmt::format("Could not delete command file {}: {}", f.path.string(), ec.message()));
        }
    }
}

fs::path CommandSource::command_file_for(const fs::path& target) const {
    return dir_ / (hash_id(normalize_target(target).string()) + COMMAND_FILE_EXT);
}

void CommandSource::trigger(const fs::path& target) const {
    fs::create_directories(dir_);

    fs::path abs = normalize_target(target);
    fs::path command_file = command_file_for(abs);
    if (fs::exists(command_file)) {
        log_warn(fmt::format("Syncing not active or too slow: command file {} still exists",
                             command_file.string()));
    }
    log_debug(fmt::format("Writing command file {} for {}", command_file.string(), abs.string()));

    // Write under a name the scanner ignores, then rename into place so a
    // concurrent scan never reads a partial path.
    fs::path tmp = dir_ / fmt::format(".{}.{}.tmp", command_file.filename().string(),
                                      platform::current_pid());
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("Failed to write command file " + tmp.string());
        }
        out << abs.string();
    }
    std::error_code ec;
    fs::rename(tmp, command_file, ec);
    if (ec) {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
        throw fs::filesystem_error("Failed to publish command file", tmp, command_file, ec);
    }
}
