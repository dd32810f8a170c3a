#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// One *.command file found during a scan. target is empty when the file
// could not be read; such files are still consumed.
struct CommandFile {
    fs::path path;
    fs::path target;
};

// The directory through which sync requests arrive. Producers drop
// <id>.command files whose whole content is a directory path; the
// scheduler scans, consumes and deletes them.
class CommandSource {
public:
    explicit CommandSource(fs::path command_dir);

    // Create the directory if needed and read every command file in it.
    // Files that vanish between listing and reading are skipped.
    std::vector<CommandFile> scan() const;

    // Delete the given files. Files already gone are ignored.
    void remove(const std::vector<CommandFile>& files) const;

    // Write the command file requesting a sync of target. Repeated triggers
    // for the same directory land on the same file.
    void trigger(const fs::path& target) const;

    // Path of the command file trigger() writes for target
    fs::path command_file_for(const fs::path& target) const;

    const fs::path& dir() const { return dir_; }

private:
    fs::path dir_;
};

// Absolute, lexically normalized form used as a target's identity
fs::path normalize_target(const fs::path& target);
