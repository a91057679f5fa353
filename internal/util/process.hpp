#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ito::util {

struct CommandResult {
  int         exit_code{-1};
  std::string stdout_text;
  bool        spawned{false};
};

/*
  Runs argv[0] (looked up in PATH) with the given arguments and captures stdout.
  stderr is discarded. Never throws for a missing program: spawned=false.
*/
CommandResult RunCommand(const std::vector<std::string>& argv, const std::filesystem::path& cwd = {});

// Trimmed stdout on exit code 0 with non-empty output, nullopt otherwise.
std::optional<std::string> RunCommandTrimmed(const std::vector<std::string>& argv, const std::filesystem::path& cwd = {});

} // namespace ito::util
