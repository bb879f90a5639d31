#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <vector>

#include "sg/error.h"

namespace sg::orchestrator {

struct AtomicReplaceHooks { // test seam for crash simulation
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
};

// Performs an atomic replace of the target file by writing the payload to a
// temporary file on the same filesystem, syncing it to disk, then renaming it
// into place. The resulting file is readable only by its owner.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks = {});

// Reads the whole file. Returns std::nullopt when the file does not exist and
// throws sg::Error{IO} for any other failure.
std::optional<std::vector<uint8_t>> ReadFileIfExists(const std::filesystem::path& path);

}  // namespace sg::orchestrator
