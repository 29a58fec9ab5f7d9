// snapshot_file.hpp

#pragma once
#include "peer_record.hpp"

#include <filesystem>

// Registry contents persisted as {"<group key>": [record, ...]} JSON.
class SnapshotFile {
public:
  explicit SnapshotFile(std::filesystem::path path);

  // A missing file loads as empty. Throws InternalError if the file cannot
  // be read or parsed.
  GroupSnapshot load() const;

  // Writes through a temporary file renamed over the target. Throws
  // InternalError on failure.
  void save(const GroupSnapshot& snapshot) const;

  const std::filesystem::path& path() const { return path_; }

private:
  std::filesystem::path path_;
};
