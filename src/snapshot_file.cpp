#include "snapshot_file.hpp"
#include "errors.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

SnapshotFile::SnapshotFile(fs::path path) : path_(std::move(path)) {}

GroupSnapshot SnapshotFile::load() const {
  std::ifstream in(path_);
  if (!in) {
    std::error_code ec;
    if (!fs::exists(path_, ec) && !ec)
      return {};
    throw InternalError("cannot open " + path_.string());
  }

  try {
    auto dump = json::parse(in);
    GroupSnapshot snapshot;
    for (const auto& item : dump.items()) {
      snapshot.emplace(item.key(),
                       item.value().get<std::vector<PeerRecord>>());
    }
    return snapshot;
  } catch (const json::exception& e) {
    throw InternalError("malformed snapshot " + path_.string() + ": " +
                        e.what());
  }
}

void SnapshotFile::save(const GroupSnapshot& snapshot) const {
  std::error_code ec;
  if (path_.has_parent_path()) {
    fs::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw InternalError("cannot create " + path_.parent_path().string() +
                          ": " + ec.message());
    }
  }

  json dump = json::object();
  for (const auto& [group_key, members] : snapshot) {
    dump[group_key] = members;
  }

  auto tmp = path_;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    out << dump.dump(2);
    out.flush();
    if (!out) {
      throw InternalError("cannot write " + tmp.string());
    }
  }
  fs::rename(tmp, path_, ec);
  if (ec) {
    throw InternalError("cannot replace " + path_.string() + ": " +
                        ec.message());
  }
}
