#include "tracker/artifact_store.hpp"

#include <algorithm>
#include <system_error>

#include <kj/debug.h>

#include "core/errors.hpp"
#include "util/file.hpp"

namespace tracker {

std::string ArtifactStore::Directory(const std::string& request_id) const {
  if (!util::File::IsSafeRelativePath(request_id) ||
      request_id.find('/') != std::string::npos) {
    throw core::request_not_found("Invalid request id " + request_id);
  }
  return util::File::JoinPath(root_, request_id);
}

std::string ArtifactStore::Prepare(const std::string& request_id) {
  std::string dir = Directory(request_id);
  try {
    if (util::File::Exists(dir)) util::File::RemoveTree(dir);
    util::File::MakeDirs(dir);
  } catch (const std::system_error& e) {
    throw core::transfer_error("Cannot prepare " + dir + ": " + e.what());
  }
  return dir;
}

std::vector<std::string> ArtifactStore::List(
    const std::string& request_id) const {
  std::vector<std::string> files = util::File::ListFiles(Directory(request_id));
  std::sort(files.begin(), files.end());
  return files;
}

std::string ArtifactStore::Fetch(const std::string& request_id,
                                 const std::string& name) const {
  if (!util::File::IsSafeRelativePath(name)) {
    throw core::validation_error("Invalid file name " + name);
  }
  std::string path = util::File::JoinPath(Directory(request_id), name);
  if (!util::File::Exists(path)) {
    throw core::artifact_not_found("No file " + name + " for request " +
                                   request_id);
  }
  try {
    return util::File::ReadAll(path);
  } catch (const std::system_error& e) {
    throw core::artifact_not_found("Cannot read " + name + ": " + e.what());
  }
}

void ArtifactStore::Remove(const std::string& request_id) {
  std::string dir = Directory(request_id);
  try {
    if (util::File::Exists(dir)) util::File::RemoveTree(dir);
  } catch (const std::system_error& e) {
    KJ_LOG(ERROR, "Could not remove " + dir, e.what());
  }
}

size_t ArtifactStore::Sweep(std::chrono::system_clock::time_point cutoff) {
  size_t removed = 0;
  for (const std::string& request : util::File::ListDirectories(root_)) {
    std::string dir = util::File::JoinPath(root_, request);
    try {
      if (util::File::ModificationTime(dir) >= cutoff) continue;
      util::File::RemoveTree(dir);
      removed++;
    } catch (const std::system_error& e) {
      KJ_LOG(ERROR, "Could not expire " + dir, e.what());
    }
  }
  if (removed) KJ_LOG(INFO, "Expired artifacts", removed);
  return removed;
}

}  // namespace tracker
