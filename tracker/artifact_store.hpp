#ifndef TRACKER_ARTIFACT_STORE_HPP
#define TRACKER_ARTIFACT_STORE_HPP

#include <chrono>
#include <string>
#include <vector>

namespace tracker {

// Files produced by executions, stored as <root>/<request id>/<name>.
class ArtifactStore {
 public:
  explicit ArtifactStore(std::string root) : root_(std::move(root)) {}

  // Creates the empty directory of a request and returns its path. Throws
  // core::transfer_error.
  std::string Prepare(const std::string& request_id);

  // Names of the files of a request, sorted. A request without files has
  // none.
  std::vector<std::string> List(const std::string& request_id) const;

  // Throws core::validation_error for names that could leave the request
  // directory and core::artifact_not_found for missing files.
  std::string Fetch(const std::string& request_id,
                    const std::string& name) const;

  void Remove(const std::string& request_id);

  // Removes the request directories last modified before cutoff, including
  // the ones left by previous runs. Returns how many were removed.
  size_t Sweep(std::chrono::system_clock::time_point cutoff);

  const std::string& Root() const { return root_; }

 private:
  std::string Directory(const std::string& request_id) const;

  std::string root_;
};

}  // namespace tracker

#endif
