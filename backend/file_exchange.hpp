#ifndef BACKEND_FILE_EXCHANGE_HPP
#define BACKEND_FILE_EXCHANGE_HPP

#include <chrono>
#include <string>
#include <vector>

#include "backend/host.hpp"

namespace backend {

// Moves files between this process and session workspaces, i.e. the
// directories that are mounted into containers. Remote paths are relative to
// a workspace. Writes are atomic: a failed Push leaves nothing at its
// destination. Every failure throws core::transfer_error.
class FileExchange {
 public:
  // Creates an empty workspace for a session and returns its path, as the
  // container engine sees it.
  virtual std::string CreateWorkspace(const std::string& session_id) = 0;

  // Removes a workspace and everything in it.
  virtual void RemoveWorkspace(const std::string& workspace) = 0;

  virtual void Push(const std::string& workspace, const std::string& data,
                    const std::string& remote_path) = 0;

  virtual std::string Pull(const std::string& workspace,
                           const std::string& remote_path) = 0;

  // Copies every file below local_dir to remote_dir.
  void PushTree(const std::string& workspace, const std::string& local_dir,
                const std::string& remote_dir);

  // Copies every regular file below remote_dir into local_dir and returns
  // their paths relative to remote_dir. A missing remote_dir has no files.
  std::vector<std::string> PullTree(const std::string& workspace,
                                    const std::string& remote_dir,
                                    const std::string& local_dir);

  virtual std::string Describe() const = 0;

  FileExchange() = default;
  virtual ~FileExchange() = default;
  FileExchange(const FileExchange&) = delete;
  FileExchange& operator=(const FileExchange&) = delete;

 protected:
  // Regular files below remote_dir, relative to it.
  virtual std::vector<std::string> List(const std::string& workspace,
                                        const std::string& remote_dir) = 0;
};

// Workspaces are local directories bind-mounted into containers run by a
// native engine.
class MountedFileExchange : public FileExchange {
 public:
  // Workspaces are created below base_dir. With keep set, RemoveWorkspace
  // leaves them on disk for debugging.
  MountedFileExchange(std::string base_dir, bool keep)
      : base_dir_(std::move(base_dir)), keep_(keep) {}

  std::string CreateWorkspace(const std::string& session_id) override;
  void RemoveWorkspace(const std::string& workspace) override;
  void Push(const std::string& workspace, const std::string& data,
            const std::string& remote_path) override;
  std::string Pull(const std::string& workspace,
                   const std::string& remote_path) override;
  std::string Describe() const override { return "mounted " + base_dir_; }

 protected:
  std::vector<std::string> List(const std::string& workspace,
                                const std::string& remote_dir) override;

 private:
  std::string base_dir_;
  bool keep_;
};

// Workspaces live inside the VM and every copy is a command run there.
class VmFileExchange : public FileExchange {
 public:
  VmFileExchange(Host* vm, std::string base_dir,
                 std::chrono::milliseconds timeout)
      : vm_(vm), base_dir_(std::move(base_dir)), timeout_(timeout) {}

  std::string CreateWorkspace(const std::string& session_id) override;
  void RemoveWorkspace(const std::string& workspace) override;
  void Push(const std::string& workspace, const std::string& data,
            const std::string& remote_path) override;
  std::string Pull(const std::string& workspace,
                   const std::string& remote_path) override;
  std::string Describe() const override {
    return "copied through " + vm_->Describe();
  }

 protected:
  std::vector<std::string> List(const std::string& workspace,
                                const std::string& remote_dir) override;

 private:
  // Runs a command in the VM, throwing core::transfer_error on failure.
  util::ProcessResult Run(const std::vector<std::string>& argv,
                          const std::string& stdin_data, const char* what);

  Host* vm_;
  std::string base_dir_;
  std::chrono::milliseconds timeout_;
};

}  // namespace backend

#endif
