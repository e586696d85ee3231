#include "agentboard/storage/atomic_file.hpp"

#include "agentboard/util/id.hpp"
#include "agentboard/util/log.hpp"

#include <fmt/format.h>

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

namespace agentboard {

namespace {

auto io_failure(std::string_view what, const std::filesystem::path& path,
                int err) -> std::unexpected<Failure> {
  return fail(Error::IoError,
              fmt::format("{} {}: {}", what, path.string(), std::strerror(err)));
}

// Closes the descriptor and unlinks the temp file unless committed.
class TempFile {
public:
  explicit TempFile(std::filesystem::path path)
      : path_(std::move(path)),
        fd_(::open(path_.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC,
                   0644)) {}
  ~TempFile() {
    close();
    if (!committed_) {
      ::unlink(path_.c_str());
    }
  }
  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;

  [[nodiscard]] auto fd() const noexcept -> int {
    return fd_;
  }
  [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& {
    return path_;
  }
  auto close() -> int {
    int rc = 0;
    if (fd_ >= 0) {
      rc = ::close(fd_);
      fd_ = -1;
    }
    return rc;
  }
  auto commit() noexcept -> void {
    committed_ = true;
  }

private:
  std::filesystem::path path_;
  int fd_{-1};
  bool committed_{false};
};

}  // namespace

auto temp_path_for(const std::filesystem::path& path)
    -> std::filesystem::path {
  auto p = path;
  p += fmt::format(".tmp.{}.{}", ::getpid(), detail::generate_short_uuid());
  return p;
}

auto is_temp_file_for(const std::filesystem::path& live,
                      const std::filesystem::path& candidate) -> bool {
  if (candidate.parent_path() != live.parent_path()) {
    return false;
  }
  auto prefix = live.filename().string() + ".tmp.";
  return candidate.filename().string().starts_with(prefix);
}

auto fsync_directory(const std::filesystem::path& dir) -> Result<void> {
  auto target = dir.empty() ? std::filesystem::path{"."} : dir;
  int fd = ::open(target.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    return io_failure("cannot open directory", target, errno);
  }
  int rc = ::fsync(fd);
  int err = errno;
  ::close(fd);
  if (rc != 0) {
    return io_failure("cannot fsync directory", target, err);
  }
  return ok();
}

auto write_file_atomic(const std::filesystem::path& path,
                       std::string_view contents) -> Result<void> {
  TempFile tmp(temp_path_for(path));
  if (tmp.fd() < 0) {
    return io_failure("cannot create", tmp.path(), errno);
  }

  const char* data = contents.data();
  std::size_t left = contents.size();
  while (left > 0) {
    auto n = ::write(tmp.fd(), data, left);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return io_failure("cannot write", tmp.path(), errno);
    }
    data += n;
    left -= static_cast<std::size_t>(n);
  }

  if (::fsync(tmp.fd()) != 0) {
    return io_failure("cannot fsync", tmp.path(), errno);
  }
  if (tmp.close() != 0) {
    return io_failure("cannot close", tmp.path(), errno);
  }
  if (::rename(tmp.path().c_str(), path.c_str()) != 0) {
    return io_failure("cannot rename onto", path, errno);
  }
  tmp.commit();

  // The rename is visible already; a failed directory sync only weakens
  // durability across power loss.
  if (auto r = fsync_directory(path.parent_path()); !r) {
    log::warn("{}", r.error().message());
  }
  return ok();
}

auto read_file(const std::filesystem::path& path)
    -> Result<std::optional<std::string>> {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
      return std::optional<std::string>{};
    }
    return io_failure("cannot open", path, errno);
  }
  std::string text{std::istreambuf_iterator<char>(in),
                   std::istreambuf_iterator<char>()};
  if (in.bad()) {
    return io_failure("cannot read", path, errno);
  }
  return std::optional<std::string>{std::move(text)};
}

}  // namespace agentboard
