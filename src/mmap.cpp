#include <cerrno>
#include <cstring>
#include <format>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <mpqx/mmap.hpp>

namespace mpqx {

namespace {

void setIoError(Error *outError, std::string_view what, const std::filesystem::path &path) {
  const int code = errno;
  detail::setError(outError, ErrorCode::IoError,
                   std::format("{}: {} ({})", what, path.string(), std::strerror(code)));
}

} // namespace

MappedFile::MappedFile() = default;

MappedFile::~MappedFile() {
  close();
}

MappedFile::MappedFile(MappedFile &&other) noexcept
    : fd_(std::exchange(other.fd_, -1)), data_(std::exchange(other.data_, nullptr)),
      size_(std::exchange(other.size_, 0)), writable_(std::exchange(other.writable_, false)) {}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    data_ = std::exchange(other.data_, nullptr);
    size_ = std::exchange(other.size_, 0);
    writable_ = std::exchange(other.writable_, false);
  }
  return *this;
}

bool MappedFile::openRead(const std::filesystem::path &path, Error *outError) {
  close();

  fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd_ < 0) {
    setIoError(outError, "Failed to open archive for reading", path);
    return false;
  }

  struct stat st;
  if (fstat(fd_, &st) < 0) {
    setIoError(outError, "Failed to stat archive", path);
    close();
    return false;
  }
  if (!S_ISREG(st.st_mode)) {
    detail::setError(outError, ErrorCode::IoError,
                     std::format("Not a regular file: {}", path.string()));
    close();
    return false;
  }

  size_ = static_cast<size_t>(st.st_size);
  writable_ = false;
  return map(path, PROT_READ, MAP_PRIVATE, outError);
}

bool MappedFile::openWrite(const std::filesystem::path &path, size_t size, Error *outError) {
  close();

  fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
  if (fd_ < 0) {
    setIoError(outError, "Failed to create archive", path);
    return false;
  }

  if (ftruncate(fd_, static_cast<off_t>(size)) < 0) {
    setIoError(outError, "Failed to resize archive", path);
    close();
    return false;
  }

  size_ = size;
  writable_ = true;
  return map(path, PROT_READ | PROT_WRITE, MAP_SHARED, outError);
}

bool MappedFile::map(const std::filesystem::path &path, int protection, int sharing,
                     Error *outError) {
  if (size_ == 0) {
    return true;
  }

  void *mapped = mmap(nullptr, size_, protection, sharing, fd_, 0);
  if (mapped == MAP_FAILED) {
    setIoError(outError, "Failed to map archive", path);
    close();
    return false;
  }

  data_ = mapped;
  return true;
}

bool MappedFile::flush(Error *outError) {
  if (!isOpen() || !writable_) {
    detail::setError(outError, ErrorCode::IoError, "Cannot flush: file not open for writing");
    return false;
  }

  if (data_ && msync(data_, size_, MS_SYNC) < 0) {
    const int code = errno;
    detail::setError(outError, ErrorCode::IoError,
                     std::format("Failed to sync archive ({})", std::strerror(code)));
    return false;
  }
  return true;
}

void MappedFile::close() noexcept {
  release();
}

void MappedFile::release() noexcept {
  if (data_) {
    munmap(data_, size_);
    data_ = nullptr;
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  size_ = 0;
  writable_ = false;
}

} // namespace mpqx
