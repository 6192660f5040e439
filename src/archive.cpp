#include <mpqx/archive.hpp>
#include <mpqx/reader.hpp>
#include <mpqx/writer.hpp>

namespace mpqx {

Archive::Archive() = default;
Archive::~Archive() = default;
Archive::Archive(Archive &&) noexcept = default;
Archive &Archive::operator=(Archive &&) noexcept = default;

std::optional<Archive> Archive::open(const std::filesystem::path &path, Error *outError) {
  return open(path, OpenOptions{}, outError);
}

std::optional<Archive> Archive::open(const std::filesystem::path &path, const OpenOptions &options,
                                     Error *outError) {
  auto reader = Reader::open(path, options, outError);
  if (!reader) {
    return std::nullopt;
  }

  Archive archive;
  archive.reader_ = std::make_unique<Reader>(std::move(*reader));
  return archive;
}

std::optional<Archive> Archive::openMemory(std::vector<uint8_t> data, Error *outError) {
  auto reader = Reader::openMemory(std::move(data), outError);
  if (!reader) {
    return std::nullopt;
  }

  Archive archive;
  archive.reader_ = std::make_unique<Reader>(std::move(*reader));
  return archive;
}

Archive Archive::create() {
  return create(WriteOptions{});
}

Archive Archive::create(const WriteOptions &options) {
  Archive archive;
  archive.writer_ = std::make_unique<Writer>(options);
  return archive;
}

bool Archive::requireReader(Error *outError) const {
  if (!reader_) {
    detail::setError(outError, ErrorCode::InvalidArgument, "Archive not open for reading");
    return false;
  }
  return true;
}

bool Archive::requireWriter(Error *outError) const {
  if (!writer_) {
    detail::setError(outError, ErrorCode::InvalidArgument, "Archive not open for writing");
    return false;
  }
  return true;
}

bool Archive::addFile(const std::filesystem::path &sourcePath, const std::string &archivePath,
                      Error *outError) {
  return requireWriter(outError) && writer_->addFile(sourcePath, archivePath, outError);
}

bool Archive::addFile(const std::filesystem::path &sourcePath, const std::string &archivePath,
                      const AddFileOptions &options, Error *outError) {
  return requireWriter(outError) && writer_->addFile(sourcePath, archivePath, options, outError);
}

bool Archive::addFile(std::span<const uint8_t> data, const std::string &archivePath,
                      Error *outError) {
  return requireWriter(outError) && writer_->addFile(data, archivePath, outError);
}

bool Archive::addFile(std::span<const uint8_t> data, const std::string &archivePath,
                      const AddFileOptions &options, Error *outError) {
  return requireWriter(outError) && writer_->addFile(data, archivePath, options, outError);
}

bool Archive::removeFile(std::string_view archivePath, uint16_t locale, Error *outError) {
  return requireWriter(outError) && writer_->removeFile(archivePath, locale, outError);
}

bool Archive::write(const std::filesystem::path &destPath, Error *outError) {
  return requireWriter(outError) && writer_->write(destPath, outError);
}

std::optional<std::vector<uint8_t>> Archive::writeToMemory(Error *outError) {
  if (!requireWriter(outError)) {
    return std::nullopt;
  }
  return writer_->writeToMemory(outError);
}

void Archive::clear() {
  if (writer_) {
    writer_->clear();
  }
}

const Header *Archive::header() const {
  return reader_ ? &reader_->header() : nullptr;
}

const std::vector<FileEntry> &Archive::files() const {
  static const std::vector<FileEntry> empty;
  if (reader_) {
    return reader_->files();
  }
  if (writer_) {
    return writer_->files();
  }
  return empty;
}

size_t Archive::fileCount() const {
  if (reader_) {
    return reader_->fileCount();
  }
  if (writer_) {
    return writer_->fileCount();
  }
  return 0;
}

std::optional<FileEntry> Archive::findFile(std::string_view name, uint16_t locale,
                                           uint16_t platform, Error *outError) const {
  if (!requireReader(outError)) {
    return std::nullopt;
  }
  return reader_->findFile(name, locale, platform, outError);
}

bool Archive::fileExists(std::string_view name, uint16_t locale, uint16_t platform) const {
  return reader_ && reader_->fileExists(name, locale, platform);
}

std::optional<std::vector<uint8_t>> Archive::readFile(std::string_view name, uint16_t locale,
                                                      uint16_t platform, Error *outError) const {
  if (!requireReader(outError)) {
    return std::nullopt;
  }
  return reader_->readFile(name, locale, platform, outError);
}

bool Archive::extract(const FileEntry &entry, const std::filesystem::path &destPath,
                      Error *outError) const {
  return requireReader(outError) && reader_->extract(entry, destPath, outError);
}

bool Archive::extract(std::string_view name, const std::filesystem::path &destPath,
                      Error *outError) const {
  return requireReader(outError) && reader_->extract(name, destPath, outError);
}

std::optional<std::vector<uint8_t>> Archive::extractToMemory(const FileEntry &entry,
                                                             Error *outError) const {
  if (!requireReader(outError)) {
    return std::nullopt;
  }
  return reader_->extractToMemory(entry, outError);
}

void Archive::close() {
  reader_.reset();
  writer_.reset();
}

} // namespace mpqx
