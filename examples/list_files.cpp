#include <iomanip>
#include <iostream>

#include <mpqx/mpqx.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <archive.mpq>\n";
    return 1;
  }

  mpqx::Error error;
  auto archive = mpqx::Archive::open(argv[1], &error);

  if (!archive) {
    std::cerr << "Error (" << mpqx::errorCodeName(error.code) << "): " << error.message << "\n";
    return 1;
  }

  const auto *header = archive->header();
  std::cout << "Archive: " << argv[1] << "\n";
  std::cout << "Format: " << static_cast<int>(header->format()) << ", sector size "
            << header->sectorSize() << "\n";
  std::cout << "Files: " << archive->fileCount() << "\n\n";

  for (const auto &file : archive->files()) {
    std::cout << "  " << std::setw(10) << file.size << " " << std::setw(10) << file.compressedSize
              << "  " << std::hex << std::setw(8) << std::setfill('0') << file.flags
              << std::dec << std::setfill(' ') << "  ";
    if (file.hasName()) {
      std::cout << file.name;
    } else {
      std::cout << "<block " << file.blockIndex << ">";
    }
    if (file.locale != mpqx::neutralLocale) {
      std::cout << " [locale " << file.locale << "]";
    }
    std::cout << "\n";
  }

  return 0;
}
