#include <filesystem>
#include <iostream>
#include <string>

#include <mpqx/mpqx.hpp>

namespace {

// Archive names use backslashes as directory separators
std::filesystem::path toRelativePath(const std::string &archiveName) {
  std::string path = archiveName;
  for (char &c : path) {
    if (c == '\\') {
      c = '/';
    }
  }
  return std::filesystem::path(path).relative_path();
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <archive.mpq> <output_dir>\n";
    return 1;
  }

  mpqx::Error error;
  auto archive = mpqx::Archive::open(argv[1], &error);

  if (!archive) {
    std::cerr << "Error (" << mpqx::errorCodeName(error.code) << "): " << error.message << "\n";
    return 1;
  }

  std::filesystem::path outputDir = argv[2];
  std::error_code ec;
  std::filesystem::create_directories(outputDir, ec);
  if (ec) {
    std::cerr << "Error: cannot create " << outputDir << ": " << ec.message() << "\n";
    return 1;
  }

  int extractedCount = 0;
  int failedCount = 0;
  for (const auto &file : archive->files()) {
    if (!file.hasName()) {
      std::cerr << "Skipping block " << file.blockIndex << ": name unknown\n";
      continue;
    }

    std::filesystem::path outputPath = outputDir / toRelativePath(file.name);
    if (!archive->extract(file, outputPath, &error)) {
      std::cerr << "Failed to extract " << file.name << ": " << error.message << "\n";
      ++failedCount;
      continue;
    }
    ++extractedCount;
  }

  std::cout << "Extracted " << extractedCount << " files to " << outputDir << "\n";
  return failedCount == 0 ? 0 : 2;
}
