#include <filesystem>
#include <iostream>
#include <string>
#include <utility>

#include <vfsx/vfsx.hpp>

namespace {

void printUsage(const char *argv0) {
  std::string appName = std::filesystem::path(argv0).filename().string();

  std::cout << "Usage: " << appName << " <path_to_vfs_file> [output_directory]\n";
  std::cout << "If output_directory is not specified, a directory named after\n";
  std::cout << "the VFS file (without extension) in the current location is used.\n";
  std::cout << "\nExamples:\n";
  std::cout << "  " << appName
            << " \"D:\\Steam\\steamapps\\common\\Pathologic Classic HD\\data\\Sounds.vfs\"\n";
  std::cout << "  " << appName << " Sounds.vfs extracted_sounds\n";
}

} // namespace

int main(int argc, char *argv[]) {
  if (argc < 2 || argc > 3) {
    printUsage(argv[0]);
    return 1;
  }

  std::filesystem::path archivePath = std::filesystem::path(argv[1]).lexically_normal();
  std::filesystem::path outputDir = argc == 3
                                        ? std::filesystem::path(argv[2]).lexically_normal()
                                        : vfsx::defaultOutputRoot(archivePath);

  std::cout << "Input VFS: " << archivePath.string() << "\n";
  std::cout << "Output Directory: " << outputDir.string() << "\n";

  vfsx::Error error;
  auto reader = vfsx::Reader::open(archivePath, &error);
  if (!reader) {
    std::cerr << "\nInitialization error: " << error.describe() << "\n";
    return 1;
  }

  vfsx::ExtractOptions options;
  options.log = [](vfsx::LogLevel level, std::string_view message) {
    if (level == vfsx::LogLevel::Warn) {
      std::cerr << "Warning: " << message << "\n";
    } else {
      std::cout << message << "\n";
    }
  };
  options.onProgress = [](const vfsx::ExtractProgress &progress) {
    std::cout << "Extracted (" << progress.index << "/" << progress.total
              << "): " << progress.entry->name << " (" << progress.entry->size << " bytes)\n";
  };

  vfsx::Extractor extractor(*reader, outputDir, std::move(options));
  if (!extractor.run(&error)) {
    std::cerr << "\nError during unpacking: " << error.describe() << "\n";
    return 1;
  }

  return 0;
}
