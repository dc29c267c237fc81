#include <iostream>

#include <vfsx/vfsx.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <archive.vfs>\n";
    return 1;
  }

  vfsx::Error error;
  auto reader = vfsx::Reader::open(argv[1], &error);
  if (!reader) {
    std::cerr << "Error: " << error.describe() << "\n";
    return 1;
  }

  auto header = reader->readHeader(&error);
  if (!header) {
    std::cerr << "Error: " << error.describe() << "\n";
    return 1;
  }

  std::cout << "Archive: " << argv[1] << "\n";
  std::cout << "Files: " << header->fileCount << "\n\n";

  for (uint32_t i = 1; i <= header->fileCount; ++i) {
    auto entry = reader->readEntry(&error);
    if (!entry || !vfsx::Reader::validateRange(*entry, reader->archiveSize(), &error)) {
      std::cerr << "Error in entry " << i << ": " << error.describe() << "\n";
      return 1;
    }

    std::cout << "  " << entry->name << " (" << entry->size << " bytes @ " << entry->offset
              << ")\n";

    if (!reader->skipFixedSuffix(&error)) {
      if (i == header->fileCount && error.code == vfsx::ErrorCode::Truncated) {
        break;
      }
      std::cerr << "Error in entry " << i << ": " << error.describe() << "\n";
      return 1;
    }
  }

  return 0;
}
