#pragma once

// mpqx: reading and writing MPQ archives
// A C++20 library for the hashed, optionally encrypted and compressed archive
// container used by Blizzard games.

#include "archive.hpp"
#include "block_table.hpp"
#include "compression.hpp"
#include "crypto.hpp"
#include "hash_table.hpp"
#include "header.hpp"
#include "reader.hpp"
#include "sector.hpp"
#include "types.hpp"
#include "writer.hpp"

// Layers, from the bottom up:
//
// 1. Format pieces: Header, HashTable, BlockTable, the cipher in crypto.hpp,
//    the codecs in compression.hpp and the SectorReader / SectorWriter
// 2. Reader / Writer: open an archive, or build one in a single pass
// 3. Archive: one handle for either direction
//
// Example usage:
//
//   mpqx::Error error;
//   auto archive = mpqx::Archive::open("patch.mpq", &error);
//   if (archive) {
//     for (const auto &file : archive->files()) {
//       std::cout << file.name << std::endl;
//     }
//     auto data = archive->readFile("units\\human\\footman.txt", 0, 0, &error);
//   }
//
//   mpqx::WriteOptions options;
//   options.format = mpqx::Format::ExtendedV1;
//   auto archive = mpqx::Archive::create(options);
//   mpqx::AddFileOptions fileOptions;
//   fileOptions.compression = mpqx::Compression::Zlib;
//   archive.addFile("readme.txt", "docs\\readme.txt", fileOptions);
//   archive.write("out.mpq");
