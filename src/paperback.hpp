#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "chunk_codec.hpp"
#include "errors.hpp"
#include "layout.hpp"
#include "manifest.hpp"
#include "session.hpp"

#define PAPERBACK_VERSION "1.0.0"

namespace paperback {

// Everything one encode run produces.
struct Backup {
  BackupManifest manifest;
  std::vector<Chunk> chunks;
  std::vector<PageSpec> pages;
};

Backup make_backup(const Bytes& data,const std::string& identifier,uint32_t chunk_size,PageFormat format);

// Page sequence only: cover first, then one page per chunk.
std::vector<PageSpec> encode(const Bytes& data,const std::string& identifier,uint32_t chunk_size,PageFormat format);

std::unique_ptr<ReconstructionSession> new_session();

} // namespace paperback
