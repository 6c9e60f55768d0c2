#pragma once
#include <cstdint>
#include <string>
#include "encoding.hpp"

namespace paperback {

const uint32_t kMinChunkSize=50;
const uint32_t kMaxChunkSize=1500;
const uint32_t kChunkSizeStep=50;
const uint32_t kDefaultChunkSize=1500;
// the record's count field is bounded; 2^24 chunks of 1500 bytes is ~25 GB of paper
const uint32_t kMaxChunkCount=1u<<24;

/*
 * Identifying metadata of one backup. Built once from the input at encode time;
 * during restore it is rebuilt from the fields every record carries, so only
 * identifier, content_hash and chunk_count are known until the chunks are in.
 */
struct BackupManifest {
  std::string identifier;
  std::string content_hash;     // sha256 of the whole input, lowercase hex
  uint64_t total_length=0;
  uint32_t chunk_size=0;        // 0 while unknown
  uint32_t chunk_count=0;

  static BackupManifest from_data(const Bytes& data,const std::string& identifier,uint32_t chunk_size);

  // Same backup: (identifier, content_hash, chunk_count). chunk_size is not part of the key.
  bool matches(const BackupManifest& other) const;
};

bool valid_chunk_size(uint32_t chunk_size);
void validate_chunk_size(uint32_t chunk_size);   // throws InvalidConfig
// Command-line form: plain decimal. Throws InvalidConfig for anything else or an invalid size.
uint32_t parse_chunk_size(const std::string& text);
uint32_t chunk_count_for(uint64_t total_length,uint32_t chunk_size);

} // namespace paperback
