#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "encoding.hpp"
#include "manifest.hpp"

namespace paperback {

/*
 * Wire record, one per chunk, ASCII only:
 *
 *   PB2|<identifier b64>|<sha256 hex>|<chunk count>|<index>|<payload length>|<payload check>|<payload b64>
 *
 * Every record repeats the backup's identifying fields so that any single
 * decoded code tells which backup it belongs to and how many siblings exist.
 * The payload check is the first 8 hex digits of the payload's SHA-256; with
 * the declared length it catches a scan cut short on a base64 quad boundary.
 * '|' never occurs in base64 or hex.
 */
extern const char* const kRecordVersion;
const char kRecordSeparator='|';
const size_t kRecordFields=8;
const size_t kPayloadCheckDigits=8;

struct Chunk {
  uint32_t index=0;
  Bytes payload;
};

enum class ParseError {
  None,
  Empty,
  FieldCount,
  UnsupportedVersion,
  BadIdentifier,
  BadHash,
  BadCount,
  BadIndex,
  IndexOutOfRange,
  BadLength,
  BadChecksum,
  BadPayload,
  PayloadTooLarge,
  Truncated,
  ChecksumMismatch
};

const char* parse_error_label(ParseError e);

// deserialize() result. manifest holds identifier, content_hash and chunk_count only.
struct ParsedRecord {
  ParseError error=ParseError::None;
  Chunk chunk;
  BackupManifest manifest;
  bool ok() const { return error==ParseError::None; }
};

// Throws InvalidConfig for a bad chunk size. Empty input gives one empty chunk.
std::vector<Chunk> split(const Bytes& data,uint32_t chunk_size);
std::string serialize(const Chunk& chunk,const BackupManifest& manifest);
// Never throws on bad input. Accepts one trailing line terminator (\n, \r or \r\n).
ParsedRecord deserialize(const std::string& text);

// Upper bound on serialize() output for any chunk of this manifest.
size_t max_record_length(const BackupManifest& manifest);

// First kPayloadCheckDigits hex digits of sha256(payload).
std::string payload_check(const Bytes& payload);

} // namespace paperback
