#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "chunk_codec.hpp"
#include "manifest.hpp"

namespace paperback {

enum class IngestStatus { Accepted, Duplicate, Rejected, Malformed };
enum class RejectReason { None, MismatchedBackup };

const char* ingest_status_label(IngestStatus s);

struct IngestOutcome {
  IngestStatus status=IngestStatus::Malformed;
  RejectReason reason=RejectReason::None;      // set when Rejected
  ParseError parse_error=ParseError::None;     // set when Malformed
  uint32_t index=0;                            // valid unless Malformed
};

struct IngestStats {
  size_t accepted=0;
  size_t duplicate=0;
  size_t rejected=0;
  size_t malformed=0;

  void add(const IngestOutcome& o);
  IngestStats& operator+=(const IngestStats& o);
  size_t total() const { return accepted+duplicate+rejected+malformed; }
};

// missing_indices() result. known==false means no valid record was ingested yet,
// which is not the same as an empty list of missing chunks.
struct MissingChunks {
  bool known=false;
  std::vector<uint32_t> indices;
  bool unknown() const { return !known; }
};

/*
 * Accumulates decoded records of one backup, in any order and from any number
 * of batches. The first valid record fixes the manifest; records of other
 * backups are rejected without touching the received set. All members lock,
 * so decode workers may call ingest() concurrently.
 */
class ReconstructionSession {
public:
  ReconstructionSession() {}
  ReconstructionSession(const ReconstructionSession&)=delete;
  ReconstructionSession& operator=(const ReconstructionSession&)=delete;

  IngestOutcome ingest(const std::string& text);

  bool has_manifest() const;
  // Throws std::runtime_error before the first accepted record. chunk_size is
  // filled once a non-final chunk arrived, total_length once complete.
  BackupManifest manifest() const;

  bool is_complete() const;
  MissingChunks missing_indices() const;
  size_t received_count() const;
  IngestStats stats() const;

  // Throws IncompleteError unless is_complete(). Later ingests are diagnostic only.
  Bytes assemble();
  bool assembled() const;

  // Compares the sha256 of data with the manifest's content hash.
  bool verify(const Bytes& data) const;

  // Received chunks as wire records in index order, to carry a session over to a later run.
  std::vector<std::string> export_records() const;

private:
  bool complete_locked() const;

  mutable std::mutex mutex_;
  bool has_manifest_=false;
  BackupManifest manifest_;
  std::unordered_map<uint32_t,Bytes> received_;
  IngestStats stats_;
  bool assembled_=false;
};

} // namespace paperback
