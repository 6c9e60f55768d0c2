#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "session.hpp"

namespace paperback {

/* process exit codes of the paperback tool */
const int kExitOk=0;
const int kExitUsage=1;
const int kExitError=2;        // any exception: I/O, bad configuration
const int kExitIncomplete=3;   // no valid record, or chunks still missing
const int kExitIntegrity=4;    // all chunks present but the content hash disagrees

enum class RestoreStatus { Restored, NoRecords, Incomplete, IntegrityFailure };

struct RestoreResult {
  RestoreStatus status=RestoreStatus::NoRecords;
  std::vector<uint32_t> missing;     // chunk indices, Incomplete only
  size_t bytes_written=0;
  std::string message;               // user-facing, one or two lines
};

// Printed page numbers of missing chunks, comma separated: {1,3} -> "3,5".
std::string rescan_pages(const std::vector<uint32_t>& missing);

// Feeds records saved by save_state() back into a session. A missing file contributes nothing.
IngestStats load_state(ReconstructionSession& session,const std::string& path);
void save_state(const ReconstructionSession& session,const std::string& path);

/*
 * Final step of a restore run. Writes the assembled bytes to output once every
 * chunk is present, also when the content hash does not match, so a damaged
 * backup still yields whatever could be read. Nothing is written otherwise.
 */
RestoreResult finish_restore(ReconstructionSession& session,const std::string& output);

int exit_code_for(RestoreStatus status);

} // namespace paperback
