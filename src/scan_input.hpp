#pragma once
#include <string>
#include <vector>
#include "encoding.hpp"
#include "session.hpp"

namespace paperback {

// Decoder output: one candidate record per non-empty line.
std::vector<std::string> records_from_text(const Bytes& buf);

/*
 * Candidate record strings found in one scan input:
 *  - PDF written by paperback: its embedded record streams
 *  - text (e.g. zbarimg --raw output): one per line
 *  - anything binary (a raw image): nothing, no optical decoder is attached
 * Throws std::runtime_error when the file cannot be read.
 */
std::vector<std::string> extract_records(const std::string& path);

// Extracts every file on up to `threads` workers (0 = hardware concurrency) and
// feeds all records into the shared session. Unreadable files are reported and skipped.
IngestStats ingest_files(ReconstructionSession& session,const std::vector<std::string>& paths,unsigned threads);

} // namespace paperback
