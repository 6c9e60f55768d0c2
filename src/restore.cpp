#include "restore.hpp"
#include "io.hpp"
#include "layout.hpp"
#include "ui.hpp"

namespace paperback {

std::string rescan_pages(const std::vector<uint32_t>& missing){
  std::string s;
  for(size_t i=0;i<missing.size();++i){ if(i) s+=","; s+=std::to_string(page_for_chunk(missing[i])); }
  return s;
}

IngestStats load_state(ReconstructionSession& session,const std::string& path){
  IngestStats st;
  for(const auto& r: read_lines(path)) st.add(session.ingest(r));
  if(st.malformed) ui::warn(path+": "+std::to_string(st.malformed)+" unreadable line(s) in saved state");
  return st;
}

void save_state(const ReconstructionSession& session,const std::string& path){
  write_lines(path,session.export_records());
  ui::debug("session saved to "+path);
}

RestoreResult finish_restore(ReconstructionSession& session,const std::string& output){
  RestoreResult res;
  MissingChunks missing=session.missing_indices();
  if(missing.unknown()){
    res.status=RestoreStatus::NoRecords;
    res.message="No valid codes found. Check the scan files, or rescan the pages with a higher quality setting.";
    return res;
  }
  if(!missing.indices.empty()){
    res.status=RestoreStatus::Incomplete;
    res.missing=missing.indices;
    res.message="The backup could not be restored completely. Page(s) "+rescan_pages(missing.indices)+" must be rescanned.";
    return res;
  }

  Bytes data=session.assemble();
  bool intact=session.verify(data);
  write_file(output,data);
  res.bytes_written=data.size();
  std::string id=session.manifest().identifier;
  if(!intact){
    res.status=RestoreStatus::IntegrityFailure;
    res.message="Backup of '"+id+"' was restored, but its SHA-256 does not match (hash mismatch).\n"
                "  The file was saved but is probably corrupt. Rescan all pages into a fresh folder and try again.";
    return res;
  }
  res.status=RestoreStatus::Restored;
  res.message="backup of '"+id+"' restored completely ("+std::to_string(data.size())+" bytes)";
  return res;
}

int exit_code_for(RestoreStatus status){
  switch(status){
    case RestoreStatus::Restored: return kExitOk;
    case RestoreStatus::NoRecords: return kExitIncomplete;
    case RestoreStatus::Incomplete: return kExitIncomplete;
    case RestoreStatus::IntegrityFailure: return kExitIntegrity;
  }
  return kExitError;
}

} // namespace paperback
