#include "session.hpp"
#include "errors.hpp"
#include "ui.hpp"
#include <stdexcept>
#include <utility>

namespace paperback {

const char* ingest_status_label(IngestStatus s){
  switch(s){
    case IngestStatus::Accepted: return "accepted";
    case IngestStatus::Duplicate: return "duplicate";
    case IngestStatus::Rejected: return "rejected";
    case IngestStatus::Malformed: return "malformed";
  }
  return "unknown";
}

void IngestStats::add(const IngestOutcome& o){
  switch(o.status){
    case IngestStatus::Accepted: accepted++; break;
    case IngestStatus::Duplicate: duplicate++; break;
    case IngestStatus::Rejected: rejected++; break;
    case IngestStatus::Malformed: malformed++; break;
  }
}
IngestStats& IngestStats::operator+=(const IngestStats& o){
  accepted+=o.accepted; duplicate+=o.duplicate; rejected+=o.rejected; malformed+=o.malformed;
  return *this;
}

IngestOutcome ReconstructionSession::ingest(const std::string& text){
  IngestOutcome out;
  ParsedRecord rec=deserialize(text);

  std::lock_guard<std::mutex> lock(mutex_);
  if(!rec.ok()){
    out.status=IngestStatus::Malformed; out.parse_error=rec.error;
    stats_.add(out);
    ui::debug(std::string("malformed record: ")+parse_error_label(rec.error));
    return out;
  }
  out.index=rec.chunk.index;
  if(assembled_) ui::debug("record "+std::to_string(out.index)+" arrived after assembly");

  if(!has_manifest_){
    manifest_=rec.manifest; has_manifest_=true;
    ui::debug("backup '"+manifest_.identifier+"' "+manifest_.content_hash+", "+std::to_string(manifest_.chunk_count)+" chunk(s)");
  }else if(!manifest_.matches(rec.manifest)){
    out.status=IngestStatus::Rejected; out.reason=RejectReason::MismatchedBackup;
    stats_.add(out);
    ui::debug("record "+std::to_string(out.index)+" belongs to another backup ('"+rec.manifest.identifier+"'), ignored");
    return out;
  }

  auto it=received_.find(rec.chunk.index);
  if(it!=received_.end() && it->second==rec.chunk.payload){
    out.status=IngestStatus::Duplicate;
    stats_.add(out);
    ui::debug("record "+std::to_string(out.index)+": "+ingest_status_label(out.status));
    return out;
  }
  if(it!=received_.end()) ui::debug("chunk "+std::to_string(out.index)+" rescanned with different content, replacing");
  if(manifest_.chunk_size==0 && rec.chunk.index+1<manifest_.chunk_count)
    manifest_.chunk_size=(uint32_t)rec.chunk.payload.size();
  received_[rec.chunk.index]=std::move(rec.chunk.payload);
  out.status=IngestStatus::Accepted;
  stats_.add(out);
  return out;
}

bool ReconstructionSession::has_manifest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return has_manifest_;
}

BackupManifest ReconstructionSession::manifest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!has_manifest_) throw std::runtime_error("no valid record ingested yet");
  BackupManifest m=manifest_;
  if(complete_locked()){
    m.total_length=0;
    for(const auto& kv: received_) m.total_length+=kv.second.size();
  }
  return m;
}

bool ReconstructionSession::complete_locked() const {
  // keys are always < chunk_count, so a full map covers every index
  return has_manifest_ && received_.size()==manifest_.chunk_count;
}

bool ReconstructionSession::is_complete() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return complete_locked();
}

MissingChunks ReconstructionSession::missing_indices() const {
  std::lock_guard<std::mutex> lock(mutex_);
  MissingChunks m;
  if(!has_manifest_) return m;
  m.known=true;
  for(uint32_t i=0;i<manifest_.chunk_count;i++)
    if(received_.find(i)==received_.end()) m.indices.push_back(i);
  return m;
}

size_t ReconstructionSession::received_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return received_.size();
}

IngestStats ReconstructionSession::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

Bytes ReconstructionSession::assemble(){
  std::lock_guard<std::mutex> lock(mutex_);
  if(!complete_locked()){
    if(!has_manifest_) throw IncompleteError("cannot assemble: no valid record ingested yet",0);
    size_t missing=manifest_.chunk_count-received_.size();
    throw IncompleteError("cannot assemble: "+std::to_string(missing)+" of "+std::to_string(manifest_.chunk_count)+
                          " chunk(s) missing",missing);
  }
  Bytes out;
  for(uint32_t i=0;i<manifest_.chunk_count;i++){
    const Bytes& p=received_.at(i);
    out.insert(out.end(),p.begin(),p.end());
  }
  manifest_.total_length=out.size();
  assembled_=true;
  return out;
}

bool ReconstructionSession::assembled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return assembled_;
}

bool ReconstructionSession::verify(const Bytes& data) const {
  std::string want;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(!has_manifest_) return false;
    want=manifest_.content_hash;
  }
  return sha256_hex(data)==want;
}

std::vector<std::string> ReconstructionSession::export_records() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  if(!has_manifest_) return out;
  for(uint32_t i=0;i<manifest_.chunk_count;i++){
    auto it=received_.find(i);
    if(it==received_.end()) continue;
    Chunk c; c.index=i; c.payload=it->second;
    out.push_back(serialize(c,manifest_));
  }
  return out;
}

} // namespace paperback
