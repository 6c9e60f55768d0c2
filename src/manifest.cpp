#include "manifest.hpp"
#include "errors.hpp"

namespace paperback {

bool valid_chunk_size(uint32_t chunk_size){
  return chunk_size>=kMinChunkSize && chunk_size<=kMaxChunkSize && chunk_size%kChunkSizeStep==0;
}

void validate_chunk_size(uint32_t chunk_size){
  if(!valid_chunk_size(chunk_size))
    throw InvalidConfig("chunk size "+std::to_string(chunk_size)+" must be a multiple of "+std::to_string(kChunkSizeStep)+
                        " between "+std::to_string(kMinChunkSize)+" and "+std::to_string(kMaxChunkSize));
}

uint32_t parse_chunk_size(const std::string& text){
  uint64_t v=0;
  bool digits=!text.empty() && text.size()<=10;
  for(char c: text){ if(c<'0'||c>'9'){ digits=false; break; } v=v*10+(uint64_t)(c-'0'); }
  if(!digits||v>kMaxChunkSize) throw InvalidConfig("chunk size '"+text+"' must be a multiple of "+std::to_string(kChunkSizeStep)+
                                                   " between "+std::to_string(kMinChunkSize)+" and "+std::to_string(kMaxChunkSize));
  validate_chunk_size((uint32_t)v);
  return (uint32_t)v;
}

uint32_t chunk_count_for(uint64_t total_length,uint32_t chunk_size){
  validate_chunk_size(chunk_size);
  if(total_length==0) return 1;
  uint64_t n=(total_length+chunk_size-1)/chunk_size;
  if(n>kMaxChunkCount) throw InvalidConfig("input too large: "+std::to_string(total_length)+" bytes needs more than "+
                                           std::to_string(kMaxChunkCount)+" chunks");
  return (uint32_t)n;
}

BackupManifest BackupManifest::from_data(const Bytes& data,const std::string& identifier,uint32_t chunk_size){
  BackupManifest m;
  m.chunk_count=chunk_count_for(data.size(),chunk_size);
  m.identifier=identifier;
  m.content_hash=sha256_hex(data);
  m.total_length=data.size();
  m.chunk_size=chunk_size;
  return m;
}

bool BackupManifest::matches(const BackupManifest& other) const {
  return identifier==other.identifier && content_hash==other.content_hash && chunk_count==other.chunk_count;
}

} // namespace paperback
