#include "paperback.hpp"

namespace paperback {

Backup make_backup(const Bytes& data,const std::string& identifier,uint32_t chunk_size,PageFormat format){
  Backup b;
  b.manifest=BackupManifest::from_data(data,identifier,chunk_size);
  b.chunks=split(data,chunk_size);
  b.pages=plan(b.manifest,b.chunks,format);
  return b;
}

std::vector<PageSpec> encode(const Bytes& data,const std::string& identifier,uint32_t chunk_size,PageFormat format){
  return make_backup(data,identifier,chunk_size,format).pages;
}

std::unique_ptr<ReconstructionSession> new_session(){
  return std::unique_ptr<ReconstructionSession>(new ReconstructionSession());
}

} // namespace paperback
