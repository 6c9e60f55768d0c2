#include "chunk_codec.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace paperback {

const char* const kRecordVersion="PB2";

const char* parse_error_label(ParseError e){
  switch(e){
    case ParseError::None: return "none";
    case ParseError::Empty: return "empty record";
    case ParseError::FieldCount: return "wrong field count";
    case ParseError::UnsupportedVersion: return "unsupported version tag";
    case ParseError::BadIdentifier: return "bad identifier";
    case ParseError::BadHash: return "bad content hash";
    case ParseError::BadCount: return "bad chunk count";
    case ParseError::BadIndex: return "bad chunk index";
    case ParseError::IndexOutOfRange: return "chunk index out of range";
    case ParseError::BadLength: return "bad payload length";
    case ParseError::BadChecksum: return "bad payload check";
    case ParseError::BadPayload: return "bad payload encoding";
    case ParseError::PayloadTooLarge: return "payload too large";
    case ParseError::Truncated: return "payload truncated";
    case ParseError::ChecksumMismatch: return "payload check mismatch";
  }
  return "unknown";
}

std::vector<Chunk> split(const Bytes& data,uint32_t chunk_size){
  uint32_t count=chunk_count_for(data.size(),chunk_size);
  std::vector<Chunk> out(count);
  for(uint32_t i=0;i<count;i++){
    uint64_t off=(uint64_t)i*chunk_size, take=std::min<uint64_t>(chunk_size,data.size()-std::min<uint64_t>(off,data.size()));
    out[i].index=i;
    if(take>0) out[i].payload.assign(data.begin()+off,data.begin()+off+take);
  }
  return out;
}

std::string serialize(const Chunk& chunk,const BackupManifest& manifest){
  if(chunk.index>=manifest.chunk_count)
    throw std::out_of_range("chunk index "+std::to_string(chunk.index)+" beyond chunk count "+std::to_string(manifest.chunk_count));
  std::string s; s.reserve(max_record_length(manifest));
  s+=kRecordVersion; s+=kRecordSeparator;
  s+=base64_encode(manifest.identifier); s+=kRecordSeparator;
  s+=manifest.content_hash; s+=kRecordSeparator;
  s+=std::to_string(manifest.chunk_count); s+=kRecordSeparator;
  s+=std::to_string(chunk.index); s+=kRecordSeparator;
  s+=std::to_string(chunk.payload.size()); s+=kRecordSeparator;
  s+=payload_check(chunk.payload); s+=kRecordSeparator;
  s+=base64_encode(chunk.payload);
  return s;
}

size_t max_record_length(const BackupManifest& manifest){
  size_t digits=std::to_string(manifest.chunk_count).size();
  uint32_t payload=manifest.chunk_size? manifest.chunk_size : kMaxChunkSize;
  size_t length_digits=std::to_string(payload).size();
  return 3+1+base64_length(manifest.identifier.size())+1+64+1+digits+1+digits+1+
         length_digits+1+kPayloadCheckDigits+1+base64_length(payload);
}

std::string payload_check(const Bytes& payload){
  return sha256_hex(payload).substr(0,kPayloadCheckDigits);
}

static bool is_lower_hex(const std::string& s,size_t n){
  if(s.size()!=n) return false;
  for(char c: s) if(!((c>='0'&&c<='9')||(c>='a'&&c<='f'))) return false;
  return true;
}

static std::vector<std::string> split_fields(const std::string& s){
  std::vector<std::string> f; size_t start=0;
  for(;;){
    size_t p=s.find(kRecordSeparator,start);
    if(p==std::string::npos){ f.push_back(s.substr(start)); break; }
    f.push_back(s.substr(start,p-start)); start=p+1;
  }
  return f;
}

// plain decimal, no sign, at most 10 digits
static bool parse_decimal(const std::string& s,uint64_t& out){
  if(s.empty()||s.size()>10) return false;
  uint64_t v=0;
  for(char c: s){ if(c<'0'||c>'9') return false; v=v*10+(uint64_t)(c-'0'); }
  out=v; return true;
}

ParsedRecord deserialize(const std::string& text){
  ParsedRecord r;
  std::string s=text;
  if(!s.empty() && s.back()=='\n') s.pop_back();
  if(!s.empty() && s.back()=='\r') s.pop_back();
  if(s.empty()){ r.error=ParseError::Empty; return r; }

  std::vector<std::string> f=split_fields(s);
  if(f.size()!=kRecordFields){ r.error=ParseError::FieldCount; return r; }
  if(f[0]!=kRecordVersion){ r.error=ParseError::UnsupportedVersion; return r; }

  Bytes ident;
  if(!base64_decode(f[1],ident)){ r.error=ParseError::BadIdentifier; return r; }
  if(!is_sha256_hex(f[2])){ r.error=ParseError::BadHash; return r; }
  uint64_t count=0, index=0;
  if(!parse_decimal(f[3],count)||count==0||count>kMaxChunkCount){ r.error=ParseError::BadCount; return r; }
  if(!parse_decimal(f[4],index)){ r.error=ParseError::BadIndex; return r; }
  if(index>=count){ r.error=ParseError::IndexOutOfRange; return r; }
  uint64_t length=0;
  if(!parse_decimal(f[5],length)){ r.error=ParseError::BadLength; return r; }
  if(length>kMaxChunkSize||f[7].size()>base64_length(kMaxChunkSize)){ r.error=ParseError::PayloadTooLarge; return r; }
  if(!is_lower_hex(f[6],kPayloadCheckDigits)){ r.error=ParseError::BadChecksum; return r; }
  if(!base64_decode(f[7],r.chunk.payload)){ r.error=ParseError::BadPayload; return r; }
  if(r.chunk.payload.size()<length){ r.error=ParseError::Truncated; r.chunk.payload.clear(); return r; }
  if(r.chunk.payload.size()!=length||payload_check(r.chunk.payload)!=f[6]){
    r.error=ParseError::ChecksumMismatch; r.chunk.payload.clear(); return r;
  }

  std::string hash=f[2];
  for(auto& c: hash) c=(char)std::tolower((unsigned char)c);
  r.manifest.identifier.assign(ident.begin(),ident.end());
  r.manifest.content_hash=hash;
  r.manifest.chunk_count=(uint32_t)count;
  r.chunk.index=(uint32_t)index;
  return r;
}

} // namespace paperback
