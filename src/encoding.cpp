#include "encoding.hpp"
#include <cctype>
#include <stdexcept>
#include <openssl/evp.h>

namespace paperback {

Bytes sha256(const Bytes& data){
  Bytes md(EVP_MAX_MD_SIZE); unsigned int len=0;
  if(EVP_Digest(data.data(),data.size(),md.data(),&len,EVP_sha256(),nullptr)!=1)
    throw std::runtime_error("EVP_Digest(sha256) failed");
  md.resize(len); return md;
}
std::string sha256_hex(const Bytes& data){ return to_hex(sha256(data)); }

std::string to_hex(const Bytes& data){
  static const char* hx="0123456789abcdef";
  std::string out; out.reserve(data.size()*2);
  for(unsigned char b: data){ out.push_back(hx[b>>4]); out.push_back(hx[b&15]); }
  return out;
}
bool is_sha256_hex(const std::string& s){
  if(s.size()!=64) return false;
  for(char c: s) if(!std::isxdigit((unsigned char)c)) return false;
  return true;
}

std::string base64_encode(const unsigned char* p,size_t n){
  if(n==0) return std::string();
  std::string out(base64_length(n)+1,'\0');
  int len=EVP_EncodeBlock((unsigned char*)&out[0],p,(int)n);
  if(len<0) throw std::runtime_error("EVP_EncodeBlock failed");
  out.resize((size_t)len); return out;
}

static bool b64_char(char c){
  return (c>='A'&&c<='Z')||(c>='a'&&c<='z')||(c>='0'&&c<='9')||c=='+'||c=='/';
}
bool base64_decode(const std::string& s,Bytes& out){
  out.clear();
  if(s.empty()) return true;
  if(s.size()%4!=0) return false;
  size_t pad=0;
  if(s[s.size()-1]=='='){ pad=1; if(s[s.size()-2]=='=') pad=2; }
  for(size_t i=0;i<s.size()-pad;i++) if(!b64_char(s[i])) return false;
  // EVP_DecodeBlock counts padding as zero bytes
  out.resize(s.size()/4*3);
  int n=EVP_DecodeBlock(out.data(),(const unsigned char*)s.data(),(int)s.size());
  if(n<0||(size_t)n<pad){ out.clear(); return false; }
  out.resize((size_t)n-pad); return true;
}

} // namespace paperback
