#pragma once
#include <cstdio>
#include <cstdlib>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>
#include "chunk_codec.hpp"
#include "encoding.hpp"
#include "io.hpp"

namespace testutil {

inline paperback::Bytes bytes_of(const std::string& s){ return paperback::Bytes(s.begin(),s.end()); }

inline paperback::Bytes random_bytes(size_t n,unsigned seed){
  std::mt19937 rng(seed);
  paperback::Bytes out(n);
  for(auto& b: out) b=(unsigned char)(rng()&0xFF);
  return out;
}

// Wire records for every chunk of data.
inline std::vector<std::string> records_for(const paperback::Bytes& data,const std::string& identifier,uint32_t chunk_size){
  paperback::BackupManifest m=paperback::BackupManifest::from_data(data,identifier,chunk_size);
  std::vector<std::string> out;
  for(const auto& c: paperback::split(data,chunk_size)) out.push_back(paperback::serialize(c,m));
  return out;
}

inline std::string join_fields(const std::vector<std::string>& f){
  std::string s;
  for(size_t i=0;i<f.size();++i){ if(i) s+="|"; s+=f[i]; }
  return s;
}

// Scratch directory removed with everything written through path().
class TempDir {
public:
  TempDir(){
    char tmpl[]="/tmp/paperback_test_XXXXXX";
    if(!mkdtemp(tmpl)) throw std::runtime_error("mkdtemp failed");
    dir_=tmpl;
  }
  ~TempDir(){
    for(const auto& f: files_) std::remove(f.c_str());
    ::rmdir(dir_.c_str());
  }
  TempDir(const TempDir&)=delete;
  TempDir& operator=(const TempDir&)=delete;

  std::string path(const std::string& name){ std::string p=dir_+"/"+name; files_.push_back(p); return p; }
  std::string write(const std::string& name,const std::string& content){
    std::string p=path(name);
    paperback::write_file(p,paperback::Bytes(content.begin(),content.end()));
    return p;
  }

private:
  std::string dir_;
  std::vector<std::string> files_;
};

} // namespace testutil
