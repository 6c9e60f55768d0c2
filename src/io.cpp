#include "io.hpp"
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <sys/stat.h>
#include <sys/types.h>

namespace paperback {

std::vector<unsigned char> read_file(const std::string& path){
  std::ifstream f(path,std::ios::binary); if(!f) throw std::runtime_error("Cannot open: "+path);
  return std::vector<unsigned char>((std::istreambuf_iterator<char>(f)),std::istreambuf_iterator<char>());
}
void write_file(const std::string& path,const std::vector<unsigned char>& data){
  std::ofstream f(path,std::ios::binary); if(!f) throw std::runtime_error("Cannot write: "+path);
  f.write((const char*)data.data(),(std::streamsize)data.size());
  if(!f) throw std::runtime_error("Write failed: "+path);
}
std::vector<unsigned char> read_stream_stdin(){
  std::vector<unsigned char> out; unsigned char b[1<<16];
  for(;;){
    size_t n=std::fread(b,1,sizeof(b),stdin); if(n>0) out.insert(out.end(),b,b+n);
    if(n<sizeof(b)){ if(std::feof(stdin)) break; if(std::ferror(stdin)) throw std::runtime_error("stdin read error"); }
  }
  return out;
}

std::vector<std::string> read_lines(const std::string& path){
  std::vector<std::string> lines;
  std::ifstream f(path,std::ios::binary); if(!f) return lines;
  std::string s;
  while(std::getline(f,s)){
    while(!s.empty() && (s.back()=='\r'||s.back()=='\n')) s.pop_back();
    if(!s.empty()) lines.push_back(s);
  }
  return lines;
}
void write_lines(const std::string& path,const std::vector<std::string>& lines){
  std::ofstream f(path,std::ios::binary|std::ios::trunc); if(!f) throw std::runtime_error("Cannot write: "+path);
  for(const auto& l: lines) f<<l<<"\n";
  if(!f) throw std::runtime_error("Write failed: "+path);
}

/* path helpers */
static bool is_dir(const std::string& p){ struct stat st{}; return (stat(p.c_str(),&st)==0)&&S_ISDIR(st.st_mode); }
void ensure_dir(const std::string& dir){
  if(dir.empty() || dir==".") return;
  if(is_dir(dir)) return;
  if(::mkdir(dir.c_str(),0775)!=0){
    // -p style
    std::string cur;
    for(size_t i=0;i<dir.size();++i){
      if(dir[i]=='/'){ if(!cur.empty() && !is_dir(cur)) ::mkdir(cur.c_str(),0775); }
      cur.push_back(dir[i]);
    }
    if(!is_dir(dir) && ::mkdir(dir.c_str(),0775)!=0 && errno!=EEXIST)
      throw std::runtime_error("Cannot create folder: "+dir);
  }
}
std::string join2(const std::string& a,const std::string& b){
  if(a.empty()||a==".") return b;
  if(a.back()=='/') return a+b;
  return a+"/"+b;
}

} // namespace paperback
