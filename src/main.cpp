// paperback - prints a file as a cover page plus one optical code per page, and restores it from scans in any order.
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>
#include "io.hpp"
#include "paperback.hpp"
#include "pdf.hpp"
#include "restore.hpp"
#include "scan_input.hpp"
#include "ui.hpp"

using namespace paperback;

namespace {

struct EncodeOptions{
  std::string input;                  // empty: stdin
  std::string output="backup.pdf";
  std::string folder;
  std::string identifier;
  std::string records_file;
  PageFormat format=PageFormat::A4;
  uint32_t chunk_size=kDefaultChunkSize;
  bool force_stdin=false;
};

struct RestoreOptions{
  std::vector<std::string> scans;
  std::string output;
  std::string state_file;
  unsigned threads=0;
};

void usage(const char* argv0){
  std::cerr<<"paperback "<<PAPERBACK_VERSION<<"\n"
           <<"Usage:\n"
           <<"  "<<argv0<<" encode [-o <out.pdf>] [-f <input>] [--id <text>] [--format <A4|Letter>] [-b <50-1500>]\n"
           <<"         [--records <file>] [--folder <DIR>] [--force-from-stdin] [--quiet] [--verbose]\n"
           <<"  "<<argv0<<" restore -o <out_file> [--state <file>] [--threads <n>] [--quiet] [--verbose] [scan ...]\n"
           <<"  "<<argv0<<" inspect [--verbose] <scan> [scan ...]\n"
           <<"Scans are paperback PDFs or text files with one decoded record per line.\n"
           <<"restore needs at least one scan unless --state names saved progress.\n";
}

std::string stats_line(const IngestStats& st){
  return std::to_string(st.accepted)+" accepted, "+std::to_string(st.duplicate)+" duplicate, "+
         std::to_string(st.rejected)+" from another backup, "+std::to_string(st.malformed)+" unreadable";
}

/* encode */
int encode_cmd(const EncodeOptions& o){
  ui::banner();
  ui::step("reading input");
  Bytes data;
  if(!o.input.empty()) data=read_file(o.input);
  else data=read_stream_stdin();
  if(!ui::quiet) std::cerr<<"   size: "<<data.size()<<" bytes\n";

  Backup b=make_backup(data,o.identifier,o.chunk_size,o.format);
  ui::ok("sha256 "+b.manifest.content_hash);
  ui::step(std::to_string(b.manifest.chunk_count)+" chunk(s) of "+std::to_string(o.chunk_size)+" bytes, code version "+
           std::to_string(b.pages.size()>1? b.pages[1].symbol.version : 0));

  std::string out=o.output;
  if(out.size()<4||out.substr(out.size()-4)!=".pdf") out+=".pdf";
  if(!o.folder.empty()){ ensure_dir(o.folder); out=join2(o.folder,out); }

  ui::step("writing "+out+" ("+std::to_string(b.pages.size())+" pages, "+page_geometry(o.format).name+")");
  write_pdf(out,b.pages,o.format,nullptr);

  if(!o.records_file.empty()){
    std::vector<std::string> recs;
    for(size_t i=1;i<b.pages.size();++i) recs.push_back(b.pages[i].payload);
    write_lines(o.records_file,recs);
    ui::ok("records written to "+o.records_file);
  }
  ui::ok("saved backup as '"+out+"'");
  return kExitOk;
}

void report_manifest(const ReconstructionSession& s){
  BackupManifest m=s.manifest();
  ui::ok("backup '"+m.identifier+"' sha256 "+m.content_hash+", "+std::to_string(m.chunk_count)+" chunk(s)");
}

/* restore */
int restore_cmd(const RestoreOptions& o){
  ui::banner();
  std::unique_ptr<ReconstructionSession> session=new_session();

  if(!o.state_file.empty()){
    IngestStats prev=load_state(*session,o.state_file);
    if(prev.accepted) ui::step("resumed "+std::to_string(prev.accepted)+" chunk(s) from "+o.state_file);
  }

  if(!o.scans.empty()){
    ui::step("reading "+std::to_string(o.scans.size())+" scan file(s)");
    IngestStats st=ingest_files(*session,o.scans,o.threads);
    ui::step(stats_line(st));
    if(st.rejected) ui::warn(std::to_string(st.rejected)+" record(s) belong to a different backup and were ignored");
  }
  if(!o.state_file.empty()) save_state(*session,o.state_file);

  if(session->has_manifest()) report_manifest(*session);
  RestoreResult res=finish_restore(*session,o.output);
  if(res.status==RestoreStatus::Restored||res.status==RestoreStatus::IntegrityFailure) ui::step("wrote "+o.output);
  if(res.status==RestoreStatus::Restored) ui::ok(res.message);
  else ui::fail(res.message);
  if(res.status==RestoreStatus::Incomplete && !o.state_file.empty())
    ui::step("progress kept in "+o.state_file+"; rerun with the new scans");
  return exit_code_for(res.status);
}

/* inspect */
int inspect_cmd(const RestoreOptions& o){
  std::unique_ptr<ReconstructionSession> session=new_session();
  IngestStats st=ingest_files(*session,o.scans,o.threads);
  std::cout<<"records: "<<stats_line(st)<<"\n";
  MissingChunks missing=session->missing_indices();
  if(missing.unknown()){ std::cout<<"backup: unknown (no valid record)\n"; return kExitIncomplete; }
  BackupManifest m=session->manifest();
  std::cout<<"identifier: "<<m.identifier<<"\n"
           <<"sha256: "<<m.content_hash<<"\n"
           <<"chunks: "<<session->received_count()<<" of "<<m.chunk_count<<"\n";
  if(m.chunk_size) std::cout<<"chunk size: "<<m.chunk_size<<"\n";
  if(!missing.indices.empty()) std::cout<<"missing pages: "<<rescan_pages(missing.indices)<<"\n";
  return missing.indices.empty()? kExitOk : kExitIncomplete;
}

bool parse_uint(const char* s,unsigned long& out){
  char* e=nullptr; out=std::strtoul(s,&e,10);
  return e!=s && *e=='\0';
}

} // namespace

int main(int argc,char** argv){
  try{
    if(argc<2){ usage(argv[0]); return kExitUsage; }
    std::string mode=argv[1];
    EncodeOptions enc; RestoreOptions res;
    int i=2;

    while(i<argc){
      std::string a=argv[i];
      auto value=[&](std::string& dst)->bool{ if(i+1>=argc) return false; dst=argv[++i]; ++i; return true; };
      std::string v;
      if(a=="-o"){ if(!value(v)){ usage(argv[0]); return kExitUsage; } enc.output=v; res.output=v; continue; }
      if(a=="-f"){ if(!value(enc.input)){ usage(argv[0]); return kExitUsage; } continue; }
      if(a=="--id"||a=="-id"){ if(!value(enc.identifier)){ usage(argv[0]); return kExitUsage; } continue; }
      if(a=="--format"){ if(!value(v)){ usage(argv[0]); return kExitUsage; } enc.format=parse_page_format(v); continue; }
      if(a=="-b"){ if(!value(v)){ usage(argv[0]); return kExitUsage; } enc.chunk_size=parse_chunk_size(v); continue; }
      if(a=="--records"){ if(!value(enc.records_file)){ usage(argv[0]); return kExitUsage; } continue; }
      if(a=="--folder"){ if(!value(enc.folder)){ usage(argv[0]); return kExitUsage; } continue; }
      if(a=="--force-from-stdin"){ enc.force_stdin=true; ++i; continue; }
      if(a=="--state"){ if(!value(res.state_file)){ usage(argv[0]); return kExitUsage; } continue; }
      if(a=="--threads"){
        unsigned long n=0;
        if(!value(v)||!parse_uint(v.c_str(),n)||n>1024){ usage(argv[0]); return kExitUsage; }
        res.threads=(unsigned)n; continue;
      }
      if(a=="--quiet"){ ui::quiet=true; ++i; continue; }
      if(a=="--verbose"){ ui::verbose=true; ++i; continue; }
      if(a=="-h"||a=="--help"){ usage(argv[0]); return kExitOk; }
      if(a.size()>1 && a[0]=='-'){ ui::fail("unknown option "+a); usage(argv[0]); return kExitUsage; }
      res.scans.push_back(a); ++i;
    }

    if(mode=="encode"){
      if(!res.scans.empty()){ usage(argv[0]); return kExitUsage; }
      if(enc.input.empty() && isatty(0) && !enc.force_stdin){ usage(argv[0]); return kExitUsage; }
      return encode_cmd(enc);
    }else if(mode=="restore"){
      if((res.scans.empty()&&res.state_file.empty())||res.output.empty()){ usage(argv[0]); return kExitUsage; }
      return restore_cmd(res);
    }else if(mode=="inspect"){
      if(res.scans.empty()){ usage(argv[0]); return kExitUsage; }
      return inspect_cmd(res);
    }
    usage(argv[0]); return kExitUsage;
  }catch(const std::exception& e){
    ui::fail(e.what()); return kExitError;
  }
}
