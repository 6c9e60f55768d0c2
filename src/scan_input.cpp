#include "scan_input.hpp"
#include "io.hpp"
#include "pdf.hpp"
#include "ui.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <system_error>
#include <thread>

namespace paperback {

std::vector<std::string> records_from_text(const Bytes& buf){
  std::vector<std::string> out; std::string cur;
  for(unsigned char c: buf){
    if(c=='\n'||c=='\r'){ if(!cur.empty()) out.push_back(cur); cur.clear(); }
    else cur.push_back((char)c);
  }
  if(!cur.empty()) out.push_back(cur);
  return out;
}

std::vector<std::string> extract_records(const std::string& path){
  Bytes buf=read_file(path);
  if(looks_like_pdf(buf)){
    std::vector<std::string> recs=read_records_from_pdf(buf);
    if(recs.empty()) ui::warn(path+": PDF without embedded records (scan its pages and decode them instead)");
    return recs;
  }
  if(std::find(buf.begin(),buf.end(),(unsigned char)0)!=buf.end()){
    ui::warn(path+": binary file skipped; decode the codes externally (e.g. zbarimg --raw) and pass the text");
    return std::vector<std::string>();
  }
  return records_from_text(buf);
}

IngestStats ingest_files(ReconstructionSession& session,const std::vector<std::string>& paths,unsigned threads){
  IngestStats total;
  if(paths.empty()) return total;
  if(threads==0) threads=std::max(1u,std::thread::hardware_concurrency());
  threads=std::min<unsigned>(threads,(unsigned)paths.size());

  std::atomic<size_t> next(0);
  std::mutex total_mutex;
  auto worker=[&](){
    IngestStats local;
    for(;;){
      size_t i=next.fetch_add(1);
      if(i>=paths.size()) break;
      std::vector<std::string> recs;
      try{
        recs=extract_records(paths[i]);
      }catch(const std::exception& e){
        ui::warn(std::string(e.what())+", skipped");
        continue;
      }
      IngestStats file;
      for(const auto& r: recs) file.add(session.ingest(r));
      ui::debug(paths[i]+": "+std::to_string(file.accepted)+" accepted, "+std::to_string(file.duplicate)+" duplicate, "+
                std::to_string(file.rejected)+" rejected, "+std::to_string(file.malformed)+" malformed");
      local+=file;
    }
    std::lock_guard<std::mutex> lock(total_mutex);
    total+=local;
  };

  std::vector<std::thread> pool;
  pool.reserve(threads);
  try{
    for(unsigned t=1;t<threads;++t) pool.emplace_back(worker);
  }catch(const std::system_error& e){
    // the started workers and this thread still drain the whole queue
    ui::warn(std::string("started ")+std::to_string(pool.size()+1)+" of "+std::to_string(threads)+" decode threads: "+e.what());
  }
  worker();
  for(auto& th: pool) th.join();
  return total;
}

} // namespace paperback
