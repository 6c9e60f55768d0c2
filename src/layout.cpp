#include "layout.hpp"
#include "errors.hpp"
#include "ui.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace paperback {

static const PageGeometry kA4={"A4",595.28,841.89,36.0,72.0};
static const PageGeometry kLetter={"Letter",612.0,792.0,36.0,72.0};

const PageGeometry& page_geometry(PageFormat format){
  return format==PageFormat::Letter? kLetter : kA4;
}

PageFormat parse_page_format(const std::string& name){
  std::string l=name;
  for(auto& c: l) c=(char)std::tolower((unsigned char)c);
  if(l=="a4") return PageFormat::A4;
  if(l=="letter") return PageFormat::Letter;
  throw InvalidConfig("unknown page format '"+name+"' (A4 or Letter)");
}

// byte-mode data capacity per version at ECC level M
static const unsigned kCapacityM[kMaxSymbolVersion]={
    14,  26,  42,  62,  84, 106, 122, 152, 180, 213,
   251, 287, 331, 362, 412, 450, 504, 560, 624, 666,
   711, 779, 857, 911, 997,1059,1125,1190,1264,1370,
  1452,1538,1628,1722,1809,1911,1989,2099,2213,2331
};

size_t symbol_capacity(unsigned version){
  if(version<1||version>kMaxSymbolVersion) return 0;
  return kCapacityM[version-1];
}

unsigned symbol_version_for(size_t record_length){
  for(unsigned v=1;v<=kMaxSymbolVersion;v++) if(kCapacityM[v-1]>=record_length) return v;
  return 0;
}

static SymbolSpec place_symbol(const PageGeometry& g,unsigned version){
  SymbolSpec s;
  s.version=version;
  s.modules=symbol_modules(version);
  double avail_w=g.width_pt-2*g.margin_pt;
  double avail_h=g.height_pt-2*g.margin_pt-g.caption_pt;
  s.box_pt=std::min(avail_w,avail_h);
  s.x_pt=(g.width_pt-s.box_pt)/2;
  s.y_pt=g.margin_pt+(avail_h-s.box_pt)/2;
  s.module_pt=s.box_pt/(s.modules+2*kQuietZoneModules);
  return s;
}

static std::string cover_caption(const BackupManifest& m){
  std::string c;
  c+="paperback backup\n";
  c+="Identifier: "+(m.identifier.empty()? std::string("(none)") : m.identifier)+"\n";
  c+="SHA-256: "+m.content_hash+"\n";
  c+="Size: "+std::to_string(m.total_length)+" bytes in "+std::to_string(m.chunk_count)+" chunk(s) of up to "+
     std::to_string(m.chunk_size)+" bytes\n";
  c+="Pages: "+std::to_string(m.chunk_count+1)+" (this cover, then one code per page)\n";
  c+="\n";
  c+="To restore: scan every code page, decode the codes to text (one record per line,\n";
  c+="e.g. zbarimg --raw), then run: paperback restore -o <file> <decoded files>\n";
  c+="Pages may be scanned in any order; missing pages are listed by page number.";
  return c;
}

std::vector<PageSpec> plan(const BackupManifest& manifest,const std::vector<Chunk>& chunks,PageFormat format){
  if(chunks.size()!=manifest.chunk_count)
    throw InvalidConfig("layout needs "+std::to_string(manifest.chunk_count)+" chunks, got "+std::to_string(chunks.size()));
  size_t need=max_record_length(manifest);
  unsigned version=symbol_version_for(need);
  if(version==0)
    throw InvalidConfig("records of "+std::to_string(need)+" characters exceed the largest code ("+
                        std::to_string(symbol_capacity(kMaxSymbolVersion))+"); shorten the identifier or lower the chunk size");
  const PageGeometry& g=page_geometry(format);
  SymbolSpec sym=place_symbol(g,version);
  if(version>30){
    char mod[32]; std::snprintf(mod,sizeof(mod),"%.2f",sym.module_pt);
    ui::warn("dense codes (version "+std::to_string(version)+", "+mod+" pt modules); print and scan at 300 dpi or better");
  }

  std::vector<PageSpec> pages(manifest.chunk_count+1);
  pages[0].page_number=kCoverPage;
  pages[0].caption=cover_caption(manifest);
  for(const auto& ch: chunks){
    if(ch.index>=manifest.chunk_count) throw InvalidConfig("chunk index "+std::to_string(ch.index)+" out of range");
    PageSpec& p=pages[ch.index+1];
    if(p.has_payload) throw InvalidConfig("chunk index "+std::to_string(ch.index)+" appears twice");
    p.page_number=page_for_chunk(ch.index);
    p.caption="chunk "+std::to_string(ch.index+1)+" of "+std::to_string(manifest.chunk_count);
    if(!manifest.identifier.empty()) p.caption+="\n"+manifest.identifier;
    p.has_payload=true;
    p.payload=serialize(ch,manifest);
    p.symbol=sym;
  }
  return pages;
}

} // namespace paperback
