#include "pdf.hpp"
#include "io.hpp"
#include "ui.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace paperback {

static const std::string kRecordType="/Type /PaperbackRecord";

/* object writer */
struct PdfBuf{
  std::vector<unsigned char> b; std::vector<size_t> xref;
  void put(const std::string& s){ b.insert(b.end(),s.begin(),s.end()); }
  size_t off() const { return b.size(); }
  void obj(unsigned num){ xref[num]=off(); put(std::to_string(num)+" 0 obj\n"); }
  void stream(const std::string& dict_extra,const std::string& data){
    put("<< "+dict_extra+"/Length "+std::to_string(data.size())+" >>\nstream\n"); put(data); put("\nendstream\nendobj\n");
  }
};

static std::string num(double v){ char buf[32]; std::snprintf(buf,sizeof(buf),"%.3f",v); return buf; }

// PDF literal string body; the base fonts only cover printable ASCII here
static std::string pdf_text(const std::string& s){
  std::string o;
  for(unsigned char c: s){
    if(c=='('||c==')'||c=='\\'){ o.push_back('\\'); o.push_back((char)c); }
    else if(c<32||c>126) o.push_back('?');
    else o.push_back((char)c);
  }
  return o;
}

static std::vector<std::string> split_lines(const std::string& s){
  std::vector<std::string> out; size_t start=0;
  for(;;){
    size_t p=s.find('\n',start);
    if(p==std::string::npos){ out.push_back(s.substr(start)); break; }
    out.push_back(s.substr(start,p-start)); start=p+1;
  }
  return out;
}

static void text_line(std::string& cs,const char* font,double fs,double x,double y,const std::string& s){
  cs+="BT /"+std::string(font)+" "+num(fs)+" Tf "+num(x)+" "+num(y)+" Td ("+pdf_text(s)+") Tj ET\n";
}

static void caption_ops(std::string& cs,const PageGeometry& g,const PageSpec& p){
  double fs=p.has_payload? 12 : 11;
  double y=g.height_pt-g.margin_pt-fs;
  for(const auto& l: split_lines(p.caption)){ text_line(cs,"F1",fs,g.margin_pt,y,l); y-=fs*1.4; }
  text_line(cs,"F1",8,g.margin_pt,g.margin_pt/2,"page "+std::to_string(p.page_number));
}

static void module_ops(std::string& cs,const SymbolSpec& sym,const std::vector<unsigned char>& mods,unsigned side){
  double m=sym.box_pt/(side+2*kQuietZoneModules);
  double x0=sym.x_pt+kQuietZoneModules*m, top=sym.y_pt+sym.box_pt-kQuietZoneModules*m;
  cs+="q\n0 0 0 rg\n";
  for(unsigned r=0;r<side;r++){
    unsigned c=0;
    while(c<side){
      if(!mods[(size_t)r*side+c]){ c++; continue; }
      unsigned e=c; while(e<side && mods[(size_t)r*side+e]) e++;
      // one rectangle per horizontal run of dark modules
      cs+=num(x0+c*m)+" "+num(top-(r+1)*m)+" "+num((e-c)*m)+" "+num(m)+" re\n";
      c=e;
    }
  }
  cs+="f\nQ\n";
}

// Courier glyphs are 0.6 em wide; pick the largest size whose wrapped block fits the box.
static void text_block_ops(std::string& cs,const SymbolSpec& sym,const std::string& payload){
  double fs=9; size_t cpl=1;
  for(; fs>3; fs-=0.5){
    cpl=std::max<size_t>(1,(size_t)std::floor(sym.box_pt/(0.6*fs)));
    size_t lines=(payload.size()+cpl-1)/cpl;
    if(lines*fs*1.2<=sym.box_pt) break;
  }
  cpl=std::max<size_t>(1,(size_t)std::floor(sym.box_pt/(0.6*fs)));
  cs+="q\n0.5 w "+num(sym.x_pt)+" "+num(sym.y_pt)+" "+num(sym.box_pt)+" "+num(sym.box_pt)+" re S\nQ\n";
  double y=sym.y_pt+sym.box_pt-fs;
  for(size_t i=0;i<payload.size();i+=cpl){
    text_line(cs,"F2",fs,sym.x_pt,y,payload.substr(i,cpl)); y-=fs*1.2;
  }
}

static std::string page_content(const PageGeometry& g,const PageSpec& p,SymbolRenderer* renderer){
  std::string cs;
  caption_ops(cs,g,p);
  if(!p.has_payload) return cs;
  std::vector<unsigned char> mods; unsigned side=0;
  if(renderer && renderer->render(p.payload,p.symbol.version,mods,side) && side>0 && mods.size()==(size_t)side*side){
    module_ops(cs,p.symbol,mods,side);
  }else{
    if(renderer) ui::warn("symbol renderer failed on page "+std::to_string(p.page_number)+", printing record text");
    text_block_ops(cs,p.symbol,p.payload);
  }
  return cs;
}

std::vector<unsigned char> render_pdf(const std::vector<PageSpec>& pages,PageFormat format,SymbolRenderer* renderer){
  const PageGeometry& g=page_geometry(format);
  // 1 catalog, 2 page tree, 3 Helvetica, 4 Courier, then page/contents[/record] per page
  struct Nums{ unsigned page,content,record; };
  std::vector<Nums> nums; unsigned next=5;
  for(const auto& p: pages){ Nums n; n.page=next++; n.content=next++; n.record=p.has_payload? next++ : 0; nums.push_back(n); }

  PdfBuf P; P.xref.assign(next,0);
  P.put("%PDF-1.4\n%\xe2\xe3\xcf\xd3\n");
  P.obj(1); P.put("<< /Type /Catalog /Pages 2 0 R >>\nendobj\n");
  P.obj(2); {
    std::string kids;
    for(const auto& n: nums) kids+=std::to_string(n.page)+" 0 R ";
    P.put("<< /Type /Pages /Kids ["+kids+"] /Count "+std::to_string(pages.size())+" >>\nendobj\n");
  }
  P.obj(3); P.put("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>\nendobj\n");
  P.obj(4); P.put("<< /Type /Font /Subtype /Type1 /BaseFont /Courier >>\nendobj\n");

  for(size_t i=0;i<pages.size();++i){
    const PageSpec& p=pages[i]; const Nums& n=nums[i];
    P.obj(n.page);
    P.put("<< /Type /Page /Parent 2 0 R /MediaBox [0 0 "+num(g.width_pt)+" "+num(g.height_pt)+"]"
          " /Resources << /Font << /F1 3 0 R /F2 4 0 R >> >> /Contents "+std::to_string(n.content)+" 0 R >>\nendobj\n");
    P.obj(n.content); P.stream("",page_content(g,p,renderer));
    if(n.record){ P.obj(n.record); P.stream(kRecordType+" ",p.payload); }
  }

  size_t xref_pos=P.off();
  P.put("xref\n0 "+std::to_string(next)+"\n0000000000 65535 f \n");
  for(unsigned i=1;i<next;++i){ char line[32]; std::snprintf(line,sizeof(line),"%010zu 00000 n \n",P.xref[i]); P.put(line); }
  P.put("trailer\n<< /Size "+std::to_string(next)+" /Root 1 0 R >>\nstartxref\n"+std::to_string(xref_pos)+"\n%%EOF\n");
  return P.b;
}

void write_pdf(const std::string& path,const std::vector<PageSpec>& pages,PageFormat format,SymbolRenderer* renderer){
  write_file(path,render_pdf(pages,format,renderer));
}

bool looks_like_pdf(const std::vector<unsigned char>& buf){
  static const char magic[]="%PDF-";
  return buf.size()>=5 && std::equal(magic,magic+5,buf.begin());
}

/* record stream reader by /Length */
std::vector<std::string> read_records_from_pdf(const std::vector<unsigned char>& buf){
  std::vector<std::string> out;
  const std::string LKEY="/Length";
  const unsigned char s1[]="stream\n", s2[]="stream\r\n";
  auto pos=buf.begin();
  for(;;){
    pos=std::search(pos,buf.end(),kRecordType.begin(),kRecordType.end());
    if(pos==buf.end()) break;
    pos+=kRecordType.size();
    auto it=std::search(pos,buf.end(),LKEY.begin(),LKEY.end());
    if(it==buf.end()) break;
    it+=LKEY.size();
    while(it!=buf.end() && (*it==' '||*it=='\t'||*it=='\r'||*it=='\n')) ++it;
    if(it==buf.end() || !std::isdigit((unsigned char)*it)){ ui::debug("record stream without direct /Length, skipped"); continue; }
    size_t length=0; int digits=0;
    while(it!=buf.end() && std::isdigit((unsigned char)*it) && digits<9){ length=length*10+(size_t)(*it-'0'); ++it; ++digits; }

    auto p2=std::search(it,buf.end(),s1,s1+7);
    if(p2==buf.end()) p2=std::search(it,buf.end(),s2,s2+8);
    if(p2==buf.end()) break;
    size_t data_off=(size_t)(p2-buf.begin())+((p2[6]=='\n')? 7 : 8);
    if(data_off+length>buf.size()){ ui::debug("truncated record stream, skipped"); break; }
    out.push_back(std::string(buf.begin()+data_off,buf.begin()+data_off+length));
    pos=buf.begin()+data_off+length;
  }
  return out;
}

} // namespace paperback
