#include "ui.hpp"
#include <iostream>
#include <mutex>

namespace paperback {
namespace ui {

static const char* R="\x1b[31m"; static const char* G="\x1b[32m"; static const char* Y="\x1b[33m";
static const char* B="\x1b[34m"; static const char* C="\x1b[36m"; static const char* D="\x1b[90m"; static const char* N="\x1b[0m";
bool quiet=false;
bool verbose=false;

// workers report from several threads while a restore batch runs
static std::mutex g_out;

static void line(const char* color,const char* mark,const std::string& s){
  std::lock_guard<std::mutex> lock(g_out);
  std::cerr<<color<<mark<<s<<N<<"\n";
}

void banner(){
  if(quiet) return;
  std::lock_guard<std::mutex> lock(g_out);
  std::cerr<<B<<"paperback"<<N<<" - printable paper backup (PDF + optical codes)\n";
}
void step(const std::string& s){ if(!quiet) line(C,"» ",s); }
void ok(const std::string& s){ if(!quiet) line(G,"✓ ",s); }
void warn(const std::string& s){ if(!quiet) line(Y,"! ",s); }
void fail(const std::string& s){ line(R,"✗ ",s); }
void debug(const std::string& s){ if(verbose && !quiet) line(D,"  ",s); }

} // namespace ui
} // namespace paperback
