#pragma once
#include <string>
#include <vector>
#include "layout.hpp"

namespace paperback {

/*
 * Produces the module matrix of one optical code for the planned symbol
 * version. Code generation lives outside this project; without a renderer
 * the PDF prints the record text inside the symbol box instead.
 */
class SymbolRenderer {
public:
  virtual ~SymbolRenderer() {}
  // side*side entries, row-major, non-zero is dark. false if the payload cannot be encoded.
  virtual bool render(const std::string& payload,unsigned version,std::vector<unsigned char>& modules,unsigned& side)=0;
};

// Every record page also embeds its record as a /Type /PaperbackRecord stream.
std::vector<unsigned char> render_pdf(const std::vector<PageSpec>& pages,PageFormat format,SymbolRenderer* renderer);
void write_pdf(const std::string& path,const std::vector<PageSpec>& pages,PageFormat format,SymbolRenderer* renderer);

bool looks_like_pdf(const std::vector<unsigned char>& buf);
// Embedded records in file order. Damaged streams are skipped.
std::vector<std::string> read_records_from_pdf(const std::vector<unsigned char>& buf);

} // namespace paperback
