#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include "chunk_codec.hpp"
#include "manifest.hpp"

namespace paperback {

enum class PageFormat { A4, Letter };

// Physical page preset, in PDF points (1/72 inch).
struct PageGeometry {
  const char* name;
  double width_pt;
  double height_pt;
  double margin_pt;
  double caption_pt;    // text band at the top of every page
};

const PageGeometry& page_geometry(PageFormat format);
PageFormat parse_page_format(const std::string& name);   // "A4" / "Letter", any case; throws InvalidConfig

/* QR symbol sizing, byte mode, error correction level M */
const unsigned kMaxSymbolVersion=40;
const unsigned kQuietZoneModules=4;
size_t symbol_capacity(unsigned version);
unsigned symbol_version_for(size_t record_length);      // 0 when nothing fits
inline unsigned symbol_modules(unsigned version){ return 17+4*version; }

// Square box for the optical code; origin is the PDF lower-left corner.
struct SymbolSpec {
  unsigned version=0;
  unsigned modules=0;
  double x_pt=0;
  double y_pt=0;
  double box_pt=0;      // includes the quiet zone
  double module_pt=0;
};

// One rendering instruction. The cover page carries no payload.
struct PageSpec {
  uint32_t page_number=0;
  std::string caption;  // lines separated by '\n'
  bool has_payload=false;
  std::string payload;
  SymbolSpec symbol;
};

const uint32_t kCoverPage=1;
inline uint32_t page_for_chunk(uint32_t index){ return index+2; }

// Cover page followed by one page per chunk, in index order.
std::vector<PageSpec> plan(const BackupManifest& manifest,const std::vector<Chunk>& chunks,PageFormat format);

} // namespace paperback
