#pragma once
#include <string>

namespace paperback {

/* console reporting: colored status lines on stderr */
namespace ui {
  extern bool quiet;
  extern bool verbose;
  void banner();
  void step(const std::string& s);
  void ok(const std::string& s);
  void warn(const std::string& s);
  void fail(const std::string& s);
  void debug(const std::string& s);
}

} // namespace paperback
