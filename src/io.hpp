#pragma once
#include <string>
#include <vector>

namespace paperback {

std::vector<unsigned char> read_file(const std::string& path);
void write_file(const std::string& path,const std::vector<unsigned char>& data);
std::vector<unsigned char> read_stream_stdin();

// One entry per non-empty line, CR/LF stripped. A missing file yields no lines.
std::vector<std::string> read_lines(const std::string& path);
void write_lines(const std::string& path,const std::vector<std::string>& lines);

void ensure_dir(const std::string& dir);
std::string join2(const std::string& a,const std::string& b);

} // namespace paperback
