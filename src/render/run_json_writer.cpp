#include "fieldcut/run_json.hpp"
#include "fieldcut/path_utils.hpp"
#include <cmath> // std::isfinite
#include <fstream>
#include <sstream>

namespace fc {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          static const char* hex = "0123456789abcdef";
          o << "\\u00" << hex[(c >> 4) & 0xF] << hex[c & 0xF];
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

void fill_from_stats(RunJsonPayload& p, const RunStats& s) {
  p.rows = s.rows;
  p.chunks = s.chunks;
  p.bytes_in = s.bytes_in;
  p.bytes_out = s.bytes_out;
  p.wall_time_ms = s.wall_time_ms;
  p.throughput_mb_s = s.throughput_mb_s;
  p.rows_per_sec = s.rows_per_sec;
  p.stage_times.clear();
  for (const auto& st : s.stages) p.stage_times.emplace_back(st.name, st.duration_ms);
}

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"rows\":" << p.rows << ",";
  o << "\"chunks\":" << p.chunks << ",";
  o << "\"threads\":" << p.threads << ",";
  o << "\"bytes_in\":" << p.bytes_in << ",";
  o << "\"bytes_out\":" << p.bytes_out << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";
  o << "\"rows_per_sec\":" << safe_num(p.rows_per_sec) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<p.stage_times.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, p.stage_times[i].first);
    o << ",\"duration_ms\":" << safe_num(p.stage_times[i].second) << "}";
  }
  o << "],";

  o << "\"input\":";  esc(o, p.input);  o << ",";
  o << "\"output\":"; esc(o, p.output); o << ",";
  o << "\"delimiter\":"; esc(o, std::string(1, p.delimiter)); o << ",";

  o << "\"fields\":[";
  for (size_t i=0;i<p.fields.size();++i){
    if (i) o << ",";
    o << p.fields[i];
  }
  o << "],";

  o << "\"filter_equal\":";
  if (p.filter_equal) o << "[" << p.filter_equal->first << "," << p.filter_equal->second << "]";
  else o << "null";
  o << ",";

  o << "\"empty_fields\":"; esc(o, p.empty_fields);

  o << "}";
  return o.str();
}

bool write_run_json(const std::string& path, const std::string& json, std::string* err_out) {
  if (!ensure_parent_dirs(path)) {
    if (err_out) *err_out = "cannot create parent directory for " + path;
    return false;
  }
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    if (err_out) *err_out = "failed to open " + path;
    return false;
  }
  out.write(json.data(), static_cast<std::streamsize>(json.size()));
  if (!out) {
    if (err_out) *err_out = "failed to write " + path;
    return false;
  }
  return true;
}

}
