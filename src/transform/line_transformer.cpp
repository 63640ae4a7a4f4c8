#include "fieldcut/line_transformer.hpp"
#include <algorithm>
#include <utility>

namespace fc {

void split_fields(std::string_view line, char delim, std::vector<std::string_view>& fields) {
  fields.clear();
  std::size_t start = 0;
  while (true) {
    std::size_t pos = line.find(delim, start);
    if (pos == std::string_view::npos) {
      fields.emplace_back(line.substr(start));
      return;
    }
    fields.emplace_back(line.substr(start, pos - start));
    start = pos + 1;
  }
}

LineTransformer::LineTransformer(TransformConfig cfg)
  : cfg_(std::move(cfg)), min_fields_(0) {
  std::size_t max_idx = 0;
  for (auto i : cfg_.selector) max_idx = std::max(max_idx, i);
  min_fields_ = max_idx + 1;
}

bool LineTransformer::transform_line(std::string_view line, std::string& out) const {
  thread_local std::vector<std::string_view> fields;

  if (cfg_.strip_cr && !line.empty() && line.back() == '\r') line.remove_suffix(1);
  if (line.empty()) return false;

  split_fields(line, cfg_.delimiter, fields);
  if (fields.size() < min_fields_) return false;

  if (cfg_.filter) {
    const auto& f = *cfg_.filter;
    if (f.col1 < fields.size() && f.col2 < fields.size() && fields[f.col1] == fields[f.col2])
      return false;
  }

  const std::size_t mark = out.size();
  if (cfg_.empty_fields == EmptyFieldMode::Keep) {
    for (std::size_t i = 0; i < cfg_.selector.size(); ++i) {
      if (i) out.push_back(cfg_.separator);
      out.append(fields[cfg_.selector[i]]);
    }
    return true;
  }

  // Omit: the separator belongs to the non-empty field that follows it, so an
  // empty field at position i drops both its value and its separator.
  for (std::size_t i = 0; i < cfg_.selector.size(); ++i) {
    std::string_view v = fields[cfg_.selector[i]];
    if (v.empty()) continue;
    if (i) out.push_back(cfg_.separator);
    out.append(v);
  }
  return out.size() != mark;
}

ChunkOutput LineTransformer::transform(std::string_view chunk, bool is_first_chunk) const {
  ChunkOutput res;
  res.bytes.reserve(chunk.size() / 2);

  std::size_t start = 0;
  if (is_first_chunk) {
    // Header: always the first line of the file.
    std::size_t nl = chunk.find(cfg_.terminator);
    start = (nl == std::string_view::npos) ? chunk.size() : nl + 1;
  }

  while (start < chunk.size()) {
    std::size_t nl = chunk.find(cfg_.terminator, start);
    std::size_t stop = (nl == std::string_view::npos) ? chunk.size() : nl;
    if (transform_line(chunk.substr(start, stop - start), res.bytes)) {
      res.bytes.push_back(cfg_.terminator);
      ++res.rows;
    }
    start = stop + 1;
  }
  return res;
}

}
