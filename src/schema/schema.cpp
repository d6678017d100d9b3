#include "typed_csv/schema.hpp"
#include "typed_csv/value_parser.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace tc {

std::optional<std::size_t> Schema::find(std::string_view name) const {
  for (std::size_t i = 0; i < fields.size(); ++i)
    if (fields[i].name == name) return i;
  return std::nullopt;
}

static std::string generated_name(const ParseOptions& opt, std::size_t i) {
  return opt.prefix + std::to_string(i);
}

std::vector<std::string> resolve_names(const std::vector<std::string>& header, bool has_header,
                                       std::size_t ncols, const ParseOptions& opt) {
  std::vector<std::string> out;
  out.reserve(ncols);
  if (!opt.names.empty()) {
    out = opt.names;
  } else if (has_header) {
    for (std::size_t i = 0; i < header.size() && i < ncols; ++i)
      out.push_back(header[i].empty() ? "Unnamed: " + std::to_string(i) : header[i]);
  }
  for (std::size_t i = out.size(); i < ncols; ++i) out.push_back(generated_name(opt, i));
  mangle_duplicates(out);
  return out;
}

void mangle_duplicates(std::vector<std::string>& names) {
  std::unordered_set<std::string> taken(names.begin(), names.end());
  std::unordered_set<std::string> seen;
  std::unordered_map<std::string, std::size_t> next_suffix;
  for (auto& n : names) {
    if (seen.insert(n).second) continue;
    std::size_t& k = next_suffix[n];
    if (k == 0) k = 1;
    std::string cand;
    do {
      cand = n + "." + std::to_string(k++);
    } while (taken.count(cand) || seen.count(cand));
    taken.insert(cand);
    seen.insert(cand);
    n = std::move(cand);
  }
}

// Position of `ref` among `names`, or nullopt.
static std::optional<std::size_t> find_ref(const std::vector<std::string>& names, const ColumnRef& ref) {
  if (const auto* pos = std::get_if<std::size_t>(&ref))
    return *pos < names.size() ? std::optional<std::size_t>(*pos) : std::nullopt;
  const auto& name = std::get<std::string>(ref);
  auto it = std::find(names.begin(), names.end(), name);
  if (it == names.end()) return std::nullopt;
  return static_cast<std::size_t>(it - names.begin());
}

static std::string describe_ref(const ColumnRef& ref) {
  if (const auto* pos = std::get_if<std::size_t>(&ref)) return "position " + std::to_string(*pos);
  return "'" + std::get<std::string>(ref) + "'";
}

bool select_columns(const std::vector<std::string>& names, const std::vector<ColumnRef>& usecols,
                    std::vector<std::size_t>& selected, ReadError& err) {
  selected.clear();
  if (usecols.empty()) {
    for (std::size_t i = 0; i < names.size(); ++i) selected.push_back(i);
    return true;
  }
  for (const auto& ref : usecols) {
    auto pos = find_ref(names, ref);
    if (!pos) {
      err = ReadError::make(ErrorKind::InvalidOption, "usecols: no column at " + describe_ref(ref));
      return false;
    }
    selected.push_back(*pos);
  }
  std::sort(selected.begin(), selected.end());
  selected.erase(std::unique(selected.begin(), selected.end()), selected.end());
  return true;
}

bool resolve_index_col(const std::vector<std::string>& names, const std::vector<std::size_t>& selected,
                       const std::optional<ColumnRef>& index_col,
                       std::optional<std::size_t>& out, ReadError& err) {
  out.reset();
  if (!index_col) return true;
  if (const auto* pos = std::get_if<std::size_t>(&*index_col)) {
    if (*pos < selected.size()) { out = *pos; return true; }
  } else {
    const auto& name = std::get<std::string>(*index_col);
    for (std::size_t j = 0; j < selected.size(); ++j)
      if (names[selected[j]] == name) { out = j; return true; }
  }
  err = ReadError::make(ErrorKind::InvalidOption, "index_col: no selected column at " + describe_ref(*index_col));
  return false;
}

bool assign_dtypes(const std::vector<std::string>& names, const std::vector<std::size_t>& selected,
                   const ParseOptions& opt, std::vector<std::optional<DType>>& out, ReadError& err) {
  out.assign(selected.size(), std::nullopt);
  const bool by_selection = !opt.usecols.empty() && opt.dtypes.size() == selected.size();
  for (std::size_t j = 0; j < selected.size(); ++j) {
    const std::size_t pos = by_selection ? j : selected[j];
    if (pos < opt.dtypes.size()) out[j] = opt.dtypes[pos];
  }
  for (const auto& kv : opt.dtype_by_name) {
    auto it = std::find(names.begin(), names.end(), kv.first);
    if (it == names.end()) {
      err = ReadError::make(ErrorKind::InvalidOption, "dtype given for unknown column '" + kv.first + "'");
      return false;
    }
    const std::size_t pos = static_cast<std::size_t>(it - names.begin());
    for (std::size_t j = 0; j < selected.size(); ++j)
      if (selected[j] == pos) out[j] = kv.second;
  }
  return true;
}

void TypeInferrer::observe(const ValueParser& p, std::string_view field) {
  if (field.empty() || p.is_na(field)) return;
  ++seen_;
  if (!(int_ || float_ || bool_ || date_)) return;
  const bool is_int = int_ && p.parse_integer(field).has_value();
  const bool is_float = is_int || (float_ && p.parse_number(field).has_value());
  int_ = int_ && is_int;
  float_ = float_ && is_float;
  // Numeric text is never boolean.
  bool_ = bool_ && !is_float && p.parse_bool(field).has_value();
  date_ = date_ && !is_float && p.parse_date(field).has_value();
}

DType TypeInferrer::result() const noexcept {
  if (seen_ == 0) return DType::Float64;
  if (int_) return DType::Int64;
  if (float_) return DType::Float64;
  if (bool_) return DType::Bool;
  if (date_) return DType::Date;
  return DType::Str;
}

}
