#include "typed_csv/csv_reader.hpp"
#include "typed_csv/byte_range.hpp"
#include "typed_csv/column_builder.hpp"
#include "typed_csv/log.hpp"
#include "typed_csv/row_selector.hpp"
#include "typed_csv/row_stream.hpp"
#include "typed_csv/row_view.hpp"
#include "typed_csv/schema.hpp"
#include "typed_csv/value_parser.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <utility>

namespace tc {

static constexpr std::size_t kCountSampleRows = 1024;
static constexpr std::size_t kDetectSampleBytes = 64 * 1024;

static double ms_since(std::chrono::steady_clock::time_point t0) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
}

struct CsvReader::Impl {
  ParseOptions opt;
  ReadError err;
  ReadMetrics stats;
  MetricsRegistry reg;
  std::vector<std::string> names;
  Dialect dialect;
  std::chrono::steady_clock::time_point t0;

  bool fail(ReadError e) {
    err = std::move(e);
    stats = reg.snapshot(ms_since(t0));
    log(LogLevel::Info, "read failed: ", err.to_string());
    return false;
  }

  bool run(ByteSource& src, Table& out);
  bool count_columns(RowSelector& sel, std::size_t& ncols);
};

// Widest row among the first data rows; the selector is rewound afterwards.
bool CsvReader::Impl::count_columns(RowSelector& sel, std::size_t& ncols) {
  RowView row;
  std::size_t n = 0;
  RowStream::Status st = RowStream::Status::End;
  while (n < kCountSampleRows && (st = sel.next(row)) == RowStream::Status::Row) {
    ncols = std::max(ncols, row.size());
    ++n;
  }
  if (st == RowStream::Status::Error) return false;
  sel.rewind();
  if (n == 0) ncols = opt.dtypes.size();
  return true;
}

bool CsvReader::Impl::run(ByteSource& src, Table& out) {
  t0 = std::chrono::steady_clock::now();
  err.clear();
  reg.reset();
  names.clear();
  dialect = dialect_from(opt);

  ReadError e;
  if (!validate_options(opt, e)) return fail(std::move(e));

  Window win;
  if (!resolve_window(src, opt.byte_range.value_or(ByteRange{}), dialect, opt.chunk_bytes, win, e))
    return fail(std::move(e));
  const bool first = win.first;
  if (log_enabled(LogLevel::Debug)) {
    log(LogLevel::Debug, src.describe(), ": window [", win.start, ", ",
        win.limit == Window::kUnbounded ? std::string("end") : std::to_string(win.limit), ")");
  }
  reg.add_window();

  RowStream rows(src, dialect, std::move(win), opt.chunk_bytes);
  if (opt.detect_delimiter) {
    bool complete = false;
    const std::string_view sample = rows.prefetch(kDetectSampleBytes, complete);
    if (!rows.error().ok()) return fail(rows.error());
    Dialect found;
    if (!detect_dialect(sample, complete, dialect, found))
      log(LogLevel::Warn, src.describe(), ": no consistent delimiter in sample, using ','");
    dialect = found;
    rows.set_dialect(dialect);
  }

  const ValueParser vp(opt);
  RowSelector sel(rows, opt, first, vp);
  reg.start_stage("tokenize");
  std::vector<std::string> header;
  bool has_header = false;
  if (!sel.begin(header, has_header)) return fail(rows.error());
  if (opt.skipfooter && !sel.drop_footer(opt.skipfooter)) return fail(rows.error());

  std::size_t ncols = 0;
  if (!opt.names.empty()) ncols = opt.names.size();
  else if (has_header) ncols = header.size();
  else if (!count_columns(sel, ncols)) return fail(rows.error());
  names = resolve_names(header, has_header, ncols, opt);
  reg.end_stage("tokenize");

  if (names.empty())
    return fail(ReadError::make(ErrorKind::EmptyInputNoDtype,
                                "no columns: input has no header or data rows and no dtypes were given"));

  std::vector<std::size_t> selected;
  std::optional<std::size_t> index_at;
  std::vector<std::optional<DType>> dtypes;
  if (!select_columns(names, opt.usecols, selected, e)) return fail(std::move(e));
  if (!resolve_index_col(names, selected, opt.index_col, index_at, e)) return fail(std::move(e));
  if (!assign_dtypes(names, selected, opt, dtypes, e)) return fail(std::move(e));

  RowView row;
  RowStream::Status st;

  const bool need_infer = std::any_of(dtypes.begin(), dtypes.end(),
                                      [](const std::optional<DType>& t) { return !t; });
  if (need_infer) {
    reg.start_stage("infer");
    std::vector<TypeInferrer> inf(selected.size());
    std::size_t n = 0;
    while ((st = sel.next(row)) == RowStream::Status::Row) {
      ++n;
      for (std::size_t j = 0; j < selected.size(); ++j)
        if (!dtypes[j]) inf[j].observe(vp, row.at(selected[j]));
    }
    if (st == RowStream::Status::Error) return fail(rows.error());
    sel.rewind();
    reg.end_stage("infer");
    if (n == 0)
      return fail(ReadError::make(ErrorKind::EmptyInputNoDtype,
                                  "no data rows to infer column types from; give dtypes for every column"));
    for (std::size_t j = 0; j < selected.size(); ++j)
      if (!dtypes[j]) dtypes[j] = inf[j].result();
  }

  reg.start_stage("convert");
  rows.forward_only();
  std::vector<ColumnBuilder> builders;
  builders.reserve(selected.size());
  for (std::size_t j = 0; j < selected.size(); ++j) {
    builders.emplace_back(*dtypes[j], vp);
    if (sel.cap()) builders.back().reserve(*sel.cap());
  }
  std::size_t r = 0;
  while ((st = sel.next(row)) == RowStream::Status::Row) {
    for (std::size_t j = 0; j < selected.size(); ++j) {
      const std::size_t s = selected[j];
      if (s >= row.size()) { builders[j].append_missing(); continue; }
      if (!builders[j].append(row.at(s))) {
        ReadError ce = ReadError::make(ErrorKind::ConversionFailure,
                                       "cannot convert field to " + std::string(dtype_name(*dtypes[j])));
        ce.row = r;
        ce.line = row.line();
        ce.column = j;
        ce.column_name = names[s];
        ce.field = std::string(row.at(s));
        return fail(std::move(ce));
      }
    }
    ++r;
  }
  if (st == RowStream::Status::Error) return fail(rows.error());
  reg.end_stage("convert");
  reg.add_rows(r);
  reg.add_bytes(rows.bytes_loaded());

  Schema schema;
  std::vector<Column> cols;
  std::optional<IndexColumn> index;
  for (std::size_t j = 0; j < selected.size(); ++j) {
    Field f{names[selected[j]], *dtypes[j]};
    if (index_at && *index_at == j) {
      index = IndexColumn{std::move(f), builders[j].finish()};
      continue;
    }
    schema.fields.push_back(std::move(f));
    cols.push_back(builders[j].finish());
  }
  out = Table(std::move(schema), std::move(cols), std::move(index));

  stats = reg.snapshot(ms_since(t0));
  if (log_enabled(LogLevel::Debug)) {
    for (const auto& s : stats.stages) log(LogLevel::Debug, "stage ", s.name, ": ", s.duration_ms, " ms");
    log(LogLevel::Debug, src.describe(), ": ", stats.rows, " rows, ", stats.bytes, " bytes");
  }
  return true;
}

CsvReader::CsvReader(ParseOptions opt) : p_(new Impl{}) { p_->opt = std::move(opt); }

CsvReader::~CsvReader() { delete p_; }

bool CsvReader::read(ByteSource& src, Table& out) { return p_->run(src, out); }

bool CsvReader::read_file(const std::string& path, Table& out) {
  p_->t0 = std::chrono::steady_clock::now();
  p_->reg.reset();
  ReadError e;
  auto src = open_file_source(path, e);
  if (!src) return p_->fail(std::move(e));
  return p_->run(*src, out);
}

bool CsvReader::read_buffer(std::string_view data, Table& out) {
  auto src = make_buffer_source(data);
  return p_->run(*src, out);
}

const ParseOptions& CsvReader::options() const { return p_->opt; }
const ReadError& CsvReader::error() const { return p_->err; }
const ReadMetrics& CsvReader::metrics() const { return p_->stats; }
const std::vector<std::string>& CsvReader::column_names() const { return p_->names; }
const Dialect& CsvReader::dialect() const { return p_->dialect; }

// Options for windows after the first: window 0's dialect, names and dtypes.
static ParseOptions pin_to_first_window(const ParseOptions& opt, const CsvReader& r0, const Table& t0) {
  ParseOptions p = opt;
  p.names = r0.column_names();
  p.header = HeaderMode::None;
  p.skiprows = 0;
  p.skiprow_indices.clear();
  p.dtypes.clear();
  p.dtype_by_name.clear();
  for (const auto& f : t0.schema().fields) p.dtype_by_name[f.name] = f.dtype;
  if (t0.index()) p.dtype_by_name[t0.index()->field.name] = t0.index()->field.dtype;

  const Dialect& d = r0.dialect();
  p.detect_delimiter = false;
  p.delim_whitespace = d.delim_whitespace;
  if (d.delim_whitespace) p.delimiter.reset();
  else p.delimiter = d.delimiter;
  return p;
}

bool read_partitioned(const SourceOpener& open, const ParseOptions& opt,
                      std::uint64_t segment_bytes, unsigned threads,
                      Table& out, ReadError& err, ReadMetrics* metrics) {
  const auto t0 = std::chrono::steady_clock::now();
  err.clear();
  if (opt.byte_range || opt.nrows || opt.skipfooter) {
    err = ReadError::make(ErrorKind::ConfigurationConflict,
                          "partitioned read: byte_range, nrows and skipfooter need a single-window read");
    return false;
  }
  if (!validate_options(opt, err)) return false;

  auto first_src = open(err);
  if (!first_src) return false;
  const auto size = first_src->size();
  if (!size) {
    err = ReadError::make(ErrorKind::InvalidOption,
                          "partitioned read needs a source of known size: " + first_src->describe());
    return false;
  }

  const auto ranges = split_ranges(*size, segment_bytes);
  std::vector<Table> parts(ranges.size());
  MetricsRegistry reg;

  ParseOptions o0 = opt;
  o0.byte_range = ranges[0];
  CsvReader r0(o0);
  if (!r0.read(*first_src, parts[0])) {
    err = r0.error();
    return false;
  }
  first_src.reset();
  reg.merge(r0.metrics());
  const ParseOptions rest = pin_to_first_window(opt, r0, parts[0]);

  std::vector<ReadError> errs(ranges.size());
  std::vector<ReadMetrics> stats(ranges.size());
  std::atomic<std::size_t> next{1};
  std::atomic<bool> failed{false};

  auto worker = [&]() {
    for (;;) {
      const std::size_t i = next.fetch_add(1);
      if (i >= ranges.size() || failed.load()) return;
      ReadError oe;
      auto src = open(oe);
      if (!src) { errs[i] = std::move(oe); failed = true; return; }
      ParseOptions o = rest;
      o.byte_range = ranges[i];
      CsvReader r(std::move(o));
      if (!r.read(*src, parts[i])) { errs[i] = r.error(); failed = true; return; }
      stats[i] = r.metrics();
    }
  };

  if (ranges.size() > 1) {
    const std::size_t n = std::max<std::size_t>(1, std::min<std::size_t>(threads, ranges.size() - 1));
    log(LogLevel::Debug, "partitioned read: ", ranges.size(), " windows on ", n, " threads");
    std::vector<std::thread> pool;
    pool.reserve(n);
    for (std::size_t k = 0; k < n; ++k) pool.emplace_back(worker);
    for (auto& t : pool) t.join();
  }

  for (std::size_t i = 1; i < ranges.size(); ++i) {
    if (errs[i].ok()) continue;
    err = std::move(errs[i]);
    err.message = "window " + std::to_string(i) + ": " + err.message;
    log(LogLevel::Info, "partitioned read failed: ", err.to_string());
    return false;
  }
  for (std::size_t i = 1; i < ranges.size(); ++i) reg.merge(stats[i]);

  if (!Table::concat(parts, out, err)) return false;
  if (metrics) *metrics = reg.snapshot(ms_since(t0));
  return true;
}

}
