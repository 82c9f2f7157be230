#include "aged_cache/options.hpp"

#include <fstream>
#include <regex>
#include <sstream>
#include <utility>

namespace aged_cache {
namespace {
// Matches `"key": <value>` in a flat JSON object and hands the captured
// value text to parse. Fields that are absent leave out unchanged.
template <typename T, typename Parse>
void read_field(const std::string &text, const std::string &key,
                const char *value_pattern, Parse parse, T &out) {
  const std::regex re("\"" + key + "\"\\s*:\\s*" + value_pattern);
  std::smatch m;
  if (std::regex_search(text, m, re))
    out = parse(m[1].str());
}

bool read_file(const std::string &path, std::string &text) {
  std::ifstream in(path);
  if (!in.is_open())
    return false;
  std::stringstream ss;
  ss << in.rdbuf();
  text = ss.str();
  return true;
}
} // namespace

bool load_options(const std::string &path, CacheOptions &out,
                  std::string *err) {
  std::string text;
  if (!read_file(path, text)) {
    if (err)
      *err = "options file not found";
    return false;
  }
  const auto open = text.find('{');
  if (open == std::string::npos ||
      text.find('}', open) == std::string::npos) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  CacheOptions staged = out;
  read_field(text, "sweep_on_put", "(true|false)",
             [](const std::string &v) { return v == "true"; },
             staged.sweep_on_put);
  read_field(text, "version", "\"([^\"]*)\"",
             [](const std::string &v) { return v; }, staged.version);
  out = std::move(staged);
  return true;
}

std::string render_info(const CacheStats &stats, const CacheOptions &opts,
                        const std::string &time_source,
                        std::size_t entries_linked) {
  std::ostringstream os;
  os << "options_version:" << opts.version << "\n";
  os << "sweep_on_put:" << (opts.sweep_on_put ? 1 : 0) << "\n";
  os << "time_source:" << time_source << "\n";
  os << "entries_linked:" << entries_linked << "\n";
  os << "puts:" << stats.puts << "\n";
  os << "replacements:" << stats.replacements << "\n";
  os << "hits:" << stats.hits << "\n";
  os << "misses:" << stats.misses << "\n";
  os << "expirations:" << stats.expirations << "\n";
  os << "sweeps:" << stats.sweeps << "\n";
  return os.str();
}

} // namespace aged_cache
