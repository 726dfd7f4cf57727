#include "pc/io/histogram_csv.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <initializer_list>
#include <iomanip>
#include <stdexcept>
#include <unordered_map>

namespace {

// --- helpers texte ---
static inline std::string trim(std::string s) {
  auto notsp = [](unsigned char ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
  s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
  return s;
}
static inline std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}

static std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> out;
  std::string field;
  for (char c : line) {
    if (c == ',') { out.push_back(trim(field)); field.clear(); }
    else field.push_back(c);
  }
  out.push_back(trim(field));
  return out;
}

// entier non signé strict ("" ou "12x" -> false)
static bool parse_count(const std::string& s, unsigned long long& v) {
  if (s.empty() || !std::isdigit(static_cast<unsigned char>(s[0]))) return false;
  std::size_t pos = 0;
  try {
    v = std::stoull(s, &pos);
  } catch (const std::exception&) {
    return false;
  }
  return pos == s.size();
}

static int col(const std::unordered_map<std::string,int>& idx, std::initializer_list<const char*> names) {
  for (auto* n: names) {
    auto it = idx.find(n);
    if (it != idx.end()) return it->second;
  }
  return -1;
}

} // namespace

namespace pc::io {

void write_histogram_csv(const std::string& path, const pc::sim::BatchSummary& summary) {
  std::ofstream ofs(path);
  if (!ofs) {
    throw std::runtime_error("Cannot open CSV file: " + path);
  }
  ofs << "# trials=" << summary.n_trials << '\n';
  ofs.setf(std::ios::fixed);
  ofs << std::setprecision(10);
  ofs << "# mean=" << summary.mean_trial_length << '\n';
  ofs << "length,count\n";
  for (const auto& kv : summary.histogram) {
    ofs << kv.first << ',' << kv.second << '\n';
  }
  if (!ofs) {
    throw std::runtime_error("Write failed: " + path);
  }
}

pc::sim::Histogram
read_histogram_csv(const std::string& path,
                   std::size_t* num_ignored,
                   std::vector<std::string>* warnings)
{
  if (num_ignored) *num_ignored = 0;

  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("Cannot open CSV file: " + path);
  }

  pc::sim::Histogram hist;
  std::string line;
  bool header_seen = false;
  int iLen = -1, iCount = -1;
  std::size_t line_no = 0;

  while (std::getline(f, line)) {
    ++line_no;
    if (!line.empty() && line.back()=='\r') line.pop_back();
    auto l = trim(line);
    if (l.empty() || l.rfind("#",0)==0) continue;

    auto cells = split_csv_line(l);

    if (!header_seen) {
      header_seen = true;
      std::unordered_map<std::string,int> idx;
      for (int i=0;i<(int)cells.size();++i) idx[lower(cells[i])] = i;
      iLen   = col(idx, {"length","draws","rolls"});
      iCount = col(idx, {"count","trials","n"});
      if (iLen < 0 || iCount < 0) {
        throw std::runtime_error("Missing length/count columns in " + path);
      }
      continue;
    }

    auto get = [&](int i)->std::string {
      return (i>=0 && i<(int)cells.size()) ? cells[i] : std::string();
    };

    unsigned long long len = 0, cnt = 0;
    std::string why;
    if (!parse_count(get(iLen), len))        why = "longueur invalide";
    else if (!parse_count(get(iCount), cnt)) why = "compte invalide";
    else if (cnt == 0)                       why = "compte nul";

    if (!why.empty()) {
      if (num_ignored) (*num_ignored)++;
      if (warnings) warnings->push_back("Ligne " + std::to_string(line_no) + " ignorée: " + why);
      continue;
    }
    hist.add(static_cast<std::size_t>(len), cnt);
  }

  return hist;
}

} // namespace pc::io
