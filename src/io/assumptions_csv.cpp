#include "lw/io/assumptions_csv.hpp"
#include "lw/core/errors.hpp"
#include <fstream>
#include <unordered_map>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <stdexcept>

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

// CSV splitter minimal qui gère les champs entre "..."
static std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> out;
  std::string field;
  bool in_quotes = false;
  for (size_t i=0;i<line.size();++i) {
    char c = line[i];
    if (c == '"') {
      if (in_quotes && i+1<line.size() && line[i+1] == '"') { field.push_back('"'); ++i; }
      else { in_quotes = !in_quotes; }
    } else if (c == ',' && !in_quotes) {
      out.push_back(trim(field)); field.clear();
    } else {
      field.push_back(c);
    }
  }
  out.push_back(trim(field));
  return out;
}

// parse double strict : toute la cellule doit être consommée
static double parse_double(const std::string& key, const std::string& s) {
  char* end=nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (s.empty() || end==s.c_str() || *end != '\0' || !std::isfinite(v)) {
    throw lw::ValidationError(key, "read_assumptions_csv: invalid number for " + key + ": '" + s + "'");
  }
  return v;
}

static int parse_int(const std::string& key, const std::string& s) {
  const double v = parse_double(key, s);
  if (v != std::floor(v) || std::fabs(v) > 1e9) {
    throw lw::ValidationError(key, "read_assumptions_csv: " + key + " must be an integer");
  }
  return static_cast<int>(v);
}

static bool parse_bool(const std::string& key, std::string s) {
  s = lower(trim(s));
  if (s=="1" || s=="true" || s=="yes" || s=="on")  return true;
  if (s=="0" || s=="false"|| s=="no"  || s=="off") return false;
  throw lw::ValidationError(key, "read_assumptions_csv: invalid boolean for " + key + ": '" + s + "'");
}

// synonymes → nom canonique
static const std::unordered_map<std::string, std::string>& aliases() {
  static const std::unordered_map<std::string, std::string> m = {
    {"capacity_mw", "capacity_mw"}, {"capacity", "capacity_mw"},
    {"capacity_factor", "capacity_factor"}, {"cf", "capacity_factor"},
    {"daily_yield_kwh_per_kwp", "daily_yield_kwh_per_kwp"}, {"daily_yield", "daily_yield_kwh_per_kwp"},
    {"capital_expenditure_per_mw", "capital_expenditure_per_mw"}, {"capex_per_mw", "capital_expenditure_per_mw"},
    {"o_m_cost_pct_of_capital_cost", "o_m_cost_pct_of_capital_cost"}, {"om_pct", "o_m_cost_pct_of_capital_cost"},
    {"debt_pct_of_capital_cost", "debt_pct_of_capital_cost"}, {"debt_pct", "debt_pct_of_capital_cost"},
    {"equity_pct_of_capital_cost", "equity_pct_of_capital_cost"}, {"equity_pct", "equity_pct_of_capital_cost"},
    {"cost_of_debt", "cost_of_debt"}, {"kd", "cost_of_debt"},
    {"cost_of_equity", "cost_of_equity"}, {"ke", "cost_of_equity"},
    {"tax_rate", "tax_rate"}, {"tax", "tax_rate"},
    {"project_lifetime_years", "project_lifetime_years"}, {"lifetime", "project_lifetime_years"},
    {"dcsr", "dcsr"}, {"dscr", "dcsr"},
    {"debt_tenor_years", "debt_tenor_years"}, {"tenor", "debt_tenor_years"},
    {"tax_loss_carryforward", "tax_loss_carryforward"}, {"nol", "tax_loss_carryforward"}
  };
  return m;
}

} // namespace

namespace lw::io {

lw::project::AssumptionInputs
read_assumptions_csv(const std::string& path, std::vector<std::string>* warnings)
{
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("read_assumptions_csv: cannot open file: " + path);
  }

  // 1) clé canonique → valeur brute
  std::unordered_map<std::string, std::string> kv;
  std::string line;
  bool first = true;
  while (std::getline(f, line)) {
    if (!line.empty() && line.back()=='\r') line.pop_back();
    auto l = trim(line);
    if (l.empty() || l.rfind("#",0)==0) continue;

    auto cells = split_csv_line(l);
    const std::string key = lower(cells[0]);
    const std::string val = cells.size() > 1 ? cells[1] : std::string();

    // en-tête optionnel
    if (first) {
      first = false;
      if (key=="key" || key=="field" || key=="parameter") continue;
    }

    auto it = aliases().find(key);
    if (it == aliases().end()) {
      if (warnings) warnings->push_back("Clé inconnue ignorée: " + cells[0]);
      continue;
    }
    if (kv.count(it->second) && warnings) {
      warnings->push_back("Clé dupliquée (dernière valeur retenue): " + it->second);
    }
    kv[it->second] = val;
  }

  // 2) champs obligatoires / optionnels
  auto required = [&](const char* key) -> const std::string& {
    auto it = kv.find(key);
    if (it == kv.end() || it->second.empty()) {
      throw lw::ValidationError(key, std::string("read_assumptions_csv: missing required key ") + key);
    }
    return it->second;
  };
  auto optional = [&](const char* key) -> const std::string* {
    auto it = kv.find(key);
    return (it == kv.end() || it->second.empty()) ? nullptr : &it->second;
  };

  lw::project::AssumptionInputs in;
  in.capacity_mw                  = parse_double("capacity_mw", required("capacity_mw"));
  // facteur de charge direct, sinon dérivé du productible journalier
  const std::string* yield = optional("daily_yield_kwh_per_kwp");
  if (yield && !optional("capacity_factor")) {
    in.capacity_factor = lw::project::capacity_factor_from_daily_yield(
        parse_double("daily_yield_kwh_per_kwp", *yield));
  } else {
    if (yield && warnings) warnings->push_back("daily_yield_kwh_per_kwp ignoré (capacity_factor fourni)");
    in.capacity_factor = parse_double("capacity_factor", required("capacity_factor"));
  }
  in.capital_expenditure_per_mw   = parse_double("capital_expenditure_per_mw", required("capital_expenditure_per_mw"));
  in.o_m_cost_pct_of_capital_cost = parse_double("o_m_cost_pct_of_capital_cost", required("o_m_cost_pct_of_capital_cost"));
  in.cost_of_debt                 = parse_double("cost_of_debt", required("cost_of_debt"));
  in.cost_of_equity               = parse_double("cost_of_equity", required("cost_of_equity"));
  in.tax_rate                     = parse_double("tax_rate", required("tax_rate"));
  in.project_lifetime_years       = parse_int("project_lifetime_years", required("project_lifetime_years"));
  in.dcsr                         = parse_double("dcsr", required("dcsr"));

  if (auto* v = optional("debt_pct_of_capital_cost"))   in.debt_pct_of_capital_cost   = parse_double("debt_pct_of_capital_cost", *v);
  if (auto* v = optional("equity_pct_of_capital_cost")) in.equity_pct_of_capital_cost = parse_double("equity_pct_of_capital_cost", *v);
  if (auto* v = optional("debt_tenor_years"))           in.debt_tenor_years           = parse_int("debt_tenor_years", *v);
  if (auto* v = optional("tax_loss_carryforward"))      in.tax_loss_carryforward      = parse_bool("tax_loss_carryforward", *v);

  return in;
}

} // namespace lw::io
