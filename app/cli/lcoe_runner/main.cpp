#include <lw/project/assumptions.hpp>
#include <lw/config/solver_config.hpp>
#include <lw/lcoe/lcoe.hpp>
#include <lw/io/assumptions_csv.hpp>
#include <lw/core/errors.hpp>

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <cmath>

static void print_usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog
            << " capacity_mw capacity_factor capex_per_mw om_pct cost_of_debt cost_of_equity tax_rate lifetime dscr"
            << " [--debt PCT] [--equity PCT] [--tenor N] [--nol] [--schedule] [--log]\n  "
            << prog << " --config FILE [--debt PCT] [--equity PCT] [--tenor N] [--nol] [--schedule] [--log]\n";
}

static void print_log(const char* title, const std::vector<lw::core::IterationPoint>& log) {
  std::cout << title << " (" << log.size() << " points)\n";
  for (const auto& p : log) {
    std::cout << "  #" << std::setw(3) << p.iter
              << "  x=" << std::setprecision(10) << p.x
              << "  residual=" << p.residual << "\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage(argv[0]);
    return 1;
  }

  lw::project::AssumptionInputs in;
  int first_flag = 0;
  std::vector<std::string> warnings;

  // Source des hypothèses : fichier de config ou positionnels
  try {
    if (std::string(argv[1]) == "--config") {
      if (argc < 3) { print_usage(argv[0]); return 1; }
      in = lw::io::read_assumptions_csv(argv[2], &warnings);
      first_flag = 3;
    } else {
      if (argc < 10) { print_usage(argv[0]); return 1; }
      in.capacity_mw                  = std::stod(argv[1]);
      in.capacity_factor              = std::stod(argv[2]);
      in.capital_expenditure_per_mw   = std::stod(argv[3]);
      in.o_m_cost_pct_of_capital_cost = std::stod(argv[4]);
      in.cost_of_debt                 = std::stod(argv[5]);
      in.cost_of_equity               = std::stod(argv[6]);
      in.tax_rate                     = std::stod(argv[7]);
      in.project_lifetime_years       = std::stoi(argv[8]);
      in.dcsr                         = std::stod(argv[9]);
      first_flag = 10;
    }
  } catch (const lw::ValidationError& e) {
    std::cerr << "Invalid config [" << e.field() << "]: " << e.what() << "\n";
    return 2;
  } catch (const std::invalid_argument&) {
    print_usage(argv[0]);
    return 1;
  } catch (const std::out_of_range&) {
    print_usage(argv[0]);
    return 1;
  } catch (const std::runtime_error& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  for (const auto& w : warnings) std::cerr << "[warn] " << w << "\n";

  // Flags optionnels
  bool want_schedule = false;
  bool want_log = false;

  try {
    for (int i = first_flag; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--debt" && i + 1 < argc) {
        in.debt_pct_of_capital_cost = std::stod(argv[++i]);
      } else if (arg == "--equity" && i + 1 < argc) {
        in.equity_pct_of_capital_cost = std::stod(argv[++i]);
      } else if (arg == "--tenor" && i + 1 < argc) {
        in.debt_tenor_years = std::stoi(argv[++i]);
      } else if (arg == "--nol") {
        in.tax_loss_carryforward = true;
      } else if (arg == "--schedule") {
        want_schedule = true;
      } else if (arg == "--log") {
        want_log = true;
      } else {
        std::cerr << "Unknown option: " << arg << "\n";
        print_usage(argv[0]);
        return 1;
      }
    }
  } catch (const std::logic_error&) {
    print_usage(argv[0]);
    return 1;
  }

  try {
    const lw::project::Assumptions assumptions(in);

    lw::config::LcoeConfig cfg;
    cfg.enable_logs(want_log);

    const auto res = lw::lcoe::compute_lcoe(assumptions, cfg);
    const auto& adj = res.adjusted_assumptions;

    // Affichage
    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(6);

    std::cout << "capital_cost      : " << adj.capital_cost()        << "\n"
              << "annual_energy_mwh : " << adj.annual_energy_mwh()   << "\n"
              << "debt_pct          : " << adj.debt_pct().value_or(NAN)   << "\n"
              << "equity_pct        : " << adj.equity_pct().value_or(NAN) << "\n"
              << "debt_capped       : " << (res.debt_capped ? "true" : "false") << "\n"
              << "wacc              : " << adj.wacc().value_or(NAN)  << "\n"
              << "tax_adjusted_wacc : " << adj.tax_adjusted_wacc().value_or(NAN) << "\n"
              << "lcoe_per_mwh      : " << res.lcoe                  << "\n"
              << "equity_irr        : " << res.equity_irr            << "\n"
              << "min_dscr          : " << lw::cashflow::min_dscr(res.schedule) << "\n"
              << "sizing_iters      : " << res.sizing_iters          << "\n"
              << "tariff_iters      : " << res.tariff_iters          << "\n";

    if (want_schedule) {
      std::cout << std::setprecision(2)
                << "\nyear,energy_mwh,revenue,opex,ebitda,interest,principal,debt_eop,"
                   "depreciation,taxable_income,tax,equity_cashflow,dscr\n";
      for (const auto& r : res.schedule.rows) {
        std::cout << r.year << ',' << r.energy_mwh << ',' << r.revenue << ',' << r.opex << ','
                  << r.ebitda << ',' << r.interest << ',' << r.principal << ',' << r.debt_eop << ','
                  << r.depreciation << ',' << r.taxable_income << ',' << r.tax << ','
                  << r.equity_cashflow << ',';
        if (std::isfinite(r.dscr)) std::cout << std::setprecision(4) << r.dscr << std::setprecision(2);
        std::cout << '\n';
      }
    }

    if (want_log) {
      std::cout << std::scientific;
      print_log("\nsizing_log", res.sizing_log);
      print_log("tariff_log", res.tariff_log);
    }
  } catch (const lw::ValidationError& e) {
    std::cerr << "Invalid assumption [" << e.field() << "]: " << e.what() << "\n";
    return 2;
  } catch (const lw::NonConvergenceError& e) {
    std::cerr << "Solver '" << e.solver() << "' failed: " << e.what()
              << " (residual=" << e.residual() << ", iterations=" << e.iterations() << ")\n";
    return 3;
  }

  return 0;
}
