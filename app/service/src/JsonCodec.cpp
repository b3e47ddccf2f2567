#include "JsonCodec.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QString>
#include <QDebug>

#include <cmath>
#include <exception>
#include <optional>
#include <string>

#include <lw/core/errors.hpp>

namespace {

// null si vide/non fini (DSCR infini, parts non résolues)
inline QJsonValue num(double x) {
  return std::isfinite(x) ? QJsonValue(x) : QJsonValue();
}

inline QJsonValue opt(const std::optional<double>& x) {
  return x ? num(*x) : QJsonValue();
}

double readNumber(const QJsonObject& o, const char* key, double fallback) {
  if (!o.contains(key) || o.value(key).isNull()) return fallback;
  const QJsonValue v = o.value(key);
  if (!v.isDouble()) {
    throw lw::ValidationError(key, std::string("request: ") + key + " must be a number");
  }
  return v.toDouble();
}

std::optional<double> readOptionalNumber(const QJsonObject& o, const char* key) {
  if (!o.contains(key) || o.value(key).isNull()) return std::nullopt;
  return readNumber(o, key, 0.0);
}

int readInteger(const QJsonObject& o, const char* key, int fallback) {
  const double v = readNumber(o, key, static_cast<double>(fallback));
  if (v != std::floor(v) || std::fabs(v) > 1e9) {
    throw lw::ValidationError(key, std::string("request: ") + key + " must be an integer");
  }
  return static_cast<int>(v);
}

QJsonObject errorJson(int status, const QString& kind, const QString& message) {
  return QJsonObject{
    {"status",  status},
    {"error",   kind},
    {"message", message}
  };
}

} // namespace

namespace service {

lw::project::AssumptionInputs inputsFromJson(const QJsonObject& o) {
  lw::project::AssumptionInputs in = lw::project::default_solar_pv_inputs();
  in.capacity_mw                  = readNumber(o, "capacity_mw", in.capacity_mw);
  const auto yield = readOptionalNumber(o, "daily_yield_kwh_per_kwp");
  const auto cf    = readOptionalNumber(o, "capacity_factor");
  if (cf) {
    if (yield) qWarning() << "[lcoe_json] daily_yield_kwh_per_kwp ignored, capacity_factor given";
    in.capacity_factor = *cf;
  } else if (yield) {
    in.capacity_factor = lw::project::capacity_factor_from_daily_yield(*yield);
  }
  in.capital_expenditure_per_mw   = readNumber(o, "capital_expenditure_per_mw", in.capital_expenditure_per_mw);
  in.o_m_cost_pct_of_capital_cost = readNumber(o, "o_m_cost_pct_of_capital_cost", in.o_m_cost_pct_of_capital_cost);
  in.debt_pct_of_capital_cost     = readOptionalNumber(o, "debt_pct_of_capital_cost");
  in.equity_pct_of_capital_cost   = readOptionalNumber(o, "equity_pct_of_capital_cost");
  in.cost_of_debt                 = readNumber(o, "cost_of_debt", in.cost_of_debt);
  in.cost_of_equity               = readNumber(o, "cost_of_equity", in.cost_of_equity);
  in.tax_rate                     = readNumber(o, "tax_rate", in.tax_rate);
  in.project_lifetime_years       = readInteger(o, "project_lifetime_years", in.project_lifetime_years);
  in.dcsr                         = readNumber(o, "dcsr", in.dcsr);

  if (o.contains("debt_tenor_years") && !o.value("debt_tenor_years").isNull()) {
    in.debt_tenor_years = readInteger(o, "debt_tenor_years", 0);
  }
  if (o.contains("tax_loss_carryforward") && !o.value("tax_loss_carryforward").isNull()) {
    const QJsonValue v = o.value("tax_loss_carryforward");
    if (!v.isBool()) {
      throw lw::ValidationError("tax_loss_carryforward", "request: tax_loss_carryforward must be a boolean");
    }
    in.tax_loss_carryforward = v.toBool();
  }
  return in;
}

QJsonObject assumptionsToJson(const lw::project::Assumptions& a) {
  return QJsonObject{
    {"capacity_mw",                  a.capacity_mw},
    {"capacity_factor",              a.capacity_factor},
    {"capital_expenditure_per_mw",   a.capital_expenditure_per_mw},
    {"o_m_cost_pct_of_capital_cost", a.o_m_cost_pct_of_capital_cost},
    {"debt_pct_of_capital_cost",     opt(a.debt_pct())},
    {"equity_pct_of_capital_cost",   opt(a.equity_pct())},
    {"cost_of_debt",                 a.cost_of_debt},
    {"cost_of_equity",               a.cost_of_equity},
    {"tax_rate",                     a.tax_rate},
    {"project_lifetime_years",       a.project_lifetime_years},
    {"dcsr",                         a.dcsr},
    {"debt_tenor_years",             a.debt_tenor_years},
    {"tax_loss_carryforward",        a.tax_loss_carryforward},
    {"capital_cost",                 a.capital_cost()},
    {"wacc",                         opt(a.wacc())},
    {"tax_adjusted_wacc",            opt(a.tax_adjusted_wacc())}
  };
}

QJsonObject rowToJson(const lw::cashflow::YearRow& r) {
  return QJsonObject{
    {"year",            r.year},
    {"energy_mwh",      r.energy_mwh},
    {"revenue",         r.revenue},
    {"opex",            r.opex},
    {"ebitda",          r.ebitda},
    {"interest",        r.interest},
    {"principal",       r.principal},
    {"debt_bop",        r.debt_bop},
    {"debt_eop",        r.debt_eop},
    {"depreciation",    r.depreciation},
    {"taxable_income",  r.taxable_income},
    {"tax",             r.tax},
    {"equity_cashflow", r.equity_cashflow},
    {"dscr",            num(r.dscr)}
  };
}

QJsonObject resultToJson(const lw::lcoe::LcoeResult& r) {
  QJsonArray rows;
  for (const auto& row : r.schedule.rows) rows.append(rowToJson(row));

  return QJsonObject{
    {"status",      static_cast<int>(StatusOk)},
    {"lcoe",        r.lcoe},
    {"equity_irr",  r.equity_irr},
    {"debt_capped", r.debt_capped},
    {"assumptions", assumptionsToJson(r.adjusted_assumptions)},
    {"schedule",    rows}
  };
}

QJsonObject handleRequest(const QByteArray& body) {
  QJsonParseError perr;
  const QJsonDocument doc = QJsonDocument::fromJson(body, &perr);
  if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
    const QString why = (perr.error != QJsonParseError::NoError) ? perr.errorString()
                                                                 : QString("body is not a JSON object");
    qWarning() << "[lcoe_json] invalid request:" << why;
    QJsonObject out = errorJson(StatusInvalidRequest, "validation", "invalid JSON: " + why);
    out["field"] = QJsonValue();
    return out;
  }

  try {
    const lw::project::Assumptions a(inputsFromJson(doc.object()));
    const auto res = lw::lcoe::compute_lcoe(a);
    qDebug() << "[lcoe_json] lcoe =" << res.lcoe << "debt_pct =" << res.schedule.debt_fraction
             << "iters =" << res.sizing_iters << "/" << res.tariff_iters;
    return resultToJson(res);
  } catch (const lw::ValidationError& e) {
    qWarning() << "[lcoe_json] validation:" << e.what();
    QJsonObject out = errorJson(StatusInvalidRequest, "validation", QString::fromStdString(e.what()));
    out["field"] = QString::fromStdString(e.field());
    return out;
  } catch (const lw::NonConvergenceError& e) {
    qWarning() << "[lcoe_json] solver" << QString::fromStdString(e.solver()) << "failed:" << e.what();
    QJsonObject out = errorJson(StatusSolverFailure, "non_convergence", QString::fromStdString(e.what()));
    out["solver"]     = QString::fromStdString(e.solver());
    out["residual"]   = num(e.residual());
    out["iterations"] = e.iterations();
    return out;
  } catch (const std::exception& e) {
    qCritical() << "[lcoe_json] internal error:" << e.what();
    return errorJson(StatusSolverFailure, "internal", QString::fromStdString(e.what()));
  }
}

} // namespace service
