#include "payengine/report/csv_writer.hpp"

#include <sstream>
#include <stdexcept>

namespace payengine {
namespace report {

std::string format_amount(const common::Decimal& value) {
  return value.round(kOutputFractionDigits).to_string();
}

void write_snapshots(std::ostream& out, const std::vector<ledger::AccountSnapshot>& snapshots) {
  if (snapshots.empty()) {
    return;
  }

  out << "client,available,held,total,locked\n";
  for (const auto& snapshot : snapshots) {
    out << snapshot.client << ',' << format_amount(snapshot.available) << ',' << format_amount(snapshot.held)
        << ',' << format_amount(snapshot.total) << ',' << (snapshot.locked ? "true" : "false") << '\n';
  }
  out.flush();
  if (!out) {
    throw std::runtime_error("failed to write account report");
  }
}

std::string to_csv_string(const std::vector<ledger::AccountSnapshot>& snapshots) {
  std::ostringstream oss;
  write_snapshots(oss, snapshots);
  auto text = oss.str();
  if (!text.empty() && text.back() == '\n') {
    text.pop_back();
  }
  return text;
}

}  // namespace report
}  // namespace payengine
