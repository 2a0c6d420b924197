#include "payengine/ingest/csv_reader.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <utility>

namespace payengine {
namespace ingest {

namespace {

constexpr std::size_t kMissingColumn = static_cast<std::size_t>(-1);

std::string_view trim(std::string_view text) {
  constexpr std::string_view kWhitespace = " \t\r\n";
  const auto first = text.find_first_not_of(kWhitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(kWhitespace);
  return text.substr(first, last - first + 1);
}

std::string to_lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

template <typename T>
std::optional<T> parse_unsigned(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  T value{};
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

enum class RowKind {
  kDeposit,
  kWithdrawal,
  kDispute,
  kResolve,
  kChargeback,
};

std::optional<RowKind> parse_kind(std::string_view text) {
  const auto lowered = to_lower(text);
  if (lowered == "deposit") {
    return RowKind::kDeposit;
  }
  if (lowered == "withdrawal") {
    return RowKind::kWithdrawal;
  }
  if (lowered == "dispute") {
    return RowKind::kDispute;
  }
  if (lowered == "resolve") {
    return RowKind::kResolve;
  }
  if (lowered == "chargeback") {
    return RowKind::kChargeback;
  }
  return std::nullopt;
}

// Sets `error` and returns nullopt when the text is not a positive decimal.
std::optional<common::PositiveDecimal> parse_amount(std::string_view text, std::string& error) {
  const auto value = common::Decimal::parse(text);
  if (!value) {
    error = "invalid amount '" + std::string(text) + "'";
    return std::nullopt;
  }
  try {
    return common::PositiveDecimal{*value};
  } catch (const common::InvalidAmount& e) {
    error = e.what();
    return std::nullopt;
  }
}

}  // namespace

std::vector<std::string> split_record(std::string_view line) {
  std::vector<std::string> fields;
  std::string field;
  bool quoted = false;

  for (std::size_t pos = 0; pos < line.size(); ++pos) {
    const char c = line[pos];
    if (quoted) {
      if (c == '"' && pos + 1 < line.size() && line[pos + 1] == '"') {
        field.push_back('"');
        ++pos;
      } else if (c == '"') {
        quoted = false;
      } else {
        field.push_back(c);
      }
    } else if (c == '"') {
      quoted = true;
    } else if (c == ',') {
      fields.emplace_back(trim(field));
      field.clear();
    } else {
      field.push_back(c);
    }
  }
  fields.emplace_back(trim(field));
  return fields;
}

CsvEventReader::CsvEventReader(std::istream& input) : input_(input) {
  std::string header;
  if (!read_line(header)) {
    throw HeaderError("input has no header row");
  }

  columns_ = Columns{kMissingColumn, kMissingColumn, kMissingColumn, kMissingColumn, 0};
  const auto names = split_record(header);
  columns_.count = names.size();
  for (std::size_t idx = 0; idx < names.size(); ++idx) {
    const auto name = to_lower(names[idx]);
    if (name == "type") {
      columns_.type = idx;
    } else if (name == "client") {
      columns_.client = idx;
    } else if (name == "tx") {
      columns_.tx = idx;
    } else if (name == "amount") {
      columns_.amount = idx;
    }
  }

  const std::pair<std::size_t, const char*> required[] = {
      {columns_.type, "type"},
      {columns_.client, "client"},
      {columns_.tx, "tx"},
      {columns_.amount, "amount"},
  };
  for (const auto& [index, name] : required) {
    if (index == kMissingColumn) {
      throw HeaderError(std::string("header is missing column '") + name + "'");
    }
  }
}

// Skips blank lines.
bool CsvEventReader::read_line(std::string& out) {
  while (std::getline(input_, out)) {
    ++line_;
    if (!trim(out).empty()) {
      return true;
    }
  }
  if (input_.bad()) {
    throw std::runtime_error("failed to read input at line " + std::to_string(line_ + 1));
  }
  return false;
}

bool CsvEventReader::next(DecodedRow& out) {
  std::string line;
  if (!read_line(line)) {
    return false;
  }
  out = decode(split_record(line));
  return true;
}

DecodedRow CsvEventReader::decode(const std::vector<std::string>& fields) const {
  DecodedRow row;
  row.line = line_;

  if (fields.size() != columns_.count) {
    row.error = "found record with " + std::to_string(fields.size()) + " fields, but the header has " +
                std::to_string(columns_.count) + " fields";
    return row;
  }

  const auto& type_field = fields[columns_.type];
  const auto kind = parse_kind(type_field);
  if (!kind) {
    row.error = "unknown transaction type '" + type_field + "'";
    return row;
  }

  const auto client = parse_unsigned<common::ClientId>(fields[columns_.client]);
  if (!client) {
    row.error = "invalid client id '" + fields[columns_.client] + "'";
    return row;
  }

  const auto txn = parse_unsigned<common::TxnId>(fields[columns_.tx]);
  if (!txn) {
    row.error = "invalid transaction id '" + fields[columns_.tx] + "'";
    return row;
  }

  const auto& amount_field = fields[columns_.amount];
  std::optional<common::PositiveDecimal> amount;
  if (!amount_field.empty()) {
    amount = parse_amount(amount_field, row.error);
    if (!amount) {
      return row;
    }
  }

  ledger::Event event{.client = *client, .txn = *txn, .detail = ledger::Dispute{}};
  switch (*kind) {
    case RowKind::kDeposit:
      if (!amount) {
        row.error = "deposit requires an amount";
        return row;
      }
      event.detail = ledger::Deposit{.amount = *amount};
      break;
    case RowKind::kWithdrawal:
      if (!amount) {
        row.error = "withdrawal requires an amount";
        return row;
      }
      event.detail = ledger::Withdrawal{.amount = *amount};
      break;
    case RowKind::kDispute:
      event.detail = ledger::Dispute{};
      break;
    case RowKind::kResolve:
      event.detail = ledger::Resolve{};
      break;
    case RowKind::kChargeback:
      event.detail = ledger::Chargeback{};
      break;
  }

  row.event = std::move(event);
  return row;
}

}  // namespace ingest
}  // namespace payengine
