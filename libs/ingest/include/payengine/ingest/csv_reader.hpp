#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "payengine/ledger/event.hpp"

namespace payengine {
namespace ingest {

class HeaderError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct DecodedRow {
  std::size_t line{0};
  std::optional<ledger::Event> event{};
  std::string error{};  // why the row was rejected, when event is empty
};

// Splits one CSV record into fields with surrounding whitespace trimmed.
// Double-quoted fields may contain commas and "" escapes.
std::vector<std::string> split_record(std::string_view line);

// Decodes `type,client,tx,amount` rows. Columns are located by header name,
// type names are case-insensitive. Rows that do not decode into a valid event
// are returned with an error instead of an event.
class CsvEventReader {
 public:
  // Reads the header. Throws HeaderError when it is missing or lacks a column.
  explicit CsvEventReader(std::istream& input);

  // Returns false at end of input. Throws std::runtime_error on a read error.
  bool next(DecodedRow& out);

  [[nodiscard]] std::size_t line() const noexcept { return line_; }

 private:
  struct Columns {
    std::size_t type{0};
    std::size_t client{0};
    std::size_t tx{0};
    std::size_t amount{0};
    std::size_t count{0};
  };

  bool read_line(std::string& out);
  [[nodiscard]] DecodedRow decode(const std::vector<std::string>& fields) const;

  std::istream& input_;
  Columns columns_{};
  std::size_t line_{0};
};

}  // namespace ingest
}  // namespace payengine
