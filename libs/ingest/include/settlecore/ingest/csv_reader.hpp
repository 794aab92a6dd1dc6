#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "settlecore/ledger/transaction.hpp"

namespace settlecore {
namespace ingest {

struct ParseError {
  std::size_t line{0};
  std::string message;
};

// Column positions resolved from the header row.
struct ColumnLayout {
  std::size_t type{0};
  std::size_t client{0};
  std::size_t tx{0};
  std::optional<std::size_t> amount{};
};

// std::nullopt when type, client or tx is not named.
[[nodiscard]] std::optional<ColumnLayout> parse_header(std::string_view line);
[[nodiscard]] std::vector<std::string_view> split_row(std::string_view line);

// Reads "type,client,tx,amount" rows. Malformed rows are reported and
// skipped. Empty input yields no rows; a header lacking the required columns
// makes every row malformed. Only stream failures throw.
class CsvTransactionReader {
 public:
  struct Stats {
    std::uint64_t rows{0};
    std::uint64_t accepted{0};
    std::uint64_t malformed{0};
  };

  using ErrorHandler = std::function<void(const ParseError&)>;

  explicit CsvTransactionReader(std::istream& input, ErrorHandler on_error = ErrorHandler{});

  // Returns false at end of input.
  bool next(ledger::Transaction& out);

  [[nodiscard]] const Stats& stats() const noexcept { return stats_; }

 private:
  std::istream& input_;
  ErrorHandler on_error_;
  bool header_read_{false};
  std::optional<ColumnLayout> layout_{};
  std::size_t line_number_{0};
  std::string line_{};
  Stats stats_{};

  bool read_line();
  bool read_header();
  std::optional<ledger::Transaction> parse_row(std::string_view line, std::string& error) const;
};

// Throws std::runtime_error if the file cannot be opened.
[[nodiscard]] std::ifstream open_transactions_file(const std::filesystem::path& path);

}  // namespace ingest
}  // namespace settlecore
