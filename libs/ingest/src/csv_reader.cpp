#include "settlecore/ingest/csv_reader.hpp"

#include <cctype>
#include <charconv>
#include <limits>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace settlecore {
namespace ingest {

namespace {

std::string_view trim(std::string_view text) noexcept {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

std::string lowercase(std::string_view text) {
  std::string out(text);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

template <typename T>
std::optional<T> parse_unsigned(std::string_view text) noexcept {
  std::uint64_t value = 0;
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc{} || ptr != last || value > std::numeric_limits<T>::max()) {
    return std::nullopt;
  }
  return static_cast<T>(value);
}

// One pair of surrounding double quotes is dropped: "deposit" reads as deposit.
std::string_view unquote(std::string_view text) noexcept {
  if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
    return trim(text.substr(1, text.size() - 2));
  }
  return text;
}

std::string_view field(const std::vector<std::string_view>& fields, std::size_t index) noexcept {
  return index < fields.size() ? fields[index] : std::string_view{};
}

}  // namespace

std::vector<std::string_view> split_row(std::string_view line) {
  std::vector<std::string_view> fields;
  std::size_t start = 0;
  while (true) {
    const auto comma = line.find(',', start);
    if (comma == std::string_view::npos) {
      fields.push_back(unquote(trim(line.substr(start))));
      break;
    }
    fields.push_back(unquote(trim(line.substr(start, comma - start))));
    start = comma + 1;
  }
  return fields;
}

std::optional<ColumnLayout> parse_header(std::string_view line) {
  std::optional<std::size_t> type;
  std::optional<std::size_t> client;
  std::optional<std::size_t> tx;
  std::optional<std::size_t> amount;

  const auto fields = split_row(line);
  for (std::size_t i = 0; i < fields.size(); ++i) {
    const auto name = lowercase(fields[i]);
    if (name == "type") {
      type = i;
    } else if (name == "client") {
      client = i;
    } else if (name == "tx") {
      tx = i;
    } else if (name == "amount") {
      amount = i;
    }
  }

  if (!type || !client || !tx) {
    return std::nullopt;
  }
  return ColumnLayout{.type = *type, .client = *client, .tx = *tx, .amount = amount};
}

CsvTransactionReader::CsvTransactionReader(std::istream& input, ErrorHandler on_error)
    : input_(input), on_error_(std::move(on_error)) {}

bool CsvTransactionReader::read_line() {
  while (std::getline(input_, line_)) {
    ++line_number_;
    if (!trim(line_).empty()) {
      return true;
    }
  }
  if (input_.bad()) {
    throw std::runtime_error("failed reading input at line " + std::to_string(line_number_));
  }
  return false;
}

bool CsvTransactionReader::read_header() {
  if (!read_line()) {
    return false;
  }
  header_read_ = true;
  layout_ = parse_header(line_);
  if (!layout_) {
    spdlog::warn("input header at line {} does not name type, client and tx columns: {}", line_number_, line_);
  }
  return true;
}

bool CsvTransactionReader::next(ledger::Transaction& out) {
  if (!header_read_ && !read_header()) {
    return false;
  }

  while (read_line()) {
    ++stats_.rows;
    std::string error;
    if (auto tx = parse_row(line_, error)) {
      ++stats_.accepted;
      out = *tx;
      return true;
    }

    ++stats_.malformed;
    ParseError parse_error{.line = line_number_, .message = std::move(error)};
    spdlog::warn("skipping malformed row at line {}: {}", parse_error.line, parse_error.message);
    if (on_error_) {
      on_error_(parse_error);
    }
  }
  return false;
}

std::optional<ledger::Transaction> CsvTransactionReader::parse_row(std::string_view line, std::string& error) const {
  if (!layout_) {
    error = "no usable header row";
    return std::nullopt;
  }

  const auto fields = split_row(line);

  const auto type_text = field(fields, layout_->type);
  const auto kind = ledger::parse_kind(type_text);
  if (!kind) {
    error = "unknown transaction type '" + std::string(type_text) + "'";
    return std::nullopt;
  }

  const auto client_text = field(fields, layout_->client);
  const auto client = parse_unsigned<common::ClientId>(client_text);
  if (!client) {
    error = "invalid client id '" + std::string(client_text) + "'";
    return std::nullopt;
  }

  const auto tx_text = field(fields, layout_->tx);
  const auto id = parse_unsigned<common::TransactionId>(tx_text);
  if (!id) {
    error = "invalid transaction id '" + std::string(tx_text) + "'";
    return std::nullopt;
  }

  ledger::Transaction tx{.kind = *kind, .id = *id, .client = *client, .amount = std::nullopt};
  if (tx.is_dispute_related()) {
    return tx;
  }

  const auto amount_text = layout_->amount ? field(fields, *layout_->amount) : std::string_view{};
  if (amount_text.empty()) {
    error = std::string(ledger::to_string(*kind)) + " without amount";
    return std::nullopt;
  }
  tx.amount = decimal::Decimal::parse(amount_text);
  if (!tx.amount) {
    error = "invalid amount '" + std::string(amount_text) + "'";
    return std::nullopt;
  }
  return tx;
}

std::ifstream open_transactions_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open input file: " + path.string());
  }
  return in;
}

}  // namespace ingest
}  // namespace settlecore
