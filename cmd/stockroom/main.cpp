#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/names.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

using namespace stockroom;

static void Usage() {
  std::cout << "Usage:\n"
            << "  stockroom --config <config.yaml> <command> [args]\n"
            << "\n"
            << "Commands (money in minor units):\n"
            << "  products\n"
            << "  add-product <sku> <name> <retail> <cost> [low_stock_threshold]\n"
            << "  adjust <product_id> <new_level> <reason> [variant_id]\n"
            << "  receive <product_id> <quantity> [variant_id]\n"
            << "  history [product_id]\n"
            << "  open-shift <start_float>\n"
            << "  close-shift <actual_cash> [notes]\n"
            << "  shift\n"
            << "  delete-product <product_id> [--force]\n"
            << "  tombstones\n"
            << "  notifications\n";
}

static std::optional<std::int64_t> ParseInt(const std::string& value) {
  try {
    std::size_t used   = 0;
    const auto  parsed = std::stoll(value, &used);
    if (used != value.size()) return std::nullopt;
    return parsed;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static std::optional<std::string> OptionalArg(const std::vector<std::string>& args, std::size_t index) {
  if (index < args.size()) return args[index];
  return std::nullopt;
}

template <typename Outcome>
static int Fail(const Outcome& outcome) {
  std::cerr << util::OutcomeCodeName(outcome.code) << ": " << outcome.message << "\n";
  return 2;
}

static void PrintProduct(const model::Product& product) {
  std::cout << product.id << "  " << product.sku << "  " << product.name << "  stock=" << product.stock
            << "  retail=" << model::FormatMoney(product.retail_price) << "  cost=" << model::FormatMoney(product.cost_price) << "\n";
  for (const auto& variant : product.variants) {
    std::cout << "    " << variant.id << "  " << model::DisplayName(product, &variant) << "  stock=" << variant.stock << "\n";
  }
}

static void PrintShift(const model::Shift& shift) {
  std::cout << shift.id << "  " << model::ToString(shift.status) << "  opened_by=" << shift.opened_by_name
            << "  start=" << util::ToIso8601(shift.start_time) << "  float=" << model::FormatMoney(shift.start_float)
            << "  cash_sales=" << model::FormatMoney(shift.cash_sales) << "  cash_refunds=" << model::FormatMoney(shift.cash_refunds)
            << "  expected=" << model::FormatMoney(shift.expected_cash.value_or(model::ExpectedCash(shift)));
  if (shift.actual_cash) {
    std::cout << "  actual=" << model::FormatMoney(*shift.actual_cash) << "  difference=" << model::FormatMoney(shift.difference.value_or(0));
  }
  std::cout << "\n";
}

static int Run(factory::Application& app, const std::string& cmd, const std::vector<std::string>& args) {
  // ------------------------------------------------------------

  if (cmd == "products") {
    auto out = app.inventory->ListProducts();
    if (!out) return Fail(out);
    for (const auto& product : *out) PrintProduct(product);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "add-product") {
    if (args.size() < 4) return 1;
    const auto retail = ParseInt(args[2]);
    const auto cost   = ParseInt(args[3]);
    if (!retail || !cost) return 1;

    core::ProductDraft draft;
    draft.sku          = args[0];
    draft.name         = args[1];
    draft.retail_price = *retail;
    draft.cost_price   = *cost;
    if (auto threshold = OptionalArg(args, 4)) {
      auto parsed = ParseInt(*threshold);
      if (!parsed) return 1;
      draft.low_stock_threshold = *parsed;
    }

    auto out = app.inventory->AddProduct(draft);
    if (!out) return Fail(out);
    std::cout << out->id << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "adjust") {
    if (args.size() < 3) return 1;
    const auto level = ParseInt(args[1]);
    if (!level) return 1;

    auto out = app.inventory->AdjustStock(args[0], OptionalArg(args, 3), *level, args[2]);
    if (!out) return Fail(out);
    std::cout << "adjusted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "receive") {
    if (args.size() < 2) return 1;
    const auto quantity = ParseInt(args[1]);
    if (!quantity) return 1;

    auto out = app.inventory->ReceiveStock(args[0], OptionalArg(args, 2), *quantity);
    if (!out) return Fail(out);
    std::cout << "received\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "history") {
    auto out = app.inventory->ListAdjustments(OptionalArg(args, 0));
    if (!out) return Fail(out);
    for (const auto& row : *out) {
      std::cout << util::ToIso8601(row.created_at) << "  " << row.product_id;
      if (row.variant_id) std::cout << "/" << *row.variant_id;
      std::cout << "  " << (row.quantity > 0 ? "+" : "") << row.quantity << "  " << row.reason << "  [" << model::ToString(row.source) << "]\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "open-shift") {
    if (args.empty()) return 1;
    const auto start_float = ParseInt(args[0]);
    if (!start_float) return 1;

    auto out = app.sales->OpenShift(*start_float);
    if (!out) return Fail(out);
    PrintShift(*out);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "close-shift") {
    if (args.empty()) return 1;
    const auto actual = ParseInt(args[0]);
    if (!actual) return 1;

    auto out = app.sales->CloseShift(*actual, OptionalArg(args, 1).value_or(""));
    if (!out) return Fail(out);
    PrintShift(*out);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "shift") {
    auto out = app.sales->CurrentShift();
    if (!out) return Fail(out);
    if (!out->has_value()) {
      std::cout << "no open shift\n";
      return 0;
    }
    PrintShift(**out);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete-product") {
    if (args.empty()) return 1;
    const bool force = OptionalArg(args, 1) == std::optional<std::string>("--force");

    auto out = app.inventory->DeleteProduct(args[0], force);
    if (!out) return Fail(out);
    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "tombstones") {
    auto out = app.inventory->ListDeletionRecords();
    if (!out) return Fail(out);
    for (const auto& record : *out) {
      std::cout << util::ToIso8601(record.deleted_at) << "  " << record.table << "  " << record.id << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "notifications") {
    auto out = app.inventory->ListNotifications();
    if (!out) return Fail(out);
    for (const auto& notification : *out) {
      std::cout << util::ToIso8601(notification.timestamp) << "  " << (notification.is_read ? " " : "*") << " "
                << model::ToString(notification.category) << "  " << notification.message << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string              config_path = argv[2];
  const std::string              cmd         = argv[3];
  const std::vector<std::string> args(argv + 4, argv + argc);

  int code = 0;
  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto runtime_config = config::ConfigLoader::LoadFromYaml(config_path);

    observability::InitializeTracing(runtime_config);
    observability::InitializeMetrics(runtime_config);
    observability::InitializeLogging(runtime_config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = factory::Build(runtime_config);

    code = Run(app, cmd, args);
    if (code == 1) Usage();
  } catch (const std::exception& e) {
    STOCKROOM_LOG_ERROR("Fatal error", {observability::StringField("error", e.what())});
    code = 2;
  }

  observability::ShutdownLogging();
  observability::ShutdownMetrics();
  observability::ShutdownTracing();
  return code;
}
