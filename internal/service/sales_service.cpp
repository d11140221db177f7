#include "sales_service.hpp"

#include "internal/core/shift_register.hpp"
#include "observe.hpp"

namespace stockroom::service {

SalesService::SalesService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

util::OutcomeOf<model::Sale> SalesService::ProcessSale(const core::SaleRequest& request) {
  return Observe(ctx_, "SalesService.ProcessSale", [&] { return ctx_.sales->ProcessSale(request); });
}

util::OutcomeOf<std::size_t> SalesService::DeleteSale(const std::string& sale_id) {
  return Observe(ctx_, "SalesService.DeleteSale", [&] { return ctx_.sales->DeleteSale(sale_id); });
}

util::OutcomeOf<std::size_t> SalesService::ClearSales(const std::optional<std::vector<model::SaleStatus>>& statuses) {
  return Observe(ctx_, "SalesService.ClearSales", [&] { return ctx_.sales->ClearSales(statuses); });
}

util::OutcomeOf<std::size_t> SalesService::PruneSales(int days, const std::optional<std::vector<model::SaleStatus>>& statuses) {
  return Observe(ctx_, "SalesService.PruneSales", [&] { return ctx_.sales->PruneSales(days, statuses); });
}

util::OutcomeOf<std::vector<model::Sale>> SalesService::ListSales() {
  return Observe(ctx_, "SalesService.ListSales", [&] { return ctx_.sales->ListSales(); });
}

util::OutcomeOf<model::Sale> SalesService::GetSale(const std::string& sale_id) {
  return Observe(ctx_, "SalesService.GetSale", [&] { return ctx_.sales->GetSale(sale_id); });
}

util::OutcomeOf<model::Shift> SalesService::OpenShift(model::Money start_float) {
  return Observe(ctx_, "SalesService.OpenShift", [&] { return ctx_.shifts->OpenShift(start_float); });
}

util::OutcomeOf<model::Shift> SalesService::CloseShift(model::Money actual_cash, const std::string& notes) {
  return Observe(ctx_, "SalesService.CloseShift", [&] { return ctx_.shifts->CloseShift(actual_cash, notes); });
}

util::OutcomeOf<std::optional<model::Shift>> SalesService::CurrentShift() {
  return Observe(ctx_, "SalesService.CurrentShift", [&] { return ctx_.shifts->CurrentShift(); });
}

util::OutcomeOf<std::vector<model::Shift>> SalesService::ListShifts() {
  return Observe(ctx_, "SalesService.ListShifts", [&] { return ctx_.shifts->ListShifts(); });
}

} // namespace stockroom::service
